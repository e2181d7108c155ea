#include "ArchiverApplication.h"
#include "GlobalExceptionHandler.h"
#include "Version.h"

#include <exception>

ArchiverApplication::ArchiverApplication(int& argc, char** argv)
    : QApplication(argc, argv)
{
    setOrganizationName("SubstackArchiver");
    setApplicationName("Substack Archiver");
    setApplicationVersion(Archiver::getVersion());
}

bool ArchiverApplication::notify(QObject* receiver, QEvent* event)
{
    try {
        return QApplication::notify(receiver, event);
    } catch (const std::exception& e) {
        GlobalExceptionHandler::handle(e);
    } catch (...) {
        const char* target = receiver ? receiver->metaObject()->className() : "(null)";
        GlobalExceptionHandler::handle(QString("Unknown exception while delivering event %1 to %2")
                                           .arg(event ? int(event->type()) : -1)
                                           .arg(QLatin1String(target)));
    }
    return false;
}
