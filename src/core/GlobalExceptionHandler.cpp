#include "GlobalExceptionHandler.h"
#include "Logger.h"

#include <QApplication>
#include <QDesktopServices>
#include <QFileInfo>
#include <QMessageBox>
#include <QPushButton>
#include <QThread>
#include <QUrl>
#include <cstdlib>
#include <cstring>
#include <iostream>

#ifndef Q_OS_WIN
#include <execinfo.h>
#endif

void GlobalExceptionHandler::init()
{
#ifndef Q_OS_WIN
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_flags = SA_SIGINFO | SA_RESETHAND;
    sa.sa_sigaction = &GlobalExceptionHandler::onFatalSignal;
    sigemptyset(&sa.sa_mask);

    for (int sig : { SIGSEGV, SIGABRT, SIGFPE, SIGILL, SIGBUS })
        sigaction(sig, &sa, nullptr);
#endif

    std::set_terminate(&GlobalExceptionHandler::onTerminate);
}

#ifndef Q_OS_WIN
void GlobalExceptionHandler::onFatalSignal(int sig, siginfo_t* info, void*)
{
    QString text = QString("Fatal signal %1 (%2)").arg(sig).arg(QString::fromLocal8Bit(strsignal(sig)));
    if (info && info->si_addr)
        text += QString(" at 0x%1").arg(reinterpret_cast<quintptr>(info->si_addr), 0, 16);

    void* frames[32];
    const int depth = backtrace(frames, 32);
    if (char** symbols = backtrace_symbols(frames, depth)) {
        for (int i = 0; i < depth; ++i)
            text += "\n  " + QString::fromLatin1(symbols[i]);
        std::free(symbols);
    }

    Logger::critical(text, "Crash");
    Logger::shutdown();

    // SA_RESETHAND restored the default action
    raise(sig);
}
#endif

void GlobalExceptionHandler::onTerminate()
{
    QString message = "std::terminate called";
    if (std::exception_ptr current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            message = QString::fromUtf8(e.what());
        } catch (...) {
            message = "Unknown exception";
        }
    }
    Logger::critical("Terminating: " + message, "Crash");
    report(message, true);
    Logger::shutdown();
    std::abort();
}

void GlobalExceptionHandler::handle(const std::exception& e)
{
    handle(QString::fromUtf8(e.what()));
}

void GlobalExceptionHandler::handle(const QString& errorMessage)
{
    Logger::critical("Unhandled error: " + errorMessage, "ExceptionHandler");
    report(errorMessage, false);
}

void GlobalExceptionHandler::report(const QString& message, bool fatal)
{
    QCoreApplication* app = QCoreApplication::instance();
    if (!qobject_cast<QApplication*>(app)) {
        std::cerr << (fatal ? "Fatal error: " : "Error: ") << message.toStdString() << std::endl;
        return;
    }

    // The GUI thread may be the one waiting on us, so a fatal error from a
    // worker only reaches stderr and the log
    if (QThread::currentThread() != app->thread()) {
        if (fatal)
            std::cerr << "Fatal error: " << message.toStdString() << std::endl;
        else
            QMetaObject::invokeMethod(app, [message]() { report(message, false); }, Qt::QueuedConnection);
        return;
    }

    QMessageBox box;
    box.setIcon(QMessageBox::Critical);
    box.setWindowTitle(fatal ? QObject::tr("Critical Error") : QObject::tr("Application Error"));
    box.setText(fatal ? QObject::tr("A critical error occurred and Substack Archiver must close.")
                      : QObject::tr("An unexpected error occurred."));
    box.setInformativeText(message);
    box.setDetailedText(Logger::getRecentLogs(50));
    QPushButton* openLogs = box.addButton(QObject::tr("Open Log Folder"), QMessageBox::ActionRole);
    box.addButton(fatal ? QObject::tr("Exit") : QObject::tr("Close"), QMessageBox::AcceptRole);
    box.exec();

    if (box.clickedButton() == openLogs) {
        const QString logFile = Logger::currentLogFile();
        if (!logFile.isEmpty()
            && !QDesktopServices::openUrl(QUrl::fromLocalFile(QFileInfo(logFile).absolutePath())))
            std::cerr << "Could not open " << logFile.toStdString() << std::endl;
    }
}
