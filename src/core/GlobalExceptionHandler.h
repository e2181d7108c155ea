#ifndef GLOBALEXCEPTIONHANDLER_H
#define GLOBALEXCEPTIONHANDLER_H

#include <QString>
#include <exception>

#ifndef Q_OS_WIN
#include <csignal>
#endif

/**
 * @brief Last-resort error reporting.
 *
 * Exceptions escaping an event handler end up in handle() (see
 * ArchiverApplication::notify). Crashes and std::terminate are logged with
 * whatever context is available before the process goes down.
 */
class GlobalExceptionHandler
{
public:
    static void init();

    static void handle(const std::exception& e);
    static void handle(const QString& errorMessage);

private:
#ifndef Q_OS_WIN
    static void onFatalSignal(int sig, siginfo_t* info, void* context);
#endif
    static void onTerminate();
    static void report(const QString& message, bool fatal);
};

#endif // GLOBALEXCEPTIONHANDLER_H
