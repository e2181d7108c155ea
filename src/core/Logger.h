#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QtGlobal>

/**
 * @brief Application diagnostics log.
 *
 * One file per user, SubstackArchiver.log under the app's local data folder.
 * When it grows past MaxFileBytes it is moved aside to a single ".1" backup
 * at the next start. qDebug/qWarning/qCritical output is routed here once
 * init() has run; calls made before that are dropped.
 *
 * The last RecentLines entries are also kept in memory for the crash dialog.
 *
 *   Logger::init();
 *   Logger::info("Settings loaded", "Settings");
 *   Logger::shutdown();
 */
class Logger
{
public:
    enum Level {
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Fatal
    };

    static constexpr qint64 MaxFileBytes = 1024 * 1024;
    static constexpr int RecentLines = 200;

    /**
     * @param logDirPath Directory for the log file; empty picks the per-user
     *        data location
     * @return false when the file could not be opened (in-memory history
     *         still works)
     */
    static bool init(const QString& logDirPath = QString());
    static void shutdown();

    static void log(Level level, const QString& message, const QString& category = QString());

    static QString currentLogFile();

    /** Last @p maxLines formatted entries, oldest first */
    static QString getRecentLogs(int maxLines = 50);

    static void info(const QString& msg, const QString& cat = QString())     { log(Info, msg, cat); }
    static void warning(const QString& msg, const QString& cat = QString())  { log(Warning, msg, cat); }
    static void error(const QString& msg, const QString& cat = QString())    { log(Error, msg, cat); }
    static void critical(const QString& msg, const QString& cat = QString()) { log(Critical, msg, cat); }

private:
    Logger() = delete;

    static void qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
};

#endif // LOGGER_H
