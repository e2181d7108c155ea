#include "Logger.h"
#include "Version.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRecursiveMutex>
#include <QStandardPaths>
#include <QStringConverter>
#include <QStringList>
#include <QTextStream>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

const char* const LogFileName = "SubstackArchiver.log";

struct LogState {
    QRecursiveMutex mutex;
    QFile file;
    QTextStream stream;
    QString path;
    QStringList recent;
    bool active = false;
    QtMessageHandler previousHandler = nullptr;
};

LogState& state()
{
    static LogState s;
    return s;
}

const char* levelName(Logger::Level level)
{
    switch (level) {
        case Logger::Debug:    return "DEBUG";
        case Logger::Info:     return "INFO";
        case Logger::Warning:  return "WARNING";
        case Logger::Error:    return "ERROR";
        case Logger::Critical: return "CRITICAL";
        case Logger::Fatal:    return "FATAL";
    }
    return "?";
}

// Keeps one previous generation next to the live file
void rotateIfLarge(const QString& path)
{
    if (QFileInfo(path).size() <= Logger::MaxFileBytes) return;

    const QString backup = path + ".1";
    QFile::remove(backup);
    if (!QFile::rename(path, backup))
        std::cerr << "Could not rotate log file " << path.toStdString() << std::endl;
}

QString timestamp()
{
    return QDateTime::currentDateTime().toString(Qt::ISODate);
}

} // namespace

bool Logger::init(const QString& logDirPath)
{
    LogState& st = state();
    QMutexLocker locker(&st.mutex);
    if (st.active) return st.file.isOpen();

    QString dirPath = logDirPath;
    if (dirPath.isEmpty()) {
        dirPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
        if (dirPath.isEmpty()) dirPath = QDir::tempPath();
        dirPath += "/logs";
    }
    QDir().mkpath(dirPath);

    st.path = QDir(dirPath).filePath(LogFileName);
    rotateIfLarge(st.path);

    st.file.setFileName(st.path);
    if (st.file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Append)) {
        st.stream.setDevice(&st.file);
        st.stream.setEncoding(QStringConverter::Utf8);
        st.stream << "\n---- Substack Archiver " << Archiver::getVersion()
                  << " session " << timestamp() << " ----\n";
        st.stream.flush();
    } else {
        std::cerr << "Cannot open log file " << st.path.toStdString() << ": "
                  << st.file.errorString().toStdString() << std::endl;
    }

    st.previousHandler = qInstallMessageHandler(&Logger::qtMessageHandler);
    st.active = true;

    info("Log file: " + st.path, "Logger");
    return st.file.isOpen();
}

void Logger::shutdown()
{
    LogState& st = state();
    QMutexLocker locker(&st.mutex);
    if (!st.active) return;

    qInstallMessageHandler(st.previousHandler);
    st.previousHandler = nullptr;

    if (st.file.isOpen()) {
        st.stream << "---- session ended " << timestamp() << " ----\n";
        st.stream.flush();
        st.stream.setDevice(nullptr);
        st.file.close();
    }

    st.recent.clear();
    st.active = false;
}

void Logger::log(Level level, const QString& message, const QString& category)
{
    LogState& st = state();
    QMutexLocker locker(&st.mutex);
    if (!st.active) return;

    QString line = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz")
                 + QString(" %1 ").arg(QLatin1String(levelName(level)), -8);
    if (!category.isEmpty())
        line += '[' + category + "] ";
    line += message;

    if (st.file.isOpen()) {
        st.stream << line << '\n';
        st.stream.flush();
    }

    st.recent.append(line);
    if (st.recent.size() > RecentLines)
        st.recent.erase(st.recent.begin(), st.recent.begin() + (st.recent.size() - RecentLines));
}

void Logger::qtMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    static const Level levels[] = { Debug, Warning, Critical, Fatal, Info };
    const Level level = (type >= QtDebugMsg && type <= QtInfoMsg) ? levels[type] : Info;

    const bool named = context.category && std::strcmp(context.category, "default") != 0;
    log(level, msg, named ? QString::fromUtf8(context.category) : QString());

    if (type == QtFatalMsg) {
        shutdown();
        std::abort();
    }
}

QString Logger::currentLogFile()
{
    LogState& st = state();
    QMutexLocker locker(&st.mutex);
    return st.path;
}

QString Logger::getRecentLogs(int maxLines)
{
    LogState& st = state();
    QMutexLocker locker(&st.mutex);
    if (maxLines <= 0) return QString();
    return st.recent.mid(qMax(0, st.recent.size() - maxLines)).join('\n');
}
