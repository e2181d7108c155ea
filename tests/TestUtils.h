#ifndef TESTUTILS_H
#define TESTUTILS_H

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

namespace TestUtils {

inline bool writeFile(const QString& path, const QByteArray& content = QByteArray())
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.write(content) == content.size();
}

inline void touchFiles(const QDir& dir, const QStringList& names)
{
    for (const QString& n : names)
        writeFile(dir.filePath(n), "# " + n.toUtf8() + "\n");
}

inline QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

/**
 * @brief Spin the event loop until @p signal fires on @p sender or
 *        @p timeoutMs elapses.
 * @return true if the signal arrived in time
 */
template <typename Sender, typename Signal>
bool waitForSignal(Sender* sender, Signal signal, int timeoutMs = 10000)
{
    QEventLoop loop;
    bool fired = false;
    QObject::connect(sender, signal, &loop, [&]() {
        fired = true;
        loop.quit();
    });
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    loop.exec();
    return fired;
}

/// Spin the event loop until @p done returns true or the timeout expires
template <typename Predicate>
bool waitUntil(Predicate done, int timeoutMs = 10000)
{
    QDeadlineTimer deadline(timeoutMs);
    while (!done()) {
        if (deadline.hasExpired()) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
    return true;
}

} // namespace TestUtils

#endif // TESTUTILS_H
