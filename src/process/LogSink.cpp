#include "LogSink.h"

#include <QMutexLocker>
#include <utility>

void LogSink::enqueue(const QString& fragment)
{
    if (fragment.isEmpty()) return;
    QMutexLocker lock(&m_mutex);
    m_queue.append(fragment);
}

QStringList LogSink::drain()
{
    QStringList out;
    QMutexLocker lock(&m_mutex);
    std::swap(out, m_queue);
    return out;
}

bool LogSink::isEmpty() const
{
    QMutexLocker lock(&m_mutex);
    return m_queue.isEmpty();
}
