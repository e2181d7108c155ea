#ifndef LOGSINK_H
#define LOGSINK_H

#include <QMutex>
#include <QStringList>

/**
 * @brief Many-writer, single-reader queue of output fragments.
 *
 * Worker threads enqueue text as it arrives; the GUI thread drains everything
 * queued so far on a timer. Fragments are kept verbatim, newlines included.
 */
class LogSink
{
public:
    LogSink() = default;

    void enqueue(const QString& fragment);

    /** @return all queued fragments in arrival order; the queue is left empty */
    QStringList drain();

    bool isEmpty() const;

private:
    mutable QMutex m_mutex;
    QStringList m_queue;
};

#endif // LOGSINK_H
