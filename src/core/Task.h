#ifndef ARCHIVER_TASK_H
#define ARCHIVER_TASK_H

#include <QObject>
#include <QRunnable>
#include <QString>
#include <atomic>

namespace Threading {

/**
 * @brief Unit of background work run by TaskManager's pool.
 *
 * Subclasses implement execute() and poll shouldContinue() in their loops.
 * Exactly one of finished(), failed() or cancelled() is emitted per run,
 * from the pool thread; receivers living in the GUI thread get them queued.
 *
 * Lifetime is owned by shared_ptr (autoDelete is off), so a task object can
 * be inspected after it has run.
 */
class Task : public QObject, public QRunnable
{
    Q_OBJECT
    Q_DISABLE_COPY(Task)

public:
    using Id = quint64;

    enum class Status {
        Pending,
        Running,
        Cancelled,
        Failed,
        Completed
    };
    Q_ENUM(Status)

    explicit Task(QObject* parent = nullptr);

    Id id() const noexcept { return m_id; }
    Status status() const noexcept { return m_status.load(std::memory_order_acquire); }

    /** Asks the task to stop at its next shouldContinue() check. Thread-safe. */
    void cancel();

signals:
    void started(quint64 id);
    void finished(quint64 id);
    void failed(quint64 id, const QString& errorMessage);
    void cancelled(quint64 id);

protected:
    /// Task body, runs on a pool thread. Throwing reports failed().
    virtual void execute() = 0;

    /// False once cancel() was called or the application is shutting down
    bool shouldContinue() const noexcept;

private:
    void run() override final;

    const Id m_id;
    std::atomic<Status> m_status { Status::Pending };
    std::atomic<bool>   m_cancelRequested { false };
};

} // namespace Threading

#endif // ARCHIVER_TASK_H
