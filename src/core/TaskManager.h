#ifndef ARCHIVER_TASKMANAGER_H
#define ARCHIVER_TASKMANAGER_H

#include "Task.h"

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QThreadPool>
#include <memory>

namespace Threading {

/**
 * @brief Owns the worker pool external tool runs execute on.
 *
 * The pool is private (not QThreadPool::globalInstance()) and sized once at
 * startup. Submitted tasks are kept alive until they report an outcome, so
 * callers may drop their own reference.
 *
 * @code
 *   auto task = std::make_shared<ProcessTask>(cmd, sink);
 *   connect(task.get(), &Task::finished, this, &MyWidget::onDone);
 *   TaskManager::instance().submit(task);
 * @endcode
 */
class TaskManager : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY(TaskManager)

public:
    static TaskManager& instance();

    void init(int maxThreads = 1);

    Task::Id submit(std::shared_ptr<Task> task);

    /// Asks every queued or running task to stop
    void cancelAll();

    /// @return false if tasks were still running after @p msTimeout (-1 waits forever)
    bool waitForAll(int msTimeout = -1);

private:
    TaskManager();
    ~TaskManager() override;

    void release(quint64 id);

    QThreadPool m_pool;
    QMutex m_mutex;   // guards m_tasks
    QHash<Task::Id, std::shared_ptr<Task>> m_tasks;
};

} // namespace Threading

#endif // ARCHIVER_TASKMANAGER_H
