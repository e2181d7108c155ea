#include "TaskManager.h"
#include "Logger.h"

#include <QList>
#include <QMutexLocker>
#include <stdexcept>

namespace Threading {

TaskManager& TaskManager::instance()
{
    static TaskManager manager;
    return manager;
}

TaskManager::TaskManager()
{
    m_pool.setMaxThreadCount(1);
}

TaskManager::~TaskManager()
{
    cancelAll();
    m_pool.waitForDone(5000);
}

void TaskManager::init(int maxThreads)
{
    m_pool.setMaxThreadCount(qMax(1, maxThreads));
    Logger::info(QString("Worker pool: %1 thread(s)").arg(m_pool.maxThreadCount()), "Threading");
}

Task::Id TaskManager::submit(std::shared_ptr<Task> task)
{
    if (!task)
        throw std::invalid_argument("TaskManager::submit called with a null task");

    const Task::Id id = task->id();
    {
        QMutexLocker lock(&m_mutex);
        m_tasks.insert(id, task);
    }

    // Queued back to this (GUI) thread from the pool thread
    connect(task.get(), &Task::finished, this, &TaskManager::release);
    connect(task.get(), &Task::cancelled, this, &TaskManager::release);
    connect(task.get(), &Task::failed, this, [this](quint64 tid, const QString&) { release(tid); });

    m_pool.start(task.get());
    return id;
}

void TaskManager::cancelAll()
{
    QList<std::shared_ptr<Task>> running;
    {
        QMutexLocker lock(&m_mutex);
        running = m_tasks.values();
    }
    for (const auto& task : running)
        task->cancel();
}

bool TaskManager::waitForAll(int msTimeout)
{
    return m_pool.waitForDone(msTimeout);
}

void TaskManager::release(quint64 id)
{
    QMutexLocker lock(&m_mutex);
    m_tasks.remove(id);
}

} // namespace Threading
