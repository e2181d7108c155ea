#include "Task.h"
#include "ThreadState.h"

#include <exception>

namespace Threading {

static std::atomic<Task::Id> s_nextId { 1 };

Task::Task(QObject* parent)
    : QObject(parent)
    , m_id(s_nextId.fetch_add(1, std::memory_order_relaxed))
{
    setAutoDelete(false);
}

void Task::cancel()
{
    m_cancelRequested.store(true, std::memory_order_release);
}

bool Task::shouldContinue() const noexcept
{
    return !m_cancelRequested.load(std::memory_order_acquire) && ThreadState::shouldRun();
}

void Task::run()
{
    // Cancelled while still queued: never start the body
    if (!shouldContinue()) {
        m_status.store(Status::Cancelled, std::memory_order_release);
        emit cancelled(m_id);
        return;
    }

    m_status.store(Status::Running, std::memory_order_release);
    emit started(m_id);

    bool threw = true;
    QString error;
    try {
        execute();
        threw = false;
    } catch (const std::exception& e) {
        error = QString::fromUtf8(e.what());
    } catch (...) {
        error = QString("Task %1 threw a non-standard exception").arg(m_id);
    }

    if (threw) {
        m_status.store(Status::Failed, std::memory_order_release);
        emit failed(m_id, error);
    } else if (!shouldContinue()) {
        m_status.store(Status::Cancelled, std::memory_order_release);
        emit cancelled(m_id);
    } else {
        m_status.store(Status::Completed, std::memory_order_release);
        emit finished(m_id);
    }
}

} // namespace Threading
