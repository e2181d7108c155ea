#include "ProcessRunner.h"
#include "LogSink.h"
#include "ProcessTask.h"
#include "core/Logger.h"
#include "core/TaskManager.h"

ProcessRunner::ProcessRunner(std::shared_ptr<LogSink> sink, QObject* parent)
    : QObject(parent)
    , m_sink(std::move(sink))
{
}

ProcessRunner::~ProcessRunner()
{
    if (m_task) {
        // Results of a run outliving us have nowhere to go
        m_task->disconnect(this);
        m_task->cancel();
    }
}

bool ProcessRunner::start(const QStringList& command, Operation operation)
{
    if (m_state == State::Running) {
        m_sink->enqueue("[WARNING] A process is already running. Please wait.\n");
        Logger::warning("Start rejected, a process is already running", "Process");
        return false;
    }

    m_state = State::Running;
    m_operation = operation;

    auto task = std::make_shared<ProcessTask>(command, m_sink);
    m_task = task;

    ProcessTask* raw = task.get();
    connect(raw, &Threading::Task::finished, this, [this, raw](quint64) {
        complete(raw->succeeded());
    });
    connect(raw, &Threading::Task::failed, this, [this](quint64, const QString& message) {
        m_sink->enqueue(QString("\n[ERROR] %1\n").arg(message));
        Logger::error("Run failed: " + message, "Process");
        complete(false);
    });
    connect(raw, &Threading::Task::cancelled, this, [this](quint64) {
        complete(false);
    });

    emit started(operation);
    Threading::TaskManager::instance().submit(task);
    return true;
}

void ProcessRunner::complete(bool success)
{
    const Operation op = m_operation;
    m_state = State::Idle;
    m_operation = Operation::None;
    m_task.reset();
    emit finished(op, success);
}

bool ProcessRunner::shutdown(int msTimeout)
{
    if (m_task) {
        Logger::info("Stopping active run for shutdown", "Process");
        m_task->cancel();
    }
    return Threading::TaskManager::instance().waitForAll(msTimeout);
}
