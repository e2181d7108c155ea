#ifndef PROCESSRUNNER_H
#define PROCESSRUNNER_H

#include <QObject>
#include <QStringList>
#include <memory>

class LogSink;
class ProcessTask;

/**
 * @brief Single-flight launcher for the external tools.
 *
 * Idle -> Running -> Idle. While a run is active further start() calls are
 * rejected with a warning in the log; they are never queued. The command runs
 * as a ProcessTask on the TaskManager pool and finished() is emitted on the
 * thread this object lives in (the GUI thread).
 */
class ProcessRunner : public QObject
{
    Q_OBJECT

public:
    enum class State { Idle, Running };
    Q_ENUM(State)

    enum class Operation { None, Download, Convert };
    Q_ENUM(Operation)

    explicit ProcessRunner(std::shared_ptr<LogSink> sink, QObject* parent = nullptr);
    ~ProcessRunner() override;

    /**
     * @brief Launch @p command for @p operation.
     * @return false if a run is already active (nothing is started)
     */
    bool start(const QStringList& command, Operation operation);

    bool isRunning() const { return m_state == State::Running; }
    State state() const { return m_state; }
    Operation currentOperation() const { return m_operation; }

    /**
     * @brief Kill the active process (if any) and wait up to @p msTimeout for
     *        the worker to return. Used when the application exits.
     */
    bool shutdown(int msTimeout = 5000);

signals:
    void started(ProcessRunner::Operation operation);

    /** Emitted once per run, after the state went back to Idle. */
    void finished(ProcessRunner::Operation operation, bool success);

private:
    void complete(bool success);

    std::shared_ptr<LogSink> m_sink;
    std::shared_ptr<ProcessTask> m_task;
    State m_state = State::Idle;
    Operation m_operation = Operation::None;
};

#endif // PROCESSRUNNER_H
