#ifndef PROCESSTASK_H
#define PROCESSTASK_H

#include "core/Task.h"

#include <QStringList>
#include <atomic>
#include <memory>

class LogSink;

/**
 * @brief Runs one external command on a pool thread and streams its output.
 *
 * stdout and stderr are merged and forwarded to the sink line by line as they
 * arrive. The stream is drained completely before the exit status is read.
 * The outcome is available through succeeded()/exitCode() once the task has
 * emitted finished().
 *
 * The process is only killed when the task is cancelled (application
 * shutdown); there is no timeout.
 */
class ProcessTask : public Threading::Task
{
    Q_OBJECT

public:
    /// Exit code reported when the process never started or crashed
    static constexpr int NoExitCode = -1;

    ProcessTask(const QStringList& command, std::shared_ptr<LogSink> sink,
                QObject* parent = nullptr);

    const QStringList& command() const { return m_command; }

    bool succeeded() const { return m_succeeded.load(std::memory_order_acquire); }
    int exitCode() const { return m_exitCode.load(std::memory_order_acquire); }

protected:
    void execute() override;

private:
    void emitText(const QString& text);

    const QStringList m_command;
    std::shared_ptr<LogSink> m_sink;
    std::atomic<bool> m_succeeded { false };
    std::atomic<int> m_exitCode { NoExitCode };
};

#endif // PROCESSTASK_H
