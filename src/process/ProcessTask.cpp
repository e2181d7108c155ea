#include "ProcessTask.h"
#include "LogSink.h"
#include "commands/CommandBuilder.h"
#include "core/Logger.h"

#include <QProcess>
#include <stdexcept>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace {

QString decode(const QByteArray& bytes)
{
    QString text = QString::fromUtf8(bytes);
    text.replace("\r\n", "\n");
    return text;
}

} // namespace

ProcessTask::ProcessTask(const QStringList& command, std::shared_ptr<LogSink> sink, QObject* parent)
    : Threading::Task(parent)
    , m_command(command)
    , m_sink(std::move(sink))
{
}

void ProcessTask::emitText(const QString& text)
{
    if (m_sink) m_sink->enqueue(text);
}

void ProcessTask::execute()
{
    if (m_command.isEmpty())
        throw std::invalid_argument("Cannot run an empty command");

    const QString display = CommandBuilder::toDisplayString(m_command);
    const QString rule(60, QChar(0x2500));
    emitText(QString("\n%1\n Running: %2\n%1\n\n").arg(rule, display));
    Logger::info("Starting: " + display, "Process");

    QProcess process;
    process.setProgram(m_command.first());
    process.setArguments(m_command.mid(1));
    process.setProcessChannelMode(QProcess::MergedChannels);
#ifdef Q_OS_WIN
    process.setCreateProcessArgumentsModifier([](QProcess::CreateProcessArguments* args) {
        args->flags |= CREATE_NO_WINDOW;
    });
#endif

    process.start(QIODevice::ReadOnly);
    if (!process.waitForStarted(-1)) {
        if (process.error() == QProcess::FailedToStart) {
            emitText(QString("\n[ERROR] Could not find executable: %1\n").arg(m_command.first()));
            emitText(QString("  %1 Check the Settings tab and make sure the path is correct.\n").arg(QChar(0x2192)));
            emitText(QString("  %1 If using sbstck-dl, install it with:  pip install sbstck-dl\n").arg(QChar(0x2192)));
        } else {
            emitText(QString("\n[ERROR] %1\n").arg(process.errorString()));
        }
        Logger::error(QString("Failed to start %1: %2").arg(m_command.first(), process.errorString()), "Process");
        return;
    }

    // Forward complete lines as they arrive. A partial line stays buffered in
    // QProcess until its newline shows up or the process ends.
    while (process.state() != QProcess::NotRunning) {
        if (!shouldContinue()) {
            process.kill();
            process.waitForFinished();
            emitText("\n[Process terminated]\n");
            Logger::warning("Terminated on shutdown: " + m_command.first(), "Process");
            return;
        }
        process.waitForReadyRead(100);
        while (process.canReadLine())
            emitText(decode(process.readLine()));
    }

    // Drain whatever arrived between the last read and process exit
    while (process.canReadLine())
        emitText(decode(process.readLine()));
    const QByteArray rest = process.readAll();
    if (!rest.isEmpty())
        emitText(decode(rest));

    if (process.exitStatus() == QProcess::CrashExit) {
        emitText(QString("\n%1 Process exited with code %2\n").arg(QChar(0x2717)).arg(NoExitCode));
        Logger::error(QString("%1 crashed: %2").arg(m_command.first(), process.errorString()), "Process");
        return;
    }

    const int code = process.exitCode();
    m_exitCode.store(code, std::memory_order_release);
    if (code == 0) {
        m_succeeded.store(true, std::memory_order_release);
        emitText(QString("\n%1 Completed successfully (exit code 0)\n").arg(QChar(0x2713)));
        Logger::info(m_command.first() + " finished with exit code 0", "Process");
    } else {
        emitText(QString("\n%1 Process exited with code %2\n").arg(QChar(0x2717)).arg(code));
        Logger::warning(QString("%1 finished with exit code %2").arg(m_command.first()).arg(code), "Process");
    }
}
