#include "process/LogSink.h"
#include "process/ProcessRunner.h"
#include "process/ProcessTask.h"
#include "core/TaskManager.h"
#include "TestUtils.h"

#include <QThread>
#include <gtest/gtest.h>
#include <memory>

// Runs real subprocesses through /bin/sh
class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifdef Q_OS_WIN
        GTEST_SKIP() << "POSIX shell required";
#endif
        m_sink = std::make_shared<LogSink>();
        m_runner = std::make_unique<ProcessRunner>(m_sink);
        QObject::connect(m_runner.get(), &ProcessRunner::finished, m_runner.get(),
                         [this](ProcessRunner::Operation op, bool success) {
                             ++m_finishedCount;
                             m_lastOp = op;
                             m_lastSuccess = success;
                         });
    }

    static QStringList shell(const QString& script) {
        return { "/bin/sh", "-c", script };
    }

    bool runToCompletion(const QStringList& cmd,
                         ProcessRunner::Operation op = ProcessRunner::Operation::Download) {
        if (!m_runner->start(cmd, op)) return false;
        return TestUtils::waitForSignal(m_runner.get(), &ProcessRunner::finished);
    }

    QString output() {
        m_output += m_sink->drain().join(QString());
        return m_output;
    }

    std::shared_ptr<LogSink> m_sink;
    std::unique_ptr<ProcessRunner> m_runner;
    QString m_output;
    int m_finishedCount = 0;
    ProcessRunner::Operation m_lastOp = ProcessRunner::Operation::None;
    bool m_lastSuccess = false;
};

TEST_F(ProcessRunnerTest, SuccessfulRunStreamsMergedOutput) {
    ASSERT_TRUE(runToCompletion(shell("echo hello; echo oops 1>&2; exit 0")));

    EXPECT_EQ(m_finishedCount, 1);
    EXPECT_TRUE(m_lastSuccess);
    EXPECT_EQ(m_lastOp, ProcessRunner::Operation::Download);
    EXPECT_FALSE(m_runner->isRunning());
    EXPECT_EQ(m_runner->currentOperation(), ProcessRunner::Operation::None);

    const QString out = output();
    EXPECT_TRUE(out.contains(" Running: /bin/sh -c \"echo hello; echo oops 1>&2; exit 0\"\n"));
    EXPECT_TRUE(out.contains("hello\n"));
    EXPECT_TRUE(out.contains("oops\n"));
    EXPECT_TRUE(out.endsWith(QString::fromUtf8("\n\xE2\x9C\x93 Completed successfully (exit code 0)\n")));
}

TEST_F(ProcessRunnerTest, NonZeroExitIsFailure) {
    ASSERT_TRUE(runToCompletion(shell("echo partial; exit 3"), ProcessRunner::Operation::Convert));

    EXPECT_FALSE(m_lastSuccess);
    EXPECT_EQ(m_lastOp, ProcessRunner::Operation::Convert);
    EXPECT_TRUE(output().endsWith(QString::fromUtf8("\n\xE2\x9C\x97 Process exited with code 3\n")));
}

TEST_F(ProcessRunnerTest, MissingExecutableIsReported) {
    const QString exe = "/nonexistent/dir/sbstck-dl";
    ASSERT_TRUE(runToCompletion({ exe, "download" }));

    EXPECT_FALSE(m_lastSuccess);
    const QString out = output();
    EXPECT_TRUE(out.contains("[ERROR] Could not find executable: " + exe + "\n"));
    EXPECT_TRUE(out.contains("Check the Settings tab and make sure the path is correct."));
    EXPECT_TRUE(out.contains("pip install sbstck-dl"));
    EXPECT_FALSE(out.contains("Completed successfully"));
}

TEST_F(ProcessRunnerTest, EmptyCommandFailsWithoutCrashing) {
    ASSERT_TRUE(runToCompletion({}));
    EXPECT_FALSE(m_lastSuccess);
    EXPECT_TRUE(output().contains("[ERROR] Cannot run an empty command"));
    EXPECT_FALSE(m_runner->isRunning());
}

TEST_F(ProcessRunnerTest, EveryLineArrivesBeforeCompletion) {
    ASSERT_TRUE(runToCompletion(shell("i=1; while [ $i -le 500 ]; do echo line$i; i=$((i+1)); done; printf tail")));
    ASSERT_TRUE(m_lastSuccess);

    const QString out = output();
    int last = -1;
    for (int i = 1; i <= 500; ++i) {
        const int at = out.indexOf(QString("line%1\n").arg(i));
        ASSERT_GT(at, last) << i;
        last = at;
    }
    // Unterminated final output is still forwarded
    EXPECT_GT(out.indexOf("tail"), last);
    EXPECT_LT(out.indexOf("tail"), out.indexOf("Completed successfully"));
}

TEST_F(ProcessRunnerTest, SecondStartIsRejectedWhileRunning) {
    ASSERT_TRUE(m_runner->start(shell("sleep 1; echo first-done"), ProcessRunner::Operation::Download));
    EXPECT_TRUE(m_runner->isRunning());
    EXPECT_EQ(m_runner->state(), ProcessRunner::State::Running);

    EXPECT_FALSE(m_runner->start(shell("echo second"), ProcessRunner::Operation::Convert));
    EXPECT_EQ(m_runner->currentOperation(), ProcessRunner::Operation::Download);

    ASSERT_TRUE(TestUtils::waitForSignal(m_runner.get(), &ProcessRunner::finished));
    EXPECT_EQ(m_finishedCount, 1);
    EXPECT_TRUE(m_lastSuccess);
    EXPECT_EQ(m_lastOp, ProcessRunner::Operation::Download);

    const QString out = output();
    EXPECT_TRUE(out.contains("[WARNING] A process is already running. Please wait.\n"));
    EXPECT_TRUE(out.contains("first-done"));
    EXPECT_FALSE(out.contains("second\n"));

    // Idle again: a new run is accepted
    ASSERT_TRUE(runToCompletion(shell("echo again")));
    EXPECT_EQ(m_finishedCount, 2);
}

TEST_F(ProcessRunnerTest, FinishedIsDeliveredOnOwnerThread) {
    const Qt::HANDLE testThread = QThread::currentThreadId();
    Qt::HANDLE seen = nullptr;
    QObject::connect(m_runner.get(), &ProcessRunner::finished, m_runner.get(),
                     [&seen](ProcessRunner::Operation, bool) { seen = QThread::currentThreadId(); });
    ASSERT_TRUE(runToCompletion(shell("true")));
    EXPECT_EQ(seen, testThread);
}

// ProcessTask driven directly through the pool, without the runner
class ProcessTaskTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifdef Q_OS_WIN
        GTEST_SKIP() << "POSIX shell required";
#endif
        m_sink = std::make_shared<LogSink>();
    }

    std::shared_ptr<LogSink> m_sink;
};

TEST_F(ProcessTaskTest, RecordsExitCode) {
    auto task = std::make_shared<ProcessTask>(QStringList{ "/bin/sh", "-c", "exit 7" }, m_sink);
    EXPECT_EQ(task->status(), Threading::Task::Status::Pending);
    EXPECT_EQ(task->exitCode(), ProcessTask::NoExitCode);
    EXPECT_EQ(task->command().first(), "/bin/sh");

    // Connect before submitting: the pool thread may finish immediately
    bool done = false;
    QObject::connect(task.get(), &Threading::Task::finished, task.get(), [&done](quint64) { done = true; });
    Threading::TaskManager::instance().submit(task);
    ASSERT_TRUE(TestUtils::waitUntil([&done] { return done; }));

    EXPECT_EQ(task->status(), Threading::Task::Status::Completed);
    EXPECT_EQ(task->exitCode(), 7);
    EXPECT_FALSE(task->succeeded());
}

TEST_F(ProcessTaskTest, CancelKillsTheProcess) {
    auto task = std::make_shared<ProcessTask>(QStringList{ "/bin/sh", "-c", "echo begin; sleep 30" }, m_sink);
    bool started = false;
    bool cancelled = false;
    QObject::connect(task.get(), &Threading::Task::started, task.get(), [&started](quint64) { started = true; });
    QObject::connect(task.get(), &Threading::Task::cancelled, task.get(), [&cancelled](quint64) { cancelled = true; });
    Threading::TaskManager::instance().submit(task);
    ASSERT_TRUE(TestUtils::waitUntil([&started] { return started; }));

    task->cancel();
    ASSERT_TRUE(TestUtils::waitUntil([&cancelled] { return cancelled; }));

    EXPECT_EQ(task->status(), Threading::Task::Status::Cancelled);
    EXPECT_FALSE(task->succeeded());
    EXPECT_EQ(task->exitCode(), ProcessTask::NoExitCode);
    EXPECT_TRUE(m_sink->drain().join(QString()).contains("[Process terminated]"));
}
