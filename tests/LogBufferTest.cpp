#include "process/LogBuffer.h"
#include "process/LogSink.h"

#include <QThread>
#include <gtest/gtest.h>
#include <vector>

TEST(LogBufferTest, StartsWithOneEmptyLine) {
    LogBuffer buf;
    EXPECT_EQ(buf.lineCount(), 1);
    EXPECT_EQ(buf.text(), QString());
    EXPECT_EQ(buf.maxLines(), 2000);
}

TEST(LogBufferTest, FragmentsContinueTheLastLine) {
    LogBuffer buf;
    EXPECT_EQ(buf.append("Downloading "), 0);
    EXPECT_EQ(buf.append("post 1\nDownloading post 2\n"), 0);
    EXPECT_EQ(buf.text(), QString("Downloading post 1\nDownloading post 2\n"));
    EXPECT_EQ(buf.lineCount(), 3);
}

TEST(LogBufferTest, EvictsOldestBeyondCap) {
    LogBuffer buf(5);
    int evicted = 0;
    for (int i = 0; i < 8; ++i)
        evicted += buf.append(QString("line%1\n").arg(i));

    // Five lines of text plus the empty line after the last newline
    EXPECT_EQ(buf.lineCount(), 6);
    EXPECT_EQ(evicted, 3);
    EXPECT_EQ(buf.lines().first(), QString("line3"));
    EXPECT_EQ(buf.lines().at(4), QString("line7"));
    EXPECT_EQ(buf.lines().last(), QString());
}

TEST(LogBufferTest, DefaultCapHolds) {
    LogBuffer buf;
    QString chunk;
    for (int i = 0; i < 2500; ++i)
        chunk += QString("%1\n").arg(i);
    EXPECT_EQ(buf.append(chunk), 500);
    EXPECT_EQ(buf.lineCount(), LogBuffer::MaxLines + 1);
    EXPECT_EQ(buf.lines().first(), QString("500"));
    EXPECT_EQ(buf.lines().at(LogBuffer::MaxLines - 1), QString("2499"));
}

TEST(LogBufferTest, PartialLastLineCountsTowardCap) {
    LogBuffer buf(3);
    EXPECT_EQ(buf.append("a
b
c
"), 0);
    EXPECT_EQ(buf.lineCount(), 4);

    // "d" now holds text, so the oldest line goes
    EXPECT_EQ(buf.append("d"), 1);
    EXPECT_EQ(buf.lines(), QStringList({ "b", "c", "d" }));
    EXPECT_EQ(buf.text(), QString("b
c
d"));
}

TEST(LogBufferTest, ClearResets) {
    LogBuffer buf;
    buf.append("a\nb\n");
    buf.clear();
    EXPECT_EQ(buf.lineCount(), 1);
    EXPECT_EQ(buf.text(), QString());
}

TEST(LogSinkTest, DrainReturnsInOrderAndEmpties) {
    LogSink sink;
    EXPECT_TRUE(sink.isEmpty());
    sink.enqueue("a");
    sink.enqueue("");
    sink.enqueue("b\n");
    EXPECT_FALSE(sink.isEmpty());
    EXPECT_EQ(sink.drain(), QStringList({ "a", "b\n" }));
    EXPECT_TRUE(sink.isEmpty());
    EXPECT_TRUE(sink.drain().isEmpty());
}

TEST(LogSinkTest, ConcurrentWritersLoseNothing) {
    LogSink sink;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;

    std::vector<QThread*> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.push_back(QThread::create([&sink, t]() {
            for (int i = 0; i < kPerThread; ++i)
                sink.enqueue(QString("%1:%2\n").arg(t).arg(i));
        }));
    }

    int drained = 0;
    for (QThread* th : threads) th->start();
    for (QThread* th : threads) {
        while (!th->wait(1))
            drained += sink.drain().size();
    }
    drained += sink.drain().size();
    for (QThread* th : threads) delete th;

    EXPECT_EQ(drained, kThreads * kPerThread);
}
