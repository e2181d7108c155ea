#include "core/Logger.h"
#include "TestUtils.h"

#include <QDebug>
#include <QFileInfo>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
    }

    void TearDown() override {
        Logger::shutdown();
    }

    QString logPath() const { return QDir(m_dir.path()).filePath("SubstackArchiver.log"); }

    QTemporaryDir m_dir;
};

TEST_F(LoggerTest, MessagesBeforeInitAreDropped) {
    Logger::info("too early", "Test");
    ASSERT_TRUE(Logger::init(m_dir.path()));
    EXPECT_FALSE(Logger::getRecentLogs(50).contains("too early"));
}

TEST_F(LoggerTest, WritesToFileAndHistory) {
    ASSERT_TRUE(Logger::init(m_dir.path()));
    EXPECT_EQ(Logger::currentLogFile(), logPath());

    Logger::warning("rate limit is odd", "Settings");
    const QString recent = Logger::getRecentLogs(1);
    EXPECT_TRUE(recent.contains("WARNING"));
    EXPECT_TRUE(recent.contains("[Settings] rate limit is odd"));
    EXPECT_FALSE(recent.contains('\n'));

    Logger::shutdown();
    const QString onDisk = QString::fromUtf8(TestUtils::readFile(logPath()));
    EXPECT_TRUE(onDisk.contains("[Settings] rate limit is odd"));
    EXPECT_TRUE(onDisk.contains("session ended"));
}

TEST_F(LoggerTest, QtWarningsAreCaptured) {
    ASSERT_TRUE(Logger::init(m_dir.path()));
    qWarning() << "routed through qt";
    EXPECT_TRUE(Logger::getRecentLogs(5).contains("routed through qt"));
}

TEST_F(LoggerTest, HistoryIsBounded) {
    ASSERT_TRUE(Logger::init(m_dir.path()));
    for (int i = 0; i < Logger::RecentLines + 20; ++i)
        Logger::info(QString("entry %1").arg(i));

    const QStringList lines = Logger::getRecentLogs(Logger::RecentLines * 2).split('\n');
    EXPECT_EQ(lines.size(), Logger::RecentLines);
    EXPECT_TRUE(lines.last().endsWith(QString("entry %1").arg(Logger::RecentLines + 19)));
    EXPECT_EQ(Logger::getRecentLogs(0), QString());
}

TEST_F(LoggerTest, OversizedLogIsRotated) {
    ASSERT_TRUE(TestUtils::writeFile(logPath(), QByteArray(Logger::MaxFileBytes + 1, 'x')));
    ASSERT_TRUE(Logger::init(m_dir.path()));

    EXPECT_EQ(QFileInfo(logPath() + ".1").size(), Logger::MaxFileBytes + 1);
    EXPECT_LT(QFileInfo(logPath()).size(), 4096);
}
