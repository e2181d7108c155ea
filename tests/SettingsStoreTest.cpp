#include "settings/Settings.h"
#include "settings/SettingsStore.h"
#include "TestUtils.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class SettingsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_path = QDir(m_dir.path()).filePath("config.json");
    }

    QTemporaryDir m_dir;
    QString m_path;
};

TEST_F(SettingsStoreTest, MissingFileYieldsDefaults) {
    SettingsStore store(m_path);
    EXPECT_EQ(store.load(), Settings::defaults());
}

TEST_F(SettingsStoreTest, DefaultValues) {
    const Settings s = Settings::defaults();
    EXPECT_EQ(s.sbstckdlPath(), QString());
    EXPECT_EQ(s.lastUrl(), QString());
    EXPECT_EQ(s.lastOutputDir(), QString());
    EXPECT_EQ(s.lastFormat(), QString("Markdown (.md)"));
    EXPECT_EQ(s.lastEpubSourceDir(), QString());
    EXPECT_EQ(s.lastEpubOutputFile(), QString());
    EXPECT_EQ(s.lastAuthor(), QString());
    EXPECT_EQ(s.windowGeometry(), QString("1050x800"));
#ifdef Q_OS_WIN
    EXPECT_EQ(s.pandocPath(), QString("C:\\Program Files\\Pandoc\\pandoc.exe"));
#else
    EXPECT_EQ(s.pandocPath(), QString());
#endif
    EXPECT_EQ(s.toJson().size(), 9);
}

TEST_F(SettingsStoreTest, CorruptJsonYieldsDefaults) {
    ASSERT_TRUE(TestUtils::writeFile(m_path, "{ \"last_url\": \"https://a.substack.com\", "));
    EXPECT_EQ(SettingsStore(m_path).load(), Settings::defaults());
}

TEST_F(SettingsStoreTest, NonObjectRootYieldsDefaults) {
    ASSERT_TRUE(TestUtils::writeFile(m_path, "[1, 2, 3]"));
    EXPECT_EQ(SettingsStore(m_path).load(), Settings::defaults());
}

TEST_F(SettingsStoreTest, PartialDocumentIsMergedOverDefaults) {
    ASSERT_TRUE(TestUtils::writeFile(m_path,
        "{ \"last_url\": \"https://x.substack.com\", \"last_author\": \"Jane\" }"));

    const Settings s = SettingsStore(m_path).load();
    EXPECT_EQ(s.lastUrl(), QString("https://x.substack.com"));
    EXPECT_EQ(s.lastAuthor(), QString("Jane"));
    // Missing keys come from the defaults
    EXPECT_EQ(s.lastFormat(), QString("Markdown (.md)"));
    EXPECT_EQ(s.windowGeometry(), QString("1050x800"));
    for (const QString& key : Settings::defaultValues().keys())
        EXPECT_TRUE(s.contains(key)) << key.toStdString();
}

TEST_F(SettingsStoreTest, UnknownKeysSurviveRoundTrip) {
    ASSERT_TRUE(TestUtils::writeFile(m_path,
        "{ \"future_option\": true, \"future_list\": [1, 2], \"last_url\": \"https://y.substack.com\" }"));

    SettingsStore store(m_path);
    ASSERT_TRUE(store.save(store.load()));

    const QJsonObject obj = QJsonDocument::fromJson(TestUtils::readFile(m_path)).object();
    EXPECT_EQ(obj.value("future_option").toBool(), true);
    EXPECT_EQ(obj.value("future_list").toArray().size(), 2);
    EXPECT_EQ(obj.value("last_url").toString(), QString("https://y.substack.com"));
    EXPECT_TRUE(obj.contains("window_geometry"));
}

TEST_F(SettingsStoreTest, SaveOfLoadIsIdempotent) {
    ASSERT_TRUE(TestUtils::writeFile(m_path, "{ \"last_author\": \"A\" }"));
    SettingsStore store(m_path);

    ASSERT_TRUE(store.save(store.load()));
    const QByteArray first = TestUtils::readFile(m_path);
    ASSERT_TRUE(store.save(store.load()));
    const QByteArray second = TestUtils::readFile(m_path);

    EXPECT_EQ(first, second);
    EXPECT_EQ(store.load().lastAuthor(), QString("A"));
}

TEST_F(SettingsStoreTest, WrongTypedValueFallsBackButIsKept) {
    ASSERT_TRUE(TestUtils::writeFile(m_path, "{ \"last_format\": 5 }"));
    const Settings s = SettingsStore(m_path).load();

    EXPECT_EQ(s.lastFormat(), QString("Markdown (.md)"));
    EXPECT_EQ(s.toJson().value("last_format").toInt(), 5);
}

TEST_F(SettingsStoreTest, SavedValuesReloadExactly) {
    Settings s;
    s.setString(Settings::KeyLastUrl, "https://z.substack.com");
    s.setString(Settings::KeyPandocPath, "/usr/local/bin/pandoc");
    s.setBoolean("remember_me", true);

    SettingsStore store(m_path);
    ASSERT_TRUE(store.save(s));
    const Settings loaded = store.load();
    EXPECT_EQ(loaded, s);
    EXPECT_TRUE(loaded.boolean("remember_me"));
    EXPECT_FALSE(loaded.boolean(Settings::KeyLastUrl));
}

TEST_F(SettingsStoreTest, SaveReportsUnwritablePath) {
    SettingsStore store(QDir(m_dir.path()).filePath("missing/sub/dir/config.json"));
    QString err;
    EXPECT_FALSE(store.save(Settings::defaults(), &err));
    EXPECT_FALSE(err.isEmpty());
}

TEST(WindowGeometryTest, ParsesSizeOnly) {
    QSize size;
    bool hasPos = true;
    ASSERT_TRUE(Archiver::parseWindowGeometry("1050x800", &size, nullptr, &hasPos));
    EXPECT_EQ(size, QSize(1050, 800));
    EXPECT_FALSE(hasPos);
}

TEST(WindowGeometryTest, ParsesSizeAndPosition) {
    QSize size;
    QPoint pos;
    bool hasPos = false;
    ASSERT_TRUE(Archiver::parseWindowGeometry("900x700+12+-30", &size, &pos, &hasPos));
    EXPECT_EQ(size, QSize(900, 700));
    EXPECT_TRUE(hasPos);
    EXPECT_EQ(pos, QPoint(12, -30));
}

TEST(WindowGeometryTest, RejectsMalformed) {
    QSize size;
    EXPECT_FALSE(Archiver::parseWindowGeometry("", &size));
    EXPECT_FALSE(Archiver::parseWindowGeometry("big", &size));
    EXPECT_FALSE(Archiver::parseWindowGeometry("0x800", &size));
    EXPECT_FALSE(Archiver::parseWindowGeometry("1050x", &size));
}

TEST(WindowGeometryTest, FormatMatchesParse) {
    const QString text = Archiver::formatWindowGeometry(QRect(40, 50, 1024, 768));
    EXPECT_EQ(text, QString("1024x768+40+50"));
}
