#include "commands/CommandBuilder.h"
#include "commands/Validation.h"
#include "TestUtils.h"

#include <QTemporaryDir>
#include <gtest/gtest.h>

using Archiver::validateConvert;
using Archiver::validateDownload;

namespace {

DownloadParams validDownload()
{
    DownloadParams p;
    p.url = "https://x.substack.com";
    p.outputDir = "/tmp/out";
    return p;
}

QString downloadError(const DownloadParams& p)
{
    QString err;
    EXPECT_FALSE(validateDownload(p, &err));
    return err;
}

} // namespace

TEST(DownloadValidationTest, AcceptsValidForm) {
    QString err;
    EXPECT_TRUE(validateDownload(validDownload(), &err));
    EXPECT_TRUE(err.isEmpty());
    EXPECT_TRUE(validateDownload(validDownload()));
}

TEST(DownloadValidationTest, UrlRules) {
    DownloadParams p = validDownload();
    p.url = "  ";
    EXPECT_EQ(downloadError(p), QString("Substack URL is required."));
    p.url = "x.substack.com";
    EXPECT_EQ(downloadError(p), QString("URL must start with http:// or https://"));
    p.url = "http://x.substack.com";
    EXPECT_TRUE(validateDownload(p));
}

TEST(DownloadValidationTest, FirstFailingRuleWins) {
    DownloadParams p;
    p.rateLimit = "abc";
    p.filterByDate = true;
    p.afterDate = "yesterday";
    EXPECT_EQ(downloadError(p), QString("Substack URL is required."));

    p.url = "https://x.substack.com";
    EXPECT_EQ(downloadError(p), QString("Please select an output folder."));

    p.outputDir = "/tmp/out";
    EXPECT_EQ(downloadError(p), QString("Rate must be a number (e.g. 1 or 0.5)."));

    p.rateLimit = "1";
    EXPECT_EQ(downloadError(p), QString("After date must be in YYYY-MM-DD format."));
}

TEST(DownloadValidationTest, RateRules) {
    DownloadParams p = validDownload();
    p.rateLimit = "0";
    EXPECT_EQ(downloadError(p), QString("Rate must be a positive number."));
    p.rateLimit = "-2";
    EXPECT_EQ(downloadError(p), QString("Rate must be a positive number."));
    p.rateLimit = "1,5";
    EXPECT_EQ(downloadError(p), QString("Rate must be a number (e.g. 1 or 0.5)."));
    p.rateLimit = "0.25";
    EXPECT_TRUE(validateDownload(p));
    p.rateLimit = "";
    EXPECT_TRUE(validateDownload(p));
}

TEST(DownloadValidationTest, DatesCheckedOnlyWhenFiltering) {
    DownloadParams p = validDownload();
    p.afterDate = "01/02/2024";
    p.beforeDate = "2024-1-5";
    EXPECT_TRUE(validateDownload(p));

    p.filterByDate = true;
    EXPECT_EQ(downloadError(p), QString("After date must be in YYYY-MM-DD format."));
    p.afterDate = "2024-01-02";
    EXPECT_EQ(downloadError(p), QString("Before date must be in YYYY-MM-DD format."));
    p.beforeDate = "";
    EXPECT_TRUE(validateDownload(p));
}

TEST(DownloadValidationTest, MalformedDateFailsBeforeAnyCommand) {
    DownloadParams p = validDownload();
    p.filterByDate = true;
    p.beforeDate = "2024-13";
    EXPECT_FALSE(validateDownload(p));
    // Shape only: the builder would still pass it through verbatim
    EXPECT_TRUE(CommandBuilder::buildDownloadCommand(p).contains("2024-13"));
}

TEST(DateShapeTest, ShapeOnly) {
    EXPECT_TRUE(Archiver::isIsoDate("2024-02-30"));
    EXPECT_FALSE(Archiver::isIsoDate("2024-2-3"));
    EXPECT_FALSE(Archiver::isIsoDate(" 2024-02-03"));
    EXPECT_FALSE(Archiver::isIsoDate("2024-02-03x"));
}

class ConvertValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_params.sourceDir = m_dir.path();
        m_params.outputFile = QDir(m_dir.path()).filePath("book.epub");
    }

    QString error() {
        QString err;
        EXPECT_FALSE(validateConvert(m_params, &err));
        return err;
    }

    QTemporaryDir m_dir;
    ConvertParams m_params;
};

TEST_F(ConvertValidationTest, SourceFolderRequired) {
    m_params.sourceDir = " ";
    EXPECT_EQ(error(), QString("Please select a source folder containing .md files."));
}

TEST_F(ConvertValidationTest, SourceFolderMustExist) {
    const QString missing = QDir(m_dir.path()).filePath("gone");
    m_params.sourceDir = missing;
    EXPECT_EQ(error(), QString("Source folder does not exist:\n%1").arg(missing));
}

TEST_F(ConvertValidationTest, NoMatchingFilesIsReportedAndCommandNotReady) {
    TestUtils::touchFiles(QDir(m_dir.path()), { "index.md", "notes.txt" });
    EXPECT_EQ(error(), QString("No .md files found in the source folder (excluding index.md).\n"
                               "Make sure you downloaded in Markdown format first."));
    EXPECT_FALSE(CommandBuilder::buildConvertCommand(m_params).has_value());
}

TEST_F(ConvertValidationTest, OutputRules) {
    TestUtils::touchFiles(QDir(m_dir.path()), { "a.md" });

    m_params.outputFile = "";
    EXPECT_EQ(error(), QString("Please choose an output .epub file path."));
    m_params.outputFile = "/tmp/book.pdf";
    EXPECT_EQ(error(), QString("Output file must have a .epub extension."));
    m_params.outputFile = "/tmp/BOOK.EPUB";
    EXPECT_TRUE(validateConvert(m_params));
}
