#include "CommandBuilder.h"

#include <QDir>
#include <QFileInfo>
#include <QLocale>

#include <algorithm>
#include <cmath>

const QString CommandBuilder::DefaultDownloader = "sbstck-dl";
const QString CommandBuilder::DefaultConverter  = "pandoc";
const QString CommandBuilder::InputExtension    = ".md";
const QString CommandBuilder::IndexFileName     = "index.md";
const QString CommandBuilder::DefaultTitle      = "Substack Archive";
const QString CommandBuilder::DefaultAuthor     = "Unknown";

namespace {

struct FormatEntry {
    const char* label;
    const char* flag;
};

// Combo order; the first entry is the fallback for unknown labels
const FormatEntry kFormats[] = {
    { "Markdown (.md)",    "md"   },
    { "HTML (.html)",      "html" },
    { "Plain Text (.txt)", "txt"  },
};

QString orDefault(const QString& value, const QString& fallback) {
    const QString t = value.trimmed();
    return t.isEmpty() ? fallback : t;
}

} // namespace

QStringList CommandBuilder::formatLabels() {
    QStringList labels;
    for (const FormatEntry& f : kFormats)
        labels << QString::fromLatin1(f.label);
    return labels;
}

QString CommandBuilder::formatFlag(const QString& label) {
    for (const FormatEntry& f : kFormats) {
        if (label == QLatin1String(f.label))
            return QString::fromLatin1(f.flag);
    }
    return QString::fromLatin1(kFormats[0].flag);
}

QString CommandBuilder::formatRate(double rate) {
    // Plain decimals between 1e-4 and 1e16, exponent form outside, and
    // always a fractional part ("2" -> "2.0") so the tool reads a float
    const double magnitude = std::fabs(rate);
    const bool plain = rate == 0.0 || (magnitude >= 1e-4 && magnitude < 1e16);
    QString s = QString::number(rate, plain ? 'f' : 'g', QLocale::FloatingPointShortest);
    if (!s.contains('.') && !s.contains('e') && !s.contains("inf") && !s.contains("nan"))
        s += ".0";
    return s;
}

QStringList CommandBuilder::buildDownloadCommand(const DownloadParams& p) {
    QStringList cmd;
    cmd << orDefault(p.executable, DefaultDownloader) << "download";

    const QString url = p.url.trimmed();
    if (!url.isEmpty())
        cmd << "--url" << url;

    const QString out = p.outputDir.trimmed();
    if (!out.isEmpty())
        cmd << "-o" << out;

    cmd << "-f" << formatFlag(p.formatLabel);

    if (p.filterByDate) {
        const QString after = p.afterDate.trimmed();
        const QString before = p.beforeDate.trimmed();
        if (!after.isEmpty())
            cmd << "--after" << after;
        if (!before.isEmpty())
            cmd << "--before" << before;
    }

    if (p.downloadImages) {
        cmd << "--download-images" << "--image-quality" << p.imageQuality;
        const QString imagesDir = p.imagesDir.trimmed();
        if (!imagesDir.isEmpty() && imagesDir != "images")
            cmd << "--images-dir" << imagesDir;
    }

    if (p.downloadFiles) {
        cmd << "--download-files";
        const QString exts = p.fileExtensions.trimmed();
        if (!exts.isEmpty())
            cmd << "--file-extensions" << exts;
        const QString filesDir = p.filesDir.trimmed();
        if (!filesDir.isEmpty() && filesDir != "files")
            cmd << "--files-dir" << filesDir;
    }

    if (p.addSourceUrl)
        cmd << "--add-source-url";
    if (p.createArchive)
        cmd << "--create-archive";

    const QString rate = p.rateLimit.trimmed();
    if (!rate.isEmpty() && rate != "1") {
        bool ok = false;
        const double value = rate.toDouble(&ok);
        if (ok)
            cmd << "-r" << formatRate(value);
    }

    if (p.verbose)
        cmd << "-v";
    if (p.dryRun)
        cmd << "-d";

    const QString cookieValue = p.cookieValue.trimmed();
    if (!cookieValue.isEmpty())
        cmd << "--cookie_name" << p.cookieName << "--cookie_val" << cookieValue;

    return cmd;
}

std::optional<QStringList> CommandBuilder::buildConvertCommand(const ConvertParams& p) {
    const QString sourceDir = p.sourceDir.trimmed();
    if (sourceDir.isEmpty() || !QFileInfo(sourceDir).isDir())
        return std::nullopt;

    const QStringList files = findInputFiles(sourceDir);
    if (files.isEmpty())
        return std::nullopt;

    const QDir dir(sourceDir);
    QStringList cmd;
    cmd << orDefault(p.executable, DefaultConverter);
    for (const QString& f : files)
        cmd << dir.filePath(f);

    const QString output = p.outputFile.trimmed();
    if (!output.isEmpty())
        cmd << "-o" << output;

    cmd << "--metadata" << QString("title=%1").arg(orDefault(p.title, DefaultTitle));
    cmd << "--metadata" << QString("author=%1").arg(orDefault(p.author, DefaultAuthor));
    if (p.tableOfContents)
        cmd << "--toc";
    cmd << QString("--split-level=%1").arg(orDefault(p.splitLevel, "1"));

    return cmd;
}

QStringList CommandBuilder::findInputFiles(const QString& sourceDir) {
    QDir dir(sourceDir);
    if (!dir.exists())
        return {};

    QStringList files;
    const QStringList entries = dir.entryList(QDir::Files | QDir::Hidden | QDir::System, QDir::Name);
    for (const QString& name : entries) {
        if (name.endsWith(InputExtension, Qt::CaseInsensitive)
            && name.toLower() != IndexFileName)
            files << name;
    }
    // QDir::Name is locale aware on some platforms; keep a plain code-point order
    std::sort(files.begin(), files.end());
    return files;
}

QString CommandBuilder::toDisplayString(const QStringList& command) {
    static const QString special = QStringLiteral("&|<>()\"");
    QStringList parts;
    parts.reserve(command.size());
    for (const QString& arg : command) {
        bool quote = arg.isEmpty() || arg.contains(' ');
        for (int i = 0; !quote && i < special.size(); ++i)
            quote = arg.contains(special.at(i));
        parts << (quote ? QString("\"%1\"").arg(arg) : arg);
    }
    return parts.join(' ');
}

QString CommandBuilder::downloadPreviewText(const DownloadParams& p) {
    return toDisplayString(buildDownloadCommand(p));
}

QString CommandBuilder::convertPreviewText(const ConvertParams& p) {
    if (!buildConvertCommand(p))
        return "(Select a source folder containing .md files and an output path)";

    const QString sourceDir = p.sourceDir.trimmed();
    const QStringList files = findInputFiles(sourceDir);

    QStringList lines;
    lines << orDefault(p.executable, DefaultConverter);
    if (!files.isEmpty()) {
        lines << QString("  \"%1\"").arg(QDir(sourceDir).filePath(files.first()));
        if (files.size() > 1)
            lines << QString("  ... (%1 .md files total, sorted by name)").arg(files.size());
    }
    lines << QString("  -o \"%1\"").arg(orDefault(p.outputFile, "<output.epub>"));
    lines << QString("  --metadata title=\"%1\"").arg(orDefault(p.title, DefaultTitle));
    lines << QString("  --metadata author=\"%1\"").arg(orDefault(p.author, DefaultAuthor));
    if (p.tableOfContents)
        lines << "  --toc";
    lines << QString("  --split-level=%1").arg(orDefault(p.splitLevel, "1"));
    return lines.join(" \\\n");
}

QString CommandBuilder::filesPreviewText(const QString& sourceDir) {
    const QString source = sourceDir.trimmed();
    if (source.isEmpty())
        return "(No folder selected)";
    if (!QFileInfo(source).isDir())
        return "(Folder does not exist)";

    const QStringList files = findInputFiles(source);
    if (files.isEmpty()) {
        return "No .md files found (excluding index.md).\n"
               "Make sure you downloaded using Markdown format first.";
    }
    return QString("Found %1 file(s):\n").arg(files.size()) + files.join('\n');
}
