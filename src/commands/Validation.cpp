#include "Validation.h"
#include "CommandBuilder.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace Archiver {

namespace {

bool fail(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

} // namespace

bool isIsoDate(const QString& text) {
    static const QRegularExpression re(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    return re.match(text).hasMatch();
}

bool validateDownload(const DownloadParams& params, QString* error) {
    const QString url = params.url.trimmed();
    if (url.isEmpty())
        return fail(error, "Substack URL is required.");
    if (!url.startsWith("http"))
        return fail(error, "URL must start with http:// or https://");

    if (params.outputDir.trimmed().isEmpty())
        return fail(error, "Please select an output folder.");

    const QString rate = params.rateLimit.trimmed();
    if (!rate.isEmpty()) {
        bool ok = false;
        const double r = rate.toDouble(&ok);
        if (!ok)
            return fail(error, "Rate must be a number (e.g. 1 or 0.5).");
        if (r <= 0)
            return fail(error, "Rate must be a positive number.");
    }

    if (params.filterByDate) {
        const QString after = params.afterDate.trimmed();
        const QString before = params.beforeDate.trimmed();
        if (!after.isEmpty() && !isIsoDate(after))
            return fail(error, "After date must be in YYYY-MM-DD format.");
        if (!before.isEmpty() && !isIsoDate(before))
            return fail(error, "Before date must be in YYYY-MM-DD format.");
    }

    return true;
}

bool validateConvert(const ConvertParams& params, QString* error) {
    const QString source = params.sourceDir.trimmed();
    if (source.isEmpty())
        return fail(error, "Please select a source folder containing .md files.");
    if (!QFileInfo(source).isDir())
        return fail(error, QString("Source folder does not exist:\n%1").arg(source));

    if (CommandBuilder::findInputFiles(source).isEmpty()) {
        return fail(error,
                    "No .md files found in the source folder (excluding index.md).\n"
                    "Make sure you downloaded in Markdown format first.");
    }

    const QString output = params.outputFile.trimmed();
    if (output.isEmpty())
        return fail(error, "Please choose an output .epub file path.");
    if (!output.endsWith(".epub", Qt::CaseInsensitive))
        return fail(error, "Output file must have a .epub extension.");

    return true;
}

} // namespace Archiver
