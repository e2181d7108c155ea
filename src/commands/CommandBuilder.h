#ifndef COMMANDBUILDER_H
#define COMMANDBUILDER_H

#include "CommandParams.h"
#include <QStringList>
#include <optional>

/**
 * @brief Maps form state to the argument vectors of the external tools.
 *
 * Every function is pure apart from the directory listing done for the
 * converter: the same form state always yields the same command. Element 0
 * of a command is the executable, the rest are its arguments.
 */
class CommandBuilder {
public:
    static const QString DefaultDownloader;     // "sbstck-dl"
    static const QString DefaultConverter;      // "pandoc"
    static const QString InputExtension;        // ".md"
    static const QString IndexFileName;         // "index.md"
    static const QString DefaultTitle;
    static const QString DefaultAuthor;

    // Format combo labels in display order, and their -f values
    static QStringList formatLabels();
    static QString formatFlag(const QString& label);

    static QStringList buildDownloadCommand(const DownloadParams& p);

    /**
     * @brief Converter command, or std::nullopt while the source folder is
     *        unset, missing or holds no input files.
     */
    static std::optional<QStringList> buildConvertCommand(const ConvertParams& p);

    /**
     * @brief Input file names in @p sourceDir: "*.md" in any letter case,
     *        index.md excluded, sorted by name. Unreadable folders give an
     *        empty list.
     */
    static QStringList findInputFiles(const QString& sourceDir);

    /**
     * @brief One-line rendering for display. Elements that are empty or
     *        contain a space or one of &|<>()" are wrapped in double quotes.
     */
    static QString toDisplayString(const QStringList& command);

    // Preview texts shown beside the forms
    static QString downloadPreviewText(const DownloadParams& p);
    static QString convertPreviewText(const ConvertParams& p);
    static QString filesPreviewText(const QString& sourceDir);

private:
    static QString formatRate(double rate);
};

#endif // COMMANDBUILDER_H
