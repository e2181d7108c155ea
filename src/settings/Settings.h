#ifndef SETTINGS_H
#define SETTINGS_H

#include <QJsonObject>
#include <QRect>
#include <QSize>
#include <QString>

/**
 * @brief Persistent application preferences.
 *
 * A flat JSON object of string/boolean values. Keys this version does not
 * know about are carried through untouched so a newer build's settings
 * survive a round trip through an older one.
 */
class Settings {
public:
    // Document keys
    static const QString KeySbstckdlPath;
    static const QString KeyPandocPath;
    static const QString KeyLastUrl;
    static const QString KeyLastOutputDir;
    static const QString KeyLastFormat;
    static const QString KeyLastEpubSourceDir;
    static const QString KeyLastEpubOutputFile;
    static const QString KeyLastAuthor;
    static const QString KeyWindowGeometry;

    /** Defaults only */
    Settings();

    static Settings defaults();
    static QJsonObject defaultValues();

    /**
     * @brief Defaults overlaid with every key of @p loaded (known or not).
     */
    static Settings merged(const QJsonObject& loaded);

    QJsonObject toJson() const { return m_values; }

    bool contains(const QString& key) const { return m_values.contains(key); }

    /**
     * @brief String value of @p key, or its default when the stored value
     *        is missing or not a string.
     */
    QString string(const QString& key) const;
    void setString(const QString& key, const QString& value);

    bool boolean(const QString& key, bool fallback = false) const;
    void setBoolean(const QString& key, bool value);

    // Typed accessors
    QString sbstckdlPath() const      { return string(KeySbstckdlPath); }
    QString pandocPath() const        { return string(KeyPandocPath); }
    QString lastUrl() const           { return string(KeyLastUrl); }
    QString lastOutputDir() const     { return string(KeyLastOutputDir); }
    QString lastFormat() const        { return string(KeyLastFormat); }
    QString lastEpubSourceDir() const { return string(KeyLastEpubSourceDir); }
    QString lastEpubOutputFile() const { return string(KeyLastEpubOutputFile); }
    QString lastAuthor() const        { return string(KeyLastAuthor); }
    QString windowGeometry() const    { return string(KeyWindowGeometry); }

    bool operator==(const Settings& other) const { return m_values == other.m_values; }
    bool operator!=(const Settings& other) const { return !(*this == other); }

private:
    QJsonObject m_values;
};

namespace Archiver {

/**
 * @brief Parse "WIDTHxHEIGHT" or "WIDTHxHEIGHT+X+Y".
 * @param size Receives the size (always set on success)
 * @param pos  Receives the position; left untouched when none is given
 * @param hasPosition Set to true when a position was present
 * @return false for malformed input or non-positive sizes
 */
bool parseWindowGeometry(const QString& text, QSize* size, QPoint* pos = nullptr, bool* hasPosition = nullptr);

/** "WIDTHxHEIGHT+X+Y" */
QString formatWindowGeometry(const QRect& geometry);

} // namespace Archiver

#endif // SETTINGS_H
