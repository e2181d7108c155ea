#include "Settings.h"
#include <QRegularExpression>

const QString Settings::KeySbstckdlPath       = QStringLiteral("sbstckdl_path");
const QString Settings::KeyPandocPath         = QStringLiteral("pandoc_path");
const QString Settings::KeyLastUrl            = QStringLiteral("last_url");
const QString Settings::KeyLastOutputDir      = QStringLiteral("last_output_dir");
const QString Settings::KeyLastFormat         = QStringLiteral("last_format");
const QString Settings::KeyLastEpubSourceDir  = QStringLiteral("last_epub_source_dir");
const QString Settings::KeyLastEpubOutputFile = QStringLiteral("last_epub_output_file");
const QString Settings::KeyLastAuthor         = QStringLiteral("last_author");
const QString Settings::KeyWindowGeometry     = QStringLiteral("window_geometry");

Settings::Settings()
    : m_values(defaultValues())
{
}

Settings Settings::defaults()
{
    return Settings();
}

QJsonObject Settings::defaultValues()
{
    QJsonObject d;
    d[KeySbstckdlPath] = QString();
#ifdef Q_OS_WIN
    d[KeyPandocPath] = QStringLiteral("C:\\Program Files\\Pandoc\\pandoc.exe");
#else
    d[KeyPandocPath] = QString();
#endif
    d[KeyLastUrl] = QString();
    d[KeyLastOutputDir] = QString();
    d[KeyLastFormat] = QStringLiteral("Markdown (.md)");
    d[KeyLastEpubSourceDir] = QString();
    d[KeyLastEpubOutputFile] = QString();
    d[KeyLastAuthor] = QString();
    d[KeyWindowGeometry] = QStringLiteral("1050x800");
    return d;
}

Settings Settings::merged(const QJsonObject& loaded)
{
    Settings s;
    for (auto it = loaded.constBegin(); it != loaded.constEnd(); ++it) {
        s.m_values.insert(it.key(), it.value());
    }
    return s;
}

QString Settings::string(const QString& key) const
{
    const QJsonValue v = m_values.value(key);
    if (v.isString()) return v.toString();
    return defaultValues().value(key).toString();
}

void Settings::setString(const QString& key, const QString& value)
{
    m_values[key] = value;
}

bool Settings::boolean(const QString& key, bool fallback) const
{
    const QJsonValue v = m_values.value(key);
    return v.isBool() ? v.toBool() : fallback;
}

void Settings::setBoolean(const QString& key, bool value)
{
    m_values[key] = value;
}

namespace Archiver {

bool parseWindowGeometry(const QString& text, QSize* size, QPoint* pos, bool* hasPosition)
{
    static const QRegularExpression re("^(\\d+)x(\\d+)(?:([+-]-?\\d+)([+-]-?\\d+))?$");
    const QRegularExpressionMatch m = re.match(text.trimmed());
    if (!m.hasMatch()) return false;

    const int w = m.captured(1).toInt();
    const int h = m.captured(2).toInt();
    if (w <= 0 || h <= 0) return false;
    if (size) *size = QSize(w, h);

    const bool positioned = m.capturedLength(3) > 0;
    if (hasPosition) *hasPosition = positioned;
    if (positioned && pos) {
        // "+-5" is a negative offset, "+5" positive
        auto offset = [](QString s) {
            if (s.startsWith('+')) s.remove(0, 1);
            return s.toInt();
        };
        *pos = QPoint(offset(m.captured(3)), offset(m.captured(4)));
    }
    return true;
}

QString formatWindowGeometry(const QRect& geometry)
{
    return QString("%1x%2+%3+%4")
        .arg(geometry.width())
        .arg(geometry.height())
        .arg(geometry.x())
        .arg(geometry.y());
}

} // namespace Archiver
