#include "SettingsStore.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

SettingsStore::SettingsStore(const QString& path)
    : m_path(path)
{
}

QString SettingsStore::defaultPath()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath("config.json");
}

Settings SettingsStore::load() const
{
    if (!QFileInfo::exists(m_path)) {
        Logger::info(QString("No settings file at %1, using defaults").arg(m_path), "Settings");
        return Settings::defaults();
    }

    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly)) {
        Logger::warning(formatError("Cannot read settings", m_path, file.errorString()), "Settings");
        return Settings::defaults();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        Logger::warning(formatError("Corrupt settings", m_path, parseError.errorString()), "Settings");
        return Settings::defaults();
    }
    if (!doc.isObject()) {
        Logger::warning(formatError("Corrupt settings", m_path, "root is not an object"), "Settings");
        return Settings::defaults();
    }

    Logger::info(QString("Settings loaded from %1").arg(m_path), "Settings");
    return Settings::merged(doc.object());
}

bool SettingsStore::save(const Settings& settings, QString* errorMsg) const
{
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        QString err = formatError("Cannot open settings for writing", m_path, file.errorString());
        Logger::error(err, "Settings");
        if (errorMsg) *errorMsg = err;
        return false;
    }

    const QByteArray data = QJsonDocument(settings.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size() || !file.commit()) {
        QString err = formatError("Cannot write settings", m_path, file.errorString());
        Logger::error(err, "Settings");
        if (errorMsg) *errorMsg = err;
        return false;
    }

    Logger::info(QString("Settings saved to %1").arg(m_path), "Settings");
    return true;
}
