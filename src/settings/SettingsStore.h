#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include "Settings.h"
#include <QString>

/**
 * @brief Loads and saves Settings as a JSON document at a fixed path.
 *
 * load() never fails: a missing, unreadable or corrupt document yields the
 * defaults. save() reports failures through its return value so the caller
 * can tell the user; the process keeps running either way.
 */
class SettingsStore {
public:
    explicit SettingsStore(const QString& path = defaultPath());

    /** config.json beside the executable */
    static QString defaultPath();

    QString path() const { return m_path; }

    Settings load() const;
    bool save(const Settings& settings, QString* errorMsg = nullptr) const;

private:
    QString m_path;
};

#endif // SETTINGSSTORE_H
