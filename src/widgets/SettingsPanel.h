#ifndef SETTINGSPANEL_H
#define SETTINGSPANEL_H

#include <QWidget>

class QLineEdit;
class QPushButton;
class Settings;

// "Settings" tab: locations of the two external tools
class SettingsPanel : public QWidget {
    Q_OBJECT
public:
    explicit SettingsPanel(QWidget* parent = nullptr);

    QString sbstckdlPath() const;
    QString pandocPath() const;

    void applySettings(const Settings& settings);
    void storeSettings(Settings& settings) const;

    // Button reads "Saved!" for two seconds
    void showSavedFeedback();

signals:
    void sbstckdlPathChanged(const QString& path);
    void pandocPathChanged(const QString& path);
    void saveRequested();

private:
    void setupUI();
    void browseExecutable(QLineEdit* target);

    QLineEdit* m_sbstckdlEdit;
    QLineEdit* m_pandocEdit;
    QPushButton* m_saveBtn;
};

#endif // SETTINGSPANEL_H
