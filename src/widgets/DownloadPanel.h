#ifndef DOWNLOADPANEL_H
#define DOWNLOADPANEL_H

#include "commands/CommandParams.h"

#include <QWidget>

class QCheckBox;
class QComboBox;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QWidget;
class Settings;

// "Download" tab: sbstck-dl options, live command preview and the start button
class DownloadPanel : public QWidget {
    Q_OBJECT
public:
    explicit DownloadPanel(QWidget* parent = nullptr);

    DownloadParams params() const;

    void applySettings(const Settings& settings);
    void storeSettings(Settings& settings) const;

    // Executable configured on the Settings tab (empty = PATH lookup)
    void setExecutable(const QString& path);

    void setRunning(bool running);

signals:
    void startRequested();

public slots:
    void updatePreview();

private:
    void setupUI();
    void toggleCookieSection();
    void toggleCookieVisibility();
    void browseOutputDir();
    void pickDate(QLineEdit* target);

    QString m_executable;

    QLineEdit* m_urlEdit;
    QLineEdit* m_outputDirEdit;
    QComboBox* m_formatCombo;

    QCheckBox* m_datesCheck;
    QWidget* m_dateFrame;
    QLineEdit* m_afterEdit;
    QLineEdit* m_beforeEdit;

    QCheckBox* m_imagesCheck;
    QWidget* m_imageFrame;
    QComboBox* m_qualityCombo;
    QLineEdit* m_imagesDirEdit;

    QCheckBox* m_filesCheck;
    QWidget* m_fileFrame;
    QLineEdit* m_extensionsEdit;
    QLineEdit* m_filesDirEdit;

    QCheckBox* m_sourceUrlCheck;
    QCheckBox* m_archiveCheck;
    QCheckBox* m_verboseCheck;
    QCheckBox* m_dryRunCheck;
    QLineEdit* m_rateEdit;

    QPushButton* m_cookieToggleBtn;
    QWidget* m_cookieFrame;
    QComboBox* m_cookieNameCombo;
    QLineEdit* m_cookieValueEdit;
    QPushButton* m_showCookieBtn;

    QPlainTextEdit* m_preview;
    QPushButton* m_startBtn;
};

#endif // DOWNLOADPANEL_H
