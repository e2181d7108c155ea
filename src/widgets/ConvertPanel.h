#ifndef CONVERTPANEL_H
#define CONVERTPANEL_H

#include "commands/CommandParams.h"

#include <QWidget>

class QCheckBox;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class Settings;

// "ePub Conversion" tab: pandoc options, the list of files that will be
// bound, the command preview and the convert button
class ConvertPanel : public QWidget {
    Q_OBJECT
public:
    explicit ConvertPanel(QWidget* parent = nullptr);

    ConvertParams params() const;

    void applySettings(const Settings& settings);
    void storeSettings(Settings& settings) const;

    void setExecutable(const QString& path);

    // Prefill from a finished download
    void setSourceDir(const QString& dir);
    void setOutputFile(const QString& file);

    void setRunning(bool running);

signals:
    void convertRequested();

public slots:
    void updatePreview();
    void updateFilesPreview();

private:
    void setupUI();
    void browseSourceDir();
    void browseOutputFile();

    QString m_executable;

    QLineEdit* m_sourceEdit;
    QPlainTextEdit* m_filesPreview;
    QLineEdit* m_outputEdit;
    QLineEdit* m_titleEdit;
    QLineEdit* m_authorEdit;
    QCheckBox* m_tocCheck;
    QLineEdit* m_splitEdit;
    QPlainTextEdit* m_preview;
    QPushButton* m_convertBtn;
};

#endif // CONVERTPANEL_H
