#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <memory>

#include "process/ProcessRunner.h"
#include "settings/Settings.h"
#include "settings/SettingsStore.h"

class QCloseEvent;
class QTabWidget;
class LogSink;
class LogPanel;
class DownloadPanel;
class ConvertPanel;
class SettingsPanel;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    enum LogType {
        Log_Info,
        Log_Success,
        Log_Warning,
        Log_Error
    };

    explicit MainWindow(const SettingsStore& store, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Append to the Output Log and mirror to the log file.
     * Safe from any thread: the text goes through the log sink.
     */
    void log(const QString& msg, LogType type = Log_Info);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onDownloadRequested();
    void onConvertRequested();
    void onSaveSettings();
    void onRunStarted(ProcessRunner::Operation operation);
    void onRunFinished(ProcessRunner::Operation operation, bool success);

private:
    void setupUI();
    void restoreGeometryFromSettings();
    void showDownloadComplete(const QString& outputFolder, bool dryRun);
    void showConversionComplete(const QString& epubPath);
    void openFolder(const QString& path);
    bool persistSettings();

    SettingsStore m_store;
    Settings m_settings;

    std::shared_ptr<LogSink> m_sink;
    ProcessRunner* m_runner = nullptr;

    QTabWidget* m_tabs = nullptr;
    DownloadPanel* m_downloadPanel = nullptr;
    ConvertPanel* m_convertPanel = nullptr;
    SettingsPanel* m_settingsPanel = nullptr;
    LogPanel* m_logPanel = nullptr;

    // Values captured when the run was launched, for the completion dialog
    QString m_runOutputFolder;
    QString m_runEpubPath;
    bool m_runDryRun = false;

    bool m_isClosing = false;
};

#endif // MAINWINDOW_H
