#include "MainWindow.h"

#include "commands/CommandBuilder.h"
#include "commands/Validation.h"
#include "core/ErrorHandling.h"
#include "core/Logger.h"
#include "core/TaskManager.h"
#include "core/ThreadState.h"
#include "dialogs/ConversionCompleteDialog.h"
#include "dialogs/DownloadCompleteDialog.h"
#include "process/LogSink.h"
#include "widgets/ConvertPanel.h"
#include "widgets/DownloadPanel.h"
#include "widgets/LogPanel.h"
#include "widgets/SettingsPanel.h"

#include <QCloseEvent>
#include <QDesktopServices>
#include <QDir>
#include <QFileInfo>
#include <QGuiApplication>
#include <QMessageBox>
#include <QScreen>
#include <QSplitter>
#include <QTabWidget>
#include <QUrl>
#include <QVBoxLayout>

MainWindow::MainWindow(const SettingsStore& store, QWidget* parent)
    : QMainWindow(parent)
    , m_store(store)
    , m_settings(store.load())
    , m_sink(std::make_shared<LogSink>())
{
    setWindowTitle(tr("Substack Archiver"));
    setMinimumSize(800, 620);

    m_runner = new ProcessRunner(m_sink, this);
    connect(m_runner, &ProcessRunner::started, this, &MainWindow::onRunStarted);
    connect(m_runner, &ProcessRunner::finished, this, &MainWindow::onRunFinished);

    setupUI();
    restoreGeometryFromSettings();
}

MainWindow::~MainWindow() {
    // Cleanup is handled in closeEvent
}

void MainWindow::setupUI() {
    QWidget* central = new QWidget(this);
    setCentralWidget(central);
    QVBoxLayout* layout = new QVBoxLayout(central);
    layout->setContentsMargins(10, 10, 10, 10);

    m_tabs = new QTabWidget(central);
    m_downloadPanel = new DownloadPanel(m_tabs);
    m_convertPanel = new ConvertPanel(m_tabs);
    m_settingsPanel = new SettingsPanel(m_tabs);
    m_tabs->addTab(m_downloadPanel, tr("Download"));
    m_tabs->addTab(m_convertPanel, tr("ePub Conversion"));
    m_tabs->addTab(m_settingsPanel, tr("Settings"));

    m_logPanel = new LogPanel(m_sink, central);

    QSplitter* splitter = new QSplitter(Qt::Vertical, central);
    splitter->addWidget(m_tabs);
    splitter->addWidget(m_logPanel);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 0);
    splitter->setChildrenCollapsible(false);
    layout->addWidget(splitter);

    // Tool paths live on the Settings tab but feed both previews
    connect(m_settingsPanel, &SettingsPanel::sbstckdlPathChanged, m_downloadPanel, &DownloadPanel::setExecutable);
    connect(m_settingsPanel, &SettingsPanel::pandocPathChanged, m_convertPanel, &ConvertPanel::setExecutable);
    connect(m_settingsPanel, &SettingsPanel::saveRequested, this, &MainWindow::onSaveSettings);
    connect(m_downloadPanel, &DownloadPanel::startRequested, this, &MainWindow::onDownloadRequested);
    connect(m_convertPanel, &ConvertPanel::convertRequested, this, &MainWindow::onConvertRequested);

    m_settingsPanel->applySettings(m_settings);
    m_downloadPanel->applySettings(m_settings);
    m_convertPanel->applySettings(m_settings);
}

void MainWindow::restoreGeometryFromSettings() {
    QSize size(1050, 800);
    QPoint pos;
    bool hasPos = false;
    if (!Archiver::parseWindowGeometry(m_settings.windowGeometry(), &size, &pos, &hasPos)) {
        Logger::warning("Ignoring malformed window geometry: " + m_settings.windowGeometry(), "Settings");
        Archiver::parseWindowGeometry(Settings::defaults().windowGeometry(), &size);
    }
    resize(size.expandedTo(minimumSize()));

    if (hasPos) {
        // Only restore a position that is still on some screen
        for (QScreen* screen : QGuiApplication::screens()) {
            if (screen->availableGeometry().contains(pos)) {
                move(pos);
                break;
            }
        }
    }
}

void MainWindow::log(const QString& msg, LogType type) {
    // 1. Log to File System immediately
    Logger::Level level = Logger::Info;
    switch (type) {
        case Log_Info:    level = Logger::Info; break;
        case Log_Success: level = Logger::Info; break;
        case Log_Warning: level = Logger::Warning; break;
        case Log_Error:   level = Logger::Error; break;
    }
    Logger::log(level, msg.trimmed(), "Console");

    // 2. Log to UI (drained by the log panel's timer)
    m_sink->enqueue(msg);
}

// ========== Actions ==========

void MainWindow::onDownloadRequested() {
    if (m_runner->isRunning()) {
        log("[WARNING] A process is already running. Please wait.\n", Log_Warning);
        return;
    }

    const DownloadParams params = m_downloadPanel->params();
    QString err;
    if (!Archiver::validateDownload(params, &err)) {
        Logger::info("Download validation failed: " + err, "Console");
        QMessageBox::critical(this, tr("Validation Error"), err);
        return;
    }

    m_runOutputFolder = params.outputDir.trimmed();
    m_runDryRun = params.dryRun;
    m_runner->start(CommandBuilder::buildDownloadCommand(params), ProcessRunner::Operation::Download);
}

void MainWindow::onConvertRequested() {
    if (m_runner->isRunning()) {
        log("[WARNING] A process is already running. Please wait.\n", Log_Warning);
        return;
    }

    const ConvertParams params = m_convertPanel->params();
    QString err;
    if (!Archiver::validateConvert(params, &err)) {
        Logger::info("Conversion validation failed: " + err, "Console");
        QMessageBox::critical(this, tr("Validation Error"), err);
        return;
    }

    const std::optional<QStringList> cmd = CommandBuilder::buildConvertCommand(params);
    if (!cmd) {
        QMessageBox::critical(this, tr("Error"), tr("Could not build pandoc command."));
        return;
    }

    m_runEpubPath = params.outputFile.trimmed();
    m_runner->start(*cmd, ProcessRunner::Operation::Convert);
}

void MainWindow::onSaveSettings() {
    m_settingsPanel->storeSettings(m_settings);
    if (!persistSettings()) return;
    log("[Settings saved]\n", Log_Success);
    m_settingsPanel->showSavedFeedback();
}

bool MainWindow::persistSettings() {
    QString err;
    if (!m_store.save(m_settings, &err)) {
        reportUserError(tr("Config Error"), err);
        QMessageBox::critical(this, tr("Config Error"), tr("Could not save settings:\n%1").arg(err));
        return false;
    }
    return true;
}

// ========== Run lifecycle ==========

void MainWindow::onRunStarted(ProcessRunner::Operation operation) {
    if (operation == ProcessRunner::Operation::Download)
        m_downloadPanel->setRunning(true);
    else if (operation == ProcessRunner::Operation::Convert)
        m_convertPanel->setRunning(true);
}

void MainWindow::onRunFinished(ProcessRunner::Operation operation, bool success) {
    m_downloadPanel->setRunning(false);
    m_convertPanel->setRunning(false);

    // Failures are already explained in the log
    if (!success || m_isClosing) return;

    // Let the tail of the output reach the log before the modal dialog opens
    m_logPanel->pollSink();

    if (operation == ProcessRunner::Operation::Download)
        showDownloadComplete(m_runOutputFolder, m_runDryRun);
    else if (operation == ProcessRunner::Operation::Convert)
        showConversionComplete(m_runEpubPath);
}

void MainWindow::showDownloadComplete(const QString& outputFolder, bool dryRun) {
    DownloadCompleteDialog dlg(outputFolder, dryRun, this);
    dlg.exec();

    switch (dlg.choice()) {
        case DownloadCompleteDialog::CreateEpub: {
            const QString folder = QDir::toNativeSeparators(QDir::cleanPath(outputFolder));
            m_convertPanel->setSourceDir(folder);
            m_convertPanel->setOutputFile(
                QDir::toNativeSeparators(QDir::cleanPath(QDir(outputFolder).filePath("archive.epub"))));
            m_tabs->setCurrentWidget(m_convertPanel);
            break;
        }
        case DownloadCompleteDialog::ShowFiles:
            openFolder(outputFolder);
            break;
        case DownloadCompleteDialog::ReturnToApp:
            break;
    }
}

void MainWindow::showConversionComplete(const QString& epubPath) {
    ConversionCompleteDialog dlg(epubPath, this);
    dlg.exec();

    if (dlg.choice() == ConversionCompleteDialog::ShowFile) {
        const QFileInfo info(epubPath);
        openFolder(info.path().isEmpty() ? epubPath : info.absolutePath());
    }
}

void MainWindow::openFolder(const QString& path) {
    const QString folder = QDir::cleanPath(path);
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(folder))) {
        reportWarning(tr("Open Folder"), "Could not open " + folder);
        QMessageBox::critical(this, tr("Error"), tr("Could not open the folder:\n%1").arg(QDir::toNativeSeparators(folder)));
    }
}

// ========== Shutdown ==========

void MainWindow::closeEvent(QCloseEvent* event) {
    if (m_isClosing) {
        QMainWindow::closeEvent(event);
        return;
    }
    m_isClosing = true;

    // Last-used values; the cookie value is never written
    m_downloadPanel->storeSettings(m_settings);
    m_convertPanel->storeSettings(m_settings);
    m_settings.setString(Settings::KeyWindowGeometry,
                         Archiver::formatWindowGeometry(QRect(pos(), size())));
    persistSettings();

    // === FORCE CLEANUP ===
    Threading::setThreadRun(false);
    Threading::TaskManager::instance().cancelAll();
    if (!m_runner->shutdown(5000))
        Logger::warning("Background run did not stop within 5 s", "Process");

    QMainWindow::closeEvent(event);
}
