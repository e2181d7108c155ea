#include "DownloadPanel.h"
#include "FormHelpers.h"
#include "commands/CommandBuilder.h"
#include "dialogs/DatePickerDialog.h"
#include "settings/Settings.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDir>
#include <QFileDialog>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QVBoxLayout>

DownloadPanel::DownloadPanel(QWidget* parent) : QWidget(parent) {
    setupUI();
    updatePreview();
}

void DownloadPanel::setupUI() {
    QVBoxLayout* outer = new QVBoxLayout(this);
    outer->setContentsMargins(0, 0, 0, 0);

    QScrollArea* scroll = new QScrollArea(this);
    scroll->setWidgetResizable(true);
    scroll->setFrameShape(QFrame::NoFrame);
    outer->addWidget(scroll);

    QWidget* content = new QWidget();
    QGridLayout* grid = new QGridLayout(content);
    grid->setColumnStretch(1, 1);
    grid->setVerticalSpacing(4);
    scroll->setWidget(content);

    int row = 0;

    // --- Source ---
    FormHelpers::addSectionLabel(grid, row++, tr("Source"));
    m_urlEdit = new QLineEdit();
    m_urlEdit->setPlaceholderText("https://yourname.substack.com/");
    grid->addWidget(new QLabel(tr("Substack URL:")), row, 0);
    grid->addWidget(m_urlEdit, row++, 1, 1, 2);

    // --- Destination ---
    FormHelpers::addSectionLabel(grid, row++, tr("Destination"));
    m_outputDirEdit = new QLineEdit();
    m_outputDirEdit->setPlaceholderText(tr("Choose a folder…"));
    QPushButton* browseBtn = new QPushButton(tr("Browse…"));
    browseBtn->setFixedWidth(80);
    connect(browseBtn, &QPushButton::clicked, this, &DownloadPanel::browseOutputDir);
    grid->addWidget(new QLabel(tr("Output folder:")), row, 0);
    grid->addWidget(m_outputDirEdit, row, 1);
    grid->addWidget(browseBtn, row++, 2);

    m_formatCombo = new QComboBox();
    m_formatCombo->addItems(CommandBuilder::formatLabels());
    grid->addWidget(new QLabel(tr("Format:")), row, 0);
    grid->addWidget(m_formatCombo, row++, 1, Qt::AlignLeft);

    // --- Date range ---
    FormHelpers::addSectionLabel(grid, row++, tr("Date Range (optional)"));
    m_datesCheck = new QCheckBox(tr("Filter by date range"));
    grid->addWidget(m_datesCheck, row++, 0, 1, 3);

    m_dateFrame = new QWidget();
    QHBoxLayout* dateLayout = new QHBoxLayout(m_dateFrame);
    dateLayout->setContentsMargins(0, 0, 0, 0);
    m_afterEdit = new QLineEdit();
    m_beforeEdit = new QLineEdit();
    for (QLineEdit* e : { m_afterEdit, m_beforeEdit }) {
        e->setPlaceholderText("YYYY-MM-DD");
        e->setFixedWidth(115);
    }
    QPushButton* afterCal = new QPushButton(QString::fromUtf8("\xF0\x9F\x93\x85"));
    QPushButton* beforeCal = new QPushButton(QString::fromUtf8("\xF0\x9F\x93\x85"));
    afterCal->setFixedWidth(32);
    beforeCal->setFixedWidth(32);
    connect(afterCal, &QPushButton::clicked, this, [this]() { pickDate(m_afterEdit); });
    connect(beforeCal, &QPushButton::clicked, this, [this]() { pickDate(m_beforeEdit); });
    dateLayout->addWidget(new QLabel(tr("After:")));
    dateLayout->addWidget(m_afterEdit);
    dateLayout->addWidget(afterCal);
    dateLayout->addSpacing(14);
    dateLayout->addWidget(new QLabel(tr("Before:")));
    dateLayout->addWidget(m_beforeEdit);
    dateLayout->addWidget(beforeCal);
    dateLayout->addStretch();
    m_dateFrame->setVisible(false);
    grid->addWidget(m_dateFrame, row++, 0, 1, 3);

    // --- Images ---
    FormHelpers::addSectionLabel(grid, row++, tr("Image Options"));
    m_imagesCheck = new QCheckBox(tr("Download images locally"));
    grid->addWidget(m_imagesCheck, row++, 0, 1, 3);

    m_imageFrame = new QWidget();
    QGridLayout* imageLayout = new QGridLayout(m_imageFrame);
    imageLayout->setContentsMargins(24, 0, 0, 0);
    m_qualityCombo = new QComboBox();
    m_qualityCombo->addItems({ "low", "medium", "high" });
    m_qualityCombo->setFixedWidth(120);
    m_imagesDirEdit = new QLineEdit("images");
    m_imagesDirEdit->setFixedWidth(160);
    imageLayout->addWidget(new QLabel(tr("Quality:")), 0, 0);
    imageLayout->addWidget(m_qualityCombo, 0, 1, Qt::AlignLeft);
    imageLayout->addWidget(new QLabel(tr("Images subfolder:")), 1, 0);
    imageLayout->addWidget(m_imagesDirEdit, 1, 1, Qt::AlignLeft);
    imageLayout->setColumnStretch(1, 1);
    m_imageFrame->setVisible(false);
    grid->addWidget(m_imageFrame, row++, 0, 1, 3);

    // --- File attachments ---
    FormHelpers::addSectionLabel(grid, row++, tr("File Attachments"));
    m_filesCheck = new QCheckBox(tr("Download file attachments"));
    grid->addWidget(m_filesCheck, row++, 0, 1, 3);

    m_fileFrame = new QWidget();
    QGridLayout* fileLayout = new QGridLayout(m_fileFrame);
    fileLayout->setContentsMargins(24, 0, 0, 0);
    m_extensionsEdit = new QLineEdit();
    m_extensionsEdit->setPlaceholderText("pdf,docx,mp3");
    m_extensionsEdit->setFixedWidth(200);
    m_filesDirEdit = new QLineEdit("files");
    m_filesDirEdit->setFixedWidth(160);
    fileLayout->addWidget(new QLabel(tr("Extensions (blank = all):")), 0, 0);
    fileLayout->addWidget(m_extensionsEdit, 0, 1, Qt::AlignLeft);
    fileLayout->addWidget(new QLabel(tr("Files subfolder:")), 1, 0);
    fileLayout->addWidget(m_filesDirEdit, 1, 1, Qt::AlignLeft);
    fileLayout->setColumnStretch(1, 1);
    m_fileFrame->setVisible(false);
    grid->addWidget(m_fileFrame, row++, 0, 1, 3);

    // --- Advanced ---
    FormHelpers::addSectionLabel(grid, row++, tr("Advanced Options"));
    m_sourceUrlCheck = new QCheckBox(tr("Add source URL to each post"));
    m_sourceUrlCheck->setChecked(true);
    m_archiveCheck = new QCheckBox(tr("Create archive index page (index.md / index.html)"));
    m_verboseCheck = new QCheckBox(tr("Verbose output"));
    m_dryRunCheck = new QCheckBox(tr("Dry run (preview command only, no actual download)"));
    for (QCheckBox* cb : { m_sourceUrlCheck, m_archiveCheck, m_verboseCheck, m_dryRunCheck })
        grid->addWidget(cb, row++, 0, 1, 3);

    QHBoxLayout* rateLayout = new QHBoxLayout();
    m_rateEdit = new QLineEdit("1");
    m_rateEdit->setFixedWidth(70);
    rateLayout->addWidget(new QLabel(tr("Rate limit (requests/sec):")));
    rateLayout->addWidget(m_rateEdit);
    rateLayout->addStretch();
    grid->addLayout(rateLayout, row++, 0, 1, 3);

    // --- Cookie authentication (collapsible) ---
    FormHelpers::addSectionLabel(grid, row++, tr("Paid Content Authentication"));
    FormHelpers::addHintLabel(grid, row++,
        tr("Only needed if downloading articles from a paid Substack you subscribe to."));

    m_cookieToggleBtn = new QPushButton(tr("Show Cookie Settings"));
    m_cookieToggleBtn->setFixedWidth(200);
    connect(m_cookieToggleBtn, &QPushButton::clicked, this, &DownloadPanel::toggleCookieSection);
    grid->addWidget(m_cookieToggleBtn, row++, 0, 1, 3, Qt::AlignLeft);

    m_cookieFrame = new QWidget();
    QGridLayout* cookieLayout = new QGridLayout(m_cookieFrame);
    m_cookieNameCombo = new QComboBox();
    m_cookieNameCombo->addItems({ "substack.sid", "connect.sid" });
    m_cookieNameCombo->setFixedWidth(160);
    m_cookieValueEdit = new QLineEdit();
    m_cookieValueEdit->setEchoMode(QLineEdit::Password);
    m_cookieValueEdit->setPlaceholderText(tr("Paste your session cookie value here…"));
    m_showCookieBtn = new QPushButton(tr("Show"));
    m_showCookieBtn->setFixedWidth(60);
    connect(m_showCookieBtn, &QPushButton::clicked, this, &DownloadPanel::toggleCookieVisibility);
    QLabel* cookieHelp = new QLabel(
        tr("How to find your cookie:\n"
           "1. Log into Substack in your browser\n"
           "2. Open DevTools (F12) → Application → Cookies → substack.com\n"
           "3. Copy the value of 'substack.sid' (or 'connect.sid')"));
    cookieHelp->setStyleSheet("color: #999999;");
    cookieLayout->addWidget(new QLabel(tr("Cookie name:")), 0, 0);
    cookieLayout->addWidget(m_cookieNameCombo, 0, 1, Qt::AlignLeft);
    cookieLayout->addWidget(new QLabel(tr("Cookie value:")), 1, 0);
    cookieLayout->addWidget(m_cookieValueEdit, 1, 1);
    cookieLayout->addWidget(m_showCookieBtn, 1, 2);
    cookieLayout->addWidget(cookieHelp, 2, 0, 1, 3);
    cookieLayout->setColumnStretch(1, 1);
    m_cookieFrame->setVisible(false);
    grid->addWidget(m_cookieFrame, row++, 0, 1, 3);

    // --- Preview + action ---
    FormHelpers::addSectionLabel(grid, row++, tr("Command Preview"));
    m_preview = FormHelpers::createPreviewBox(content, 70, false);
    grid->addWidget(m_preview, row++, 0, 1, 3);

    m_startBtn = new QPushButton(tr("Start Download"));
    m_startBtn->setMinimumHeight(40);
    m_startBtn->setStyleSheet("font-size: 14px; font-weight: bold;");
    connect(m_startBtn, &QPushButton::clicked, this, &DownloadPanel::startRequested);
    grid->addWidget(m_startBtn, row++, 0, 1, 3);
    grid->setRowStretch(row, 1);

    // Every edit refreshes the preview
    for (QLineEdit* e : { m_urlEdit, m_outputDirEdit, m_afterEdit, m_beforeEdit, m_imagesDirEdit,
                          m_extensionsEdit, m_filesDirEdit, m_rateEdit, m_cookieValueEdit })
        connect(e, &QLineEdit::textChanged, this, &DownloadPanel::updatePreview);
    for (QComboBox* c : { m_formatCombo, m_qualityCombo, m_cookieNameCombo })
        connect(c, &QComboBox::currentTextChanged, this, &DownloadPanel::updatePreview);
    for (QCheckBox* cb : { m_datesCheck, m_imagesCheck, m_filesCheck, m_sourceUrlCheck,
                           m_archiveCheck, m_verboseCheck, m_dryRunCheck })
        connect(cb, &QCheckBox::toggled, this, &DownloadPanel::updatePreview);

    connect(m_datesCheck, &QCheckBox::toggled, m_dateFrame, &QWidget::setVisible);
    connect(m_imagesCheck, &QCheckBox::toggled, m_imageFrame, &QWidget::setVisible);
    connect(m_filesCheck, &QCheckBox::toggled, m_fileFrame, &QWidget::setVisible);
}

DownloadParams DownloadPanel::params() const {
    DownloadParams p;
    p.executable = m_executable;
    p.url = m_urlEdit->text();
    p.outputDir = m_outputDirEdit->text();
    p.formatLabel = m_formatCombo->currentText();
    p.filterByDate = m_datesCheck->isChecked();
    p.afterDate = m_afterEdit->text();
    p.beforeDate = m_beforeEdit->text();
    p.downloadImages = m_imagesCheck->isChecked();
    p.imageQuality = m_qualityCombo->currentText();
    p.imagesDir = m_imagesDirEdit->text();
    p.downloadFiles = m_filesCheck->isChecked();
    p.fileExtensions = m_extensionsEdit->text();
    p.filesDir = m_filesDirEdit->text();
    p.addSourceUrl = m_sourceUrlCheck->isChecked();
    p.createArchive = m_archiveCheck->isChecked();
    p.rateLimit = m_rateEdit->text();
    p.verbose = m_verboseCheck->isChecked();
    p.dryRun = m_dryRunCheck->isChecked();
    p.cookieName = m_cookieNameCombo->currentText();
    p.cookieValue = m_cookieValueEdit->text();
    return p;
}

void DownloadPanel::applySettings(const Settings& settings) {
    m_urlEdit->setText(settings.lastUrl());
    m_outputDirEdit->setText(settings.lastOutputDir());
    const int idx = m_formatCombo->findText(settings.lastFormat());
    m_formatCombo->setCurrentIndex(idx >= 0 ? idx : 0);
    setExecutable(settings.sbstckdlPath());
}

void DownloadPanel::storeSettings(Settings& settings) const {
    // The cookie value stays in memory only
    settings.setString(Settings::KeyLastUrl, m_urlEdit->text());
    settings.setString(Settings::KeyLastOutputDir, m_outputDirEdit->text());
    settings.setString(Settings::KeyLastFormat, m_formatCombo->currentText());
}

void DownloadPanel::setExecutable(const QString& path) {
    m_executable = path;
    updatePreview();
}

void DownloadPanel::setRunning(bool running) {
    m_startBtn->setEnabled(!running);
    m_startBtn->setText(running ? tr("Downloading…") : tr("Start Download"));
}

void DownloadPanel::updatePreview() {
    FormHelpers::setPreviewText(m_preview, CommandBuilder::downloadPreviewText(params()));
}

void DownloadPanel::toggleCookieSection() {
    const bool show = m_cookieFrame->isHidden();
    m_cookieFrame->setVisible(show);
    m_cookieToggleBtn->setText(show ? tr("Hide Cookie Settings") : tr("Show Cookie Settings"));
    updatePreview();
}

void DownloadPanel::toggleCookieVisibility() {
    const bool masked = m_cookieValueEdit->echoMode() == QLineEdit::Password;
    m_cookieValueEdit->setEchoMode(masked ? QLineEdit::Normal : QLineEdit::Password);
    m_showCookieBtn->setText(masked ? tr("Hide") : tr("Show"));
}

void DownloadPanel::browseOutputDir() {
    QString initial = m_outputDirEdit->text().trimmed();
    if (initial.isEmpty()) initial = QDir::homePath();
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Select Folder"), initial);
    if (!dir.isEmpty())
        m_outputDirEdit->setText(QDir::toNativeSeparators(dir));
}

void DownloadPanel::pickDate(QLineEdit* target) {
    DatePickerDialog dlg(target->text().trimmed(), this);
    if (dlg.exec() == QDialog::Accepted)
        target->setText(dlg.selectedDateText());
}
