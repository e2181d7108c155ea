#include "ConvertPanel.h"
#include "FormHelpers.h"
#include "commands/CommandBuilder.h"
#include "settings/Settings.h"

#include <QCheckBox>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QVBoxLayout>

ConvertPanel::ConvertPanel(QWidget* parent) : QWidget(parent) {
    setupUI();
    updateFilesPreview();
}

void ConvertPanel::setupUI() {
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

    FormHelpers::addSectionLabel(grid, row++, tr("Source"));
    FormHelpers::addHintLabel(grid, row++,
        tr("Point this to the folder where you saved your downloaded Markdown files."));

    m_sourceEdit = new QLineEdit();
    m_sourceEdit->setPlaceholderText(tr("Folder containing .md files…"));
    QPushButton* browseSrc = new QPushButton(tr("Browse…"));
    browseSrc->setFixedWidth(80);
    connect(browseSrc, &QPushButton::clicked, this, &ConvertPanel::browseSourceDir);
    grid->addWidget(new QLabel(tr("Source folder (.md files):")), row, 0);
    grid->addWidget(m_sourceEdit, row, 1);
    grid->addWidget(browseSrc, row++, 2);

    m_filesPreview = FormHelpers::createPreviewBox(content, 110, true);
    grid->addWidget(new QLabel(tr("Files found:")), row, 0, Qt::AlignTop);
    grid->addWidget(m_filesPreview, row++, 1, 1, 2);

    FormHelpers::addSectionLabel(grid, row++, tr("Destination"));
    m_outputEdit = new QLineEdit();
    m_outputEdit->setPlaceholderText(tr("Save ePub as…"));
    QPushButton* browseOut = new QPushButton(tr("Browse…"));
    browseOut->setFixedWidth(80);
    connect(browseOut, &QPushButton::clicked, this, &ConvertPanel::browseOutputFile);
    grid->addWidget(new QLabel(tr("Output .epub file:")), row, 0);
    grid->addWidget(m_outputEdit, row, 1);
    grid->addWidget(browseOut, row++, 2);

    FormHelpers::addSectionLabel(grid, row++, tr("Book Metadata"));
    m_titleEdit = new QLineEdit();
    m_titleEdit->setPlaceholderText(tr("e.g. My Substack Archive"));
    grid->addWidget(new QLabel(tr("Book title:")), row, 0);
    grid->addWidget(m_titleEdit, row++, 1, 1, 2);
    m_authorEdit = new QLineEdit();
    m_authorEdit->setPlaceholderText(tr("e.g. Jane Smith"));
    grid->addWidget(new QLabel(tr("Author:")), row, 0);
    grid->addWidget(m_authorEdit, row++, 1, 1, 2);

    FormHelpers::addSectionLabel(grid, row++, tr("ePub Options"));
    m_tocCheck = new QCheckBox(tr("Include Table of Contents"));
    m_tocCheck->setChecked(true);
    grid->addWidget(m_tocCheck, row++, 0, 1, 3);

    QHBoxLayout* splitLayout = new QHBoxLayout();
    m_splitEdit = new QLineEdit("1");
    m_splitEdit->setFixedWidth(60);
    splitLayout->addWidget(new QLabel(tr("Chapter split level (1 = each article is a chapter):")));
    splitLayout->addWidget(m_splitEdit);
    splitLayout->addStretch();
    grid->addLayout(splitLayout, row++, 0, 1, 3);

    FormHelpers::addSectionLabel(grid, row++, tr("Command Preview"));
    m_preview = FormHelpers::createPreviewBox(content, 90, false);
    grid->addWidget(m_preview, row++, 0, 1, 3);

    m_convertBtn = new QPushButton(tr("Convert to ePub"));
    m_convertBtn->setMinimumHeight(40);
    m_convertBtn->setStyleSheet("font-size: 14px; font-weight: bold;");
    connect(m_convertBtn, &QPushButton::clicked, this, &ConvertPanel::convertRequested);
    grid->addWidget(m_convertBtn, row++, 0, 1, 3);
    grid->setRowStretch(row, 1);

    for (QLineEdit* e : { m_outputEdit, m_titleEdit, m_authorEdit, m_splitEdit })
        connect(e, &QLineEdit::textChanged, this, &ConvertPanel::updatePreview);
    connect(m_tocCheck, &QCheckBox::toggled, this, &ConvertPanel::updatePreview);
    // The files preview refreshes the command preview too
    connect(m_sourceEdit, &QLineEdit::textChanged, this, &ConvertPanel::updateFilesPreview);
}

ConvertParams ConvertPanel::params() const {
    ConvertParams p;
    p.executable = m_executable;
    p.sourceDir = m_sourceEdit->text();
    p.outputFile = m_outputEdit->text();
    p.title = m_titleEdit->text();
    p.author = m_authorEdit->text();
    p.tableOfContents = m_tocCheck->isChecked();
    p.splitLevel = m_splitEdit->text();
    return p;
}

void ConvertPanel::applySettings(const Settings& settings) {
    m_sourceEdit->setText(settings.lastEpubSourceDir());
    m_outputEdit->setText(settings.lastEpubOutputFile());
    m_authorEdit->setText(settings.lastAuthor());
    setExecutable(settings.pandocPath());
}

void ConvertPanel::storeSettings(Settings& settings) const {
    settings.setString(Settings::KeyLastEpubSourceDir, m_sourceEdit->text());
    settings.setString(Settings::KeyLastEpubOutputFile, m_outputEdit->text());
    settings.setString(Settings::KeyLastAuthor, m_authorEdit->text());
}

void ConvertPanel::setExecutable(const QString& path) {
    m_executable = path;
    updatePreview();
}

void ConvertPanel::setSourceDir(const QString& dir) {
    m_sourceEdit->setText(dir);
}

void ConvertPanel::setOutputFile(const QString& file) {
    m_outputEdit->setText(file);
}

void ConvertPanel::setRunning(bool running) {
    m_convertBtn->setEnabled(!running);
    m_convertBtn->setText(running ? tr("Converting…") : tr("Convert to ePub"));
}

void ConvertPanel::updatePreview() {
    FormHelpers::setPreviewText(m_preview, CommandBuilder::convertPreviewText(params()));
}

void ConvertPanel::updateFilesPreview() {
    FormHelpers::setPreviewText(m_filesPreview, CommandBuilder::filesPreviewText(m_sourceEdit->text()));
    updatePreview();
}

void ConvertPanel::browseSourceDir() {
    QString initial = m_sourceEdit->text().trimmed();
    if (initial.isEmpty()) initial = QDir::homePath();
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Select Folder"), initial);
    if (!dir.isEmpty())
        m_sourceEdit->setText(QDir::toNativeSeparators(dir));
}

void ConvertPanel::browseOutputFile() {
    QString initialDir = QFileInfo(m_outputEdit->text().trimmed()).absolutePath();
    if (m_outputEdit->text().trimmed().isEmpty()) initialDir = QDir::homePath();

    QFileDialog dlg(this, tr("Save ePub As"), initialDir,
                    tr("ePub files (*.epub);;All files (*)"));
    dlg.setAcceptMode(QFileDialog::AcceptSave);
    dlg.setDefaultSuffix("epub");
    if (dlg.exec() == QDialog::Accepted && !dlg.selectedFiles().isEmpty())
        m_outputEdit->setText(QDir::toNativeSeparators(dlg.selectedFiles().first()));
}
