#include "SettingsPanel.h"
#include "FormHelpers.h"
#include "settings/Settings.h"

#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGridLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QTimer>
#include <QVBoxLayout>

SettingsPanel::SettingsPanel(QWidget* parent) : QWidget(parent) {
    setupUI();
}

void SettingsPanel::setupUI() {
    QVBoxLayout* outer = new QVBoxLayout(this);
    outer->setContentsMargins(0, 0, 0, 0);

    QScrollArea* scroll = new QScrollArea(this);
    scroll->setWidgetResizable(true);
    scroll->setFrameShape(QFrame::NoFrame);
    outer->addWidget(scroll);

    QWidget* content = new QWidget();
    QGridLayout* grid = new QGridLayout(content);
    grid->setColumnStretch(1, 1);
    scroll->setWidget(content);

    int row = 0;
    FormHelpers::addSectionLabel(grid, row++, tr("Executable Paths"));
    FormHelpers::addHintLabel(grid, row++,
        tr("If sbstck-dl or pandoc are on your system PATH you can leave these blank.\n"
           "Otherwise browse to the executable file."));

    m_sbstckdlEdit = new QLineEdit();
    m_pandocEdit = new QLineEdit();
    const struct { const char* label; QLineEdit* edit; } rows[] = {
        { QT_TR_NOOP("sbstck-dl path:"), m_sbstckdlEdit },
        { QT_TR_NOOP("pandoc path:"),    m_pandocEdit },
    };
    for (const auto& r : rows) {
        r.edit->setPlaceholderText(tr("Leave blank to use system PATH"));
        QPushButton* browse = new QPushButton(tr("Browse…"));
        browse->setFixedWidth(80);
        QLineEdit* edit = r.edit;
        connect(browse, &QPushButton::clicked, this, [this, edit]() { browseExecutable(edit); });
        grid->addWidget(new QLabel(tr(r.label)), row, 0);
        grid->addWidget(edit, row, 1);
        grid->addWidget(browse, row++, 2);
    }
    connect(m_sbstckdlEdit, &QLineEdit::textChanged, this, &SettingsPanel::sbstckdlPathChanged);
    connect(m_pandocEdit, &QLineEdit::textChanged, this, &SettingsPanel::pandocPathChanged);

    m_saveBtn = new QPushButton(tr("Save Settings"));
    m_saveBtn->setFixedWidth(160);
    connect(m_saveBtn, &QPushButton::clicked, this, &SettingsPanel::saveRequested);
    grid->addWidget(m_saveBtn, row++, 0, 1, 3, Qt::AlignLeft);

    FormHelpers::addSectionLabel(grid, row++, tr("First-Time Setup"));
    QPlainTextEdit* guide = FormHelpers::createPreviewBox(content, 220, true);
    guide->setPlainText(
        tr("Install sbstck-dl:\n\n"
           "    pip install sbstck-dl\n\n"
           "After installing sbstck-dl via pip, it is usually found automatically\n"
           "(no path needed above). If it is not found, use Browse to locate it.\n\n"
           "Install pandoc from https://pandoc.org/installing.html.\n"
           "If it is not on your PATH, set its location above and click Save Settings."));
    grid->addWidget(guide, row++, 0, 1, 3);
    grid->setRowStretch(row, 1);
}

QString SettingsPanel::sbstckdlPath() const {
    return m_sbstckdlEdit->text().trimmed();
}

QString SettingsPanel::pandocPath() const {
    return m_pandocEdit->text().trimmed();
}

void SettingsPanel::applySettings(const Settings& settings) {
    m_sbstckdlEdit->setText(settings.sbstckdlPath());
    m_pandocEdit->setText(settings.pandocPath());
}

void SettingsPanel::storeSettings(Settings& settings) const {
    settings.setString(Settings::KeySbstckdlPath, sbstckdlPath());
    settings.setString(Settings::KeyPandocPath, pandocPath());
}

void SettingsPanel::showSavedFeedback() {
    m_saveBtn->setText(tr("Saved!"));
    QTimer::singleShot(2000, this, [this]() { m_saveBtn->setText(tr("Save Settings")); });
}

void SettingsPanel::browseExecutable(QLineEdit* target) {
    QString initial = QFileInfo(target->text().trimmed()).absolutePath();
    if (target->text().trimmed().isEmpty()) {
#ifdef Q_OS_WIN
        initial = "C:\\Program Files";
#else
        initial = QDir::homePath();
#endif
    }
#ifdef Q_OS_WIN
    const QString filter = tr("Executables (*.exe);;All files (*)");
#else
    const QString filter = tr("All files (*)");
#endif
    const QString path = QFileDialog::getOpenFileName(this, tr("Select Executable"), initial, filter);
    if (!path.isEmpty())
        target->setText(QDir::toNativeSeparators(path));
}
