#include "DownloadCompleteDialog.h"

#include <QHBoxLayout>
#include <QPushButton>
#include <QVBoxLayout>

DownloadCompleteDialog::DownloadCompleteDialog(const QString& outputFolder, bool dryRun, QWidget* parent)
    : DialogBase(parent, tr("Download Complete"))
{
    QString heading;
    QString detail;
    if (dryRun) {
        heading = QString::fromUtf8("\xF0\x9F\x94\x8D  ") + tr("Dry Run Complete");
        detail = tr("No files were downloaded, this was a preview only.\n\n"
                    "Uncheck 'Dry run' and click Start Download to download for real.");
    } else {
        heading = QString::fromUtf8("\xE2\x9C\x93  ") + tr("Download Complete!");
        detail = tr("Files saved to:\n%1").arg(outputFolder);
    }

    QVBoxLayout* layout = new QVBoxLayout(this);
    addMessageBlock(layout, heading, detail);

    QHBoxLayout* buttons = new QHBoxLayout();
    buttons->addStretch();
    if (!dryRun) {
        QPushButton* epubBtn = new QPushButton(QString::fromUtf8("Create ePub \xE2\x86\x92"), this);
        epubBtn->setDefault(true);
        connect(epubBtn, &QPushButton::clicked, this, [this]() { finish(CreateEpub); });
        buttons->addWidget(epubBtn);

        QPushButton* filesBtn = new QPushButton(tr("Show Files"), this);
        connect(filesBtn, &QPushButton::clicked, this, [this]() { finish(ShowFiles); });
        buttons->addWidget(filesBtn);
    }
    QPushButton* returnBtn = new QPushButton(tr("Return to App"), this);
    connect(returnBtn, &QPushButton::clicked, this, [this]() { finish(ReturnToApp); });
    buttons->addWidget(returnBtn);
    buttons->addStretch();
    layout->addLayout(buttons);

    finalizeLayout(420);
}

void DownloadCompleteDialog::finish(Choice c) {
    m_choice = c;
    accept();
}
