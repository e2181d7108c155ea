#include "ConversionCompleteDialog.h"

#include <QHBoxLayout>
#include <QPushButton>
#include <QVBoxLayout>

ConversionCompleteDialog::ConversionCompleteDialog(const QString& epubPath, QWidget* parent)
    : DialogBase(parent, tr("Conversion Complete"))
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    addMessageBlock(layout, QString::fromUtf8("\xE2\x9C\x93  ") + tr("ePub Created!"),
                    tr("Saved to:\n%1").arg(epubPath));

    QHBoxLayout* buttons = new QHBoxLayout();
    buttons->addStretch();
    QPushButton* showBtn = new QPushButton(tr("Show File"), this);
    showBtn->setDefault(true);
    connect(showBtn, &QPushButton::clicked, this, [this]() {
        m_choice = ShowFile;
        accept();
    });
    QPushButton* returnBtn = new QPushButton(tr("Return to App"), this);
    connect(returnBtn, &QPushButton::clicked, this, &QDialog::accept);
    buttons->addWidget(showBtn);
    buttons->addWidget(returnBtn);
    buttons->addStretch();
    layout->addLayout(buttons);

    finalizeLayout(420);
}
