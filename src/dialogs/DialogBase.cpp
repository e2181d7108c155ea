#include "DialogBase.h"

#include <QApplication>
#include <QFrame>
#include <QLabel>
#include <QScreen>
#include <QVBoxLayout>

DialogBase::DialogBase(QWidget* parent, const QString& title)
    : QDialog(parent)
{
    setModal(true);
    if (!title.isEmpty())
        setWindowTitle(title);
}

void DialogBase::finalizeLayout(int minimumWidth)
{
    if (minimumWidth > 0)
        setMinimumWidth(minimumWidth);
    adjustSize();
    setFixedSize(size());
    centerOnParent();
}

void DialogBase::centerOnParent()
{
    QRect area;
    if (parentWidget())
        area = parentWidget()->window()->frameGeometry();
    else if (QScreen* screen = QApplication::primaryScreen())
        area = screen->availableGeometry();
    else
        return;
    move(area.center() - rect().center());
}

void DialogBase::addMessageBlock(QVBoxLayout* layout, const QString& heading, const QString& detail)
{
    layout->setContentsMargins(30, 24, 30, 24);
    layout->setSpacing(12);

    QLabel* headingLabel = new QLabel(heading, this);
    headingLabel->setStyleSheet("font-size: 16px; font-weight: bold;");
    headingLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(headingLabel);

    QLabel* detailLabel = new QLabel(detail, this);
    detailLabel->setWordWrap(true);
    detailLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(detailLabel);

    QFrame* line = new QFrame(this);
    line->setFrameShape(QFrame::HLine);
    line->setFrameShadow(QFrame::Sunken);
    layout->addWidget(line);
}
