#include "DatePickerDialog.h"

#include <QCalendarWidget>
#include <QPushButton>
#include <QTextCharFormat>
#include <QVBoxLayout>

const QString DatePickerDialog::DateFormat = "yyyy-MM-dd";

DatePickerDialog::DatePickerDialog(const QString& currentText, QWidget* parent)
    : DialogBase(parent, tr("Select Date"))
{
    QDate start = QDate::fromString(currentText, DateFormat);
    if (!start.isValid()) start = QDate::currentDate();
    m_selected = start;

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(12, 12, 12, 10);

    m_calendar = new QCalendarWidget(this);
    m_calendar->setFirstDayOfWeek(Qt::Monday);
    m_calendar->setGridVisible(false);
    m_calendar->setVerticalHeaderFormat(QCalendarWidget::NoVerticalHeader);
    m_calendar->setSelectedDate(start);

    QTextCharFormat todayFormat;
    todayFormat.setFontWeight(QFont::Bold);
    m_calendar->setDateTextFormat(QDate::currentDate(), todayFormat);

    connect(m_calendar, &QCalendarWidget::clicked, this, &DatePickerDialog::pick);
    connect(m_calendar, &QCalendarWidget::activated, this, &DatePickerDialog::pick);
    layout->addWidget(m_calendar);

    QPushButton* todayBtn = new QPushButton(tr("Today"), this);
    connect(todayBtn, &QPushButton::clicked, this, [this]() { pick(QDate::currentDate()); });
    layout->addWidget(todayBtn, 0, Qt::AlignHCenter);

    finalizeLayout();
}

void DatePickerDialog::pick(const QDate& date) {
    m_selected = date;
    accept();
}
