#ifndef DATEPICKERDIALOG_H
#define DATEPICKERDIALOG_H

#include "DialogBase.h"
#include <QDate>

class QCalendarWidget;

// Calendar popup for the date-range fields. Opens on the date already in the
// field (today if it does not parse); accepted on a click or "Today".
class DatePickerDialog : public DialogBase {
    Q_OBJECT
public:
    static const QString DateFormat;   // "yyyy-MM-dd"

    explicit DatePickerDialog(const QString& currentText, QWidget* parent = nullptr);

    QDate selectedDate() const { return m_selected; }
    QString selectedDateText() const { return m_selected.toString(DateFormat); }

private:
    void pick(const QDate& date);

    QCalendarWidget* m_calendar;
    QDate m_selected;
};

#endif // DATEPICKERDIALOG_H
