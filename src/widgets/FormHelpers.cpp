#include "FormHelpers.h"

#include <QFontDatabase>
#include <QGridLayout>
#include <QLabel>
#include <QPlainTextEdit>

namespace FormHelpers {

QLabel* addSectionLabel(QGridLayout* grid, int row, const QString& text) {
    QLabel* lbl = new QLabel(text);
    lbl->setStyleSheet("font-size: 13px; font-weight: bold; margin-top: 10px;");
    grid->addWidget(lbl, row, 0, 1, 3);
    return lbl;
}

QLabel* addHintLabel(QGridLayout* grid, int row, const QString& text) {
    QLabel* lbl = new QLabel(text);
    lbl->setStyleSheet("color: #999999;");
    lbl->setWordWrap(true);
    grid->addWidget(lbl, row, 0, 1, 3);
    return lbl;
}

QPlainTextEdit* createPreviewBox(QWidget* parent, int height, bool wrap) {
    QPlainTextEdit* box = new QPlainTextEdit(parent);
    box->setReadOnly(true);
    box->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    box->setLineWrapMode(wrap ? QPlainTextEdit::WidgetWidth : QPlainTextEdit::NoWrap);
    box->setFixedHeight(height);
    box->setStyleSheet("QPlainTextEdit { background-color: #252525; color: #cfcfcf; border: 1px solid #444; }");
    return box;
}

void setPreviewText(QPlainTextEdit* box, const QString& text) {
    if (box->toPlainText() != text)
        box->setPlainText(text);
}

} // namespace FormHelpers
