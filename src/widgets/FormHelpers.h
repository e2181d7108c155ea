#ifndef FORMHELPERS_H
#define FORMHELPERS_H

#include <QString>

class QGridLayout;
class QLabel;
class QPlainTextEdit;
class QWidget;

// Layout bits shared by the three tabs
namespace FormHelpers {

// Bold section title spanning the grid
QLabel* addSectionLabel(QGridLayout* grid, int row, const QString& text);

// Gray explanatory text spanning the grid
QLabel* addHintLabel(QGridLayout* grid, int row, const QString& text);

// Read-only monospace box used for previews
QPlainTextEdit* createPreviewBox(QWidget* parent, int height, bool wrap);

void setPreviewText(QPlainTextEdit* box, const QString& text);

} // namespace FormHelpers

#endif // FORMHELPERS_H
