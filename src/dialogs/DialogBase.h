#ifndef DIALOGBASE_H
#define DIALOGBASE_H

#include <QDialog>
#include <QString>

class QVBoxLayout;

/**
 * @brief Modal, fixed-size dialog centred over the main window.
 *
 * Subclasses build their layout in the constructor and finish with
 * finalizeLayout().
 */
class DialogBase : public QDialog {
    Q_OBJECT

public:
    explicit DialogBase(QWidget* parent = nullptr, const QString& title = QString());

protected:
    /// Fixes the dialog at its natural size and centres it
    void finalizeLayout(int minimumWidth = 0);

    void centerOnParent();

    /**
     * @brief Adds the heading / selectable detail text / separator block the
     *        completion dialogs open with.
     */
    void addMessageBlock(QVBoxLayout* layout, const QString& heading, const QString& detail);
};

#endif // DIALOGBASE_H
