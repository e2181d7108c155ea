#ifndef CONVERSIONCOMPLETEDIALOG_H
#define CONVERSIONCOMPLETEDIALOG_H

#include "DialogBase.h"

// Shown after pandoc exited with code 0
class ConversionCompleteDialog : public DialogBase {
    Q_OBJECT
public:
    enum Choice { ReturnToApp, ShowFile };

    ConversionCompleteDialog(const QString& epubPath, QWidget* parent = nullptr);

    Choice choice() const { return m_choice; }

private:
    Choice m_choice = ReturnToApp;
};

#endif // CONVERSIONCOMPLETEDIALOG_H
