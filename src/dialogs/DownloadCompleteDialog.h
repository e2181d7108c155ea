#ifndef DOWNLOADCOMPLETEDIALOG_H
#define DOWNLOADCOMPLETEDIALOG_H

#include "DialogBase.h"

/**
 * @brief Shown after sbstck-dl exited with code 0.
 *
 * A dry run only offers "Return to App". A real run also offers to continue
 * with the ePub conversion or to open the output folder; the caller acts on
 * choice() after exec() returns.
 */
class DownloadCompleteDialog : public DialogBase {
    Q_OBJECT
public:
    enum Choice { ReturnToApp, CreateEpub, ShowFiles };

    DownloadCompleteDialog(const QString& outputFolder, bool dryRun, QWidget* parent = nullptr);

    Choice choice() const { return m_choice; }

private:
    void finish(Choice c);

    Choice m_choice = ReturnToApp;
};

#endif // DOWNLOADCOMPLETEDIALOG_H
