#ifndef ARCHIVERAPPLICATION_H
#define ARCHIVERAPPLICATION_H

#include <QApplication>

/**
 * @brief QApplication that sets the app identity (organization, name,
 *        version) and turns exceptions escaping an event handler into an
 *        error report instead of a crash.
 */
class ArchiverApplication : public QApplication
{
public:
    ArchiverApplication(int& argc, char** argv);

    bool notify(QObject* receiver, QEvent* event) override;
};

#endif // ARCHIVERAPPLICATION_H
