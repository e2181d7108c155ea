#ifndef ERRORHANDLING_H
#define ERRORHANDLING_H

#include <QString>

/*
 * Error conventions used throughout the application:
 *  - Recoverable failures return bool and fill an optional QString* error,
 *    e.g. SettingsStore::save(const Settings&, QString* error).
 *  - "Nothing to do yet" is an empty std::optional, e.g.
 *    CommandBuilder::buildConvertCommand().
 *  - Background runs report through Task signals; exceptions thrown inside a
 *    task become Task::failed().
 */

/**
 * @brief "operation: context - reason", or "operation: context" when there
 *        is no reason.
 *
 *   formatError("Failed to write settings", path, file.errorString())
 */
inline QString formatError(const QString& operation, const QString& context, const QString& reason) {
    if (reason.isEmpty()) return QString("%1: %2").arg(operation, context);
    return QString("%1: %2 - %3").arg(operation, context, reason);
}

/// Records an error that the caller also shows in a message box
void reportUserError(const QString& title, const QString& message);

/// Records a non-fatal problem
void reportWarning(const QString& title, const QString& message);

#endif // ERRORHANDLING_H
