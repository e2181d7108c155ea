#include "ErrorHandling.h"
#include "Logger.h"

void reportUserError(const QString& title, const QString& message) {
    Logger::error(title + ": " + message, "UI");
}

void reportWarning(const QString& title, const QString& message) {
    Logger::warning(title + ": " + message, "UI");
}
