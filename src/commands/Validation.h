#ifndef VALIDATION_H
#define VALIDATION_H

#include "CommandParams.h"
#include <QString>

namespace Archiver {

/**
 * @brief Pre-flight checks run before a command is built and launched.
 *
 * Rules are evaluated in order and the first failure wins. On failure the
 * user-facing message is written to @p error (if non-null).
 * @return true when the form may be submitted
 */
bool validateDownload(const DownloadParams& params, QString* error = nullptr);
bool validateConvert(const ConvertParams& params, QString* error = nullptr);

// YYYY-MM-DD, shape only
bool isIsoDate(const QString& text);

} // namespace Archiver

#endif // VALIDATION_H
