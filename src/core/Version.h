#ifndef ARCHIVER_CORE_VERSION_H
#define ARCHIVER_CORE_VERSION_H

#ifndef ARCHIVER_VERSION
#define ARCHIVER_VERSION "1.0.0"
#endif

namespace Archiver {
    /**
     * @brief Get the application version string.
     * @return The version string (e.g., "1.2.3").
     */
    const char* getVersion();
}

#endif // ARCHIVER_CORE_VERSION_H
