#include "Version.h"

namespace Archiver {

const char* getVersion()
{
    return ARCHIVER_VERSION;
}

} // namespace Archiver
