//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Debug logging for the function-table core.  Output goes to stderr as single
// lines so it interleaves sensibly with diagnostics printed by printDiag.
//
//===----------------------------------------------------------------------===//

#include "support/debug_log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace funtab::support
{

bool isTableDebugLoggingEnabled() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv("FUNTAB_DEBUG_TABLE"))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}

void tableDebugLog(const char *fmt, ...)
{
    if (!isTableDebugLoggingEnabled())
        return;

    std::fputs("[DEBUG][TABLE] ", stderr);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace funtab::support
