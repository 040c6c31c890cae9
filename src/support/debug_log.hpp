// File: src/support/debug_log.hpp
// Purpose: Environment-gated debug logging for the function-table core.
// Key invariants: The enable flag is read once per process.
// Ownership/Lifetime: Stateless apart from the cached flag.
// Links: docs/table-manager.md
#pragma once

namespace funtab::support
{

/// @brief Check whether verbose table logging is enabled.
/// @details Reads the FUNTAB_DEBUG_TABLE flag once and caches the result; any
///          non-empty value enables logging.
bool isTableDebugLoggingEnabled() noexcept;

/// @brief printf-style debug line on stderr, prefixed with "[DEBUG][TABLE] ".
/// @details No-op unless isTableDebugLoggingEnabled() returns true.
void tableDebugLog(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace funtab::support
