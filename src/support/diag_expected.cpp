//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across FunTab.  The
// utilities defined here wrap structured diagnostics around an Expected<void>
// type, provide consistent severity-to-string mapping, and print diagnostics
// in the single format every component reports errors with.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace funtab::support
{

/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic of the provided category.
/// @param kind Category recorded alongside the message.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity.
Diag makeError(ErrorKind kind, std::string msg)
{
    return Diag{Severity::Error, kind, std::move(msg)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details The severity word comes from `detail::diagSeverityToString()` and
///          the category from `toString(ErrorKind)`.  The function always emits
///          a trailing newline so multiple diagnostics appear as a contiguous
///          block.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity) << ": [" << toString(diag.kind) << "] "
       << diag.message << '\n';
}

} // namespace funtab::support
