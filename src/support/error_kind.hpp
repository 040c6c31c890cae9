// File: src/support/error_kind.hpp
// Purpose: Defines the error classification shared by every FunTab component.
// Key invariants: Enum values map directly to error categories used in diagnostics.
// Ownership/Lifetime: Not applicable.
// Links: docs/table-manager.md
#pragma once

#include <cstdint>
#include <string_view>

namespace funtab::support
{

/// @brief Categorises failures reported by the function-table core.
enum class ErrorKind : int32_t
{
    ContractViolation = 0, ///< Caller bug: bad signature, missing signature, bad release.
    ResourceExhausted = 1, ///< The table refused to grow.
    HostFailure = 2,       ///< Module compile/instantiate or table failure inside the host.
};

/// @brief Convert error kind to canonical diagnostic string.
/// @param kind Enumerated error kind.
/// @return Stable string view naming the error category.
constexpr std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::ContractViolation:
            return "ContractViolation";
        case ErrorKind::ResourceExhausted:
            return "ResourceExhausted";
        case ErrorKind::HostFailure:
            return "HostFailure";
    }
    return "HostFailure";
}

} // namespace funtab::support
