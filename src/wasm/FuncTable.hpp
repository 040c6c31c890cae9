//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/FuncTable.hpp
// Purpose: Growable indexed table of callable entries.
// Key invariants: Indices are stable once assigned; the table never shrinks.
//                 Only typed functions (or null) may be stored.
// Ownership/Lifetime: The table shares ownership of its entries.
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "wasm/Function.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace funtab::wasm
{

/// @brief Outcome of a table mutation.
enum class TableStatus
{
    Ok,               ///< Mutation committed.
    OutOfBounds,      ///< Index at or beyond length().
    NotAValidEntry,   ///< Value is not natively callable (untyped host function).
    CapacityExceeded, ///< Growth would exceed the table maximum.
};

/// @brief Stable name of @p status for diagnostics.
constexpr std::string_view toString(TableStatus status) noexcept
{
    switch (status)
    {
        case TableStatus::Ok:
            return "Ok";
        case TableStatus::OutOfBounds:
            return "OutOfBounds";
        case TableStatus::NotAValidEntry:
            return "NotAValidEntry";
        case TableStatus::CapacityExceeded:
            return "CapacityExceeded";
    }
    return "Ok";
}

/**
 * @brief Interface of a growable function table owned by the embedder.
 *
 * The function-table manager only ever talks to a table through this
 * interface, so an embedder can back it with its own storage.
 */
class Table
{
  public:
    virtual ~Table() = default;

    /// @brief Number of slots, empty ones included.
    virtual uint32_t length() const = 0;

    /// @brief Entry at @p index, or nullptr when empty or out of range.
    virtual FunctionPtr get(uint32_t index) const = 0;

    /// @brief Store @p entry at @p index; a null entry clears the slot.
    virtual TableStatus set(uint32_t index, FunctionPtr entry) = 0;

    /// @brief Append @p delta empty slots.
    virtual TableStatus grow(uint32_t delta) = 0;
};

/// @brief Vector-backed table with an optional maximum length.
class FuncTable final : public Table
{
  public:
    /// @param initial Number of empty slots present at construction.
    /// @param maximum Upper bound on length(); empty means unbounded.
    explicit FuncTable(uint32_t initial = 0, std::optional<uint32_t> maximum = std::nullopt);

    uint32_t length() const override;
    FunctionPtr get(uint32_t index) const override;
    TableStatus set(uint32_t index, FunctionPtr entry) override;
    TableStatus grow(uint32_t delta) override;

    /// @brief Configured maximum length, if any.
    std::optional<uint32_t> maximum() const noexcept
    {
        return maximum_;
    }

  private:
    std::vector<FunctionPtr> entries_;
    std::optional<uint32_t> maximum_;
};

} // namespace funtab::wasm
