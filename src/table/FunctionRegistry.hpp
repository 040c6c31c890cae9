//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/table/FunctionRegistry.hpp
// Purpose: Maps callables to function-table slots so repeated registration of
//          the same callable yields the same slot.
// Key invariants: Forward (callable -> slot) and reverse (slot -> callable)
//                 maps are always mirror images of each other.
//                 Maps change only after the table mutation they record.
// Ownership/Lifetime: Keys are non-owning; the table keeps each live callable
//                     alive (directly or through its wrapper).
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//
//
// CACHE COHERENCE
// ===============
//
// The registry is built lazily from the table contents the first time it is
// used and is then kept current by addFunction/removeFunction.  Entries written
// into the table by anybody else afterwards are invisible to it until reported
// through noteTableEntries().  At assertion level 2 every new registration
// first scans the live (non-free) slots and reports a callable that is present
// but untracked.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "table/SlotAllocator.hpp"
#include "table/TrampolineSynthesizer.hpp"
#include "wasm/FuncTable.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace funtab::table
{

class FunctionRegistry
{
  public:
    FunctionRegistry(wasm::Table &table,
                     SlotAllocator &slots,
                     const TrampolineSynthesizer &synthesizer,
                     int assertionLevel);

    /// @brief Scan the whole table once; later calls do nothing.
    void ensureInitialized();

    bool isInitialized() const noexcept
    {
        return initialized_;
    }

    /// @brief Record non-null entries in [offset, offset + count).
    /// @details The first slot seen for a callable wins; an entry that
    ///          replaced a recorded callable out of band evicts the old record.
    ///          Slots on the free list are skipped.
    void noteTableEntries(uint32_t offset, uint32_t count);

    /// @brief Register @p callable and return its slot.
    /// @param callable Function to place in the table.
    /// @param sig Signature, required only when @p callable is not a valid
    ///        table entry by itself. Ignored for already registered callables.
    support::Expected<uint32_t> addFunction(const wasm::FunctionPtr &callable,
                                            std::string_view sig = {});

    /// @brief Drop the registration at @p slot and release the slot.
    /// @return ContractViolation when no live registration uses @p slot.
    support::Expected<void> removeFunction(uint32_t slot);

    /// @brief Slot recorded for @p callable, if any.
    std::optional<uint32_t> lookup(const wasm::FunctionPtr &callable) const;

    /// @brief Number of live registrations.
    size_t liveCount() const noexcept
    {
        return slotOf_.size();
    }

    /// @brief Check that both maps agree with each other, with the table and
    ///        with the free list.
    support::Expected<void> verifyConsistency() const;

  private:
    /// @brief What a live slot was registered for.
    struct Binding
    {
        const wasm::Function *callable; ///< Registered identity.
        const wasm::Function *entry;    ///< Value stored in the table (callable or wrapper).
    };

    void record(const wasm::Function *callable, const wasm::Function *entry, uint32_t slot);
    support::Expected<wasm::FunctionPtr> place(uint32_t slot,
                                               const wasm::FunctionPtr &callable,
                                               std::string_view sig);
    bool presentUntracked(const wasm::Function *fn) const;

    wasm::Table &table_;
    SlotAllocator &slots_;
    const TrampolineSynthesizer &synthesizer_;
    int assertionLevel_;
    bool initialized_ = false;
    std::unordered_map<const wasm::Function *, uint32_t> slotOf_;
    std::unordered_map<uint32_t, Binding> functionAt_;
};

} // namespace funtab::table
