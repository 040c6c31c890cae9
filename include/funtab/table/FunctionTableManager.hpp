//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/funtab/table/FunctionTableManager.hpp
// Purpose: Public facade for registering callables in a function table and
//          releasing their slots again.
// Invariants: One manager per table. The manager owns its slot allocator,
//             trampoline synthesizer and registry and wires them together.
// Ownership: The table, module host and optional reflection capability are
//            borrowed and must outlive the manager.
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/feature_flags.hpp"
#include "table/FunctionRegistry.hpp"
#include "table/SlotAllocator.hpp"
#include "table/TrampolineSynthesizer.hpp"
#include "wasm/FuncTable.hpp"
#include "wasm/Function.hpp"
#include "wasm/ModuleHost.hpp"
#include "wasm/TypeReflection.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace funtab::table
{

/// @brief Construction-time options for FunctionTableManager.
struct ManagerConfig
{
    const wasm::TypeReflection *reflection = nullptr; ///< Optional; not owned.
    /// @brief 0 disables checks, 1 prints failures, 2 also detects a stale registry.
    /// @details Overridden by the FUNTAB_ASSERTIONS environment variable when it
    ///          holds 0, 1 or 2.
    int assertionLevel = FUNTAB_ASSERTIONS;
};

/// @brief Lightweight facade owning the registration machinery for one table.
class FunctionTableManager
{
  public:
    FunctionTableManager(wasm::Table &table,
                         const wasm::ModuleHost &host,
                         ManagerConfig config = {});

    FunctionTableManager(const FunctionTableManager &) = delete;
    FunctionTableManager &operator=(const FunctionTableManager &) = delete;

    /// @brief Register @p callable, reusing its slot when already registered.
    /// @param sig Signature string, used only when @p callable must be wrapped.
    support::Expected<uint32_t> addFunction(const wasm::FunctionPtr &callable,
                                            std::string_view sig = {});

    /// @brief Forget the registration at @p slot and make the slot reusable.
    support::Expected<void> removeFunction(uint32_t slot);

    std::optional<uint32_t> lookup(const wasm::FunctionPtr &callable) const
    {
        return registry_.lookup(callable);
    }

    /// @brief Report entries written to the table without going through the manager.
    void noteTableEntries(uint32_t offset, uint32_t count);

    void ensureInitialized()
    {
        registry_.ensureInitialized();
    }

    size_t liveCount() const noexcept
    {
        return registry_.liveCount();
    }

    size_t freeSlotCount() const noexcept
    {
        return slots_.freeCount();
    }

    support::Expected<void> verifyConsistency() const;

    int assertionLevel() const noexcept
    {
        return assertionLevel_;
    }

    wasm::Table &table() noexcept
    {
        return table_;
    }

  private:
    /// @brief Print @p diag at assertion level 1 and above.
    void report(const support::Diag &diag) const;

    wasm::Table &table_;
    int assertionLevel_;
    SlotAllocator slots_;
    TrampolineSynthesizer synth_;
    FunctionRegistry registry_;
};

} // namespace funtab::table
