// File: src/table/SlotAllocator.hpp
// Purpose: Hands out function-table slots, reusing released ones before
//          growing the table by exactly one entry.
// Key invariants: A slot is either live or on the free list, never both.
//                 The free list only changes after the table operation it
//                 depends on has committed.
// Ownership/Lifetime: Borrows the table; the table must outlive the allocator.
// Links: docs/table-manager.md
#pragma once

#include "support/diag_expected.hpp"
#include "wasm/FuncTable.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace funtab::table
{

class SlotAllocator
{
  public:
    explicit SlotAllocator(wasm::Table &table) : table_(table) {}

    /// @brief Obtain a slot: a released one if available, otherwise a new one.
    /// @return Slot index, or ResourceExhausted when the table cannot grow.
    ///         The free list is untouched on failure.
    support::Expected<uint32_t> acquire();

    /// @brief Return @p slot to the free list. The table entry is not cleared.
    /// @pre @p slot is live (asserted in debug builds).
    void release(uint32_t slot);

    /// @brief Number of released slots awaiting reuse.
    size_t freeCount() const noexcept
    {
        return free_.size();
    }

    /// @brief Whether @p slot is currently on the free list.
    bool isFree(uint32_t slot) const;

  private:
    wasm::Table &table_;
    std::vector<uint32_t> free_;
};

} // namespace funtab::table
