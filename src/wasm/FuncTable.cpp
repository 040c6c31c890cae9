//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// In-process function table.  Growth is all-or-nothing: a request that would
// exceed the maximum leaves the table untouched.
//
//===----------------------------------------------------------------------===//

#include "wasm/FuncTable.hpp"

#include <limits>
#include <utility>

namespace funtab::wasm
{

FuncTable::FuncTable(uint32_t initial, std::optional<uint32_t> maximum)
    : entries_(initial), maximum_(maximum)
{
}

uint32_t FuncTable::length() const
{
    return static_cast<uint32_t>(entries_.size());
}

FunctionPtr FuncTable::get(uint32_t index) const
{
    if (index >= entries_.size())
        return nullptr;
    return entries_[index];
}

TableStatus FuncTable::set(uint32_t index, FunctionPtr entry)
{
    if (index >= entries_.size())
        return TableStatus::OutOfBounds;
    if (entry && entry->type() == nullptr)
        return TableStatus::NotAValidEntry;
    entries_[index] = std::move(entry);
    return TableStatus::Ok;
}

TableStatus FuncTable::grow(uint32_t delta)
{
    const uint64_t wanted = static_cast<uint64_t>(entries_.size()) + delta;
    const uint64_t limit = maximum_ ? *maximum_ : std::numeric_limits<uint32_t>::max();
    if (wanted > limit)
        return TableStatus::CapacityExceeded;
    entries_.resize(static_cast<size_t>(wanted));
    return TableStatus::Ok;
}

} // namespace funtab::wasm
