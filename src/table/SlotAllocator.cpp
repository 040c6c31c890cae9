//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Slot allocation for the function table.  Released slots are reused in LIFO
// order; callers must not depend on which released slot comes back first.
//
//===----------------------------------------------------------------------===//

#include "table/SlotAllocator.hpp"

#include "support/debug_log.hpp"

#include <algorithm>
#include <cassert>
#include <string>

namespace funtab::table
{

support::Expected<uint32_t> SlotAllocator::acquire()
{
    if (!free_.empty())
    {
        const uint32_t slot = free_.back();
        free_.pop_back();
        support::tableDebugLog("reuse slot %u (%zu free left)", slot, free_.size());
        return slot;
    }

    const uint32_t slot = table_.length();
    const wasm::TableStatus status = table_.grow(1);
    if (status == wasm::TableStatus::CapacityExceeded)
    {
        return support::makeError(support::ErrorKind::ResourceExhausted,
                                  "Unable to grow function table beyond " + std::to_string(slot) +
                                      " entries; enable table growth or raise the table maximum");
    }
    if (status != wasm::TableStatus::Ok)
    {
        return support::makeError(support::ErrorKind::HostFailure,
                                  "function table grow failed: " +
                                      std::string(wasm::toString(status)));
    }
    support::tableDebugLog("grew table to %u, new slot %u", table_.length(), slot);
    return slot;
}

void SlotAllocator::release(uint32_t slot)
{
    assert(slot < table_.length() && "released slot is outside the table");
    assert(!isFree(slot) && "slot released twice");
    free_.push_back(slot);
    support::tableDebugLog("release slot %u (%zu free)", slot, free_.size());
}

bool SlotAllocator::isFree(uint32_t slot) const
{
    return std::find(free_.begin(), free_.end(), slot) != free_.end();
}

} // namespace funtab::table
