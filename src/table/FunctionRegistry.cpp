//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements callable registration for the function table.  A registration
// first tries to store the callable itself; only when the table reports that
// the value is not a valid entry is the callable converted through the
// trampoline synthesizer, which needs the caller-supplied signature.  The slot
// obtained from the allocator is handed back on every failure path so a failed
// registration leaves neither a live slot nor a registry record behind.
//
//===----------------------------------------------------------------------===//

#include "table/FunctionRegistry.hpp"

#include "support/debug_log.hpp"

#include <algorithm>
#include <string>

namespace funtab::table
{
namespace
{

support::Diag contractError(std::string msg)
{
    return support::makeError(support::ErrorKind::ContractViolation, std::move(msg));
}

} // namespace

FunctionRegistry::FunctionRegistry(wasm::Table &table,
                                   SlotAllocator &slots,
                                   const TrampolineSynthesizer &synthesizer,
                                   int assertionLevel)
    : table_(table), slots_(slots), synthesizer_(synthesizer), assertionLevel_(assertionLevel)
{
}

void FunctionRegistry::ensureInitialized()
{
    if (initialized_)
        return;
    initialized_ = true;
    noteTableEntries(0, table_.length());
    support::tableDebugLog("registry initialized from %u slot(s), %zu live",
                           table_.length(),
                           slotOf_.size());
}

void FunctionRegistry::noteTableEntries(uint32_t offset, uint32_t count)
{
    const uint32_t length = table_.length();
    if (offset >= length)
        return;
    const uint32_t end = offset + std::min(count, length - offset);
    for (uint32_t slot = offset; slot < end; ++slot)
    {
        if (slots_.isFree(slot))
            continue;
        const wasm::FunctionPtr entry = table_.get(slot);
        if (entry)
            record(entry.get(), entry.get(), slot);
    }
}

/// @brief Associate @p callable with @p slot in both maps.
///
/// @details A slot that still holds the entry recorded for it is left alone.
///          A slot whose entry changed drops its previous association first.
///          A callable that already owns a slot keeps that slot.
void FunctionRegistry::record(const wasm::Function *callable,
                              const wasm::Function *entry,
                              uint32_t slot)
{
    if (auto at = functionAt_.find(slot); at != functionAt_.end())
    {
        if (at->second.entry == entry)
            return;
        slotOf_.erase(at->second.callable);
        functionAt_.erase(at);
    }
    if (slotOf_.find(callable) != slotOf_.end())
        return;
    slotOf_.emplace(callable, slot);
    functionAt_.emplace(slot, Binding{callable, entry});
}

support::Expected<uint32_t> FunctionRegistry::addFunction(const wasm::FunctionPtr &callable,
                                                          std::string_view sig)
{
    if (!callable)
        return contractError("addFunction called with a null function");

    ensureInitialized();
    if (auto it = slotOf_.find(callable.get()); it != slotOf_.end())
        return it->second;

    if (assertionLevel_ >= 2 && presentUntracked(callable.get()))
    {
        return contractError("function '" + callable->name() +
                             "' is in the table but not tracked by the registry");
    }

    auto slot = slots_.acquire();
    if (!slot)
        return slot.error();

    auto placed = place(slot.value(), callable, sig);
    if (!placed)
    {
        slots_.release(slot.value());
        return placed.error();
    }

    record(callable.get(), placed.value().get(), slot.value());
    support::tableDebugLog("registered '%s' at slot %u%s",
                           callable->name().c_str(),
                           slot.value(),
                           placed.value() == callable ? "" : " (wrapped)");
    return slot.value();
}

/// @brief Store @p callable, or a wrapper for it, at @p slot.
/// @return The value actually stored in the table.
support::Expected<wasm::FunctionPtr> FunctionRegistry::place(uint32_t slot,
                                                             const wasm::FunctionPtr &callable,
                                                             std::string_view sig)
{
    wasm::TableStatus status = table_.set(slot, callable);
    if (status == wasm::TableStatus::Ok)
        return callable;
    if (status != wasm::TableStatus::NotAValidEntry)
    {
        return support::makeError(support::ErrorKind::HostFailure,
                                  "function table rejected slot " + std::to_string(slot) + ": " +
                                      std::string(wasm::toString(status)));
    }

    if (sig.empty())
        return contractError("missing signature for function '" + callable->name() + "'");

    auto wrapped = synthesizer_.convert(callable, sig);
    if (!wrapped)
        return wrapped.error();

    status = table_.set(slot, wrapped.value());
    if (status != wasm::TableStatus::Ok)
    {
        return support::makeError(support::ErrorKind::HostFailure,
                                  "function table rejected wrapper for '" + callable->name() +
                                      "' at slot " + std::to_string(slot) + ": " +
                                      std::string(wasm::toString(status)));
    }
    return wrapped.value();
}

support::Expected<void> FunctionRegistry::removeFunction(uint32_t slot)
{
    ensureInitialized();
    auto at = functionAt_.find(slot);
    if (at == functionAt_.end())
        return contractError("no live function registered at slot " + std::to_string(slot));

    slotOf_.erase(at->second.callable);
    functionAt_.erase(at);
    slots_.release(slot);
    return {};
}

std::optional<uint32_t> FunctionRegistry::lookup(const wasm::FunctionPtr &callable) const
{
    auto it = slotOf_.find(callable.get());
    if (it == slotOf_.end())
        return std::nullopt;
    return it->second;
}

bool FunctionRegistry::presentUntracked(const wasm::Function *fn) const
{
    const uint32_t length = table_.length();
    for (uint32_t slot = 0; slot < length; ++slot)
    {
        if (slots_.isFree(slot))
            continue;
        if (table_.get(slot).get() == fn)
            return true;
    }
    return false;
}

support::Expected<void> FunctionRegistry::verifyConsistency() const
{
    if (slotOf_.size() != functionAt_.size())
    {
        return contractError("registry maps disagree: " + std::to_string(slotOf_.size()) +
                             " callable(s), " + std::to_string(functionAt_.size()) + " slot(s)");
    }

    const uint32_t length = table_.length();
    for (const auto &[slot, binding] : functionAt_)
    {
        const std::string where = "slot " + std::to_string(slot);
        auto forward = slotOf_.find(binding.callable);
        if (forward == slotOf_.end() || forward->second != slot)
            return contractError(where + " has no matching callable record");
        if (slot >= length)
            return contractError(where + " is outside the table");
        if (table_.get(slot).get() != binding.entry)
            return contractError(where + " no longer holds the registered entry");
        if (slots_.isFree(slot))
            return contractError(where + " is both live and free");
    }
    return {};
}

} // namespace funtab::table
