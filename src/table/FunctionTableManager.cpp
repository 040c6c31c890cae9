//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the FunctionTableManager facade.  Construction resolves the
// assertion level (config first, then the FUNTAB_ASSERTIONS environment
// override) and wires the allocator, synthesizer and registry to the borrowed
// table and module host.  Each public operation forwards to the registry and,
// at assertion level 1 or higher, echoes failures to stderr.
//
//===----------------------------------------------------------------------===//

#include "funtab/table/FunctionTableManager.hpp"

#include "support/debug_log.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace funtab::table
{
namespace
{

/// @brief Apply the FUNTAB_ASSERTIONS environment override to @p level.
/// @details Only "0", "1" and "2" are accepted; other values keep @p level.
int resolveAssertionLevel(int level)
{
    if (const char *env = std::getenv("FUNTAB_ASSERTIONS"))
    {
        if (std::strcmp(env, "0") == 0)
            return 0;
        if (std::strcmp(env, "1") == 0)
            return 1;
        if (std::strcmp(env, "2") == 0)
            return 2;
    }
    return level;
}

} // namespace

FunctionTableManager::FunctionTableManager(wasm::Table &table,
                                           const wasm::ModuleHost &host,
                                           ManagerConfig config)
    : table_(table),
      assertionLevel_(resolveAssertionLevel(config.assertionLevel)),
      slots_(table),
      synth_(host, config.reflection),
      registry_(table, slots_, synth_, assertionLevel_)
{
    support::tableDebugLog("manager created: assertions=%d reflection=%s",
                           assertionLevel_,
                           synth_.hasReflection() ? "yes" : "no");
}

support::Expected<uint32_t> FunctionTableManager::addFunction(const wasm::FunctionPtr &callable,
                                                              std::string_view sig)
{
    auto slot = registry_.addFunction(callable, sig);
    if (!slot)
        report(slot.error());
    return slot;
}

support::Expected<void> FunctionTableManager::removeFunction(uint32_t slot)
{
    auto removed = registry_.removeFunction(slot);
    if (!removed)
        report(removed.error());
    return removed;
}

void FunctionTableManager::noteTableEntries(uint32_t offset, uint32_t count)
{
    registry_.ensureInitialized();
    registry_.noteTableEntries(offset, count);
}

support::Expected<void> FunctionTableManager::verifyConsistency() const
{
    auto ok = registry_.verifyConsistency();
    if (!ok)
        report(ok.error());
    return ok;
}

void FunctionTableManager::report(const support::Diag &diag) const
{
    if (assertionLevel_ >= 1)
        support::printDiag(diag, std::cerr);
}

} // namespace funtab::table
