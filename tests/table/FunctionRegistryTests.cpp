// File: tests/table/FunctionRegistryTests.cpp
// Purpose: Verify callable registration, slot reuse and registry coherence.
// Key invariants: A live callable always maps to the same slot.
//                 Failed registrations leave no live slot or record behind.
//                 Out-of-band table writes are seen only after a scan.
// Ownership/Lifetime: Each test owns its table, host, allocator and registry.
// Links: docs/table-manager.md

#include <gtest/gtest.h>

#include "table/FunctionRegistry.hpp"
#include "table/SlotAllocator.hpp"
#include "table/TrampolineSynthesizer.hpp"
#include "wasm/FuncTable.hpp"
#include "wasm/ModuleHost.hpp"
#include "wasm/SignatureTranslator.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace funtab::table;
using namespace funtab::wasm;
using funtab::support::ErrorKind;
using funtab::support::Expected;

namespace
{
class FailingModuleHost final : public ModuleHost
{
  public:
    Expected<CompiledModule> compile(std::span<const uint8_t>) const override
    {
        return funtab::support::makeError(ErrorKind::HostFailure, "compile refused by host");
    }

    Expected<Instance> instantiate(const CompiledModule &, const ImportObject &) const override
    {
        return funtab::support::makeError(ErrorKind::HostFailure, "instantiate refused by host");
    }
};

/// Table, host, allocator and registry wired the way the manager wires them.
struct Harness
{
    explicit Harness(int assertionLevel = 1,
                     uint32_t initial = 0,
                     std::optional<uint32_t> maximum = std::nullopt)
        : table(initial, maximum), slots(table), synth(host),
          registry(table, slots, synth, assertionLevel)
    {
    }

    FuncTable table;
    BinaryModuleHost host;
    SlotAllocator slots;
    TrampolineSynthesizer synth;
    FunctionRegistry registry;
};

FunctionPtr hostFn(std::string name)
{
    return makeHostFunction(std::move(name),
                            [](std::span<const Value> args)
                            {
                                int32_t sum = 0;
                                for (const Value &v : args)
                                    sum += v.i32;
                                return std::vector<Value>{Value::fromI32(sum)};
                            });
}

FunctionPtr nativeFn(std::string name)
{
    auto type = sigToWasmTypes("v");
    EXPECT_TRUE(type);
    return makeNativeFunction(std::move(name), type ? type.value() : FuncType{}, nullptr);
}
} // namespace

TEST(FunctionRegistry, RegistrationIsIdempotent)
{
    Harness h;
    FunctionPtr f = hostFn("f");

    auto first = h.registry.addFunction(f, "vi");
    ASSERT_TRUE(first) << first.error().message;
    FunctionPtr entry = h.table.get(first.value());
    ASSERT_NE(entry, nullptr);

    auto second = h.registry.addFunction(f, "vi");
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value(), first.value());
    EXPECT_EQ(h.table.get(first.value()), entry);
    EXPECT_EQ(h.table.length(), 1u);
    EXPECT_EQ(h.registry.liveCount(), 1u);

    auto unsigned_ = h.registry.addFunction(f);
    ASSERT_TRUE(unsigned_);
    EXPECT_EQ(unsigned_.value(), first.value());
}

TEST(FunctionRegistry, DistinctCallablesGetIncreasingSlotsThenReuse)
{
    Harness h(1, 1);
    FunctionPtr f1 = hostFn("f1");
    FunctionPtr f2 = hostFn("f2");
    FunctionPtr f3 = hostFn("f3");

    auto s1 = h.registry.addFunction(f1, "ii");
    auto s2 = h.registry.addFunction(f2, "ii");
    ASSERT_TRUE(s1);
    ASSERT_TRUE(s2);
    EXPECT_EQ(s1.value(), 1u);
    EXPECT_EQ(s2.value(), 2u);

    ASSERT_TRUE(h.registry.removeFunction(s1.value()));
    EXPECT_FALSE(h.registry.lookup(f1).has_value());
    EXPECT_EQ(h.slots.freeCount(), 1u);

    auto s3 = h.registry.addFunction(f3, "ii");
    ASSERT_TRUE(s3);
    EXPECT_EQ(s3.value(), s1.value());
    EXPECT_EQ(h.table.length(), 3u);
    EXPECT_EQ(h.slots.freeCount(), 0u);
    EXPECT_TRUE(h.registry.verifyConsistency());
}

TEST(FunctionRegistry, GrowthRefusalLeavesStateUntouched)
{
    Harness h(1, 0, 1);
    FunctionPtr f1 = nativeFn("f1");
    FunctionPtr f2 = nativeFn("f2");

    ASSERT_TRUE(h.registry.addFunction(f1));
    auto refused = h.registry.addFunction(f2);
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().kind, ErrorKind::ResourceExhausted);
    EXPECT_EQ(h.registry.liveCount(), 1u);
    EXPECT_EQ(h.slots.freeCount(), 0u);
    EXPECT_FALSE(h.registry.lookup(f2).has_value());
    EXPECT_EQ(h.table.length(), 1u);
}

TEST(FunctionRegistry, MissingSignatureReleasesSlot)
{
    Harness h;
    FunctionPtr f = hostFn("needs_sig");

    auto result = h.registry.addFunction(f);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::ContractViolation);
    EXPECT_NE(result.error().message.find("needs_sig"), std::string::npos);
    EXPECT_EQ(h.registry.liveCount(), 0u);
    EXPECT_EQ(h.slots.freeCount(), 1u);

    auto retried = h.registry.addFunction(f, "v");
    ASSERT_TRUE(retried);
    EXPECT_EQ(retried.value(), 0u);
    EXPECT_EQ(h.table.length(), 1u);
}

TEST(FunctionRegistry, HostFailureReleasesSlot)
{
    FuncTable table;
    FailingModuleHost host;
    SlotAllocator slots(table);
    TrampolineSynthesizer synth(host);
    FunctionRegistry registry(table, slots, synth, 1);

    auto result = registry.addFunction(hostFn("f"), "v");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::HostFailure);
    EXPECT_EQ(result.error().message, "compile refused by host");
    EXPECT_EQ(registry.liveCount(), 0u);
    EXPECT_EQ(slots.freeCount(), 1u);
    EXPECT_EQ(table.get(0), nullptr);
}

TEST(FunctionRegistry, InvalidSignatureIsContractViolation)
{
    Harness h;
    auto result = h.registry.addFunction(hostFn("f"), "vq");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::ContractViolation);
    EXPECT_EQ(h.registry.liveCount(), 0u);
}

TEST(FunctionRegistry, NativeFunctionIsStoredDirectly)
{
    Harness h;
    FunctionPtr n = nativeFn("native");
    auto slot = h.registry.addFunction(n);
    ASSERT_TRUE(slot);
    EXPECT_EQ(h.table.get(slot.value()), n);
}

TEST(FunctionRegistry, TrampolineEntryDelegatesToCallable)
{
    Harness h;
    FunctionPtr f = hostFn("sum");
    auto slot = h.registry.addFunction(f, "iii");
    ASSERT_TRUE(slot);

    FunctionPtr entry = h.table.get(slot.value());
    ASSERT_NE(entry, nullptr);
    EXPECT_NE(entry, f);
    const Value args[] = {Value::fromI32(20), Value::fromI32(22)};
    auto out = entry->call(args);
    ASSERT_TRUE(out) << out.error().message;
    ASSERT_EQ(out.value().size(), 1u);
    EXPECT_EQ(out.value().front().i32, 42);
    EXPECT_EQ(h.registry.lookup(f), slot.value());
}

TEST(FunctionRegistry, NullCallableRejected)
{
    Harness h;
    auto result = h.registry.addFunction(nullptr, "v");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::ContractViolation);
}

TEST(FunctionRegistry, LazyScanFindsExistingEntries)
{
    Harness h(1, 2);
    FunctionPtr n = nativeFn("preloaded");
    ASSERT_EQ(h.table.set(1, n), TableStatus::Ok);
    EXPECT_FALSE(h.registry.isInitialized());

    auto slot = h.registry.addFunction(n);
    ASSERT_TRUE(slot);
    EXPECT_TRUE(h.registry.isInitialized());
    EXPECT_EQ(slot.value(), 1u);
    EXPECT_EQ(h.table.length(), 2u);
}

TEST(FunctionRegistry, ScanKeepsFirstSlotForDuplicates)
{
    Harness h(1, 3);
    FunctionPtr n = nativeFn("dup");
    ASSERT_EQ(h.table.set(0, n), TableStatus::Ok);
    ASSERT_EQ(h.table.set(2, n), TableStatus::Ok);

    h.registry.ensureInitialized();
    EXPECT_EQ(h.registry.lookup(n), 0u);
    EXPECT_EQ(h.registry.liveCount(), 1u);
}

TEST(FunctionRegistry, NoteTableEntriesPicksUpOutOfBandWrites)
{
    Harness h;
    h.registry.ensureInitialized();

    FunctionPtr n = nativeFn("late");
    ASSERT_EQ(h.table.grow(1), TableStatus::Ok);
    ASSERT_EQ(h.table.set(0, n), TableStatus::Ok);
    EXPECT_FALSE(h.registry.lookup(n).has_value());

    h.registry.noteTableEntries(0, 1);
    EXPECT_EQ(h.registry.lookup(n), 0u);

    auto slot = h.registry.addFunction(n);
    ASSERT_TRUE(slot);
    EXPECT_EQ(slot.value(), 0u);
    EXPECT_EQ(h.table.length(), 1u);
}

TEST(FunctionRegistry, NoteTableEntriesEvictsReplacedCallable)
{
    Harness h;
    FunctionPtr a = nativeFn("a");
    FunctionPtr b = nativeFn("b");
    auto slot = h.registry.addFunction(a);
    ASSERT_TRUE(slot);

    ASSERT_EQ(h.table.set(slot.value(), b), TableStatus::Ok);
    h.registry.noteTableEntries(0, h.table.length());
    EXPECT_FALSE(h.registry.lookup(a).has_value());
    EXPECT_EQ(h.registry.lookup(b), slot.value());
    EXPECT_TRUE(h.registry.verifyConsistency());
}

TEST(FunctionRegistry, NoteTableEntriesKeepsWrappedRegistrations)
{
    Harness h;
    FunctionPtr f = hostFn("wrapped");
    auto slot = h.registry.addFunction(f, "v");
    ASSERT_TRUE(slot);

    h.registry.noteTableEntries(0, h.table.length());
    EXPECT_EQ(h.registry.lookup(f), slot.value());
    EXPECT_EQ(h.registry.liveCount(), 1u);
}

TEST(FunctionRegistry, StaleRegistryDetectedAtLevelTwo)
{
    Harness h(2);
    h.registry.ensureInitialized();

    FunctionPtr n = nativeFn("stale");
    ASSERT_EQ(h.table.grow(1), TableStatus::Ok);
    ASSERT_EQ(h.table.set(0, n), TableStatus::Ok);

    auto result = h.registry.addFunction(n);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::ContractViolation);
    EXPECT_NE(result.error().message.find("not tracked"), std::string::npos);
    EXPECT_EQ(h.table.length(), 1u);
}

TEST(FunctionRegistry, ReaddAfterRemoveAtLevelTwo)
{
    Harness h(2);
    FunctionPtr n = nativeFn("cycled");

    auto first = h.registry.addFunction(n);
    ASSERT_TRUE(first);
    ASSERT_TRUE(h.registry.removeFunction(first.value()));
    EXPECT_EQ(h.table.get(first.value()), n);

    auto again = h.registry.addFunction(n);
    ASSERT_TRUE(again) << again.error().message;
    EXPECT_EQ(again.value(), first.value());
    EXPECT_EQ(h.slots.freeCount(), 0u);
    EXPECT_TRUE(h.registry.verifyConsistency());
}

TEST(FunctionRegistry, StaleRegistryUndetectedAtLevelOne)
{
    Harness h(1);
    h.registry.ensureInitialized();

    FunctionPtr n = nativeFn("stale");
    ASSERT_EQ(h.table.grow(1), TableStatus::Ok);
    ASSERT_EQ(h.table.set(0, n), TableStatus::Ok);

    auto result = h.registry.addFunction(n);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), 1u);
}

TEST(FunctionRegistry, RemovingNonLiveSlotFails)
{
    Harness h;
    auto missing = h.registry.removeFunction(7);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::ContractViolation);

    auto slot = h.registry.addFunction(nativeFn("once"));
    ASSERT_TRUE(slot);
    ASSERT_TRUE(h.registry.removeFunction(slot.value()));
    auto again = h.registry.removeFunction(slot.value());
    ASSERT_FALSE(again);
    EXPECT_EQ(h.slots.freeCount(), 1u);
}

TEST(FunctionRegistry, RemoveDoesNotClearTableEntry)
{
    Harness h;
    FunctionPtr n = nativeFn("kept");
    auto slot = h.registry.addFunction(n);
    ASSERT_TRUE(slot);
    ASSERT_TRUE(h.registry.removeFunction(slot.value()));
    EXPECT_EQ(h.table.get(slot.value()), n);
}

TEST(FunctionRegistry, VerifyConsistencyDetectsOverwrittenEntry)
{
    Harness h;
    auto slot = h.registry.addFunction(nativeFn("a"));
    ASSERT_TRUE(slot);
    EXPECT_TRUE(h.registry.verifyConsistency());

    ASSERT_EQ(h.table.set(slot.value(), nativeFn("intruder")), TableStatus::Ok);
    auto check = h.registry.verifyConsistency();
    ASSERT_FALSE(check);
    EXPECT_EQ(check.error().kind, ErrorKind::ContractViolation);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
