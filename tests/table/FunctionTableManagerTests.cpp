// File: tests/table/FunctionTableManagerTests.cpp
// Purpose: Verify the public facade end to end, including the assertion-level
//          configuration and failure reporting on stderr.
// Key invariants: FUNTAB_ASSERTIONS overrides the configured level only when
//                 it holds 0, 1 or 2. Failures are printed at level 1 and up.
// Ownership/Lifetime: Test owns tables and hosts; managers borrow them.
// Links: docs/table-manager.md

#include <gtest/gtest.h>

#include "funtab/table/FunctionTableManager.hpp"
#include "wasm/FuncTable.hpp"
#include "wasm/ModuleHost.hpp"
#include "wasm/TypeReflection.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using namespace funtab::table;
using namespace funtab::wasm;
using funtab::support::ErrorKind;

namespace
{
/// Sets an environment variable for the lifetime of the guard.
class ScopedEnv
{
  public:
    ScopedEnv(const char *name, const char *value) : name_(name)
    {
        if (const char *old = std::getenv(name))
            previous_ = old;
        setenv(name, value, 1);
    }

    ~ScopedEnv()
    {
        if (previous_)
            setenv(name_, previous_->c_str(), 1);
        else
            unsetenv(name_);
    }

  private:
    const char *name_;
    std::optional<std::string> previous_;
};

FunctionPtr callback(std::string name, int &calls)
{
    return makeHostFunction(std::move(name),
                            [&calls](std::span<const Value>)
                            {
                                ++calls;
                                return std::vector<Value>{};
                            });
}
} // namespace

TEST(FunctionTableManager, RegistersAndReusesSlots)
{
    unsetenv("FUNTAB_ASSERTIONS");
    FuncTable table(1);
    BinaryModuleHost host;
    FunctionTableManager manager(table, host);

    int calls = 0;
    FunctionPtr f1 = callback("f1", calls);
    FunctionPtr f2 = callback("f2", calls);

    auto s1 = manager.addFunction(f1, "v");
    auto s2 = manager.addFunction(f2, "v");
    ASSERT_TRUE(s1);
    ASSERT_TRUE(s2);
    EXPECT_LT(s1.value(), s2.value());
    EXPECT_EQ(manager.liveCount(), 2u);

    auto again = manager.addFunction(f1, "v");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), s1.value());

    ASSERT_TRUE(manager.removeFunction(s2.value()));
    EXPECT_EQ(manager.freeSlotCount(), 1u);
    FunctionPtr f3 = callback("f3", calls);
    auto s3 = manager.addFunction(f3, "v");
    ASSERT_TRUE(s3);
    EXPECT_EQ(s3.value(), s2.value());
    EXPECT_EQ(manager.freeSlotCount(), 0u);
    EXPECT_TRUE(manager.verifyConsistency());

    FunctionPtr entry = manager.table().get(s3.value());
    ASSERT_NE(entry, nullptr);
    ASSERT_TRUE(entry->call({}));
    EXPECT_EQ(calls, 1);
}

TEST(FunctionTableManager, ReflectionPathProducesTypedEntry)
{
    unsetenv("FUNTAB_ASSERTIONS");
    FuncTable table;
    BinaryModuleHost host;
    DirectTypeReflection reflection;
    ManagerConfig config;
    config.reflection = &reflection;
    FunctionTableManager manager(table, host, config);

    int calls = 0;
    FunctionPtr f = callback("f", calls);
    auto slot = manager.addFunction(f, "vi");
    ASSERT_TRUE(slot);
    FunctionPtr entry = table.get(slot.value());
    ASSERT_NE(entry, nullptr);
    ASSERT_EQ(entry->kind(), Function::Kind::Typed);
    EXPECT_EQ(static_cast<const TypedFunction &>(*entry).target(), f);
}

TEST(FunctionTableManager, GrowthRefusalCarriesRemediation)
{
    unsetenv("FUNTAB_ASSERTIONS");
    FuncTable table(0, 0);
    BinaryModuleHost host;
    ManagerConfig config;
    config.assertionLevel = 0;
    FunctionTableManager manager(table, host, config);

    int calls = 0;
    auto slot = manager.addFunction(callback("f", calls), "v");
    ASSERT_FALSE(slot);
    EXPECT_EQ(slot.error().kind, ErrorKind::ResourceExhausted);
    EXPECT_NE(slot.error().message.find("raise the table maximum"), std::string::npos);
    EXPECT_EQ(manager.liveCount(), 0u);
    EXPECT_EQ(manager.freeSlotCount(), 0u);
}

TEST(FunctionTableManager, EnvironmentOverridesAssertionLevel)
{
    FuncTable table;
    BinaryModuleHost host;
    ManagerConfig config;
    config.assertionLevel = 1;
    {
        ScopedEnv env("FUNTAB_ASSERTIONS", "2");
        FunctionTableManager manager(table, host, config);
        EXPECT_EQ(manager.assertionLevel(), 2);
    }
    {
        ScopedEnv env("FUNTAB_ASSERTIONS", "0");
        FunctionTableManager manager(table, host, config);
        EXPECT_EQ(manager.assertionLevel(), 0);
    }
    {
        ScopedEnv env("FUNTAB_ASSERTIONS", "loud");
        FunctionTableManager manager(table, host, config);
        EXPECT_EQ(manager.assertionLevel(), 1);
    }
}

TEST(FunctionTableManager, FailuresPrintedAtLevelOne)
{
    unsetenv("FUNTAB_ASSERTIONS");
    FuncTable table;
    BinaryModuleHost host;
    ManagerConfig config;
    config.assertionLevel = 1;
    FunctionTableManager manager(table, host, config);

    int calls = 0;
    testing::internal::CaptureStderr();
    auto slot = manager.addFunction(callback("unsigned_cb", calls));
    const std::string err = testing::internal::GetCapturedStderr();
    ASSERT_FALSE(slot);
    EXPECT_NE(err.find("error: [ContractViolation]"), std::string::npos);
    EXPECT_NE(err.find("unsigned_cb"), std::string::npos);
}

TEST(FunctionTableManager, FailuresSilentAtLevelZero)
{
    unsetenv("FUNTAB_ASSERTIONS");
    FuncTable table;
    BinaryModuleHost host;
    ManagerConfig config;
    config.assertionLevel = 0;
    FunctionTableManager manager(table, host, config);

    testing::internal::CaptureStderr();
    auto removed = manager.removeFunction(3);
    const std::string err = testing::internal::GetCapturedStderr();
    ASSERT_FALSE(removed);
    EXPECT_EQ(err.find("error:"), std::string::npos);
}

TEST(FunctionTableManager, StaleRegistryDetectedAtLevelTwo)
{
    unsetenv("FUNTAB_ASSERTIONS");
    FuncTable table;
    BinaryModuleHost host;
    ManagerConfig config;
    config.assertionLevel = 2;
    FunctionTableManager manager(table, host, config);
    manager.ensureInitialized();

    FunctionPtr native = makeNativeFunction("native", FuncType{}, nullptr);
    ASSERT_EQ(table.grow(1), TableStatus::Ok);
    ASSERT_EQ(table.set(0, native), TableStatus::Ok);

    testing::internal::CaptureStderr();
    auto stale = manager.addFunction(native);
    testing::internal::GetCapturedStderr();
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().kind, ErrorKind::ContractViolation);

    manager.noteTableEntries(0, table.length());
    EXPECT_EQ(manager.lookup(native), 0u);
    auto slot = manager.addFunction(native);
    ASSERT_TRUE(slot);
    EXPECT_EQ(slot.value(), 0u);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
