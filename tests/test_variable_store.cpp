#include <gtest/gtest.h>

#include "variable_store.hpp"

#include <string>
#include <thread>
#include <vector>

using linecalc::VariableOrigin;
using linecalc::VariableStore;

namespace {
// 6 операторов и по два синонима у каждого
constexpr std::size_t kSeededEntries = 18;
}

TEST(VariableStoreTest, IsSeededWithOperatorAliases) {
    VariableStore store;
    EXPECT_EQ(store.size(), kSeededEntries);
    EXPECT_EQ(store.lookup("plus"), "+");
    EXPECT_EQ(store.lookup("PLUS"), "+");
    EXPECT_EQ(store.lookup("+"), "+");
    EXPECT_EQ(store.lookup("times"), "*");
    EXPECT_EQ(store.originOf("minus"), VariableOrigin::Operator);
}

TEST(VariableStoreTest, DefinesAndLooksUpCaseInsensitively) {
    VariableStore store;
    EXPECT_TRUE(store.define("Rate", "42"));
    EXPECT_EQ(store.lookup("rate"), "42");
    EXPECT_EQ(store.lookup("RATE"), "42");
    EXPECT_EQ(store.originOf("rate"), VariableOrigin::User);
    EXPECT_FALSE(store.lookup("rat").has_value());
}

TEST(VariableStoreTest, LaterDefinitionOverwrites) {
    VariableStore store;
    store.define("x", "1");
    store.define("X", "2");
    EXPECT_EQ(store.lookup("x"), "2");
    EXPECT_EQ(store.size(), kSeededEntries + 1);
}

TEST(VariableStoreTest, RejectsInvalidNamesWithoutChanges) {
    VariableStore store;
    for (const char* name : {"", "1x", "x_y", "x y", "+", "é"}) {
        EXPECT_FALSE(store.define(name, "5")) << name;
    }
    EXPECT_EQ(store.size(), kSeededEntries);
    EXPECT_TRUE(store.define("x1", "5"));
}

TEST(VariableStoreTest, ResetKeepsAliasesAndRemovesUserVariables) {
    VariableStore store;
    store.define("x", "5");
    store.resetUserVariables();
    EXPECT_FALSE(store.lookup("x").has_value());
    EXPECT_EQ(store.lookup("plus"), "+");
    EXPECT_EQ(store.size(), kSeededEntries);
}

TEST(VariableStoreTest, ResetRestoresOverriddenAlias) {
    VariableStore store;
    store.define("plus", "7");
    EXPECT_EQ(store.lookup("plus"), "7");
    store.resetUserVariables();
    EXPECT_EQ(store.lookup("plus"), "+");
    EXPECT_EQ(store.originOf("plus"), VariableOrigin::Operator);
}

TEST(VariableStoreTest, ResetRemovesUserVariableHoldingOperatorSymbol) {
    VariableStore store;
    store.define("op", "+");
    store.resetUserVariables();
    EXPECT_FALSE(store.contains("op"));
}

TEST(VariableStoreTest, ConcurrentDefinitionsAreAllStored) {
    VariableStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                store.define("v" + std::to_string(t) + "n" + std::to_string(i), std::to_string(i));
                store.lookup("plus");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.size(), kSeededEntries + kThreads * kPerThread);
    EXPECT_EQ(store.lookup("v3n42"), "42");
}
