// =============================================================================
// FILE: tests/test_teardown_hook.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/teardown_hook.h"
#include <stdexcept>
#include <vector>

using namespace device_watch;

TEST(TeardownHook, FiresActionsInRegistrationOrder) {
    TeardownHook hook;
    std::vector<int> order;
    hook.register_action([&] { order.push_back(1); });
    hook.register_action([&] { order.push_back(2); });
    hook.register_action([&] { order.push_back(3); });

    EXPECT_EQ(hook.fire(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(hook.fired());
    EXPECT_EQ(hook.pending_count(), 0u);
}

TEST(TeardownHook, FiresOnlyOnce) {
    TeardownHook hook;
    int runs = 0;
    hook.register_action([&] { runs++; });
    EXPECT_EQ(hook.fire(), 1u);
    EXPECT_EQ(hook.fire(), 0u);
    EXPECT_EQ(runs, 1);
}

TEST(TeardownHook, FireWithNothingRegistered) {
    TeardownHook hook;
    EXPECT_EQ(hook.fire(), 0u);
    EXPECT_TRUE(hook.fired());
}

TEST(TeardownHook, UnregisteredActionDoesNotRun) {
    TeardownHook hook;
    int runs = 0;
    auto token = hook.register_action([&] { runs++; });
    ASSERT_NE(token, TeardownHook::kInvalidToken);
    hook.unregister(token);
    hook.unregister(token);
    hook.unregister(TeardownHook::kInvalidToken);

    EXPECT_EQ(hook.fire(), 0u);
    EXPECT_EQ(runs, 0);
}

TEST(TeardownHook, RegisterAfterFireIsRefused) {
    TeardownHook hook;
    hook.fire();
    EXPECT_EQ(hook.register_action([] {}), TeardownHook::kInvalidToken);
    EXPECT_EQ(hook.pending_count(), 0u);
}

TEST(TeardownHook, NullActionIsRefused) {
    TeardownHook hook;
    EXPECT_EQ(hook.register_action(nullptr), TeardownHook::kInvalidToken);
}

TEST(TeardownHook, ActionMayUnregisterAnother) {
    TeardownHook hook;
    int second_runs = 0;
    TeardownHook::Token second = TeardownHook::kInvalidToken;
    hook.register_action([&] { hook.unregister(second); });
    second = hook.register_action([&] { second_runs++; });

    EXPECT_EQ(hook.fire(), 1u);
    EXPECT_EQ(second_runs, 0);
}

TEST(TeardownHook, ThrowingActionDoesNotStopOthers) {
    TeardownHook hook;
    int runs = 0;
    hook.register_action([] { throw std::runtime_error("boom"); });
    hook.register_action([&] { runs++; });

    EXPECT_EQ(hook.fire(), 2u);
    EXPECT_EQ(runs, 1);
}
