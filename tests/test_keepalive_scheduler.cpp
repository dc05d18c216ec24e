// =============================================================================
// FILE: tests/test_keepalive_scheduler.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "keepalive/keepalive_scheduler.h"
#include "subscription/subscription_registry.h"
#include "stub_transport.h"
#include <thread>

using namespace device_watch;
using testing_support::StubTransport;

class KeepaliveSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.keepalive_interval = Seconds(170);
        t0_ = Clock::now();
    }

    void add_subscription(SubscriptionKey key, const std::string& id,
                          const DeviceId& device = "devA",
                          NameList names = {"prop.power", "event.doneWashing"}) {
        SubscriptionDescriptor d;
        d.key = key;
        d.device_id = device;
        d.watched_names = std::move(names);
        ASSERT_EQ(registry_.insert(id, d), Result::kOk);
    }

    TimePoint at(int seconds) const { return t0_ + Seconds(seconds); }

    Config config_;
    SubscriptionRegistry registry_;
    TimePoint t0_;
};

TEST_F(KeepaliveSchedulerTest, ArmDisarm) {
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);

    sched.arm_at(1, at(170));
    EXPECT_TRUE(sched.is_armed(1));
    EXPECT_EQ(sched.armed_count(), 1u);
    EXPECT_EQ(sched.next_due(), at(170));

    EXPECT_TRUE(sched.disarm(1));
    EXPECT_FALSE(sched.disarm(1));
    EXPECT_FALSE(sched.is_armed(1));
    EXPECT_EQ(sched.next_due(), TimePoint::max());
}

TEST_F(KeepaliveSchedulerTest, DefaultIntervalIs170Seconds) {
    StubTransport transport;
    Config c;
    KeepaliveScheduler sched(c, registry_, transport);
    EXPECT_EQ(sched.interval(), Duration(Seconds(170)));
}

TEST_F(KeepaliveSchedulerTest, NonPositiveIntervalFallsBackToDefault) {
    StubTransport transport;
    Config c;
    c.keepalive_interval = Seconds(0);
    KeepaliveScheduler sched(c, registry_, transport);
    EXPECT_EQ(sched.interval(), Duration(Seconds(170)));
}

TEST_F(KeepaliveSchedulerTest, NothingFiresBeforeDue) {
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    EXPECT_EQ(sched.run_due(at(169)), 0u);
    EXPECT_EQ(transport.subscribe_count(), 0u);
}

TEST_F(KeepaliveSchedulerTest, TickRenewsWithSameDeviceAndNames) {
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    transport.script_subscribe(RpcOutcome::success("sub-2"));
    EXPECT_EQ(sched.run_due(at(170)), 1u);

    auto calls = transport.subscribe_calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].device_id, "devA");
    EXPECT_EQ(calls[0].names, (NameList{"prop.power", "event.doneWashing"}));

    EXPECT_FALSE(registry_.contains("sub-1"));
    SubscriptionDescriptor out;
    ASSERT_TRUE(registry_.lookup("sub-2", out));
    EXPECT_EQ(out.device_id, "devA");
    EXPECT_EQ(out.watched_names, (NameList{"prop.power", "event.doneWashing"}));
    EXPECT_EQ(out.renewals_ok, 1u);

    // Same timer keeps running for the renewed subscription
    EXPECT_TRUE(sched.is_armed(1));
    EXPECT_EQ(sched.armed_count(), 1u);
    EXPECT_EQ(sched.stats().renewals_ok.load(), 1u);
}

TEST_F(KeepaliveSchedulerTest, RenewalFailureKeepsIdAndRetriesOnceNextInterval) {
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    transport.script_subscribe(RpcOutcome::failure("relay busy"));
    EXPECT_EQ(sched.run_due(at(170)), 1u);
    EXPECT_TRUE(registry_.contains("sub-1"));
    EXPECT_EQ(sched.stats().renewals_failed.load(), 1u);

    // Nothing more until the next interval
    EXPECT_EQ(sched.run_due(at(171)), 0u);
    EXPECT_EQ(sched.run_due(at(339)), 0u);
    EXPECT_EQ(transport.subscribe_count(), 1u);

    transport.script_subscribe(RpcOutcome::success("sub-2"));
    EXPECT_EQ(sched.run_due(at(340)), 1u);
    EXPECT_EQ(transport.subscribe_count(), 2u);
    EXPECT_TRUE(registry_.contains("sub-2"));
    EXPECT_FALSE(registry_.contains("sub-1"));
}

TEST_F(KeepaliveSchedulerTest, AtMostOneRenewalInFlight) {
    StubTransport transport(StubTransport::Mode::kQueued);
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    EXPECT_EQ(sched.run_due(at(170)), 1u);
    // Transport never answered; later ticks must not stack calls
    EXPECT_EQ(sched.run_due(at(340)), 0u);
    EXPECT_EQ(sched.run_due(at(510)), 0u);
    EXPECT_EQ(transport.subscribe_count(), 1u);
    EXPECT_EQ(sched.stats().skipped_in_flight.load(), 2u);
    EXPECT_TRUE(sched.is_armed(1));

    ASSERT_TRUE(transport.complete_next_subscribe(RpcOutcome::success("sub-2")));
    EXPECT_TRUE(registry_.contains("sub-2"));
    EXPECT_EQ(sched.run_due(at(510 + 170)), 1u);
    EXPECT_EQ(transport.subscribe_count(), 2u);
}

TEST_F(KeepaliveSchedulerTest, StaleTimerStopsRescheduling) {
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    // Removed from the registry without disarming
    registry_.remove("sub-1");

    EXPECT_EQ(sched.run_due(at(170)), 0u);
    EXPECT_EQ(transport.subscribe_count(), 0u);
    EXPECT_FALSE(sched.is_armed(1));
    EXPECT_EQ(sched.stats().stale_timers.load(), 1u);
}

TEST_F(KeepaliveSchedulerTest, LateRenewalAfterRemovalIsDiscardedAndReleased) {
    StubTransport transport(StubTransport::Mode::kQueued);
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    EXPECT_EQ(sched.run_due(at(170)), 1u);

    // Removal path: disarm, then drop from the registry
    sched.disarm(1);
    ASSERT_TRUE(registry_.remove_key(1));

    ASSERT_TRUE(transport.complete_next_subscribe(RpcOutcome::success("sub-2")));
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_FALSE(registry_.contains("sub-2"));
    EXPECT_FALSE(sched.is_armed(1));
    EXPECT_EQ(sched.stats().discarded_results.load(), 1u);

    auto unsubs = transport.unsubscribe_calls();
    ASSERT_EQ(unsubs.size(), 1u);
    EXPECT_EQ(unsubs[0].subscription_id, "sub-2");
    EXPECT_EQ(sched.stats().orphans_released.load(), 1u);
}

TEST_F(KeepaliveSchedulerTest, OtherSubscriptionsFireWhileOneIsOutstanding) {
    StubTransport transport(StubTransport::Mode::kQueued);
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "a-1", "devA");
    add_subscription(2, "b-1", "devB");
    sched.arm_at(1, at(170));
    sched.arm_at(2, at(200));

    EXPECT_EQ(sched.run_due(at(170)), 1u);
    EXPECT_EQ(sched.run_due(at(200)), 1u);
    auto calls = transport.subscribe_calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].device_id, "devA");
    EXPECT_EQ(calls[1].device_id, "devB");
}

TEST_F(KeepaliveSchedulerTest, EmptyIdCountsAsFailure) {
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, at(170));

    transport.script_subscribe(RpcOutcome::success(""));
    sched.run_due(at(170));
    EXPECT_TRUE(registry_.contains("sub-1"));
    EXPECT_EQ(registry_.total_count(), 1u);
    EXPECT_EQ(sched.stats().renewals_failed.load(), 1u);
}

TEST_F(KeepaliveSchedulerTest, BackgroundThreadFiresDueRenewals) {
    config_.keepalive_interval = Seconds(1);
    config_.keepalive_tick_resolution = Millisecs(20);
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");
    sched.arm_at(1, Clock::now());

    ASSERT_EQ(sched.start(), Result::kOk);
    EXPECT_EQ(sched.start(), Result::kAlreadyExists);
    for (int i = 0; i < 100 && transport.subscribe_count() == 0; ++i)
        std::this_thread::sleep_for(Millisecs(10));
    sched.stop();

    EXPECT_GE(transport.subscribe_count(), 1u);
    EXPECT_FALSE(sched.is_running());
}

TEST_F(KeepaliveSchedulerTest, ArmWakesSleepingThread) {
    config_.keepalive_interval = Seconds(170);
    config_.keepalive_tick_resolution = Millisecs(60000);
    StubTransport transport;
    KeepaliveScheduler sched(config_, registry_, transport);
    add_subscription(1, "sub-1");

    ASSERT_EQ(sched.start(), Result::kOk);
    // Let the thread settle into its long idle wait with nothing armed
    std::this_thread::sleep_for(Millisecs(50));

    sched.arm_at(1, Clock::now() + Millisecs(100));
    for (int i = 0; i < 200 && transport.subscribe_count() == 0; ++i)
        std::this_thread::sleep_for(Millisecs(10));
    sched.stop();

    EXPECT_EQ(transport.subscribe_count(), 1u);
}
