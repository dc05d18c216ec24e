// =============================================================================
// FILE: tests/test_subscription_manager.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "subscription/subscription_manager.h"
#include "subscription/subscription_registry.h"
#include "subscription/watched_name_index.h"
#include "keepalive/keepalive_scheduler.h"
#include "common/slow_call_logger.h"
#include "common/teardown_hook.h"
#include "stub_transport.h"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

using namespace device_watch;
using testing_support::StubTransport;

class SubscriptionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.keepalive_interval = Seconds(170);
        transport_ = std::make_unique<StubTransport>();
        build();
    }

    void build() {
        scheduler_ = std::make_unique<KeepaliveScheduler>(config_, registry_, *transport_);
        slow_logger_ = std::make_unique<SlowCallLogger>(config_);
        manager_ = SubscriptionManager::create(registry_, *scheduler_, *transport_, hook_,
                                               slow_logger_.get(), &index_);
    }

    // Subscribes and returns the synchronous outcome (StubTransport kSync)
    SubscribeOutcome subscribe_sync(const DeviceId& device, const NameList& names) {
        SubscribeOutcome captured;
        int calls = 0;
        manager_->subscribe(device, names, [&](const SubscribeOutcome& o) {
            captured = o;
            calls++;
        });
        EXPECT_EQ(calls, 1);
        return captured;
    }

    Config config_;
    SubscriptionRegistry registry_;
    WatchedNameIndex index_;
    TeardownHook hook_;
    std::unique_ptr<SlowCallLogger> slow_logger_;   // outlives callbacks queued in the transport
    std::unique_ptr<StubTransport> transport_;
    std::unique_ptr<KeepaliveScheduler> scheduler_;
    std::shared_ptr<SubscriptionManager> manager_;
};

TEST_F(SubscriptionManagerTest, EmptyNamesFailsWithoutTransportCall) {
    int calls = 0;
    SubscribeOutcome out;
    Result r = manager_->subscribe("devA", {}, [&](const SubscribeOutcome& o) { out = o; calls++; });

    EXPECT_EQ(r, Result::kInvalidArgument);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(out.result, Result::kInvalidArgument);
    EXPECT_EQ(out.handle, nullptr);
    EXPECT_EQ(transport_->call_count(), 0u);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
}

TEST_F(SubscriptionManagerTest, BlankNameFailsWithoutTransportCall) {
    auto out = subscribe_sync("devA", {"prop.power", "  "});
    EXPECT_EQ(out.result, Result::kInvalidArgument);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(SubscriptionManagerTest, TransportFailureSurfacesPayload) {
    transport_->set_mode(StubTransport::Mode::kFail);
    transport_->set_fail_payload("{\"code\":-2,\"message\":\"device offline\"}");

    auto out = subscribe_sync("devA", {"prop.power"});
    EXPECT_EQ(out.result, Result::kSubscriptionFailed);
    EXPECT_EQ(out.failure_payload, "{\"code\":-2,\"message\":\"device offline\"}");
    EXPECT_EQ(out.handle, nullptr);
    EXPECT_EQ(transport_->subscribe_count(), 1u);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(hook_.pending_count(), 0u);
}

TEST_F(SubscriptionManagerTest, EmptyIdIsAFailure) {
    transport_->script_subscribe(RpcOutcome::success(""));
    auto out = subscribe_sync("devA", {"prop.power"});
    EXPECT_EQ(out.result, Result::kSubscriptionFailed);
    EXPECT_EQ(registry_.total_count(), 0u);
}

TEST_F(SubscriptionManagerTest, SuccessfulSubscribeRegistersEverything) {
    transport_->script_subscribe(RpcOutcome::success("sub-1"));
    auto out = subscribe_sync("devA", {"prop.power", "event.doneWashing"});

    ASSERT_TRUE(out.ok());
    ASSERT_NE(out.handle, nullptr);
    EXPECT_FALSE(out.handle->is_passive());
    EXPECT_EQ(out.handle->initial_id(), "sub-1");
    EXPECT_TRUE(registry_.contains("sub-1"));
    EXPECT_TRUE(scheduler_->is_armed(out.handle->key()));
    EXPECT_EQ(hook_.pending_count(), 1u);
    EXPECT_EQ(manager_->tracked_count(), 1u);
    EXPECT_TRUE(index_.is_watched("devA", "event.doneWashing"));
}

TEST_F(SubscriptionManagerTest, HandleRemoveIsIdempotent) {
    auto out = subscribe_sync("devA", {"prop.power"});
    ASSERT_TRUE(out.ok());

    out.handle->remove();
    out.handle->remove();
    out.handle->remove();

    EXPECT_TRUE(out.handle->removed());
    EXPECT_EQ(transport_->unsubscribe_count(), 1u);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(hook_.pending_count(), 0u);
    EXPECT_EQ(manager_->tracked_count(), 0u);
    EXPECT_FALSE(index_.is_watched("devA", "prop.power"));
}

TEST_F(SubscriptionManagerTest, RemoveIgnoresUnsubscribeFailure) {
    transport_->set_unsubscribe_fails(true);
    auto out = subscribe_sync("devA", {"prop.power"});
    ASSERT_TRUE(out.ok());

    out.handle->remove();
    EXPECT_EQ(transport_->unsubscribe_count(), 1u);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(manager_->stats().unsubscribes_failed.load(), 1u);
}

TEST_F(SubscriptionManagerTest, RenewThenRemoveScenario) {
    transport_->script_subscribe(RpcOutcome::success("sub-1"));
    auto out = subscribe_sync("deviceA", {"prop.power", "event.doneWashing"});
    ASSERT_TRUE(out.ok());

    // One interval later the relay hands out a new id
    transport_->script_subscribe(RpcOutcome::success("sub-2"));
    EXPECT_EQ(scheduler_->run_due(Clock::now() + Seconds(170)), 1u);

    auto subs = transport_->subscribe_calls();
    ASSERT_EQ(subs.size(), 2u);
    EXPECT_EQ(subs[1].device_id, "deviceA");
    EXPECT_EQ(subs[1].names, (NameList{"prop.power", "event.doneWashing"}));

    auto ids = registry_.active_ids();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], "sub-2");
    SubscriptionDescriptor d;
    ASSERT_TRUE(registry_.lookup("sub-2", d));
    EXPECT_EQ(d.watched_names, (NameList{"prop.power", "event.doneWashing"}));

    out.handle->remove();

    auto unsubs = transport_->unsubscribe_calls();
    ASSERT_EQ(unsubs.size(), 1u);
    EXPECT_EQ(unsubs[0].device_id, "deviceA");
    EXPECT_EQ(unsubs[0].names, (NameList{"prop.power", "event.doneWashing"}));
    EXPECT_EQ(unsubs[0].subscription_id, "sub-2");
    EXPECT_EQ(registry_.total_count(), 0u);
}

TEST_F(SubscriptionManagerTest, InFlightRenewalAfterRemoveDoesNotReinsert) {
    auto out = subscribe_sync("devA", {"prop.power"});
    ASSERT_TRUE(out.ok());

    transport_->set_mode(StubTransport::Mode::kQueued);
    EXPECT_EQ(scheduler_->run_due(Clock::now() + Seconds(170)), 1u);
    ASSERT_EQ(transport_->queued_count(), 1u);

    out.handle->remove();
    ASSERT_TRUE(transport_->complete_next_subscribe(RpcOutcome::success("sub-late")));

    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_FALSE(registry_.contains("sub-late"));
    EXPECT_EQ(scheduler_->armed_count(), 0u);

    // Original id released by remove(), late id released as an orphan
    auto unsubs = transport_->unsubscribe_calls();
    ASSERT_EQ(unsubs.size(), 2u);
    EXPECT_EQ(unsubs[0].subscription_id, "sub-1");
    EXPECT_EQ(unsubs[1].subscription_id, "sub-late");
}

TEST_F(SubscriptionManagerTest, TeardownWithNSubscriptions) {
    constexpr int kN = 5;
    std::vector<std::shared_ptr<SubscriptionHandle>> handles;
    for (int i = 0; i < kN; ++i) {
        auto out = subscribe_sync("dev" + std::to_string(i), {"prop.power"});
        ASSERT_TRUE(out.ok());
        handles.push_back(out.handle);
    }
    ASSERT_EQ(registry_.total_count(), static_cast<size_t>(kN));

    transport_->set_unsubscribe_fails(true);
    EXPECT_EQ(hook_.fire(), static_cast<size_t>(kN));

    EXPECT_EQ(transport_->unsubscribe_count(), static_cast<size_t>(kN));
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(manager_->tracked_count(), 0u);

    // Handles stay safe after teardown
    for (auto& h : handles) h->remove();
    EXPECT_EQ(transport_->unsubscribe_count(), static_cast<size_t>(kN));
}

TEST_F(SubscriptionManagerTest, TeardownWithNoSubscriptionsIsSafe) {
    EXPECT_EQ(hook_.fire(), 0u);
    EXPECT_EQ(hook_.fire(), 0u);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(SubscriptionManagerTest, ExplicitTeardownDrainsPartition) {
    subscribe_sync("devA", {"prop.power"});
    subscribe_sync("devB", {"prop.color"});

    // An entry owned by someone else in the shared registry
    SubscriptionDescriptor foreign;
    foreign.key = 1000000;
    foreign.device_id = "devZ";
    foreign.watched_names = {"prop.x"};
    ASSERT_EQ(registry_.insert("foreign-1", foreign), Result::kOk);

    EXPECT_EQ(manager_->teardown(), 2u);
    EXPECT_EQ(registry_.total_count(), 1u);
    EXPECT_TRUE(registry_.contains("foreign-1"));
    EXPECT_EQ(scheduler_->armed_count(), 0u);
}

TEST_F(SubscriptionManagerTest, SubscribeAfterTeardownIsRejected) {
    hook_.fire();
    auto out = subscribe_sync("devA", {"prop.power"});
    EXPECT_EQ(out.result, Result::kShuttingDown);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(SubscriptionManagerTest, TeardownDuringPendingSubscribeReleasesId) {
    transport_->set_mode(StubTransport::Mode::kQueued);
    SubscribeOutcome out;
    manager_->subscribe("devA", {"prop.power"}, [&](const SubscribeOutcome& o) { out = o; });

    hook_.fire();
    ASSERT_TRUE(transport_->complete_next_subscribe(RpcOutcome::success("sub-1")));

    EXPECT_EQ(out.result, Result::kShuttingDown);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    auto unsubs = transport_->unsubscribe_calls();
    ASSERT_EQ(unsubs.size(), 1u);
    EXPECT_EQ(unsubs[0].subscription_id, "sub-1");
}

TEST_F(SubscriptionManagerTest, TransportWithoutUnsubscribeGivesPassiveHandle) {
    transport_->set_supports_unsubscribe(false);
    auto out = subscribe_sync("devA", {"prop.power"});

    ASSERT_TRUE(out.ok());
    ASSERT_NE(out.handle, nullptr);
    EXPECT_TRUE(out.handle->is_passive());
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(hook_.pending_count(), 0u);

    out.handle->remove();
    EXPECT_EQ(transport_->unsubscribe_count(), 0u);
}

// Handles come only from the manager; outside code cannot mint the passkey
static_assert(!std::is_default_constructible<SubscriptionHandle::Passkey>::value,
              "SubscriptionHandle::Passkey must stay private to the manager");

TEST_F(SubscriptionManagerTest, HandlesAreBoundToTheirKeys) {
    auto a = subscribe_sync("devA", {"prop.power"});
    auto b = subscribe_sync("devB", {"prop.power"});
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.handle->key(), b.handle->key());

    a.handle->remove();
    EXPECT_TRUE(a.handle->removed());
    EXPECT_FALSE(b.handle->removed());
    EXPECT_EQ(registry_.total_count(), 1u);
}

TEST_F(SubscriptionManagerTest, DestroyingManagerReleasesItsSubscriptions) {
    auto out = subscribe_sync("devA", {"prop.power"});
    ASSERT_TRUE(out.ok());
    ASSERT_EQ(registry_.total_count(), 1u);

    manager_.reset();
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(index_.subscription_count(), 0u);
    ASSERT_EQ(transport_->unsubscribe_count(), 1u);
    EXPECT_EQ(transport_->unsubscribe_calls()[0].subscription_id, "sub-1");
    EXPECT_EQ(hook_.pending_count(), 0u);

    // Handle and hook are inert afterwards
    out.handle->remove();
    EXPECT_TRUE(out.handle->removed());
    EXPECT_EQ(hook_.fire(), 0u);
    EXPECT_EQ(transport_->unsubscribe_count(), 1u);

    // Nothing left to renew
    EXPECT_EQ(scheduler_->run_due(Clock::now() + Seconds(171)), 0u);
    EXPECT_EQ(transport_->subscribe_count(), 1u);
}

TEST_F(SubscriptionManagerTest, CompletionAfterManagerDestroyedReleasesId) {
    transport_->set_mode(StubTransport::Mode::kQueued);
    SubscribeOutcome out;
    manager_->subscribe("devA", {"prop.power"}, [&](const SubscribeOutcome& o) { out = o; });
    manager_.reset();

    ASSERT_TRUE(transport_->complete_next_subscribe(RpcOutcome::success("sub-9")));
    EXPECT_EQ(out.result, Result::kShuttingDown);
    EXPECT_EQ(registry_.total_count(), 0u);
    ASSERT_EQ(transport_->unsubscribe_count(), 1u);
    EXPECT_EQ(transport_->unsubscribe_calls()[0].subscription_id, "sub-9");
}

TEST_F(SubscriptionManagerTest, ManagersShareRegistryAndScheduler) {
    auto other = SubscriptionManager::create(registry_, *scheduler_, *transport_, hook_,
                                             nullptr, &index_);
    auto a = subscribe_sync("devA", {"prop.power"});
    SubscribeOutcome b;
    other->subscribe("devB", {"prop.color"}, [&](const SubscribeOutcome& o) { b = o; });

    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.handle->key(), b.handle->key());
    EXPECT_EQ(registry_.total_count(), 2u);
    EXPECT_EQ(scheduler_->armed_count(), 2u);
    EXPECT_EQ(transport_->unsubscribe_count(), 0u);

    // Each manager tears down only its own
    EXPECT_EQ(other->teardown(), 1u);
    EXPECT_TRUE(registry_.contains("sub-1"));
    EXPECT_FALSE(registry_.contains("sub-2"));
    EXPECT_TRUE(scheduler_->is_armed(a.handle->key()));
    EXPECT_FALSE(scheduler_->is_armed(b.handle->key()));
}

TEST_F(SubscriptionManagerTest, ThrowingCompletionIsContained) {
    Result r = manager_->subscribe("devA", {"prop.power"}, [](const SubscribeOutcome&) {
        throw std::runtime_error("caller bug");
    });
    EXPECT_EQ(r, Result::kOk);
    EXPECT_EQ(manager_->stats().callback_errors.load(), 1u);
    // The subscription itself was set up before the callback ran
    EXPECT_EQ(registry_.total_count(), 1u);
    EXPECT_EQ(manager_->tracked_count(), 1u);
}

TEST_F(SubscriptionManagerTest, TeardownRacingSubscribeLeavesNothingBehind) {
    std::atomic<bool> done{false};
    std::atomic<int> ok_count{0};
    std::thread subscriber([&] {
        for (int i = 0; i < 300; ++i) {
            manager_->subscribe("dev", {"prop.p" + std::to_string(i)}, [&](const SubscribeOutcome& o) {
                if (o.ok()) ok_count++;
            });
        }
        done = true;
    });
    std::thread sweeper([&] {
        while (!done.load()) manager_->teardown();
    });
    subscriber.join();
    sweeper.join();
    manager_->teardown();

    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
    EXPECT_EQ(index_.subscription_count(), 0u);
    EXPECT_EQ(manager_->tracked_count(), 0u);
    // Every issued id released exactly once
    EXPECT_EQ(transport_->unsubscribe_count(), transport_->subscribe_count());
    EXPECT_LE(ok_count.load(), 300);
}

TEST_F(SubscriptionManagerTest, DuplicateIdFromTransportIsRejected) {
    transport_->script_subscribe(RpcOutcome::success("same"));
    transport_->script_subscribe(RpcOutcome::success("same"));
    auto first = subscribe_sync("devA", {"prop.power"});
    auto second = subscribe_sync("devA", {"prop.power"});

    EXPECT_TRUE(first.ok());
    EXPECT_EQ(second.result, Result::kAlreadyExists);
    EXPECT_EQ(registry_.total_count(), 1u);
    EXPECT_EQ(transport_->unsubscribe_count(), 0u);
}

TEST_F(SubscriptionManagerTest, ConcurrentRemoveAndTeardown) {
    std::vector<std::shared_ptr<SubscriptionHandle>> handles;
    for (int i = 0; i < 50; ++i) handles.push_back(subscribe_sync("dev", {"prop.p" + std::to_string(i)}).handle);

    std::thread remover([&] { for (auto& h : handles) h->remove(); });
    std::thread teardown([&] { hook_.fire(); });
    remover.join();
    teardown.join();

    // Each subscription released exactly once
    EXPECT_EQ(transport_->unsubscribe_count(), 50u);
    EXPECT_EQ(registry_.total_count(), 0u);
    EXPECT_EQ(scheduler_->armed_count(), 0u);
}
