// =============================================================================
// FILE: include/subscription/subscription_manager.h
// =============================================================================
#ifndef SUBSCRIPTION_MANAGER_H
#define SUBSCRIPTION_MANAGER_H

#include "common/types.h"
#include "common/teardown_hook.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace device_watch {
class SubscriptionRegistry;
class KeepaliveScheduler;
class RpcTransport;
class SlowCallLogger;
class WatchedNameIndex;
class SubscriptionManager;

// Caller-held capability for one subscription.
class SubscriptionHandle {
public:
    // Only SubscriptionManager can construct one
    class Passkey {
        friend class SubscriptionManager;
        explicit Passkey() {}
    };

    SubscriptionHandle(Passkey, std::weak_ptr<SubscriptionManager> manager, SubscriptionKey key,
                       DeviceId device_id, std::string initial_id, bool passive);

    // Stops renewal, releases the server-side registration (best effort) and
    // drops local tracking. Safe to call any number of times, including
    // after teardown. Once the manager is destroyed this is a no-op: the
    // manager's destructor has already released everything it tracked.
    // Never throws.
    void remove();

    SubscriptionKey key() const { return key_; }
    const DeviceId& device_id() const { return device_id_; }
    const std::string& initial_id() const { return initial_id_; }

    // Passive handles come from transports that keep their own
    // registrations alive; remove() does nothing for them.
    bool is_passive() const { return passive_; }
    bool removed() const { return removed_.load(); }

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

private:
    std::weak_ptr<SubscriptionManager> manager_;
    SubscriptionKey key_;
    DeviceId device_id_;
    std::string initial_id_;
    bool passive_;
    std::atomic<bool> removed_{false};
};

struct SubscribeOutcome {
    Result result = Result::kError;
    std::string failure_payload;                   // transport payload on kSubscriptionFailed
    std::shared_ptr<SubscriptionHandle> handle;    // set on kOk only

    bool ok() const { return result == Result::kOk; }
};

// Entry point for callers: subscribe, remove, and teardown binding.
//
// Every successful subscription is recorded in the registry, armed in the
// keepalive scheduler and bound to the teardown hook. Firing the hook (or
// calling teardown()) removes every subscription this manager created.
// Destroying the manager does the same.
//
// Keys come from the registry, so several managers may share one registry
// and scheduler.
class SubscriptionManager : public std::enable_shared_from_this<SubscriptionManager> {
    struct Passkey { explicit Passkey() {} };

public:
    using Completion = std::function<void(const SubscribeOutcome&)>;

    static std::shared_ptr<SubscriptionManager> create(
        SubscriptionRegistry& registry, KeepaliveScheduler& scheduler,
        RpcTransport& transport, TeardownHook& teardown_hook,
        SlowCallLogger* slow_logger = nullptr, WatchedNameIndex* name_index = nullptr);

    SubscriptionManager(Passkey, SubscriptionRegistry& registry, KeepaliveScheduler& scheduler,
                        RpcTransport& transport, TeardownHook& teardown_hook,
                        SlowCallLogger* slow_logger, WatchedNameIndex* name_index);
    ~SubscriptionManager();

    // `on_done` runs exactly once, synchronously for argument and shutdown
    // rejections, otherwise from the transport's completion.
    // Return value is kOk when the transport call was issued, or the
    // synchronous rejection reason.
    Result subscribe(const DeviceId& device_id, const NameList& names, Completion on_done);

    // Cleanup path shared by handles and teardown. Returns false if the
    // subscription was already gone.
    bool remove_subscription(SubscriptionKey key);

    // Removes everything this manager still tracks. Returns the count.
    size_t teardown();

    size_t tracked_count() const;

    struct ManagerStats {
        std::atomic<uint64_t> subscribe_requests{0};
        std::atomic<uint64_t> subscribe_ok{0};
        std::atomic<uint64_t> subscribe_failed{0};
        std::atomic<uint64_t> invalid_argument{0};
        std::atomic<uint64_t> rejected_shutdown{0};
        std::atomic<uint64_t> passive_handles{0};
        std::atomic<uint64_t> removals{0};
        std::atomic<uint64_t> unsubscribes_failed{0};
        std::atomic<uint64_t> callback_errors{0};
    };
    const ManagerStats& stats() const { return stats_; }

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

private:
    void on_subscribed(const DeviceId& device_id, const NameList& names,
                       bool ok, const std::string& value, const Completion& on_done);

    // Disarm, drop from registry and index, release the id. `self` is empty
    // when called from the destructor.
    bool cleanup(SubscriptionKey key, const std::weak_ptr<SubscriptionManager>& self);
    void release_id(const DeviceId& device_id, const NameList& names, const std::string& id,
                    const std::weak_ptr<SubscriptionManager>& self);

    // Invokes the caller's completion; exceptions it throws are logged and
    // counted in `stats` (may be null once the manager is gone).
    static void complete(const Completion& on_done, ManagerStats* stats, Result r,
                         std::string payload = "",
                         std::shared_ptr<SubscriptionHandle> handle = nullptr);

    SubscriptionRegistry& registry_;
    KeepaliveScheduler& scheduler_;
    RpcTransport& transport_;
    TeardownHook& teardown_hook_;
    SlowCallLogger* slow_logger_;
    WatchedNameIndex* name_index_;

    // Keys created by this manager -> their teardown registration
    mutable std::mutex mu_;
    std::unordered_map<SubscriptionKey, TeardownHook::Token> tracked_;

    ManagerStats stats_;
};

} // namespace device_watch
#endif // SUBSCRIPTION_MANAGER_H
