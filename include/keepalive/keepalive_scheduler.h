// =============================================================================
// FILE: include/keepalive/keepalive_scheduler.h
// =============================================================================
#ifndef KEEPALIVE_SCHEDULER_H
#define KEEPALIVE_SCHEDULER_H

#include "common/types.h"
#include "common/config.h"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace device_watch {
class SubscriptionRegistry;
class RpcTransport;
class SlowCallLogger;

// One renewal timer per logical subscription.
//
// A timer that comes due is re-armed to `now + interval` before its renewal
// is issued, so timers never stack. If the previous renewal for the same
// subscription is still outstanding the tick is skipped. When a renewal
// completes the timer is re-armed again from the completion time.
//
// run_due() does all the work and can be driven by tests with synthetic
// time; the background thread only calls run_due(Clock::now()).
//
// Transport callbacks capture `this`: stop the transport before destroying
// the scheduler.
class KeepaliveScheduler {
public:
    KeepaliveScheduler(const Config& config, SubscriptionRegistry& registry,
                       RpcTransport& transport, SlowCallLogger* slow_logger = nullptr);
    ~KeepaliveScheduler();

    Result start();
    void stop();
    bool is_running() const { return running_.load(); }

    // First renewal comes due one interval from now
    void arm(SubscriptionKey key);
    void arm_at(SubscriptionKey key, TimePoint due);
    // Returns false if the key was not armed
    bool disarm(SubscriptionKey key);
    bool is_armed(SubscriptionKey key) const;
    size_t armed_count() const;
    // Earliest due time, or TimePoint::max() when nothing is armed
    TimePoint next_due() const;

    // Fires every renewal due at `now`. Returns the number of renewal calls issued.
    size_t run_due(TimePoint now);

    Duration interval() const { return interval_; }

    struct SchedulerStats {
        std::atomic<uint64_t> ticks{0};
        std::atomic<uint64_t> renewals_issued{0};
        std::atomic<uint64_t> renewals_ok{0};
        std::atomic<uint64_t> renewals_failed{0};
        std::atomic<uint64_t> skipped_in_flight{0};
        std::atomic<uint64_t> stale_timers{0};
        std::atomic<uint64_t> discarded_results{0};
        std::atomic<uint64_t> orphans_released{0};
    };
    const SchedulerStats& stats() const { return stats_; }

    KeepaliveScheduler(const KeepaliveScheduler&) = delete;
    KeepaliveScheduler& operator=(const KeepaliveScheduler&) = delete;

private:
    void run();
    // false when nothing was issued (stale or already in flight)
    bool fire(SubscriptionKey key);
    void on_renewal_done(SubscriptionKey key, const std::string& old_id,
                         const DeviceId& device_id, const NameList& names,
                         TimePoint fired_at, bool ok, const std::string& value);

    Duration interval_;
    Millisecs tick_resolution_;
    SubscriptionRegistry& registry_;
    RpcTransport& transport_;
    SlowCallLogger* slow_logger_;

    mutable std::mutex timers_mu_;
    std::map<SubscriptionKey, TimePoint> timers_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    bool wake_requested_ = false;   // guarded by mu_; set when a timer is (re)armed
    SchedulerStats stats_;
};

} // namespace device_watch
#endif // KEEPALIVE_SCHEDULER_H
