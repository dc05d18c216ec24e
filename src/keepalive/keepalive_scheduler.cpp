// =============================================================================
// FILE: src/keepalive/keepalive_scheduler.cpp
// =============================================================================
#include "keepalive/keepalive_scheduler.h"
#include "subscription/subscription_registry.h"
#include "transport/rpc_transport.h"
#include "common/slow_call_logger.h"
#include "common/logger.h"
#include <algorithm>
#include <memory>
#include <vector>

namespace device_watch {

KeepaliveScheduler::KeepaliveScheduler(const Config& config, SubscriptionRegistry& registry,
                                       RpcTransport& transport, SlowCallLogger* slow_logger)
    : interval_(config.keepalive_interval)
    , tick_resolution_(config.keepalive_tick_resolution)
    , registry_(registry), transport_(transport), slow_logger_(slow_logger)
{
    if (interval_ <= Duration::zero()) {
        LOG_WARN("KeepaliveScheduler: non-positive interval, using %ds",
                 Config::kDefaultKeepaliveIntervalSec);
        interval_ = Seconds(Config::kDefaultKeepaliveIntervalSec);
    }
    if (tick_resolution_ <= Millisecs::zero()) tick_resolution_ = Millisecs(1000);
}

KeepaliveScheduler::~KeepaliveScheduler() { stop(); }

Result KeepaliveScheduler::start() {
    if (running_.load()) return Result::kAlreadyExists;
    stop_requested_.store(false); running_.store(true);
    thread_ = std::thread(&KeepaliveScheduler::run, this);
    LOG_INFO("KeepaliveScheduler: started (interval=%lds)",
             static_cast<long>(std::chrono::duration_cast<Seconds>(interval_).count()));
    return Result::kOk;
}

void KeepaliveScheduler::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(mu_); stop_requested_.store(true); }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
    LOG_INFO("KeepaliveScheduler: stopped (%zu timers armed)", armed_count());
}

void KeepaliveScheduler::run() {
    while (!stop_requested_.load()) {
        {
            std::unique_lock<std::mutex> lk(mu_);
            TimePoint wake = Clock::now() + tick_resolution_;
            wake = std::min(wake, next_due());
            cv_.wait_until(lk, wake, [this]{ return stop_requested_.load() || wake_requested_; });
            wake_requested_ = false;
        }
        if (stop_requested_.load()) break;
        run_due(Clock::now());
    }
}

void KeepaliveScheduler::arm(SubscriptionKey key) {
    arm_at(key, Clock::now() + interval_);
}

void KeepaliveScheduler::arm_at(SubscriptionKey key, TimePoint due) {
    {
        std::lock_guard<std::mutex> lk(timers_mu_);
        timers_[key] = due;
    }
    // The run loop may be sleeping until a later due time
    { std::lock_guard<std::mutex> lk(mu_); wake_requested_ = true; }
    cv_.notify_one();
}

bool KeepaliveScheduler::disarm(SubscriptionKey key) {
    std::lock_guard<std::mutex> lk(timers_mu_);
    return timers_.erase(key) > 0;
}

bool KeepaliveScheduler::is_armed(SubscriptionKey key) const {
    std::lock_guard<std::mutex> lk(timers_mu_);
    return timers_.count(key) > 0;
}

size_t KeepaliveScheduler::armed_count() const {
    std::lock_guard<std::mutex> lk(timers_mu_);
    return timers_.size();
}

TimePoint KeepaliveScheduler::next_due() const {
    std::lock_guard<std::mutex> lk(timers_mu_);
    TimePoint earliest = TimePoint::max();
    for (const auto& [key, due] : timers_) earliest = std::min(earliest, due);
    return earliest;
}

size_t KeepaliveScheduler::run_due(TimePoint now) {
    std::vector<SubscriptionKey> due_keys;
    {
        std::lock_guard<std::mutex> lk(timers_mu_);
        for (auto& [key, due] : timers_) {
            if (due <= now) {
                due_keys.push_back(key);
                due = now + interval_;
            }
        }
    }
    if (due_keys.empty()) return 0;
    stats_.ticks.fetch_add(1);

    size_t issued = 0;
    for (SubscriptionKey key : due_keys) {
        if (fire(key)) issued++;
    }
    return issued;
}

bool KeepaliveScheduler::fire(SubscriptionKey key) {
    SubscriptionDescriptor snap;
    Result r = registry_.begin_renewal(key, snap);
    if (r == Result::kNotFound) {
        // Removed just before the tick
        disarm(key);
        stats_.stale_timers.fetch_add(1);
        LOG_DEBUG("Keepalive: stale timer key=%lu dropped", static_cast<unsigned long>(key));
        return false;
    }
    if (r == Result::kAlreadyExists) {
        stats_.skipped_in_flight.fetch_add(1);
        LOG_DEBUG("Keepalive: renewal still outstanding for id=%s, tick skipped",
                  snap.current_id.c_str());
        return false;
    }

    stats_.renewals_issued.fetch_add(1);
    LOG_TRACE("Keepalive: renewing id=%s device=%s names=%s", snap.current_id.c_str(),
              snap.device_id.c_str(), join_names(snap.watched_names).c_str());

    std::shared_ptr<SlowCallLogger::Timer> call_timer;
    if (slow_logger_) {
        call_timer = std::make_shared<SlowCallLogger::Timer>(
            *slow_logger_, "RENEW", snap.device_id, "id=" + snap.current_id);
    }

    TimePoint fired_at = Clock::now();
    std::string old_id = snap.current_id;
    DeviceId device_id = snap.device_id;
    NameList names = snap.watched_names;
    transport_.subscribe(snap.device_id, snap.watched_names,
        [this, key, old_id, device_id, names, fired_at, call_timer](const RpcOutcome& out) {
            if (call_timer) call_timer->finish();
            on_renewal_done(key, old_id, device_id, names, fired_at, out.ok, out.value);
        });
    return true;
}

void KeepaliveScheduler::on_renewal_done(SubscriptionKey key, const std::string& old_id,
                                         const DeviceId& device_id, const NameList& names,
                                         TimePoint fired_at, bool ok, const std::string& value) {
    Result r = registry_.complete_renewal(key, old_id, ok, value);

    if (r == Result::kNotFound) {
        // Removed while the call was outstanding; never re-insert
        stats_.discarded_results.fetch_add(1);
        disarm(key);
        if (ok && !value.empty() && transport_.supports_unsubscribe()) {
            stats_.orphans_released.fetch_add(1);
            LOG_DEBUG("Keepalive: late renewal id=%s for removed subscription, releasing",
                      value.c_str());
            transport_.unsubscribe(device_id, names, value, [value](const RpcOutcome& out) {
                if (!out.ok) LOG_DEBUG("Keepalive: orphan release of %s failed: %s",
                                       value.c_str(), out.value.c_str());
            });
        }
        return;
    }

    if (ok && !value.empty() && r == Result::kOk) {
        stats_.renewals_ok.fetch_add(1);
        if (value != old_id)
            LOG_DEBUG("Keepalive: renewed device=%s %s -> %s", device_id.c_str(),
                      old_id.c_str(), value.c_str());
    } else {
        // Not surfaced to callers; retried at the next interval
        stats_.renewals_failed.fetch_add(1);
        LOG_DEBUG("Keepalive: renewal failed device=%s id=%s result=%s payload=%s",
                  device_id.c_str(), old_id.c_str(), result_to_string(r),
                  ok ? "<empty id>" : value.c_str());
    }

    // Re-arm from completion, unless removed meanwhile
    TimePoint base = std::max(fired_at, Clock::now());
    {
        std::lock_guard<std::mutex> lk(timers_mu_);
        auto it = timers_.find(key);
        if (it != timers_.end()) it->second = std::max(it->second, base + interval_);
    }
}

} // namespace device_watch
