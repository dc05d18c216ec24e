// =============================================================================
// FILE: src/subscription/subscription_manager.cpp
// =============================================================================
#include "subscription/subscription_manager.h"
#include "subscription/subscription_registry.h"
#include "subscription/watched_name_index.h"
#include "keepalive/keepalive_scheduler.h"
#include "transport/rpc_transport.h"
#include "common/slow_call_logger.h"
#include "common/logger.h"
#include <exception>
#include <vector>

namespace device_watch {

// --- SubscriptionHandle ------------------------------------------------------

SubscriptionHandle::SubscriptionHandle(Passkey, std::weak_ptr<SubscriptionManager> manager,
                                       SubscriptionKey key, DeviceId device_id,
                                       std::string initial_id, bool passive)
    : manager_(std::move(manager)), key_(key), device_id_(std::move(device_id))
    , initial_id_(std::move(initial_id)), passive_(passive)
{}

void SubscriptionHandle::remove() {
    if (removed_.exchange(true)) return;
    if (passive_) return;
    if (auto mgr = manager_.lock()) mgr->remove_subscription(key_);
}

// --- SubscriptionManager -----------------------------------------------------

std::shared_ptr<SubscriptionManager> SubscriptionManager::create(
    SubscriptionRegistry& registry, KeepaliveScheduler& scheduler,
    RpcTransport& transport, TeardownHook& teardown_hook,
    SlowCallLogger* slow_logger, WatchedNameIndex* name_index) {
    return std::make_shared<SubscriptionManager>(Passkey(), registry, scheduler, transport,
                                                 teardown_hook, slow_logger, name_index);
}

SubscriptionManager::SubscriptionManager(Passkey, SubscriptionRegistry& registry,
                                         KeepaliveScheduler& scheduler, RpcTransport& transport,
                                         TeardownHook& teardown_hook, SlowCallLogger* slow_logger,
                                         WatchedNameIndex* name_index)
    : registry_(registry), scheduler_(scheduler), transport_(transport)
    , teardown_hook_(teardown_hook), slow_logger_(slow_logger), name_index_(name_index)
{}

SubscriptionManager::~SubscriptionManager() {
    std::vector<SubscriptionKey> keys;
    {
        std::lock_guard<std::mutex> lk(mu_);
        keys.reserve(tracked_.size());
        for (const auto& [key, token] : tracked_) keys.push_back(key);
    }
    size_t removed = 0;
    for (SubscriptionKey key : keys) {
        if (cleanup(key, std::weak_ptr<SubscriptionManager>())) removed++;
    }
    if (removed > 0)
        LOG_INFO("SubscriptionManager: released %zu subscriptions on destruction", removed);
}

void SubscriptionManager::complete(const Completion& on_done, ManagerStats* stats, Result r,
                                   std::string payload, std::shared_ptr<SubscriptionHandle> handle) {
    if (!on_done) return;
    SubscribeOutcome out;
    out.result = r;
    out.failure_payload = std::move(payload);
    out.handle = std::move(handle);
    try {
        on_done(out);
    } catch (const std::exception& e) {
        LOG_ERROR("subscribe completion threw: %s", e.what());
        if (stats) stats->callback_errors.fetch_add(1);
    }
}

Result SubscriptionManager::subscribe(const DeviceId& device_id, const NameList& names,
                                      Completion on_done) {
    stats_.subscribe_requests.fetch_add(1);

    bool bad_name = false;
    for (const auto& n : names) {
        if (n.find_first_not_of(" \t") == std::string::npos) { bad_name = true; break; }
    }
    if (names.empty() || bad_name || device_id.empty()) {
        stats_.invalid_argument.fetch_add(1);
        LOG_WARN("subscribe rejected: device='%s' names=[%s]", device_id.c_str(),
                 join_names(names).c_str());
        complete(on_done, &stats_, Result::kInvalidArgument);
        return Result::kInvalidArgument;
    }

    if (teardown_hook_.fired()) {
        stats_.rejected_shutdown.fetch_add(1);
        LOG_DEBUG("subscribe rejected after teardown: device=%s", device_id.c_str());
        complete(on_done, &stats_, Result::kShuttingDown);
        return Result::kShuttingDown;
    }

    std::shared_ptr<SlowCallLogger::Timer> call_timer;
    if (slow_logger_) {
        call_timer = std::make_shared<SlowCallLogger::Timer>(
            *slow_logger_, "SUBSCRIBE", device_id, "names=" + join_names(names));
    }

    std::weak_ptr<SubscriptionManager> weak = weak_from_this();
    RpcTransport* transport = &transport_;
    transport_.subscribe(device_id, names,
        [weak, transport, device_id, names, on_done, call_timer](const RpcOutcome& out) {
            if (call_timer) call_timer->finish();
            auto self = weak.lock();
            if (!self) {
                // Manager is gone; nothing will renew this id, so give it back
                if (out.ok && !out.value.empty() && transport->supports_unsubscribe()) {
                    std::string id = out.value;
                    transport->unsubscribe(device_id, names, id, [id](const RpcOutcome& r) {
                        if (!r.ok) LOG_DEBUG("unsubscribe of id=%s failed: %s", id.c_str(), r.value.c_str());
                    });
                }
                complete(on_done, nullptr, Result::kShuttingDown);
                return;
            }
            self->on_subscribed(device_id, names, out.ok, out.value, on_done);
        });
    return Result::kOk;
}

void SubscriptionManager::on_subscribed(const DeviceId& device_id, const NameList& names,
                                        bool ok, const std::string& value,
                                        const Completion& on_done) {
    if (!ok || value.empty()) {
        stats_.subscribe_failed.fetch_add(1);
        std::string payload = ok ? "empty subscription id" : value;
        LOG_WARN("subscribe failed: device=%s names=[%s] payload=%s", device_id.c_str(),
                 join_names(names).c_str(), payload.c_str());
        complete(on_done, &stats_, Result::kSubscriptionFailed, payload);
        return;
    }

    std::weak_ptr<SubscriptionManager> weak = weak_from_this();

    if (teardown_hook_.fired()) {
        // Teardown ran while the call was outstanding
        stats_.rejected_shutdown.fetch_add(1);
        release_id(device_id, names, value, weak);
        complete(on_done, &stats_, Result::kShuttingDown);
        return;
    }

    SubscriptionKey key = registry_.next_key();

    if (!transport_.supports_unsubscribe()) {
        stats_.passive_handles.fetch_add(1);
        stats_.subscribe_ok.fetch_add(1);
        LOG_INFO("subscribed device=%s id=%s (transport-managed, untracked)",
                 device_id.c_str(), value.c_str());
        complete(on_done, &stats_, Result::kOk, "", std::make_shared<SubscriptionHandle>(
            SubscriptionHandle::Passkey(), weak, key, device_id, value, true));
        return;
    }

    SubscriptionDescriptor desc;
    desc.key = key;
    desc.device_id = device_id;
    desc.watched_names = names;
    desc.created_at = Clock::now();
    desc.last_renewed_at = desc.created_at;

    Result r = registry_.insert(value, desc);
    if (r != Result::kOk) {
        // The id already belongs to a live subscription; leave it alone
        stats_.subscribe_failed.fetch_add(1);
        LOG_ERROR("subscribe: registry insert of id=%s failed: %s", value.c_str(), result_to_string(r));
        complete(on_done, &stats_, r, "duplicate subscription id " + value);
        return;
    }

    // Everything cleanup() undoes must be in place before the key becomes
    // visible to teardown()
    scheduler_.arm(key);
    if (name_index_) name_index_->add(key, device_id, names);
    {
        std::lock_guard<std::mutex> lk(mu_);
        tracked_[key] = TeardownHook::kInvalidToken;
    }

    TeardownHook::Token token = teardown_hook_.register_action([weak, key]() {
        if (auto self = weak.lock()) self->remove_subscription(key);
    });

    if (token == TeardownHook::kInvalidToken) {
        // Hook fired between the check above and registration
        remove_subscription(key);
        stats_.rejected_shutdown.fetch_add(1);
        complete(on_done, &stats_, Result::kShuttingDown);
        return;
    }

    bool still_tracked;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tracked_.find(key);
        still_tracked = (it != tracked_.end());
        if (still_tracked) it->second = token;
    }
    if (!still_tracked) {
        // A concurrent teardown() already removed and released it
        teardown_hook_.unregister(token);
        stats_.rejected_shutdown.fetch_add(1);
        LOG_DEBUG("subscribe: key=%lu torn down before completion", static_cast<unsigned long>(key));
        complete(on_done, &stats_, Result::kShuttingDown);
        return;
    }

    stats_.subscribe_ok.fetch_add(1);
    LOG_INFO("subscribed device=%s id=%s key=%lu names=[%s]", device_id.c_str(), value.c_str(),
             static_cast<unsigned long>(key), join_names(names).c_str());
    complete(on_done, &stats_, Result::kOk, "", std::make_shared<SubscriptionHandle>(
        SubscriptionHandle::Passkey(), weak, key, device_id, value, false));
}

bool SubscriptionManager::remove_subscription(SubscriptionKey key) {
    return cleanup(key, weak_from_this());
}

bool SubscriptionManager::cleanup(SubscriptionKey key, const std::weak_ptr<SubscriptionManager>& self) {
    // Disarm first so no new renewal starts for this key
    scheduler_.disarm(key);

    SubscriptionDescriptor desc;
    bool present = registry_.remove_key(key, &desc);

    TeardownHook::Token token = TeardownHook::kInvalidToken;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tracked_.find(key);
        if (it != tracked_.end()) {
            token = it->second;
            tracked_.erase(it);
        }
    }
    teardown_hook_.unregister(token);
    if (name_index_) name_index_->remove(key);

    if (!present) return false;

    stats_.removals.fetch_add(1);
    LOG_INFO("unsubscribing device=%s id=%s", desc.device_id.c_str(), desc.current_id.c_str());
    release_id(desc.device_id, desc.watched_names, desc.current_id, self);
    return true;
}

void SubscriptionManager::release_id(const DeviceId& device_id, const NameList& names,
                                     const std::string& id,
                                     const std::weak_ptr<SubscriptionManager>& self) {
    std::shared_ptr<SlowCallLogger::Timer> call_timer;
    if (slow_logger_) {
        call_timer = std::make_shared<SlowCallLogger::Timer>(
            *slow_logger_, "UNSUBSCRIBE", device_id, "id=" + id);
    }
    transport_.unsubscribe(device_id, names, id,
        [weak = self, id, call_timer](const RpcOutcome& out) {
            if (call_timer) call_timer->finish();
            if (out.ok) return;
            // Local state is already gone; the result is only recorded
            LOG_DEBUG("unsubscribe of id=%s failed: %s", id.c_str(), out.value.c_str());
            if (auto mgr = weak.lock()) mgr->stats_.unsubscribes_failed.fetch_add(1);
        });
}

size_t SubscriptionManager::teardown() {
    std::vector<SubscriptionKey> keys;
    {
        std::lock_guard<std::mutex> lk(mu_);
        keys.reserve(tracked_.size());
        for (const auto& [key, token] : tracked_) keys.push_back(key);
    }
    size_t removed = 0;
    for (SubscriptionKey key : keys) {
        if (remove_subscription(key)) removed++;
    }
    LOG_INFO("SubscriptionManager: teardown removed %zu subscriptions", removed);
    return removed;
}

size_t SubscriptionManager::tracked_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return tracked_.size();
}

} // namespace device_watch
