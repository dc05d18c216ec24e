// =============================================================================
// FILE: src/router/message_router.cpp
// =============================================================================
#include "router/message_router.h"
#include "subscription/watched_name_index.h"
#include "common/logger.h"
#include <exception>
#include <algorithm>

namespace device_watch {

std::atomic<uint64_t> DeviceMessage::id_counter_{1};

uint64_t DeviceMessage::next_id() {
    return id_counter_.fetch_add(1, std::memory_order_relaxed);
}

MessageRouter::MessageRouter(const Config& config, const WatchedNameIndex& index)
    : max_pending_(config.router_max_pending_messages), index_(index)
{}

MessageRouter::~MessageRouter() { stop(); }

Result MessageRouter::start() {
    if (running_.load(std::memory_order_acquire)) return Result::kAlreadyExists;
    stop_requested_.store(false);
    running_.store(true);
    router_thread_ = std::thread(&MessageRouter::router_thread_func, this);
    LOG_INFO("MessageRouter started");
    return Result::kOk;
}

void MessageRouter::stop() {
    if (!running_.load(std::memory_order_acquire)) return;
    {
        std::lock_guard<std::mutex> lk(queue_mu_);
        stop_requested_.store(true);
    }
    queue_cv_.notify_one();
    if (router_thread_.joinable()) router_thread_.join();
    running_.store(false);
    LOG_INFO("MessageRouter stopped");
}

void MessageRouter::on_device_message(DeviceMessage&& message) {
    stats_.messages_received.fetch_add(1, std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lk(queue_mu_);
        if (message_queue_.size() >= max_pending_) {
            stats_.messages_dropped.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("MessageRouter: queue full, dropping message from %s",
                     message.device_id.c_str());
            return;
        }
        message_queue_.push(std::move(message));
        stats_.queue_depth.store(message_queue_.size(), std::memory_order_relaxed);
    }
    queue_cv_.notify_one();
}

void MessageRouter::on_connection_state_changed(bool connected, const std::string& detail) {
    LOG_INFO("MessageRouter: relay %s (%s)", connected ? "connected" : "disconnected", detail.c_str());
}

size_t MessageRouter::drain_pending() {
    if (running_.load(std::memory_order_acquire)) return 0;

    size_t handled = 0;
    while (true) {
        DeviceMessage message;
        {
            std::lock_guard<std::mutex> lk(queue_mu_);
            if (message_queue_.empty()) break;
            message = std::move(message_queue_.front());
            message_queue_.pop();
            stats_.queue_depth.store(message_queue_.size(), std::memory_order_relaxed);
        }
        route(message);
        handled++;
    }
    return handled;
}

void MessageRouter::router_thread_func() {
    LOG_INFO("MessageRouter: thread started");

    while (!stop_requested_.load(std::memory_order_acquire)) {
        DeviceMessage message;
        {
            std::unique_lock<std::mutex> lk(queue_mu_);
            queue_cv_.wait(lk, [this] {
                return !message_queue_.empty() || stop_requested_.load(std::memory_order_acquire);
            });
            if (stop_requested_.load() && message_queue_.empty()) break;
            if (message_queue_.empty()) continue;

            message = std::move(message_queue_.front());
            message_queue_.pop();
            stats_.queue_depth.store(message_queue_.size(), std::memory_order_relaxed);
        }

        route(message);
    }

    LOG_INFO("MessageRouter: thread exiting");
}

void MessageRouter::route(const DeviceMessage& message) {
    if (!message.is_valid) return;

    std::map<std::string, std::string> watched;
    std::vector<SubscriptionKey> keys;
    for (const auto& [name, value] : message.values) {
        auto matched = index_.lookup(message.device_id, name);
        if (matched.empty()) continue;
        watched.emplace(name, value);
        for (SubscriptionKey k : matched)
            if (std::find(keys.begin(), keys.end(), k) == keys.end()) keys.push_back(k);
    }

    if (watched.empty()) {
        stats_.unwatched.fetch_add(1, std::memory_order_relaxed);
        LOG_TRACE("MessageRouter: nothing watches %zu names from %s",
                  message.values.size(), message.device_id.c_str());
        return;
    }

    LOG_DEBUG("MessageRouter: %zu values from %s to %zu subscriptions",
              watched.size(), message.device_id.c_str(), keys.size());

    if (!listener_) return;
    try {
        listener_(message.device_id, watched, keys);
        stats_.messages_delivered.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        stats_.listener_errors.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("MessageRouter: listener threw for device %s: %s",
                  message.device_id.c_str(), e.what());
    }
}

} // namespace device_watch
