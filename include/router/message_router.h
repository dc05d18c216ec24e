// =============================================================================
// FILE: include/router/message_router.h
// =============================================================================
#ifndef MESSAGE_ROUTER_H
#define MESSAGE_ROUTER_H

#include "common/types.h"
#include "common/config.h"
#include "router/device_message.h"
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <queue>
#include <vector>

namespace device_watch {

class WatchedNameIndex;

// Receives the watched subset of a device message and the subscriptions
// that asked for it. Runs on the router thread.
using MessageListener = std::function<void(const DeviceId& device_id,
                                           const std::map<std::string, std::string>& values,
                                           const std::vector<SubscriptionKey>& keys)>;

class MessageRouter {
public:
    MessageRouter(const Config& config, const WatchedNameIndex& index);
    ~MessageRouter();

    Result start();
    void stop();

    // Must be set before start()
    void set_listener(MessageListener listener) { listener_ = std::move(listener); }

    // Called from the transport reader thread
    void on_device_message(DeviceMessage&& message);
    void on_connection_state_changed(bool connected, const std::string& detail);

    // Routes everything queued on the calling thread. Only valid while the
    // router thread is not running. Returns the number of messages handled.
    size_t drain_pending();

    struct RouterStats {
        std::atomic<uint64_t> messages_received{0};
        std::atomic<uint64_t> messages_delivered{0};
        std::atomic<uint64_t> messages_dropped{0};
        std::atomic<uint64_t> unwatched{0};
        std::atomic<uint64_t> listener_errors{0};
        std::atomic<uint64_t> queue_depth{0};
    };
    const RouterStats& stats() const { return stats_; }

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

private:
    void router_thread_func();
    void route(const DeviceMessage& message);

    size_t max_pending_;
    const WatchedNameIndex& index_;
    MessageListener listener_;

    std::thread router_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    mutable std::mutex queue_mu_;
    std::condition_variable queue_cv_;
    std::queue<DeviceMessage> message_queue_;
    RouterStats stats_;
};

} // namespace device_watch
#endif // MESSAGE_ROUTER_H
