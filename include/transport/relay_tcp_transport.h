// =============================================================================
// FILE: include/transport/relay_tcp_transport.h
// =============================================================================
#ifndef RELAY_TCP_TRANSPORT_H
#define RELAY_TCP_TRANSPORT_H

#include "common/types.h"
#include "common/config.h"
#include "transport/rpc_transport.h"
#include "router/device_message.h"
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace device_watch {

class RelayLineParser;

// RpcTransport over a persistent TCP link to the message relay.
//
// Requests carry a numeric id and are answered by OK/ERR lines with the
// same id. Pushed MSG lines go to the message callback. A pending request
// fails with "request timeout" once relay_request_timeout passes without a
// reply, and with "connection lost" when the link drops, so every callback
// runs in bounded time. Requests issued while disconnected fail immediately.
class RelayTcpTransport : public RpcTransport {
public:
    using MessageCallback = std::function<void(DeviceMessage&&)>;

    enum class ConnectionState { kDisconnected, kConnecting, kConnected, kReconnecting };
    using StateCallback = std::function<void(ConnectionState, const std::string&)>;

    explicit RelayTcpTransport(const Config& config);
    ~RelayTcpTransport() override;

    // Both must be set before start()
    void set_message_callback(MessageCallback cb);
    void set_state_callback(StateCallback cb);

    Result start();
    void stop();

    void subscribe(const DeviceId& device_id, const NameList& names, Callback on_done) override;
    void unsubscribe(const DeviceId& device_id, const NameList& names,
                     const std::string& subscription_id, Callback on_done) override;
    bool supports_unsubscribe() const override { return supports_unsubscribe_; }
    bool is_connected() const override { return connected_.load(std::memory_order_acquire); }

    ConnectionState connection_state() const { return conn_state_.load(std::memory_order_acquire); }
    std::string endpoint() const;
    size_t pending_count() const;
    Seconds current_backoff() const;

    struct TransportStats {
        std::atomic<uint64_t> requests_sent{0};
        std::atomic<uint64_t> requests_rejected{0};
        std::atomic<uint64_t> responses_ok{0};
        std::atomic<uint64_t> responses_err{0};
        std::atomic<uint64_t> unmatched_responses{0};
        std::atomic<uint64_t> pending_failed{0};
        std::atomic<uint64_t> requests_timed_out{0};
        std::atomic<uint64_t> messages_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> connect_attempts{0};
        std::atomic<uint64_t> connect_successes{0};
        std::atomic<uint64_t> disconnect_count{0};
        std::atomic<uint64_t> heartbeat_timeouts{0};
        std::atomic<uint64_t> parse_errors{0};
    };
    const TransportStats& stats() const { return stats_; }

    RelayTcpTransport(const RelayTcpTransport&) = delete;
    RelayTcpTransport& operator=(const RelayTcpTransport&) = delete;

private:
    struct PendingRequest {
        Callback  callback;
        TimePoint sent_at;
        std::string description;
    };

    void send_request(const std::string& line, uint64_t request_id,
                      std::string description, Callback on_done);
    bool send_line(const std::string& line);
    void complete_request(uint64_t request_id, const RpcOutcome& outcome);
    void fail_all_pending(const std::string& reason);
    void expire_stale_requests();

    void reader_thread_func();
    Result connect_to_relay();
    void close_socket();
    void read_loop();
    void reconnect_with_backoff();
    void maybe_send_heartbeat();
    void check_heartbeat_timeout();
    void set_connection_state(ConnectionState state, const std::string& detail = "");

    Config config_;
    bool supports_unsubscribe_;

    int socket_fd_ = -1;
    mutable std::mutex sock_mu_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> connected_{false};
    std::atomic<ConnectionState> conn_state_{ConnectionState::kDisconnected};

    std::mutex shutdown_mu_;
    std::condition_variable shutdown_cv_;

    mutable std::mutex backoff_mu_;
    Seconds current_backoff_;

    TimePoint last_heard_;
    TimePoint last_ping_sent_;
    std::mutex heartbeat_mu_;

    std::atomic<uint64_t> next_request_id_{1};
    mutable std::mutex pending_mu_;
    std::unordered_map<uint64_t, PendingRequest> pending_;

    std::unique_ptr<RelayLineParser> parser_;
    MessageCallback message_callback_;
    StateCallback state_callback_;
    TransportStats stats_;
    std::vector<char> recv_buffer_;
};

inline const char* connection_state_to_string(RelayTcpTransport::ConnectionState s) {
    switch (s) {
        case RelayTcpTransport::ConnectionState::kDisconnected: return "disconnected";
        case RelayTcpTransport::ConnectionState::kConnecting:   return "connecting";
        case RelayTcpTransport::ConnectionState::kConnected:    return "connected";
        case RelayTcpTransport::ConnectionState::kReconnecting: return "reconnecting";
        default:                                                return "unknown";
    }
}

} // namespace device_watch
#endif // RELAY_TCP_TRANSPORT_H
