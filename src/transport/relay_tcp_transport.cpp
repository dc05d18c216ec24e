// =============================================================================
// FILE: src/transport/relay_tcp_transport.cpp
// =============================================================================
#include "transport/relay_tcp_transport.h"
#include "transport/relay_line_parser.h"
#include "common/logger.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace device_watch {

RelayTcpTransport::RelayTcpTransport(const Config& config)
    : config_(config)
    , supports_unsubscribe_(config.relay_supports_unsubscribe)
    , current_backoff_(config.relay_reconnect_interval)
    , parser_(std::make_unique<RelayLineParser>())
    , recv_buffer_(std::max<size_t>(config.relay_recv_buffer_size, 1024), '\0')
{}

RelayTcpTransport::~RelayTcpTransport() { stop(); }

void RelayTcpTransport::set_message_callback(MessageCallback cb) { message_callback_ = std::move(cb); }
void RelayTcpTransport::set_state_callback(StateCallback cb) { state_callback_ = std::move(cb); }

std::string RelayTcpTransport::endpoint() const {
    return config_.relay_host + ":" + std::to_string(config_.relay_port);
}

size_t RelayTcpTransport::pending_count() const {
    std::lock_guard<std::mutex> lk(pending_mu_);
    return pending_.size();
}

Seconds RelayTcpTransport::current_backoff() const {
    std::lock_guard<std::mutex> lk(backoff_mu_);
    return current_backoff_;
}

Result RelayTcpTransport::start() {
    if (running_.load(std::memory_order_acquire)) return Result::kAlreadyExists;
    if (config_.relay_host.empty() || config_.relay_port == 0) return Result::kInvalidArgument;
    stop_requested_.store(false); running_.store(true);
    reader_thread_ = std::thread(&RelayTcpTransport::reader_thread_func, this);
    LOG_INFO("RelayTcpTransport started (relay=%s)", endpoint().c_str());
    return Result::kOk;
}

void RelayTcpTransport::stop() {
    if (!running_.load(std::memory_order_acquire)) return;
    stop_requested_.store(true);
    { std::lock_guard<std::mutex> lk(shutdown_mu_); }
    shutdown_cv_.notify_all();
    close_socket();
    if (reader_thread_.joinable()) reader_thread_.join();
    running_.store(false);
    fail_all_pending("transport stopped");
    LOG_INFO("RelayTcpTransport stopped");
}

void RelayTcpTransport::set_connection_state(ConnectionState state, const std::string& detail) {
    conn_state_.store(state);
    connected_.store(state == ConnectionState::kConnected);
    if (state_callback_) state_callback_(state, detail);
}

// --- Requests ----------------------------------------------------------------

void RelayTcpTransport::subscribe(const DeviceId& device_id, const NameList& names,
                                  Callback on_done) {
    bool names_ok = !names.empty();
    for (const auto& n : names) names_ok = names_ok && RelayLineParser::is_wire_safe(n);
    if (!RelayLineParser::is_wire_safe(device_id) || !names_ok) {
        stats_.requests_rejected.fetch_add(1);
        on_done(RpcOutcome::failure("invalid device id or name"));
        return;
    }
    uint64_t req = next_request_id_.fetch_add(1);
    send_request(RelayLineParser::encode_subscribe(req, device_id, names), req,
                 "SUB " + device_id, std::move(on_done));
}

void RelayTcpTransport::unsubscribe(const DeviceId& device_id, const NameList& names,
                                    const std::string& subscription_id, Callback on_done) {
    bool names_ok = !names.empty();
    for (const auto& n : names) names_ok = names_ok && RelayLineParser::is_wire_safe(n);
    if (!RelayLineParser::is_wire_safe(device_id) || !names_ok ||
        !RelayLineParser::is_wire_safe(subscription_id)) {
        stats_.requests_rejected.fetch_add(1);
        on_done(RpcOutcome::failure("invalid unsubscribe arguments"));
        return;
    }
    uint64_t req = next_request_id_.fetch_add(1);
    send_request(RelayLineParser::encode_unsubscribe(req, device_id, names, subscription_id), req,
                 "UNSUB " + subscription_id, std::move(on_done));
}

void RelayTcpTransport::send_request(const std::string& line, uint64_t request_id,
                                     std::string description, Callback on_done) {
    if (!is_connected()) {
        stats_.requests_rejected.fetch_add(1);
        LOG_DEBUG("RelayTcp: %s rejected, not connected", description.c_str());
        on_done(RpcOutcome::failure("not connected"));
        return;
    }

    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        if (pending_.size() >= config_.relay_max_pending_requests) {
            stats_.requests_rejected.fetch_add(1);
            LOG_WARN("RelayTcp: %zu requests pending, rejecting %s",
                     pending_.size(), description.c_str());
            // Callback runs below, outside the lock
        } else {
            pending_.emplace(request_id, PendingRequest{std::move(on_done), Clock::now(), description});
            on_done = nullptr;
        }
    }
    if (on_done) {
        on_done(RpcOutcome::failure("too many pending requests"));
        return;
    }

    if (!send_line(line)) {
        complete_request(request_id, RpcOutcome::failure("send failed"));
        return;
    }
    stats_.requests_sent.fetch_add(1);
    LOG_TRACE("RelayTcp: sent req=%lu %s", static_cast<unsigned long>(request_id), description.c_str());
}

bool RelayTcpTransport::send_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(sock_mu_);
    if (socket_fd_ < 0) return false;

    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = send(socket_fd_, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("RelayTcp: send failed: %s", std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void RelayTcpTransport::complete_request(uint64_t request_id, const RpcOutcome& outcome) {
    Callback cb;
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        auto it = pending_.find(request_id);
        if (it == pending_.end()) {
            stats_.unmatched_responses.fetch_add(1);
            LOG_DEBUG("RelayTcp: response for unknown req=%lu", static_cast<unsigned long>(request_id));
            return;
        }
        cb = std::move(it->second.callback);
        pending_.erase(it);
    }
    if (cb) cb(outcome);
}

void RelayTcpTransport::fail_all_pending(const std::string& reason) {
    std::unordered_map<uint64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        failed.swap(pending_);
    }
    if (failed.empty()) return;

    LOG_WARN("RelayTcp: failing %zu pending requests: %s", failed.size(), reason.c_str());
    stats_.pending_failed.fetch_add(failed.size());
    for (auto& [id, req] : failed) {
        if (req.callback) req.callback(RpcOutcome::failure(reason));
    }
}

void RelayTcpTransport::expire_stale_requests() {
    std::vector<std::pair<uint64_t, PendingRequest>> expired;
    TimePoint cutoff = Clock::now() - config_.relay_request_timeout;
    {
        std::lock_guard<std::mutex> lk(pending_mu_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.sent_at <= cutoff) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (expired.empty()) return;

    stats_.requests_timed_out.fetch_add(expired.size());
    for (auto& [id, req] : expired) {
        LOG_WARN("RelayTcp: req=%lu %s timed out", static_cast<unsigned long>(id), req.description.c_str());
        if (req.callback) req.callback(RpcOutcome::failure("request timeout"));
    }
}

// --- Link --------------------------------------------------------------------

Result RelayTcpTransport::connect_to_relay() {
    set_connection_state(ConnectionState::kConnecting, endpoint());
    stats_.connect_attempts.fetch_add(1);

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_INET; hints.ai_socktype = SOCK_STREAM;
    std::string port_str = std::to_string(config_.relay_port);

    int gai = getaddrinfo(config_.relay_host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        LOG_ERROR("RelayTcp: DNS failed for %s: %s", config_.relay_host.c_str(), gai_strerror(gai));
        return Result::kError;
    }

    int fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd < 0) { freeaddrinfo(res); return Result::kError; }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    // Non-blocking connect
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int cr = connect(fd, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);

    if (cr < 0 && errno != EINPROGRESS) { close(fd); return Result::kError; }

    if (cr < 0) {
        struct pollfd pfd{fd, POLLOUT, 0};
        if (poll(&pfd, 1, 10000) <= 0) { close(fd); return Result::kTimeout; }
        int sock_err = 0; socklen_t el = sizeof(sock_err);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &el);
        if (sock_err != 0) { close(fd); return Result::kError; }
    }

    if (flags >= 0) fcntl(fd, F_SETFL, flags);

    struct timeval tv;
    tv.tv_sec = config_.relay_read_timeout.count(); tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    { std::lock_guard<std::mutex> lk(sock_mu_); socket_fd_ = fd; }

    stats_.connect_successes.fetch_add(1);
    {
        std::lock_guard<std::mutex> lk(heartbeat_mu_);
        last_heard_ = Clock::now();
        last_ping_sent_ = last_heard_;
    }
    parser_->reset();
    { std::lock_guard<std::mutex> lk(backoff_mu_); current_backoff_ = config_.relay_reconnect_interval; }
    set_connection_state(ConnectionState::kConnected, endpoint());

    return Result::kOk;
}

void RelayTcpTransport::close_socket() {
    std::lock_guard<std::mutex> lk(sock_mu_);
    if (socket_fd_ >= 0) { shutdown(socket_fd_, SHUT_RDWR); close(socket_fd_); socket_fd_ = -1; }
    connected_.store(false);
}

void RelayTcpTransport::reader_thread_func() {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        Result r = connect_to_relay();
        if (r != Result::kOk) {
            LOG_WARN("RelayTcp: connect to %s failed: %s", endpoint().c_str(), result_to_string(r));
            set_connection_state(ConnectionState::kDisconnected, result_to_string(r));
            if (stop_requested_.load()) break;
            reconnect_with_backoff();
            continue;
        }

        read_loop();

        // Disconnected
        close_socket();
        stats_.disconnect_count.fetch_add(1);
        set_connection_state(ConnectionState::kDisconnected);
        fail_all_pending("connection lost");

        if (!stop_requested_.load()) reconnect_with_backoff();
    }
    close_socket();
}

void RelayTcpTransport::read_loop() {
    // Wake often enough to honour the request deadline
    int poll_ms = static_cast<int>(std::min<int64_t>(1000,
        std::max<int64_t>(config_.relay_request_timeout.count() / 4, 10)));

    while (!stop_requested_.load(std::memory_order_acquire)) {
        int fd;
        { std::lock_guard<std::mutex> lk(sock_mu_); fd = socket_fd_; }
        if (fd < 0) return;

        struct pollfd pfd{fd, POLLIN, 0};
        int pr = poll(&pfd, 1, poll_ms);

        expire_stale_requests();

        if (pr < 0) { if (errno == EINTR) continue; return; }
        if (pr == 0) {
            maybe_send_heartbeat();
            check_heartbeat_timeout();
            continue;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return;

        if (pfd.revents & POLLIN) {
            ssize_t bytes = recv(fd, recv_buffer_.data(), recv_buffer_.size(), 0);
            if (bytes <= 0) { if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) continue; return; }

            stats_.bytes_received.fetch_add(static_cast<uint64_t>(bytes));

            auto parsed = parser_->feed(recv_buffer_.data(), static_cast<size_t>(bytes));
            if (!parsed.error.empty() || parsed.malformed_lines > 0)
                stats_.parse_errors.fetch_add(std::max<size_t>(parsed.malformed_lines, 1));

            if (!parsed.frames.empty()) {
                std::lock_guard<std::mutex> lk(heartbeat_mu_);
                last_heard_ = Clock::now();
            }

            for (auto& frame : parsed.frames) {
                switch (frame.type) {
                    case RelayFrameType::kOk:
                        stats_.responses_ok.fetch_add(1);
                        complete_request(frame.request_id, RpcOutcome::success(frame.value));
                        break;
                    case RelayFrameType::kErr:
                        stats_.responses_err.fetch_add(1);
                        complete_request(frame.request_id, RpcOutcome::failure(frame.value));
                        break;
                    case RelayFrameType::kMsg:
                        stats_.messages_received.fetch_add(1);
                        if (message_callback_) message_callback_(std::move(frame.message));
                        break;
                    case RelayFrameType::kPong:
                        break;
                }
            }
        }
        maybe_send_heartbeat();
    }
}

void RelayTcpTransport::maybe_send_heartbeat() {
    {
        std::lock_guard<std::mutex> lk(heartbeat_mu_);
        if (Clock::now() - last_ping_sent_ < config_.relay_heartbeat_interval) return;
        last_ping_sent_ = Clock::now();
    }
    if (!send_line(RelayLineParser::encode_ping()))
        LOG_DEBUG("RelayTcp: heartbeat send failed");
}

void RelayTcpTransport::check_heartbeat_timeout() {
    Duration elapsed;
    {
        std::lock_guard<std::mutex> lk(heartbeat_mu_);
        elapsed = Clock::now() - last_heard_;
    }
    auto timeout = config_.relay_heartbeat_interval * config_.relay_heartbeat_miss_threshold;
    if (elapsed > timeout) {
        LOG_WARN("RelayTcp: heartbeat timeout (%ldms)",
                 static_cast<long>(std::chrono::duration_cast<Millisecs>(elapsed).count()));
        stats_.heartbeat_timeouts.fetch_add(1);
        close_socket();
    }
}

void RelayTcpTransport::reconnect_with_backoff() {
    Seconds backoff = current_backoff();
    set_connection_state(ConnectionState::kReconnecting,
                        "backoff=" + std::to_string(backoff.count()) + "s");
    {
        std::unique_lock<std::mutex> lk(shutdown_mu_);
        shutdown_cv_.wait_for(lk, backoff, [this] { return stop_requested_.load(); });
    }
    std::lock_guard<std::mutex> lk(backoff_mu_);
    current_backoff_ = std::min(
        Seconds(std::max<int64_t>(current_backoff_.count(), 1) * 2),
        config_.relay_reconnect_max_interval);
}

} // namespace device_watch
