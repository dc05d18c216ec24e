// =============================================================================
// FILE: src/main.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include "common/slow_call_logger.h"
#include "common/teardown_hook.h"
#include "subscription/subscription_registry.h"
#include "subscription/subscription_manager.h"
#include "subscription/watched_name_index.h"
#include "keepalive/keepalive_scheduler.h"
#include "router/message_router.h"
#include "transport/relay_tcp_transport.h"
#include "http/http_server.h"
#include "http/health_handler.h"
#include "http/stats_handler.h"
#include <csignal>
#include <signal.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace device_watch;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int sig) {
    LOG_INFO("Signal %d received", sig);
    g_shutdown.store(true, std::memory_order_release);
}

namespace {

// One configured watch entry and its live subscription, if any
struct WatchSlot {
    WatchEntry entry;
    std::shared_ptr<SubscriptionHandle> handle;
    bool in_flight = false;
    uint64_t attempts = 0;
};

// Subscribes every slot that has no live subscription yet. Retried from the
// main loop until the relay accepts each entry.
void subscribe_missing(SubscriptionManager& manager, const RelayTcpTransport& transport,
                       std::vector<std::shared_ptr<WatchSlot>>& slots, std::mutex& slots_mu) {
    if (!transport.is_connected()) return;

    for (auto& slot : slots) {
        {
            std::lock_guard<std::mutex> lk(slots_mu);
            if (slot->handle || slot->in_flight) continue;
            slot->in_flight = true;
            slot->attempts++;
        }
        std::weak_ptr<WatchSlot> weak = slot;
        manager.subscribe(slot->entry.device_id, slot->entry.names,
            [weak, &slots_mu](const SubscribeOutcome& out) {
                auto s = weak.lock();
                if (!s) return;
                std::lock_guard<std::mutex> lk(slots_mu);
                s->in_flight = false;
                if (out.ok()) {
                    s->handle = out.handle;
                } else {
                    LOG_WARN("Watch %s: subscribe failed (%s) %s, attempt %lu",
                             s->entry.device_id.c_str(), result_to_string(out.result),
                             out.failure_payload.c_str(), static_cast<unsigned long>(s->attempts));
                }
            });
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::instance().set_level(LogLevel::kInfo);
    LOG_INFO("device_watchd starting...");

    // 1. Load config
    Config config = (argc > 1) ? Config::load_from_file(argv[1]) : Config::load_defaults();

    // Configure file-based logging with rotation
    Logger::instance().configure(
        config.log_directory,
        config.log_base_name,
        parse_log_level(config.log_console_level_str),
        config.log_max_file_size_mb * 1024 * 1024,
        config.log_max_rotated_files);
    Logger::instance().set_level(parse_log_level(config.log_level_str));

    // Signals
    struct sigaction sa{}; sa.sa_handler = signal_handler; sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr); sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    // 2. Shared components
    SlowCallLogger slow_logger(config);
    TeardownHook teardown_hook;
    SubscriptionRegistry registry;
    WatchedNameIndex name_index;

    // 3. Router + relay transport
    MessageRouter router(config, name_index);
    router.set_listener([&registry](const DeviceId& device_id,
                                    const std::map<std::string, std::string>& values,
                                    const std::vector<SubscriptionKey>& keys) {
        for (const auto& [name, value] : values) {
            LOG_INFO("Message device=%s %s=%s (subscriptions=%zu)",
                     device_id.c_str(), name.c_str(), value.c_str(), keys.size());
        }
        LOG_TRACE("Device %s has %zu live subscriptions", device_id.c_str(),
                  registry.count_by_device(device_id));
    });
    if (router.start() != Result::kOk) { LOG_FATAL("Message router start failed"); return 1; }

    RelayTcpTransport transport(config);
    transport.set_message_callback([&](DeviceMessage&& msg) {
        router.on_device_message(std::move(msg));
    });
    transport.set_state_callback([&](RelayTcpTransport::ConnectionState state,
                                     const std::string& detail) {
        router.on_connection_state_changed(
            state == RelayTcpTransport::ConnectionState::kConnected, detail);
    });
    if (transport.start() != Result::kOk) {
        LOG_FATAL("Relay transport start failed");
        router.stop();
        return 1;
    }

    // 4. Keepalive + lifecycle
    KeepaliveScheduler scheduler(config, registry, transport, &slow_logger);
    if (scheduler.start() != Result::kOk) {
        LOG_FATAL("Keepalive scheduler start failed");
        transport.stop();
        router.stop();
        return 1;
    }

    auto manager = SubscriptionManager::create(registry, scheduler, transport, teardown_hook,
                                               &slow_logger, &name_index);

    // 5. HTTP server
    HttpServer http(config);
    if (config.http_enabled) {
        HealthHandler::Dependencies hdeps{&transport, &scheduler, &router, &teardown_hook};
        HealthHandler::register_routes(http, hdeps);

        StatsHandler::Dependencies sdeps{&config, &registry, manager.get(), &scheduler,
                                         &name_index, &router, &transport, &slow_logger,
                                         &teardown_hook};
        StatsHandler::register_routes(http, sdeps);

        if (http.start() != Result::kOk) LOG_ERROR("HTTP server failed to start, continuing without it");
    }

    // 6. Watch list
    std::mutex slots_mu;
    std::vector<std::shared_ptr<WatchSlot>> slots;
    for (const auto& e : config.watch_devices) {
        auto slot = std::make_shared<WatchSlot>();
        slot->entry = e;
        slots.push_back(std::move(slot));
    }
    if (slots.empty()) LOG_WARN("No watch.devices configured; idle until shutdown");

    LOG_INFO("All components started. service_id=%s watches=%zu",
             config.service_id.c_str(), slots.size());

    // Main loop
    uint64_t tick = 0;
    while (!g_shutdown.load(std::memory_order_acquire)) {
        if (tick % 5 == 0) subscribe_missing(*manager, transport, slots, slots_mu);
        std::this_thread::sleep_for(Seconds(1));
        if (++tick % 30 == 0) {
            auto& ks = scheduler.stats();
            LOG_INFO("Stats: subscriptions=%zu armed=%zu renewals=%lu/%lu messages=%lu relay=%s",
                     registry.total_count(), scheduler.armed_count(),
                     static_cast<unsigned long>(ks.renewals_ok.load()),
                     static_cast<unsigned long>(ks.renewals_issued.load()),
                     static_cast<unsigned long>(router.stats().messages_delivered.load()),
                     transport.is_connected() ? "connected" : "disconnected");
        }
    }

    // Shutdown: release subscriptions while the link is still up, then
    // stop components in reverse order
    LOG_INFO("Shutting down...");
    size_t released = teardown_hook.fire();
    LOG_INFO("Teardown released %zu subscriptions (registry now %zu)",
             released, registry.total_count());

    http.stop();
    scheduler.stop();
    transport.stop();
    router.stop();
    {
        std::lock_guard<std::mutex> lk(slots_mu);
        slots.clear();
    }

    LOG_INFO("device_watchd stopped cleanly.");
    Logger::instance().flush_all();
    return 0;
}
