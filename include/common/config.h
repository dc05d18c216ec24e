// =============================================================================
// FILE: include/common/config.h
// =============================================================================
#ifndef COMMON_CONFIG_H
#define COMMON_CONFIG_H

#include "common/types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>

namespace device_watch {

// One line of the daemon's watch list: a device and the names to subscribe.
struct WatchEntry {
    DeviceId device_id;
    NameList names;
};

struct Config {
    static constexpr int kDefaultKeepaliveIntervalSec = 170;  // inside the relay's ~3 min idle expiry

    // General
    std::string service_id     = "device-watch-01";
    std::string log_level_str  = "info";

    // Keepalive
    Seconds   keepalive_interval   = Seconds(kDefaultKeepaliveIntervalSec);
    Millisecs keepalive_tick_resolution = Millisecs(1000);

    // Relay transport
    std::string relay_host                 = "127.0.0.1";
    uint16_t    relay_port                 = 7070;
    Seconds     relay_reconnect_interval     = Seconds(5);
    Seconds     relay_reconnect_max_interval = Seconds(60);
    Seconds     relay_read_timeout         = Seconds(30);
    Seconds     relay_heartbeat_interval   = Seconds(15);
    int         relay_heartbeat_miss_threshold = 3;
    size_t      relay_recv_buffer_size     = 65536;
    size_t      relay_max_pending_requests = 10000;
    Millisecs   relay_request_timeout      = Millisecs(30000);
    bool        relay_supports_unsubscribe = true;

    // Message router
    size_t router_max_pending_messages = 100000;

    // Watch list (daemon only)
    std::vector<WatchEntry> watch_devices;

    // Slow transport call thresholds
    Millisecs slow_call_warn_threshold     = Millisecs(500);
    Millisecs slow_call_error_threshold    = Millisecs(5000);
    Millisecs slow_call_critical_threshold = Millisecs(30000);

    // HTTP status endpoint
    bool        http_enabled         = true;
    std::string http_bind_address    = "0.0.0.0";
    uint16_t    http_port            = 8081;
    Seconds     http_read_timeout    = Seconds(30);
    size_t      http_max_connections = 100;

    // Logging
    std::string log_directory         = "/var/log/device_watch";
    std::string log_base_name         = "device_watch";
    std::string log_console_level_str = "warn";
    size_t      log_max_file_size_mb  = 50;
    int         log_max_rotated_files = 10;

    // Parse from INI-style config file
    static Config load_from_file(const std::string& path);
    static Config load_defaults();

    // "did1:prop.a|event.b, did2:prop.2.1" -> entries; malformed items are skipped
    static std::vector<WatchEntry> parse_watch_list(const std::string& csv);

private:
    using KeyValues = std::unordered_map<std::string, std::string>;

    static KeyValues parse_ini(const std::string& path);
    static std::string get_or(const KeyValues& m, const std::string& key, const std::string& def);
    static int get_int(const KeyValues& m, const std::string& key, int def);
    static size_t get_size(const KeyValues& m, const std::string& key, size_t def);
    static bool get_bool(const KeyValues& m, const std::string& key, bool def);
};

} // namespace device_watch
#endif // COMMON_CONFIG_H
