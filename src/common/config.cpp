// =============================================================================
// FILE: src/common/config.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>

namespace device_watch {

namespace {

void trim(std::string& s, const char* ws = " \t\r\n") {
    s.erase(0, s.find_first_not_of(ws));
    auto last = s.find_last_not_of(ws);
    if (last == std::string::npos) s.clear();
    else s.erase(last + 1);
}

} // namespace

Config::KeyValues Config::parse_ini(const std::string& path) {
    KeyValues map;
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: %s", path.c_str());
        return map;
    }

    std::string section, line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) section = line.substr(1, end - 1);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        trim(key, " \t");
        trim(val, " \t");

        // ${ENV_VAR} substitution
        size_t pos = 0;
        while ((pos = val.find("${", pos)) != std::string::npos) {
            auto end = val.find('}', pos);
            if (end == std::string::npos) break;
            std::string env_name = val.substr(pos + 2, end - pos - 2);
            const char* env_val = std::getenv(env_name.c_str());
            std::string replacement = env_val ? env_val : "";
            val.replace(pos, end - pos + 1, replacement);
            pos += replacement.size();
        }

        map[section.empty() ? key : section + "." + key] = val;
    }
    return map;
}

std::string Config::get_or(const KeyValues& m, const std::string& key, const std::string& def) {
    auto it = m.find(key);
    return (it != m.end()) ? it->second : def;
}

int Config::get_int(const KeyValues& m, const std::string& key, int def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        LOG_WARN("Config: invalid integer for %s='%s', using %d", key.c_str(), it->second.c_str(), def);
        return def;
    }
}

size_t Config::get_size(const KeyValues& m, const std::string& key, size_t def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        if (!it->second.empty() && it->second[0] == '-') throw std::invalid_argument("negative");
        return std::stoull(it->second);
    } catch (const std::exception&) {
        LOG_WARN("Config: invalid size for %s='%s', using %zu", key.c_str(), it->second.c_str(), def);
        return def;
    }
}

bool Config::get_bool(const KeyValues& m, const std::string& key, bool def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    return (it->second == "true" || it->second == "1" || it->second == "yes");
}

std::vector<WatchEntry> Config::parse_watch_list(const std::string& csv) {
    std::vector<WatchEntry> entries;
    std::istringstream stream(csv);
    std::string token;

    while (std::getline(stream, token, ',')) {
        trim(token, " \t");
        if (token.empty()) continue;

        auto colon = token.find(':');
        if (colon == std::string::npos || colon == 0) {
            LOG_WARN("Config: watch entry '%s' has no device id, skipped", token.c_str());
            continue;
        }

        WatchEntry entry;
        entry.device_id = token.substr(0, colon);
        trim(entry.device_id, " \t");

        std::istringstream names(token.substr(colon + 1));
        std::string name;
        while (std::getline(names, name, '|')) {
            trim(name, " \t");
            if (!name.empty()) entry.names.push_back(name);
        }
        if (entry.names.empty()) {
            LOG_WARN("Config: watch entry for device %s lists no names, skipped", entry.device_id.c_str());
            continue;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

Config Config::load_defaults() {
    Config cfg;
    LOG_INFO("Config: defaults loaded, keepalive=%lds relay=%s:%d",
             static_cast<long>(cfg.keepalive_interval.count()),
             cfg.relay_host.c_str(), cfg.relay_port);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    auto m = parse_ini(path);
    if (m.empty()) {
        LOG_WARN("Config: empty or missing file '%s', using defaults", path.c_str());
        return load_defaults();
    }

    Config c;

    // General
    c.service_id    = get_or(m, "general.service_id", c.service_id);
    c.log_level_str = get_or(m, "general.log_level", c.log_level_str);

    // Keepalive
    int interval = get_int(m, "keepalive.interval_sec", kDefaultKeepaliveIntervalSec);
    if (interval <= 0) {
        LOG_WARN("Config: keepalive.interval_sec=%d is not positive, using %d",
                 interval, kDefaultKeepaliveIntervalSec);
        interval = kDefaultKeepaliveIntervalSec;
    }
    c.keepalive_interval = Seconds(interval);
    int resolution = get_int(m, "keepalive.tick_resolution_ms", 1000);
    c.keepalive_tick_resolution = Millisecs(resolution > 0 ? resolution : 1000);

    // Relay
    c.relay_host = get_or(m, "relay.host", c.relay_host);
    c.relay_port = static_cast<uint16_t>(get_int(m, "relay.port", c.relay_port));
    c.relay_reconnect_interval     = Seconds(get_int(m, "relay.reconnect_interval_sec", 5));
    c.relay_reconnect_max_interval = Seconds(get_int(m, "relay.reconnect_max_interval_sec", 60));
    c.relay_read_timeout           = Seconds(get_int(m, "relay.read_timeout_sec", 30));
    c.relay_heartbeat_interval     = Seconds(get_int(m, "relay.heartbeat_interval_sec", 15));
    c.relay_heartbeat_miss_threshold = get_int(m, "relay.heartbeat_miss_threshold", 3);
    c.relay_recv_buffer_size       = get_size(m, "relay.recv_buffer_size", 65536);
    c.relay_max_pending_requests   = get_size(m, "relay.max_pending_requests", 10000);
    int request_timeout = get_int(m, "relay.request_timeout_ms", 30000);
    c.relay_request_timeout        = Millisecs(request_timeout > 0 ? request_timeout : 30000);
    c.relay_supports_unsubscribe   = get_bool(m, "relay.supports_unsubscribe", true);

    // Router
    c.router_max_pending_messages = get_size(m, "router.max_pending_messages", 100000);

    // Watch list
    c.watch_devices = parse_watch_list(get_or(m, "watch.devices", ""));

    // Slow calls
    c.slow_call_warn_threshold     = Millisecs(get_int(m, "slow_call.warn_threshold_ms", 500));
    c.slow_call_error_threshold    = Millisecs(get_int(m, "slow_call.error_threshold_ms", 5000));
    c.slow_call_critical_threshold = Millisecs(get_int(m, "slow_call.critical_threshold_ms", 30000));

    // HTTP
    c.http_enabled         = get_bool(m, "http.enabled", true);
    c.http_bind_address    = get_or(m, "http.bind_address", c.http_bind_address);
    c.http_port            = static_cast<uint16_t>(get_int(m, "http.port", 8081));
    c.http_read_timeout    = Seconds(get_int(m, "http.read_timeout_sec", 30));
    c.http_max_connections = get_size(m, "http.max_connections", 100);

    // Logging
    c.log_directory         = get_or(m, "logging.directory", c.log_directory);
    c.log_base_name         = get_or(m, "logging.base_name", c.log_base_name);
    c.log_console_level_str = get_or(m, "logging.console_level", c.log_console_level_str);
    c.log_max_file_size_mb  = get_size(m, "logging.max_file_size_mb", 50);
    c.log_max_rotated_files = get_int(m, "logging.max_rotated_files", 10);

    LOG_INFO("Config: loaded from '%s' - keepalive=%lds relay=%s:%d watch=%zu http=%s:%d",
             path.c_str(), static_cast<long>(c.keepalive_interval.count()),
             c.relay_host.c_str(), c.relay_port, c.watch_devices.size(),
             c.http_bind_address.c_str(), c.http_port);

    return c;
}

} // namespace device_watch
