// =============================================================================
// FILE: src/http/stats_handler.cpp
// =============================================================================
#include "http/stats_handler.h"
#include "subscription/subscription_registry.h"
#include "subscription/subscription_manager.h"
#include "subscription/watched_name_index.h"
#include "keepalive/keepalive_scheduler.h"
#include "router/message_router.h"
#include "transport/relay_tcp_transport.h"
#include "common/slow_call_logger.h"
#include "common/teardown_hook.h"
#include "common/config.h"
#include <sstream>

namespace device_watch {

namespace {

void write_name_array(std::ostringstream& j, const NameList& names) {
    j << "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) j << ",";
        j << "\"" << HttpServer::json_escape(names[i]) << "\"";
    }
    j << "]";
}

long long seconds_since(TimePoint t) {
    if (t == TimePoint{}) return -1;
    return static_cast<long long>(
        std::chrono::duration_cast<Seconds>(Clock::now() - t).count());
}

} // namespace

void StatsHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("GET", "/stats", [d](const HttpServer::Request& r) { return handle_stats(r, d); });
    server.route("GET", "/stats/transport", [d](const HttpServer::Request& r) { return handle_stats_transport(r, d); });
    server.route("GET", "/subscriptions", [d](const HttpServer::Request& r) { return handle_subscriptions(r, d); });
    server.route("GET", "/config", [d](const HttpServer::Request& r) { return handle_config(r, d); });
}

HttpServer::Response StatsHandler::handle_stats(const HttpServer::Request&, const Dependencies& d) {
    HttpServer::Response resp;
    std::ostringstream j;
    j << "{";

    // Registry
    j << "\"subscriptions\":{";
    j << "\"total\":" << (d.registry ? d.registry->total_count() : 0);
    j << ",\"tracked_by_manager\":" << (d.manager ? d.manager->tracked_count() : 0);
    j << "}";

    if (d.manager) {
        auto& ms = d.manager->stats();
        j << ",\"manager\":{";
        j << "\"subscribe_requests\":" << ms.subscribe_requests.load();
        j << ",\"subscribe_ok\":" << ms.subscribe_ok.load();
        j << ",\"subscribe_failed\":" << ms.subscribe_failed.load();
        j << ",\"invalid_argument\":" << ms.invalid_argument.load();
        j << ",\"rejected_shutdown\":" << ms.rejected_shutdown.load();
        j << ",\"passive_handles\":" << ms.passive_handles.load();
        j << ",\"removals\":" << ms.removals.load();
        j << ",\"unsubscribes_failed\":" << ms.unsubscribes_failed.load();
        j << ",\"callback_errors\":" << ms.callback_errors.load();
        j << "}";
    }

    if (d.scheduler) {
        auto& ss = d.scheduler->stats();
        j << ",\"keepalive\":{";
        j << "\"running\":" << (d.scheduler->is_running() ? "true" : "false");
        j << ",\"interval_sec\":" << std::chrono::duration_cast<Seconds>(d.scheduler->interval()).count();
        j << ",\"armed\":" << d.scheduler->armed_count();
        j << ",\"renewals_issued\":" << ss.renewals_issued.load();
        j << ",\"renewals_ok\":" << ss.renewals_ok.load();
        j << ",\"renewals_failed\":" << ss.renewals_failed.load();
        j << ",\"skipped_in_flight\":" << ss.skipped_in_flight.load();
        j << ",\"stale_timers\":" << ss.stale_timers.load();
        j << ",\"discarded_results\":" << ss.discarded_results.load();
        j << ",\"orphans_released\":" << ss.orphans_released.load();
        j << "}";
    }

    if (d.name_index) {
        j << ",\"name_index\":{";
        j << "\"watched_names\":" << d.name_index->watched_name_count();
        j << ",\"subscriptions\":" << d.name_index->subscription_count();
        j << "}";
    }

    if (d.router) {
        auto& rs = d.router->stats();
        j << ",\"router\":{";
        j << "\"messages_received\":" << rs.messages_received.load();
        j << ",\"messages_delivered\":" << rs.messages_delivered.load();
        j << ",\"messages_dropped\":" << rs.messages_dropped.load();
        j << ",\"unwatched\":" << rs.unwatched.load();
        j << ",\"listener_errors\":" << rs.listener_errors.load();
        j << ",\"queue_depth\":" << rs.queue_depth.load();
        j << "}";
    }

    if (d.transport) {
        j << ",\"transport\":{";
        j << "\"connected\":" << (d.transport->is_connected() ? "true" : "false");
        j << ",\"pending\":" << d.transport->pending_count();
        j << "}";
    }

    // Slow calls
    if (d.slow_logger) {
        auto& ss = d.slow_logger->stats();
        auto th = d.slow_logger->thresholds();
        j << ",\"slow_calls\":{";
        j << "\"calls_timed\":" << ss.calls_timed.load();
        j << ",\"warn_count\":" << ss.warn_count.load();
        j << ",\"error_count\":" << ss.error_count.load();
        j << ",\"critical_count\":" << ss.critical_count.load();
        j << ",\"max_duration_ms\":" << ss.max_duration_ms.load();
        j << ",\"warn_threshold_ms\":" << th.warn.count();
        j << ",\"error_threshold_ms\":" << th.error.count();
        j << ",\"critical_threshold_ms\":" << th.critical.count();
        j << "}";
    }

    if (d.teardown_hook) {
        j << ",\"teardown\":{";
        j << "\"fired\":" << (d.teardown_hook->fired() ? "true" : "false");
        j << ",\"pending_actions\":" << d.teardown_hook->pending_count();
        j << "}";
    }

    j << "}";
    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_stats_transport(const HttpServer::Request&,
                                                          const Dependencies& d) {
    HttpServer::Response resp;
    if (!d.transport) { resp.status_code = 404; resp.body = R"({"error":"no_transport"})"; return resp; }

    auto& ts = d.transport->stats();
    std::ostringstream j;
    j << "{";
    j << "\"relay\":\"" << HttpServer::json_escape(d.transport->endpoint()) << "\"";
    j << ",\"state\":\"" << connection_state_to_string(d.transport->connection_state()) << "\"";
    j << ",\"supports_unsubscribe\":" << (d.transport->supports_unsubscribe() ? "true" : "false");
    j << ",\"backoff_sec\":" << d.transport->current_backoff().count();
    j << ",\"pending\":" << d.transport->pending_count();
    j << ",\"requests_sent\":" << ts.requests_sent.load();
    j << ",\"requests_rejected\":" << ts.requests_rejected.load();
    j << ",\"responses_ok\":" << ts.responses_ok.load();
    j << ",\"responses_err\":" << ts.responses_err.load();
    j << ",\"unmatched_responses\":" << ts.unmatched_responses.load();
    j << ",\"pending_failed\":" << ts.pending_failed.load();
    j << ",\"requests_timed_out\":" << ts.requests_timed_out.load();
    j << ",\"messages_received\":" << ts.messages_received.load();
    j << ",\"bytes_received\":" << ts.bytes_received.load();
    j << ",\"connect_attempts\":" << ts.connect_attempts.load();
    j << ",\"connect_successes\":" << ts.connect_successes.load();
    j << ",\"disconnects\":" << ts.disconnect_count.load();
    j << ",\"heartbeat_timeouts\":" << ts.heartbeat_timeouts.load();
    j << ",\"parse_errors\":" << ts.parse_errors.load();
    j << "}";
    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_subscriptions(const HttpServer::Request& req,
                                                        const Dependencies& d) {
    HttpServer::Response resp;
    if (!d.registry) { resp.status_code = 500; resp.body = R"({"error":"no_registry"})"; return resp; }

    auto device_it = req.query_params.find("device");
    std::vector<SubscriptionDescriptor> subs;

    if (device_it != req.query_params.end()) {
        subs = d.registry->get_for_device(device_it->second);
    } else {
        subs = d.registry->get_all();
    }

    std::ostringstream j;
    j << "{\"count\":" << subs.size() << ",\"subscriptions\":[";
    for (size_t i = 0; i < subs.size() && i < 1000; ++i) {  // Limit response
        if (i > 0) j << ",";
        auto& s = subs[i];
        j << "{\"key\":" << s.key;
        j << ",\"id\":\"" << HttpServer::json_escape(s.current_id) << "\"";
        j << ",\"device\":\"" << HttpServer::json_escape(s.device_id) << "\"";
        j << ",\"names\":";
        write_name_array(j, s.watched_names);
        j << ",\"lifecycle\":\"" << lifecycle_to_string(s.lifecycle) << "\"";
        j << ",\"age_sec\":" << seconds_since(s.created_at);
        j << ",\"since_renewal_sec\":" << seconds_since(s.last_renewed_at);
        j << ",\"renewals_ok\":" << s.renewals_ok;
        j << ",\"renewals_failed\":" << s.renewals_failed;
        j << ",\"armed\":" << ((d.scheduler && d.scheduler->is_armed(s.key)) ? "true" : "false");
        j << "}";
    }
    if (subs.size() > 1000) j << "],\"truncated\":true";
    else j << "]";
    j << "}";

    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_config(const HttpServer::Request&,
                                                 const Dependencies& d) {
    HttpServer::Response resp;
    if (!d.config) { resp.status_code = 500; return resp; }
    auto& c = *d.config;

    std::ostringstream j;
    j << "{";
    j << "\"service_id\":\"" << HttpServer::json_escape(c.service_id) << "\"";
    j << ",\"log_level\":\"" << HttpServer::json_escape(c.log_level_str) << "\"";
    j << ",\"keepalive_interval_sec\":" << c.keepalive_interval.count();
    j << ",\"keepalive_tick_resolution_ms\":" << c.keepalive_tick_resolution.count();
    j << ",\"relay\":\"" << HttpServer::json_escape(c.relay_host) << ":" << c.relay_port << "\"";
    j << ",\"relay_reconnect_sec\":" << c.relay_reconnect_interval.count();
    j << ",\"relay_reconnect_max_sec\":" << c.relay_reconnect_max_interval.count();
    j << ",\"relay_heartbeat_sec\":" << c.relay_heartbeat_interval.count();
    j << ",\"relay_heartbeat_misses\":" << c.relay_heartbeat_miss_threshold;
    j << ",\"relay_max_pending\":" << c.relay_max_pending_requests;
    j << ",\"relay_request_timeout_ms\":" << c.relay_request_timeout.count();
    j << ",\"relay_supports_unsubscribe\":" << (c.relay_supports_unsubscribe ? "true" : "false");
    j << ",\"router_max_pending\":" << c.router_max_pending_messages;
    j << ",\"watch_devices\":[";
    for (size_t i = 0; i < c.watch_devices.size(); ++i) {
        if (i > 0) j << ",";
        j << "{\"device\":\"" << HttpServer::json_escape(c.watch_devices[i].device_id) << "\",\"names\":";
        write_name_array(j, c.watch_devices[i].names);
        j << "}";
    }
    j << "]";
    j << ",\"slow_call_warn_ms\":" << c.slow_call_warn_threshold.count();
    j << ",\"slow_call_error_ms\":" << c.slow_call_error_threshold.count();
    j << ",\"slow_call_critical_ms\":" << c.slow_call_critical_threshold.count();
    j << ",\"log_directory\":\"" << HttpServer::json_escape(c.log_directory) << "\"";
    j << "}";

    resp.body = j.str();
    return resp;
}

} // namespace device_watch
