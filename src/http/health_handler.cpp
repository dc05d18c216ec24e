// =============================================================================
// FILE: src/http/health_handler.cpp
// =============================================================================
#include "http/health_handler.h"
#include "transport/relay_tcp_transport.h"
#include "keepalive/keepalive_scheduler.h"
#include "router/message_router.h"
#include "common/teardown_hook.h"
#include <sstream>

namespace device_watch {

void HealthHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto deps_copy = deps;  // Capture by value for lambda lifetime

    server.route("GET", "/health", [deps_copy](const HttpServer::Request& req) {
        return handle_health(req, deps_copy);
    });

    server.route("GET", "/ready", [deps_copy](const HttpServer::Request& req) {
        return handle_ready(req, deps_copy);
    });
}

HttpServer::Response HealthHandler::handle_health(const HttpServer::Request&,
                                                  const Dependencies& deps) {
    HttpServer::Response resp;
    std::ostringstream json;
    json << "{";

    bool sched_ok = deps.scheduler && deps.scheduler->is_running();
    json << "\"keepalive_scheduler\":" << (sched_ok ? "true" : "false");
    json << ",\"armed_timers\":" << (deps.scheduler ? deps.scheduler->armed_count() : 0);

    bool link_ok = deps.transport && deps.transport->is_connected();
    json << ",\"relay_link\":" << (link_ok ? "true" : "false");
    if (deps.transport) {
        json << ",\"relay\":\"" << HttpServer::json_escape(deps.transport->endpoint()) << "\"";
        json << ",\"relay_state\":\""
             << connection_state_to_string(deps.transport->connection_state()) << "\"";
    }

    json << ",\"router\":" << (deps.router ? "true" : "false");

    bool healthy = sched_ok && link_ok;
    json << ",\"healthy\":" << (healthy ? "true" : "false");
    json << "}";

    resp.status_code = healthy ? 200 : 503;
    resp.body = json.str();
    return resp;
}

HttpServer::Response HealthHandler::handle_ready(const HttpServer::Request&,
                                                 const Dependencies& deps) {
    HttpServer::Response resp;
    bool ready = deps.scheduler && deps.scheduler->is_running() &&
                 deps.transport && deps.transport->is_connected();
    if (deps.teardown_hook) ready = ready && !deps.teardown_hook->fired();

    resp.status_code = ready ? 200 : 503;
    resp.body = ready ? R"({"ready":true})" : R"({"ready":false})";
    return resp;
}

} // namespace device_watch
