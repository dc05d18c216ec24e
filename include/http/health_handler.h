// =============================================================================
// FILE: include/http/health_handler.h
// =============================================================================
#ifndef HEALTH_HANDLER_H
#define HEALTH_HANDLER_H

#include "http/http_server.h"
#include <memory>
#include <functional>

namespace device_watch {

class RelayTcpTransport;
class KeepaliveScheduler;
class MessageRouter;
class TeardownHook;

// Registers health and readiness endpoints on the HTTP server.
// Health is determined by:
//   - Keepalive scheduler running
//   - Relay link connected
// Readiness additionally requires that teardown has not started.
class HealthHandler {
public:
    struct Dependencies {
        RelayTcpTransport*  transport     = nullptr;
        KeepaliveScheduler* scheduler     = nullptr;
        MessageRouter*      router        = nullptr;
        TeardownHook*       teardown_hook = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_health(const HttpServer::Request& req,
                                              const Dependencies& deps);
    static HttpServer::Response handle_ready(const HttpServer::Request& req,
                                             const Dependencies& deps);
};

} // namespace device_watch
#endif // HEALTH_HANDLER_H
