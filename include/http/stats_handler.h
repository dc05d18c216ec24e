// =============================================================================
// FILE: include/http/stats_handler.h
// =============================================================================
#ifndef STATS_HANDLER_H
#define STATS_HANDLER_H

#include "http/http_server.h"
#include <memory>

namespace device_watch {

class SubscriptionRegistry;
class SubscriptionManager;
class KeepaliveScheduler;
class WatchedNameIndex;
class MessageRouter;
class RelayTcpTransport;
class SlowCallLogger;
class TeardownHook;
struct Config;

// Registers stats, subscription, and config endpoints on the HTTP server.
class StatsHandler {
public:
    struct Dependencies {
        const Config*         config        = nullptr;
        SubscriptionRegistry* registry      = nullptr;
        SubscriptionManager*  manager       = nullptr;
        KeepaliveScheduler*   scheduler     = nullptr;
        WatchedNameIndex*     name_index    = nullptr;
        MessageRouter*        router        = nullptr;
        RelayTcpTransport*    transport     = nullptr;
        SlowCallLogger*       slow_logger   = nullptr;
        TeardownHook*         teardown_hook = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_stats(const HttpServer::Request& req,
                                             const Dependencies& deps);
    static HttpServer::Response handle_stats_transport(const HttpServer::Request& req,
                                                       const Dependencies& deps);
    static HttpServer::Response handle_subscriptions(const HttpServer::Request& req,
                                                     const Dependencies& deps);
    static HttpServer::Response handle_config(const HttpServer::Request& req,
                                              const Dependencies& deps);
};

} // namespace device_watch
#endif // STATS_HANDLER_H
