// =============================================================================
// FILE: include/transport/rpc_transport.h
// =============================================================================
#ifndef RPC_TRANSPORT_H
#define RPC_TRANSPORT_H

#include "common/types.h"
#include <functional>
#include <string>

namespace device_watch {

// Outcome of one transport call. On success `value` carries the subscription
// id (empty for unsubscribe acks); on failure it carries the raw failure payload.
struct RpcOutcome {
    bool        ok = false;
    std::string value;

    static RpcOutcome success(std::string v = "") { return {true, std::move(v)}; }
    static RpcOutcome failure(std::string payload) { return {false, std::move(payload)}; }
};

// Asynchronous request/response channel to the device message relay.
//
// Contract for implementations:
//   - every call invokes its callback exactly once, either synchronously
//     from inside the call or later from a transport thread;
//   - callbacks must not be invoked while the transport holds a lock that
//     the caller could need (callers re-enter their own components);
//   - calls never block the calling thread on network I/O.
class RpcTransport {
public:
    using Callback = std::function<void(const RpcOutcome&)>;

    virtual ~RpcTransport() = default;

    // Registers interest in `names` on `device_id`. Used for the initial
    // subscribe and for every renewal.
    virtual void subscribe(const DeviceId& device_id, const NameList& names,
                           Callback on_done) = 0;

    // Releases a server-side registration. Best effort.
    virtual void unsubscribe(const DeviceId& device_id, const NameList& names,
                             const std::string& subscription_id, Callback on_done) = 0;

    // False for transports that renew server-side registrations on their
    // own and expose no unsubscribe; subscriptions over them are not tracked.
    virtual bool supports_unsubscribe() const { return true; }

    virtual bool is_connected() const { return true; }
};

} // namespace device_watch
#endif // RPC_TRANSPORT_H
