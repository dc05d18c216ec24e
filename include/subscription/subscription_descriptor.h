// =============================================================================
// FILE: include/subscription/subscription_descriptor.h
// =============================================================================
#ifndef SUBSCRIPTION_DESCRIPTOR_H
#define SUBSCRIPTION_DESCRIPTOR_H

#include "common/types.h"
#include <string>

namespace device_watch {

enum class SubLifecycle { kPending, kActive, kRenewing, kRemoved, kFailed };

inline const char* lifecycle_to_string(SubLifecycle s) {
    switch (s) {
        case SubLifecycle::kPending:  return "Pending";
        case SubLifecycle::kActive:   return "Active";
        case SubLifecycle::kRenewing: return "Renewing";
        case SubLifecycle::kRemoved:  return "Removed";
        case SubLifecycle::kFailed:   return "Failed";
        default:                      return "Unknown";
    }
}

// State of one logical subscription. `key` is local and survives renewals;
// `current_id` is the server-issued id and changes on every successful renewal.
struct SubscriptionDescriptor {
    SubscriptionKey key = 0;
    std::string     current_id;
    DeviceId        device_id;
    NameList        watched_names;
    SubLifecycle    lifecycle = SubLifecycle::kPending;

    bool            renewal_in_flight = false;
    TimePoint       created_at      = Clock::now();
    TimePoint       last_renewed_at = {};
    uint64_t        renewals_ok     = 0;
    uint64_t        renewals_failed = 0;
};

} // namespace device_watch
#endif // SUBSCRIPTION_DESCRIPTOR_H
