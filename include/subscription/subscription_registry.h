// =============================================================================
// FILE: include/subscription/subscription_registry.h
// =============================================================================
#ifndef SUBSCRIPTION_REGISTRY_H
#define SUBSCRIPTION_REGISTRY_H

#include "common/types.h"
#include "subscription/subscription_descriptor.h"
#include <memory>
#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace device_watch {

// Table of live subscriptions, keyed by the server-issued id.
//
// The registry is the single authority that resolves races between the
// keepalive scheduler (renewals) and callers (remove, teardown). Every
// operation takes the same lock; `by_id_`, `active_ids_` and `id_by_key_`
// are only ever changed together.
//
// Reads return copies; no caller holds a reference into the table.
class SubscriptionRegistry {
public:
    SubscriptionRegistry() = default;

    // Allocates a key that no other user of this registry will get.
    // Every component sharing the registry must take its keys from here.
    SubscriptionKey next_key() { return next_key_.fetch_add(1); }

    // Adds `descriptor` under `id`. kAlreadyExists if either the id or the
    // descriptor's key is already present; kInvalidArgument for an empty id.
    Result insert(const std::string& id, const SubscriptionDescriptor& descriptor);

    // Both return false if absent; removal of an absent entry is a no-op.
    bool remove(const std::string& id, SubscriptionDescriptor* removed = nullptr);
    bool remove_key(SubscriptionKey key, SubscriptionDescriptor* removed = nullptr);

    bool lookup(const std::string& id, SubscriptionDescriptor& out) const;
    bool lookup_key(SubscriptionKey key, SubscriptionDescriptor& out) const;
    bool contains(const std::string& id) const;

    // Re-keys the entry at `old_id` to `new_id` and updates its current id.
    //   kNotFound       old_id is gone (removed while a renewal was outstanding)
    //   kAlreadyExists  new_id already belongs to another entry
    //   kOk             swapped, or old_id == new_id
    Result swap_id(const std::string& old_id, const std::string& new_id);

    // Marks a renewal outstanding for `key` and copies the entry into `snapshot`.
    //   kNotFound       no such subscription (stale timer)
    //   kAlreadyExists  a renewal is already outstanding
    Result begin_renewal(SubscriptionKey key, SubscriptionDescriptor& snapshot);

    // Applies a renewal result. `new_id` is only looked at when `ok`.
    // Returns kNotFound when the subscription was removed meanwhile; the
    // result is then discarded and nothing is re-inserted.
    Result complete_renewal(SubscriptionKey key, const std::string& old_id,
                            bool ok, const std::string& new_id);

    std::vector<std::string> active_ids() const;
    std::vector<SubscriptionDescriptor> get_all() const;
    std::vector<SubscriptionDescriptor> get_for_device(const DeviceId& device_id) const;

    // Removes everything and returns what was removed.
    std::vector<SubscriptionDescriptor> drain();

    size_t total_count() const;
    size_t count_by_device(const DeviceId& device_id) const;

    // Union of watched names across the device's live subscriptions,
    // in first-subscribed order.
    NameList watched_names_for_device(const DeviceId& device_id) const;

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

private:
    using DescriptorPtr = std::shared_ptr<SubscriptionDescriptor>;

    DescriptorPtr find_key_locked(SubscriptionKey key) const;
    void erase_locked(const std::string& id, const DescriptorPtr& desc);
    Result swap_locked(const std::string& old_id, const std::string& new_id);

    std::atomic<SubscriptionKey> next_key_{1};

    mutable std::mutex mu_;
    std::unordered_map<std::string, DescriptorPtr> by_id_;
    std::unordered_set<std::string> active_ids_;
    std::unordered_map<SubscriptionKey, std::string> id_by_key_;
};

} // namespace device_watch
#endif // SUBSCRIPTION_REGISTRY_H
