// =============================================================================
// FILE: include/subscription/watched_name_index.h
// =============================================================================
#ifndef WATCHED_NAME_INDEX_H
#define WATCHED_NAME_INDEX_H

#include "common/types.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <shared_mutex>

namespace device_watch {

enum class NameKind { kProperty, kEvent, kSpecProperty, kSpecEvent, kUnknown };

inline const char* name_kind_to_string(NameKind k) {
    switch (k) {
        case NameKind::kProperty:     return "property";
        case NameKind::kEvent:        return "event";
        case NameKind::kSpecProperty: return "spec-property";
        case NameKind::kSpecEvent:    return "spec-event";
        default:                      return "unknown";
    }
}

// Reverse index used to route pushed device messages:
// (device, watched name) -> subscription keys watching it.
class WatchedNameIndex {
public:
    WatchedNameIndex() = default;

    // Trims surrounding whitespace: " prop.power " -> "prop.power"
    static std::string normalize_name(const std::string& name);

    // prop.power -> kProperty, event.doneWashing -> kEvent,
    // prop.2.1 -> kSpecProperty, event.3.1 -> kSpecEvent
    static NameKind classify(const std::string& name);

    // Re-adding a key replaces its previous names
    void add(SubscriptionKey key, const DeviceId& device_id, const NameList& names);
    void remove(SubscriptionKey key);

    std::vector<SubscriptionKey> lookup(const DeviceId& device_id, const std::string& name) const;
    bool is_watched(const DeviceId& device_id, const std::string& name) const;

    size_t watched_name_count() const;
    size_t subscription_count() const;

    WatchedNameIndex(const WatchedNameIndex&) = delete;
    WatchedNameIndex& operator=(const WatchedNameIndex&) = delete;

private:
    static std::string slot(const DeviceId& device_id, const std::string& name);
    void remove_locked(SubscriptionKey key);

    struct Entry { DeviceId device_id; NameList names; };

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::vector<SubscriptionKey>> slot_to_keys_;
    std::unordered_map<SubscriptionKey, Entry> key_to_entry_;
};

} // namespace device_watch
#endif // WATCHED_NAME_INDEX_H
