// =============================================================================
// FILE: src/subscription/watched_name_index.cpp
// =============================================================================
#include "subscription/watched_name_index.h"
#include "common/logger.h"
#include <algorithm>
#include <cctype>

namespace device_watch {

namespace {

bool all_digits(const std::string& s, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

// "2.1" style: <siid>.<id>
bool is_spec_suffix(const std::string& s, size_t from) {
    auto dot = s.find('.', from);
    if (dot == std::string::npos) return false;
    return all_digits(s, from, dot) && all_digits(s, dot + 1, s.size());
}

} // namespace

std::string WatchedNameIndex::normalize_name(const std::string& name) {
    size_t b = 0, e = name.size();
    while (b < e && std::isspace(static_cast<unsigned char>(name[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(name[e - 1]))) --e;
    return name.substr(b, e - b);
}

NameKind WatchedNameIndex::classify(const std::string& name) {
    static const std::string kProp = "prop.";
    static const std::string kEvent = "event.";

    if (name.compare(0, kProp.size(), kProp) == 0 && name.size() > kProp.size())
        return is_spec_suffix(name, kProp.size()) ? NameKind::kSpecProperty : NameKind::kProperty;
    if (name.compare(0, kEvent.size(), kEvent) == 0 && name.size() > kEvent.size())
        return is_spec_suffix(name, kEvent.size()) ? NameKind::kSpecEvent : NameKind::kEvent;
    return NameKind::kUnknown;
}

std::string WatchedNameIndex::slot(const DeviceId& device_id, const std::string& name) {
    std::string s;
    s.reserve(device_id.size() + name.size() + 1);
    s += device_id;
    s += '\x1f';
    s += name;
    return s;
}

void WatchedNameIndex::add(SubscriptionKey key, const DeviceId& device_id, const NameList& names) {
    if (device_id.empty() || names.empty()) {
        LOG_WARN("WatchedNameIndex::add: empty device or names (key=%lu)",
                 static_cast<unsigned long>(key));
        return;
    }

    Entry entry{device_id, {}};
    for (const auto& raw : names) {
        std::string n = normalize_name(raw);
        if (n.empty()) continue;
        if (classify(n) == NameKind::kUnknown)
            LOG_DEBUG("WatchedNameIndex: unrecognized name form '%s' on %s", n.c_str(), device_id.c_str());
        if (std::find(entry.names.begin(), entry.names.end(), n) == entry.names.end())
            entry.names.push_back(std::move(n));
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    remove_locked(key);
    for (const auto& n : entry.names) slot_to_keys_[slot(device_id, n)].push_back(key);

    LOG_DEBUG("WatchedNameIndex: key=%lu watching %zu names on %s",
              static_cast<unsigned long>(key), entry.names.size(), device_id.c_str());
    key_to_entry_[key] = std::move(entry);
}

void WatchedNameIndex::remove(SubscriptionKey key) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    remove_locked(key);
}

void WatchedNameIndex::remove_locked(SubscriptionKey key) {
    auto it = key_to_entry_.find(key);
    if (it == key_to_entry_.end()) return;

    for (const auto& n : it->second.names) {
        auto sit = slot_to_keys_.find(slot(it->second.device_id, n));
        if (sit == slot_to_keys_.end()) continue;
        auto& keys = sit->second;
        keys.erase(std::remove(keys.begin(), keys.end(), key), keys.end());
        if (keys.empty()) slot_to_keys_.erase(sit);
    }
    key_to_entry_.erase(it);
}

std::vector<SubscriptionKey> WatchedNameIndex::lookup(const DeviceId& device_id,
                                                      const std::string& name) const {
    std::string s = slot(device_id, normalize_name(name));
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = slot_to_keys_.find(s);
    if (it == slot_to_keys_.end()) return {};
    return it->second;
}

bool WatchedNameIndex::is_watched(const DeviceId& device_id, const std::string& name) const {
    std::string s = slot(device_id, normalize_name(name));
    std::shared_lock<std::shared_mutex> lk(mu_);
    return slot_to_keys_.count(s) > 0;
}

size_t WatchedNameIndex::watched_name_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return slot_to_keys_.size();
}

size_t WatchedNameIndex::subscription_count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return key_to_entry_.size();
}

} // namespace device_watch
