// =============================================================================
// FILE: src/subscription/subscription_registry.cpp
// =============================================================================
#include "subscription/subscription_registry.h"
#include "common/logger.h"
#include <algorithm>

namespace device_watch {

Result SubscriptionRegistry::insert(const std::string& id, const SubscriptionDescriptor& descriptor) {
    if (id.empty()) return Result::kInvalidArgument;

    std::lock_guard<std::mutex> lk(mu_);
    if (by_id_.count(id) || id_by_key_.count(descriptor.key)) {
        LOG_WARN("Registry: insert rejected, id=%s key=%lu already present",
                 id.c_str(), static_cast<unsigned long>(descriptor.key));
        return Result::kAlreadyExists;
    }

    auto desc = std::make_shared<SubscriptionDescriptor>(descriptor);
    desc->current_id = id;
    desc->lifecycle = SubLifecycle::kActive;
    desc->renewal_in_flight = false;

    by_id_.emplace(id, desc);
    active_ids_.insert(id);
    id_by_key_.emplace(desc->key, id);

    LOG_DEBUG("Registry: inserted id=%s key=%lu device=%s (total=%zu)",
              id.c_str(), static_cast<unsigned long>(desc->key),
              desc->device_id.c_str(), by_id_.size());
    return Result::kOk;
}

SubscriptionRegistry::DescriptorPtr SubscriptionRegistry::find_key_locked(SubscriptionKey key) const {
    auto kit = id_by_key_.find(key);
    if (kit == id_by_key_.end()) return nullptr;
    auto it = by_id_.find(kit->second);
    return (it != by_id_.end()) ? it->second : nullptr;
}

void SubscriptionRegistry::erase_locked(const std::string& id, const DescriptorPtr& desc) {
    by_id_.erase(id);
    active_ids_.erase(id);
    id_by_key_.erase(desc->key);
    desc->lifecycle = SubLifecycle::kRemoved;
}

bool SubscriptionRegistry::remove(const std::string& id, SubscriptionDescriptor* removed) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;

    DescriptorPtr desc = it->second;
    erase_locked(id, desc);
    if (removed) *removed = *desc;
    return true;
}

bool SubscriptionRegistry::remove_key(SubscriptionKey key, SubscriptionDescriptor* removed) {
    std::lock_guard<std::mutex> lk(mu_);
    DescriptorPtr desc = find_key_locked(key);
    if (!desc) return false;

    erase_locked(desc->current_id, desc);
    if (removed) *removed = *desc;
    return true;
}

bool SubscriptionRegistry::lookup(const std::string& id, SubscriptionDescriptor& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;
    out = *it->second;
    return true;
}

bool SubscriptionRegistry::lookup_key(SubscriptionKey key, SubscriptionDescriptor& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    DescriptorPtr desc = find_key_locked(key);
    if (!desc) return false;
    out = *desc;
    return true;
}

bool SubscriptionRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_ids_.count(id) > 0;
}

Result SubscriptionRegistry::swap_locked(const std::string& old_id, const std::string& new_id) {
    auto it = by_id_.find(old_id);
    if (it == by_id_.end()) return Result::kNotFound;
    if (new_id.empty()) return Result::kInvalidArgument;
    if (new_id == old_id) return Result::kOk;
    if (by_id_.count(new_id)) return Result::kAlreadyExists;

    DescriptorPtr desc = it->second;
    by_id_.erase(it);
    active_ids_.erase(old_id);

    desc->current_id = new_id;
    by_id_.emplace(new_id, desc);
    active_ids_.insert(new_id);
    id_by_key_[desc->key] = new_id;
    return Result::kOk;
}

Result SubscriptionRegistry::swap_id(const std::string& old_id, const std::string& new_id) {
    std::lock_guard<std::mutex> lk(mu_);
    return swap_locked(old_id, new_id);
}

Result SubscriptionRegistry::begin_renewal(SubscriptionKey key, SubscriptionDescriptor& snapshot) {
    std::lock_guard<std::mutex> lk(mu_);
    DescriptorPtr desc = find_key_locked(key);
    if (!desc) return Result::kNotFound;
    if (desc->renewal_in_flight) return Result::kAlreadyExists;

    desc->renewal_in_flight = true;
    desc->lifecycle = SubLifecycle::kRenewing;
    snapshot = *desc;
    return Result::kOk;
}

Result SubscriptionRegistry::complete_renewal(SubscriptionKey key, const std::string& old_id,
                                              bool ok, const std::string& new_id) {
    std::lock_guard<std::mutex> lk(mu_);
    DescriptorPtr desc = find_key_locked(key);
    if (!desc) return Result::kNotFound;

    desc->renewal_in_flight = false;
    desc->lifecycle = SubLifecycle::kActive;

    if (!ok || new_id.empty()) {
        desc->renewals_failed++;
        return Result::kOk;
    }

    Result r = swap_locked(old_id, new_id);
    if (r != Result::kOk) {
        desc->renewals_failed++;
        return r;
    }
    desc->renewals_ok++;
    desc->last_renewed_at = Clock::now();
    return Result::kOk;
}

std::vector<std::string> SubscriptionRegistry::active_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<std::string>(active_ids_.begin(), active_ids_.end());
}

std::vector<SubscriptionDescriptor> SubscriptionRegistry::get_all() const {
    std::vector<SubscriptionDescriptor> result;
    std::lock_guard<std::mutex> lk(mu_);
    result.reserve(by_id_.size());
    for (const auto& [id, desc] : by_id_) result.push_back(*desc);
    return result;
}

std::vector<SubscriptionDescriptor> SubscriptionRegistry::get_for_device(const DeviceId& device_id) const {
    std::vector<SubscriptionDescriptor> result;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, desc] : by_id_)
        if (desc->device_id == device_id) result.push_back(*desc);
    return result;
}

std::vector<SubscriptionDescriptor> SubscriptionRegistry::drain() {
    std::vector<SubscriptionDescriptor> result;
    std::lock_guard<std::mutex> lk(mu_);
    result.reserve(by_id_.size());
    for (auto& [id, desc] : by_id_) {
        desc->lifecycle = SubLifecycle::kRemoved;
        result.push_back(*desc);
    }
    by_id_.clear();
    active_ids_.clear();
    id_by_key_.clear();
    return result;
}

size_t SubscriptionRegistry::total_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_id_.size();
}

size_t SubscriptionRegistry::count_by_device(const DeviceId& device_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t c = 0;
    for (const auto& [id, desc] : by_id_) if (desc->device_id == device_id) c++;
    return c;
}

NameList SubscriptionRegistry::watched_names_for_device(const DeviceId& device_id) const {
    std::vector<DescriptorPtr> owned;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, desc] : by_id_)
            if (desc->device_id == device_id) owned.push_back(desc);
    }
    // Stable order across calls: oldest subscription first
    std::sort(owned.begin(), owned.end(),
              [](const DescriptorPtr& a, const DescriptorPtr& b) { return a->key < b->key; });

    NameList names;
    std::unordered_set<std::string> seen;
    for (const auto& desc : owned) {
        for (const auto& n : desc->watched_names)
            if (seen.insert(n).second) names.push_back(n);
    }
    return names;
}

} // namespace device_watch
