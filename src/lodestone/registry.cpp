#include "lodestone/registry.h"

bool InstanceRegistry::insert(const std::shared_ptr<Instance>& instance) {
    if (!instance) {
        return false;
    }
    InstanceUuid uuid = instance->uuid();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instances_.emplace(uuid, instance).second) {
        return false;
    }
    pending_prefixes_.erase(uuid.short_prefix());
    return true;
}

std::shared_ptr<Instance> InstanceRegistry::remove(const InstanceUuid& uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(uuid);
    if (it == instances_.end()) {
        return nullptr;
    }
    std::shared_ptr<Instance> removed = it->second;
    instances_.erase(it);
    return removed;
}

std::shared_ptr<Instance> InstanceRegistry::get(const InstanceUuid& uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(uuid);
    return it == instances_.end() ? nullptr : it->second;
}

bool InstanceRegistry::contains(const InstanceUuid& uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.count(uuid) != 0;
}

std::optional<InstanceInfo> InstanceRegistry::inspect(const InstanceUuid& uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(uuid);
    if (it == instances_.end()) {
        return std::nullopt;
    }
    return it->second->info();
}

std::vector<std::shared_ptr<Instance>> InstanceRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Instance>> result;
    result.reserve(instances_.size());
    for (const auto& entry : instances_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<InstanceInfo> InstanceRegistry::list_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InstanceInfo> result;
    result.reserve(instances_.size());
    for (const auto& entry : instances_) {
        result.push_back(entry.second->info());
    }
    return result;
}

std::size_t InstanceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

bool InstanceRegistry::claim_short_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (prefix_in_use_locked(prefix)) {
        return false;
    }
    pending_prefixes_.insert(prefix);
    return true;
}

void InstanceRegistry::release_short_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_prefixes_.erase(prefix);
}

bool InstanceRegistry::prefix_in_use_locked(const std::string& prefix) const {
    if (pending_prefixes_.count(prefix) != 0) {
        return true;
    }
    for (const auto& entry : instances_) {
        if (entry.first.short_prefix() == prefix) {
            return true;
        }
    }
    return false;
}
