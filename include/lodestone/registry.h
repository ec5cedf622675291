#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "lodestone/instance.h"
#include "lodestone/types.h"

// Authoritative map from identity to instance handle. Every access holds the
// registry lock for the map access only; callers act on the returned handles
// after the lock is released.
class InstanceRegistry {
public:
    // Returns false if the identity is already registered.
    bool insert(const std::shared_ptr<Instance>& instance);
    std::shared_ptr<Instance> remove(const InstanceUuid& uuid);
    std::shared_ptr<Instance> get(const InstanceUuid& uuid) const;
    bool contains(const InstanceUuid& uuid) const;

    // Reads the instance's info while the registry lock is held.
    std::optional<InstanceInfo> inspect(const InstanceUuid& uuid) const;

    std::vector<std::shared_ptr<Instance>> list() const;
    std::vector<InstanceInfo> list_info() const;
    std::size_t size() const;

    // Short-prefix reservations for identities that are being provisioned.
    // A claim fails if a registered or pending identity already uses the prefix.
    bool claim_short_prefix(const std::string& prefix);
    void release_short_prefix(const std::string& prefix);

private:
    bool prefix_in_use_locked(const std::string& prefix) const;

    mutable std::mutex mutex_;
    std::map<InstanceUuid, std::shared_ptr<Instance>> instances_;
    std::set<std::string> pending_prefixes_;
};
