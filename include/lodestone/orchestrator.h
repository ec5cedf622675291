#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lodestone/events.h"
#include "lodestone/instance.h"
#include "lodestone/ports.h"
#include "lodestone/registry.h"
#include "lodestone/tasks.h"
#include "lodestone/types.h"
#include "lodestone/users.h"

using json = nlohmann::json;

// Create, delete, list and inspect workflows over the instance registry.
// Every public operation takes the caller's bearer token and throws ApiError
// for authorization and validation failures before mutating anything.
class InstanceManager {
public:
    InstanceManager(std::string instances_root, UserStore& users, InstanceFactory& factory);
    InstanceManager(const InstanceManager&) = delete;
    InstanceManager& operator=(const InstanceManager&) = delete;

    // Instances the requester may view, oldest first.
    std::vector<InstanceInfo> list_instances(const std::string& token);
    InstanceInfo get_instance_info(const std::string& token, const InstanceUuid& uuid);

    // Returns as soon as the directory and marker exist; provisioning finishes
    // in the background and reports through progression events.
    InstanceUuid create_instance(const std::string& token,
                                 const std::string& game_type,
                                 const json& manifest);

    // The instance must be stopped. Once the marker is gone the instance is
    // unregistered even if removing its files fails; that failure is thrown as
    // IOFailure after the fact.
    void delete_instance(const std::string& token, const InstanceUuid& uuid);

    void start_instance(const std::string& token, const InstanceUuid& uuid);
    void stop_instance(const std::string& token, const InstanceUuid& uuid);

    // Registers every managed directory under the instances root. Returns the
    // number of instances restored.
    std::size_t restore_instances();

    const std::string& instances_root() const { return instances_root_; }
    UserStore& users() { return users_; }
    InstanceRegistry& registry() { return registry_; }
    PortAllocator& ports() { return ports_; }
    EventBroadcaster& events() { return events_; }
    TaskRunner& tasks() { return tasks_; }

private:
    InstanceUuid claim_instance_uuid();
    void provision(const SetupConfig& config,
                   const DotLodestoneConfig& marker,
                   const std::string& setup_path,
                   EventId event_id,
                   const std::string& requester_uid);

    std::string instances_root_;
    UserStore& users_;
    InstanceFactory& factory_;
    InstanceRegistry registry_;
    PortAllocator ports_;
    EventBroadcaster events_;
    // Declared last so pending provisioning finishes before the members it uses go away.
    TaskRunner tasks_;
};
