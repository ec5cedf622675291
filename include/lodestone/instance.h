#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lodestone/events.h"
#include "lodestone/types.h"

using json = nlohmann::json;

// What a flavour needs to provision a new instance, derived from the
// user-supplied manifest.
struct SetupConfig {
    std::string name;
    uint32_t port = 25565;
    GameType game_type = GameType::MinecraftJavaVanilla;
    Flavour flavour = Flavour::Vanilla;
    std::string description;
    std::vector<std::string> command;
    json settings = json::object();
    // Optional server binary copied into the instance as server.jar.
    std::string source;
};

// A managed game server. Implementations are internally synchronized; the
// registry hands out shared handles so long operations run without its lock.
class Instance {
public:
    virtual ~Instance() = default;

    virtual InstanceUuid uuid() const = 0;
    virtual std::string name() const = 0;
    virtual std::string path() const = 0;
    virtual uint32_t port() const = 0;
    virtual InstanceState state() const = 0;
    virtual InstanceInfo info() const = 0;

    // Both throw ApiError on failure.
    virtual void start() = 0;
    virtual void stop() = 0;
};

class InstanceFactory {
public:
    virtual ~InstanceFactory() = default;

    // Throws ApiError(BadRequest) for an unusable manifest.
    virtual SetupConfig construct_setup_config(const json& manifest, GameType game_type) = 0;

    // Provisions the server files in path. Runs detached from the request that
    // asked for it; may report intermediate progress through events. Throws on failure.
    virtual std::shared_ptr<Instance> create_instance(const SetupConfig& config,
                                                      const DotLodestoneConfig& marker,
                                                      const std::string& path,
                                                      EventId event_id,
                                                      EventBroadcaster& events) = 0;

    // Rebuilds the handle of an instance provisioned by an earlier process.
    virtual std::shared_ptr<Instance> restore_instance(const DotLodestoneConfig& marker,
                                                       const std::string& path) = 0;
};
