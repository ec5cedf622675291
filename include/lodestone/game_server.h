#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

#include "lodestone/instance.h"

extern const char* const INSTANCE_CONFIG_FILE_NAME;

// Reference flavour: a server launched from a configured command line inside
// its instance directory. Its pid is persisted so a later process can see
// whether the server is still running, together with its start time so that a
// recycled pid is not mistaken for the server.
class GameServerInstance : public Instance {
public:
    GameServerInstance(const SetupConfig& config,
                       const InstanceUuid& uuid,
                       const std::string& path,
                       int64_t creation_time,
                       int stop_timeout_sec = 10);

    // Throws std::runtime_error if the instance config is missing or malformed.
    static std::shared_ptr<GameServerInstance> load(const DotLodestoneConfig& marker,
                                                    const std::string& path,
                                                    int stop_timeout_sec = 10);

    InstanceUuid uuid() const override;
    std::string name() const override;
    std::string path() const override;
    uint32_t port() const override;
    InstanceState state() const override;
    InstanceInfo info() const override;

    void start() override;
    void stop() override;

    bool save_config(std::string& error_message) const;

private:
    InstanceState state_locked() const;
    bool server_alive_locked() const;
    bool save_config_locked(std::string& error_message) const;

    mutable std::mutex mutex_;
    InstanceUuid uuid_;
    std::string name_;
    std::string description_;
    std::string path_;
    uint32_t port_;
    GameType game_type_;
    Flavour flavour_;
    std::vector<std::string> command_;
    int64_t creation_time_;
    int stop_timeout_sec_;
    pid_t pid_ = 0;
    uint64_t pid_start_time_ = 0;
    bool stopping_ = false;
};

class GameServerFactory : public InstanceFactory {
public:
    explicit GameServerFactory(int stop_timeout_sec = 10) : stop_timeout_sec_(stop_timeout_sec) {}

    SetupConfig construct_setup_config(const json& manifest, GameType game_type) override;
    std::shared_ptr<Instance> create_instance(const SetupConfig& config,
                                              const DotLodestoneConfig& marker,
                                              const std::string& path,
                                              EventId event_id,
                                              EventBroadcaster& events) override;
    std::shared_ptr<Instance> restore_instance(const DotLodestoneConfig& marker,
                                               const std::string& path) override;

private:
    int stop_timeout_sec_;
};
