#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

extern const char* const MARKER_FILE_NAME;

struct InstanceUuid {
    std::string value;

    static InstanceUuid generate();

    std::string no_prefix() const;
    // First 8 characters of no_prefix(); used in directory names.
    std::string short_prefix() const;

    bool operator==(const InstanceUuid& other) const { return value == other.value; }
    bool operator!=(const InstanceUuid& other) const { return value != other.value; }
    bool operator<(const InstanceUuid& other) const { return value < other.value; }
};

enum class GameType {
    MinecraftJavaVanilla,
    MinecraftForge,
    MinecraftFabric,
    MinecraftPaper
};

enum class Flavour {
    Vanilla,
    Forge,
    Fabric,
    Paper
};

enum class InstanceState {
    Starting,
    Running,
    Stopping,
    Stopped,
    Error
};

const char* game_type_name(GameType type);
std::optional<GameType> parse_game_type(const std::string& name);
Flavour flavour_for(GameType type);
const char* flavour_name(Flavour flavour);
std::optional<Flavour> parse_flavour(const std::string& name);
const char* instance_state_name(InstanceState state);

struct InstanceInfo {
    InstanceUuid uuid;
    std::string name;
    GameType game_type = GameType::MinecraftJavaVanilla;
    Flavour flavour = Flavour::Vanilla;
    std::string description;
    std::string path;
    uint32_t port = 0;
    InstanceState state = InstanceState::Stopped;
    int64_t creation_time = 0;

    json to_json_object() const;
};

// Contents of <instance-root>/.lodestone_config.
struct DotLodestoneConfig {
    InstanceUuid uuid;
    GameType game_type = GameType::MinecraftJavaVanilla;

    json to_json_object() const;
    std::string to_json() const;
    static DotLodestoneConfig from_json(const std::string& json_str);
};

std::string marker_path(const std::string& instance_root);
bool save_marker(const std::string& instance_root,
                 const DotLodestoneConfig& config,
                 std::string& error_message);
DotLodestoneConfig load_marker(const std::string& instance_root);

std::string iso8601_now();
int64_t unix_time_now();
