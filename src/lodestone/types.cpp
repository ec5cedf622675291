#include "lodestone/types.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

const char* const MARKER_FILE_NAME = ".lodestone_config";

namespace {

const char* const UUID_PREFIX = "INSTANCE_";

std::mt19937_64& uuid_engine() {
    thread_local std::mt19937_64 engine([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());
    return engine;
}

} // namespace

InstanceUuid InstanceUuid::generate() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(uuid_engine());
    uint64_t lo = dist(uuid_engine());
    // RFC 4122 version 4, variant 1.
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xffff) << '-'
        << std::setw(4) << (hi & 0xffff) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xffffffffffffULL);
    return InstanceUuid{UUID_PREFIX + oss.str()};
}

std::string InstanceUuid::no_prefix() const {
    const std::string prefix = UUID_PREFIX;
    if (value.compare(0, prefix.size(), prefix) == 0) {
        return value.substr(prefix.size());
    }
    return value;
}

std::string InstanceUuid::short_prefix() const {
    return no_prefix().substr(0, 8);
}

const char* game_type_name(GameType type) {
    switch (type) {
        case GameType::MinecraftJavaVanilla:
            return "MinecraftJavaVanilla";
        case GameType::MinecraftForge:
            return "MinecraftForge";
        case GameType::MinecraftFabric:
            return "MinecraftFabric";
        case GameType::MinecraftPaper:
            return "MinecraftPaper";
    }
    return "MinecraftJavaVanilla";
}

std::optional<GameType> parse_game_type(const std::string& name) {
    if (name == "MinecraftJavaVanilla") {
        return GameType::MinecraftJavaVanilla;
    }
    if (name == "MinecraftForge") {
        return GameType::MinecraftForge;
    }
    if (name == "MinecraftFabric") {
        return GameType::MinecraftFabric;
    }
    if (name == "MinecraftPaper") {
        return GameType::MinecraftPaper;
    }
    return std::nullopt;
}

Flavour flavour_for(GameType type) {
    switch (type) {
        case GameType::MinecraftJavaVanilla:
            return Flavour::Vanilla;
        case GameType::MinecraftForge:
            return Flavour::Forge;
        case GameType::MinecraftFabric:
            return Flavour::Fabric;
        case GameType::MinecraftPaper:
            return Flavour::Paper;
    }
    return Flavour::Vanilla;
}

const char* flavour_name(Flavour flavour) {
    switch (flavour) {
        case Flavour::Vanilla:
            return "vanilla";
        case Flavour::Forge:
            return "forge";
        case Flavour::Fabric:
            return "fabric";
        case Flavour::Paper:
            return "paper";
    }
    return "vanilla";
}

std::optional<Flavour> parse_flavour(const std::string& name) {
    if (name == "vanilla") {
        return Flavour::Vanilla;
    }
    if (name == "forge") {
        return Flavour::Forge;
    }
    if (name == "fabric") {
        return Flavour::Fabric;
    }
    if (name == "paper") {
        return Flavour::Paper;
    }
    return std::nullopt;
}

const char* instance_state_name(InstanceState state) {
    switch (state) {
        case InstanceState::Starting:
            return "starting";
        case InstanceState::Running:
            return "running";
        case InstanceState::Stopping:
            return "stopping";
        case InstanceState::Stopped:
            return "stopped";
        case InstanceState::Error:
            return "error";
    }
    return "error";
}

json InstanceInfo::to_json_object() const {
    return json{
            {"uuid", uuid.value},
            {"name", name},
            {"game_type", game_type_name(game_type)},
            {"flavour", flavour_name(flavour)},
            {"description", description},
            {"path", path},
            {"port", port},
            {"state", instance_state_name(state)},
            {"creation_time", creation_time}
    };
}

json DotLodestoneConfig::to_json_object() const {
    return json{
            {"uuid", uuid.value},
            {"game_type", game_type_name(game_type)}
    };
}

std::string DotLodestoneConfig::to_json() const {
    return to_json_object().dump(4);
}

DotLodestoneConfig DotLodestoneConfig::from_json(const std::string& json_str) {
    DotLodestoneConfig config;
    json j = json::parse(json_str);
    j.at("uuid").get_to(config.uuid.value);
    std::string type_name = j.at("game_type").get<std::string>();
    auto type = parse_game_type(type_name);
    if (!type) {
        throw std::runtime_error("Unknown game type in marker: " + type_name);
    }
    config.game_type = *type;
    return config;
}

std::string marker_path(const std::string& instance_root) {
    return instance_root + "/" + MARKER_FILE_NAME;
}

bool save_marker(const std::string& instance_root,
                 const DotLodestoneConfig& config,
                 std::string& error_message) {
    std::string path = marker_path(instance_root);
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        error_message = "Failed to open " + path + ": " + std::strerror(errno);
        return false;
    }
    ofs << config.to_json();
    ofs.flush();
    if (!ofs) {
        error_message = "Failed to write " + path;
        return false;
    }
    return true;
}

DotLodestoneConfig load_marker(const std::string& instance_root) {
    std::string path = marker_path(instance_root);
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Failed to load marker file: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return DotLodestoneConfig::from_json(buffer.str());
}

std::string iso8601_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto seconds = system_clock::to_time_t(now);
    std::tm tm {};
    gmtime_r(&seconds, &tm);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

int64_t unix_time_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}
