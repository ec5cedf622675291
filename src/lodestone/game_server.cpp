#include "lodestone/game_server.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "lodestone/error.h"
#include "lodestone/filesystem.h"
#include "lodestone/options.h"
#include "lodestone/process.h"

const char* const INSTANCE_CONFIG_FILE_NAME = ".lodestone_instance.json";

namespace {

const uint32_t DEFAULT_PORT = 25565;
const size_t MAX_NAME_LENGTH = 100;

std::vector<std::string> default_command() {
    return {"java", "-jar", "server.jar", "nogui"};
}

// server.properties is line oriented; an embedded line break would inject a key.
bool has_line_break(const std::string& value) {
    return value.find_first_of("\r\n") != std::string::npos;
}

std::string setting_value(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

bool copy_file(const std::string& from, const std::string& to, std::string& error_message) {
    std::ifstream in(from, std::ios::binary);
    if (!in) {
        error_message = "Server binary not found: " + from;
        return false;
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out) {
        error_message = "Failed to create " + to;
        return false;
    }
    out << in.rdbuf();
    out.flush();
    if (!out) {
        error_message = "Failed to copy " + from + " to " + to;
        return false;
    }
    return true;
}

std::string render_properties(const SetupConfig& config) {
    std::ostringstream oss;
    oss << "# Generated by lodestone\n";
    oss << "server-port=" << config.port << "\n";
    if (!config.description.empty()) {
        oss << "motd=" << config.description << "\n";
    }
    for (auto it = config.settings.begin(); it != config.settings.end(); ++it) {
        if (it.key() == "server-port") {
            continue;
        }
        oss << it.key() << "=" << setting_value(it.value()) << "\n";
    }
    return oss.str();
}

} // namespace

GameServerInstance::GameServerInstance(const SetupConfig& config,
                                       const InstanceUuid& uuid,
                                       const std::string& path,
                                       int64_t creation_time,
                                       int stop_timeout_sec)
    : uuid_(uuid),
      name_(config.name),
      description_(config.description),
      path_(path),
      port_(config.port),
      game_type_(config.game_type),
      flavour_(config.flavour),
      command_(config.command),
      creation_time_(creation_time),
      stop_timeout_sec_(stop_timeout_sec) {}

std::shared_ptr<GameServerInstance> GameServerInstance::load(const DotLodestoneConfig& marker,
                                                             const std::string& path,
                                                             int stop_timeout_sec) {
    std::string config_path = path_join(path, INSTANCE_CONFIG_FILE_NAME);
    std::string contents;
    std::string error;
    if (!read_file_contents(config_path, contents, error)) {
        throw std::runtime_error(error);
    }
    json j = json::parse(contents);

    SetupConfig config;
    j.at("name").get_to(config.name);
    j.at("port").get_to(config.port);
    config.game_type = marker.game_type;
    config.flavour = flavour_for(marker.game_type);
    if (j.contains("flavour")) {
        auto flavour = parse_flavour(j.at("flavour").get<std::string>());
        if (flavour) {
            config.flavour = *flavour;
        }
    }
    if (j.contains("description")) {
        j.at("description").get_to(config.description);
    }
    if (j.contains("command")) {
        j.at("command").get_to(config.command);
    }
    int64_t creation_time = 0;
    if (j.contains("creation_time")) {
        j.at("creation_time").get_to(creation_time);
    }

    auto instance = std::make_shared<GameServerInstance>(config, marker.uuid, path, creation_time,
                                                         stop_timeout_sec);
    if (j.contains("pid")) {
        j.at("pid").get_to(instance->pid_);
    }
    if (j.contains("pid_start_time")) {
        j.at("pid_start_time").get_to(instance->pid_start_time_);
    }
    return instance;
}

InstanceUuid GameServerInstance::uuid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uuid_;
}

std::string GameServerInstance::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

std::string GameServerInstance::path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path_;
}

uint32_t GameServerInstance::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_;
}

InstanceState GameServerInstance::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked();
}

InstanceState GameServerInstance::state_locked() const {
    if (stopping_) {
        return InstanceState::Stopping;
    }
    return server_alive_locked() ? InstanceState::Running : InstanceState::Stopped;
}

// A persisted pid only names the server while the process behind it has the
// start time recorded at spawn. The kernel may have handed the pid to another
// process since.
bool GameServerInstance::server_alive_locked() const {
    if (!process_alive(pid_)) {
        return false;
    }
    uint64_t start_time = 0;
    if (!process_start_time(pid_, start_time)) {
        return false;
    }
    return start_time == pid_start_time_;
}

InstanceInfo GameServerInstance::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    InstanceInfo info;
    info.uuid = uuid_;
    info.name = name_;
    info.game_type = game_type_;
    info.flavour = flavour_;
    info.description = description_;
    info.path = path_;
    info.port = port_;
    info.state = state_locked();
    info.creation_time = creation_time_;
    return info;
}

void GameServerInstance::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        throw ApiError(ErrorKind::BadRequest, "Instance is stopping");
    }
    if (state_locked() == InstanceState::Running) {
        throw ApiError(ErrorKind::BadRequest, "Instance is already running");
    }
    if (command_.empty()) {
        throw ApiError(ErrorKind::BadRequest, "Instance has no start command");
    }
    pid_t pid = 0;
    std::string error;
    if (!spawn_process(command_, path_, path_join(path_, "server.log"), pid, error)) {
        throw ApiError(ErrorKind::IOFailure, error);
    }
    pid_ = pid;
    pid_start_time_ = 0;
    if (!process_start_time(pid, pid_start_time_)) {
        log_warning("Failed to read start time of pid " + std::to_string(pid));
    }
    log_debug("Instance '" + name_ + "' started with pid " + std::to_string(pid));
    if (!save_config_locked(error)) {
        log_warning("Failed to persist pid of instance '" + name_ + "': " + error);
    }
}

// The mutex is released while the process tree is terminated so that info()
// keeps answering, with Stopping, for the whole stop timeout.
void GameServerInstance::stop() {
    pid_t pid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_locked() != InstanceState::Running) {
            throw ApiError(ErrorKind::BadRequest, "Instance is not running");
        }
        stopping_ = true;
        pid = pid_;
    }

    std::string error;
    bool terminated = terminate_process(pid, stop_timeout_sec_, error);

    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
    if (!terminated) {
        throw ApiError(ErrorKind::IOFailure, error);
    }
    log_debug("Instance '" + name_ + "' stopped");
    pid_ = 0;
    pid_start_time_ = 0;
    if (!save_config_locked(error)) {
        log_warning("Failed to persist stopped state of instance '" + name_ + "': " + error);
    }
}

bool GameServerInstance::save_config(std::string& error_message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_config_locked(error_message);
}

bool GameServerInstance::save_config_locked(std::string& error_message) const {
    json j = {
            {"name", name_},
            {"description", description_},
            {"port", port_},
            {"flavour", flavour_name(flavour_)},
            {"command", command_},
            {"creation_time", creation_time_},
            {"pid", pid_},
            {"pid_start_time", pid_start_time_}
    };
    return write_file_contents(path_join(path_, INSTANCE_CONFIG_FILE_NAME), j.dump(4), error_message);
}

SetupConfig GameServerFactory::construct_setup_config(const json& manifest, GameType game_type) {
    if (!manifest.is_object()) {
        throw ApiError(ErrorKind::BadRequest, "Manifest must be a JSON object");
    }
    SetupConfig config;
    config.game_type = game_type;
    config.flavour = flavour_for(game_type);

    if (!manifest.contains("name") || !manifest.at("name").is_string()) {
        throw ApiError(ErrorKind::BadRequest, "Manifest field 'name' is required");
    }
    config.name = manifest.at("name").get<std::string>();
    if (config.name.empty() || config.name.size() > MAX_NAME_LENGTH) {
        throw ApiError(ErrorKind::BadRequest, "Instance name must be 1 to 100 characters");
    }
    if (config.name.find_first_of("/\\") != std::string::npos || config.name == "." || config.name == "..") {
        throw ApiError(ErrorKind::BadRequest, "Instance name must not contain path separators");
    }

    config.port = DEFAULT_PORT;
    if (manifest.contains("port")) {
        const json& port = manifest.at("port");
        if (!port.is_number_integer() || port.get<int64_t>() < 1 || port.get<int64_t>() > 65535) {
            throw ApiError(ErrorKind::BadRequest, "Manifest field 'port' must be an integer in 1..65535");
        }
        config.port = static_cast<uint32_t>(port.get<int64_t>());
    }

    if (manifest.contains("description")) {
        if (!manifest.at("description").is_string()) {
            throw ApiError(ErrorKind::BadRequest, "Manifest field 'description' must be a string");
        }
        config.description = manifest.at("description").get<std::string>();
        if (has_line_break(config.description)) {
            throw ApiError(ErrorKind::BadRequest, "Manifest field 'description' must be a single line");
        }
    }

    config.command = default_command();
    if (manifest.contains("command")) {
        const json& command = manifest.at("command");
        if (!command.is_array() || command.empty()) {
            throw ApiError(ErrorKind::BadRequest, "Manifest field 'command' must be a non-empty array");
        }
        config.command.clear();
        for (const auto& arg : command) {
            if (!arg.is_string()) {
                throw ApiError(ErrorKind::BadRequest, "Manifest field 'command' must contain only strings");
            }
            config.command.push_back(arg.get<std::string>());
        }
    }

    if (manifest.contains("settings")) {
        const json& settings = manifest.at("settings");
        if (!settings.is_object()) {
            throw ApiError(ErrorKind::BadRequest, "Manifest field 'settings' must be an object");
        }
        for (auto it = settings.begin(); it != settings.end(); ++it) {
            if (it.key().empty() || has_line_break(it.key()) || it.key().find('=') != std::string::npos) {
                throw ApiError(ErrorKind::BadRequest, "Setting names must be non-empty single lines without '='");
            }
            if (!it.value().is_primitive() || it.value().is_null()) {
                throw ApiError(ErrorKind::BadRequest, "Setting '" + it.key() + "' must be a scalar");
            }
            if (it.value().is_string() && has_line_break(it.value().get<std::string>())) {
                throw ApiError(ErrorKind::BadRequest, "Setting '" + it.key() + "' must be a single line");
            }
        }
        config.settings = settings;
    }

    if (manifest.contains("source")) {
        if (!manifest.at("source").is_string()) {
            throw ApiError(ErrorKind::BadRequest, "Manifest field 'source' must be a string");
        }
        config.source = manifest.at("source").get<std::string>();
    }
    return config;
}

std::shared_ptr<Instance> GameServerFactory::create_instance(const SetupConfig& config,
                                                             const DotLodestoneConfig& marker,
                                                             const std::string& path,
                                                             EventId event_id,
                                                             EventBroadcaster&) {
    log_debug("Provisioning " + std::string(flavour_name(config.flavour)) + " server '" + config.name +
              "' in " + path + " (event " + std::to_string(event_id) + ")");
    std::string error;
    if (!config.source.empty()) {
        if (!copy_file(config.source, path_join(path, "server.jar"), error)) {
            throw std::runtime_error(error);
        }
    }
    if (!write_file_contents(path_join(path, "server.properties"), render_properties(config), error)) {
        throw std::runtime_error(error);
    }
    auto instance = std::make_shared<GameServerInstance>(config, marker.uuid, path, unix_time_now(),
                                                         stop_timeout_sec_);
    if (!instance->save_config(error)) {
        throw std::runtime_error(error);
    }
    return instance;
}

std::shared_ptr<Instance> GameServerFactory::restore_instance(const DotLodestoneConfig& marker,
                                                              const std::string& path) {
    return GameServerInstance::load(marker, path, stop_timeout_sec_);
}
