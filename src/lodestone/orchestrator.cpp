#include "lodestone/orchestrator.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <stdexcept>
#include <unistd.h>
#include <utility>

#include "lodestone/error.h"
#include "lodestone/filesystem.h"
#include "lodestone/options.h"
#include "lodestone/permissions.h"

namespace {

const double PROGRESSION_TOTAL = 10.0;

std::string trim_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

InstanceManager::InstanceManager(std::string instances_root, UserStore& users, InstanceFactory& factory)
    : instances_root_(trim_trailing_slash(std::move(instances_root))), users_(users), factory_(factory) {}

std::vector<InstanceInfo> InstanceManager::list_instances(const std::string& token) {
    User requester = users_.try_auth_or_err(token);
    std::vector<InstanceInfo> result;
    for (const auto& info : registry_.list_info()) {
        if (can_perform_action(requester, UserAction::view_instance(info.uuid))) {
            result.push_back(info);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const InstanceInfo& a, const InstanceInfo& b) {
        return a.creation_time < b.creation_time;
    });
    return result;
}

InstanceInfo InstanceManager::get_instance_info(const std::string& token, const InstanceUuid& uuid) {
    User requester = users_.try_auth_or_err(token);
    auto info = registry_.inspect(uuid);
    if (!info) {
        throw ApiError(ErrorKind::NotFound, "Instance not found");
    }
    try_action(requester, UserAction::view_instance(uuid));
    return *info;
}

InstanceUuid InstanceManager::claim_instance_uuid() {
    InstanceUuid uuid = InstanceUuid::generate();
    while (!registry_.claim_short_prefix(uuid.short_prefix())) {
        uuid = InstanceUuid::generate();
    }
    return uuid;
}

InstanceUuid InstanceManager::create_instance(const std::string& token,
                                              const std::string& game_type,
                                              const json& manifest) {
    User requester = users_.try_auth_or_err(token);
    try_action(requester, UserAction::create_instance());

    auto type = parse_game_type(game_type);
    if (!type) {
        throw ApiError(ErrorKind::BadRequest, "Unknown game type '" + game_type + "'");
    }

    InstanceUuid uuid = claim_instance_uuid();
    std::string setup_path;
    SetupConfig config;
    try {
        config = factory_.construct_setup_config(manifest, *type);
        if (ports_.is_reserved(config.port)) {
            throw ApiError(ErrorKind::BadRequest, "Port " + std::to_string(config.port) + " is already in use");
        }

        setup_path = instances_root_ + "/" + config.name + "-" + uuid.short_prefix();
        if (!ensure_directory(setup_path, 0755)) {
            throw ApiError(ErrorKind::IOFailure,
                           "Failed to create instance directory: " + std::string(std::strerror(errno)));
        }
    } catch (const std::exception&) {
        registry_.release_short_prefix(uuid.short_prefix());
        throw;
    }

    DotLodestoneConfig marker;
    marker.uuid = uuid;
    marker.game_type = *type;
    std::string error;
    if (!save_marker(setup_path, marker, error)) {
        registry_.release_short_prefix(uuid.short_prefix());
        std::string cleanup_error;
        if (!remove_tree(setup_path, cleanup_error)) {
            log_warning("Failed to remove " + setup_path + " after marker write failed: " + cleanup_error);
        }
        throw ApiError(ErrorKind::IOFailure, "Failed to write .lodestone_config file: " + error);
    }

    auto start = new_progression_start(
            "Setting up " + std::string(flavour_name(config.flavour)) + " server " + config.name,
            uuid,
            PROGRESSION_TOTAL,
            ProgressionStartValue::instance_creation(uuid, config.name, config.port,
                                                     flavour_name(config.flavour), game_type_name(*type)),
            CausedBy::user(requester.uid, requester.username));
    events_.send(start.first);
    EventId event_id = start.second;

    std::string requester_uid = requester.uid;
    tasks_.spawn("provision " + uuid.value, [this, config, marker, setup_path, event_id, requester_uid]() {
        provision(config, marker, setup_path, event_id, requester_uid);
    });
    log_info("Instance " + uuid.value + " (" + config.name + ") is being provisioned in " + setup_path);
    return uuid;
}

void InstanceManager::provision(const SetupConfig& config,
                                const DotLodestoneConfig& marker,
                                const std::string& setup_path,
                                EventId event_id,
                                const std::string& requester_uid) {
    std::shared_ptr<Instance> instance;
    try {
        instance = factory_.create_instance(config, marker, setup_path, event_id, events_);
        if (!instance) {
            throw std::runtime_error("flavour returned no instance");
        }
    } catch (const std::exception& e) {
        events_.send(new_progression_end(event_id, false,
                                         std::string("Instance creation failed: ") + e.what(),
                                         std::nullopt));
        registry_.release_short_prefix(marker.uuid.short_prefix());
        std::string cleanup_error;
        if (!remove_tree(setup_path, cleanup_error)) {
            throw std::runtime_error("Failed to remove directory after instance creation failed: " +
                                     cleanup_error);
        }
        log_info("Rolled back instance " + marker.uuid.value + ": " + e.what());
        return;
    }

    events_.send(new_progression_end(event_id, true, std::string("Instance created successfully"),
                                     ProgressionEndValue::instance_creation(instance->info())));
    ports_.reserve(config.port);

    std::string error;
    if (!users_.grant_creator_permissions(requester_uid, marker.uuid, error)) {
        log_warning("Failed to update permissions for user " + requester_uid + ": " + error);
    }

    if (!registry_.insert(instance)) {
        throw std::runtime_error("Instance " + marker.uuid.value + " was already registered");
    }
    log_info("Instance " + marker.uuid.value + " registered");
}

void InstanceManager::delete_instance(const std::string& token, const InstanceUuid& uuid) {
    User requester = users_.try_auth_or_err(token);
    try_action(requester, UserAction::delete_instance());

    auto info = registry_.inspect(uuid);
    if (!info) {
        throw ApiError(ErrorKind::NotFound, "Instance not found");
    }
    if (info->state != InstanceState::Stopped) {
        throw ApiError(ErrorKind::BadRequest, "Instance must be stopped before deletion");
    }

    auto start = new_progression_start("Deleting instance " + info->name,
                                       uuid,
                                       PROGRESSION_TOTAL,
                                       ProgressionStartValue::instance_delete(uuid),
                                       CausedBy::user(requester.uid, requester.username));
    events_.send(start.first);
    EventId event_id = start.second;

    std::string marker_file = marker_path(info->path);
    if (unlink(marker_file.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        events_.send(new_progression_end(event_id, false,
                                         std::string("Failed to delete .lodestone_config. Instance not deleted"),
                                         std::nullopt));
        throw ApiError(ErrorKind::IOFailure,
                       "Failed to delete .lodestone_config file. Instance not deleted: " + reason);
    }

    ports_.release(info->port);
    registry_.remove(uuid);

    std::string error;
    if (!remove_tree(info->path, error)) {
        events_.send(new_progression_end(event_id, false,
                                         "Failed to delete some or all of instance's files: " + error,
                                         std::nullopt));
        throw ApiError(ErrorKind::IOFailure,
                       "Instance was unregistered but some of its files could not be deleted: " + error);
    }
    events_.send(new_progression_end(event_id, true, std::string("Instance deleted successfully"),
                                     ProgressionEndValue::instance_delete(uuid)));
    log_info("Instance " + uuid.value + " deleted");
}

void InstanceManager::start_instance(const std::string& token, const InstanceUuid& uuid) {
    User requester = users_.try_auth_or_err(token);
    try_action(requester, UserAction::start_instance(uuid));
    auto instance = registry_.get(uuid);
    if (!instance) {
        throw ApiError(ErrorKind::NotFound, "Instance not found");
    }
    instance->start();
}

void InstanceManager::stop_instance(const std::string& token, const InstanceUuid& uuid) {
    User requester = users_.try_auth_or_err(token);
    try_action(requester, UserAction::stop_instance(uuid));
    auto instance = registry_.get(uuid);
    if (!instance) {
        throw ApiError(ErrorKind::NotFound, "Instance not found");
    }
    instance->stop();
}

std::size_t InstanceManager::restore_instances() {
    DIR* dir = opendir(instances_root_.c_str());
    if (!dir) {
        log_warning("Failed to open instances root " + instances_root_ + ": " + std::strerror(errno));
        return 0;
    }
    std::vector<std::string> candidates;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        std::string candidate = path_join(instances_root_, entry->d_name);
        if (is_directory(candidate)) {
            candidates.push_back(candidate);
        }
    }
    closedir(dir);
    std::sort(candidates.begin(), candidates.end());

    std::size_t restored = 0;
    for (const auto& path : candidates) {
        if (!path_exists(marker_path(path))) {
            log_debug("Skipping " + path + ": no .lodestone_config");
            continue;
        }
        try {
            DotLodestoneConfig marker = load_marker(path);
            if (registry_.contains(marker.uuid)) {
                log_warning("Duplicate instance " + marker.uuid.value + " in " + path);
                continue;
            }
            auto instance = factory_.restore_instance(marker, path);
            if (!instance) {
                log_warning("Flavour could not restore instance in " + path);
                continue;
            }
            if (!registry_.insert(instance)) {
                log_warning("Instance " + marker.uuid.value + " in " + path + " could not be registered");
                continue;
            }
            ports_.reserve(instance->port());
            ++restored;
        } catch (const std::exception& e) {
            log_warning("Failed to restore instance in " + path + ": " + e.what());
        }
    }
    log_debug("Restored " + std::to_string(restored) + " instance(s) from " + instances_root_);
    return restored;
}
