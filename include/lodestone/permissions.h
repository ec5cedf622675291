#pragma once

#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "lodestone/types.h"

using json = nlohmann::json;

struct UserPermission {
    bool can_create_instance = false;
    bool can_delete_instance = false;
    std::set<std::string> can_view_instance;
    std::set<std::string> can_start_instance;
    std::set<std::string> can_stop_instance;
    std::set<std::string> can_read_instance_file;
    std::set<std::string> can_write_instance_file;

    json to_json_object() const;
    static UserPermission from_json_object(const json& j);
};

struct User {
    std::string uid;
    std::string username;
    std::string token;
    bool is_owner = false;
    UserPermission permissions;

    json to_json_object() const;
    static User from_json_object(const json& j);
};

enum class UserActionKind {
    ViewInstance,
    CreateInstance,
    DeleteInstance,
    ReadInstanceFile,
    WriteInstanceFile,
    StartInstance,
    StopInstance
};

struct UserAction {
    UserActionKind kind = UserActionKind::ViewInstance;
    // Empty for actions that are not scoped to an instance.
    InstanceUuid instance;

    static UserAction view_instance(const InstanceUuid& uuid);
    static UserAction create_instance();
    static UserAction delete_instance();
    static UserAction read_instance_file(const InstanceUuid& uuid);
    static UserAction write_instance_file(const InstanceUuid& uuid);
    static UserAction start_instance(const InstanceUuid& uuid);
    static UserAction stop_instance(const InstanceUuid& uuid);
};

std::string describe_action(const UserAction& action);

// Pure lookup against the user's permission record.
bool can_perform_action(const User& user, const UserAction& action);

// Throws ApiError(Forbidden) when can_perform_action() is false.
void try_action(const User& user, const UserAction& action);

// Adds the grants a user receives on an instance they created.
void grant_creator_permissions(UserPermission& permissions, const InstanceUuid& uuid);
