#include "lodestone/permissions.h"

#include "lodestone/error.h"

namespace {

void read_id_set(const json& j, const char* key, std::set<std::string>& out) {
    if (j.contains(key)) {
        j.at(key).get_to(out);
    }
}

UserAction make_action(UserActionKind kind, const InstanceUuid& uuid = InstanceUuid{}) {
    UserAction action;
    action.kind = kind;
    action.instance = uuid;
    return action;
}

} // namespace

json UserPermission::to_json_object() const {
    return json{
            {"can_create_instance", can_create_instance},
            {"can_delete_instance", can_delete_instance},
            {"can_view_instance", can_view_instance},
            {"can_start_instance", can_start_instance},
            {"can_stop_instance", can_stop_instance},
            {"can_read_instance_file", can_read_instance_file},
            {"can_write_instance_file", can_write_instance_file}
    };
}

UserPermission UserPermission::from_json_object(const json& j) {
    UserPermission permissions;
    if (j.contains("can_create_instance")) {
        j.at("can_create_instance").get_to(permissions.can_create_instance);
    }
    if (j.contains("can_delete_instance")) {
        j.at("can_delete_instance").get_to(permissions.can_delete_instance);
    }
    read_id_set(j, "can_view_instance", permissions.can_view_instance);
    read_id_set(j, "can_start_instance", permissions.can_start_instance);
    read_id_set(j, "can_stop_instance", permissions.can_stop_instance);
    read_id_set(j, "can_read_instance_file", permissions.can_read_instance_file);
    read_id_set(j, "can_write_instance_file", permissions.can_write_instance_file);
    return permissions;
}

json User::to_json_object() const {
    return json{
            {"uid", uid},
            {"username", username},
            {"token", token},
            {"is_owner", is_owner},
            {"permissions", permissions.to_json_object()}
    };
}

User User::from_json_object(const json& j) {
    User user;
    j.at("uid").get_to(user.uid);
    j.at("username").get_to(user.username);
    j.at("token").get_to(user.token);
    if (j.contains("is_owner")) {
        j.at("is_owner").get_to(user.is_owner);
    }
    if (j.contains("permissions")) {
        user.permissions = UserPermission::from_json_object(j.at("permissions"));
    }
    return user;
}

UserAction UserAction::view_instance(const InstanceUuid& uuid) {
    return make_action(UserActionKind::ViewInstance, uuid);
}

UserAction UserAction::create_instance() {
    return make_action(UserActionKind::CreateInstance);
}

UserAction UserAction::delete_instance() {
    return make_action(UserActionKind::DeleteInstance);
}

UserAction UserAction::read_instance_file(const InstanceUuid& uuid) {
    return make_action(UserActionKind::ReadInstanceFile, uuid);
}

UserAction UserAction::write_instance_file(const InstanceUuid& uuid) {
    return make_action(UserActionKind::WriteInstanceFile, uuid);
}

UserAction UserAction::start_instance(const InstanceUuid& uuid) {
    return make_action(UserActionKind::StartInstance, uuid);
}

UserAction UserAction::stop_instance(const InstanceUuid& uuid) {
    return make_action(UserActionKind::StopInstance, uuid);
}

std::string describe_action(const UserAction& action) {
    switch (action.kind) {
        case UserActionKind::ViewInstance:
            return "view instance " + action.instance.value;
        case UserActionKind::CreateInstance:
            return "create instances";
        case UserActionKind::DeleteInstance:
            return "delete instances";
        case UserActionKind::ReadInstanceFile:
            return "read files of instance " + action.instance.value;
        case UserActionKind::WriteInstanceFile:
            return "write files of instance " + action.instance.value;
        case UserActionKind::StartInstance:
            return "start instance " + action.instance.value;
        case UserActionKind::StopInstance:
            return "stop instance " + action.instance.value;
    }
    return "perform this action";
}

bool can_perform_action(const User& user, const UserAction& action) {
    if (user.is_owner) {
        return true;
    }
    const UserPermission& p = user.permissions;
    const std::string& id = action.instance.value;
    switch (action.kind) {
        case UserActionKind::ViewInstance:
            return p.can_view_instance.count(id) != 0;
        case UserActionKind::CreateInstance:
            return p.can_create_instance;
        case UserActionKind::DeleteInstance:
            return p.can_delete_instance;
        case UserActionKind::ReadInstanceFile:
            return p.can_read_instance_file.count(id) != 0;
        case UserActionKind::WriteInstanceFile:
            return p.can_write_instance_file.count(id) != 0;
        case UserActionKind::StartInstance:
            return p.can_start_instance.count(id) != 0;
        case UserActionKind::StopInstance:
            return p.can_stop_instance.count(id) != 0;
    }
    return false;
}

void try_action(const User& user, const UserAction& action) {
    if (!can_perform_action(user, action)) {
        throw ApiError(ErrorKind::Forbidden, "Not authorized to " + describe_action(action));
    }
}

void grant_creator_permissions(UserPermission& permissions, const InstanceUuid& uuid) {
    permissions.can_start_instance.insert(uuid.value);
    permissions.can_stop_instance.insert(uuid.value);
    permissions.can_view_instance.insert(uuid.value);
    permissions.can_read_instance_file.insert(uuid.value);
    permissions.can_write_instance_file.insert(uuid.value);
}
