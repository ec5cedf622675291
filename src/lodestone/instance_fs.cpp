#include "lodestone/instance_fs.h"

#include "lodestone/error.h"
#include "lodestone/options.h"
#include "lodestone/permissions.h"
#include "lodestone/sandbox.h"

namespace {

// Authorizes the requester and copies the instance root out of the registry.
std::string authorized_root(InstanceManager& manager,
                            const std::string& token,
                            const UserAction& action) {
    User requester = manager.users().try_auth_or_err(token);
    if (!can_perform_action(requester, action)) {
        throw ApiError(ErrorKind::Forbidden, "Not authorized to access instance files");
    }
    auto info = manager.registry().inspect(action.instance);
    if (!info) {
        throw ApiError(ErrorKind::NotFound, "Instance not found");
    }
    return info->path;
}

// The root itself holds the marker, whatever its own name looks like.
void ensure_not_protected(const std::string& root, const std::string& path) {
    if (path == scoped_join(root, "")) {
        throw ApiError(ErrorKind::ProtectedResource, "Cannot modify the instance root");
    }
    if (is_file_protected(path)) {
        throw ApiError(ErrorKind::ProtectedResource, "Cannot modify protected file");
    }
}

} // namespace

std::vector<FileEntry> list_instance_files(InstanceManager& manager,
                                           const std::string& token,
                                           const InstanceUuid& uuid,
                                           const std::string& relative_path) {
    std::string root = authorized_root(manager, token, UserAction::read_instance_file(uuid));
    std::string path = scoped_join(root, relative_path);
    if (!is_directory(path)) {
        throw ApiError(ErrorKind::NotFound, "Path is not a directory");
    }
    std::vector<FileEntry> entries;
    std::string error;
    if (!list_directory(path, root, entries, error)) {
        throw ApiError(ErrorKind::IOFailure, "Failed to list directory");
    }
    return entries;
}

std::string read_instance_file(InstanceManager& manager,
                               const std::string& token,
                               const InstanceUuid& uuid,
                               const std::string& relative_path) {
    std::string root = authorized_root(manager, token, UserAction::read_instance_file(uuid));
    std::string path = scoped_join(root, relative_path);
    if (!is_regular_file(path)) {
        throw ApiError(ErrorKind::BadRequest, "Path is not a file");
    }
    std::string content;
    std::string error;
    if (!read_file_contents(path, content, error)) {
        log_debug(error);
        throw ApiError(ErrorKind::IOFailure, "Failed to read file");
    }
    if (!is_valid_utf8(content)) {
        throw ApiError(ErrorKind::BadRequest, "You may only view/edit text files encoded in UTF-8.");
    }
    return content;
}

void write_instance_file(InstanceManager& manager,
                         const std::string& token,
                         const InstanceUuid& uuid,
                         const std::string& relative_path,
                         const std::string& content) {
    std::string root = authorized_root(manager, token, UserAction::write_instance_file(uuid));
    std::string path = scoped_join(root, relative_path);
    ensure_not_protected(root, path);
    std::string error;
    if (!write_file_contents(path, content, error)) {
        log_debug(error);
        throw ApiError(ErrorKind::IOFailure, "Failed to write file");
    }
}

void make_instance_directory(InstanceManager& manager,
                             const std::string& token,
                             const InstanceUuid& uuid,
                             const std::string& relative_path) {
    std::string root = authorized_root(manager, token, UserAction::write_instance_file(uuid));
    std::string path = scoped_join(root, relative_path);
    if (!ensure_directory(path, 0755)) {
        throw ApiError(ErrorKind::IOFailure, "Failed to create directory");
    }
}

void remove_instance_file(InstanceManager& manager,
                          const std::string& token,
                          const InstanceUuid& uuid,
                          const std::string& relative_path) {
    std::string root = authorized_root(manager, token, UserAction::write_instance_file(uuid));
    std::string path = scoped_join(root, relative_path);
    ensure_not_protected(root, path);
    if (!path_exists(path)) {
        throw ApiError(ErrorKind::NotFound, "Path does not exist");
    }
    std::string error;
    if (!remove_tree(path, error)) {
        log_debug(error);
        throw ApiError(ErrorKind::IOFailure,
                       is_directory(path) ? "Failed to remove directory" : "Failed to remove file");
    }
}
