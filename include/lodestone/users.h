#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "lodestone/permissions.h"
#include "lodestone/types.h"

// Users and their permission records. Token verification is a plain lookup;
// the store only answers "which user does this token belong to".
class UserStore {
public:
    // Replaces the store contents with the users file at path and remembers
    // the path for save(). Throws std::runtime_error on a missing or malformed file.
    void load_from_file(const std::string& path);

    void add_user(const User& user);
    std::optional<User> get(const std::string& uid) const;
    std::optional<User> authenticate(const std::string& token) const;

    // Throws ApiError(Unauthorized) for an unknown or empty token.
    User try_auth_or_err(const std::string& token) const;

    bool update_permissions(const std::string& uid,
                            const UserPermission& permissions,
                            std::string& error_message);
    bool grant_creator_permissions(const std::string& uid,
                                   const InstanceUuid& uuid,
                                   std::string& error_message);

    // Writes the users file. A store that was never loaded from a file keeps
    // its state in memory only and always succeeds.
    bool save(std::string& error_message) const;

private:
    mutable std::mutex mutex_;
    mutable std::mutex save_mutex_;
    std::map<std::string, User> users_;
    std::string path_;
};
