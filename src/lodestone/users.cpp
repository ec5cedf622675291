#include "lodestone/users.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "lodestone/error.h"
#include "lodestone/filesystem.h"
#include "lodestone/options.h"

void UserStore::load_from_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Failed to load users file: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    json j = json::parse(buffer.str());

    std::map<std::string, User> loaded;
    if (j.contains("users")) {
        for (const auto& entry : j.at("users")) {
            User user = User::from_json_object(entry);
            if (user.uid.empty()) {
                throw std::runtime_error("User entry without uid in " + path);
            }
            loaded[user.uid] = user;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    users_ = std::move(loaded);
    path_ = path;
    log_debug("Loaded " + std::to_string(users_.size()) + " user(s) from " + path);
}

void UserStore::add_user(const User& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[user.uid] = user;
}

std::optional<User> UserStore::get(const std::string& uid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(uid);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<User> UserStore::authenticate(const std::string& token) const {
    if (token.empty()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : users_) {
        if (entry.second.token == token) {
            return entry.second;
        }
    }
    return std::nullopt;
}

User UserStore::try_auth_or_err(const std::string& token) const {
    auto user = authenticate(token);
    if (!user) {
        throw ApiError(ErrorKind::Unauthorized, "Token error");
    }
    return *user;
}

bool UserStore::update_permissions(const std::string& uid,
                                   const UserPermission& permissions,
                                   std::string& error_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(uid);
        if (it == users_.end()) {
            error_message = "User " + uid + " not found";
            return false;
        }
        it->second.permissions = permissions;
    }
    return save(error_message);
}

bool UserStore::grant_creator_permissions(const std::string& uid,
                                          const InstanceUuid& uuid,
                                          std::string& error_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(uid);
        if (it == users_.end()) {
            error_message = "User " + uid + " not found";
            return false;
        }
        ::grant_creator_permissions(it->second.permissions, uuid);
    }
    return save(error_message);
}

bool UserStore::save(std::string& error_message) const {
    std::lock_guard<std::mutex> save_lock(save_mutex_);
    std::string path;
    json users = json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = path_;
        for (const auto& entry : users_) {
            users.push_back(entry.second.to_json_object());
        }
    }
    if (path.empty()) {
        return true;
    }
    json document = {{"users", users}};
    std::string tmp_path = path + ".tmp";
    if (!write_file_contents(tmp_path, document.dump(4), error_message)) {
        return false;
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        error_message = "Failed to replace users file " + path;
        std::string cleanup_error;
        if (!remove_tree(tmp_path, cleanup_error)) {
            log_debug(cleanup_error);
        }
        return false;
    }
    return true;
}
