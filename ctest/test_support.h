#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "lodestone/error.h"
#include "lodestone/filesystem.h"
#include "lodestone/game_server.h"
#include "lodestone/instance.h"
#include "lodestone/options.h"
#include "lodestone/orchestrator.h"
#include "lodestone/users.h"

namespace fs = std::filesystem;

// In-memory instance whose lifecycle state is driven by the test.
class FakeInstance : public Instance {
public:
    FakeInstance(const SetupConfig& config, const InstanceUuid& uuid, const std::string& path, int64_t creation_time)
        : config_(config), uuid_(uuid), path_(path), creation_time_(creation_time) {}

    InstanceUuid uuid() const override { return uuid_; }
    std::string name() const override { return config_.name; }
    std::string path() const override { return path_; }
    uint32_t port() const override { return config_.port; }

    InstanceState state() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    InstanceInfo info() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        InstanceInfo info;
        info.uuid = uuid_;
        info.name = config_.name;
        info.game_type = config_.game_type;
        info.flavour = config_.flavour;
        info.description = config_.description;
        info.path = path_;
        info.port = config_.port;
        info.state = state_;
        info.creation_time = creation_time_;
        return info;
    }

    void start() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == InstanceState::Running) {
            throw ApiError(ErrorKind::BadRequest, "Instance is already running");
        }
        state_ = InstanceState::Running;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != InstanceState::Running) {
            throw ApiError(ErrorKind::BadRequest, "Instance is not running");
        }
        state_ = InstanceState::Stopped;
    }

    void set_state(InstanceState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }

private:
    mutable std::mutex mutex_;
    SetupConfig config_;
    InstanceUuid uuid_;
    std::string path_;
    int64_t creation_time_;
    InstanceState state_ = InstanceState::Stopped;
};

// Validates manifests like the real flavour but provisions instantly. Can be
// told to fail, or to hold provisioning until release() is called.
class FakeFactory : public InstanceFactory {
public:
    SetupConfig construct_setup_config(const json& manifest, GameType game_type) override {
        return validator_.construct_setup_config(manifest, game_type);
    }

    std::shared_ptr<Instance> create_instance(const SetupConfig& config,
                                              const DotLodestoneConfig& marker,
                                              const std::string& path,
                                              EventId,
                                              EventBroadcaster&) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            gate_.wait(lock, [this] { return !hold_; });
        }
        if (fail_provisioning) {
            throw std::runtime_error("download failed");
        }
        std::string error;
        if (!write_file_contents(path_join(path, "server.properties"),
                                 "server-port=" + std::to_string(config.port) + "\n", error)) {
            throw std::runtime_error(error);
        }
        auto instance = std::make_shared<FakeInstance>(config, marker.uuid, path, next_creation_time_++);
        last_created = instance;
        return instance;
    }

    // Takes the port back from server.properties when one was written.
    std::shared_ptr<Instance> restore_instance(const DotLodestoneConfig& marker, const std::string& path) override {
        SetupConfig config;
        config.name = fs::path(path).filename().string();
        config.game_type = marker.game_type;
        config.flavour = flavour_for(marker.game_type);
        config.port = restore_port;
        std::string properties;
        std::string error;
        if (read_file_contents(path_join(path, "server.properties"), properties, error) &&
            properties.rfind("server-port=", 0) == 0) {
            config.port = static_cast<uint32_t>(std::stoul(properties.substr(12)));
        }
        InstanceUuid uuid = restore_uuid ? *restore_uuid : marker.uuid;
        return std::make_shared<FakeInstance>(config, uuid, path, next_creation_time_++);
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hold_ = false;
        }
        gate_.notify_all();
    }

    std::atomic<bool> fail_provisioning{false};
    uint32_t restore_port = 27000;
    std::optional<InstanceUuid> restore_uuid;
    std::shared_ptr<FakeInstance> last_created;

private:
    GameServerFactory validator_;
    std::mutex mutex_;
    std::condition_variable gate_;
    bool hold_ = false;
    std::atomic<int64_t> next_creation_time_{1000};
};

inline std::string unique_test_root(const std::string& prefix) {
    const testing::TestInfo* info = testing::UnitTest::GetInstance()->current_test_info();
    std::string safe_name = info ? std::string(info->test_suite_name()) + "-" + info->name() : "default";
    std::transform(safe_name.begin(), safe_name.end(), safe_name.begin(), [](unsigned char c) {
        return (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    });
    return "/tmp/" + prefix + "-" + std::to_string(getpid()) + "-" + safe_name;
}

inline User make_user(const std::string& uid, const std::string& token, bool is_owner = false) {
    User user;
    user.uid = uid;
    user.username = uid;
    user.token = token;
    user.is_owner = is_owner;
    return user;
}

// Owner "admin", creator "alice" (may create and delete) and "bob" (no grants).
class ManagerFixture : public ::testing::Test {
protected:
    std::string root;
    UserStore users;
    FakeFactory factory;
    std::unique_ptr<InstanceManager> manager;

    void SetUp() override {
        root = unique_test_root("lodestone-gtest");
        std::error_code ec;
        fs::remove_all(root, ec);
        ensure_directory(root + "/instances", 0755);

        users.add_user(make_user("admin", "admin-token", true));
        User alice = make_user("alice", "alice-token");
        alice.permissions.can_create_instance = true;
        alice.permissions.can_delete_instance = true;
        users.add_user(alice);
        users.add_user(make_user("bob", "bob-token"));

        manager.reset(new InstanceManager(root + "/instances", users, factory));
    }

    void TearDown() override {
        factory.release();
        manager.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    json manifest(const std::string& name, uint32_t port = 25565) const {
        return json{{"name", name}, {"port", port}, {"description", "test server"}};
    }

    // Creates an instance as alice and waits for provisioning to finish.
    InstanceUuid create_ready(const std::string& name, uint32_t port = 25565) {
        InstanceUuid uuid = manager->create_instance("alice-token", "MinecraftJavaVanilla", manifest(name, port));
        manager->tasks().wait_idle();
        return uuid;
    }

    std::string instance_dir(const std::string& name, const InstanceUuid& uuid) const {
        return root + "/instances/" + name + "-" + uuid.short_prefix();
    }
};

template <typename F>
ErrorKind error_kind_of(F&& f) {
    try {
        f();
    } catch (const ApiError& e) {
        return e.kind();
    }
    throw std::runtime_error("expected an ApiError");
}
