#include <chrono>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "test_support.h"

#include "lodestone/process.h"

class GameServerTest : public ::testing::Test {
protected:
    std::string root;

    void SetUp() override {
        root = unique_test_root("lodestone-server");
        std::error_code ec;
        fs::remove_all(root, ec);
        ensure_directory(root + "/instances", 0755);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::shared_ptr<GameServerInstance> make_instance(const std::string& name, const json& command) {
        SetupConfig config = GameServerFactory().construct_setup_config(json{{"name", name}, {"command", command}},
                                                                        GameType::MinecraftJavaVanilla);
        std::string dir = root + "/instances/" + name;
        EXPECT_TRUE(ensure_directory(dir, 0755));
        auto instance = std::make_shared<GameServerInstance>(config, InstanceUuid::generate(), dir, unix_time_now(), 2);
        std::string error;
        EXPECT_TRUE(instance->save_config(error)) << error;
        return instance;
    }

    DotLodestoneConfig marker_for(const GameServerInstance& instance) const {
        DotLodestoneConfig marker;
        marker.uuid = instance.uuid();
        marker.game_type = GameType::MinecraftJavaVanilla;
        return marker;
    }

    json read_instance_config(const std::string& dir) const {
        std::string contents;
        std::string error;
        EXPECT_TRUE(read_file_contents(path_join(dir, INSTANCE_CONFIG_FILE_NAME), contents, error)) << error;
        return json::parse(contents);
    }

    void write_instance_config(const std::string& dir, const json& config) const {
        std::string error;
        ASSERT_TRUE(write_file_contents(path_join(dir, INSTANCE_CONFIG_FILE_NAME), config.dump(4), error)) << error;
    }
};

TEST_F(GameServerTest, StartPersistsPidWithStartTime) {
    auto instance = make_instance("persisted", json::array({"sleep", "30"}));
    instance->start();
    ASSERT_EQ(InstanceState::Running, instance->state());

    json saved = read_instance_config(instance->path());
    pid_t pid = saved.at("pid").get<pid_t>();
    uint64_t start_time = 0;
    ASSERT_TRUE(process_start_time(pid, start_time));
    EXPECT_EQ(start_time, saved.at("pid_start_time").get<uint64_t>());

    // A later process loading the same directory sees the server running.
    auto reloaded = GameServerInstance::load(marker_for(*instance), instance->path(), 2);
    EXPECT_EQ(InstanceState::Running, reloaded->state());

    instance->stop();
    EXPECT_EQ(InstanceState::Stopped, instance->state());
    EXPECT_EQ(InstanceState::Stopped, reloaded->state());
    EXPECT_EQ(0, read_instance_config(instance->path()).at("pid").get<pid_t>());
}

TEST_F(GameServerTest, RecycledPidIsNotTakenForTheServer) {
    auto instance = make_instance("recycled", json::array({"sleep", "30"}));
    uint64_t own_start_time = 0;
    ASSERT_TRUE(process_start_time(getpid(), own_start_time));

    // The saved pid now belongs to a live process that started at another time.
    json config = read_instance_config(instance->path());
    config["pid"] = getpid();
    config["pid_start_time"] = own_start_time + 1;
    write_instance_config(instance->path(), config);

    auto stale = GameServerInstance::load(marker_for(*instance), instance->path(), 2);
    EXPECT_EQ(InstanceState::Stopped, stale->state());
    EXPECT_EQ(InstanceState::Stopped, stale->info().state);
    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] { stale->stop(); }));

    // Configs written before start times were recorded never match either.
    config.erase("pid_start_time");
    write_instance_config(instance->path(), config);
    EXPECT_EQ(InstanceState::Stopped, GameServerInstance::load(marker_for(*instance), instance->path(), 2)->state());

    config["pid_start_time"] = own_start_time;
    write_instance_config(instance->path(), config);
    EXPECT_EQ(InstanceState::Running, GameServerInstance::load(marker_for(*instance), instance->path(), 2)->state());
}

TEST_F(GameServerTest, SlowStopDoesNotBlockRegistryReaders) {
    UserStore users;
    users.add_user(make_user("admin", "admin-token", true));
    GameServerFactory factory(2);
    InstanceManager manager(root + "/instances", users, factory);

    json manifest = {{"name", "stubborn"}, {"command", {"sh", "-c", "trap '' TERM; sleep 30"}}};
    InstanceUuid uuid = manager.create_instance("admin-token", "MinecraftJavaVanilla", manifest);
    manager.tasks().wait_idle();
    manager.start_instance("admin-token", uuid);
    // Let the shell install its trap before it is signalled.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    std::string stop_error;
    std::thread stopper([&] {
        try {
            manager.stop_instance("admin-token", uuid);
        } catch (const ApiError& e) {
            stop_error = e.what();
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(1u, manager.registry().size());
    EXPECT_EQ(1u, manager.list_instances("admin-token").size());
    EXPECT_EQ(InstanceState::Stopping, manager.get_instance_info("admin-token", uuid).state);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));

    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] { manager.start_instance("admin-token", uuid); }));
    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] { manager.delete_instance("admin-token", uuid); }));

    stopper.join();
    EXPECT_TRUE(stop_error.empty()) << stop_error;
    EXPECT_EQ(InstanceState::Stopped, manager.get_instance_info("admin-token", uuid).state);
}

TEST(GameServerFactoryTest, RejectsLineBreaksInProperties) {
    GameServerFactory factory;
    auto kind_for = [&](const json& manifest) {
        return error_kind_of([&] { factory.construct_setup_config(manifest, GameType::MinecraftJavaVanilla); });
    };

    EXPECT_EQ(ErrorKind::BadRequest, kind_for(json{{"name", "a"}, {"description", "hello\nserver-port=1"}}));
    EXPECT_EQ(ErrorKind::BadRequest, kind_for(json{{"name", "a"}, {"description", "hello\rworld"}}));
    EXPECT_EQ(ErrorKind::BadRequest, kind_for(json{{"name", "a"}, {"settings", {{"pvp\nserver-port", "1"}}}}));
    EXPECT_EQ(ErrorKind::BadRequest, kind_for(json{{"name", "a"}, {"settings", {{"server-port=1\npvp", true}}}}));
    EXPECT_EQ(ErrorKind::BadRequest, kind_for(json{{"name", "a"}, {"settings", {{"level-name", "w\nserver-port=1"}}}}));
    EXPECT_EQ(ErrorKind::BadRequest, kind_for(json{{"name", "a"}, {"settings", {{"", "x"}}}}));

    SetupConfig config = factory.construct_setup_config(
            json{{"name", "a"}, {"description", "A friendly server"}, {"settings", {{"level-name", "world one"}}}},
            GameType::MinecraftJavaVanilla);
    EXPECT_EQ("A friendly server", config.description);
    EXPECT_EQ("world one", config.settings.at("level-name").get<std::string>());
}
