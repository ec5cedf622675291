#include <atomic>
#include <chrono>
#include <fstream>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "test_support.h"

#include "lodestone/events.h"
#include "lodestone/permissions.h"
#include "lodestone/ports.h"
#include "lodestone/registry.h"
#include "lodestone/tasks.h"
#include "lodestone/types.h"

TEST(InstanceUuidTest, GeneratedIdentitiesCarryPrefix) {
    InstanceUuid uuid = InstanceUuid::generate();
    ASSERT_EQ(0u, uuid.value.find("INSTANCE_"));
    EXPECT_EQ(36u, uuid.no_prefix().size());
    EXPECT_EQ('4', uuid.no_prefix()[14]);
    EXPECT_EQ(uuid.no_prefix().substr(0, 8), uuid.short_prefix());
    EXPECT_NE(uuid, InstanceUuid::generate());
}

TEST(GameTypeTest, ParsesKnownTypesAndMapsFlavours) {
    auto forge = parse_game_type("MinecraftForge");
    ASSERT_TRUE(forge.has_value());
    EXPECT_EQ(Flavour::Forge, flavour_for(*forge));
    EXPECT_EQ(Flavour::Vanilla, flavour_for(GameType::MinecraftJavaVanilla));
    EXPECT_EQ(Flavour::Paper, flavour_for(GameType::MinecraftPaper));
    EXPECT_STREQ("fabric", flavour_name(flavour_for(GameType::MinecraftFabric)));
    EXPECT_FALSE(parse_game_type("minecraft").has_value());
    EXPECT_STREQ("stopped", instance_state_name(InstanceState::Stopped));
}

TEST(MarkerTest, RejectsUnknownGameType) {
    EXPECT_THROW(DotLodestoneConfig::from_json(R"({"uuid":"INSTANCE_x","game_type":"Pong"})"), std::runtime_error);
    DotLodestoneConfig config =
            DotLodestoneConfig::from_json(R"({"uuid":"INSTANCE_x","game_type":"MinecraftFabric"})");
    EXPECT_EQ("INSTANCE_x", config.uuid.value);
    EXPECT_EQ(GameType::MinecraftFabric, config.game_type);
}

TEST(PortAllocatorTest, ReserveAndRelease) {
    PortAllocator ports;
    EXPECT_FALSE(ports.is_reserved(25565));
    ports.reserve(25565);
    ports.reserve(25565);
    ports.reserve(25566);
    EXPECT_TRUE(ports.is_reserved(25565));
    EXPECT_EQ((std::set<uint32_t>{25565, 25566}), ports.reserved());
    ports.release(25565);
    EXPECT_FALSE(ports.is_reserved(25565));
    ports.release(40000);
    EXPECT_EQ(1u, ports.reserved().size());
}

TEST(PermissionTest, OwnerMayDoEverything) {
    User owner = make_user("root", "t", true);
    InstanceUuid uuid{"INSTANCE_a"};
    EXPECT_TRUE(can_perform_action(owner, UserAction::create_instance()));
    EXPECT_TRUE(can_perform_action(owner, UserAction::delete_instance()));
    EXPECT_TRUE(can_perform_action(owner, UserAction::write_instance_file(uuid)));
}

TEST(PermissionTest, ScopedGrantsApplyToOneInstance) {
    User user = make_user("u", "t");
    InstanceUuid mine{"INSTANCE_mine"};
    InstanceUuid other{"INSTANCE_other"};
    user.permissions.can_view_instance.insert(mine.value);
    user.permissions.can_read_instance_file.insert(mine.value);

    EXPECT_TRUE(can_perform_action(user, UserAction::view_instance(mine)));
    EXPECT_TRUE(can_perform_action(user, UserAction::read_instance_file(mine)));
    EXPECT_FALSE(can_perform_action(user, UserAction::write_instance_file(mine)));
    EXPECT_FALSE(can_perform_action(user, UserAction::view_instance(other)));
    EXPECT_FALSE(can_perform_action(user, UserAction::create_instance()));

    EXPECT_NO_THROW(try_action(user, UserAction::view_instance(mine)));
    try {
        try_action(user, UserAction::start_instance(mine));
        FAIL() << "expected Forbidden";
    } catch (const ApiError& e) {
        EXPECT_EQ(ErrorKind::Forbidden, e.kind());
    }
}

TEST(PermissionTest, CreatorGrantsCoverInstanceOperations) {
    UserPermission permissions;
    InstanceUuid uuid{"INSTANCE_new"};
    grant_creator_permissions(permissions, uuid);
    EXPECT_EQ(1u, permissions.can_view_instance.count(uuid.value));
    EXPECT_EQ(1u, permissions.can_start_instance.count(uuid.value));
    EXPECT_EQ(1u, permissions.can_stop_instance.count(uuid.value));
    EXPECT_EQ(1u, permissions.can_read_instance_file.count(uuid.value));
    EXPECT_EQ(1u, permissions.can_write_instance_file.count(uuid.value));
    EXPECT_FALSE(permissions.can_delete_instance);
}

class UserStoreTest : public ::testing::Test {
protected:
    std::string root;

    void SetUp() override {
        root = unique_test_root("lodestone-users");
        ensure_directory(root, 0755);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

TEST_F(UserStoreTest, AuthenticatesByToken) {
    UserStore store;
    store.add_user(make_user("alice", "secret"));
    ASSERT_TRUE(store.authenticate("secret").has_value());
    EXPECT_EQ("alice", store.authenticate("secret")->uid);
    EXPECT_FALSE(store.authenticate("").has_value());
    EXPECT_FALSE(store.authenticate("guess").has_value());
    try {
        store.try_auth_or_err("guess");
        FAIL() << "expected Unauthorized";
    } catch (const ApiError& e) {
        EXPECT_EQ(ErrorKind::Unauthorized, e.kind());
    }
}

TEST_F(UserStoreTest, LoadsAndPersistsGrants) {
    std::string path = root + "/users.json";
    std::string error;
    ASSERT_TRUE(write_file_contents(path, R"({"users":[
        {"uid":"alice","username":"Alice","token":"a-token","is_owner":false,
         "permissions":{"can_create_instance":true,"can_view_instance":["INSTANCE_old"]}}
    ]})", error)) << error;

    UserStore store;
    store.load_from_file(path);
    auto alice = store.get("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ("Alice", alice->username);
    EXPECT_TRUE(alice->permissions.can_create_instance);
    EXPECT_EQ(1u, alice->permissions.can_view_instance.count("INSTANCE_old"));

    ASSERT_TRUE(store.grant_creator_permissions("alice", InstanceUuid{"INSTANCE_new"}, error)) << error;
    EXPECT_FALSE(store.grant_creator_permissions("nobody", InstanceUuid{"INSTANCE_new"}, error));

    UserStore reloaded;
    reloaded.load_from_file(path);
    auto persisted = reloaded.get("alice");
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(1u, persisted->permissions.can_write_instance_file.count("INSTANCE_new"));
    EXPECT_EQ(1u, persisted->permissions.can_view_instance.count("INSTANCE_old"));
}

TEST_F(UserStoreTest, MalformedFileThrows) {
    std::string path = root + "/broken.json";
    std::string error;
    ASSERT_TRUE(write_file_contents(path, "{\"users\": [", error)) << error;
    UserStore store;
    EXPECT_ANY_THROW(store.load_from_file(path));
    EXPECT_THROW(store.load_from_file(root + "/missing.json"), std::runtime_error);
}

TEST(EventTest, EventIdsAreMonotonic) {
    auto first = new_progression_start("first", std::nullopt, std::nullopt, std::nullopt, CausedBy::system());
    auto second = new_progression_start("second", std::nullopt, 10.0, std::nullopt, CausedBy::system());
    EXPECT_LT(first.second, second.second);
    EXPECT_EQ(first.second, first.first.event_id);

    Event end = new_progression_end(second.second, true, std::string("done"), std::nullopt);
    EXPECT_EQ(second.second, end.event_id);
    EXPECT_EQ(EventKind::ProgressionEnd, end.kind);

    json j = second.first.to_json_object();
    EXPECT_EQ("ProgressionStart", j.at("type").get<std::string>());
    EXPECT_EQ("System", j.at("caused_by").at("type").get<std::string>());
    EXPECT_DOUBLE_EQ(10.0, j.at("total").get<double>());
}

TEST(EventTest, BroadcastReachesEverySubscriber) {
    EventBroadcaster events;
    auto a = events.subscribe();
    auto b = events.subscribe();
    auto start = new_progression_start("x", std::nullopt, std::nullopt, std::nullopt, CausedBy::user("u", "U"));
    events.send(start.first);

    auto received = a->try_receive();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(start.second, received->event_id);
    EXPECT_TRUE(b->receive_for(std::chrono::milliseconds(100)).has_value());
    EXPECT_FALSE(a->try_receive().has_value());
}

TEST(EventTest, SendingWithoutSubscribersIsHarmless) {
    EventBroadcaster events;
    {
        auto gone = events.subscribe();
        EXPECT_EQ(1u, events.subscriber_count());
    }
    events.send(new_progression_end(1, true, std::nullopt, std::nullopt));
    EXPECT_EQ(0u, events.subscriber_count());
}

TEST(EventTest, FullSubscriberDropsNewEvents) {
    EventBroadcaster events(2);
    auto slow = events.subscribe();
    for (int i = 0; i < 5; ++i) {
        events.send(new_progression_end(static_cast<EventId>(i + 1), true, std::nullopt, std::nullopt));
    }
    std::vector<Event> queued = slow->drain();
    ASSERT_EQ(2u, queued.size());
    EXPECT_EQ(1u, queued[0].event_id);
    EXPECT_EQ(2u, queued[1].event_id);
    EXPECT_EQ(3u, slow->dropped());
}

TEST(EventTest, RecordEventAppendsJsonLines) {
    std::string dir = unique_test_root("lodestone-events");
    ensure_directory(dir, 0755);
    std::string path = dir + "/events.log";
    auto start = new_progression_start("Deleting instance x", InstanceUuid{"INSTANCE_x"}, 10.0,
                                       ProgressionStartValue::instance_delete(InstanceUuid{"INSTANCE_x"}),
                                       CausedBy::system());
    ASSERT_TRUE(record_event(path, start.first));
    ASSERT_TRUE(record_event(path, new_progression_end(start.second, false, std::string("boom"), std::nullopt)));

    std::ifstream ifs(path);
    std::string line;
    std::vector<json> entries;
    while (std::getline(ifs, line)) {
        entries.push_back(json::parse(line));
    }
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("InstanceDelete", entries[0].at("value").at("type").get<std::string>());
    EXPECT_EQ("INSTANCE_x", entries[0].at("instance_uuid").get<std::string>());
    EXPECT_FALSE(entries[1].at("success").get<bool>());
    EXPECT_EQ("boom", entries[1].at("message").get<std::string>());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(RegistryTest, InsertGetRemove) {
    InstanceRegistry registry;
    SetupConfig config;
    config.name = "a";
    InstanceUuid uuid = InstanceUuid::generate();
    auto instance = std::make_shared<FakeInstance>(config, uuid, "/tmp/a", 1);

    EXPECT_TRUE(registry.insert(instance));
    EXPECT_FALSE(registry.insert(instance));
    EXPECT_TRUE(registry.contains(uuid));
    EXPECT_EQ(instance, registry.get(uuid));
    ASSERT_TRUE(registry.inspect(uuid).has_value());
    EXPECT_EQ("a", registry.inspect(uuid)->name);
    EXPECT_EQ(1u, registry.list().size());
    EXPECT_EQ(1u, registry.list_info().size());

    EXPECT_EQ(instance, registry.remove(uuid));
    EXPECT_EQ(nullptr, registry.remove(uuid));
    EXPECT_FALSE(registry.inspect(uuid).has_value());
    EXPECT_EQ(0u, registry.size());
}

TEST(RegistryTest, ShortPrefixClaimsAreExclusive) {
    InstanceRegistry registry;
    InstanceUuid uuid{"INSTANCE_abcdef12-0000-4000-8000-000000000000"};
    EXPECT_TRUE(registry.claim_short_prefix(uuid.short_prefix()));
    EXPECT_FALSE(registry.claim_short_prefix("abcdef12"));

    SetupConfig config;
    config.name = "a";
    EXPECT_TRUE(registry.insert(std::make_shared<FakeInstance>(config, uuid, "/tmp/a", 1)));
    EXPECT_FALSE(registry.claim_short_prefix("abcdef12"));

    registry.remove(uuid);
    EXPECT_TRUE(registry.claim_short_prefix("abcdef12"));
    registry.release_short_prefix("abcdef12");
    EXPECT_TRUE(registry.claim_short_prefix("abcdef12"));
}

TEST(TaskRunnerTest, WaitsForSpawnedWork) {
    TaskRunner tasks;
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i) {
        tasks.spawn("work", [&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ++done;
        });
    }
    tasks.wait_idle();
    EXPECT_EQ(4, done.load());
    EXPECT_EQ(0u, tasks.active());
    EXPECT_TRUE(tasks.faults().empty());
}

TEST(TaskRunnerTest, RecordsFaults) {
    TaskRunner tasks;
    tasks.spawn("cleanup", [] { throw std::runtime_error("disk gone"); });
    tasks.wait_idle();
    std::vector<std::string> faults = tasks.faults();
    ASSERT_EQ(1u, faults.size());
    EXPECT_EQ("cleanup: disk gone", faults[0]);
}
