#include <fcntl.h>
#include <set>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "test_support.h"

#include "lodestone/events.h"
#include "lodestone/types.h"

namespace {

const std::string kDeepSegment(200, 'd');
const int kDeepLevels = 25;

// Nests directories under dir until full paths exceed PATH_MAX, so that they
// can only be reached relative to a working directory.
void build_overlong_tree(const std::string& dir) {
    int saved = open(".", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    ASSERT_GE(saved, 0);
    ASSERT_EQ(0, chdir(dir.c_str()));
    for (int i = 0; i < kDeepLevels; ++i) {
        ASSERT_EQ(0, mkdir(kDeepSegment.c_str(), 0755));
        ASSERT_EQ(0, chdir(kDeepSegment.c_str()));
    }
    EXPECT_EQ(0, fchdir(saved));
    close(saved);
}

void remove_overlong_tree(const std::string& dir) {
    int saved = open(".", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    ASSERT_GE(saved, 0);
    ASSERT_EQ(0, chdir(dir.c_str()));
    int depth = 0;
    while (chdir(kDeepSegment.c_str()) == 0) {
        ++depth;
    }
    for (; depth > 0; --depth) {
        ASSERT_EQ(0, chdir(".."));
        EXPECT_EQ(0, rmdir(kDeepSegment.c_str()));
    }
    EXPECT_EQ(0, fchdir(saved));
    close(saved);
}

} // namespace

TEST_F(ManagerFixture, CreateRegistersInstanceAndReservesPort) {
    auto subscriber = manager->events().subscribe();
    InstanceUuid uuid = create_ready("survival", 25565);

    EXPECT_EQ(0u, uuid.value.find("INSTANCE_"));
    ASSERT_TRUE(manager->registry().contains(uuid));
    EXPECT_TRUE(manager->ports().is_reserved(25565));

    std::string dir = instance_dir("survival", uuid);
    ASSERT_TRUE(is_regular_file(marker_path(dir)));
    DotLodestoneConfig marker = load_marker(dir);
    EXPECT_EQ(uuid, marker.uuid);
    EXPECT_EQ(GameType::MinecraftJavaVanilla, marker.game_type);

    InstanceInfo info = manager->get_instance_info("alice-token", uuid);
    EXPECT_EQ("survival", info.name);
    EXPECT_EQ(Flavour::Vanilla, info.flavour);
    EXPECT_EQ(25565u, info.port);

    std::vector<Event> events = subscriber->drain();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(EventKind::ProgressionStart, events[0].kind);
    ASSERT_TRUE(events[0].start_value.has_value());
    EXPECT_EQ(ProgressionKind::InstanceCreation, events[0].start_value->kind);
    EXPECT_EQ("survival", events[0].start_value->instance_name);
    EXPECT_EQ("vanilla", events[0].start_value->flavour);
    EXPECT_EQ(25565u, events[0].start_value->port);
    EXPECT_EQ(CausedByKind::User, events[0].caused_by.kind);
    EXPECT_EQ("alice", events[0].caused_by.user_id);

    EXPECT_EQ(EventKind::ProgressionEnd, events[1].kind);
    EXPECT_EQ(events[0].event_id, events[1].event_id);
    EXPECT_TRUE(events[1].success);
    ASSERT_TRUE(events[1].end_value.has_value());
    EXPECT_EQ(uuid, events[1].end_value->info.uuid);
}

TEST_F(ManagerFixture, CreatorReceivesScopedGrants) {
    InstanceUuid uuid = create_ready("granted");
    auto alice = users.get("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_TRUE(can_perform_action(*alice, UserAction::view_instance(uuid)));
    EXPECT_TRUE(can_perform_action(*alice, UserAction::start_instance(uuid)));
    EXPECT_TRUE(can_perform_action(*alice, UserAction::stop_instance(uuid)));
    EXPECT_TRUE(can_perform_action(*alice, UserAction::read_instance_file(uuid)));
    EXPECT_TRUE(can_perform_action(*alice, UserAction::write_instance_file(uuid)));

    auto bob = users.get("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_FALSE(can_perform_action(*bob, UserAction::view_instance(uuid)));
}

TEST_F(ManagerFixture, CreateReturnsBeforeProvisioningCompletes) {
    factory.hold();
    InstanceUuid uuid = manager->create_instance("alice-token", "MinecraftForge", manifest("modded", 25570));

    EXPECT_TRUE(is_regular_file(marker_path(instance_dir("modded", uuid))));
    EXPECT_FALSE(manager->registry().contains(uuid));
    EXPECT_FALSE(manager->ports().is_reserved(25570));
    EXPECT_EQ(ErrorKind::NotFound, error_kind_of([&] { manager->get_instance_info("admin-token", uuid); }));

    factory.release();
    manager->tasks().wait_idle();
    EXPECT_TRUE(manager->registry().contains(uuid));
    EXPECT_TRUE(manager->ports().is_reserved(25570));
    EXPECT_EQ(Flavour::Forge, manager->get_instance_info("admin-token", uuid).flavour);
}

TEST_F(ManagerFixture, ProvisioningFailureRollsBack) {
    auto subscriber = manager->events().subscribe();
    factory.fail_provisioning = true;
    InstanceUuid uuid = manager->create_instance("alice-token", "MinecraftJavaVanilla", manifest("broken", 25566));
    manager->tasks().wait_idle();

    EXPECT_FALSE(manager->registry().contains(uuid));
    EXPECT_FALSE(manager->ports().is_reserved(25566));
    EXPECT_FALSE(path_exists(instance_dir("broken", uuid)));
    EXPECT_TRUE(manager->tasks().faults().empty());

    auto alice = users.get("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_FALSE(can_perform_action(*alice, UserAction::view_instance(uuid)));

    std::vector<Event> events = subscriber->drain();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(EventKind::ProgressionEnd, events[1].kind);
    EXPECT_FALSE(events[1].success);
    ASSERT_TRUE(events[1].message.has_value());
    EXPECT_NE(std::string::npos, events[1].message->find("download failed"));
}

TEST_F(ManagerFixture, CreateRejectsInvalidRequestsWithoutSideEffects) {
    EXPECT_EQ(ErrorKind::Unauthorized,
              error_kind_of([&] { manager->create_instance("", "MinecraftJavaVanilla", manifest("x")); }));
    EXPECT_EQ(ErrorKind::Unauthorized,
              error_kind_of([&] { manager->create_instance("nope", "MinecraftJavaVanilla", manifest("x")); }));
    EXPECT_EQ(ErrorKind::Forbidden,
              error_kind_of([&] { manager->create_instance("bob-token", "MinecraftJavaVanilla", manifest("x")); }));
    EXPECT_EQ(ErrorKind::BadRequest,
              error_kind_of([&] { manager->create_instance("alice-token", "Terraria", manifest("x")); }));
    EXPECT_EQ(ErrorKind::BadRequest,
              error_kind_of([&] { manager->create_instance("alice-token", "MinecraftJavaVanilla", json{{"port", 1}}); }));
    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] {
        manager->create_instance("alice-token", "MinecraftJavaVanilla", manifest("x", 70000));
    }));
    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] {
        manager->create_instance("alice-token", "MinecraftJavaVanilla", manifest("../escape"));
    }));

    manager->tasks().wait_idle();
    EXPECT_EQ(0u, manager->registry().size());
    EXPECT_TRUE(fs::is_empty(root + "/instances"));
}

TEST_F(ManagerFixture, CreateRejectsPortAlreadyInUse) {
    create_ready("first", 25565);
    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] { create_ready("second", 25565); }));
    EXPECT_EQ(1u, manager->registry().size());
}

TEST_F(ManagerFixture, ConcurrentCreatesGetDistinctIdentities) {
    const int count = 8;
    std::vector<InstanceUuid> created(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; ++i) {
        threads.emplace_back([this, i, &created] {
            created[i] = manager->create_instance("alice-token", "MinecraftPaper",
                                                  manifest("paper" + std::to_string(i), 26000 + i));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    manager->tasks().wait_idle();

    std::set<std::string> prefixes;
    for (const auto& uuid : created) {
        prefixes.insert(uuid.short_prefix());
        EXPECT_TRUE(manager->registry().contains(uuid));
    }
    EXPECT_EQ(static_cast<size_t>(count), prefixes.size());
    EXPECT_EQ(static_cast<size_t>(count), manager->ports().reserved().size());
}

TEST_F(ManagerFixture, ListFiltersByViewPermissionAndSortsByCreationTime) {
    InstanceUuid first = create_ready("first", 25565);
    InstanceUuid second = create_ready("second", 25566);
    InstanceUuid third = create_ready("third", 25567);

    std::vector<InstanceInfo> all = manager->list_instances("admin-token");
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ(first, all[0].uuid);
    EXPECT_EQ(second, all[1].uuid);
    EXPECT_EQ(third, all[2].uuid);

    EXPECT_TRUE(manager->list_instances("bob-token").empty());

    User bob = *users.get("bob");
    bob.permissions.can_view_instance.insert(second.value);
    std::string error;
    ASSERT_TRUE(users.update_permissions("bob", bob.permissions, error)) << error;
    std::vector<InstanceInfo> visible = manager->list_instances("bob-token");
    ASSERT_EQ(1u, visible.size());
    EXPECT_EQ(second, visible[0].uuid);

    EXPECT_EQ(ErrorKind::Unauthorized, error_kind_of([&] { manager->list_instances("bad"); }));
}

TEST_F(ManagerFixture, InfoReportsNotFoundBeforeForbidden) {
    InstanceUuid uuid = create_ready("private");
    EXPECT_EQ(ErrorKind::Forbidden, error_kind_of([&] { manager->get_instance_info("bob-token", uuid); }));
    EXPECT_EQ(ErrorKind::NotFound,
              error_kind_of([&] { manager->get_instance_info("bob-token", InstanceUuid{"INSTANCE_missing"}); }));
}

TEST_F(ManagerFixture, DeleteRunningInstanceIsRejectedWithoutSideEffects) {
    InstanceUuid uuid = create_ready("busy", 25565);
    factory.last_created->set_state(InstanceState::Running);

    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] { manager->delete_instance("alice-token", uuid); }));
    EXPECT_TRUE(manager->registry().contains(uuid));
    EXPECT_TRUE(manager->ports().is_reserved(25565));
    EXPECT_TRUE(is_regular_file(marker_path(instance_dir("busy", uuid))));
}

TEST_F(ManagerFixture, DeleteRemovesEverything) {
    InstanceUuid uuid = create_ready("doomed", 25565);
    auto subscriber = manager->events().subscribe();

    manager->delete_instance("alice-token", uuid);

    EXPECT_FALSE(manager->registry().contains(uuid));
    EXPECT_FALSE(manager->ports().is_reserved(25565));
    EXPECT_FALSE(path_exists(instance_dir("doomed", uuid)));
    EXPECT_EQ(ErrorKind::NotFound, error_kind_of([&] { manager->get_instance_info("admin-token", uuid); }));

    std::vector<Event> events = subscriber->drain();
    ASSERT_EQ(2u, events.size());
    ASSERT_TRUE(events[0].start_value.has_value());
    EXPECT_EQ(ProgressionKind::InstanceDelete, events[0].start_value->kind);
    EXPECT_TRUE(events[1].success);
    ASSERT_TRUE(events[1].end_value.has_value());
    EXPECT_EQ(uuid, events[1].end_value->instance_uuid);

    // The port is free again.
    create_ready("reborn", 25565);
    EXPECT_TRUE(manager->ports().is_reserved(25565));
}

TEST_F(ManagerFixture, DeleteKeepsInstanceWhenMarkerCannotBeRemoved) {
    InstanceUuid uuid = create_ready("stubborn", 25565);
    std::string dir = instance_dir("stubborn", uuid);
    // A non-empty directory in place of the marker cannot be unlinked.
    ASSERT_EQ(0, unlink(marker_path(dir).c_str()));
    ASSERT_TRUE(ensure_directory(marker_path(dir) + "/held", 0755));
    auto subscriber = manager->events().subscribe();

    EXPECT_EQ(ErrorKind::IOFailure, error_kind_of([&] { manager->delete_instance("alice-token", uuid); }));

    EXPECT_TRUE(manager->registry().contains(uuid));
    EXPECT_TRUE(manager->ports().is_reserved(25565));
    EXPECT_TRUE(is_directory(dir));
    EXPECT_TRUE(is_regular_file(dir + "/server.properties"));

    std::vector<Event> events = subscriber->drain();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(EventKind::ProgressionStart, events[0].kind);
    EXPECT_EQ(EventKind::ProgressionEnd, events[1].kind);
    EXPECT_FALSE(events[1].success);
    EXPECT_FALSE(events[1].end_value.has_value());
}

TEST_F(ManagerFixture, DeleteUnregistersEvenWhenFilesRemain) {
    InstanceUuid uuid = create_ready("sticky", 25565);
    std::string dir = instance_dir("sticky", uuid);
    build_overlong_tree(dir);
    auto subscriber = manager->events().subscribe();

    EXPECT_EQ(ErrorKind::IOFailure, error_kind_of([&] { manager->delete_instance("alice-token", uuid); }));

    EXPECT_FALSE(manager->registry().contains(uuid));
    EXPECT_FALSE(manager->ports().is_reserved(25565));
    EXPECT_FALSE(path_exists(marker_path(dir)));
    EXPECT_TRUE(is_directory(dir));

    std::vector<Event> events = subscriber->drain();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(EventKind::ProgressionEnd, events[1].kind);
    EXPECT_FALSE(events[1].success);
    ASSERT_TRUE(events[1].message.has_value());
    EXPECT_EQ(0u, events[1].message->find("Failed to delete some or all of instance's files"));

    remove_overlong_tree(dir);
}

TEST_F(ManagerFixture, DeleteChecksPermissionThenExistence) {
    InstanceUuid uuid = create_ready("kept");
    EXPECT_EQ(ErrorKind::Forbidden, error_kind_of([&] { manager->delete_instance("bob-token", uuid); }));
    EXPECT_EQ(ErrorKind::Forbidden,
              error_kind_of([&] { manager->delete_instance("bob-token", InstanceUuid{"INSTANCE_missing"}); }));
    EXPECT_EQ(ErrorKind::NotFound,
              error_kind_of([&] { manager->delete_instance("alice-token", InstanceUuid{"INSTANCE_missing"}); }));
    EXPECT_TRUE(manager->registry().contains(uuid));
}

TEST_F(ManagerFixture, StartAndStopFollowPermissions) {
    InstanceUuid uuid = create_ready("toggled");
    EXPECT_EQ(ErrorKind::Forbidden, error_kind_of([&] { manager->start_instance("bob-token", uuid); }));

    manager->start_instance("alice-token", uuid);
    EXPECT_EQ(InstanceState::Running, manager->get_instance_info("alice-token", uuid).state);
    EXPECT_EQ(ErrorKind::BadRequest, error_kind_of([&] { manager->start_instance("alice-token", uuid); }));

    manager->stop_instance("alice-token", uuid);
    EXPECT_EQ(InstanceState::Stopped, manager->get_instance_info("alice-token", uuid).state);
    EXPECT_EQ(ErrorKind::NotFound,
              error_kind_of([&] { manager->stop_instance("admin-token", InstanceUuid{"INSTANCE_missing"}); }));
}

TEST_F(ManagerFixture, RestoreRegistersMarkedDirectoriesOnly) {
    InstanceUuid uuid = create_ready("persisted", 25565);
    ensure_directory(root + "/instances/unmanaged", 0755);

    InstanceManager restored_manager(root + "/instances", users, factory);
    EXPECT_EQ(1u, restored_manager.restore_instances());
    EXPECT_TRUE(restored_manager.registry().contains(uuid));
    EXPECT_TRUE(restored_manager.ports().is_reserved(25565));
    EXPECT_EQ(1u, restored_manager.registry().size());

    // Running restore again does not register duplicates.
    EXPECT_EQ(0u, restored_manager.restore_instances());
    EXPECT_EQ(1u, restored_manager.registry().size());
}

TEST_F(ManagerFixture, RestoreReservesPortsOnlyForRegisteredInstances) {
    InstanceUuid first = create_ready("first", 25570);
    create_ready("second", 25571);
    // Both directories now restore under the first identity.
    factory.restore_uuid = first;

    InstanceManager restored_manager(root + "/instances", users, factory);
    size_t warnings_before = warning_count();
    EXPECT_EQ(1u, restored_manager.restore_instances());
    EXPECT_EQ(1u, restored_manager.registry().size());
    EXPECT_TRUE(restored_manager.registry().contains(first));
    EXPECT_TRUE(restored_manager.ports().is_reserved(25570));
    EXPECT_FALSE(restored_manager.ports().is_reserved(25571));
    EXPECT_GT(warning_count(), warnings_before);
}

TEST_F(ManagerFixture, RestoreSkipsCorruptMarkers) {
    std::string dir = root + "/instances/corrupt-00000000";
    ensure_directory(dir, 0755);
    std::string error;
    ASSERT_TRUE(write_file_contents(marker_path(dir), "{not json", error)) << error;

    size_t warnings_before = warning_count();
    EXPECT_EQ(0u, manager->restore_instances());
    EXPECT_EQ(0u, manager->registry().size());
    EXPECT_GT(warning_count(), warnings_before);
}

TEST_F(ManagerFixture, DefaultVanillaScenario) {
    InstanceUuid uuid = manager->create_instance("admin-token", "MinecraftJavaVanilla", json{{"name", "world"}});
    manager->tasks().wait_idle();

    InstanceInfo info = manager->get_instance_info("admin-token", uuid);
    EXPECT_EQ(25565u, info.port);
    EXPECT_EQ(Flavour::Vanilla, info.flavour);
    EXPECT_EQ(InstanceState::Stopped, info.state);
    EXPECT_EQ(instance_dir("world", uuid), info.path);
    EXPECT_TRUE(manager->ports().is_reserved(25565));
}
