#include <string>
#include <vector>

#include "test_support.h"

#include "lodestone/instance_fs.h"

class InstanceFilesTest : public ManagerFixture {
protected:
    InstanceUuid uuid;
    std::string dir;

    void SetUp() override {
        ManagerFixture::SetUp();
        uuid = create_ready("files");
        dir = instance_dir("files", uuid);
    }
};

TEST_F(InstanceFilesTest, ListsInstanceRoot) {
    std::vector<FileEntry> entries = list_instance_files(*manager, "alice-token", uuid, "");
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ(".lodestone_config", entries[0].name);
    EXPECT_EQ("server.properties", entries[1].name);
    EXPECT_EQ("server.properties", entries[1].path);
    EXPECT_EQ(FileType::File, entries[1].file_type);
}

TEST_F(InstanceFilesTest, WritesReadsAndListsNestedFiles) {
    make_instance_directory(*manager, "alice-token", uuid, "config/plugins");
    write_instance_file(*manager, "alice-token", uuid, "config/plugins/motd.txt", "Welcome \xc3\xa9t\xc3\xa9\n");
    EXPECT_EQ("Welcome \xc3\xa9t\xc3\xa9\n", read_instance_file(*manager, "alice-token", uuid, "config\\plugins\\motd.txt"));

    std::vector<FileEntry> entries = list_instance_files(*manager, "alice-token", uuid, "config");
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("plugins", entries[0].name);
    EXPECT_EQ("config/plugins", entries[0].path);
    EXPECT_EQ(FileType::Directory, entries[0].file_type);

    write_instance_file(*manager, "alice-token", uuid, "config/plugins/motd.txt", "short");
    EXPECT_EQ("short", read_instance_file(*manager, "alice-token", uuid, "config/plugins/motd.txt"));
}

TEST_F(InstanceFilesTest, RemovesFiles) {
    write_instance_file(*manager, "alice-token", uuid, "notes.txt", "x");
    remove_instance_file(*manager, "alice-token", uuid, "notes.txt");
    EXPECT_FALSE(path_exists(dir + "/notes.txt"));
    EXPECT_EQ(ErrorKind::NotFound,
              error_kind_of([&] { remove_instance_file(*manager, "alice-token", uuid, "notes.txt"); }));
}

TEST_F(InstanceFilesTest, RemovesDirectoriesWithExtension) {
    make_instance_directory(*manager, "alice-token", uuid, "backup.old/region");
    write_instance_file(*manager, "alice-token", uuid, "backup.old/region/r.0.0.mca", "data");
    remove_instance_file(*manager, "alice-token", uuid, "backup.old");
    EXPECT_FALSE(path_exists(dir + "/backup.old"));
}

TEST_F(InstanceFilesTest, ProtectedFilesCannotBeWrittenOrRemoved) {
    EXPECT_EQ(ErrorKind::ProtectedResource,
              error_kind_of([&] { write_instance_file(*manager, "admin-token", uuid, "server.jar", "x"); }));
    EXPECT_EQ(ErrorKind::ProtectedResource,
              error_kind_of([&] { write_instance_file(*manager, "admin-token", uuid, "start.sh", "x"); }));
    EXPECT_EQ(ErrorKind::ProtectedResource,
              error_kind_of([&] { write_instance_file(*manager, "admin-token", uuid, ".lodestone_config", "x"); }));
    EXPECT_EQ(ErrorKind::ProtectedResource,
              error_kind_of([&] { write_instance_file(*manager, "admin-token", uuid, "eula", "x"); }));
    EXPECT_EQ(ErrorKind::ProtectedResource,
              error_kind_of([&] { remove_instance_file(*manager, "admin-token", uuid, ".lodestone_config"); }));

    EXPECT_FALSE(path_exists(dir + "/server.jar"));
    EXPECT_FALSE(path_exists(dir + "/eula"));
    DotLodestoneConfig marker = load_marker(dir);
    EXPECT_EQ(uuid, marker.uuid);
}

TEST_F(InstanceFilesTest, InstanceRootCannotBeWrittenOrRemoved) {
    // A dotted name gives the root directory an unprotected looking extension.
    InstanceUuid dotted = create_ready("my.server", 25566);
    std::string dotted_dir = instance_dir("my.server", dotted);

    for (const std::string& root_path : std::vector<std::string>{".", "", "/", "config/..", "./."}) {
        EXPECT_EQ(ErrorKind::ProtectedResource,
                  error_kind_of([&] { remove_instance_file(*manager, "alice-token", dotted, root_path); }))
                << root_path;
        EXPECT_EQ(ErrorKind::ProtectedResource,
                  error_kind_of([&] { write_instance_file(*manager, "alice-token", dotted, root_path, "x"); }))
                << root_path;
    }

    EXPECT_TRUE(manager->registry().contains(dotted));
    EXPECT_TRUE(is_directory(dotted_dir));
    EXPECT_TRUE(is_regular_file(marker_path(dotted_dir)));
    EXPECT_EQ(dotted, load_marker(dotted_dir).uuid);
}

TEST_F(InstanceFilesTest, EscapesAreRejected) {
    EXPECT_EQ(ErrorKind::MalformedPath,
              error_kind_of([&] { read_instance_file(*manager, "alice-token", uuid, "../../etc/passwd"); }));
    EXPECT_EQ(ErrorKind::MalformedPath,
              error_kind_of([&] { write_instance_file(*manager, "alice-token", uuid, "..\\..\\secret.txt", "x"); }));
    EXPECT_EQ(ErrorKind::MalformedPath,
              error_kind_of([&] { list_instance_files(*manager, "alice-token", uuid, ".."); }));
    EXPECT_FALSE(path_exists(root + "/secret.txt"));
}

TEST_F(InstanceFilesTest, PermissionsAreCheckedPerInstance) {
    EXPECT_EQ(ErrorKind::Unauthorized,
              error_kind_of([&] { list_instance_files(*manager, "", uuid, ""); }));
    EXPECT_EQ(ErrorKind::Forbidden,
              error_kind_of([&] { read_instance_file(*manager, "bob-token", uuid, "server.properties"); }));

    User bob = *users.get("bob");
    bob.permissions.can_read_instance_file.insert(uuid.value);
    std::string error;
    ASSERT_TRUE(users.update_permissions("bob", bob.permissions, error)) << error;
    EXPECT_NO_THROW(read_instance_file(*manager, "bob-token", uuid, "server.properties"));
    EXPECT_EQ(ErrorKind::Forbidden,
              error_kind_of([&] { write_instance_file(*manager, "bob-token", uuid, "ops.json", "[]"); }));
}

TEST_F(InstanceFilesTest, MissingTargetsAreReported) {
    EXPECT_EQ(ErrorKind::NotFound,
              error_kind_of([&] { list_instance_files(*manager, "admin-token", InstanceUuid{"INSTANCE_gone"}, ""); }));
    EXPECT_EQ(ErrorKind::NotFound,
              error_kind_of([&] { list_instance_files(*manager, "admin-token", uuid, "world"); }));
    EXPECT_EQ(ErrorKind::BadRequest,
              error_kind_of([&] { read_instance_file(*manager, "admin-token", uuid, "missing.txt"); }));
}

TEST_F(InstanceFilesTest, BinaryFilesCannotBeRead) {
    std::string error;
    ASSERT_TRUE(write_file_contents(dir + "/level.dat", std::string("\x1f\x8b\x08\x00\xff", 5), error)) << error;
    EXPECT_EQ(ErrorKind::BadRequest,
              error_kind_of([&] { read_instance_file(*manager, "admin-token", uuid, "level.dat"); }));
}
