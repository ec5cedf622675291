#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "test_support.h"

#define main lodestone_cli_main
#include "../main.cpp"
#undef main

namespace {

std::vector<char*> to_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

} // namespace

class CliFixture : public ::testing::Test {
protected:
    std::string root;

    void SetUp() override {
        root = unique_test_root("lodestone-cli");
        std::error_code ec;
        fs::remove_all(root, ec);
        ensure_directory(root, 0755);
        unsetenv("LODESTONE_TOKEN");
        g_global_options = GlobalOptions{};

        json users = {
                {"users", json::array({
                        {{"uid", "owner"}, {"username", "Owner"}, {"token", "owner-token"}, {"is_owner", true}},
                        {{"uid", "guest"}, {"username", "Guest"}, {"token", "guest-token"}, {"is_owner", false}}
                })}
        };
        std::string error;
        ASSERT_TRUE(write_file_contents(root + "/users.json", users.dump(), error)) << error;
    }

    void TearDown() override {
        g_global_options = GlobalOptions{};
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    int run(std::vector<std::string> args, std::string* out = nullptr, const std::string& token = "owner-token") {
        std::vector<std::string> full = {"lodestone", "--root", root + "/instances", "--users", root + "/users.json"};
        if (!token.empty()) {
            full.push_back("--token");
            full.push_back(token);
        }
        full.insert(full.end(), args.begin(), args.end());
        std::vector<char*> argv = to_argv(full);

        g_global_options = GlobalOptions{};
        ::testing::internal::CaptureStdout();
        ::testing::internal::CaptureStderr();
        int rc = lodestone_cli_main(static_cast<int>(full.size()), argv.data());
        std::string captured = ::testing::internal::GetCapturedStdout();
        ::testing::internal::GetCapturedStderr();
        if (out) {
            *out = captured;
        }
        return rc;
    }

    std::string write_manifest(const json& manifest) {
        std::string path = root + "/manifest.json";
        std::string error;
        EXPECT_TRUE(write_file_contents(path, manifest.dump(), error)) << error;
        return path;
    }
};

TEST(CliRequest, PercentEncodesPathSegments) {
    EXPECT_EQ("world%20one/level.dat", percent_encode_path("world one/level.dat"));
    EXPECT_EQ("a%25b", percent_encode_path("a%b"));
    EXPECT_EQ("..%5C..%5Csecret", percent_encode_path("..\\..\\secret"));
}

TEST(CliRequest, BuildsRoutesForCommands) {
    g_global_options = GlobalOptions{};
    g_global_options.token = "tok";

    std::vector<std::string> args = {"ls", "INSTANCE_1", "world one"};
    std::vector<char*> argv = to_argv(args);
    ApiRequest request;
    ASSERT_TRUE(build_cli_request(static_cast<int>(args.size()), argv.data(), request));
    EXPECT_EQ("GET", request.method);
    EXPECT_EQ("/instance/INSTANCE_1/fs/ls/world%20one", request.path);
    EXPECT_EQ("tok", request.token);

    args = {"stop", "INSTANCE_1"};
    argv = to_argv(args);
    request = ApiRequest{};
    ASSERT_TRUE(build_cli_request(static_cast<int>(args.size()), argv.data(), request));
    EXPECT_EQ("PUT", request.method);
    EXPECT_EQ("/instance/INSTANCE_1/stop", request.path);

    args = {"request", "delete", "/instance/INSTANCE_1"};
    argv = to_argv(args);
    request = ApiRequest{};
    ASSERT_TRUE(build_cli_request(static_cast<int>(args.size()), argv.data(), request));
    EXPECT_EQ("DELETE", request.method);
    EXPECT_EQ("/instance/INSTANCE_1", request.path);

    ::testing::internal::CaptureStderr();
    args = {"info"};
    argv = to_argv(args);
    EXPECT_FALSE(build_cli_request(static_cast<int>(args.size()), argv.data(), request));
    args = {"reboot", "INSTANCE_1"};
    argv = to_argv(args);
    EXPECT_FALSE(build_cli_request(static_cast<int>(args.size()), argv.data(), request));
    ::testing::internal::GetCapturedStderr();
    g_global_options = GlobalOptions{};
}

TEST_F(CliFixture, CreateListAndRecordEvents) {
    std::string manifest = write_manifest(json{{"name", "cli-world"}, {"port", 25600}, {"settings", {{"difficulty", "hard"}}}});
    std::string out;
    ASSERT_EQ(0, run({"create", "MinecraftJavaVanilla", manifest}, &out));
    std::string uuid = json::parse(out).get<std::string>();
    ASSERT_EQ(0u, uuid.find("INSTANCE_"));

    std::string dir = root + "/instances/cli-world-" + InstanceUuid{uuid}.short_prefix();
    EXPECT_TRUE(is_regular_file(dir + "/.lodestone_config"));
    EXPECT_TRUE(is_regular_file(dir + "/" + INSTANCE_CONFIG_FILE_NAME));
    std::string properties;
    std::string error;
    ASSERT_TRUE(read_file_contents(dir + "/server.properties", properties, error)) << error;
    EXPECT_NE(std::string::npos, properties.find("server-port=25600"));
    EXPECT_NE(std::string::npos, properties.find("difficulty=hard"));

    ASSERT_EQ(0, run({"list"}, &out));
    json listed = json::parse(out);
    ASSERT_EQ(1u, listed.size());
    EXPECT_EQ(uuid, listed[0].at("uuid").get<std::string>());
    EXPECT_EQ(25600u, listed[0].at("port").get<uint32_t>());

    // The guest has no grants and sees nothing.
    ASSERT_EQ(0, run({"list"}, &out, "guest-token"));
    EXPECT_TRUE(json::parse(out).empty());

    std::ifstream events(root + "/instances/events.log");
    ASSERT_TRUE(events.good());
    std::vector<json> entries;
    std::string line;
    while (std::getline(events, line)) {
        entries.push_back(json::parse(line));
    }
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("ProgressionStart", entries[0].at("type").get<std::string>());
    EXPECT_EQ("ProgressionEnd", entries[1].at("type").get<std::string>());
    EXPECT_TRUE(entries[1].at("success").get<bool>());
}

TEST_F(CliFixture, FileCommandsOperateInsideInstance) {
    std::string out;
    ASSERT_EQ(0, run({"create", "MinecraftPaper", write_manifest(json{{"name", "paper"}})}, &out));
    std::string uuid = json::parse(out).get<std::string>();

    std::string note = root + "/note.txt";
    std::string error;
    ASSERT_TRUE(write_file_contents(note, "whitelist: on\n", error)) << error;
    EXPECT_EQ(0, run({"mkdir", uuid, "config"}));
    EXPECT_EQ(0, run({"write", uuid, "config/paper.yml", note}));
    ASSERT_EQ(0, run({"read", uuid, "config/paper.yml"}, &out));
    EXPECT_EQ("whitelist: on\n", out);

    EXPECT_NE(0, run({"write", uuid, "server.jar", note}));
    EXPECT_NE(0, run({"read", uuid, "../../../etc/passwd"}));
    EXPECT_EQ(0, run({"rm", uuid, "config/paper.yml"}));
    EXPECT_FALSE(path_exists(root + "/instances/paper-" + InstanceUuid{uuid}.short_prefix() + "/config/paper.yml"));
}

TEST_F(CliFixture, StartStopAndDeleteRealServer) {
    std::string out;
    json manifest = {{"name", "sleeper"}, {"command", {"sleep", "30"}}};
    ASSERT_EQ(0, run({"create", "MinecraftFabric", write_manifest(manifest)}, &out));
    std::string uuid = json::parse(out).get<std::string>();

    ASSERT_EQ(0, run({"start", uuid}));
    ASSERT_EQ(0, run({"info", uuid}, &out));
    EXPECT_EQ("running", json::parse(out).at("state").get<std::string>());
    EXPECT_NE(0, run({"delete", uuid}));

    ASSERT_EQ(0, run({"stop", uuid}));
    ASSERT_EQ(0, run({"info", uuid}, &out));
    EXPECT_EQ("stopped", json::parse(out).at("state").get<std::string>());

    ASSERT_EQ(0, run({"delete", uuid}));
    EXPECT_NE(0, run({"info", uuid}));
    EXPECT_FALSE(path_exists(root + "/instances/sleeper-" + InstanceUuid{uuid}.short_prefix()));
}

TEST_F(CliFixture, FailuresExitNonZero) {
    EXPECT_NE(0, run({"list"}, nullptr, ""));
    EXPECT_NE(0, run({"list"}, nullptr, "wrong"));
    EXPECT_NE(0, run({"create", "MinecraftJavaVanilla", write_manifest(json{{"name", "x"}})}, nullptr, "guest-token"));
    EXPECT_NE(0, run({"create", "MinecraftJavaVanilla", write_manifest(json{{"name", "y"}, {"source", root + "/missing.jar"}})}));
    EXPECT_NE(0, run({"bogus"}));
}

TEST_F(CliFixture, TokenFromEnvironment) {
    setenv("LODESTONE_TOKEN", "owner-token", 1);
    EXPECT_EQ(0, run({"list"}, nullptr, ""));
    unsetenv("LODESTONE_TOKEN");
}
