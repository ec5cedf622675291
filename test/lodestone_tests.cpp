#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

#define main lodestone_cli_main
#include "../main.cpp"
#undef main

#include "lodestone/error.h"
#include "lodestone/process.h"
#include "lodestone/types.h"

struct TestContext {
    int passed = 0;
    int failed = 0;

    void expect(bool condition, const std::string& name, const std::string& message = "") {
        if (condition) {
            ++passed;
        } else {
            ++failed;
            std::cerr << "[FAIL] " << name;
            if (!message.empty()) {
                std::cerr << " - " << message;
            }
            std::cerr << std::endl;
        }
    }
};

std::string make_temp_dir(const std::string& prefix) {
    std::string tmpl = "/tmp/" + prefix + "XXXXXX";
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    char* created = mkdtemp(buffer.data());
    if (!created) {
        throw std::runtime_error("mkdtemp failed");
    }
    return created;
}

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

void cleanup(const std::string& path) {
    std::string error;
    if (!remove_tree(path, error)) {
        std::cerr << "[WARN] cleanup " << path << ": " << error << std::endl;
    }
}

void test_iso8601_format(TestContext& ctx) {
    const std::string ts = iso8601_now();
    bool has_z = !ts.empty() && ts.back() == 'Z';
    ctx.expect(has_z, "iso8601_now terminator", ts);
    bool has_fraction = ts.find('.') != std::string::npos;
    ctx.expect(has_fraction, "iso8601_now fractional", ts);
    ctx.expect(unix_time_now() > 1600000000, "unix_time_now plausible", std::to_string(unix_time_now()));
}

void test_collect_process_tree(TestContext& ctx) {
    pid_t self = getpid();
    auto pids = collect_process_tree(self);
    bool contains_self = std::find(pids.begin(), pids.end(), self) != pids.end();
    ctx.expect(contains_self, "collect_process_tree contains self");
}

void test_process_start_time(TestContext& ctx) {
    uint64_t own = 0;
    ctx.expect(process_start_time(getpid(), own) && own > 0, "process_start_time of self", std::to_string(own));
    uint64_t again = 0;
    ctx.expect(process_start_time(getpid(), again) && again == own, "process_start_time is stable");

    uint64_t missing = 0;
    ctx.expect(!process_start_time(0, missing), "process_start_time rejects pid 0");
}

void test_spawn_and_terminate(TestContext& ctx) {
    std::string dir = make_temp_dir("spawn-");
    std::string log_path = path_join(dir, "server.log");

    pid_t pid = 0;
    std::string error;
    bool spawned = spawn_process({"sh", "-c", "echo started; exec sleep 30"}, dir, log_path, pid, error);
    ctx.expect(spawned, "spawn_process starts command", error);
    if (spawned) {
        ctx.expect(process_alive(pid), "process_alive running child");
        ctx.expect(getsid(pid) == pid, "spawn_process new session");
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ctx.expect(read_file(log_path).find("started") != std::string::npos, "spawn_process log capture",
                   read_file(log_path));
        ctx.expect(terminate_process(pid, 2, error), "terminate_process succeeds", error);
        ctx.expect(!process_alive(pid), "terminate_process leaves nothing running");
    }

    pid_t missing = 0;
    bool bad = spawn_process({"lodestone-no-such-binary"}, dir, log_path, missing, error);
    ctx.expect(!bad, "spawn_process reports exec failure");
    ctx.expect(error.find("lodestone-no-such-binary") != std::string::npos, "spawn_process exec error message", error);

    pid_t exited = 0;
    if (spawn_process({"true"}, dir, log_path, exited, error)) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (process_alive(exited) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        ctx.expect(!process_alive(exited), "process_alive after exit");
    } else {
        ctx.expect(false, "spawn_process true", error);
    }

    cleanup(dir);
}

void test_filesystem_helpers(TestContext& ctx) {
    std::string base = make_temp_dir("fs-");
    std::string nested = path_join(base, "nested/deeper");
    ctx.expect(ensure_directory(nested, 0700), "ensure_directory creates nested");
    ctx.expect(is_directory(nested), "is_directory nested", nested);

    std::string file_path = path_join(nested, "file.txt");
    std::string error;
    ctx.expect(write_file_contents(file_path, "payload", error), "write_file_contents", error);
    ctx.expect(is_regular_file(file_path), "is_regular_file", file_path);
    std::string contents;
    ctx.expect(read_file_contents(file_path, contents, error) && contents == "payload",
               "read_file_contents round trip", contents);
    ctx.expect(!read_file_contents(path_join(base, "missing"), contents, error), "read_file_contents missing");

    ctx.expect(path_join("/a", "b") == "/a/b", "path_join simple");
    ctx.expect(path_join("/a/", "b") == "/a/b", "path_join trailing slash");
    ctx.expect(path_join("/", "b") == "/b", "path_join root");

    ctx.expect(is_valid_utf8("plain ascii"), "is_valid_utf8 ascii");
    ctx.expect(is_valid_utf8("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80"), "is_valid_utf8 multibyte");
    ctx.expect(!is_valid_utf8("\xc3"), "is_valid_utf8 truncated");
    ctx.expect(!is_valid_utf8("\xc0\xaf"), "is_valid_utf8 overlong");
    ctx.expect(!is_valid_utf8("\xed\xa0\x80"), "is_valid_utf8 surrogate");

    std::vector<FileEntry> entries;
    ctx.expect(list_directory(path_join(base, "nested"), base, entries, error), "list_directory", error);
    ctx.expect(entries.size() == 1 && entries[0].path == "nested/deeper" &&
               entries[0].file_type == FileType::Directory, "list_directory relative entries");

    ctx.expect(remove_tree(path_join(base, "nested"), error), "remove_tree nested", error);
    ctx.expect(!path_exists(path_join(base, "nested")), "remove_tree removes");
    error.clear();
    ctx.expect(!remove_tree(path_join(base, "nested"), error), "remove_tree missing path fails");

    std::string root = path_join(base, "instances");
    g_global_options.instances_root = root + "/";
    ctx.expect(ensure_instances_root_directory(), "ensure_instances_root_directory success");
    ctx.expect(g_global_options.instances_root == root, "ensure_instances_root_directory trims", g_global_options.instances_root);
    ctx.expect(is_directory(root), "ensure_instances_root_directory exists", root);
    ctx.expect(default_users_path() == path_join(base, "users.json"), "default_users_path beside root",
               default_users_path());
    ctx.expect(events_log_path() == path_join(root, "events.log"), "events_log_path", events_log_path());

    std::string fallback = fallback_instances_root();
    ctx.expect(fallback.find(std::to_string(geteuid())) != std::string::npos,
               "fallback_instances_root includes uid", fallback);

    if (geteuid() != 0) {
        std::string xdg_dir = make_temp_dir("xdg-");
        setenv("XDG_DATA_HOME", xdg_dir.c_str(), 1);
        std::string default_root = default_instances_root();
        ctx.expect(default_root == path_join(xdg_dir, "lodestone/instances"), "default_instances_root uses XDG",
                   default_root);
        unsetenv("XDG_DATA_HOME");
        cleanup(xdg_dir);
    } else {
        ctx.expect(default_instances_root() == "/var/lib/lodestone/instances", "default_instances_root as root");
    }

    g_global_options = GlobalOptions{};
    cleanup(base);
}

void test_marker_serialization(TestContext& ctx) {
    std::string dir = make_temp_dir("marker-");
    DotLodestoneConfig config;
    config.uuid = InstanceUuid::generate();
    config.game_type = GameType::MinecraftForge;

    std::string error;
    ctx.expect(save_marker(dir, config, error), "save_marker", error);
    ctx.expect(marker_path(dir) == path_join(dir, ".lodestone_config"), "marker_path", marker_path(dir));
    DotLodestoneConfig parsed = load_marker(dir);
    ctx.expect(parsed.uuid == config.uuid, "load_marker uuid", parsed.uuid.value);
    ctx.expect(parsed.game_type == GameType::MinecraftForge, "load_marker game type");

    json j = json::parse(read_file(marker_path(dir)));
    ctx.expect(j.at("game_type").get<std::string>() == "MinecraftForge", "marker game_type field", j.dump());

    bool threw = false;
    try {
        load_marker(path_join(dir, "missing"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ctx.expect(threw, "load_marker missing throws");

    cleanup(dir);
}

void test_game_server_config(TestContext& ctx) {
    std::string dir = make_temp_dir("server-");
    SetupConfig config;
    config.name = "survival";
    config.port = 25570;
    config.flavour = Flavour::Fabric;
    config.game_type = GameType::MinecraftFabric;
    config.command = {"sleep", "30"};
    InstanceUuid uuid = InstanceUuid::generate();

    GameServerInstance instance(config, uuid, dir, 1700000000, 2);
    std::string error;
    ctx.expect(instance.save_config(error), "GameServerInstance save_config", error);
    ctx.expect(instance.state() == InstanceState::Stopped, "GameServerInstance initially stopped");

    DotLodestoneConfig marker;
    marker.uuid = uuid;
    marker.game_type = GameType::MinecraftFabric;
    auto loaded = GameServerInstance::load(marker, dir, 2);
    InstanceInfo info = loaded->info();
    ctx.expect(info.name == "survival", "GameServerInstance load name", info.name);
    ctx.expect(info.port == 25570, "GameServerInstance load port", std::to_string(info.port));
    ctx.expect(info.flavour == Flavour::Fabric, "GameServerInstance load flavour");
    ctx.expect(info.creation_time == 1700000000, "GameServerInstance load creation time");

    bool started = true;
    try {
        loaded->start();
    } catch (const ApiError& e) {
        started = false;
        ctx.expect(false, "GameServerInstance start", e.what());
    }
    if (started) {
        ctx.expect(loaded->state() == InstanceState::Running, "GameServerInstance running after start");
        json persisted = json::parse(read_file(path_join(dir, INSTANCE_CONFIG_FILE_NAME)));
        ctx.expect(persisted.at("pid").get<int>() > 0, "GameServerInstance persists pid", persisted.dump());
        loaded->stop();
        ctx.expect(loaded->state() == InstanceState::Stopped, "GameServerInstance stopped after stop");
    }

    bool rejected = false;
    try {
        loaded->stop();
    } catch (const ApiError& e) {
        rejected = e.kind() == ErrorKind::BadRequest;
    }
    ctx.expect(rejected, "GameServerInstance stop when stopped");

    GameServerFactory factory;
    SetupConfig parsed = factory.construct_setup_config(json{{"name", "lobby"}}, GameType::MinecraftPaper);
    ctx.expect(parsed.port == 25565, "construct_setup_config default port", std::to_string(parsed.port));
    ctx.expect(parsed.flavour == Flavour::Paper, "construct_setup_config flavour");
    ctx.expect(!parsed.command.empty() && parsed.command[0] == "java", "construct_setup_config default command");

    cleanup(dir);
}

void test_configure_log_destination(TestContext& ctx) {
    std::string dir = make_temp_dir("logs-");
    std::string log_path = path_join(dir, "lodestone.log");
    g_global_options.debug = true;
    bool ok = configure_log_destination(log_path);
    ctx.expect(ok, "configure_log_destination success");
    log_debug("debug message for log file");
    std::size_t warnings = warning_count();
    log_warning("warning message for log file");
    ctx.expect(warning_count() == warnings + 1, "log_warning counted");

    g_global_options.log_format = "json";
    log_info("json formatted line");
    reset_log_destination();

    std::string contents = read_file(log_path);
    ctx.expect(contents.find("[debug] debug message") != std::string::npos, "log_debug writes to log", contents);
    ctx.expect(contents.find("[warning] warning message") != std::string::npos, "log_warning writes to log", contents);

    std::string last_line;
    std::istringstream lines(contents);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            last_line = line;
        }
    }
    json entry = json::parse(last_line, nullptr, false);
    ctx.expect(!entry.is_discarded() && entry.value("level", "") == "info" &&
               entry.value("message", "") == "json formatted line", "json log format", last_line);

    g_global_options = GlobalOptions{};
    cleanup(dir);
}

void test_print_response(TestContext& ctx) {
    std::streambuf* original_cout = std::cout.rdbuf();
    std::ostringstream captured;
    std::cout.rdbuf(captured.rdbuf());
    ApiResponse ok;
    ok.body = "[1,2]";
    print_response(ok);
    ApiResponse empty;
    empty.body = "null";
    print_response(empty);
    std::cout.rdbuf(original_cout);
    ctx.expect(captured.str() == "[\n  1,\n  2\n]\n", "print_response pretty prints", captured.str());
}

int main() {
    TestContext ctx;

    test_iso8601_format(ctx);
    test_collect_process_tree(ctx);
    test_process_start_time(ctx);
    test_spawn_and_terminate(ctx);
    test_filesystem_helpers(ctx);
    test_marker_serialization(ctx);
    test_game_server_config(ctx);
    test_configure_log_destination(ctx);
    test_print_response(ctx);

    std::cout << "[TEST SUMMARY] Passed: " << ctx.passed << ", Failed: " << ctx.failed << std::endl;
    return ctx.failed == 0 ? 0 : 1;
}
