#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lodestone/api.h"
#include "lodestone/events.h"
#include "lodestone/filesystem.h"
#include "lodestone/game_server.h"
#include "lodestone/options.h"
#include "lodestone/orchestrator.h"
#include "lodestone/users.h"

using json = nlohmann::json;

enum GlobalOptionValue {
    OPT_DEBUG = 1000,
    OPT_LOG,
    OPT_LOG_FORMAT,
    OPT_ROOT,
    OPT_USERS,
    OPT_TOKEN,
    OPT_VERSION,
    OPT_HELP
};

// Encodes everything but unreserved characters and '/'.
std::string percent_encode_path(const std::string& path) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

bool read_input(const std::string& source, std::string& out) {
    std::string error;
    if (source.empty() || source == "-") {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        out = buffer.str();
        return true;
    }
    if (!read_file_contents(source, out, error)) {
        std::cerr << error << std::endl;
        return false;
    }
    return true;
}

bool expect_argc(int argc, int min, int max, const std::string& command) {
    if (argc < min || argc > max) {
        std::cerr << "Error: Wrong number of arguments for '" << command << "'" << std::endl;
        return false;
    }
    return true;
}

// Translates a CLI command into the equivalent API request.
bool build_cli_request(int argc, char* const argv[], ApiRequest& request) {
    if (argc < 1) {
        return false;
    }
    std::string command = argv[0];
    request.token = g_global_options.token;

    auto instance_path = [&](const std::string& suffix) {
        return "/instance/" + percent_encode_path(argv[1]) + suffix;
    };

    if (command == "list") {
        if (!expect_argc(argc, 1, 1, command)) {
            return false;
        }
        request.method = "GET";
        request.path = "/instance/list";
    } else if (command == "info") {
        if (!expect_argc(argc, 2, 2, command)) {
            return false;
        }
        request.method = "GET";
        request.path = instance_path("/info");
    } else if (command == "create") {
        if (!expect_argc(argc, 3, 3, command)) {
            return false;
        }
        request.method = "POST";
        request.path = "/instance/create/" + percent_encode_path(argv[1]);
        if (!read_input(argv[2], request.body)) {
            return false;
        }
    } else if (command == "delete") {
        if (!expect_argc(argc, 2, 2, command)) {
            return false;
        }
        request.method = "DELETE";
        request.path = instance_path("");
    } else if (command == "start" || command == "stop") {
        if (!expect_argc(argc, 2, 2, command)) {
            return false;
        }
        request.method = "PUT";
        request.path = instance_path("/" + command);
    } else if (command == "ls") {
        if (!expect_argc(argc, 2, 3, command)) {
            return false;
        }
        request.method = "GET";
        request.path = instance_path("/fs/ls/" + (argc == 3 ? percent_encode_path(argv[2]) : std::string()));
    } else if (command == "read") {
        if (!expect_argc(argc, 3, 3, command)) {
            return false;
        }
        request.method = "GET";
        request.path = instance_path("/fs/read/" + percent_encode_path(argv[2]));
    } else if (command == "write") {
        if (!expect_argc(argc, 3, 4, command)) {
            return false;
        }
        request.method = "PUT";
        request.path = instance_path("/fs/write/" + percent_encode_path(argv[2]));
        if (!read_input(argc == 4 ? argv[3] : "", request.body)) {
            return false;
        }
    } else if (command == "mkdir") {
        if (!expect_argc(argc, 3, 3, command)) {
            return false;
        }
        request.method = "PUT";
        request.path = instance_path("/fs/mkdir/" + percent_encode_path(argv[2]));
    } else if (command == "rm") {
        if (!expect_argc(argc, 3, 3, command)) {
            return false;
        }
        request.method = "DELETE";
        request.path = instance_path("/fs/rm/" + percent_encode_path(argv[2]));
    } else if (command == "request") {
        if (!expect_argc(argc, 3, 4, command)) {
            return false;
        }
        request.method = argv[1];
        std::transform(request.method.begin(), request.method.end(), request.method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        request.path = argv[2];
        if (argc == 4 && !read_input(argv[3], request.body)) {
            return false;
        }
    } else {
        std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
        return false;
    }
    return true;
}

void print_response(const ApiResponse& response) {
    if (response.status >= 300) {
        json error = json::parse(response.body, nullptr, false);
        if (!error.is_discarded() && error.contains("kind")) {
            std::cerr << "Error (" << response.status << "): " << error.value("kind", "")
                      << ": " << error.value("detail", "") << std::endl;
        } else {
            std::cerr << "Error (" << response.status << "): " << response.body << std::endl;
        }
        return;
    }
    if (response.content_type.rfind("application/json", 0) != 0) {
        std::cout << response.body;
        return;
    }
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        std::cout << response.body << std::endl;
    } else if (!body.is_null()) {
        std::cout << body.dump(2) << std::endl;
    }
}

void show_events() {
    std::ifstream ifs(events_log_path());
    if (!ifs) {
        return;
    }
    std::string line;
    while (std::getline(ifs, line)) {
        std::cout << line << std::endl;
    }
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [global options] <command> [arguments]\n"
              << "\n"
              << "Global options:\n"
              << "  --debug                 Enable verbose debug logging\n"
              << "  --log <path>            Write logs to the given file\n"
              << "  --log-format <fmt>      Log format (text|json)\n"
              << "  --root <path>           Directory holding the instances\n"
              << "  --users <path>          Users file (default: users.json next to the root)\n"
              << "  --token <token>         Bearer token (default: $LODESTONE_TOKEN)\n"
              << "  --help                  Show this help message\n"
              << "  --version               Show version information\n"
              << "\n"
              << "Commands:\n"
              << "  list                           List instances you may view\n"
              << "  info   <id>                    Show one instance\n"
              << "  create <gameType> <manifest>   Create an instance from a manifest file ('-' for stdin)\n"
              << "  delete <id>                    Delete a stopped instance\n"
              << "  start  <id>                    Start an instance\n"
              << "  stop   <id>                    Stop an instance\n"
              << "  ls     <id> [path]             List files in an instance\n"
              << "  read   <id> <path>             Print a text file of an instance\n"
              << "  write  <id> <path> [file]      Write a file (stdin when no file is given)\n"
              << "  mkdir  <id> <path>             Create a directory\n"
              << "  rm     <id> <path>             Remove a file or directory\n"
              << "  request <METHOD> <path> [body] Send a raw API request\n"
              << "  events                         Show the recorded progression events\n"
              << "\n"
              << "Game types: MinecraftJavaVanilla, MinecraftForge, MinecraftFabric, MinecraftPaper\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    opterr = 0;
    optind = 1;
    const char* env_token = std::getenv("LODESTONE_TOKEN");
    if (env_token) {
        g_global_options.token = env_token;
    }

    static struct option global_long_options[] = {
            {"debug", no_argument, nullptr, OPT_DEBUG},
            {"log", required_argument, nullptr, OPT_LOG},
            {"log-format", required_argument, nullptr, OPT_LOG_FORMAT},
            {"root", required_argument, nullptr, OPT_ROOT},
            {"users", required_argument, nullptr, OPT_USERS},
            {"token", required_argument, nullptr, OPT_TOKEN},
            {"version", no_argument, nullptr, OPT_VERSION},
            {"help", no_argument, nullptr, OPT_HELP},
            {nullptr, 0, nullptr, 0}
    };

    int global_opt;
    while ((global_opt = getopt_long(argc, argv, "+", global_long_options, nullptr)) != -1) {
        switch (global_opt) {
            case OPT_DEBUG:
                g_global_options.debug = true;
                break;
            case OPT_LOG:
                g_global_options.log_path = optarg;
                if (!configure_log_destination(g_global_options.log_path)) {
                    return 1;
                }
                break;
            case OPT_LOG_FORMAT:
                g_global_options.log_format = optarg;
                if (g_global_options.log_format != "text" && g_global_options.log_format != "json") {
                    std::cerr << "Warning: Unsupported log format '" << g_global_options.log_format
                              << "', defaulting to text." << std::endl;
                    g_global_options.log_format = "text";
                }
                break;
            case OPT_ROOT:
                g_global_options.instances_root = optarg ? optarg : "";
                break;
            case OPT_USERS:
                g_global_options.users_path = optarg ? optarg : "";
                break;
            case OPT_TOKEN:
                g_global_options.token = optarg ? optarg : "";
                break;
            case OPT_VERSION:
                std::cout << "Lodestone version " << LODESTONE_VERSION << std::endl;
                return 0;
            case OPT_HELP:
                print_usage(argv[0]);
                return 0;
            case '?': {
                int idx = std::max(0, optind - 1);
                std::cerr << "Unknown global option: " << argv[idx] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            default:
                std::cerr << "Unknown option encountered." << std::endl;
                return 1;
        }
    }

    if (optind >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    char** command_argv = argv + optind;
    int command_argc = argc - optind;
    std::string command = command_argv[0];

    if (!ensure_instances_root_directory()) {
        return 1;
    }

    if (command == "events") {
        show_events();
        return 0;
    }

    ApiRequest request;
    if (!build_cli_request(command_argc, command_argv, request)) {
        print_usage(argv[0]);
        return 1;
    }

    if (g_global_options.users_path.empty()) {
        g_global_options.users_path = default_users_path();
    }
    UserStore users;
    try {
        users.load_from_file(g_global_options.users_path);
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }

    GameServerFactory factory;
    InstanceManager manager(g_global_options.instances_root, users, factory);
    auto observer = manager.events().subscribe();
    manager.restore_instances();

    ApiResponse response = handle_request(manager, request);
    print_response(response);

    manager.tasks().wait_idle();
    bool progression_failed = false;
    for (const auto& event : observer->drain()) {
        if (!record_event(events_log_path(), event)) {
            log_warning("Failed to record event " + std::to_string(event.event_id));
        }
        if (event.kind != EventKind::ProgressionEnd) {
            continue;
        }
        progression_failed = progression_failed || !event.success;
        if (event.message) {
            if (event.success) {
                log_info(*event.message);
            } else {
                log_error(*event.message);
            }
        }
    }

    if (progression_failed || !manager.tasks().faults().empty()) {
        return 1;
    }
    return response.status < 300 ? 0 : 1;
}
