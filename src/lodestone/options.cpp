#include "lodestone/options.h"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "lodestone/filesystem.h"
#include "lodestone/types.h"

using json = nlohmann::json;

namespace {

std::string ensure_trailing_slash(const std::string& path) {
    if (path.empty() || path.back() == '/') {
        return path;
    }
    return path + "/";
}

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::unique_ptr<std::ofstream> g_log_stream;
std::mutex g_log_mutex;
std::atomic<std::size_t> g_warning_count{0};

void write_log_line(const char* level, const std::string& message) {
    std::string line;
    if (g_global_options.log_format == "json") {
        json entry = {
                {"timestamp", iso8601_now()},
                {"level", level},
                {"message", message}
        };
        line = entry.dump();
    } else {
        line = std::string("[") + level + "] " + message;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_stream && g_log_stream->is_open()) {
        (*g_log_stream) << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

} // namespace

GlobalOptions g_global_options;
const std::string LODESTONE_VERSION = "0.4.2";

bool configure_log_destination(const std::string& path) {
    std::unique_ptr<std::ofstream> stream(new std::ofstream(path, std::ios::app));
    if (!stream || !(*stream)) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_stream = std::move(stream);
    return true;
}

void reset_log_destination() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_stream.reset();
}

void log_debug(const std::string& message) {
    if (g_global_options.debug) {
        write_log_line("debug", message);
    }
}

void log_info(const std::string& message) {
    write_log_line("info", message);
}

void log_warning(const std::string& message) {
    ++g_warning_count;
    write_log_line("warning", message);
}

void log_error(const std::string& message) {
    write_log_line("error", message);
}

std::size_t warning_count() {
    return g_warning_count.load();
}

std::string instances_base_path() {
    return ensure_trailing_slash(g_global_options.instances_root);
}

std::string fallback_instances_root() {
    return "/tmp/lodestone-" + std::to_string(geteuid()) + "/instances";
}

std::string default_instances_root() {
    if (geteuid() == 0) {
        return "/var/lib/lodestone/instances";
    }
    const char* data_home = std::getenv("XDG_DATA_HOME");
    if (data_home && data_home[0] != '\0') {
        return ensure_trailing_slash(data_home) + "lodestone/instances";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return ensure_trailing_slash(home) + ".local/share/lodestone/instances";
    }
    return fallback_instances_root();
}

bool ensure_instances_root_directory() {
    if (g_global_options.instances_root.empty()) {
        g_global_options.instances_root = default_instances_root();
    }
    g_global_options.instances_root = strip_trailing_slash(g_global_options.instances_root);
    if (ensure_directory(g_global_options.instances_root, 0755)) {
        return true;
    }
    int primary_error = errno;
    std::string fallback = strip_trailing_slash(fallback_instances_root());
    if (fallback != g_global_options.instances_root) {
        log_debug("Unable to use preferred instances root '" + g_global_options.instances_root +
                  "': " + std::strerror(primary_error));
        if (ensure_directory(fallback, 0755)) {
            log_debug("Falling back to instances root '" + fallback + "'");
            g_global_options.instances_root = fallback;
            return true;
        }
        log_error("Failed to create instances root directory '" + fallback +
                  "': " + std::strerror(errno));
        return false;
    }
    log_error("Failed to create instances root directory '" + g_global_options.instances_root +
              "': " + std::strerror(primary_error));
    return false;
}

std::string default_users_path() {
    std::string root = strip_trailing_slash(g_global_options.instances_root);
    auto pos = root.find_last_of('/');
    if (pos == std::string::npos) {
        return "users.json";
    }
    if (pos == 0) {
        return "/users.json";
    }
    return root.substr(0, pos) + "/users.json";
}

std::string events_log_path() {
    return instances_base_path() + "events.log";
}
