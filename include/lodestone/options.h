#pragma once

#include <cstddef>
#include <string>

struct GlobalOptions {
    bool debug = false;
    std::string log_path;
    std::string log_format = "text";
    std::string instances_root;
    std::string users_path;
    std::string token;
};

extern GlobalOptions g_global_options;
extern const std::string LODESTONE_VERSION;

bool configure_log_destination(const std::string& path);
void reset_log_destination();

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warning(const std::string& message);
void log_error(const std::string& message);

// Number of warnings logged since start-up. Best-effort paths that swallow a
// failure record it here instead of propagating.
std::size_t warning_count();

std::string instances_base_path();
std::string fallback_instances_root();
std::string default_instances_root();
bool ensure_instances_root_directory();
// users.json next to the instances root.
std::string default_users_path();
std::string events_log_path();
