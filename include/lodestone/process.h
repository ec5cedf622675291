#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

std::vector<pid_t> collect_process_tree(pid_t root_pid);

// Starts args in its own session with cwd as working directory and stdout and
// stderr appended to log_path.
bool spawn_process(const std::vector<std::string>& args,
                   const std::string& cwd,
                   const std::string& log_path,
                   pid_t& out_pid,
                   std::string& error_message);

// Reaps pid if it is an exited child of this process.
bool process_alive(pid_t pid);

// SIGTERM to pid and its descendants, then SIGKILL once timeout_sec passes.
bool terminate_process(pid_t pid, int timeout_sec, std::string& error_message);

// Start time of pid in clock ticks since boot, from /proc/<pid>/stat.
bool process_start_time(pid_t pid, uint64_t& start_time);
