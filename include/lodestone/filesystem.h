#pragma once

#include <string>
#include <sys/stat.h>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class FileType {
    File,
    Directory,
    Unknown
};

struct FileEntry {
    std::string name;
    // Path relative to the directory listing was rooted at.
    std::string path;
    FileType file_type = FileType::Unknown;

    json to_json_object() const;
};

bool ensure_directory(const std::string& path, mode_t mode = 0755);
bool ensure_parent_directory(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

std::string path_join(const std::string& base, const std::string& child);

// Recursively removes path. Keeps going past individual failures and reports
// the first one; returns true only if everything was removed.
bool remove_tree(const std::string& path, std::string& error_message);

bool read_file_contents(const std::string& path, std::string& out, std::string& error_message);
bool write_file_contents(const std::string& path, const std::string& data, std::string& error_message);
bool is_valid_utf8(const std::string& data);

bool list_directory(const std::string& dir,
                    const std::string& root,
                    std::vector<FileEntry>& out,
                    std::string& error_message);
