#include "lodestone/sandbox.h"

#include <algorithm>
#include <cctype>
#include <vector>

#include "lodestone/error.h"

namespace {

const char* const PROTECTED_EXTENSIONS[] = {
        "jar",
        "lua",
        "sh",
        "exe",
        "bat",
        "cmd",
        "msi",
        "lodestone_config",
        "out",
        "inf",
};

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

bool is_drive_prefix(const std::string& segment) {
    return segment.size() == 2 && std::isalpha(static_cast<unsigned char>(segment[0])) && segment[1] == ':';
}

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (is_separator(c)) {
            segments.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    segments.push_back(current);
    return segments;
}

} // namespace

std::string scoped_join(const std::string& root, const std::string& relative_path) {
    if (relative_path.find('\0') != std::string::npos) {
        throw ApiError(ErrorKind::MalformedPath, "Path contains a NUL byte");
    }
    std::vector<std::string> parts;
    bool first = true;
    for (const auto& segment : split_segments(relative_path)) {
        if (first) {
            first = false;
            if (is_drive_prefix(segment)) {
                continue;
            }
        }
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (parts.empty()) {
                throw ApiError(ErrorKind::MalformedPath, "Path escapes the instance directory");
            }
            parts.pop_back();
            continue;
        }
        parts.push_back(segment);
    }

    std::string joined = root;
    while (joined.size() > 1 && joined.back() == '/') {
        joined.pop_back();
    }
    for (const auto& part : parts) {
        if (joined.empty() || joined.back() != '/') {
            joined += '/';
        }
        joined += part;
    }
    return joined;
}

bool is_file_protected(const std::string& path) {
    auto name_start = std::find_if(path.rbegin(), path.rend(), is_separator).base();
    std::string name(name_start, path.end());
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos) {
        return true;
    }
    std::string extension = name.substr(dot + 1);
    if (extension.empty()) {
        return true;
    }
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const char* protected_extension : PROTECTED_EXTENSIONS) {
        if (extension == protected_extension) {
            return true;
        }
    }
    return false;
}
