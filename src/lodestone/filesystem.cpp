#include "lodestone/filesystem.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

const char* file_type_name(FileType type) {
    switch (type) {
        case FileType::File:
            return "File";
        case FileType::Directory:
            return "Directory";
        case FileType::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

void note_failure(std::string& error_message, const std::string& what, const std::string& path) {
    if (error_message.empty()) {
        error_message = what + " " + path + ": " + std::strerror(errno);
    }
}

} // namespace

json FileEntry::to_json_object() const {
    return json{
            {"name", name},
            {"path", path},
            {"file_type", file_type_name(file_type)}
    };
}

bool ensure_directory(const std::string& path, mode_t mode) {
    if (path.empty()) {
        return false;
    }
    struct stat st {};
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    std::string parent;
    auto pos = path.find_last_of('/');
    if (pos != std::string::npos && pos != 0) {
        parent = path.substr(0, pos);
    } else if (pos == 0) {
        parent = "/";
    }
    if (!parent.empty() && parent != path) {
        if (!ensure_directory(parent, mode)) {
            return false;
        }
    }
    if (mkdir(path.c_str(), mode) == 0 || errno == EEXIST) {
        return true;
    }
    return false;
}

bool ensure_parent_directory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return true;
    }
    return ensure_directory(path.substr(0, pos));
}

bool path_exists(const std::string& path) {
    struct stat st {};
    return lstat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string& path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string path_join(const std::string& base, const std::string& child) {
    if (base.empty()) {
        return child;
    }
    if (child.empty()) {
        return base;
    }
    if (base == "/") {
        return "/" + child;
    }
    if (base.back() == '/') {
        return base + child;
    }
    return base + "/" + child;
}

bool remove_tree(const std::string& path, std::string& error_message) {
    struct stat st {};
    if (lstat(path.c_str(), &st) != 0) {
        note_failure(error_message, "Failed to stat", path);
        return false;
    }
    bool ok = true;
    if (S_ISDIR(st.st_mode)) {
        DIR* dir = opendir(path.c_str());
        if (!dir) {
            note_failure(error_message, "Failed to open directory", path);
            return false;
        }
        struct dirent* entry;
        while ((entry = readdir(dir)) != nullptr) {
            if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
                continue;
            }
            if (!remove_tree(path_join(path, entry->d_name), error_message)) {
                ok = false;
            }
        }
        closedir(dir);
        if (rmdir(path.c_str()) != 0) {
            note_failure(error_message, "Failed to remove directory", path);
            ok = false;
        }
    } else if (unlink(path.c_str()) != 0) {
        note_failure(error_message, "Failed to remove file", path);
        ok = false;
    }
    return ok;
}

bool read_file_contents(const std::string& path, std::string& out, std::string& error_message) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        error_message = "Failed to open " + path + ": " + std::strerror(errno);
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        error_message = "Failed to read " + path;
        return false;
    }
    out = buffer.str();
    return true;
}

bool write_file_contents(const std::string& path, const std::string& data, std::string& error_message) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        error_message = "Failed to open " + path + ": " + std::strerror(errno);
        return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
        error_message = "Failed to write " + path;
        return false;
    }
    return true;
}

bool is_valid_utf8(const std::string& data) {
    size_t i = 0;
    const size_t n = data.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong encodings, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

bool list_directory(const std::string& dir,
                    const std::string& root,
                    std::vector<FileEntry>& out,
                    std::string& error_message) {
    DIR* handle = opendir(dir.c_str());
    if (!handle) {
        error_message = "Failed to open directory " + dir + ": " + std::strerror(errno);
        return false;
    }
    std::string prefix = root;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        FileEntry file;
        file.name = entry->d_name;
        std::string full = path_join(dir, entry->d_name);
        file.path = full.compare(0, prefix.size(), prefix) == 0 ? full.substr(prefix.size()) : full;
        struct stat st {};
        if (lstat(full.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode)) {
                file.file_type = FileType::Directory;
            } else if (S_ISREG(st.st_mode)) {
                file.file_type = FileType::File;
            }
        }
        out.push_back(file);
    }
    closedir(handle);
    std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.name < b.name;
    });
    return true;
}
