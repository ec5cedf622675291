#pragma once

#include <string>

// Joins a caller-supplied relative path onto root. Both '/' and '\\' are
// separators, '.' and empty segments are dropped, and '..' pops a segment.
// Throws ApiError(MalformedPath) if the result would leave root or the input
// contains a NUL byte. The result need not exist.
std::string scoped_join(const std::string& root, const std::string& relative_path);

// True for paths that may never be written or removed through the file API:
// a fixed list of executable/script/marker extensions, and any file without an
// extension.
bool is_file_protected(const std::string& path);
