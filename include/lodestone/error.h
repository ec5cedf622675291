#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class ErrorKind {
    Unauthorized,
    Forbidden,
    NotFound,
    BadRequest,
    MalformedPath,
    ProtectedResource,
    IOFailure
};

// Error surfaced to an API caller. what() is the human-readable detail; no
// other internal detail leaves the process.
class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

const char* error_kind_name(ErrorKind kind);
int http_status_for(ErrorKind kind);
json error_to_json(const ApiError& error);
