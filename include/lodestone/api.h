#pragma once

#include <string>

#include "lodestone/orchestrator.h"

struct ApiRequest {
    std::string method;
    // Percent-encoded request target, e.g. /instance/<id>/fs/read/world%20one/level.dat
    std::string path;
    // Bearer token, without the "Bearer " prefix.
    std::string token;
    std::string body;
};

struct ApiResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Routes one request onto the instance manager. Never throws; every failure
// becomes a typed {"kind", "detail"} response.
ApiResponse handle_request(InstanceManager& manager, const ApiRequest& request);

// Decodes %XX escapes. Throws ApiError(MalformedPath) on a broken escape.
std::string percent_decode(const std::string& encoded);
