#include "lodestone/api.h"

#include <cctype>
#include <vector>

#include "lodestone/error.h"
#include "lodestone/instance_fs.h"
#include "lodestone/options.h"

namespace {

const char* const ROUTE_PREFIX = "/instance/";

// Known route, wrong method. Reported as BadRequest with status 405.
class MethodNotAllowed : public ApiError {
public:
    explicit MethodNotAllowed(const std::string& method)
        : ApiError(ErrorKind::BadRequest, "Method " + method + " not allowed") {}
};

ApiResponse json_response(const json& body, int status = 200) {
    ApiResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

ApiResponse empty_response() {
    return json_response(json());
}

ApiResponse error_response(const ApiError& error, int status) {
    return json_response(error_to_json(error), status);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

void require_method(const ApiRequest& request, const char* method) {
    if (request.method != method) {
        throw MethodNotAllowed(request.method);
    }
}

json parse_body(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw ApiError(ErrorKind::BadRequest, "Request body is not valid JSON");
    }
    return parsed;
}

json instance_list_json(const std::vector<InstanceInfo>& infos) {
    json list = json::array();
    for (const auto& info : infos) {
        list.push_back(info.to_json_object());
    }
    return list;
}

ApiResponse route_fs(InstanceManager& manager,
                     const ApiRequest& request,
                     const InstanceUuid& uuid,
                     const std::string& operation,
                     const std::string& relative_path) {
    if (operation == "ls") {
        require_method(request, "GET");
        json entries = json::array();
        for (const auto& entry : list_instance_files(manager, request.token, uuid, relative_path)) {
            entries.push_back(entry.to_json_object());
        }
        return json_response(entries);
    }
    if (operation == "read") {
        require_method(request, "GET");
        ApiResponse response;
        response.content_type = "text/plain; charset=utf-8";
        response.body = read_instance_file(manager, request.token, uuid, relative_path);
        return response;
    }
    if (operation == "write") {
        require_method(request, "PUT");
        write_instance_file(manager, request.token, uuid, relative_path, request.body);
        return empty_response();
    }
    if (operation == "mkdir") {
        require_method(request, "PUT");
        make_instance_directory(manager, request.token, uuid, relative_path);
        return empty_response();
    }
    if (operation == "rm") {
        require_method(request, "DELETE");
        remove_instance_file(manager, request.token, uuid, relative_path);
        return empty_response();
    }
    throw ApiError(ErrorKind::NotFound, "Unknown route");
}

ApiResponse route(InstanceManager& manager, const ApiRequest& request) {
    std::string target = request.path;
    auto query = target.find('?');
    if (query != std::string::npos) {
        target = target.substr(0, query);
    }
    const std::string prefix = ROUTE_PREFIX;
    if (target.compare(0, prefix.size(), prefix) != 0) {
        throw ApiError(ErrorKind::NotFound, "Unknown route");
    }
    std::vector<std::string> parts = split_path(target.substr(prefix.size()));

    if (parts.size() == 1 && parts[0] == "list") {
        require_method(request, "GET");
        return json_response(instance_list_json(manager.list_instances(request.token)));
    }
    if (parts.size() == 2 && parts[0] == "create") {
        require_method(request, "POST");
        json manifest = parse_body(request.body);
        InstanceUuid uuid = manager.create_instance(request.token, percent_decode(parts[1]), manifest);
        return json_response(uuid.value);
    }
    if (parts.empty() || parts[0].empty()) {
        throw ApiError(ErrorKind::NotFound, "Unknown route");
    }

    InstanceUuid uuid{percent_decode(parts[0])};
    if (parts.size() == 1) {
        require_method(request, "DELETE");
        manager.delete_instance(request.token, uuid);
        return empty_response();
    }
    if (parts.size() == 2 && parts[1] == "info") {
        require_method(request, "GET");
        return json_response(manager.get_instance_info(request.token, uuid).to_json_object());
    }
    if (parts.size() == 2 && parts[1] == "start") {
        require_method(request, "PUT");
        manager.start_instance(request.token, uuid);
        return empty_response();
    }
    if (parts.size() == 2 && parts[1] == "stop") {
        require_method(request, "PUT");
        manager.stop_instance(request.token, uuid);
        return empty_response();
    }
    if (parts.size() >= 3 && parts[1] == "fs") {
        std::string relative;
        for (size_t i = 3; i < parts.size(); ++i) {
            if (i > 3) {
                relative += '/';
            }
            relative += parts[i];
        }
        return route_fs(manager, request, uuid, parts[2], percent_decode(relative));
    }
    throw ApiError(ErrorKind::NotFound, "Unknown route");
}

} // namespace

std::string percent_decode(const std::string& encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            decoded.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size()) {
            throw ApiError(ErrorKind::MalformedPath, "Malformed percent escape");
        }
        int hi = hex_value(encoded[i + 1]);
        int lo = hex_value(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
            throw ApiError(ErrorKind::MalformedPath, "Malformed percent escape");
        }
        decoded.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return decoded;
}

ApiResponse handle_request(InstanceManager& manager, const ApiRequest& request) {
    log_debug(request.method + " " + request.path);
    try {
        return route(manager, request);
    } catch (const MethodNotAllowed& e) {
        return error_response(e, 405);
    } catch (const ApiError& e) {
        return error_response(e, http_status_for(e.kind()));
    } catch (const std::exception& e) {
        log_error("Unhandled error for " + request.method + " " + request.path + ": " + e.what());
        return error_response(ApiError(ErrorKind::IOFailure, "Internal error"), 500);
    }
}
