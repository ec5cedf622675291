#include <string>

#include "test_support.h"

#include "lodestone/api.h"

class ApiTest : public ManagerFixture {
protected:
    ApiResponse send(const std::string& method,
                     const std::string& path,
                     const std::string& token,
                     const std::string& body = "") {
        ApiRequest request;
        request.method = method;
        request.path = path;
        request.token = token;
        request.body = body;
        return handle_request(*manager, request);
    }

    std::string error_kind(const ApiResponse& response) {
        return json::parse(response.body).at("kind").get<std::string>();
    }

    InstanceUuid create_via_api(const std::string& name, uint32_t port = 25565) {
        ApiResponse response = send("POST", "/instance/create/MinecraftJavaVanilla", "alice-token",
                                    json{{"name", name}, {"port", port}}.dump());
        EXPECT_EQ(200, response.status) << response.body;
        manager->tasks().wait_idle();
        return InstanceUuid{json::parse(response.body).get<std::string>()};
    }
};

TEST_F(ApiTest, CreateListInfoDelete) {
    InstanceUuid uuid = create_via_api("api-world");

    ApiResponse list = send("GET", "/instance/list", "alice-token");
    ASSERT_EQ(200, list.status);
    json instances = json::parse(list.body);
    ASSERT_EQ(1u, instances.size());
    EXPECT_EQ(uuid.value, instances[0].at("uuid").get<std::string>());
    EXPECT_EQ("vanilla", instances[0].at("flavour").get<std::string>());

    ApiResponse info = send("GET", "/instance/" + uuid.value + "/info", "alice-token");
    ASSERT_EQ(200, info.status);
    EXPECT_EQ("api-world", json::parse(info.body).at("name").get<std::string>());
    EXPECT_EQ("stopped", json::parse(info.body).at("state").get<std::string>());

    ApiResponse removed = send("DELETE", "/instance/" + uuid.value, "alice-token");
    EXPECT_EQ(200, removed.status);
    EXPECT_EQ("null", removed.body);
    EXPECT_EQ(404, send("GET", "/instance/" + uuid.value + "/info", "alice-token").status);
}

TEST_F(ApiTest, ErrorsMapToStatusAndKind) {
    ApiResponse unauthorized = send("GET", "/instance/list", "");
    EXPECT_EQ(401, unauthorized.status);
    EXPECT_EQ("Unauthorized", error_kind(unauthorized));

    ApiResponse forbidden = send("POST", "/instance/create/MinecraftJavaVanilla", "bob-token", R"({"name":"x"})");
    EXPECT_EQ(403, forbidden.status);
    EXPECT_EQ("Forbidden", error_kind(forbidden));

    ApiResponse bad_json = send("POST", "/instance/create/MinecraftJavaVanilla", "alice-token", "{name:");
    EXPECT_EQ(400, bad_json.status);
    EXPECT_EQ("BadRequest", error_kind(bad_json));

    ApiResponse missing = send("GET", "/instance/INSTANCE_nothing/info", "admin-token");
    EXPECT_EQ(404, missing.status);
    EXPECT_EQ("NotFound", error_kind(missing));

    EXPECT_EQ(404, send("GET", "/status", "admin-token").status);
    EXPECT_EQ(404, send("GET", "/instance/", "admin-token").status);
    EXPECT_EQ(405, send("POST", "/instance/list", "admin-token").status);
}

TEST_F(ApiTest, DeletingRunningInstanceIsBadRequest) {
    InstanceUuid uuid = create_via_api("running");
    ASSERT_EQ(200, send("PUT", "/instance/" + uuid.value + "/start", "alice-token").status);

    ApiResponse response = send("DELETE", "/instance/" + uuid.value, "alice-token");
    EXPECT_EQ(400, response.status);
    EXPECT_EQ("BadRequest", error_kind(response));
    EXPECT_TRUE(manager->registry().contains(uuid));

    ASSERT_EQ(200, send("PUT", "/instance/" + uuid.value + "/stop", "alice-token").status);
    EXPECT_EQ(200, send("DELETE", "/instance/" + uuid.value, "alice-token").status);
}

TEST_F(ApiTest, FileRoutes) {
    InstanceUuid uuid = create_via_api("fs");
    std::string base = "/instance/" + uuid.value + "/fs/";

    EXPECT_EQ(200, send("PUT", base + "mkdir/world%20one", "alice-token").status);
    EXPECT_EQ(200, send("PUT", base + "write/world%20one/notes.txt", "alice-token", "hello").status);

    ApiResponse read = send("GET", base + "read/world%20one/notes.txt", "alice-token");
    ASSERT_EQ(200, read.status);
    EXPECT_EQ("hello", read.body);
    EXPECT_EQ(0u, read.content_type.find("text/plain"));

    ApiResponse ls = send("GET", base + "ls/world%20one", "alice-token");
    ASSERT_EQ(200, ls.status);
    json entries = json::parse(ls.body);
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("world one/notes.txt", entries[0].at("path").get<std::string>());
    EXPECT_EQ("File", entries[0].at("file_type").get<std::string>());

    EXPECT_EQ(200, send("GET", base + "ls/", "alice-token").status);
    EXPECT_EQ(200, send("DELETE", base + "rm/world%20one/notes.txt", "alice-token").status);
    EXPECT_EQ(405, send("GET", base + "rm/world%20one/notes.txt", "alice-token").status);
}

TEST_F(ApiTest, FileRouteFailures) {
    InstanceUuid uuid = create_via_api("guarded");
    std::string base = "/instance/" + uuid.value + "/fs/";

    ApiResponse escape = send("GET", base + "read/..%2F..%2Fetc%2Fpasswd", "alice-token");
    EXPECT_EQ(400, escape.status);
    EXPECT_EQ("MalformedPath", error_kind(escape));

    ApiResponse traversal = send("GET", base + "read/../../etc/passwd", "alice-token");
    EXPECT_EQ(400, traversal.status);
    EXPECT_EQ("MalformedPath", error_kind(traversal));

    ApiResponse backslash = send("PUT", base + "write/..%5C..%5Csecret.txt", "alice-token", "x");
    EXPECT_EQ("MalformedPath", error_kind(backslash));

    ApiResponse protected_write = send("PUT", base + "write/server.jar", "alice-token", "x");
    EXPECT_EQ(403, protected_write.status);
    EXPECT_EQ("ProtectedResource", error_kind(protected_write));

    ApiResponse broken_escape = send("GET", base + "read/bad%2", "alice-token");
    EXPECT_EQ("MalformedPath", error_kind(broken_escape));

    ApiResponse forbidden = send("GET", base + "ls/", "bob-token");
    EXPECT_EQ(403, forbidden.status);
    EXPECT_EQ("Forbidden", error_kind(forbidden));
}

TEST(PercentDecode, DecodesEscapes) {
    EXPECT_EQ("a b/c", percent_decode("a%20b%2Fc"));
    EXPECT_EQ("plain", percent_decode("plain"));
    EXPECT_EQ("\xc3\xa9", percent_decode("%C3%a9"));
    EXPECT_THROW(percent_decode("%zz"), ApiError);
    EXPECT_THROW(percent_decode("tail%4"), ApiError);
}
