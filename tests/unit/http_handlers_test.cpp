/**
 * @file http_handlers_test.cpp
 * @brief Unit tests for HTTP server handlers
 *
 * Runs a real HttpServer over an in-memory inventory and a fake device dialer:
 * - Envelope shape on success and failure
 * - Status mapping (400, 404, 405, 500)
 * - Router inventory CRUD
 * - Connection and command endpoints
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>

#include "commands/router_commands.hpp"
#include "connection/connection_manager.hpp"
#include "http/server.hpp"
#include "mocks/fake_device.hpp"
#include "registry/router_registry.hpp"
#include "runtime/config.hpp"

// Skipped under ThreadSanitizer: cpp-httplib's listen/bind threading trips TSAN
// during server initialization.
#if defined(__SANITIZE_THREAD__)
#define ROUTERLINK_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define ROUTERLINK_SKIP_HTTP_TESTS 1
#else
#define ROUTERLINK_SKIP_HTTP_TESTS 0
#endif
#else
#define ROUTERLINK_SKIP_HTTP_TESTS 0
#endif

#if !ROUTERLINK_SKIP_HTTP_TESTS

using namespace routerlink;
using namespace routerlink::tests;
using namespace testing;
using nlohmann::json;

/**
 * @brief Test fixture for HTTP handler tests
 *
 * Uses a dedicated test port (9999) to avoid conflicts.
 */
class HttpHandlersTest : public Test {
protected:
    void SetUp() override {
        registry = std::make_unique<registry::RouterRegistry>();
        dialer = std::make_shared<FakeDialer>();

        connection::ConnectionConfig conn_config;
        conn_config.dial_timeout_ms = 500;
        conn_config.health_sweep_enabled = false;
        connections = std::make_unique<connection::ConnectionManager>(*registry, dialer, conn_config);
        commands = std::make_unique<commands::RouterCommands>(*connections);

        runtime::HttpConfig http_config;
        http_config.enabled = true;
        http_config.bind = "127.0.0.1";
        http_config.port = 9999;                   // Fixed test port
        http_config.cors_allowed_origins = {"*"};  // Allow CORS for testing
        http_config.thread_pool_size = 4;
        http_config.connect_timeout_ms = 1000;

        server = std::make_unique<http::HttpServer>(http_config, *registry, *connections, *commands);

        std::string error;
        ASSERT_TRUE(server->start(error)) << "Failed to start HTTP server: " << error;
        ASSERT_EQ(server->get_port(), 9999);

        // Give server time to bind
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        client = std::make_unique<httplib::Client>("http://127.0.0.1:9999");
        client->set_connection_timeout(1, 0);
        client->set_read_timeout(5, 0);
    }

    void TearDown() override {
        client.reset();
        if (server) {
            server->stop();
        }
        server.reset();
        commands.reset();
        connections.reset();
    }

    registry::RouterId add_router(const std::string &name, bool active = true) {
        registry::RouterCreateRequest request;
        request.name = name;
        request.hostname = "10.0.0." + std::to_string(registry->router_count() + 1);
        request.username = "admin";
        request.password = "secret";
        request.is_active = active;
        std::string error;
        auto router = registry->create_router(request, error);
        EXPECT_TRUE(router.has_value()) << error;
        return router ? router->id : 0;
    }

    static json body_of(const httplib::Result &res) { return json::parse(res->body); }

    std::unique_ptr<registry::RouterRegistry> registry;
    std::shared_ptr<FakeDialer> dialer;
    std::unique_ptr<connection::ConnectionManager> connections;
    std::unique_ptr<commands::RouterCommands> commands;
    std::unique_ptr<http::HttpServer> server;
    std::unique_ptr<httplib::Client> client;
};

//=============================================================================
// System
//=============================================================================
TEST_F(HttpHandlersTest, HealthReportsCounts) {
    add_router("core-01");

    auto res = client->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");

    auto body = body_of(res);
    EXPECT_TRUE(body["success"]);
    EXPECT_EQ(body["message"], "API is running");
    EXPECT_EQ(body["data"]["routers"], 1);
    EXPECT_EQ(body["data"]["connections"], 0);
}

TEST_F(HttpHandlersTest, UnknownRouteIsEnvelope404) {
    auto res = client->Get("/api/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    auto body = body_of(res);
    EXPECT_FALSE(body["success"]);
    EXPECT_THAT(body["error"].get<std::string>(), HasSubstr("Route not found"));
}

TEST_F(HttpHandlersTest, CorsHeadersOnRequestWithOrigin) {
    httplib::Headers headers = {{"Origin", "http://localhost:3000"}};
    auto res = client->Get("/health", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_THAT(res->get_header_value("Access-Control-Allow-Methods"), HasSubstr("PATCH"));
}

//=============================================================================
// Router inventory
//=============================================================================
TEST_F(HttpHandlersTest, CreateRouterReturnsRecordWithoutPassword) {
    json request = {{"name", "core-01"},
                    {"hostname", "192.168.88.1"},
                    {"username", "admin"},
                    {"password", "secret"},
                    {"location", "rack A"}};

    auto res = client->Post("/api/routers", request.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = body_of(res);
    EXPECT_TRUE(body["success"]);
    EXPECT_EQ(body["message"], "Router created");
    EXPECT_EQ(body["data"]["id"], 1);
    EXPECT_EQ(body["data"]["port"], 8728);
    EXPECT_EQ(body["data"]["location"], "rack A");
    EXPECT_TRUE(body["data"]["description"].is_null());
    EXPECT_EQ(body["data"]["status"], "offline");
    EXPECT_FALSE(body["data"].contains("password"));
    EXPECT_EQ(registry->router_count(), 1u);
}

TEST_F(HttpHandlersTest, CreateRouterMissingFieldIs400) {
    json request = {{"name", "core-01"}, {"hostname", "192.168.88.1"}, {"username", "admin"}};

    auto res = client->Post("/api/routers", request.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = body_of(res);
    EXPECT_FALSE(body["success"]);
    EXPECT_EQ(body["error"], "password is required");
}

TEST_F(HttpHandlersTest, CreateRouterMalformedJsonIs400) {
    auto res = client->Post("/api/routers", "{not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_THAT(body_of(res)["error"].get<std::string>(), HasSubstr("Invalid request body"));
}

TEST_F(HttpHandlersTest, CreateRouterWrongFieldTypeIs400) {
    json request = {{"name", "core-01"},
                    {"hostname", "192.168.88.1"},
                    {"username", "admin"},
                    {"password", "secret"},
                    {"port", "not-a-number"}};

    auto res = client->Post("/api/routers", request.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_THAT(body_of(res)["error"].get<std::string>(), HasSubstr("'port'"));
}

TEST_F(HttpHandlersTest, ListAndActiveFilter) {
    add_router("core-01");
    add_router("edge-02", false);

    auto all = client->Get("/api/routers");
    ASSERT_TRUE(all);
    EXPECT_EQ(body_of(all)["data"].size(), 2u);

    auto active = client->Get("/api/routers/active");
    ASSERT_TRUE(active);
    auto data = body_of(active)["data"];
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0]["name"], "core-01");
}

TEST_F(HttpHandlersTest, GetRouterNotFoundIs404) {
    auto res = client->Get("/api/routers/42");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(body_of(res)["error"], "router with ID 42 not found");
}

TEST_F(HttpHandlersTest, UpdateRouterChangesGivenFields) {
    auto id = add_router("core-01");
    json request = {{"hostname", "10.9.9.9"}, {"description", "moved"}};

    auto res = client->Put("/api/routers/" + std::to_string(id), request.dump(), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = body_of(res);
    EXPECT_EQ(body["message"], "Router updated");
    EXPECT_EQ(body["data"]["hostname"], "10.9.9.9");
    EXPECT_EQ(body["data"]["name"], "core-01");
    EXPECT_EQ(registry->get_router(id)->description.value_or(""), "moved");
}

TEST_F(HttpHandlersTest, DeleteRouterClosesItsConnection) {
    auto id = add_router("core-01");
    ASSERT_TRUE(connections->get_or_connect(id).success);

    auto res = client->Delete("/api/routers/" + std::to_string(id));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body_of(res)["message"], "Router deleted");
    EXPECT_FALSE(registry->get_router(id).has_value());
    EXPECT_FALSE(connections->is_connected(id));

    auto again = client->Delete("/api/routers/" + std::to_string(id));
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 404);
}

TEST_F(HttpHandlersTest, PatchStatusValidatesValue) {
    auto id = add_router("core-01");
    const std::string path = "/api/routers/" + std::to_string(id) + "/status";

    auto bad = client->Patch(path, json{{"status", "degraded"}}.dump(), "application/json");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);

    auto good = client->Patch(path, json{{"status", "online"}, {"version", "7.14"}}.dump(), "application/json");
    ASSERT_TRUE(good);
    EXPECT_EQ(good->status, 200);
    EXPECT_EQ(body_of(good)["message"], "Router status updated");
    EXPECT_EQ(registry->get_router(id)->version.value_or(""), "7.14");
}

TEST_F(HttpHandlersTest, PatchActiveTogglesFlag) {
    auto id = add_router("core-01");

    auto res = client->Patch("/api/routers/" + std::to_string(id) + "/active", json{{"is_active", false}}.dump(),
                             "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body_of(res)["message"], "Router deactivated");
    EXPECT_FALSE(registry->get_router(id)->is_active);
}

TEST_F(HttpHandlersTest, WrongMethodIs405) {
    auto res = client->Patch("/api/routers", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);
    EXPECT_FALSE(body_of(res)["success"]);

    auto del = client->Delete("/api/interfaces?router_id=1");
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 405);
}

//=============================================================================
// Connections
//=============================================================================
TEST_F(HttpHandlersTest, ConnectAndStatus) {
    auto id = add_router("core-01");

    auto res = client->Post("/api/connections/connect?router_id=" + std::to_string(id), "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = body_of(res);
    EXPECT_EQ(body["message"], "Router connected");
    EXPECT_EQ(body["data"]["router_id"], id);

    auto status = client->Get("/api/connections/status");
    ASSERT_TRUE(status);
    auto data = body_of(status)["data"];
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0]["router_name"], "core-01");
    EXPECT_TRUE(data[0]["is_healthy"]);
}

TEST_F(HttpHandlersTest, ConnectWithoutRouterIdIs400) {
    auto res = client->Get("/api/connections/connect");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(body_of(res)["error"], "parameter 'router_id' is required and must be valid");

    auto bad = client->Get("/api/connections/connect?router_id=abc");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);
}

TEST_F(HttpHandlersTest, ConnectUnknownRouterIs404) {
    auto res = client->Get("/api/connections/connect?router_id=77");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(HttpHandlersTest, ConnectAuthFailureIs500) {
    auto id = add_router("core-01");
    dialer->failure = device::DialError::AUTH_FAILED;

    auto res = client->Get("/api/connections/connect?router_id=" + std::to_string(id));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_THAT(body_of(res)["error"].get<std::string>(), HasSubstr("invalid user name or password"));
}

TEST_F(HttpHandlersTest, DisconnectWithoutSessionFails) {
    auto id = add_router("core-01");

    auto res = client->Get("/api/connections/disconnect?router_id=" + std::to_string(id));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_FALSE(body_of(res)["success"]);
}

//=============================================================================
// Commands
//=============================================================================
TEST_F(HttpHandlersTest, AvailableInterfacesMessageAndShape) {
    auto id = add_router("core-01");
    ASSERT_TRUE(connections->get_or_connect(id).success);
    dialer->latest()->set_reply("/interface/print", {make_record({{".id", "*1"},
                                                                  {"name", "ether1"},
                                                                  {"type", "ether"},
                                                                  {"running", "true"},
                                                                  {"disabled", "false"},
                                                                  {"rx-bytes", "10"}}),
                                                     make_record({{".id", "*2"},
                                                                  {"name", "ether2"},
                                                                  {"running", "false"},
                                                                  {"disabled", "false"}})});

    auto res = client->Get("/api/interfaces/list?router_id=" + std::to_string(id));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = body_of(res);
    EXPECT_EQ(body["message"], "Found 1 available interfaces");
    ASSERT_EQ(body["data"].size(), 1u);
    EXPECT_EQ(body["data"][0]["rx_bytes"], "10");

    auto all = client->Get("/api/interfaces?router_id=" + std::to_string(id));
    ASSERT_TRUE(all);
    auto data = body_of(all)["data"];
    ASSERT_EQ(data.size(), 2u);
    EXPECT_EQ(data[0][".id"], "*1");
    EXPECT_EQ(data[0]["rx-bytes"], "10");
}

TEST_F(HttpHandlersTest, CommandRequiresParameters) {
    auto id = add_router("core-01");

    auto res = client->Post("/api/interfaces/enable?router_id=" + std::to_string(id), "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(body_of(res)["error"], "parameter 'name' is required");
    EXPECT_EQ(dialer->dial_count.load(), 0);
}

TEST_F(HttpHandlersTest, EnableUnknownInterfaceIs500) {
    auto id = add_router("core-01");

    auto res = client->Post("/api/interfaces/enable?router_id=" + std::to_string(id) + "&name=ether9", "",
                            "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(body_of(res)["error"], "interface ether9 not found");
}

TEST_F(HttpHandlersTest, TrafficOnceReturnsSample) {
    auto id = add_router("core-01");
    ASSERT_TRUE(connections->get_or_connect(id).success);
    dialer->latest()->set_reply("/interface/monitor-traffic", {traffic_record("ether1", "2048")});

    auto res = client->Get("/api/traffic/once?router_id=" + std::to_string(id) + "&interface=ether1");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto data = body_of(res)["data"];
    EXPECT_EQ(data["interface"], "ether1");
    EXPECT_EQ(data["rx-bits-per-second"], "2048");
    EXPECT_TRUE(data["timestamp"].is_string());
}

TEST_F(HttpHandlersTest, QueueAddUsesDeviceFieldName) {
    auto id = add_router("core-01");

    auto res = client->Post("/api/queues/add?router_id=" + std::to_string(id) +
                                "&name=guest&target=10.0.0.0/24&max-limit=5M/5M",
                            "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body_of(res)["message"], "Queue added");
    EXPECT_THAT(dialer->latest()->command_log().back(),
                ElementsAre("/queue/simple/add", "=name=guest", "=target=10.0.0.0/24", "=max-limit=5M/5M"));
}

#endif  // !ROUTERLINK_SKIP_HTTP_TESTS
