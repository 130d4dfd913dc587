#include <gtest/gtest.h>
#include <httplib.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>

#include "connection/connection_manager.hpp"
#include "mocks/fake_device.hpp"
#include "registry/router_registry.hpp"
#include "telemetry/telemetry_multiplexer.hpp"
#include "ws/websocket_server.hpp"

using namespace routerlink;
using namespace routerlink::tests;

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

TEST(SplitTargetTest, PathWithoutQuery) {
    std::string path;
    std::map<std::string, std::string> query;

    ws::split_target("/ws/health", path, query);

    EXPECT_EQ(path, "/ws/health");
    EXPECT_TRUE(query.empty());
}

TEST(SplitTargetTest, DecodesQueryValues) {
    std::string path;
    std::map<std::string, std::string> query;

    ws::split_target("/ws/traffic/monitor?router_id=3&interfaces=ether1%2Cether2&note=a+b&flag", path, query);

    EXPECT_EQ(path, "/ws/traffic/monitor");
    EXPECT_EQ(query["router_id"], "3");
    EXPECT_EQ(query["interfaces"], "ether1,ether2");
    EXPECT_EQ(query["note"], "a b");
    EXPECT_EQ(query.count("flag"), 1u);
    EXPECT_EQ(query["flag"], "");
}

TEST(SplitTargetTest, FirstOccurrenceWins) {
    std::string path;
    std::map<std::string, std::string> query;

    ws::split_target("/x?router_id=1&router_id=2", path, query);

    EXPECT_EQ(query["router_id"], "1");
}

class WebSocketServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry::RouterCreateRequest request;
        request.name = "core-01";
        request.hostname = "10.0.0.1";
        request.username = "admin";
        request.password = "secret";
        std::string error;
        router_id = registry.create_router(request, error)->id;

        dialer = std::make_shared<FakeDialer>();
        connection::ConnectionConfig config;
        config.dial_timeout_ms = 500;
        config.health_sweep_enabled = false;
        connections = std::make_unique<connection::ConnectionManager>(registry, dialer, config);
        multiplexer = std::make_unique<telemetry::TelemetryMultiplexer>(*connections);

        ws::WebSocketConfig ws_config;
        ws_config.bind = "127.0.0.1";
        ws_config.port = 0;
        ws_config.threads = 2;
        ws_config.shutdown_timeout_ms = 2000;
        server = std::make_unique<ws::WebSocketServer>(ws_config, *multiplexer);
        ASSERT_TRUE(server->start(error)) << error;
        ASSERT_NE(server->port(), 0);
    }

    void TearDown() override {
        server->stop();
        server.reset();
        multiplexer.reset();
        connections.reset();
    }

    // Opens a client websocket on the given target
    std::unique_ptr<beast::websocket::stream<tcp::socket>> open_client(const std::string &target) {
        auto client = std::make_unique<beast::websocket::stream<tcp::socket>>(ioc);
        tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), server->port());
        client->next_layer().connect(endpoint);
        client->handshake("127.0.0.1", target);
        return client;
    }

    static nlohmann::json read_message(beast::websocket::stream<tcp::socket> &client) {
        beast::flat_buffer buffer;
        client.read(buffer);
        return nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
    }

    registry::RouterRegistry registry;
    registry::RouterId router_id = 0;
    std::shared_ptr<FakeDialer> dialer;
    std::unique_ptr<connection::ConnectionManager> connections;
    std::unique_ptr<telemetry::TelemetryMultiplexer> multiplexer;
    std::unique_ptr<ws::WebSocketServer> server;
    net::io_context ioc;
};

TEST_F(WebSocketServerTest, HealthEndpoint) {
    httplib::Client client("127.0.0.1", server->port());

    auto res = client.Get("/ws/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_TRUE(body["success"]);
    EXPECT_EQ(body["message"], "WebSocket server running");
}

TEST_F(WebSocketServerTest, UnknownPathIs404) {
    httplib::Client client("127.0.0.1", server->port());

    auto res = client.Get("/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(WebSocketServerTest, MonitorWithoutUpgradeIs400) {
    httplib::Client client("127.0.0.1", server->port());

    auto res = client.Get("/ws/traffic/monitor?router_id=1&interface=ether1");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(WebSocketServerTest, StreamsTrafficAndAnswersPing) {
    auto client = open_client("/ws/traffic/monitor?router_id=" + std::to_string(router_id) + "&interface=ether1");

    auto connected = read_message(*client);
    EXPECT_EQ(connected["type"], "connected");

    ASSERT_TRUE(wait_for([&]() { return dialer->latest() && dialer->latest()->stream("ether1") != nullptr; }));
    dialer->latest()->stream("ether1")->push(traffic_record("ether1", "8000"));

    auto update = read_message(*client);
    EXPECT_EQ(update["type"], "traffic_update");
    EXPECT_EQ(update["interface"], "ether1");
    EXPECT_EQ(update["data"]["rx-bits-per-second"], "8000");

    client->write(net::buffer(std::string(R"({"type":"ping"})")));
    auto pong = read_message(*client);
    EXPECT_EQ(pong["type"], "pong");

    EXPECT_EQ(server->connection_count(), 1u);

    client->close(beast::websocket::close_code::normal);
    EXPECT_TRUE(wait_for([&]() { return multiplexer->active_stream_count() == 0; }));
    EXPECT_TRUE(wait_for([&]() { return server->connection_count() == 0; }));
}

TEST_F(WebSocketServerTest, InvalidRouterIdGetsErrorThenClose) {
    auto client = open_client("/ws/traffic/monitor?router_id=abc&interface=ether1");

    auto error = read_message(*client);
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["error"], "parameter 'router_id' is required and must be valid");

    beast::flat_buffer buffer;
    beast::error_code ec;
    client->read(buffer, ec);
    EXPECT_EQ(ec, beast::websocket::error::closed);
    EXPECT_EQ(dialer->dial_count.load(), 0);
}
