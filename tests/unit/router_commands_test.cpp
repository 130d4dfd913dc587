#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "commands/router_commands.hpp"
#include "connection/connection_manager.hpp"
#include "mocks/fake_device.hpp"
#include "registry/router_registry.hpp"

using namespace routerlink;
using namespace routerlink::tests;
using commands::RouterCommands;
using connection::ErrorCode;
using ::testing::ElementsAre;

class RouterCommandsTest : public ::testing::Test {
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
        commands = std::make_unique<RouterCommands>(*connections);

        ASSERT_TRUE(connections->get_or_connect(router_id).success);
        device = dialer->latest();
        device->set_reply("/interface/print",
                          {make_record({{".id", "*1"},
                                        {"name", "ether1"},
                                        {"type", "ether"},
                                        {"running", "true"},
                                        {"disabled", "false"},
                                        {"rx-bytes", "1000"}}),
                           make_record({{".id", "*2"},
                                        {"name", "ether2"},
                                        {"type", "ether"},
                                        {"running", "false"},
                                        {"disabled", "false"}}),
                           make_record({{".id", "*3"},
                                        {"name", "wlan1"},
                                        {"type", "wlan"},
                                        {"running", "true"},
                                        {"disabled", "true"}})});
    }

    // Last command the device received
    device::Command last_command() {
        auto log = device->command_log();
        return log.empty() ? device::Command() : log.back();
    }

    registry::RouterRegistry registry;
    registry::RouterId router_id = 0;
    std::shared_ptr<FakeDialer> dialer;
    std::shared_ptr<FakeDeviceSession::Shared> device;
    std::unique_ptr<connection::ConnectionManager> connections;
    std::unique_ptr<RouterCommands> commands;
};

TEST_F(RouterCommandsTest, ListInterfacesMapsRecords) {
    std::vector<commands::Interface> interfaces;
    auto result = commands->list_interfaces(router_id, interfaces);

    ASSERT_TRUE(result.success) << result.error_message;
    ASSERT_EQ(interfaces.size(), 3u);
    EXPECT_EQ(interfaces[0].id, "*1");
    EXPECT_EQ(interfaces[0].name, "ether1");
    EXPECT_TRUE(interfaces[0].running);
    EXPECT_FALSE(interfaces[0].disabled);
    EXPECT_EQ(interfaces[0].rx_bytes, "1000");
    EXPECT_TRUE(interfaces[2].disabled);
}

TEST_F(RouterCommandsTest, AvailableInterfacesAreRunningAndEnabled) {
    std::vector<commands::Interface> interfaces;
    auto result = commands->list_available_interfaces(router_id, interfaces);

    ASSERT_TRUE(result.success);
    ASSERT_EQ(interfaces.size(), 1u);
    EXPECT_EQ(interfaces[0].name, "ether1");
}

TEST_F(RouterCommandsTest, DisableResolvesIdThenSets) {
    device->set_reply("/interface/print", {make_record({{".id", "*7"}, {"name", "ether1"}})});

    auto result = commands->disable_interface(router_id, "ether1");

    ASSERT_TRUE(result.success) << result.error_message;
    auto log = device->command_log();
    ASSERT_GE(log.size(), 2u);
    EXPECT_THAT(log[log.size() - 2], ElementsAre("/interface/print", "?name=ether1"));
    EXPECT_THAT(log.back(), ElementsAre("/interface/set", "=.id=*7", "=disabled=true"));
}

TEST_F(RouterCommandsTest, EnableUnknownInterfaceFails) {
    device->set_reply("/interface/print", {});

    auto result = commands->enable_interface(router_id, "ether9");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::COMMAND_FAILED);
    EXPECT_EQ(result.error_message, "interface ether9 not found");
    EXPECT_NE(last_command().front(), "/interface/set");
}

TEST_F(RouterCommandsTest, EnableRequiresName) {
    auto result = commands->enable_interface(router_id, "");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RouterCommandsTest, AddAddressBuildsCommand) {
    auto result = commands->add_address(router_id, "ether1", "10.10.0.1/24");

    ASSERT_TRUE(result.success);
    EXPECT_THAT(last_command(), ElementsAre("/ip/address/add", "=address=10.10.0.1/24", "=interface=ether1"));
}

TEST_F(RouterCommandsTest, AddAddressRequiresBothFields) {
    auto result = commands->add_address(router_id, "ether1", "");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RouterCommandsTest, ListAddressesAndQueues) {
    device->set_reply("/ip/address/print", {make_record({{".id", "*A"},
                                                          {"address", "10.0.0.1/24"},
                                                          {"interface", "ether1"},
                                                          {"network", "10.0.0.0"},
                                                          {"disabled", "false"}})});
    device->set_reply("/queue/simple/print", {make_record({{".id", "*Q"},
                                                            {"name", "guest"},
                                                            {"target", "10.0.0.0/24"},
                                                            {"max-limit", "10M/10M"},
                                                            {"burst-limit", "0/0"}})});

    std::vector<commands::Address> addresses;
    ASSERT_TRUE(commands->list_addresses(router_id, addresses).success);
    ASSERT_EQ(addresses.size(), 1u);
    EXPECT_EQ(addresses[0].network, "10.0.0.0");

    std::vector<commands::Queue> queues;
    ASSERT_TRUE(commands->list_queues(router_id, queues).success);
    ASSERT_EQ(queues.size(), 1u);
    EXPECT_EQ(queues[0].max_limit, "10M/10M");
    EXPECT_EQ(queues[0].burst_limit, "0/0");
}

TEST_F(RouterCommandsTest, QueueAddAndRemove) {
    ASSERT_TRUE(commands->add_queue(router_id, "guest", "10.0.0.0/24", "5M/5M").success);
    EXPECT_THAT(last_command(),
                ElementsAre("/queue/simple/add", "=name=guest", "=target=10.0.0.0/24", "=max-limit=5M/5M"));

    ASSERT_TRUE(commands->remove_queue(router_id, "*Q").success);
    EXPECT_THAT(last_command(), ElementsAre("/queue/simple/remove", "=.id=*Q"));

    EXPECT_EQ(commands->remove_queue(router_id, "").code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RouterCommandsTest, TrafficOnceReturnsSingleSample) {
    device->set_reply("/interface/monitor-traffic", {traffic_record("ether1", "12345")});

    telemetry::TrafficSample sample;
    auto result = commands->traffic_once(router_id, "ether1", sample);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(sample.router_id, router_id);
    EXPECT_EQ(sample.rx_bits_per_second, "12345");
    EXPECT_THAT(last_command(), ElementsAre("/interface/monitor-traffic", "=interface=ether1", "=once="));
}

TEST_F(RouterCommandsTest, TrafficOnceWithoutDataFails) {
    device->set_reply("/interface/monitor-traffic", {});

    telemetry::TrafficSample sample;
    auto result = commands->traffic_once(router_id, "ether9", sample);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::COMMAND_FAILED);
    EXPECT_EQ(result.error_message, "interface ether9 not found or no data");
}

TEST_F(RouterCommandsTest, UnknownRouterPropagatesNotFound) {
    std::vector<commands::Interface> interfaces;
    auto result = commands->list_interfaces(404, interfaces);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::NOT_FOUND);
}

TEST(MonitorTrafficCommandTest, ContinuousHasNoOnceFlag) {
    EXPECT_THAT(commands::monitor_traffic("ether1", false),
                ElementsAre("/interface/monitor-traffic", "=interface=ether1"));
}
