#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "connection/connection_manager.hpp"
#include "mocks/fake_device.hpp"
#include "registry/router_registry.hpp"

using namespace routerlink;
using namespace routerlink::tests;
using connection::ConnectionConfig;
using connection::ConnectionManager;
using connection::ErrorCode;
using ::testing::_;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dialer = std::make_shared<FakeDialer>();

        registry::RouterCreateRequest request;
        request.name = "core-01";
        request.hostname = "10.0.0.1";
        request.username = "admin";
        request.password = "secret";
        std::string error;
        auto router = registry.create_router(request, error);
        ASSERT_TRUE(router.has_value()) << error;
        router_id = router->id;

        config.dial_timeout_ms = 500;
        config.health_sweep_enabled = false;
    }

    std::unique_ptr<ConnectionManager> make_manager() {
        return std::make_unique<ConnectionManager>(registry, dialer, config);
    }

    registry::RouterRegistry registry;
    std::shared_ptr<FakeDialer> dialer;
    ConnectionConfig config;
    registry::RouterId router_id = 0;
};

TEST_F(ConnectionManagerTest, ConnectRecordsOnlineStatusAndDeviceInfo) {
    auto manager = make_manager();

    auto result = manager->get_or_connect(router_id);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(manager->is_connected(router_id));
    EXPECT_EQ(manager->connection_count(), 1u);

    auto router = registry.get_router(router_id);
    ASSERT_TRUE(router.has_value());
    EXPECT_EQ(router->status, registry::kStatusOnline);
    EXPECT_EQ(router->version.value_or(""), "7.14");
    EXPECT_EQ(router->uptime.value_or(""), "1d2h3m");
    EXPECT_TRUE(router->last_seen.has_value());

    auto endpoint = dialer->last_endpoint();
    EXPECT_EQ(endpoint.address, "10.0.0.1");
    EXPECT_EQ(endpoint.port, 8728);
    EXPECT_EQ(endpoint.username, "admin");
}

TEST_F(ConnectionManagerTest, SecondConnectReusesHealthySession) {
    auto manager = make_manager();

    auto first = manager->get_or_connect(router_id);
    auto second = manager->get_or_connect(router_id);
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.session, second.session);
    EXPECT_EQ(dialer->dial_count.load(), 1);
}

TEST_F(ConnectionManagerTest, ConcurrentConnectsDialOnce) {
    dialer->delay_ms = 100;
    auto manager = make_manager();

    std::vector<std::future<connection::ConnectResult>> callers;
    for (int i = 0; i < 16; ++i) {
        callers.push_back(std::async(std::launch::async, [&]() { return manager->get_or_connect(router_id); }));
    }

    std::shared_ptr<connection::ManagedSession> session;
    for (auto &caller : callers) {
        auto result = caller.get();
        ASSERT_TRUE(result.success) << result.error_message;
        if (!session) {
            session = result.session;
        }
        EXPECT_EQ(result.session, session);
    }

    EXPECT_EQ(dialer->dial_count.load(), 1);
    EXPECT_EQ(manager->connection_count(), 1u);
}

TEST_F(ConnectionManagerTest, UnknownRouterIsNotFound) {
    auto manager = make_manager();

    auto result = manager->get_or_connect(999);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(dialer->dial_count.load(), 0);
}

TEST_F(ConnectionManagerTest, InactiveRouterIsNeverDialed) {
    std::string error;
    ASSERT_TRUE(registry.set_active(router_id, false, error));
    auto manager = make_manager();

    auto result = manager->get_or_connect(router_id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::INACTIVE);
    EXPECT_EQ(dialer->dial_count.load(), 0);
}

TEST_F(ConnectionManagerTest, SlowDialTimesOutWithinBound) {
    config.dial_timeout_ms = 200;
    dialer->delay_ms = 1000;
    auto manager = make_manager();

    auto start = std::chrono::steady_clock::now();
    auto result = manager->get_or_connect(router_id);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::DIAL_TIMEOUT);
    EXPECT_LT(elapsed, std::chrono::milliseconds(800));
    EXPECT_FALSE(manager->is_connected(router_id));
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusError);

    // Let the abandoned dial finish before the fixture goes away
    std::this_thread::sleep_for(std::chrono::milliseconds(900));
}

TEST_F(ConnectionManagerTest, AuthFailureMapsToAuthFailed) {
    auto mock = std::make_shared<MockDeviceDialer>();
    EXPECT_CALL(*mock, dial(_, _)).WillOnce([](const device::Endpoint &, std::chrono::milliseconds) {
        device::DialResult result;
        result.error = device::DialError::AUTH_FAILED;
        result.error_message = "invalid user name or password";
        return result;
    });
    ConnectionManager manager(registry, mock, config);

    auto result = manager.get_or_connect(router_id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::AUTH_FAILED);
    EXPECT_THAT(result.error_message, ::testing::HasSubstr("invalid user name or password"));
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusError);
}

TEST_F(ConnectionManagerTest, TransportFailureMapsToTransportError) {
    dialer->failure = device::DialError::TRANSPORT_ERROR;
    auto manager = make_manager();

    auto result = manager->get_or_connect(router_id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::TRANSPORT_ERROR);
    EXPECT_FALSE(manager->is_connected(router_id));
}

TEST_F(ConnectionManagerTest, CommandsOnOneRouterNeverOverlap) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->get_or_connect(router_id).success);
    auto device = dialer->latest();
    device->run_delay_ms = 10;
    device->max_in_flight = 0;

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&]() {
            auto result = manager->run_command(router_id, {"/interface/print"});
            EXPECT_TRUE(result.success) << result.error_message;
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    EXPECT_EQ(device->max_in_flight.load(), 1);
}

TEST_F(ConnectionManagerTest, TransactionHoldsLockAcrossSteps) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->get_or_connect(router_id).success);
    auto device = dialer->latest();
    device->set_reply("/interface/print", {make_record({{".id", "*1"}, {"name", "ether1"}})});

    std::string seen_id;
    auto result = manager->run_transaction(
        router_id, [&seen_id](const connection::ManagedSession::Step &step, std::string &error) {
            device::Reply lookup;
            if (!step({"/interface/print", "?name=ether1"}, lookup, error)) {
                return false;
            }
            seen_id = lookup.records().front().get(".id");
            device::Reply ignored;
            return step({"/interface/set", "=.id=" + seen_id, "=disabled=true"}, ignored, error);
        });

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(seen_id, "*1");
    auto log = device->command_log();
    ASSERT_GE(log.size(), 2u);
    EXPECT_EQ(log.back().front(), "/interface/set");
}

TEST_F(ConnectionManagerTest, TransportFailureDuringCommandMarksSessionUnhealthy) {
    auto manager = make_manager();
    auto first = manager->get_or_connect(router_id);
    ASSERT_TRUE(first.success);
    dialer->latest()->open = false;

    auto result = manager->run_command(router_id, {"/interface/print"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::TRANSPORT_ERROR);
    EXPECT_FALSE(first.session->is_healthy());

    // Next caller replaces the broken session
    auto second = manager->get_or_connect(router_id);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.session, second.session);
    EXPECT_EQ(dialer->dial_count.load(), 2);
}

TEST_F(ConnectionManagerTest, HealthSweepReconnectsFailedSession) {
    config.reconnect_on_failure = true;
    auto manager = make_manager();
    manager->start();

    auto first = manager->get_or_connect(router_id);
    ASSERT_TRUE(first.success);
    dialer->latest()->fail_runs = true;

    manager->run_health_sweep();
    EXPECT_FALSE(first.session->is_healthy());

    ASSERT_TRUE(wait_for([&]() { return dialer->dial_count.load() == 2 && manager->is_connected(router_id); }));
    manager->stop();

    auto current = manager->get_or_connect(router_id);
    ASSERT_TRUE(current.success);
    EXPECT_NE(current.session, first.session);
    EXPECT_EQ(dialer->dial_count.load(), 2);
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusOnline);
}

TEST_F(ConnectionManagerTest, HealthSweepWithoutReconnectOnlyMarksError) {
    config.reconnect_on_failure = false;
    auto manager = make_manager();

    ASSERT_TRUE(manager->get_or_connect(router_id).success);
    dialer->latest()->fail_runs = true;

    manager->run_health_sweep();

    EXPECT_EQ(dialer->dial_count.load(), 1);
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusError);
    auto statuses = manager->get_all_connections();
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_FALSE(statuses[0].is_healthy);
}

TEST_F(ConnectionManagerTest, DisconnectDuringHealthCheckStaysDisconnected) {
    config.reconnect_on_failure = true;
    auto manager = make_manager();
    manager->start();

    ASSERT_TRUE(manager->get_or_connect(router_id).success);
    dialer->latest()->run_delay_ms = 200;

    auto sweep = std::async(std::launch::async, [&]() { manager->run_health_sweep(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(manager->disconnect(router_id).success);
    sweep.wait();

    // Waits for any reconnect the sweep might have scheduled
    manager->stop();

    EXPECT_FALSE(manager->is_connected(router_id));
    EXPECT_EQ(dialer->dial_count.load(), 1);
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusOffline);
}

TEST_F(ConnectionManagerTest, FailedCheckOfReplacedSessionIsIgnored) {
    config.reconnect_on_failure = true;
    auto manager = make_manager();
    manager->start();

    auto first = manager->get_or_connect(router_id);
    ASSERT_TRUE(first.success);
    auto old_device = dialer->latest();
    old_device->run_delay_ms = 200;
    old_device->fail_runs = true;

    auto sweep = std::async(std::launch::async, [&]() { manager->run_health_sweep(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // Replace the session while its liveness command is still running
    first.session->mark_unhealthy();
    auto second = manager->get_or_connect(router_id);
    ASSERT_TRUE(second.success);
    ASSERT_NE(second.session, first.session);
    sweep.wait();
    manager->stop();

    EXPECT_EQ(dialer->dial_count.load(), 2);
    EXPECT_TRUE(second.session->is_healthy());
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusOnline);
}

TEST_F(ConnectionManagerTest, AutoConnectDialsEveryActiveRouterOnStart) {
    registry::RouterCreateRequest request;
    request.name = "edge-02";
    request.hostname = "10.0.0.2";
    request.username = "admin";
    request.password = "secret";
    std::string error;
    auto edge = registry.create_router(request, error);
    ASSERT_TRUE(edge.has_value()) << error;

    request.name = "spare-03";
    request.hostname = "10.0.0.3";
    request.is_active = false;
    auto spare = registry.create_router(request, error);
    ASSERT_TRUE(spare.has_value()) << error;

    config.auto_connect = true;
    auto manager = make_manager();
    manager->start();

    ASSERT_TRUE(wait_for([&]() { return manager->connection_count() == 2; }));
    manager->stop();

    EXPECT_TRUE(manager->is_connected(router_id));
    EXPECT_TRUE(manager->is_connected(edge->id));
    EXPECT_FALSE(manager->is_connected(spare->id));
    EXPECT_EQ(dialer->dial_count.load(), 2);
    EXPECT_EQ(registry.get_router(spare->id)->status, registry::kStatusOffline);
}

TEST_F(ConnectionManagerTest, AutoConnectContinuesPastFailedRouter) {
    registry::RouterCreateRequest request;
    request.name = "edge-02";
    request.hostname = "10.0.0.2";
    request.username = "admin";
    request.password = "secret";
    std::string error;
    ASSERT_TRUE(registry.create_router(request, error).has_value()) << error;

    auto mock = std::make_shared<MockDeviceDialer>();
    EXPECT_CALL(*mock, dial(_, _))
        .WillOnce([](const device::Endpoint &, std::chrono::milliseconds) {
            device::DialResult result;
            result.error = device::DialError::TRANSPORT_ERROR;
            result.error_message = "connection refused";
            return result;
        })
        .WillOnce([](const device::Endpoint &, std::chrono::milliseconds) {
            device::DialResult result;
            result.success = true;
            result.session = std::make_unique<FakeDeviceSession>(std::make_shared<FakeDeviceSession::Shared>());
            return result;
        });

    config.auto_connect = true;
    ConnectionManager manager(registry, mock, config);
    manager.start();

    ASSERT_TRUE(wait_for([&]() { return manager.connection_count() == 1; }));
    manager.stop();

    auto routers = registry.get_all_routers();
    ASSERT_EQ(routers.size(), 2u);
    int errors = 0;
    for (const auto &router : routers) {
        if (router.status == registry::kStatusError) {
            ++errors;
        }
    }
    EXPECT_EQ(errors, 1);
}

TEST_F(ConnectionManagerTest, WithoutAutoConnectStartDialsNothing) {
    auto manager = make_manager();
    manager->start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    manager->stop();

    EXPECT_EQ(dialer->dial_count.load(), 0);
    EXPECT_EQ(manager->connection_count(), 0u);
}

TEST_F(ConnectionManagerTest, DisconnectClosesSession) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->get_or_connect(router_id).success);
    auto device = dialer->latest();

    auto result = manager->disconnect(router_id);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(device->open.load());
    EXPECT_FALSE(manager->is_connected(router_id));
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusOffline);
}

TEST_F(ConnectionManagerTest, DisconnectWithoutSessionFails) {
    auto manager = make_manager();

    auto result = manager->disconnect(router_id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::NOT_CONNECTED);
}

TEST_F(ConnectionManagerTest, StatusListsLiveSessions) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->get_or_connect(router_id).success);

    auto statuses = manager->get_all_connections();
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].router_id, router_id);
    EXPECT_EQ(statuses[0].router_name, "core-01");
    EXPECT_EQ(statuses[0].hostname, "10.0.0.1");
    EXPECT_TRUE(statuses[0].is_healthy);
}

TEST_F(ConnectionManagerTest, CloseAllMarksRoutersOffline) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->get_or_connect(router_id).success);

    manager->close_all();

    EXPECT_EQ(manager->connection_count(), 0u);
    EXPECT_EQ(registry.get_router(router_id)->status, registry::kStatusOffline);
}
