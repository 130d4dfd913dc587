#pragma once

/**
 * @file router_commands.hpp
 * @brief One-shot configuration and telemetry commands against a router
 *
 * Each operation maps a structured request to a device command, runs it
 * through the ConnectionManager (serialized on the router's command lock)
 * and maps the reply to a structured result.
 */

#include <string>
#include <vector>

#include "connection/connection_manager.hpp"
#include "connection/errors.hpp"
#include "device/device_session.hpp"
#include "telemetry/traffic_sample.hpp"

namespace routerlink {
namespace commands {

struct Interface {
    std::string id;
    std::string name;
    std::string type;
    bool running = false;
    bool disabled = false;
    std::string rx_bytes;
    std::string tx_bytes;
    std::string rx_packets;
    std::string tx_packets;
};

struct Address {
    std::string id;
    std::string address;
    std::string interface;
    std::string network;
    bool disabled = false;
};

struct Queue {
    std::string id;
    std::string name;
    std::string target;
    std::string max_limit;
    std::string burst_limit;
    bool disabled = false;
};

// /interface/monitor-traffic for one interface; once=true samples a single reading
device::Command monitor_traffic(const std::string &interface, bool once);

class RouterCommands {
public:
    explicit RouterCommands(connection::ConnectionManager &connections) : connections_(connections) {}

    connection::OperationResult list_interfaces(registry::RouterId router_id, std::vector<Interface> &out);

    // Interfaces that are running and not disabled
    connection::OperationResult list_available_interfaces(registry::RouterId router_id,
                                                          std::vector<Interface> &out);

    connection::OperationResult enable_interface(registry::RouterId router_id, const std::string &name);
    connection::OperationResult disable_interface(registry::RouterId router_id, const std::string &name);

    connection::OperationResult list_addresses(registry::RouterId router_id, std::vector<Address> &out);
    connection::OperationResult add_address(registry::RouterId router_id, const std::string &interface,
                                            const std::string &address);
    connection::OperationResult remove_address(registry::RouterId router_id, const std::string &id);

    connection::OperationResult list_queues(registry::RouterId router_id, std::vector<Queue> &out);
    connection::OperationResult add_queue(registry::RouterId router_id, const std::string &name,
                                          const std::string &target, const std::string &max_limit);
    connection::OperationResult remove_queue(registry::RouterId router_id, const std::string &id);

    // Single immediate sample, taken under the command lock (not through the multiplexer)
    connection::OperationResult traffic_once(registry::RouterId router_id, const std::string &interface,
                                             telemetry::TrafficSample &out);

private:
    connection::OperationResult set_interface_disabled(registry::RouterId router_id, const std::string &name,
                                                       bool disabled);
    connection::OperationResult run(registry::RouterId router_id, const device::Command &command,
                                    device::Reply &reply);

    connection::ConnectionManager &connections_;
};

}  // namespace commands
}  // namespace routerlink
