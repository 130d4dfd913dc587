#include "router_commands.hpp"

#include "logging/logger.hpp"

namespace routerlink {
namespace commands {

namespace {

using connection::ErrorCode;
using connection::OperationResult;

bool flag(const device::Sentence &sentence, const char *key) { return sentence.get(key) == "true"; }

OperationResult require(const std::string &value, const char *name) {
    if (value.empty()) {
        return OperationResult::fail(ErrorCode::INVALID_ARGUMENT, std::string("parameter '") + name + "' is required");
    }
    return OperationResult::ok();
}

}  // namespace

device::Command monitor_traffic(const std::string &interface, bool once) {
    device::Command command{"/interface/monitor-traffic", "=interface=" + interface};
    if (once) {
        command.push_back("=once=");
    }
    return command;
}

OperationResult RouterCommands::run(registry::RouterId router_id, const device::Command &command,
                                    device::Reply &reply) {
    auto result = connections_.run_command(router_id, command);
    if (!result.success) {
        return OperationResult::fail(result.code, result.error_message);
    }
    reply = std::move(result.reply);
    return OperationResult::ok();
}

//=============================================================================
// Interfaces
//=============================================================================
OperationResult RouterCommands::list_interfaces(registry::RouterId router_id, std::vector<Interface> &out) {
    device::Reply reply;
    auto result = run(router_id,
                      {"/interface/print",
                       "=.proplist=.id,name,type,running,disabled,rx-bytes,tx-bytes,rx-packets,tx-packets"},
                      reply);
    if (!result.success) {
        return result;
    }

    out.clear();
    for (const auto &record : reply.records()) {
        Interface iface;
        iface.id = record.get(".id");
        iface.name = record.get("name");
        iface.type = record.get("type");
        iface.running = flag(record, "running");
        iface.disabled = flag(record, "disabled");
        iface.rx_bytes = record.get("rx-bytes");
        iface.tx_bytes = record.get("tx-bytes");
        iface.rx_packets = record.get("rx-packets");
        iface.tx_packets = record.get("tx-packets");
        out.push_back(std::move(iface));
    }
    return result;
}

OperationResult RouterCommands::list_available_interfaces(registry::RouterId router_id,
                                                          std::vector<Interface> &out) {
    std::vector<Interface> all;
    auto result = list_interfaces(router_id, all);
    if (!result.success) {
        return result;
    }

    out.clear();
    for (auto &iface : all) {
        if (iface.running && !iface.disabled) {
            out.push_back(std::move(iface));
        }
    }
    return result;
}

OperationResult RouterCommands::enable_interface(registry::RouterId router_id, const std::string &name) {
    return set_interface_disabled(router_id, name, false);
}

OperationResult RouterCommands::disable_interface(registry::RouterId router_id, const std::string &name) {
    return set_interface_disabled(router_id, name, true);
}

OperationResult RouterCommands::set_interface_disabled(registry::RouterId router_id, const std::string &name,
                                                       bool disabled) {
    auto check = require(name, "name");
    if (!check.success) {
        return check;
    }

    // Lookup and set must not interleave with another command on the same router
    auto result = connections_.run_transaction(
        router_id, [&name, disabled](const connection::ManagedSession::Step &step, std::string &error) {
            device::Reply lookup;
            if (!step({"/interface/print", "?name=" + name}, lookup, error)) {
                return false;
            }
            auto records = lookup.records();
            if (records.empty()) {
                error = "interface " + name + " not found";
                return false;
            }

            device::Reply ignored;
            return step({"/interface/set", "=.id=" + records.front().get(".id"),
                         std::string("=disabled=") + (disabled ? "true" : "false")},
                        ignored, error);
        });

    if (result.success) {
        LOG_INFO("[Cmd] Router " << router_id << ": interface " << name << (disabled ? " disabled" : " enabled"));
    }
    return result;
}

//=============================================================================
// Addresses
//=============================================================================
OperationResult RouterCommands::list_addresses(registry::RouterId router_id, std::vector<Address> &out) {
    device::Reply reply;
    auto result = run(router_id, {"/ip/address/print", "=.proplist=.id,address,interface,network,disabled"}, reply);
    if (!result.success) {
        return result;
    }

    out.clear();
    for (const auto &record : reply.records()) {
        Address address;
        address.id = record.get(".id");
        address.address = record.get("address");
        address.interface = record.get("interface");
        address.network = record.get("network");
        address.disabled = flag(record, "disabled");
        out.push_back(std::move(address));
    }
    return result;
}

OperationResult RouterCommands::add_address(registry::RouterId router_id, const std::string &interface,
                                            const std::string &address) {
    if (interface.empty() || address.empty()) {
        return OperationResult::fail(ErrorCode::INVALID_ARGUMENT, "parameters 'interface' and 'address' are required");
    }

    device::Reply reply;
    return run(router_id, {"/ip/address/add", "=address=" + address, "=interface=" + interface}, reply);
}

OperationResult RouterCommands::remove_address(registry::RouterId router_id, const std::string &id) {
    auto check = require(id, "id");
    if (!check.success) {
        return check;
    }

    device::Reply reply;
    return run(router_id, {"/ip/address/remove", "=.id=" + id}, reply);
}

//=============================================================================
// Queues
//=============================================================================
OperationResult RouterCommands::list_queues(registry::RouterId router_id, std::vector<Queue> &out) {
    device::Reply reply;
    auto result =
        run(router_id, {"/queue/simple/print", "=.proplist=.id,name,target,max-limit,burst-limit,disabled"}, reply);
    if (!result.success) {
        return result;
    }

    out.clear();
    for (const auto &record : reply.records()) {
        Queue queue;
        queue.id = record.get(".id");
        queue.name = record.get("name");
        queue.target = record.get("target");
        queue.max_limit = record.get("max-limit");
        queue.burst_limit = record.get("burst-limit");
        queue.disabled = flag(record, "disabled");
        out.push_back(std::move(queue));
    }
    return result;
}

OperationResult RouterCommands::add_queue(registry::RouterId router_id, const std::string &name,
                                          const std::string &target, const std::string &max_limit) {
    if (name.empty() || target.empty() || max_limit.empty()) {
        return OperationResult::fail(ErrorCode::INVALID_ARGUMENT,
                                     "parameters 'name', 'target' and 'max_limit' are required");
    }

    device::Reply reply;
    return run(router_id, {"/queue/simple/add", "=name=" + name, "=target=" + target, "=max-limit=" + max_limit},
               reply);
}

OperationResult RouterCommands::remove_queue(registry::RouterId router_id, const std::string &id) {
    auto check = require(id, "id");
    if (!check.success) {
        return check;
    }

    device::Reply reply;
    return run(router_id, {"/queue/simple/remove", "=.id=" + id}, reply);
}

//=============================================================================
// Traffic
//=============================================================================
OperationResult RouterCommands::traffic_once(registry::RouterId router_id, const std::string &interface,
                                             telemetry::TrafficSample &out) {
    auto check = require(interface, "interface");
    if (!check.success) {
        return check;
    }

    device::Reply reply;
    auto result = run(router_id, monitor_traffic(interface, true), reply);
    if (!result.success) {
        return result;
    }

    auto records = reply.records();
    if (records.empty()) {
        LOG_WARN("[Cmd] Router " << router_id << ": no traffic data for interface " << interface);
        return OperationResult::fail(ErrorCode::COMMAND_FAILED, "interface " + interface + " not found or no data");
    }

    out = telemetry::sample_from_sentence(router_id, interface, records.front());
    return result;
}

}  // namespace commands
}  // namespace routerlink
