#include "json.hpp"

#include "telemetry/traffic_sample.hpp"

namespace routerlink {
namespace http {

namespace {

nlohmann::json optional_string(const std::optional<std::string> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optional_time(const std::optional<registry::Timestamp> &value) {
    return value ? nlohmann::json(telemetry::format_rfc3339(*value)) : nlohmann::json(nullptr);
}

// Reads an optional typed field; a present field of the wrong type is an error
template <typename T>
bool read_field(const nlohmann::json &json, const char *key, std::optional<T> &out, std::string &error) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    try {
        out = it->get<T>();
        return true;
    } catch (const nlohmann::json::exception &) {
        error = std::string("Invalid type for field '") + key + "'";
        return false;
    }
}

template <typename Request>
bool read_common_fields(const nlohmann::json &json, Request &request, std::string &error) {
    return read_field(json, "keepalive", request.keepalive, error) &&
           read_field(json, "timeout", request.timeout, error) && read_field(json, "port", request.port, error) &&
           read_field(json, "location", request.location, error) &&
           read_field(json, "description", request.description, error) &&
           read_field(json, "is_active", request.is_active, error);
}

}  // namespace

nlohmann::json encode_router(const registry::Router &router) {
    return {{"id", router.id},
            {"uuid", router.uuid},
            {"name", router.name},
            {"hostname", router.hostname},
            {"username", router.username},
            {"keepalive", router.keepalive},
            {"timeout", router.timeout},
            {"port", router.port},
            {"location", optional_string(router.location)},
            {"description", optional_string(router.description)},
            {"is_active", router.is_active},
            {"last_seen", optional_time(router.last_seen)},
            {"status", router.status},
            {"version", optional_string(router.version)},
            {"uptime", optional_string(router.uptime)},
            {"created_at", telemetry::format_rfc3339(router.created_at)},
            {"updated_at", telemetry::format_rfc3339(router.updated_at)}};
}

nlohmann::json encode_connection_status(const connection::ConnectionStatus &status) {
    return {{"router_id", status.router_id},
            {"router_name", status.router_name},
            {"hostname", status.hostname},
            {"is_healthy", status.is_healthy},
            {"last_ping", telemetry::format_rfc3339(status.last_ping)}};
}

nlohmann::json encode_interface(const commands::Interface &iface) {
    return {{".id", iface.id},
            {"name", iface.name},
            {"type", iface.type},
            {"running", iface.running},
            {"disabled", iface.disabled},
            {"rx-bytes", iface.rx_bytes},
            {"tx-bytes", iface.tx_bytes},
            {"rx-packets", iface.rx_packets},
            {"tx-packets", iface.tx_packets}};
}

nlohmann::json encode_available_interface(const commands::Interface &iface) {
    return {{"name", iface.name},
            {"type", iface.type},
            {"rx_bytes", iface.rx_bytes},
            {"tx_bytes", iface.tx_bytes},
            {"rx_packets", iface.rx_packets},
            {"tx_packets", iface.tx_packets}};
}

nlohmann::json encode_address(const commands::Address &address) {
    return {{".id", address.id},
            {"address", address.address},
            {"interface", address.interface},
            {"network", address.network},
            {"disabled", address.disabled}};
}

nlohmann::json encode_queue(const commands::Queue &queue) {
    return {{".id", queue.id},
            {"name", queue.name},
            {"target", queue.target},
            {"max-limit", queue.max_limit},
            {"burst-limit", queue.burst_limit},
            {"disabled", queue.disabled}};
}

bool decode_router_create(const nlohmann::json &json, registry::RouterCreateRequest &request, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    std::optional<std::string> name, hostname, username, password;
    if (!read_field(json, "name", name, error) || !read_field(json, "hostname", hostname, error) ||
        !read_field(json, "username", username, error) || !read_field(json, "password", password, error)) {
        return false;
    }
    request.name = name.value_or("");
    request.hostname = hostname.value_or("");
    request.username = username.value_or("");
    request.password = password.value_or("");

    return read_common_fields(json, request, error);
}

bool decode_router_update(const nlohmann::json &json, registry::RouterUpdateRequest &request, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    return read_field(json, "name", request.name, error) && read_field(json, "hostname", request.hostname, error) &&
           read_field(json, "username", request.username, error) &&
           read_field(json, "password", request.password, error) && read_common_fields(json, request, error);
}

bool decode_status_update(const nlohmann::json &json, registry::RouterStatusUpdate &update, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    std::optional<std::string> status;
    if (!read_field(json, "status", status, error) || !read_field(json, "version", update.version, error) ||
        !read_field(json, "uptime", update.uptime, error)) {
        return false;
    }
    if (!status) {
        error = "Missing 'status'";
        return false;
    }
    if (!registry::is_valid_status(*status)) {
        error = "Invalid status '" + *status + "': must be online, offline or error";
        return false;
    }
    update.status = *status;
    return true;
}

bool decode_active_flag(const nlohmann::json &json, bool &is_active, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    std::optional<bool> flag;
    if (!read_field(json, "is_active", flag, error)) {
        return false;
    }
    if (!flag) {
        error = "Missing 'is_active'";
        return false;
    }
    is_active = *flag;
    return true;
}

}  // namespace http
}  // namespace routerlink
