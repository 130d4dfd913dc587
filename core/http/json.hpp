#pragma once

#include <nlohmann/json.hpp>

#include "commands/router_commands.hpp"
#include "connection/connection_manager.hpp"
#include "registry/router.hpp"

namespace routerlink {
namespace http {

/**
 * @brief JSON encoding for REST payloads
 *
 * Field names follow the wire names of the device where a record mirrors a
 * device table (rx-bytes, max-limit); inventory fields are snake_case.
 * Timestamps are RFC 3339 UTC. Router passwords are never encoded.
 */
nlohmann::json encode_router(const registry::Router &router);
nlohmann::json encode_connection_status(const connection::ConnectionStatus &status);
nlohmann::json encode_interface(const commands::Interface &iface);
nlohmann::json encode_available_interface(const commands::Interface &iface);
nlohmann::json encode_address(const commands::Address &address);
nlohmann::json encode_queue(const commands::Queue &queue);

// Decode functions for incoming requests
bool decode_router_create(const nlohmann::json &json, registry::RouterCreateRequest &request, std::string &error);
bool decode_router_update(const nlohmann::json &json, registry::RouterUpdateRequest &request, std::string &error);
bool decode_status_update(const nlohmann::json &json, registry::RouterStatusUpdate &update, std::string &error);
bool decode_active_flag(const nlohmann::json &json, bool &is_active, std::string &error);

}  // namespace http
}  // namespace routerlink
