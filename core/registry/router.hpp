#ifndef ROUTERLINK_REGISTRY_ROUTER_HPP
#define ROUTERLINK_REGISTRY_ROUTER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace routerlink {
namespace registry {

using RouterId = int64_t;
using Timestamp = std::chrono::system_clock::time_point;

// Router status values persisted in the inventory
constexpr const char *kStatusOnline = "online";
constexpr const char *kStatusOffline = "offline";
constexpr const char *kStatusError = "error";

// Inventory record for one managed router
struct Router {
    RouterId id = 0;
    std::string uuid;
    std::string name;
    std::string hostname;
    std::string username;
    std::string password;
    bool keepalive = true;
    int timeout = 300000;  // Command timeout handed to the session (ms)
    int port = 8728;
    std::optional<std::string> location;
    std::optional<std::string> description;
    bool is_active = true;
    std::optional<Timestamp> last_seen;
    std::string status = kStatusOffline;
    std::optional<std::string> version;
    std::optional<std::string> uptime;
    Timestamp created_at{};
    Timestamp updated_at{};
};

// Fields accepted on create; unset optionals take record defaults
struct RouterCreateRequest {
    std::string name;
    std::string hostname;
    std::string username;
    std::string password;
    std::optional<bool> keepalive;
    std::optional<int> timeout;
    std::optional<int> port;
    std::optional<std::string> location;
    std::optional<std::string> description;
    std::optional<bool> is_active;
};

// Partial update; only set fields change
struct RouterUpdateRequest {
    std::optional<std::string> name;
    std::optional<std::string> hostname;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<bool> keepalive;
    std::optional<int> timeout;
    std::optional<int> port;
    std::optional<std::string> location;
    std::optional<std::string> description;
    std::optional<bool> is_active;
};

struct RouterStatusUpdate {
    std::string status;
    std::optional<std::string> version;
    std::optional<std::string> uptime;
    std::optional<Timestamp> last_seen;
};

bool is_valid_status(const std::string &status);

}  // namespace registry
}  // namespace routerlink

#endif  // ROUTERLINK_REGISTRY_ROUTER_HPP
