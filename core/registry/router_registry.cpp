#include "router_registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

#include "logging/logger.hpp"

namespace routerlink {
namespace registry {

namespace {

std::string generate_uuid() {
    // random_generator is not thread-safe; one instance per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool validate_port(int port, std::string &error) {
    if (port < 1 || port > 65535) {
        error = "port must be between 1 and 65535";
        return false;
    }
    return true;
}

bool validate_timeout(int timeout, std::string &error) {
    if (timeout <= 0) {
        error = "timeout must be positive";
        return false;
    }
    return true;
}

}  // namespace

bool is_valid_status(const std::string &status) {
    return status == kStatusOnline || status == kStatusOffline || status == kStatusError;
}

bool validate_create_request(const RouterCreateRequest &request, std::string &error) {
    if (request.name.empty()) {
        error = "name is required";
        return false;
    }
    if (request.hostname.empty()) {
        error = "hostname is required";
        return false;
    }
    if (request.username.empty()) {
        error = "username is required";
        return false;
    }
    if (request.password.empty()) {
        error = "password is required";
        return false;
    }
    if (request.port && !validate_port(*request.port, error)) {
        return false;
    }
    if (request.timeout && !validate_timeout(*request.timeout, error)) {
        return false;
    }
    return true;
}

std::optional<Router> RouterRegistry::get_router(RouterId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = routers_.find(id);
    if (it == routers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Router> RouterRegistry::get_all_routers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Router> result;
    result.reserve(routers_.size());
    for (const auto &[id, router] : routers_) {
        result.push_back(router);
    }
    return result;
}

std::vector<Router> RouterRegistry::get_active_routers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Router> result;
    for (const auto &[id, router] : routers_) {
        if (router.is_active) {
            result.push_back(router);
        }
    }
    return result;
}

std::optional<Router> RouterRegistry::create_router(const RouterCreateRequest &request, std::string &error) {
    if (!validate_create_request(request, error)) {
        return std::nullopt;
    }

    Router router;
    router.uuid = generate_uuid();
    router.name = request.name;
    router.hostname = request.hostname;
    router.username = request.username;
    router.password = request.password;
    router.keepalive = request.keepalive.value_or(true);
    router.timeout = request.timeout.value_or(300000);
    router.port = request.port.value_or(8728);
    router.location = request.location;
    router.description = request.description;
    router.is_active = request.is_active.value_or(true);
    router.created_at = std::chrono::system_clock::now();
    router.updated_at = router.created_at;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        router.id = next_id_++;
        routers_[router.id] = router;
    }

    LOG_INFO("[Registry] Router " << router.id << " created: " << router.name << " (" << router.hostname << ":"
                                  << router.port << ")");
    return router;
}

std::optional<Router> RouterRegistry::update_router(RouterId id, const RouterUpdateRequest &request,
                                                    std::string &error) {
    if (request.port && !validate_port(*request.port, error)) {
        return std::nullopt;
    }
    if (request.timeout && !validate_timeout(*request.timeout, error)) {
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = routers_.find(id);
    if (it == routers_.end()) {
        error = "router not found";
        return std::nullopt;
    }

    Router &router = it->second;
    if (request.name) router.name = *request.name;
    if (request.hostname) router.hostname = *request.hostname;
    if (request.username) router.username = *request.username;
    if (request.password) router.password = *request.password;
    if (request.keepalive) router.keepalive = *request.keepalive;
    if (request.timeout) router.timeout = *request.timeout;
    if (request.port) router.port = *request.port;
    if (request.location) router.location = *request.location;
    if (request.description) router.description = *request.description;
    if (request.is_active) router.is_active = *request.is_active;
    router.updated_at = std::chrono::system_clock::now();

    return router;
}

bool RouterRegistry::delete_router(RouterId id, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (routers_.erase(id) == 0) {
        error = "router not found";
        return false;
    }
    return true;
}

bool RouterRegistry::update_status(RouterId id, const RouterStatusUpdate &update, std::string &error) {
    if (!is_valid_status(update.status)) {
        error = "invalid status '" + update.status + "': must be online, offline or error";
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = routers_.find(id);
    if (it == routers_.end()) {
        error = "router not found";
        return false;
    }

    Router &router = it->second;
    auto now = std::chrono::system_clock::now();
    router.status = update.status;
    if (update.version) router.version = *update.version;
    if (update.uptime) router.uptime = *update.uptime;
    if (update.last_seen) {
        router.last_seen = *update.last_seen;
    } else if (update.status == kStatusOnline) {
        router.last_seen = now;
    }
    router.updated_at = now;
    return true;
}

bool RouterRegistry::set_active(RouterId id, bool is_active, std::string &error) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = routers_.find(id);
    if (it == routers_.end()) {
        error = "router not found";
        return false;
    }
    it->second.is_active = is_active;
    it->second.updated_at = std::chrono::system_clock::now();
    return true;
}

size_t RouterRegistry::router_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return routers_.size();
}

}  // namespace registry
}  // namespace routerlink
