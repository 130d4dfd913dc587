#ifndef ROUTERLINK_REGISTRY_ROUTER_REGISTRY_HPP
#define ROUTERLINK_REGISTRY_ROUTER_REGISTRY_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "router.hpp"

namespace routerlink {
namespace registry {

/**
 * @brief Keyed store of router descriptors
 *
 * The connection layer reads descriptors and writes status through this
 * interface only. Mutators return false and fill error on failure
 * ("router not found", validation messages).
 */
class IRouterRegistry {
public:
    virtual ~IRouterRegistry() = default;

    virtual std::optional<Router> get_router(RouterId id) const = 0;
    virtual std::vector<Router> get_all_routers() const = 0;
    virtual std::vector<Router> get_active_routers() const = 0;

    virtual std::optional<Router> create_router(const RouterCreateRequest &request, std::string &error) = 0;
    virtual std::optional<Router> update_router(RouterId id, const RouterUpdateRequest &request,
                                                std::string &error) = 0;
    virtual bool delete_router(RouterId id, std::string &error) = 0;

    virtual bool update_status(RouterId id, const RouterStatusUpdate &update, std::string &error) = 0;
    virtual bool set_active(RouterId id, bool is_active, std::string &error) = 0;
};

// In-memory registry - Thread-safe
/**
 * Thread Safety:
 * - Read methods use shared_lock and return copies
 * - Write methods use unique_lock
 *
 * Ids are assigned sequentially from 1 and never reused.
 */
class RouterRegistry : public IRouterRegistry {
public:
    RouterRegistry() = default;

    std::optional<Router> get_router(RouterId id) const override;
    std::vector<Router> get_all_routers() const override;
    std::vector<Router> get_active_routers() const override;

    std::optional<Router> create_router(const RouterCreateRequest &request, std::string &error) override;
    std::optional<Router> update_router(RouterId id, const RouterUpdateRequest &request,
                                        std::string &error) override;
    bool delete_router(RouterId id, std::string &error) override;

    bool update_status(RouterId id, const RouterStatusUpdate &update, std::string &error) override;
    bool set_active(RouterId id, bool is_active, std::string &error) override;

    size_t router_count() const;

private:
    // Ordered so listings come back by id
    std::map<RouterId, Router> routers_;
    RouterId next_id_ = 1;

    mutable std::shared_mutex mutex_;
};

// Validates a create request (required fields, port and timeout ranges)
bool validate_create_request(const RouterCreateRequest &request, std::string &error);

}  // namespace registry
}  // namespace routerlink

#endif  // ROUTERLINK_REGISTRY_ROUTER_REGISTRY_HPP
