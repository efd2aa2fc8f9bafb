#pragma once
/**
 * @file dispatcher.hpp
 * @brief Request admission: route match, zone charge, upstream lease.
 *
 * Order per request:
 *   1. match the route (static routes answer here, never touching a zone),
 *   2. charge the route's zone for the client key,
 *   3. lease a connection from the route's upstream group.
 * Every outcome is a value; one request's failure never affects another.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "dockyard/routing/rate_limiter.hpp"
#include "dockyard/routing/route_registry.hpp"
#include "dockyard/routing/upstream_pool.hpp"

namespace dockyard::obs { class Observer; }

namespace dockyard::routing {

/// How a request was disposed of.
enum class Disposition : std::uint8_t {
    Static,       ///< Answered from the route's fixed response
    Proxy,        ///< Forward over the leased connection
    Rejected      ///< Answer with @ref DispatchResult::status
};

[[nodiscard]] std::string_view to_string(Disposition d) noexcept;

struct DispatchResult final {
    Disposition            disposition{Disposition::Rejected};
    std::uint16_t          status{0};
    std::string            body;       ///< Static body, or a short rejection reason
    RouteRegistry::Match   match;      ///< Winning route (and its table generation)
    std::optional<Lease>   lease;      ///< Set for Proxy only
    std::string            decision;   ///< "static", "proxy", "rate_limited", "unavailable", "bad_gateway", "bad_request"
};

/**
 * @class Dispatcher
 * @brief Stateless glue over the registry, limiter and pool; safe to share across threads.
 */
class Dispatcher final {
public:
    Dispatcher(const RouteRegistry& routes, RateLimiter& limiter, UpstreamPool& pool,
               obs::Observer* observer = nullptr) noexcept
        : routes_(routes), limiter_(limiter), pool_(pool), observer_(observer) {}

    [[nodiscard]] DispatchResult dispatch(std::string_view target, std::string_view client_key, TimePoint now);

    /// Hand a proxied lease back to the pool.
    void complete(DispatchResult& result, bool reusable, TimePoint now);

private:
    DispatchResult reject(DispatchResult r, std::uint16_t status, std::string_view decision, std::string reason);
    void emit(std::string_view target, std::string_view client_key, const DispatchResult& r) const;

    const RouteRegistry& routes_;
    RateLimiter&         limiter_;
    UpstreamPool&        pool_;
    obs::Observer*       observer_;
};

} // namespace dockyard::routing
