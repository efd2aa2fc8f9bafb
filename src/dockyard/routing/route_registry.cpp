// RouteRegistry: RCU Implementation Notes
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: build a fresh table off to the side, atomic_store (RELEASE).
// The shared_ptr reference count provides the grace period.

#include "dockyard/routing/route_registry.hpp"

#include <utility>

namespace dockyard::routing {

RouteRegistry::RouteRegistry(RouteTable initial) {
    publish(std::move(initial));
}

RouteRegistry::Snapshot RouteRegistry::snapshot() const noexcept {
    return std::atomic_load_explicit(&table_, std::memory_order_acquire);
}

void RouteRegistry::publish(RouteTable table) {
    std::shared_ptr<const RouteTable> next = std::make_shared<const RouteTable>(std::move(table));
    std::atomic_store_explicit(&table_, std::move(next), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

dockyard_detail::expected<std::uint64_t, RouteError> RouteRegistry::reload(std::vector<Route> routes) {
    auto built = RouteTable::build(std::move(routes));
    if (!built) return dockyard_detail::unexpected<RouteError>(std::move(built.error()));
    publish(std::move(*built));
    return version();
}

RouteRegistry::Match RouteRegistry::match(std::string_view target) const {
    Match m;
    m.table = snapshot();
    if (m.table) m.route = m.table->match(target);
    return m;
}

} // namespace dockyard::routing
