#pragma once
// dockyard: RouteRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics and match against it.
//   • A reload builds a whole new RouteTable and publishes it with RELEASE semantics.
//   • Readers never block the publisher; the publisher never blocks readers.
//   • Old tables stay alive until the last in-flight lookup drops its reference.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/routing/route_table.hpp"

namespace dockyard::routing {

/**
 * @class RouteRegistry
 * @brief Holds the current RouteTable generation.
 *
 * Thread-safety:
 *   - snapshot()/match() are lock-free with respect to publish().
 *   - publish()/reload() may allocate; concurrent publishers race last-writer-wins.
 */
class RouteRegistry final {
public:
    using Snapshot = std::shared_ptr<const RouteTable>;

    /// Result of a lookup; keeps the table generation alive for as long as the route is used.
    struct Match {
        Snapshot     table;
        const Route* route{nullptr};

        explicit operator bool() const noexcept { return route != nullptr; }
    };

    RouteRegistry() = default;
    explicit RouteRegistry(RouteTable initial);

    /// Consistent view of the current table; may be null before the first publish.
    [[nodiscard]] Snapshot snapshot() const noexcept;

    /// Swap in an already-built table.
    void publish(RouteTable table);

    /// Build from @p routes and publish on success; the current table is kept on error.
    [[nodiscard]] dockyard_detail::expected<std::uint64_t, RouteError> reload(std::vector<Route> routes);

    /// Match @p target against the current generation.
    [[nodiscard]] Match match(std::string_view target) const;

    /// Monotonic generation counter; increments on every publish.
    [[nodiscard]] std::uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<const RouteTable> table_;
    std::atomic<std::uint64_t>        version_{0};
};

} // namespace dockyard::routing
