#pragma once
/**
 * @file upstream_pool.hpp
 * @brief Upstream groups: member health with rise/fall hysteresis, round-robin
 *        selection over healthy members and bounded keepalive pools.
 *
 * Members start healthy. A healthy member is ejected after @c fall consecutive
 * failed checks and rejoins after @c rise consecutive good ones; its idle
 * connections are dropped on ejection. acquire() never hands out a member
 * known to be down: with no healthy member it fails with GroupUnavailable.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/config/constants.hpp"
#include "dockyard/routing/rate_limiter.hpp"

namespace dockyard::routing {

/// host:port of one group member.
struct Endpoint final {
    std::string   host;
    std::uint16_t port{0};

    [[nodiscard]] std::string str() const { return host + ":" + std::to_string(port); }
    bool operator==(const Endpoint&) const = default;
};

/// Parse "host:port"; nullopt on a missing host or a port outside 1..65535.
[[nodiscard]] std::optional<Endpoint> parse_endpoint(std::string_view s);

/// Declared shape of one upstream group.
struct GroupConfig final {
    std::string               name;
    std::vector<std::string>  members;   ///< "host:port", in rotation order
    std::uint32_t             keepalive{config::constants::UPSTREAM_KEEPALIVE};
    std::uint32_t             rise{config::constants::UPSTREAM_RISE};
    std::uint32_t             fall{config::constants::UPSTREAM_FALL};
    std::chrono::milliseconds connect_timeout{config::constants::UPSTREAM_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout{config::constants::UPSTREAM_REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds probe_interval{config::constants::PROBE_INTERVAL_MS};
    std::chrono::milliseconds probe_timeout{config::constants::PROBE_TIMEOUT_MS};

    bool operator==(const GroupConfig&) const = default;
};

enum class PoolErr : std::uint8_t {
    UnknownGroup,      ///< acquire()/mark_health() on an undeclared group
    UnknownMember,     ///< mark_health() on a member the group does not have
    GroupUnavailable,  ///< Every member is unhealthy
    ConnectFailed,     ///< Selected member refused or timed out
    InvalidGroup,      ///< create(): empty name/members, bad endpoint, rise/fall of 0, zero timeout or interval
    DuplicateGroup     ///< create(): two groups with one name
};

[[nodiscard]] std::string_view to_string(PoolErr e) noexcept;

/// An open transport to one member. Closing happens on destruction.
class Connection {
public:
    virtual ~Connection() = default;
    [[nodiscard]] virtual const Endpoint& peer() const noexcept = 0;
};

/// Opens connections; swapped out in tests.
class Connector {
public:
    virtual ~Connector() = default;
    [[nodiscard]] virtual dockyard_detail::expected<std::unique_ptr<Connection>, std::string>
    connect(const Endpoint& ep, std::chrono::milliseconds timeout) = 0;
};

/// Non-blocking TCP connect bounded by the timeout.
class TcpConnector final : public Connector {
public:
    [[nodiscard]] dockyard_detail::expected<std::unique_ptr<Connection>, std::string>
    connect(const Endpoint& ep, std::chrono::milliseconds timeout) override;
};

/**
 * @struct Lease
 * @brief Exclusive use of one connection until released back to the pool.
 */
struct Lease final {
    std::string                 group;
    std::string                 member;    ///< "host:port"
    std::size_t                 member_index{0};
    std::unique_ptr<Connection> conn;
    TimePoint                   deadline{};  ///< acquire time + request timeout
    bool                        reused{false};
};

/**
 * @class UpstreamPool
 * @brief Thread-safe acquire/release/mark_health over a fixed set of groups.
 */
class UpstreamPool final {
public:
    [[nodiscard]] static dockyard_detail::expected<UpstreamPool, PoolErr>
    create(std::vector<GroupConfig> groups, std::shared_ptr<Connector> connector);

    UpstreamPool(UpstreamPool&&)                 = default;
    UpstreamPool& operator=(UpstreamPool&&)      = default;
    UpstreamPool(const UpstreamPool&)            = delete;
    UpstreamPool& operator=(const UpstreamPool&) = delete;

    /// Pick the next healthy member round-robin and hand out an idle or fresh connection.
    [[nodiscard]] dockyard_detail::expected<Lease, PoolErr> acquire(std::string_view group, TimePoint now);

    /**
     * @brief Return a lease.
     * @param reusable False if the caller saw the connection break.
     * @note The connection is closed instead of pooled when the deadline passed,
     *       the member is down or the idle pool is already at keepalive.
     */
    void release(Lease lease, bool reusable, TimePoint now);

    /**
     * @brief Feed one health check result for @p member of @p group.
     * @return Member health after applying the rise/fall thresholds.
     */
    dockyard_detail::expected<bool, PoolErr> mark_health(std::string_view group, std::string_view member, bool ok);

    [[nodiscard]] std::optional<bool>        healthy(std::string_view group, std::string_view member) const;
    [[nodiscard]] std::size_t                idle_count(std::string_view group, std::string_view member) const;
    [[nodiscard]] std::vector<Endpoint>      members(std::string_view group) const;
    [[nodiscard]] const GroupConfig*         config(std::string_view group) const noexcept;
    [[nodiscard]] std::vector<std::string>   group_names() const;

private:
    struct Member {
        explicit Member(Endpoint e) : ep(std::move(e)), id(ep.str()) {}

        Endpoint                                 ep;
        std::string                              id;
        std::atomic<bool>                        up{true};
        mutable std::mutex                       mu;   ///< Guards streaks and idle
        std::uint32_t                            ok_streak{0};
        std::uint32_t                            fail_streak{0};
        std::deque<std::unique_ptr<Connection>>  idle;
    };

    struct Group {
        GroupConfig                           cfg;
        std::vector<std::unique_ptr<Member>>  members;
        std::atomic<std::uint64_t>            rr{0};
    };

    UpstreamPool() = default;

    Group*       find(std::string_view group) noexcept;
    const Group* find(std::string_view group) const noexcept;
    static Member*       find_member(Group& g, std::string_view member) noexcept;
    static const Member* find_member(const Group& g, std::string_view member) noexcept;

    std::vector<std::unique_ptr<Group>> groups_;   ///< Declaration order; fixed after create()
    std::shared_ptr<Connector>          connector_;
};

} // namespace dockyard::routing
