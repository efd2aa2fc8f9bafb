#pragma once
/**
 * @file rate_limiter.hpp
 * @brief Per-zone, per-key token-bucket admission control.
 *
 * Each zone keeps one bucket per client key. Tokens accrue continuously at
 * @c rate per second (double precision) up to @c burst; an admitted request
 * consumes one token. A new or evicted key starts with a full bucket.
 *
 * Each shard drops its idle buckets at most once per idle period, from inside
 * admit(), so the key table stays bounded without an external sweeper. When
 * @c max_keys is reached and nothing is idle, the least recently used bucket
 * makes room for the new key.
 *
 * Buckets are spread over striped shards, each behind its own mutex, so
 * unrelated keys rarely contend. Time is always supplied by the caller.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/config/constants.hpp"

namespace dockyard::routing {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Admission decision for one request.
enum class Admission : std::uint8_t { Allow, Reject };

/// Failures distinct from a Reject.
enum class RateLimitErr : std::uint8_t {
    UnknownZone,    ///< admit() against an undeclared zone
    DuplicateZone,  ///< create(): two zones with one name
    InvalidZone     ///< create(): empty name, rate <= 0, burst < 1 or idle_evict <= 0
};

[[nodiscard]] std::string_view to_string(Admission a) noexcept;
[[nodiscard]] std::string_view to_string(RateLimitErr e) noexcept;

/// Declared budget of one zone.
struct ZoneConfig final {
    std::string               name;
    double                    rate{0.0};    ///< Sustained requests per second
    double                    burst{0.0};   ///< Bucket capacity in tokens
    std::string               key{config::constants::ZONE_KEY_CLIENT};
    std::chrono::milliseconds idle_evict{config::constants::ZONE_IDLE_EVICT_MS};
    std::size_t               max_keys{0};  ///< 0 = unbounded

    bool operator==(const ZoneConfig&) const = default;
};

/**
 * @class RateLimiter
 * @brief Non-blocking admit() over a fixed set of zones.
 *
 * The zone set is fixed at create(); bucket state is the only mutable part.
 */
class RateLimiter final {
public:
    [[nodiscard]] static dockyard_detail::expected<RateLimiter, RateLimitErr>
    create(std::vector<ZoneConfig> zones);

    RateLimiter(RateLimiter&&)                     = default;
    RateLimiter& operator=(RateLimiter&&)          = default;
    RateLimiter(const RateLimiter&)                = delete;
    RateLimiter& operator=(const RateLimiter&)     = delete;

    /**
     * @brief Try to take one token for @p key in @p zone.
     * @return Allow or Reject; RateLimitErr::UnknownZone if the zone was never declared.
     */
    [[nodiscard]] dockyard_detail::expected<Admission, RateLimitErr>
    admit(std::string_view zone, std::string_view key, TimePoint now);

    /// Tokens @p key would hold at @p now; nullopt if unknown zone or untracked key.
    [[nodiscard]] std::optional<double> tokens(std::string_view zone, std::string_view key, TimePoint now) const;

    /// Drop buckets idle for at least their zone's idle period. @return buckets dropped.
    std::size_t evict_idle(TimePoint now);

    /// Keys currently tracked by @p zone (0 for an unknown zone).
    [[nodiscard]] std::size_t tracked_keys(std::string_view zone) const noexcept;

    [[nodiscard]] bool has_zone(std::string_view zone) const noexcept;

private:
    struct Bucket {
        double    tokens;
        TimePoint last;
    };

    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct KeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    using BucketMap = std::unordered_map<std::string, Bucket, KeyHash, KeyEq>;

    struct alignas(64) Shard {
        mutable std::mutex mu;
        BucketMap          buckets;
        TimePoint          next_sweep{};  ///< Guarded by mu
    };

    struct Zone {
        explicit Zone(ZoneConfig c);

        ZoneConfig               cfg;
        std::vector<Shard>       shards;
        std::atomic<std::size_t> keys{0};

        Shard&       shard_for(std::string_view key) noexcept;
        const Shard& shard_for(std::string_view key) const noexcept;
    };

    using ZoneMap = std::unordered_map<std::string, std::unique_ptr<Zone>, KeyHash, KeyEq>;

    RateLimiter() = default;

    Zone*       find(std::string_view zone) noexcept;
    const Zone* find(std::string_view zone) const noexcept;

    /// Bucket level after continuous refill up to @p now.
    static double refilled(const ZoneConfig& cfg, const Bucket& b, TimePoint now) noexcept;
    static Admission take(const ZoneConfig& cfg, Bucket& b, TimePoint now) noexcept;
    static bool reserve_slot(Zone& z) noexcept;
    static Admission insert_and_take(Zone& z, Shard& sh, std::string_view key, TimePoint now);
    /// Drop idle buckets of one shard; caller holds sh.mu.
    static std::size_t sweep_shard(Zone& z, Shard& sh, TimePoint now);
    static std::size_t sweep(Zone& z, TimePoint now);
    /// Drop the bucket with the oldest use across all shards. @return false if the zone is empty.
    static bool evict_oldest(Zone& z);

    ZoneMap zones_;
};

} // namespace dockyard::routing
