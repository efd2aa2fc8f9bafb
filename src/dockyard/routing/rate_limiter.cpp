/**
 * @file rate_limiter.cpp
 * @brief Token-bucket zones with striped shard locks.
 */
#include "dockyard/routing/rate_limiter.hpp"

#include <algorithm>
#include <utility>

namespace dockyard::routing {

std::string_view to_string(Admission a) noexcept {
    switch (a) {
        case Admission::Allow:  return "allow";
        case Admission::Reject: return "reject";
    }
    return "unknown";
}

std::string_view to_string(RateLimitErr e) noexcept {
    switch (e) {
        case RateLimitErr::UnknownZone:   return "unknown rate-limit zone";
        case RateLimitErr::DuplicateZone: return "duplicate rate-limit zone";
        case RateLimitErr::InvalidZone:   return "invalid rate-limit zone";
    }
    return "unknown";
}

//------------------------------- Zone ------------------------------------------

RateLimiter::Zone::Zone(ZoneConfig c)
    : cfg(std::move(c)), shards(config::constants::ZONE_SHARDS) {}

RateLimiter::Shard& RateLimiter::Zone::shard_for(std::string_view key) noexcept {
    return shards[KeyHash{}(key) % shards.size()];
}

const RateLimiter::Shard& RateLimiter::Zone::shard_for(std::string_view key) const noexcept {
    return shards[KeyHash{}(key) % shards.size()];
}

//------------------------------- Construction ----------------------------------

dockyard_detail::expected<RateLimiter, RateLimitErr>
RateLimiter::create(std::vector<ZoneConfig> zones) {
    using Unexpected = dockyard_detail::unexpected<RateLimitErr>;
    RateLimiter rl;
    for (auto& z : zones) {
        if (z.name.empty() || !(z.rate > 0.0) || z.burst < 1.0 || z.idle_evict.count() <= 0) {
            return Unexpected(RateLimitErr::InvalidZone);
        }
        if (rl.zones_.find(std::string_view(z.name)) != rl.zones_.end()) {
            return Unexpected(RateLimitErr::DuplicateZone);
        }
        std::string name = z.name;
        rl.zones_.emplace(std::move(name), std::make_unique<Zone>(std::move(z)));
    }
    return rl;
}

RateLimiter::Zone* RateLimiter::find(std::string_view zone) noexcept {
    const auto it = zones_.find(zone);
    return it == zones_.end() ? nullptr : it->second.get();
}

const RateLimiter::Zone* RateLimiter::find(std::string_view zone) const noexcept {
    const auto it = zones_.find(zone);
    return it == zones_.end() ? nullptr : it->second.get();
}

bool RateLimiter::has_zone(std::string_view zone) const noexcept {
    return find(zone) != nullptr;
}

//------------------------------- Bucket math -----------------------------------

double RateLimiter::refilled(const ZoneConfig& cfg, const Bucket& b, TimePoint now) noexcept {
    if (now <= b.last) return b.tokens;
    const std::chrono::duration<double> elapsed = now - b.last;
    return std::min(cfg.burst, b.tokens + cfg.rate * elapsed.count());
}

Admission RateLimiter::take(const ZoneConfig& cfg, Bucket& b, TimePoint now) noexcept {
    b.tokens = refilled(cfg, b, now);
    if (now > b.last) b.last = now;
    if (b.tokens < 1.0) return Admission::Reject;
    b.tokens -= 1.0;
    return Admission::Allow;
}

bool RateLimiter::reserve_slot(Zone& z) noexcept {
    if (z.cfg.max_keys == 0) {
        z.keys.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    std::size_t cur = z.keys.load(std::memory_order_relaxed);
    while (cur < z.cfg.max_keys) {
        if (z.keys.compare_exchange_weak(cur, cur + 1, std::memory_order_relaxed)) return true;
    }
    return false;
}

Admission RateLimiter::insert_and_take(Zone& z, Shard& sh, std::string_view key, TimePoint now) {
    auto& b = sh.buckets.emplace(std::string(key), Bucket{z.cfg.burst, now}).first->second;
    return take(z.cfg, b, now);
}

std::size_t RateLimiter::sweep_shard(Zone& z, Shard& sh, TimePoint now) {
    std::size_t dropped = 0;
    for (auto it = sh.buckets.begin(); it != sh.buckets.end();) {
        if (now >= it->second.last && now - it->second.last >= z.cfg.idle_evict) {
            it = sh.buckets.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    sh.next_sweep = now + z.cfg.idle_evict;
    z.keys.fetch_sub(dropped, std::memory_order_relaxed);
    return dropped;
}

std::size_t RateLimiter::sweep(Zone& z, TimePoint now) {
    std::size_t dropped = 0;
    for (auto& sh : z.shards) {
        std::lock_guard<std::mutex> lk(sh.mu);
        dropped += sweep_shard(z, sh, now);
    }
    return dropped;
}

bool RateLimiter::evict_oldest(Zone& z) {
    // Find the victim one shard lock at a time, then erase it only if it was not touched since.
    Shard*      victim = nullptr;
    std::string victim_key;
    TimePoint   oldest = TimePoint::max();
    for (auto& sh : z.shards) {
        std::lock_guard<std::mutex> lk(sh.mu);
        for (const auto& [k, b] : sh.buckets) {
            if (b.last < oldest) {
                oldest     = b.last;
                victim     = &sh;
                victim_key = k;
            }
        }
    }
    if (!victim) return false;

    std::lock_guard<std::mutex> lk(victim->mu);
    const auto it = victim->buckets.find(victim_key);
    if (it == victim->buckets.end() || it->second.last != oldest) return true;  // touched since the scan
    victim->buckets.erase(it);
    z.keys.fetch_sub(1, std::memory_order_relaxed);
    return true;
}

//------------------------------- Public API ------------------------------------

dockyard_detail::expected<Admission, RateLimitErr>
RateLimiter::admit(std::string_view zone, std::string_view key, TimePoint now) {
    Zone* z = find(zone);
    if (!z) return dockyard_detail::unexpected<RateLimitErr>(RateLimitErr::UnknownZone);

    Shard& sh = z->shard_for(key);
    {
        std::lock_guard<std::mutex> lk(sh.mu);
        if (now >= sh.next_sweep) sweep_shard(*z, sh, now);
        if (auto it = sh.buckets.find(key); it != sh.buckets.end()) return take(z->cfg, it->second, now);
        if (reserve_slot(*z)) return insert_and_take(*z, sh, key, now);
    }

    // Zone is at max_keys: sweep idle keys (shard locks taken one at a time), retry.
    sweep(*z, now);
    for (std::size_t attempt = 0; attempt < z->shards.size(); ++attempt) {
        {
            std::lock_guard<std::mutex> lk(sh.mu);
            if (auto it = sh.buckets.find(key); it != sh.buckets.end()) return take(z->cfg, it->second, now);
            if (reserve_slot(*z)) return insert_and_take(*z, sh, key, now);
        }
        if (!evict_oldest(*z)) break;
    }

    // Other writers keep refilling the table: overshoot max_keys rather than skip the charge.
    std::lock_guard<std::mutex> lk(sh.mu);
    if (auto it = sh.buckets.find(key); it != sh.buckets.end()) return take(z->cfg, it->second, now);
    z->keys.fetch_add(1, std::memory_order_relaxed);
    return insert_and_take(*z, sh, key, now);
}

std::optional<double> RateLimiter::tokens(std::string_view zone, std::string_view key, TimePoint now) const {
    const Zone* z = find(zone);
    if (!z) return std::nullopt;
    const Shard& sh = z->shard_for(key);
    std::lock_guard<std::mutex> lk(sh.mu);
    const auto it = sh.buckets.find(key);
    if (it == sh.buckets.end()) return std::nullopt;
    return refilled(z->cfg, it->second, now);
}

std::size_t RateLimiter::evict_idle(TimePoint now) {
    std::size_t dropped = 0;
    for (auto& [name, z] : zones_) dropped += sweep(*z, now);
    return dropped;
}

std::size_t RateLimiter::tracked_keys(std::string_view zone) const noexcept {
    const Zone* z = find(zone);
    return z ? z->keys.load(std::memory_order_relaxed) : 0;
}

} // namespace dockyard::routing
