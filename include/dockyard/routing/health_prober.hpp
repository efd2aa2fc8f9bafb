#pragma once
/**
 * @file health_prober.hpp
 * @brief Periodic per-member health checks feeding UpstreamPool::mark_health.
 *
 * One background thread per member. A check that reports success but took
 * longer than the group's probe timeout still counts as a failure.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dockyard/routing/upstream_pool.hpp"

namespace dockyard::routing {

/// One health check; must return within roughly @p timeout.
using ProbeFn = std::function<bool(const Endpoint& ep, std::chrono::milliseconds timeout)>;

/// Default check: a TCP connect bounded by @p timeout.
[[nodiscard]] bool tcp_probe(const Endpoint& ep, std::chrono::milliseconds timeout);

/// Result of one check, as fed to the pool.
struct ProbeResult final {
    std::string group;
    std::string member;
    bool        ok{false};
    bool        healthy{false};  ///< Member health after the check
};

/**
 * @class HealthProber
 * @brief Owns the probe threads; stop() (or destruction) wakes and joins them.
 */
class HealthProber final {
public:
    explicit HealthProber(UpstreamPool& pool, ProbeFn probe = tcp_probe);
    ~HealthProber();

    HealthProber(const HealthProber&)            = delete;
    HealthProber& operator=(const HealthProber&) = delete;

    /// Spawn one thread per member of every group. No-op if already running.
    void start();

    /// Wake every thread and join. Safe to call twice.
    void stop();

    /// Check every member once on the calling thread.
    std::vector<ProbeResult> run_once();

    [[nodiscard]] bool running() const noexcept;

private:
    ProbeResult check(const std::string& group, const Endpoint& ep, std::chrono::milliseconds timeout);
    void loop(std::string group, Endpoint ep, std::chrono::milliseconds interval, std::chrono::milliseconds timeout);

    UpstreamPool&            pool_;
    ProbeFn                  probe_;
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    bool                     stopping_{false};
    std::vector<std::thread> threads_;
};

} // namespace dockyard::routing
