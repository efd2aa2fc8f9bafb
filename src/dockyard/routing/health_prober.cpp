/**
 * @file health_prober.cpp
 * @brief HealthProber threads and the TCP connect check.
 */
#include "dockyard/routing/health_prober.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace dockyard::routing {

bool tcp_probe(const Endpoint& ep, std::chrono::milliseconds timeout) {
    TcpConnector c;
    return c.connect(ep, timeout).has_value();
}

HealthProber::HealthProber(UpstreamPool& pool, ProbeFn probe)
    : pool_(pool), probe_(std::move(probe)) {}

HealthProber::~HealthProber() {
    stop();
}

bool HealthProber::running() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return !threads_.empty();
}

ProbeResult HealthProber::check(const std::string& group, const Endpoint& ep, std::chrono::milliseconds timeout) {
    const auto t0 = std::chrono::steady_clock::now();
    bool ok = probe_(ep, timeout);
    if (ok && std::chrono::steady_clock::now() - t0 > timeout) {
        spdlog::debug("probe {} ({}): answered after the {}ms timeout", ep.str(), group, timeout.count());
        ok = false;
    }

    ProbeResult r{group, ep.str(), ok, false};
    const auto health = pool_.mark_health(group, r.member, ok);
    if (health) {
        r.healthy = *health;
    } else {
        spdlog::warn("probe {} ({}): {}", r.member, group, to_string(health.error()));
    }
    return r;
}

std::vector<ProbeResult> HealthProber::run_once() {
    std::vector<ProbeResult> out;
    for (const auto& group : pool_.group_names()) {
        const GroupConfig* cfg = pool_.config(group);
        if (!cfg) continue;
        for (const auto& ep : pool_.members(group)) out.push_back(check(group, ep, cfg->probe_timeout));
    }
    return out;
}

void HealthProber::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!threads_.empty()) return;
    stopping_ = false;
    for (const auto& group : pool_.group_names()) {
        const GroupConfig* cfg = pool_.config(group);
        if (!cfg) continue;
        for (const auto& ep : pool_.members(group)) {
            threads_.emplace_back(&HealthProber::loop, this, group, ep, cfg->probe_interval, cfg->probe_timeout);
        }
    }
    spdlog::debug("health prober: {} member thread(s) started", threads_.size());
}

void HealthProber::stop() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
        joining.swap(threads_);
    }
    cv_.notify_all();
    for (auto& t : joining) {
        if (t.joinable()) t.join();
    }
}

void HealthProber::loop(std::string group, Endpoint ep, std::chrono::milliseconds interval,
                        std::chrono::milliseconds timeout) {
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stopping_) return;
        }
        check(group, ep, timeout);

        std::unique_lock<std::mutex> lk(mu_);
        if (cv_.wait_for(lk, interval, [this] { return stopping_; })) return;
    }
}

} // namespace dockyard::routing
