// apps/route_check/src/main.cpp
// dockyard: route_check
// Purpose: validate the proxy section of a deployment file and show which route
// answers a given request path. Optionally probe the upstream members.
//
// Usage:
//   ./route_check [--config <file>] [--probe <seconds>] [-v] <path>...

#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "dockyard/config/config_loader.hpp"
#include "dockyard/config/constants.hpp"
#include "dockyard/obs/observability.hpp"
#include "dockyard/routing/health_prober.hpp"
#include "dockyard/routing/route_registry.hpp"
#include "dockyard/routing/upstream_pool.hpp"

using namespace dockyard;
namespace cst = dockyard::config::constants;

static void usage(std::ostream& os) {
    os << "Usage: route_check [--config <file>] [--probe <seconds>] [-v] <path>...\n";
}

static void print_match(const std::string& path, const routing::RouteRegistry& reg) {
    const auto m = reg.match(path);
    std::cout << std::left << std::setw(28) << path;
    if (!m) { std::cout << "-> (no match: path must start with '/')\n"; return; }
    const auto& r = *m.route;
    std::cout << "-> " << r.pattern << " [" << routing::to_string(r.kind) << "]";
    if (r.is_static()) {
        std::cout << " static " << r.static_response->status << "\n";
        return;
    }
    std::cout << " group=" << r.group << " zone=" << (r.zone.empty() ? "-" : r.zone) << "\n";
}

static int probe(const config::ProxyConfig& proxy, int seconds) {
    auto pool = routing::UpstreamPool::create(proxy.groups, std::make_shared<routing::TcpConnector>());
    if (!pool) {
        spdlog::error("{}", routing::to_string(pool.error()));
        return cst::EXIT_FATAL;
    }
    routing::HealthProber prober(*pool);
    if (seconds > 0) {
        prober.start();
        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        prober.stop();
    } else {
        prober.run_once();
    }

    std::cout << "\nUpstream health:\n";
    int down = 0;
    for (const auto& g : pool->group_names()) {
        for (const auto& ep : pool->members(g)) {
            const bool up = pool->healthy(g, ep.str()).value_or(false);
            if (!up) ++down;
            std::cout << "  " << std::left << std::setw(12) << g << std::setw(24) << ep.str()
                      << (up ? "up" : "down") << "\n";
        }
    }
    return down == 0 ? cst::EXIT_OK : cst::EXIT_DEGRADED;
}

int main(int argc, char** argv) {
    std::string config_path;
    int probe_seconds = -1;
    bool verbose = false;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") { usage(std::cout); return cst::EXIT_OK; }
        if (a == "-v" || a == "--verbose") { verbose = true; continue; }
        if (a == "--config" || a == "--probe") {
            if (i + 1 >= argc) { usage(std::cerr); return cst::EXIT_FATAL; }
            const std::string v = argv[++i];
            if (a == "--config") { config_path = v; continue; }
            const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), probe_seconds);
            if (ec != std::errc{} || ptr != v.data() + v.size() || probe_seconds < 0) {
                std::cerr << "route_check: --probe expects a number of seconds\n";
                return cst::EXIT_FATAL;
            }
            continue;
        }
        paths.push_back(a);
    }

    obs::init_logging(verbose);

    const auto cfg = config::Loader::load_from_file(config_path);
    if (!cfg) {
        spdlog::error("config ({}): {}", config::to_string(cfg.error().code), cfg.error().detail);
        return cst::EXIT_FATAL;
    }

    routing::RouteRegistry reg;
    if (auto v = reg.reload(cfg->proxy.routes); !v) {
        spdlog::error("routes: {} {}", routing::to_string(v.error().code), v.error().detail);
        return cst::EXIT_FATAL;
    }
    std::cout << cfg->proxy.routes.size() << " route(s), " << cfg->proxy.zones.size() << " zone(s), "
              << cfg->proxy.groups.size() << " upstream group(s): OK\n";

    for (const auto& p : paths) print_match(p, reg);

    if (probe_seconds >= 0) return probe(cfg->proxy, probe_seconds);
    return cst::EXIT_OK;
}
