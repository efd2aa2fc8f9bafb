// apps/dockyard/src/main.cpp
// dockyard: bring a deployment unit up, or tear it down.
//
// Usage:
//   dockyard [up|down] [--destroy] [--dry-run] [--no-build] [--yes] [--config <file>] [-v] [-h]
//
// Exit codes: 0 ok, 1 fatal/prerequisite/usage, 2 destroy cancelled, 3 degraded.

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "dockyard/config/config_loader.hpp"
#include "dockyard/config/constants.hpp"
#include "dockyard/lifecycle/deploy_lock.hpp"
#include "dockyard/lifecycle/docker_runtime.hpp"
#include "dockyard/lifecycle/orchestrator.hpp"
#include "dockyard/obs/observability.hpp"
#include "dockyard/version.hpp"

namespace {

using namespace dockyard;
using namespace dockyard::lifecycle;
namespace cst = dockyard::config::constants;

struct Options {
    Mode        mode{Mode::Apply};
    bool        dry_run{false};
    bool        no_build{false};
    bool        yes{false};
    bool        verbose{false};
    bool        help{false};
    std::string config_path;
};

void usage(std::ostream& os) {
    os << "dockyard " << dockyard::version_string << "\n"
       << "Usage: dockyard [up|down] [options]\n"
       << "\n"
       << "Commands:\n"
       << "  up            Build images, provision the network and start all services (default)\n"
       << "  down          Stop and remove all services, then the network\n"
       << "\n"
       << "Options:\n"
       << "  --destroy         Same as 'down'\n"
       << "  --dry-run         Print the action plan; change nothing\n"
       << "  --no-build        Skip building images\n"
       << "  -y, --yes         Confirm teardown without prompting\n"
       << "  --config <file>   JSON deployment file (built-in notes stack by default)\n"
       << "  -v, --verbose     Debug output\n"
       << "  -h, --help        Show this help\n";
}

/// @return false on a usage error (already reported).
bool parse_args(int argc, char** argv, Options& o) {
    bool have_command = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "up" || a == "down") {
            if (have_command) { std::cerr << "dockyard: more than one command given\n"; return false; }
            have_command = true;
            o.mode = (a == "down") ? Mode::Destroy : Mode::Apply;
        } else if (a == "--destroy") {
            o.mode = Mode::Destroy;
        } else if (a == "--dry-run") {
            o.dry_run = true;
        } else if (a == "--no-build") {
            o.no_build = true;
        } else if (a == "-y" || a == "--yes") {
            o.yes = true;
        } else if (a == "-v" || a == "--verbose") {
            o.verbose = true;
        } else if (a == "-h" || a == "--help") {
            o.help = true;
        } else if (a == "--config") {
            if (i + 1 >= argc) { std::cerr << "dockyard: --config needs a file argument\n"; return false; }
            o.config_path = argv[++i];
        } else {
            std::cerr << "dockyard: unknown argument '" << a << "'\n";
            return false;
        }
    }
    return true;
}

void step(int n, int total, const std::string& what) {
    std::cout << "\n[Step " << n << "/" << total << "] " << what << "\n";
}

std::string join(const std::vector<Action>& actions) {
    if (actions.empty()) return "(no change)";
    std::string s;
    for (const auto a : actions) {
        if (!s.empty()) s += " -> ";
        s += to_string(a);
    }
    return s;
}

void print_plan(const ReconcileReport& r) {
    std::cout << "Plan for '" << r.deployment << "' (" << to_string(r.mode) << ", dry run):\n";
    for (const auto& p : r.plan) {
        std::cout << "  " << std::left << std::setw(16) << p.service
                  << std::setw(10) << to_string(p.observed)
                  << join(p.actions) << (p.drift ? "  [config changed]" : "") << "\n";
    }
    std::cout << "  network " << r.network << ": " << to_string(r.network_outcome) << "\n";
}

void print_report(const ReconcileReport& r) {
    for (const auto& s : r.services) {
        std::cout << "  " << std::left << std::setw(16) << s.service
                  << std::setw(10) << to_string(s.outcome)
                  << std::setw(10) << to_string(s.final_state)
                  << s.reason << "\n";
    }
    std::cout << "  network " << r.network << ": " << to_string(r.network_outcome) << "\n";
}

void print_entrypoints(const config::DeployConfig& cfg, const Topology& topo) {
    std::cout << "\nEntrypoints:\n";
    if (const Service* entry = topo.find(cfg.proxy.service); entry && entry->port.host != 0) {
        const std::string base = "http://localhost:" + std::to_string(entry->port.host);
        for (const auto& r : cfg.proxy.routes) {
            if (r.kind == routing::MatchKind::Regex) continue;
            std::string path = r.pattern;
            if (!path.empty() && path.back() == '*') path.pop_back();
            const std::string target = r.is_static() ? "static " + std::to_string(r.static_response->status)
                                                     : r.group;
            std::cout << "  - " << std::left << std::setw(32) << (base + path) << " -> " << target << "\n";
        }
    }
    for (const auto& name : topo.start_order()) {
        const Service* s = topo.find(name);
        if (!s || s->port.host == 0 || s->name == cfg.proxy.service) continue;
        std::cout << "  - " << std::left << std::setw(32) << ("localhost:" + std::to_string(s->port.host))
                  << " -> " << s->name << " (direct)\n";
    }
}

int build_images(ArtifactBuilder& builder, const Topology& topo, bool dry_run) {
    std::size_t built = 0;
    for (const auto& name : topo.start_order()) {
        const Service* s = topo.find(name);
        if (!s || s->build_context.empty()) continue;
        if (dry_run) {
            std::cout << "  would build " << s->image << " from " << s->build_context << "\n";
            continue;
        }
        spdlog::info("building {} from {}", s->image, s->build_context);
        auto r = builder.build(s->image, s->build_context);
        if (!r) {
            spdlog::error("build of {} failed: {}", s->image, r.error().detail);
            return cst::EXIT_FATAL;
        }
        ++built;
    }
    if (!dry_run) std::cout << "  " << built << " image(s) built\n";
    return cst::EXIT_OK;
}

/// Ask for the confirmation phrase. @return the phrase to pass on, or nullopt when cancelled.
std::optional<std::string> confirm_destroy(const Options& o) {
    if (o.yes) return std::string(cst::DESTROY_CONFIRM_PHRASE);
    if (!::isatty(STDIN_FILENO)) {
        spdlog::error("refusing to tear down without a terminal; pass --yes to confirm");
        return std::nullopt;
    }
    std::cout << "\nType '" << cst::DESTROY_CONFIRM_PHRASE << "' to confirm: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line) || line != cst::DESTROY_CONFIRM_PHRASE) {
        std::cout << "Teardown cancelled.\n";
        return std::nullopt;
    }
    return line;
}

int finish(const ReconcileResult& res, bool dry_run) {
    if (!res) {
        spdlog::error("{}: {}", to_string(res.error().code), res.error().detail);
        if (!res.error().partial.services.empty()) print_report(res.error().partial);
        return cst::EXIT_FATAL;
    }
    if (dry_run) print_plan(*res);
    else         print_report(*res);
    return res->ok() ? cst::EXIT_OK : cst::EXIT_DEGRADED;
}

} // namespace

int main(int argc, char** argv) {
    Options o;
    if (!parse_args(argc, argv, o)) { usage(std::cerr); return cst::EXIT_FATAL; }
    if (o.help) { usage(std::cout); return cst::EXIT_OK; }

    obs::init_logging(o.verbose);

    const auto cfg = config::Loader::load_from_file(o.config_path);
    if (!cfg) {
        spdlog::error("config ({}): {}", config::to_string(cfg.error().code), cfg.error().detail);
        return cst::EXIT_FATAL;
    }
    const auto topo = config::Loader::topology(*cfg);
    if (!topo) {
        spdlog::error("config ({}): {}", config::to_string(topo.error().code), topo.error().detail);
        return cst::EXIT_FATAL;
    }

    const bool destroy = o.mode == Mode::Destroy;
    const int  total   = destroy ? 3 : 4;
    std::cout << "dockyard " << dockyard::version_string << ": " << (destroy ? "tearing down" : "bringing up")
              << " '" << topo->deployment() << "'" << (o.dry_run ? " (dry run)" : "") << "\n";

    DockerRuntime docker;

    step(1, total, "Checking prerequisites");
    if (auto p = docker.ping(); !p) {
        spdlog::error("{}", p.error().detail);
        return cst::EXIT_FATAL;
    }
    std::cout << "  container runtime reachable\n";

    // Dry runs only read, so they do not contend for the deployment lock.
    std::optional<DeployLock> lock;
    if (!o.dry_run) {
        const auto path = DeployLock::default_path(topo->deployment());
        auto l = DeployLock::try_acquire(path);
        if (!l) {
            if (l.error() == LockErr::Busy) spdlog::error("another dockyard run holds {}", path);
            else                            spdlog::error("cannot open lock file {}", path);
            return cst::EXIT_FATAL;
        }
        lock.emplace(std::move(*l));
    }

    Orchestrator orch(docker, {}, obs::make_log_observer());

    if (!destroy) {
        step(2, total, "Building images");
        if (o.no_build) {
            std::cout << "  skipped (--no-build)\n";
        } else if (const int rc = build_images(docker, *topo, o.dry_run); rc != cst::EXIT_OK) {
            return rc;
        }

        step(3, total, "Reconciling services");
        const auto res = orch.reconcile(*topo, ReconcileRequest{Mode::Apply, o.dry_run, std::nullopt});
        const int rc = finish(res, o.dry_run);

        step(4, total, "Summary");
        if (rc == cst::EXIT_OK && !o.dry_run) {
            std::cout << "  all services running\n";
            print_entrypoints(*cfg, *topo);
        } else if (rc == cst::EXIT_DEGRADED) {
            std::cout << "  finished with failed or blocked services\n";
        } else if (o.dry_run && rc == cst::EXIT_OK) {
            std::cout << "  dry run: nothing was changed\n";
        }
        return rc;
    }

    step(2, total, "Teardown preview");
    auto order = topo->start_order();
    std::reverse(order.begin(), order.end());
    std::cout << "  The following will be removed:\n";
    for (const auto& name : order) std::cout << "    - service " << name << "\n";
    std::cout << "    - network " << topo->network() << " (if no other instance uses it)\n";

    ReconcileRequest req{Mode::Destroy, o.dry_run, std::nullopt};
    if (!o.dry_run) {
        req.confirmation = confirm_destroy(o);
        if (!req.confirmation) return cst::EXIT_CANCELLED;
    }

    step(3, total, "Removing services");
    return finish(orch.reconcile(*topo, req), o.dry_run);
}
