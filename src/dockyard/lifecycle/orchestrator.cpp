/**
 * @file orchestrator.cpp
 * @brief Observe/plan/apply implementation of the lifecycle orchestrator.
 */
#include "dockyard/lifecycle/orchestrator.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "dockyard/config/constants.hpp"
#include "dockyard/obs/observability.hpp"

namespace dockyard::lifecycle {

std::string_view to_string(Mode m) noexcept {
    return m == Mode::Apply ? "apply" : "destroy";
}

std::string_view to_string(Action a) noexcept {
    switch (a) {
        case Action::Create: return "create";
        case Action::Start:  return "start";
        case Action::Stop:   return "stop";
        case Action::Remove: return "remove";
    }
    return "unknown";
}

std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Unchanged: return "unchanged";
        case Outcome::Created:   return "created";
        case Outcome::Started:   return "started";
        case Outcome::Recreated: return "recreated";
        case Outcome::Restarted: return "restarted";
        case Outcome::Removed:   return "removed";
        case Outcome::Failed:    return "failed";
        case Outcome::Blocked:   return "blocked";
        case Outcome::Planned:   return "planned";
    }
    return "unknown";
}

std::string_view to_string(NetworkOutcome n) noexcept {
    switch (n) {
        case NetworkOutcome::Existing: return "existing";
        case NetworkOutcome::Created:  return "created";
        case NetworkOutcome::Removed:  return "removed";
        case NetworkOutcome::InUse:    return "in use";
        case NetworkOutcome::Missing:  return "missing";
        case NetworkOutcome::Planned:  return "planned";
    }
    return "unknown";
}

std::string_view to_string(ReconcileErr e) noexcept {
    switch (e) {
        case ReconcileErr::ConfirmationRequired: return "confirmation required";
        case ReconcileErr::Unreachable:          return "runtime unreachable";
        case ReconcileErr::NetworkFailed:        return "network provisioning failed";
        case ReconcileErr::RuntimeFailed:        return "runtime inspection failed";
    }
    return "unknown";
}

bool ReconcileReport::ok() const noexcept {
    return std::none_of(services.begin(), services.end(), [](const ServiceReport& r) {
        return r.outcome == Outcome::Failed || r.outcome == Outcome::Blocked;
    });
}

const ServiceReport* ReconcileReport::find(std::string_view name) const noexcept {
    for (const auto& r : services) if (r.service == name) return &r;
    return nullptr;
}

namespace {

// One mutex per deployment unit, shared by every Orchestrator in the process.
std::mutex& unit_mutex(const std::string& deployment) {
    static std::mutex registry_mu;
    static std::unordered_map<std::string, std::unique_ptr<std::mutex>> units;
    std::lock_guard<std::mutex> lk(registry_mu);
    auto& slot = units[deployment];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

ReconcileError make_error(ReconcileErr code, std::string detail, const ReconcileReport& partial) {
    return ReconcileError{code, std::move(detail), partial};
}

bool is_fatal(const RuntimeError& e) noexcept {
    return e.code == RuntimeErrc::Unreachable;
}

} // namespace

std::vector<Action> plan_apply(ServiceState observed, bool drift) {
    switch (observed) {
        case ServiceState::Running:   return {};
        case ServiceState::Stopped:   return drift ? std::vector<Action>{Action::Remove, Action::Create, Action::Start}
                                                   : std::vector<Action>{Action::Start};
        case ServiceState::Absent:    return {Action::Create, Action::Start};
        case ServiceState::Unhealthy: return {Action::Stop, Action::Start};
    }
    return {};
}

std::vector<Action> plan_destroy(ServiceState observed) {
    switch (observed) {
        case ServiceState::Running:
        case ServiceState::Unhealthy: return {Action::Stop, Action::Remove};
        case ServiceState::Stopped:   return {Action::Remove};
        case ServiceState::Absent:    return {};
    }
    return {};
}

Orchestrator::Orchestrator(Runtime& rt, OrchestratorOptions opts, obs::Observer* observer)
    : rt_(rt), inspector_(rt), networks_(rt), opts_(std::move(opts)), observer_(observer) {
    if (!opts_.sleep) {
        opts_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void Orchestrator::emit(const ReconcileReport& report, const std::string& service, std::string_view action,
                        std::string_view outcome, const std::string& reason) const {
    if (!observer_) return;
    observer_->record(obs::LifecycleEvent{report.deployment, service, std::string(action),
                                          std::string(outcome), reason, report.dry_run});
}

ReconcileResult Orchestrator::reconcile(const Topology& topology, const ReconcileRequest& req) {
    ReconcileReport report;
    report.deployment = topology.deployment();
    report.mode       = req.mode;
    report.dry_run    = req.dry_run;
    report.network    = topology.network();

    // Checked before anything touches the runtime: a refusal must be side-effect free.
    if (req.mode == Mode::Destroy && !req.dry_run &&
        req.confirmation.value_or("") != config::constants::DESTROY_CONFIRM_PHRASE) {
        spdlog::warn("Destroy of '{}' was not confirmed; nothing changed", topology.deployment());
        return dockyard_detail::unexpected<ReconcileError>(
            make_error(ReconcileErr::ConfirmationRequired, "destroy requires the confirmation phrase", report));
    }

    std::lock_guard<std::mutex> unit_lock(unit_mutex(topology.deployment()));

    if (auto alive = rt_.ping(); !alive) {
        return dockyard_detail::unexpected<ReconcileError>(
            make_error(ReconcileErr::Unreachable, alive.error().detail, report));
    }

    auto steps = observe(topology, req.mode, report);
    if (!steps) return dockyard_detail::unexpected<ReconcileError>(std::move(steps.error()));
    report.plan = *steps;

    if (req.mode == Mode::Apply) {
        auto net = networks_.ensure_network(topology.network(), req.dry_run);
        if (!net) {
            const auto code = is_fatal(net.error()) ? ReconcileErr::Unreachable : ReconcileErr::NetworkFailed;
            return dockyard_detail::unexpected<ReconcileError>(make_error(code, net.error().detail, report));
        }
        if (net->created) {
            report.network_outcome = req.dry_run ? NetworkOutcome::Planned : NetworkOutcome::Created;
            if (!req.dry_run) report.mutations++;
            emit(report, topology.network(), "create_network", req.dry_run ? "planned" : "ok", "");
        } else {
            report.network_outcome = NetworkOutcome::Existing;
        }
    }

    if (req.dry_run) {
        std::size_t detaching = 0;
        for (const auto& step : report.plan) {
            ServiceReport r;
            r.service     = step.service;
            r.initial     = step.observed;
            r.applied     = step.actions;
            r.outcome     = step.actions.empty() ? Outcome::Unchanged : Outcome::Planned;
            r.final_state = req.mode == Mode::Apply ? ServiceState::Running : ServiceState::Absent;
            if (step.drift) r.reason = "configuration drift";
            for (Action a : step.actions) {
                spdlog::info("[DRY RUN] {} {}", to_string(a), step.service);
                emit(report, step.service, to_string(a), "planned", r.reason);
            }
            if (step.observed != ServiceState::Absent) ++detaching;
            report.services.push_back(std::move(r));
        }
        if (req.mode == Mode::Destroy) {
            auto rel = networks_.release_network(topology.network(), true, detaching);
            if (!rel) {
                return dockyard_detail::unexpected<ReconcileError>(
                    make_error(ReconcileErr::RuntimeFailed, rel.error().detail, report));
            }
            report.network_outcome = *rel == NetworkRelease::Missing ? NetworkOutcome::Missing
                                   : *rel == NetworkRelease::InUse   ? NetworkOutcome::InUse
                                                                     : NetworkOutcome::Planned;
        }
        return report;
    }

    for (const auto& step : report.plan) {
        const Service* svc = topology.find(step.service);
        ServiceReport out;
        out.service = step.service;
        out.initial = step.observed;

        if (req.mode == Mode::Apply) {
            // A dependency that did not come up blocks everything downstream of it.
            const ServiceReport* bad_dep = nullptr;
            for (const auto& dep : svc->depends_on) {
                const ServiceReport* dr = report.find(dep);
                if (dr && (dr->outcome == Outcome::Failed || dr->outcome == Outcome::Blocked)) { bad_dep = dr; break; }
            }
            if (bad_dep) {
                out.outcome     = Outcome::Blocked;
                out.final_state = step.observed;
                out.reason      = "dependency '" + bad_dep->service + "' " + std::string(to_string(bad_dep->outcome));
                emit(report, out.service, "apply", "blocked", out.reason);
                report.services.push_back(std::move(out));
                continue;
            }
        }

        auto done = req.mode == Mode::Apply ? apply_service(topology, *svc, step, out, report)
                                            : destroy_service(topology, *svc, step, out, report);
        report.services.push_back(std::move(out));
        if (!done) {
            return dockyard_detail::unexpected<ReconcileError>(
                make_error(ReconcileErr::Unreachable, done.error().detail, report));
        }
        const auto& last = report.services.back();
        if (last.outcome == Outcome::Failed) emit(report, last.service, to_string(req.mode), "failed", last.reason);
    }

    if (req.mode == Mode::Destroy) {
        auto rel = networks_.release_network(topology.network());
        if (!rel) {
            const auto code = is_fatal(rel.error()) ? ReconcileErr::Unreachable : ReconcileErr::NetworkFailed;
            return dockyard_detail::unexpected<ReconcileError>(make_error(code, rel.error().detail, report));
        }
        switch (*rel) {
            case NetworkRelease::Removed:
                report.network_outcome = NetworkOutcome::Removed;
                report.mutations++;
                emit(report, topology.network(), "remove_network", "ok", "");
                break;
            case NetworkRelease::InUse:   report.network_outcome = NetworkOutcome::InUse;   break;
            case NetworkRelease::Missing: report.network_outcome = NetworkOutcome::Missing; break;
            case NetworkRelease::Planned: report.network_outcome = NetworkOutcome::Planned; break;
        }
    }
    return report;
}

dockyard_detail::expected<Orchestrator::Steps, ReconcileError>
Orchestrator::observe(const Topology& topology, Mode mode, ReconcileReport& report) {
    std::vector<std::string> order = topology.start_order();
    if (mode == Mode::Destroy) std::reverse(order.begin(), order.end());

    Steps steps;
    steps.reserve(order.size());
    for (const auto& name : order) {
        const Service* svc = topology.find(name);
        auto info = inspector_.status(name);
        if (!info) {
            const auto code = is_fatal(info.error()) ? ReconcileErr::Unreachable : ReconcileErr::RuntimeFailed;
            return dockyard_detail::unexpected<ReconcileError>(
                make_error(code, name + ": " + info.error().detail, report));
        }

        PlannedStep step;
        step.service  = name;
        step.observed = info->state;
        step.health_pending = info->state == ServiceState::Running && info->health_pending;
        step.drift    = info->state != ServiceState::Absent &&
                        info->config_hash != fingerprint_hex(config_fingerprint(*svc));
        step.actions  = mode == Mode::Apply ? plan_apply(step.observed, step.drift)
                                            : plan_destroy(step.observed);

        spdlog::debug("{}: observed {}{}", name, to_string(step.observed), step.drift ? " (drift)" : "");
        if (mode == Mode::Apply && step.observed == ServiceState::Running && step.drift) {
            spdlog::info("{}: running with configuration drift; left in place", name);
        }
        steps.push_back(std::move(step));
    }
    return steps;
}

RuntimeResult<Done> Orchestrator::mutate(Action a, const Topology& topology, const Service& svc,
                                         ServiceReport& out, ReconcileReport& report) {
    report.mutations++;
    out.applied.push_back(a);

    RuntimeResult<Done> r = Done{};
    switch (a) {
        case Action::Create:
            r = rt_.create(CreateSpec{svc, topology.deployment(), fingerprint_hex(config_fingerprint(svc))});
            break;
        case Action::Start:  r = rt_.start(svc.name);  break;
        case Action::Stop:   r = rt_.stop(svc.name);   break;
        case Action::Remove: r = rt_.remove(svc.name); break;
    }

    if (r) {
        emit(report, svc.name, to_string(a), "ok", "");
    } else {
        spdlog::warn("{} {} failed: {}", to_string(a), svc.name, r.error().detail);
        emit(report, svc.name, to_string(a), "error", r.error().detail);
    }
    return r;
}

RuntimeResult<InstanceInfo> Orchestrator::wait_running(const Service& svc) {
    const auto interval = svc.health.interval;
    std::uint64_t polls = 1 + svc.health.retries;
    if (interval.count() > 0) polls += static_cast<std::uint64_t>(svc.health.start_period / interval);
    polls = std::min<std::uint64_t>(polls, std::max<std::uint32_t>(opts_.max_ready_polls, 1));

    InstanceInfo last;
    for (std::uint64_t i = 0; i < polls; ++i) {
        auto info = inspector_.status(svc.name);
        if (!info) return info;
        last = *info;
        if (last.state == ServiceState::Running && !last.health_pending) return last;
        if (last.state == ServiceState::Absent) return last;
        if (i + 1 < polls && interval.count() > 0) opts_.sleep(interval);
    }
    return last;
}

RuntimeResult<InstanceInfo> Orchestrator::launch(const Topology& topology, const Service& svc,
                                                 ServiceReport& out, ReconcileReport& report) {
    if (auto c = mutate(Action::Create, topology, svc, out, report); !c) {
        return dockyard_detail::unexpected<RuntimeError>(std::move(c.error()));
    }
    if (auto s = mutate(Action::Start, topology, svc, out, report); !s) {
        return dockyard_detail::unexpected<RuntimeError>(std::move(s.error()));
    }
    return wait_running(svc);
}

RuntimeResult<InstanceInfo> Orchestrator::recreate(const Topology& topology, const Service& svc,
                                                   ServiceReport& out, ReconcileReport& report) {
    auto current = inspector_.state(svc.name);
    if (!current) return dockyard_detail::unexpected<RuntimeError>(std::move(current.error()));

    if (*current == ServiceState::Running || *current == ServiceState::Unhealthy) {
        if (auto s = mutate(Action::Stop, topology, svc, out, report); !s) {
            return dockyard_detail::unexpected<RuntimeError>(std::move(s.error()));
        }
    }
    if (*current != ServiceState::Absent) {
        auto r = mutate(Action::Remove, topology, svc, out, report);
        if (!r && r.error().code != RuntimeErrc::NotFound) {
            return dockyard_detail::unexpected<RuntimeError>(std::move(r.error()));
        }
    }
    return launch(topology, svc, out, report);
}

RuntimeResult<Done> Orchestrator::apply_service(const Topology& topology, const Service& svc,
                                                const PlannedStep& step, ServiceReport& out,
                                                ReconcileReport& report) {
    // Turn a launch result into the service outcome; only fatal errors escape.
    auto settle = [&](RuntimeResult<InstanceInfo> r, Outcome success) -> RuntimeResult<Done> {
        if (!r) {
            if (is_fatal(r.error())) return dockyard_detail::unexpected<RuntimeError>(std::move(r.error()));
            out.outcome = Outcome::Failed;
            out.reason  = r.error().detail;
            auto now = inspector_.state(svc.name);
            if (now) out.final_state = *now;
            else if (is_fatal(now.error())) return dockyard_detail::unexpected<RuntimeError>(std::move(now.error()));
            return Done{};
        }
        out.final_state = r->state;
        if (r->state == ServiceState::Running && !r->health_pending) {
            out.outcome = success;
            spdlog::info("{}: {}", svc.name, to_string(success));
        } else {
            out.outcome = Outcome::Failed;
            out.reason  = "did not become running (last state: " + std::string(to_string(r->state)) +
                          (r->health_pending ? ", health check pending)" : ")");
        }
        return Done{};
    };

    switch (step.observed) {
        case ServiceState::Running: {
            if (step.drift) out.reason = "running with configuration drift";
            if (step.health_pending) {
                // Dependents must not start against a service that is still warming up.
                spdlog::info("{}: running, waiting for its health check", svc.name);
                auto ready = wait_running(svc);
                if (!ready) {
                    if (is_fatal(ready.error())) {
                        return dockyard_detail::unexpected<RuntimeError>(std::move(ready.error()));
                    }
                    out.outcome = Outcome::Failed;
                    out.reason  = ready.error().detail;
                    return Done{};
                }
                out.final_state = ready->state;
                if (ready->state != ServiceState::Running || ready->health_pending) {
                    out.outcome = Outcome::Failed;
                    out.reason  = "did not become healthy (last state: " + std::string(to_string(ready->state)) +
                                  (ready->health_pending ? ", health check pending)" : ")");
                    return Done{};
                }
            }
            out.outcome     = Outcome::Unchanged;
            out.final_state = ServiceState::Running;
            spdlog::info("{}: already running", svc.name);
            return Done{};
        }

        case ServiceState::Absent:
            spdlog::info("{}: creating", svc.name);
            return settle(launch(topology, svc, out, report), Outcome::Created);

        case ServiceState::Stopped: {
            if (step.drift) {
                spdlog::info("{}: configuration changed since last start; recreating", svc.name);
                return settle(recreate(topology, svc, out, report), Outcome::Recreated);
            }
            spdlog::info("{}: stopped; starting", svc.name);
            auto started = mutate(Action::Start, topology, svc, out, report);
            if (started) {
                auto ready = wait_running(svc);
                if (!ready) return settle(std::move(ready), Outcome::Started);
                if (ready->state == ServiceState::Running && !ready->health_pending) {
                    return settle(std::move(ready), Outcome::Started);
                }
            } else if (is_fatal(started.error())) {
                return dockyard_detail::unexpected<RuntimeError>(std::move(started.error()));
            }
            spdlog::warn("{}: plain start did not succeed; removing and recreating", svc.name);
            return settle(recreate(topology, svc, out, report), Outcome::Recreated);
        }

        case ServiceState::Unhealthy: {
            spdlog::info("{}: unhealthy; restarting", svc.name);
            auto stopped = mutate(Action::Stop, topology, svc, out, report);
            if (stopped) {
                auto started = mutate(Action::Start, topology, svc, out, report);
                if (started) {
                    auto ready = wait_running(svc);
                    if (!ready || (ready->state == ServiceState::Running && !ready->health_pending)) {
                        return settle(std::move(ready), Outcome::Restarted);
                    }
                } else if (is_fatal(started.error())) {
                    return dockyard_detail::unexpected<RuntimeError>(std::move(started.error()));
                }
            } else if (is_fatal(stopped.error())) {
                return dockyard_detail::unexpected<RuntimeError>(std::move(stopped.error()));
            }
            spdlog::warn("{}: restart did not succeed; removing and recreating", svc.name);
            return settle(recreate(topology, svc, out, report), Outcome::Recreated);
        }
    }
    return Done{};
}

RuntimeResult<Done> Orchestrator::destroy_service(const Topology& topology, const Service& svc,
                                                  const PlannedStep& step, ServiceReport& out,
                                                  ReconcileReport& report) {
    if (step.observed == ServiceState::Absent) {
        spdlog::debug("Instance not found (skipping): {}", svc.name);
        out.outcome     = Outcome::Unchanged;
        out.final_state = ServiceState::Absent;
        return Done{};
    }

    // NotFound mid-teardown means someone else already removed it.
    auto fail = [&](RuntimeError e) -> RuntimeResult<Done> {
        if (is_fatal(e)) return dockyard_detail::unexpected<RuntimeError>(std::move(e));
        out.outcome = Outcome::Failed;
        out.reason  = std::move(e.detail);
        return Done{};
    };

    spdlog::info("Removing instance: {}", svc.name);
    out.final_state = step.observed;
    if (step.observed == ServiceState::Running || step.observed == ServiceState::Unhealthy) {
        auto s = mutate(Action::Stop, topology, svc, out, report);
        if (!s && s.error().code != RuntimeErrc::NotFound) return fail(std::move(s.error()));
        out.final_state = ServiceState::Stopped;
    }
    auto r = mutate(Action::Remove, topology, svc, out, report);
    if (!r && r.error().code != RuntimeErrc::NotFound) return fail(std::move(r.error()));

    out.outcome     = Outcome::Removed;
    out.final_state = ServiceState::Absent;
    return Done{};
}

} // namespace dockyard::lifecycle
