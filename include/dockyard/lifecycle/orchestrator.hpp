#pragma once
/**
 * @file orchestrator.hpp
 * @brief Lifecycle Orchestrator: reconcile a Topology against the runtime.
 *
 * A reconciliation runs in two phases:
 *   1. Observe: ping the runtime, inspect every service once and derive a plan.
 *      Nothing is mutated; any runtime failure here aborts.
 *   2. Apply: ensure the network, execute the plan in dependency order (reverse
 *      order for destroy, releasing the network last), collecting a per-service
 *      outcome. Dry runs report the plan and issue no mutating call.
 *
 * Calls against the same deployment unit are serialized in-process; cross-process
 * exclusion is the caller's job (see deploy_lock.hpp).
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/lifecycle/runtime.hpp"
#include "dockyard/lifecycle/service.hpp"
#include "dockyard/lifecycle/state_inspector.hpp"

namespace dockyard::obs { class Observer; }

namespace dockyard::lifecycle {

/// What a reconciliation is asked to achieve.
enum class Mode : std::uint8_t { Apply, Destroy };

/// Primitive runtime mutation.
enum class Action : std::uint8_t { Create, Start, Stop, Remove };

/// Per-service result.
enum class Outcome : std::uint8_t {
    Unchanged,  ///< Already in the desired state
    Created,    ///< Absent -> created and running
    Started,    ///< Stopped -> running with a plain start
    Recreated,  ///< Removed and created again (drift or failed start)
    Restarted,  ///< Unhealthy -> stopped -> running
    Removed,    ///< Destroy: stopped (if needed) and removed
    Failed,     ///< Could not reach the desired state
    Blocked,    ///< Skipped because a dependency failed or is blocked
    Planned     ///< Dry run: actions listed, nothing executed
};

/// What happened to the shared network.
enum class NetworkOutcome : std::uint8_t { Existing, Created, Removed, InUse, Missing, Planned };

[[nodiscard]] std::string_view to_string(Mode m) noexcept;
[[nodiscard]] std::string_view to_string(Action a) noexcept;
[[nodiscard]] std::string_view to_string(Outcome o) noexcept;
[[nodiscard]] std::string_view to_string(NetworkOutcome n) noexcept;

/**
 * @brief Actions taking a service from @p observed to Running.
 *
 * Stopped with drift is removed and created again; Unhealthy is restarted.
 * Create and Start always appear together, forming the Absent->Running edge.
 */
[[nodiscard]] std::vector<Action> plan_apply(ServiceState observed, bool drift);

/// Actions taking a service from @p observed to Absent.
[[nodiscard]] std::vector<Action> plan_destroy(ServiceState observed);

/// Phase-1 result for one service.
struct PlannedStep final {
    std::string         service;
    ServiceState        observed{ServiceState::Absent};
    bool                drift{false};   ///< Stored fingerprint differs from desired
    bool                health_pending{false}; ///< Running, health check not yet decided
    std::vector<Action> actions;        ///< Empty: nothing to do
};

/// Phase-2 result for one service.
struct ServiceReport final {
    std::string         service;
    Outcome             outcome{Outcome::Unchanged};
    ServiceState        initial{ServiceState::Absent};
    ServiceState        final_state{ServiceState::Absent};
    std::vector<Action> applied;        ///< Mutations actually issued (or planned on dry run)
    std::string         reason;
};

/// Structured result of one reconcile() call.
struct ReconcileReport final {
    std::string                deployment;
    Mode                       mode{Mode::Apply};
    bool                       dry_run{false};
    std::string                network;
    NetworkOutcome             network_outcome{NetworkOutcome::Existing};
    std::vector<PlannedStep>   plan;      ///< In execution order
    std::vector<ServiceReport> services;  ///< In execution order
    std::size_t                mutations{0}; ///< Mutating runtime calls issued

    /// True when no service failed or was blocked.
    [[nodiscard]] bool ok() const noexcept;

    /// Report entry for @p name; nullptr if the service was not processed.
    [[nodiscard]] const ServiceReport* find(std::string_view name) const noexcept;
};

/// Errors that abort a reconciliation as a whole.
enum class ReconcileErr : std::uint8_t {
    ConfirmationRequired, ///< Destroy without the confirmation phrase; nothing touched
    Unreachable,          ///< Runtime backend unusable
    NetworkFailed,        ///< Shared network could not be provisioned
    RuntimeFailed         ///< Inspection failed during planning
};

struct ReconcileError final {
    ReconcileErr    code;
    std::string     detail;
    ReconcileReport partial;  ///< What had been done before the abort
};

[[nodiscard]] std::string_view to_string(ReconcileErr e) noexcept;

using ReconcileResult = dockyard_detail::expected<ReconcileReport, ReconcileError>;

/// Caller-supplied parameters of one reconciliation.
struct ReconcileRequest final {
    Mode                       mode{Mode::Apply};
    bool                       dry_run{false};
    std::optional<std::string> confirmation;  ///< Must equal DESTROY_CONFIRM_PHRASE for destroy
};

/// Tunables; defaults suit production, tests replace @ref sleep.
struct OrchestratorOptions final {
    /// Blocking wait between readiness polls.
    std::function<void(std::chrono::milliseconds)> sleep;
    /// Stop after this many readiness polls even if the health descriptor allows more.
    std::uint32_t max_ready_polls{600};
};

/**
 * @class Orchestrator
 * @brief Idempotent, dependency-ordered reconciler.
 */
class Orchestrator final {
public:
    explicit Orchestrator(Runtime& rt,
                          OrchestratorOptions opts = {},
                          obs::Observer* observer = nullptr);

    /**
     * @brief Drive the runtime toward (or away from) @p topology.
     * @return Report on completion, including partial service failures; an error only
     *         for whole-run aborts (see ReconcileErr).
     */
    ReconcileResult reconcile(const Topology& topology, const ReconcileRequest& req);

private:
    using Steps = std::vector<PlannedStep>;

    dockyard_detail::expected<Steps, ReconcileError>
    observe(const Topology& topology, Mode mode, ReconcileReport& report);

    /// Service-level failures land in @p out; an error return means "abort the run".
    RuntimeResult<Done> apply_service(const Topology& topology, const Service& svc,
                                      const PlannedStep& step, ServiceReport& out, ReconcileReport& report);
    RuntimeResult<Done> destroy_service(const Topology& topology, const Service& svc,
                                        const PlannedStep& step, ServiceReport& out, ReconcileReport& report);

    /// Create + start + wait.
    RuntimeResult<InstanceInfo> launch(const Topology& topology, const Service& svc,
                                       ServiceReport& out, ReconcileReport& report);
    /// Stop/remove whatever exists, then launch().
    RuntimeResult<InstanceInfo> recreate(const Topology& topology, const Service& svc,
                                         ServiceReport& out, ReconcileReport& report);
    /// Poll until Running with no pending health check, within the health budget.
    RuntimeResult<InstanceInfo> wait_running(const Service& svc);

    RuntimeResult<Done> mutate(Action a, const Topology& topology, const Service& svc,
                               ServiceReport& out, ReconcileReport& report);

    void emit(const ReconcileReport& report, const std::string& service, std::string_view action,
              std::string_view outcome, const std::string& reason) const;

    Runtime&            rt_;
    StateInspector      inspector_;
    NetworkProvisioner  networks_;
    OrchestratorOptions opts_;
    obs::Observer*      observer_;
};

} // namespace dockyard::lifecycle
