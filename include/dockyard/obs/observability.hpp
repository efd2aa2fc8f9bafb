#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: lifecycle/admission events + counters, spdlog-backed.
 */

#include <cstdint>
#include <string>

namespace dockyard::obs {

    /** @struct Counters
     *  @brief Process-level counters for lifecycle and admission decisions.
     */
    struct Counters {
        uint64_t lifecycle_actions{0};  ///< Mutating lifecycle actions applied
        uint64_t planned_actions{0};    ///< Actions reported by dry runs
        uint64_t service_failures{0};   ///< Services that failed to reach Running
        uint64_t services_blocked{0};   ///< Services skipped because a dependency failed
        uint64_t admitted{0};           ///< Requests dispatched (static or proxied)
        uint64_t rate_limited{0};       ///< Requests rejected by a zone
        uint64_t unavailable{0};        ///< Requests with no healthy/connectable upstream
    };

    /** @struct LifecycleEvent
     *  @brief One service-level step of a reconciliation.
     */
    struct LifecycleEvent {
        std::string deployment;   ///< Deployment unit label
        std::string service;      ///< Service (or network) name
        std::string action;       ///< "create", "start", "recreate", ...
        std::string outcome;      ///< "ok", "failed", "blocked", "planned"
        std::string reason;       ///< Human-readable detail
        bool        dry_run{false};
    };

    /** @struct AdmissionEvent
     *  @brief One request admission decision.
     */
    struct AdmissionEvent {
        std::string path;         ///< Request path as received
        std::string route;        ///< Winning route pattern
        std::string zone;         ///< Zone charged (empty for static routes)
        std::string client_key;   ///< Rate-limit key
        uint16_t    status{0};    ///< Response status chosen by the dispatcher
        std::string decision;     ///< "static", "proxy", "rate_limited", "unavailable", "bad_gateway", "bad_request"
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a lifecycle step.
        virtual void record(const LifecycleEvent& e) = 0;
        /// Record an admission decision.
        virtual void record(const AdmissionEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// One-line JSON rendering of @p e; the dry_run flag is included only when @p with_dry_run is set.
    std::string to_json_line(const LifecycleEvent& e, bool with_dry_run = true);
    /// One-line JSON rendering of @p e.
    std::string to_json_line(const AdmissionEvent& e);

    /// Process-wide observer writing through spdlog.
    Observer* make_log_observer();

    /**
     * @brief Install the default colored console logger.
     * @param verbose Lower the level to debug.
     */
    void init_logging(bool verbose);

} // namespace dockyard::obs
