/**
 * @file service.hpp
 * @brief Service / Topology model shared by the inspector, orchestrator and loader.
 *
 * A Topology is one deployment unit: a network plus an ordered list of services.
 * Declaration order is significant; it breaks ties whenever the dependency graph
 * leaves the start order open.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/config/constants.hpp"

namespace dockyard::lifecycle {

/**
 * @brief Observed lifecycle state of a managed service instance.
 *
 * @note Legal edges: Absent->Running, Running->Stopped, Stopped->Running,
 *       Stopped->Absent, Running->Unhealthy, Unhealthy->Stopped, Unhealthy->Running.
 */
enum class ServiceState : std::uint8_t {
    Absent = 0,
    Stopped,
    Running,
    Unhealthy
};

/// True if @p from -> @p to is one of the legal lifecycle edges.
[[nodiscard]] bool is_valid_transition(ServiceState from, ServiceState to) noexcept;

/// Lower-case label ("absent", "running", ...).
[[nodiscard]] std::string_view to_string(ServiceState s) noexcept;

/// Host -> container port mapping. host == 0 means "not published".
struct PortBinding final {
    std::uint16_t host{0};
    std::uint16_t container{0};

    bool operator==(const PortBinding&) const = default;
};

/// Runtime health-check descriptor attached to an instance.
struct HealthCheck final {
    std::string command;  ///< Probe run inside the instance; empty = none declared
    std::chrono::milliseconds interval{config::constants::HEALTH_INTERVAL_MS};
    std::chrono::milliseconds timeout{config::constants::HEALTH_TIMEOUT_MS};
    std::uint32_t             retries{config::constants::HEALTH_RETRIES};
    std::chrono::milliseconds start_period{config::constants::HEALTH_START_PERIOD_MS};

    bool operator==(const HealthCheck&) const = default;
};

using EnvBinding = std::pair<std::string, std::string>;

/**
 * @brief Desired configuration of one service.
 *
 * Environment values are stored already resolved: peer references of the form
 * ${svc.host} / ${svc.port} are expanded by make_topology().
 */
struct Service final {
    std::string              name;
    std::string              image;
    std::string              build_context;  ///< Empty: image is pulled, never built
    std::vector<std::string> depends_on;
    std::string              network;
    PortBinding              port;
    std::vector<EnvBinding>  env;            ///< Ordered; ordering is part of the fingerprint
    HealthCheck              health;

    bool operator==(const Service&) const = default;
};

/// Shared communication domain of one deployment unit.
struct Network final {
    std::string name;
    bool        created{false};  ///< True if ensure_network() had to create it
};

/**
 * @brief Validated deployment unit.
 *
 * Construct through make_topology(); services() is guaranteed to be non-empty,
 * uniquely named, acyclic and attached to network().
 */
class Topology final {
public:
    [[nodiscard]] const std::string& deployment() const noexcept { return deployment_; }
    [[nodiscard]] const std::string& network() const noexcept { return network_; }
    [[nodiscard]] const std::vector<Service>& services() const noexcept { return services_; }

    /// Services in start order: every dependency precedes its dependents,
    /// declaration order otherwise.
    [[nodiscard]] const std::vector<std::string>& start_order() const noexcept { return order_; }

    /// Lookup by name; nullptr when not declared.
    [[nodiscard]] const Service* find(std::string_view name) const noexcept;

private:
    friend struct TopologyBuilder;

    std::string              deployment_;
    std::string              network_;
    std::vector<Service>     services_;
    std::vector<std::string> order_;
};

/// Why a topology was rejected.
enum class TopologyErr : std::uint8_t {
    Empty,              ///< No services declared
    InvalidName,        ///< Empty or malformed service/network name
    DuplicateService,   ///< Two services share a name
    UnknownDependency,  ///< depends_on names an undeclared service
    Cycle,              ///< Dependency graph is not a DAG
    UnknownReference,   ///< ${svc.*} refers to an undeclared service
    BadReference        ///< ${...} placeholder that is neither .host nor .port
};

struct TopologyError final {
    TopologyErr code;
    std::string detail;
};

[[nodiscard]] std::string_view to_string(TopologyErr e) noexcept;

/**
 * @brief Validate declarations and compute the start order.
 * @param deployment Deployment unit label.
 * @param network Network every service is attached to (overrides Service::network).
 * @param services Declared services, in declaration order.
 */
[[nodiscard]] dockyard_detail::expected<Topology, TopologyError>
make_topology(std::string deployment, std::string network, std::vector<Service> services);

/**
 * @brief Stable 64-bit fingerprint of everything that shapes an instance.
 * @details FNV-1a over image, network, ports, env (in order) and the health
 *          descriptor. Dependencies and build context are excluded: they do
 *          not change what runs.
 */
[[nodiscard]] std::uint64_t config_fingerprint(const Service& s) noexcept;

/// Fingerprint rendered as 16 lower-case hex digits (label value form).
[[nodiscard]] std::string fingerprint_hex(std::uint64_t fp);

} // namespace dockyard::lifecycle
