#pragma once
/**
 * @file runtime.hpp
 * @brief Narrow capability set the lifecycle core needs from a container runtime.
 * @details The orchestrator depends on nothing else; tests substitute a fake,
 *          production wires docker_runtime.hpp.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/lifecycle/service.hpp"

namespace dockyard::lifecycle {

/// Failure classes reported by a runtime backend.
enum class RuntimeErrc : std::uint8_t {
    Unreachable,    ///< Backend not installed / daemon down. Always fatal.
    NotFound,       ///< Named object does not exist
    Conflict,       ///< Object already exists / is in use
    CommandFailed   ///< Backend rejected the request for any other reason
};

struct RuntimeError final {
    RuntimeErrc code{RuntimeErrc::CommandFailed};
    std::string detail;
};

[[nodiscard]] std::string_view to_string(RuntimeErrc e) noexcept;

/// Inspection result for one instance.
struct InstanceInfo final {
    ServiceState state{ServiceState::Absent};
    bool         health_pending{false}; ///< Health check declared but not yet decided
    std::string  config_hash;           ///< Fingerprint label stored at create time
};

/// Inspection result for a network.
struct NetworkInfo final {
    bool        exists{false};
    std::size_t attached{0};  ///< Instances currently attached
};

/// Everything a runtime needs to create an instance.
struct CreateSpec final {
    Service     service;
    std::string deployment;   ///< Deployment label value
    std::string config_hash;  ///< Fingerprint label value
};

template <class T>
using RuntimeResult = dockyard_detail::expected<T, RuntimeError>;

/// Tag type for operations that return nothing on success.
struct Done final {};

/**
 * @class Runtime
 * @brief Container runtime collaborator.
 *
 * Every call is synchronous. Mutating calls are create/start/stop/remove and
 * create_network/remove_network; everything else is a pure query.
 */
class Runtime {
public:
    virtual ~Runtime() = default;

    /// Reachability check; Unreachable when the backend cannot be used at all.
    virtual RuntimeResult<Done> ping() = 0;

    virtual RuntimeResult<Done> create(const CreateSpec& spec) = 0;
    virtual RuntimeResult<Done> start(const std::string& name) = 0;
    virtual RuntimeResult<Done> stop(const std::string& name) = 0;
    virtual RuntimeResult<Done> remove(const std::string& name) = 0;
    virtual RuntimeResult<InstanceInfo> inspect(const std::string& name) = 0;

    virtual RuntimeResult<Done> create_network(const std::string& name) = 0;
    virtual RuntimeResult<Done> remove_network(const std::string& name) = 0;
    virtual RuntimeResult<NetworkInfo> inspect_network(const std::string& name) = 0;
};

/**
 * @class ArtifactBuilder
 * @brief Image build collaborator (kept separate: building is not reconciliation).
 */
class ArtifactBuilder {
public:
    virtual ~ArtifactBuilder() = default;

    /// Build @p image from @p context (a directory).
    virtual RuntimeResult<Done> build(const std::string& image, const std::string& context) = 0;
};

} // namespace dockyard::lifecycle
