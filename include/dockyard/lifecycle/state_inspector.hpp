#pragma once
/**
 * @file state_inspector.hpp
 * @brief State Inspector and Network Provisioner: the only query/mutation points
 *        the orchestrator uses to observe the runtime and manage the shared network.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "dockyard/lifecycle/runtime.hpp"

namespace dockyard::lifecycle {

/**
 * @class StateInspector
 * @brief Single authoritative state read per reconciliation step.
 */
class StateInspector final {
public:
    explicit StateInspector(Runtime& rt) noexcept : rt_(rt) {}

    /// Current state of @p name. A NotFound answer from the backend reads as Absent.
    [[nodiscard]] RuntimeResult<InstanceInfo> status(const std::string& name) const;

    /// Convenience: state only.
    [[nodiscard]] RuntimeResult<ServiceState> state(const std::string& name) const;

private:
    Runtime& rt_;
};

/// What release_network() did.
enum class NetworkRelease : std::uint8_t {
    Removed,  ///< Network existed, was unreferenced, and is gone
    InUse,    ///< Network still has attached instances; left in place
    Missing,  ///< Nothing to remove
    Planned   ///< Dry run: would be removed
};

/**
 * @class NetworkProvisioner
 * @brief Ensures the deployment network exists before any service is created.
 */
class NetworkProvisioner final {
public:
    explicit NetworkProvisioner(Runtime& rt) noexcept : rt_(rt) {}

    /**
     * @brief Create @p name unless it already exists.
     * @param dry_run When true no mutating call is issued; Network::created reports
     *        whether a create would have happened.
     */
    [[nodiscard]] RuntimeResult<Network> ensure_network(const std::string& name, bool dry_run = false);

    /**
     * @brief Remove @p name if no instance is attached to it.
     * @param detaching Dry run only: attached instances the caller would have
     *        removed first, discounted from the attachment count.
     */
    [[nodiscard]] RuntimeResult<NetworkRelease> release_network(const std::string& name,
                                                                bool dry_run = false,
                                                                std::size_t detaching = 0);

private:
    Runtime& rt_;
};

} // namespace dockyard::lifecycle
