/**
 * @file state_inspector.cpp
 * @brief StateInspector / NetworkProvisioner implementation.
 */
#include "dockyard/lifecycle/state_inspector.hpp"

#include <spdlog/spdlog.h>

namespace dockyard::lifecycle {

std::string_view to_string(RuntimeErrc e) noexcept {
    switch (e) {
        case RuntimeErrc::Unreachable:   return "unreachable";
        case RuntimeErrc::NotFound:      return "not found";
        case RuntimeErrc::Conflict:      return "conflict";
        case RuntimeErrc::CommandFailed: return "command failed";
    }
    return "unknown";
}

RuntimeResult<InstanceInfo> StateInspector::status(const std::string& name) const {
    auto info = rt_.inspect(name);
    if (!info && info.error().code == RuntimeErrc::NotFound) return InstanceInfo{};
    return info;
}

RuntimeResult<ServiceState> StateInspector::state(const std::string& name) const {
    auto info = status(name);
    if (!info) return dockyard_detail::unexpected<RuntimeError>(std::move(info.error()));
    return info->state;
}

RuntimeResult<Network> NetworkProvisioner::ensure_network(const std::string& name, bool dry_run) {
    auto info = rt_.inspect_network(name);
    if (!info) return dockyard_detail::unexpected<RuntimeError>(std::move(info.error()));
    if (info->exists) {
        spdlog::info("Network already exists: {}", name);
        return Network{name, false};
    }
    if (dry_run) {
        spdlog::info("[DRY RUN] would create network {}", name);
        return Network{name, true};
    }
    auto made = rt_.create_network(name);
    // Lost a race with another creator: the network is there, which is all we need.
    if (!made && made.error().code != RuntimeErrc::Conflict) {
        return dockyard_detail::unexpected<RuntimeError>(std::move(made.error()));
    }
    spdlog::info("Network created: {}", name);
    return Network{name, true};
}

RuntimeResult<NetworkRelease> NetworkProvisioner::release_network(const std::string& name,
                                                                  bool dry_run,
                                                                  std::size_t detaching) {
    auto info = rt_.inspect_network(name);
    if (!info) return dockyard_detail::unexpected<RuntimeError>(std::move(info.error()));
    if (!info->exists) {
        spdlog::debug("Network not found (skipping): {}", name);
        return NetworkRelease::Missing;
    }
    std::size_t remaining = info->attached;
    if (dry_run) remaining = remaining > detaching ? remaining - detaching : 0;
    if (remaining > 0) {
        spdlog::warn("Network {} still has {} attached instance(s); leaving it", name, remaining);
        return NetworkRelease::InUse;
    }
    if (dry_run) return NetworkRelease::Planned;

    auto gone = rt_.remove_network(name);
    if (!gone) {
        if (gone.error().code == RuntimeErrc::NotFound) return NetworkRelease::Missing;
        return dockyard_detail::unexpected<RuntimeError>(std::move(gone.error()));
    }
    spdlog::info("Removed network: {}", name);
    return NetworkRelease::Removed;
}

} // namespace dockyard::lifecycle
