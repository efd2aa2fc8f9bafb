#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON deployment file -> DeployConfig (topology inputs + proxy routing).
 * @details Every omitted field falls back to a named default in constants.hpp.
 *          With no file the bundled notes stack is returned.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "dockyard/compat/expected.hpp"
#include "dockyard/lifecycle/service.hpp"
#include "dockyard/routing/rate_limiter.hpp"
#include "dockyard/routing/route_table.hpp"
#include "dockyard/routing/upstream_pool.hpp"

namespace dockyard::config {

    /** @struct ProxyConfig
     *  @brief Declarative routing surface of the reverse proxy.
     */
    struct ProxyConfig {
        std::string                                 service;  ///< Service fronting the routes (for entrypoint listing)
        std::vector<dockyard::routing::Route>       routes;  ///< Declaration order is significant
        std::vector<dockyard::routing::ZoneConfig>  zones;
        std::vector<dockyard::routing::GroupConfig> groups;
    };

    /** @struct DeployConfig
     *  @brief Aggregate handed to the orchestrator and the proxy components.
     */
    struct DeployConfig {
        std::string                             deployment;
        std::string                             network;
        std::vector<dockyard::lifecycle::Service> services;  ///< Unresolved ${svc.*} references
        ProxyConfig                             proxy;
    };

    /// Which stage rejected the input.
    enum class ConfigErr : std::uint8_t {
        Io,        ///< File missing or unreadable
        Parse,     ///< Not valid JSON
        Schema,    ///< Wrong field type, missing required field, out-of-range value
        Topology,  ///< Services failed make_topology()
        Proxy      ///< Routes/zones/groups inconsistent
    };

    struct ConfigError {
        ConfigErr   code;
        std::string detail;
    };

    [[nodiscard]] std::string_view to_string(ConfigErr e) noexcept;

    /** @class Loader
     *  @brief Source of deployment configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Built-in notes stack: postgres-db -> backend -> frontend -> nginx-proxy.
        static DeployConfig defaults();

        /// Default proxy routing for the notes stack.
        static ProxyConfig default_proxy();

        /**
         * @brief Read and validate a JSON deployment file.
         * @param path File path; an empty path yields defaults().
         */
        static dockyard_detail::expected<DeployConfig, ConfigError> load_from_file(const std::string& path);

        /// Parse a JSON document held in memory.
        static dockyard_detail::expected<DeployConfig, ConfigError> parse(std::string_view text);

        /// Validated topology for @p cfg.
        static dockyard_detail::expected<dockyard::lifecycle::Topology, ConfigError>
        topology(const DeployConfig& cfg);

        /// Cross-check routes against declared zones and groups.
        static dockyard_detail::expected<void, ConfigError> validate_proxy(const ProxyConfig& proxy);
    };

} // namespace dockyard::config
