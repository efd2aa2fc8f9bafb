#pragma once
/**
 * @file route_table.hpp
 * @brief Immutable location-match table with deterministic precedence.
 *
 * Precedence, first hit wins:
 *   1. exact rules (if two exact rules share a path, the first declared wins),
 *   2. prefix rules, longest prefix first; equal lengths keep declaration order,
 *   3. regex rules (ECMAScript, search semantics) in declaration order,
 *   4. the catch-all prefix rule "/".
 * The catch-all is mandatory and is consulted last, so regex rules stay reachable
 * and every path that starts with '/' matches something.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dockyard/compat/expected.hpp"

namespace dockyard::routing {

/// How a route pattern is compared against the request path.
enum class MatchKind : std::uint8_t { Exact, Prefix, Regex };

[[nodiscard]] std::string_view to_string(MatchKind k) noexcept;

/// Fixed response served without touching any upstream or zone.
struct StaticResponse final {
    std::uint16_t status{200};
    std::string   body;

    bool operator==(const StaticResponse&) const = default;
};

/**
 * @brief One declared match rule.
 * @note For prefix rules a trailing '*' is accepted ("/api/*") and dropped.
 */
struct Route final {
    std::string                   pattern;
    MatchKind                     kind{MatchKind::Prefix};
    std::string                   group;   ///< Upstream group; unused by static routes
    std::string                   zone;    ///< Rate-limit zone; empty = not throttled
    std::optional<StaticResponse> static_response;

    [[nodiscard]] bool is_static() const noexcept { return static_response.has_value(); }

    bool operator==(const Route& o) const {
        return pattern == o.pattern && kind == o.kind && group == o.group &&
               zone == o.zone && static_response == o.static_response;
    }
};

/// Why a table was rejected.
enum class RouteErr : std::uint8_t {
    Empty,          ///< No routes declared
    NoCatchAll,     ///< Missing the "/" prefix fallback
    BadPattern,     ///< Exact/prefix pattern not starting with '/'
    BadRegex,       ///< Regex failed to compile
    MissingTarget   ///< Non-static route without an upstream group
};

struct RouteError final {
    RouteErr    code;
    std::string detail;
};

[[nodiscard]] std::string_view to_string(RouteErr e) noexcept;

/**
 * @class RouteTable
 * @brief Read-only after build(); safe for any number of concurrent match() calls.
 */
class RouteTable final {
public:
    /// Validate and index @p routes (declaration order is significant).
    [[nodiscard]] static dockyard_detail::expected<RouteTable, RouteError> build(std::vector<Route> routes);

    /**
     * @brief Find the winning route for a request target.
     * @param target Path, optionally followed by "?query" (ignored).
     * @return Winning route; nullptr only when @p target does not start with '/'.
     */
    [[nodiscard]] const Route* match(std::string_view target) const;

    /// Routes in declaration order.
    [[nodiscard]] const std::vector<Route>& routes() const noexcept { return routes_; }
    [[nodiscard]] std::size_t size() const noexcept { return routes_.size(); }

private:
    struct CompiledRegex {
        std::size_t index;
        std::regex  re;
    };

    /// Prefix form of a pattern: "/api/*" -> "/api/".
    static std::string_view literal_prefix(std::string_view pattern) noexcept;

    // Transparent hash/equal: match() looks up exact rules by string_view.
    struct PathHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct PathEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    std::vector<Route>                                            routes_;
    std::unordered_map<std::string, std::size_t, PathHash, PathEq> exact_;     ///< path -> route index
    std::vector<std::size_t>                                      prefixes_;  ///< longest first, stable; no "/"
    std::vector<CompiledRegex>                                    regexes_;   ///< declaration order
    std::size_t                                                   catch_all_{0};
};

} // namespace dockyard::routing
