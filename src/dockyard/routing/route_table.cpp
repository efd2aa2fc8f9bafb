/**
 * @file route_table.cpp
 * @brief RouteTable validation, indexing and lookup.
 */
#include "dockyard/routing/route_table.hpp"

#include <algorithm>

namespace dockyard::routing {

std::string_view to_string(MatchKind k) noexcept {
    switch (k) {
        case MatchKind::Exact:  return "exact";
        case MatchKind::Prefix: return "prefix";
        case MatchKind::Regex:  return "regex";
    }
    return "unknown";
}

std::string_view to_string(RouteErr e) noexcept {
    switch (e) {
        case RouteErr::Empty:         return "no routes";
        case RouteErr::NoCatchAll:    return "missing catch-all prefix route '/'";
        case RouteErr::BadPattern:    return "pattern must start with '/'";
        case RouteErr::BadRegex:      return "invalid regex";
        case RouteErr::MissingTarget: return "route has neither upstream group nor static response";
    }
    return "unknown";
}

std::string_view RouteTable::literal_prefix(std::string_view pattern) noexcept {
    if (!pattern.empty() && pattern.back() == '*') pattern.remove_suffix(1);
    return pattern;
}

dockyard_detail::expected<RouteTable, RouteError> RouteTable::build(std::vector<Route> routes) {
    using Unexpected = dockyard_detail::unexpected<RouteError>;
    if (routes.empty()) return Unexpected(RouteError{RouteErr::Empty, {}});

    RouteTable t;
    bool catch_all = false;
    for (std::size_t i = 0; i < routes.size(); ++i) {
        const Route& r = routes[i];
        if (!r.is_static() && r.group.empty()) return Unexpected(RouteError{RouteErr::MissingTarget, r.pattern});

        switch (r.kind) {
            case MatchKind::Exact:
                if (r.pattern.empty() || r.pattern.front() != '/') {
                    return Unexpected(RouteError{RouteErr::BadPattern, r.pattern});
                }
                t.exact_.emplace(r.pattern, i);  // keeps the first declaration
                break;
            case MatchKind::Prefix: {
                const auto lit = literal_prefix(r.pattern);
                if (lit.empty() || lit.front() != '/') {
                    return Unexpected(RouteError{RouteErr::BadPattern, r.pattern});
                }
                if (lit == "/") {
                    if (!catch_all) t.catch_all_ = i;
                    catch_all = true;
                } else {
                    t.prefixes_.push_back(i);
                }
                break;
            }
            case MatchKind::Regex:
                try {
                    t.regexes_.push_back({i, std::regex(r.pattern, std::regex::ECMAScript | std::regex::optimize)});
                } catch (const std::regex_error& e) {
                    return Unexpected(RouteError{RouteErr::BadRegex, r.pattern + ": " + e.what()});
                }
                break;
        }
    }
    if (!catch_all) return Unexpected(RouteError{RouteErr::NoCatchAll, {}});

    // Longest literal first; stable_sort keeps declaration order among equals.
    std::stable_sort(t.prefixes_.begin(), t.prefixes_.end(), [&](std::size_t a, std::size_t b) {
        return literal_prefix(routes[a].pattern).size() > literal_prefix(routes[b].pattern).size();
    });

    t.routes_ = std::move(routes);
    return t;
}

const Route* RouteTable::match(std::string_view target) const {
    const auto q = target.find_first_of("?#");
    const std::string_view path = q == std::string_view::npos ? target : target.substr(0, q);
    if (path.empty() || path.front() != '/') return nullptr;

    if (const auto it = exact_.find(path); it != exact_.end()) return &routes_[it->second];

    for (std::size_t idx : prefixes_) {
        const auto lit = literal_prefix(routes_[idx].pattern);
        if (path.substr(0, lit.size()) == lit) return &routes_[idx];
    }

    for (const auto& cr : regexes_) {
        if (std::regex_search(path.begin(), path.end(), cr.re)) return &routes_[cr.index];
    }
    return &routes_[catch_all_];
}

} // namespace dockyard::routing
