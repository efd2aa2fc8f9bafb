/**
 * @file service.cpp
 * @brief Topology validation, start ordering, peer-reference expansion, fingerprints.
 */
#include "dockyard/lifecycle/service.hpp"

#include <algorithm>
#include <cstdio>
#include <unordered_map>
#include <unordered_set>

namespace dockyard::lifecycle {

bool is_valid_transition(ServiceState from, ServiceState to) noexcept {
    switch (from) {
        case ServiceState::Absent:    return to == ServiceState::Running;
        case ServiceState::Running:   return to == ServiceState::Stopped || to == ServiceState::Unhealthy;
        case ServiceState::Stopped:   return to == ServiceState::Running || to == ServiceState::Absent;
        case ServiceState::Unhealthy: return to == ServiceState::Stopped || to == ServiceState::Running;
    }
    return false;
}

std::string_view to_string(ServiceState s) noexcept {
    switch (s) {
        case ServiceState::Absent:    return "absent";
        case ServiceState::Stopped:   return "stopped";
        case ServiceState::Running:   return "running";
        case ServiceState::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

std::string_view to_string(TopologyErr e) noexcept {
    switch (e) {
        case TopologyErr::Empty:             return "empty topology";
        case TopologyErr::InvalidName:       return "invalid name";
        case TopologyErr::DuplicateService:  return "duplicate service";
        case TopologyErr::UnknownDependency: return "unknown dependency";
        case TopologyErr::Cycle:             return "dependency cycle";
        case TopologyErr::UnknownReference:  return "unknown service reference";
        case TopologyErr::BadReference:      return "malformed reference";
    }
    return "unknown";
}

const Service* Topology::find(std::string_view name) const noexcept {
    for (const auto& s : services_) if (s.name == name) return &s;
    return nullptr;
}

namespace {

using TopoResult = dockyard_detail::expected<Topology, TopologyError>;

TopoResult fail(TopologyErr code, std::string detail) {
    return dockyard_detail::unexpected<TopologyError>(TopologyError{code, std::move(detail)});
}

// Container runtimes accept [a-zA-Z0-9][a-zA-Z0-9_.-]*
bool valid_name(std::string_view n) noexcept {
    if (n.empty()) return false;
    auto alnum = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    };
    if (!alnum(n.front())) return false;
    return std::all_of(n.begin(), n.end(), [&](char c) {
        return alnum(c) || c == '_' || c == '.' || c == '-';
    });
}

// Expand ${svc.host} / ${svc.port}. Anything outside a placeholder is copied.
dockyard_detail::expected<std::string, TopologyError>
expand_refs(const std::string& value,
            const std::unordered_map<std::string_view, const Service*>& by_name) {
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    while (pos < value.size()) {
        const auto open = value.find("${", pos);
        if (open == std::string::npos) { out.append(value, pos, std::string::npos); break; }
        out.append(value, pos, open - pos);
        const auto close = value.find('}', open + 2);
        if (close == std::string::npos) {
            return dockyard_detail::unexpected<TopologyError>(
                TopologyError{TopologyErr::BadReference, value});
        }
        const std::string_view ref(value.data() + open + 2, close - open - 2);
        const auto dot = ref.rfind('.');
        if (dot == std::string_view::npos) {
            return dockyard_detail::unexpected<TopologyError>(
                TopologyError{TopologyErr::BadReference, std::string(ref)});
        }
        const auto svc  = ref.substr(0, dot);
        const auto attr = ref.substr(dot + 1);
        const auto it = by_name.find(svc);
        if (it == by_name.end()) {
            return dockyard_detail::unexpected<TopologyError>(
                TopologyError{TopologyErr::UnknownReference, std::string(svc)});
        }
        if (attr == "host")      out += it->second->name;
        else if (attr == "port") out += std::to_string(it->second->port.container);
        else {
            return dockyard_detail::unexpected<TopologyError>(
                TopologyError{TopologyErr::BadReference, std::string(ref)});
        }
        pos = close + 1;
    }
    return out;
}

} // namespace

struct TopologyBuilder {
    static Topology assemble(std::string deployment, std::string network,
                             std::vector<Service> services, std::vector<std::string> order) {
        Topology t;
        t.deployment_ = std::move(deployment);
        t.network_    = std::move(network);
        t.services_   = std::move(services);
        t.order_      = std::move(order);
        return t;
    }
};

TopoResult make_topology(std::string deployment, std::string network, std::vector<Service> services) {
    if (services.empty()) return fail(TopologyErr::Empty, deployment);
    if (!valid_name(network)) return fail(TopologyErr::InvalidName, network);

    std::unordered_map<std::string_view, const Service*> by_name;
    for (const auto& s : services) {
        if (!valid_name(s.name)) return fail(TopologyErr::InvalidName, s.name);
        if (!by_name.emplace(s.name, &s).second) return fail(TopologyErr::DuplicateService, s.name);
    }
    for (const auto& s : services) {
        for (const auto& d : s.depends_on) {
            if (!by_name.count(d)) return fail(TopologyErr::UnknownDependency, s.name + " -> " + d);
        }
    }

    // Kahn's algorithm; at every step take the earliest-declared ready service
    // so independent services keep their declaration order.
    std::vector<std::string> order;
    order.reserve(services.size());
    std::unordered_set<std::string_view> placed;
    while (order.size() < services.size()) {
        const Service* next = nullptr;
        for (const auto& s : services) {
            if (placed.count(s.name)) continue;
            const bool ready = std::all_of(s.depends_on.begin(), s.depends_on.end(),
                                           [&](const std::string& d) { return placed.count(d) > 0; });
            if (ready) { next = &s; break; }
        }
        if (!next) {
            std::string stuck;
            for (const auto& s : services) {
                if (placed.count(s.name)) continue;
                if (!stuck.empty()) stuck += ", ";
                stuck += s.name;
            }
            return fail(TopologyErr::Cycle, stuck);
        }
        placed.insert(next->name);
        order.push_back(next->name);
    }

    // Expand peer references against the declared set, then pin the network.
    std::vector<Service> resolved = services;
    for (auto& s : resolved) {
        for (auto& [key, value] : s.env) {
            auto expanded = expand_refs(value, by_name);
            if (!expanded) return dockyard_detail::unexpected<TopologyError>(std::move(expanded.error()));
            value = std::move(*expanded);
        }
        s.network = network;
    }

    return TopologyBuilder::assemble(std::move(deployment), std::move(network),
                                     std::move(resolved), std::move(order));
}

namespace {

constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME  = 0x100000001b3ULL;

void fnv_mix(std::uint64_t& h, std::string_view bytes) noexcept {
    for (unsigned char c : bytes) { h ^= c; h *= FNV_PRIME; }
    // Field separator so ("ab","c") and ("a","bc") differ.
    h ^= 0xffu; h *= FNV_PRIME;
}

void fnv_mix(std::uint64_t& h, std::uint64_t v) noexcept {
    for (int i = 0; i < 8; ++i) { h ^= (v >> (i * 8)) & 0xffu; h *= FNV_PRIME; }
}

} // namespace

std::uint64_t config_fingerprint(const Service& s) noexcept {
    std::uint64_t h = FNV_OFFSET;
    fnv_mix(h, s.image);
    fnv_mix(h, s.network);
    fnv_mix(h, static_cast<std::uint64_t>(s.port.host));
    fnv_mix(h, static_cast<std::uint64_t>(s.port.container));
    fnv_mix(h, static_cast<std::uint64_t>(s.env.size()));
    for (const auto& [k, v] : s.env) { fnv_mix(h, k); fnv_mix(h, v); }
    fnv_mix(h, s.health.command);
    fnv_mix(h, static_cast<std::uint64_t>(s.health.interval.count()));
    fnv_mix(h, static_cast<std::uint64_t>(s.health.timeout.count()));
    fnv_mix(h, static_cast<std::uint64_t>(s.health.retries));
    fnv_mix(h, static_cast<std::uint64_t>(s.health.start_period.count()));
    return h;
}

std::string fingerprint_hex(std::uint64_t fp) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fp));
    return std::string(buf, 16);
}

} // namespace dockyard::lifecycle
