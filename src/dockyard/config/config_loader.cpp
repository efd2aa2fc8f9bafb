/**
 * @file config_loader.cpp
 * @brief nlohmann::json-backed loader; json exceptions stop at this boundary.
 */
#include "dockyard/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dockyard/config/constants.hpp"

namespace dockyard::config {
    using namespace dockyard::lifecycle;
    using namespace dockyard::routing;
    using namespace dockyard::config::constants;
    using json = nlohmann::json;

    namespace {

    /// Thrown inside this file only; converted to ConfigErr::Schema by parse().
    struct SchemaError {
        std::string what;
    };

    const json* field(const json& j, const char* key) {
        const auto it = j.find(key);
        return it == j.end() || it->is_null() ? nullptr : &*it;
    }

    std::string req_string(const json& j, const char* key, const std::string& where) {
        const json* v = field(j, key);
        if (!v) throw SchemaError{where + ": missing \"" + key + "\""};
        if (!v->is_string()) throw SchemaError{where + ": \"" + key + "\" must be a string"};
        return v->get<std::string>();
    }

    std::string opt_string(const json& j, const char* key, std::string def) {
        const json* v = field(j, key);
        return v ? v->get<std::string>() : std::move(def);
    }

    /// Non-negative integer within [0, max].
    std::uint64_t opt_uint(const json& j, const char* key, std::uint64_t def, std::uint64_t max,
                           const std::string& where) {
        const json* v = field(j, key);
        if (!v) return def;
        if (!v->is_number_unsigned()) {
            throw SchemaError{where + ": \"" + key + "\" must be a non-negative integer"};
        }
        const auto n = v->get<std::uint64_t>();
        if (n > max) throw SchemaError{where + ": \"" + key + "\" out of range"};
        return n;
    }

    std::chrono::milliseconds opt_ms(const json& j, const char* key, std::uint32_t def, const std::string& where) {
        return std::chrono::milliseconds(opt_uint(j, key, def, std::numeric_limits<std::uint32_t>::max(), where));
    }

    /// Like opt_ms() but 0 is refused: these values pace loops or bound waits.
    std::chrono::milliseconds opt_positive_ms(const json& j, const char* key, std::uint32_t def,
                                              const std::string& where) {
        const auto ms = opt_ms(j, key, def, where);
        if (ms.count() == 0) throw SchemaError{where + ": \"" + key + "\" must be > 0"};
        return ms;
    }

    std::uint16_t opt_port(const json& j, const char* key, const std::string& where) {
        return static_cast<std::uint16_t>(opt_uint(j, key, 0, 65535, where));
    }

    double req_positive(const json& j, const char* key, double def, const std::string& where) {
        const json* v = field(j, key);
        if (!v) return def;
        if (!v->is_number()) throw SchemaError{where + ": \"" + key + "\" must be a number"};
        const double d = v->get<double>();
        if (!(d > 0.0)) throw SchemaError{where + ": \"" + key + "\" must be > 0"};
        return d;
    }

    const json& req_array(const json& j, const char* key, const std::string& where) {
        const json* v = field(j, key);
        if (!v || !v->is_array()) throw SchemaError{where + ": \"" + key + "\" must be an array"};
        return *v;
    }

    Service parse_service(const json& j, std::size_t idx) {
        std::string where = "services[" + std::to_string(idx) + "]";
        if (!j.is_object()) throw SchemaError{where + ": must be an object"};
        Service s;
        s.name = req_string(j, "name", where);
        where += " (" + s.name + ")";
        s.image         = req_string(j, "image", where);
        s.build_context = opt_string(j, "build_context", {});
        if (const json* deps = field(j, "depends_on")) {
            if (!deps->is_array()) throw SchemaError{where + ": \"depends_on\" must be an array"};
            for (const auto& d : *deps) s.depends_on.push_back(d.get<std::string>());
        }
        if (const json* ports = field(j, "ports")) {
            s.port.host      = opt_port(*ports, "host", where);
            s.port.container = opt_port(*ports, "container", where);
        }
        if (const json* env = field(j, "env")) {
            if (!env->is_object()) throw SchemaError{where + ": \"env\" must be an object"};
            for (const auto& [k, v] : env->items()) {
                if (!v.is_string()) throw SchemaError{where + ": env \"" + k + "\" must be a string"};
                s.env.emplace_back(k, v.get<std::string>());
            }
        }
        if (const json* h = field(j, "health")) {
            s.health.command      = opt_string(*h, "command", {});
            s.health.interval     = opt_positive_ms(*h, "interval_ms", HEALTH_INTERVAL_MS, where);
            s.health.timeout      = opt_positive_ms(*h, "timeout_ms", HEALTH_TIMEOUT_MS, where);
            s.health.retries      = static_cast<std::uint32_t>(
                opt_uint(*h, "retries", HEALTH_RETRIES, std::numeric_limits<std::uint32_t>::max(), where));
            s.health.start_period = opt_ms(*h, "start_period_ms", HEALTH_START_PERIOD_MS, where);
        }
        return s;
    }

    MatchKind parse_kind(const std::string& k, const std::string& where) {
        if (k == "exact")  return MatchKind::Exact;
        if (k == "prefix") return MatchKind::Prefix;
        if (k == "regex")  return MatchKind::Regex;
        throw SchemaError{where + ": unknown route kind \"" + k + "\""};
    }

    Route parse_route(const json& j, std::size_t idx) {
        const std::string where = "proxy.routes[" + std::to_string(idx) + "]";
        if (!j.is_object()) throw SchemaError{where + ": must be an object"};
        Route r;
        r.pattern = req_string(j, "pattern", where);
        r.kind    = parse_kind(opt_string(j, "kind", "prefix"), where);
        r.group   = opt_string(j, "group", {});
        r.zone    = opt_string(j, "zone", {});
        if (const json* st = field(j, "static")) {
            StaticResponse resp;
            resp.status = static_cast<std::uint16_t>(opt_uint(*st, "status", LIVENESS_STATUS, 599, where));
            resp.body   = opt_string(*st, "body", {});
            r.static_response = std::move(resp);
        }
        return r;
    }

    ZoneConfig parse_zone(const json& j, std::size_t idx) {
        const std::string where = "proxy.zones[" + std::to_string(idx) + "]";
        if (!j.is_object()) throw SchemaError{where + ": must be an object"};
        ZoneConfig z;
        z.name       = req_string(j, "name", where);
        z.rate       = req_positive(j, "rate", ZONE_GENERAL_RATE, where);
        z.burst      = req_positive(j, "burst", ZONE_GENERAL_BURST, where);
        z.key        = opt_string(j, "key", ZONE_KEY_CLIENT);
        z.idle_evict = opt_positive_ms(j, "idle_evict_ms", ZONE_IDLE_EVICT_MS, where);
        z.max_keys   = static_cast<std::size_t>(
            opt_uint(j, "max_keys", 0, std::numeric_limits<std::uint32_t>::max(), where));
        return z;
    }

    GroupConfig parse_group(const json& j, std::size_t idx) {
        const std::string where = "proxy.groups[" + std::to_string(idx) + "]";
        if (!j.is_object()) throw SchemaError{where + ": must be an object"};
        constexpr std::uint64_t U32 = std::numeric_limits<std::uint32_t>::max();
        GroupConfig g;
        g.name = req_string(j, "name", where);
        for (const auto& m : req_array(j, "members", where)) g.members.push_back(m.get<std::string>());
        g.keepalive          = static_cast<std::uint32_t>(opt_uint(j, "keepalive", UPSTREAM_KEEPALIVE, U32, where));
        g.rise               = static_cast<std::uint32_t>(opt_uint(j, "rise", UPSTREAM_RISE, U32, where));
        g.fall               = static_cast<std::uint32_t>(opt_uint(j, "fall", UPSTREAM_FALL, U32, where));
        g.connect_timeout    = opt_positive_ms(j, "connect_timeout_ms", UPSTREAM_CONNECT_TIMEOUT_MS, where);
        g.request_timeout    = opt_positive_ms(j, "request_timeout_ms", UPSTREAM_REQUEST_TIMEOUT_MS, where);
        if (const json* p = field(j, "probe")) {
            g.probe_interval = opt_positive_ms(*p, "interval_ms", PROBE_INTERVAL_MS, where);
            g.probe_timeout  = opt_positive_ms(*p, "timeout_ms", PROBE_TIMEOUT_MS, where);
        }
        return g;
    }

    DeployConfig build_config(const json& root) {
        if (!root.is_object()) throw SchemaError{"top level must be an object"};
        DeployConfig cfg = Loader::defaults();
        cfg.deployment = opt_string(root, "deployment", cfg.deployment);
        cfg.network    = opt_string(root, "network", cfg.network);

        if (const json* svcs = field(root, "services")) {
            if (!svcs->is_array()) throw SchemaError{"\"services\" must be an array"};
            cfg.services.clear();
            for (std::size_t i = 0; i < svcs->size(); ++i) cfg.services.push_back(parse_service((*svcs)[i], i));
        }

        if (const json* proxy = field(root, "proxy")) {
            if (!proxy->is_object()) throw SchemaError{"\"proxy\" must be an object"};
            cfg.proxy.service = opt_string(*proxy, "service", cfg.proxy.service);
            // A section left out keeps its default; a present one replaces it wholesale.
            if (const json* routes = field(*proxy, "routes")) {
                if (!routes->is_array()) throw SchemaError{"proxy.routes must be an array"};
                cfg.proxy.routes.clear();
                for (std::size_t i = 0; i < routes->size(); ++i) cfg.proxy.routes.push_back(parse_route((*routes)[i], i));
            }
            if (const json* zones = field(*proxy, "zones")) {
                if (!zones->is_array()) throw SchemaError{"proxy.zones must be an array"};
                cfg.proxy.zones.clear();
                for (std::size_t i = 0; i < zones->size(); ++i) cfg.proxy.zones.push_back(parse_zone((*zones)[i], i));
            }
            if (const json* groups = field(*proxy, "groups")) {
                if (!groups->is_array()) throw SchemaError{"proxy.groups must be an array"};
                cfg.proxy.groups.clear();
                for (std::size_t i = 0; i < groups->size(); ++i) cfg.proxy.groups.push_back(parse_group((*groups)[i], i));
            }
        }
        return cfg;
    }

    std::string ref(const char* svc, const char* part) {
        return std::string("${") + svc + "." + part + "}";
    }

    } // namespace

    std::string_view to_string(ConfigErr e) noexcept {
        switch (e) {
            case ConfigErr::Io:       return "io";
            case ConfigErr::Parse:    return "parse";
            case ConfigErr::Schema:   return "schema";
            case ConfigErr::Topology: return "topology";
            case ConfigErr::Proxy:    return "proxy";
        }
        return "unknown";
    }

    DeployConfig Loader::defaults() {
        DeployConfig cfg;
        cfg.deployment = DEPLOYMENT_NAME;
        cfg.network    = NETWORK_NAME;

        Service db;
        db.name  = POSTGRES_NAME;
        db.image = POSTGRES_IMAGE;
        db.port  = {POSTGRES_PORT, POSTGRES_PORT};
        db.env   = {{"POSTGRES_DB", POSTGRES_DB},
                    {"POSTGRES_USER", POSTGRES_USER},
                    {"POSTGRES_PASSWORD", POSTGRES_PASSWORD}};
        db.health.command = POSTGRES_HEALTH_CMD;

        Service backend;
        backend.name          = BACKEND_NAME;
        backend.image         = BACKEND_IMAGE;
        backend.build_context = BACKEND_CONTEXT;
        backend.depends_on    = {POSTGRES_NAME};
        backend.port          = {BACKEND_PORT, BACKEND_PORT};
        backend.env = {{"DB_HOST", ref(POSTGRES_NAME, "host")},
                       {"DB_PORT", ref(POSTGRES_NAME, "port")},
                       {"DB_NAME", POSTGRES_DB},
                       {"DB_USERNAME", POSTGRES_USER},
                       {"DB_PASSWORD", POSTGRES_PASSWORD},
                       {"PORT", std::to_string(BACKEND_PORT)},
                       {"NODE_ENV", "production"}};

        Service frontend;
        frontend.name          = FRONTEND_NAME;
        frontend.image         = FRONTEND_IMAGE;
        frontend.build_context = FRONTEND_CONTEXT;
        frontend.depends_on    = {BACKEND_NAME};
        frontend.port          = {FRONTEND_PORT, FRONTEND_PORT};
        frontend.env = {{"NEXT_PUBLIC_API_URL",
                         "http://" + ref(PROXY_NAME, "host") + ":" + ref(PROXY_NAME, "port") + "/api"},
                        {"PORT", std::to_string(FRONTEND_PORT)}};

        Service proxy;
        proxy.name          = PROXY_NAME;
        proxy.image         = PROXY_IMAGE;
        proxy.build_context = PROXY_CONTEXT;
        proxy.depends_on    = {BACKEND_NAME, FRONTEND_NAME};
        proxy.port          = {PROXY_HOST_PORT, PROXY_CONTAINER_PORT};

        cfg.services = {std::move(db), std::move(backend), std::move(frontend), std::move(proxy)};
        cfg.proxy    = default_proxy();
        return cfg;
    }

    ProxyConfig Loader::default_proxy() {
        ProxyConfig p;
        p.service = PROXY_NAME;

        Route liveness;
        liveness.pattern         = LIVENESS_PATH;
        liveness.kind            = MatchKind::Exact;
        liveness.static_response = StaticResponse{LIVENESS_STATUS, LIVENESS_BODY};

        Route health;
        health.pattern = "/health";
        health.kind    = MatchKind::Exact;
        health.group   = BACKEND_NAME;

        Route api;
        api.pattern = "/api/*";
        api.kind    = MatchKind::Prefix;
        api.group   = BACKEND_NAME;
        api.zone    = ZONE_API_NAME;

        Route root;
        root.pattern = "/";
        root.kind    = MatchKind::Prefix;
        root.group   = FRONTEND_NAME;
        root.zone    = ZONE_GENERAL_NAME;

        p.routes = {std::move(liveness), std::move(health), std::move(api), std::move(root)};

        ZoneConfig zapi;
        zapi.name  = ZONE_API_NAME;
        zapi.rate  = ZONE_API_RATE;
        zapi.burst = ZONE_API_BURST;
        ZoneConfig zgen;
        zgen.name  = ZONE_GENERAL_NAME;
        zgen.rate  = ZONE_GENERAL_RATE;
        zgen.burst = ZONE_GENERAL_BURST;
        p.zones = {std::move(zapi), std::move(zgen)};

        GroupConfig gb;
        gb.name    = BACKEND_NAME;
        gb.members = {std::string(BACKEND_NAME) + ":" + std::to_string(BACKEND_PORT)};
        GroupConfig gf;
        gf.name    = FRONTEND_NAME;
        gf.members = {std::string(FRONTEND_NAME) + ":" + std::to_string(FRONTEND_PORT)};
        p.groups = {std::move(gb), std::move(gf)};
        return p;
    }

    dockyard_detail::expected<DeployConfig, ConfigError> Loader::parse(std::string_view text) {
        using Unexpected = dockyard_detail::unexpected<ConfigError>;
        DeployConfig cfg;
        try {
            cfg = build_config(json::parse(text.begin(), text.end()));
        } catch (const json::parse_error& e) {
            return Unexpected(ConfigError{ConfigErr::Parse, e.what()});
        } catch (const json::exception& e) {
            return Unexpected(ConfigError{ConfigErr::Schema, e.what()});
        } catch (const SchemaError& e) {
            return Unexpected(ConfigError{ConfigErr::Schema, e.what});
        }

        if (auto topo = topology(cfg); !topo) return Unexpected(std::move(topo.error()));
        if (auto ok = validate_proxy(cfg.proxy); !ok) return Unexpected(std::move(ok.error()));
        return cfg;
    }

    dockyard_detail::expected<DeployConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return defaults();
        std::ifstream in(path);
        if (!in) {
            return dockyard_detail::unexpected<ConfigError>(ConfigError{ConfigErr::Io, "cannot open " + path});
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        spdlog::debug("config: loaded {} ({} bytes)", path, buf.str().size());
        return parse(buf.str());
    }

    dockyard_detail::expected<Topology, ConfigError> Loader::topology(const DeployConfig& cfg) {
        auto topo = make_topology(cfg.deployment, cfg.network, cfg.services);
        if (!topo) {
            std::string detail(lifecycle::to_string(topo.error().code));
            if (!topo.error().detail.empty()) detail += ": " + topo.error().detail;
            return dockyard_detail::unexpected<ConfigError>(ConfigError{ConfigErr::Topology, std::move(detail)});
        }
        return std::move(*topo);
    }

    dockyard_detail::expected<void, ConfigError> Loader::validate_proxy(const ProxyConfig& proxy) {
        using Unexpected = dockyard_detail::unexpected<ConfigError>;
        const auto fail = [](std::string detail) { return Unexpected(ConfigError{ConfigErr::Proxy, std::move(detail)}); };

        if (auto table = RouteTable::build(proxy.routes); !table) {
            std::string detail(routing::to_string(table.error().code));
            if (!table.error().detail.empty()) detail += ": " + table.error().detail;
            return fail(std::move(detail));
        }
        if (auto rl = RateLimiter::create(proxy.zones); !rl) return fail(std::string(routing::to_string(rl.error())));
        if (auto pool = UpstreamPool::create(proxy.groups, nullptr); !pool) {
            return fail(std::string(routing::to_string(pool.error())));
        }

        std::unordered_set<std::string> zones, groups;
        for (const auto& z : proxy.zones) {
            if (z.key != ZONE_KEY_CLIENT) return fail("zone " + z.name + ": unsupported key \"" + z.key + "\"");
            zones.insert(z.name);
        }
        for (const auto& g : proxy.groups) groups.insert(g.name);

        for (const auto& r : proxy.routes) {
            if (!r.zone.empty() && !zones.count(r.zone)) {
                return fail("route " + r.pattern + ": unknown zone \"" + r.zone + "\"");
            }
            if (!r.is_static() && !groups.count(r.group)) {
                return fail("route " + r.pattern + ": unknown upstream group \"" + r.group + "\"");
            }
        }
        return {};
    }

} // namespace dockyard::config
