/**
 * @file dispatcher.cpp
 * @brief Dispatcher decision chain and admission events.
 */
#include "dockyard/routing/dispatcher.hpp"

#include <utility>

#include "dockyard/config/constants.hpp"
#include "dockyard/obs/observability.hpp"

namespace dockyard::routing {

namespace cst = config::constants;

std::string_view to_string(Disposition d) noexcept {
    switch (d) {
        case Disposition::Static:   return "static";
        case Disposition::Proxy:    return "proxy";
        case Disposition::Rejected: return "rejected";
    }
    return "unknown";
}

DispatchResult Dispatcher::reject(DispatchResult r, std::uint16_t status, std::string_view decision, std::string reason) {
    r.disposition = Disposition::Rejected;
    r.status      = status;
    r.decision    = std::string(decision);
    r.body        = std::move(reason);
    return r;
}

DispatchResult Dispatcher::dispatch(std::string_view target, std::string_view client_key, TimePoint now) {
    DispatchResult r;
    r.match = routes_.match(target);
    if (!r.match) {
        r = reject(std::move(r), cst::STATUS_BAD_REQUEST, "bad_request", "request target must start with '/'");
        emit(target, client_key, r);
        return r;
    }
    const Route& route = *r.match.route;

    if (route.is_static()) {
        r.disposition = Disposition::Static;
        r.status      = route.static_response->status;
        r.body        = route.static_response->body;
        r.decision    = "static";
        emit(target, client_key, r);
        return r;
    }

    if (!route.zone.empty()) {
        const auto adm = limiter_.admit(route.zone, client_key, now);
        if (!adm) {
            r = reject(std::move(r), cst::STATUS_UNAVAILABLE, "unavailable", std::string(to_string(adm.error())));
            emit(target, client_key, r);
            return r;
        }
        if (*adm == Admission::Reject) {
            r = reject(std::move(r), cst::STATUS_RATE_LIMITED, "rate_limited", "rate limit exceeded");
            emit(target, client_key, r);
            return r;
        }
    }

    auto lease = pool_.acquire(route.group, now);
    if (!lease) {
        const bool connect = lease.error() == PoolErr::ConnectFailed;
        r = reject(std::move(r), connect ? cst::STATUS_BAD_GATEWAY : cst::STATUS_UNAVAILABLE,
                   connect ? "bad_gateway" : "unavailable", std::string(to_string(lease.error())));
        emit(target, client_key, r);
        return r;
    }

    r.disposition = Disposition::Proxy;
    r.lease       = std::move(*lease);
    r.decision    = "proxy";
    emit(target, client_key, r);
    return r;
}

void Dispatcher::complete(DispatchResult& result, bool reusable, TimePoint now) {
    if (!result.lease) return;
    pool_.release(std::move(*result.lease), reusable, now);
    result.lease.reset();
}

void Dispatcher::emit(std::string_view target, std::string_view client_key, const DispatchResult& r) const {
    if (!observer_) return;
    obs::AdmissionEvent e;
    e.path       = std::string(target);
    e.client_key = std::string(client_key);
    e.status     = r.status;
    e.decision   = r.decision;
    if (r.match) {
        e.route = r.match.route->pattern;
        if (!r.match.route->is_static()) e.zone = r.match.route->zone;
    }
    observer_->record(e);
}

} // namespace dockyard::routing
