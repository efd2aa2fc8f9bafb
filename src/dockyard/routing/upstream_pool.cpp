/**
 * @file upstream_pool.cpp
 * @brief UpstreamPool selection, keepalive pooling and health hysteresis.
 */
#include "dockyard/routing/upstream_pool.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace dockyard::routing {

namespace {

class TcpConnection final : public Connection {
public:
    TcpConnection(int fd, Endpoint peer) noexcept : fd_(fd), peer_(std::move(peer)) {}
    ~TcpConnection() override { if (fd_ >= 0) ::close(fd_); }

    TcpConnection(const TcpConnection&)            = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    const Endpoint& peer() const noexcept override { return peer_; }

private:
    int      fd_;
    Endpoint peer_;
};

/// Connect @p fd to @p ai within @p timeout. @return 0 or an errno value.
int connect_with_timeout(int fd, const addrinfo* ai, std::chrono::milliseconds timeout) {
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return 0;
    if (errno != EINPROGRESS) return errno;

    pollfd pfd{fd, POLLOUT, 0};
    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) return ETIMEDOUT;
    if (rc < 0) return errno;

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) return errno;
    return err;
}

} // namespace

std::optional<Endpoint> parse_endpoint(std::string_view s) {
    const auto colon = s.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == s.size()) return std::nullopt;
    unsigned port = 0;
    const char* first = s.data() + colon + 1;
    const char* last  = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port == 0 || port > 65535) return std::nullopt;
    return Endpoint{std::string(s.substr(0, colon)), static_cast<std::uint16_t>(port)};
}

std::string_view to_string(PoolErr e) noexcept {
    switch (e) {
        case PoolErr::UnknownGroup:     return "unknown upstream group";
        case PoolErr::UnknownMember:    return "unknown upstream member";
        case PoolErr::GroupUnavailable: return "no healthy upstream";
        case PoolErr::ConnectFailed:    return "upstream connect failed";
        case PoolErr::InvalidGroup:     return "invalid upstream group";
        case PoolErr::DuplicateGroup:   return "duplicate upstream group";
    }
    return "unknown";
}

//------------------------------- TcpConnector ----------------------------------

dockyard_detail::expected<std::unique_ptr<Connection>, std::string>
TcpConnector::connect(const Endpoint& ep, std::chrono::milliseconds timeout) {
    using Unexpected = dockyard_detail::unexpected<std::string>;

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port = std::to_string(ep.port);
    if (const int rc = ::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res); rc != 0) {
        return Unexpected(ep.str() + ": " + ::gai_strerror(rc));
    }

    std::string last_err = "no address";
    for (const addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { last_err = std::strerror(errno); continue; }
        const int err = connect_with_timeout(fd, ai, timeout);
        if (err == 0) {
            ::freeaddrinfo(res);
            return std::unique_ptr<Connection>(std::make_unique<TcpConnection>(fd, ep));
        }
        last_err = std::strerror(err);
        ::close(fd);
    }
    ::freeaddrinfo(res);
    return Unexpected(ep.str() + ": " + last_err);
}

//------------------------------- Construction ----------------------------------

dockyard_detail::expected<UpstreamPool, PoolErr>
UpstreamPool::create(std::vector<GroupConfig> groups, std::shared_ptr<Connector> connector) {
    using Unexpected = dockyard_detail::unexpected<PoolErr>;
    UpstreamPool pool;
    pool.connector_ = connector ? std::move(connector) : std::make_shared<TcpConnector>();

    for (auto& cfg : groups) {
        if (cfg.name.empty() || cfg.members.empty() || cfg.rise == 0 || cfg.fall == 0) {
            return Unexpected(PoolErr::InvalidGroup);
        }
        if (cfg.connect_timeout.count() <= 0 || cfg.request_timeout.count() <= 0 ||
            cfg.probe_interval.count() <= 0 || cfg.probe_timeout.count() <= 0) {
            return Unexpected(PoolErr::InvalidGroup);
        }
        if (pool.find(cfg.name)) return Unexpected(PoolErr::DuplicateGroup);

        auto g = std::make_unique<Group>();
        for (const auto& m : cfg.members) {
            auto ep = parse_endpoint(m);
            if (!ep) return Unexpected(PoolErr::InvalidGroup);
            g->members.push_back(std::make_unique<Member>(std::move(*ep)));
        }
        g->cfg = std::move(cfg);
        pool.groups_.push_back(std::move(g));
    }
    return pool;
}

UpstreamPool::Group* UpstreamPool::find(std::string_view group) noexcept {
    for (auto& g : groups_) if (g->cfg.name == group) return g.get();
    return nullptr;
}

const UpstreamPool::Group* UpstreamPool::find(std::string_view group) const noexcept {
    for (const auto& g : groups_) if (g->cfg.name == group) return g.get();
    return nullptr;
}

UpstreamPool::Member* UpstreamPool::find_member(Group& g, std::string_view member) noexcept {
    for (auto& m : g.members) if (m->id == member) return m.get();
    return nullptr;
}

const UpstreamPool::Member* UpstreamPool::find_member(const Group& g, std::string_view member) noexcept {
    for (const auto& m : g.members) if (m->id == member) return m.get();
    return nullptr;
}

//------------------------------- Request path ----------------------------------

dockyard_detail::expected<Lease, PoolErr> UpstreamPool::acquire(std::string_view group, TimePoint now) {
    using Unexpected = dockyard_detail::unexpected<PoolErr>;
    Group* g = find(group);
    if (!g) return Unexpected(PoolErr::UnknownGroup);

    // Groups are small; collect the healthy set and rotate over it.
    std::vector<std::size_t> healthy;
    healthy.reserve(g->members.size());
    for (std::size_t i = 0; i < g->members.size(); ++i) {
        if (g->members[i]->up.load(std::memory_order_acquire)) healthy.push_back(i);
    }
    if (healthy.empty()) return Unexpected(PoolErr::GroupUnavailable);

    const auto idx = healthy[g->rr.fetch_add(1, std::memory_order_relaxed) % healthy.size()];
    Member& m = *g->members[idx];

    Lease lease;
    lease.group        = g->cfg.name;
    lease.member       = m.id;
    lease.member_index = idx;
    lease.deadline     = now + g->cfg.request_timeout;
    {
        std::lock_guard<std::mutex> lk(m.mu);
        if (!m.idle.empty()) {
            lease.conn = std::move(m.idle.front());
            m.idle.pop_front();
            lease.reused = true;
            return lease;
        }
    }

    auto conn = connector_->connect(m.ep, g->cfg.connect_timeout);
    if (!conn) {
        spdlog::debug("upstream {}: connect to {} failed: {}", g->cfg.name, m.id, conn.error());
        return Unexpected(PoolErr::ConnectFailed);
    }
    lease.conn = std::move(*conn);
    return lease;
}

void UpstreamPool::release(Lease lease, bool reusable, TimePoint now) {
    if (!lease.conn) return;
    Group* g = find(lease.group);
    if (!g || lease.member_index >= g->members.size()) return;  // connection closes with the lease
    Member& m = *g->members[lease.member_index];

    if (!reusable || now >= lease.deadline || !m.up.load(std::memory_order_acquire)) return;

    // An ejection may have drained the pool since the check above; it flips up under m.mu.
    std::lock_guard<std::mutex> lk(m.mu);
    if (!m.up.load(std::memory_order_relaxed) || m.idle.size() >= g->cfg.keepalive) return;
    m.idle.push_back(std::move(lease.conn));
}

//------------------------------- Health ----------------------------------------

dockyard_detail::expected<bool, PoolErr>
UpstreamPool::mark_health(std::string_view group, std::string_view member, bool ok) {
    using Unexpected = dockyard_detail::unexpected<PoolErr>;
    Group* g = find(group);
    if (!g) return Unexpected(PoolErr::UnknownGroup);
    Member* m = find_member(*g, member);
    if (!m) return Unexpected(PoolErr::UnknownMember);

    std::deque<std::unique_ptr<Connection>> dropped;  // closed outside the lock
    bool up;
    {
        std::lock_guard<std::mutex> lk(m->mu);
        up = m->up.load(std::memory_order_relaxed);
        if (ok) {
            m->fail_streak = 0;
            ++m->ok_streak;
            if (!up && m->ok_streak >= g->cfg.rise) {
                up = true;
                m->up.store(true, std::memory_order_release);
                spdlog::info("upstream {}: member {} is back in rotation", g->cfg.name, m->id);
            }
        } else {
            m->ok_streak = 0;
            ++m->fail_streak;
            if (up && m->fail_streak >= g->cfg.fall) {
                up = false;
                m->up.store(false, std::memory_order_release);
                dropped.swap(m->idle);
                spdlog::warn("upstream {}: member {} ejected after {} failed check(s)",
                             g->cfg.name, m->id, m->fail_streak);
            }
        }
    }
    return up;
}

std::optional<bool> UpstreamPool::healthy(std::string_view group, std::string_view member) const {
    const Group* g = find(group);
    if (!g) return std::nullopt;
    const Member* m = find_member(*g, member);
    if (!m) return std::nullopt;
    return m->up.load(std::memory_order_acquire);
}

std::size_t UpstreamPool::idle_count(std::string_view group, std::string_view member) const {
    const Group* g = find(group);
    if (!g) return 0;
    const Member* m = find_member(*g, member);
    if (!m) return 0;
    std::lock_guard<std::mutex> lk(m->mu);
    return m->idle.size();
}

std::vector<Endpoint> UpstreamPool::members(std::string_view group) const {
    std::vector<Endpoint> out;
    if (const Group* g = find(group)) {
        out.reserve(g->members.size());
        for (const auto& m : g->members) out.push_back(m->ep);
    }
    return out;
}

const GroupConfig* UpstreamPool::config(std::string_view group) const noexcept {
    const Group* g = find(group);
    return g ? &g->cfg : nullptr;
}

std::vector<std::string> UpstreamPool::group_names() const {
    std::vector<std::string> out;
    out.reserve(groups_.size());
    for (const auto& g : groups_) out.push_back(g->cfg.name);
    return out;
}

} // namespace dockyard::routing
