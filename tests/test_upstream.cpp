/**
 * @file test_upstream.cpp
 * @brief Tests for UpstreamPool selection/keepalive and HealthProber.
 *
 * Validates:
 *  - Round-robin over healthy members; down members are never selected
 *  - fall/rise hysteresis and idle-connection drop on ejection
 *  - Keepalive bound, deadline and broken-connection release paths
 *  - Probe results (including late successes) feed the pool
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "dockyard/routing/health_prober.hpp"
#include "dockyard/routing/upstream_pool.hpp"

using namespace std::chrono_literals;
using namespace dockyard::routing;

namespace {

/// Connection that tracks how many are open at once.
class FakeConnection final : public Connection {
public:
  FakeConnection(Endpoint ep, std::shared_ptr<std::atomic<int>> open)
      : ep_(std::move(ep)), open_(std::move(open)) { open_->fetch_add(1); }
  ~FakeConnection() override { open_->fetch_sub(1); }
  const Endpoint& peer() const noexcept override { return ep_; }

private:
  Endpoint                          ep_;
  std::shared_ptr<std::atomic<int>> open_;
};

/// Connector that succeeds unless the member is listed in @c refuse.
class FakeConnector final : public Connector {
public:
  std::set<std::string>             refuse;
  std::atomic<int>                  connects{0};
  std::shared_ptr<std::atomic<int>> open = std::make_shared<std::atomic<int>>(0);

  dockyard_detail::expected<std::unique_ptr<Connection>, std::string>
  connect(const Endpoint& ep, std::chrono::milliseconds) override {
    ++connects;
    if (refuse.count(ep.str())) return dockyard_detail::unexpected<std::string>("connection refused");
    return std::unique_ptr<Connection>(std::make_unique<FakeConnection>(ep, open));
  }
};

GroupConfig backend_group(std::uint32_t keepalive = 2) {
  GroupConfig g;
  g.name      = "backend";
  g.members   = {"b1:3001", "b2:3001"};
  g.keepalive = keepalive;
  g.rise      = 2;
  g.fall      = 1;
  g.probe_interval = 10ms;
  g.probe_timeout  = 50ms;
  return g;
}

UpstreamPool make_pool(std::shared_ptr<FakeConnector> conn, std::uint32_t keepalive = 2) {
  auto p = UpstreamPool::create({backend_group(keepalive)}, std::move(conn));
  EXPECT_TRUE(p.has_value());
  return std::move(*p);
}

} // namespace

// --------------------------- Endpoint --------------------------------------

/**
 * @test Endpoint_Parse
 * @brief host:port parses; missing host, missing port and out-of-range ports do not.
 */
TEST(UpstreamPool, Endpoint_Parse) {
  auto ep = parse_endpoint("backend:3001");
  ASSERT_TRUE(ep);
  EXPECT_EQ(ep->host, "backend");
  EXPECT_EQ(ep->port, 3001);
  EXPECT_EQ(ep->str(), "backend:3001");

  EXPECT_FALSE(parse_endpoint("backend"));
  EXPECT_FALSE(parse_endpoint(":3001"));
  EXPECT_FALSE(parse_endpoint("backend:0"));
  EXPECT_FALSE(parse_endpoint("backend:70000"));
  EXPECT_FALSE(parse_endpoint("backend:30x1"));
}

// --------------------------- Selection -------------------------------------

/**
 * @test UpstreamPool_RoundRobin_AlternatesMembers
 * @brief Consecutive acquires rotate through members in declared order.
 */
TEST(UpstreamPool, UpstreamPool_RoundRobin_AlternatesMembers) {
  auto conn = std::make_shared<FakeConnector>();
  auto pool = make_pool(conn);
  const auto now = Clock::now();

  std::vector<std::string> picked;
  for (int i = 0; i < 4; ++i) {
    auto l = pool.acquire("backend", now);
    ASSERT_TRUE(l);
    picked.push_back(l->member);
  }
  EXPECT_EQ(picked, (std::vector<std::string>{"b1:3001", "b2:3001", "b1:3001", "b2:3001"}));
  EXPECT_EQ(conn->connects.load(), 4);
}

/**
 * @test UpstreamPool_Failover_SkipsDownMember
 * @brief With b1 ejected every request lands on b2.
 */
TEST(UpstreamPool, UpstreamPool_Failover_SkipsDownMember) {
  auto pool = make_pool(std::make_shared<FakeConnector>());
  auto down = pool.mark_health("backend", "b1:3001", false);
  ASSERT_TRUE(down);
  EXPECT_FALSE(*down);

  for (int i = 0; i < 5; ++i) {
    auto l = pool.acquire("backend", Clock::now());
    ASSERT_TRUE(l);
    EXPECT_EQ(l->member, "b2:3001");
  }
}

/**
 * @test UpstreamPool_AllDown_GroupUnavailable
 * @brief No healthy member means GroupUnavailable, not a connect attempt.
 */
TEST(UpstreamPool, UpstreamPool_AllDown_GroupUnavailable) {
  auto conn = std::make_shared<FakeConnector>();
  auto pool = make_pool(conn);
  ASSERT_TRUE(pool.mark_health("backend", "b1:3001", false));
  ASSERT_TRUE(pool.mark_health("backend", "b2:3001", false));

  auto l = pool.acquire("backend", Clock::now());
  ASSERT_FALSE(l);
  EXPECT_EQ(l.error(), PoolErr::GroupUnavailable);
  EXPECT_EQ(conn->connects.load(), 0);
}

/**
 * @test UpstreamPool_Errors_UnknownGroupAndConnectFailed
 * @brief Undeclared group and refused connects are reported distinctly.
 */
TEST(UpstreamPool, UpstreamPool_Errors_UnknownGroupAndConnectFailed) {
  auto conn = std::make_shared<FakeConnector>();
  conn->refuse.insert("b1:3001");
  auto pool = make_pool(conn);

  auto unknown = pool.acquire("frontend", Clock::now());
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error(), PoolErr::UnknownGroup);

  auto refused = pool.acquire("backend", Clock::now());
  ASSERT_FALSE(refused);
  EXPECT_EQ(refused.error(), PoolErr::ConnectFailed);

  auto member = pool.mark_health("backend", "b9:3001", true);
  ASSERT_FALSE(member);
  EXPECT_EQ(member.error(), PoolErr::UnknownMember);
}

// --------------------------- Health ----------------------------------------

/**
 * @test UpstreamPool_Rise_NeedsConsecutiveSuccesses
 * @brief An ejected member rejoins only after rise consecutive good checks.
 */
TEST(UpstreamPool, UpstreamPool_Rise_NeedsConsecutiveSuccesses) {
  auto pool = make_pool(std::make_shared<FakeConnector>());
  EXPECT_EQ(pool.healthy("backend", "b1:3001"), std::optional<bool>(true));

  ASSERT_TRUE(pool.mark_health("backend", "b1:3001", false));
  EXPECT_FALSE(*pool.mark_health("backend", "b1:3001", true));
  EXPECT_FALSE(*pool.mark_health("backend", "b1:3001", false));  // streak broken
  EXPECT_FALSE(*pool.mark_health("backend", "b1:3001", true));
  EXPECT_TRUE(*pool.mark_health("backend", "b1:3001", true));
  EXPECT_EQ(pool.healthy("backend", "b1:3001"), std::optional<bool>(true));
  EXPECT_FALSE(pool.healthy("backend", "nope:1"));
}

/**
 * @test UpstreamPool_Eject_DropsIdleConnections
 * @brief Pooled connections to an ejected member are closed immediately.
 */
TEST(UpstreamPool, UpstreamPool_Eject_DropsIdleConnections) {
  auto conn = std::make_shared<FakeConnector>();
  auto pool = make_pool(conn);
  const auto now = Clock::now();

  auto l = pool.acquire("backend", now);
  ASSERT_TRUE(l);
  ASSERT_EQ(l->member, "b1:3001");
  pool.release(std::move(*l), true, now);
  EXPECT_EQ(pool.idle_count("backend", "b1:3001"), 1u);
  EXPECT_EQ(conn->open->load(), 1);

  ASSERT_TRUE(pool.mark_health("backend", "b1:3001", false));
  EXPECT_EQ(pool.idle_count("backend", "b1:3001"), 0u);
  EXPECT_EQ(conn->open->load(), 0);
}

// --------------------------- Keepalive -------------------------------------

/**
 * @test UpstreamPool_Keepalive_ReuseAndBound
 * @brief Released connections are reused; the idle pool never exceeds keepalive.
 */
TEST(UpstreamPool, UpstreamPool_Keepalive_ReuseAndBound) {
  GroupConfig g = backend_group(2);
  g.members = {"b1:3001"};
  auto conn = std::make_shared<FakeConnector>();
  auto created = UpstreamPool::create({g}, conn);
  ASSERT_TRUE(created);
  auto& pool = *created;
  const auto now = Clock::now();

  std::vector<Lease> leases;
  for (int i = 0; i < 3; ++i) {
    auto l = pool.acquire("backend", now);
    ASSERT_TRUE(l);
    EXPECT_FALSE(l->reused);
    leases.push_back(std::move(*l));
  }
  for (auto& l : leases) pool.release(std::move(l), true, now);
  EXPECT_EQ(pool.idle_count("backend", "b1:3001"), 2u);
  EXPECT_EQ(conn->open->load(), 2);

  auto again = pool.acquire("backend", now);
  ASSERT_TRUE(again);
  EXPECT_TRUE(again->reused);
  EXPECT_EQ(conn->connects.load(), 3);
  EXPECT_EQ(pool.idle_count("backend", "b1:3001"), 1u);
}

/**
 * @test UpstreamPool_Release_BrokenOrLate_Closes
 * @brief Non-reusable or past-deadline leases are closed rather than pooled.
 */
TEST(UpstreamPool, UpstreamPool_Release_BrokenOrLate_Closes) {
  auto conn = std::make_shared<FakeConnector>();
  auto pool = make_pool(conn);
  const auto now = Clock::now();

  auto broken = pool.acquire("backend", now);
  ASSERT_TRUE(broken);
  const std::string m1 = broken->member;
  pool.release(std::move(*broken), false, now);
  EXPECT_EQ(pool.idle_count("backend", m1), 0u);

  auto late = pool.acquire("backend", now);
  ASSERT_TRUE(late);
  const std::string m2 = late->member;
  const auto deadline = late->deadline;
  EXPECT_EQ(deadline, now + std::chrono::milliseconds(30000));
  pool.release(std::move(*late), true, deadline);
  EXPECT_EQ(pool.idle_count("backend", m2), 0u);
  EXPECT_EQ(conn->open->load(), 0);
}

/**
 * @test UpstreamPool_Release_RacingEjection_NeverRepools
 * @brief Releases that overlap an ejection leave the ejected member's idle pool empty.
 */
TEST(UpstreamPool, UpstreamPool_Release_RacingEjection_NeverRepools) {
  GroupConfig g = backend_group(1000);
  g.members = {"b1:3001"};
  auto conn = std::make_shared<FakeConnector>();
  auto created = UpstreamPool::create({g}, conn);
  ASSERT_TRUE(created);
  auto& pool = *created;
  const auto now = Clock::now();

  std::vector<Lease> leases;
  for (int i = 0; i < 500; ++i) {
    auto l = pool.acquire("backend", now);
    ASSERT_TRUE(l);
    leases.push_back(std::move(*l));
  }

  std::atomic<bool> go{false};
  std::thread releaser([&] {
    while (!go.load()) std::this_thread::yield();
    for (auto& l : leases) pool.release(std::move(l), true, now);
  });
  go.store(true);
  ASSERT_TRUE(pool.mark_health("backend", "b1:3001", false));
  releaser.join();

  EXPECT_EQ(pool.idle_count("backend", "b1:3001"), 0u);
  EXPECT_EQ(conn->open->load(), 0);

  // Back in rotation, the member starts from fresh connections.
  EXPECT_FALSE(*pool.mark_health("backend", "b1:3001", true));
  EXPECT_TRUE(*pool.mark_health("backend", "b1:3001", true));
  auto fresh = pool.acquire("backend", now);
  ASSERT_TRUE(fresh);
  EXPECT_FALSE(fresh->reused);
}

/**
 * @test UpstreamPool_Create_Rejections
 * @brief Empty groups, bad endpoints, zero thresholds or timeouts and duplicates are refused.
 */
TEST(UpstreamPool, UpstreamPool_Create_Rejections) {
  auto conn = std::make_shared<FakeConnector>();

  GroupConfig empty = backend_group();
  empty.members.clear();
  auto e = UpstreamPool::create({empty}, conn);
  ASSERT_FALSE(e);
  EXPECT_EQ(e.error(), PoolErr::InvalidGroup);

  GroupConfig bad = backend_group();
  bad.members = {"no-port"};
  EXPECT_EQ(UpstreamPool::create({bad}, conn).error(), PoolErr::InvalidGroup);

  GroupConfig zero = backend_group();
  zero.rise = 0;
  EXPECT_EQ(UpstreamPool::create({zero}, conn).error(), PoolErr::InvalidGroup);

  GroupConfig no_connect_wait = backend_group();
  no_connect_wait.connect_timeout = 0ms;
  EXPECT_EQ(UpstreamPool::create({no_connect_wait}, conn).error(), PoolErr::InvalidGroup);

  GroupConfig spinning = backend_group();
  spinning.probe_interval = 0ms;
  EXPECT_EQ(UpstreamPool::create({spinning}, conn).error(), PoolErr::InvalidGroup);

  GroupConfig no_probe_wait = backend_group();
  no_probe_wait.probe_timeout = 0ms;
  EXPECT_EQ(UpstreamPool::create({no_probe_wait}, conn).error(), PoolErr::InvalidGroup);

  auto dup = UpstreamPool::create({backend_group(), backend_group()}, conn);
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error(), PoolErr::DuplicateGroup);
}

// --------------------------- Prober ----------------------------------------

/**
 * @test HealthProber_RunOnce_FeedsPool
 * @brief Failed probes eject; two good rounds bring the member back (rise = 2).
 */
TEST(HealthProber, HealthProber_RunOnce_FeedsPool) {
  auto pool = make_pool(std::make_shared<FakeConnector>());
  std::atomic<bool> b1_up{false};
  HealthProber prober(pool, [&](const Endpoint& ep, std::chrono::milliseconds) {
    return ep.str() != "b1:3001" || b1_up.load();
  });

  auto first = prober.run_once();
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].member, "b1:3001");
  EXPECT_FALSE(first[0].ok);
  EXPECT_FALSE(first[0].healthy);
  EXPECT_TRUE(first[1].healthy);

  b1_up = true;
  EXPECT_FALSE(prober.run_once()[0].healthy);
  EXPECT_TRUE(prober.run_once()[0].healthy);
}

/**
 * @test HealthProber_LateSuccess_CountsAsFailure
 * @brief A probe that answers OK after the timeout ejects the member.
 */
TEST(HealthProber, HealthProber_LateSuccess_CountsAsFailure) {
  auto pool = make_pool(std::make_shared<FakeConnector>());
  HealthProber prober(pool, [](const Endpoint& ep, std::chrono::milliseconds timeout) {
    if (ep.str() == "b2:3001") std::this_thread::sleep_for(timeout + 20ms);
    return true;
  });

  const auto r = prober.run_once();
  ASSERT_EQ(r.size(), 2u);
  EXPECT_TRUE(r[0].ok);
  EXPECT_FALSE(r[1].ok);
  EXPECT_EQ(pool.healthy("backend", "b2:3001"), std::optional<bool>(false));
}

/**
 * @test HealthProber_StartStop_Background
 * @brief Background threads probe every member until stop(), which joins them.
 */
TEST(HealthProber, HealthProber_StartStop_Background) {
  auto pool = make_pool(std::make_shared<FakeConnector>());
  std::mutex mu;
  std::set<std::string> probed;
  HealthProber prober(pool, [&](const Endpoint& ep, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lk(mu);
    probed.insert(ep.str());
    return false;
  });

  prober.start();
  EXPECT_TRUE(prober.running());
  prober.start();  // no-op while running

  const auto until = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < until) {
    {
      std::lock_guard<std::mutex> lk(mu);
      if (probed.size() == 2) break;
    }
    std::this_thread::sleep_for(5ms);
  }
  prober.stop();
  EXPECT_FALSE(prober.running());
  prober.stop();

  EXPECT_EQ(probed.size(), 2u);
  EXPECT_EQ(pool.healthy("backend", "b1:3001"), std::optional<bool>(false));
  EXPECT_EQ(pool.healthy("backend", "b2:3001"), std::optional<bool>(false));
}
