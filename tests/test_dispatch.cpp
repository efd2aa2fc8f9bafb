/**
 * @file test_dispatch.cpp
 * @brief Tests for Dispatcher: route -> zone -> upstream admission.
 *
 * Validates:
 *  - Static routes answer without charging a zone or leasing a connection
 *  - 429 on zone exhaustion, 503 on unknown zone / no healthy member, 502 on connect failure
 *  - 400 for targets without a leading '/'
 *  - Leases go back to the pool on complete()
 *  - Observer receives one event per request and counts decisions
 *  - Event log lines stay valid JSON whatever the request or error text holds
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "dockyard/config/config_loader.hpp"
#include "dockyard/obs/observability.hpp"
#include "dockyard/routing/dispatcher.hpp"

using namespace dockyard;
using namespace dockyard::routing;

namespace {

class NullConnection final : public Connection {
public:
  explicit NullConnection(Endpoint ep) : ep_(std::move(ep)) {}
  const Endpoint& peer() const noexcept override { return ep_; }

private:
  Endpoint ep_;
};

class StubConnector final : public Connector {
public:
  std::set<std::string> refuse;
  int                   connects{0};

  dockyard_detail::expected<std::unique_ptr<Connection>, std::string>
  connect(const Endpoint& ep, std::chrono::milliseconds) override {
    ++connects;
    if (refuse.count(ep.str())) return dockyard_detail::unexpected<std::string>("connection refused");
    return std::unique_ptr<Connection>(std::make_unique<NullConnection>(ep));
  }
};

/// Keeps every admission event it sees.
class RecordingObserver final : public obs::Observer {
public:
  std::vector<obs::AdmissionEvent> events;

  void record(const obs::LifecycleEvent&) override {}
  void record(const obs::AdmissionEvent& e) override { events.push_back(e); }
  obs::Counters snapshot() const override { return {}; }
};

/// The built-in notes proxy wired to a stub connector.
struct Fixture {
  std::shared_ptr<StubConnector> connector = std::make_shared<StubConnector>();
  RouteRegistry                  routes;
  RateLimiter                    limiter;
  UpstreamPool                   pool;

  explicit Fixture(config::ProxyConfig p = config::Loader::default_proxy())
      : limiter(std::move(*RateLimiter::create(p.zones))),
        pool(std::move(*UpstreamPool::create(p.groups, connector))) {
    EXPECT_TRUE(routes.reload(p.routes));
  }
};

} // namespace

// --------------------------- Static ----------------------------------------

/**
 * @test Dispatch_Static_BypassesZoneAndPool
 * @brief The liveness route answers 200 "healthy" without charging or connecting.
 */
TEST(Dispatcher, Dispatch_Static_BypassesZoneAndPool) {
  Fixture f;
  Dispatcher d(f.routes, f.limiter, f.pool);
  const auto now = Clock::now();

  for (int i = 0; i < 100; ++i) {
    auto r = d.dispatch("/nginx-health", "10.0.0.1", now);
    ASSERT_EQ(r.disposition, Disposition::Static);
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "healthy\n");
    EXPECT_FALSE(r.lease);
  }
  EXPECT_EQ(f.limiter.tracked_keys("api"), 0u);
  EXPECT_EQ(f.limiter.tracked_keys("general"), 0u);
  EXPECT_EQ(f.connector->connects, 0);
}

// --------------------------- Proxy -----------------------------------------

/**
 * @test Dispatch_Proxy_LeasesAndReturns
 * @brief /api/ goes to backend; the lease is pooled again on complete().
 */
TEST(Dispatcher, Dispatch_Proxy_LeasesAndReturns) {
  Fixture f;
  Dispatcher d(f.routes, f.limiter, f.pool);
  const auto now = Clock::now();

  auto r = d.dispatch("/api/notes?page=2", "10.0.0.1", now);
  ASSERT_EQ(r.disposition, Disposition::Proxy);
  EXPECT_EQ(r.decision, "proxy");
  ASSERT_TRUE(r.lease);
  EXPECT_EQ(r.lease->group, "backend");
  EXPECT_EQ(r.lease->member, "backend:3001");
  EXPECT_EQ(r.match.route->pattern, "/api/*");

  d.complete(r, true, now);
  EXPECT_FALSE(r.lease);
  EXPECT_EQ(f.pool.idle_count("backend", "backend:3001"), 1u);

  auto again = d.dispatch("/api/notes", "10.0.0.1", now);
  ASSERT_TRUE(again.lease);
  EXPECT_TRUE(again.lease->reused);
  EXPECT_EQ(f.connector->connects, 1);

  auto page = d.dispatch("/notes/7", "10.0.0.1", now);
  ASSERT_TRUE(page.lease);
  EXPECT_EQ(page.lease->group, "frontend");
}

// --------------------------- Rejections ------------------------------------

/**
 * @test Dispatch_ZoneExhausted_429
 * @brief The 21st /api/ request in one instant is rate limited; other clients are not.
 */
TEST(Dispatcher, Dispatch_ZoneExhausted_429) {
  Fixture f;
  Dispatcher d(f.routes, f.limiter, f.pool);
  const auto now = Clock::now();

  for (int i = 0; i < 20; ++i) {
    auto r = d.dispatch("/api/x", "10.0.0.1", now);
    ASSERT_EQ(r.disposition, Disposition::Proxy) << i;
    d.complete(r, true, now);
  }
  auto limited = d.dispatch("/api/x", "10.0.0.1", now);
  EXPECT_EQ(limited.disposition, Disposition::Rejected);
  EXPECT_EQ(limited.status, 429);
  EXPECT_EQ(limited.decision, "rate_limited");
  EXPECT_FALSE(limited.lease);

  EXPECT_EQ(d.dispatch("/api/x", "10.0.0.2", now).disposition, Disposition::Proxy);
  EXPECT_EQ(d.dispatch("/api/x", "10.0.0.1", now + std::chrono::milliseconds(100)).disposition,
            Disposition::Proxy);
}

/**
 * @test Dispatch_NoHealthyMember_503
 * @brief An ejected-only group answers 503 without a connect attempt.
 */
TEST(Dispatcher, Dispatch_NoHealthyMember_503) {
  Fixture f;
  Dispatcher d(f.routes, f.limiter, f.pool);
  ASSERT_TRUE(f.pool.mark_health("backend", "backend:3001", false));

  auto r = d.dispatch("/health", "10.0.0.1", Clock::now());
  EXPECT_EQ(r.disposition, Disposition::Rejected);
  EXPECT_EQ(r.status, 503);
  EXPECT_EQ(r.decision, "unavailable");
  EXPECT_EQ(f.connector->connects, 0);
}

/**
 * @test Dispatch_ConnectFailure_502
 * @brief A member that refuses the connection yields 502.
 */
TEST(Dispatcher, Dispatch_ConnectFailure_502) {
  Fixture f;
  f.connector->refuse.insert("frontend:3000");
  Dispatcher d(f.routes, f.limiter, f.pool);

  auto r = d.dispatch("/", "10.0.0.1", Clock::now());
  EXPECT_EQ(r.status, 502);
  EXPECT_EQ(r.decision, "bad_gateway");
}

/**
 * @test Dispatch_UnknownZone_503
 * @brief A route naming an undeclared zone is an error, not a throttle.
 */
TEST(Dispatcher, Dispatch_UnknownZone_503) {
  auto p = config::Loader::default_proxy();
  p.zones.pop_back();  // drop "general"
  Fixture f(p);
  Dispatcher d(f.routes, f.limiter, f.pool);

  auto r = d.dispatch("/about", "10.0.0.1", Clock::now());
  EXPECT_EQ(r.status, 503);
  EXPECT_EQ(r.decision, "unavailable");
  EXPECT_EQ(f.connector->connects, 0);
}

/**
 * @test Dispatch_RelativeTarget_400
 * @brief A target without a leading '/' matches nothing.
 */
TEST(Dispatcher, Dispatch_RelativeTarget_400) {
  Fixture f;
  Dispatcher d(f.routes, f.limiter, f.pool);

  auto r = d.dispatch("api/notes", "10.0.0.1", Clock::now());
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(r.decision, "bad_request");
  EXPECT_FALSE(r.match);
}

// --------------------------- Observability ---------------------------------

/**
 * @test Dispatch_Observer_OneEventPerRequest
 * @brief Events carry route, zone (empty for static) and the decision.
 */
TEST(Dispatcher, Dispatch_Observer_OneEventPerRequest) {
  Fixture f;
  RecordingObserver rec;
  Dispatcher d(f.routes, f.limiter, f.pool, &rec);
  const auto now = Clock::now();

  (void)d.dispatch("/nginx-health", "k", now);
  (void)d.dispatch("/api/a", "k", now);
  (void)d.dispatch("bad", "k", now);

  ASSERT_EQ(rec.events.size(), 3u);
  EXPECT_EQ(rec.events[0].decision, "static");
  EXPECT_TRUE(rec.events[0].zone.empty());
  EXPECT_EQ(rec.events[1].route, "/api/*");
  EXPECT_EQ(rec.events[1].zone, "api");
  EXPECT_EQ(rec.events[1].client_key, "k");
  EXPECT_EQ(rec.events[2].status, 400);
  EXPECT_TRUE(rec.events[2].route.empty());
}

/**
 * @test Dispatch_LogObserver_CountsDecisions
 * @brief The process-wide observer tallies admitted, limited and unavailable requests.
 */
TEST(Dispatcher, Dispatch_LogObserver_CountsDecisions) {
  Fixture f;
  obs::Observer* o = obs::make_log_observer();
  const auto before = o->snapshot();
  Dispatcher d(f.routes, f.limiter, f.pool, o);
  const auto now = Clock::now();

  for (int i = 0; i < 21; ++i) (void)d.dispatch("/api/a", "counter-test", now);
  ASSERT_TRUE(f.pool.mark_health("frontend", "frontend:3000", false));
  (void)d.dispatch("/", "counter-test", now);
  (void)d.dispatch("nope", "counter-test", now);

  const auto after = o->snapshot();
  EXPECT_EQ(after.admitted - before.admitted, 20u);
  EXPECT_EQ(after.rate_limited - before.rate_limited, 1u);
  EXPECT_EQ(after.unavailable - before.unavailable, 1u);
}

/**
 * @test EventLines_EscapeQuotesAndBackslashes
 * @brief Error text and paths with quotes, backslashes or bad bytes still render as one JSON object.
 */
TEST(Dispatcher, EventLines_EscapeQuotesAndBackslashes) {
  obs::LifecycleEvent le{"notes", "backend", "create", "failed",
                         R"(Error response from daemon: Conflict. The container name "/backend" is in use)", false};
  auto lj = nlohmann::json::parse(obs::to_json_line(le));
  EXPECT_EQ(lj["reason"], le.reason);
  EXPECT_EQ(lj["dry_run"], false);
  EXPECT_FALSE(nlohmann::json::parse(obs::to_json_line(le, false)).contains("dry_run"));

  obs::AdmissionEvent ae{"/api/\"x\"\\y", "/api/*", "api", "10.0.0.1", 429, "rate_limited"};
  auto aj = nlohmann::json::parse(obs::to_json_line(ae));
  EXPECT_EQ(aj["path"], ae.path);
  EXPECT_EQ(aj["status"], 429);
  EXPECT_EQ(aj["key"], "10.0.0.1");

  obs::AdmissionEvent raw{std::string("/bad\xff"), "", "", "k", 400, "bad_request"};
  EXPECT_NO_THROW((void)nlohmann::json::parse(obs::to_json_line(raw)));
}
