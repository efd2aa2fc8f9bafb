/**
 * @file test_routing.cpp
 * @brief Tests for RouteTable precedence and RouteRegistry RCU semantics.
 *
 * Validates:
 *  - exact > longest prefix > regex > catch-all "/" precedence
 *  - Query strings are ignored; targets without a leading '/' match nothing
 *  - Build-time rejections (no catch-all, bad regex, missing target)
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - No torn reads under 1 writer / many readers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "dockyard/routing/route_registry.hpp"
#include "dockyard/routing/route_table.hpp"

using namespace dockyard::routing;

// --------------------------- Helpers ---------------------------------------

static Route proxy(std::string pattern, MatchKind kind, std::string group, std::string zone = {}) {
  return Route{std::move(pattern), kind, std::move(group), std::move(zone), std::nullopt};
}

static Route fixed(std::string pattern, std::uint16_t status, std::string body) {
  return Route{std::move(pattern), MatchKind::Exact, {}, {}, StaticResponse{status, std::move(body)}};
}

/// The proxy layout of the notes stack plus a regex rule.
static std::vector<Route> notes_routes() {
  return {
    fixed("/nginx-health", 200, "healthy\n"),
    proxy("/api/*", MatchKind::Prefix, "backend", "api"),
    proxy("/health", MatchKind::Exact, "backend", "general"),
    proxy("\\.(png|svg)$", MatchKind::Regex, "assets"),
    proxy("/", MatchKind::Prefix, "frontend", "general"),
  };
}

static RouteTable must_build(std::vector<Route> routes) {
  auto t = RouteTable::build(std::move(routes));
  EXPECT_TRUE(t.has_value());
  return std::move(*t);
}

// --------------------------- Precedence ------------------------------------

/**
 * @test RouteTable_Precedence_ExactPrefixRegexCatchAll
 * @brief Each tier wins over the tiers below it.
 */
TEST(RouteTable, RouteTable_Precedence_ExactPrefixRegexCatchAll) {
  const auto t = must_build(notes_routes());

  const Route* live = t.match("/nginx-health");
  ASSERT_NE(live, nullptr);
  EXPECT_TRUE(live->is_static());
  EXPECT_EQ(live->static_response->body, "healthy\n");

  EXPECT_EQ(t.match("/api/notes")->group, "backend");
  EXPECT_EQ(t.match("/api/notes")->zone, "api");
  EXPECT_EQ(t.match("/health")->kind, MatchKind::Exact);
  EXPECT_EQ(t.match("/img/logo.png")->group, "assets");
  EXPECT_EQ(t.match("/notes/42")->group, "frontend");
  EXPECT_EQ(t.match("/")->group, "frontend");
}

/**
 * @test RouteTable_Exact_BeatsLongerPrefix
 * @brief An exact hit wins even when a prefix rule would also match.
 */
TEST(RouteTable, RouteTable_Exact_BeatsLongerPrefix) {
  const auto t = must_build({
    proxy("/api/status/full", MatchKind::Prefix, "long"),
    proxy("/api/status", MatchKind::Exact, "exact"),
    proxy("/", MatchKind::Prefix, "root"),
  });
  EXPECT_EQ(t.match("/api/status")->group, "exact");
  EXPECT_EQ(t.match("/api/status/full/1")->group, "long");
  EXPECT_EQ(t.match("/api/statusx")->group, "root");
}

/**
 * @test RouteTable_Prefix_LongestWins_TiesKeepDeclarationOrder
 * @brief Longest literal prefix wins; equal lengths resolve to the first declared.
 */
TEST(RouteTable, RouteTable_Prefix_LongestWins_TiesKeepDeclarationOrder) {
  const auto t = must_build({
    proxy("/a/", MatchKind::Prefix, "short"),
    proxy("/a/b/", MatchKind::Prefix, "first"),
    proxy("/a/b/*", MatchKind::Prefix, "second"),  // same literal as "/a/b/"
    proxy("/", MatchKind::Prefix, "root"),
  });
  EXPECT_EQ(t.match("/a/b/c")->group, "first");
  EXPECT_EQ(t.match("/a/x")->group, "short");
}

/**
 * @test RouteTable_Regex_ReachableDespiteCatchAll
 * @brief The "/" fallback is consulted after regex rules, in declaration order.
 */
TEST(RouteTable, RouteTable_Regex_ReachableDespiteCatchAll) {
  const auto t = must_build({
    proxy("/", MatchKind::Prefix, "root"),
    proxy("^/v[0-9]+/", MatchKind::Regex, "versioned"),
    proxy("^/v1/", MatchKind::Regex, "never"),
  });
  EXPECT_EQ(t.match("/v1/items")->group, "versioned");
  EXPECT_EQ(t.match("/items")->group, "root");
}

/**
 * @test RouteTable_Query_IsIgnored_RelativeTarget_Unmatched
 * @brief "?query" does not affect matching; "x/y" yields nullptr.
 */
TEST(RouteTable, RouteTable_Query_IsIgnored_RelativeTarget_Unmatched) {
  const auto t = must_build(notes_routes());
  ASSERT_NE(t.match("/nginx-health?probe=1"), nullptr);
  EXPECT_TRUE(t.match("/nginx-health?probe=1")->is_static());
  EXPECT_EQ(t.match("/api?x=/api/")->group, "frontend");
  EXPECT_EQ(t.match("api/notes"), nullptr);
  EXPECT_EQ(t.match(""), nullptr);
}

// --------------------------- Validation ------------------------------------

/**
 * @test RouteTable_Build_Rejections
 * @brief Missing fallback, bad regex, bad pattern and missing target are refused.
 */
TEST(RouteTable, RouteTable_Build_Rejections) {
  auto empty = RouteTable::build({});
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code, RouteErr::Empty);

  auto no_root = RouteTable::build({proxy("/api/", MatchKind::Prefix, "backend")});
  ASSERT_FALSE(no_root);
  EXPECT_EQ(no_root.error().code, RouteErr::NoCatchAll);

  auto bad_re = RouteTable::build({proxy("([a-z", MatchKind::Regex, "x"), proxy("/", MatchKind::Prefix, "root")});
  ASSERT_FALSE(bad_re);
  EXPECT_EQ(bad_re.error().code, RouteErr::BadRegex);

  auto bad_pat = RouteTable::build({proxy("api", MatchKind::Exact, "x"), proxy("/", MatchKind::Prefix, "root")});
  ASSERT_FALSE(bad_pat);
  EXPECT_EQ(bad_pat.error().code, RouteErr::BadPattern);

  auto no_target = RouteTable::build({proxy("/", MatchKind::Prefix, "")});
  ASSERT_FALSE(no_target);
  EXPECT_EQ(no_target.error().code, RouteErr::MissingTarget);
}

// --------------------------- Registry --------------------------------------

/**
 * @test Registry_Construct_Empty
 * @brief Before the first publish there is no table and nothing matches.
 */
TEST(RouteRegistry, Registry_Construct_Empty) {
  RouteRegistry reg;
  EXPECT_FALSE(reg.snapshot());
  EXPECT_FALSE(reg.match("/"));
  EXPECT_EQ(reg.version(), 0u);
}

/**
 * @test Registry_Reload_PublishesNewGeneration
 * @brief A good reload bumps the version; a bad one keeps the current table.
 */
TEST(RouteRegistry, Registry_Reload_PublishesNewGeneration) {
  RouteRegistry reg;
  auto v1 = reg.reload(notes_routes());
  ASSERT_TRUE(v1);
  EXPECT_EQ(*v1, 1u);
  EXPECT_EQ(reg.match("/api/x").route->group, "backend");

  auto bad = reg.reload({proxy("/api/", MatchKind::Prefix, "backend")});
  ASSERT_FALSE(bad);
  EXPECT_EQ(reg.version(), 1u);
  EXPECT_EQ(reg.match("/api/x").route->group, "backend");

  auto v2 = reg.reload({proxy("/", MatchKind::Prefix, "maintenance")});
  ASSERT_TRUE(v2);
  EXPECT_EQ(*v2, 2u);
  EXPECT_EQ(reg.match("/api/x").route->group, "maintenance");
}

/**
 * @test Registry_Match_KeepsOldGenerationAlive
 * @brief A Match obtained before a reload still points at valid memory after it.
 */
TEST(RouteRegistry, Registry_Match_KeepsOldGenerationAlive) {
  RouteRegistry reg(must_build(notes_routes()));
  const auto before = reg.match("/api/notes");
  ASSERT_TRUE(before);

  ASSERT_TRUE(reg.reload({proxy("/", MatchKind::Prefix, "other")}));
  EXPECT_NE(before.table, reg.snapshot());
  EXPECT_EQ(before.route->group, "backend");
  EXPECT_EQ(before.table->size(), 5u);
}

/**
 * @test Registry_Concurrency_1W_MR
 * @brief One writer toggles tables; readers only observe complete generations.
 *
 * This is a lightweight sanity test (not a full linearizability proof).
 */
TEST(RouteRegistry, Registry_Concurrency_1W_MR) {
  const auto table_a = notes_routes();
  const std::vector<Route> table_b{proxy("/", MatchKind::Prefix, "maintenance")};
  RouteRegistry reg(must_build(table_a));

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 2000; ++i) {
      (void)reg.reload((i & 1) == 0 ? table_b : table_a);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      const auto m = reg.match("/api/notes");
      if (!m) { ADD_FAILURE() << "no match"; break; }
      const auto n = m.table->size();
      const bool consistent = (n == table_a.size() && m.route->group == "backend") ||
                              (n == table_b.size() && m.route->group == "maintenance");
      if (consistent) {
        ok_reads.fetch_add(1, std::memory_order_relaxed);
      } else {
        ADD_FAILURE() << "Observed torn generation: size " << n << " group " << m.route->group;
        break;
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  EXPECT_GT(ok_reads.load(), 0);
  EXPECT_EQ(reg.version(), 2001u);
}
