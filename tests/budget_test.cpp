/**
 * Budget and Token Accounting Unit Tests
 */

#include <doctest/doctest.h>
#include <lats/budget.hpp>
#include <lats/config.hpp>
#include <lats/tokens.hpp>
#include <memory>
#include <string_view>

using namespace lats;

// ============================================================================
// SearchMetrics / BudgetTracker
// ============================================================================

TEST_CASE("budget: cost is derived from the token total") {
  SearchMetrics m;
  m.add_tokens(Phase::Expansion, 1500, 0.01);
  m.add_tokens(Phase::Simulation, 500, 0.01);

  CHECK(m.total_tokens_used == 2000);
  CHECK(m.total_cost_usd == doctest::Approx(0.02));
  CHECK(m.tokens_by_phase["expansion"] == 1500);
  CHECK(m.tokens_by_phase["simulation"] == 500);
}

TEST_CASE("budget: token ceiling trips at the limit") {
  MCTSConfig c;
  c.max_total_tokens = 1000;
  SearchMetrics m;
  BudgetTracker budget(c, m);

  budget.charge(Phase::Expansion, 999);
  CHECK_FALSE(budget.tripped());
  budget.charge(Phase::Simulation, 1);
  CHECK(budget.tripped());
}

TEST_CASE("budget: cost ceiling trips independently of tokens") {
  MCTSConfig c;
  c.max_total_tokens = 1000000;
  c.max_cost_usd = 0.05;
  c.cost_per_1k_tokens = 0.01;
  SearchMetrics m;
  BudgetTracker budget(c, m);

  budget.charge(Phase::Expansion, 4000);
  CHECK_FALSE(budget.tripped());
  budget.charge(Phase::Simulation, 1000);
  CHECK(budget.tripped());
}

TEST_CASE("budget: metrics dump") {
  SearchMetrics m;
  m.iterations_completed = 3;
  m.nodes_created = 6;
  m.add_tokens(Phase::Expansion, 100, 0.01);

  auto j = m.to_json();
  CHECK(j["iterations_completed"] == 3);
  CHECK(j["nodes_created"] == 6);
  CHECK(j["total_tokens_used"] == 100);
  CHECK(j["tokens_by_phase"]["expansion"] == 100);
  CHECK(j["end_time"].is_null());
  CHECK(j["duration_seconds"].get<double>() >= 0.0);

  m.end_time = SearchMetrics::Clock::now();
  CHECK(m.to_json()["end_time"].is_number());
}

// ============================================================================
// Token counting
// ============================================================================

TEST_CASE("tokens: word count approximation") {
  WordCountTokenCounter counter;
  CHECK(counter.count("") == 0);
  CHECK(counter.count("   ") == 0);
  CHECK(counter.count("fix the bug") == 6);
  CHECK(counter.count("fix\tthe\nbug  now") == 8);

  WordCountTokenCounter dense(1.5);
  CHECK(dense.count("one two three") == 5);
}

TEST_CASE("tokens: estimator adds per-phase overhead") {
  TokenCountingEstimator usage(std::make_shared<WordCountTokenCounter>(1.0));

  CHECK(usage.expansion("Depth 0: p", "p", {"a b", "c"}) ==
        TokenCountingEstimator::EXPANSION_OVERHEAD + 3 + 1 + 2 + 1);
  CHECK(usage.intermediate("one two") == TokenCountingEstimator::EVALUATION_OVERHEAD + 2);

  Strategy s;
  s.file_changes["a.py"] = "x = 1";
  CHECK(usage.leaf({"Problem: p", "step"}, "p", s) ==
        TokenCountingEstimator::LEAF_OVERHEAD + 1 + 2 + 1 + 3);
}

TEST_CASE("tokens: custom counters plug into the estimator") {
  struct CharCounter : TokenCounter {
    int64_t count(std::string_view text) const override {
      return static_cast<int64_t>(text.size());
    }
  };
  TokenCountingEstimator usage(std::make_shared<CharCounter>());
  CHECK(usage.intermediate("abcd") == TokenCountingEstimator::EVALUATION_OVERHEAD + 4);
}
