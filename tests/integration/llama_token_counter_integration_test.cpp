/**
 * llama.cpp Token Counter Integration Test
 *
 * Counts real tokens with a GGUF vocabulary and drives a search whose
 * budget is charged in those tokens.
 *
 * Requires LLAMA_TEST_MODEL; every case skips without it.
 */

#include "../test_doubles.hpp"
#include "test_config.hpp"

#include <doctest/doctest.h>
#include <lats/llama_token_counter.hpp>
#include <lats/search.hpp>
#include <lats/tokens.hpp>
#include <llama/llama.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lats;

TEST_CASE("llama_token_counter integration: null model is rejected") {
  CHECK_THROWS_AS(LlamaTokenCounter(nullptr), std::invalid_argument);
}

TEST_CASE("llama_token_counter integration: counts match llama_tokenize") {
  REQUIRE_MODEL();
  auto model = TestConfig::acquire_test_model();
  REQUIRE(model);

  LlamaTokenCounter counter(model);
  const std::string text = "Add a bounds check before indexing the buffer.";

  const llama_vocab* vocab = llama_model_get_vocab(model.get());
  std::vector<llama_token> tokens(text.size() + 8);
  int32_t n = llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                             tokens.data(), static_cast<int32_t>(tokens.size()),
                             false, false);
  REQUIRE(n > 0);

  CHECK(counter.count(text) == n);
  CHECK(counter.count("") == 0);
  CHECK(counter.count(text + text) >= counter.count(text));
}

TEST_CASE("llama_token_counter integration: counter outlives caller's handle") {
  REQUIRE_MODEL();
  // Private instance: the shared cache would keep the model alive anyway
  auto model = TestConfig::load_test_model();
  REQUIRE(model);
  std::weak_ptr<llama_model> watch = model;

  auto counter = std::make_shared<LlamaTokenCounter>(model);
  CHECK(model.use_count() == 2);
  model.reset();
  CHECK_FALSE(watch.expired());
  CHECK(counter->count("hello world") > 0);

  counter.reset();
  CHECK(watch.expired());
}

TEST_CASE("llama_token_counter integration: search budget in model tokens") {
  REQUIRE_MODEL();
  auto model = TestConfig::acquire_test_model();
  REQUIRE(model);

  lats_test::ScriptedExecutor exec;
  lats_test::FixedScorer scorer(0.5);
  MCTSConfig config;
  config.max_iterations = 3;
  config.max_depth = 2;
  config.strategies_per_expansion = 2;
  config.save_winning_paths = false;

  auto counter = std::make_shared<LlamaTokenCounter>(model);
  SearchEngine engine(exec, scorer, config);
  engine.set_usage_estimator(std::make_shared<TokenCountingEstimator>(counter));

  SearchResult result = engine.search("Fix the off-by-one error in the pagination helper");

  CHECK(result.metrics.iterations_completed == 3);
  CHECK(result.metrics.tokens_by_phase.at("expansion") >
        TokenCountingEstimator::EXPANSION_OVERHEAD);
  CHECK(result.metrics.total_tokens_used > 0);
}
