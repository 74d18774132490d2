#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file tokens.hpp
 * @brief Token counting and per-phase usage estimation
 *
 * The collaborators do not report provider usage, so every charge against
 * the budget is an estimate built from the text that went in and came out
 * of a phase. Two layers:
 *
 * - TokenCounter: text -> token count. WordCountTokenCounter is the
 *   default approximation; LlamaTokenCounter (llama_token_counter.hpp)
 *   counts real tokens with a GGUF vocabulary.
 * - UsageEstimator: phase inputs/outputs -> tokens charged. The default
 *   TokenCountingEstimator adds a fixed prompt overhead per phase.
 *
 * An embedder that has measured usage can supply its own UsageEstimator
 * without touching the budget contract.
 */

#include "strategy.hpp"

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lats {

class TokenCounter {
public:
  virtual ~TokenCounter() = default;
  virtual int64_t count(std::string_view text) const = 0;
};

/**
 * Word-count approximation: ceil(words * tokens_per_word)
 */
class WordCountTokenCounter : public TokenCounter {
public:
  explicit WordCountTokenCounter(double tokens_per_word = 2.0)
      : tokens_per_word_(tokens_per_word) {}

  int64_t count(std::string_view text) const override {
    int64_t words = 0;
    bool in_word = false;
    for (char ch : text) {
      bool space = ch == ' ' || ch == '\n' || ch == '\t' || ch == '\r';
      if (!space && !in_word) ++words;
      in_word = !space;
    }
    return static_cast<int64_t>(std::ceil(static_cast<double>(words) * tokens_per_word_));
  }

private:
  double tokens_per_word_;
};

class UsageEstimator {
public:
  virtual ~UsageEstimator() = default;

  /** Tokens for one generate_next_thoughts call */
  virtual int64_t expansion(const std::string& summary,
                            const std::string& problem,
                            const std::vector<std::string>& thoughts) const = 0;

  /** Tokens for strategy generation plus execution of a leaf */
  virtual int64_t leaf(const std::vector<std::string>& path,
                       const std::string& problem,
                       const Strategy& strategy) const = 0;

  /** Tokens for evaluating an intermediate thought */
  virtual int64_t intermediate(const std::string& thought) const = 0;
};

/**
 * Counts phase text with a TokenCounter and adds a per-phase prompt overhead
 */
class TokenCountingEstimator : public UsageEstimator {
public:
  static constexpr int64_t EXPANSION_OVERHEAD = 200;
  static constexpr int64_t LEAF_OVERHEAD = 500;
  static constexpr int64_t EVALUATION_OVERHEAD = 50;

  explicit TokenCountingEstimator(
      std::shared_ptr<const TokenCounter> counter = std::make_shared<WordCountTokenCounter>())
      : counter_(std::move(counter)) {}

  int64_t expansion(const std::string& summary,
                    const std::string& problem,
                    const std::vector<std::string>& thoughts) const override {
    int64_t total = EXPANSION_OVERHEAD + counter_->count(summary) + counter_->count(problem);
    for (const auto& t : thoughts) total += counter_->count(t);
    return total;
  }

  int64_t leaf(const std::vector<std::string>& path,
               const std::string& problem,
               const Strategy& strategy) const override {
    int64_t total = LEAF_OVERHEAD + counter_->count(problem);
    for (const auto& t : path) total += counter_->count(t);
    for (const auto& [file, content] : strategy.file_changes) {
      total += counter_->count(content);
    }
    return total;
  }

  int64_t intermediate(const std::string& thought) const override {
    return EVALUATION_OVERHEAD + counter_->count(thought);
  }

private:
  std::shared_ptr<const TokenCounter> counter_;
};

}  // namespace lats
