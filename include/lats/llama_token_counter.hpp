#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file llama_token_counter.hpp
 * @brief TokenCounter backed by a llama.cpp vocabulary
 *
 * Counts real tokens for the model the generator runs on, replacing the
 * word-count approximation in budget accounting. The model must outlive
 * the counter; sharing a std::shared_ptr<llama_model> keeps it alive.
 *
 * @example
 * @code
 *   auto counter = std::make_shared<lats::LlamaTokenCounter>(model);
 *   engine.set_usage_estimator(
 *       std::make_shared<lats::TokenCountingEstimator>(counter));
 * @endcode
 */

#include "common.hpp"
#include "tokens.hpp"

#include <llama/llama.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace lats {

class LlamaTokenCounter : public TokenCounter {
public:
  /**
   * @throws std::invalid_argument if model is null
   */
  explicit LlamaTokenCounter(std::shared_ptr<const llama_model> model)
      : model_(std::move(model)) {
    if (!model_) {
      throw std::invalid_argument("LlamaTokenCounter: NULL model");
    }
    vocab_ = llama_model_get_vocab(model_.get());
  }

  /**
   * Token count of text without special tokens
   *
   * llama_tokenize reports the required buffer size as a negative value
   * when given no buffer, so no allocation is needed.
   *
   * @throws std::runtime_error if tokenization fails
   */
  int64_t count(std::string_view text) const override {
    if (text.empty()) return 0;
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
      throw std::runtime_error("LlamaTokenCounter: text too long");
    }

    int32_t n = llama_tokenize(vocab_, text.data(), static_cast<int32_t>(text.size()),
                               nullptr, 0, /*add_special=*/false, /*parse_special=*/false);
    if (n == std::numeric_limits<int32_t>::min()) {
      throw std::runtime_error("LlamaTokenCounter: tokenization overflow");
    }
    int64_t tokens = n < 0 ? -static_cast<int64_t>(n) : static_cast<int64_t>(n);
    LATS_LOG_DEBUG("[llama_token_counter::count] %zu bytes -> %lld tokens",
                   text.size(), static_cast<long long>(tokens));
    return tokens;
  }

private:
  std::shared_ptr<const llama_model> model_;
  const llama_vocab* vocab_ = nullptr;
};

}  // namespace lats
