#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file budget.hpp
 * @brief Search metrics and the token/cost circuit breaker
 *
 * SearchMetrics accumulates what a run consumed. BudgetTracker charges
 * per-phase token counts against it and answers whether the configured
 * ceilings have been crossed. The engine asks once per completed
 * iteration; an iteration is never cut short mid-flight.
 *
 * Cost is always derived from the token total
 * (tokens / 1000 * cost_per_1k_tokens), never accumulated separately,
 * so it cannot drift from the token count.
 */

#include "common.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace lats {

enum class Phase { Expansion, Simulation };

inline const char* phase_name(Phase phase) {
  switch (phase) {
    case Phase::Expansion:  return "expansion";
    case Phase::Simulation: return "simulation";
  }
  return "unknown";
}

/**
 * Counters collected during one search run
 */
struct SearchMetrics {
  using Clock = std::chrono::system_clock;

  int iterations_completed = 0;
  int nodes_created = 0;
  int64_t total_tokens_used = 0;
  double total_cost_usd = 0.0;

  /** Token totals keyed by phase name */
  std::map<std::string, int64_t> tokens_by_phase;

  /** Sandbox executions that raised (converted to reward 0) */
  int execution_failures = 0;

  /** Thought evaluations that degraded to the neutral score */
  int evaluation_fallbacks = 0;

  /** Event callbacks that threw */
  int callback_failures = 0;

  /** Winning-path writes or experience mirrors that failed */
  int persistence_failures = 0;

  Clock::time_point start_time = Clock::now();
  Clock::time_point end_time{};

  /**
   * Charge tokens to a phase and refresh the derived cost
   */
  void add_tokens(Phase phase, int64_t tokens, double cost_per_1k_tokens) {
    total_tokens_used += tokens;
    tokens_by_phase[phase_name(phase)] += tokens;
    total_cost_usd = static_cast<double>(total_tokens_used) / 1000.0 * cost_per_1k_tokens;
  }

  /**
   * Pure budget predicate
   *
   * @return true iff tokens >= max_total_tokens or cost >= max_cost_usd
   */
  bool exceeds_budget(const MCTSConfig& config) const {
    return total_tokens_used >= config.max_total_tokens ||
           total_cost_usd >= config.max_cost_usd;
  }

  /** Seconds from start to end, or to now while the run is live */
  double duration_seconds() const {
    auto end = end_time == Clock::time_point{} ? Clock::now() : end_time;
    return std::chrono::duration<double>(end - start_time).count();
  }

  nlohmann::json to_json() const {
    auto epoch_seconds = [](Clock::time_point tp) {
      return std::chrono::duration<double>(tp.time_since_epoch()).count();
    };
    return {
      {"iterations_completed", iterations_completed},
      {"nodes_created", nodes_created},
      {"total_tokens_used", total_tokens_used},
      {"total_cost_usd", total_cost_usd},
      {"tokens_by_phase", tokens_by_phase},
      {"execution_failures", execution_failures},
      {"evaluation_fallbacks", evaluation_fallbacks},
      {"callback_failures", callback_failures},
      {"persistence_failures", persistence_failures},
      {"start_time", epoch_seconds(start_time)},
      {"end_time", end_time == Clock::time_point{} ? nlohmann::json(nullptr)
                                                   : nlohmann::json(epoch_seconds(end_time))},
      {"duration_seconds", duration_seconds()},
    };
  }
};

/**
 * Circuit breaker over a SearchMetrics instance
 */
class BudgetTracker {
public:
  BudgetTracker(const MCTSConfig& config, SearchMetrics& metrics)
      : config_(config), metrics_(metrics) {}

  void charge(Phase phase, int64_t tokens) {
    metrics_.add_tokens(phase, tokens, config_.cost_per_1k_tokens);
    LATS_LOG_DEBUG("[budget::charge] %s +%lld tokens (total=%lld, cost=$%.4f)",
                   phase_name(phase), static_cast<long long>(tokens),
                   static_cast<long long>(metrics_.total_tokens_used),
                   metrics_.total_cost_usd);
  }

  bool tripped() const { return metrics_.exceeds_budget(config_); }

private:
  const MCTSConfig& config_;
  SearchMetrics& metrics_;
};

}  // namespace lats
