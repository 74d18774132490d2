#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file termination.hpp
 * @brief Stop conditions for the search loop
 *
 * RUNNING moves to exactly one terminal state. After every completed
 * iteration the conditions are checked in priority order:
 *
 *   1. CANCELLED        external cancellation flag is set
 *   2. BUDGET_EXCEEDED  token or cost ceiling reached
 *   3. EARLY_GIVEUP     enabled, more than early_giveup_iterations done,
 *                       and the best leaf Q-value is below the threshold
 *   4. EARLY_STOP       some leaf Q-value reached early_stop_threshold
 *   5. MAX_ITERATIONS   iteration limit reached
 *
 * Cancellation is cooperative: the flag is read between iterations, so a
 * blocking collaborator call already in flight runs to completion.
 */

#include "budget.hpp"
#include "common.hpp"
#include "config.hpp"
#include "tree.hpp"

#include <atomic>

namespace lats {

enum class TerminationState {
  Running,
  Cancelled,
  BudgetExceeded,
  EarlyGiveup,
  EarlyStop,
  MaxIterations,
};

inline const char* termination_state_name(TerminationState state) {
  switch (state) {
    case TerminationState::Running:        return "RUNNING";
    case TerminationState::Cancelled:      return "CANCELLED";
    case TerminationState::BudgetExceeded: return "BUDGET_EXCEEDED";
    case TerminationState::EarlyGiveup:    return "EARLY_GIVEUP";
    case TerminationState::EarlyStop:      return "EARLY_STOP";
    case TerminationState::MaxIterations:  return "MAX_ITERATIONS";
  }
  return "UNKNOWN";
}

/**
 * Shared cancellation flag
 *
 * May be set from any thread; the engine reads it between iterations.
 */
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> cancelled_{false};
};

class TerminationPolicy {
public:
  explicit TerminationPolicy(const MCTSConfig& config) : config_(config) {}

  /**
   * Evaluate the stop conditions after a completed iteration
   *
   * @return Running, or the highest-priority terminal state that applies
   */
  TerminationState check(const Tree& tree,
                         const SearchMetrics& metrics,
                         const CancellationToken* cancel) const {
    if (cancel && cancel->is_cancelled()) {
      return TerminationState::Cancelled;
    }
    if (metrics.exceeds_budget(config_)) {
      return TerminationState::BudgetExceeded;
    }
    if (should_give_up(tree, metrics.iterations_completed)) {
      return TerminationState::EarlyGiveup;
    }
    if (has_good_solution(tree)) {
      return TerminationState::EarlyStop;
    }
    if (metrics.iterations_completed >= config_.max_iterations) {
      return TerminationState::MaxIterations;
    }
    return TerminationState::Running;
  }

  /**
   * Low-confidence give-up
   *
   * Considered only once more than early_giveup_iterations iterations
   * have completed.
   */
  bool should_give_up(const Tree& tree, int iterations_completed) const {
    if (!config_.enable_early_giveup) return false;
    if (iterations_completed <= config_.early_giveup_iterations) return false;

    auto leaves = tree.leaves();
    if (leaves.empty()) return false;

    double best_q = tree.at(leaves.front()).q_value;
    for (NodeIndex idx : leaves) {
      if (tree.at(idx).q_value > best_q) best_q = tree.at(idx).q_value;
    }

    if (best_q < config_.early_giveup_threshold) {
      LATS_LOG_WARN("[termination::should_give_up] best_q=%.2f < %.2f",
                    best_q, config_.early_giveup_threshold);
      return true;
    }
    return false;
  }

  bool has_good_solution(const Tree& tree) const {
    for (NodeIndex idx : tree.leaves()) {
      if (tree.at(idx).q_value >= config_.early_stop_threshold) return true;
    }
    return false;
  }

private:
  const MCTSConfig& config_;
};

}  // namespace lats
