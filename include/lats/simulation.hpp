#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file simulation.hpp
 * @brief Simulation phase: reward a node
 *
 * Dispatch on depth:
 *
 * - Leaf (depth >= max_depth - 1): generate a complete strategy from the
 *   root-to-node thought path, mark the node terminal, run it in the
 *   sandbox and score it. Sandbox errors give reward 0 and a reflexion
 *   message; scores below 0.5 also produce a reflexion message. A
 *   terminal node selected again reuses its first reward at no token cost.
 *
 * - Intermediate: score the thought (hybrid ThoughtEvaluator when one is
 *   installed, otherwise Executor::evaluate_thought) and mark the node
 *   promising when the score clears thought_eval_threshold. Any evaluation
 *   failure degrades to 0.5.
 *
 * Strategy generation errors are fatal and propagate.
 */

#include "budget.hpp"
#include "common.hpp"
#include "config.hpp"
#include "ports.hpp"
#include "reflexion.hpp"
#include "thought_evaluator.hpp"
#include "tokens.hpp"
#include "tree.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

namespace lats {

struct SimulationOutcome {
  double reward = 0.0;
  int64_t estimated_tokens = 0;
  bool leaf = false;
};

class SimulationEngine {
public:
  /** Leaf scores below this trigger reflexion */
  static constexpr double LOW_SCORE_THRESHOLD = 0.5;

  /** Weakness characters quoted in a low-score reason */
  static constexpr size_t WEAKNESS_CHARS = 100;

  /**
   * @param reflexion Failure propagation (nullptr: reflexion off)
   * @param evaluator Hybrid thought scorer (nullptr: use the executor)
   */
  SimulationEngine(Executor& executor,
                   Scorer& scorer,
                   const MCTSConfig& config,
                   const UsageEstimator& usage,
                   const ReflexionPropagator* reflexion,
                   const ThoughtEvaluator* evaluator)
      : executor_(executor),
        scorer_(scorer),
        config_(config),
        usage_(usage),
        reflexion_(reflexion),
        evaluator_(evaluator) {}

  bool is_leaf_depth(const Node& node) const {
    return node.depth >= config_.max_depth - 1;
  }

  SimulationOutcome simulate(Tree& tree,
                             NodeIndex idx,
                             const std::string& problem,
                             const Context& context,
                             SearchMetrics& metrics) const {
    if (is_leaf_depth(tree.at(idx))) {
      return simulate_leaf(tree, idx, problem, context, metrics);
    }
    return simulate_intermediate(tree, idx, metrics);
  }

private:
  SimulationOutcome simulate_leaf(Tree& tree,
                                  NodeIndex idx,
                                  const std::string& problem,
                                  const Context& context,
                                  SearchMetrics& metrics) const {
    SimulationOutcome outcome;
    outcome.leaf = true;

    if (tree.at(idx).is_terminal && tree.at(idx).terminal_reward) {
      outcome.reward = *tree.at(idx).terminal_reward;
      LATS_LOG_DEBUG("[simulation::leaf] %s already terminal, reward=%.2f",
                     tree.at(idx).id.c_str(), outcome.reward);
      return outcome;
    }

    std::vector<std::string> path = tree.get_full_path(idx);
    Strategy strategy = executor_.generate_complete_strategy(path, problem, context);
    outcome.estimated_tokens = usage_.leaf(path, problem, strategy);

    {
      Node& node = tree.at(idx);
      node.completed_strategy = strategy;
      node.is_terminal = true;
    }

    ExecutionResult result;
    try {
      result = executor_.execute_strategy(strategy);
    } catch (const std::exception& e) {
      metrics.execution_failures += 1;
      LATS_LOG_WARN("[simulation::leaf] Execution failed for %s: %s",
                    strategy.strategy_id.c_str(), e.what());
      if (reflexion_) {
        std::string reason = reflexion_->extract_failure_reason(tree.at(idx), std::string(e.what()));
        reflexion_->propagate_to_parent(tree, idx, reason);
      }
      tree.at(idx).terminal_reward = 0.0;
      outcome.reward = 0.0;
      return outcome;
    }

    tree.at(idx).execution_result = result;
    ScoreCard card = scorer_.score(strategy, result);
    double score = std::isfinite(card.total_score) ? std::clamp(card.total_score, 0.0, 1.0) : 0.0;

    if (reflexion_ && score < LOW_SCORE_THRESHOLD) {
      std::string weakness = card.weaknesses.empty()
                                 ? std::string("unknown")
                                 : card.weaknesses.substr(0, WEAKNESS_CHARS);
      char prefix[48];
      std::snprintf(prefix, sizeof(prefix), "Low score (%.2f): ", score);
      reflexion_->propagate_to_parent(tree, idx, prefix + weakness);
    }

    LATS_LOG_DEBUG("[simulation::leaf] %s -> %.2f", tree.at(idx).id.c_str(), score);
    tree.at(idx).terminal_reward = score;
    outcome.reward = score;
    return outcome;
  }

  SimulationOutcome simulate_intermediate(Tree& tree,
                                          NodeIndex idx,
                                          SearchMetrics& metrics) const {
    SimulationOutcome outcome;
    const std::string& thought = tree.at(idx).partial_thought;

    double score = ThoughtEvaluator::NEUTRAL_SCORE;
    if (evaluator_) {
      score = evaluator_->evaluate(thought);
    } else {
      try {
        score = executor_.evaluate_thought(thought);
      } catch (const std::exception& e) {
        metrics.evaluation_fallbacks += 1;
        LATS_LOG_DEBUG("[simulation::intermediate] evaluate_thought failed: %s", e.what());
        score = ThoughtEvaluator::NEUTRAL_SCORE;
      }
    }
    if (!std::isfinite(score)) {
      metrics.evaluation_fallbacks += 1;
      score = ThoughtEvaluator::NEUTRAL_SCORE;
    }
    score = std::clamp(score, 0.0, 1.0);

    Node& node = tree.at(idx);
    node.thought_score = score;
    node.is_promising = score >= config_.thought_eval_threshold;
    outcome.reward = score;
    outcome.estimated_tokens = usage_.intermediate(thought);

    LATS_LOG_DEBUG("[simulation::intermediate] %s -> %.2f (%s)", node.id.c_str(), score,
                   node.is_promising ? "promising" : "unpromising");
    return outcome;
  }

  Executor& executor_;
  Scorer& scorer_;
  const MCTSConfig& config_;
  const UsageEstimator& usage_;
  const ReflexionPropagator* reflexion_;
  const ThoughtEvaluator* evaluator_;
};

}  // namespace lats
