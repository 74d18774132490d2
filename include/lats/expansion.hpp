#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file expansion.hpp
 * @brief Expansion phase: grow children from generated thoughts
 *
 * One Executor::generate_next_thoughts call per expansion. Each returned
 * thought (at most k) becomes a child in order; the first child is
 * simulated this iteration and its siblings wait for Selection.
 *
 * Errors from the executor propagate: a failed expansion aborts the run.
 * Children added before the failure point stay in the tree.
 */

#include "budget.hpp"
#include "common.hpp"
#include "config.hpp"
#include "ports.hpp"
#include "reflexion.hpp"
#include "tokens.hpp"
#include "tree.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lats {

struct ExpansionOutcome {
  /** Node to simulate: first new child, or the expanded node if none were made */
  NodeIndex simulate = INVALID_NODE;
  int children_created = 0;
  int64_t estimated_tokens = 0;
};

class ExpansionEngine {
public:
  /**
   * @param reflexion Source of rejection guidance (nullptr: reflexion off)
   */
  ExpansionEngine(Executor& executor,
                  const MCTSConfig& config,
                  const UsageEstimator& usage,
                  const ReflexionPropagator* reflexion)
      : executor_(executor), config_(config), usage_(usage), reflexion_(reflexion) {}

  /**
   * Expand a non-terminal node
   *
   * @throws whatever Executor::generate_next_thoughts throws
   */
  ExpansionOutcome expand(Tree& tree,
                          NodeIndex idx,
                          const std::string& problem,
                          const Context& context,
                          SearchMetrics& metrics) const {
    const std::string summary = tree.at(idx).get_summary();
    Context request = expansion_context(tree, idx, context);

    std::vector<std::string> thoughts = executor_.generate_next_thoughts(
        summary, problem, request, config_.strategies_per_expansion);

    if (thoughts.size() > static_cast<size_t>(config_.strategies_per_expansion)) {
      LATS_LOG_DEBUG("[expansion::expand] Executor returned %zu thoughts, keeping %d",
                     thoughts.size(), config_.strategies_per_expansion);
      thoughts.resize(config_.strategies_per_expansion);
    }

    ExpansionOutcome outcome;
    outcome.estimated_tokens = usage_.expansion(summary, problem, thoughts);

    for (const auto& thought : thoughts) {
      NodeIndex child = tree.add_child(idx, thought);
      metrics.nodes_created += 1;
      if (outcome.children_created == 0) outcome.simulate = child;
      outcome.children_created += 1;
    }
    if (outcome.children_created == 0) outcome.simulate = idx;

    LATS_LOG_DEBUG("[expansion::expand] Expanded %d children from %s",
                   outcome.children_created, tree.at(idx).id.c_str());
    return outcome;
  }

private:
  /**
   * Caller context plus rejection guidance and the derived sibling seed
   */
  Context expansion_context(const Tree& tree, NodeIndex idx, const Context& context) const {
    Context request = context.is_object() ? context : Context::object();

    if (reflexion_) {
      std::string guidance = reflexion_->get_rejection_context(tree, idx);
      if (!guidance.empty()) request["rejection_context"] = guidance;
    }

    // Distinct, reproducible seed per (parent, child slot)
    if (config_.seed) {
      uint32_t derived = *config_.seed +
                         static_cast<uint32_t>(idx) * 1000u +
                         static_cast<uint32_t>(tree.at(idx).children.size());
      request["seed"] = derived;
    }
    return request;
  }

  Executor& executor_;
  const MCTSConfig& config_;
  const UsageEstimator& usage_;
  const ReflexionPropagator* reflexion_;
};

}  // namespace lats
