#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file selection.hpp
 * @brief UCT selection walk
 *
 * From the root, descend while the current node has children and
 * depth < max_depth:
 * - the first child with visit_count == 0 wins outright (every child is
 *   tried once before any exploitation, and UCT is never evaluated with a
 *   zero denominator)
 * - otherwise the child with the highest UCT score wins; ties go to the
 *   first child in insertion order
 *
 * Pure function of the tree state.
 */

#include "common.hpp"
#include "config.hpp"
#include "tree.hpp"

#include <limits>

namespace lats::selection {

inline NodeIndex select(const Tree& tree, const MCTSConfig& config) {
  NodeIndex idx = ROOT_NODE;

  while (!tree.at(idx).is_leaf() && tree.at(idx).depth < config.max_depth) {
    const Node& node = tree.at(idx);
    NodeIndex best_child = INVALID_NODE;
    double best_ucb = -std::numeric_limits<double>::infinity();

    for (NodeIndex child_idx : node.children) {
      if (tree.at(child_idx).visit_count == 0) {
        best_child = child_idx;
        break;
      }
      double score = tree.ucb(child_idx, config.exploration_constant);
      // Strict > keeps the first of equal scores
      if (score > best_ucb) {
        best_ucb = score;
        best_child = child_idx;
      }
    }

    if (best_child == INVALID_NODE) break;
    idx = best_child;
  }

  const Node& selected = tree.at(idx);
  LATS_LOG_DEBUG("[selection::select] Selected %s (depth=%d, visits=%d, q=%.2f)",
                 selected.id.c_str(), selected.depth, selected.visit_count,
                 selected.q_value);
  return idx;
}

}  // namespace lats::selection
