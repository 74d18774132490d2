#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file backprop.hpp
 * @brief Reward backpropagation along the parent chain
 */

#include "common.hpp"
#include "tree.hpp"

#include <cstdio>
#include <string>

namespace lats::backprop {

/**
 * Fold reward into every node from idx up to the root (inclusive)
 *
 * Each node on the path gets exactly one visit and one incremental-mean
 * update. Single path, single writer.
 */
inline void backpropagate(Tree& tree, NodeIndex idx, double reward) {
  std::string trail;
  while (idx != INVALID_NODE) {
    Node& node = tree.at(idx);
    double old_q = node.q_value;
    node.update_q_value(reward);

    if (log::enabled(log::Level::Debug)) {
      char step[160];
      std::snprintf(step, sizeof(step), "%s%s: %.2f -> %.2f",
                    trail.empty() ? "" : " <- ", node.id.c_str(), old_q, node.q_value);
      trail += step;
    }
    idx = node.parent;
  }
  LATS_LOG_DEBUG("[backprop::backpropagate] %s", trail.c_str());
}

}  // namespace lats::backprop
