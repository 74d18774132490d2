#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file reflexion.hpp
 * @brief Failure-reason propagation between sibling branches
 *
 * When a leaf fails (sandbox error or low score) a short verbal reason is
 * appended to its parent's rejected_reasons. Later expansions under that
 * parent receive the deduplicated reasons as guidance, steering the
 * siblings' subtrees away from failure modes already seen.
 */

#include "common.hpp"
#include "tree.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace lats {

class ReflexionPropagator {
public:
  /** Most reasons rendered into one rejection context */
  static constexpr size_t MAX_CONTEXT_REASONS = 5;

  /** Characters of an unclassified raw error kept in the reason */
  static constexpr size_t RAW_ERROR_CHARS = 100;

  /** Q-value below which a node without a raw error counts as failed */
  static constexpr double LOW_Q_THRESHOLD = 0.3;

  /** Thought score below which an intermediate node counts as weak */
  static constexpr double LOW_THOUGHT_SCORE = 0.5;

  /**
   * Derive a failure reason for node
   *
   * With a raw error, classify it by well-known substrings; unknown errors
   * keep their first 100 characters. Without one, fall back to the node's
   * statistics.
   */
  std::string extract_failure_reason(const Node& node,
                                     const std::optional<std::string>& raw_error = std::nullopt) const {
    if (raw_error) {
      const std::string& err = *raw_error;
      for (const auto& rule : error_rules()) {
        for (const char* needle : rule.needles) {
          if (needle && err.find(needle) != std::string::npos) {
            return rule.reason;
          }
        }
      }
      return "Execution failed: " + err.substr(0, RAW_ERROR_CHARS);
    }

    char buf[128];
    if (node.visit_count > 0 && node.q_value < LOW_Q_THRESHOLD) {
      std::snprintf(buf, sizeof(buf), "Low Q-value (%.2f): approach underperformed", node.q_value);
      return buf;
    }
    if (node.thought_score && *node.thought_score < LOW_THOUGHT_SCORE) {
      std::snprintf(buf, sizeof(buf), "Low thought score (%.2f): reasoning step judged weak",
                    *node.thought_score);
      return buf;
    }
    return "Unknown failure";
  }

  /**
   * Append reason to the parent of idx
   *
   * No-op for the root.
   */
  void propagate_to_parent(Tree& tree, NodeIndex idx, const std::string& reason) const {
    const Node& node = tree.at(idx);
    if (node.parent == INVALID_NODE) return;

    tree.at(node.parent).add_rejection_reason(reason);
    LATS_LOG_DEBUG("[reflexion::propagate] %s -> %s: %s", node.id.c_str(),
                   tree.at(node.parent).id.c_str(), reason.c_str());
  }

  /**
   * Guidance text built from the node's rejected reasons
   *
   * @return "" when no reasons are recorded, otherwise a bullet list of at
   *         most 5 distinct reasons in first-seen order
   */
  std::string get_rejection_context(const Node& node) const {
    return format_context(node.rejected_reasons);
  }

  /**
   * Guidance for expanding idx: reasons on idx and its ancestors, nearest first
   *
   * A failed leaf reports to its parent, so the failures of idx's own
   * siblings are found one level up.
   */
  std::string get_rejection_context(const Tree& tree, NodeIndex idx) const {
    std::vector<std::string> reasons;
    for (NodeIndex i = idx; i != INVALID_NODE; i = tree.at(i).parent) {
      const auto& own = tree.at(i).rejected_reasons;
      reasons.insert(reasons.end(), own.begin(), own.end());
    }
    return format_context(reasons);
  }

private:
  static std::string format_context(const std::vector<std::string>& reasons) {
    if (reasons.empty()) return "";

    std::vector<const std::string*> unique;
    for (const auto& reason : reasons) {
      bool seen = false;
      for (const std::string* u : unique) {
        if (*u == reason) {
          seen = true;
          break;
        }
      }
      if (!seen) unique.push_back(&reason);
      if (unique.size() == MAX_CONTEXT_REASONS) break;
    }

    std::string out = "Previously rejected approaches (avoid these failure modes):";
    for (const std::string* reason : unique) {
      out += "\n- " + *reason;
    }
    return out;
  }

  struct ErrorRule {
    const char* needles[3];
    const char* reason;
  };

  static const std::vector<ErrorRule>& error_rules() {
    static const std::vector<ErrorRule> rules = {
      {{"IndexError", "index out of range", "out of bounds"}, "Index out of range: check list/array bounds"},
      {{"TypeError", "type mismatch", nullptr}, "Type mismatch: check argument and return types"},
      {{"AttributeError", "has no attribute", nullptr}, "Missing attribute: object lacks the accessed member"},
      {{"ModuleNotFoundError", "ImportError", "No module named"}, "Missing module: import cannot be resolved"},
      {{"SyntaxError", "invalid syntax", nullptr}, "Syntax error in generated code"},
      {{"NameError", "is not defined", nullptr}, "Undefined name: variable or function not defined"},
    };
    return rules;
  }
};

}  // namespace lats
