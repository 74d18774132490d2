#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file tree.hpp
 * @brief Thought tree: node statistics and the node arena
 *
 * Nodes are stored in a single arena (std::vector<Node>) and refer to each
 * other by index. parent is a non-owning back-reference (-1 for root),
 * children is the insertion-ordered list of owned child indices. The tree
 * only grows through Tree::add_child(), so it is acyclic and a child's
 * index is always greater than its parent's.
 *
 * Invariants:
 * - depth == parent.depth + 1 for every non-root node
 * - node id is "{parent_id}-{child_index}", root id is "root"
 * - completed_strategy implies is_terminal
 * - visit_count grows by exactly 1 per update_q_value() call
 *
 * All traversals are iterative so deep or wide trees cannot exhaust the
 * call stack.
 */

#include "common.hpp"
#include "strategy.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lats {

using NodeIndex = int;
constexpr NodeIndex INVALID_NODE = -1;
constexpr NodeIndex ROOT_NODE = 0;

/** Guards the UCT exploration term against division by zero */
constexpr double UCB_EPSILON = 1e-6;

/** Character budget of a node summary */
constexpr size_t SUMMARY_MAX_CHARS = 200;

/**
 * Thought tree vertex
 */
struct Node {
  std::string id;

  /** Parent index (-1 for root) */
  NodeIndex parent = INVALID_NODE;

  /** Child indices in insertion order */
  std::vector<NodeIndex> children;

  int depth = 0;

  /** Thought text at this node */
  std::string partial_thought;

  /** Increment over the parent's thought */
  std::string thought_diff;

  int visit_count = 0;

  /** Running mean of backpropagated rewards */
  double q_value = 0.0;

  /** Intermediate evaluation score (set only for non-terminal simulated nodes) */
  std::optional<double> thought_score;

  bool is_terminal = false;
  bool is_promising = false;

  /** Present only on terminal nodes that reached full generation */
  std::optional<Strategy> completed_strategy;

  /** Sandbox outcome of completed_strategy when execution succeeded */
  std::optional<ExecutionResult> execution_result;

  /** Reward of the first terminal simulation, reused on re-selection */
  std::optional<double> terminal_reward;

  /** Failure reasons reported by children (append-only, may repeat) */
  std::vector<std::string> rejected_reasons;

  bool is_leaf() const { return children.empty(); }

  /**
   * Fold one reward into the running mean
   *
   * visit_count += 1; q += (reward - q) / visit_count
   */
  void update_q_value(double reward) {
    visit_count += 1;
    q_value += (reward - q_value) / visit_count;
  }

  /** Caller deduplicates when reading (see ReflexionPropagator) */
  void add_rejection_reason(std::string reason) {
    rejected_reasons.push_back(std::move(reason));
  }

  /**
   * Length-bounded projection used in expansion prompts
   *
   * @return "Depth <d>: <thought>" with the thought cut to 200 chars
   */
  std::string get_summary() const {
    std::string summary = "Depth " + std::to_string(depth) + ": " +
                          truncate(partial_thought, SUMMARY_MAX_CHARS);
    if (!rejected_reasons.empty()) {
      summary += " [" + std::to_string(rejected_reasons.size()) +
                 " rejected approaches]";
    }
    return summary;
  }
};

/**
 * Arena-backed thought tree
 */
class Tree {
public:
  /**
   * Create a tree holding only the root
   *
   * @param problem Problem statement; root thought is "Problem: <problem>"
   */
  explicit Tree(const std::string& problem) {
    Node root;
    root.id = "root";
    root.partial_thought = "Problem: " + problem;
    nodes_.push_back(std::move(root));
  }

  /**
   * Append a child under parent
   *
   * Sets the back-reference, depth and deterministic id. Counting the new
   * node in the search metrics is the caller's job.
   *
   * @return Index of the new child
   * @throws std::invalid_argument if parent is not a valid index
   */
  NodeIndex add_child(NodeIndex parent, std::string thought) {
    check(parent);
    Node child;
    child.parent = parent;
    child.depth = nodes_[parent].depth + 1;
    child.id = nodes_[parent].id + "-" + std::to_string(nodes_[parent].children.size());
    child.thought_diff = thought;
    child.partial_thought = std::move(thought);

    NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(std::move(child));
    nodes_[parent].children.push_back(idx);
    return idx;
  }

  Node& at(NodeIndex idx) {
    check(idx);
    return nodes_[idx];
  }

  const Node& at(NodeIndex idx) const {
    check(idx);
    return nodes_[idx];
  }

  Node& root() { return nodes_[ROOT_NODE]; }
  const Node& root() const { return nodes_[ROOT_NODE]; }

  /** Number of nodes, root included */
  int size() const { return static_cast<int>(nodes_.size()); }

  /**
   * UCT score of a visited node
   *
   * q + c * sqrt(ln(parent.visits + 1) / (visits + eps))
   *
   * Selection never calls this on unvisited children; it picks those first.
   */
  double ucb(NodeIndex idx, double c) const {
    const Node& node = at(idx);
    int parent_visits = node.parent == INVALID_NODE ? 0 : nodes_[node.parent].visit_count;
    double exploration =
        c * std::sqrt(std::log(static_cast<double>(parent_visits) + 1.0) /
                      (static_cast<double>(node.visit_count) + UCB_EPSILON));
    return node.q_value + exploration;
  }

  /**
   * Indices from root to idx (inclusive)
   */
  std::vector<NodeIndex> path_to(NodeIndex idx) const {
    check(idx);
    std::vector<NodeIndex> path;
    while (idx != INVALID_NODE) {
      path.push_back(idx);
      idx = nodes_[idx].parent;
    }
    return {path.rbegin(), path.rend()};
  }

  /**
   * Thoughts from root to idx (inclusive)
   */
  std::vector<std::string> get_full_path(NodeIndex idx) const {
    std::vector<std::string> thoughts;
    for (NodeIndex i : path_to(idx)) {
      thoughts.push_back(nodes_[i].partial_thought);
    }
    return thoughts;
  }

  /**
   * All leaves in breadth-first order
   */
  std::vector<NodeIndex> leaves() const {
    std::vector<NodeIndex> out;
    std::vector<NodeIndex> queue{ROOT_NODE};
    for (size_t head = 0; head < queue.size(); ++head) {
      const Node& node = nodes_[queue[head]];
      if (node.is_leaf()) {
        out.push_back(queue[head]);
      } else {
        queue.insert(queue.end(), node.children.begin(), node.children.end());
      }
    }
    return out;
  }

  int max_depth() const {
    int deepest = 0;
    for (const Node& node : nodes_) {
      if (node.depth > deepest) deepest = node.depth;
    }
    return deepest;
  }

  /**
   * Look up a node by id
   *
   * @return Index, or INVALID_NODE if absent
   */
  NodeIndex find(const std::string& id) const {
    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (nodes_[i].id == id) return static_cast<NodeIndex>(i);
    }
    return INVALID_NODE;
  }

  /**
   * Nested JSON dump of the tree
   *
   * Children always sit at higher indices than their parent, so walking
   * the arena backwards finishes every subtree before its parent needs it.
   */
  nlohmann::json to_json() const {
    std::vector<nlohmann::json> built(nodes_.size());
    for (size_t i = nodes_.size(); i-- > 0;) {
      const Node& node = nodes_[i];
      nlohmann::json children = nlohmann::json::array();
      for (NodeIndex c : node.children) {
        children.push_back(std::move(built[c]));
      }
      built[i] = {
        {"id", node.id},
        {"thought", truncate(node.partial_thought, 50)},
        {"q_value", std::round(node.q_value * 1000.0) / 1000.0},
        {"visit_count", node.visit_count},
        {"thought_score", node.thought_score
                              ? nlohmann::json(std::round(*node.thought_score * 1000.0) / 1000.0)
                              : nlohmann::json(nullptr)},
        {"is_promising", node.is_promising},
        {"is_terminal", node.is_terminal},
        {"depth", node.depth},
        {"children", std::move(children)},
      };
    }
    return std::move(built[ROOT_NODE]);
  }

private:
  void check(NodeIndex idx) const {
    if (idx < 0 || idx >= static_cast<NodeIndex>(nodes_.size())) {
      throw std::invalid_argument("Tree: invalid node index " + std::to_string(idx));
    }
  }

  std::vector<Node> nodes_;
};

}  // namespace lats
