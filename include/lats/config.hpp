#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file config.hpp
 * @brief Search configuration
 *
 * MCTSConfig collects every knob of the tree search: iteration/depth
 * limits, UCT exploration, branching factor, termination thresholds,
 * the token/cost budget, and the persistence switches.
 *
 * Configs round-trip through nlohmann::json. Missing keys keep their
 * defaults and unknown keys are ignored, so a partial JSON file is a
 * valid override of the defaults.
 *
 * @example
 * @code
 *   auto cfg = lats::MCTSConfig::from_json(nlohmann::json::parse(text));
 *   cfg.validate();  // throws std::invalid_argument on bad values
 * @endcode
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace lats {

/**
 * Configuration for the LATS tree search
 */
struct MCTSConfig {
  /** Maximum number of MCTS iterations (default 100) */
  int max_iterations = 100;

  /** Maximum tree depth; nodes at max_depth-1 are simulated as leaves (default 5) */
  int max_depth = 5;

  /** UCT exploration constant c (default 1.4) */
  double exploration_constant = 1.4;

  /** Branching factor k: thoughts requested per expansion (default 3) */
  int strategies_per_expansion = 3;

  /** Thought score at or above which a node is marked promising (default 0.5) */
  double thought_eval_threshold = 0.5;

  /** Any leaf Q-value at or above this stops the search with success (default 0.9) */
  double early_stop_threshold = 0.9;

  /** Abandon low-confidence problems (default true) */
  bool enable_early_giveup = true;

  /** Iterations that must elapse before give-up is considered (default 20) */
  int early_giveup_iterations = 20;

  /** Give up when the best leaf Q-value is below this (default 0.2) */
  double early_giveup_threshold = 0.2;

  /** Token ceiling for the whole run (default 50000) */
  int64_t max_total_tokens = 50000;

  /** Cost ceiling in USD for the whole run (default 5.0) */
  double max_cost_usd = 5.0;

  /** Price per 1000 tokens in USD (default 0.01) */
  double cost_per_1k_tokens = 0.01;

  /** Optional seed for deterministic generation */
  std::optional<uint32_t> seed;

  /** Model that generates thoughts and strategies (recorded in winning paths) */
  std::string generator_model = "gpt-4o";

  /** Model used as the critical reviewer in thought evaluation */
  std::string verifier_model = "claude-3.5-sonnet";

  /** Sampling temperature for the reviewer model (default 0.2) */
  double temperature_evaluation = 0.2;

  /** Propagate failure reasons to parents (default true) */
  bool enable_reflexion = true;

  /** Append the winning path of successful runs to a JSONL log (default true) */
  bool save_winning_paths = true;

  /** Directory for winning-path logs */
  std::string winning_path_dir = "data/lats/winning_paths";

  /** Write a JSON dump of the final tree here when set */
  std::optional<std::string> tree_dump_path;

  /**
   * Check value ranges
   *
   * @throws std::invalid_argument naming the first offending field
   */
  void validate() const {
    if (max_iterations < 1) {
      throw std::invalid_argument("MCTSConfig: max_iterations must be >= 1");
    }
    if (max_depth < 1) {
      throw std::invalid_argument("MCTSConfig: max_depth must be >= 1");
    }
    if (exploration_constant < 0.0) {
      throw std::invalid_argument("MCTSConfig: exploration_constant must be >= 0");
    }
    if (strategies_per_expansion < 1) {
      throw std::invalid_argument("MCTSConfig: strategies_per_expansion must be >= 1");
    }
    if (thought_eval_threshold < 0.0 || thought_eval_threshold > 1.0) {
      throw std::invalid_argument("MCTSConfig: thought_eval_threshold must be in [0, 1]");
    }
    if (early_stop_threshold < 0.0 || early_stop_threshold > 1.0) {
      throw std::invalid_argument("MCTSConfig: early_stop_threshold must be in [0, 1]");
    }
    if (early_giveup_iterations < 0) {
      throw std::invalid_argument("MCTSConfig: early_giveup_iterations must be >= 0");
    }
    if (early_giveup_threshold < 0.0 || early_giveup_threshold > 1.0) {
      throw std::invalid_argument("MCTSConfig: early_giveup_threshold must be in [0, 1]");
    }
    if (max_total_tokens < 0) {
      throw std::invalid_argument("MCTSConfig: max_total_tokens must be >= 0");
    }
    if (max_cost_usd < 0.0) {
      throw std::invalid_argument("MCTSConfig: max_cost_usd must be >= 0");
    }
    if (cost_per_1k_tokens < 0.0) {
      throw std::invalid_argument("MCTSConfig: cost_per_1k_tokens must be >= 0");
    }
  }

  nlohmann::json to_json() const {
    nlohmann::json j = {
      {"max_iterations", max_iterations},
      {"max_depth", max_depth},
      {"exploration_constant", exploration_constant},
      {"strategies_per_expansion", strategies_per_expansion},
      {"thought_eval_threshold", thought_eval_threshold},
      {"early_stop_threshold", early_stop_threshold},
      {"enable_early_giveup", enable_early_giveup},
      {"early_giveup_iterations", early_giveup_iterations},
      {"early_giveup_threshold", early_giveup_threshold},
      {"max_total_tokens", max_total_tokens},
      {"max_cost_usd", max_cost_usd},
      {"cost_per_1k_tokens", cost_per_1k_tokens},
      {"generator_model", generator_model},
      {"verifier_model", verifier_model},
      {"temperature_evaluation", temperature_evaluation},
      {"enable_reflexion", enable_reflexion},
      {"save_winning_paths", save_winning_paths},
      {"winning_path_dir", winning_path_dir},
    };
    j["seed"] = seed ? nlohmann::json(*seed) : nlohmann::json(nullptr);
    if (tree_dump_path) j["tree_dump_path"] = *tree_dump_path;
    return j;
  }

  /**
   * Build a config from JSON, keeping defaults for absent keys
   *
   * @throws nlohmann::json::type_error if a present key has the wrong type
   */
  static MCTSConfig from_json(const nlohmann::json& j) {
    MCTSConfig c;
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    c.max_depth = j.value("max_depth", c.max_depth);
    c.exploration_constant = j.value("exploration_constant", c.exploration_constant);
    c.strategies_per_expansion = j.value("strategies_per_expansion", c.strategies_per_expansion);
    c.thought_eval_threshold = j.value("thought_eval_threshold", c.thought_eval_threshold);
    c.early_stop_threshold = j.value("early_stop_threshold", c.early_stop_threshold);
    c.enable_early_giveup = j.value("enable_early_giveup", c.enable_early_giveup);
    c.early_giveup_iterations = j.value("early_giveup_iterations", c.early_giveup_iterations);
    c.early_giveup_threshold = j.value("early_giveup_threshold", c.early_giveup_threshold);
    c.max_total_tokens = j.value("max_total_tokens", c.max_total_tokens);
    c.max_cost_usd = j.value("max_cost_usd", c.max_cost_usd);
    c.cost_per_1k_tokens = j.value("cost_per_1k_tokens", c.cost_per_1k_tokens);
    c.generator_model = j.value("generator_model", c.generator_model);
    c.verifier_model = j.value("verifier_model", c.verifier_model);
    c.temperature_evaluation = j.value("temperature_evaluation", c.temperature_evaluation);
    c.enable_reflexion = j.value("enable_reflexion", c.enable_reflexion);
    c.save_winning_paths = j.value("save_winning_paths", c.save_winning_paths);
    c.winning_path_dir = j.value("winning_path_dir", c.winning_path_dir);

    auto seed_it = j.find("seed");
    if (seed_it != j.end() && !seed_it->is_null()) {
      c.seed = seed_it->get<uint32_t>();
    }
    auto dump_it = j.find("tree_dump_path");
    if (dump_it != j.end() && !dump_it->is_null()) {
      c.tree_dump_path = dump_it->get<std::string>();
    }
    return c;
  }
};

}  // namespace lats
