#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file ports.hpp
 * @brief Interfaces of the collaborators the search engine consumes
 *
 * The engine never branches on which model provider or sandbox sits behind
 * these interfaces; one adapter per provider implements them.
 *
 * Failure contract, as the engine treats it:
 * - Executor::generate_next_thoughts / generate_complete_strategy:
 *   any exception is fatal to the run and propagates to the caller.
 * - Executor::execute_strategy: any exception is recoverable; the leaf is
 *   scored 0 and the error text is fed to reflexion.
 * - Executor::evaluate_thought: any exception degrades to a 0.5 score.
 * - ExperienceRepository::save: best-effort; failures are logged.
 *
 * Calls are blocking. The engine owns no per-call timeout; adapters are
 * expected to enforce their own.
 */

#include "strategy.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lats {

/** Free-form search context forwarded to the executor (JSON object) */
using Context = nlohmann::json;

class Executor {
public:
  virtual ~Executor() = default;

  /**
   * Propose up to k next reasoning steps from the current node
   *
   * @param summary Length-bounded summary of the node being expanded
   * @param problem Problem statement
   * @param context Search context (may carry "rejection_context" and "seed")
   * @param k Number of thoughts requested
   */
  virtual std::vector<std::string> generate_next_thoughts(const std::string& summary,
                                                          const std::string& problem,
                                                          const Context& context,
                                                          int k) = 0;

  /**
   * Turn a root-to-leaf thought path into an executable strategy
   */
  virtual Strategy generate_complete_strategy(const std::vector<std::string>& thought_path,
                                              const std::string& problem,
                                              const Context& context) = 0;

  /**
   * Run a strategy in the sandbox
   */
  virtual ExecutionResult execute_strategy(const Strategy& strategy) = 0;

  /**
   * Score an intermediate thought in [0, 1]
   */
  virtual double evaluate_thought(const std::string& partial_thought) = 0;
};

/**
 * Static rubric applied to an executed strategy
 */
class Scorer {
public:
  virtual ~Scorer() = default;
  virtual ScoreCard score(const Strategy& strategy, const ExecutionResult& result) = 0;
};

/**
 * Long-term experience entry mirrored from a winning path
 */
struct ExperienceRecord {
  std::string problem_description;
  std::string problem_type;
  std::string strategy_id;
  std::string strategy_type = "LATS";
  std::vector<std::string> file_paths;
  bool success = false;
  double score = 0.0;
  std::string reflection_verdict;
  std::optional<double> test_pass_rate;
  std::vector<std::string> tags;
};

class ExperienceRepository {
public:
  virtual ~ExperienceRepository() = default;
  virtual void save(const ExperienceRecord& record) = 0;
};

}  // namespace lats
