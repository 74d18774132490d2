#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file strategy.hpp
 * @brief Strategy, execution result and score value types
 *
 * These are the values exchanged with the external collaborators
 * (see ports.hpp). A Strategy is only ever produced at a terminal node.
 */

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace lats {

/**
 * A fully generated candidate solution
 */
struct Strategy {
  std::string strategy_id;
  std::string description;
  /** path -> new file content, ordered by path */
  std::map<std::string, std::string> file_changes;

  nlohmann::json to_json() const {
    return {
      {"strategy_id", strategy_id},
      {"description", description},
      {"file_changes", file_changes},
    };
  }

  static Strategy from_json(const nlohmann::json& j) {
    Strategy s;
    s.strategy_id = j.at("strategy_id").get<std::string>();
    s.description = j.value("description", std::string{});
    s.file_changes = j.value("file_changes", std::map<std::string, std::string>{});
    return s;
  }
};

/**
 * Outcome of running a strategy in the sandbox
 */
struct ExecutionResult {
  bool success = false;
  std::string output;
  std::string error;
  std::optional<double> test_pass_rate;
  double duration_seconds = 0.0;

  nlohmann::json to_json() const {
    nlohmann::json j = {
      {"success", success},
      {"output", output},
      {"error", error},
      {"duration_seconds", duration_seconds},
    };
    j["test_pass_rate"] = test_pass_rate ? nlohmann::json(*test_pass_rate)
                                         : nlohmann::json(nullptr);
    return j;
  }

  static ExecutionResult from_json(const nlohmann::json& j) {
    ExecutionResult r;
    r.success = j.value("success", false);
    r.output = j.value("output", std::string{});
    r.error = j.value("error", std::string{});
    r.duration_seconds = j.value("duration_seconds", 0.0);
    auto it = j.find("test_pass_rate");
    if (it != j.end() && !it->is_null()) {
      r.test_pass_rate = it->get<double>();
    }
    return r;
  }
};

/**
 * Static rubric score of an executed strategy
 */
struct ScoreCard {
  /** Overall score in [0, 1] */
  double total_score = 0.0;
  /** Free-text weaknesses reported by the scorer (may be empty) */
  std::string weaknesses;
};

}  // namespace lats
