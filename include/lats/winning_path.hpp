#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file winning_path.hpp
 * @brief Winning-path extraction and the append-only trace log
 *
 * After a run, the best strategy is the completed leaf with the highest
 * visit count (ties: first in breadth-first order). Its root-to-leaf
 * thought sequence, code changes and run statistics form one WinningPath
 * record, appended as a single JSON line to
 *
 *   <dir>/<YYYYmmdd_HHMMSS>_<hash(problem) mod 10000, 4 digits>.jsonl
 *
 * The hash is 32-bit FNV-1a so file names are stable across builds.
 *
 * @example
 * @code
 *   lats::WinningPathStore store("data/lats/winning_paths");
 *   auto file = store.append(path);                  // throws on I/O error
 *   auto records = lats::WinningPathStore::load(file);
 * @endcode
 */

#include "budget.hpp"
#include "common.hpp"
#include "config.hpp"
#include "ports.hpp"
#include "strategy.hpp"
#include "tree.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lats {

/** Minimum final Q-value for an ACCEPT verdict */
constexpr double ACCEPT_THRESHOLD = 0.6;

/**
 * Trace of the best strategy found by one successful run
 */
struct WinningPath {
  std::string problem_description;
  std::string problem_type;
  std::vector<std::string> thought_sequence;
  std::string final_strategy_id;
  std::map<std::string, std::string> final_code_changes;
  double final_q_value = 0.0;
  int total_iterations = 0;
  int total_nodes_explored = 0;
  nlohmann::json execution_result = nlohmann::json::object();
  std::string reflection_verdict;
  std::string llm_model;
  nlohmann::json config = nlohmann::json::object();

  nlohmann::json to_json() const {
    return {
      {"problem_description", problem_description},
      {"problem_type", problem_type},
      {"thought_sequence", thought_sequence},
      {"final_strategy_id", final_strategy_id},
      {"final_code_changes", final_code_changes},
      {"final_q_value", final_q_value},
      {"total_iterations", total_iterations},
      {"total_nodes_explored", total_nodes_explored},
      {"execution_result", execution_result},
      {"reflection_verdict", reflection_verdict},
      {"llm_model", llm_model},
      {"lats_config", config},
    };
  }

  /** Single-line JSON record (newline included) */
  std::string to_jsonl() const { return to_json().dump() + "\n"; }

  /**
   * @throws nlohmann::json::exception on missing required keys
   */
  static WinningPath from_json(const nlohmann::json& j) {
    WinningPath w;
    w.problem_description = j.at("problem_description").get<std::string>();
    w.problem_type = j.value("problem_type", std::string("unknown"));
    w.thought_sequence = j.at("thought_sequence").get<std::vector<std::string>>();
    w.final_strategy_id = j.at("final_strategy_id").get<std::string>();
    w.final_code_changes = j.value("final_code_changes", std::map<std::string, std::string>{});
    w.final_q_value = j.value("final_q_value", 0.0);
    w.total_iterations = j.value("total_iterations", 0);
    w.total_nodes_explored = j.value("total_nodes_explored", 0);
    w.execution_result = j.value("execution_result", nlohmann::json::object());
    w.reflection_verdict = j.value("reflection_verdict", std::string{});
    w.llm_model = j.value("llm_model", std::string{});
    w.config = j.value("lats_config", nlohmann::json::object());
    return w;
  }
};

namespace winning_path {

/**
 * Best completed leaf: highest visit count, first on ties
 *
 * @return INVALID_NODE when no leaf holds a completed strategy
 */
inline NodeIndex best_leaf(const Tree& tree) {
  NodeIndex best = INVALID_NODE;
  for (NodeIndex idx : tree.leaves()) {
    const Node& leaf = tree.at(idx);
    if (!leaf.completed_strategy) continue;
    if (best == INVALID_NODE || leaf.visit_count > tree.at(best).visit_count) {
      best = idx;
    }
  }
  return best;
}

/**
 * Build the WinningPath record for the best leaf
 *
 * A non-string context "problem_type" is recorded as "unknown".
 *
 * @return nullopt when the run produced no completed strategy
 */
inline std::optional<WinningPath> extract(const Tree& tree,
                                          const std::string& problem,
                                          const Context& context,
                                          const MCTSConfig& config,
                                          const SearchMetrics& metrics) {
  NodeIndex idx = best_leaf(tree);
  if (idx == INVALID_NODE) return std::nullopt;

  const Node& leaf = tree.at(idx);
  WinningPath w;
  w.problem_description = problem;
  w.problem_type = "unknown";
  if (context.is_object()) {
    auto type = context.find("problem_type");
    if (type != context.end() && type->is_string()) w.problem_type = type->get<std::string>();
  }
  w.thought_sequence = tree.get_full_path(idx);
  w.final_strategy_id = leaf.completed_strategy->strategy_id;
  w.final_code_changes = leaf.completed_strategy->file_changes;
  w.final_q_value = leaf.q_value;
  w.total_iterations = metrics.iterations_completed;
  w.total_nodes_explored = metrics.nodes_created;
  w.execution_result = leaf.execution_result ? leaf.execution_result->to_json()
                                             : nlohmann::json::object();
  bool executed = leaf.execution_result && leaf.execution_result->success;
  w.reflection_verdict = executed && leaf.q_value >= ACCEPT_THRESHOLD ? "ACCEPT" : "REVISE";
  w.llm_model = config.generator_model;
  w.config = config.to_json();
  return w;
}

/**
 * Long-term experience entry for a winning path
 */
inline ExperienceRecord to_experience(const WinningPath& w) {
  ExperienceRecord r;
  r.problem_description = w.problem_description;
  r.problem_type = w.problem_type;
  r.strategy_id = w.final_strategy_id;
  for (const auto& entry : w.final_code_changes) {
    r.file_paths.push_back(entry.first);
  }
  r.success = w.reflection_verdict == "ACCEPT";
  r.score = w.final_q_value;
  r.reflection_verdict = w.reflection_verdict;
  auto rate = w.execution_result.find("test_pass_rate");
  if (rate != w.execution_result.end() && rate->is_number()) {
    r.test_pass_rate = rate->get<double>();
  }
  r.tags = {"lats", "iterations_" + std::to_string(w.total_iterations)};
  return r;
}

/** 32-bit FNV-1a */
inline uint32_t problem_hash(const std::string& text) {
  uint32_t h = 2166136261u;
  for (unsigned char ch : text) {
    h ^= ch;
    h *= 16777619u;
  }
  return h;
}

/**
 * Log file name for a problem at a given time
 */
inline std::string filename_for(const std::string& problem,
                                std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

  char name[64];
  std::snprintf(name, sizeof(name), "%s_%04u.jsonl", stamp,
                static_cast<unsigned>(problem_hash(problem) % 10000u));
  return name;
}

}  // namespace winning_path

/**
 * Append-only JSONL log of winning paths
 */
class WinningPathStore {
public:
  explicit WinningPathStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

  /**
   * Append one record, creating the directory if needed
   *
   * @return File the record was written to
   * @throws std::runtime_error on I/O failure
   */
  std::filesystem::path append(const WinningPath& path,
                               std::chrono::system_clock::time_point when =
                                   std::chrono::system_clock::now()) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
      throw std::runtime_error("WinningPathStore: cannot create " + dir_.string() +
                               ": " + ec.message());
    }

    std::filesystem::path file = dir_ / winning_path::filename_for(path.problem_description, when);
    std::ofstream out(file, std::ios::app);
    if (!out) {
      throw std::runtime_error("WinningPathStore: cannot open " + file.string());
    }
    out << path.to_jsonl();
    out.flush();
    if (!out) {
      throw std::runtime_error("WinningPathStore: write failed for " + file.string());
    }

    LATS_LOG_INFO("[winning_path::append] Saved winning path to %s", file.string().c_str());
    return file;
  }

  /**
   * Read every record of a JSONL file, skipping blank lines
   *
   * @throws std::runtime_error if the file cannot be opened
   * @throws nlohmann::json::exception on malformed records
   */
  static std::vector<WinningPath> load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
      throw std::runtime_error("WinningPathStore: cannot open " + file.string());
    }
    std::vector<WinningPath> out;
    std::string line;
    while (std::getline(in, line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      out.push_back(WinningPath::from_json(nlohmann::json::parse(line)));
    }
    return out;
  }

private:
  std::filesystem::path dir_;
};

}  // namespace lats
