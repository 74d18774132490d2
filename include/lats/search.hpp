#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file search.hpp
 * @brief LATS search engine: MCTS over LLM-generated thoughts
 *
 * Each iteration runs, strictly in sequence:
 * 1. Selection: UCT walk from the root (unvisited children first)
 * 2. Expansion: generate up to k thoughts under a non-terminal node above
 *    max_depth, so the tree never grows deeper than max_depth
 * 3. Simulation: score a strategy (leaf) or a thought (intermediate)
 * 4. Backpropagation: fold the reward into every node up to the root
 * then charges the phase tokens and checks the stop conditions.
 *
 * Selection reads the whole tree, so iterations cannot run concurrently.
 * The engine is the only writer of the tree.
 *
 * Failure tiers:
 * - Fatal: expansion or strategy-generation errors propagate out of
 *   search(). The partial tree stays readable through tree().
 * - Recoverable: sandbox errors and low scores become reward 0 / low
 *   reward plus a reflexion message.
 * - Degrade: evaluation failures score 0.5; event callback, winning-path
 *   and experience-store failures are logged and counted in metrics.
 *
 * Example usage:
 *
 *   #include <lats/search.hpp>
 *
 *   lats::MCTSConfig config;
 *   config.max_iterations = 30;
 *   config.max_depth = 3;
 *
 *   lats::SearchEngine engine(executor, scorer, config);
 *   lats::SearchResult result = engine.search(problem, {{"problem_type", "bugfix"}});
 *   if (result.best_strategy_id) apply(*result.best_strategy_id);
 */

#include "backprop.hpp"
#include "budget.hpp"
#include "common.hpp"
#include "config.hpp"
#include "events.hpp"
#include "expansion.hpp"
#include "ports.hpp"
#include "reflexion.hpp"
#include "selection.hpp"
#include "simulation.hpp"
#include "termination.hpp"
#include "thought_evaluator.hpp"
#include "tokens.hpp"
#include "tree.hpp"
#include "winning_path.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lats {

/** Strategy score at or above which a strategy counts as passed */
constexpr double PASS_THRESHOLD = 0.6;

/** Q-value at or above which a strategy is recommended outright */
constexpr double RECOMMEND_THRESHOLD = 0.7;

/**
 * Per-strategy summary derived from tree statistics
 */
struct StrategyScore {
  std::string strategy_id;
  /** Leaf Q-value */
  double total_score = 0.0;
  /** Leaf visits / root visits */
  double confidence = 0.0;
  std::string recommendation;

  nlohmann::json to_json() const {
    return {
      {"strategy_id", strategy_id},
      {"total_score", total_score},
      {"confidence", confidence},
      {"recommendation", recommendation},
    };
  }
};

/**
 * Outcome of one search run
 */
struct SearchResult {
  std::vector<Strategy> all_strategies;
  /** Strategies whose sandbox run returned a result */
  std::vector<Strategy> executed_strategies;
  std::map<std::string, StrategyScore> scores;
  std::optional<std::string> best_strategy_id;
  double best_score = 0.0;
  int total_generated = 0;
  int total_executed = 0;
  int total_passed = 0;
  SearchMetrics metrics;
  TerminationState termination = TerminationState::Running;
  /** Read-only trace of the best strategy */
  std::optional<const WinningPath> winning_path;
  /** Log file the winning path was appended to, when persisted */
  std::optional<std::filesystem::path> winning_path_file;

  nlohmann::json to_json() const {
    nlohmann::json score_map = nlohmann::json::object();
    for (const auto& [id, score] : scores) score_map[id] = score.to_json();

    nlohmann::json all = nlohmann::json::array();
    for (const auto& s : all_strategies) all.push_back(s.to_json());

    return {
      {"all_strategies", std::move(all)},
      {"scores", std::move(score_map)},
      {"best_strategy_id", best_strategy_id ? nlohmann::json(*best_strategy_id)
                                            : nlohmann::json(nullptr)},
      {"best_score", best_score},
      {"total_generated", total_generated},
      {"total_executed", total_executed},
      {"total_passed", total_passed},
      {"termination", termination_state_name(termination)},
      {"lats_metrics", metrics.to_json()},
    };
  }
};

class SearchEngine {
public:
  /**
   * Construct a search engine
   *
   * @param executor Thought/strategy generation and sandbox port
   * @param scorer Rubric applied to executed strategies
   * @param config Search configuration (validated here)
   * @param on_event Lifecycle callback (optional)
   * @param experience Long-term store mirrored on success (optional, not owned)
   * @throws std::invalid_argument on an invalid config
   */
  SearchEngine(Executor& executor,
               Scorer& scorer,
               MCTSConfig config = MCTSConfig{},
               EventCallback on_event = nullptr,
               ExperienceRepository* experience = nullptr)
      : executor_(executor),
        scorer_(scorer),
        config_(std::move(config)),
        emitter_(std::move(on_event)),
        experience_(experience),
        usage_(std::make_shared<TokenCountingEstimator>()) {
    config_.validate();
    LATS_LOG_INFO("[search::init] max_iter=%d max_depth=%d k=%d reflexion=%d experience_store=%d",
                  config_.max_iterations, config_.max_depth, config_.strategies_per_expansion,
                  config_.enable_reflexion ? 1 : 0, experience_ ? 1 : 0);
  }

  /**
   * Score intermediate thoughts with the hybrid evaluator instead of
   * Executor::evaluate_thought
   *
   * The judge is called with config().verifier_model and
   * config().temperature_evaluation. An empty judge restores
   * Executor::evaluate_thought.
   *
   * @param judge Reviewer model call
   * @param syntax_check Snippet checker (empty: balanced delimiters)
   */
  void set_judge(JudgeFn judge, SyntaxCheckFn syntax_check = nullptr) {
    if (!judge) {
      evaluator_.reset();
      return;
    }
    evaluator_ = std::make_shared<const ThoughtEvaluator>(
        std::move(judge), config_.verifier_model, config_.temperature_evaluation,
        std::move(syntax_check));
  }

  /** Hybrid evaluator installed by set_judge(), or nullptr */
  const ThoughtEvaluator* thought_evaluator() const { return evaluator_.get(); }

  /**
   * Replace the token usage estimator (nullptr restores the default)
   */
  void set_usage_estimator(std::shared_ptr<const UsageEstimator> usage) {
    usage_ = usage ? std::move(usage) : std::make_shared<TokenCountingEstimator>();
  }

  /**
   * Run the search for one problem
   *
   * Any previous tree is discarded.
   *
   * @param problem Problem statement (root thought)
   * @param context JSON object forwarded to the executor ("problem_type" is
   *        recorded in the winning path)
   * @param cancel Cooperative cancellation flag, read between iterations
   * @throws std::invalid_argument if context is neither null nor an object
   * @throws whatever expansion or strategy generation throws
   */
  SearchResult search(const std::string& problem,
                      const Context& context = Context::object(),
                      const CancellationToken* cancel = nullptr) {
    if (!context.is_null() && !context.is_object()) {
      throw std::invalid_argument("SearchEngine::search: context must be a JSON object");
    }
    const Context ctx = context.is_null() ? Context::object() : context;

    tree_ = std::make_unique<Tree>(problem);
    metrics_ = SearchMetrics{};
    state_ = TerminationState::Running;

    LATS_LOG_INFO("[search::run] Starting search: %s", truncate(problem, 50).c_str());
    if (config_.seed) {
      LATS_LOG_INFO("[search::run] seed=%u (deterministic mode)", *config_.seed);
    }
    emit({EventType::SearchStart, 0, tree_->root().id,
          "Starting LATS search: " + truncate(problem, 50)});

    try {
      run_loop(problem, ctx, cancel);
    } catch (const std::exception& e) {
      metrics_.end_time = SearchMetrics::Clock::now();
      LATS_LOG_ERROR("[search::run] Aborted at iteration %d: %s",
                     metrics_.iterations_completed + 1, e.what());
      throw;
    }

    metrics_.end_time = SearchMetrics::Clock::now();
    LATS_LOG_INFO("[search::run] Completed (%s): %d iterations, %lld tokens, $%.2f, %.1fs",
                  termination_state_name(state_), metrics_.iterations_completed,
                  static_cast<long long>(metrics_.total_tokens_used),
                  metrics_.total_cost_usd, metrics_.duration_seconds());

    SearchResult result = build_result();

    if (result.best_strategy_id) {
      if (auto path = winning_path::extract(*tree_, problem, ctx, config_, metrics_)) {
        result.winning_path.emplace(std::move(*path));
      }
      if (result.winning_path && config_.save_winning_paths) {
        result.winning_path_file = persist(*result.winning_path);
      }
    }

    if (config_.tree_dump_path) {
      dump_tree(*config_.tree_dump_path);
    }

    nlohmann::json end_meta = {
      {"total_tokens", metrics_.total_tokens_used},
      {"total_cost", metrics_.total_cost_usd},
      {"best_score", result.best_score},
      {"termination", termination_state_name(state_)},
    };
    emit({EventType::SearchEnd, metrics_.iterations_completed, "",
          "LATS search completed", std::move(end_meta)});

    // Persistence and callback failures land after build_result()
    result.metrics = metrics_;

    return result;
  }

  /** Tree of the last (or aborted) run; nullptr before the first search */
  const Tree* tree() const { return tree_.get(); }

  const SearchMetrics& metrics() const { return metrics_; }

  TerminationState state() const { return state_; }

  const MCTSConfig& config() const { return config_; }

  /**
   * JSON dump of the current tree with metrics
   *
   * @throws std::logic_error before the first search
   */
  nlohmann::json tree_to_json() const {
    if (!tree_) throw std::logic_error("SearchEngine::tree_to_json: no search has run");
    return {
      {"problem", truncate(tree_->root().partial_thought, 100)},
      {"total_nodes", tree_->size()},
      {"max_depth", tree_->max_depth()},
      {"metrics", metrics_.to_json()},
      {"tree", tree_->to_json()},
    };
  }

private:
  void run_loop(const std::string& problem, const Context& ctx, const CancellationToken* cancel) {
    ReflexionPropagator reflexion;
    const ReflexionPropagator* reflexion_ptr = config_.enable_reflexion ? &reflexion : nullptr;

    BudgetTracker budget(config_, metrics_);
    TerminationPolicy policy(config_);
    ExpansionEngine expansion(executor_, config_, *usage_, reflexion_ptr);
    SimulationEngine simulation(executor_, scorer_, config_, *usage_, reflexion_ptr,
                                evaluator_.get());

    for (int iteration = 1; iteration <= config_.max_iterations; ++iteration) {
      if (cancel && cancel->is_cancelled()) {
        LATS_LOG_WARN("[search::run] Cancelled before iteration %d", iteration);
        state_ = TerminationState::Cancelled;
        return;
      }

      LATS_LOG_DEBUG("[search::run] Iteration %d/%d", iteration, config_.max_iterations);
      emit({EventType::IterationStart, iteration, "",
            "Iteration " + std::to_string(iteration) + "/" +
                std::to_string(config_.max_iterations)});

      // 1. Selection
      NodeIndex idx = selection::select(*tree_, config_);
      emit({EventType::Selection, iteration, tree_->at(idx).id,
            "Selected node: " + tree_->at(idx).id,
            {{"q_value", tree_->at(idx).q_value},
             {"visit_count", tree_->at(idx).visit_count}}});

      // 2. Expansion (nodes at max_depth are simulated, never grown)
      if (!tree_->at(idx).is_terminal && tree_->at(idx).depth < config_.max_depth) {
        emit({EventType::Expansion, iteration, tree_->at(idx).id,
              "Expanding node (generating thoughts)"});
        ExpansionOutcome grown = expansion.expand(*tree_, idx, problem, ctx, metrics_);
        budget.charge(Phase::Expansion, grown.estimated_tokens);
        idx = grown.simulate;
      }

      // 3. Simulation
      emit({EventType::SimulationStart, iteration, tree_->at(idx).id, "Simulating node"});
      SimulationOutcome sim = simulation.simulate(*tree_, idx, problem, ctx, metrics_);
      budget.charge(Phase::Simulation, sim.estimated_tokens);

      char msg[64];
      std::snprintf(msg, sizeof(msg), "Simulation complete: value=%.2f", sim.reward);
      emit({EventType::SimulationEnd, iteration, tree_->at(idx).id, msg,
            {{"value", sim.reward}, {"leaf", sim.leaf}}});

      // 4. Backpropagation
      emit({EventType::Backpropagation, iteration, tree_->at(idx).id, "Updating Q-values"});
      backprop::backpropagate(*tree_, idx, sim.reward);

      metrics_.iterations_completed = iteration;

      state_ = policy.check(*tree_, metrics_, cancel);
      bool over_budget = state_ == TerminationState::BudgetExceeded;
      emit({EventType::BudgetCheck, iteration, "",
            over_budget ? "Budget exceeded" : "Budget ok",
            {{"tokens", metrics_.total_tokens_used},
             {"cost", metrics_.total_cost_usd},
             {"exceeded", over_budget}}});

      switch (state_) {
        case TerminationState::Running:
          continue;
        case TerminationState::Cancelled:
          LATS_LOG_WARN("[search::run] Cancelled after iteration %d", iteration);
          return;
        case TerminationState::BudgetExceeded:
          LATS_LOG_WARN("[search::run] Budget exceeded: tokens %lld/%lld, cost $%.2f/$%.2f",
                        static_cast<long long>(metrics_.total_tokens_used),
                        static_cast<long long>(config_.max_total_tokens),
                        metrics_.total_cost_usd, config_.max_cost_usd);
          return;
        case TerminationState::EarlyGiveup:
          LATS_LOG_WARN("[search::run] Early give-up at iteration %d", iteration);
          emit({EventType::EarlyGiveup, iteration, "", "Low confidence, giving up"});
          return;
        case TerminationState::EarlyStop:
          LATS_LOG_INFO("[search::run] Early stop at iteration %d", iteration);
          emit({EventType::EarlyStop, iteration, "", "Early stop (good solution found)"});
          return;
        case TerminationState::MaxIterations:
          return;
      }
    }
    state_ = TerminationState::MaxIterations;
  }

  SearchResult build_result() const {
    SearchResult result;
    result.termination = state_;
    result.metrics = metrics_;

    const Node& root = tree_->root();
    for (NodeIndex idx : tree_->leaves()) {
      const Node& leaf = tree_->at(idx);
      if (!leaf.completed_strategy) continue;

      const Strategy& strategy = *leaf.completed_strategy;
      result.all_strategies.push_back(strategy);
      if (leaf.execution_result) result.executed_strategies.push_back(strategy);

      StrategyScore score;
      score.strategy_id = strategy.strategy_id;
      score.total_score = leaf.q_value;
      score.confidence = root.visit_count > 0
                             ? static_cast<double>(leaf.visit_count) / root.visit_count
                             : 0.0;
      score.recommendation = leaf.q_value >= RECOMMEND_THRESHOLD ? "LATS selected"
                                                                 : "Consider alternatives";
      result.scores[strategy.strategy_id] = score;
    }

    result.total_generated = static_cast<int>(result.all_strategies.size());
    result.total_executed = static_cast<int>(result.executed_strategies.size());
    for (const auto& strategy : result.all_strategies) {
      auto it = result.scores.find(strategy.strategy_id);
      if (it != result.scores.end() && it->second.total_score >= PASS_THRESHOLD) {
        result.total_passed += 1;
      }
    }

    NodeIndex best = winning_path::best_leaf(*tree_);
    if (best != INVALID_NODE) {
      result.best_strategy_id = tree_->at(best).completed_strategy->strategy_id;
      result.best_score = tree_->at(best).q_value;
    }
    return result;
  }

  /**
   * Append the winning path once and mirror it to the experience store
   *
   * @note This function never throws.
   */
  std::optional<std::filesystem::path> persist(const WinningPath& path) {
    std::optional<std::filesystem::path> file;
    try {
      file = WinningPathStore(config_.winning_path_dir).append(path);
    } catch (const std::exception& e) {
      metrics_.persistence_failures += 1;
      LATS_LOG_WARN("[search::persist] Failed to save winning path: %s", e.what());
    }

    if (experience_) {
      try {
        experience_->save(winning_path::to_experience(path));
        LATS_LOG_INFO("[search::persist] Winning path saved to experience store");
      } catch (const std::exception& e) {
        metrics_.persistence_failures += 1;
        LATS_LOG_WARN("[search::persist] Failed to save to experience store: %s", e.what());
      }
    }
    return file;
  }

  /**
   * @note This function never throws.
   */
  void dump_tree(const std::string& file) const {
    try {
      std::ofstream out(file);
      if (!out) throw std::runtime_error("cannot open " + file);
      out << tree_to_json().dump(2);
      LATS_LOG_INFO("[search::dump_tree] Tree dumped to %s", file.c_str());
    } catch (const std::exception& e) {
      LATS_LOG_WARN("[search::dump_tree] Failed: %s", e.what());
    }
  }

  void emit(const Event& event) {
    if (!emitter_.emit(event)) metrics_.callback_failures += 1;
  }

  Executor& executor_;
  Scorer& scorer_;
  MCTSConfig config_;
  EventEmitter emitter_;
  ExperienceRepository* experience_;
  std::shared_ptr<const UsageEstimator> usage_;
  std::shared_ptr<const ThoughtEvaluator> evaluator_;

  std::unique_ptr<Tree> tree_;
  SearchMetrics metrics_;
  TerminationState state_ = TerminationState::Running;
};

}  // namespace lats
