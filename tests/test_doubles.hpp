#pragma once

/**
 * Hand-written collaborators for engine tests
 *
 * Plain classes implementing the ports; each records what it was asked so
 * tests can assert on call order and forwarded context.
 */

#include <lats/ports.hpp>
#include <lats/strategy.hpp>
#include <lats/tokens.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lats_test {

/**
 * Executor whose answers are produced by overridable callbacks
 *
 * Defaults: thoughts are "Add a bounds check to step <call>.<i>", strategies
 * get sequential ids, execution succeeds, thought evaluation returns 0.5.
 */
class ScriptedExecutor : public lats::Executor {
public:
  struct ExpandCall {
    std::string summary;
    lats::Context context;
    int k = 0;
  };

  std::function<std::vector<std::string>(int call, int k)> thoughts;
  std::function<void(int call)> before_strategy;
  std::function<lats::ExecutionResult(const lats::Strategy&)> execute;
  std::function<double(const std::string&)> evaluate;

  std::vector<ExpandCall> expand_calls;
  std::vector<std::vector<std::string>> strategy_paths;
  int strategy_calls = 0;
  int execute_calls = 0;
  int evaluate_calls = 0;

  std::vector<std::string> generate_next_thoughts(const std::string& summary,
                                                  const std::string& /*problem*/,
                                                  const lats::Context& context,
                                                  int k) override {
    int call = static_cast<int>(expand_calls.size()) + 1;
    expand_calls.push_back({summary, context, k});
    if (thoughts) return thoughts(call, k);

    std::vector<std::string> out;
    for (int i = 0; i < k; ++i) {
      out.push_back("Add a bounds check to step " + std::to_string(call) + "." +
                    std::to_string(i));
    }
    return out;
  }

  lats::Strategy generate_complete_strategy(const std::vector<std::string>& thought_path,
                                            const std::string& /*problem*/,
                                            const lats::Context& /*context*/) override {
    strategy_calls += 1;
    if (before_strategy) before_strategy(strategy_calls);
    strategy_paths.push_back(thought_path);

    lats::Strategy s;
    s.strategy_id = "strategy-" + std::to_string(strategy_calls);
    s.description = thought_path.back();
    s.file_changes["src/fix_" + std::to_string(strategy_calls) + ".py"] = "def fix():\n    return 1\n";
    return s;
  }

  lats::ExecutionResult execute_strategy(const lats::Strategy& strategy) override {
    execute_calls += 1;
    if (execute) return execute(strategy);
    lats::ExecutionResult r;
    r.success = true;
    r.output = "ok";
    return r;
  }

  double evaluate_thought(const std::string& partial_thought) override {
    evaluate_calls += 1;
    if (evaluate) return evaluate(partial_thought);
    return 0.5;
  }
};

/**
 * Scorer returning a fixed score, or one per call from a list
 */
class FixedScorer : public lats::Scorer {
public:
  explicit FixedScorer(double score, std::string weaknesses = "")
      : scores_{score}, weaknesses_(std::move(weaknesses)) {}

  explicit FixedScorer(std::vector<double> scores, std::string weaknesses = "")
      : scores_(std::move(scores)), weaknesses_(std::move(weaknesses)) {}

  int calls = 0;

  lats::ScoreCard score(const lats::Strategy& /*strategy*/,
                        const lats::ExecutionResult& /*result*/) override {
    size_t i = static_cast<size_t>(calls);
    calls += 1;
    lats::ScoreCard card;
    card.total_score = i < scores_.size() ? scores_[i] : scores_.back();
    card.weaknesses = weaknesses_;
    return card;
  }

private:
  std::vector<double> scores_;
  std::string weaknesses_;
};

class RecordingRepository : public lats::ExperienceRepository {
public:
  std::vector<lats::ExperienceRecord> saved;
  bool fail = false;

  void save(const lats::ExperienceRecord& record) override {
    if (fail) throw std::runtime_error("experience store unavailable");
    saved.push_back(record);
  }
};

/**
 * Constant per-phase token charges
 */
class FixedUsage : public lats::UsageEstimator {
public:
  FixedUsage(int64_t expansion, int64_t leaf, int64_t intermediate)
      : expansion_(expansion), leaf_(leaf), intermediate_(intermediate) {}

  int64_t expansion(const std::string&, const std::string&,
                    const std::vector<std::string>&) const override {
    return expansion_;
  }
  int64_t leaf(const std::vector<std::string>&, const std::string&,
               const lats::Strategy&) const override {
    return leaf_;
  }
  int64_t intermediate(const std::string&) const override { return intermediate_; }

private:
  int64_t expansion_;
  int64_t leaf_;
  int64_t intermediate_;
};

/**
 * Unique scratch directory, removed on scope exit
 */
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("lats_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

}  // namespace lats_test
