#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file thought_evaluator.hpp
 * @brief Hybrid heuristic + model-judge scoring of intermediate thoughts
 *
 * score = clamp(0.4 * heuristic(thought) + 0.6 * judge(thought), 0, 1)
 *
 * Heuristic (starts at 0.5):
 * - +0.1 for 5..50 words, -0.2 for fewer than 3 words
 * - +0.05 per concrete-action keyword, at most 4 counted
 * - first fenced code snippet: +0.1 if it passes the syntax check, -0.1 if not
 * - +0.1 when ordinal/sequencing markers are present
 *
 * Judge: a critical-reviewer prompt sent to the verifier model, which must
 * answer with a single number. Parse failures and exceptions yield 0.5.
 *
 * @note evaluate() never throws. Evaluation failures must not abort a search.
 */

#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lats {

/**
 * Request sent to the reviewer model
 */
struct JudgeRequest {
  std::string prompt;
  std::string model;
  double temperature = 0.2;
};

/** Reviewer model call: prompt in, raw completion text out */
using JudgeFn = std::function<std::string(const JudgeRequest&)>;

/** Syntax check of a code snippet: (code, language tag) -> valid */
using SyntaxCheckFn = std::function<bool(std::string_view, std::string_view)>;

namespace heuristics {

constexpr double BASE_SCORE = 0.5;
constexpr double LENGTH_BONUS = 0.1;
constexpr double SHORT_PENALTY = 0.2;
constexpr double KEYWORD_BONUS = 0.05;
constexpr int MAX_KEYWORD_MATCHES = 4;
constexpr double CODE_BONUS = 0.1;
constexpr double SEQUENCE_BONUS = 0.1;

/**
 * Fenced code block found in a thought
 */
struct CodeSnippet {
  std::string language;
  std::string code;
};

inline std::vector<std::string> lower_words(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  for (char ch : text) {
    unsigned char u = static_cast<unsigned char>(ch);
    if (std::isalnum(u) || ch == '_') {
      current.push_back(static_cast<char>(std::tolower(u)));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) words.push_back(std::move(current));
  return words;
}

/** Whitespace-separated word count */
inline int word_count(std::string_view text) {
  int n = 0;
  bool in_word = false;
  for (char ch : text) {
    bool space = std::isspace(static_cast<unsigned char>(ch)) != 0;
    if (!space && !in_word) ++n;
    in_word = !space;
  }
  return n;
}

inline int count_action_keywords(std::string_view text) {
  static const char* const keywords[] = {
    "add", "implement", "create", "refactor", "fix", "update", "remove",
    "replace", "extract", "validate", "check", "handle", "modify", "rename",
    "move", "call", "return", "define", "test", "use",
  };
  int matches = 0;
  for (const auto& word : lower_words(text)) {
    for (const char* kw : keywords) {
      if (word == kw) {
        ++matches;
        break;
      }
    }
  }
  return matches;
}

/**
 * First ``` fenced block, or nullopt
 *
 * An unterminated fence runs to the end of the text.
 */
inline std::optional<CodeSnippet> find_fenced_code(const std::string& text) {
  size_t open = text.find("```");
  if (open == std::string::npos) return std::nullopt;

  size_t header_end = text.find('\n', open + 3);
  if (header_end == std::string::npos) return std::nullopt;

  CodeSnippet snippet;
  snippet.language = text.substr(open + 3, header_end - (open + 3));
  while (!snippet.language.empty() &&
         std::isspace(static_cast<unsigned char>(snippet.language.back()))) {
    snippet.language.pop_back();
  }

  size_t body = header_end + 1;
  size_t close = text.find("```", body);
  snippet.code = text.substr(body, close == std::string::npos ? std::string::npos : close - body);
  return snippet;
}

/**
 * Default syntax check: brackets balance and string literals close
 *
 * Skips // comments, and # comments for hash-comment languages.
 */
inline bool balanced_delimiters(std::string_view code, std::string_view language) {
  bool hash_comments = language.empty() || language == "python" || language == "py" ||
                       language == "sh" || language == "bash" || language == "ruby" ||
                       language == "yaml";
  std::vector<char> stack;
  char quote = 0;

  for (size_t i = 0; i < code.size(); ++i) {
    char ch = code[i];
    if (quote) {
      if (ch == '\\') {
        ++i;
      } else if (ch == quote) {
        quote = 0;
      } else if (ch == '\n') {
        return false;
      }
      continue;
    }

    if ((ch == '#' && hash_comments) ||
        (ch == '/' && i + 1 < code.size() && code[i + 1] == '/')) {
      while (i < code.size() && code[i] != '\n') ++i;
      continue;
    }

    switch (ch) {
      case '"':
      case '\'':
        quote = ch;
        break;
      case '(': stack.push_back(')'); break;
      case '[': stack.push_back(']'); break;
      case '{': stack.push_back('}'); break;
      case ')':
      case ']':
      case '}':
        if (stack.empty() || stack.back() != ch) return false;
        stack.pop_back();
        break;
      default:
        break;
    }
  }
  return quote == 0 && stack.empty();
}

/**
 * Ordinal words ("first", "then", "finally", ...) or numbered steps
 * ("1.", "2)", "step 3")
 */
inline bool has_sequencing_markers(const std::string& text) {
  static const char* const markers[] = {
    "first", "second", "third", "then", "next", "finally", "lastly", "afterwards",
  };
  auto words = lower_words(text);
  for (size_t i = 0; i < words.size(); ++i) {
    for (const char* m : markers) {
      if (words[i] == m) return true;
    }
    if (words[i] == "step" && i + 1 < words.size() &&
        std::isdigit(static_cast<unsigned char>(words[i + 1][0]))) {
      return true;
    }
  }

  size_t line_start = 0;
  while (line_start < text.size()) {
    size_t i = line_start;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    size_t digits = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i > digits && i < text.size() && (text[i] == '.' || text[i] == ')')) return true;

    size_t nl = text.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
  }
  return false;
}

/**
 * Heuristic component in [0, 1]
 */
inline double score(const std::string& thought, const SyntaxCheckFn& syntax_check) {
  double s = BASE_SCORE;

  int words = word_count(thought);
  if (words >= 5 && words <= 50) {
    s += LENGTH_BONUS;
  } else if (words < 3) {
    s -= SHORT_PENALTY;
  }

  s += KEYWORD_BONUS * std::min(count_action_keywords(thought), MAX_KEYWORD_MATCHES);

  if (auto snippet = find_fenced_code(thought)) {
    bool valid = syntax_check ? syntax_check(snippet->code, snippet->language)
                              : balanced_delimiters(snippet->code, snippet->language);
    s += valid ? CODE_BONUS : -CODE_BONUS;
  }

  if (has_sequencing_markers(thought)) s += SEQUENCE_BONUS;

  return std::clamp(s, 0.0, 1.0);
}

}  // namespace heuristics

class ThoughtEvaluator {
public:
  static constexpr double HEURISTIC_WEIGHT = 0.4;
  static constexpr double JUDGE_WEIGHT = 0.6;
  static constexpr double NEUTRAL_SCORE = 0.5;

  /**
   * @param judge Reviewer model call (empty: judge always neutral)
   * @param verifier_model Model name passed to the judge
   * @param temperature Reviewer sampling temperature
   * @param syntax_check Snippet checker (empty: balanced_delimiters)
   */
  explicit ThoughtEvaluator(JudgeFn judge,
                            std::string verifier_model = "claude-3.5-sonnet",
                            double temperature = 0.2,
                            SyntaxCheckFn syntax_check = nullptr)
      : judge_(std::move(judge)),
        verifier_model_(std::move(verifier_model)),
        temperature_(temperature),
        syntax_check_(std::move(syntax_check)) {}

  /**
   * Hybrid score in [0, 1]
   *
   * @note This function never throws.
   */
  double evaluate(const std::string& thought) const {
    double h = heuristic(thought);
    double j = model_judge(thought);
    double s = std::clamp(HEURISTIC_WEIGHT * h + JUDGE_WEIGHT * j, 0.0, 1.0);
    LATS_LOG_DEBUG("[thought_evaluator::evaluate] heuristic=%.2f judge=%.2f -> %.2f", h, j, s);
    return s;
  }

  double heuristic(const std::string& thought) const {
    return heuristics::score(thought, syntax_check_);
  }

  /**
   * Reviewer score, 0.5 on any failure
   *
   * @note This function never throws.
   */
  double model_judge(const std::string& thought) const {
    if (!judge_) return NEUTRAL_SCORE;
    try {
      std::string reply = judge_(JudgeRequest{build_prompt(thought), verifier_model_, temperature_});
      if (auto parsed = parse_score(reply)) return *parsed;
      LATS_LOG_DEBUG("[thought_evaluator::model_judge] Unparseable reply: %s",
                     truncate(reply, 80).c_str());
    } catch (const std::exception& e) {
      LATS_LOG_DEBUG("[thought_evaluator::model_judge] Judge failed: %s", e.what());
    }
    return NEUTRAL_SCORE;
  }

  static std::string build_prompt(const std::string& thought) {
    return "You are a critical code reviewer. Evaluate the following intermediate "
           "reasoning step toward solving a coding problem.\n\n"
           "Thought:\n" + thought + "\n\n"
           "Judge whether it is correct, specific and actionable. Be strict.\n"
           "Respond with a single number between 0.0 and 1.0 and nothing else.";
  }

  /**
   * First number in reply, clamped to [0, 1]
   *
   * A leading sign is honoured, so "-0.5" clamps to 0. A fraction such as
   * "8/10" or "3 / 5" is read as numerator over denominator.
   *
   * @return nullopt when the reply holds no finite number
   */
  static std::optional<double> parse_score(const std::string& reply) {
    auto starts_number = [&](size_t i) {
      if (i >= reply.size()) return false;
      if (std::isdigit(static_cast<unsigned char>(reply[i]))) return true;
      return reply[i] == '.' && i + 1 < reply.size() &&
             std::isdigit(static_cast<unsigned char>(reply[i + 1]));
    };

    for (size_t i = 0; i < reply.size(); ++i) {
      bool signed_start = (reply[i] == '-' || reply[i] == '+') && starts_number(i + 1);
      if (!signed_start && !starts_number(i)) continue;

      const char* begin = reply.c_str() + i;
      char* end = nullptr;
      double value = std::strtod(begin, &end);
      if (end == begin || !std::isfinite(value)) return std::nullopt;

      const char* rest = end;
      while (*rest == ' ') ++rest;
      if (*rest == '/') {
        ++rest;
        while (*rest == ' ') ++rest;
        char* den_end = nullptr;
        double denominator = std::strtod(rest, &den_end);
        if (den_end != rest && std::isfinite(denominator) && denominator > 0.0) {
          value /= denominator;
        }
      }
      return std::clamp(value, 0.0, 1.0);
    }
    return std::nullopt;
  }

private:
  JudgeFn judge_;
  std::string verifier_model_;
  double temperature_;
  SyntaxCheckFn syntax_check_;
};

}  // namespace lats
