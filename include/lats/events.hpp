#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file events.hpp
 * @brief Lifecycle events and the best-effort emitter
 *
 * One synchronous callback, invoked at fixed points of each iteration.
 * A throwing callback is logged and counted; the search carries on.
 */

#include "common.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <string>
#include <utility>

namespace lats {

enum class EventType {
  SearchStart,
  IterationStart,
  Selection,
  Expansion,
  SimulationStart,
  SimulationEnd,
  Backpropagation,
  BudgetCheck,
  EarlyGiveup,
  EarlyStop,
  SearchEnd,
};

inline const char* event_type_name(EventType type) {
  switch (type) {
    case EventType::SearchStart:     return "search_start";
    case EventType::IterationStart:  return "iteration_start";
    case EventType::Selection:       return "selection";
    case EventType::Expansion:       return "expansion";
    case EventType::SimulationStart: return "simulation_start";
    case EventType::SimulationEnd:   return "simulation_end";
    case EventType::Backpropagation: return "backpropagation";
    case EventType::BudgetCheck:     return "budget_check";
    case EventType::EarlyGiveup:     return "early_giveup";
    case EventType::EarlyStop:       return "early_stop";
    case EventType::SearchEnd:       return "search_end";
  }
  return "unknown";
}

struct Event {
  EventType type;
  int iteration = 0;
  std::string node_id;
  std::string message;
  nlohmann::json metadata = nlohmann::json::object();
};

using EventCallback = std::function<void(const Event&)>;

class EventEmitter {
public:
  explicit EventEmitter(EventCallback callback = nullptr)
      : callback_(std::move(callback)) {}

  /**
   * Deliver event to the callback
   *
   * @return false if the callback threw
   * @note This function never throws.
   */
  bool emit(const Event& event) const {
    if (!callback_) return true;
    try {
      callback_(event);
      return true;
    } catch (const std::exception& e) {
      LATS_LOG_ERROR("[events::emit] Callback failed on %s: %s",
                     event_type_name(event.type), e.what());
    } catch (...) {
      LATS_LOG_ERROR("[events::emit] Callback failed on %s: non-standard exception",
                     event_type_name(event.type));
    }
    return false;
  }

  bool has_callback() const { return static_cast<bool>(callback_); }

private:
  EventCallback callback_;
};

}  // namespace lats
