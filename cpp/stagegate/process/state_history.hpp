#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "stagegate/element/value.hpp"
#include "stagegate/stage/action.hpp"

namespace stagegate {

// One recorded state change of one element.
struct StateTransition final {
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
  std::optional<EvaluationState> from_state;  // nullopt on first record
  EvaluationState to_state = EvaluationState::kScoping;
  std::string element_id;
  std::optional<std::string> stage;
  std::string reason;
  Value::Object metadata;

  // Rank-based; see state_rank(). Both false for the first record.
  bool is_progression() const noexcept;
  bool is_regression() const noexcept;

  Value to_value() const;
};

/// Append-only log for one element. Not synchronized: Process guards every
/// instance with its own history mutex and hands out copies.
class ElementStateHistory final {
 public:
  explicit ElementStateHistory(std::string element_id);

  const std::string& element_id() const noexcept { return element_id_; }
  std::chrono::system_clock::time_point created_at() const noexcept { return created_at_; }
  const std::vector<StateTransition>& transitions() const noexcept { return transitions_; }
  std::size_t evaluation_count() const noexcept { return evaluation_count_; }
  const std::optional<std::string>& current_stage() const noexcept { return current_stage_; }

  // max_keep > 0 drops the oldest transitions beyond that count.
  void add_transition(StateTransition t, std::size_t max_keep = 0);
  void record_evaluation() noexcept { ++evaluation_count_; }

  std::optional<EvaluationState> current_state() const noexcept;

  std::size_t progression_count() const noexcept;
  std::size_t regression_count() const noexcept;

  // Object with element_id, evaluation_count, transition_count,
  // current_state, current_stage, progressions, regressions, created_at.
  Value summary() const;

 private:
  std::string element_id_;
  std::chrono::system_clock::time_point created_at_;
  std::vector<StateTransition> transitions_;
  std::size_t evaluation_count_ = 0;
  std::optional<std::string> current_stage_;
};

}  // namespace stagegate
