#include "stagegate/process/state_history.hpp"

#include <iterator>
#include <utility>

#include "stagegate/process/status_result.hpp"

namespace stagegate {

bool StateTransition::is_progression() const noexcept {
  if (!from_state) return false;
  return state_rank(to_state) > state_rank(*from_state);
}

bool StateTransition::is_regression() const noexcept {
  if (!from_state) return false;
  if (to_state == EvaluationState::kRegressing) return true;
  return state_rank(to_state) < state_rank(*from_state);
}

Value StateTransition::to_value() const {
  Value::Object o;
  o["timestamp"] = Value(format_utc_timestamp(timestamp));
  o["from_state"] = from_state ? Value(to_string(*from_state)) : Value();
  o["to_state"] = Value(to_string(to_state));
  o["element_id"] = Value(element_id);
  o["stage"] = stage ? Value(*stage) : Value();
  o["reason"] = Value(reason);
  o["metadata"] = Value(metadata);
  return Value(std::move(o));
}

ElementStateHistory::ElementStateHistory(std::string element_id)
    : element_id_(std::move(element_id)), created_at_(std::chrono::system_clock::now()) {}

void ElementStateHistory::add_transition(StateTransition t, std::size_t max_keep) {
  if (t.stage) current_stage_ = t.stage;
  transitions_.push_back(std::move(t));

  if (max_keep > 0 && transitions_.size() > max_keep) {
    const auto drop = static_cast<std::ptrdiff_t>(transitions_.size() - max_keep);
    transitions_.erase(transitions_.begin(), std::next(transitions_.begin(), drop));
  }
}

std::optional<EvaluationState> ElementStateHistory::current_state() const noexcept {
  if (transitions_.empty()) return std::nullopt;
  return transitions_.back().to_state;
}

std::size_t ElementStateHistory::progression_count() const noexcept {
  std::size_t n = 0;
  for (const auto& t : transitions_) {
    if (t.is_progression()) ++n;
  }
  return n;
}

std::size_t ElementStateHistory::regression_count() const noexcept {
  std::size_t n = 0;
  for (const auto& t : transitions_) {
    if (t.is_regression()) ++n;
  }
  return n;
}

Value ElementStateHistory::summary() const {
  const auto state = current_state();

  Value::Object o;
  o["element_id"] = Value(element_id_);
  o["created_at"] = Value(format_utc_timestamp(created_at_));
  o["evaluation_count"] = Value(evaluation_count_);
  o["transition_count"] = Value(transitions_.size());
  o["current_state"] = state ? Value(to_string(*state)) : Value();
  o["current_stage"] = current_stage_ ? Value(*current_stage_) : Value();
  o["progressions"] = Value(progression_count());
  o["regressions"] = Value(regression_count());
  return Value(std::move(o));
}

}  // namespace stagegate
