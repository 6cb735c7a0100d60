#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "stagegate/element/value.hpp"
#include "stagegate/stage/action.hpp"

namespace stagegate {

struct StatusJsonOptions {
  bool pretty = false;
  // Off => identical evaluations render byte-identical.
  bool include_timestamp = true;
};

// Outcome of one Process::evaluate call.
struct StatusResult final {
  EvaluationState state = EvaluationState::kScoping;
  std::string element_id;
  std::optional<std::string> current_stage;
  std::optional<std::string> proposed_stage;
  std::vector<Action> actions;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  Value::Object metadata;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

  // proposed_stage defaults to current_stage for FULFILLING/QUALIFYING/AWAITING.
  static StatusResult make(EvaluationState state,
                           std::string element_id,
                           std::optional<std::string> current_stage,
                           std::optional<std::string> proposed_stage = std::nullopt);

  bool has_errors() const noexcept { return !errors.empty(); }
  bool is_terminal() const noexcept { return state == EvaluationState::kCompleted; }

  // "Error in scoping: ..." or "Awaiting (stage: S1) - 1 action(s)".
  std::string summary() const;

  Value to_value(bool include_timestamp = true) const;
  std::string to_json(const StatusJsonOptions& opt = {}) const;
};

// ISO-8601 UTC with milliseconds: 2026-01-02T03:04:05.678Z
std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace stagegate
