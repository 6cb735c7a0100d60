#pragma once
/*
================================================================================
Fragment 5.1 — Process: ordered Stages + evaluation state machine
FILE: cpp/stagegate/process/process.hpp

Purpose:
  - Locate an element in an ordered list of stages, walk it forward while
    it qualifies, and report one of the workflow states with actions.
  - Keep a per-element transition history.

Walk (one evaluate call):
  - Scope: known stage, else the compatible stage with the highest
    completion (ties -> earliest in order). None -> SCOPING error.
  - Loop: stage fails -> FULFILLING; last stage passes -> COMPLETED;
    next stage not enterable -> AWAITING; else record ADVANCING, move on.
  - Bounded by the number of stages (or ProcessSettings::max_stage_walk).

Hardening:
  - evaluate() never throws; internal faults come back as a SCOPING result
    with a CRITICAL manual_review action.
  - History lives behind one mutex; callers only ever receive copies.
  - Stages are immutable after construction, so concurrent evaluations of
    different elements share them without locking.
================================================================================
*/

#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stagegate/core/settings.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/process/state_history.hpp"
#include "stagegate/process/status_result.hpp"
#include "stagegate/rules/validator_registry.hpp"
#include "stagegate/stage/stage.hpp"

namespace stagegate {

struct RegressionReport final {
  bool regressed = false;
  std::optional<std::string> previous_stage;  // furthest stage recorded before
  std::optional<std::string> current_stage;   // stage the element sits in now
  // REGRESSING result when regressed, the plain evaluation otherwise.
  StatusResult status;
};

class Process final {
 public:
  /// stage_order empty => declaration order. Otherwise it must list every
  /// stage exactly once. registry null => ValidatorRegistry::shared().
  /// Throws Error(kInvalidConfig) on any structural violation.
  Process(std::string name,
          std::vector<Stage> stages,
          std::vector<std::string> stage_order = {},
          bool allow_stage_skipping = false,
          bool regression_detection = false,
          Value::Object metadata = Value::Object{},
          EngineSettings settings = EngineSettings::defaults(),
          std::shared_ptr<ValidatorRegistry> registry = nullptr);

  Process(Process&&) = default;
  Process& operator=(Process&&) = default;
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;

  const std::string& name() const noexcept { return name_; }
  // Stages in process order.
  const std::vector<Stage>& stages() const noexcept { return stages_; }
  std::vector<std::string> stage_order() const;
  bool allow_stage_skipping() const noexcept { return allow_stage_skipping_; }
  bool regression_detection() const noexcept { return regression_detection_; }
  const Value::Object& metadata() const noexcept { return metadata_; }
  const EngineSettings& settings() const noexcept { return settings_; }
  ValidatorRegistry& validators() const noexcept { return *registry_; }

  // Never throws. Records history when enabled.
  StatusResult evaluate(const Element& element,
                        const std::optional<std::string>& current_stage = std::nullopt);

  // Input order preserved; each element evaluated independently.
  std::vector<StatusResult> evaluate_batch(const std::vector<Element>& elements);

  /// Evaluate and compare with the furthest stage in the element's history.
  /// A regression is recorded as a REGRESSING transition.
  RegressionReport check_regression(const Element& element,
                                    const std::optional<std::string>& current_stage = std::nullopt);

  const Stage* get_stage(std::string_view stage_name) const noexcept;
  std::optional<std::size_t> get_stage_index(std::string_view stage_name) const noexcept;
  std::optional<std::string> get_next_stage_name(std::string_view stage_name) const;

  // Forward only: next stage, or any later stage when skipping is allowed.
  bool can_transition(std::string_view from_stage, std::string_view to_stage) const noexcept;

  // Reasons the element may not move from -> to; empty = eligible.
  std::vector<std::string> validate_stage_progression(const Element& element,
                                                      std::string_view from_stage,
                                                      std::string_view to_stage) const;

  // Union over stages, sorted and unique.
  std::vector<std::string> get_all_required_properties() const;

  // Per-stage warnings plus gate targets naming unknown stages.
  std::vector<std::string> validate_structure() const;

  Value summary() const;

  // Copies; nullopt when nothing is recorded for the id.
  std::optional<ElementStateHistory> get_history(std::string_view element_id) const;
  std::size_t history_size() const;
  void clear_history();
  bool clear_history(std::string_view element_id);

 private:
  struct HistoryStore {
    mutable std::mutex mu;
    std::map<std::string, ElementStateHistory, std::less<>> by_element;
  };

  const Stage* next_stage(const Stage& stage) const noexcept;
  const Stage* scope(const Element& element) const;

  // State machine proper; may throw. ADVANCING hops go to *hops.
  StatusResult run(const Element& element,
                   const std::optional<std::string>& current_stage,
                   const std::string& element_id,
                   std::vector<StateTransition>* hops) const;

  // run() behind the fault barrier; fills *element_id.
  StatusResult run_guarded(const Element& element,
                           const std::optional<std::string>& current_stage,
                           std::string* element_id,
                           std::vector<StateTransition>* hops) const;

  std::optional<std::string> furthest_recorded_stage(const std::string& element_id) const;
  void record(const std::string& element_id,
              const StatusResult& result,
              std::vector<StateTransition> hops);

  Value::Object template_context(const Stage& stage, const std::string& element_id) const;

  std::string name_;
  std::vector<Stage> stages_;
  bool allow_stage_skipping_ = false;
  bool regression_detection_ = false;
  Value::Object metadata_;
  EngineSettings settings_;
  std::shared_ptr<ValidatorRegistry> registry_;
  std::unique_ptr<HistoryStore> history_;
};

// Stage name the result refers to: current_stage, or final_stage for COMPLETED.
std::optional<std::string> reached_stage(const StatusResult& result);

// SCOPING result for a fault caught during evaluation: "Evaluation error: <text>"
// plus a CRITICAL manual_review action. A stagegate::Error contributes its
// message() only, without the throw site.
StatusResult evaluation_failure(const std::string& element_id, const std::exception& fault);

}  // namespace stagegate
