#pragma once
/*
================================================================================
Fragment 4.1 — Stage: Schema + ordered Gates (one workflow checkpoint)
FILE: cpp/stagegate/stage/stage.hpp

Purpose:
  - Decide pass/fail of one checkpoint for an element.
  - Report a completion fraction and the actions still needed.
  - Hold per-state action templates that the Process resolves into Actions.

Semantics:
  - Schema.validate runs first; every gate runs regardless of its outcome.
  - overall_passed = schema_valid && (no gates || allow_partial ? any gate : all gates)
  - completion: no gates and no schema -> 1.0; no gates -> schema only;
    otherwise mean of (passed gates / gates) and (schema valid ? 1 : 0).
================================================================================
*/

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stagegate/core/settings.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/rules/gate.hpp"
#include "stagegate/schema/schema.hpp"
#include "stagegate/stage/action.hpp"

namespace stagegate {

class ValidatorRegistry;

using ActionTemplateMap = std::map<EvaluationState, std::vector<ActionTemplate>>;

struct StageResult final {
  std::string stage_name;

  bool schema_valid = true;
  std::vector<std::string> schema_errors;

  // One per gate, declaration order.
  std::vector<GateResult> gate_results;

  bool overall_passed = false;
  std::vector<std::string> actions;  // remediation from failed gates
  double completion_fraction = 0.0;

  std::size_t passed_gate_count() const noexcept;
  std::vector<std::string> failed_gate_names() const;

  // Schema errors followed by failed-gate messages.
  std::vector<std::string> messages() const;
};

class Stage final {
 public:
  Stage(std::string name,
        std::vector<Gate> gates,
        std::optional<Schema> schema = std::nullopt,
        bool allow_partial = false,
        ActionTemplateMap action_templates = {},
        Value::Object metadata = Value::Object{},
        std::string description = std::string());

  const std::string& name() const noexcept { return name_; }
  const std::string& description() const noexcept { return description_; }
  const std::vector<Gate>& gates() const noexcept { return gates_; }
  const std::optional<Schema>& schema() const noexcept { return schema_; }
  bool allow_partial() const noexcept { return allow_partial_; }
  const ActionTemplateMap& action_templates() const noexcept { return templates_; }
  const Value::Object& metadata() const noexcept { return metadata_; }

  StageResult evaluate(const Element& element, const ValidatorRegistry& registry) const;
  StageResult evaluate(const Element& element) const;

  // All schema-required fields present (true without a schema).
  bool is_compatible_with_element(const Element& element) const;

  // Schema-required fields plus every gate property path, sorted.
  std::vector<std::string> get_required_properties() const;

  bool has_gate(std::string_view gate_name) const;
  const Gate* get_gate(std::string_view gate_name) const;

  bool has_action_templates(EvaluationState state) const;

  // Resolved templates for `state`; empty when none are declared.
  std::vector<Action> resolve_actions_for_state(EvaluationState state,
                                                const Element& element,
                                                const Value::Object& context = Value::Object{}) const;

  // Per-gate structure warnings plus conflicts between gates.
  std::vector<std::string> validate_structure(const GateLimits& limits = GateLimits{}) const;

  std::string summary() const;

 private:
  std::string name_;
  std::string description_;
  std::vector<Gate> gates_;
  std::optional<Schema> schema_;
  bool allow_partial_ = false;
  ActionTemplateMap templates_;
  Value::Object metadata_;
};

}  // namespace stagegate
