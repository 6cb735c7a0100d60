#include "stagegate/stage/stage.hpp"

#include <set>
#include <sstream>
#include <utility>

#include "stagegate/core/error.hpp"
#include "stagegate/rules/validator_registry.hpp"

namespace stagegate {

std::size_t StageResult::passed_gate_count() const noexcept {
  std::size_t n = 0;
  for (const auto& g : gate_results) {
    if (g.passed) ++n;
  }
  return n;
}

std::vector<std::string> StageResult::failed_gate_names() const {
  std::vector<std::string> out;
  for (const auto& g : gate_results) {
    if (!g.passed) out.push_back(g.gate_name);
  }
  return out;
}

std::vector<std::string> StageResult::messages() const {
  std::vector<std::string> out = schema_errors;
  for (const auto& g : gate_results) {
    if (!g.passed) out.insert(out.end(), g.messages.begin(), g.messages.end());
  }
  return out;
}

Stage::Stage(std::string name,
             std::vector<Gate> gates,
             std::optional<Schema> schema,
             bool allow_partial,
             ActionTemplateMap action_templates,
             Value::Object metadata,
             std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      gates_(std::move(gates)),
      schema_(std::move(schema)),
      allow_partial_(allow_partial),
      templates_(std::move(action_templates)),
      metadata_(std::move(metadata)) {
  STAGEGATE_ENSURE(!name_.empty(), ErrorCode::kInvalidConfig, "Stage name cannot be empty");

  std::set<std::string> seen;
  for (const auto& g : gates_) {
    if (!seen.insert(g.name()).second) {
      STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                      "Stage '" + name_ + "' has duplicate gate name '" + g.name() + "'");
    }
  }
}

StageResult Stage::evaluate(const Element& element, const ValidatorRegistry& registry) const {
  StageResult r;
  r.stage_name = name_;

  if (schema_) {
    r.schema_errors = schema_->validate(element);
    r.schema_valid = r.schema_errors.empty();
  }

  r.gate_results.reserve(gates_.size());
  for (const auto& g : gates_) {
    GateResult gr = g.evaluate(element, registry);
    if (!gr.passed) r.actions.insert(r.actions.end(), gr.actions.begin(), gr.actions.end());
    r.gate_results.push_back(std::move(gr));
  }

  const std::size_t passed = r.passed_gate_count();
  bool gates_ok = true;
  if (!gates_.empty()) gates_ok = allow_partial_ ? (passed > 0) : (passed == gates_.size());
  r.overall_passed = r.schema_valid && gates_ok;

  const double schema_part = r.schema_valid ? 1.0 : 0.0;
  if (gates_.empty()) {
    r.completion_fraction = schema_ ? schema_part : 1.0;
  } else {
    const double gate_part = static_cast<double>(passed) / static_cast<double>(gates_.size());
    r.completion_fraction = (gate_part + schema_part) / 2.0;
  }
  return r;
}

StageResult Stage::evaluate(const Element& element) const {
  return evaluate(element, *ValidatorRegistry::shared());
}

bool Stage::is_compatible_with_element(const Element& element) const {
  if (!schema_) return true;
  for (const auto& f : schema_->required_fields()) {
    if (!element.has_property(f)) return false;
  }
  return true;
}

std::vector<std::string> Stage::get_required_properties() const {
  std::set<std::string> props;
  if (schema_) props.insert(schema_->required_fields().begin(), schema_->required_fields().end());
  for (const auto& g : gates_) {
    for (auto& p : g.get_property_paths()) props.insert(std::move(p));
  }
  return std::vector<std::string>(props.begin(), props.end());
}

bool Stage::has_gate(std::string_view gate_name) const {
  return get_gate(gate_name) != nullptr;
}

const Gate* Stage::get_gate(std::string_view gate_name) const {
  for (const auto& g : gates_) {
    if (g.name() == gate_name) return &g;
  }
  return nullptr;
}

bool Stage::has_action_templates(EvaluationState state) const {
  const auto it = templates_.find(state);
  return it != templates_.end() && !it->second.empty();
}

std::vector<Action> Stage::resolve_actions_for_state(EvaluationState state,
                                                     const Element& element,
                                                     const Value::Object& context) const {
  std::vector<Action> out;
  const auto it = templates_.find(state);
  if (it == templates_.end()) return out;
  out.reserve(it->second.size());
  for (const auto& t : it->second) out.push_back(t.resolve(element, context));
  return out;
}

std::vector<std::string> Stage::validate_structure(const GateLimits& limits) const {
  std::vector<std::string> warnings;
  for (const auto& g : gates_) {
    for (auto& w : g.validate_structure(limits)) warnings.push_back("Stage '" + name_ + "': " + w);
  }
  for (std::size_t i = 0; i < gates_.size(); ++i) {
    for (std::size_t j = i + 1; j < gates_.size(); ++j) {
      for (const auto& c : gates_[i].conflicts_with(gates_[j])) {
        warnings.push_back("Stage '" + name_ + "': gates '" + gates_[i].name() + "' and '" +
                           gates_[j].name() + "' conflict: " + c);
      }
    }
  }
  if (gates_.empty() && !schema_) {
    warnings.push_back("Stage '" + name_ + "' has neither gates nor schema; it always passes");
  }
  return warnings;
}

std::string Stage::summary() const {
  std::ostringstream oss;
  oss << "Stage '" << name_ << "': " << gates_.size() << " gates";
  if (schema_) oss << ", schema '" << schema_->name() << "' (" << schema_->required_fields().size() << " required)";
  else oss << ", no schema";
  if (allow_partial_) oss << ", partial";
  return oss.str();
}

}  // namespace stagegate
