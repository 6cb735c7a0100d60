#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "stagegate/core/settings.hpp"
#include "stagegate/element/value.hpp"
#include "stagegate/process/process.hpp"
#include "stagegate/rules/gate.hpp"
#include "stagegate/rules/lock.hpp"
#include "stagegate/rules/validator_registry.hpp"
#include "stagegate/schema/schema.hpp"
#include "stagegate/stage/stage.hpp"

namespace stagegate {

// Plain, name-typed description of a process. Hosts fill these from whatever
// file format they read; build_process turns them into the immutable graph.

struct LockDefinition {
  std::string type;  // "exists", "not-empty", "RANGE", ...
  std::string property_path;
  Value expected_value;
  std::string validator_name;
  // Replaces the generated failure text when the lock fails.
  std::optional<std::string> error_message;
  Value::Object metadata;
};

struct GateDefinition;
using GateComponentDefinition = std::variant<LockDefinition, std::shared_ptr<const GateDefinition>>;

struct GateDefinition {
  std::string name;
  std::string logic = "AND";
  std::optional<std::string> target_stage;
  std::vector<GateComponentDefinition> components;
  Value::Object metadata;
};

struct SchemaDefinition {
  std::string name;
  std::vector<std::string> required_fields;
  std::vector<std::string> optional_fields;
  std::map<std::string, std::string> field_types;  // field -> "string", "integer", ...
  Value::Object default_values;
  std::map<std::string, FieldRule> rules;
};

struct ActionTemplateDefinition {
  std::string type = "complete_field";
  std::string description;
  std::string priority = "normal";
  std::vector<std::string> conditions;
  std::map<std::string, std::string> template_vars;
  Value::Object metadata;
};

struct StageDefinition {
  std::string name;
  std::string description;
  std::vector<GateDefinition> gates;
  std::optional<SchemaDefinition> schema;
  bool allow_partial = false;
  // State name ("fulfilling", "awaiting", ...) -> templates.
  std::map<std::string, std::vector<ActionTemplateDefinition>> actions;
  Value::Object metadata;
};

struct ProcessDefinition {
  std::string name;
  std::vector<StageDefinition> stages;
  // Stages keyed by name; an empty StageDefinition::name takes the key.
  std::map<std::string, StageDefinition> named_stages;
  // Empty: `stages` in order, then `named_stages` by key.
  std::vector<std::string> order;
  bool allow_stage_skipping = false;
  bool regression_detection = false;
  Value::Object metadata;
};

// Each throws Error(kInvalidConfig) naming the offending definition.
// `limits` caps the subjects of REGEX locks and schema patterns.
Lock build_lock(const LockDefinition& def, const PatternLimits& limits = PatternLimits{});
Gate build_gate(const GateDefinition& def, const PatternLimits& limits = PatternLimits{});
Schema build_schema(const SchemaDefinition& def, const PatternLimits& limits = PatternLimits{});
ActionTemplate build_action_template(const ActionTemplateDefinition& def);
Stage build_stage(const StageDefinition& def, const PatternLimits& limits = PatternLimits{});

Process build_process(const ProcessDefinition& def,
                      std::shared_ptr<ValidatorRegistry> registry = nullptr,
                      EngineSettings settings = EngineSettings::defaults());

}  // namespace stagegate
