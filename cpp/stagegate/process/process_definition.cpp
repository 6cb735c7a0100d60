#include "stagegate/process/process_definition.hpp"

#include <set>
#include <utility>

#include "stagegate/core/error.hpp"

namespace stagegate {
namespace {

// Rethrows with `where` prepended so nested failures read
// "Stage 'review': gate 'docs': Lock 'equals' requires an expected value".
template <class Fn>
auto with_context(const std::string& where, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const Error& e) {
    throw e.prefixed(where);
  }
}

Gate build_gate_path(const GateDefinition& def, const PatternLimits& limits,
                     std::vector<const GateDefinition*>* path) {
  for (const GateDefinition* p : *path) {
    STAGEGATE_ENSURE(p != &def, ErrorCode::kInvalidConfig,
                     "Gate definition '" + def.name + "' contains itself");
  }
  path->push_back(&def);

  std::vector<GateComponent> components;
  components.reserve(def.components.size());
  for (std::size_t i = 0; i < def.components.size(); ++i) {
    const auto& c = def.components[i];
    if (const auto* lock = std::get_if<LockDefinition>(&c)) {
      components.emplace_back(with_context("component " + std::to_string(i), [&] { return build_lock(*lock, limits); }));
      continue;
    }
    const auto& nested = std::get<std::shared_ptr<const GateDefinition>>(c);
    STAGEGATE_ENSURE(nested != nullptr, ErrorCode::kInvalidConfig,
                     "Gate '" + def.name + "' component " + std::to_string(i) + " is a null gate");
    Gate g = with_context("gate '" + nested->name + "'", [&] { return build_gate_path(*nested, limits, path); });
    components.emplace_back(Gate::share(std::move(g)));
  }

  path->pop_back();
  return Gate(def.name, std::move(components), def.target_stage, def.metadata, def.logic);
}

}  // namespace

Lock build_lock(const LockDefinition& def, const PatternLimits& limits) {
  LockOptions options;
  options.error_message = def.error_message.value_or("");
  options.max_pattern_subject = limits.max_subject_length;
  return Lock(lock_type_from_string(def.type), def.property_path, def.expected_value,
              def.validator_name, def.metadata, std::move(options));
}

Gate build_gate(const GateDefinition& def, const PatternLimits& limits) {
  std::vector<const GateDefinition*> path;
  return build_gate_path(def, limits, &path);
}

Schema build_schema(const SchemaDefinition& def, const PatternLimits& limits) {
  std::set<std::string> required;
  for (const auto& f : def.required_fields) {
    STAGEGATE_ENSURE(required.insert(f).second, ErrorCode::kInvalidConfig,
                     "Schema '" + def.name + "' lists required field '" + f + "' twice");
  }
  std::set<std::string> optional;
  for (const auto& f : def.optional_fields) {
    STAGEGATE_ENSURE(optional.insert(f).second, ErrorCode::kInvalidConfig,
                     "Schema '" + def.name + "' lists optional field '" + f + "' twice");
  }

  std::map<std::string, FieldType> types;
  for (const auto& kv : def.field_types) {
    types.emplace(kv.first, with_context("Schema '" + def.name + "' field '" + kv.first + "'",
                                         [&] { return field_type_from_string(kv.second); }));
  }

  return Schema(def.name, std::move(required), std::move(optional), std::move(types),
                def.default_values, def.rules, limits);
}

ActionTemplate build_action_template(const ActionTemplateDefinition& def) {
  ActionTemplate t;
  STAGEGATE_ENSURE(try_parse_action_type(def.type, &t.type), ErrorCode::kInvalidConfig,
                   "Unknown action type '" + def.type + "'");
  STAGEGATE_ENSURE(try_parse_priority(def.priority, &t.priority), ErrorCode::kInvalidConfig,
                   "Unknown action priority '" + def.priority + "'");
  STAGEGATE_ENSURE(!def.description.empty(), ErrorCode::kInvalidConfig,
                   "Action template description must be non-empty");
  t.description = def.description;
  t.conditions = def.conditions;
  t.template_vars = def.template_vars;
  t.metadata = def.metadata;
  return t;
}

Stage build_stage(const StageDefinition& def, const PatternLimits& limits) {
  return with_context("Stage '" + def.name + "'", [&] {
    std::vector<Gate> gates;
    gates.reserve(def.gates.size());
    for (const auto& g : def.gates) {
      gates.push_back(with_context("gate '" + g.name + "'", [&] { return build_gate(g, limits); }));
    }

    std::optional<Schema> schema;
    if (def.schema) schema = build_schema(*def.schema, limits);

    ActionTemplateMap templates;
    for (const auto& kv : def.actions) {
      EvaluationState state{};
      STAGEGATE_ENSURE(try_parse_evaluation_state(kv.first, &state), ErrorCode::kInvalidConfig,
                       "Unknown evaluation state '" + kv.first + "' in action templates");
      auto& out = templates[state];
      for (const auto& t : kv.second) {
        out.push_back(with_context("action template for '" + kv.first + "'",
                                   [&] { return build_action_template(t); }));
      }
    }

    return Stage(def.name, std::move(gates), std::move(schema), def.allow_partial,
                 std::move(templates), def.metadata, def.description);
  });
}

Process build_process(const ProcessDefinition& def,
                      std::shared_ptr<ValidatorRegistry> registry,
                      EngineSettings settings) {
  settings.validate_or_throw();
  std::vector<Stage> stages;
  stages.reserve(def.stages.size() + def.named_stages.size());
  for (const auto& s : def.stages) stages.push_back(build_stage(s, settings.pattern));

  for (const auto& [key, s] : def.named_stages) {
    STAGEGATE_ENSURE(s.name.empty() || s.name == key, ErrorCode::kInvalidConfig,
                     "Stage keyed '" + key + "' is named '" + s.name + "'");
    if (s.name.empty()) {
      StageDefinition named = s;
      named.name = key;
      stages.push_back(build_stage(named, settings.pattern));
    } else {
      stages.push_back(build_stage(s, settings.pattern));
    }
  }

  return with_context("Process '" + def.name + "'", [&] {
    return Process(def.name, std::move(stages), def.order, def.allow_stage_skipping,
                   def.regression_detection, def.metadata, settings, std::move(registry));
  });
}

}  // namespace stagegate
