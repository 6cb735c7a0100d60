#include "stagegate/stage/action.hpp"

#include <cctype>

namespace stagegate {
namespace {

std::string lower_ascii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

std::string resolve_placeholder(const std::string& var,
                                const std::map<std::string, std::string>& bindings,
                                const Element& element,
                                const Value::Object& context,
                                bool* resolved) {
  *resolved = true;

  const auto b = bindings.find(var);
  if (b != bindings.end()) {
    const Value* v = element.get_property(b->second);
    return v ? v->to_display() : std::string();
  }

  const auto c = context.find(var);
  if (c != context.end()) return c->second.to_display();

  if (const Value* v = element.get_property(var); v && !var.empty()) return v->to_display();

  *resolved = false;
  return std::string();
}

}  // namespace

const char* to_string(EvaluationState s) noexcept {
  switch (s) {
    case EvaluationState::kScoping:    return "scoping";
    case EvaluationState::kFulfilling: return "fulfilling";
    case EvaluationState::kQualifying: return "qualifying";
    case EvaluationState::kAwaiting:   return "awaiting";
    case EvaluationState::kAdvancing:  return "advancing";
    case EvaluationState::kRegressing: return "regressing";
    case EvaluationState::kCompleted:  return "completed";
  }
  return "scoping";
}

bool try_parse_evaluation_state(std::string_view name, EvaluationState* out) noexcept {
  static constexpr EvaluationState kAll[] = {
      EvaluationState::kScoping,  EvaluationState::kFulfilling, EvaluationState::kQualifying,
      EvaluationState::kAwaiting, EvaluationState::kAdvancing,  EvaluationState::kRegressing,
      EvaluationState::kCompleted,
  };
  try {
    const std::string norm = lower_ascii(name);
    for (EvaluationState s : kAll) {
      if (norm == to_string(s)) {
        if (out) *out = s;
        return true;
      }
    }
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

double state_rank(EvaluationState s) noexcept {
  switch (s) {
    case EvaluationState::kScoping:    return 0.0;
    case EvaluationState::kFulfilling: return 1.0;
    case EvaluationState::kAwaiting:   return 1.5;
    case EvaluationState::kQualifying: return 2.0;
    case EvaluationState::kAdvancing:  return 3.0;
    case EvaluationState::kCompleted:  return 4.0;
    case EvaluationState::kRegressing: return -1.0;
  }
  return 0.0;
}

const char* to_string(ActionType t) noexcept {
  switch (t) {
    case ActionType::kCompleteField:    return "complete_field";
    case ActionType::kValidateData:     return "validate_data";
    case ActionType::kWaitForCondition: return "wait_for_condition";
    case ActionType::kTransitionStage:  return "transition_stage";
    case ActionType::kManualReview:     return "manual_review";
  }
  return "complete_field";
}

bool try_parse_action_type(std::string_view name, ActionType* out) noexcept {
  static constexpr ActionType kAll[] = {
      ActionType::kCompleteField, ActionType::kValidateData, ActionType::kWaitForCondition,
      ActionType::kTransitionStage, ActionType::kManualReview,
  };
  try {
    const std::string norm = lower_ascii(name);
    for (ActionType t : kAll) {
      if (norm == to_string(t)) {
        if (out) *out = t;
        return true;
      }
    }
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

const char* to_string(Priority p) noexcept {
  switch (p) {
    case Priority::kLow:      return "low";
    case Priority::kNormal:   return "normal";
    case Priority::kHigh:     return "high";
    case Priority::kCritical: return "critical";
  }
  return "normal";
}

bool try_parse_priority(std::string_view name, Priority* out) noexcept {
  static constexpr Priority kAll[] = {Priority::kLow, Priority::kNormal, Priority::kHigh, Priority::kCritical};
  try {
    const std::string norm = lower_ascii(name);
    for (Priority p : kAll) {
      if (norm == to_string(p)) {
        if (out) *out = p;
        return true;
      }
    }
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

Value Action::to_value() const {
  Value::Array conds;
  conds.reserve(conditions.size());
  for (const auto& c : conditions) conds.emplace_back(c);

  Value::Object o;
  o["type"] = Value(to_string(type));
  o["description"] = Value(description);
  o["priority"] = Value(to_string(priority));
  o["conditions"] = Value(std::move(conds));
  o["metadata"] = Value(metadata);
  return Value(std::move(o));
}

std::string render_template(std::string_view text,
                            const std::map<std::string, std::string>& bindings,
                            const Element& element,
                            const Value::Object& context) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c != '{') {
      out.push_back(c);
      ++i;
      continue;
    }

    const std::size_t close = text.find('}', i + 1);
    if (close == std::string_view::npos) {
      out.append(text.substr(i));
      break;
    }

    const std::string var(text.substr(i + 1, close - i - 1));
    if (var.empty() || var.find('{') != std::string::npos) {
      out.push_back(c);
      ++i;
      continue;
    }

    bool resolved = false;
    const std::string rendered = resolve_placeholder(var, bindings, element, context, &resolved);
    if (resolved) out += rendered;
    else out.append(text.substr(i, close - i + 1));
    i = close + 1;
  }
  return out;
}

Action ActionTemplate::resolve(const Element& element, const Value::Object& context) const {
  Action a;
  a.type = type;
  a.priority = priority;
  a.metadata = metadata;
  a.description = render_template(description, template_vars, element, context);
  a.conditions.reserve(conditions.size());
  for (const auto& cond : conditions) {
    a.conditions.push_back(render_template(cond, template_vars, element, context));
  }
  return a;
}

}  // namespace stagegate
