#include "stagegate/rules/gate.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <utility>

#include "stagegate/core/error.hpp"
#include "stagegate/core/logging.hpp"
#include "stagegate/rules/validator_registry.hpp"

namespace stagegate {
namespace {

std::string upper_ascii(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

void collect_locks(const Gate& g, std::vector<const Lock*>& out) {
  for (const auto& c : g.components()) {
    if (const Lock* lk = std::get_if<Lock>(&c)) {
      out.push_back(lk);
    } else {
      collect_locks(*std::get<GatePtr>(c), out);
    }
  }
}

bool same_lock(const Lock& a, const Lock& b) {
  return a.type() == b.type() &&
         a.property_path() == b.property_path() &&
         a.expected_value() == b.expected_value() &&
         a.validator_name() == b.validator_name();
}

bool requires_presence(const Lock& l) {
  return l.type() == LockType::kExists &&
         !(l.expected_value().is_bool() && !l.expected_value().as_bool());
}

bool requires_absence(const Lock& l) {
  return l.type() == LockType::kExists && l.expected_value().is_bool() && !l.expected_value().as_bool();
}

// Pairwise conflict between two locks on the same path; empty when compatible.
std::string lock_conflict(const Lock& a, const Lock& b) {
  const std::string& p = a.property_path();
  if (p != b.property_path()) return std::string();

  if (a.type() == LockType::kEquals && b.type() == LockType::kEquals &&
      a.expected_value() != b.expected_value()) {
    return "Conflicting equals on '" + p + "': '" + a.expected_value().to_display() +
           "' vs '" + b.expected_value().to_display() + "'";
  }
  if ((requires_presence(a) && requires_absence(b)) || (requires_absence(a) && requires_presence(b))) {
    return "Conflicting exists requirements on '" + p + "'";
  }

  // equals X against greater_than / less_than Y.
  auto eq_vs_bound = [&p](const Lock& eq, const Lock& bound) -> std::string {
    if (eq.type() != LockType::kEquals) return std::string();
    double x = 0.0;
    double y = 0.0;
    if (!eq.expected_value().to_number(&x) || !bound.expected_value().to_number(&y)) return std::string();
    if (bound.type() == LockType::kGreaterThan && !(x > y)) {
      return "Conflicting bounds on '" + p + "': equals " + eq.expected_value().to_display() +
             " can never be greater than " + bound.expected_value().to_display();
    }
    if (bound.type() == LockType::kLessThan && !(x < y)) {
      return "Conflicting bounds on '" + p + "': equals " + eq.expected_value().to_display() +
             " can never be less than " + bound.expected_value().to_display();
    }
    return std::string();
  };
  if (std::string m = eq_vs_bound(a, b); !m.empty()) return m;
  return eq_vs_bound(b, a);
}

}  // namespace

Gate::Gate(std::string name,
           std::vector<GateComponent> components,
           std::optional<std::string> target_stage,
           Value::Object metadata,
           std::string logic)
    : name_(std::move(name)),
      components_(std::move(components)),
      target_stage_(std::move(target_stage)),
      metadata_(std::move(metadata)) {
  STAGEGATE_ENSURE(!name_.empty(), ErrorCode::kInvalidConfig, "Gate: name cannot be empty");
  STAGEGATE_ENSURE(!components_.empty(), ErrorCode::kInvalidConfig,
                   "Gate '" + name_ + "' must contain at least one component");
  for (const auto& c : components_) {
    if (const GatePtr* g = std::get_if<GatePtr>(&c)) {
      STAGEGATE_ENSURE(static_cast<bool>(*g), ErrorCode::kInvalidConfig,
                       "Gate '" + name_ + "' has a null nested gate");
    }
  }
  if (target_stage_ && target_stage_->empty()) target_stage_.reset();

  const std::string tag = upper_ascii(logic);
  if (!tag.empty() && tag != "AND") {
    log(LogLevel::DEBUG, "Gate '" + name_ + "': legacy logic '" + tag + "' recorded; evaluation stays AND");
    metadata_["logic"] = Value(tag);
  }
}

Gate Gate::AND(std::string name, std::vector<GateComponent> components) {
  return Gate(std::move(name), std::move(components));
}

std::string Gate::logic() const {
  const auto it = metadata_.find("logic");
  if (it != metadata_.end() && it->second.is_string()) return it->second.as_string();
  return "AND";
}

GateResult Gate::evaluate(const Element& element, const ValidatorRegistry& registry) const {
  GateResult r;
  r.gate_name = name_;
  r.total_components = components_.size();

  for (std::size_t i = 0; i < components_.size(); ++i) {
    const GateComponent& c = components_[i];
    ComponentOutcome o;

    if (const Lock* lk = std::get_if<Lock>(&c)) {
      o.label = lk->describe();
      o.lock = lk->validate(element, registry);
      o.passed = o.lock.success;
    } else {
      const Gate& nested = *std::get<GatePtr>(c);
      auto sub = std::make_shared<GateResult>(nested.evaluate(element, registry));
      o.label = nested.name();
      o.is_gate = true;
      o.passed = sub->passed;
      o.gate = std::move(sub);
    }
    ++r.evaluated_count;

    if (o.passed) {
      r.passed_components.push_back(std::move(o));
      continue;
    }

    if (o.is_gate) {
      r.messages.insert(r.messages.end(), o.gate->messages.begin(), o.gate->messages.end());
      r.actions.insert(r.actions.end(), o.gate->actions.begin(), o.gate->actions.end());
    } else {
      if (!o.lock.error_message.empty()) r.messages.push_back(o.lock.error_message);
      if (!o.lock.action_message.empty()) r.actions.push_back(o.lock.action_message);
    }
    r.failed_components.push_back(std::move(o));
    r.short_circuited = (i + 1 < components_.size());
    break;
  }

  r.passed = r.failed_components.empty();
  return r;
}

GateResult Gate::evaluate(const Element& element) const {
  return evaluate(element, *ValidatorRegistry::shared());
}

std::vector<std::string> Gate::get_property_paths() const {
  std::set<std::string> paths;
  for (const Lock* lk : all_locks()) paths.insert(lk->property_path());
  return std::vector<std::string>(paths.begin(), paths.end());
}

bool Gate::requires_property(std::string_view path) const {
  for (const Lock* lk : all_locks()) {
    if (lk->property_path() == path) return true;
  }
  return false;
}

std::size_t Gate::get_complexity() const {
  std::size_t n = 0;
  for (const auto& c : components_) {
    if (std::holds_alternative<Lock>(c)) ++n;
    else n += std::get<GatePtr>(c)->get_complexity();
  }
  return n;
}

std::size_t Gate::max_depth() const {
  std::size_t deepest = 0;
  for (const auto& c : components_) {
    if (const GatePtr* g = std::get_if<GatePtr>(&c)) deepest = std::max(deepest, (*g)->max_depth());
  }
  return deepest + 1;
}

std::vector<std::string> Gate::validate_structure(const GateLimits& limits) const {
  std::vector<std::string> warnings;

  const std::size_t depth = max_depth();
  if (depth > static_cast<std::size_t>(limits.max_recommended_depth)) {
    std::ostringstream oss;
    oss << "Gate '" << name_ << "' nesting depth " << depth
        << " exceeds recommended maximum " << limits.max_recommended_depth;
    warnings.push_back(oss.str());
  }

  const std::size_t complexity = get_complexity();
  if (complexity > static_cast<std::size_t>(limits.max_recommended_complexity)) {
    std::ostringstream oss;
    oss << "Gate '" << name_ << "' has " << complexity
        << " locks, above recommended maximum " << limits.max_recommended_complexity;
    warnings.push_back(oss.str());
  }

  const std::vector<const Lock*> locks = all_locks();
  for (std::size_t i = 0; i < locks.size(); ++i) {
    for (std::size_t j = i + 1; j < locks.size(); ++j) {
      if (same_lock(*locks[i], *locks[j])) {
        warnings.push_back("Gate '" + name_ + "' repeats lock " + locks[i]->describe());
      } else if (std::string m = lock_conflict(*locks[i], *locks[j]); !m.empty()) {
        warnings.push_back("Gate '" + name_ + "' can never pass: " + m);
      }
    }
  }

  if (logic() != "AND") {
    warnings.push_back("Gate '" + name_ + "' declares legacy logic '" + logic() + "'; evaluated as AND");
  }
  return warnings;
}

std::vector<std::string> Gate::conflicts_with(const Gate& other) const {
  std::vector<std::string> out;
  const auto mine = all_locks();
  const auto theirs = other.all_locks();
  for (const Lock* a : mine) {
    for (const Lock* b : theirs) {
      std::string m = lock_conflict(*a, *b);
      if (!m.empty() && std::find(out.begin(), out.end(), m) == out.end()) out.push_back(std::move(m));
    }
  }
  return out;
}

std::vector<const Lock*> Gate::all_locks() const {
  std::vector<const Lock*> out;
  collect_locks(*this, out);
  return out;
}

std::string Gate::summary() const {
  std::size_t locks = 0;
  std::size_t gates = 0;
  for (const auto& c : components_) {
    if (std::holds_alternative<Lock>(c)) ++locks;
    else ++gates;
  }

  std::ostringstream oss;
  oss << "Gate '" << name_ << "': " << components_.size() << " components ("
      << locks << " locks, " << gates << " gates), depth " << max_depth()
      << ", complexity " << get_complexity();
  if (target_stage_) oss << ", target " << *target_stage_;
  return oss.str();
}

}  // namespace stagegate
