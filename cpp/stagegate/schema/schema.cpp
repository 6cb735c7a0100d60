#include "stagegate/schema/schema.hpp"

#include <cmath>
#include <sstream>
#include <utility>

#include "stagegate/core/error.hpp"
#include "stagegate/core/logging.hpp"

namespace stagegate {
namespace {

// 18.0 -> "18", 0.5 -> "0.5"
std::string format_bound(double d) {
  if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
    return std::to_string(static_cast<long long>(d));
  }
  return format_double(d);
}

std::size_t code_points(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0u) != 0x80u) ++n;
  }
  return n;
}

std::string join_values(const Value::Array& items) {
  std::string out = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out += ", ";
    out += items[i].to_display();
  }
  out += "]";
  return out;
}

Value with_default(const Value& node, const std::vector<PathToken>& tokens, std::size_t idx,
                   const Value& def) {
  if (!node.is_object()) return node;
  Value::Object copy = node.as_object();
  const std::string& key = tokens[idx].text;
  const auto it = copy.find(key);

  if (idx + 1 == tokens.size()) {
    if (it == copy.end()) copy.emplace(key, def);
    return Value(std::move(copy));
  }

  const Value child = (it == copy.end()) ? Value(Value::Object{}) : it->second;
  copy[key] = with_default(child, tokens, idx + 1, def);
  return Value(std::move(copy));
}

}  // namespace

const char* to_string(FieldType t) noexcept {
  switch (t) {
    case FieldType::kString:  return "string";
    case FieldType::kNumber:  return "number";
    case FieldType::kInteger: return "integer";
    case FieldType::kBoolean: return "boolean";
    case FieldType::kArray:   return "array";
    case FieldType::kObject:  return "object";
    case FieldType::kNull:    return "null";
  }
  return "unknown";
}

bool try_parse_field_type(std::string_view name, FieldType* out) noexcept {
  static constexpr FieldType kAll[] = {
      FieldType::kString, FieldType::kNumber, FieldType::kInteger, FieldType::kBoolean,
      FieldType::kArray,  FieldType::kObject, FieldType::kNull,
  };
  for (FieldType t : kAll) {
    if (name == to_string(t)) {
      if (out) *out = t;
      return true;
    }
  }
  return false;
}

FieldType field_type_from_string(std::string_view name) {
  FieldType t = FieldType::kString;
  if (!try_parse_field_type(name, &t)) {
    STAGEGATE_THROW(ErrorCode::kInvalidConfig, "Invalid field type '" + std::string(name) + "'");
  }
  return t;
}

bool matches_field_type(const Value& v, FieldType t) noexcept {
  switch (t) {
    case FieldType::kString:  return v.is_string();
    case FieldType::kNumber:  return v.is_number();
    case FieldType::kInteger: return v.is_int();
    case FieldType::kBoolean: return v.is_bool();
    case FieldType::kArray:   return v.is_array();
    case FieldType::kObject:  return v.is_object();
    case FieldType::kNull:    return v.is_null();
  }
  return false;
}

void FieldRule::validate_or_throw(const std::string& field) const {
  if (min && max) {
    STAGEGATE_ENSURE(*min <= *max, ErrorCode::kInvalidConfig,
                     "Rule for field '" + field + "': min greater than max");
  }
  if (min_length && max_length) {
    STAGEGATE_ENSURE(*min_length <= *max_length, ErrorCode::kInvalidConfig,
                     "Rule for field '" + field + "': min_length greater than max_length");
  }
  if (min) STAGEGATE_ENSURE(!std::isnan(*min), ErrorCode::kInvalidConfig, "Rule for field '" + field + "': min is NaN");
  if (max) STAGEGATE_ENSURE(!std::isnan(*max), ErrorCode::kInvalidConfig, "Rule for field '" + field + "': max is NaN");
}

Schema::Schema(std::string name,
               std::set<std::string> required_fields,
               std::set<std::string> optional_fields,
               std::map<std::string, FieldType> field_types,
               Value::Object default_values,
               std::map<std::string, FieldRule> rules,
               PatternLimits pattern_limits)
    : name_(std::move(name)),
      required_(std::move(required_fields)),
      optional_(std::move(optional_fields)),
      types_(std::move(field_types)),
      defaults_(std::move(default_values)),
      rules_(std::move(rules)) {
  STAGEGATE_ENSURE(!name_.empty(), ErrorCode::kInvalidConfig, "Schema must have a name");

  for (const auto& f : required_) {
    STAGEGATE_ENSURE(!f.empty(), ErrorCode::kInvalidConfig, "Schema '" + name_ + "': empty required field path");
    if (optional_.count(f)) {
      STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                      "Schema '" + name_ + "': field '" + f + "' cannot be both required and optional");
    }
  }
  for (const auto& f : optional_) {
    STAGEGATE_ENSURE(!f.empty(), ErrorCode::kInvalidConfig, "Schema '" + name_ + "': empty optional field path");
  }
  for (const auto& kv : defaults_) {
    if (!optional_.count(kv.first)) {
      STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                      "Schema '" + name_ + "': default value provided for non-optional field '" + kv.first + "'");
    }
  }

  pattern_limits.validate_or_throw();
  for (const auto& [field, rule] : rules_) {
    rule.validate_or_throw(field);
    if (!rule.pattern) continue;
    std::string why;
    auto compiled = AnchoredPattern::compile(*rule.pattern, pattern_limits.max_subject_length, &why);
    if (!compiled) {
      STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                      "Schema '" + name_ + "': invalid pattern for field '" + field + "': " + why);
    }
    patterns_[field] = std::move(compiled);
  }
}

std::vector<std::string> Schema::missing_required(const Element& element) const {
  std::vector<std::string> out;
  for (const auto& f : required_) {
    if (!element.has_property(f)) out.push_back(f);
  }
  return out;
}

std::vector<std::string> Schema::validate(const Element& element) const {
  std::vector<std::string> errors;

  for (const auto& f : missing_required(element)) {
    errors.push_back("Required field missing: " + f);
  }

  for (const auto& [field, type] : types_) {
    const Value* v = element.get_property(field);
    if (v && !matches_field_type(*v, type)) {
      errors.push_back("Field '" + field + "' has invalid type: expected " + to_string(type));
    }
  }

  for (const auto& [field, rule] : rules_) {
    const Value* v = element.get_property(field);
    if (!v) continue;
    auto field_errors = check_rules(field, *v, rule);
    errors.insert(errors.end(), field_errors.begin(), field_errors.end());
  }

  return errors;
}

std::vector<std::string> Schema::check_rules(const std::string& field, const Value& v,
                                             const FieldRule& rule) const {
  std::vector<std::string> errors;
  const std::string f = "Field '" + field + "'";

  double x = 0.0;
  const bool numeric = v.to_number(&x);
  if (rule.min) {
    if (!numeric) errors.push_back(f + " cannot be compared to minimum value");
    else if (x < *rule.min) errors.push_back(f + " below minimum value " + format_bound(*rule.min));
  }
  if (rule.max) {
    if (!numeric) errors.push_back(f + " cannot be compared to maximum value");
    else if (x > *rule.max) errors.push_back(f + " above maximum value " + format_bound(*rule.max));
  }

  if (v.is_string()) {
    const std::size_t len = code_points(v.as_string());
    if (rule.min_length && len < *rule.min_length) {
      errors.push_back(f + " below minimum length " + std::to_string(*rule.min_length));
    }
    if (rule.max_length && len > *rule.max_length) {
      errors.push_back(f + " above maximum length " + std::to_string(*rule.max_length));
    }

    const auto it = patterns_.find(field);
    if (it != patterns_.end()) {
      switch (it->second->match(v.as_string())) {
        case PatternMatch::kMatched:
          break;
        case PatternMatch::kNotMatched:
          errors.push_back(f + " does not match required pattern");
          break;
        case PatternMatch::kSubjectTooLong: {
          const std::string limit = std::to_string(it->second->max_subject_length());
          log(LogLevel::WARN, "Schema '" + name_ + "': " + f + " is " + std::to_string(v.as_string().size()) +
                                  " bytes, over the pattern limit of " + limit);
          errors.push_back(f + " is too long to check against its pattern (limit " + limit + " bytes)");
        } break;
      }
    }
  }

  if (rule.enum_values) {
    bool member = false;
    for (const auto& item : *rule.enum_values) {
      if (item == v) {
        member = true;
        break;
      }
    }
    if (!member) errors.push_back(f + " must be one of: " + join_values(*rule.enum_values));
  }

  return errors;
}

bool Schema::is_field_required(std::string_view field) const {
  return required_.find(std::string(field)) != required_.end();
}

std::optional<FieldType> Schema::get_field_type(std::string_view field) const {
  const auto it = types_.find(std::string(field));
  if (it == types_.end()) return std::nullopt;
  return it->second;
}

const Value* Schema::get_default_value(std::string_view field) const {
  const auto it = defaults_.find(field);
  return (it == defaults_.end()) ? nullptr : &it->second;
}

std::vector<std::string> Schema::get_all_fields() const {
  std::set<std::string> all = required_;
  all.insert(optional_.begin(), optional_.end());
  return std::vector<std::string>(all.begin(), all.end());
}

Value Schema::apply_defaults(const Value& data) const {
  Value out = data;
  for (const auto& [field, def] : defaults_) {
    const Element filled_so_far(out);
    if (filled_so_far.has_property(field)) continue;

    std::vector<PathToken> tokens;
    if (!split_property_path(field, &tokens) || tokens.empty()) continue;
    bool bracketed = false;
    for (const auto& t : tokens) bracketed = bracketed || t.bracketed;
    if (bracketed) continue;

    out = with_default(out, tokens, 0, def);
  }
  return out;
}

}  // namespace stagegate
