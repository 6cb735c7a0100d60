#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "stagegate/core/pattern.hpp"
#include "stagegate/core/settings.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/element/value.hpp"

namespace stagegate {

enum class FieldType : std::uint8_t {
  kString = 0,
  kNumber,
  kInteger,
  kBoolean,
  kArray,
  kObject,
  kNull,
};

const char* to_string(FieldType t) noexcept;

// "string", "number", "integer", "boolean", "array", "object", "null".
bool try_parse_field_type(std::string_view name, FieldType* out) noexcept;
FieldType field_type_from_string(std::string_view name);  // throws kInvalidConfig

bool matches_field_type(const Value& v, FieldType t) noexcept;

// Per-field constraints. Unset members are not checked.
struct FieldRule final {
  std::optional<double> min;
  std::optional<double> max;
  std::optional<std::size_t> min_length;  // strings only, in code points
  std::optional<std::size_t> max_length;
  std::optional<std::string> pattern;     // anchored at start, ECMAScript; see PatternLimits
  std::optional<Value::Array> enum_values;

  // Throws Error(kInvalidConfig) naming `field`.
  void validate_or_throw(const std::string& field) const;
};

/// Structural contract for an element.
/// Field names are property paths, so "profile.email" checks a nested value.
class Schema final {
 public:
  Schema(std::string name,
         std::set<std::string> required_fields,
         std::set<std::string> optional_fields = {},
         std::map<std::string, FieldType> field_types = {},
         Value::Object default_values = Value::Object{},
         std::map<std::string, FieldRule> rules = {},
         PatternLimits pattern_limits = PatternLimits{});

  const std::string& name() const noexcept { return name_; }
  const std::set<std::string>& required_fields() const noexcept { return required_; }
  const std::set<std::string>& optional_fields() const noexcept { return optional_; }
  const std::map<std::string, FieldType>& field_types() const noexcept { return types_; }
  const Value::Object& default_values() const noexcept { return defaults_; }
  const std::map<std::string, FieldRule>& rules() const noexcept { return rules_; }

  /// All problems, in order: missing required fields, type mismatches, rule
  /// violations. Empty means valid. Absent optional fields never error.
  std::vector<std::string> validate(const Element& element) const;

  bool is_valid(const Element& element) const { return validate(element).empty(); }

  std::vector<std::string> missing_required(const Element& element) const;

  bool is_field_required(std::string_view field) const;
  std::optional<FieldType> get_field_type(std::string_view field) const;
  const Value* get_default_value(std::string_view field) const;

  // required ∪ optional, sorted.
  std::vector<std::string> get_all_fields() const;

  /// Copy of `data` with defaults filled in for absent optional fields.
  /// Dotted default paths create intermediate objects; bracketed ones are skipped.
  Value apply_defaults(const Value& data) const;

 private:
  std::vector<std::string> check_rules(const std::string& field, const Value& v, const FieldRule& rule) const;

  std::string name_;
  std::set<std::string> required_;
  std::set<std::string> optional_;
  std::map<std::string, FieldType> types_;
  Value::Object defaults_;
  std::map<std::string, FieldRule> rules_;
  std::map<std::string, std::shared_ptr<const AnchoredPattern>> patterns_;
};

}  // namespace stagegate
