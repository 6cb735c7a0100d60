#pragma once
/*
================================================================================
Fragment 3.1 — Rules: Lock (atomic predicate over one property path)
FILE: cpp/stagegate/rules/lock.hpp

Purpose:
  - Resolve one property path on an Element and apply one of 13 checks.
  - Produce a failure message and a remediation message for every failure.

Hardening:
  - Construction validates configuration (kInvalidConfig); a built Lock is
    always evaluable.
  - validate() is total: absent paths, wrong kinds, malformed patterns,
    over-long regex subjects and throwing custom predicates all fold into
    success=false.
  - LockType dispatch is an exhaustive switch with no default branch.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <string_view>

#include "stagegate/core/pattern.hpp"
#include "stagegate/core/settings.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/element/value.hpp"

namespace stagegate {

class ValidatorRegistry;

enum class LockType : std::uint8_t {
  kExists = 0,
  kEquals,
  kGreaterThan,
  kLessThan,
  kContains,
  kRegex,
  kTypeCheck,
  kRange,
  kLength,
  kNotEmpty,
  kInList,
  kNotInList,
  kCustom,
};

// Canonical snake_case name ("greater_than").
const char* to_string(LockType t) noexcept;

// Accepts canonical names, hyphens instead of underscores, any case.
bool try_parse_lock_type(std::string_view name, LockType* out) noexcept;

// Throws Error(kInvalidConfig) for unknown names.
LockType lock_type_from_string(std::string_view name);

// True for the comparison-style types that need a non-null expected_value.
bool requires_expected_value(LockType t) noexcept;

struct LockResult final {
  bool success = false;
  std::string property_path;
  LockType lock_type = LockType::kExists;

  bool found = false;     // property path resolved
  Value actual_value;     // null when !found
  Value expected_value;

  std::string error_message;   // empty on success
  std::string action_message;  // empty on success
  Value::Object metadata;
};

struct LockOptions {
  // Replaces the generated failure text when set.
  std::string error_message;
  // REGEX only.
  std::size_t max_pattern_subject = PatternLimits{}.max_subject_length;
};

class Lock final {
 public:
  Lock(LockType type,
       std::string property_path,
       Value expected_value = Value(),
       std::string validator_name = std::string(),
       Value::Object metadata = Value::Object{},
       LockOptions options = LockOptions{});

  // TYPE_CHECK against a concrete Value kind instead of a type name.
  static Lock type_check(std::string property_path, Value::Type tag,
                         Value::Object metadata = Value::Object{});

  static Lock custom(std::string property_path, std::string validator_name,
                     Value expected_value = Value(),
                     Value::Object metadata = Value::Object{});

  LockType type() const noexcept { return type_; }
  const std::string& property_path() const noexcept { return property_path_; }
  const Value& expected_value() const noexcept { return expected_; }
  const std::string& validator_name() const noexcept { return validator_name_; }
  const Value::Object& metadata() const noexcept { return metadata_; }
  const std::string& custom_error_message() const noexcept { return options_.error_message; }
  std::size_t max_pattern_subject() const noexcept { return options_.max_pattern_subject; }

  LockResult validate(const Element& element, const ValidatorRegistry& registry) const;

  // Uses ValidatorRegistry::shared().
  LockResult validate(const Element& element) const;

  // Deferred: runs validate() on the thread calling get(). Lock, element and
  // registry must outlive the future.
  std::future<LockResult> validate_async(const Element& element,
                                         const ValidatorRegistry& registry) const;

  // Rule applied to an already-resolved value.
  bool check_value(const Value& value, const ValidatorRegistry& registry) const;

  // observed == nullptr means the path did not resolve. Always the generated
  // text; validate() substitutes custom_error_message() when one is set.
  std::string failure_message(const Value* observed) const;
  std::string action_message(const Value* observed) const;

  // Short label, e.g. "range(age)".
  std::string describe() const;

 private:
  bool expects_absent() const noexcept;

  LockType type_;
  std::string property_path_;
  Value expected_;
  std::string validator_name_;
  Value::Object metadata_;
  LockOptions options_;

  // REGEX only; null when the pattern does not compile.
  std::shared_ptr<const AnchoredPattern> regex_;
};

}  // namespace stagegate
