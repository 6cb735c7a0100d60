#include "stagegate/rules/lock.hpp"

#include <cctype>
#include <sstream>
#include <utility>

#include "stagegate/core/error.hpp"
#include "stagegate/core/logging.hpp"
#include "stagegate/rules/validator_registry.hpp"

namespace stagegate {
namespace {

std::string lower_ascii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

std::string display(const Value* v) {
  return v ? v->to_display() : std::string("<missing>");
}

// UTF-8 code points; arrays/objects by element count.
bool measure_length(const Value& v, std::int64_t* out) {
  if (v.is_string()) {
    std::int64_t n = 0;
    for (unsigned char c : v.as_string()) {
      if ((c & 0xC0u) != 0x80u) ++n;
    }
    *out = n;
    return true;
  }
  if (v.is_array() || v.is_object()) {
    *out = static_cast<std::int64_t>(v.size());
    return true;
  }
  return false;
}

const char* type_tag_name(Value::Type t) noexcept {
  switch (t) {
    case Value::Type::kNull:   return "null";
    case Value::Type::kBool:   return "bool";
    case Value::Type::kInt:    return "int";
    case Value::Type::kFloat:  return "float";
    case Value::Type::kString: return "str";
    case Value::Type::kArray:  return "list";
    case Value::Type::kObject: return "dict";
  }
  return "unknown";
}

bool expects_null_type(const Value& expected) {
  return expected.is_string() && lower_ascii(expected.as_string()) == "null";
}

// Membership of `needle` in `hay`. *container=false when hay cannot hold members.
bool member_of(const Value& needle, const Value& hay, bool* container) {
  *container = true;
  if (hay.is_array()) {
    for (const auto& item : hay.as_array()) {
      if (item == needle) return true;
    }
    return false;
  }
  if (hay.is_object()) {
    return needle.is_string() && hay.find(needle.as_string()) != nullptr;
  }
  if (hay.is_string()) {
    return needle.is_string() && hay.as_string().find(needle.as_string()) != std::string::npos;
  }
  *container = false;
  return false;
}

// ----------------------------- per-type rules --------------------------------

bool check_exists(const Value& v, bool expects_absent) {
  const bool empty_like = v.is_null() ||
                          (v.is_string() && v.as_string().empty()) ||
                          (v.is_array() && v.size() == 0);
  return expects_absent ? empty_like : !empty_like;
}

bool check_compare(const Value& v, const Value& expected, bool greater) {
  double a = 0.0;
  double b = 0.0;
  if (!v.to_number(&a) || !expected.to_number(&b)) return false;
  return greater ? (a > b) : (a < b);
}

bool check_contains(const Value& v, const Value& expected) {
  if (v.is_string()) {
    return expected.is_string() && v.as_string().find(expected.as_string()) != std::string::npos;
  }
  if (v.is_array()) {
    for (const auto& item : v.as_array()) {
      if (item == expected) return true;
    }
    return false;
  }
  if (v.is_object()) {
    return expected.is_string() && v.find(expected.as_string()) != nullptr;
  }
  return false;
}

bool check_regex(const Value& v, const AnchoredPattern* re, const std::string& path) {
  if (!v.is_string() || re == nullptr) return false;
  switch (re->match(v.as_string())) {
    case PatternMatch::kMatched:
      return true;
    case PatternMatch::kNotMatched:
      return false;
    case PatternMatch::kSubjectTooLong:
      log(LogLevel::WARN, "Lock: value of '" + path + "' is " + std::to_string(v.as_string().size()) +
                              " bytes, over the pattern limit of " + std::to_string(re->max_subject_length()) +
                              "; treated as no match");
      return false;
  }
  return false;
}

bool check_type(const Value& v, const Value& expected) {
  if (!expected.is_string()) return false;
  const std::string name = lower_ascii(expected.as_string());
  const Value::Type t = v.type();

  if (name == "str" || name == "string") return t == Value::Type::kString;
  if (name == "int" || name == "integer") return t == Value::Type::kInt;
  if (name == "float") return t == Value::Type::kFloat;
  if (name == "number") return v.is_number();
  if (name == "bool" || name == "boolean") return t == Value::Type::kBool;
  if (name == "list" || name == "array") return t == Value::Type::kArray;
  if (name == "dict" || name == "dictionary" || name == "object") return t == Value::Type::kObject;
  if (name == "null") return t == Value::Type::kNull;
  return false;
}

bool check_range(const Value& v, const Value& expected) {
  if (!expected.is_array() || expected.size() != 2) return false;
  double x = 0.0;
  double lo = 0.0;
  double hi = 0.0;
  if (!v.to_number(&x)) return false;
  if (!expected.as_array()[0].to_number(&lo) || !expected.as_array()[1].to_number(&hi)) return false;
  return lo <= x && x <= hi;
}

bool check_length(const Value& v, const Value& expected) {
  std::int64_t len = 0;
  if (!measure_length(v, &len)) return false;
  const double n = static_cast<double>(len);

  if (expected.is_int()) return len == expected.as_int();

  if (expected.is_object()) {
    double bound = 0.0;
    if (const Value* lo = expected.find("min"); lo && !lo->is_null()) {
      if (!lo->is_number()) return false;
      bound = lo->as_double();
      if (n < bound) return false;
    }
    if (const Value* hi = expected.find("max"); hi && !hi->is_null()) {
      if (!hi->is_number()) return false;
      bound = hi->as_double();
      if (n > bound) return false;
    }
    return true;
  }

  if (expected.is_array() && expected.size() == 2) {
    const auto& pair = expected.as_array();
    if (!pair[0].is_number() || !pair[1].is_number()) return false;
    return pair[0].as_double() <= n && n <= pair[1].as_double();
  }
  return false;
}

bool check_not_empty(const Value& v) {
  if (v.is_string()) {
    for (char c : v.as_string()) {
      if (!std::isspace(static_cast<unsigned char>(c))) return true;
    }
    return false;
  }
  if (v.is_array() || v.is_object()) return v.size() > 0;
  return !v.is_null();
}

bool check_custom(const Value& v, const Value& expected, const std::string& name,
                  const std::string& path, const ValidatorRegistry& registry) {
  const ValidatorFn fn = registry.find(name);
  if (!fn) {
    log(LogLevel::WARN, "Lock: custom validator '" + name + "' is not registered (property '" + path + "')");
    return false;
  }
  try {
    return fn(v, expected);
  } catch (const std::exception& e) {
    log(LogLevel::WARN, "Lock: custom validator '" + name + "' threw on property '" + path + "': " + e.what());
    return false;
  } catch (...) {
    log(LogLevel::WARN, "Lock: custom validator '" + name + "' threw a non-standard exception on property '" + path + "'");
    return false;
  }
}

// "at least 2 and at most 5" for {min,max} length maps.
std::string length_constraints(const Value& expected) {
  std::string out;
  if (const Value* lo = expected.find("min")) out += "at least " + lo->to_display();
  if (const Value* hi = expected.find("max")) {
    if (!out.empty()) out += " and ";
    out += "at most " + hi->to_display();
  }
  return out;
}

bool is_pair(const Value& v) {
  return v.is_array() && v.size() == 2;
}

}  // namespace

const char* to_string(LockType t) noexcept {
  switch (t) {
    case LockType::kExists:      return "exists";
    case LockType::kEquals:      return "equals";
    case LockType::kGreaterThan: return "greater_than";
    case LockType::kLessThan:    return "less_than";
    case LockType::kContains:    return "contains";
    case LockType::kRegex:       return "regex";
    case LockType::kTypeCheck:   return "type_check";
    case LockType::kRange:       return "range";
    case LockType::kLength:      return "length";
    case LockType::kNotEmpty:    return "not_empty";
    case LockType::kInList:      return "in_list";
    case LockType::kNotInList:   return "not_in_list";
    case LockType::kCustom:      return "custom";
  }
  return "unknown";
}

bool try_parse_lock_type(std::string_view name, LockType* out) noexcept {
  static constexpr LockType kAll[] = {
      LockType::kExists,  LockType::kEquals,    LockType::kGreaterThan, LockType::kLessThan,
      LockType::kContains, LockType::kRegex,    LockType::kTypeCheck,   LockType::kRange,
      LockType::kLength,  LockType::kNotEmpty,  LockType::kInList,      LockType::kNotInList,
      LockType::kCustom,
  };
  try {
    std::string norm = lower_ascii(name);
    for (char& c : norm) {
      if (c == '-') c = '_';
    }
    for (LockType t : kAll) {
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

LockType lock_type_from_string(std::string_view name) {
  LockType t = LockType::kExists;
  if (!try_parse_lock_type(name, &t)) {
    STAGEGATE_THROW(ErrorCode::kInvalidConfig, "Unknown lock type '" + std::string(name) + "'");
  }
  return t;
}

bool requires_expected_value(LockType t) noexcept {
  switch (t) {
    case LockType::kEquals:
    case LockType::kGreaterThan:
    case LockType::kLessThan:
    case LockType::kContains:
    case LockType::kRegex:
    case LockType::kTypeCheck:
    case LockType::kRange:
    case LockType::kLength:
    case LockType::kInList:
    case LockType::kNotInList:
      return true;
    case LockType::kExists:
    case LockType::kNotEmpty:
    case LockType::kCustom:
      return false;
  }
  return false;
}

Lock::Lock(LockType type,
           std::string property_path,
           Value expected_value,
           std::string validator_name,
           Value::Object metadata,
           LockOptions options)
    : type_(type),
      property_path_(std::move(property_path)),
      expected_(std::move(expected_value)),
      validator_name_(std::move(validator_name)),
      metadata_(std::move(metadata)),
      options_(std::move(options)) {
  STAGEGATE_ENSURE(!property_path_.empty(), ErrorCode::kInvalidConfig,
                   "Lock: property path cannot be empty");
  if (requires_expected_value(type_) && expected_.is_null()) {
    STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                    std::string("Lock type ") + to_string(type_) + " requires expected_value (property '" +
                        property_path_ + "')");
  }
  if (type_ == LockType::kCustom && validator_name_.empty()) {
    STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                    "Custom lock type requires validator_name (property '" + property_path_ + "')");
  }

  if (type_ == LockType::kRegex) {
    PatternLimits{options_.max_pattern_subject}.validate_or_throw();
    const std::string pattern = expected_.to_display();
    std::string why;
    regex_ = AnchoredPattern::compile(pattern, options_.max_pattern_subject, &why);
    if (!regex_) {
      // Not a construction error: the lock simply never passes.
      log(LogLevel::WARN, "Lock: pattern '" + pattern + "' for property '" + property_path_ +
                              "' does not compile: " + why);
    }
  }
}

Lock Lock::type_check(std::string property_path, Value::Type tag, Value::Object metadata) {
  return Lock(LockType::kTypeCheck, std::move(property_path), Value(type_tag_name(tag)),
              std::string(), std::move(metadata));
}

Lock Lock::custom(std::string property_path, std::string validator_name,
                  Value expected_value, Value::Object metadata) {
  return Lock(LockType::kCustom, std::move(property_path), std::move(expected_value),
              std::move(validator_name), std::move(metadata));
}

bool Lock::expects_absent() const noexcept {
  return type_ == LockType::kExists && expected_.is_bool() && !expected_.as_bool();
}

bool Lock::check_value(const Value& value, const ValidatorRegistry& registry) const {
  if (value.is_null() && type_ != LockType::kExists &&
      !(type_ == LockType::kTypeCheck && expects_null_type(expected_))) {
    return false;
  }

  switch (type_) {
    case LockType::kExists:      return check_exists(value, expects_absent());
    case LockType::kEquals:      return value == expected_;
    case LockType::kGreaterThan: return check_compare(value, expected_, true);
    case LockType::kLessThan:    return check_compare(value, expected_, false);
    case LockType::kContains:    return check_contains(value, expected_);
    case LockType::kRegex:       return check_regex(value, regex_.get(), property_path_);
    case LockType::kTypeCheck:   return check_type(value, expected_);
    case LockType::kRange:       return check_range(value, expected_);
    case LockType::kLength:      return check_length(value, expected_);
    case LockType::kNotEmpty:    return check_not_empty(value);
    case LockType::kInList: {
      bool container = false;
      const bool member = member_of(value, expected_, &container);
      return container && member;
    }
    case LockType::kNotInList: {
      bool container = false;
      const bool member = member_of(value, expected_, &container);
      return container && !member;
    }
    case LockType::kCustom:
      return check_custom(value, expected_, validator_name_, property_path_, registry);
  }
  return false;
}

LockResult Lock::validate(const Element& element, const ValidatorRegistry& registry) const {
  LockResult r;
  r.property_path = property_path_;
  r.lock_type = type_;
  r.expected_value = expected_;
  r.metadata = metadata_;

  const Value* v = element.get_property(property_path_);
  if (v == nullptr) {
    r.found = false;
    r.success = expects_absent();
  } else {
    r.found = true;
    r.actual_value = *v;
    r.success = check_value(*v, registry);
  }

  if (!r.success) {
    r.error_message = options_.error_message.empty() ? failure_message(v) : options_.error_message;
    r.action_message = action_message(v);
  }
  return r;
}

LockResult Lock::validate(const Element& element) const {
  return validate(element, *ValidatorRegistry::shared());
}

std::future<LockResult> Lock::validate_async(const Element& element,
                                             const ValidatorRegistry& registry) const {
  return std::async(std::launch::deferred,
                    [this, &element, &registry]() { return validate(element, registry); });
}

std::string Lock::failure_message(const Value* observed) const {
  const std::string p = "Property '" + property_path_ + "'";
  const std::string e = expected_.to_display();
  const std::string v = display(observed);

  std::ostringstream oss;
  switch (type_) {
    case LockType::kExists:
      if (expects_absent()) oss << p << " should not exist but has value: " << v;
      else oss << p << " is required but missing or empty";
      break;
    case LockType::kEquals:
      oss << p << " should equal '" << e << "' but is '" << v << "'";
      break;
    case LockType::kGreaterThan:
      oss << p << " should be greater than " << e << " but is " << v;
      break;
    case LockType::kLessThan:
      oss << p << " should be less than " << e << " but is " << v;
      break;
    case LockType::kContains:
      oss << p << " should contain '" << e << "' but is '" << v << "'";
      break;
    case LockType::kRegex:
      if (observed && observed->is_string() && observed->as_string().size() > options_.max_pattern_subject) {
        oss << p << " is too long to match pattern '" << e << "' (" << observed->as_string().size()
            << " bytes, limit " << options_.max_pattern_subject << ")";
      } else {
        oss << p << " should match pattern '" << e << "' but is '" << v << "'";
      }
      break;
    case LockType::kTypeCheck:
      oss << p << " should be of type '" << e << "' but is '"
          << (observed ? to_string(observed->type()) : "missing") << "' with value '" << v << "'";
      break;
    case LockType::kRange:
      if (is_pair(expected_)) {
        oss << p << " should be between " << expected_.as_array()[0].to_display() << " and "
            << expected_.as_array()[1].to_display() << " but is " << v;
      } else {
        oss << p << " should be within range " << e << " but is " << v;
      }
      break;
    case LockType::kLength: {
      std::int64_t len = 0;
      const std::string actual =
          (observed && measure_length(*observed, &len)) ? std::to_string(len) : "<non-measurable>";
      if (expected_.is_object()) {
        oss << p << " should have length " << length_constraints(expected_) << " but has length " << actual;
      } else {
        oss << p << " should have length " << e << " but has length " << actual;
      }
    } break;
    case LockType::kNotEmpty:
      oss << p << " should not be empty but is '" << v << "'";
      break;
    case LockType::kInList:
      oss << p << " should be one of " << e << " but is '" << v << "'";
      break;
    case LockType::kNotInList:
      oss << p << " should not be one of " << e << " but is '" << v << "'";
      break;
    case LockType::kCustom:
      oss << "Custom validation '" << validator_name_ << "' failed for property '" << property_path_ << "'";
      break;
  }
  return oss.str();
}

std::string Lock::action_message(const Value* observed) const {
  (void)observed;  // remediation depends on the lock only
  const std::string& p = property_path_;
  const std::string e = expected_.to_display();

  std::ostringstream oss;
  switch (type_) {
    case LockType::kExists:
      if (expects_absent()) oss << "Remove property: " << p;
      else oss << "Set missing field: " << p;
      break;
    case LockType::kEquals:
      oss << "Set " << p << " to '" << e << "'";
      break;
    case LockType::kGreaterThan:
      oss << "Increase " << p << " to be greater than " << e;
      break;
    case LockType::kLessThan:
      oss << "Decrease " << p << " to be less than " << e;
      break;
    case LockType::kContains:
      oss << "Ensure " << p << " contains '" << e << "'";
      break;
    case LockType::kRegex:
      oss << "Update " << p << " to match pattern: " << e;
      break;
    case LockType::kTypeCheck:
      oss << "Change " << p << " to be of type " << e;
      break;
    case LockType::kRange:
      if (is_pair(expected_)) {
        oss << "Set " << p << " to a value between " << expected_.as_array()[0].to_display() << " and "
            << expected_.as_array()[1].to_display();
      } else {
        oss << "Set " << p << " to a value within range " << e;
      }
      break;
    case LockType::kLength:
      if (expected_.is_int()) {
        oss << "Adjust " << p << " to have exactly " << e << " elements/characters";
      } else if (expected_.is_object()) {
        oss << "Adjust " << p << " to have " << length_constraints(expected_) << " elements/characters";
      } else {
        oss << "Adjust " << p << " length to match " << e;
      }
      break;
    case LockType::kNotEmpty:
      oss << "Provide a non-empty value for " << p;
      break;
    case LockType::kInList:
      oss << "Set " << p << " to one of: ";
      if (expected_.is_array()) {
        const auto& items = expected_.as_array();
        for (std::size_t i = 0; i < items.size(); ++i) {
          if (i) oss << ", ";
          oss << items[i].to_display();
        }
      } else {
        oss << e;
      }
      break;
    case LockType::kNotInList:
      oss << "Change " << p << " from restricted value";
      break;
    case LockType::kCustom:
      oss << "Fix custom validation for " << p;
      break;
  }
  return oss.str();
}

std::string Lock::describe() const {
  return std::string(to_string(type_)) + "(" + property_path_ + ")";
}

}  // namespace stagegate
