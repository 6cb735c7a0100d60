#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "stagegate/core/hashing.hpp"

namespace stagegate {

// JSON-like tree used for element data, lock expectations, metadata and
// StatusResult maps. Object keys are kept sorted so iteration, hashing and
// rendering are deterministic.
class Value {
 public:
  enum class Type : std::uint8_t {
    kNull = 0,
    kBool = 1,
    kInt = 2,
    kFloat = 3,
    kString = 4,
    kArray = 5,
    kObject = 6,
  };

  using Array = std::vector<Value>;
  using Object = std::map<std::string, Value, std::less<>>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : type_(Type::kBool), bool_(b) {}

  template <class T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                 !std::is_same_v<T, char>,
                             int> = 0>
  Value(T i) : type_(Type::kInt), int_(static_cast<std::int64_t>(i)) {}

  Value(double d) : type_(Type::kFloat), float_(d) {}
  Value(const char* s) : type_(Type::kString), str_(s ? s : "") {}
  Value(std::string s) : type_(Type::kString), str_(std::move(s)) {}
  Value(Array a) : type_(Type::kArray), arr_(std::move(a)) {}
  Value(Object o) : type_(Type::kObject), obj_(std::move(o)) {}

  Type type() const noexcept { return type_; }

  bool is_null() const noexcept { return type_ == Type::kNull; }
  bool is_bool() const noexcept { return type_ == Type::kBool; }
  bool is_int() const noexcept { return type_ == Type::kInt; }
  bool is_float() const noexcept { return type_ == Type::kFloat; }
  bool is_number() const noexcept { return type_ == Type::kInt || type_ == Type::kFloat; }
  bool is_string() const noexcept { return type_ == Type::kString; }
  bool is_array() const noexcept { return type_ == Type::kArray; }
  bool is_object() const noexcept { return type_ == Type::kObject; }

  // Typed access; throws Error(kInvalidArgument) on a kind mismatch.
  bool as_bool() const;
  std::int64_t as_int() const;
  double as_double() const;  // int or float
  const std::string& as_string() const;
  const Array& as_array() const;
  const Object& as_object() const;

  // Object member lookup. nullptr when absent or when this is not an object.
  const Value* find(std::string_view key) const noexcept;

  // Array element lookup; negative indexes count from the end.
  const Value* at_index(std::int64_t idx) const noexcept;

  // Element count for arrays/objects, 0 otherwise.
  std::size_t size() const noexcept;

  // Float coercion: numbers, bools, and strings holding a complete decimal
  // literal (surrounding whitespace allowed). Returns false otherwise.
  bool to_number(double* out) const noexcept;

  // Int/float compare numerically; bool never equals a number.
  bool operator==(const Value& o) const;
  bool operator!=(const Value& o) const { return !(*this == o); }

  // Human rendering used in messages: strings unquoted, containers as JSON.
  std::string to_display() const;

 private:
  Type type_ = Type::kNull;
  bool bool_ = false;
  std::int64_t int_ = 0;
  double float_ = 0.0;
  std::string str_;
  Array arr_;
  Object obj_;
};

const char* to_string(Value::Type t) noexcept;

// Shortest text that parses back to the same double ("3.5", "1e+100", "70.0").
std::string format_double(double v);

// Deterministic content hash (object keys are visited in sorted order).
Hash64 hash_value(const Value& v);

}  // namespace stagegate
