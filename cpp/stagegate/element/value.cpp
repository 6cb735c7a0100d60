#include "stagegate/element/value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "stagegate/core/error.hpp"
#include "stagegate/element/value_json.hpp"

namespace stagegate {
namespace {

std::string kind_mismatch(const char* wanted, Value::Type got) {
  std::ostringstream oss;
  oss << "Value: expected " << wanted << " but holds " << to_string(got);
  return oss.str();
}

bool parse_decimal(const std::string& s, double* out) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  if (b == e) return false;

  const std::string tmp = s.substr(b, e - b);
  errno = 0;
  char* endptr = nullptr;
  const double v = std::strtod(tmp.c_str(), &endptr);
  if (endptr == tmp.c_str() || *endptr != '\0') return false;
  if (errno == ERANGE && !std::isfinite(v)) return false;
  *out = v;
  return true;
}

}  // namespace

const char* to_string(Value::Type t) noexcept {
  switch (t) {
    case Value::Type::kNull:   return "null";
    case Value::Type::kBool:   return "bool";
    case Value::Type::kInt:    return "int";
    case Value::Type::kFloat:  return "float";
    case Value::Type::kString: return "string";
    case Value::Type::kArray:  return "array";
    case Value::Type::kObject: return "object";
  }
  return "unknown";
}

bool Value::as_bool() const {
  STAGEGATE_ENSURE(type_ == Type::kBool, ErrorCode::kInvalidArgument, kind_mismatch("bool", type_));
  return bool_;
}

std::int64_t Value::as_int() const {
  STAGEGATE_ENSURE(type_ == Type::kInt, ErrorCode::kInvalidArgument, kind_mismatch("int", type_));
  return int_;
}

double Value::as_double() const {
  if (type_ == Type::kInt) return static_cast<double>(int_);
  STAGEGATE_ENSURE(type_ == Type::kFloat, ErrorCode::kInvalidArgument, kind_mismatch("number", type_));
  return float_;
}

const std::string& Value::as_string() const {
  STAGEGATE_ENSURE(type_ == Type::kString, ErrorCode::kInvalidArgument, kind_mismatch("string", type_));
  return str_;
}

const Value::Array& Value::as_array() const {
  STAGEGATE_ENSURE(type_ == Type::kArray, ErrorCode::kInvalidArgument, kind_mismatch("array", type_));
  return arr_;
}

const Value::Object& Value::as_object() const {
  STAGEGATE_ENSURE(type_ == Type::kObject, ErrorCode::kInvalidArgument, kind_mismatch("object", type_));
  return obj_;
}

const Value* Value::find(std::string_view key) const noexcept {
  if (type_ != Type::kObject) return nullptr;
  const auto it = obj_.find(key);
  return (it == obj_.end()) ? nullptr : &it->second;
}

const Value* Value::at_index(std::int64_t idx) const noexcept {
  if (type_ != Type::kArray) return nullptr;
  const auto n = static_cast<std::int64_t>(arr_.size());
  if (idx < 0) idx += n;
  if (idx < 0 || idx >= n) return nullptr;
  return &arr_[static_cast<std::size_t>(idx)];
}

std::size_t Value::size() const noexcept {
  if (type_ == Type::kArray) return arr_.size();
  if (type_ == Type::kObject) return obj_.size();
  return 0;
}

bool Value::to_number(double* out) const noexcept {
  double v = 0.0;
  switch (type_) {
    case Type::kBool:  v = bool_ ? 1.0 : 0.0; break;
    case Type::kInt:   v = static_cast<double>(int_); break;
    case Type::kFloat: v = float_; break;
    case Type::kString: {
      try {
        if (!parse_decimal(str_, &v)) return false;
      } catch (const std::exception&) {
        return false;
      }
    } break;
    case Type::kNull:
    case Type::kArray:
    case Type::kObject:
      return false;
  }
  if (out) *out = v;
  return true;
}

bool Value::operator==(const Value& o) const {
  if (is_number() && o.is_number()) {
    if (type_ == Type::kInt && o.type_ == Type::kInt) return int_ == o.int_;
    return as_double() == o.as_double();
  }
  if (type_ != o.type_) return false;
  switch (type_) {
    case Type::kNull:   return true;
    case Type::kBool:   return bool_ == o.bool_;
    case Type::kString: return str_ == o.str_;
    case Type::kArray:  return arr_ == o.arr_;
    case Type::kObject: return obj_ == o.obj_;
    case Type::kInt:
    case Type::kFloat:
      break;  // handled above
  }
  return false;
}

std::string Value::to_display() const {
  switch (type_) {
    case Type::kNull:   return "null";
    case Type::kBool:   return bool_ ? "true" : "false";
    case Type::kInt:    return std::to_string(int_);
    case Type::kFloat:  return format_double(float_);
    case Type::kString: return str_;
    case Type::kArray:
    case Type::kObject:
      return value_to_json(*this);
  }
  return std::string();
}

std::string format_double(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  if (std::strtod(buf, nullptr) != v) {
    std::snprintf(buf, sizeof(buf), "%.17g", v);
  }

  std::string s(buf);
  // Keep floats visibly floats.
  if (s.find_first_of(".eE") == std::string::npos) s += ".0";
  return s;
}

namespace {

// One pass over the tree: kind tag, then payload. Containers are
// length-prefixed so [[1],[2]] and [[1,2]] never collide.
void feed(Fnv1a64& h, const Value& v) {
  h.update_tag(static_cast<uint8_t>(v.type()));
  switch (v.type()) {
    case Value::Type::kNull:
      break;
    case Value::Type::kBool:
      h.update_tag(v.as_bool() ? 1 : 0);
      break;
    case Value::Type::kInt:
      h.update_i64(v.as_int());
      break;
    case Value::Type::kFloat:
      h.update_f64(v.as_double());
      break;
    case Value::Type::kString:
      h.update_string(v.as_string());
      break;
    case Value::Type::kArray:
      h.update_length(v.size());
      for (const auto& item : v.as_array()) feed(h, item);
      break;
    case Value::Type::kObject:
      h.update_length(v.size());
      for (const auto& kv : v.as_object()) {
        h.update_string(kv.first);
        feed(h, kv.second);
      }
      break;
  }
}

}  // namespace

Hash64 hash_value(const Value& v) {
  Fnv1a64 h;
  feed(h, v);
  return h.digest();
}

}  // namespace stagegate
