#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "stagegate/element/value.hpp"

namespace stagegate {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

/// Parse strict JSON text into a Value.
/// - Integral literals without fraction/exponent that fit int64 become kInt,
///   everything else numeric becomes kFloat.
/// - Rejects NaN/Inf literals, trailing garbage and unescaped control chars.
/// - Duplicate object keys: last one wins.
bool parse_value_json(std::string_view json, Value* out, JsonParseError* err = nullptr);

/// Same as parse_value_json but throws Error(kParseError) with line:col.
Value parse_value_json_or_throw(std::string_view json);

struct JsonWriteOptions {
  bool pretty = false;
  int indent = 2;
};

/// Serialize a Value. Keys come out sorted; non-finite floats become null.
std::string value_to_json(const Value& v, const JsonWriteOptions& opt = {});

/// Quoted JSON string literal.
std::string json_escape(std::string_view s);

}  // namespace stagegate
