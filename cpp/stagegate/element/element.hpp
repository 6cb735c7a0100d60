#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "stagegate/core/hashing.hpp"
#include "stagegate/element/value.hpp"

namespace stagegate {

// One step of a property path. `bracketed` tokens came from a [..] suffix.
struct PathToken {
  std::string text;
  bool bracketed = false;
};

/// Split "a.b[0][key].c" into tokens.
/// - '.' inside brackets belongs to the key.
/// - Quotes around a bracket key are stripped: a["x.y"] == a[x.y].
/// Returns false for malformed paths (unterminated '[', text after ']').
bool split_property_path(std::string_view path, std::vector<PathToken>* out);

// Read-only record under evaluation. Nothing in the engine mutates it.
class Element final {
 public:
  Element() : root_(Value::Object{}) {}
  explicit Element(Value root) : root_(std::move(root)) {}

  // Throws Error(kParseError) on malformed JSON.
  static Element from_json(std::string_view json);

  const Value& data() const noexcept { return root_; }

  /// Resolve a property path. nullptr means "not found"; a present JSON null
  /// comes back as a pointer to a null Value. Never throws.
  const Value* get_property(std::string_view path) const noexcept;

  bool has_property(std::string_view path) const noexcept {
    return get_property(path) != nullptr;
  }

  /// History key: the first present id-like field ("id", "_id", "uuid",
  /// "element_id") rendered as text, else "element_" + content hash.
  std::string stable_id() const;

  Hash64 fingerprint() const { return hash_value(root_); }

 private:
  Value root_;
};

}  // namespace stagegate
