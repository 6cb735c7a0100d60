#include "stagegate/element/element.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include "stagegate/element/value_json.hpp"

namespace stagegate {
namespace {

const char* const kIdFields[] = {"id", "_id", "uuid", "element_id"};

bool parse_index(const std::string& s, std::int64_t* out) {
  if (s.empty()) return false;
  std::size_t i = (s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (std::size_t k = i; k < s.size(); ++k) {
    if (s[k] < '0' || s[k] > '9') return false;
  }
  errno = 0;
  char* endptr = nullptr;
  const long long v = std::strtoll(s.c_str(), &endptr, 10);
  if (errno == ERANGE || *endptr != '\0') return false;
  *out = static_cast<std::int64_t>(v);
  return true;
}

std::string unquote(std::string s) {
  if (s.size() >= 2) {
    const char q = s.front();
    if ((q == '"' || q == '\'') && s.back() == q) return s.substr(1, s.size() - 2);
  }
  return s;
}

const Value* step(const Value* cur, const PathToken& tok) {
  if (cur->is_object()) return cur->find(tok.text);
  if (cur->is_array()) {
    std::int64_t idx = 0;
    if (!parse_index(tok.text, &idx)) return nullptr;
    return cur->at_index(idx);
  }
  return nullptr;
}

}  // namespace

bool split_property_path(std::string_view path, std::vector<PathToken>* out) {
  std::vector<PathToken> tokens;
  std::size_t i = 0;
  const std::size_t n = path.size();

  while (i <= n) {
    // Segment head: plain key up to '.', '[' or end.
    std::string head;
    while (i < n && path[i] != '.' && path[i] != '[') {
      if (path[i] == ']') return false;
      head.push_back(path[i]);
      ++i;
    }
    const bool has_suffix = (i < n && path[i] == '[');
    if (!head.empty() || !has_suffix) tokens.push_back(PathToken{std::move(head), false});

    // [..] suffixes.
    while (i < n && path[i] == '[') {
      const std::size_t close = path.find(']', i + 1);
      if (close == std::string_view::npos) return false;
      tokens.push_back(PathToken{unquote(std::string(path.substr(i + 1, close - i - 1))), true});
      i = close + 1;
      if (i < n && path[i] != '.' && path[i] != '[') return false;
    }

    if (i >= n) break;
    ++i;  // skip '.'
    if (i == n) {
      tokens.push_back(PathToken{std::string(), false});
      break;
    }
  }

  if (out) *out = std::move(tokens);
  return true;
}

Element Element::from_json(std::string_view json) {
  return Element(parse_value_json_or_throw(json));
}

const Value* Element::get_property(std::string_view path) const noexcept {
  if (path.empty()) return &root_;
  try {
    std::vector<PathToken> tokens;
    if (!split_property_path(path, &tokens)) return nullptr;

    const Value* cur = &root_;
    for (const auto& tok : tokens) {
      cur = step(cur, tok);
      if (!cur) return nullptr;
    }
    return cur;
  } catch (const std::exception&) {
    // Allocation failure while tokenizing; treat as unresolvable.
    return nullptr;
  }
}

std::string Element::stable_id() const {
  for (const char* key : kIdFields) {
    const Value* v = root_.find(key);
    if (!v) continue;
    if (v->is_string() && !v->as_string().empty()) return v->as_string();
    if (v->is_int() || v->is_float()) return v->to_display();
  }
  return "element_" + hash_to_hex(fingerprint());
}

}  // namespace stagegate
