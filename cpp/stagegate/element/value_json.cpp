/*
================================================================================
Fragment 2.1 — Element: JSON codec for Value trees
FILE: cpp/stagegate/element/value_json.cpp
================================================================================
*/

#include "stagegate/element/value_json.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include "stagegate/core/error.hpp"

namespace stagegate {
namespace {

// Object/array nesting limit; deeper input is rejected instead of recursing.
constexpr int kMaxDepth = 256;

bool is_digit(char ch) { return ch >= '0' && ch <= '9'; }

void put_utf8(std::string& s, unsigned cp) {
  auto cont = [&](int shift) { s.push_back(static_cast<char>(0x80 | ((cp >> shift) & 0x3F))); };
  if (cp < 0x80) {
    s.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    s.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    cont(0);
  } else if (cp < 0x10000) {
    s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    cont(6);
    cont(0);
  } else {
    s.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    cont(12);
    cont(6);
    cont(0);
  }
}

// Recursive-descent reader over a string_view. Position is a byte offset;
// line/col are only computed when a failure is reported.
class JsonReader {
 public:
  explicit JsonReader(std::string_view text) : text_(text) {}

  bool read_document(Value* out) {
    Value v;
    if (!read_value(v, 0)) return false;
    skip_space();
    if (pos_ < text_.size()) return fail("trailing characters after value");
    if (out) *out = std::move(v);
    return true;
  }

  const JsonParseError& error() const { return error_; }

 private:
  bool fail(std::string msg) {
    error_.message = std::move(msg);
    error_.offset = pos_;
    error_.line = 1;
    error_.col = 1;
    for (std::size_t i = 0; i < pos_ && i < text_.size(); ++i) {
      if (text_[i] == '\n') {
        ++error_.line;
        error_.col = 1;
      } else {
        ++error_.col;
      }
    }
    return false;
  }

  bool more() const { return pos_ < text_.size(); }
  char peek() const { return text_[pos_]; }

  void skip_space() {
    while (more()) {
      const char ch = peek();
      if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') break;
      ++pos_;
    }
  }

  bool take(char ch) {
    if (more() && peek() == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool read_value(Value& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting deeper than 256 levels");
    skip_space();
    if (!more()) return fail("unexpected end of input");

    switch (peek()) {
      case '{': return read_object(out, depth);
      case '[': return read_array(out, depth);
      case '"': {
        std::string s;
        if (!read_string(s)) return false;
        out = Value(std::move(s));
        return true;
      }
      case 't': return read_keyword("true", Value(true), out);
      case 'f': return read_keyword("false", Value(false), out);
      case 'n': return read_keyword("null", Value(), out);
      default:
        if (peek() == '-' || is_digit(peek())) return read_number(out);
        return fail(std::string("unexpected character '") + peek() + "'");
    }
  }

  bool read_keyword(std::string_view word, Value v, Value& out) {
    if (text_.substr(pos_, word.size()) != word) return fail("invalid literal");
    pos_ += word.size();
    out = std::move(v);
    return true;
  }

  bool read_object(Value& out, int depth) {
    ++pos_;  // '{'
    Value::Object obj;
    skip_space();
    if (take('}')) {
      out = Value(std::move(obj));
      return true;
    }
    for (;;) {
      skip_space();
      if (!more() || peek() != '"') return fail("expected object key");
      std::string key;
      if (!read_string(key)) return false;
      skip_space();
      if (!take(':')) return fail("expected ':' after object key");

      Value item;
      if (!read_value(item, depth + 1)) return false;
      obj.insert_or_assign(std::move(key), std::move(item));

      skip_space();
      if (take(',')) continue;
      if (take('}')) break;
      return fail(more() ? "expected ',' or '}' in object" : "unterminated object");
    }
    out = Value(std::move(obj));
    return true;
  }

  bool read_array(Value& out, int depth) {
    ++pos_;  // '['
    Value::Array arr;
    skip_space();
    if (take(']')) {
      out = Value(std::move(arr));
      return true;
    }
    for (;;) {
      Value item;
      if (!read_value(item, depth + 1)) return false;
      arr.push_back(std::move(item));

      skip_space();
      if (take(',')) continue;
      if (take(']')) break;
      return fail(more() ? "expected ',' or ']' in array" : "unterminated array");
    }
    out = Value(std::move(arr));
    return true;
  }

  bool read_hex4(unsigned& cp) {
    if (text_.size() - pos_ < 4) return fail("truncated \\u escape");
    cp = 0;
    for (int i = 0; i < 4; ++i) {
      const char ch = text_[pos_];
      unsigned nibble;
      if (is_digit(ch)) nibble = static_cast<unsigned>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') nibble = static_cast<unsigned>(ch - 'a' + 10);
      else if (ch >= 'A' && ch <= 'F') nibble = static_cast<unsigned>(ch - 'A' + 10);
      else return fail("bad hex digit in \\u escape");
      cp = (cp << 4) | nibble;
      ++pos_;
    }
    return true;
  }

  bool read_escape(std::string& out) {
    if (!more()) return fail("unterminated escape");
    const char esc = text_[pos_++];
    switch (esc) {
      case '"':  out += '"'; return true;
      case '\\': out += '\\'; return true;
      case '/':  out += '/'; return true;
      case 'b':  out += '\b'; return true;
      case 'f':  out += '\f'; return true;
      case 'n':  out += '\n'; return true;
      case 'r':  out += '\r'; return true;
      case 't':  out += '\t'; return true;
      case 'u':  break;
      default:   return fail(std::string("invalid escape '\\") + esc + "'");
    }

    unsigned hi = 0;
    if (!read_hex4(hi)) return false;
    if (hi >= 0xDC00 && hi <= 0xDFFF) return fail("lone low surrogate");
    if (hi < 0xD800 || hi > 0xDBFF) {
      put_utf8(out, hi);
      return true;
    }
    if (text_.substr(pos_, 2) != "\\u") return fail("high surrogate without a pair");
    pos_ += 2;
    unsigned lo = 0;
    if (!read_hex4(lo)) return false;
    if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid low surrogate");
    put_utf8(out, 0x10000u + ((hi - 0xD800u) << 10) + (lo - 0xDC00u));
    return true;
  }

  bool read_string(std::string& out) {
    ++pos_;  // opening quote
    out.clear();
    while (more()) {
      const char ch = text_[pos_++];
      if (ch == '"') return true;
      if (ch == '\\') {
        if (!read_escape(out)) return false;
      } else if (static_cast<unsigned char>(ch) < 0x20) {
        --pos_;
        return fail("control character in string");
      } else {
        out += ch;
      }
    }
    return fail("unterminated string");
  }

  // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  bool read_number(Value& out) {
    const std::size_t start = pos_;
    bool integral = true;
    auto digits = [&] {
      const std::size_t from = pos_;
      while (more() && is_digit(peek())) ++pos_;
      return pos_ > from;
    };

    take('-');
    if (take('0')) {
      // no leading zeros
    } else if (!digits()) {
      return fail("expected digit");
    }
    if (take('.')) {
      integral = false;
      if (!digits()) return fail("expected digit after '.'");
    }
    if (more() && (peek() == 'e' || peek() == 'E')) {
      integral = false;
      ++pos_;
      if (!take('+')) take('-');
      if (!digits()) return fail("expected digit in exponent");
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (integral) {
      std::int64_t iv = 0;
      const auto res = std::from_chars(first, last, iv);
      if (res.ec == std::errc() && res.ptr == last) {
        out = Value(iv);
        return true;
      }
      // Beyond int64: read as double below.
    }

    const std::string literal(first, last);
    errno = 0;
    const double dv = std::strtod(literal.c_str(), nullptr);
    if (errno == ERANGE && !std::isfinite(dv)) return fail("number out of range");
    out = Value(dv);
    return true;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
  JsonParseError error_;
};

class JsonWriter {
 public:
  explicit JsonWriter(const JsonWriteOptions& opt) : opt_(opt) {}

  void write(const Value& v) {
    switch (v.type()) {
      case Value::Type::kNull:
        buf_ += "null";
        break;
      case Value::Type::kBool:
        buf_ += v.as_bool() ? "true" : "false";
        break;
      case Value::Type::kInt:
        buf_ += std::to_string(v.as_int());
        break;
      case Value::Type::kFloat:
        buf_ += std::isfinite(v.as_double()) ? format_double(v.as_double()) : "null";
        break;
      case Value::Type::kString:
        buf_ += json_escape(v.as_string());
        break;
      case Value::Type::kArray:
        write_seq('[', ']', v.as_array(), [&](const Value& item) { write(item); });
        break;
      case Value::Type::kObject:
        write_seq('{', '}', v.as_object(), [&](const Value::Object::value_type& kv) {
          buf_ += json_escape(kv.first);
          buf_ += ": ";
          write(kv.second);
        });
        break;
    }
  }

  std::string take() { return std::move(buf_); }

 private:
  template <class Seq, class Fn>
  void write_seq(char open, char close, const Seq& seq, Fn&& each) {
    buf_ += open;
    if (seq.empty()) {
      buf_ += close;
      return;
    }
    ++depth_;
    bool first = true;
    for (const auto& item : seq) {
      if (!first) buf_ += opt_.pretty ? "," : ", ";
      first = false;
      newline();
      each(item);
    }
    --depth_;
    newline();
    buf_ += close;
  }

  void newline() {
    if (!opt_.pretty) return;
    buf_ += '\n';
    buf_.append(static_cast<std::size_t>(depth_ * opt_.indent), ' ');
  }

  const JsonWriteOptions& opt_;
  std::string buf_;
  int depth_ = 0;
};

}  // namespace

bool parse_value_json(std::string_view json, Value* out, JsonParseError* err) {
  JsonReader reader(json);
  if (reader.read_document(out)) return true;
  if (err) *err = reader.error();
  return false;
}

Value parse_value_json_or_throw(std::string_view json) {
  Value v;
  JsonParseError err;
  if (!parse_value_json(json, &v, &err)) {
    STAGEGATE_THROW(ErrorCode::kParseError, "Invalid JSON at line " + std::to_string(err.line) + ", column " +
                                                std::to_string(err.col) + ": " + err.message);
  }
  return v;
}

std::string value_to_json(const Value& v, const JsonWriteOptions& opt) {
  JsonWriter w(opt);
  w.write(v);
  return w.take();
}

std::string json_escape(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 2);
  o += '"';
  for (char c : s) {
    switch (c) {
      case '"':  o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char esc[8];
          std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += esc;
        } else {
          o += c;
        }
    }
  }
  o += '"';
  return o;
}

}  // namespace stagegate
