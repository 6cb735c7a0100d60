/*
  Element / Value selftest

  Covers:
    1) Property path resolution (dotted, bracketed, quoted keys, negative indexes).
    2) "Not found" vs present null.
    3) Strict JSON parsing with line/col errors and int/float typing.
    4) Deterministic writer output and stable element ids.

  Framework-free: prints [ OK ]/[FAIL] and returns non-zero on failure.
*/

#include <string>
#include <vector>

#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/element/value.hpp"
#include "stagegate/element/value_json.hpp"

namespace stagegate {
namespace {

using namespace selftest;

const char* kDoc = R"({
  "id": "cust-42",
  "profile": {"email": "a@b.co", "tags": ["vip", "beta"], "name": null},
  "orders": [{"total": 12.5}, {"total": 40}],
  "weird.key": {"x": 1},
  "score": 7
})";

void test_path_resolution() {
  const Element e = Element::from_json(kDoc);

  const Value* email = e.get_property("profile.email");
  expect_true(email && email->is_string() && email->as_string() == "a@b.co", "dotted path resolves nested key");

  const Value* tag = e.get_property("profile.tags[1]");
  expect_true(tag && tag->as_string() == "beta", "bracketed index resolves array element");

  const Value* dotted_idx = e.get_property("profile.tags.0");
  expect_true(dotted_idx && dotted_idx->as_string() == "vip", "dotted numeric segment indexes arrays");

  const Value* last = e.get_property("orders[-1].total");
  expect_true(last && last->is_int() && last->as_int() == 40, "negative index counts from the end");

  const Value* quoted = e.get_property("[\"weird.key\"].x");
  expect_true(quoted && quoted->as_int() == 1, "quoted bracket key may contain dots");

  expect_true(e.get_property("") == &e.data(), "empty path is the root");
  expect_false(e.has_property("profile.phone"), "missing key is not found");
  expect_false(e.has_property("orders[5]"), "out-of-range index is not found");
  expect_false(e.has_property("score.value"), "descending into a scalar is not found");
  expect_false(e.has_property("profile.tags[x]"), "non-numeric array index is not found");
  expect_false(e.has_property("profile[tags"), "unterminated bracket is not found");

  const Value* name = e.get_property("profile.name");
  expect_true(name != nullptr && name->is_null(), "present null is found and null");
}

void test_split_property_path() {
  std::vector<PathToken> toks;
  expect_true(split_property_path("a.b[0]['c.d'].e", &toks), "split accepts mixed path");
  expect_eq_int(static_cast<int64_t>(toks.size()), 5, "split yields five tokens");
  if (toks.size() == 5) {
    expect_eq_str(toks[3].text, "c.d", "quoted bracket token is unquoted");
    expect_true(toks[2].bracketed && !toks[4].bracketed, "bracketed flag tracks origin");
  }
  expect_false(split_property_path("a]b", &toks), "stray ']' is malformed");
  expect_false(split_property_path("a[0]b", &toks), "text after ']' is malformed");
}

void test_json_typing_and_errors() {
  Value v;
  JsonParseError err;
  expect_true(parse_value_json("[1, 1.0, 1e2, -0, true, null, \"\\u00e9\"]", &v, &err), "parse mixed array");
  if (v.is_array() && v.size() == 7) {
    const auto& a = v.as_array();
    expect_true(a[0].is_int(), "integral literal is int");
    expect_true(a[1].is_float(), "fraction literal is float");
    expect_true(a[2].is_float(), "exponent literal is float");
    expect_true(a[0] == a[1], "int and float compare numerically");
    expect_false(a[4] == Value(1), "bool never equals a number");
    expect_eq_str(a[6].as_string(), "\xC3\xA9", "unicode escape decodes to UTF-8");
  } else {
    fail("parse mixed array shape");
  }

  expect_false(parse_value_json("{\"a\": 1,\n \"b\": }", &v, &err), "missing value rejected");
  expect_eq_int(err.line, 2, "error line is reported");
  expect_false(parse_value_json("{} x", &v, &err), "trailing characters rejected");
  expect_false(parse_value_json("[NaN]", &v, &err), "NaN literal rejected");

  expect_error([] { (void)Element::from_json("{\"a\":"); }, ErrorCode::kParseError,
               "from_json throws kParseError");
  try {
    (void)parse_value_json_or_throw("[1,\n  2,\n  x]");
    fail("bad literal must throw");
  } catch (const Error& e) {
    expect_contains(e.message(), "line 3, column 3", "parse error names line and column");
    expect_false(e.site().file.empty(), "throw site recorded");
    expect_contains(e.prefixed("import").message(), "import: Invalid JSON", "context prefix keeps the message");
    expect_true(e.prefixed("import").code() == ErrorCode::kParseError, "context prefix keeps the code");
  }
}

void test_writer_and_ids() {
  const Element e = Element::from_json("{\"b\": [1, 2.5], \"a\": {\"z\": null, \"y\": \"q\"}}");
  expect_eq_str(value_to_json(e.data()), "{\"a\": {\"y\": \"q\", \"z\": null}, \"b\": [1, 2.5]}",
                "writer sorts keys and is compact");
  expect_eq_str(Value(70.0).to_display(), "70.0", "floats stay visibly floats");
  expect_eq_str(json_escape("a\"b\n"), "\"a\\\"b\\n\"", "json_escape quotes and escapes");

  const Element same = Element::from_json("{\"a\": {\"y\": \"q\", \"z\": null}, \"b\": [1, 2.5]}");
  expect_eq_str(e.stable_id(), same.stable_id(), "content id ignores key order");
  expect_true(e.stable_id().rfind("element_", 0) == 0, "content id is prefixed");

  const Element other = Element::from_json("{\"a\": 1}");
  expect_true(other.stable_id() != e.stable_id(), "different content gives a different id");
  expect_eq_str(Element::from_json("{\"x\": -0.0}").stable_id(), Element::from_json("{\"x\": 0.0}").stable_id(),
                "signed zero hashes as zero");
  expect_true(Element::from_json("[[1], [2]]").stable_id() != Element::from_json("[[1, 2]]").stable_id(),
              "nesting is part of the content id");

  expect_eq_str(Element::from_json(kDoc).stable_id(), "cust-42", "explicit id wins");
  expect_eq_str(Element::from_json("{\"uuid\": 99}").stable_id(), "99", "numeric id renders as text");
}

void test_value_access() {
  Value::Object o;
  o["n"] = Value(" 3.5 ");
  const Value v(o);
  double d = 0.0;
  expect_true(v.find("n")->to_number(&d) && d == 3.5, "numeric string coerces to number");
  expect_false(Value("3.5x").to_number(&d), "partial numeric string does not coerce");
  expect_error([&] { (void)v.as_array(); }, ErrorCode::kInvalidArgument, "kind mismatch throws");
  expect_eq_int(static_cast<int64_t>(v.size()), 1, "object size");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  test_path_resolution();
  test_split_property_path();
  test_json_typing_and_errors();
  test_writer_and_ids();
  test_value_access();

  return selftest::finish();
}
