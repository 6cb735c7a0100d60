/*
  Schema selftest

  Required-field omissions always surface, optional-field absence never does,
  and per-field rules only run on present values.
*/

#include <algorithm>
#include <string>
#include <vector>

#include "stagegate/core/logging.hpp"
#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/element/value_json.hpp"
#include "stagegate/schema/schema.hpp"

namespace stagegate {
namespace {

using namespace selftest;

bool has(const std::vector<std::string>& errs, const std::string& needle) {
  return std::any_of(errs.begin(), errs.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

Schema person_schema() {
  FieldRule age;
  age.min = 18;
  age.max = 120;

  FieldRule code;
  code.pattern = "[A-Z]{2}\\d{3}";
  code.min_length = 5;

  FieldRule tier;
  tier.enum_values = Value::Array{Value("gold"), Value("silver")};

  Value::Object defaults;
  defaults["tier"] = Value("silver");
  defaults["prefs.lang"] = Value("en");

  return Schema("person",
                {"name", "age"},
                {"code", "tier", "prefs.lang"},
                {{"name", FieldType::kString}, {"age", FieldType::kInteger}, {"tier", FieldType::kString}},
                defaults,
                {{"age", age}, {"code", code}, {"tier", tier}});
}

void test_required_and_optional() {
  const Schema s = person_schema();

  const auto errs = s.validate(Element::from_json("{}"));
  expect_true(has(errs, "Required field missing: age"), "missing age reported");
  expect_true(has(errs, "Required field missing: name"), "missing name reported");
  expect_eq_int(static_cast<int64_t>(errs.size()), 2, "optional absence is silent");

  expect_true(s.is_valid(Element::from_json("{\"name\": \"Ann\", \"age\": 30}")), "minimal valid element");

  const auto missing = s.missing_required(Element::from_json("{\"name\": \"Ann\"}"));
  expect_true(missing.size() == 1 && missing[0] == "age", "missing_required lists only absent fields");
}

void test_types_and_rules() {
  const Schema s = person_schema();

  auto errs = s.validate(Element::from_json("{\"name\": 5, \"age\": 30.5}"));
  expect_true(has(errs, "Field 'name' has invalid type: expected string"), "string type enforced");
  expect_true(has(errs, "Field 'age' has invalid type: expected integer"), "integer type enforced");

  errs = s.validate(Element::from_json("{\"name\": \"A\", \"age\": 12}"));
  expect_true(has(errs, "Field 'age' below minimum value 18"), "min rule");

  errs = s.validate(Element::from_json("{\"name\": \"A\", \"age\": \"old\"}"));
  expect_true(has(errs, "cannot be compared to minimum value"), "non-numeric value cannot meet min");

  errs = s.validate(Element::from_json("{\"name\": \"A\", \"age\": 40, \"code\": \"ab123\"}"));
  expect_true(has(errs, "Field 'code' does not match required pattern"), "pattern rule");

  errs = s.validate(Element::from_json("{\"name\": \"A\", \"age\": 40, \"code\": \"AB12\"}"));
  expect_true(has(errs, "Field 'code' below minimum length 5"), "min_length rule");

  errs = s.validate(Element::from_json("{\"name\": \"A\", \"age\": 40, \"tier\": \"bronze\"}"));
  expect_true(has(errs, "Field 'tier' must be one of: [gold, silver]"), "enum rule");

  expect_true(s.is_valid(Element::from_json("{\"name\": \"A\", \"age\": 40, \"code\": \"AB123\", \"tier\": \"gold\"}")),
              "all rules satisfied");
}

void test_introspection_and_defaults() {
  const Schema s = person_schema();
  expect_true(s.is_field_required("name") && !s.is_field_required("tier"), "is_field_required");
  expect_true(s.get_field_type("age") == FieldType::kInteger, "get_field_type");
  expect_false(s.get_field_type("code").has_value(), "untyped field has no type");
  expect_eq_int(static_cast<int64_t>(s.get_all_fields().size()), 5, "all fields");

  const Value* d = s.get_default_value("tier");
  expect_true(d && d->as_string() == "silver", "default value lookup");

  const Value filled = s.apply_defaults(Element::from_json("{\"name\": \"A\", \"tier\": \"gold\"}").data());
  expect_eq_str(value_to_json(filled), "{\"name\": \"A\", \"prefs\": {\"lang\": \"en\"}, \"tier\": \"gold\"}",
                "defaults fill only absent paths, nested paths included");
}

void test_long_pattern_subjects() {
  FieldRule words;
  words.pattern = "(\\w|\\s)+";
  const Schema s("note", {"body"}, {}, {}, Value::Object{}, {{"body", words}});

  auto note = [](std::size_t n) {
    Value::Object o;
    o["body"] = Value(std::string(n, 'w'));
    return Element(Value(std::move(o)));
  };

  expect_true(s.is_valid(note(2000)), "subject under the default limit is matched");

  int warnings = 0;
  set_log_sink([&](LogLevel lvl, const std::string&) {
    if (lvl == LogLevel::WARN) ++warnings;
  });
  const auto errs = s.validate(note(100000));
  set_log_sink(nullptr);

  expect_eq_int(static_cast<int64_t>(errs.size()), 1, "over-long subject yields exactly one error");
  expect_true(has(errs, "Field 'body' is too long to check against its pattern (limit 4096 bytes)"),
              "over-long subject fails closed");
  expect_eq_int(warnings, 1, "over-long subject logs a WARN");

  const Schema tight("note", {"body"}, {}, {}, Value::Object{}, {{"body", words}}, PatternLimits{16});
  expect_true(tight.is_valid(note(16)), "configured limit is inclusive");
  expect_true(has(tight.validate(note(17)), "limit 16 bytes"), "configured limit is applied");

  expect_error([&] { Schema bad("x", {"a"}, {}, {}, Value::Object{}, {{"a", words}}, PatternLimits{0}); },
               ErrorCode::kInvalidConfig, "zero pattern limit rejected");
  expect_error([&] { Schema bad("x", {"a"}, {}, {}, Value::Object{}, {{"a", words}}, PatternLimits{20000}); },
               ErrorCode::kInvalidConfig, "pattern limit above the ceiling rejected");
}

void test_configuration_errors() {
  expect_error([] { Schema s("", {"a"}); }, ErrorCode::kInvalidConfig, "empty schema name rejected");
  expect_error([] { Schema s("x", {"a"}, {"a"}); }, ErrorCode::kInvalidConfig, "required/optional overlap rejected");
  expect_error(
      [] {
        Value::Object d;
        d["a"] = Value(1);
        Schema s("x", {"a"}, {}, {}, d);
      },
      ErrorCode::kInvalidConfig, "default on required field rejected");
  expect_error(
      [] {
        FieldRule r;
        r.min = 5;
        r.max = 1;
        Schema s("x", {"a"}, {}, {}, Value::Object{}, {{"a", r}});
      },
      ErrorCode::kInvalidConfig, "min above max rejected");
  expect_error(
      [] {
        FieldRule r;
        r.pattern = "(";
        Schema s("x", {"a"}, {}, {}, Value::Object{}, {{"a", r}});
      },
      ErrorCode::kInvalidConfig, "malformed pattern rejected at construction");
  expect_error([] { (void)field_type_from_string("float"); }, ErrorCode::kInvalidConfig, "unknown field type name");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  test_required_and_optional();
  test_types_and_rules();
  test_introspection_and_defaults();
  test_long_pattern_subjects();
  test_configuration_errors();

  return selftest::finish();
}
