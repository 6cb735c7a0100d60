/*
  Lock selftest

  Objective
  ---------
  Every lock kind returns a boolean for every input (absent, null, wrong kind,
  malformed expected value) and never throws out of validate(). Messages and
  remediation text stay stable because callers surface them verbatim.
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "stagegate/core/logging.hpp"
#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/rules/lock.hpp"
#include "stagegate/rules/validator_registry.hpp"

namespace stagegate {
namespace {

using namespace selftest;

Value arr(Value a, Value b) { return Value(Value::Array{std::move(a), std::move(b)}); }

bool passes(const Lock& l, const char* json, const ValidatorRegistry& reg) {
  return l.validate(Element::from_json(json), reg).success;
}

void test_exists_and_messages() {
  ValidatorRegistry reg;
  const Lock email(LockType::kExists, "email", Value(true));

  const LockResult r = email.validate(Element::from_json("{}"), reg);
  expect_false(r.success, "exists fails on missing property");
  expect_false(r.found, "missing property is reported as not found");
  expect_contains(r.error_message, "required but missing", "exists message names the miss");
  expect_eq_str(r.action_message, "Set missing field: email", "exists remediation");

  expect_false(passes(email, "{\"email\": \"\"}", reg), "empty string counts as missing");
  expect_false(passes(email, "{\"email\": null}", reg), "null counts as missing");
  expect_false(passes(email, "{\"email\": []}", reg), "empty list counts as missing");
  expect_true(passes(email, "{\"email\": 0}", reg), "zero is present");

  const Lock absent(LockType::kExists, "debug", Value(false));
  expect_true(passes(absent, "{}", reg), "exists=false passes when absent");
  expect_false(passes(absent, "{\"debug\": 1}", reg), "exists=false fails when present");
  expect_eq_str(absent.validate(Element::from_json("{\"debug\": 1}"), reg).action_message,
                "Remove property: debug", "exists=false remediation");
}

void test_comparisons() {
  ValidatorRegistry reg;
  const Lock age(LockType::kRange, "age", arr(Value(18), Value(65)));

  const LockResult r = age.validate(Element::from_json("{\"age\": 70}"), reg);
  expect_false(r.success, "range fails above the upper bound");
  expect_eq_str(r.error_message, "Property 'age' should be between 18 and 65 but is 70", "range message");
  expect_eq_str(r.action_message, "Set age to a value between 18 and 65", "range remediation");
  expect_true(passes(age, "{\"age\": 40}", reg), "range passes inside bounds");
  expect_true(passes(age, "{\"age\": 18}", reg), "range is inclusive");
  expect_true(passes(age, "{\"age\": \"40\"}", reg), "numeric strings are coerced");
  expect_false(passes(age, "{\"age\": \"old\"}", reg), "non-numeric string fails");
  expect_false(passes(Lock(LockType::kRange, "age", Value(5)), "{\"age\": 5}", reg),
               "malformed range bound fails closed");

  const Lock gt(LockType::kGreaterThan, "n", Value(10));
  expect_true(passes(gt, "{\"n\": 10.5}", reg), "greater_than int vs float");
  expect_false(passes(gt, "{\"n\": 10}", reg), "greater_than is strict");
  expect_false(passes(gt, "{\"n\": true}", reg), "bool compares as 1");

  const Lock lt(LockType::kLessThan, "n", Value(0));
  expect_true(passes(lt, "{\"n\": -1}", reg), "less_than passes below");
  expect_false(passes(lt, "{\"n\": [1]}", reg), "less_than fails on a list");
}

void test_equality_and_membership() {
  ValidatorRegistry reg;
  const Lock status(LockType::kEquals, "status", Value("ready"));
  expect_true(passes(status, "{\"status\": \"ready\"}", reg), "equals passes on match");
  expect_false(passes(status, "{\"status\": \"Ready\"}", reg), "equals is case sensitive");
  expect_true(passes(Lock(LockType::kEquals, "n", Value(2)), "{\"n\": 2.0}", reg), "equals is numeric across int/float");
  expect_false(passes(Lock(LockType::kEquals, "n", Value(1)), "{\"n\": true}", reg), "equals keeps bool apart from 1");

  const Lock contains(LockType::kContains, "tags", Value("vip"));
  expect_true(passes(contains, "{\"tags\": [\"a\", \"vip\"]}", reg), "contains finds list member");
  expect_true(passes(contains, "{\"tags\": \"is vip\"}", reg), "contains finds substring");
  expect_true(passes(contains, "{\"tags\": {\"vip\": 1}}", reg), "contains finds object key");
  expect_false(passes(contains, "{\"tags\": 5}", reg), "contains fails on a number");

  Value::Array allowed{Value("red"), Value("green")};
  const Lock in(LockType::kInList, "color", Value(allowed));
  const Lock not_in(LockType::kNotInList, "color", Value(allowed));
  expect_true(passes(in, "{\"color\": \"red\"}", reg), "in_list passes for member");
  expect_false(passes(in, "{\"color\": \"blue\"}", reg), "in_list fails for non-member");
  expect_eq_str(in.validate(Element::from_json("{\"color\": \"blue\"}"), reg).action_message,
                "Set color to one of: red, green", "in_list remediation");
  expect_true(passes(not_in, "{\"color\": \"blue\"}", reg), "not_in_list passes for non-member");
  expect_false(passes(not_in, "{\"color\": null}", reg), "not_in_list fails on null");
  expect_false(passes(Lock(LockType::kInList, "color", Value(3)), "{\"color\": 3}", reg),
               "in_list with a scalar expected value fails closed");
}

void test_text_and_shape() {
  ValidatorRegistry reg;
  const Lock re(LockType::kRegex, "code", Value("[A-Z]{3}-\\d+"));
  expect_true(passes(re, "{\"code\": \"ABC-12\"}", reg), "regex matches at start");
  expect_true(passes(re, "{\"code\": \"ABC-12 trailing\"}", reg), "regex anchors only at start");
  expect_false(passes(re, "{\"code\": \"xABC-12\"}", reg), "regex does not search mid-string");
  expect_false(passes(re, "{\"code\": 12}", reg), "regex fails on non-string");

  std::vector<std::string> warnings;
  set_log_sink([&](LogLevel lvl, const std::string& line) {
    if (lvl == LogLevel::WARN) warnings.push_back(line);
  });
  const Lock broken(LockType::kRegex, "code", Value("([unclosed"));
  set_log_sink(nullptr);
  expect_false(passes(broken, "{\"code\": \"anything\"}", reg), "malformed pattern never passes");
  expect_true(warnings.size() == 1 && warnings[0].find("[WARN] stagegate: Lock: pattern") != std::string::npos,
              "malformed pattern logged at WARN");

  const Lock t_int = Lock::type_check("n", Value::Type::kInt);
  expect_true(passes(t_int, "{\"n\": 3}", reg), "type_check int");
  expect_false(passes(t_int, "{\"n\": 3.0}", reg), "type_check int rejects float");
  expect_true(passes(Lock(LockType::kTypeCheck, "n", Value("number")), "{\"n\": 3.0}", reg), "type_check number");
  expect_true(passes(Lock(LockType::kTypeCheck, "n", Value("null")), "{\"n\": null}", reg),
              "type_check null accepts present null");
  expect_false(passes(Lock(LockType::kTypeCheck, "n", Value("str")), "{\"n\": null}", reg),
               "type_check str rejects null");
  expect_false(passes(Lock(LockType::kTypeCheck, "n", Value("mystery")), "{\"n\": 1}", reg),
               "unknown type name fails closed");

  const Lock len(LockType::kLength, "name", Value(3));
  expect_true(passes(len, "{\"name\": \"abc\"}", reg), "length exact");
  expect_true(passes(len, "{\"name\": \"\xC3\xA9t\xC3\xA9\"}", reg), "length counts code points");
  Value::Object bounds;
  bounds["min"] = Value(2);
  const Lock min_len(LockType::kLength, "items", Value(bounds));
  expect_true(passes(min_len, "{\"items\": [1, 2, 3]}", reg), "length min bound on list");
  expect_false(passes(min_len, "{\"items\": [1]}", reg), "length min bound rejects short list");
  expect_false(passes(min_len, "{\"items\": 5}", reg), "length fails on a number");
  expect_eq_str(min_len.validate(Element::from_json("{\"items\": [1]}"), reg).action_message,
                "Adjust items to have at least 2 elements/characters", "length remediation");

  const Lock ne(LockType::kNotEmpty, "note", Value());
  expect_true(passes(ne, "{\"note\": \"x\"}", reg), "not_empty passes on text");
  expect_false(passes(ne, "{\"note\": \"   \"}", reg), "not_empty rejects whitespace");
  expect_false(passes(ne, "{\"note\": {}}", reg), "not_empty rejects empty object");
  expect_true(passes(ne, "{\"note\": false}", reg), "not_empty accepts false");
}

void test_custom_validators() {
  auto reg = std::make_shared<ValidatorRegistry>();
  reg->register_validator("even", [](const Value& v, const Value&) { return v.is_int() && v.as_int() % 2 == 0; });
  reg->register_validator("boom", [](const Value&, const Value&) -> bool { throw std::runtime_error("kaboom"); });

  const Lock even = Lock::custom("n", "even");
  expect_true(passes(even, "{\"n\": 4}", *reg), "custom validator passes");
  expect_false(passes(even, "{\"n\": 5}", *reg), "custom validator fails");
  expect_eq_str(even.validate(Element::from_json("{\"n\": 5}"), *reg).error_message,
                "Custom validation 'even' failed for property 'n'", "custom message");

  expect_false(passes(Lock::custom("n", "boom"), "{\"n\": 1}", *reg), "throwing validator counts as failure");
  expect_false(passes(Lock::custom("n", "nobody"), "{\"n\": 1}", *reg), "unregistered validator fails");

  reg->register_validator("nobody", [](const Value&, const Value&) { return true; });
  expect_true(passes(Lock::custom("n", "nobody"), "{\"n\": 1}", *reg), "late registration is honoured");

  const Element two = Element::from_json("{\"n\": 2}");
  auto fut = even.validate_async(two, *reg);
  expect_true(fut.get().success, "deferred validation runs on get()");
}

void test_long_pattern_subjects() {
  ValidatorRegistry reg;
  auto with_text = [](std::size_t n) {
    Value::Object o;
    o["s"] = Value(std::string(n, 'a'));
    return Element(Value(std::move(o)));
  };

  const Lock letters(LockType::kRegex, "s", Value("^[a-z ]*$"));
  expect_true(letters.validate(with_text(4000), reg).success, "subject under the limit is matched");

  std::vector<std::string> warnings;
  set_log_sink([&](LogLevel lvl, const std::string& line) {
    if (lvl == LogLevel::WARN) warnings.push_back(line);
  });
  const LockResult big = letters.validate(with_text(100000), reg);
  const LockResult alternation =
      Lock(LockType::kRegex, "s", Value("(a|b)*c")).validate(with_text(100000), reg);
  set_log_sink(nullptr);

  expect_false(big.success, "subject over the limit fails closed");
  expect_contains(big.error_message, "is too long to match pattern", "over-long subject is named in the message");
  expect_contains(big.error_message, "limit 4096", "message names the limit");
  expect_false(alternation.success, "backtracking pattern on a huge subject fails closed");
  expect_eq_int(static_cast<int64_t>(warnings.size()), 2, "each over-long subject logs a WARN");

  LockOptions tight;
  tight.max_pattern_subject = 8;
  const Lock short_only(LockType::kRegex, "s", Value("a+"), "", Value::Object{}, tight);
  expect_true(short_only.validate(with_text(8), reg).success, "limit is inclusive");
  expect_false(short_only.validate(with_text(9), reg).success, "one byte over the configured limit fails");

  expect_error(
      [] {
        LockOptions zero;
        zero.max_pattern_subject = 0;
        Lock l(LockType::kRegex, "s", Value("a"), "", Value::Object{}, zero);
      },
      ErrorCode::kInvalidConfig, "zero pattern limit rejected");
}

void test_custom_error_message() {
  ValidatorRegistry reg;
  LockOptions opts;
  opts.error_message = "Applicant must be an adult";
  const Lock adult(LockType::kGreaterThan, "age", Value(17), "", Value::Object{}, opts);

  const LockResult young = adult.validate(Element::from_json("{\"age\": 12}"), reg);
  expect_false(young.success, "custom message lock still fails on bad data");
  expect_eq_str(young.error_message, "Applicant must be an adult", "custom message replaces generated text");
  expect_eq_str(young.action_message, "Increase age to be greater than 17", "remediation text is unchanged");
  expect_eq_str(adult.failure_message(nullptr), "Property 'age' should be greater than 17 but is <missing>",
                "failure_message keeps the generated text");

  const LockResult ok = adult.validate(Element::from_json("{\"age\": 30}"), reg);
  expect_true(ok.success && ok.error_message.empty(), "no message on success");

  const Lock plain(LockType::kGreaterThan, "age", Value(17));
  expect_contains(plain.validate(Element::from_json("{\"age\": 12}"), reg).error_message, "should be greater than 17",
                  "without a custom message the generated text is used");
}

void test_configuration_errors() {
  expect_error([] { Lock l(LockType::kEquals, "x"); }, ErrorCode::kInvalidConfig,
               "equals without expected value is rejected");
  expect_error([] { Lock l(LockType::kExists, ""); }, ErrorCode::kInvalidConfig, "empty path is rejected");
  expect_error([] { Lock l(LockType::kCustom, "x"); }, ErrorCode::kInvalidConfig,
               "custom without validator name is rejected");
  expect_error([] { (void)lock_type_from_string("bogus"); }, ErrorCode::kInvalidConfig, "unknown lock type name");

  LockType t = LockType::kExists;
  expect_true(try_parse_lock_type("Not-In-List", &t) && t == LockType::kNotInList, "lock type names are lenient");
  expect_eq_str(Lock(LockType::kGreaterThan, "a.b", Value(1)).describe(), "greater_than(a.b)", "describe");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  test_exists_and_messages();
  test_comparisons();
  test_equality_and_membership();
  test_text_and_shape();
  test_custom_validators();
  test_long_pattern_subjects();
  test_custom_error_message();
  test_configuration_errors();

  return selftest::finish();
}
