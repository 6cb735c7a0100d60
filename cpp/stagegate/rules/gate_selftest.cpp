/*
  Gate selftest: short-circuit AND, nesting, structure warnings.
*/

#include <string>
#include <vector>

#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/rules/gate.hpp"
#include "stagegate/rules/lock.hpp"
#include "stagegate/rules/validator_registry.hpp"

namespace stagegate {
namespace {

using namespace selftest;

Lock exists(const char* path) { return Lock(LockType::kExists, path, Value(true)); }

void check_result_invariants(const GateResult& r, const char* label) {
  const std::string l(label);
  expect_true(r.passed == r.failed_components.empty(), l + ": passed iff no failed components");
  expect_true(!r.short_circuited || r.evaluated_count < r.total_components,
              l + ": short circuit implies fewer evaluations");
  expect_eq_int(static_cast<int64_t>(r.passed_components.size() + r.failed_components.size()),
                static_cast<int64_t>(r.evaluated_count), l + ": outcomes match evaluated count");
}

void test_and_of_two_locks() {
  ValidatorRegistry reg;
  const Gate g = Gate::AND("ab", {exists("a"), exists("b")});
  const GateResult r = g.evaluate(Element::from_json("{\"a\": 1}"), reg);

  expect_false(r.passed, "gate fails when the second lock fails");
  expect_eq_int(static_cast<int64_t>(r.passed_components.size()), 1, "first lock passed");
  expect_eq_int(static_cast<int64_t>(r.failed_components.size()), 1, "second lock failed");
  if (!r.failed_components.empty()) {
    expect_eq_str(r.failed_components[0].label, "exists(b)", "failed component label");
  }
  expect_false(r.short_circuited, "failure on the last component is not a short circuit");
  expect_eq_int(static_cast<int64_t>(r.actions.size()), 1, "one remediation action");
  check_result_invariants(r, "ab");
}

void test_short_circuit() {
  ValidatorRegistry reg;
  const Gate g = Gate::AND("abc", {exists("a"), exists("b"), exists("c")});
  const GateResult r = g.evaluate(Element::from_json("{\"c\": 1}"), reg);

  expect_false(r.passed, "gate fails on the first lock");
  expect_true(r.short_circuited, "remaining components are skipped");
  expect_eq_int(static_cast<int64_t>(r.evaluated_count), 1, "only one component evaluated");
  expect_eq_int(static_cast<int64_t>(r.total_components), 3, "total components recorded");
  check_result_invariants(r, "abc");

  const GateResult ok = g.evaluate(Element::from_json("{\"a\": 1, \"b\": 2, \"c\": 3}"), reg);
  expect_true(ok.passed, "all locks pass");
  expect_true(ok.messages.empty() && ok.actions.empty(), "passing gate has no messages");
  check_result_invariants(ok, "abc pass");
}

void test_nested_gates() {
  ValidatorRegistry reg;
  const GatePtr contact = Gate::share(Gate::AND("contact", {
      exists("email"),
      Lock(LockType::kRegex, "email", Value("[^@]+@[^@]+")),
  }));
  const GatePtr identity = Gate::share(Gate("identity", {exists("name"), contact}, std::string("review")));
  const Gate root("root", {identity, Lock(LockType::kGreaterThan, "age", Value(17))});

  expect_eq_int(static_cast<int64_t>(root.get_complexity()), 4, "complexity counts leaf locks");
  expect_eq_int(static_cast<int64_t>(root.max_depth()), 3, "depth counts nesting levels");
  const std::vector<std::string> paths = root.get_property_paths();
  expect_eq_int(static_cast<int64_t>(paths.size()), 3, "property paths are unique");
  expect_true(root.requires_property("email") && !root.requires_property("phone"), "requires_property");

  const GateResult r = root.evaluate(Element::from_json("{\"name\": \"n\", \"email\": \"bad\", \"age\": 30}"), reg);
  expect_false(r.passed, "nested failure fails the root");
  expect_true(r.short_circuited, "root skips the age lock");
  if (!r.failed_components.empty()) {
    const ComponentOutcome& o = r.failed_components[0];
    expect_true(o.is_gate && o.gate != nullptr, "failure recorded as nested gate outcome");
    if (o.gate) expect_eq_str(o.gate->gate_name, "identity", "nested outcome names the gate");
  }
  expect_eq_int(static_cast<int64_t>(r.messages.size()), 1, "nested messages bubble up");
  if (!r.messages.empty()) expect_contains(r.messages[0], "should match pattern", "regex message surfaces");

  expect_true(identity->target_stage().has_value() && *identity->target_stage() == "review", "target stage kept");
  check_result_invariants(r, "root");
}

void test_structure_and_conflicts() {
  const Gate legacy("legacy", {exists("a")}, std::nullopt, Value::Object{}, "or");
  expect_eq_str(legacy.logic(), "OR", "legacy logic tag is normalized");
  const auto lw = legacy.validate_structure();
  bool saw = false;
  for (const auto& w : lw) saw = saw || w.find("legacy logic 'OR'") != std::string::npos;
  expect_true(saw, "legacy logic produces a warning");

  const Gate bad("bad", {
      Lock(LockType::kEquals, "status", Value("open")),
      Lock(LockType::kEquals, "status", Value("closed")),
      exists("x"),
      exists("x"),
  });
  const auto bw = bad.validate_structure();
  bool conflict = false;
  bool repeat = false;
  for (const auto& w : bw) {
    conflict = conflict || w.find("can never pass") != std::string::npos;
    repeat = repeat || w.find("repeats lock exists(x)") != std::string::npos;
  }
  expect_true(conflict, "contradictory equals reported");
  expect_true(repeat, "duplicate lock reported");

  const Gate low("low", {Lock(LockType::kEquals, "n", Value(3))});
  const Gate high("high", {Lock(LockType::kGreaterThan, "n", Value(5))});
  expect_eq_int(static_cast<int64_t>(low.conflicts_with(high).size()), 1, "equals vs bound conflict");

  GateLimits tight;
  tight.max_recommended_complexity = 1;
  const Gate two("two", {exists("a"), exists("b")});
  bool complex = false;
  for (const auto& w : two.validate_structure(tight)) complex = complex || w.find("above recommended") != std::string::npos;
  expect_true(complex, "complexity warning honours limits");
}

void test_configuration_errors() {
  expect_error([] { Gate g("", {exists("a")}); }, ErrorCode::kInvalidConfig, "empty gate name rejected");
  expect_error([] { Gate g("empty", {}); }, ErrorCode::kInvalidConfig, "gate without components rejected");
  expect_error([] { Gate g("null", {GatePtr()}); }, ErrorCode::kInvalidConfig, "null nested gate rejected");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  test_and_of_two_locks();
  test_short_circuit();
  test_nested_gates();
  test_structure_and_conflicts();
  test_configuration_errors();

  return selftest::finish();
}
