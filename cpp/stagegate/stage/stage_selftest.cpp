/*
  Stage selftest: schema + gates, allow_partial, completion, action templates.
*/

#include <string>
#include <vector>

#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/rules/gate.hpp"
#include "stagegate/rules/lock.hpp"
#include "stagegate/rules/validator_registry.hpp"
#include "stagegate/schema/schema.hpp"
#include "stagegate/stage/stage.hpp"

namespace stagegate {
namespace {

using namespace selftest;

Gate equals_gate(const char* name, const char* path, const char* value) {
  return Gate::AND(name, {Lock(LockType::kEquals, path, Value(value))});
}

void test_single_gate_stage() {
  ValidatorRegistry reg;
  const Stage ready("ready", {equals_gate("status_ready", "status", "ready")});

  const StageResult ok = ready.evaluate(Element::from_json("{\"status\": \"ready\"}"), reg);
  expect_true(ok.overall_passed, "stage passes when its only gate passes");
  expect_true(ok.schema_valid, "no schema counts as valid");
  expect_near(ok.completion_fraction, 1.0, 1e-12, "full completion");

  const StageResult bad = ready.evaluate(Element::from_json("{\"status\": \"draft\"}"), reg);
  expect_false(bad.overall_passed, "stage fails when the gate fails");
  expect_near(bad.completion_fraction, 0.5, 1e-12, "failed gate with valid schema is half done");
  expect_eq_int(static_cast<int64_t>(bad.actions.size()), 1, "one remediation action");
  if (!bad.actions.empty()) expect_eq_str(bad.actions[0], "Set status to 'ready'", "remediation text");
  const auto failed = bad.failed_gate_names();
  expect_true(failed.size() == 1 && failed[0] == "status_ready", "failed gate names");
}

void test_partial_and_monotonicity() {
  ValidatorRegistry reg;
  const Element e = Element::from_json("{\"a\": 1}");
  const Gate has_a = Gate::AND("has_a", {Lock(LockType::kExists, "a", Value(true))});
  const Gate has_b = Gate::AND("has_b", {Lock(LockType::kExists, "b", Value(true))});

  const Stage strict("strict", {has_a, has_b});
  const Stage partial("partial", {has_a, has_b}, std::nullopt, true);
  expect_false(strict.evaluate(e, reg).overall_passed, "all gates required without allow_partial");
  expect_true(partial.evaluate(e, reg).overall_passed, "any gate suffices with allow_partial");
  expect_near(partial.evaluate(e, reg).completion_fraction, 0.75, 1e-12, "half the gates plus valid schema");

  // Adding a passing gate never hurts under allow_partial.
  const Stage partial_more("partial_more", {has_b, has_a}, std::nullopt, true);
  const Stage only_b("only_b", {has_b}, std::nullopt, true);
  expect_false(only_b.evaluate(e, reg).overall_passed, "partial stage with only failing gate fails");
  expect_true(partial_more.evaluate(e, reg).overall_passed, "adding a passing gate flips partial stage to pass");

  // Adding a failing gate can only hurt without allow_partial.
  const Stage single("single", {has_a});
  expect_true(single.evaluate(e, reg).overall_passed, "strict stage passes with one passing gate");
  expect_false(strict.evaluate(e, reg).overall_passed, "strict stage fails once a failing gate is added");
}

void test_schema_interplay() {
  ValidatorRegistry reg;
  const Schema s("order", {"id", "total"}, {}, {{"total", FieldType::kNumber}});
  const Stage intake("intake", {}, s);

  expect_true(intake.is_compatible_with_element(Element::from_json("{\"id\": 1, \"total\": \"x\"}")),
              "compatibility only checks required presence");
  expect_false(intake.is_compatible_with_element(Element::from_json("{\"id\": 1}")), "missing required field");

  const StageResult r = intake.evaluate(Element::from_json("{\"id\": 1, \"total\": \"x\"}"), reg);
  expect_false(r.overall_passed, "schema type error fails the stage");
  expect_near(r.completion_fraction, 0.0, 1e-12, "no gates: completion follows schema");
  expect_eq_int(static_cast<int64_t>(r.messages().size()), 1, "schema error surfaces in messages");

  const Stage empty("empty", {});
  expect_near(empty.evaluate(Element(), reg).completion_fraction, 1.0, 1e-12, "empty stage is complete");
  bool warned = false;
  for (const auto& w : empty.validate_structure()) warned = warned || w.find("always passes") != std::string::npos;
  expect_true(warned, "empty stage warns that it always passes");

  const Stage both("both", {equals_gate("g", "status", "ok")}, s);
  const auto props = both.get_required_properties();
  expect_true(props.size() == 3 && props[0] == "id" && props[1] == "status" && props[2] == "total",
              "required properties are sorted and unique");
}

void test_action_templates() {
  ActionTemplate t;
  t.type = ActionType::kCompleteField;
  t.description = "Hi {customer}, finish {stage} ({missing})";
  t.priority = Priority::kHigh;
  t.template_vars["customer"] = "profile.name";
  t.conditions.push_back("{status} must be ready");

  ActionTemplateMap templates;
  templates[EvaluationState::kFulfilling].push_back(t);
  const Stage st("kyc", {equals_gate("g", "status", "ready")}, std::nullopt, false, templates);

  expect_true(st.has_action_templates(EvaluationState::kFulfilling), "templates declared for fulfilling");
  expect_false(st.has_action_templates(EvaluationState::kAwaiting), "no templates for awaiting");

  Value::Object ctx;
  ctx["stage"] = Value("kyc");
  const auto actions = st.resolve_actions_for_state(
      EvaluationState::kFulfilling,
      Element::from_json("{\"profile\": {\"name\": \"Ann\"}, \"status\": \"draft\"}"), ctx);
  expect_eq_int(static_cast<int64_t>(actions.size()), 1, "one resolved action");
  if (!actions.empty()) {
    expect_eq_str(actions[0].description, "Hi Ann, finish kyc ({missing})", "bindings, context, verbatim fallback");
    expect_true(actions[0].priority == Priority::kHigh, "priority carried");
    expect_true(actions[0].conditions.size() == 1 && actions[0].conditions[0] == "draft must be ready",
                "condition resolved from element path");
  }

  expect_eq_str(render_template("{unclosed", {}, Element(), {}), "{unclosed", "unmatched brace copied through");
}

void test_configuration_errors() {
  expect_error([] { Stage s("", {}); }, ErrorCode::kInvalidConfig, "empty stage name rejected");
  expect_error([] { Stage s("dup", {equals_gate("g", "a", "x"), equals_gate("g", "b", "y")}); },
               ErrorCode::kInvalidConfig, "duplicate gate names rejected");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  test_single_gate_stage();
  test_partial_and_monotonicity();
  test_schema_interplay();
  test_action_templates();
  test_configuration_errors();

  return selftest::finish();
}
