/*
  ProcessDefinition -> Process builder selftest.
*/

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/process/process_definition.hpp"

namespace stagegate {
namespace {

using namespace selftest;

LockDefinition lock_def(std::string type, std::string path, Value expected = Value()) {
  LockDefinition d;
  d.type = std::move(type);
  d.property_path = std::move(path);
  d.expected_value = std::move(expected);
  return d;
}

ProcessDefinition loan_definition() {
  // Nested gate: income present and above the floor.
  auto income = std::make_shared<GateDefinition>();
  income->name = "income_ok";
  income->components.push_back(lock_def("exists", "applicant.income"));
  income->components.push_back(lock_def("greater-than", "applicant.income", Value(30000)));

  GateDefinition eligibility;
  eligibility.name = "eligibility";
  eligibility.components.push_back(lock_def("NOT_EMPTY", "applicant.name"));
  eligibility.components.push_back(std::shared_ptr<const GateDefinition>(income));

  SchemaDefinition intake_schema;
  intake_schema.name = "intake";
  intake_schema.required_fields = {"id", "applicant.name"};
  intake_schema.optional_fields = {"channel"};
  intake_schema.field_types["applicant.name"] = "string";
  intake_schema.default_values["channel"] = Value("web");

  ActionTemplateDefinition nudge;
  nudge.type = "complete_field";
  nudge.priority = "high";
  nudge.description = "Ask {name} for proof of income";
  nudge.template_vars["name"] = "applicant.name";

  StageDefinition intake;
  intake.name = "intake";
  intake.description = "Collect the application";
  intake.gates.push_back(eligibility);
  intake.schema = intake_schema;
  intake.actions["fulfilling"].push_back(nudge);

  GateDefinition signed_gate;
  signed_gate.name = "signed";
  signed_gate.logic = "and";
  signed_gate.components.push_back(lock_def("equals", "contract.signed", Value(true)));

  StageDefinition contract;
  contract.gates.push_back(signed_gate);
  SchemaDefinition contract_schema;
  contract_schema.name = "contract";
  contract_schema.required_fields = {"contract.signed"};
  contract.schema = contract_schema;

  ProcessDefinition def;
  def.name = "loan";
  def.stages.push_back(intake);
  def.named_stages["contract"] = contract;
  return def;
}

void test_build_and_evaluate() {
  const auto reg = std::make_shared<ValidatorRegistry>();
  Process p = build_process(loan_definition(), reg);

  expect_eq_str(p.name(), "loan", "process name");
  expect_true(p.stage_order() == std::vector<std::string>({"intake", "contract"}),
              "ordered stages first, then named stages");
  expect_true(&p.validators() == reg.get(), "registry passed through");

  const Stage* intake = p.get_stage("intake");
  expect_true(intake != nullptr && intake->description() == "Collect the application", "stage description kept");
  if (intake) {
    const Gate* g = intake->get_gate("eligibility");
    expect_true(g != nullptr && g->get_complexity() == 3 && g->max_depth() == 2, "nested gate built");
    expect_true(intake->schema() && intake->schema()->get_default_value("channel") != nullptr, "schema defaults kept");
  }

  const StatusResult low =
      p.evaluate(Element::from_json("{\"id\": \"L1\", \"applicant\": {\"name\": \"Kim\", \"income\": 1000}}"));
  expect_true(low.state == EvaluationState::kFulfilling, "low income fails intake");
  expect_true(low.actions.size() == 1 && low.actions[0].description == "Ask Kim for proof of income" &&
                  low.actions[0].priority == Priority::kHigh,
              "declared template used for fulfilling");

  const StatusResult waiting =
      p.evaluate(Element::from_json("{\"id\": \"L2\", \"applicant\": {\"name\": \"Kim\", \"income\": 50000}}"));
  expect_true(waiting.state == EvaluationState::kAwaiting, "intake satisfied, contract missing");

  const StatusResult done = p.evaluate(Element::from_json(
      "{\"id\": \"L3\", \"applicant\": {\"name\": \"Kim\", \"income\": 50000}, \"contract\": {\"signed\": true}}"));
  expect_true(done.state == EvaluationState::kCompleted, "signed contract completes the process");
}

void test_explicit_order_and_flags() {
  ProcessDefinition def = loan_definition();
  def.order = {"contract", "intake"};
  def.allow_stage_skipping = true;
  def.regression_detection = true;
  EngineSettings s = EngineSettings::defaults();
  s.process.record_history = false;

  Process p = build_process(def, std::make_shared<ValidatorRegistry>(), s);
  expect_true(p.stage_order() == std::vector<std::string>({"contract", "intake"}), "explicit order wins");
  expect_true(p.allow_stage_skipping() && p.regression_detection(), "flags carried over");
  expect_false(p.settings().process.record_history, "settings carried over");
}

void test_lock_messages_and_pattern_limits() {
  const auto reg = std::make_shared<ValidatorRegistry>();

  LockDefinition adult = lock_def("greater_than", "age", Value(17));
  adult.error_message = "Applicant must be an adult";
  expect_eq_str(build_lock(adult).custom_error_message(), "Applicant must be an adult", "override carried to the lock");
  expect_eq_str(build_lock(lock_def("greater_than", "age", Value(17))).custom_error_message(), "",
                "no override by default");

  GateDefinition gd;
  gd.name = "age_ok";
  gd.components.push_back(adult);
  const GateResult r = build_gate(gd).evaluate(Element::from_json("{\"age\": 12}"), *reg);
  expect_false(r.passed, "gate fails on the young applicant");
  expect_true(r.messages.size() == 1 && r.messages[0] == "Applicant must be an adult",
              "override surfaces in gate messages");

  ProcessDefinition def;
  def.name = "codes";
  StageDefinition st;
  st.name = "coded";
  GateDefinition fmt;
  fmt.name = "format";
  fmt.components.push_back(lock_def("regex", "code", Value("[A-Z]+")));
  st.gates.push_back(fmt);
  SchemaDefinition sd;
  sd.name = "codes";
  sd.required_fields = {"code"};
  FieldRule upper;
  upper.pattern = "[A-Z]+";
  sd.rules["code"] = upper;
  st.schema = sd;
  def.stages.push_back(st);

  EngineSettings s = EngineSettings::defaults();
  s.pattern.max_subject_length = 4;
  Process p = build_process(def, reg, s);

  const Stage* coded = p.get_stage("coded");
  expect_true(coded != nullptr, "stage built");
  if (coded) {
    const auto& comp = coded->gates().at(0).components().at(0);
    expect_true(std::holds_alternative<Lock>(comp) && std::get<Lock>(comp).max_pattern_subject() == 4,
                "engine pattern limit reaches regex locks");
  }
  expect_true(p.evaluate(Element::from_json("{\"code\": \"ABCD\"}")).state == EvaluationState::kCompleted,
              "subject at the limit is matched");
  const StatusResult long_code = p.evaluate(Element::from_json("{\"code\": \"ABCDE\"}"));
  expect_true(long_code.state == EvaluationState::kFulfilling, "subject over the limit fails the stage");
  bool limit_action = false;
  for (const auto& a : long_code.actions) {
    limit_action = limit_action ||
                   (a.type == ActionType::kValidateData &&
                    a.description == "Field 'code' is too long to check against its pattern (limit 4 bytes)");
  }
  expect_true(limit_action, "engine pattern limit reaches the schema");

  expect_error(
      [&] {
        EngineSettings bad = EngineSettings::defaults();
        bad.pattern.max_subject_length = 0;
        (void)build_process(def, reg, bad);
      },
      ErrorCode::kInvalidConfig, "zero pattern limit rejected by build_process");
}

void test_definition_errors() {
  expect_error(
      [] {
        ProcessDefinition def = loan_definition();
        def.stages[0].gates[0].components.push_back(lock_def("sideways", "x"));
        (void)build_process(def);
      },
      ErrorCode::kInvalidConfig, "unknown lock type rejected");

  try {
    ProcessDefinition def = loan_definition();
    def.stages[0].gates[0].components.push_back(lock_def("equals", "x"));
    (void)build_process(def);
    fail("missing expected value must be rejected");
  } catch (const Error& e) {
    expect_contains(e.message(), "Stage 'intake': gate 'eligibility': component 2:",
                    "error names the stage, gate and component");
  }

  expect_error(
      [] {
        ProcessDefinition def = loan_definition();
        def.stages[0].schema->field_types["id"] = "float";
        (void)build_process(def);
      },
      ErrorCode::kInvalidConfig, "unknown field type rejected");

  expect_error(
      [] {
        ProcessDefinition def = loan_definition();
        def.stages[0].actions["pondering"].push_back(ActionTemplateDefinition{});
        (void)build_process(def);
      },
      ErrorCode::kInvalidConfig, "unknown template state rejected");

  expect_error(
      [] {
        ProcessDefinition def = loan_definition();
        ActionTemplateDefinition t;
        t.description = "x";
        t.priority = "urgent";
        def.stages[0].actions["awaiting"].push_back(t);
        (void)build_process(def);
      },
      ErrorCode::kInvalidConfig, "unknown priority rejected");

  expect_error(
      [] {
        ProcessDefinition def = loan_definition();
        def.named_stages["contract"].name = "other";
        (void)build_process(def);
      },
      ErrorCode::kInvalidConfig, "named stage key mismatch rejected");

  expect_error(
      [] {
        ProcessDefinition def = loan_definition();
        def.stages.push_back(def.stages[0]);
        (void)build_process(def);
      },
      ErrorCode::kInvalidConfig, "duplicate stage rejected");

  {
    auto loop = std::make_shared<GateDefinition>();
    loop->name = "loop";
    loop->components.push_back(lock_def("exists", "a"));
    loop->components.push_back(std::shared_ptr<const GateDefinition>(loop));
    expect_error([&] { (void)build_gate(*loop); }, ErrorCode::kInvalidConfig,
                 "self-containing gate definition rejected");
    loop->components.clear();
  }

  expect_error(
      [] {
        SchemaDefinition s;
        s.name = "dup";
        s.required_fields = {"a", "a"};
        (void)build_schema(s);
      },
      ErrorCode::kInvalidConfig, "repeated required field rejected");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  set_log_level(LogLevel::WARN);

  test_build_and_evaluate();
  test_explicit_order_and_flags();
  test_lock_messages_and_pattern_limits();
  test_definition_errors();

  return selftest::finish();
}
