/*
  Process selftest

  Objective
  ---------
  Drive the state machine end to end:
    1) SCOPING errors (unknown stage, no compatible stage, walk bound).
    2) FULFILLING / AWAITING / COMPLETED with default and templated actions.
    3) Multi-stage walks strictly advance and terminate.
    4) Identical input renders bit-identical output (timestamp excluded).
    5) History bookkeeping and regression detection.
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "stagegate/core/selftest.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/process/process.hpp"
#include "stagegate/rules/gate.hpp"
#include "stagegate/rules/lock.hpp"
#include "stagegate/rules/validator_registry.hpp"
#include "stagegate/schema/schema.hpp"
#include "stagegate/stage/stage.hpp"

namespace stagegate {
namespace {

using namespace selftest;

std::string meta_str(const StatusResult& r, const char* key) {
  const auto it = r.metadata.find(key);
  return (it != r.metadata.end() && it->second.is_string()) ? it->second.as_string() : std::string();
}

std::vector<std::string> meta_list(const StatusResult& r, const char* key) {
  std::vector<std::string> out;
  const auto it = r.metadata.find(key);
  if (it == r.metadata.end() || !it->second.is_array()) return out;
  for (const auto& v : it->second.as_array()) out.push_back(v.to_display());
  return out;
}

// S1: id + email present. S2: needs a reviewer and approval.
Stage stage_s1(ActionTemplateMap templates = {}) {
  return Stage("S1",
               {Gate::AND("email_present", {Lock(LockType::kExists, "email", Value(true))})},
               Schema("intake", {"id", "email"}),
               false,
               std::move(templates));
}

Stage stage_s2() {
  return Stage("S2",
               {Gate::AND("approved", {Lock(LockType::kEquals, "approved", Value(true))})},
               Schema("review", {"reviewer"}));
}

Process two_stage(bool regression = false, EngineSettings settings = EngineSettings::defaults()) {
  return Process("onboarding", {stage_s1(), stage_s2()}, {}, false, regression, Value::Object{}, settings,
                 std::make_shared<ValidatorRegistry>());
}

void test_awaiting_next_stage() {
  Process p = two_stage();
  const StatusResult r = p.evaluate(Element::from_json("{\"id\": \"e1\", \"email\": \"a@b.co\"}"));

  expect_true(r.state == EvaluationState::kAwaiting, "S1 satisfied, S2 not enterable: awaiting");
  expect_true(r.current_stage && *r.current_stage == "S1", "current stage is S1");
  expect_true(r.proposed_stage == r.current_stage, "proposed stage defaults to current");
  expect_eq_str(meta_str(r, "next_stage"), "S2", "metadata names the next stage");
  expect_false(r.has_errors(), "awaiting is not an error");
  expect_eq_int(static_cast<int64_t>(r.actions.size()), 1, "one wait action per unmet condition");
  if (!r.actions.empty()) {
    expect_true(r.actions[0].type == ActionType::kWaitForCondition, "wait_for_condition action");
    expect_eq_str(r.actions[0].description, "Element does not meet requirements for stage 'S2'", "wait reason");
  }
  expect_eq_str(r.summary(), "Awaiting (stage: S1) - 1 action(s)", "summary text");
  expect_eq_str(r.element_id, "e1", "element id taken from id field");
}

void test_completed() {
  Process p = two_stage();
  const StatusResult r =
      p.evaluate(Element::from_json("{\"id\": \"e2\", \"email\": \"a@b.co\", \"reviewer\": \"rk\", \"approved\": true}"));

  expect_true(r.state == EvaluationState::kCompleted, "both stages satisfied: completed");
  expect_false(r.current_stage.has_value(), "completed has no current stage");
  expect_eq_str(meta_str(r, "final_stage"), "S2", "final stage recorded");
  expect_true(r.is_terminal(), "completed is terminal");
  const auto walked = meta_list(r, "walked_stages");
  expect_true(walked.size() == 2 && walked[0] == "S1" && walked[1] == "S2", "walk visits S1 then S2");
  if (!r.actions.empty()) {
    expect_true(r.actions[0].type == ActionType::kTransitionStage, "transition_stage action");
    expect_eq_str(r.actions[0].description, "Process completed successfully", "completion action text");
  }
  expect_true(reached_stage(r) == std::optional<std::string>("S2"), "reached_stage falls back to final_stage");
}

void test_fulfilling() {
  Process p = two_stage();
  const StatusResult r =
      p.evaluate(Element::from_json("{\"id\": \"e3\", \"email\": \"a@b.co\", \"reviewer\": \"rk\", \"approved\": false}"));

  expect_true(r.state == EvaluationState::kFulfilling, "failing S2 gate: fulfilling");
  expect_true(r.current_stage && *r.current_stage == "S2", "walked into S2 before failing");
  expect_eq_int(static_cast<int64_t>(r.actions.size()), 1, "one complete_field action");
  if (!r.actions.empty()) {
    expect_true(r.actions[0].type == ActionType::kCompleteField, "complete_field action");
    expect_eq_str(r.actions[0].description, "Set approved to 'true'", "gate remediation becomes the action");
  }
  const auto it = r.metadata.find("completion");
  expect_true(it != r.metadata.end() && it->second.is_number() && it->second.as_double() == 0.5,
              "completion carried in metadata");
  const auto failed = meta_list(r, "failed_gates");
  expect_true(failed.size() == 1 && failed[0] == "approved", "failed gates listed");

  const StatusResult known = p.evaluate(Element::from_json("{\"id\": \"e4\", \"email\": \"x\"}"), std::string("S2"));
  expect_true(known.state == EvaluationState::kFulfilling, "known stage is evaluated even if incompatible");
  bool schema_action = false;
  for (const auto& a : known.actions) {
    schema_action = schema_action ||
                    (a.type == ActionType::kValidateData && a.description == "Required field missing: reviewer");
  }
  expect_true(schema_action, "schema errors become validate_data actions");
}

void test_scoping_errors() {
  Process p = two_stage();

  const StatusResult unknown = p.evaluate(Element::from_json("{\"id\": \"e5\"}"), std::string("nope"));
  expect_true(unknown.state == EvaluationState::kScoping, "unknown stage: scoping");
  expect_true(unknown.errors.size() == 1 && unknown.errors[0] == "Stage 'nope' not found in process",
              "unknown stage error text");
  expect_true(!unknown.actions.empty() && unknown.actions[0].type == ActionType::kManualReview &&
                  unknown.actions[0].priority == Priority::kHigh,
              "high priority manual review");
  expect_eq_str(unknown.summary(), "Error in scoping: Stage 'nope' not found in process", "error summary");

  const StatusResult none = p.evaluate(Element::from_json("{\"foo\": 1}"));
  expect_true(none.state == EvaluationState::kScoping, "no compatible stage: scoping");
  expect_true(!none.errors.empty() && none.errors[0] == "Element lacks required properties for any stage",
              "no compatible stage error text");
  if (!none.actions.empty()) {
    expect_eq_str(none.actions[0].description, "Ensure element has required properties for at least one stage",
                  "no compatible stage action");
  }
  const auto it = none.metadata.find("missing_by_stage");
  expect_true(it != none.metadata.end() && it->second.find("S1") != nullptr, "missing fields listed per stage");

  EngineSettings tight = EngineSettings::defaults();
  tight.process.max_stage_walk = 1;
  Process bounded = two_stage(false, tight);
  const StatusResult walk =
      bounded.evaluate(Element::from_json("{\"id\": \"e6\", \"email\": \"a\", \"reviewer\": \"r\", \"approved\": true}"));
  expect_true(walk.state == EvaluationState::kCompleted, "a bound of one still allows one hop");
}

void test_multi_stage_walk_terminates() {
  std::vector<Stage> stages;
  const char* names[] = {"A", "B", "C", "D"};
  for (const char* n : names) {
    stages.emplace_back(n, std::vector<Gate>{Gate::AND(std::string("g") + n, {Lock(LockType::kExists, n, Value(true))})});
  }
  Process p("chain", std::move(stages), {}, false, false, Value::Object{}, EngineSettings::defaults(),
            std::make_shared<ValidatorRegistry>());

  EngineSettings two_hops = EngineSettings::defaults();
  two_hops.process.max_stage_walk = 2;
  std::vector<Stage> copy = p.stages();
  Process short_walk("short", std::move(copy), {}, false, false, Value::Object{}, two_hops,
                     std::make_shared<ValidatorRegistry>());
  const StatusResult cut =
      short_walk.evaluate(Element::from_json("{\"id\": 8, \"A\": 1, \"B\": 1, \"C\": 1, \"D\": 1}"));
  expect_true(cut.state == EvaluationState::kScoping && cut.has_errors(), "walk bound yields scoping error");
  if (!cut.errors.empty()) {
    expect_eq_str(cut.errors[0], "Stage walk exceeded 2 hops at stage 'C'", "walk bound counts hops made");
  }
  expect_eq_int(static_cast<int64_t>(meta_list(cut, "walked_stages").size()), 3, "two hops visit three stages");

  const StatusResult r = p.evaluate(Element::from_json("{\"id\": 7, \"A\": 1, \"B\": 1, \"C\": 1}"));
  expect_true(r.state == EvaluationState::kFulfilling, "walk stops at the first failing stage");
  expect_true(r.current_stage && *r.current_stage == "D", "stopped at D");
  const auto walked = meta_list(r, "walked_stages");
  bool strictly_forward = walked.size() == 4;
  for (std::size_t i = 1; strictly_forward && i < walked.size(); ++i) {
    strictly_forward = *p.get_stage_index(walked[i]) == *p.get_stage_index(walked[i - 1]) + 1;
  }
  expect_true(strictly_forward, "every hop moves exactly one stage forward");

  const auto h = p.get_history("7");
  expect_true(h.has_value(), "numeric id keys the history");
  if (h) {
    expect_eq_int(static_cast<int64_t>(h->transitions().size()), 4, "three advancing hops plus the final state");
    expect_true(h->transitions()[0].to_state == EvaluationState::kAdvancing, "first record is a hop");
    expect_true(h->current_state() == EvaluationState::kFulfilling, "last record is the outcome");
  }
}

void test_determinism() {
  EngineSettings s = EngineSettings::defaults();
  s.process.record_history = false;
  Process p = two_stage(false, s);
  const Element e = Element::from_json("{\"email\": \"a@b.co\", \"id\": \"d1\"}");

  StatusJsonOptions opt;
  opt.include_timestamp = false;
  const std::string j1 = p.evaluate(e).to_json(opt);
  const std::string j2 = p.evaluate(e).to_json(opt);
  expect_eq_str(j1, j2, "repeated evaluation renders identically");
  expect_contains(j1, "\"state\": \"awaiting\"", "json carries the state name");
  expect_eq_int(static_cast<int64_t>(p.history_size()), 0, "history disabled records nothing");

  StatusJsonOptions with_ts;
  expect_contains(p.evaluate(e).to_json(with_ts), "\"timestamp\": \"", "timestamp included by default");
}

void test_templates_and_batch() {
  ActionTemplate wait;
  wait.type = ActionType::kWaitForCondition;
  wait.description = "Assign a reviewer to {id} before {next_stage}";
  ActionTemplateMap templates;
  templates[EvaluationState::kAwaiting].push_back(wait);

  Process p("templated", {stage_s1(templates), stage_s2()}, {}, false, false, Value::Object{},
            EngineSettings::defaults(), std::make_shared<ValidatorRegistry>());
  const StatusResult r = p.evaluate(Element::from_json("{\"id\": \"t1\", \"email\": \"a\"}"));
  expect_true(r.actions.size() == 1 && r.actions[0].description == "Assign a reviewer to t1 before S2",
              "awaiting template replaces default actions");

  const std::vector<Element> batch = {
      Element::from_json("{\"id\": \"b1\", \"email\": \"a\"}"),
      Element::from_json("{\"foo\": 1}"),
      Element::from_json("{\"id\": \"b3\", \"email\": \"a\", \"reviewer\": \"r\", \"approved\": true}"),
  };
  const auto results = p.evaluate_batch(batch);
  expect_true(results.size() == 3 && results[0].state == EvaluationState::kAwaiting &&
                  results[1].state == EvaluationState::kScoping && results[2].state == EvaluationState::kCompleted,
              "batch keeps input order");
}

void test_history_and_regression() {
  Process p = two_stage(true);
  const char* full = "{\"id\": \"r1\", \"email\": \"a\", \"reviewer\": \"r\", \"approved\": true}";
  const char* partial = "{\"id\": \"r1\", \"email\": \"a\"}";

  const StatusResult done = p.evaluate(Element::from_json(full));
  expect_true(done.state == EvaluationState::kCompleted && done.warnings.empty(), "first pass completes cleanly");

  const StatusResult back = p.evaluate(Element::from_json(partial));
  expect_true(back.state == EvaluationState::kAwaiting, "regressed element keeps its evaluated state");
  expect_true(back.warnings.size() == 1 && back.warnings[0] == "Element regressed from stage 'S2' to 'S1'",
              "evaluate warns about the regression");

  const RegressionReport rep = p.check_regression(Element::from_json(partial));
  expect_true(rep.regressed, "check_regression detects the regression");
  expect_true(rep.previous_stage == std::optional<std::string>("S2"), "previous stage is the furthest reached");
  expect_true(rep.current_stage == std::optional<std::string>("S1"), "current stage is the scoped stage");
  expect_true(rep.status.state == EvaluationState::kRegressing, "report carries a regressing result");
  expect_true(!rep.status.actions.empty() && rep.status.actions[0].type == ActionType::kManualReview,
              "regression asks for review first");

  const auto h = p.get_history("r1");
  expect_true(h.has_value(), "history recorded for r1");
  if (h) {
    expect_eq_int(static_cast<int64_t>(h->evaluation_count()), 3, "three evaluations counted");
    expect_true(h->current_state() == EvaluationState::kRegressing, "last transition is regressing");
    expect_true(h->regression_count() >= 1, "regression counted");
    expect_true(h->current_stage() == std::optional<std::string>("S1"), "history tracks current stage");
    const Value s = h->summary();
    expect_true(s.find("transition_count") && s.find("transition_count")->as_int() ==
                                                   static_cast<int64_t>(h->transitions().size()),
                "summary reports transition count");
  }

  const RegressionReport fresh = p.check_regression(Element::from_json("{\"id\": \"n1\", \"email\": \"a\"}"));
  expect_false(fresh.regressed, "no history means no regression");
  expect_true(fresh.status.state == EvaluationState::kAwaiting, "plain evaluation returned otherwise");

  expect_eq_int(static_cast<int64_t>(p.history_size()), 2, "two elements tracked");
  expect_true(p.clear_history("r1"), "clear one element");
  expect_false(p.clear_history("r1"), "second clear finds nothing");
  p.clear_history();
  expect_eq_int(static_cast<int64_t>(p.history_size()), 0, "clear all");

  EngineSettings capped = EngineSettings::defaults();
  capped.process.max_history_per_element = 1;
  Process q = two_stage(false, capped);
  (void)q.evaluate(Element::from_json(full));
  const auto qh = q.get_history("r1");
  expect_true(qh && qh->transitions().size() == 1 && qh->transitions()[0].to_state == EvaluationState::kCompleted,
              "history cap keeps the newest transitions");

  StateTransition t;
  t.from_state = EvaluationState::kCompleted;
  t.to_state = EvaluationState::kFulfilling;
  expect_true(t.is_regression() && !t.is_progression(), "rank drop is a regression");
  t.from_state = EvaluationState::kFulfilling;
  t.to_state = EvaluationState::kAwaiting;
  expect_true(t.is_progression(), "fulfilling to awaiting is progress");
}

void test_navigation_and_structure() {
  Process p = two_stage();
  expect_true(p.get_stage("S1") != nullptr && p.get_stage("S9") == nullptr, "get_stage");
  expect_true(p.get_stage_index("S2") == std::optional<std::size_t>(1), "get_stage_index");
  expect_true(p.get_next_stage_name("S1") == std::optional<std::string>("S2"), "next stage name");
  expect_false(p.get_next_stage_name("S2").has_value(), "last stage has no successor");
  expect_true(p.can_transition("S1", "S2"), "forward by one is allowed");
  expect_false(p.can_transition("S2", "S1"), "backward is not allowed");

  const auto reasons = p.validate_stage_progression(Element::from_json("{\"id\": 1}"), "S1", "S2");
  expect_true(reasons.size() == 1 && reasons[0] == "Element does not meet requirements for stage 'S2'",
              "progression reason for missing requirements");

  std::vector<Stage> three = {stage_s1(), stage_s2(), Stage("S3", {})};
  Process strict("strict", three, {}, false);
  Process skipping("skipping", three, {}, true);
  expect_false(strict.can_transition("S1", "S3"), "skip refused without allow_stage_skipping");
  expect_true(skipping.can_transition("S1", "S3"), "skip allowed with allow_stage_skipping");
  const auto skip_reasons = strict.validate_stage_progression(Element::from_json("{}"), "S1", "S3");
  expect_true(!skip_reasons.empty() && skip_reasons[0] == "Direct transition from 'S1' to 'S3' not allowed",
              "skip refusal reason");

  const auto props = p.get_all_required_properties();
  expect_true(props == std::vector<std::string>({"approved", "email", "id", "reviewer"}), "required properties union");

  const Stage targeted("T", {Gate("g", {Lock(LockType::kExists, "x", Value(true))}, std::string("Nowhere"))});
  Process t("targets", {targeted});
  bool warned = false;
  for (const auto& w : t.validate_structure()) warned = warned || w.find("targets unknown stage 'Nowhere'") != std::string::npos;
  expect_true(warned, "unknown gate target is reported");

  Process ordered("ordered", {stage_s1(), stage_s2()}, {"S2", "S1"});
  expect_true(ordered.stage_order() == std::vector<std::string>({"S2", "S1"}), "explicit order applied");

  const Value s = p.summary();
  expect_true(s.find("stage_count") && s.find("stage_count")->as_int() == 2, "summary stage count");
}

void test_custom_registry_injection() {
  auto reg = std::make_shared<ValidatorRegistry>();
  reg->register_validator("vip", [](const Value& v, const Value&) { return v.is_string() && v.as_string() == "gold"; });

  const Stage vip("vip", {Gate::AND("tier", {Lock::custom("tier", "vip")})});
  Process p("vip", {vip}, {}, false, false, Value::Object{}, EngineSettings::defaults(), reg);
  expect_true(&p.validators() == reg.get(), "process uses the injected registry");
  expect_true(p.evaluate(Element::from_json("{\"tier\": \"gold\"}")).state == EvaluationState::kCompleted,
              "custom validator passes via injected registry");
  expect_true(p.evaluate(Element::from_json("{\"tier\": \"tin\"}")).state == EvaluationState::kFulfilling,
              "custom validator fails via injected registry");
}

void test_long_pattern_subject_fails_closed() {
  const Stage coded("coded", {Gate::AND("code_format", {Lock(LockType::kRegex, "code", Value("(a|b)*c"))})});
  Process p("codes", {coded}, {}, false, false, Value::Object{}, EngineSettings::defaults(),
            std::make_shared<ValidatorRegistry>());

  Value::Object o;
  o["id"] = Value("long");
  o["code"] = Value(std::string(100000, 'a'));
  const StatusResult r = p.evaluate(Element(Value(std::move(o))));

  expect_true(r.state == EvaluationState::kFulfilling, "over-long subject fails the gate instead of crashing");
  expect_false(r.has_errors(), "over-long subject is a gate failure, not an evaluation error");
  const auto failed = meta_list(r, "failed_gates");
  expect_true(failed.size() == 1 && failed[0] == "code_format", "regex gate reported as failed");

  Value::Object ok;
  ok["id"] = Value("short");
  ok["code"] = Value("ababc");
  expect_true(p.evaluate(Element(Value(std::move(ok)))).state == EvaluationState::kCompleted,
              "short subject is still matched");
}

void test_evaluation_failure_text() {
  try {
    STAGEGATE_THROW(ErrorCode::kInternal, "registry went away");
  } catch (const Error& e) {
    const StatusResult r = evaluation_failure("e9", e);
    expect_true(r.state == EvaluationState::kScoping, "evaluation failure is scoping");
    expect_eq_str(r.element_id, "e9", "element id kept");
    expect_eq_int(static_cast<int64_t>(r.errors.size()), 1, "one error");
    if (!r.errors.empty()) {
      expect_eq_str(r.errors[0], "Evaluation error: registry went away", "error text omits code and throw site");
      expect_true(r.errors[0].find('[') == std::string::npos, "no file:line suffix");
    }
    expect_eq_int(static_cast<int64_t>(r.actions.size()), 1, "one manual review action");
    if (!r.actions.empty()) {
      expect_true(r.actions[0].type == ActionType::kManualReview, "manual_review action");
      expect_true(r.actions[0].priority == Priority::kCritical, "critical priority");
      expect_eq_str(r.actions[0].description, "Process evaluation failed", "manual review text");
    }
  }

  const StatusResult other = evaluation_failure("e10", std::runtime_error("out of cheese"));
  expect_true(other.errors.size() == 1 && other.errors[0] == "Evaluation error: out of cheese",
              "foreign exceptions use what()");
}

void test_configuration_errors() {
  expect_error([] { Process p("", {stage_s1()}); }, ErrorCode::kInvalidConfig, "empty process name rejected");
  expect_error([] { Process p("x", {}); }, ErrorCode::kInvalidConfig, "process without stages rejected");
  expect_error([] { Process p("x", {stage_s1(), stage_s1()}); }, ErrorCode::kInvalidConfig,
               "duplicate stage names rejected");
  expect_error([] { Process p("x", {stage_s1(), stage_s2()}, {"S1", "S9"}); }, ErrorCode::kInvalidConfig,
               "order naming an unknown stage rejected");
  expect_error([] { Process p("x", {stage_s1(), stage_s2()}, {"S1"}); }, ErrorCode::kInvalidConfig,
               "order omitting a stage rejected");
  expect_error([] { Process p("x", {stage_s1(), stage_s2()}, {"S1", "S1"}); }, ErrorCode::kInvalidConfig,
               "order repeating a stage rejected");
  expect_error(
      [] {
        EngineSettings s;
        s.process.max_stage_walk = 1000000;
        Process p("x", {stage_s1()}, {}, false, false, Value::Object{}, s);
      },
      ErrorCode::kInvalidConfig, "insane settings rejected");
}

}  // namespace
}  // namespace stagegate

int main() {
  using namespace stagegate;

  set_log_level(LogLevel::WARN);

  test_awaiting_next_stage();
  test_completed();
  test_fulfilling();
  test_scoping_errors();
  test_multi_stage_walk_terminates();
  test_determinism();
  test_templates_and_batch();
  test_history_and_regression();
  test_navigation_and_structure();
  test_custom_registry_injection();
  test_long_pattern_subject_fails_closed();
  test_evaluation_failure_text();
  test_configuration_errors();

  return selftest::finish();
}
