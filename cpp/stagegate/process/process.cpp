#include "stagegate/process/process.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

#include "stagegate/core/error.hpp"
#include "stagegate/core/logging.hpp"

namespace stagegate {
namespace {

Action make_action(ActionType type, std::string description, Priority priority) {
  Action a;
  a.type = type;
  a.description = std::move(description);
  a.priority = priority;
  return a;
}

Value string_array(const std::vector<std::string>& items) {
  Value::Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return Value(std::move(out));
}

std::string quoted(const std::string& s) { return "'" + s + "'"; }

// Text stored as the reason of the final transition of one evaluation.
std::string transition_reason(const StatusResult& r) {
  if (r.has_errors()) return r.errors.front();

  const auto meta_text = [&](const char* key) -> std::string {
    const auto it = r.metadata.find(key);
    return (it != r.metadata.end() && it->second.is_string()) ? it->second.as_string() : std::string();
  };

  switch (r.state) {
    case EvaluationState::kFulfilling:
      return "Stage " + quoted(r.current_stage.value_or("")) + " requirements not met";
    case EvaluationState::kAwaiting:
      return "Waiting to enter stage " + quoted(meta_text("next_stage"));
    case EvaluationState::kCompleted:
      return "Process completed";
    case EvaluationState::kRegressing:
      return "Regressed from stage " + quoted(meta_text("previous_stage")) + " to " +
             quoted(r.current_stage.value_or(""));
    case EvaluationState::kScoping:
    case EvaluationState::kQualifying:
    case EvaluationState::kAdvancing:
      break;
  }
  return to_string(r.state);
}

}  // namespace

std::optional<std::string> reached_stage(const StatusResult& result) {
  if (result.current_stage) return result.current_stage;
  if (result.state == EvaluationState::kCompleted) {
    const auto it = result.metadata.find("final_stage");
    if (it != result.metadata.end() && it->second.is_string()) return it->second.as_string();
  }
  return std::nullopt;
}

StatusResult evaluation_failure(const std::string& element_id, const std::exception& fault) {
  const auto* err = dynamic_cast<const Error*>(&fault);
  StatusResult r = StatusResult::make(EvaluationState::kScoping, element_id, std::nullopt);
  r.errors.push_back("Evaluation error: " + (err ? err->message() : std::string(fault.what())));
  r.actions.push_back(make_action(ActionType::kManualReview, "Process evaluation failed", Priority::kCritical));
  return r;
}

// ----------------------------- Construction ----------------------------------
Process::Process(std::string name,
                 std::vector<Stage> stages,
                 std::vector<std::string> stage_order,
                 bool allow_stage_skipping,
                 bool regression_detection,
                 Value::Object metadata,
                 EngineSettings settings,
                 std::shared_ptr<ValidatorRegistry> registry)
    : name_(std::move(name)),
      allow_stage_skipping_(allow_stage_skipping),
      regression_detection_(regression_detection),
      metadata_(std::move(metadata)),
      settings_(settings),
      registry_(registry ? std::move(registry) : ValidatorRegistry::shared()),
      history_(std::make_unique<HistoryStore>()) {
  STAGEGATE_ENSURE(!name_.empty(), ErrorCode::kInvalidConfig, "Process name must be non-empty");
  STAGEGATE_ENSURE(!stages.empty(), ErrorCode::kInvalidConfig,
                   "Process " + quoted(name_) + " must have at least one stage");
  settings_.validate_or_throw();

  std::map<std::string, std::size_t, std::less<>> index_by_name;
  for (std::size_t i = 0; i < stages.size(); ++i) {
    if (!index_by_name.emplace(stages[i].name(), i).second) {
      STAGEGATE_THROW(ErrorCode::kInvalidConfig,
                      "Process " + quoted(name_) + " has duplicate stage name " + quoted(stages[i].name()));
    }
  }

  if (stage_order.empty()) {
    stages_ = std::move(stages);
  } else {
    std::vector<std::size_t> picks;
    std::vector<bool> used(stages.size(), false);
    for (const auto& n : stage_order) {
      const auto it = index_by_name.find(n);
      if (it == index_by_name.end()) {
        STAGEGATE_THROW(ErrorCode::kInvalidConfig, "Stage order references unknown stage " + quoted(n));
      }
      if (used[it->second]) {
        STAGEGATE_THROW(ErrorCode::kInvalidConfig, "Stage order lists " + quoted(n) + " more than once");
      }
      used[it->second] = true;
      picks.push_back(it->second);
    }
    for (std::size_t i = 0; i < stages.size(); ++i) {
      if (!used[i]) {
        STAGEGATE_THROW(ErrorCode::kInvalidConfig, "Stage order omits stage " + quoted(stages[i].name()));
      }
    }
    stages_.reserve(stages.size());
    for (std::size_t i : picks) stages_.push_back(std::move(stages[i]));
  }

  std::ostringstream oss;
  oss << "Process '" << name_ << "' built with " << stages_.size() << " stages";
  log(LogLevel::DEBUG, oss.str());
}

std::vector<std::string> Process::stage_order() const {
  std::vector<std::string> out;
  out.reserve(stages_.size());
  for (const auto& s : stages_) out.push_back(s.name());
  return out;
}

// ----------------------------- Stage lookup ----------------------------------
const Stage* Process::get_stage(std::string_view stage_name) const noexcept {
  for (const auto& s : stages_) {
    if (s.name() == stage_name) return &s;
  }
  return nullptr;
}

std::optional<std::size_t> Process::get_stage_index(std::string_view stage_name) const noexcept {
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (stages_[i].name() == stage_name) return i;
  }
  return std::nullopt;
}

std::optional<std::string> Process::get_next_stage_name(std::string_view stage_name) const {
  const auto idx = get_stage_index(stage_name);
  if (!idx || *idx + 1 >= stages_.size()) return std::nullopt;
  return stages_[*idx + 1].name();
}

const Stage* Process::next_stage(const Stage& stage) const noexcept {
  const auto idx = get_stage_index(stage.name());
  if (!idx || *idx + 1 >= stages_.size()) return nullptr;
  return &stages_[*idx + 1];
}

bool Process::can_transition(std::string_view from_stage, std::string_view to_stage) const noexcept {
  const auto from = get_stage_index(from_stage);
  const auto to = get_stage_index(to_stage);
  if (!from || !to) return false;
  if (allow_stage_skipping_) return *to > *from;
  return *to == *from + 1;
}

std::vector<std::string> Process::validate_stage_progression(const Element& element,
                                                             std::string_view from_stage,
                                                             std::string_view to_stage) const {
  std::vector<std::string> reasons;
  const std::string from(from_stage);
  const std::string to(to_stage);

  const Stage* target = get_stage(to);
  if (!get_stage(from)) reasons.push_back("Stage " + quoted(from) + " not found in process");
  if (!target) reasons.push_back("Stage " + quoted(to) + " not found in process");
  if (!reasons.empty()) return reasons;

  if (!can_transition(from, to)) {
    reasons.push_back("Direct transition from " + quoted(from) + " to " + quoted(to) + " not allowed");
  }
  if (!target->is_compatible_with_element(element)) {
    reasons.push_back("Element does not meet requirements for stage " + quoted(to));
  }
  return reasons;
}

const Stage* Process::scope(const Element& element) const {
  const Stage* best = nullptr;
  double best_completion = -1.0;
  std::size_t candidates = 0;

  for (const auto& s : stages_) {
    if (!s.is_compatible_with_element(element)) continue;
    ++candidates;
    const double c = s.evaluate(element, *registry_).completion_fraction;
    if (c > best_completion) {
      best = &s;
      best_completion = c;
    }
  }

  if (best) {
    std::ostringstream oss;
    oss << "Process '" << name_ << "': scoped to stage '" << best->name() << "' ("
        << candidates << " compatible, completion " << best_completion << ")";
    log(LogLevel::DEBUG, oss.str());
  }
  return best;
}

Value::Object Process::template_context(const Stage& stage, const std::string& element_id) const {
  Value::Object ctx;
  ctx["process"] = Value(name_);
  ctx["stage"] = Value(stage.name());
  ctx["element_id"] = Value(element_id);
  const auto next = get_next_stage_name(stage.name());
  ctx["next_stage"] = next ? Value(*next) : Value();
  return ctx;
}

// ----------------------------- State machine ---------------------------------
StatusResult Process::run(const Element& element,
                          const std::optional<std::string>& current_stage,
                          const std::string& element_id,
                          std::vector<StateTransition>* hops) const {
  const Stage* stage = nullptr;

  if (current_stage) {
    stage = get_stage(*current_stage);
    if (!stage) {
      StatusResult r = StatusResult::make(EvaluationState::kScoping, element_id, std::nullopt);
      r.errors.push_back("Stage " + quoted(*current_stage) + " not found in process");
      r.actions.push_back(make_action(ActionType::kManualReview,
                                      "Invalid current stage: " + *current_stage, Priority::kHigh));
      return r;
    }
  } else {
    stage = scope(element);
    if (!stage) {
      StatusResult r = StatusResult::make(EvaluationState::kScoping, element_id, std::nullopt);
      r.errors.push_back("Element lacks required properties for any stage");
      r.actions.push_back(make_action(ActionType::kCompleteField,
                                      "Ensure element has required properties for at least one stage",
                                      Priority::kHigh));
      Value::Object missing;
      for (const auto& s : stages_) {
        if (s.schema()) missing[s.name()] = string_array(s.schema()->missing_required(element));
      }
      r.metadata["missing_by_stage"] = Value(std::move(missing));
      return r;
    }
  }

  const std::size_t bound =
      settings_.process.max_stage_walk > 0 ? settings_.process.max_stage_walk : stages_.size();
  Value::Array walked;

  for (std::size_t hop = 0;; ++hop) {
    walked.emplace_back(stage->name());
    const StageResult sr = stage->evaluate(element, *registry_);
    Value::Object ctx = template_context(*stage, element_id);
    ctx["completion"] = Value(sr.completion_fraction);

    if (!sr.overall_passed) {
      StatusResult r = StatusResult::make(EvaluationState::kFulfilling, element_id, stage->name());
      r.actions = stage->resolve_actions_for_state(EvaluationState::kFulfilling, element, ctx);
      if (r.actions.empty()) {
        for (const auto& a : sr.actions) r.actions.push_back(make_action(ActionType::kCompleteField, a, Priority::kNormal));
        for (const auto& e : sr.schema_errors) {
          r.actions.push_back(make_action(ActionType::kValidateData, e, Priority::kNormal));
        }
      }
      r.metadata["completion"] = Value(sr.completion_fraction);
      r.metadata["failed_gates"] = string_array(sr.failed_gate_names());
      r.metadata["schema_valid"] = Value(sr.schema_valid);
      r.metadata["walked_stages"] = Value(std::move(walked));
      return r;
    }

    const Stage* next = next_stage(*stage);
    if (!next) {
      StatusResult r = StatusResult::make(EvaluationState::kCompleted, element_id, std::nullopt);
      r.actions = stage->resolve_actions_for_state(EvaluationState::kCompleted, element, ctx);
      if (r.actions.empty()) {
        r.actions.push_back(make_action(ActionType::kTransitionStage, "Process completed successfully",
                                        Priority::kNormal));
      }
      r.metadata["final_stage"] = Value(stage->name());
      r.metadata["walked_stages"] = Value(std::move(walked));
      return r;
    }

    const auto reasons = validate_stage_progression(element, stage->name(), next->name());
    if (!reasons.empty()) {
      StatusResult r = StatusResult::make(EvaluationState::kAwaiting, element_id, stage->name());
      r.actions = stage->resolve_actions_for_state(EvaluationState::kAwaiting, element, ctx);
      if (r.actions.empty()) {
        for (const auto& why : reasons) {
          r.actions.push_back(make_action(ActionType::kWaitForCondition, why, Priority::kNormal));
        }
      }
      r.metadata["next_stage"] = Value(next->name());
      r.metadata["unmet_conditions"] = string_array(reasons);
      r.metadata["walked_stages"] = Value(std::move(walked));
      return r;
    }

    if (hop >= bound) {
      std::ostringstream oss;
      oss << "Stage walk exceeded " << bound << " hops at stage '" << stage->name() << "'";
      StatusResult r = StatusResult::make(EvaluationState::kScoping, element_id, stage->name());
      r.errors.push_back(oss.str());
      r.actions.push_back(make_action(ActionType::kManualReview, "Process evaluation failed", Priority::kCritical));
      r.metadata["walked_stages"] = Value(std::move(walked));
      return r;
    }

    StateTransition t;
    t.to_state = EvaluationState::kAdvancing;
    t.element_id = element_id;
    t.stage = next->name();
    t.reason = "Advanced from stage " + quoted(stage->name()) + " to " + quoted(next->name());
    t.metadata["from_stage"] = Value(stage->name());
    t.metadata["to_stage"] = Value(next->name());
    const auto advancing = stage->resolve_actions_for_state(EvaluationState::kAdvancing, element, ctx);
    if (!advancing.empty()) {
      Value::Array acts;
      for (const auto& a : advancing) acts.push_back(a.to_value());
      t.metadata["actions"] = Value(std::move(acts));
    }
    hops->push_back(std::move(t));

    log(LogLevel::DEBUG, "Process '" + name_ + "': element '" + element_id + "' advanced from '" +
                             stage->name() + "' to '" + next->name() + "'");
    stage = next;
  }
}

StatusResult Process::run_guarded(const Element& element,
                                  const std::optional<std::string>& current_stage,
                                  std::string* element_id,
                                  std::vector<StateTransition>* hops) const {
  try {
    *element_id = element.stable_id();
    return run(element, current_stage, *element_id, hops);
  } catch (const std::exception& e) {
    hops->clear();
    log(LogLevel::ERROR, "Process '" + name_ + "': evaluation of '" + *element_id + "' failed: " + e.what());
    return evaluation_failure(*element_id, e);
  }
}

StatusResult Process::evaluate(const Element& element, const std::optional<std::string>& current_stage) {
  std::string element_id;
  std::vector<StateTransition> hops;
  StatusResult result = run_guarded(element, current_stage, &element_id, &hops);

  if (regression_detection_ && !result.has_errors()) {
    const auto before = furthest_recorded_stage(element_id);
    const auto now = reached_stage(result);
    if (before && now) {
      const auto bi = get_stage_index(*before);
      const auto ni = get_stage_index(*now);
      if (bi && ni && *bi > *ni) {
        result.warnings.push_back("Element regressed from stage " + quoted(*before) + " to " + quoted(*now));
      }
    }
  }

  record(element_id, result, std::move(hops));
  return result;
}

std::vector<StatusResult> Process::evaluate_batch(const std::vector<Element>& elements) {
  std::vector<StatusResult> out;
  out.reserve(elements.size());
  for (const auto& e : elements) out.push_back(evaluate(e));
  return out;
}

RegressionReport Process::check_regression(const Element& element,
                                           const std::optional<std::string>& current_stage) {
  std::string element_id;
  std::vector<StateTransition> hops;
  StatusResult base = run_guarded(element, current_stage, &element_id, &hops);

  RegressionReport rep;
  rep.previous_stage = furthest_recorded_stage(element_id);
  rep.current_stage = reached_stage(base);
  if (!base.has_errors() && rep.previous_stage && rep.current_stage) {
    const auto pi = get_stage_index(*rep.previous_stage);
    const auto ci = get_stage_index(*rep.current_stage);
    rep.regressed = pi && ci && *pi > *ci;
  }

  if (!rep.regressed) {
    record(element_id, base, std::move(hops));
    rep.status = std::move(base);
    return rep;
  }

  const Stage* stage = get_stage(*rep.current_stage);
  const std::string warning =
      "Element regressed from stage " + quoted(*rep.previous_stage) + " to " + quoted(*rep.current_stage);

  StatusResult r = StatusResult::make(EvaluationState::kRegressing, element_id, rep.current_stage,
                                      rep.current_stage);
  Value::Object ctx = template_context(*stage, element_id);
  ctx["previous_stage"] = Value(*rep.previous_stage);
  r.actions = stage->resolve_actions_for_state(EvaluationState::kRegressing, element, ctx);
  if (r.actions.empty()) {
    r.actions.push_back(make_action(ActionType::kManualReview,
                                    "Review regression from stage " + quoted(*rep.previous_stage) + " to " +
                                        quoted(*rep.current_stage),
                                    Priority::kHigh));
  }
  r.actions.insert(r.actions.end(), base.actions.begin(), base.actions.end());
  r.warnings = base.warnings;
  r.warnings.push_back(warning);
  r.metadata = base.metadata;
  r.metadata["previous_stage"] = Value(*rep.previous_stage);
  r.metadata["evaluated_state"] = Value(to_string(base.state));

  log(LogLevel::WARN, "Process '" + name_ + "': " + warning + " (element '" + element_id + "')");
  record(element_id, r, std::move(hops));
  rep.status = std::move(r);
  return rep;
}

// ----------------------------- History ---------------------------------------
std::optional<std::string> Process::furthest_recorded_stage(const std::string& element_id) const {
  std::lock_guard<std::mutex> lock(history_->mu);
  const auto it = history_->by_element.find(element_id);
  if (it == history_->by_element.end()) return std::nullopt;

  std::optional<std::size_t> best;
  for (const auto& t : it->second.transitions()) {
    if (!t.stage) continue;
    const auto idx = get_stage_index(*t.stage);
    if (idx && (!best || *idx > *best)) best = idx;
  }
  if (!best) return std::nullopt;
  return stages_[*best].name();
}

void Process::record(const std::string& element_id,
                     const StatusResult& result,
                     std::vector<StateTransition> hops) {
  if (!settings_.process.record_history || element_id.empty()) return;

  try {
    StateTransition last;
    last.timestamp = result.timestamp;
    last.to_state = result.state;
    last.element_id = element_id;
    last.stage = reached_stage(result);
    last.reason = transition_reason(result);
    last.metadata["action_count"] = Value(result.actions.size());

    const std::size_t keep = settings_.process.max_history_per_element;
    std::lock_guard<std::mutex> lock(history_->mu);
    auto it = history_->by_element.find(element_id);
    if (it == history_->by_element.end()) {
      it = history_->by_element.emplace(element_id, ElementStateHistory(element_id)).first;
    }
    ElementStateHistory& h = it->second;
    h.record_evaluation();

    std::optional<EvaluationState> prev = h.current_state();
    for (auto& t : hops) {
      t.from_state = prev;
      prev = t.to_state;
      h.add_transition(std::move(t), keep);
    }
    last.from_state = prev;
    h.add_transition(std::move(last), keep);
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, "Process '" + name_ + "': history not recorded for '" + element_id + "': " + e.what());
  }
}

std::optional<ElementStateHistory> Process::get_history(std::string_view element_id) const {
  std::lock_guard<std::mutex> lock(history_->mu);
  const auto it = history_->by_element.find(element_id);
  if (it == history_->by_element.end()) return std::nullopt;
  return it->second;
}

std::size_t Process::history_size() const {
  std::lock_guard<std::mutex> lock(history_->mu);
  return history_->by_element.size();
}

void Process::clear_history() {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(history_->mu);
    dropped = history_->by_element.size();
    history_->by_element.clear();
  }
  log(LogLevel::INFO, "Process '" + name_ + "': cleared history of " + std::to_string(dropped) + " elements");
}

bool Process::clear_history(std::string_view element_id) {
  bool erased = false;
  {
    std::lock_guard<std::mutex> lock(history_->mu);
    const auto it = history_->by_element.find(element_id);
    if (it != history_->by_element.end()) {
      history_->by_element.erase(it);
      erased = true;
    }
  }
  if (erased) log(LogLevel::INFO, "Process '" + name_ + "': cleared history of '" + std::string(element_id) + "'");
  return erased;
}

// ----------------------------- Introspection ---------------------------------
std::vector<std::string> Process::get_all_required_properties() const {
  std::set<std::string> props;
  for (const auto& s : stages_) {
    for (auto& p : s.get_required_properties()) props.insert(std::move(p));
  }
  return std::vector<std::string>(props.begin(), props.end());
}

std::vector<std::string> Process::validate_structure() const {
  std::vector<std::string> warnings;
  for (const auto& s : stages_) {
    for (auto& w : s.validate_structure(settings_.gate)) warnings.push_back(std::move(w));
    for (const auto& g : s.gates()) {
      if (g.target_stage() && !get_stage(*g.target_stage())) {
        warnings.push_back("Gate " + quoted(g.name()) + " in stage " + quoted(s.name()) +
                           " targets unknown stage " + quoted(*g.target_stage()));
      }
    }
  }
  return warnings;
}

Value Process::summary() const {
  Value::Object o;
  o["name"] = Value(name_);
  o["stage_count"] = Value(stages_.size());
  o["stages"] = string_array(stage_order());
  o["allow_stage_skipping"] = Value(allow_stage_skipping_);
  o["regression_detection"] = Value(regression_detection_);
  o["required_properties"] = string_array(get_all_required_properties());
  o["tracked_elements"] = Value(history_size());
  o["metadata"] = Value(metadata_);
  return Value(std::move(o));
}

}  // namespace stagegate
