#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "stagegate/element/element.hpp"
#include "stagegate/element/value.hpp"

namespace stagegate {

// The 7 workflow states an evaluation can report.
enum class EvaluationState : std::uint8_t {
  kScoping = 0,
  kFulfilling,
  kQualifying,
  kAwaiting,
  kAdvancing,
  kRegressing,
  kCompleted,
};

const char* to_string(EvaluationState s) noexcept;  // "scoping", ...
bool try_parse_evaluation_state(std::string_view name, EvaluationState* out) noexcept;

// Ordering used by history: higher = further along. Regressing is negative.
double state_rank(EvaluationState s) noexcept;

enum class ActionType : std::uint8_t {
  kCompleteField = 0,
  kValidateData,
  kWaitForCondition,
  kTransitionStage,
  kManualReview,
};

const char* to_string(ActionType t) noexcept;  // "complete_field", ...
bool try_parse_action_type(std::string_view name, ActionType* out) noexcept;

enum class Priority : std::uint8_t { kLow = 0, kNormal, kHigh, kCritical };

const char* to_string(Priority p) noexcept;  // "low", ...
bool try_parse_priority(std::string_view name, Priority* out) noexcept;

struct Action final {
  ActionType type = ActionType::kCompleteField;
  std::string description;
  Priority priority = Priority::kNormal;
  std::vector<std::string> conditions;
  Value::Object metadata;

  Value to_value() const;
};

/// Stage-declared action with `{var}` placeholders.
///
/// Placeholder lookup order:
///   1. template_vars binding (var -> property path); unresolvable path -> ""
///   2. caller context entry with that name
///   3. the placeholder text itself as a property path of the element
///   4. left verbatim
struct ActionTemplate final {
  ActionType type = ActionType::kCompleteField;
  std::string description;
  Priority priority = Priority::kNormal;
  std::vector<std::string> conditions;
  std::map<std::string, std::string> template_vars;
  Value::Object metadata;

  Action resolve(const Element& element, const Value::Object& context) const;
};

// Never throws on malformed braces; unmatched '{' is copied through.
std::string render_template(std::string_view text,
                            const std::map<std::string, std::string>& bindings,
                            const Element& element,
                            const Value::Object& context);

}  // namespace stagegate
