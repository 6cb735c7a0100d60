#include "stagegate/process/status_result.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "stagegate/element/value_json.hpp"

namespace stagegate {
namespace {

Value optional_text(const std::optional<std::string>& s) {
  return s ? Value(*s) : Value();
}

Value string_array(const std::vector<std::string>& items) {
  Value::Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return Value(std::move(out));
}

std::string capitalized(const char* s) {
  std::string out(s);
  if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  return out;
}

}  // namespace

StatusResult StatusResult::make(EvaluationState state,
                                std::string element_id,
                                std::optional<std::string> current_stage,
                                std::optional<std::string> proposed_stage) {
  StatusResult r;
  r.state = state;
  r.element_id = std::move(element_id);
  r.current_stage = std::move(current_stage);
  r.proposed_stage = std::move(proposed_stage);

  const bool defaults_to_current = state == EvaluationState::kFulfilling ||
                                   state == EvaluationState::kQualifying ||
                                   state == EvaluationState::kAwaiting;
  if (!r.proposed_stage && defaults_to_current) r.proposed_stage = r.current_stage;
  return r;
}

std::string StatusResult::summary() const {
  std::ostringstream oss;
  if (has_errors()) {
    oss << "Error in " << to_string(state) << ": ";
    for (std::size_t i = 0; i < errors.size(); ++i) {
      if (i) oss << "; ";
      oss << errors[i];
    }
    return oss.str();
  }

  oss << capitalized(to_string(state));
  if (current_stage) oss << " (stage: " << *current_stage << ")";
  oss << " - " << actions.size() << " action(s)";
  return oss.str();
}

Value StatusResult::to_value(bool include_timestamp) const {
  Value::Array acts;
  acts.reserve(actions.size());
  for (const auto& a : actions) acts.push_back(a.to_value());

  Value::Object o;
  o["state"] = Value(to_string(state));
  o["element_id"] = Value(element_id);
  o["current_stage"] = optional_text(current_stage);
  o["proposed_stage"] = optional_text(proposed_stage);
  o["actions"] = Value(std::move(acts));
  o["errors"] = string_array(errors);
  o["warnings"] = string_array(warnings);
  o["metadata"] = Value(metadata);
  if (include_timestamp) o["timestamp"] = Value(format_utc_timestamp(timestamp));
  return Value(std::move(o));
}

std::string StatusResult::to_json(const StatusJsonOptions& opt) const {
  JsonWriteOptions w;
  w.pretty = opt.pretty;
  return value_to_json(to_value(opt.include_timestamp), w);
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  const std::time_t tt = system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "."
      << std::setw(3) << std::setfill('0') << (ms.count() < 0 ? ms.count() + 1000 : ms.count()) << "Z";
  return oss.str();
}

}  // namespace stagegate
