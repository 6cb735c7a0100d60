#include "stagegate/core/pattern.hpp"

#include <utility>

namespace stagegate {

std::shared_ptr<const AnchoredPattern> AnchoredPattern::compile(const std::string& pattern,
                                                                std::size_t max_subject_length,
                                                                std::string* error) {
  try {
    std::regex re(pattern, std::regex::ECMAScript);
    return std::shared_ptr<const AnchoredPattern>(
        new AnchoredPattern(pattern, std::move(re), max_subject_length));
  } catch (const std::regex_error& e) {
    if (error) *error = e.what();
    return nullptr;
  }
}

PatternMatch AnchoredPattern::match(std::string_view subject) const {
  if (subject.size() > max_subject_) return PatternMatch::kSubjectTooLong;
  // error_complexity / error_stack are the engine's own give-up signals.
  try {
    return std::regex_search(subject.begin(), subject.end(), re_, std::regex_constants::match_continuous)
               ? PatternMatch::kMatched
               : PatternMatch::kNotMatched;
  } catch (const std::regex_error&) {
    return PatternMatch::kNotMatched;
  }
}

}  // namespace stagegate
