#pragma once
/*
================================================================================
Fragment 1.6 — Core: Bounded Pattern Matching
FILE: cpp/stagegate/core/pattern.hpp

Purpose:
  - One compiled ECMAScript pattern, matched at the start of a subject.
  - Shared by Lock (REGEX) and Schema (FieldRule::pattern).

Hardening:
  - std::regex backtracks recursively; a long enough subject exhausts the
    stack instead of throwing. Subjects longer than max_subject_length are
    never handed to the engine and report kSubjectTooLong.
================================================================================
*/

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace stagegate {

enum class PatternMatch { kMatched, kNotMatched, kSubjectTooLong };

class AnchoredPattern final {
 public:
  // nullptr (and *error filled) when the pattern does not compile.
  static std::shared_ptr<const AnchoredPattern> compile(const std::string& pattern,
                                                        std::size_t max_subject_length,
                                                        std::string* error);

  const std::string& source() const noexcept { return source_; }
  std::size_t max_subject_length() const noexcept { return max_subject_; }

  PatternMatch match(std::string_view subject) const;

 private:
  AnchoredPattern(std::string source, std::regex re, std::size_t max_subject)
      : source_(std::move(source)), re_(std::move(re)), max_subject_(max_subject) {}

  std::string source_;
  std::regex re_;
  std::size_t max_subject_;
};

}  // namespace stagegate
