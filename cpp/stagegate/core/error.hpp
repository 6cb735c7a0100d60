#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace stagegate {

enum class ErrorCode : int {
  kInvalidArgument = 1,
  kInvalidConfig   = 2,
  kOutOfRange      = 3,
  kParseError      = 4,
  kInvariant       = 5,
  kInternal        = 6,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "invalid_argument";
    case ErrorCode::kInvalidConfig:   return "invalid_config";
    case ErrorCode::kOutOfRange:      return "out_of_range";
    case ErrorCode::kParseError:      return "parse_error";
    case ErrorCode::kInvariant:       return "invariant";
    case ErrorCode::kInternal:        return "internal";
  }
  return "unknown";
}

// Where a STAGEGATE_THROW / STAGEGATE_ENSURE fired.
struct ThrowSite {
  std::string file;
  std::string function;
  int line = 0;
};

// Single exception type for every stagegate component.
// Construction of Locks/Gates/Schemas/Stages/Processes throws kInvalidConfig;
// evaluation never lets one of these escape Process::evaluate.
class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ThrowSite site)
      : std::runtime_error(render(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(std::move(site)) {}

  ErrorCode code() const noexcept { return code_; }

  // Message without the code/site decoration added to what().
  const std::string& message() const noexcept { return message_; }
  const ThrowSite& site() const noexcept { return site_; }

  // Same code and site, message prefixed with "<context>: ".
  // Builders use this to name the stage/gate/component a config error came from.
  Error prefixed(const std::string& context) const {
    return Error(code_, context + ": " + message_, site_);
  }

 private:
  static std::string render(ErrorCode code, const std::string& msg, const ThrowSite& site) {
    std::string out = "stagegate ";
    out += to_string(code);
    out += ": ";
    out += msg;
    if (!site.file.empty()) {
      out += " [" + site.file + ":" + std::to_string(site.line);
      if (!site.function.empty()) out += " in " + site.function;
      out += "]";
    }
    return out;
  }

  ErrorCode code_;
  std::string message_;
  ThrowSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message,
                                     const char* file, int line, const char* function) {
  throw Error(code, std::move(message), ThrowSite{file ? file : "", function ? function : "", line});
}

}  // namespace stagegate

#define STAGEGATE_THROW(CODE, MSG) ::stagegate::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)

// Message is only built on failure.
#define STAGEGATE_ENSURE(EXPR, CODE, MSG)                                          \
  do {                                                                             \
    if (!(EXPR)) ::stagegate::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__); \
  } while (0)
