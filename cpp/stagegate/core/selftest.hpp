#pragma once
/*
  Framework-free selftest helpers shared by the stagegate *_selftest programs.

  Each selftest is a tiny executable:
    - prints "[ OK ]" / "[FAIL]" per expectation on stderr
    - returns non-zero from main() when any expectation failed
  No Catch2/GoogleTest dependency.
*/

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>

#include "stagegate/core/error.hpp"

namespace stagegate::selftest {

inline int& fail_count() {
  static int g_fail_count = 0;
  return g_fail_count;
}

inline void fail(std::string_view msg) {
  ++fail_count();
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_false(bool v, std::string_view msg) {
  expect_true(!v, msg);
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_int(int64_t a, int64_t b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_near(double a, double b, double tol, std::string_view msg) {
  const double d = a > b ? a - b : b - a;
  if (!(d <= tol)) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_contains(const std::string& haystack, std::string_view needle, std::string_view msg) {
  if (haystack.find(needle) == std::string::npos) {
    fail(msg);
    std::cerr << "  text: " << haystack << "\n";
    std::cerr << "  missing: " << needle << "\n";
  } else {
    pass(msg);
  }
}

// Expects fn() to throw stagegate::Error carrying `code`.
inline void expect_error(const std::function<void()>& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception thrown\n";
}

inline int finish() {
  if (fail_count() != 0) {
    std::cerr << "\nSelftest failures: " << fail_count() << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

}  // namespace stagegate::selftest
