#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "stagegate/element/value.hpp"

namespace stagegate {

// Custom lock predicate: (resolved value, lock expected_value) -> pass?
using ValidatorFn = std::function<bool(const Value& value, const Value& expected)>;

/// Named custom predicates consulted by CUSTOM locks.
///
/// A Process evaluates against one registry for its whole lifetime; by
/// default that is the process-wide shared() instance, tests inject their
/// own to stay isolated. Registration may happen before or after locks are
/// built; only the state at evaluation time matters. Last write wins.
class ValidatorRegistry final {
 public:
  ValidatorRegistry() = default;
  ValidatorRegistry(const ValidatorRegistry&) = delete;
  ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;

  // Process-wide instance.
  static const std::shared_ptr<ValidatorRegistry>& shared();

  // Throws Error(kInvalidArgument) on an empty name or empty function.
  // Overwrites an existing entry.
  void register_validator(std::string name, ValidatorFn fn);

  // Copy of the predicate, empty when unregistered. Call it without
  // holding any registry state.
  ValidatorFn find(std::string_view name) const;

  bool contains(std::string_view name) const;

  // Registered names, sorted.
  std::vector<std::string> list() const;

  bool unregister(std::string_view name);
  void clear();
  std::size_t size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, ValidatorFn, std::less<>> validators_;
};

}  // namespace stagegate
