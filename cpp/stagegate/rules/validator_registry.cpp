#include "stagegate/rules/validator_registry.hpp"

#include <utility>

#include "stagegate/core/error.hpp"
#include "stagegate/core/logging.hpp"

namespace stagegate {

const std::shared_ptr<ValidatorRegistry>& ValidatorRegistry::shared() {
  static const std::shared_ptr<ValidatorRegistry> instance = std::make_shared<ValidatorRegistry>();
  return instance;
}

void ValidatorRegistry::register_validator(std::string name, ValidatorFn fn) {
  STAGEGATE_ENSURE(!name.empty(), ErrorCode::kInvalidArgument, "ValidatorRegistry: validator name empty");
  STAGEGATE_ENSURE(static_cast<bool>(fn), ErrorCode::kInvalidArgument,
                   "ValidatorRegistry: validator '" + name + "' has no callable");

  std::lock_guard<std::mutex> lk(mu_);
  const bool replaced = validators_.find(name) != validators_.end();
  if (replaced) log(LogLevel::DEBUG, "ValidatorRegistry: replacing validator '" + name + "'");
  validators_[std::move(name)] = std::move(fn);
}

ValidatorFn ValidatorRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = validators_.find(name);
  return (it == validators_.end()) ? ValidatorFn{} : it->second;
}

bool ValidatorRegistry::contains(std::string_view name) const {
  std::lock_guard<std::mutex> lk(mu_);
  return validators_.find(name) != validators_.end();
}

std::vector<std::string> ValidatorRegistry::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  out.reserve(validators_.size());
  for (const auto& kv : validators_) out.push_back(kv.first);
  return out;
}

bool ValidatorRegistry::unregister(std::string_view name) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = validators_.find(name);
  if (it == validators_.end()) return false;
  validators_.erase(it);
  return true;
}

void ValidatorRegistry::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  validators_.clear();
}

std::size_t ValidatorRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return validators_.size();
}

}  // namespace stagegate
