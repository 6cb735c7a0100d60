#pragma once
/*
================================================================================
Fragment 3.2 — Rules: Gate (short-circuit AND over Locks and nested Gates)
FILE: cpp/stagegate/rules/gate.hpp

Purpose:
  - Compose Locks and Gates into a tree evaluated in declaration order.
  - Report per-component outcomes plus concatenated messages/actions.

Semantics:
  - All components pass => gate passes; first failure stops evaluation.
  - short_circuited == (evaluated_count < total_components).
  - Legacy operator tags (OR, NOT, ...) are recorded in metadata["logic"]
    and never change the AND semantics.

Hardening:
  - Nested gates are shared immutable values (shared_ptr<const Gate>). A gate
    must exist before it can be nested, so cycles cannot be expressed.
  - Empty name / no components / null nested gate => kInvalidConfig.
================================================================================
*/

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "stagegate/core/settings.hpp"
#include "stagegate/element/element.hpp"
#include "stagegate/rules/lock.hpp"

namespace stagegate {

class Gate;
struct GateResult;

using GatePtr = std::shared_ptr<const Gate>;
using GateComponent = std::variant<Lock, GatePtr>;

struct ComponentOutcome final {
  std::string label;  // Lock::describe() or nested gate name
  bool is_gate = false;
  bool passed = false;

  LockResult lock;                         // when !is_gate
  std::shared_ptr<const GateResult> gate;  // when is_gate
};

struct GateResult final {
  std::string gate_name;
  bool passed = false;

  std::vector<ComponentOutcome> passed_components;
  std::vector<ComponentOutcome> failed_components;

  std::vector<std::string> messages;
  std::vector<std::string> actions;

  bool short_circuited = false;
  std::size_t evaluated_count = 0;
  std::size_t total_components = 0;
};

class Gate final {
 public:
  Gate(std::string name,
       std::vector<GateComponent> components,
       std::optional<std::string> target_stage = std::nullopt,
       Value::Object metadata = Value::Object{},
       std::string logic = "AND");

  static Gate AND(std::string name, std::vector<GateComponent> components);

  // Convenience for nesting.
  static GatePtr share(Gate g) { return std::make_shared<const Gate>(std::move(g)); }

  const std::string& name() const noexcept { return name_; }
  const std::vector<GateComponent>& components() const noexcept { return components_; }
  const std::optional<std::string>& target_stage() const noexcept { return target_stage_; }
  const Value::Object& metadata() const noexcept { return metadata_; }

  // "AND" unless a legacy tag was supplied.
  std::string logic() const;

  GateResult evaluate(const Element& element, const ValidatorRegistry& registry) const;
  GateResult evaluate(const Element& element) const;

  // Recursive union, sorted, unique.
  std::vector<std::string> get_property_paths() const;
  bool requires_property(std::string_view path) const;

  // Recursive leaf-lock count.
  std::size_t get_complexity() const;

  // A gate holding only locks has depth 1.
  std::size_t max_depth() const;

  // Advisory, never throws on a built gate.
  std::vector<std::string> validate_structure(const GateLimits& limits = GateLimits{}) const;

  // Logical conflicts between this gate's locks and other's.
  std::vector<std::string> conflicts_with(const Gate& other) const;

  // Every lock in the tree, depth-first in declaration order.
  std::vector<const Lock*> all_locks() const;

  std::string summary() const;

 private:
  std::string name_;
  std::vector<GateComponent> components_;
  std::optional<std::string> target_stage_;
  Value::Object metadata_;
};

}  // namespace stagegate
