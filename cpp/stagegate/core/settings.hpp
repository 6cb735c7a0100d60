#pragma once
/*
================================================================================
Fragment 1.4 — Core: Engine Settings
FILE: cpp/stagegate/core/settings.hpp

Purpose:
  - Collect the few tunable knobs of the evaluator in one validated object:
      * advisory thresholds for gate structure warnings
      * subject length cap for REGEX locks and schema patterns
      * history recording policy of a Process
      * log verbosity
  - Apart from the pattern cap, nothing here changes pass/fail semantics;
    it only shapes warnings, retention and diagnostics.

Hardening:
  - validate_or_throw() rejects nonsensical values before a Process is built.
  - Conservative defaults; 0 means "unbounded" / "derive from stage count".
================================================================================
*/

#include <cstddef>

#include "stagegate/core/error.hpp"
#include "stagegate/core/logging.hpp"

namespace stagegate {

// ----------------------------- Gate structure --------------------------------
struct GateLimits {
  // Nesting depth above which Gate::validate_structure warns.
  int max_recommended_depth = 5;

  // Leaf-lock count above which Gate::validate_structure warns.
  int max_recommended_complexity = 20;

  void validate_or_throw() const {
    STAGEGATE_ENSURE(max_recommended_depth >= 1 && max_recommended_depth <= 64,
                     ErrorCode::kInvalidConfig,
                     "GateLimits: max_recommended_depth outside sane bounds");
    STAGEGATE_ENSURE(max_recommended_complexity >= 1 && max_recommended_complexity <= 10000,
                     ErrorCode::kInvalidConfig,
                     "GateLimits: max_recommended_complexity outside sane bounds");
  }
};

// ----------------------------- Patterns --------------------------------------
struct PatternLimits {
  // Longest string (bytes) a REGEX lock or schema pattern will examine.
  // Longer subjects fail closed with a WARN.
  std::size_t max_subject_length = 4096;

  void validate_or_throw() const {
    STAGEGATE_ENSURE(max_subject_length >= 1 && max_subject_length <= 16384,
                     ErrorCode::kInvalidConfig,
                     "PatternLimits: max_subject_length outside sane bounds");
  }
};

// ----------------------------- Process ---------------------------------------
struct ProcessSettings {
  // Append every evaluation outcome to the per-element history.
  bool record_history = true;

  // Keep at most this many transitions per element (oldest dropped). 0 = unbounded.
  std::size_t max_history_per_element = 0;

  // Upper bound on stage hops in one evaluate() call. 0 = number of stages.
  std::size_t max_stage_walk = 0;

  void validate_or_throw() const {
    STAGEGATE_ENSURE(max_history_per_element <= 1000000,
                     ErrorCode::kInvalidConfig,
                     "ProcessSettings: max_history_per_element outside sane bounds");
    STAGEGATE_ENSURE(max_stage_walk <= 100000,
                     ErrorCode::kInvalidConfig,
                     "ProcessSettings: max_stage_walk outside sane bounds");
  }
};

// ----------------------------- Aggregate -------------------------------------
struct EngineSettings {
  GateLimits gate{};
  PatternLimits pattern{};
  ProcessSettings process{};
  LogLevel log_level = LogLevel::INFO;

  static EngineSettings defaults() { return EngineSettings{}; }

  void validate_or_throw() const {
    gate.validate_or_throw();
    pattern.validate_or_throw();
    process.validate_or_throw();
  }

  // Pushes log_level into the global logger.
  void apply_log_level() const noexcept { set_log_level(log_level); }
};

}  // namespace stagegate
