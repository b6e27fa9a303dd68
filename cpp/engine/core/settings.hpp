#pragma once
/*
================================================================================
Core: Engine Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize numerical tolerances and evaluation policy into validated
    objects so every System, Block and Model is configured the same way.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Explicit units and conservative defaults.
  - Separate "convergence numerics" from "campaign policy".
================================================================================
*/

#include <cstdint>
#include <string>

#include "engine/core/errors.hpp"

namespace procsim {

// ----------------------------- Acceleration ----------------------------------
// Update rule applied to the recycle guess between iterations.
enum class ConvergenceMethod : int {
  FixedPoint = 0,  // direct substitution, optionally damped
  Wegstein   = 1,  // bounded per-component secant
  Aitken     = 2   // delta-squared extrapolation of successive substitutions
};

inline const char* to_string(ConvergenceMethod m) noexcept {
  switch (m) {
    case ConvergenceMethod::FixedPoint: return "fixed-point";
    case ConvergenceMethod::Wegstein:   return "wegstein";
    case ConvergenceMethod::Aitken:     return "aitken";
    default:                            return "unknown";
  }
}

// ----------------------------- Convergence -----------------------------------
struct ConvergenceSettings {
  // Relative error on total and per-component recycle flow.
  double relative_flow_tolerance = 1e-3;

  // Absolute error on per-component recycle flow (kg/h). Either flow test
  // passing is enough.
  double flow_tolerance = 1e-6;

  // Absolute error on recycle temperature (K).
  double temperature_tolerance = 0.1;

  // Hard ceiling on recycle iterations.
  int max_iterations = 100;

  ConvergenceMethod relaxation_method = ConvergenceMethod::FixedPoint;

  // Damping for FixedPoint: x' = (1-w) x + w g(x). 1.0 = plain substitution.
  double relaxation_factor = 1.0;

  // Wegstein acceleration factor q is clamped to [lower, upper].
  double wegstein_lower_bound = -5.0;
  double wegstein_upper_bound = 0.0;

  // Wall-clock budget per converge() call in seconds; 0 disables.
  double time_limit_s = 0.0;

  void validate_or_throw() const {
    if (!(relative_flow_tolerance > 0.0) || relative_flow_tolerance >= 1.0) {
      throw ValidationError("ConvergenceSettings: relative_flow_tolerance must be in (0,1)");
    }
    if (!(flow_tolerance >= 0.0)) {
      throw ValidationError("ConvergenceSettings: flow_tolerance must be >= 0");
    }
    if (!(temperature_tolerance > 0.0) || temperature_tolerance > 100.0) {
      throw ValidationError("ConvergenceSettings: temperature_tolerance outside sane bounds");
    }
    if (max_iterations < 1 || max_iterations > 1000000) {
      throw ValidationError("ConvergenceSettings: max_iterations outside sane bounds");
    }
    if (!(relaxation_factor > 0.0) || relaxation_factor > 1.0) {
      throw ValidationError("ConvergenceSettings: relaxation_factor must be (0,1]");
    }
    if (!(wegstein_lower_bound < wegstein_upper_bound) || wegstein_upper_bound >= 1.0) {
      throw ValidationError("ConvergenceSettings: wegstein bounds must satisfy lower < upper < 1");
    }
    if (!(time_limit_s >= 0.0)) {
      throw ValidationError("ConvergenceSettings: time_limit_s must be >= 0");
    }
  }
};

// ----------------------------- Model -----------------------------------------
struct ModelSettings {
  // Only re-apply parameters whose value differs from the previous sample.
  bool skip_unchanged_parameters = true;

  // After a failed sample, empty every recycle so the next sample cold starts.
  bool reset_recycles_on_failure = true;

  void validate_or_throw() const {}
};

// ----------------------------- EngineSettings --------------------------------
struct EngineSettings {
  ConvergenceSettings convergence;
  ModelSettings model;

  void validate_or_throw() const {
    convergence.validate_or_throw();
    model.validate_or_throw();
  }

  static EngineSettings defaults() {
    EngineSettings s;
    return s;
  }
};

}  // namespace procsim
