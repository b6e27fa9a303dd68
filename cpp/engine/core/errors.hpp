#pragma once
/*
================================================================================
Core: Error Types (Engine-Wide)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Provide uniform exception types so validation and runtime failures are:
      * searchable
      * catchable by category
      * reportable per Monte Carlo sample

Taxonomy:
  ProcsimError
    ValidationError        bad configuration / topology / sample shape
    SimulationError        raised while running units or converging systems
      InfeasibleStateError physically invalid balance result
      ConvergenceFailure   iteration budget exhausted
    ParameterBoundsError   parameter value outside its valid domain
    NumericalError
    IOError

Hardening:
  - Small, dependency-free exceptions.
  - Safe what() storage via std::string.
================================================================================
*/

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace procsim {

// Base error for the engine.
class ProcsimError : public std::runtime_error {
 public:
  explicit ProcsimError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public ProcsimError {
 public:
  explicit ValidationError(std::string msg) : ProcsimError(std::move(msg)) {}
};

// Thrown by units and systems while simulating.
class SimulationError : public ProcsimError {
 public:
  explicit SimulationError(std::string msg) : ProcsimError(std::move(msg)) {}
};

// A unit produced a physically invalid state (negative flow, impossible split).
class InfeasibleStateError : public SimulationError {
 public:
  explicit InfeasibleStateError(std::string msg) : SimulationError(std::move(msg)) {}
};

// A recycle loop did not meet tolerance within its iteration budget.
class ConvergenceFailure : public SimulationError {
 public:
  ConvergenceFailure(std::string system_id,
                     std::size_t iterations,
                     double flow_error,
                     double temperature_error,
                     std::string msg)
      : SimulationError(std::move(msg)),
        system_id_(std::move(system_id)),
        iterations_(iterations),
        flow_error_(flow_error),
        temperature_error_(temperature_error) {}

  const std::string& system_id() const noexcept { return system_id_; }
  std::size_t iterations() const noexcept { return iterations_; }
  double flow_error() const noexcept { return flow_error_; }
  double temperature_error() const noexcept { return temperature_error_; }

 private:
  std::string system_id_;
  std::size_t iterations_;
  double flow_error_;
  double temperature_error_;
};

// A parameter setter was handed a value outside the attribute's valid domain.
class ParameterBoundsError : public ProcsimError {
 public:
  ParameterBoundsError(std::string parameter, double value, std::string msg)
      : ProcsimError(std::move(msg)), parameter_(std::move(parameter)), value_(value) {}

  const std::string& parameter() const noexcept { return parameter_; }
  double value() const noexcept { return value_; }

 private:
  std::string parameter_;
  double value_;
};

// Thrown when a computation becomes numerically invalid.
class NumericalError : public ProcsimError {
 public:
  explicit NumericalError(std::string msg) : ProcsimError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public ProcsimError {
 public:
  explicit IOError(std::string msg) : ProcsimError(std::move(msg)) {}
};

} // namespace procsim
