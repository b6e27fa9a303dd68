/*
================================================================================
Evaluation: Parameter (Implementation)
FILE: cpp/engine/evaluation/parameter.cpp
================================================================================
*/

#include "engine/evaluation/parameter.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>
#include <utility>

namespace procsim {

namespace {

bool action_matches(ParameterKind kind, const SimulateAction& a) {
  switch (kind) {
    case ParameterKind::Isolated: return std::holds_alternative<action::Isolated>(a);
    case ParameterKind::Design:   return std::holds_alternative<action::DesignRefresh>(a);
    case ParameterKind::Cost:     return std::holds_alternative<action::CostRefresh>(a);
    case ParameterKind::Coupled:  return std::holds_alternative<action::Coupled>(a);
  }
  return false;
}

ConvergenceReport no_iterations() {
  ConvergenceReport rep;
  rep.converged = true;
  return rep;
}

}  // namespace

const char* to_string(ParameterKind k) noexcept {
  switch (k) {
    case ParameterKind::Coupled:  return "coupled";
    case ParameterKind::Design:   return "design";
    case ParameterKind::Cost:     return "cost";
    case ParameterKind::Isolated: return "isolated";
    default:                      return "unknown";
  }
}

void Bounds::validate_or_throw() const {
  if (std::isnan(lower) || std::isnan(upper) || !(lower <= upper)) {
    throw ValidationError("Bounds: requires lower <= upper");
  }
}

Parameter::Parameter(ParameterSpec spec, SimulateAction action)
    : spec_(std::move(spec)), action_(std::move(action)) {
  if (spec_.name.empty()) throw ValidationError("Parameter: name is empty");
  if (!spec_.setter) throw ValidationError("Parameter '" + spec_.name + "': setter is empty");
  spec_.bounds.validate_or_throw();
  PROCSIM_ENSURE(action_matches(spec_.kind, action_), ErrorCode::kInvariant,
                 "Parameter '" + spec_.name + "': simulate action does not match kind");

  if (spec_.distribution) {
    spec_.distribution->validate();
    if (spec_.distribution->lower() < spec_.bounds.lower || spec_.distribution->upper() > spec_.bounds.upper) {
      throw ValidationError("Parameter '" + spec_.name + "': distribution " + spec_.distribution->describe() +
                            " exceeds the parameter bounds");
    }
  }

  if (spec_.baseline) {
    baseline_ = *spec_.baseline;
  } else if (spec_.getter) {
    baseline_ = spec_.getter();
  } else if (spec_.distribution) {
    baseline_ = spec_.distribution->mean();
  } else {
    throw ValidationError("Parameter '" + spec_.name + "': no baseline, getter or distribution");
  }
  if (!is_finite(baseline_) || !spec_.bounds.contains(baseline_)) {
    std::ostringstream oss;
    oss << "Parameter '" << spec_.name << "': baseline " << baseline_ << " outside bounds";
    throw ValidationError(oss.str());
  }
}

std::optional<double> Parameter::current() const {
  if (spec_.getter) return spec_.getter();
  return value_;
}

void Parameter::check(double v) const {
  if (!is_finite(v) || !spec_.bounds.contains(v)) {
    std::ostringstream oss;
    oss << "parameter '" << spec_.name << "': value " << v << " outside ["
        << spec_.bounds.lower << ", " << spec_.bounds.upper << "]";
    throw ParameterBoundsError(spec_.name, v, oss.str());
  }
}

void Parameter::set(double v) {
  check(v);
  try {
    spec_.setter(v);
  } catch (const ValidationError& e) {
    throw ParameterBoundsError(spec_.name, v, "parameter '" + spec_.name + "': " + e.what());
  }
  value_ = v;
}

ConvergenceReport Parameter::simulate() {
  return std::visit(
      [](auto& a) -> ConvergenceReport {
        using A = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<A, action::Coupled>) {
          return a.block->simulate();
        } else if constexpr (std::is_same_v<A, action::DesignRefresh>) {
          a.flowsheet->unit(a.unit).summarize(a.flowsheet->streams());
          return no_iterations();
        } else if constexpr (std::is_same_v<A, action::CostRefresh>) {
          a.flowsheet->unit(a.unit).cost();
          return no_iterations();
        } else {
          return no_iterations();
        }
      },
      action_);
}

void Parameter::operator()(double v) {
  set(v);
  simulate();
}

const Block* Parameter::block() const noexcept {
  const auto* c = std::get_if<action::Coupled>(&action_);
  return c ? c->block.get() : nullptr;
}

Block* Parameter::block() noexcept {
  auto* c = std::get_if<action::Coupled>(&action_);
  return c ? c->block.get() : nullptr;
}

} // namespace procsim
