#pragma once
/*
================================================================================
Evaluation: Parameter
FILE: cpp/engine/evaluation/parameter.hpp

Purpose:
  - One uncertain or decision input of a Model: a setter bound to a flowsheet
    attribute plus the minimal recomputation its change requires.
  - Kinds:
      * Coupled   changes a mass/energy balance; re-simulates a Block
      * Design    changes sizing only; refreshes the unit's design and cost
      * Cost      changes costing only; refreshes the unit's cost
      * Isolated  nothing inside the flowsheet depends on it

Hardening:
  - The simulate action is a closed variant fixed at construction.
  - Domain check (Bounds) before the setter runs; an out-of-domain value raises
    ParameterBoundsError and leaves the flowsheet untouched.
  - Setter rejections (ValidationError) are reported as ParameterBoundsError.
================================================================================
*/

#include "engine/evaluation/distribution.hpp"
#include "engine/flowsheet/block.hpp"
#include "engine/flowsheet/flowsheet.hpp"

#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace procsim {

enum class ParameterKind : int {
  Coupled = 0,
  Design = 1,
  Cost = 2,
  Isolated = 3
};

const char* to_string(ParameterKind k) noexcept;

// What a parameter is attached to.
using Element = std::variant<std::monostate, UnitId, StreamId>;

// Physically valid domain (inclusive).
struct Bounds {
  double lower = -std::numeric_limits<double>::infinity();
  double upper = std::numeric_limits<double>::infinity();

  bool contains(double x) const noexcept { return x >= lower && x <= upper; }

  void validate_or_throw() const;
};

struct ParameterSpec {
  std::string name;
  std::string units;

  std::function<void(double)> setter;
  std::function<double()> getter;  // optional

  Element element;
  ParameterKind kind = ParameterKind::Isolated;

  std::optional<Distribution> distribution;
  std::optional<double> baseline;  // default: getter(), then distribution mean
  Bounds bounds;
};

namespace action {
struct Isolated {};
struct DesignRefresh {
  Flowsheet* flowsheet = nullptr;
  UnitId unit{};
};
struct CostRefresh {
  Flowsheet* flowsheet = nullptr;
  UnitId unit{};
};
struct Coupled {
  std::unique_ptr<Block> block;
};
}  // namespace action

using SimulateAction = std::variant<action::Isolated, action::DesignRefresh, action::CostRefresh, action::Coupled>;

class Parameter {
 public:
  Parameter(ParameterSpec spec, SimulateAction action);

  Parameter(const Parameter&) = delete;
  Parameter& operator=(const Parameter&) = delete;

  const std::string& name() const noexcept { return spec_.name; }
  const std::string& units() const noexcept { return spec_.units; }
  ParameterKind kind() const noexcept { return spec_.kind; }
  const Element& element() const noexcept { return spec_.element; }
  const Bounds& bounds() const noexcept { return spec_.bounds; }
  const std::optional<Distribution>& distribution() const noexcept { return spec_.distribution; }
  double baseline() const noexcept { return baseline_; }

  // Last value applied through set(); empty before the first call.
  const std::optional<double>& value() const noexcept { return value_; }

  // getter() when bound, else value().
  std::optional<double> current() const;

  // Throws ParameterBoundsError when v is outside bounds() or not finite.
  void check(double v) const;

  // check() then setter. No recomputation.
  void set(double v);

  // The bound recomputation for this parameter's kind.
  ConvergenceReport simulate();

  // set() then simulate().
  void operator()(double v);

  // Null unless kind() == Coupled.
  const Block* block() const noexcept;
  Block* block() noexcept;

  // Flattened position of the element in the Model's system (Coupled only).
  std::size_t position() const noexcept { return position_; }

  // Forget the last applied value (next sample re-applies it).
  void invalidate() noexcept { value_.reset(); }

 private:
  friend class Model;

  ParameterSpec spec_;
  SimulateAction action_;
  double baseline_ = 0.0;
  std::optional<double> value_;
  std::size_t position_ = 0;
};

} // namespace procsim
