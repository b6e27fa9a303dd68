#pragma once
/*
================================================================================
Flowsheet: System (Recycle Convergence Engine)
FILE: cpp/engine/flowsheet/system.hpp

Purpose:
  - Owns the execution path of a Network and drives it to a self-consistent
    steady state by iterating its recycle (tear) stream.
  - Nested Networks become child Systems; each child converges completely as
    one atomic step of the parent's iteration (innermost first).

Algorithm (converge):
  1. No recycle: run every element once, in declared order.
  2. Guess x_k = recycle state (flows, T, P). Warm start from the stream's
     stored value; reset_recycles() gives a cold start from zero flow.
  3. Run the path once; the recycle producer writes x_{k+1}.
  4. Errors: max |dflow| (kg/h), effective relative flow error (components
     within flow_tolerance count as converged), |dT| (K).
  5. Converged -> stop, stream left at x_{k+1}.
  6. Else accelerator proposes the next guess; flows clamped >= 0.
  7. max_iterations or time_limit_s exhausted -> ConvergenceFailure.

Topology:
  - The declared order is validated once at construction: every inlet must be
    a boundary stream, produced earlier in the path, produced outside this
    system, or this system's recycle stream. The recycle must be a back edge
    (consumed before it is produced). ValidationError otherwise.

Hardening:
  - Never loops forever: iteration ceiling + optional wall-clock budget.
  - InfeasibleStateError from units propagates untouched (not retried).
================================================================================
*/

#include "engine/convergence/accelerator.hpp"
#include "engine/core/settings.hpp"
#include "engine/flowsheet/flowsheet.hpp"
#include "engine/flowsheet/network.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace procsim {

class Block;

struct ConvergenceReport {
  bool converged = false;
  std::size_t iterations = 0;        // recycle iterations of this system
  std::size_t inner_iterations = 0;  // recycle iterations of nested systems
  double flow_error = 0.0;           // kg/h
  double relative_flow_error = 0.0;
  double temperature_error = 0.0;    // K

  std::size_t total_iterations() const noexcept { return iterations + inner_iterations; }
};

class System {
 public:
  // Path entry: exactly one of unit / subsystem is set.
  struct Element {
    std::optional<UnitId> unit;
    System* subsystem = nullptr;
  };

  // Only a Block can mint one; see the view constructor below.
  class ViewKey {
    friend class Block;
    ViewKey() = default;
  };

  System(Flowsheet& flowsheet, const Network& network, ConvergenceSettings settings = {});

  // Non-owning view over a subset of another system's elements (Blocks).
  System(ViewKey, Flowsheet& flowsheet, std::string id, std::vector<Element> elements,
         std::optional<StreamId> recycle, ConvergenceSettings settings);

  ~System();

  System(const System&) = delete;
  System& operator=(const System&) = delete;

  const std::string& id() const noexcept { return id_; }

  // Mass/energy balance only.
  ConvergenceReport converge();

  // converge() followed by design/cost refresh of every unit.
  ConvergenceReport simulate();

  // Design/cost refresh of every unit, in execution order.
  void summarize();

  // Empty this system's recycle stream and all nested ones (cold start).
  void reset_recycles();

  Flowsheet& flowsheet() noexcept { return fs_; }
  const Flowsheet& flowsheet() const noexcept { return fs_; }

  const std::vector<Element>& elements() const noexcept { return elements_; }
  const std::optional<StreamId>& recycle() const noexcept { return recycle_; }

  // Flattened execution order.
  const std::vector<UnitId>& units() const noexcept { return unit_order_; }
  std::optional<std::size_t> position_of(UnitId u) const;
  bool contains(UnitId u) const { return position_of(u).has_value(); }

  // Units executed by path element `i` (one unit, or a subsystem's units).
  std::vector<UnitId> element_units(std::size_t i) const;

  const ConvergenceSettings& settings() const noexcept { return cfg_; }
  void set_settings(const ConvergenceSettings& settings);

  const ConvergenceReport& last_report() const noexcept { return last_; }

  // Recycle iterations accumulated over all converge() calls, nested included.
  std::size_t total_iterations() const noexcept { return total_iterations_; }

 private:
  void build_order_();
  void validate_topology_() const;
  void run_path_(ConvergenceReport& rep);
  void measure_(const std::vector<double>& x, const std::vector<double>& gx, ConvergenceReport& rep) const;
  bool converged_(const ConvergenceReport& rep) const noexcept;

  Flowsheet& fs_;
  std::string id_;
  std::vector<Element> elements_;
  std::vector<std::unique_ptr<System>> owned_;
  std::optional<StreamId> recycle_;
  ConvergenceSettings cfg_;
  std::unique_ptr<RecycleAccelerator> accel_;
  std::vector<UnitId> unit_order_;
  ConvergenceReport last_;
  std::size_t total_iterations_ = 0;
};

} // namespace procsim
