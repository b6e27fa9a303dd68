#pragma once
/*
================================================================================
Flowsheet: Unit Operation Contract
FILE: cpp/engine/flowsheet/unit.hpp

Purpose:
  - Opaque computation node: ordered inlet/outlet streams, a balance (run_),
    and optional design/cost refresh.
  - The engine calls run() and relies on:
      * determinism and idempotence for unchanged inlets
      * termination (any internal iteration is the unit's own business)
      * inlets never mutated

Hardening:
  - run() checks every outlet after the balance; a physically invalid outlet
    raises InfeasibleStateError (not retried).
  - Subclasses throw SimulationError/InfeasibleStateError for their own
    infeasibility checks.
================================================================================
*/

#include "engine/flowsheet/stream.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace procsim {

enum class UnitId : std::size_t {};

inline constexpr std::size_t to_index(UnitId id) noexcept {
  return static_cast<std::size_t>(id);
}

// name -> value. Units documented by each unit (e.g. "Volume [m3]").
using ResultMap = std::map<std::string, double>;

class Unit {
 public:
  Unit(std::string id, std::vector<StreamId> ins, std::vector<StreamId> outs);
  virtual ~Unit() = default;

  Unit(const Unit&) = delete;
  Unit& operator=(const Unit&) = delete;

  const std::string& id() const noexcept { return id_; }
  const std::vector<StreamId>& ins() const noexcept { return ins_; }
  const std::vector<StreamId>& outs() const noexcept { return outs_; }

  // Mass/energy balance followed by outlet feasibility checks.
  void run(StreamTable& streams);

  // Design then cost.
  void summarize(const StreamTable& streams);

  // Refresh design results from current streams; default no-op.
  virtual void design(const StreamTable& streams);

  // Refresh cost results from design results; default no-op.
  virtual void cost();

  const ResultMap& design_results() const noexcept { return design_results_; }
  const ResultMap& cost_results() const noexcept { return cost_results_; }

  // Sum of cost results (USD).
  double purchase_cost() const noexcept;

  std::size_t run_count() const noexcept { return run_count_; }

 protected:
  virtual void run_(StreamTable& streams) = 0;

  const Stream& in(const StreamTable& streams, std::size_t i) const;
  Stream& out(StreamTable& streams, std::size_t i) const;

  // For constructor checks in subclasses.
  void require_ports_(std::size_t n_ins, std::size_t n_outs) const;

  ResultMap design_results_;
  ResultMap cost_results_;

 private:
  std::string id_;
  std::vector<StreamId> ins_;
  std::vector<StreamId> outs_;
  std::size_t run_count_ = 0;
};

} // namespace procsim
