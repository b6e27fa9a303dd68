/*
================================================================================
Flowsheet: Unit Contract (Implementation)
FILE: cpp/engine/flowsheet/unit.cpp
================================================================================
*/

#include "engine/flowsheet/unit.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"

#include <utility>

namespace procsim {

Unit::Unit(std::string id, std::vector<StreamId> ins, std::vector<StreamId> outs)
    : id_(std::move(id)), ins_(std::move(ins)), outs_(std::move(outs)) {
  if (id_.empty()) throw ValidationError("Unit: id is empty");
  for (StreamId o : outs_) {
    for (StreamId i : ins_) {
      if (o == i) throw ValidationError("Unit '" + id_ + "': stream is both inlet and outlet");
    }
  }
}

void Unit::run(StreamTable& streams) {
  ++run_count_;
  run_(streams);
  for (StreamId o : outs_) {
    try {
      streams.at(o).check_feasible();
    } catch (const InfeasibleStateError& e) {
      throw InfeasibleStateError("unit '" + id_ + "': " + e.what());
    }
  }
}

void Unit::summarize(const StreamTable& streams) {
  design(streams);
  cost();
}

void Unit::design(const StreamTable&) {}

void Unit::cost() {}

double Unit::purchase_cost() const noexcept {
  double C = 0.0;
  for (const auto& kv : cost_results_) C += kv.second;
  return C;
}

const Stream& Unit::in(const StreamTable& streams, std::size_t i) const {
  PROCSIM_ENSURE(i < ins_.size(), ErrorCode::kOutOfRange, "unit '" + id_ + "': inlet index out of range");
  return streams.at(ins_[i]);
}

Stream& Unit::out(StreamTable& streams, std::size_t i) const {
  PROCSIM_ENSURE(i < outs_.size(), ErrorCode::kOutOfRange, "unit '" + id_ + "': outlet index out of range");
  return streams.at(outs_[i]);
}

void Unit::require_ports_(std::size_t n_ins, std::size_t n_outs) const {
  if (ins_.size() != n_ins || outs_.size() != n_outs) {
    throw ValidationError("unit '" + id_ + "': expected " + std::to_string(n_ins) + " inlet(s) and " +
                          std::to_string(n_outs) + " outlet(s)");
  }
}

} // namespace procsim
