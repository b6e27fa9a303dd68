/*
================================================================================
Flowsheet: Reference Unit Operations (Implementation)
FILE: cpp/engine/flowsheet/units.cpp
================================================================================
Purpose:
  - Mixer, Splitter, ConversionReactor, Heater and PassThrough balances,
    plus reactor sizing and six-tenths cost scaling.
================================================================================
*/

#include "engine/flowsheet/units.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <cmath>
#include <utility>

namespace procsim {

namespace {

void require_fraction(const std::string& who, const char* what, double x) {
  if (!is_finite(x) || x < 0.0 || x > 1.0) {
    throw ValidationError(who + ": " + what + " must be in [0,1]");
  }
}

}  // namespace

// ----------------------------- Mixer -----------------------------------------

Mixer::Mixer(std::string id, std::vector<StreamId> ins, StreamId out)
    : Unit(std::move(id), std::move(ins), {out}) {
  if (this->ins().empty()) throw ValidationError("Mixer '" + this->id() + "': needs at least one inlet");
}

void Mixer::run_(StreamTable& streams) {
  std::vector<const Stream*> inlets;
  inlets.reserve(ins().size());
  for (StreamId s : ins()) inlets.push_back(&streams.at(s));
  out(streams, 0).mix_from(inlets);
}

// ----------------------------- Splitter --------------------------------------

Splitter::Splitter(std::string id, StreamId in, StreamId out0, StreamId out1, double split)
    : Unit(std::move(id), {in}, {out0, out1}) {
  set_split(split);
}

Splitter::Splitter(std::string id, StreamId in, StreamId out0, StreamId out1, std::vector<double> splits)
    : Unit(std::move(id), {in}, {out0, out1}) {
  set_splits(std::move(splits));
}

void Splitter::set_split(double split) {
  require_fraction("Splitter '" + id() + "'", "split", split);
  uniform_ = true;
  splits_.assign(1, split);
}

void Splitter::set_splits(std::vector<double> splits) {
  if (splits.empty()) throw ValidationError("Splitter '" + id() + "': split vector is empty");
  for (double s : splits) require_fraction("Splitter '" + id() + "'", "split", s);
  uniform_ = false;
  splits_ = std::move(splits);
}

void Splitter::run_(StreamTable& streams) {
  const Stream& feed = in(streams, 0);
  Stream& top = out(streams, 0);
  Stream& bottom = out(streams, 1);

  const std::size_t n = feed.flows.size();
  if (!uniform_ && splits_.size() != n) {
    throw SimulationError("Splitter '" + id() + "': split vector does not match component count");
  }

  top.copy_like(feed);
  bottom.copy_like(feed);
  for (std::size_t i = 0; i < n; ++i) {
    const double s = uniform_ ? splits_[0] : splits_[i];
    top.flows[i] = s * feed.flows[i];
    bottom.flows[i] = feed.flows[i] - top.flows[i];
  }
}

// ----------------------------- ConversionReactor -----------------------------

void ReactorDesignBasis::validate_or_throw() const {
  if (!(residence_time_h > 0.0)) throw ValidationError("ReactorDesignBasis: residence_time_h must be > 0");
  if (!(density_kg_m3 > 0.0)) throw ValidationError("ReactorDesignBasis: density_kg_m3 must be > 0");
  if (!(working_volume_fraction > 0.0) || working_volume_fraction > 1.0) {
    throw ValidationError("ReactorDesignBasis: working_volume_fraction must be (0,1]");
  }
  if (!(base_cost_usd >= 0.0)) throw ValidationError("ReactorDesignBasis: base_cost_usd must be >= 0");
  if (!(base_volume_m3 > 0.0)) throw ValidationError("ReactorDesignBasis: base_volume_m3 must be > 0");
  if (!(scaling_exponent > 0.0) || scaling_exponent > 2.0) {
    throw ValidationError("ReactorDesignBasis: scaling_exponent outside sane bounds");
  }
  if (!(cost_factor > 0.0)) throw ValidationError("ReactorDesignBasis: cost_factor must be > 0");
}

ConversionReactor::ConversionReactor(std::string id, StreamId in, StreamId out,
                                     std::size_t reactant, std::size_t product, double conversion,
                                     ReactorDesignBasis basis)
    : Unit(std::move(id), {in}, {out}),
      reactant_(reactant),
      product_(product),
      conversion_(0.0),
      basis_(basis) {
  if (reactant_ == product_) throw ValidationError("ConversionReactor '" + this->id() + "': reactant == product");
  basis_.validate_or_throw();
  set_conversion(conversion);
}

void ConversionReactor::set_conversion(double x) {
  require_fraction("ConversionReactor '" + id() + "'", "conversion", x);
  conversion_ = x;
}

void ConversionReactor::set_outlet_temperature(double T) {
  if (!std::isnan(T) && !(is_finite(T) && T > 0.0)) {
    throw ValidationError("ConversionReactor '" + id() + "': outlet temperature must be > 0 K");
  }
  T_out_ = T;
}

void ConversionReactor::set_residence_time(double tau_h) {
  if (!is_finite(tau_h) || !(tau_h > 0.0)) {
    throw ValidationError("ConversionReactor '" + id() + "': residence time must be > 0");
  }
  basis_.residence_time_h = tau_h;
}

void ConversionReactor::set_cost_factor(double f) {
  if (!is_finite(f) || !(f > 0.0)) {
    throw ValidationError("ConversionReactor '" + id() + "': cost factor must be > 0");
  }
  basis_.cost_factor = f;
}

void ConversionReactor::run_(StreamTable& streams) {
  const Stream& feed = in(streams, 0);
  Stream& effluent = out(streams, 0);

  if (reactant_ >= feed.flows.size() || product_ >= feed.flows.size()) {
    throw SimulationError("ConversionReactor '" + id() + "': component index out of range");
  }

  effluent.copy_like(feed);
  const double converted = conversion_ * feed.flows[reactant_];
  effluent.flows[reactant_] -= converted;
  effluent.flows[product_] += converted;
  if (!std::isnan(T_out_)) effluent.T = T_out_;
}

void ConversionReactor::design(const StreamTable& streams) {
  const Stream& effluent = streams.at(outs()[0]);
  const double Q_m3_h = effluent.total_flow() / basis_.density_kg_m3;
  const double V = Q_m3_h * basis_.residence_time_h / basis_.working_volume_fraction;

  design_results_["Residence time [h]"] = basis_.residence_time_h;
  design_results_["Volume [m3]"] = V;
}

void ConversionReactor::cost() {
  const auto it = design_results_.find("Volume [m3]");
  const double V = (it != design_results_.end()) ? it->second : 0.0;
  const double R = safe_div(V, basis_.base_volume_m3, 0.0);
  cost_results_["Reactor [USD]"] = basis_.cost_factor * basis_.base_cost_usd * std::pow(R, basis_.scaling_exponent);
}

// ----------------------------- Heater ----------------------------------------

Heater::Heater(std::string id, StreamId in, StreamId out, double T_out, double cp_kJ_kgK)
    : Unit(std::move(id), {in}, {out}), T_out_(0.0), cp_kJ_kgK_(cp_kJ_kgK) {
  if (!is_finite(cp_kJ_kgK_) || !(cp_kJ_kgK_ > 0.0)) {
    throw ValidationError("Heater '" + this->id() + "': heat capacity must be > 0");
  }
  set_outlet_temperature(T_out);
}

void Heater::set_outlet_temperature(double T) {
  if (!is_finite(T) || !(T > 0.0)) {
    throw ValidationError("Heater '" + id() + "': outlet temperature must be > 0 K");
  }
  T_out_ = T;
}

void Heater::run_(StreamTable& streams) {
  Stream& o = out(streams, 0);
  o.copy_like(in(streams, 0));
  o.T = T_out_;
}

void Heater::design(const StreamTable& streams) {
  const Stream& i = streams.at(ins()[0]);
  const Stream& o = streams.at(outs()[0]);
  // kg/h * kJ/(kg K) * K / 3600 s/h = kW
  design_results_["Duty [kW]"] = o.total_flow() * cp_kJ_kgK_ * (o.T - i.T) / 3600.0;
}

// ----------------------------- PassThrough -----------------------------------

PassThrough::PassThrough(std::string id, StreamId in, StreamId out)
    : Unit(std::move(id), {in}, {out}) {}

void PassThrough::run_(StreamTable& streams) {
  out(streams, 0).copy_like(in(streams, 0));
}

} // namespace procsim
