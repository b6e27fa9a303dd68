#pragma once
/*
================================================================================
Flowsheet: Reference Unit Operations
FILE: cpp/engine/flowsheet/units.hpp

Purpose:
  - Small balance-only units for demos, tests and simple flowsheets:
      * Mixer             n -> 1
      * Splitter          1 -> 2
      * ConversionReactor 1 -> 1  (fractional conversion reactant -> product)
      * Heater            1 -> 1  (sets outlet temperature)
      * PassThrough       1 -> 1  (storage tanks, pumps: outlet mirrors inlet)

Notes:
  - No thermodynamics. Heater duty uses a constant heat capacity.
  - Reactor design/cost: working volume from residence time, six-tenths
    capacity scaling for purchase cost.
  - Setters validate their own domain and throw ValidationError; model
    parameters check their domain earlier and raise ParameterBoundsError.
================================================================================
*/

#include "engine/flowsheet/unit.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace procsim {

// -----------------------------
// Mixer
// -----------------------------
class Mixer final : public Unit {
 public:
  Mixer(std::string id, std::vector<StreamId> ins, StreamId out);

 protected:
  void run_(StreamTable& streams) override;
};

// -----------------------------
// Splitter
// -----------------------------
// Fraction of each component sent to outlet 0; the rest goes to outlet 1.
class Splitter final : public Unit {
 public:
  Splitter(std::string id, StreamId in, StreamId out0, StreamId out1, double split);
  Splitter(std::string id, StreamId in, StreamId out0, StreamId out1, std::vector<double> splits);

  void set_split(double split);
  void set_splits(std::vector<double> splits);
  const std::vector<double>& splits() const noexcept { return splits_; }

 protected:
  void run_(StreamTable& streams) override;

 private:
  std::vector<double> splits_;
  bool uniform_ = true;
};

// -----------------------------
// ConversionReactor
// -----------------------------
struct ReactorDesignBasis {
  double residence_time_h = 1.0;
  double density_kg_m3 = 1000.0;
  double working_volume_fraction = 0.9;

  // Purchase cost = cost_factor * base_cost_usd * (V / base_volume_m3)^scaling_exponent
  double base_cost_usd = 1.0e6;
  double base_volume_m3 = 100.0;
  double scaling_exponent = 0.6;
  double cost_factor = 1.0;

  void validate_or_throw() const;
};

class ConversionReactor final : public Unit {
 public:
  ConversionReactor(std::string id, StreamId in, StreamId out,
                    std::size_t reactant, std::size_t product, double conversion,
                    ReactorDesignBasis basis = {});

  void set_conversion(double x);
  double conversion() const noexcept { return conversion_; }

  // NaN keeps the inlet temperature.
  void set_outlet_temperature(double T);

  void set_residence_time(double tau_h);
  void set_cost_factor(double f);
  const ReactorDesignBasis& basis() const noexcept { return basis_; }

  void design(const StreamTable& streams) override;
  void cost() override;

 protected:
  void run_(StreamTable& streams) override;

 private:
  std::size_t reactant_;
  std::size_t product_;
  double conversion_;
  double T_out_ = std::numeric_limits<double>::quiet_NaN();
  ReactorDesignBasis basis_;
};

// -----------------------------
// Heater
// -----------------------------
class Heater final : public Unit {
 public:
  Heater(std::string id, StreamId in, StreamId out, double T_out, double cp_kJ_kgK = 4.18);

  void set_outlet_temperature(double T);
  double outlet_temperature() const noexcept { return T_out_; }

  void design(const StreamTable& streams) override;

 protected:
  void run_(StreamTable& streams) override;

 private:
  double T_out_;
  double cp_kJ_kgK_;
};

// -----------------------------
// PassThrough
// -----------------------------
class PassThrough final : public Unit {
 public:
  PassThrough(std::string id, StreamId in, StreamId out);

 protected:
  void run_(StreamTable& streams) override;
};

} // namespace procsim
