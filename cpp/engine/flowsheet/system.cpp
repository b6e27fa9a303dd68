/*
================================================================================
Flowsheet: System (Implementation)
FILE: cpp/engine/flowsheet/system.cpp
================================================================================
Purpose:
  - Builds the flattened execution order and validates the topology once.
  - Converges the recycle stream: run path, measure error, accelerate.

Hardening:
  - Iteration budget and optional wall-clock limit raise ConvergenceFailure.
  - Accelerated guesses are clamped to non-negative flows and positive T/P.
================================================================================
*/

#include "engine/flowsheet/system.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace procsim {

namespace {

constexpr std::size_t kNoElement = std::numeric_limits<std::size_t>::max();

}  // namespace

System::System(Flowsheet& flowsheet, const Network& network, ConvergenceSettings settings)
    : fs_(flowsheet), id_(network.id.empty() ? std::string("system") : network.id),
      recycle_(network.recycle), cfg_(settings) {
  cfg_.validate_or_throw();
  if (network.path.empty()) throw ValidationError("system '" + id_ + "': network path is empty");

  elements_.reserve(network.path.size());
  for (const NetworkElement& ne : network.path) {
    Element e;
    if (ne.is_unit()) {
      e.unit = ne.unit();
      fs_.unit(*e.unit);  // id check
    } else {
      owned_.push_back(std::make_unique<System>(fs_, ne.subnetwork(), cfg_));
      e.subsystem = owned_.back().get();
    }
    elements_.push_back(e);
  }

  accel_ = make_accelerator(cfg_);
  build_order_();
  validate_topology_();
}

System::System(ViewKey, Flowsheet& flowsheet, std::string id, std::vector<Element> elements,
               std::optional<StreamId> recycle, ConvergenceSettings settings)
    : fs_(flowsheet), id_(std::move(id)), elements_(std::move(elements)),
      recycle_(recycle), cfg_(settings) {
  cfg_.validate_or_throw();
  accel_ = make_accelerator(cfg_);
  build_order_();
  validate_topology_();
}

System::~System() = default;

void System::build_order_() {
  unit_order_.clear();
  for (const Element& e : elements_) {
    if (e.unit) {
      unit_order_.push_back(*e.unit);
    } else {
      const auto& sub = e.subsystem->units();
      unit_order_.insert(unit_order_.end(), sub.begin(), sub.end());
    }
  }
}

std::vector<UnitId> System::element_units(std::size_t i) const {
  PROCSIM_ENSURE(i < elements_.size(), ErrorCode::kOutOfRange, "system '" + id_ + "': element index out of range");
  const Element& e = elements_[i];
  if (e.unit) return {*e.unit};
  return e.subsystem->units();
}

void System::validate_topology_() const {
  const std::size_t n_units = fs_.unit_count();
  const StreamTable& streams = fs_.streams();

  // Which element executes each unit.
  std::vector<std::size_t> element_of(n_units, kNoElement);
  for (std::size_t i = 0; i < elements_.size(); ++i) {
    for (UnitId u : element_units(i)) {
      if (element_of[to_index(u)] != kNoElement) {
        throw ValidationError("system '" + id_ + "': unit '" + fs_.unit(u).id() + "' appears more than once");
      }
      element_of[to_index(u)] = i;
    }
  }

  // Streams produced inside this system become available only once produced.
  std::vector<char> available(streams.size(), 1);
  for (UnitId u : unit_order_) {
    for (StreamId s : fs_.unit(u).outs()) available[to_index(s)] = 0;
  }

  if (recycle_) {
    const std::string& name = streams.at(*recycle_).name;
    const auto producer = fs_.producer_of(*recycle_);
    const auto consumer = fs_.consumer_of(*recycle_);
    if (!producer || element_of[to_index(*producer)] == kNoElement) {
      throw ValidationError("system '" + id_ + "': recycle stream '" + name + "' is not produced inside the system");
    }
    if (!consumer || element_of[to_index(*consumer)] == kNoElement) {
      throw ValidationError("system '" + id_ + "': recycle stream '" + name + "' is not consumed inside the system");
    }
    if (!(element_of[to_index(*consumer)] < element_of[to_index(*producer)])) {
      throw ValidationError("system '" + id_ + "': recycle stream '" + name +
                            "' is not a back edge of the declared order");
    }
    available[to_index(*recycle_)] = 1;
  }

  for (std::size_t i = 0; i < elements_.size(); ++i) {
    const std::vector<UnitId> units = element_units(i);
    for (UnitId u : units) {
      for (StreamId s : fs_.unit(u).ins()) {
        const auto producer = fs_.producer_of(s);
        // Dependencies inside a subsystem were validated by that subsystem.
        if (producer && element_of[to_index(*producer)] == i) continue;
        if (!available[to_index(s)]) {
          throw ValidationError("system '" + id_ + "': unit '" + fs_.unit(u).id() + "' consumes stream '" +
                                streams.at(s).name + "' before it is produced; declared order is not topological");
        }
      }
    }
    for (UnitId u : units) {
      for (StreamId s : fs_.unit(u).outs()) available[to_index(s)] = 1;
    }
  }
}

std::optional<std::size_t> System::position_of(UnitId u) const {
  for (std::size_t i = 0; i < unit_order_.size(); ++i) {
    if (unit_order_[i] == u) return i;
  }
  return std::nullopt;
}

void System::set_settings(const ConvergenceSettings& settings) {
  settings.validate_or_throw();
  cfg_ = settings;
  accel_ = make_accelerator(cfg_);
  for (auto& sub : owned_) sub->set_settings(settings);
}

void System::run_path_(ConvergenceReport& rep) {
  for (Element& e : elements_) {
    if (e.unit) {
      fs_.unit(*e.unit).run(fs_.streams());
    } else {
      const ConvergenceReport inner = e.subsystem->converge();
      rep.inner_iterations += inner.total_iterations();
    }
  }
}

void System::measure_(const std::vector<double>& x, const std::vector<double>& gx, ConvergenceReport& rep) const {
  const std::size_t n = fs_.streams().component_count();

  double abs_err = 0.0;
  double rel_err = 0.0;
  double F_old = 0.0;
  double F_new = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    abs_err = std::max(abs_err, std::fabs(gx[i] - x[i]));
    rel_err = std::max(rel_err, relative_change(x[i], gx[i], cfg_.flow_tolerance));
    F_old += x[i];
    F_new += gx[i];
  }
  rel_err = std::max(rel_err, relative_change(F_old, F_new, cfg_.flow_tolerance));

  rep.flow_error = abs_err;
  rep.relative_flow_error = rel_err;
  rep.temperature_error = std::fabs(gx[n] - x[n]);
}

bool System::converged_(const ConvergenceReport& rep) const noexcept {
  const bool flow_ok = rep.flow_error <= cfg_.flow_tolerance ||
                       rep.relative_flow_error <= cfg_.relative_flow_tolerance;
  return flow_ok && rep.temperature_error <= cfg_.temperature_tolerance;
}

ConvergenceReport System::converge() {
  ConvergenceReport rep;

  if (!recycle_) {
    run_path_(rep);
    rep.converged = true;
    last_ = rep;
    total_iterations_ += rep.total_iterations();
    return rep;
  }

  Stream& rec = fs_.stream(*recycle_);
  const std::size_t n = rec.flows.size();
  const auto t0 = std::chrono::steady_clock::now();

  accel_->reset();
  std::vector<double> x = rec.state_vector();

  for (int k = 1; k <= cfg_.max_iterations; ++k) {
    run_path_(rep);
    const std::vector<double> gx = rec.state_vector();
    measure_(x, gx, rep);
    rep.iterations = static_cast<std::size_t>(k);

    if (log_enabled(LogLevel::DEBUG)) {
      std::ostringstream oss;
      oss << "system '" << id_ << "' iteration " << k
          << ": flow_err=" << rep.flow_error
          << " kg/h, rel_flow_err=" << rep.relative_flow_error
          << ", T_err=" << rep.temperature_error << " K";
      log(LogLevel::DEBUG, oss.str());
    }

    if (converged_(rep)) {
      rep.converged = true;
      last_ = rep;
      total_iterations_ += rep.total_iterations();
      return rep;
    }

    if (cfg_.time_limit_s > 0.0) {
      const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
      if (elapsed.count() > cfg_.time_limit_s) {
        last_ = rep;
        total_iterations_ += rep.total_iterations();
        std::ostringstream oss;
        oss << "system '" << id_ << "': recycle '" << rec.name << "' exceeded time limit of "
            << cfg_.time_limit_s << " s after " << k << " iteration(s) (rel_flow_err="
            << rep.relative_flow_error << ", T_err=" << rep.temperature_error << " K)";
        throw ConvergenceFailure(id_, rep.iterations, rep.relative_flow_error, rep.temperature_error, oss.str());
      }
    }

    x = accel_->next_guess(x, gx);
    for (std::size_t i = 0; i < n; ++i) {
      if (!is_finite(x[i]) || x[i] < 0.0) x[i] = 0.0;
    }
    if (!is_finite(x[n]) || x[n] <= 0.0) x[n] = gx[n];
    if (!is_finite(x[n + 1]) || x[n + 1] <= 0.0) x[n + 1] = gx[n + 1];
    rec.set_state_vector(x);
  }

  last_ = rep;
  total_iterations_ += rep.total_iterations();

  std::ostringstream oss;
  oss << "system '" << id_ << "': recycle '" << rec.name << "' did not converge in "
      << cfg_.max_iterations << " iteration(s) (flow_err=" << rep.flow_error
      << " kg/h, rel_flow_err=" << rep.relative_flow_error
      << ", T_err=" << rep.temperature_error << " K, method=" << accel_->name() << ")";
  throw ConvergenceFailure(id_, rep.iterations, rep.relative_flow_error, rep.temperature_error, oss.str());
}

void System::summarize() {
  for (UnitId u : unit_order_) fs_.unit(u).summarize(fs_.streams());
}

ConvergenceReport System::simulate() {
  const ConvergenceReport rep = converge();
  summarize();
  if (log_enabled(LogLevel::DEBUG)) {
    std::ostringstream oss;
    oss << "system '" << id_ << "' simulated: " << rep.iterations << " iteration(s), "
        << rep.inner_iterations << " nested";
    log(LogLevel::DEBUG, oss.str());
  }
  return rep;
}

void System::reset_recycles() {
  if (recycle_) fs_.stream(*recycle_).empty();
  for (Element& e : elements_) {
    if (e.subsystem) e.subsystem->reset_recycles();
  }
}

} // namespace procsim
