/*
================================================================================
Flowsheet: Streams (Implementation)
FILE: cpp/engine/flowsheet/stream.cpp
================================================================================
*/

#include "engine/flowsheet/stream.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace procsim {

double Stream::total_flow() const noexcept {
  double F = 0.0;
  for (double f : flows) F += f;
  return F;
}

bool Stream::is_empty() const noexcept {
  return std::all_of(flows.begin(), flows.end(), [](double f) { return f == 0.0; });
}

void Stream::empty() noexcept {
  std::fill(flows.begin(), flows.end(), 0.0);
  T = kStandardTemperatureK;
  P = kStandardPressurePa;
}

void Stream::copy_flow(const Stream& other) {
  PROCSIM_ENSURE(other.flows.size() == flows.size(), ErrorCode::kInvalidArgument,
                 "copy_flow: component count mismatch between '" + other.name + "' and '" + name + "'");
  flows = other.flows;
}

void Stream::copy_like(const Stream& other) {
  copy_flow(other);
  T = other.T;
  P = other.P;
  phase = other.phase;
}

void Stream::mix_from(const std::vector<const Stream*>& inlets) {
  std::fill(flows.begin(), flows.end(), 0.0);
  if (inlets.empty()) return;

  double F_total = 0.0;
  double FT = 0.0;
  double P_min = inlets.front()->P;
  double F_max = -1.0;

  for (const Stream* s : inlets) {
    PROCSIM_ENSURE(s != nullptr, ErrorCode::kInvalidArgument, "mix_from: null inlet");
    PROCSIM_ENSURE(s->flows.size() == flows.size(), ErrorCode::kInvalidArgument,
                   "mix_from: component count mismatch for inlet '" + s->name + "'");
    for (std::size_t i = 0; i < flows.size(); ++i) flows[i] += s->flows[i];

    const double F = s->total_flow();
    F_total += F;
    FT += F * s->T;
    P_min = std::min(P_min, s->P);
    if (F > F_max) {
      F_max = F;
      phase = s->phase;
    }
  }

  T = (F_total > 0.0) ? FT / F_total : inlets.front()->T;
  P = P_min;
}

void Stream::scale(double factor) {
  for (double& f : flows) f *= factor;
}

std::vector<double> Stream::state_vector() const {
  std::vector<double> x(flows);
  x.push_back(T);
  x.push_back(P);
  return x;
}

void Stream::set_state_vector(const std::vector<double>& x) {
  PROCSIM_ENSURE(x.size() == flows.size() + 2, ErrorCode::kInvalidArgument,
                 "set_state_vector: size mismatch for '" + name + "'");
  std::copy(x.begin(), x.begin() + static_cast<std::ptrdiff_t>(flows.size()), flows.begin());
  T = x[flows.size()];
  P = x[flows.size() + 1];
}

void Stream::check_feasible() const {
  for (std::size_t i = 0; i < flows.size(); ++i) {
    if (!is_finite(flows[i]) || flows[i] < 0.0) {
      std::ostringstream oss;
      oss << "stream '" << name << "': infeasible flow " << flows[i] << " kg/h for component " << i;
      throw InfeasibleStateError(oss.str());
    }
  }
  if (!is_finite(T) || T <= 0.0) {
    std::ostringstream oss;
    oss << "stream '" << name << "': infeasible temperature " << T << " K";
    throw InfeasibleStateError(oss.str());
  }
  if (!is_finite(P) || P <= 0.0) {
    std::ostringstream oss;
    oss << "stream '" << name << "': infeasible pressure " << P << " Pa";
    throw InfeasibleStateError(oss.str());
  }
}

// ----------------------------- StreamTable -----------------------------------

StreamTable::StreamTable(std::vector<std::string> components)
    : components_(std::move(components)) {
  if (components_.empty()) throw ValidationError("StreamTable: component list is empty");
  for (std::size_t i = 0; i < components_.size(); ++i) {
    for (std::size_t j = i + 1; j < components_.size(); ++j) {
      if (components_[i] == components_[j]) {
        throw ValidationError("StreamTable: duplicate component '" + components_[i] + "'");
      }
    }
  }
}

StreamId StreamTable::add(std::string name, std::vector<double> flows, double T, double P) {
  if (name.empty()) throw ValidationError("StreamTable: stream name is empty");
  if (find(name)) throw ValidationError("StreamTable: duplicate stream '" + name + "'");
  if (flows.empty()) flows.assign(components_.size(), 0.0);
  if (flows.size() != components_.size()) {
    throw ValidationError("StreamTable: stream '" + name + "' flow vector does not match component count");
  }

  Stream s;
  s.name = std::move(name);
  s.flows = std::move(flows);
  s.T = T;
  s.P = P;
  s.check_feasible();

  streams_.push_back(std::move(s));
  return static_cast<StreamId>(streams_.size() - 1);
}

Stream& StreamTable::at(StreamId id) {
  PROCSIM_ENSURE(to_index(id) < streams_.size(), ErrorCode::kOutOfRange, "StreamTable: unknown stream id");
  return streams_[to_index(id)];
}

const Stream& StreamTable::at(StreamId id) const {
  PROCSIM_ENSURE(to_index(id) < streams_.size(), ErrorCode::kOutOfRange, "StreamTable: unknown stream id");
  return streams_[to_index(id)];
}

std::optional<StreamId> StreamTable::find(const std::string& name) const {
  for (std::size_t i = 0; i < streams_.size(); ++i) {
    if (streams_[i].name == name) return static_cast<StreamId>(i);
  }
  return std::nullopt;
}

std::size_t StreamTable::component_index(const std::string& component) const {
  for (std::size_t i = 0; i < components_.size(); ++i) {
    if (components_[i] == component) return i;
  }
  throw ValidationError("StreamTable: unknown component '" + component + "'");
}

void StreamTable::restore(const std::vector<Stream>& snap) {
  PROCSIM_ENSURE(snap.size() == streams_.size(), ErrorCode::kInvalidArgument,
                 "StreamTable: snapshot size mismatch");
  streams_ = snap;
}

} // namespace procsim
