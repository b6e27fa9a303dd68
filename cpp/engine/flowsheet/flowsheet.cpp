/*
================================================================================
Flowsheet: Unit/Stream Arena (Implementation)
FILE: cpp/engine/flowsheet/flowsheet.cpp
================================================================================
Hardening:
  - A stream has at most one producer and one consumer; registration is
    checked before the unit is stored.
================================================================================
*/

#include "engine/flowsheet/flowsheet.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"

namespace procsim {

Flowsheet::Flowsheet(std::vector<std::string> components) : streams_(std::move(components)) {}

StreamId Flowsheet::add_stream(std::string name, std::vector<double> flows, double T, double P) {
  const StreamId id = streams_.add(std::move(name), std::move(flows), T, P);
  producer_.resize(streams_.size());
  consumer_.resize(streams_.size());
  return id;
}

StreamId Flowsheet::add_feed(std::string name,
                             const std::vector<std::pair<std::string, double>>& flows,
                             double T, double P) {
  std::vector<double> f(streams_.component_count(), 0.0);
  for (const auto& kv : flows) f[streams_.component_index(kv.first)] += kv.second;
  return add_stream(std::move(name), std::move(f), T, P);
}

Unit& Flowsheet::unit(UnitId id) {
  PROCSIM_ENSURE(to_index(id) < units_.size(), ErrorCode::kOutOfRange, "Flowsheet: unknown unit id");
  return *units_[to_index(id)];
}

const Unit& Flowsheet::unit(UnitId id) const {
  PROCSIM_ENSURE(to_index(id) < units_.size(), ErrorCode::kOutOfRange, "Flowsheet: unknown unit id");
  return *units_[to_index(id)];
}

UnitId Flowsheet::unit_id(const std::string& id) const {
  for (std::size_t i = 0; i < units_.size(); ++i) {
    if (units_[i]->id() == id) return static_cast<UnitId>(i);
  }
  throw ValidationError("Flowsheet: unknown unit '" + id + "'");
}

UnitId Flowsheet::unit_id(const Unit& u) const {
  for (std::size_t i = 0; i < units_.size(); ++i) {
    if (units_[i].get() == &u) return static_cast<UnitId>(i);
  }
  throw ValidationError("Flowsheet: unit '" + u.id() + "' is not registered here");
}

std::optional<UnitId> Flowsheet::producer_of(StreamId s) const {
  PROCSIM_ENSURE(to_index(s) < producer_.size(), ErrorCode::kOutOfRange, "Flowsheet: unknown stream id");
  return producer_[to_index(s)];
}

std::optional<UnitId> Flowsheet::consumer_of(StreamId s) const {
  PROCSIM_ENSURE(to_index(s) < consumer_.size(), ErrorCode::kOutOfRange, "Flowsheet: unknown stream id");
  return consumer_[to_index(s)];
}

void Flowsheet::register_unit_(std::unique_ptr<Unit> u) {
  for (const auto& other : units_) {
    if (other->id() == u->id()) throw ValidationError("Flowsheet: duplicate unit '" + u->id() + "'");
  }

  // Validate all ports before touching the connection tables.
  for (StreamId s : u->ins()) {
    if (to_index(s) >= streams_.size()) {
      throw ValidationError("unit '" + u->id() + "': unknown inlet stream");
    }
    if (consumer_[to_index(s)]) {
      throw ValidationError("stream '" + streams_.at(s).name + "' already feeds unit '" +
                            unit(*consumer_[to_index(s)]).id() + "'; use a Splitter for fan-out");
    }
  }
  for (StreamId s : u->outs()) {
    if (to_index(s) >= streams_.size()) {
      throw ValidationError("unit '" + u->id() + "': unknown outlet stream");
    }
    if (producer_[to_index(s)]) {
      throw ValidationError("stream '" + streams_.at(s).name + "' is already produced by unit '" +
                            unit(*producer_[to_index(s)]).id() + "'");
    }
  }
  for (std::size_t i = 0; i < u->ins().size(); ++i) {
    for (std::size_t j = i + 1; j < u->ins().size(); ++j) {
      if (u->ins()[i] == u->ins()[j]) throw ValidationError("unit '" + u->id() + "': duplicate inlet stream");
    }
  }
  for (std::size_t i = 0; i < u->outs().size(); ++i) {
    for (std::size_t j = i + 1; j < u->outs().size(); ++j) {
      if (u->outs()[i] == u->outs()[j]) throw ValidationError("unit '" + u->id() + "': duplicate outlet stream");
    }
  }

  const UnitId id = static_cast<UnitId>(units_.size());
  for (StreamId s : u->ins()) consumer_[to_index(s)] = id;
  for (StreamId s : u->outs()) producer_[to_index(s)] = id;
  units_.push_back(std::move(u));
}

} // namespace procsim
