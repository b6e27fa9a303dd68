#pragma once
/*
================================================================================
Flowsheet: Arena of Streams and Units
FILE: cpp/engine/flowsheet/flowsheet.hpp

Purpose:
  - Owns every Stream (via StreamTable) and every Unit of a process model.
  - Records the connection graph: each stream has at most one producing unit
    and at most one consuming unit. Fan-out needs an explicit Splitter.
  - Systems and Blocks hold references into this arena; it must outlive them.
================================================================================
*/

#include "engine/flowsheet/stream.hpp"
#include "engine/flowsheet/unit.hpp"

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace procsim {

class Flowsheet {
 public:
  explicit Flowsheet(std::vector<std::string> components);

  Flowsheet(const Flowsheet&) = delete;
  Flowsheet& operator=(const Flowsheet&) = delete;

  StreamId add_stream(std::string name, std::vector<double> flows = {},
                      double T = kStandardTemperatureK, double P = kStandardPressurePa);

  // Convenience: flows given as (component, kg/h) pairs.
  StreamId add_feed(std::string name, const std::vector<std::pair<std::string, double>>& flows,
                    double T = kStandardTemperatureK, double P = kStandardPressurePa);

  // Construct and register a unit. Connectivity is validated before the unit
  // is accepted.
  template <class U, class... Args>
  U& add_unit(Args&&... args) {
    static_assert(std::is_base_of<Unit, U>::value, "add_unit requires a Unit subclass");
    auto u = std::make_unique<U>(std::forward<Args>(args)...);
    U& ref = *u;
    register_unit_(std::move(u));
    return ref;
  }

  StreamTable& streams() noexcept { return streams_; }
  const StreamTable& streams() const noexcept { return streams_; }

  Stream& stream(StreamId id) { return streams_.at(id); }
  const Stream& stream(StreamId id) const { return streams_.at(id); }

  Unit& unit(UnitId id);
  const Unit& unit(UnitId id) const;
  std::size_t unit_count() const noexcept { return units_.size(); }

  // Throws ValidationError when the id is unknown.
  UnitId unit_id(const std::string& id) const;
  UnitId unit_id(const Unit& u) const;

  std::optional<UnitId> producer_of(StreamId s) const;
  std::optional<UnitId> consumer_of(StreamId s) const;

 private:
  void register_unit_(std::unique_ptr<Unit> u);

  StreamTable streams_;
  std::vector<std::unique_ptr<Unit>> units_;
  std::vector<std::optional<UnitId>> producer_;  // by stream index
  std::vector<std::optional<UnitId>> consumer_;  // by stream index
};

} // namespace procsim
