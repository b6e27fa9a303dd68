#pragma once
/*
================================================================================
Flowsheet: Streams + Stream Arena
FILE: cpp/engine/flowsheet/stream.hpp

Purpose:
  - Material flow record consumed and produced by units.
  - StreamTable: arena of streams addressed by stable StreamId indices, so the
    convergence loop can snapshot/restore a specific stream without copying
    the whole graph.

Units:
  - flows: kg/h per component (component order owned by the StreamTable)
  - T: K, P: Pa, price: USD/kg

Notes:
  - No thermodynamics here. Mixing uses flow-weighted temperature and the
    minimum inlet pressure; a property engine can replace mix_from() later.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace procsim {

enum class StreamId : std::size_t {};

inline constexpr std::size_t to_index(StreamId id) noexcept {
  return static_cast<std::size_t>(id);
}

inline constexpr double kStandardTemperatureK = 298.15;
inline constexpr double kStandardPressurePa = 101325.0;

struct Stream {
  std::string name;
  std::vector<double> flows;  // kg/h per component
  double T = kStandardTemperatureK;
  double P = kStandardPressurePa;
  char phase = 'l';
  double price = 0.0;  // USD/kg

  double total_flow() const noexcept;
  bool is_empty() const noexcept;

  // Zero all flows; T/P/phase reset to defaults.
  void empty() noexcept;

  // Copy flows, T, P and phase (not name or price).
  void copy_like(const Stream& other);
  void copy_flow(const Stream& other);

  // Sum flows of `inlets`; flow-weighted T; min P; phase of the largest inlet.
  void mix_from(const std::vector<const Stream*>& inlets);

  void scale(double factor);

  // USD/h
  double cost() const noexcept { return price * total_flow(); }

  // Convergence state: flows..., T, P.
  std::vector<double> state_vector() const;
  void set_state_vector(const std::vector<double>& x);

  // Throws InfeasibleStateError on negative/non-finite flow, or T/P <= 0.
  void check_feasible() const;
};

// Arena of streams sharing one component list.
class StreamTable {
 public:
  explicit StreamTable(std::vector<std::string> components);

  StreamId add(std::string name, std::vector<double> flows = {},
               double T = kStandardTemperatureK, double P = kStandardPressurePa);

  Stream& at(StreamId id);
  const Stream& at(StreamId id) const;

  std::optional<StreamId> find(const std::string& name) const;

  std::size_t size() const noexcept { return streams_.size(); }
  std::size_t component_count() const noexcept { return components_.size(); }
  const std::vector<std::string>& components() const noexcept { return components_; }

  // Throws ValidationError for unknown components.
  std::size_t component_index(const std::string& component) const;

  std::vector<Stream> snapshot() const { return streams_; }
  void restore(const std::vector<Stream>& snap);

 private:
  std::vector<std::string> components_;
  std::vector<Stream> streams_;
};

} // namespace procsim
