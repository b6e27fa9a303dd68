#pragma once
/*
================================================================================
Flowsheet: Network Declaration
FILE: cpp/engine/flowsheet/network.hpp

Purpose:
  - Programmatic description of an execution path: an ordered list of units
    and nested networks (subsystems), plus an optional recycle (tear) stream.
  - Pure data. A System validates the order when it is built from a Network.

Example:
  Network inner{"reaction_loop", {mixer, reactor, splitter}, recycle};
  Network plant{"plant", {feed_tank, inner, product_tank}};
================================================================================
*/

#include "engine/flowsheet/stream.hpp"
#include "engine/flowsheet/unit.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace procsim {

struct Network;

// One path entry: a unit or a nested network.
class NetworkElement {
 public:
  NetworkElement(UnitId unit);
  NetworkElement(Network subnetwork);

  bool is_unit() const noexcept { return unit_.has_value(); }
  UnitId unit() const;
  const Network& subnetwork() const;

 private:
  std::optional<UnitId> unit_;
  std::shared_ptr<const Network> sub_;
};

struct Network {
  std::string id;
  std::vector<NetworkElement> path;
  std::optional<StreamId> recycle;

  Network() = default;
  Network(std::string id_, std::vector<NetworkElement> path_, std::optional<StreamId> recycle_ = std::nullopt)
      : id(std::move(id_)), path(std::move(path_)), recycle(recycle_) {}
};

} // namespace procsim
