/*
================================================================================
Flowsheet: Network Declaration (Implementation)
FILE: cpp/engine/flowsheet/network.cpp
================================================================================
*/

#include "engine/flowsheet/network.hpp"

#include "engine/core/error.hpp"

#include <utility>

namespace procsim {

NetworkElement::NetworkElement(UnitId unit) : unit_(unit) {}

NetworkElement::NetworkElement(Network subnetwork)
    : sub_(std::make_shared<const Network>(std::move(subnetwork))) {}

UnitId NetworkElement::unit() const {
  PROCSIM_ENSURE(unit_.has_value(), ErrorCode::kTopology, "NetworkElement: element is a subnetwork");
  return *unit_;
}

const Network& NetworkElement::subnetwork() const {
  PROCSIM_ENSURE(sub_ != nullptr, ErrorCode::kTopology, "NetworkElement: element is a unit");
  return *sub_;
}

} // namespace procsim
