/*
================================================================================
Flowsheet: Block (Implementation)
FILE: cpp/engine/flowsheet/block.cpp
================================================================================
Purpose:
  - Forward closure from a target unit over the parent's top-level elements,
    materialized once as a System view.
================================================================================
*/

#include "engine/flowsheet/block.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <utility>

namespace procsim {

namespace {

constexpr std::size_t kNoElement = std::numeric_limits<std::size_t>::max();

const std::vector<UnitId>& no_units() {
  static const std::vector<UnitId> empty;
  return empty;
}

}  // namespace

Block::Block(System& parent, UnitId target) : parent_(parent) {
  id_ = parent_.id() + "/" + parent_.flowsheet().unit(target).id();
  build_(target);
}

Block::Block(System& parent, StreamId target) : parent_(parent) {
  const Flowsheet& fs = parent_.flowsheet();
  id_ = parent_.id() + "/" + fs.stream(target).name;

  const auto consumer = fs.consumer_of(target);
  if (!consumer) {
    log(LogLevel::DEBUG, "block '" + id_ + "': stream has no consumer; block is empty");
    return;
  }
  build_(*consumer);
}

Block::~Block() = default;

void Block::build_(UnitId target) {
  const Flowsheet& fs = parent_.flowsheet();
  const std::size_t n_elements = parent_.elements().size();

  std::vector<std::size_t> element_of(fs.unit_count(), kNoElement);
  for (std::size_t i = 0; i < n_elements; ++i) {
    for (UnitId u : parent_.element_units(i)) element_of[to_index(u)] = i;
  }

  const std::size_t start = element_of[to_index(target)];
  if (start == kNoElement) {
    throw ValidationError("block '" + id_ + "': unit '" + fs.unit(target).id() +
                          "' is not part of system '" + parent_.id() + "'");
  }

  // Forward closure over top-level elements.
  std::vector<char> reached(n_elements, 0);
  std::deque<std::size_t> queue{start};
  reached[start] = 1;
  while (!queue.empty()) {
    const std::size_t a = queue.front();
    queue.pop_front();
    for (UnitId u : parent_.element_units(a)) {
      for (StreamId s : fs.unit(u).outs()) {
        const auto consumer = fs.consumer_of(s);
        if (!consumer) continue;
        const std::size_t b = element_of[to_index(*consumer)];
        if (b == kNoElement || reached[b]) continue;
        reached[b] = 1;
        queue.push_back(b);
      }
    }
  }

  std::optional<StreamId> recycle;
  if (parent_.recycle()) {
    const auto consumer = fs.consumer_of(*parent_.recycle());
    if (consumer && reached[element_of[to_index(*consumer)]]) recycle = parent_.recycle();
  }

  target_ = target;
  std::vector<System::Element> elements;
  for (std::size_t i = 0; i < n_elements; ++i) {
    if (reached[i]) elements.push_back(parent_.elements()[i]);
  }

  view_ = std::make_unique<System>(System::ViewKey{}, parent_.flowsheet(), id_, std::move(elements), recycle,
                                   parent_.settings());

  if (log_enabled(LogLevel::DEBUG)) {
    std::ostringstream oss;
    oss << "block '" << id_ << "': " << view_->units().size() << " of " << parent_.units().size()
        << " unit(s)" << (recycle ? ", recycle kept" : ", acyclic");
    log(LogLevel::DEBUG, oss.str());
  }
}

ConvergenceReport Block::simulate() {
  if (!view_) {
    ConvergenceReport rep;
    rep.converged = true;
    return rep;
  }
  view_->set_settings(parent_.settings());
  return view_->simulate();
}

bool Block::has_recycle() const noexcept {
  return view_ != nullptr && view_->recycle().has_value();
}

const std::vector<UnitId>& Block::units() const noexcept {
  return view_ ? view_->units() : no_units();
}

bool Block::covers(UnitId u) const {
  return view_ != nullptr && view_->contains(u);
}

} // namespace procsim
