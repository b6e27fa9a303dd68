#pragma once
/*
================================================================================
Flowsheet: Block (Downstream Sub-System)
FILE: cpp/engine/flowsheet/block.hpp

Purpose:
  - Minimal executable portion of a System that must be re-run after a change
    to one unit or stream: the target's element plus everything reachable
    downstream of it.
  - Built once for a coupled parameter and reused for every sample.

Derivation:
  - Work on the parent's top-level elements. Element A reaches B when a stream
    produced in A is consumed in B; the recycle edge (producer element ->
    consumer element) counts like any other edge.
  - A stream target maps to its consuming unit. An unconsumed stream yields an
    empty Block (simulate() is then a no-op).
  - Reaching the recycle consumer keeps the recycle, so the whole loop is
    re-converged. Otherwise the Block is acyclic and runs each element once.
  - A nested System holding the target is kept whole.

Hardening:
  - The reduced path is validated like any System path at construction.
================================================================================
*/

#include "engine/flowsheet/system.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace procsim {

class Block {
 public:
  Block(System& parent, UnitId target);
  Block(System& parent, StreamId target);
  ~Block();

  Block(const Block&) = delete;
  Block& operator=(const Block&) = delete;

  // Same contract as System::simulate(), with the parent's current settings.
  ConvergenceReport simulate();

  const std::string& id() const noexcept { return id_; }
  bool empty() const noexcept { return view_ == nullptr; }
  bool has_recycle() const noexcept;

  // Execution order of the units this Block re-runs.
  const std::vector<UnitId>& units() const noexcept;
  bool covers(UnitId u) const;

  // Unit whose change this Block propagates; empty for an empty Block.
  const std::optional<UnitId>& target() const noexcept { return target_; }

  const System& parent() const noexcept { return parent_; }

 private:
  void build_(UnitId target);

  System& parent_;
  std::string id_;
  std::optional<UnitId> target_;
  std::unique_ptr<System> view_;
};

} // namespace procsim
