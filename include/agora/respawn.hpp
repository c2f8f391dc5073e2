#pragma once
#include <cstddef>
#include <random>

#include "agora/config.hpp"
#include "agora/grid.hpp"

namespace agora {

// Tops the grid back up toward a target resource density between steps.
//
//   target  = floor(target_density * cells)
//   deficit = target - current
//   spawn   = min(ceil(deficit * rate), max_per_step, deficit)
//
// Spawned cells are the first `spawn` entries of the shuffled empty-cell list;
// each gets Good1 or Good2 on a fair coin. The target is never overshot.
class RespawnScheduler {
public:
  explicit RespawnScheduler(RespawnConfig cfg) : cfg_(cfg) {}

  const RespawnConfig& config() const noexcept { return cfg_; }

  // Whether step number `step` (0-based, before increment) is a respawn step.
  bool due(StepNo step) const noexcept {
    return cfg_.enabled && cfg_.interval > 0 && step % cfg_.interval == 0;
  }

  std::size_t target_count(const SpatialGrid& grid) const noexcept;

  // Returns the number of resources placed.
  std::size_t replenish(SpatialGrid& grid, std::mt19937_64& rng) const;

private:
  RespawnConfig cfg_;
};

} // namespace agora
