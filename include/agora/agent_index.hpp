#pragma once
#include <cstddef>
#include <span>
#include <vector>

#include "agora/agent.hpp"
#include "agora/types.hpp"

namespace agora {

// Bucketed index of agent positions, rebuilt once per step before decisions.
class AgentSpatialGrid {
public:
  AgentSpatialGrid(Coord width, Coord height);

  // O(n). Only the buckets touched by the previous rebuild are cleared.
  // Throws std::out_of_range if an agent stands off the grid.
  void rebuild(std::span<const Agent> agents);

  // Ids of agents within Manhattan `radius` of `center` (inclusive, the
  // center cell included), sorted ascending by id.
  std::vector<AgentId> query_radius(Position center, int32_t radius) const;

  std::size_t size() const noexcept { return indexed_; }

private:
  Coord width_{};
  Coord height_{};
  std::vector<std::vector<AgentId>> cells_;
  std::vector<std::size_t> occupied_;
  std::size_t indexed_{0};

  std::size_t index_of(Position p) const noexcept {
    return static_cast<std::size_t>(p.y) * static_cast<std::size_t>(width_) +
           static_cast<std::size_t>(p.x);
  }
};

} // namespace agora
