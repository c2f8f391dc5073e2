#pragma once
#include <cstdint>
#include <span>

#include "agora/agent.hpp"
#include "agora/grid.hpp"

namespace agora {

// FNV-1a 64 over every agent (id, position, home position, inventories,
// mode, partner) followed by the grid's resources in row-major order.
// Two runs reached the same state iff their digests match (modulo collisions).
uint64_t state_digest(std::span<const Agent> agents, const SpatialGrid& grid);

} // namespace agora
