#pragma once
#include <algorithm>
#include <span>

#include "agora/agent.hpp"
#include "agora/agent_index.hpp"
#include "agora/config.hpp"
#include "agora/grid.hpp"

namespace agora {

// Read-only snapshot handed to the decision engine during Phase 1.
// Agents are stored ascending by id; lookup is a binary search.
struct WorldView {
  StepNo step{0};
  std::span<const Agent> agents;
  const SpatialGrid* grid{nullptr};
  const AgentSpatialGrid* agent_index{nullptr};
  const SimConfig* config{nullptr};

  const Agent* find_agent(AgentId id) const noexcept;
};

inline WorldView make_view(StepNo step, std::span<const Agent> agents, const SpatialGrid& grid,
                           const AgentSpatialGrid& index, const SimConfig& cfg) {
  WorldView v{};
  v.step = step;
  v.agents = agents;
  v.grid = &grid;
  v.agent_index = &index;
  v.config = &cfg;
  return v;
}

inline const Agent* WorldView::find_agent(AgentId id) const noexcept {
  auto it = std::lower_bound(agents.begin(), agents.end(), id,
                             [](const Agent& a, AgentId key) { return a.id() < key; });
  if (it == agents.end() || it->id() != id) return nullptr;
  return &*it;
}

} // namespace agora
