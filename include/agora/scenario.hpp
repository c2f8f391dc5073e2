#pragma once
#include <cstddef>
#include <optional>
#include <random>
#include <vector>

#include "agora/bundle.hpp"
#include "agora/config.hpp"
#include "agora/grid.hpp"
#include "agora/step_executor.hpp"
#include "agora/utility.hpp"

namespace agora {

struct AgentSpec {
  std::optional<Position> position;   // nullopt => random free cell; home = spawn cell
  UtilityFunction utility{};
  Bundle carrying{};
  Bundle home{};
};

struct ScenarioSpec {
  SimConfig config{};
  std::vector<AgentSpec> agents;           // agent id = index
  std::vector<ResourceCell> resources;     // placed first
  double random_resource_density{0.0};     // then topped up to this fraction of cells
};

// Builds the initial world. Random placement draws from `rng`; fixed positions
// may share a cell, random ones never land on an occupied cell.
// Throws std::invalid_argument on a bad ScenarioSpec and std::out_of_range for
// off-grid resources.
StepExecutor build_scenario(const ScenarioSpec& scenario, std::mt19937_64& rng);

// `n_agents` agents at random cells cycling through the three utility kinds
// with randomised weights, empty inventories, resources at `resource_density`.
ScenarioSpec random_scenario(const SimConfig& cfg, std::size_t n_agents, double resource_density,
                             std::mt19937_64& rng);

} // namespace agora
