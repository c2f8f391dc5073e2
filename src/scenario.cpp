#include "agora/scenario.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace agora {

namespace {

std::vector<Position> all_cells(const SimConfig& cfg) {
  std::vector<Position> out;
  out.reserve(static_cast<std::size_t>(cfg.grid_width) * static_cast<std::size_t>(cfg.grid_height));
  for (Coord y = 0; y < cfg.grid_height; ++y) {
    for (Coord x = 0; x < cfg.grid_width; ++x) out.push_back(Position{x, y});
  }
  return out;
}

void scatter_resources(SpatialGrid& grid, double density, std::mt19937_64& rng) {
  const double cells = static_cast<double>(grid.width()) * static_cast<double>(grid.height());
  const auto target = static_cast<std::size_t>(std::floor(density * cells));
  if (target <= grid.resource_count()) return;

  std::vector<Position> empties = grid.empty_cells();
  std::shuffle(empties.begin(), empties.end(), rng);

  std::bernoulli_distribution coin(0.5);
  const std::size_t n = std::min(target - grid.resource_count(), empties.size());
  for (std::size_t i = 0; i < n; ++i) {
    grid.add_resource(empties[i], coin(rng) ? Good::Good1 : Good::Good2);
  }
}

} // namespace

StepExecutor build_scenario(const ScenarioSpec& scenario, std::mt19937_64& rng) {
  const SimConfig& cfg = scenario.config;
  cfg.validate();

  if (!(scenario.random_resource_density >= 0.0 && scenario.random_resource_density <= 1.0)) {
    throw std::invalid_argument("scenario: random_resource_density must be within [0, 1]");
  }

  SpatialGrid grid(cfg.grid_width, cfg.grid_height);
  for (const auto& r : scenario.resources) grid.add_resource(r.position, r.good);
  if (scenario.random_resource_density > 0.0) {
    scatter_resources(grid, scenario.random_resource_density, rng);
  }

  // Cells not claimed by a fixed position, in random order.
  std::vector<Position> free_cells = all_cells(cfg);
  for (const auto& a : scenario.agents) {
    if (!a.position) continue;
    if (!cfg.in_bounds(*a.position)) {
      throw std::invalid_argument("scenario: agent position (" + std::to_string(a.position->x) +
                                  "," + std::to_string(a.position->y) + ") is off the grid");
    }
    std::erase(free_cells, *a.position);
  }
  std::shuffle(free_cells.begin(), free_cells.end(), rng);

  std::vector<Agent> agents;
  agents.reserve(scenario.agents.size());
  std::size_t next_free = 0;
  for (std::size_t i = 0; i < scenario.agents.size(); ++i) {
    const AgentSpec& a = scenario.agents[i];
    Position pos{};
    if (a.position) {
      pos = *a.position;
    } else {
      if (next_free >= free_cells.size()) {
        throw std::invalid_argument("scenario: not enough free cells for " +
                                    std::to_string(scenario.agents.size()) + " agents");
      }
      pos = free_cells[next_free++];
    }
    agents.emplace_back(static_cast<AgentId>(i), pos, a.utility, cfg.carrying_capacity,
                        a.carrying, a.home);
  }

  return StepExecutor(cfg, std::move(grid), std::move(agents));
}

ScenarioSpec random_scenario(const SimConfig& cfg, std::size_t n_agents, double resource_density,
                             std::mt19937_64& rng) {
  ScenarioSpec scenario{};
  scenario.config = cfg;
  scenario.random_resource_density = resource_density;
  scenario.agents.resize(n_agents);

  std::uniform_real_distribution<double> share(0.2, 0.8);
  std::uniform_int_distribution<int> weight(1, 3);

  for (std::size_t i = 0; i < n_agents; ++i) {
    auto& a = scenario.agents[i];
    if (i % 3 == 0) {
      a.utility = cobb_douglas(share(rng));
      continue;
    }
    // Draw in a fixed order; argument evaluation order is unspecified.
    const double wa = weight(rng);
    const double wb = weight(rng);
    a.utility = make_utility(i % 3 == 1 ? UtilityKind::PerfectSubstitutes
                                        : UtilityKind::PerfectComplements,
                             wa, wb);
  }
  return scenario;
}

} // namespace agora
