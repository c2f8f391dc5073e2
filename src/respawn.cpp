#include "agora/respawn.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace agora {

std::size_t RespawnScheduler::target_count(const SpatialGrid& grid) const noexcept {
  const double cells = static_cast<double>(grid.width()) * static_cast<double>(grid.height());
  const double density = std::clamp(cfg_.target_density, 0.0, 1.0);
  return static_cast<std::size_t>(std::floor(density * cells));
}

std::size_t RespawnScheduler::replenish(SpatialGrid& grid, std::mt19937_64& rng) const {
  if (cfg_.max_per_step == 0) return 0;

  const double rate = std::clamp(cfg_.rate, 0.0, 1.0);
  if (rate <= 0.0) return 0;

  const std::size_t target = target_count(grid);
  const std::size_t current = grid.resource_count();
  if (target == 0 || current >= target) return 0;

  const std::size_t deficit = target - current;
  const auto desired = static_cast<std::size_t>(std::ceil(static_cast<double>(deficit) * rate));
  const std::size_t to_spawn =
      std::min({desired, static_cast<std::size_t>(cfg_.max_per_step), deficit});
  if (to_spawn == 0) return 0;

  std::vector<Position> empties = grid.empty_cells();
  if (empties.empty()) return 0;
  std::shuffle(empties.begin(), empties.end(), rng);

  std::bernoulli_distribution coin(0.5);
  const std::size_t n = std::min(to_spawn, empties.size());
  for (std::size_t i = 0; i < n; ++i) {
    grid.add_resource(empties[i], coin(rng) ? Good::Good1 : Good::Good2);
  }
  return n;
}

} // namespace agora
