#include "agora/agent_index.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace agora {

AgentSpatialGrid::AgentSpatialGrid(Coord width, Coord height) : width_(width), height_(height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("agent index dimensions must be positive");
  }
  cells_.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
}

void AgentSpatialGrid::rebuild(std::span<const Agent> agents) {
  for (std::size_t i : occupied_) cells_[i].clear();
  occupied_.clear();
  indexed_ = 0;

  for (const auto& a : agents) {
    const Position p = a.position();
    if (p.x < 0 || p.y < 0 || p.x >= width_ || p.y >= height_) {
      throw std::out_of_range("agent " + std::to_string(a.id()) + " at (" +
                              std::to_string(p.x) + "," + std::to_string(p.y) +
                              ") is outside the grid");
    }
    auto& bucket = cells_[index_of(p)];
    if (bucket.empty()) occupied_.push_back(index_of(p));
    bucket.push_back(a.id());
    ++indexed_;
  }
}

std::vector<AgentId> AgentSpatialGrid::query_radius(Position center, int32_t radius) const {
  std::vector<AgentId> out;
  if (radius < 0) return out;
  // No cell is farther than width + height; keeps the bounds below from overflowing.
  radius = std::min<int32_t>(radius, width_ + height_);

  const Coord y0 = std::max<Coord>(0, center.y - radius);
  const Coord y1 = std::min<Coord>(height_ - 1, center.y + radius);
  for (Coord y = y0; y <= y1; ++y) {
    const int32_t budget = radius - (y < center.y ? center.y - y : y - center.y);
    const Coord x0 = std::max<Coord>(0, center.x - budget);
    const Coord x1 = std::min<Coord>(width_ - 1, center.x + budget);
    for (Coord x = x0; x <= x1; ++x) {
      const auto& bucket = cells_[index_of(Position{x, y})];
      out.insert(out.end(), bucket.begin(), bucket.end());
    }
  }

  // Bucket order depends on scan order; ids are the stable key.
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace agora
