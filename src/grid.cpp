#include "agora/grid.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace agora {

SpatialGrid::SpatialGrid(Coord width, Coord height) : width_(width), height_(height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("grid dimensions must be positive, got " +
                                std::to_string(width) + "x" + std::to_string(height));
  }
  cells_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), std::nullopt);
}

void SpatialGrid::check_bounds(Position p) const {
  if (!in_bounds(p)) {
    throw std::out_of_range("cell (" + std::to_string(p.x) + "," + std::to_string(p.y) +
                            ") out of bounds for " + std::to_string(width_) + "x" +
                            std::to_string(height_) + " grid");
  }
}

void SpatialGrid::add_resource(Position p, Good g) {
  check_bounds(p);
  auto& c = cells_[index_of(p)];
  if (!c) ++count_;
  c = g;
}

std::optional<Good> SpatialGrid::remove_resource(Position p) {
  check_bounds(p);
  auto& c = cells_[index_of(p)];
  if (!c) return std::nullopt;
  const Good g = *c;
  c.reset();
  --count_;
  return g;
}

std::optional<ResourceCell> SpatialGrid::resource_at(Position p) const {
  check_bounds(p);
  const auto& c = cells_[index_of(p)];
  if (!c) return std::nullopt;
  return ResourceCell{p, *c};
}

std::vector<ResourceCell> SpatialGrid::iterate_resources() const {
  std::vector<ResourceCell> out;
  out.reserve(count_);
  for (Coord y = 0; y < height_; ++y) {
    for (Coord x = 0; x < width_; ++x) {
      const Position p{x, y};
      if (const auto& c = cells_[index_of(p)]) out.push_back(ResourceCell{p, *c});
    }
  }
  return out;
}

std::vector<ResourceCell> SpatialGrid::resources_within(Position center, int32_t radius) const {
  std::vector<ResourceCell> out;
  if (radius < 0 || count_ == 0) return out;
  // No cell is farther than width + height; keeps the bounds below from overflowing.
  radius = std::min<int32_t>(radius, width_ + height_);

  // Diamond scan, rows top to bottom, each row left to right => row-major.
  const Coord y0 = std::max<Coord>(0, center.y - radius);
  const Coord y1 = std::min<Coord>(height_ - 1, center.y + radius);
  for (Coord y = y0; y <= y1; ++y) {
    const int32_t budget = radius - (y < center.y ? center.y - y : y - center.y);
    const Coord x0 = std::max<Coord>(0, center.x - budget);
    const Coord x1 = std::min<Coord>(width_ - 1, center.x + budget);
    for (Coord x = x0; x <= x1; ++x) {
      const Position p{x, y};
      if (const auto& c = cells_[index_of(p)]) out.push_back(ResourceCell{p, *c});
    }
  }
  return out;
}

std::vector<Position> SpatialGrid::empty_cells() const {
  std::vector<Position> out;
  out.reserve(cells_.size() - count_);
  for (Coord y = 0; y < height_; ++y) {
    for (Coord x = 0; x < width_; ++x) {
      const Position p{x, y};
      if (!cells_[index_of(p)]) out.push_back(p);
    }
  }
  return out;
}

} // namespace agora
