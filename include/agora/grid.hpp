#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "agora/types.hpp"

namespace agora {

struct ResourceCell {
  Position position{};
  Good     good{Good::Good1};

  friend constexpr bool operator==(const ResourceCell&, const ResourceCell&) = default;
};

// Dense width x height store, at most one resource per cell.
// Every sequence it hands out is in row-major order.
class SpatialGrid {
public:
  SpatialGrid(Coord width, Coord height);  // throws std::invalid_argument if not positive

  Coord width() const noexcept { return width_; }
  Coord height() const noexcept { return height_; }
  bool in_bounds(Position p) const noexcept {
    return p.x >= 0 && p.y >= 0 && p.x < width_ && p.y < height_;
  }

  // The mutating/lookup calls below throw std::out_of_range for off-grid cells.
  void add_resource(Position p, Good g);        // replaces whatever is there
  std::optional<Good> remove_resource(Position p);
  std::optional<ResourceCell> resource_at(Position p) const;
  bool has_resource(Position p) const { return resource_at(p).has_value(); }

  std::size_t resource_count() const noexcept { return count_; }

  std::vector<ResourceCell> iterate_resources() const;

  // Resources with manhattan_distance(center, cell) <= radius. Clipped to the grid.
  std::vector<ResourceCell> resources_within(Position center, int32_t radius) const;

  std::vector<Position> empty_cells() const;

private:
  Coord width_{};
  Coord height_{};
  std::vector<std::optional<Good>> cells_;
  std::size_t count_{0};

  std::size_t index_of(Position p) const noexcept {
    return static_cast<std::size_t>(p.y) * static_cast<std::size_t>(width_) +
           static_cast<std::size_t>(p.x);
  }
  void check_bounds(Position p) const;
};

} // namespace agora
