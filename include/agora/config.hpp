#pragma once
#include <cstdint>

#include "agora/types.hpp"

namespace agora {

// Which behaviours the decision engine may choose. Both off => every agent idles.
struct Features {
  bool forage_enabled{true};
  bool trade_enabled{true};
};

struct RespawnConfig {
  bool     enabled{false};
  double   target_density{0.25};  // fraction of cells holding a resource
  double   rate{0.25};            // fraction of the deficit refilled per respawn
  uint32_t max_per_step{100};
  uint32_t interval{1};           // respawn every `interval` steps
};

// Read once at scenario construction and passed by const reference afterwards.
struct SimConfig {
  Coord grid_width{20};
  Coord grid_height{20};

  int32_t perception_radius{8};      // Manhattan
  double  distance_discount{0.15};   // k in exp(-k * d)
  double  min_trade_gain{1e-5};      // strict Pareto threshold per party
  Qty     carrying_capacity{100000};

  Features features{};
  RespawnConfig respawn{};

  // Throws std::invalid_argument naming the first offending field.
  void validate() const;

  bool in_bounds(const Position& p) const noexcept {
    return p.x >= 0 && p.y >= 0 && p.x < grid_width && p.y < grid_height;
  }
};

} // namespace agora
