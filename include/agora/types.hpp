#pragma once
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace agora {

using AgentId = uint32_t;
using Coord   = int32_t;
using Qty     = int32_t;   // units of a good
using StepNo  = uint64_t;

enum class Good : uint8_t { Good1 = 0, Good2 = 1 };

inline constexpr Good other(Good g) noexcept {
  return (g == Good::Good1) ? Good::Good2 : Good::Good1;
}

inline std::string_view to_string(Good g) noexcept {
  return (g == Good::Good1) ? "good1" : "good2";
}

struct Position {
  Coord x{};
  Coord y{};

  friend constexpr bool operator==(const Position&, const Position&) = default;
};

// Row-major: y first, then x. Every deterministic ordering of cells uses this.
inline constexpr bool row_major_less(const Position& a, const Position& b) noexcept {
  if (a.y != b.y) return a.y < b.y;
  return a.x < b.x;
}

inline constexpr int32_t manhattan_distance(const Position& a, const Position& b) noexcept {
  const int32_t dx = a.x - b.x;
  const int32_t dy = a.y - b.y;
  return (dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy);
}

enum class Direction : uint8_t { East = 0, West = 1, South = 2, North = 3 };

inline constexpr Position step_toward(Position p, Direction d) noexcept {
  switch (d) {
    case Direction::East:  return Position{p.x + 1, p.y};
    case Direction::West:  return Position{p.x - 1, p.y};
    case Direction::South: return Position{p.x, p.y + 1};
    case Direction::North: return Position{p.x, p.y - 1};
  }
  return p;
}

// One Manhattan step from `from` toward `to`; the x axis is reduced before y.
// Returns false when already there.
inline constexpr bool direction_toward(Position from, Position to, Direction& out) noexcept {
  if (to.x > from.x) { out = Direction::East;  return true; }
  if (to.x < from.x) { out = Direction::West;  return true; }
  if (to.y > from.y) { out = Direction::South; return true; }
  if (to.y < from.y) { out = Direction::North; return true; }
  return false;
}

inline std::string_view to_string(Direction d) noexcept {
  switch (d) {
    case Direction::East:  return "E";
    case Direction::West:  return "W";
    case Direction::South: return "S";
    case Direction::North: return "N";
  }
  return "?";
}

} // namespace agora
