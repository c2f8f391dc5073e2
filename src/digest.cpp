#include "agora/digest.hpp"

namespace agora {

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime  = 1099511628211ULL;

struct Fnv1a {
  uint64_t h{kFnvOffset};

  void byte(uint8_t b) noexcept {
    h ^= b;
    h *= kFnvPrime;
  }

  // Little-endian regardless of host order.
  void u64(uint64_t v) noexcept {
    for (int i = 0; i < 8; ++i) byte(static_cast<uint8_t>(v >> (8 * i)));
  }

  void i32(int32_t v) noexcept { u64(static_cast<uint64_t>(static_cast<uint32_t>(v))); }
};

} // namespace

uint64_t state_digest(std::span<const Agent> agents, const SpatialGrid& grid) {
  Fnv1a f{};

  f.u64(agents.size());
  for (const auto& a : agents) {
    f.u64(a.id());
    f.i32(a.position().x);
    f.i32(a.position().y);
    f.i32(a.home_position().x);
    f.i32(a.home_position().y);
    f.i32(a.carrying().q1);
    f.i32(a.carrying().q2);
    f.i32(a.home().q1);
    f.i32(a.home().q2);
    f.byte(static_cast<uint8_t>(a.mode()));
    if (const auto p = a.partner()) {
      f.byte(1);
      f.u64(*p);
    } else {
      f.byte(0);
    }
  }

  f.u64(grid.resource_count());
  for (const auto& r : grid.iterate_resources()) {
    f.i32(r.position.x);
    f.i32(r.position.y);
    f.byte(static_cast<uint8_t>(r.good));
  }
  return f.h;
}

} // namespace agora
