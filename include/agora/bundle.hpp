#pragma once
#include "agora/types.hpp"

namespace agora {

struct Bundle {
  Qty q1{};
  Qty q2{};

  constexpr Qty get(Good g) const noexcept { return (g == Good::Good1) ? q1 : q2; }
  constexpr Qty& at(Good g) noexcept { return (g == Good::Good1) ? q1 : q2; }
  constexpr Qty total() const noexcept { return q1 + q2; }
  constexpr bool empty() const noexcept { return q1 == 0 && q2 == 0; }

  // Copy with `delta` units of `g` added (delta may be negative).
  constexpr Bundle with(Good g, Qty delta) const noexcept {
    Bundle b = *this;
    b.at(g) += delta;
    return b;
  }

  friend constexpr bool operator==(const Bundle&, const Bundle&) = default;
};

inline constexpr Bundle operator+(const Bundle& a, const Bundle& b) noexcept {
  return Bundle{a.q1 + b.q1, a.q2 + b.q2};
}

inline constexpr bool is_valid_bundle(const Bundle& b) noexcept {
  return b.q1 >= 0 && b.q2 >= 0;
}

} // namespace agora
