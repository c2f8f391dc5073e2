#pragma once
#include <cstdint>
#include <string_view>

#include "agora/bundle.hpp"

namespace agora {

enum class UtilityKind : uint8_t {
  CobbDouglas        = 0,
  PerfectSubstitutes = 1,
  PerfectComplements = 2
};

inline constexpr double kDefaultEpsilon = 0.01;

// Tolerance under which alpha*q1 and beta*q2 count as equal (perfect complements).
inline constexpr double kBindingTolerance = 1e-9;

// Immutable preference value object. Build through make_utility() so the
// parameters are checked; the functions below assume a valid instance.
struct UtilityFunction {
  UtilityKind kind{UtilityKind::CobbDouglas};
  double alpha{0.5};
  double beta{0.5};
  double epsilon{kDefaultEpsilon};
};

// Throws std::invalid_argument on invalid parameters:
//  - Cobb-Douglas: 0 < alpha < 1 and alpha + beta == 1
//  - substitutes / complements: alpha > 0 and beta > 0
//  - epsilon > 0
UtilityFunction make_utility(UtilityKind kind, double alpha, double beta,
                             double epsilon = kDefaultEpsilon);

// Cobb-Douglas with beta = 1 - alpha.
UtilityFunction cobb_douglas(double alpha, double epsilon = kDefaultEpsilon);

// "cobb_douglas" | "perfect_substitutes" | "perfect_complements"; throws otherwise.
UtilityKind parse_utility_kind(std::string_view name);
std::string_view to_string(UtilityKind k) noexcept;

double value(const UtilityFunction& u, const Bundle& b) noexcept;
double marginal_utility(const UtilityFunction& u, const Bundle& b, Good g) noexcept;

// Utility change from giving one unit of `give` and receiving one unit of the other good.
double swap_gain(const UtilityFunction& u, const Bundle& b, Good give) noexcept;

} // namespace agora
