#include "agora/utility.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace agora {

namespace {

struct UtilityOps {
  double (*value)(const UtilityFunction&, const Bundle&) noexcept;
  double (*marginal)(const UtilityFunction&, const Bundle&, Good) noexcept;
  std::string_view name;
};

double cd_value(const UtilityFunction& u, const Bundle& b) noexcept {
  const double x = static_cast<double>(b.q1) + u.epsilon;
  const double y = static_cast<double>(b.q2) + u.epsilon;
  return std::pow(x, u.alpha) * std::pow(y, u.beta);
}

// discrete one-unit increment
double cd_marginal(const UtilityFunction& u, const Bundle& b, Good g) noexcept {
  return cd_value(u, b.with(g, 1)) - cd_value(u, b);
}

double ps_value(const UtilityFunction& u, const Bundle& b) noexcept {
  return u.alpha * static_cast<double>(b.q1) + u.beta * static_cast<double>(b.q2);
}

double ps_marginal(const UtilityFunction& u, const Bundle&, Good g) noexcept {
  return (g == Good::Good1) ? u.alpha : u.beta;
}

double pc_value(const UtilityFunction& u, const Bundle& b) noexcept {
  return std::min(u.alpha * static_cast<double>(b.q1), u.beta * static_cast<double>(b.q2));
}

// Binding good earns its weight, the slack good earns 0, ties bind both.
double pc_marginal(const UtilityFunction& u, const Bundle& b, Good g) noexcept {
  const double a = u.alpha * static_cast<double>(b.q1);
  const double c = u.beta * static_cast<double>(b.q2);
  const double w = (g == Good::Good1) ? u.alpha : u.beta;
  if (std::fabs(a - c) <= kBindingTolerance) return w;
  const bool good1_binds = a < c;
  return (good1_binds == (g == Good::Good1)) ? w : 0.0;
}

constexpr std::array<UtilityOps, 3> kOps{{
  {&cd_value, &cd_marginal, "cobb_douglas"},
  {&ps_value, &ps_marginal, "perfect_substitutes"},
  {&pc_value, &pc_marginal, "perfect_complements"},
}};

inline const UtilityOps& ops(UtilityKind k) noexcept {
  return kOps[static_cast<std::size_t>(k)];
}

} // namespace

UtilityFunction make_utility(UtilityKind kind, double alpha, double beta, double epsilon) {
  if (!(epsilon > 0.0)) {
    throw std::invalid_argument("utility epsilon must be > 0, got " + std::to_string(epsilon));
  }

  switch (kind) {
    case UtilityKind::CobbDouglas:
      if (!(alpha > 0.0 && alpha < 1.0)) {
        throw std::invalid_argument("cobb_douglas alpha must be in (0, 1), got " + std::to_string(alpha));
      }
      if (std::fabs(alpha + beta - 1.0) > 1e-9) {
        throw std::invalid_argument("cobb_douglas alpha + beta must equal 1, got " +
                                    std::to_string(alpha + beta));
      }
      break;
    case UtilityKind::PerfectSubstitutes:
    case UtilityKind::PerfectComplements:
      if (!(alpha > 0.0) || !(beta > 0.0)) {
        throw std::invalid_argument(std::string(to_string(kind)) +
                                    " weights must be positive, got alpha=" + std::to_string(alpha) +
                                    " beta=" + std::to_string(beta));
      }
      break;
    default:
      throw std::invalid_argument("unknown utility kind " +
                                  std::to_string(static_cast<int>(kind)));
  }

  return UtilityFunction{kind, alpha, beta, epsilon};
}

UtilityFunction cobb_douglas(double alpha, double epsilon) {
  return make_utility(UtilityKind::CobbDouglas, alpha, 1.0 - alpha, epsilon);
}

UtilityKind parse_utility_kind(std::string_view name) {
  for (std::size_t i = 0; i < kOps.size(); ++i) {
    if (kOps[i].name == name) return static_cast<UtilityKind>(i);
  }
  throw std::invalid_argument("unknown utility kind '" + std::string(name) + "'");
}

std::string_view to_string(UtilityKind k) noexcept {
  return ops(k).name;
}

double value(const UtilityFunction& u, const Bundle& b) noexcept {
  return ops(u.kind).value(u, b);
}

double marginal_utility(const UtilityFunction& u, const Bundle& b, Good g) noexcept {
  return ops(u.kind).marginal(u, b, g);
}

double swap_gain(const UtilityFunction& u, const Bundle& b, Good give) noexcept {
  const Bundle after = b.with(give, -1).with(other(give), 1);
  return value(u, after) - value(u, b);
}

} // namespace agora
