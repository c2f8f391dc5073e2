#include "agora/config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace agora {

namespace {
[[noreturn]] void reject(const char* field, const std::string& why) {
  throw std::invalid_argument(std::string("SimConfig.") + field + ": " + why);
}
} // namespace

void SimConfig::validate() const {
  if (grid_width <= 0 || grid_height <= 0) {
    reject("grid", "dimensions must be positive, got " + std::to_string(grid_width) + "x" +
                       std::to_string(grid_height));
  }
  if (perception_radius < 0) {
    reject("perception_radius", "must be >= 0, got " + std::to_string(perception_radius));
  }
  if (!std::isfinite(distance_discount) || distance_discount <= 0.0) {
    reject("distance_discount", "must be a positive finite number");
  }
  if (!std::isfinite(min_trade_gain) || min_trade_gain < 0.0) {
    reject("min_trade_gain", "must be a non-negative finite number");
  }
  if (carrying_capacity <= 0) {
    reject("carrying_capacity", "must be > 0, got " + std::to_string(carrying_capacity));
  }

  // Respawn parameters are checked even when disabled so a bad config fails early.
  if (!(respawn.target_density >= 0.0 && respawn.target_density <= 1.0)) {
    reject("respawn.target_density", "must be within [0, 1]");
  }
  if (!(respawn.rate >= 0.0 && respawn.rate <= 1.0)) {
    reject("respawn.rate", "must be within [0, 1]");
  }
  if (respawn.enabled && respawn.interval == 0) {
    reject("respawn.interval", "must be >= 1 when respawn is enabled");
  }
}

} // namespace agora
