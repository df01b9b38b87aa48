/**
 * @file slope_model.cpp
 * @brief Slope model implementation.
 * @author Watosn
 */

#include "ridgelift/lift/slope_model.hpp"

#include <algorithm>
#include <cmath>

namespace ridgelift::lift {

VerticalSpeedResult compute_vertical_speed(double wind_speed_mps,
                                           double terrain_rise_m,
                                           double probe_distance_m,
                                           double lift_multiplier,
                                           double max_vertical_ratio) {
  if (!(probe_distance_m > 0.0) || !std::isfinite(probe_distance_m) || !std::isfinite(wind_speed_mps) ||
      !std::isfinite(terrain_rise_m) || !std::isfinite(lift_multiplier)) {
    return VerticalSpeedResult{};
  }

  const double slope = terrain_rise_m / probe_distance_m;
  const double raw = wind_speed_mps * slope * lift_multiplier;
  const double max_vert = std::abs(wind_speed_mps) * std::max(0.0, max_vertical_ratio);
  const double clamped = std::clamp(raw, -max_vert, max_vert);
  if (!std::isfinite(clamped)) {
    return VerticalSpeedResult{.slope = slope};
  }
  return VerticalSpeedResult{.slope = slope, .raw_vertical_speed_mps = raw, .vertical_speed_mps = clamped};
}

}  // namespace ridgelift::lift
