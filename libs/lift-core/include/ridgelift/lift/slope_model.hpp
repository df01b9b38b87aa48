/**
 * @file slope_model.hpp
 * @brief Terrain slope to vertical wind speed conversion.
 * @author Watosn
 */
#pragma once

namespace ridgelift::lift {

/**
 * @brief Clamped vertical speed and the slope it was derived from.
 */
struct VerticalSpeedResult {
  double slope{};
  double raw_vertical_speed_mps{};
  double vertical_speed_mps{};
};

/**
 * @brief Convert a terrain rise along the probe path into a vertical wind speed.
 * @param wind_speed_mps Ambient horizontal wind magnitude.
 * @param terrain_rise_m Vessel-side elevation minus probe-side elevation.
 * @param probe_distance_m Probe offset; non-positive values yield zero output.
 * @param lift_multiplier Unitless gain.
 * @param max_vertical_ratio Output is clamped to +/- this multiple of the wind speed.
 * @return Slope (pre-clamp, diagnostic) and clamped vertical speed.
 */
[[nodiscard]] VerticalSpeedResult compute_vertical_speed(double wind_speed_mps,
                                                         double terrain_rise_m,
                                                         double probe_distance_m,
                                                         double lift_multiplier,
                                                         double max_vertical_ratio = 2.0);

}  // namespace ridgelift::lift
