/**
 * @file attenuation.hpp
 * @brief Altitude-band attenuation of ridge lift.
 * @author Watosn
 */
#pragma once

#include "ridgelift/lift/lift_config.hpp"

namespace ridgelift::lift {

/**
 * @brief Attenuation band limits in meters AGL.
 */
struct AttenuationBands {
  double ground_buffer_m{10.0};
  double low_alt_cutoff_m{50.0};
  double ramp_height_m{500.0};
  double max_ceiling_m{2500.0};
};

/**
 * @brief Both attenuation factors and their product applied to a vertical speed.
 */
struct AttenuationResult {
  double low_factor{};
  double high_factor{};
  double vertical_speed_mps{};
};

[[nodiscard]] AttenuationBands bands_from_config(const LiftConfig& config);

/**
 * @brief Fade-in above the ground: 0 at or below the buffer, 1 at or above the cutoff.
 */
[[nodiscard]] double low_altitude_factor(double agl_m, double ground_buffer_m, double low_alt_cutoff_m);

/**
 * @brief Fade-out toward the ceiling: 1 below the ramp, 0 at or above the ceiling.
 */
[[nodiscard]] double high_altitude_factor(double agl_m, double ramp_height_m, double max_ceiling_m);

/**
 * @brief Scale a raw vertical speed by both altitude factors.
 * @param raw_vertical_speed_mps Clamped slope-model output.
 * @param agl_m Height above local ground; negative or non-finite input is treated as 0.
 * @param bands Band limits.
 */
[[nodiscard]] AttenuationResult attenuate(double raw_vertical_speed_mps, double agl_m, const AttenuationBands& bands);

}  // namespace ridgelift::lift
