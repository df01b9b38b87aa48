/**
 * @file attenuation.cpp
 * @brief Altitude-band attenuation implementation.
 * @author Watosn
 */

#include "ridgelift/lift/attenuation.hpp"

#include <algorithm>
#include <cmath>

namespace ridgelift::lift {
namespace {

double sanitize_agl(double agl_m) {
  if (!std::isfinite(agl_m) || agl_m < 0.0) {
    return 0.0;
  }
  return agl_m;
}

}  // namespace

AttenuationBands bands_from_config(const LiftConfig& config) {
  return AttenuationBands{
      .ground_buffer_m = config.ground_buffer_m,
      .low_alt_cutoff_m = config.low_alt_cutoff_m,
      .ramp_height_m = config.ramp_height_m,
      .max_ceiling_m = config.max_ceiling_m};
}

double low_altitude_factor(double agl_m, double ground_buffer_m, double low_alt_cutoff_m) {
  const double agl = sanitize_agl(agl_m);
  if (agl <= ground_buffer_m) {
    return 0.0;
  }
  // A cutoff at or below the buffer saturates here as well.
  if (agl >= low_alt_cutoff_m) {
    return 1.0;
  }
  return std::clamp((agl - ground_buffer_m) / (low_alt_cutoff_m - ground_buffer_m), 0.0, 1.0);
}

double high_altitude_factor(double agl_m, double ramp_height_m, double max_ceiling_m) {
  const double agl = sanitize_agl(agl_m);
  if (agl >= max_ceiling_m) {
    return 0.0;
  }
  if (agl < ramp_height_m) {
    return 1.0;
  }
  const double range = max_ceiling_m - ramp_height_m;
  const double current = agl - ramp_height_m;
  return std::clamp(1.0 - current / range, 0.0, 1.0);
}

AttenuationResult attenuate(double raw_vertical_speed_mps, double agl_m, const AttenuationBands& bands) {
  const double low = low_altitude_factor(agl_m, bands.ground_buffer_m, bands.low_alt_cutoff_m);
  const double high = high_altitude_factor(agl_m, bands.ramp_height_m, bands.max_ceiling_m);
  double out = raw_vertical_speed_mps * high * low;
  if (!std::isfinite(out)) {
    out = 0.0;
  }
  return AttenuationResult{.low_factor = low, .high_factor = high, .vertical_speed_mps = out};
}

}  // namespace ridgelift::lift
