/**
 * @file lift_config.hpp
 * @brief Tunable parameters of the ridge-lift pipeline.
 * @author Watosn
 */
#pragma once

namespace ridgelift::lift {

/**
 * @brief Ridge-lift configuration, immutable after load.
 *
 * Lengths are meters (AGL unless noted), speeds m/s, rates 1/s.
 */
struct LiftConfig {
  double probe_distance_m{750.0};
  double lift_multiplier{2.0};
  double max_ceiling_m{2500.0};
  double ramp_height_m{500.0};
  double smoothing_speed_per_s{5.0};
  double low_alt_cutoff_m{50.0};
  bool debug_mode{true};

  double ground_buffer_m{10.0};
  double max_vertical_ratio{2.0};
  double min_wind_speed_mps{1.0};
  double absolute_ceiling_m{30000.0};
  double proximity_radius_m{2000.0};
  int update_interval_ticks{5};
  double status_interval_s{2.0};
  double status_min_speed_mps{1.0};
};

}  // namespace ridgelift::lift
