/**
 * @file sampler.cpp
 * @brief Upwind terrain probe sampling implementation.
 * @author Watosn
 */

#include "ridgelift/lift/sampler.hpp"

#include <algorithm>
#include <cmath>

namespace ridgelift::lift {
namespace {

constexpr double kMinHorizontalFraction = 1e-9;

double clamp_sea_level(double elevation_m) {
  if (!std::isfinite(elevation_m)) {
    return 0.0;
  }
  return std::max(0.0, elevation_m);
}

}  // namespace

ridgelift::core::Vec3 TerrainSampler::probe_position(const ridgelift::core::Vec3& wind_dir,
                                                     const ridgelift::core::Vec3& vessel_position_m,
                                                     const ridgelift::core::Vec3& up) const {
  const ridgelift::core::Vec3 horizontal = wind_dir - ridgelift::core::dot(wind_dir, up) * up;
  if (ridgelift::core::norm(horizontal) < kMinHorizontalFraction) {
    return vessel_position_m;
  }
  return vessel_position_m - ridgelift::core::normalized(horizontal) * probe_distance_m_;
}

std::optional<TerrainSample> TerrainSampler::sample(const ridgelift::core::Vec3& ambient_wind_mps,
                                                    const ridgelift::core::Vec3& vessel_position_m,
                                                    const ridgelift::core::ITerrainModel& terrain) const {
  const double wind_speed = ridgelift::core::norm(ambient_wind_mps);
  if (!std::isfinite(wind_speed) || wind_speed < min_wind_speed_mps_) {
    return std::nullopt;
  }

  const ridgelift::core::Vec3 wind_dir = ambient_wind_mps / wind_speed;
  const ridgelift::core::Vec3 up = terrain.up_from_world(vessel_position_m);
  const ridgelift::core::Vec3 probe = probe_position(wind_dir, vessel_position_m, up);

  const auto vessel_geo = terrain.geodetic_from_world(vessel_position_m);
  const auto probe_geo = terrain.geodetic_from_world(probe);
  const double h_vessel = clamp_sea_level(terrain.elevation_m(vessel_geo.lat_deg, vessel_geo.lon_deg));
  const double h_probe = clamp_sea_level(terrain.elevation_m(probe_geo.lat_deg, probe_geo.lon_deg));

  return TerrainSample{
      .wind_speed_mps = wind_speed,
      .wind_dir = wind_dir,
      .probe_position_m = probe,
      .elevation_at_vessel_m = h_vessel,
      .elevation_at_probe_m = h_probe,
      .terrain_rise_m = h_vessel - h_probe};
}

}  // namespace ridgelift::lift
