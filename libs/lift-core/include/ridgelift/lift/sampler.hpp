/**
 * @file sampler.hpp
 * @brief Upwind terrain probe sampling.
 * @author Watosn
 */
#pragma once

#include <optional>

#include "ridgelift/core/interfaces.hpp"

namespace ridgelift::lift {

/**
 * @brief Terrain pair sampled at the vessel and at the upwind probe point.
 */
struct TerrainSample {
  double wind_speed_mps{};
  ridgelift::core::Vec3 wind_dir{};
  ridgelift::core::Vec3 probe_position_m{};
  double elevation_at_vessel_m{};
  double elevation_at_probe_m{};
  double terrain_rise_m{};
};

/**
 * @brief Projects an upwind probe point and samples terrain under it.
 */
class TerrainSampler {
 public:
  /**
   * @brief Construct sampler.
   * @param probe_distance_m Horizontal offset of the probe, opposite the wind.
   * @param min_wind_speed_mps Wind speeds below this produce no sample.
   */
  TerrainSampler(double probe_distance_m, double min_wind_speed_mps)
      : probe_distance_m_(probe_distance_m), min_wind_speed_mps_(min_wind_speed_mps) {}

  /**
   * @brief Sample terrain rise along the wind's approach path.
   * @param ambient_wind_mps Ambient wind at the vessel, world frame.
   * @param vessel_position_m Vessel world position.
   * @param terrain Terrain of the body being flown over.
   * @return Sample, or empty when the wind is too weak.
   */
  [[nodiscard]] std::optional<TerrainSample> sample(const ridgelift::core::Vec3& ambient_wind_mps,
                                                    const ridgelift::core::Vec3& vessel_position_m,
                                                    const ridgelift::core::ITerrainModel& terrain) const;

  /**
   * @brief Upwind probe position for a wind direction.
   *
   * The offset is horizontal in the local frame at the vessel; a purely vertical wind leaves the probe at the vessel.
   */
  [[nodiscard]] ridgelift::core::Vec3 probe_position(const ridgelift::core::Vec3& wind_dir,
                                                     const ridgelift::core::Vec3& vessel_position_m,
                                                     const ridgelift::core::Vec3& up) const;

 private:
  double probe_distance_m_{};
  double min_wind_speed_mps_{};
};

}  // namespace ridgelift::lift
