/**
 * @file terrain_models.hpp
 * @brief Terrain models over a spherical body: gridded heightmap and analytic ridge.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <utility>

#include <Eigen/Dense>

#include "ridgelift/core/conversions.hpp"
#include "ridgelift/core/interfaces.hpp"

namespace ridgelift::models {

/**
 * @brief Shared spherical-frame conversions for terrain models.
 */
class SphericalTerrainModel : public ridgelift::core::ITerrainModel {
 public:
  explicit SphericalTerrainModel(ridgelift::core::SphericalFrame frame) : frame_(frame) {}

  [[nodiscard]] ridgelift::core::GeodeticPoint geodetic_from_world(const ridgelift::core::Vec3& position_m) const override {
    return ridgelift::core::spherical_geodetic_from_world(position_m, frame_);
  }
  [[nodiscard]] ridgelift::core::Vec3 up_from_world(const ridgelift::core::Vec3& position_m) const override {
    return ridgelift::core::spherical_up_from_world(position_m, frame_);
  }
  [[nodiscard]] const ridgelift::core::SphericalFrame& frame() const { return frame_; }

 private:
  ridgelift::core::SphericalFrame frame_{};
};

/**
 * @brief Equirectangular elevation grid with bilinear sampling.
 *
 * Row `i` lies at `lat_min + i * (lat_max - lat_min) / (rows - 1)`, column `j` likewise in longitude. Latitude is
 * clamped to the grid; longitude wraps when the grid spans a full turn and is clamped otherwise.
 */
class GridTerrainModel final : public SphericalTerrainModel {
 public:
  /**
   * @brief Grid placement on the body.
   */
  struct Config {
    ridgelift::core::SphericalFrame frame{};
    double lat_min_deg{-90.0};
    double lat_max_deg{90.0};
    double lon_min_deg{-180.0};
    double lon_max_deg{180.0};
  };

  /**
   * @brief Build from an in-memory elevation matrix (rows = latitude, cols = longitude).
   * @return Null when the matrix is smaller than 2x2 or the extents are degenerate.
   */
  static std::unique_ptr<GridTerrainModel> Create(const Config& config, Eigen::MatrixXd elevations_m);

  /**
   * @brief Load a whitespace grid file.
   *
   * Format: `rows cols lat_min lat_max lon_min lon_max` followed by `rows * cols` elevations, row-major from
   * `lat_min`. Lines starting with `#` are ignored.
   * @return Null when the file is missing or malformed.
   */
  static std::unique_ptr<GridTerrainModel> Load(const std::filesystem::path& grid_file,
                                                const ridgelift::core::SphericalFrame& frame);

  [[nodiscard]] double elevation_m(double lat_deg, double lon_deg) const override;

  [[nodiscard]] const Eigen::MatrixXd& elevations() const { return elevations_; }

 private:
  GridTerrainModel(const Config& config, Eigen::MatrixXd elevations_m)
      : SphericalTerrainModel(config.frame), config_(config), elevations_(std::move(elevations_m)) {}

  Config config_{};
  Eigen::MatrixXd elevations_{};
  bool wraps_longitude_{};
};

/**
 * @brief Analytic Witch-of-Agnesi ridge running along a meridian.
 *
 * `h(x) = base + peak / (1 + (x / half_width)^2)` where `x` is the east-west surface distance from the ridge axis.
 */
class BellRidgeTerrainModel final : public SphericalTerrainModel {
 public:
  struct Config {
    ridgelift::core::SphericalFrame frame{};
    double axis_lon_deg{};
    double peak_height_m{600.0};
    double half_width_m{2000.0};
    double base_height_m{};
  };

  explicit BellRidgeTerrainModel(const Config& config) : SphericalTerrainModel(config.frame), config_(config) {}

  [[nodiscard]] double elevation_m(double lat_deg, double lon_deg) const override;

 private:
  Config config_{};
};

}  // namespace ridgelift::models
