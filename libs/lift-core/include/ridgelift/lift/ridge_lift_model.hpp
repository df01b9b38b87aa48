/**
 * @file ridge_lift_model.hpp
 * @brief Ridge-lift target pipeline: gate, sample, slope and attenuation.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "ridgelift/core/interfaces.hpp"
#include "ridgelift/lift/attenuation.hpp"
#include "ridgelift/lift/lift_config.hpp"
#include "ridgelift/lift/sampler.hpp"

namespace ridgelift::lift {

/**
 * @brief Reason a valid evaluation produced zero lift before reaching the slope model.
 */
enum class LiftGate : std::uint8_t { None, NoAtmosphere, AboveCeiling, CalmWind };

/**
 * @brief Ridge-lift model output bundle.
 */
struct RidgeLiftResult {
  ridgelift::core::Vec3 target_mps{};
  ridgelift::core::Vec3 ambient_wind_mps{};
  double slope{};
  double raw_vertical_speed_mps{};
  double vertical_speed_mps{};
  double agl_m{};
  double low_factor{};
  double high_factor{};
  LiftGate gate{LiftGate::None};
  ridgelift::core::Status status{ridgelift::core::Status::Ok};
};

/**
 * @brief Computes the desired ridge-lift vector for one vehicle.
 */
class RidgeLiftModel {
 public:
  /**
   * @brief Construct model.
   * @param ambient Ambient wind source queried at the vessel.
   * @param config Pipeline parameters.
   * @param excluded_provider_id Provider id skipped in ambient queries to avoid feedback.
   */
  RidgeLiftModel(const ridgelift::core::IAmbientWindSource& ambient, LiftConfig config, std::string excluded_provider_id)
      : ambient_(ambient),
        config_(config),
        excluded_provider_id_(std::move(excluded_provider_id)),
        sampler_(config.probe_distance_m, config.min_wind_speed_mps),
        bands_(bands_from_config(config)) {}

  /**
   * @brief Evaluate the target vector for a flight context.
   * @param ctx Vehicle context; must reference a body.
   * @return Target vector with intermediate values; zero target whenever gated or failed.
   */
  [[nodiscard]] RidgeLiftResult evaluate(const ridgelift::core::FlightContext& ctx) const;

  [[nodiscard]] const LiftConfig& config() const { return config_; }

 private:
  const ridgelift::core::IAmbientWindSource& ambient_;
  LiftConfig config_{};
  std::string excluded_provider_id_{};
  TerrainSampler sampler_;
  AttenuationBands bands_{};
};

}  // namespace ridgelift::lift
