/**
 * @file ridge_lift_model.cpp
 * @brief Ridge-lift target pipeline implementation.
 * @author Watosn
 */

#include "ridgelift/lift/ridge_lift_model.hpp"

#include <algorithm>
#include <cmath>

#include "ridgelift/lift/slope_model.hpp"

namespace ridgelift::lift {

RidgeLiftResult RidgeLiftModel::evaluate(const ridgelift::core::FlightContext& ctx) const {
  if (ctx.body == nullptr) {
    return RidgeLiftResult{.status = ridgelift::core::Status::InvalidInput};
  }
  if (!ridgelift::core::is_finite(ctx.position_m) || !std::isfinite(ctx.altitude_m)) {
    return RidgeLiftResult{.status = ridgelift::core::Status::InvalidInput};
  }

  // Coarse envelope gate ahead of any terrain query.
  if (!ctx.body->has_atmosphere) {
    return RidgeLiftResult{.gate = LiftGate::NoAtmosphere};
  }
  if (ctx.altitude_m > config_.absolute_ceiling_m) {
    return RidgeLiftResult{.gate = LiftGate::AboveCeiling};
  }
  if (ctx.body->terrain == nullptr) {
    return RidgeLiftResult{.status = ridgelift::core::Status::DataUnavailable};
  }
  const auto& terrain = *ctx.body->terrain;

  const ridgelift::core::WindQuery query{.body = ctx.body, .consumer = ctx.vehicle_id, .position_m = ctx.position_m};
  const ridgelift::core::Vec3 ambient = ambient_.wind_at(query, excluded_provider_id_);
  if (!ridgelift::core::is_finite(ambient)) {
    return RidgeLiftResult{.status = ridgelift::core::Status::NumericalError};
  }

  const auto sample = sampler_.sample(ambient, ctx.position_m, terrain);
  if (!sample.has_value()) {
    return RidgeLiftResult{.ambient_wind_mps = ambient, .gate = LiftGate::CalmWind};
  }

  const auto vs = compute_vertical_speed(sample->wind_speed_mps,
                                         sample->terrain_rise_m,
                                         config_.probe_distance_m,
                                         config_.lift_multiplier,
                                         config_.max_vertical_ratio);

  const double agl = std::max(0.0, ctx.altitude_m - sample->elevation_at_vessel_m);
  const auto att = attenuate(vs.vertical_speed_mps, agl, bands_);

  const ridgelift::core::Vec3 up = terrain.up_from_world(ctx.position_m);
  const ridgelift::core::Vec3 target = up * att.vertical_speed_mps;

  RidgeLiftResult out{
      .target_mps = target,
      .ambient_wind_mps = ambient,
      .slope = vs.slope,
      .raw_vertical_speed_mps = vs.vertical_speed_mps,
      .vertical_speed_mps = att.vertical_speed_mps,
      .agl_m = agl,
      .low_factor = att.low_factor,
      .high_factor = att.high_factor,
      .gate = LiftGate::None,
      .status = ridgelift::core::Status::Ok};
  if (!ridgelift::core::is_finite(out.target_mps) || !std::isfinite(out.slope)) {
    out.target_mps = ridgelift::core::Vec3{};
    out.slope = 0.0;
    out.status = ridgelift::core::Status::NumericalError;
  }
  return out;
}

}  // namespace ridgelift::lift
