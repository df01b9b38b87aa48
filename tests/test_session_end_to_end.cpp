/**
 * @file test_session_end_to_end.cpp
 * @brief Session lifecycle over a bell ridge: registration, lift, sink and teardown.
 * @author Watosn
 */

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "ridgelift/core/constants.hpp"
#include "ridgelift/core/conversions.hpp"
#include "ridgelift/models/terrain_models.hpp"
#include "ridgelift/models/uniform_wind.hpp"
#include "ridgelift/registry/wind_registry.hpp"
#include "ridgelift/runtime/ridge_lift_session.hpp"

namespace {

ridgelift::core::FlightContext flight_at(ridgelift::core::VehicleId id,
                                         const ridgelift::core::BodyContext& body,
                                         const ridgelift::core::SphericalFrame& frame,
                                         double surface_x_m,
                                         double altitude_m) {
  const double lon_deg = surface_x_m / frame.radius_m * ridgelift::core::constants::kRadToDeg;
  const ridgelift::core::GeodeticPoint geo{.lat_deg = 0.0, .lon_deg = lon_deg, .alt_m = altitude_m};
  return ridgelift::core::FlightContext{
      .vehicle_id = id,
      .world_ready = true,
      .vehicle_present = true,
      .body = &body,
      .position_m = ridgelift::core::world_from_geodetic(geo, frame),
      .altitude_m = altitude_m};
}

}  // namespace

int main() {
  using namespace ridgelift;

  const core::SphericalFrame frame{.center_m = core::Vec3{}, .radius_m = core::constants::kKerbinRadiusM};
  const models::BellRidgeTerrainModel ridge(models::BellRidgeTerrainModel::Config{.frame = frame});
  const core::BodyContext kerbin{.name = "Kerbin", .has_atmosphere = true, .terrain = &ridge};

  registry::WindRegistry reg;
  const models::UniformWindProvider prevailing("prevailing", core::Vec3{10.0, 0.0, 0.0});
  if (!reg.register_provider(&prevailing)) {
    spdlog::error("prevailing provider registration failed");
    return 1;
  }

  auto session = std::make_unique<runtime::RidgeLiftSession>(runtime::RidgeLiftSession::Config{}, reg, [&reg]() { return &reg; });
  if (session->registration_status() != registry::RegistrationStatus::Pending) {
    spdlog::error("session should register lazily");
    return 2;
  }

  // Upwind slope (west of the crest) and lee slope (east of the crest).
  const auto windward = flight_at(1, kerbin, frame, -2000.0, 1000.0);
  const auto lee = flight_at(2, kerbin, frame, 2000.0, 1000.0);
  const std::vector<core::FlightContext> fleet{windward, lee};
  for (int i = 0; i < 400; ++i) {
    session->fixed_update(fleet, 0.02);
  }
  if (session->registration_status() != registry::RegistrationStatus::Registered || !reg.contains("RidgeLift")) {
    spdlog::error("engine did not register with the wind registry");
    return 3;
  }

  const auto& engine = session->engine();
  const auto* up_state = engine.state(1);
  const auto* down_state = engine.state(2);
  if (up_state == nullptr || down_state == nullptr) {
    spdlog::error("vehicles not tracked");
    return 4;
  }
  const double up_mps = core::dot(up_state->smoothed_mps, ridge.up_from_world(windward.position_m));
  const double down_mps = core::dot(down_state->smoothed_mps, ridge.up_from_world(lee.position_m));
  if (!(up_mps > 1.0) || !(down_mps < -1.0) || !(up_state->last_slope > 0.0) || !(down_state->last_slope < 0.0)) {
    spdlog::error("expected lift upwind and sink downwind: up={} down={}", up_mps, down_mps);
    return 5;
  }

  // The engine's own contribution never feeds back into the ambient query.
  const core::WindQuery q{.body = &kerbin, .consumer = core::VehicleId{1}, .position_m = windward.position_m};
  const core::Vec3 ambient_only = reg.wind_at(q, "RidgeLift");
  const core::Vec3 combined = reg.wind_at(q);
  if (!(core::norm(ambient_only - prevailing.wind_at(q)) < 1e-9) ||
      !(core::norm(combined - ambient_only - up_state->smoothed_mps) < 1e-9)) {
    spdlog::error("registry composition mismatch");
    return 6;
  }

  // Status lines every couple of seconds while debug mode is on.
  std::size_t lines = 0;
  for (int i = 0; i < 150; ++i) {
    lines += session->update(0.02).size();
  }
  if (lines != 2U) {
    spdlog::error("expected one status burst with two lines, got {}", lines);
    return 7;
  }

  // World not ready: all vehicles go quiet.
  session->fixed_update_not_ready(0.02);
  if (!core::is_zero(engine.wind_at(q)) || up_state->active || down_state->active) {
    spdlog::error("not-ready tick should zero every vehicle");
    return 8;
  }

  // Vehicles that stop being ticked go quiet at once.
  for (int i = 0; i < 400; ++i) {
    session->fixed_update(fleet, 0.02);
  }
  session->fixed_update({windward}, 0.02);
  if (!up_state->active || core::is_zero(up_state->smoothed_mps) || down_state->active ||
      !core::is_zero(down_state->smoothed_mps)) {
    spdlog::error("vehicle dropped from the tick list should be zeroed");
    return 10;
  }
  for (int i = 0; i < 1000; ++i) {
    session->fixed_update({}, 0.02);
  }
  const core::WindQuery passer_by{
      .body = &kerbin, .consumer = std::nullopt, .position_m = flight_at(99, kerbin, frame, -1900.0, 1000.0).position_m};
  if (up_state->active || !core::is_zero(up_state->smoothed_mps) || !core::is_zero(engine.wind_at(passer_by)) ||
      !core::is_zero(engine.wind_at(q))) {
    spdlog::error("empty tick list should zero every vehicle");
    return 11;
  }
  std::size_t idle_lines = 0;
  for (int i = 0; i < 150; ++i) {
    idle_lines += session->update(0.02).size();
  }
  if (idle_lines != 0U) {
    spdlog::error("no status lines expected with no active vehicle, got {}", idle_lines);
    return 12;
  }

  session.reset();
  if (reg.contains("RidgeLift") || !reg.contains("prevailing")) {
    spdlog::error("session teardown should deregister only the ridge-lift provider");
    return 9;
  }

  return 0;
}
