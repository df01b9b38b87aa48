/**
 * @file ridge_profile_cli.cpp
 * @brief Straight-line flight across an analytic ridge, logging ridge lift over time.
 * @author Watosn
 */

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "ridgelift/core/constants.hpp"
#include "ridgelift/core/conversions.hpp"
#include "ridgelift/lift/lift_config.hpp"
#include "ridgelift/models/terrain_models.hpp"
#include "ridgelift/models/uniform_wind.hpp"
#include "ridgelift/registry/wind_registry.hpp"
#include "ridgelift/runtime/ridge_lift_session.hpp"

namespace {

constexpr ridgelift::core::VehicleId kVehicleId = 1;
constexpr double kStartOffsetM = -8000.0;

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 9) {
    spdlog::error(
        "usage: ridge_profile_cli <output_csv> [settings_yaml] [wind_east_mps] [altitude_m] [ground_speed_mps] [duration_s] [dt_s] [ridge_peak_m]");
    return 1;
  }

  const std::filesystem::path out_csv = argv[1];
  const std::filesystem::path settings_file = (argc >= 3) ? std::filesystem::path(argv[2]) : std::filesystem::path{};
  const double wind_east_mps = (argc >= 4) ? std::atof(argv[3]) : 10.0;
  const double altitude_m = (argc >= 5) ? std::atof(argv[4]) : 1000.0;
  const double ground_speed_mps = (argc >= 6) ? std::atof(argv[5]) : 50.0;
  const double duration_s = (argc >= 7) ? std::atof(argv[6]) : 320.0;
  const double dt_s = (argc >= 8) ? std::atof(argv[7]) : 0.02;
  const double ridge_peak_m = (argc >= 9) ? std::atof(argv[8]) : 600.0;

  if (!(dt_s > 0.0) || !(duration_s > 0.0) || !std::isfinite(altitude_m) || !std::isfinite(ground_speed_mps)) {
    spdlog::error("invalid flight parameters: require dt>0, duration>0, finite altitude and speed");
    return 2;
  }
  const double step_count = std::ceil(duration_s / dt_s);
  if (!(step_count < static_cast<double>(std::numeric_limits<int>::max()))) {
    spdlog::error("invalid flight parameters: duration/dt gives {} steps, limit is {}",
                  step_count,
                  std::numeric_limits<int>::max());
    return 2;
  }

  std::ofstream out(out_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", out_csv.string());
    return 3;
  }

  const ridgelift::core::SphericalFrame frame{.center_m = ridgelift::core::Vec3{}, .radius_m = ridgelift::core::constants::kKerbinRadiusM};
  const ridgelift::models::BellRidgeTerrainModel terrain(
      {.frame = frame, .axis_lon_deg = 0.0, .peak_height_m = ridge_peak_m, .half_width_m = 2000.0, .base_height_m = 0.0});
  const ridgelift::core::BodyContext body{.name = "Kerbin", .has_atmosphere = true, .terrain = &terrain};

  ridgelift::registry::WindRegistry registry;
  const ridgelift::models::UniformWindProvider prevailing("prevailing", ridgelift::core::Vec3{wind_east_mps, 0.0, 0.0});
  if (!registry.register_provider(&prevailing)) {
    spdlog::error("failed to register prevailing wind provider");
    return 4;
  }

  std::unique_ptr<ridgelift::runtime::RidgeLiftSession> session{};
  if (settings_file.empty()) {
    session = std::make_unique<ridgelift::runtime::RidgeLiftSession>(
        ridgelift::runtime::RidgeLiftSession::Config{}, registry, [&registry]() { return &registry; });
  } else {
    session = ridgelift::runtime::RidgeLiftSession::FromSettingsFile(settings_file, registry, [&registry]() { return &registry; });
  }

  out << "t_s,surface_x_m,terrain_m,agl_m,target_up_mps,smoothed_up_mps,slope,registered\n";

  const double m_to_deg = ridgelift::core::constants::kRadToDeg / frame.radius_m;
  const int steps = static_cast<int>(step_count);
  int status_lines = 0;
  for (int i = 0; i <= steps; ++i) {
    const double t = static_cast<double>(i) * dt_s;
    const double surface_x_m = kStartOffsetM + ground_speed_mps * t;
    const ridgelift::core::GeodeticPoint geo{.lat_deg = 0.0, .lon_deg = surface_x_m * m_to_deg, .alt_m = altitude_m};

    const ridgelift::core::FlightContext ctx{
        .vehicle_id = kVehicleId,
        .world_ready = true,
        .vehicle_present = true,
        .body = &body,
        .position_m = ridgelift::core::world_from_geodetic(geo, frame),
        .altitude_m = altitude_m};
    session->fixed_update({ctx}, dt_s);
    status_lines += static_cast<int>(session->update(dt_s).size());

    const auto* state = session->engine().state(kVehicleId);
    const auto* result = session->engine().last_result(kVehicleId);
    const auto up = terrain.up_from_world(ctx.position_m);
    const double terrain_m = terrain.elevation_m(geo.lat_deg, geo.lon_deg);
    out << fmt::format("{:.3f},{:.3f},{:.3f},{:.3f},{:.6f},{:.6f},{:.6f},{}\n",
                       t,
                       surface_x_m,
                       terrain_m,
                       (result != nullptr) ? result->agl_m : std::nan(""),
                       (state != nullptr) ? ridgelift::core::dot(state->target_mps, up) : 0.0,
                       (state != nullptr) ? ridgelift::core::dot(state->smoothed_mps, up) : 0.0,
                       (state != nullptr) ? state->last_slope : 0.0,
                       session->registration_status() == ridgelift::registry::RegistrationStatus::Registered ? 1 : 0);
  }

  spdlog::info("wrote ridge profile: {} ({} status lines)", out_csv.string(), status_lines);
  return 0;
}
