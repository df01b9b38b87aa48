/**
 * @file test_fakes.hpp
 * @brief Deterministic collaborator fakes shared by the ridgelift tests.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "ridgelift/core/interfaces.hpp"

namespace ridgelift::testing {

inline bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

inline bool approx(const ridgelift::core::Vec3& a, const ridgelift::core::Vec3& b, double tol = 1e-12) {
  return approx(a.x, b.x, tol) && approx(a.y, b.y, tol) && approx(a.z, b.z, tol);
}

/**
 * @brief Flat local world: x maps to longitude, y to latitude (both in meters), up is +z.
 */
class PlanarTerrain final : public ridgelift::core::ITerrainModel {
 public:
  using ElevationFn = std::function<double(double lat, double lon)>;

  explicit PlanarTerrain(ElevationFn fn) : fn_(std::move(fn)) {}

  [[nodiscard]] double elevation_m(double lat_deg, double lon_deg) const override {
    ++queries_;
    return fn_(lat_deg, lon_deg);
  }
  [[nodiscard]] ridgelift::core::GeodeticPoint geodetic_from_world(const ridgelift::core::Vec3& p) const override {
    return ridgelift::core::GeodeticPoint{.lat_deg = p.y, .lon_deg = p.x, .alt_m = p.z};
  }
  [[nodiscard]] ridgelift::core::Vec3 up_from_world(const ridgelift::core::Vec3& /*p*/) const override {
    return ridgelift::core::Vec3{0.0, 0.0, 1.0};
  }

  [[nodiscard]] int queries() const { return queries_; }

 private:
  ElevationFn fn_;
  mutable int queries_{};
};

/**
 * @brief Terrain rising linearly toward +x: `base + grade * x`.
 */
inline PlanarTerrain make_linear_ramp(double base_m, double grade) {
  return PlanarTerrain([base_m, grade](double /*lat*/, double lon) { return base_m + grade * lon; });
}

/**
 * @brief Ambient source returning a fixed vector and recording how it was called.
 */
class FixedAmbient final : public ridgelift::core::IAmbientWindSource {
 public:
  explicit FixedAmbient(ridgelift::core::Vec3 wind_mps) : wind_mps_(wind_mps) {}

  [[nodiscard]] ridgelift::core::Vec3 wind_at(const ridgelift::core::WindQuery& /*query*/,
                                              std::string_view excluded_provider_id) const override {
    ++calls_;
    last_excluded_ = std::string(excluded_provider_id);
    return wind_mps_;
  }

  void set_wind(const ridgelift::core::Vec3& wind_mps) { wind_mps_ = wind_mps; }
  [[nodiscard]] int calls() const { return calls_; }
  [[nodiscard]] const std::string& last_excluded() const { return last_excluded_; }

 private:
  ridgelift::core::Vec3 wind_mps_{};
  mutable int calls_{};
  mutable std::string last_excluded_{};
};

/**
 * @brief Wind provider with a fixed world-frame vector.
 */
class FixedProvider final : public ridgelift::core::IWindProvider {
 public:
  FixedProvider(std::string id, ridgelift::core::Vec3 wind_mps) : id_(std::move(id)), wind_mps_(wind_mps) {}

  [[nodiscard]] std::string_view provider_id() const override { return id_; }
  [[nodiscard]] ridgelift::core::Vec3 wind_at(const ridgelift::core::WindQuery& /*query*/) const override {
    return wind_mps_;
  }

 private:
  std::string id_{};
  ridgelift::core::Vec3 wind_mps_{};
};

inline ridgelift::core::FlightContext make_context(ridgelift::core::VehicleId id,
                                                   const ridgelift::core::BodyContext* body,
                                                   ridgelift::core::Vec3 position_m,
                                                   double altitude_m) {
  return ridgelift::core::FlightContext{
      .vehicle_id = id,
      .world_ready = true,
      .vehicle_present = true,
      .body = body,
      .position_m = position_m,
      .altitude_m = altitude_m};
}

}  // namespace ridgelift::testing
