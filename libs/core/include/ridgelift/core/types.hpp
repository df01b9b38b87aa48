/**
 * @file types.hpp
 * @brief Core domain types for ridgelift.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace ridgelift::core {

class ITerrainModel;

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DataUnavailable, NumericalError };

/**
 * @brief Host-assigned vehicle identity.
 */
using VehicleId = std::uint64_t;

/**
 * @brief Cartesian 3-vector.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }
inline bool operator==(const Vec3& a, const Vec3& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
inline bool operator!=(const Vec3& a, const Vec3& b) { return !(a == b); }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm_squared(const Vec3& v) { return dot(v, v); }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }
inline bool is_finite(const Vec3& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }
inline bool is_zero(const Vec3& v) { return v.x == 0.0 && v.y == 0.0 && v.z == 0.0; }

/**
 * @brief Unit vector along `v`, or zero when `v` has no usable length.
 */
inline Vec3 normalized(const Vec3& v) {
  const double n = norm(v);
  if (!(n > 0.0) || !std::isfinite(n)) {
    return Vec3{};
  }
  return v / n;
}

/**
 * @brief Latitude/longitude/altitude point on a body.
 */
struct GeodeticPoint {
  double lat_deg{};
  double lon_deg{};
  double alt_m{};
};

/**
 * @brief Spherical body frame used to resolve world positions to geodetic points.
 */
struct SphericalFrame {
  Vec3 center_m{};
  double radius_m{};
};

/**
 * @brief Celestial body the vehicle flies over.
 *
 * `terrain` is non-owning and must outlive any tick or query that references the body.
 */
struct BodyContext {
  std::string name{};
  bool has_atmosphere{true};
  const ITerrainModel* terrain{nullptr};
};

/**
 * @brief Explicit per-tick description of one simulated vehicle.
 */
struct FlightContext {
  VehicleId vehicle_id{};
  bool world_ready{};
  bool vehicle_present{};
  const BodyContext* body{nullptr};
  Vec3 position_m{};
  double altitude_m{};
};

}  // namespace ridgelift::core

namespace ridgelift {

using Status = core::Status;
using VehicleId = core::VehicleId;
using Vec3 = core::Vec3;
using GeodeticPoint = core::GeodeticPoint;
using SphericalFrame = core::SphericalFrame;
using BodyContext = core::BodyContext;
using FlightContext = core::FlightContext;

}  // namespace ridgelift
