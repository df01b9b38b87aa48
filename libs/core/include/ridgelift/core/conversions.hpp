/**
 * @file conversions.hpp
 * @brief Coordinate conversion helpers for spherical bodies.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>

#include "ridgelift/core/constants.hpp"
#include "ridgelift/core/types.hpp"

namespace ridgelift::core {

inline GeodeticPoint spherical_geodetic_from_world(const Vec3& position_m, const SphericalFrame& frame) {
  const Vec3 rel = position_m - frame.center_m;
  const double r = norm(rel);
  if (r <= 0.0) {
    return GeodeticPoint{};
  }
  const double lat = std::asin(std::clamp(rel.z / r, -1.0, 1.0)) * constants::kRadToDeg;
  const double lon = std::atan2(rel.y, rel.x) * constants::kRadToDeg;
  return GeodeticPoint{.lat_deg = lat, .lon_deg = lon, .alt_m = r - frame.radius_m};
}

inline Vec3 spherical_up_from_world(const Vec3& position_m, const SphericalFrame& frame) {
  return normalized(position_m - frame.center_m);
}

inline Vec3 world_from_geodetic(const GeodeticPoint& geo, const SphericalFrame& frame) {
  const double lat = geo.lat_deg * constants::kDegToRad;
  const double lon = geo.lon_deg * constants::kDegToRad;
  const double r = frame.radius_m + geo.alt_m;
  return frame.center_m + Vec3{r * std::cos(lat) * std::cos(lon), r * std::cos(lat) * std::sin(lon), r * std::sin(lat)};
}

/**
 * @brief Rotate a local east/north/up vector into the body-fixed world frame.
 */
inline Vec3 world_from_enu(double lat_deg, double lon_deg, const Vec3& enu) {
  const double lat = lat_deg * constants::kDegToRad;
  const double lon = lon_deg * constants::kDegToRad;
  const double v_e = enu.x;
  const double v_n = enu.y;
  const double v_u = enu.z;
  return Vec3{
      -std::sin(lon) * v_e - std::sin(lat) * std::cos(lon) * v_n + std::cos(lat) * std::cos(lon) * v_u,
      std::cos(lon) * v_e - std::sin(lat) * std::sin(lon) * v_n + std::cos(lat) * std::sin(lon) * v_u,
      std::cos(lat) * v_n + std::sin(lat) * v_u,
  };
}

/**
 * @brief Wrap a longitude into [-180, 180).
 */
inline double wrap_longitude_deg(double lon_deg) {
  double lon = std::fmod(lon_deg + 180.0, 360.0);
  if (lon < 0.0) {
    lon += 360.0;
  }
  return lon - 180.0;
}

}  // namespace ridgelift::core
