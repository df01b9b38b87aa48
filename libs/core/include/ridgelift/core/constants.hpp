/**
 * @file constants.hpp
 * @brief Shared constants for ridge-lift models.
 * @author Watosn
 */
#pragma once

namespace ridgelift::core::constants {

inline constexpr double kPi = 3.1415926535897932384626433832795;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;
inline constexpr double kEarthRadiusWgs84M = 6378137.0;
inline constexpr double kKerbinRadiusM = 600000.0;

}  // namespace ridgelift::core::constants
