/**
 * @file uniform_wind.cpp
 * @brief Uniform wind provider implementation.
 * @author Watosn
 */

#include "ridgelift/models/uniform_wind.hpp"

#include "ridgelift/core/conversions.hpp"

namespace ridgelift::models {

ridgelift::core::Vec3 UniformWindProvider::wind_at(const ridgelift::core::WindQuery& query) const {
  if (query.body == nullptr || query.body->terrain == nullptr || !query.body->has_atmosphere) {
    return ridgelift::core::Vec3{};
  }
  const auto geo = query.body->terrain->geodetic_from_world(query.position_m);
  return ridgelift::core::world_from_enu(geo.lat_deg, geo.lon_deg, wind_enu_mps_);
}

}  // namespace ridgelift::models
