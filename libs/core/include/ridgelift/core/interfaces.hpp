/**
 * @file interfaces.hpp
 * @brief Collaborator interfaces for terrain, ambient wind and wind providers.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string_view>

#include "ridgelift/core/types.hpp"

namespace ridgelift::core {

/**
 * @brief Interface for body terrain elevation queries.
 */
class ITerrainModel {
 public:
  virtual ~ITerrainModel() = default;
  /**
   * @brief Terrain elevation above the body datum.
   * @param lat_deg Latitude in degrees.
   * @param lon_deg Longitude in degrees.
   * @return Elevation in meters; negative values denote sea floor.
   */
  [[nodiscard]] virtual double elevation_m(double lat_deg, double lon_deg) const = 0;
  /**
   * @brief Resolve a world position to a geodetic point on this body.
   */
  [[nodiscard]] virtual GeodeticPoint geodetic_from_world(const Vec3& position_m) const = 0;
  /**
   * @brief Local unit up direction at a world position.
   */
  [[nodiscard]] virtual Vec3 up_from_world(const Vec3& position_m) const = 0;
};

/**
 * @brief Wind lookup request issued by a consumer.
 *
 * `consumer` is empty when the query does not come from a tracked vehicle.
 */
struct WindQuery {
  const BodyContext* body{nullptr};
  std::optional<VehicleId> consumer{};
  Vec3 position_m{};
};

/**
 * @brief Interface for one named wind contribution.
 */
class IWindProvider {
 public:
  virtual ~IWindProvider() = default;
  /**
   * @brief Stable identifier used for registration and feedback exclusion.
   */
  [[nodiscard]] virtual std::string_view provider_id() const = 0;
  /**
   * @brief Wind contribution at a query point in world frame (m/s).
   */
  [[nodiscard]] virtual Vec3 wind_at(const WindQuery& query) const = 0;
};

/**
 * @brief Aggregated ambient wind, excluding one provider.
 */
class IAmbientWindSource {
 public:
  virtual ~IAmbientWindSource() = default;
  /**
   * @brief Sum of all provider contributions except `excluded_provider_id`.
   */
  [[nodiscard]] virtual Vec3 wind_at(const WindQuery& query, std::string_view excluded_provider_id) const = 0;
};

/**
 * @brief Registration surface of a wind-aggregation registry.
 */
class IWindRegistry {
 public:
  virtual ~IWindRegistry() = default;
  /**
   * @brief Register a non-owning provider.
   * @return False when the provider is null or its id is already registered.
   */
  virtual bool register_provider(const IWindProvider* provider) = 0;
  /**
   * @brief Remove a provider by id.
   * @return False when no provider with that id is registered.
   */
  virtual bool deregister_provider(std::string_view provider_id) = 0;
};

}  // namespace ridgelift::core
