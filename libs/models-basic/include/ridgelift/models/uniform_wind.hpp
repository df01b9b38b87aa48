/**
 * @file uniform_wind.hpp
 * @brief Constant local-frame wind provider.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "ridgelift/core/interfaces.hpp"

namespace ridgelift::models {

/**
 * @brief Wind with fixed east/north/up components everywhere on a body.
 *
 * The local basis is resolved from the query body's terrain model; queries without a body or terrain return zero.
 */
class UniformWindProvider final : public ridgelift::core::IWindProvider {
 public:
  /**
   * @param provider_id Registry id.
   * @param wind_enu_mps East/north/up wind components (x/y/z).
   */
  UniformWindProvider(std::string provider_id, ridgelift::core::Vec3 wind_enu_mps)
      : id_(std::move(provider_id)), wind_enu_mps_(wind_enu_mps) {}

  [[nodiscard]] std::string_view provider_id() const override { return id_; }
  [[nodiscard]] ridgelift::core::Vec3 wind_at(const ridgelift::core::WindQuery& query) const override;

 private:
  std::string id_{};
  ridgelift::core::Vec3 wind_enu_mps_{};
};

}  // namespace ridgelift::models
