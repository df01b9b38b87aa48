/**
 * @file wind_registry.hpp
 * @brief Wind-aggregation registry of named providers.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ridgelift/core/interfaces.hpp"

namespace ridgelift::registry {

/**
 * @brief Registry summing the contributions of non-owning wind providers.
 *
 * Providers must outlive their registration.
 */
class WindRegistry final : public ridgelift::core::IWindRegistry, public ridgelift::core::IAmbientWindSource {
 public:
  bool register_provider(const ridgelift::core::IWindProvider* provider) override;
  bool deregister_provider(std::string_view provider_id) override;

  /**
   * @brief Total wind at a point, skipping `excluded_provider_id`.
   *
   * Non-finite contributions are dropped.
   */
  [[nodiscard]] ridgelift::core::Vec3 wind_at(const ridgelift::core::WindQuery& query,
                                              std::string_view excluded_provider_id) const override;
  /**
   * @brief Total wind from all providers.
   */
  [[nodiscard]] ridgelift::core::Vec3 wind_at(const ridgelift::core::WindQuery& query) const;

  [[nodiscard]] bool contains(std::string_view provider_id) const;
  [[nodiscard]] std::size_t size() const { return providers_.size(); }
  [[nodiscard]] std::vector<std::string> provider_ids() const;

 private:
  std::vector<const ridgelift::core::IWindProvider*> providers_{};
};

}  // namespace ridgelift::registry
