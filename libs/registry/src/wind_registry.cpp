/**
 * @file wind_registry.cpp
 * @brief Wind-aggregation registry implementation.
 * @author Watosn
 */

#include "ridgelift/registry/wind_registry.hpp"

#include <algorithm>

namespace ridgelift::registry {

bool WindRegistry::register_provider(const ridgelift::core::IWindProvider* provider) {
  if (provider == nullptr || contains(provider->provider_id())) {
    return false;
  }
  providers_.push_back(provider);
  return true;
}

bool WindRegistry::deregister_provider(std::string_view provider_id) {
  const auto it = std::find_if(providers_.begin(), providers_.end(), [&](const ridgelift::core::IWindProvider* p) {
    return p->provider_id() == provider_id;
  });
  if (it == providers_.end()) {
    return false;
  }
  providers_.erase(it);
  return true;
}

bool WindRegistry::contains(std::string_view provider_id) const {
  return std::any_of(providers_.begin(), providers_.end(), [&](const ridgelift::core::IWindProvider* p) {
    return p->provider_id() == provider_id;
  });
}

std::vector<std::string> WindRegistry::provider_ids() const {
  std::vector<std::string> ids{};
  ids.reserve(providers_.size());
  for (const auto* p : providers_) {
    ids.emplace_back(p->provider_id());
  }
  return ids;
}

ridgelift::core::Vec3 WindRegistry::wind_at(const ridgelift::core::WindQuery& query,
                                            std::string_view excluded_provider_id) const {
  ridgelift::core::Vec3 total{};
  for (const auto* p : providers_) {
    if (p->provider_id() == excluded_provider_id) {
      continue;
    }
    const auto w = p->wind_at(query);
    if (!ridgelift::core::is_finite(w)) {
      continue;
    }
    total = total + w;
  }
  return total;
}

ridgelift::core::Vec3 WindRegistry::wind_at(const ridgelift::core::WindQuery& query) const {
  return wind_at(query, std::string_view{});
}

}  // namespace ridgelift::registry
