/**
 * @file ridge_lift_session.cpp
 * @brief Host lifecycle glue implementation.
 * @author Watosn
 */

#include "ridgelift/runtime/ridge_lift_session.hpp"

#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "ridgelift/config/settings_loader.hpp"

namespace ridgelift::runtime {

std::unique_ptr<RidgeLiftSession> RidgeLiftSession::FromSettingsFile(
    const std::filesystem::path& settings_file,
    const ridgelift::core::IAmbientWindSource& ambient,
    ridgelift::registry::ProviderRegistration::RegistryLocator locator) {
  const auto loaded = ridgelift::config::load_settings_file(settings_file);
  if (!loaded.rejected_keys.empty()) {
    spdlog::warn("{} ridgelift setting(s) fell back to defaults", loaded.rejected_keys.size());
  }
  return std::make_unique<RidgeLiftSession>(Config{.lift = loaded.config}, ambient, std::move(locator));
}

RidgeLiftSession::RidgeLiftSession(const Config& config,
                                   const ridgelift::core::IAmbientWindSource& ambient,
                                   ridgelift::registry::ProviderRegistration::RegistryLocator locator)
    : engine_(ambient, config.lift), registration_(engine_, std::move(locator), config.retry) {}

void RidgeLiftSession::fixed_update(const std::vector<ridgelift::core::FlightContext>& contexts, double dt_s) {
  registration_.update(dt_s);
  std::unordered_set<ridgelift::core::VehicleId> ticked{};
  for (const auto& ctx : contexts) {
    engine_.tick(ctx, dt_s);
    ticked.insert(ctx.vehicle_id);
  }
  // Vehicles absent from this tick lose their lift at once.
  engine_.deactivate_all_except(ticked);
}

void RidgeLiftSession::fixed_update_not_ready(double dt_s) {
  registration_.update(dt_s);
  engine_.deactivate_all();
}

std::vector<ridgelift::lift::StatusLine> RidgeLiftSession::update(double dt_s) { return reporter_.update(engine_, dt_s); }

}  // namespace ridgelift::runtime
