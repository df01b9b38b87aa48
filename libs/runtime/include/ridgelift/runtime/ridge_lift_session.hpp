/**
 * @file ridge_lift_session.hpp
 * @brief Host lifecycle glue: settings, engine, provider registration and status reporting.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "ridgelift/lift/lift_config.hpp"
#include "ridgelift/lift/status_reporter.hpp"
#include "ridgelift/lift/wind_field_engine.hpp"
#include "ridgelift/registry/provider_registration.hpp"

namespace ridgelift::runtime {

/**
 * @brief One ridge-lift add-on instance as seen by a host simulator.
 *
 * Construction starts registration; destruction deregisters. The ambient source and whatever the locator returns
 * must outlive the session.
 */
class RidgeLiftSession {
 public:
  struct Config {
    ridgelift::lift::LiftConfig lift{};
    ridgelift::registry::RetryPolicy retry{};
  };

  /**
   * @brief Build a session from a settings file, falling back to defaults for anything missing or malformed.
   */
  static std::unique_ptr<RidgeLiftSession> FromSettingsFile(const std::filesystem::path& settings_file,
                                                            const ridgelift::core::IAmbientWindSource& ambient,
                                                            ridgelift::registry::ProviderRegistration::RegistryLocator locator);

  RidgeLiftSession(const Config& config,
                   const ridgelift::core::IAmbientWindSource& ambient,
                   ridgelift::registry::ProviderRegistration::RegistryLocator locator);

  RidgeLiftSession(const RidgeLiftSession&) = delete;
  RidgeLiftSession& operator=(const RidgeLiftSession&) = delete;

  /**
   * @brief Physics tick: registration retry plus one engine tick per context.
   *
   * Tracked vehicles with no context in `contexts` are forced inactive, so an empty list zeroes every vehicle.
   */
  void fixed_update(const std::vector<ridgelift::core::FlightContext>& contexts, double dt_s);

  /**
   * @brief Physics tick while the world is not ready: every tracked vehicle goes inactive.
   */
  void fixed_update_not_ready(double dt_s);

  /**
   * @brief Diagnostic tick.
   */
  std::vector<ridgelift::lift::StatusLine> update(double dt_s);

  [[nodiscard]] const ridgelift::lift::WindFieldEngine& engine() const { return engine_; }
  [[nodiscard]] ridgelift::registry::RegistrationStatus registration_status() const { return registration_.status(); }

 private:
  ridgelift::lift::WindFieldEngine engine_;
  ridgelift::lift::LiftStatusReporter reporter_{};
  ridgelift::registry::ProviderRegistration registration_;
};

}  // namespace ridgelift::runtime
