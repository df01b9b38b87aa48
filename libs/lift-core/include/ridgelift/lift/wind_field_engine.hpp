/**
 * @file wind_field_engine.hpp
 * @brief Per-vehicle ridge-lift state, smoothing and provider queries.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "ridgelift/core/interfaces.hpp"
#include "ridgelift/lift/lift_config.hpp"
#include "ridgelift/lift/ridge_lift_model.hpp"

namespace ridgelift::lift {

/**
 * @brief Mutable ridge-lift state of one tracked vehicle.
 */
struct WindFieldState {
  ridgelift::core::Vec3 smoothed_mps{};
  ridgelift::core::Vec3 target_mps{};
  double last_slope{};
  int tick_counter{};
  bool active{};
  ridgelift::core::Vec3 position_m{};
  std::string body_name{};
};

/**
 * @brief Ridge-lift engine publishing a smoothed vertical wind per vehicle.
 *
 * The physics tick mutates state; `wind_at` and the accessors are read-only.
 */
class WindFieldEngine final : public ridgelift::core::IWindProvider {
 public:
  static constexpr std::string_view kProviderId = "RidgeLift";

  /**
   * @brief Construct engine.
   * @param ambient Ambient wind source; this engine's own id is excluded from its queries.
   * @param config Pipeline parameters.
   */
  explicit WindFieldEngine(const ridgelift::core::IAmbientWindSource& ambient, LiftConfig config = {})
      : model_(ambient, config, std::string(kProviderId)) {}

  [[nodiscard]] std::string_view provider_id() const override { return kProviderId; }

  /**
   * @brief Smoothed ridge-lift wind for a consumer.
   *
   * A tracked consumer gets its own vector. Anyone else gets the vector of the nearest active vehicle on the same
   * body within the proximity radius, or zero. A query without a body matches no vehicle.
   */
  [[nodiscard]] ridgelift::core::Vec3 wind_at(const ridgelift::core::WindQuery& query) const override;

  /**
   * @brief Fixed-interval physics tick for one vehicle.
   *
   * An invalid context pins that vehicle's vectors to zero. A valid one advances the smoother and, every
   * `update_interval_ticks` ticks, recomputes the target.
   */
  void tick(const ridgelift::core::FlightContext& ctx, double dt_s);

  /**
   * @brief Force one tracked vehicle into the inactive state.
   */
  void deactivate(ridgelift::core::VehicleId vehicle_id);
  /**
   * @brief Force every tracked vehicle into the inactive state, e.g. when the world is not ready.
   */
  void deactivate_all();
  /**
   * @brief Force every tracked vehicle not in `present` into the inactive state.
   */
  void deactivate_all_except(const std::unordered_set<ridgelift::core::VehicleId>& present);
  /**
   * @brief Stop tracking a vehicle and discard its state.
   */
  bool remove(ridgelift::core::VehicleId vehicle_id);

  [[nodiscard]] const WindFieldState* state(ridgelift::core::VehicleId vehicle_id) const;
  [[nodiscard]] const std::unordered_map<ridgelift::core::VehicleId, WindFieldState>& states() const { return states_; }
  [[nodiscard]] const LiftConfig& config() const { return model_.config(); }
  /**
   * @brief Result of the most recent target recompute, per vehicle.
   */
  [[nodiscard]] const RidgeLiftResult* last_result(ridgelift::core::VehicleId vehicle_id) const;

 private:
  static bool is_valid(const ridgelift::core::FlightContext& ctx);
  static void reset(WindFieldState& state);

  RidgeLiftModel model_;
  std::unordered_map<ridgelift::core::VehicleId, WindFieldState> states_{};
  std::unordered_map<ridgelift::core::VehicleId, RidgeLiftResult> last_results_{};
};

}  // namespace ridgelift::lift
