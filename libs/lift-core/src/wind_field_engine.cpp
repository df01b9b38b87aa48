/**
 * @file wind_field_engine.cpp
 * @brief Ridge-lift engine implementation.
 * @author Watosn
 */

#include "ridgelift/lift/wind_field_engine.hpp"

#include <limits>

#include "ridgelift/lift/smoother.hpp"

namespace ridgelift::lift {

bool WindFieldEngine::is_valid(const ridgelift::core::FlightContext& ctx) {
  return ctx.world_ready && ctx.vehicle_present && ctx.body != nullptr;
}

void WindFieldEngine::reset(WindFieldState& state) {
  state.target_mps = ridgelift::core::Vec3{};
  state.smoothed_mps = ridgelift::core::Vec3{};
  state.active = false;
}

void WindFieldEngine::tick(const ridgelift::core::FlightContext& ctx, double dt_s) {
  if (!is_valid(ctx)) {
    deactivate(ctx.vehicle_id);
    return;
  }

  auto& s = states_[ctx.vehicle_id];
  s.active = true;
  s.position_m = ctx.position_m;
  s.body_name = ctx.body->name;

  s.smoothed_mps = smooth_toward(s.smoothed_mps, s.target_mps, dt_s, config().smoothing_speed_per_s);

  ++s.tick_counter;
  if (s.tick_counter >= config().update_interval_ticks) {
    s.tick_counter = 0;
    const auto result = model_.evaluate(ctx);
    s.target_mps = result.target_mps;
    s.last_slope = result.slope;
    last_results_[ctx.vehicle_id] = result;
  }
}

void WindFieldEngine::deactivate(ridgelift::core::VehicleId vehicle_id) {
  const auto it = states_.find(vehicle_id);
  if (it == states_.end()) {
    return;
  }
  reset(it->second);
}

void WindFieldEngine::deactivate_all() {
  for (auto& entry : states_) {
    reset(entry.second);
  }
}

void WindFieldEngine::deactivate_all_except(const std::unordered_set<ridgelift::core::VehicleId>& present) {
  for (auto& entry : states_) {
    if (present.count(entry.first) == 0U) {
      reset(entry.second);
    }
  }
}

bool WindFieldEngine::remove(ridgelift::core::VehicleId vehicle_id) {
  last_results_.erase(vehicle_id);
  return states_.erase(vehicle_id) > 0U;
}

const WindFieldState* WindFieldEngine::state(ridgelift::core::VehicleId vehicle_id) const {
  const auto it = states_.find(vehicle_id);
  return (it == states_.end()) ? nullptr : &it->second;
}

const RidgeLiftResult* WindFieldEngine::last_result(ridgelift::core::VehicleId vehicle_id) const {
  const auto it = last_results_.find(vehicle_id);
  return (it == last_results_.end()) ? nullptr : &it->second;
}

ridgelift::core::Vec3 WindFieldEngine::wind_at(const ridgelift::core::WindQuery& query) const {
  if (query.consumer.has_value()) {
    const auto* own = state(*query.consumer);
    if (own != nullptr) {
      return own->smoothed_mps;
    }
  }

  if (query.body == nullptr) {
    return ridgelift::core::Vec3{};
  }

  const double radius = config().proximity_radius_m;
  const double radius_sq = radius * radius;
  double best_sq = std::numeric_limits<double>::infinity();
  const WindFieldState* best = nullptr;
  for (const auto& [id, s] : states_) {
    if (!s.active || ridgelift::core::is_zero(s.smoothed_mps)) {
      continue;
    }
    if (query.body->name != s.body_name) {
      continue;
    }
    const double d_sq = ridgelift::core::norm_squared(query.position_m - s.position_m);
    if (d_sq < radius_sq && d_sq < best_sq) {
      best_sq = d_sq;
      best = &s;
    }
  }
  return (best != nullptr) ? best->smoothed_mps : ridgelift::core::Vec3{};
}

}  // namespace ridgelift::lift
