/**
 * @file status_reporter.cpp
 * @brief Status line reporting implementation.
 * @author Watosn
 */

#include "ridgelift/lift/status_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ridgelift::lift {

StatusLine make_status_line(ridgelift::core::VehicleId vehicle_id, const WindFieldState& state) {
  const double magnitude = ridgelift::core::norm(state.smoothed_mps);
  std::string label = (state.last_slope > 0.0) ? "Lift" : "Sink";
  std::string text = fmt::format("[Ridge] {}: {:.1f} m/s", label, magnitude);
  return StatusLine{.vehicle_id = vehicle_id, .label = std::move(label), .magnitude_mps = magnitude, .text = std::move(text)};
}

std::vector<StatusLine> LiftStatusReporter::update(const WindFieldEngine& engine, double dt_s) {
  const auto& config = engine.config();
  std::vector<StatusLine> lines{};
  if (!config.debug_mode) {
    return lines;
  }
  if (std::isfinite(dt_s) && dt_s > 0.0) {
    elapsed_s_ += dt_s;
  }
  if (elapsed_s_ <= config.status_interval_s) {
    return lines;
  }
  elapsed_s_ = 0.0;

  const double min_sq = config.status_min_speed_mps * config.status_min_speed_mps;
  for (const auto& [id, s] : engine.states()) {
    if (!s.active || ridgelift::core::norm_squared(s.smoothed_mps) <= min_sq) {
      continue;
    }
    lines.push_back(make_status_line(id, s));
  }
  std::sort(lines.begin(), lines.end(), [](const StatusLine& a, const StatusLine& b) { return a.vehicle_id < b.vehicle_id; });
  for (const auto& line : lines) {
    spdlog::info("vehicle {}: {}", line.vehicle_id, line.text);
  }
  return lines;
}

}  // namespace ridgelift::lift
