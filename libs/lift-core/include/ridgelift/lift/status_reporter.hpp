/**
 * @file status_reporter.hpp
 * @brief Periodic human-readable ridge-lift status lines.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "ridgelift/lift/wind_field_engine.hpp"

namespace ridgelift::lift {

/**
 * @brief One status line for a vehicle experiencing noticeable lift or sink.
 */
struct StatusLine {
  ridgelift::core::VehicleId vehicle_id{};
  std::string label{};
  double magnitude_mps{};
  std::string text{};
};

/**
 * @brief Slow diagnostic tick; reads the engine, never mutates it.
 */
class LiftStatusReporter {
 public:
  /**
   * @brief Advance the report timer and emit lines when the interval elapses.
   * @return Lines emitted on this call (empty most of the time).
   */
  std::vector<StatusLine> update(const WindFieldEngine& engine, double dt_s);

  [[nodiscard]] double elapsed_s() const { return elapsed_s_; }

 private:
  double elapsed_s_{};
};

/**
 * @brief Format the status line for one vehicle state.
 */
[[nodiscard]] StatusLine make_status_line(ridgelift::core::VehicleId vehicle_id, const WindFieldState& state);

}  // namespace ridgelift::lift
