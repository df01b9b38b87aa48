/**
 * @file smoother.cpp
 * @brief Smoothing step implementation.
 * @author Watosn
 */

#include "ridgelift/lift/smoother.hpp"

#include <algorithm>
#include <cmath>

namespace ridgelift::lift {

double smoothing_fraction(double dt_s, double rate_per_s) {
  const double t = dt_s * rate_per_s;
  if (!std::isfinite(t)) {
    return 0.0;
  }
  return std::clamp(t, 0.0, 1.0);
}

ridgelift::core::Vec3 smooth_toward(const ridgelift::core::Vec3& current,
                                    const ridgelift::core::Vec3& target,
                                    double dt_s,
                                    double rate_per_s) {
  const double t = smoothing_fraction(dt_s, rate_per_s);
  const ridgelift::core::Vec3 out = current + (target - current) * t;
  if (!ridgelift::core::is_finite(out)) {
    return ridgelift::core::Vec3{};
  }
  return out;
}

}  // namespace ridgelift::lift
