/**
 * @file smoother.hpp
 * @brief Exponential approach of the published wind vector toward its target.
 * @author Watosn
 */
#pragma once

#include "ridgelift/core/types.hpp"

namespace ridgelift::lift {

/**
 * @brief Blend fraction `clamp01(dt * rate)`; zero when either input is non-finite.
 */
[[nodiscard]] double smoothing_fraction(double dt_s, double rate_per_s);

/**
 * @brief One smoothing step from `current` toward `target`.
 *
 * Returns zero if the blended vector is not finite.
 */
[[nodiscard]] ridgelift::core::Vec3 smooth_toward(const ridgelift::core::Vec3& current,
                                                  const ridgelift::core::Vec3& target,
                                                  double dt_s,
                                                  double rate_per_s);

}  // namespace ridgelift::lift
