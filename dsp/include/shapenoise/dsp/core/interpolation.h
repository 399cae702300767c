// ==============================================================================
// Layer 0: Core Utility - Interpolation
// ==============================================================================
// Standalone interpolation helpers shared by the response-curve primitive.
// ==============================================================================

#pragma once

namespace Shapenoise {
namespace DSP {
namespace Interpolation {

// =============================================================================
// Linear Interpolation
// =============================================================================

/// @brief Linear interpolation between two values.
///
/// @param y0 Value at position 0
/// @param y1 Value at position 1
/// @param t Fractional position in [0, 1]
/// @return Interpolated value
///
/// @note Returns y0 when t=0, y1 when t=1
/// @note For t outside [0,1], extrapolates linearly
///
/// @formula y = y0 + t * (y1 - y0) = (1-t)*y0 + t*y1
///
/// @example
/// @code
/// double mid = linearInterpolate(0.0, 1.0, 0.5);  // = 0.5
/// @endcode
[[nodiscard]] constexpr double linearInterpolate(
    double y0,
    double y1,
    double t
) noexcept {
    return y0 + t * (y1 - y0);
}

/// @brief Linear interpolation of y at x between two points (x0, y0), (x1, y1).
///
/// @pre x1 > x0
/// @note Returns y0 exactly at x == x0 and y1 exactly at x == x1, so control
///       points are reproduced without rounding drift.
[[nodiscard]] constexpr double linearInterpolateAt(
    double x0, double y0,
    double x1, double y1,
    double x
) noexcept {
    if (x <= x0) return y0;
    if (x >= x1) return y1;
    return linearInterpolate(y0, y1, (x - x0) / (x1 - x0));
}

} // namespace Interpolation
} // namespace DSP
} // namespace Shapenoise
