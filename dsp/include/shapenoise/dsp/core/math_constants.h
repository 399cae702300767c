// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
// All DSP components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Shapenoise {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
/// Provides full float precision: 3.14159265358979323846
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for random phase generation: phase = kTwoPi * u, u in [0, 1)
inline constexpr float kTwoPi = 2.0f * kPi;

/// Pi in double precision
/// Used where phase terms k*n/N must stay exact for large N
inline constexpr double kPiDouble = 3.14159265358979323846;

} // namespace DSP
} // namespace Shapenoise
