// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for filter and generator calculations.
// All components should import these constants instead of defining locally.
//
// Constants are double precision: control-loop timesteps and accumulated time
// are carried as double throughout the library.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

#include <numbers>

namespace Kinetic {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant
inline constexpr double kPi = std::numbers::pi_v<double>;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f
inline constexpr double kTwoPi = 2.0 * kPi;

} // namespace DSP
} // namespace Kinetic
