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

namespace Hearth {
namespace DSP {

// =============================================================================
// Mathematical Constants (double precision)
// =============================================================================
// Oscillator phase and filter design run in double precision.

/// Pi in double precision
inline constexpr double kPiD = 3.14159265358979323846;

/// Two times Pi in double precision
inline constexpr double kTwoPiD = 2.0 * kPiD;

} // namespace DSP
} // namespace Hearth
