// ==============================================================================
// Layer 0: Core Utility - Decibel and Float Helpers
// ==============================================================================
// dB <-> linear gain conversion plus the small float helpers (NaN checks,
// denormal flushing, constexpr exp) shared by every higher layer.
//
// Layer 0: no dependencies on other DSP layers
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Hearth {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Gain floor used when converting silence to dB
inline constexpr float kSilenceDb = -144.0f;

/// Values below this magnitude are flushed to zero in recursive filters
inline constexpr double kDenormalThreshold = 1e-30;

namespace detail {

/// NaN check that survives -ffast-math (bit-level test)
[[nodiscard]] inline bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Flush tiny filter state values to zero
[[nodiscard]] inline constexpr double flushDenormal(double x) noexcept {
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0 : x;
}

/// Constexpr exp() for compile-time pitch tables.
/// Range-reduces by halving until |x| < 0.5, evaluates a Taylor series,
/// then squares back up.
[[nodiscard]] constexpr float constexprExp(float x) noexcept {
    int squarings = 0;
    while (x > 0.5f || x < -0.5f) {
        x *= 0.5f;
        ++squarings;
    }
    float term = 1.0f;
    float sum = 1.0f;
    for (int n = 1; n < 10; ++n) {
        term *= x / static_cast<float>(n);
        sum += term;
    }
    for (int i = 0; i < squarings; ++i) {
        sum *= sum;
    }
    return sum;
}

} // namespace detail

// =============================================================================
// dB Conversion
// =============================================================================

/// Convert decibels to linear gain: 10^(dB/20)
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) return 0.0f;
    return std::pow(10.0f, dB / 20.0f);
}

/// Convert linear gain to decibels; zero or negative gain returns kSilenceDb
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) return kSilenceDb;
    const float dB = 20.0f * std::log10(gain);
    return dB < kSilenceDb ? kSilenceDb : dB;
}

} // namespace DSP
} // namespace Hearth
