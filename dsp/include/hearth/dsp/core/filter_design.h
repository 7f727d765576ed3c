// ==============================================================================
// Layer 0: Core Utility - Filter Design Math
// ==============================================================================
// Analog prototype and bilinear-transform helpers for Butterworth design.
// Pure math, no state: the biquad layer turns these poles into sections.
//
// References:
// - Butterworth prototype: poles evenly spaced on the left half unit circle
// - Bilinear transform with frequency prewarping: w_a = 2 fs tan(pi f / fs)
// ==============================================================================

#pragma once

#include <hearth/dsp/core/math_constants.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Hearth {
namespace DSP {
namespace FilterDesign {

/// Analog angular frequency (rad/s) that maps to `frequencyHz` after the
/// bilinear transform at `sampleRate`: 2 fs tan(pi f / fs).
/// Non-positive sample rate or frequency returns 2 pi f unchanged.
[[nodiscard]] inline double prewarpAngular(double frequencyHz, double sampleRate) noexcept {
    if (sampleRate <= 0.0 || frequencyHz <= 0.0) {
        return kTwoPiD * frequencyHz;
    }
    return 2.0 * sampleRate * std::tan(kPiD * frequencyHz / sampleRate);
}

/// Prewarped frequency in Hz: (fs / pi) tan(pi f / fs).
[[nodiscard]] inline double prewarpFrequency(double frequencyHz, double sampleRate) noexcept {
    if (sampleRate <= 0.0 || frequencyHz <= 0.0) {
        return frequencyHz;
    }
    return prewarpAngular(frequencyHz, sampleRate) / kTwoPiD;
}

/// Angle (radians, measured from the positive real axis) of the k-th
/// left-half-plane pole of an order-N Butterworth prototype.
/// theta_k = pi (2k + N + 1) / (2N). N = 0 returns 0.
[[nodiscard]] constexpr double butterworthPoleAngle(size_t k, size_t order) noexcept {
    if (order == 0) return 0.0;
    return kPiD * static_cast<double>(2 * k + order + 1) / static_cast<double>(2 * order);
}

/// Poles of the normalized (1 rad/s) order-N analog Butterworth lowpass.
[[nodiscard]] inline std::vector<std::complex<double>> butterworthPrototypePoles(size_t order) {
    std::vector<std::complex<double>> poles;
    poles.reserve(order);
    for (size_t k = 0; k < order; ++k) {
        poles.push_back(std::polar(1.0, butterworthPoleAngle(k, order)));
    }
    return poles;
}

/// Map an analog pole/zero to the z-plane: z = (2fs + s) / (2fs - s).
[[nodiscard]] inline std::complex<double> bilinear(std::complex<double> s, double sampleRate) noexcept {
    const double fs2 = 2.0 * sampleRate;
    return (fs2 + s) / (fs2 - s);
}

} // namespace FilterDesign
} // namespace DSP
} // namespace Hearth
