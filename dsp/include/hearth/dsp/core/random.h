// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// Deterministic, explicitly seeded noise source. Every noise texture in a
// render is reproducible from its seed alone.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <hearth/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Hearth {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Period 2^32-1, passes most statistical tests, fully deterministic for a
/// given seed. Gaussian samples come from the Box-Muller transform over two
/// uniform draws, with the second value cached for the next call.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5
///
/// @note NOT cryptographically secure - for audio/DSP use only
///
/// @example Basic usage:
///     Xorshift32 rng(123);
///     double g = rng.nextGaussian();  // N(0, 1)
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next float in bipolar range.
    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    /// Generate next float in unipolar range.
    /// @return Random float in range [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// Generate next double in the half-open range (0.0, 1.0].
    /// Never returns 0, so it is safe as a log() argument.
    [[nodiscard]] constexpr double nextUnitOpen() noexcept {
        return static_cast<double>(next()) * kToDouble;
    }

    /// Generate a standard normal sample (mean 0, variance 1).
    [[nodiscard]] double nextGaussian() noexcept {
        if (hasSpare_) {
            hasSpare_ = false;
            return spare_;
        }
        const double u1 = nextUnitOpen();
        const double u2 = nextUnitOpen();
        const double radius = std::sqrt(-2.0 * std::log(u1));
        const double angle = kTwoPiD * u2;
        spare_ = radius * std::sin(angle);
        hasSpare_ = true;
        return radius * std::cos(angle);
    }

    /// Reseed the generator and drop any cached Gaussian value.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
        hasSpare_ = false;
        spare_ = 0.0;
    }

    /// Get current state (for debugging/serialization).
    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;
    static constexpr double kToDouble = 1.0 / 4294967295.0;

    uint32_t state_;
    double spare_ = 0.0;
    bool hasSpare_ = false;
};

/// Derive a per-item seed from a base seed and an index.
/// Keeps sibling noise bursts uncorrelated while staying reproducible.
[[nodiscard]] constexpr uint32_t deriveSeed(uint32_t baseSeed, uint32_t index) noexcept {
    // splitmix32-style finalizer
    uint32_t z = baseSeed + 0x9E3779B9u * (index + 1u);
    z = (z ^ (z >> 16)) * 0x85EBCA6Bu;
    z = (z ^ (z >> 13)) * 0xC2B2AE35u;
    z ^= z >> 16;
    return z != 0 ? z : 1u;
}

} // namespace DSP
} // namespace Hearth
