// ==============================================================================
// Layer 1: DSP Primitive - Noise Texture Generator
// ==============================================================================
// Band-limited Gaussian noise for wind beds, leaf rustles and fire crackles.
// White noise from a seeded Xorshift32 (Box-Muller) is run through a chain
// of zero-phase Butterworth filters in order, then optionally swelled.
//
// Identical (duration, sampleRate, seed, spec) always gives identical output.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/random.h>
#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/primitives/zero_phase_filter.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

/// @brief Filter chain and optional swell for a noise texture.
struct NoiseSpec {
    std::vector<FilterSpec> filters;                ///< Applied in order; must not be empty
    std::optional<AmplitudeModulation> modulation;  ///< Applied after filtering
};

/// Unfiltered Gaussian white noise (mean 0, variance 1).
[[nodiscard]] inline AudioBuffer renderWhiteNoise(size_t numSamples, double sampleRate,
                                                  uint32_t seed) {
    AudioBuffer out(numSamples, sampleRate);
    Xorshift32 rng(seed);
    for (float& s : out) {
        s = static_cast<float>(rng.nextGaussian());
    }
    return out;
}

/// Render filtered noise of `durationSeconds`.
/// @throws ConfigurationError on an empty filter chain, invalid filter spec,
///         or non-positive duration/rate
[[nodiscard]] inline AudioBuffer renderNoise(double durationSeconds, double sampleRate,
                                             uint32_t seed, const NoiseSpec& spec) {
    detail::require(!spec.filters.empty(), "noise texture needs at least one filter");
    detail::require(sampleRate > 0.0, "noise sample rate must be positive");
    detail::require(durationSeconds > 0.0,
                    "noise duration must be positive, got " + std::to_string(durationSeconds));

    // Design everything before generating so a bad spec costs nothing.
    std::vector<ZeroPhaseFilter> chain(spec.filters.size());
    for (size_t i = 0; i < spec.filters.size(); ++i) {
        chain[i].design(spec.filters[i], sampleRate);
    }

    AudioBuffer out = renderWhiteNoise(sampleCountFor(durationSeconds, sampleRate),
                                       sampleRate, seed);
    for (auto& filter : chain) {
        filter.process(out.samples());
    }
    if (spec.modulation) {
        applyModulation(out, *spec.modulation);
    }
    return out;
}

} // namespace DSP
} // namespace Hearth
