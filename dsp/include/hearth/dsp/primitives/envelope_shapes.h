// ==============================================================================
// Layer 1: DSP Primitive - Envelope Shapes
// ==============================================================================
// Whole-buffer gain curves for offline rendering: a segment ADSR, fades, a
// linear onset, a sinusoidal swell, and the closed-form one-shot shapes used
// by chimes and noise bursts.
//
// Segment ADSR (phase lengths are trunc(seconds * sampleRate)):
// - attack  ramp(0, 1)^curve over min(attackN, total) samples
// - decay   ramp(1, S)^curve, only when attackN + decayN <= total
// - sustain S over max(0, total - a - d - r), only when it fits
// - release ramp(S, 0)^releaseCurve, always carved from the buffer tail;
//   when releaseN > total only the last `total` ramp values are written
// Ramps include both endpoints (ramp(x, y) over 1 sample is just x).
// Later phases overwrite earlier ones where they overlap.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Types
// =============================================================================

/// @brief Segment ADSR parameters (times in seconds).
struct AdsrParams {
    double attackSeconds = 0.01;
    double decaySeconds = 0.1;
    double sustainLevel = 0.7;     ///< [0, 1]
    double releaseSeconds = 0.5;
    double curveExponent = 1.0;    ///< Power applied to attack and decay ramps
    double releaseExponent = 1.0;  ///< Power applied to the release ramp
};

/// @brief Slow sinusoidal swell: gain(t) = offset + depth * sin(2 pi rate t).
struct AmplitudeModulation {
    double offset = 1.0;
    double depth = 0.0;
    double rateHz = 0.0;

    [[nodiscard]] double gainAt(double timeSeconds) const noexcept {
        return offset + depth * std::sin(kTwoPiD * rateHz * timeSeconds);
    }
};

/// Shape selector for per-event envelopes
enum class EnvelopeShape : uint8_t {
    Flat,      ///< Gain 1
    Adsr,      ///< Segment ADSR
    Chime,     ///< (1 - e^(-a t)) * e^(-d t)
    Arch,      ///< e^(-d t) * sin(pi t / T), T = segment length
    ExpDecay   ///< e^(-d t)
};

/// @brief Per-event envelope: shape plus the parameters that shape uses.
struct EnvelopeSpec {
    EnvelopeShape shape = EnvelopeShape::Flat;
    AdsrParams adsr;
    double attackRate = 0.0;  ///< Chime onset rate (1/s)
    double decayRate = 0.0;   ///< Chime/Arch/ExpDecay decay rate (1/s)

    [[nodiscard]] static EnvelopeSpec flat() noexcept { return {}; }

    [[nodiscard]] static EnvelopeSpec adsrShape(const AdsrParams& params) noexcept {
        EnvelopeSpec spec;
        spec.shape = EnvelopeShape::Adsr;
        spec.adsr = params;
        return spec;
    }

    [[nodiscard]] static EnvelopeSpec chime(double attackRate, double decayRate) noexcept {
        EnvelopeSpec spec;
        spec.shape = EnvelopeShape::Chime;
        spec.attackRate = attackRate;
        spec.decayRate = decayRate;
        return spec;
    }

    [[nodiscard]] static EnvelopeSpec arch(double decayRate) noexcept {
        EnvelopeSpec spec;
        spec.shape = EnvelopeShape::Arch;
        spec.decayRate = decayRate;
        return spec;
    }

    [[nodiscard]] static EnvelopeSpec expDecay(double decayRate) noexcept {
        EnvelopeSpec spec;
        spec.shape = EnvelopeShape::ExpDecay;
        spec.decayRate = decayRate;
        return spec;
    }
};

// =============================================================================
// Helpers
// =============================================================================

namespace detail {

/// i-th of `count` evenly spaced values from `from` to `to`, endpoints included
[[nodiscard]] inline double rampValue(double from, double to, size_t i, size_t count) noexcept {
    if (count < 2) return from;
    return from + (to - from) * static_cast<double>(i) / static_cast<double>(count - 1);
}

[[nodiscard]] inline double shaped(double value, double exponent) noexcept {
    return exponent == 1.0 ? value : std::pow(std::max(value, 0.0), exponent);
}

} // namespace detail

/// @throws ConfigurationError on negative times, sustain outside [0, 1] or
///         non-positive exponents
inline void validateAdsr(const AdsrParams& params) {
    detail::require(params.attackSeconds >= 0.0 && params.decaySeconds >= 0.0
                    && params.releaseSeconds >= 0.0,
                    "ADSR phase times must be non-negative");
    detail::require(params.sustainLevel >= 0.0 && params.sustainLevel <= 1.0,
                    "ADSR sustain level must lie in [0, 1], got "
                    + std::to_string(params.sustainLevel));
    detail::require(params.curveExponent > 0.0 && params.releaseExponent > 0.0,
                    "ADSR curve exponents must be positive");
}

// =============================================================================
// ADSR
// =============================================================================

/// Gain curve of `numSamples` samples for `params`.
/// @throws ConfigurationError if the parameters are invalid
[[nodiscard]] inline std::vector<float> makeAdsrCurve(size_t numSamples, double sampleRate,
                                                      const AdsrParams& params) {
    validateAdsr(params);
    std::vector<float> env(numSamples, 1.0f);
    const size_t total = numSamples;
    const size_t attackN = sampleCountFor(params.attackSeconds, sampleRate);
    const size_t decayN = sampleCountFor(params.decaySeconds, sampleRate);
    const size_t releaseN = sampleCountFor(params.releaseSeconds, sampleRate);
    const double sustain = params.sustainLevel;

    // Attack keeps the full-length slope when clipped to the segment
    const size_t attackEnd = std::min(attackN, total);
    for (size_t i = 0; i < attackEnd; ++i) {
        env[i] = static_cast<float>(
            detail::shaped(detail::rampValue(0.0, 1.0, i, attackN), params.curveExponent));
    }

    if (decayN > 0 && attackN + decayN <= total) {
        for (size_t i = 0; i < decayN; ++i) {
            env[attackN + i] = static_cast<float>(
                detail::shaped(detail::rampValue(1.0, sustain, i, decayN), params.curveExponent));
        }
    }

    const size_t used = attackN + decayN + releaseN;
    const size_t sustainN = total > used ? total - used : 0;
    const size_t sustainStart = attackN + decayN;
    if (sustainN > 0 && sustainStart + sustainN <= total) {
        std::fill_n(env.begin() + static_cast<std::ptrdiff_t>(sustainStart), sustainN,
                    static_cast<float>(sustain));
    }

    if (releaseN > 0) {
        const size_t written = std::min(releaseN, total);
        const size_t rampOffset = releaseN - written;
        const size_t start = total - written;
        for (size_t i = 0; i < written; ++i) {
            env[start + i] = static_cast<float>(detail::shaped(
                detail::rampValue(sustain, 0.0, rampOffset + i, releaseN),
                params.releaseExponent));
        }
    }
    return env;
}

/// Multiply `buffer` by its ADSR curve in place.
inline void applyAdsr(AudioBuffer& buffer, const AdsrParams& params) {
    const auto env = makeAdsrCurve(buffer.size(), buffer.sampleRate(), params);
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] *= env[i];
    }
}

/// Copy of `buffer` with the ADSR curve applied.
[[nodiscard]] inline AudioBuffer withAdsr(AudioBuffer buffer, const AdsrParams& params) {
    applyAdsr(buffer, params);
    return buffer;
}

// =============================================================================
// Fades and Swell
// =============================================================================

/// Head fade: ramp(0, 1)^exponent over min(trunc(seconds * sr), size) samples.
/// Gain is 0 at sample 0 and 1 at the last sample of the window.
inline void applyFadeIn(AudioBuffer& buffer, double seconds, double exponent = 2.0) noexcept {
    const size_t n = std::min(sampleCountFor(seconds, buffer.sampleRate()), buffer.size());
    for (size_t i = 0; i < n; ++i) {
        buffer[i] *= static_cast<float>(detail::shaped(detail::rampValue(0.0, 1.0, i, n), exponent));
    }
}

/// Tail fade: ramp(1, 0)^exponent over the last min(trunc(seconds * sr), size)
/// samples.
inline void applyFadeOut(AudioBuffer& buffer, double seconds, double exponent = 2.0) noexcept {
    const size_t n = std::min(sampleCountFor(seconds, buffer.sampleRate()), buffer.size());
    const size_t start = buffer.size() - n;
    for (size_t i = 0; i < n; ++i) {
        buffer[start + i] *= static_cast<float>(
            detail::shaped(detail::rampValue(1.0, 0.0, i, n), exponent));
    }
}

/// Linear onset: gain(t) = min(t / seconds, 1), t = n / sr.
inline void applyLinearFadeIn(AudioBuffer& buffer, double seconds) noexcept {
    if (!(seconds > 0.0)) return;
    const double sr = buffer.sampleRate();
    for (size_t i = 0; i < buffer.size(); ++i) {
        const double t = static_cast<double>(i) / sr;
        if (t >= seconds) break;
        buffer[i] *= static_cast<float>(t / seconds);
    }
}

/// Multiply by the swell gain at each sample time.
inline void applyModulation(AudioBuffer& buffer, const AmplitudeModulation& mod) noexcept {
    const double sr = buffer.sampleRate();
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] *= static_cast<float>(mod.gainAt(static_cast<double>(i) / sr));
    }
}

// =============================================================================
// Dispatcher
// =============================================================================

/// Apply the per-event envelope `spec` to `buffer` in place.
/// @throws ConfigurationError for invalid ADSR parameters
inline void applyEnvelope(AudioBuffer& buffer, const EnvelopeSpec& spec) {
    const double sr = buffer.sampleRate();
    const double length = buffer.duration();

    switch (spec.shape) {
        case EnvelopeShape::Flat:
            return;
        case EnvelopeShape::Adsr:
            applyAdsr(buffer, spec.adsr);
            return;
        case EnvelopeShape::Chime:
            for (size_t i = 0; i < buffer.size(); ++i) {
                const double t = static_cast<double>(i) / sr;
                buffer[i] *= static_cast<float>((1.0 - std::exp(-spec.attackRate * t))
                                                * std::exp(-spec.decayRate * t));
            }
            return;
        case EnvelopeShape::Arch:
            for (size_t i = 0; i < buffer.size(); ++i) {
                const double t = static_cast<double>(i) / sr;
                buffer[i] *= static_cast<float>(std::exp(-spec.decayRate * t)
                                                * std::sin(kPiD * t / length));
            }
            return;
        case EnvelopeShape::ExpDecay:
            for (size_t i = 0; i < buffer.size(); ++i) {
                const double t = static_cast<double>(i) / sr;
                buffer[i] *= static_cast<float>(std::exp(-spec.decayRate * t));
            }
            return;
    }
}

} // namespace DSP
} // namespace Hearth
