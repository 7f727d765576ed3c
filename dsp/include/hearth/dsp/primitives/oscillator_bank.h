// ==============================================================================
// Layer 1: DSP Primitive - Oscillator Bank
// ==============================================================================
// Additive sine synthesis: a stack of harmonics over one carrier, with
// optional vibrato and a three-voice detuned ensemble.
//
// Each harmonic integrates its own phase from the instantaneous frequency,
// so vibrato never produces phase discontinuities:
//   phase_h[n] = phase_h[n-1] + 2 pi * mult_h * f(t_n) / sr,  phase_h[0] = 0
//   f(t) = f0 * (1 + depth * sin(2 pi * rate * t)),            t_n = n / sr
// Phases are double precision and wrapped to [0, 2 pi).
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Types
// =============================================================================

/// One partial of an additive tone
struct Harmonic {
    double multiplier = 1.0;         ///< Frequency multiple of the carrier
    double relativeAmplitude = 1.0;  ///< Linear amplitude of this partial
};

/// Periodic pitch modulation
struct VibratoSpec {
    double rateHz = 0.0;  ///< Modulation rate
    double depth = 0.0;   ///< Fraction of the carrier (0.003 = 0.3 %)

    [[nodiscard]] bool isActive() const noexcept { return rateHz > 0.0 && depth != 0.0; }
};

/// Timbre of an additive tone
struct ToneSpec {
    std::vector<Harmonic> harmonics{{1.0, 1.0}};
    double detuneCents = 0.0;  ///< 0 = single voice, > 0 = three-voice ensemble
    VibratoSpec vibrato;
};

/// Detune fraction for a cent offset: 2^(cents/1200) - 1
[[nodiscard]] inline double detuneFraction(double cents) noexcept {
    return std::exp2(cents / 1200.0) - 1.0;
}

/// Cent offset for a detune fraction (inverse of detuneFraction)
[[nodiscard]] inline double fractionToCents(double fraction) noexcept {
    return 1200.0 * std::log2(1.0 + fraction);
}

namespace detail {

/// Accumulate one voice of `tone` at carrier `frequency` into `out`, scaled
/// by `gain`.
inline void accumulateVoice(std::span<float> out, double sampleRate, double frequency,
                            const ToneSpec& tone, double gain) noexcept {
    std::vector<double> phases(tone.harmonics.size(), 0.0);
    const bool vibrato = tone.vibrato.isActive();
    const double vibratoOmega = kTwoPiD * tone.vibrato.rateHz / sampleRate;

    for (size_t n = 0; n < out.size(); ++n) {
        double f = frequency;
        if (vibrato) {
            f *= 1.0 + tone.vibrato.depth * std::sin(vibratoOmega * static_cast<double>(n));
        }
        const double baseIncrement = kTwoPiD * f / sampleRate;

        double sum = 0.0;
        for (size_t h = 0; h < phases.size(); ++h) {
            const Harmonic& harmonic = tone.harmonics[h];
            sum += harmonic.relativeAmplitude * std::sin(phases[h]);

            double next = phases[h] + baseIncrement * harmonic.multiplier;
            next = std::fmod(next, kTwoPiD);
            if (next < 0.0) next += kTwoPiD;
            phases[h] = next;
        }
        out[n] += static_cast<float>(sum * gain);
    }
}

inline void validateTone(double durationSeconds, double sampleRate, double frequency,
                         const ToneSpec& tone) {
    require(frequency > 0.0 && std::isfinite(frequency),
            "tone frequency must be positive, got " + std::to_string(frequency));
    require(sampleRate > 0.0 && std::isfinite(sampleRate),
            "tone sample rate must be positive, got " + std::to_string(sampleRate));
    require(durationSeconds > 0.0 && std::isfinite(durationSeconds),
            "tone duration must be positive, got " + std::to_string(durationSeconds));
    require(!tone.harmonics.empty(), "tone needs at least one harmonic");
    require(tone.detuneCents >= 0.0, "detune must be non-negative cents");
}

} // namespace detail

// =============================================================================
// Rendering
// =============================================================================

/// Render an additive tone of `durationSeconds` at `frequency`.
///
/// With detune, voices at f(1 - frac), f and f(1 + frac) are summed and
/// divided by three so the ensemble keeps the single-voice level.
/// @throws ConfigurationError on non-positive frequency, rate or duration,
///         or an empty harmonic list
[[nodiscard]] inline AudioBuffer renderTone(double durationSeconds, double sampleRate,
                                            double frequency, const ToneSpec& tone) {
    detail::validateTone(durationSeconds, sampleRate, frequency, tone);

    AudioBuffer out(sampleCountFor(durationSeconds, sampleRate), sampleRate);
    if (tone.detuneCents > 0.0) {
        const double frac = detuneFraction(tone.detuneCents);
        constexpr double kVoiceGain = 1.0 / 3.0;
        for (double offset : {-frac, 0.0, frac}) {
            detail::accumulateVoice(out.samples(), sampleRate, frequency * (1.0 + offset),
                                    tone, kVoiceGain);
        }
    } else {
        detail::accumulateVoice(out.samples(), sampleRate, frequency, tone, 1.0);
    }
    return out;
}

/// Sum of renderTone over every carrier in `frequencies`.
/// @throws ConfigurationError if `frequencies` is empty or any tone is invalid
[[nodiscard]] inline AudioBuffer renderChord(double durationSeconds, double sampleRate,
                                             std::span<const double> frequencies,
                                             const ToneSpec& tone) {
    detail::require(!frequencies.empty(), "chord needs at least one frequency");
    AudioBuffer out(sampleCountFor(durationSeconds, sampleRate), sampleRate);
    for (double f : frequencies) {
        const AudioBuffer voice = renderTone(durationSeconds, sampleRate, f, tone);
        out.addAt(voice, 0);
    }
    return out;
}

} // namespace DSP
} // namespace Hearth
