// ==============================================================================
// Layer 3: System Component - Sound Events and Layer Specs
// ==============================================================================
// The data a layer is composed from: timbres (how a sound is made), timed
// events (when, how long, how loud, at what pitch) and the per-layer
// post-processing applied after every event has been accumulated.
//
// All of these are plain values. A preset builds them once; nothing mutates
// them during a render.
// ==============================================================================

#pragma once

#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/primitives/noise_texture.h>
#include <hearth/dsp/primitives/oscillator_bank.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Timbre
// =============================================================================

/// How an event's raw sound is produced
enum class TimbreKind : uint8_t {
    Tone,    ///< Additive oscillator bank at the event frequencies
    Noise,   ///< Filtered noise seeded by the event seed
    Sample   ///< Recorded sample from the sample bank
};

/// @brief Sound source description shared by every event that names it.
struct Timbre {
    TimbreKind kind = TimbreKind::Tone;
    ToneSpec tone;                             ///< Tone: harmonics, detune, vibrato
    NoiseSpec noise;                           ///< Noise: filter chain, modulation
    std::string sampleName;                    ///< Sample: bank key
    double pitchShiftSemitones = 0.0;          ///< Sample: resampling shift
    std::optional<AmplitudeModulation> swell;  ///< Applied to the raw sound, before the envelope

    [[nodiscard]] static Timbre makeTone(ToneSpec tone) {
        Timbre t;
        t.kind = TimbreKind::Tone;
        t.tone = std::move(tone);
        return t;
    }

    [[nodiscard]] static Timbre makeNoise(NoiseSpec noise) {
        Timbre t;
        t.kind = TimbreKind::Noise;
        t.noise = std::move(noise);
        return t;
    }

    [[nodiscard]] static Timbre makeSample(std::string name, double semitones = 0.0) {
        Timbre t;
        t.kind = TimbreKind::Sample;
        t.sampleName = std::move(name);
        t.pitchShiftSemitones = semitones;
        return t;
    }
};

// =============================================================================
// SoundEvent
// =============================================================================

/// @brief One scheduled sound: a note, a chord, a chime or a noise burst.
struct SoundEvent {
    double startSeconds = 0.0;
    double durationSeconds = 1.0;
    std::vector<double> frequencies;  ///< Carrier(s) for Tone timbres; unused otherwise
    float velocity = 1.0f;            ///< Linear gain, [0, 1]
    size_t timbre = 0;                ///< Index into LayerSpec::timbres
    EnvelopeSpec envelope;
    uint32_t seed = 1;                ///< Noise seed (Noise timbres only)
};

// =============================================================================
// LayerSpec
// =============================================================================

/// @brief Everything one layer composer needs.
///
/// Post-steps run in order after accumulation: swell, linear fade-in, peak
/// normalization.
struct LayerSpec {
    std::string name;
    std::vector<Timbre> timbres;
    std::vector<SoundEvent> events;
    std::optional<AmplitudeModulation> swell;
    std::optional<double> linearFadeInSeconds;
    std::optional<float> normalizePeak;

    /// Append `timbre` and return its index
    size_t addTimbre(Timbre timbre) {
        timbres.push_back(std::move(timbre));
        return timbres.size() - 1;
    }
};

} // namespace DSP
} // namespace Hearth
