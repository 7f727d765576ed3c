// ==============================================================================
// Layer 3: System - Soundtrack Presets
// ==============================================================================
// Factory functions that turn a RenderConfig into a ready-to-render
// SoundtrackPlan. Presets are data: note schedules, weights, cutoffs,
// compression and fades. They can be edited before rendering.
//
// Presets:
// - layered        synthesized bass / melody / atmosphere / effects
// - sampled-piano  ensemble pad plus piano samples from the sample bank
//                  (notes missing from the bank are skipped; falls back to
//                  layered when the bank is empty)
// - warm-pad       synth pad plus an external render, or the built-in score
//                  rendered by the oscillator bank when none is supplied
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/processors/sample_voice.h>
#include <hearth/dsp/systems/score.h>
#include <hearth/dsp/systems/sound_event.h>
#include <hearth/dsp/systems/soundtrack_renderer.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

inline constexpr double kDefaultSampleRate = 44100.0;
inline constexpr double kDefaultDurationSeconds = 12.0;
inline constexpr float kDefaultTargetPeak = 0.85f;
inline constexpr uint32_t kDefaultBaseSeed = 123;

/// Built-in arrangements
enum class Preset : uint8_t {
    Layered,
    SampledPiano,
    WarmPad
};

/// @brief Top-level render settings.
struct RenderConfig {
    double sampleRate = kDefaultSampleRate;
    double durationSeconds = kDefaultDurationSeconds;
    Preset preset = Preset::Layered;
    float targetPeak = kDefaultTargetPeak;
    uint32_t baseSeed = kDefaultBaseSeed;
    std::string outputPath = "soundtrack.wav";
    bool analyze = false;
};

/// Preset name as used on the command line ("layered", "sampled-piano", "warm-pad")
[[nodiscard]] const char* presetName(Preset preset) noexcept;

/// @throws ConfigurationError for an unknown name
[[nodiscard]] Preset parsePreset(const std::string& name);

/// Note names the sampled-piano preset pulls from the bank
[[nodiscard]] std::vector<std::string> pianoSampleNames();

// =============================================================================
// Layer Factories
// =============================================================================

/// C2/G2 foundation with body tones, slow swell and a 2 s linear onset
[[nodiscard]] LayerSpec makeBassLayer(double durationSeconds);

/// Soft pentatonic tones (C5 D5 E5 G5 C5)
[[nodiscard]] LayerSpec makeMelodyLayer();

/// Wind bed, leaf rustles, room hum and fire crackles, seeded from `seed`
[[nodiscard]] LayerSpec makeAtmosphereLayer(double durationSeconds, uint32_t seed);

/// Wind chimes and low "dings" with a sub-octave
[[nodiscard]] LayerSpec makeEffectsLayer();

/// Detuned C3/E3/G3 string-like pad with vibrato
[[nodiscard]] LayerSpec makeEnsemblePadLayer(double durationSeconds);

/// Piano melody, bass notes and high sparkle from recorded samples. Notes
/// missing from `samples` are left out, as is a layer left with no notes.
[[nodiscard]] std::vector<LayerSpec> makePianoLayers(const SampleBank& samples);

/// Five-note C-major pad for warm-pad
[[nodiscard]] LayerSpec makeSynthPadLayer(double durationSeconds);

/// Strings, piano, bass and bells score rendered by the oscillator bank,
/// named `layerName`
[[nodiscard]] LayerSpec makeScoreLayer(const std::string& layerName);

// =============================================================================
// Plans
// =============================================================================

[[nodiscard]] SoundtrackPlan makeLayeredPlan(const RenderConfig& config);

/// Requires a non-empty bank. Only the pianoSampleNames() entries present in
/// the bank are played.
[[nodiscard]] SoundtrackPlan makeSampledPianoPlan(const RenderConfig& config, SampleBank samples);

[[nodiscard]] SoundtrackPlan makeWarmPadPlan(const RenderConfig& config,
                                             std::optional<AudioBuffer> externalRender);

/// Plan for `config.preset`. sampled-piano with an empty bank falls back to
/// layered.
[[nodiscard]] SoundtrackPlan makePlan(const RenderConfig& config, SampleBank samples = {},
                                      std::optional<AudioBuffer> externalRender = std::nullopt);

} // namespace DSP
} // namespace Hearth
