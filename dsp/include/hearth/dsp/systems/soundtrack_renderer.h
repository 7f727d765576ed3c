// ==============================================================================
// Layer 3: System - Soundtrack Renderer
// ==============================================================================
// Runs the whole pipeline for one SoundtrackPlan:
//
//   Generate (one task per layer) -> join -> per-layer shaping -> Mix
//   -> master shaping -> Compress -> Saturate -> Fade -> Normalize -> PCM16
//
// The plan is validated in full at construction, so a bad cutoff or an
// empty plan is reported before any sample is produced. Layers share no
// mutable state and render concurrently; mixing waits on every one of them.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/processors/sample_voice.h>
#include <hearth/dsp/systems/layer_composer.h>
#include <hearth/dsp/systems/mixer.h>
#include <hearth/dsp/systems/sound_event.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

/// Mix-plan name under which an externally rendered buffer is mixed
inline constexpr const char* kExternalLayerName = "external";

/// @brief Complete description of one render.
struct SoundtrackPlan {
    double sampleRate = 44100.0;
    double durationSeconds = 12.0;
    std::vector<LayerSpec> layers;
    MixPlan mix;
    MasterSpec master;
    SampleBank samples;                       ///< Used by Sample timbres
    std::optional<AudioBuffer> externalRender;  ///< Mixed as kExternalLayerName
};

/// @brief Validates a plan once and renders it.
class SoundtrackRenderer {
public:
    /// @throws ConfigurationError if any part of the plan is invalid
    explicit SoundtrackRenderer(SoundtrackPlan plan);

    SoundtrackRenderer(const SoundtrackRenderer&) = delete;
    SoundtrackRenderer& operator=(const SoundtrackRenderer&) = delete;

    /// Render every layer (concurrently) without mixing.
    [[nodiscard]] LayerBuffers renderLayers() const;

    /// Full render: layers, mix and master.
    /// @throws ConfigurationError if the mastered result would be silent
    [[nodiscard]] AudioBuffer render() const;

    /// render() converted to signed 16-bit PCM
    [[nodiscard]] std::vector<int16_t> renderPcm16() const;

    [[nodiscard]] size_t numSamples() const noexcept { return numSamples_; }
    [[nodiscard]] double sampleRate() const noexcept { return plan_->sampleRate; }
    [[nodiscard]] size_t numLayers() const noexcept { return composers_.size(); }

private:
    // Heap-allocated so composers can keep a stable pointer to the bank.
    std::unique_ptr<SoundtrackPlan> plan_;
    std::vector<LayerComposer> composers_;
    std::unique_ptr<Mixer> mixer_;
    size_t numSamples_ = 0;
};

} // namespace DSP
} // namespace Hearth
