// ==============================================================================
// Layer 3: System Component - Layer Composer
// ==============================================================================
// Renders one layer (bass, melody, atmosphere, effects, pad, piano ...) from
// a LayerSpec into a full-length buffer.
//
// For each event:
//   render timbre -> swell -> envelope -> velocity -> add at trunc(start * sr)
// Copies running past the end are clipped; events starting at or after the
// end contribute nothing. Accumulation is additive, so event order does not
// matter, and noise events draw only from their own seed.
//
// The spec is fully validated at construction. render() is const and may be
// called from any thread.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/processors/sample_voice.h>
#include <hearth/dsp/systems/sound_event.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

/// @brief Render-wide settings shared by every layer.
struct RenderContext {
    double sampleRate = 44100.0;
    double durationSeconds = 12.0;
    const SampleBank* samples = nullptr;  ///< Required by Sample timbres; not owned
};

/// @brief Parameterised composer; one instance per layer.
class LayerComposer {
public:
    /// @throws ConfigurationError if the spec or context is invalid
    LayerComposer(LayerSpec spec, RenderContext context);

    /// Render the whole layer.
    [[nodiscard]] AudioBuffer render() const;

    /// Render a single event's contribution (timbre, swell, envelope and
    /// velocity applied), before it is placed in the layer.
    [[nodiscard]] AudioBuffer renderEvent(const SoundEvent& event) const;

    [[nodiscard]] const std::string& name() const noexcept { return spec_.name; }
    [[nodiscard]] const LayerSpec& spec() const noexcept { return spec_; }
    [[nodiscard]] size_t numSamples() const noexcept { return numSamples_; }

private:
    void validate() const;
    void validateEvent(const SoundEvent& event, size_t index) const;
    [[nodiscard]] AudioBuffer renderSource(const SoundEvent& event) const;

    LayerSpec spec_;
    RenderContext context_;
    size_t numSamples_ = 0;
};

/// Seeded, reproducible copies of `eventTemplate`:
///   start_i = i * spacing + jitter * u_i,  u_i uniform in [0, 1]
/// with u_i drawn from Xorshift32(seed) and each copy given its own noise
/// seed deriveSeed(seed, i).
[[nodiscard]] std::vector<SoundEvent> scatterEvents(size_t count, double spacingSeconds,
                                                    double jitterSeconds, uint32_t seed,
                                                    const SoundEvent& eventTemplate);

} // namespace DSP
} // namespace Hearth
