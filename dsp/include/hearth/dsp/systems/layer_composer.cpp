// ==============================================================================
// Layer 3: System Component - Layer Composer
// ==============================================================================

#include <hearth/dsp/systems/layer_composer.h>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/random.h>
#include <hearth/dsp/primitives/biquad.h>
#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/primitives/noise_texture.h>
#include <hearth/dsp/primitives/oscillator_bank.h>
#include <hearth/dsp/processors/peak_normalizer.h>

#include <cmath>
#include <utility>

namespace Hearth {
namespace DSP {

namespace {

std::string eventLabel(const std::string& layer, size_t index) {
    return "layer '" + layer + "' event " + std::to_string(index);
}

} // namespace

// =============================================================================
// Construction / Validation
// =============================================================================

LayerComposer::LayerComposer(LayerSpec spec, RenderContext context)
    : spec_(std::move(spec))
    , context_(context) {
    detail::require(context_.sampleRate > 0.0 && std::isfinite(context_.sampleRate),
                    "sample rate must be positive, got " + std::to_string(context_.sampleRate));
    detail::require(context_.durationSeconds > 0.0 && std::isfinite(context_.durationSeconds),
                    "duration must be positive, got " + std::to_string(context_.durationSeconds));
    numSamples_ = sampleCountFor(context_.durationSeconds, context_.sampleRate);
    detail::require(numSamples_ > 0, "render is shorter than one sample");
    validate();
}

void LayerComposer::validate() const {
    detail::require(!spec_.name.empty(), "layer name must not be empty");

    for (const auto& timbre : spec_.timbres) {
        switch (timbre.kind) {
            case TimbreKind::Tone:
                detail::require(!timbre.tone.harmonics.empty(),
                                "layer '" + spec_.name + "' has a tone timbre without harmonics");
                break;
            case TimbreKind::Noise:
                detail::require(!timbre.noise.filters.empty(),
                                "layer '" + spec_.name + "' has a noise timbre without filters");
                for (const auto& f : timbre.noise.filters) {
                    validateFilterSpec(f, context_.sampleRate);
                }
                break;
            case TimbreKind::Sample:
                detail::require(context_.samples != nullptr,
                                "layer '" + spec_.name + "' uses sample '" + timbre.sampleName
                                + "' but no sample bank was supplied");
                detail::require(context_.samples->contains(timbre.sampleName),
                                "sample '" + timbre.sampleName + "' used by layer '"
                                + spec_.name + "' is not in the sample bank");
                break;
        }
    }

    for (size_t i = 0; i < spec_.events.size(); ++i) {
        validateEvent(spec_.events[i], i);
    }

    if (spec_.normalizePeak) {
        detail::require(*spec_.normalizePeak > 0.0f && *spec_.normalizePeak <= 1.0f,
                        "layer '" + spec_.name + "' normalize peak must lie in (0, 1]");
    }
    if (spec_.linearFadeInSeconds) {
        detail::require(*spec_.linearFadeInSeconds >= 0.0,
                        "layer '" + spec_.name + "' fade-in must be non-negative");
    }
}

void LayerComposer::validateEvent(const SoundEvent& event, size_t index) const {
    const std::string label = eventLabel(spec_.name, index);

    detail::require(event.timbre < spec_.timbres.size(),
                    label + " references missing timbre " + std::to_string(event.timbre));
    detail::require(event.startSeconds >= 0.0 && std::isfinite(event.startSeconds),
                    label + " has a negative start time");
    detail::require(event.durationSeconds > 0.0 && std::isfinite(event.durationSeconds),
                    label + " must have a positive duration");
    detail::require(event.velocity >= 0.0f && event.velocity <= 1.0f,
                    label + " velocity must lie in [0, 1]");

    if (spec_.timbres[event.timbre].kind == TimbreKind::Tone) {
        detail::require(!event.frequencies.empty(), label + " has no frequencies");
        for (double f : event.frequencies) {
            detail::require(f > 0.0 && std::isfinite(f),
                            label + " frequency must be positive, got " + std::to_string(f));
        }
    }
    if (event.envelope.shape == EnvelopeShape::Adsr) {
        validateAdsr(event.envelope.adsr);
    }
}

// =============================================================================
// Rendering
// =============================================================================

AudioBuffer LayerComposer::renderSource(const SoundEvent& event) const {
    const Timbre& timbre = spec_.timbres[event.timbre];
    const double sr = context_.sampleRate;

    switch (timbre.kind) {
        case TimbreKind::Tone:
            return renderChord(event.durationSeconds, sr, event.frequencies, timbre.tone);
        case TimbreKind::Noise:
            return renderNoise(event.durationSeconds, sr, event.seed, timbre.noise);
        case TimbreKind::Sample: {
            const AudioBuffer& sample = context_.samples->get(timbre.sampleName);
            return fitToDuration(pitchShift(sample, timbre.pitchShiftSemitones),
                                 sampleCountFor(event.durationSeconds, sr));
        }
    }
    return AudioBuffer(sampleCountFor(event.durationSeconds, sr), sr);
}

AudioBuffer LayerComposer::renderEvent(const SoundEvent& event) const {
    AudioBuffer sound = renderSource(event);
    const Timbre& timbre = spec_.timbres[event.timbre];
    if (timbre.swell) {
        applyModulation(sound, *timbre.swell);
    }
    applyEnvelope(sound, event.envelope);
    sound.scale(event.velocity);
    return sound;
}

AudioBuffer LayerComposer::render() const {
    AudioBuffer out(numSamples_, context_.sampleRate);

    for (const auto& event : spec_.events) {
        const size_t offset = sampleCountFor(event.startSeconds, context_.sampleRate);
        if (offset >= numSamples_ || event.velocity == 0.0f) continue;
        // The envelope spans the whole event, so render it in full and let
        // addAt clip at the layer end.
        const AudioBuffer sound = renderEvent(event);
        out.addAt(sound, offset);
    }

    if (spec_.swell) {
        applyModulation(out, *spec_.swell);
    }
    if (spec_.linearFadeInSeconds) {
        applyLinearFadeIn(out, *spec_.linearFadeInSeconds);
    }
    // A layer with nothing inside the render window stays silent.
    if (spec_.normalizePeak && !out.isSilent()) {
        normalizePeak(out, *spec_.normalizePeak);
    }
    return out;
}

// =============================================================================
// Scatter
// =============================================================================

std::vector<SoundEvent> scatterEvents(size_t count, double spacingSeconds, double jitterSeconds,
                                      uint32_t seed, const SoundEvent& eventTemplate) {
    detail::require(spacingSeconds >= 0.0 && jitterSeconds >= 0.0,
                    "scatter spacing and jitter must be non-negative");

    std::vector<SoundEvent> events;
    events.reserve(count);
    Xorshift32 rng(seed);
    for (size_t i = 0; i < count; ++i) {
        SoundEvent event = eventTemplate;
        event.startSeconds = static_cast<double>(i) * spacingSeconds
                           + jitterSeconds * static_cast<double>(rng.nextUnipolar());
        event.seed = deriveSeed(seed, static_cast<uint32_t>(i));
        events.push_back(std::move(event));
    }
    return events;
}

} // namespace DSP
} // namespace Hearth
