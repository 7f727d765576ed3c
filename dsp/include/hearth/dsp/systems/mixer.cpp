// ==============================================================================
// Layer 3: System Component - Mixer / Master
// ==============================================================================

#include <hearth/dsp/systems/mixer.h>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/db_utils.h>
#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/processors/peak_normalizer.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace Hearth {
namespace DSP {

bool MixPlan::contains(const std::string& name) const noexcept {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const auto& entry) { return entry.first == name; });
}

// =============================================================================
// Construction
// =============================================================================

Mixer::Mixer(MixPlan plan, MasterSpec master, double sampleRate)
    : plan_(std::move(plan))
    , master_(std::move(master))
    , sampleRate_(sampleRate) {
    detail::require(sampleRate_ > 0.0 && std::isfinite(sampleRate_),
                    "mixer sample rate must be positive");
    detail::require(!plan_.empty(), "mix plan is empty");

    std::set<std::string> seen;
    for (const auto& [name, settings] : plan_.entries) {
        detail::require(seen.insert(name).second, "layer '" + name + "' appears twice in the mix plan");
        detail::require(settings.weight >= 0.0f && std::isfinite(settings.weight),
                        "layer '" + name + "' has a negative weight");
        detail::require(std::isfinite(settings.gainDb), "layer '" + name + "' gain is not finite");
        detail::require(settings.fadeExponent > 0.0, "layer '" + name + "' fade exponent must be positive");
        if (settings.fadeInSeconds) {
            detail::require(*settings.fadeInSeconds >= 0.0,
                            "layer '" + name + "' fade-in must be non-negative");
        }
        if (settings.preCompression) {
            validateStage(*settings.preCompression);
        }
        channels_.push_back({name, settings, SpectralShaper(settings.preFilters, sampleRate_)});
    }

    detail::require(master_.targetPeak > 0.0f && master_.targetPeak < 1.0f,
                    "master target peak must lie in (0, 1), got "
                    + std::to_string(master_.targetPeak));
    detail::require(master_.fadeInSeconds >= 0.0 && master_.fadeOutSeconds >= 0.0,
                    "master fades must be non-negative");
    detail::require(master_.fadeExponent > 0.0, "master fade exponent must be positive");

    masterShaper_ = SpectralShaper(master_.shaping, sampleRate_);
    dynamics_ = DynamicsProcessor(master_.compression, master_.saturationDrive);
}

// =============================================================================
// Mixing
// =============================================================================

AudioBuffer Mixer::processChannel(const Channel& channel, AudioBuffer buffer) const {
    const LayerMix& settings = channel.settings;

    SpectralShaper shaper = channel.shaper;
    shaper.process(buffer);

    if (settings.preCompression) {
        compressCascade(buffer, {*settings.preCompression});
    }
    if (settings.fadeInSeconds) {
        applyFadeIn(buffer, *settings.fadeInSeconds, settings.fadeExponent);
    }
    if (settings.gainDb != 0.0f) {
        buffer.scale(dbToGain(settings.gainDb));
    }
    return buffer;
}

AudioBuffer Mixer::mix(const LayerBuffers& layers) const {
    size_t length = 0;
    bool first = true;
    for (const auto& channel : channels_) {
        const auto it = layers.find(channel.name);
        detail::require(it != layers.end(), "layer '" + channel.name + "' was not rendered");
        const AudioBuffer& buffer = it->second;
        detail::require(buffer.sampleRate() == sampleRate_,
                        "layer '" + channel.name + "' sample rate does not match the mix");
        if (first) {
            length = buffer.size();
            first = false;
        }
        detail::require(buffer.size() == length,
                        "layer '" + channel.name + "' length " + std::to_string(buffer.size())
                        + " differs from " + std::to_string(length));
    }

    AudioBuffer out(length, sampleRate_);
    for (const auto& channel : channels_) {
        const AudioBuffer processed = processChannel(channel, layers.at(channel.name));
        out.addAt(processed, 0, channel.settings.weight);
    }
    return out;
}

AudioBuffer Mixer::master(AudioBuffer buffer) const {
    detail::require(buffer.sampleRate() == sampleRate_,
                    "master input sample rate does not match the mix");

    SpectralShaper shaper = masterShaper_;
    shaper.process(buffer);
    dynamics_.process(buffer);
    applyFadeIn(buffer, master_.fadeInSeconds, master_.fadeExponent);
    applyFadeOut(buffer, master_.fadeOutSeconds, master_.fadeExponent);
    normalizePeak(buffer, master_.targetPeak);
    return buffer;
}

AudioBuffer Mixer::mixAndMaster(const LayerBuffers& layers) const {
    return master(mix(layers));
}

} // namespace DSP
} // namespace Hearth
