// ==============================================================================
// Layer 3: System - Soundtrack Renderer
// ==============================================================================

#include <hearth/dsp/systems/soundtrack_renderer.h>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/pcm_utils.h>

#include <cmath>
#include <future>
#include <set>
#include <utility>

namespace Hearth {
namespace DSP {

SoundtrackRenderer::SoundtrackRenderer(SoundtrackPlan plan)
    : plan_(std::make_unique<SoundtrackPlan>(std::move(plan))) {
    const SoundtrackPlan& p = *plan_;
    detail::require(p.sampleRate > 0.0 && std::isfinite(p.sampleRate),
                    "sample rate must be positive, got " + std::to_string(p.sampleRate));
    detail::require(p.durationSeconds > 0.0 && std::isfinite(p.durationSeconds),
                    "duration must be positive, got " + std::to_string(p.durationSeconds));
    numSamples_ = sampleCountFor(p.durationSeconds, p.sampleRate);
    detail::require(numSamples_ > 0, "render is shorter than one sample");
    detail::require(!p.layers.empty() || p.externalRender.has_value(),
                    "soundtrack plan has no layers");

    const RenderContext context{p.sampleRate, p.durationSeconds, &plan_->samples};

    std::set<std::string> names;
    composers_.reserve(p.layers.size());
    for (const auto& layer : p.layers) {
        detail::require(names.insert(layer.name).second,
                        "layer '" + layer.name + "' is defined twice");
        composers_.emplace_back(layer, context);
    }

    if (p.externalRender) {
        detail::require(names.insert(kExternalLayerName).second,
                        std::string("an external render and a layer named '")
                        + kExternalLayerName + "' cannot both be supplied");
        detail::require(p.externalRender->sampleRate() == p.sampleRate,
                        "external render sample rate "
                        + std::to_string(p.externalRender->sampleRate())
                        + " does not match " + std::to_string(p.sampleRate));
        detail::require(!p.externalRender->empty(), "external render is empty");
    }

    for (const auto& [name, settings] : p.mix.entries) {
        detail::require(names.count(name) > 0,
                        "mix plan names layer '" + name + "' which the plan does not define");
    }

    mixer_ = std::make_unique<Mixer>(p.mix, p.master, p.sampleRate);
}

LayerBuffers SoundtrackRenderer::renderLayers() const {
    std::vector<std::future<AudioBuffer>> tasks;
    tasks.reserve(composers_.size());
    for (const auto& composer : composers_) {
        tasks.push_back(std::async(std::launch::async,
                                   [&composer] { return composer.render(); }));
    }

    // Barrier: every layer must be materialized before mixing.
    LayerBuffers layers;
    for (size_t i = 0; i < tasks.size(); ++i) {
        layers.emplace(composers_[i].name(), tasks[i].get());
    }

    if (plan_->externalRender) {
        // Shorter renders are zero-padded, longer ones trimmed to the track.
        layers.emplace(kExternalLayerName, fitToDuration(*plan_->externalRender, numSamples_));
    }
    return layers;
}

AudioBuffer SoundtrackRenderer::render() const {
    return mixer_->mixAndMaster(renderLayers());
}

std::vector<int16_t> SoundtrackRenderer::renderPcm16() const {
    return toPcm16(render());
}

} // namespace DSP
} // namespace Hearth
