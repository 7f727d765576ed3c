// Tests for weighted layer mixing and the master chain
// Layer 3: System Components

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/systems/mixer.h>

#include "buffer_comparison.h"
#include "test_signals.h"

using Catch::Approx;
using namespace Hearth::DSP;
using namespace TestHelpers;

namespace {

constexpr size_t kLength = 4410;

LayerMix weighted(float weight) {
    LayerMix mix;
    mix.weight = weight;
    return mix;
}

MixPlan twoLayerPlan(float a, float b) {
    MixPlan plan;
    plan.add("a", weighted(a)).add("b", weighted(b));
    return plan;
}

} // namespace

// ==============================================================================
// Mixing
// ==============================================================================

TEST_CASE("Mixing +1 and -1 at 0.6 / 0.4 gives 0.2", "[mixer]") {
    const Mixer mixer(twoLayerPlan(0.6f, 0.4f), MasterSpec{}, kTestSampleRate);

    LayerBuffers layers;
    layers.emplace("a", makeConstant(kLength, 1.0f));
    layers.emplace("b", makeConstant(kLength, -1.0f));

    const auto mixed = mixer.mix(layers);
    REQUIRE(mixed.size() == kLength);
    for (float s : mixed) {
        REQUIRE(s == Approx(0.2f).margin(1e-6));
    }
}

TEST_CASE("Layers the plan does not name are ignored", "[mixer]") {
    MixPlan plan;
    plan.add("a", weighted(1.0f));
    const Mixer mixer(plan, MasterSpec{}, kTestSampleRate);

    LayerBuffers layers;
    layers.emplace("a", makeConstant(kLength, 0.25f));
    layers.emplace("stray", makeConstant(kLength, 1.0f));
    REQUIRE(mixer.mix(layers)[100] == Approx(0.25f));
}

TEST_CASE("Per-layer gain is applied in dB", "[mixer]") {
    MixPlan plan;
    LayerMix louder;
    louder.gainDb = 6.0206f;
    plan.add("a", louder);
    const Mixer mixer(plan, MasterSpec{}, kTestSampleRate);

    LayerBuffers layers;
    layers.emplace("a", makeConstant(kLength, 0.25f));
    REQUIRE(mixer.mix(layers)[10] == Approx(0.5f).epsilon(1e-4));
}

TEST_CASE("Per-layer fade-in and pre-compression", "[mixer]") {
    MixPlan plan;
    LayerMix settings;
    settings.fadeInSeconds = 0.05;
    settings.preCompression = CompressorStage{0.3f, 2.0f};
    plan.add("a", settings);
    const Mixer mixer(plan, MasterSpec{}, kTestSampleRate);

    LayerBuffers layers;
    layers.emplace("a", makeConstant(kLength, 0.5f));
    const auto mixed = mixer.mix(layers);

    REQUIRE(mixed[0] == 0.0f);
    REQUIRE(mixed[kLength - 1] == Approx(0.4f));
}

TEST_CASE("Per-layer pre-filters shape only their layer", "[mixer]") {
    MixPlan plan;
    LayerMix filtered;
    filtered.preFilters = {FilterSpec::highpass(1000.0, 4)};
    plan.add("filtered", filtered).add("dry", weighted(1.0f));
    const Mixer mixer(plan, MasterSpec{}, kTestSampleRate);

    LayerBuffers layers;
    layers.emplace("filtered", makeSine(44100, 50.0, 0.5f));
    layers.emplace("dry", makeConstant(44100, 0.0f));
    const auto mixed = mixer.mix(layers);

    REQUIRE(calculateRMS(mixed.samples().subspan(11025, 22050)) < 1e-4f);
}

TEST_CASE("mix rejects missing or mismatched layers", "[mixer][error]") {
    const Mixer mixer(twoLayerPlan(0.5f, 0.5f), MasterSpec{}, kTestSampleRate);

    SECTION("missing layer") {
        LayerBuffers layers;
        layers.emplace("a", makeConstant(kLength, 0.1f));
        REQUIRE_THROWS_AS(mixer.mix(layers), ConfigurationError);
    }

    SECTION("length mismatch") {
        LayerBuffers layers;
        layers.emplace("a", makeConstant(kLength, 0.1f));
        layers.emplace("b", makeConstant(kLength + 1, 0.1f));
        REQUIRE_THROWS_AS(mixer.mix(layers), ConfigurationError);
    }

    SECTION("sample rate mismatch") {
        LayerBuffers layers;
        layers.emplace("a", makeConstant(kLength, 0.1f));
        layers.emplace("b", makeConstant(kLength, 0.1f, 48000.0));
        REQUIRE_THROWS_AS(mixer.mix(layers), ConfigurationError);
    }
}

// ==============================================================================
// Master
// ==============================================================================

TEST_CASE("Master normalizes to the target peak", "[mixer][master]") {
    MasterSpec master;
    master.compression = {CompressorStage{0.3f, 2.5f}};
    master.saturationDrive = 2.0f;
    master.targetPeak = 0.85f;
    const Mixer mixer(twoLayerPlan(1.0f, 1.0f), master, kTestSampleRate);

    const auto track = mixer.master(makeMultiSine(44100, {110.0, 440.0}, 0.7f));
    REQUIRE(track.peak() <= 0.85f + 1e-6f);
    REQUIRE(track.peak() == Approx(0.85f).margin(1e-6));
}

TEST_CASE("Master fades reach silence at both ends", "[mixer][master]") {
    MasterSpec master;
    master.fadeInSeconds = 0.1;
    master.fadeOutSeconds = 0.2;
    const Mixer mixer(twoLayerPlan(1.0f, 1.0f), master, kTestSampleRate);

    const auto track = mixer.master(makeConstant(44100, 0.3f));
    REQUIRE(track[0] == 0.0f);
    REQUIRE(track[track.size() - 1] == 0.0f);
    REQUIRE(track[22050] == Approx(0.85f));
}

TEST_CASE("mixAndMaster chains both stages", "[mixer][master]") {
    const Mixer mixer(twoLayerPlan(0.5f, 0.5f), MasterSpec{}, kTestSampleRate);

    LayerBuffers layers;
    layers.emplace("a", makeSine(kLength, 220.0, 0.2f));
    layers.emplace("b", makeSine(kLength, 330.0, 0.2f));

    const auto chained = mixer.mixAndMaster(layers);
    const auto stepwise = mixer.master(mixer.mix(layers));
    REQUIRE(compareBuffers(stepwise, chained, 0.0f).passed);
}

TEST_CASE("Master of silence is an error", "[mixer][master][error]") {
    const Mixer mixer(twoLayerPlan(1.0f, 1.0f), MasterSpec{}, kTestSampleRate);
    REQUIRE_THROWS_AS(mixer.master(makeConstant(kLength, 0.0f)), ConfigurationError);
}

// ==============================================================================
// Construction
// ==============================================================================

TEST_CASE("Mixer rejects invalid plans", "[mixer][error]") {
    SECTION("empty plan") {
        REQUIRE_THROWS_AS(Mixer(MixPlan{}, MasterSpec{}, kTestSampleRate), ConfigurationError);
    }

    SECTION("duplicate layer") {
        MixPlan plan;
        plan.add("a", weighted(0.5f)).add("a", weighted(0.5f));
        REQUIRE_THROWS_AS(Mixer(plan, MasterSpec{}, kTestSampleRate), ConfigurationError);
    }

    SECTION("negative weight") {
        REQUIRE_THROWS_AS(Mixer(twoLayerPlan(0.5f, -0.1f), MasterSpec{}, kTestSampleRate),
                          ConfigurationError);
    }

    SECTION("target peak outside (0, 1)") {
        MasterSpec master;
        master.targetPeak = 1.0f;
        REQUIRE_THROWS_AS(Mixer(twoLayerPlan(0.5f, 0.5f), master, kTestSampleRate),
                          ConfigurationError);
        master.targetPeak = 0.0f;
        REQUIRE_THROWS_AS(Mixer(twoLayerPlan(0.5f, 0.5f), master, kTestSampleRate),
                          ConfigurationError);
    }

    SECTION("invalid master filter") {
        MasterSpec master;
        master.shaping = {FilterSpec::lowpass(25000.0, 2)};
        REQUIRE_THROWS_AS(Mixer(twoLayerPlan(0.5f, 0.5f), master, kTestSampleRate),
                          ConfigurationError);
    }

    SECTION("invalid compressor") {
        MasterSpec master;
        master.compression = {CompressorStage{0.3f, 0.5f}};
        REQUIRE_THROWS_AS(Mixer(twoLayerPlan(0.5f, 0.5f), master, kTestSampleRate),
                          ConfigurationError);
    }
}

TEST_CASE("MixPlan::contains", "[mixer]") {
    const auto plan = twoLayerPlan(0.5f, 0.5f);
    REQUIRE(plan.contains("a"));
    REQUIRE_FALSE(plan.contains("c"));
}
