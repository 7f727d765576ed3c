// Tests for layer composition from timed events
// Layer 3: System Components

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/systems/layer_composer.h>

#include "buffer_comparison.h"
#include "test_signals.h"

#include <algorithm>
#include <vector>

using Catch::Approx;
using namespace Hearth::DSP;
using namespace TestHelpers;

namespace {

constexpr double kRate = 8000.0;
constexpr double kDuration = 2.0;

RenderContext context(const SampleBank* bank = nullptr) {
    return RenderContext{kRate, kDuration, bank};
}

SoundEvent toneAt(double start, double duration, double frequency, float velocity = 0.5f) {
    SoundEvent event;
    event.startSeconds = start;
    event.durationSeconds = duration;
    event.frequencies = {frequency};
    event.velocity = velocity;
    event.timbre = 0;
    event.envelope = EnvelopeSpec::expDecay(2.0);
    return event;
}

LayerSpec toneLayer(std::vector<SoundEvent> events) {
    LayerSpec layer;
    layer.name = "tones";
    layer.addTimbre(Timbre::makeTone(ToneSpec{}));
    layer.events = std::move(events);
    return layer;
}

LayerSpec noiseLayer(std::vector<SoundEvent> events) {
    LayerSpec layer;
    layer.name = "noise";
    NoiseSpec noise;
    noise.filters = {FilterSpec::lowpass(1000.0, 2)};
    layer.addTimbre(Timbre::makeNoise(noise));
    layer.events = std::move(events);
    return layer;
}

} // namespace

// ==============================================================================
// Rendering
// ==============================================================================

TEST_CASE("Layer length is floor(duration * rate)", "[composer]") {
    const LayerComposer composer(toneLayer({}), context());
    REQUIRE(composer.numSamples() == 16000);

    const auto out = composer.render();
    REQUIRE(out.size() == 16000);
    REQUIRE(out.sampleRate() == kRate);
    REQUIRE(out.isSilent());
}

TEST_CASE("Events are placed at trunc(start * rate)", "[composer]") {
    const auto event = toneAt(0.5, 0.25, 440.0);
    const LayerComposer composer(toneLayer({event}), context());

    const auto out = composer.render();
    const auto single = composer.renderEvent(event);
    REQUIRE(single.size() == 2000);

    for (size_t i = 0; i < 4000; ++i) REQUIRE(out[i] == 0.0f);
    for (size_t i = 0; i < single.size(); ++i) REQUIRE(out[4000 + i] == single[i]);
    for (size_t i = 6000; i < out.size(); ++i) REQUIRE(out[i] == 0.0f);
}

TEST_CASE("Event accumulation does not depend on event order", "[composer][order]") {
    std::vector<SoundEvent> events{toneAt(0.0, 1.0, 220.0), toneAt(0.3, 0.8, 330.0),
                                   toneAt(0.6, 1.2, 440.0), toneAt(0.6, 0.4, 550.0)};
    const auto forward = LayerComposer(toneLayer(events), context()).render();

    std::reverse(events.begin(), events.end());
    const auto reversed = LayerComposer(toneLayer(events), context()).render();

    const auto result = compareBuffers(forward, reversed, 1e-6f);
    INFO(result.message());
    REQUIRE(result.passed);
}

TEST_CASE("Events running past the end are clipped", "[composer][edge]") {
    const auto event = toneAt(1.75, 1.0, 440.0);
    const LayerComposer composer(toneLayer({event}), context());
    const auto out = composer.render();
    const auto full = composer.renderEvent(event);

    REQUIRE(out.size() == 16000);
    // The envelope is computed over the whole event before clipping
    for (size_t i = 0; i < 2000; ++i) REQUIRE(out[14000 + i] == full[i]);
}

TEST_CASE("Events starting at or after the end and silent events add nothing",
          "[composer][edge]") {
    const LayerComposer late(toneLayer({toneAt(2.0, 1.0, 440.0), toneAt(5.0, 1.0, 440.0)}),
                             context());
    REQUIRE(late.render().isSilent());

    const LayerComposer muted(toneLayer({toneAt(0.0, 1.0, 440.0, 0.0f)}), context());
    REQUIRE(muted.render().isSilent());
}

TEST_CASE("Chord events sum their carriers", "[composer]") {
    SoundEvent chord = toneAt(0.0, 0.5, 261.63);
    chord.frequencies = {261.63, 329.63, 392.0};
    chord.envelope = EnvelopeSpec::flat();
    chord.velocity = 1.0f;

    const LayerComposer composer(toneLayer({chord}), context());
    const auto event = composer.renderEvent(chord);
    const auto expected = renderChord(0.5, kRate, chord.frequencies, ToneSpec{});
    REQUIRE(compareBuffers(expected, event, 0.0f).passed);
}

TEST_CASE("Noise events are reproducible and draw only from their own seed", "[composer][noise]") {
    SoundEvent burst;
    burst.durationSeconds = 0.5;
    burst.envelope = EnvelopeSpec::arch(1.0);
    burst.seed = 17;
    SoundEvent other = burst;
    other.startSeconds = 1.0;
    other.seed = 99;

    const LayerComposer alone(noiseLayer({burst}), context());
    const LayerComposer both(noiseLayer({other, burst}), context());
    const auto a = alone.render();
    const auto b = both.render();

    // The first burst is untouched by the second one's presence
    for (size_t i = 0; i < 4000; ++i) REQUIRE(a[i] == b[i]);
    REQUIRE(compareBuffers(a, alone.render(), 0.0f).passed);
}

TEST_CASE("Sample timbres read from the sample bank", "[composer][sample]") {
    SampleBank bank;
    bank.add("C5", makeSine(4000, 523.25, 1.0f, kRate));

    LayerSpec layer;
    layer.name = "piano";
    layer.addTimbre(Timbre::makeSample("C5"));
    SoundEvent note;
    note.startSeconds = 0.25;
    note.durationSeconds = 1.0;
    note.envelope = EnvelopeSpec::flat();
    layer.events = {note};

    const LayerComposer composer(layer, context(&bank));
    const auto out = composer.render();

    // 4000-sample sample padded to the 8000-sample event
    REQUIRE(out[2000 + 100] == bank.get("C5")[100]);
    for (size_t i = 2000 + 4000; i < 10000; ++i) REQUIRE(out[i] == 0.0f);
}

TEST_CASE("Layer post-steps run after accumulation", "[composer]") {
    SECTION("peak normalization") {
        LayerSpec layer = toneLayer({toneAt(0.0, 1.0, 220.0), toneAt(0.5, 1.0, 330.0)});
        layer.normalizePeak = 0.6f;
        const auto out = LayerComposer(layer, context()).render();
        REQUIRE(out.peak() == Approx(0.6f).margin(1e-6));
    }

    SECTION("linear fade-in") {
        SoundEvent held = toneAt(0.0, 2.0, 100.0, 1.0f);
        held.envelope = EnvelopeSpec::flat();
        LayerSpec layer = toneLayer({held});
        layer.linearFadeInSeconds = 1.0;
        const auto out = LayerComposer(layer, context()).render();
        const auto raw = LayerComposer(toneLayer({held}), context()).render();

        REQUIRE(out[0] == 0.0f);
        REQUIRE(out[2020] == Approx(raw[2020] * 0.2525f).margin(1e-6));
        REQUIRE(out[12000] == raw[12000]);
    }

    SECTION("swell") {
        SoundEvent held = toneAt(0.0, 2.0, 100.0, 1.0f);
        held.envelope = EnvelopeSpec::flat();
        LayerSpec layer = toneLayer({held});
        layer.swell = AmplitudeModulation{0.5, 0.0, 0.0};
        const auto out = LayerComposer(layer, context()).render();
        const auto raw = LayerComposer(toneLayer({held}), context()).render();
        REQUIRE(out[1234] == Approx(raw[1234] * 0.5f));
    }
}

// ==============================================================================
// Validation
// ==============================================================================

TEST_CASE("LayerComposer rejects invalid layers", "[composer][error]") {
    SECTION("missing timbre") {
        auto event = toneAt(0.0, 1.0, 440.0);
        event.timbre = 3;
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({event}), context()), ConfigurationError);
    }

    SECTION("negative start") {
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({toneAt(-0.1, 1.0, 440.0)}), context()),
                          ConfigurationError);
    }

    SECTION("zero duration") {
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({toneAt(0.0, 0.0, 440.0)}), context()),
                          ConfigurationError);
    }

    SECTION("velocity above 1") {
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({toneAt(0.0, 1.0, 440.0, 1.5f)}), context()),
                          ConfigurationError);
    }

    SECTION("tone event without frequencies") {
        auto event = toneAt(0.0, 1.0, 440.0);
        event.frequencies.clear();
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({event}), context()), ConfigurationError);
    }

    SECTION("noise cutoff above Nyquist") {
        LayerSpec layer = noiseLayer({});
        layer.timbres[0].noise.filters = {FilterSpec::lowpass(5000.0, 2)};
        REQUIRE_THROWS_AS(LayerComposer(layer, context()), ConfigurationError);
    }

    SECTION("sample timbre without a bank") {
        LayerSpec layer;
        layer.name = "piano";
        layer.addTimbre(Timbre::makeSample("G4"));
        REQUIRE_THROWS_AS(LayerComposer(layer, context()), ConfigurationError);

        SampleBank bank;
        bank.add("A4", makeConstant(10, 0.1f, kRate));
        REQUIRE_THROWS_AS(LayerComposer(layer, context(&bank)), ConfigurationError);
    }

    SECTION("bad ADSR") {
        auto event = toneAt(0.0, 1.0, 440.0);
        AdsrParams adsr;
        adsr.sustainLevel = 2.0;
        event.envelope = EnvelopeSpec::adsrShape(adsr);
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({event}), context()), ConfigurationError);
    }

    SECTION("non-positive render duration") {
        REQUIRE_THROWS_AS(LayerComposer(toneLayer({}), RenderContext{kRate, 0.0, nullptr}),
                          ConfigurationError);
    }
}

// ==============================================================================
// Scatter
// ==============================================================================

TEST_CASE("scatterEvents is reproducible and stays in its slots", "[composer][scatter]") {
    SoundEvent templ;
    templ.durationSeconds = 0.2;

    const auto a = scatterEvents(12, 0.8, 0.5, 42, templ);
    const auto b = scatterEvents(12, 0.8, 0.5, 42, templ);
    const auto c = scatterEvents(12, 0.8, 0.5, 43, templ);

    REQUIRE(a.size() == 12);
    bool anyDifferent = false;
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].startSeconds == b[i].startSeconds);
        REQUIRE(a[i].seed == b[i].seed);
        REQUIRE(a[i].startSeconds >= 0.8 * static_cast<double>(i));
        REQUIRE(a[i].startSeconds <= 0.8 * static_cast<double>(i) + 0.5);
        REQUIRE(a[i].durationSeconds == 0.2);
        if (a[i].startSeconds != c[i].startSeconds) anyDifferent = true;
        if (i > 0) REQUIRE(a[i].seed != a[i - 1].seed);
    }
    REQUIRE(anyDifferent);
}

TEST_CASE("scatterEvents rejects negative spacing", "[composer][scatter][error]") {
    REQUIRE_THROWS_AS(scatterEvents(3, -1.0, 0.0, 1, SoundEvent{}), ConfigurationError);
}
