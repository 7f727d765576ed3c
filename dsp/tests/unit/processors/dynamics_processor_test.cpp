// Tests for static compression and tanh saturation
// Layer 2: DSP Processors

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/processors/dynamics_processor.h>

#include "buffer_comparison.h"
#include "test_signals.h"

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Hearth::DSP;
using namespace TestHelpers;

TEST_CASE("compress leaves samples under the threshold alone", "[dynamics][compress]") {
    CHECK(compress(0.2f, 0.3f, 2.0f) == 0.2f);
    CHECK(compress(-0.3f, 0.3f, 2.0f) == -0.3f);
    CHECK(compress(0.0f, 0.3f, 4.0f) == 0.0f);
}

TEST_CASE("compress divides the excess by the ratio and keeps the sign", "[dynamics][compress]") {
    CHECK(compress(0.5f, 0.3f, 2.0f) == Approx(0.4f));
    CHECK(compress(-0.5f, 0.3f, 2.0f) == Approx(-0.4f));
    CHECK(compress(1.0f, 0.5f, 4.0f) == Approx(0.625f));
    CHECK(compress(0.9f, 0.3f, 1.0f) == Approx(0.9f));
}

TEST_CASE("saturate is odd, bounded and near-linear for small inputs", "[dynamics][saturate]") {
    CHECK(saturate(0.0f, 2.0f) == 0.0f);
    CHECK(saturate(-0.4f, 2.0f) == Approx(-saturate(0.4f, 2.0f)));
    CHECK(saturate(0.001f, 2.0f) == Approx(0.001f).epsilon(1e-4));
    for (float x : {0.5f, 1.0f, 5.0f, 100.0f}) {
        REQUIRE(std::abs(saturate(x, 2.0f)) <= 0.5f + 1e-6f);
        REQUIRE(std::abs(saturate(x, 2.0f)) <= x);
    }
}

TEST_CASE("Silence through dynamics is silence", "[dynamics]") {
    const DynamicsProcessor dynamics({CompressorStage{0.3f, 2.5f}, CompressorStage{0.5f, 3.0f}}, 2.0f);
    auto silence = AudioBuffer::silence(0.5, kTestSampleRate);
    dynamics.process(silence);
    REQUIRE(silence.isSilent());
}

TEST_CASE("A 0.5 sine compressed at 0.3:2 peaks at 0.4", "[dynamics]") {
    // 441 Hz at 44.1 kHz lands exactly on the crest every 100 samples
    auto sine = makeSine(44100, 441.0, 0.5f);
    compressCascade(sine, {CompressorStage{0.3f, 2.0f}});

    REQUIRE(sine.peak() == Approx(0.4f).margin(1e-5));
}

TEST_CASE("Compression stages run in order before saturation", "[dynamics]") {
    const DynamicsProcessor dynamics({CompressorStage{0.5f, 2.0f}, CompressorStage{0.3f, 4.0f}}, 1.5f);

    const float x = 0.9f;
    const float afterFirst = 0.5f + 0.4f / 2.0f;            // 0.7
    const float afterSecond = 0.3f + (afterFirst - 0.3f) / 4.0f;  // 0.4
    const float expected = std::tanh(afterSecond * 1.5f) / 1.5f;
    REQUIRE(dynamics.processSample(x) == Approx(expected));
    REQUIRE(dynamics.processSample(-x) == Approx(-expected));

    auto buffer = makeConstant(16, x);
    dynamics.process(buffer);
    REQUIRE(buffer[7] == Approx(expected));
}

TEST_CASE("DynamicsProcessor without stages or drive is the identity", "[dynamics]") {
    const DynamicsProcessor dynamics;
    auto sine = makeSine(1024, 300.0, 0.9f);
    const auto original = sine;
    dynamics.process(sine);
    REQUIRE(compareBuffers(original, sine, 0.0f).passed);
}

TEST_CASE("CompressorStage::fromDb converts the threshold", "[dynamics]") {
    const auto stage = CompressorStage::fromDb(-20.0f, 3.0f);
    REQUIRE(stage.threshold == Approx(0.1f));
    REQUIRE(stage.ratio == 3.0f);
}

TEST_CASE("Dynamics reject invalid settings", "[dynamics][error]") {
    using Stages = std::vector<CompressorStage>;
    REQUIRE_THROWS_AS(DynamicsProcessor(Stages{CompressorStage{0.0f, 2.0f}}), ConfigurationError);
    REQUIRE_THROWS_AS(DynamicsProcessor(Stages{CompressorStage{0.3f, 0.5f}}), ConfigurationError);
    REQUIRE_THROWS_AS(DynamicsProcessor(Stages{}, 0.0f), ConfigurationError);
    REQUIRE_THROWS_AS(DynamicsProcessor(Stages{}, -1.0f), ConfigurationError);

    auto buffer = makeConstant(8, 0.5f);
    REQUIRE_THROWS_AS(saturateBuffer(buffer, 0.0f), ConfigurationError);
}
