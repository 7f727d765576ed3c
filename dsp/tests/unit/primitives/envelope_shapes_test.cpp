// Tests for segment ADSR, fades and one-shot envelope shapes
// Layer 1: DSP Primitives

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/random.h>
#include <hearth/dsp/primitives/envelope_shapes.h>

#include "test_signals.h"

#include <cmath>

using Catch::Approx;
using namespace Hearth::DSP;
using namespace TestHelpers;

namespace {
// 1 kHz keeps sample indices equal to milliseconds
constexpr double kRate = 1000.0;

AdsrParams params(double a, double d, double s, double r) {
    AdsrParams p;
    p.attackSeconds = a;
    p.decaySeconds = d;
    p.sustainLevel = s;
    p.releaseSeconds = r;
    return p;
}
} // namespace

// ==============================================================================
// ADSR
// ==============================================================================

TEST_CASE("ADSR phases land on their boundaries", "[envelope][adsr]") {
    const auto env = makeAdsrCurve(1000, kRate, params(0.1, 0.1, 0.5, 0.2));

    REQUIRE(env.size() == 1000);
    CHECK(env[0] == 0.0f);
    CHECK(env[50] == Approx(50.0 / 99.0));
    CHECK(env[99] == Approx(1.0f));
    CHECK(env[100] == Approx(1.0f));
    CHECK(env[199] == Approx(0.5f));
    CHECK(env[200] == Approx(0.5f));
    CHECK(env[799] == Approx(0.5f));
    CHECK(env[800] == Approx(0.5f));
    CHECK(env[999] == Approx(0.0f).margin(1e-7));
}

TEST_CASE("ADSR output stays within [0, 1]", "[envelope][adsr]") {
    Xorshift32 rng(77);
    for (int trial = 0; trial < 200; ++trial) {
        AdsrParams p = params(rng.nextUnipolar() * 0.5, rng.nextUnipolar() * 0.5,
                              rng.nextUnipolar(), rng.nextUnipolar() * 0.8);
        p.curveExponent = 0.5 + rng.nextUnipolar() * 2.0;
        p.releaseExponent = 0.5 + rng.nextUnipolar() * 2.0;
        const size_t n = 1 + static_cast<size_t>(rng.nextUnipolar() * 1500.0f);

        for (float g : makeAdsrCurve(n, kRate, p)) {
            REQUIRE(g >= 0.0f);
            REQUIRE(g <= 1.0f);
        }
    }
}

TEST_CASE("ADSR skips sustain when the phases do not fit", "[envelope][adsr][edge]") {
    // a + d + r = 400 > 300: release overwrites the decay tail
    const auto env = makeAdsrCurve(300, kRate, params(0.1, 0.1, 0.5, 0.2));

    CHECK(env[99] == Approx(1.0f));
    CHECK(env[100] == Approx(0.5f));
    CHECK(env[299] == Approx(0.0f).margin(1e-7));
    for (size_t i = 101; i < 300; ++i) {
        REQUIRE(env[i] <= env[i - 1]);
    }
}

TEST_CASE("ADSR release longer than the event keeps the tail of the ramp",
          "[envelope][adsr][edge]") {
    const auto env = makeAdsrCurve(100, kRate, params(0.0, 0.0, 0.8, 0.2));

    CHECK(env[0] == Approx(0.8 * (1.0 - 100.0 / 199.0)));
    CHECK(env[99] == Approx(0.0f).margin(1e-7));
}

TEST_CASE("ADSR attack longer than the event keeps its slope", "[envelope][adsr][edge]") {
    const auto env = makeAdsrCurve(50, kRate, params(0.1, 0.0, 1.0, 0.0));

    CHECK(env[0] == 0.0f);
    CHECK(env[49] == Approx(49.0 / 99.0));
}

TEST_CASE("ADSR curve exponent shapes attack and decay", "[envelope][adsr]") {
    AdsrParams p = params(0.1, 0.1, 0.5, 0.0);
    p.curveExponent = 2.0;
    const auto env = makeAdsrCurve(400, kRate, p);

    CHECK(env[50] == Approx(std::pow(50.0 / 99.0, 2.0)));
    CHECK(env[199] == Approx(0.25f));
}

TEST_CASE("applyAdsr multiplies the buffer", "[envelope][adsr]") {
    auto buffer = makeConstant(1000, 0.5f, kRate);
    applyAdsr(buffer, params(0.1, 0.1, 0.5, 0.2));

    CHECK(buffer[0] == 0.0f);
    CHECK(buffer[500] == Approx(0.25f));
}

TEST_CASE("Invalid ADSR parameters are configuration errors", "[envelope][adsr][error]") {
    REQUIRE_THROWS_AS(makeAdsrCurve(100, kRate, params(-0.1, 0.1, 0.5, 0.1)), ConfigurationError);
    REQUIRE_THROWS_AS(makeAdsrCurve(100, kRate, params(0.1, 0.1, 1.5, 0.1)), ConfigurationError);
    REQUIRE_THROWS_AS(makeAdsrCurve(100, kRate, params(0.1, 0.1, -0.1, 0.1)), ConfigurationError);

    AdsrParams bad = params(0.1, 0.1, 0.5, 0.1);
    bad.releaseExponent = 0.0;
    REQUIRE_THROWS_AS(makeAdsrCurve(100, kRate, bad), ConfigurationError);
}

// ==============================================================================
// Fades
// ==============================================================================

TEST_CASE("Fade-in starts at 0 and reaches 1", "[envelope][fade]") {
    auto buffer = makeConstant(1000, 1.0f, kRate);
    applyFadeIn(buffer, 0.1);

    CHECK(buffer[0] == 0.0f);
    CHECK(buffer[50] == Approx(std::pow(50.0 / 99.0, 2.0)));
    CHECK(buffer[99] == Approx(1.0f));
    CHECK(buffer[100] == 1.0f);
    for (size_t i = 1; i < 100; ++i) {
        REQUIRE(buffer[i] >= buffer[i - 1]);
    }
}

TEST_CASE("Fade-out ends at 0", "[envelope][fade]") {
    auto buffer = makeConstant(1000, 1.0f, kRate);
    applyFadeOut(buffer, 0.2, 1.0);

    CHECK(buffer[799] == 1.0f);
    CHECK(buffer[800] == Approx(1.0f));
    CHECK(buffer[999] == 0.0f);
    for (size_t i = 801; i < 1000; ++i) {
        REQUIRE(buffer[i] <= buffer[i - 1]);
    }
}

TEST_CASE("Fades longer than the buffer are clamped", "[envelope][fade][edge]") {
    auto in = makeConstant(50, 1.0f, kRate);
    applyFadeIn(in, 10.0);
    CHECK(in[0] == 0.0f);
    CHECK(in[49] == Approx(1.0f));

    auto out = makeConstant(50, 1.0f, kRate);
    applyFadeOut(out, 10.0);
    CHECK(out[0] == Approx(1.0f));
    CHECK(out[49] == 0.0f);
}

TEST_CASE("Linear fade-in ramps by time", "[envelope][fade]") {
    auto buffer = makeConstant(1000, 1.0f, kRate);
    applyLinearFadeIn(buffer, 0.5);

    CHECK(buffer[0] == 0.0f);
    CHECK(buffer[250] == Approx(0.5f));
    CHECK(buffer[500] == 1.0f);
    CHECK(buffer[999] == 1.0f);
}

TEST_CASE("Amplitude modulation follows offset + depth * sin", "[envelope][swell]") {
    const AmplitudeModulation swell{0.8, 0.2, 0.25};
    CHECK(swell.gainAt(0.0) == Approx(0.8));
    CHECK(swell.gainAt(1.0) == Approx(1.0));
    CHECK(swell.gainAt(3.0) == Approx(0.6));

    auto buffer = makeConstant(4000, 1.0f, kRate);
    applyModulation(buffer, swell);
    CHECK(buffer[1000] == Approx(1.0f));
    CHECK(buffer[3000] == Approx(0.6f));
}

// ==============================================================================
// One-shot shapes
// ==============================================================================

TEST_CASE("Flat envelope leaves the buffer unchanged", "[envelope][shape]") {
    auto buffer = makeConstant(100, 0.7f, kRate);
    applyEnvelope(buffer, EnvelopeSpec::flat());
    for (float s : buffer) {
        REQUIRE(s == 0.7f);
    }
}

TEST_CASE("Exponential decay starts at 1", "[envelope][shape]") {
    auto buffer = makeConstant(2000, 1.0f, kRate);
    applyEnvelope(buffer, EnvelopeSpec::expDecay(3.0));

    CHECK(buffer[0] == Approx(1.0f));
    CHECK(buffer[1000] == Approx(std::exp(-3.0)));
}

TEST_CASE("Chime envelope rises from 0 then decays", "[envelope][shape]") {
    auto buffer = makeConstant(3000, 1.0f, kRate);
    applyEnvelope(buffer, EnvelopeSpec::chime(50.0, 2.0));

    CHECK(buffer[0] == 0.0f);
    CHECK(buffer[1000] == Approx((1.0 - std::exp(-50.0)) * std::exp(-2.0)));
    CHECK(buffer[2999] < buffer[1000]);
}

TEST_CASE("Arch envelope is zero at both ends of the event", "[envelope][shape]") {
    auto buffer = makeConstant(1000, 1.0f, kRate);
    applyEnvelope(buffer, EnvelopeSpec::arch(1.0));

    CHECK(buffer[0] == 0.0f);
    CHECK(buffer[500] == Approx(std::exp(-0.5)).margin(1e-4));
    CHECK(std::abs(buffer[999]) < 0.01f);
}

TEST_CASE("ADSR through the dispatcher matches applyAdsr", "[envelope][shape]") {
    const AdsrParams p = params(0.05, 0.1, 0.6, 0.3);
    auto viaDispatcher = makeConstant(1000, 1.0f, kRate);
    applyEnvelope(viaDispatcher, EnvelopeSpec::adsrShape(p));

    const auto direct = withAdsr(makeConstant(1000, 1.0f, kRate), p);
    for (size_t i = 0; i < 1000; ++i) {
        REQUIRE(viaDispatcher[i] == direct[i]);
    }
}
