// Tests for Biquad and the Butterworth BiquadCascade
// Layer 1: DSP Primitives

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/primitives/biquad.h>

#include <cmath>

using Catch::Approx;
using namespace Hearth::DSP;

namespace {
constexpr double kSampleRate = 44100.0;
constexpr double kMinus3dB = 0.70710678118654752;
}

// ==============================================================================
// Biquad
// ==============================================================================

TEST_CASE("Biquad default coefficients pass the input through", "[biquad]") {
    Biquad bq;
    REQUIRE(bq.process(0.5) == 0.5);
    REQUIRE(bq.process(-1.0) == -1.0);
}

TEST_CASE("Biquad settleTo produces the steady-state output", "[biquad]") {
    BiquadCascade cascade;
    cascade.setButterworth(FilterSpec::lowpass(500.0, 2), kSampleRate);

    Biquad bq(cascade.section(0).coefficients());
    const double settled = bq.settleTo(0.25);
    REQUIRE(settled == Approx(0.25 * bq.coefficients().dcGain()));

    // A constant input after settling stays put
    for (int i = 0; i < 100; ++i) {
        REQUIRE(bq.process(0.25) == Approx(settled).margin(1e-12));
    }
}

TEST_CASE("Biquad reset clears state", "[biquad]") {
    BiquadCascade cascade;
    cascade.setButterworth(FilterSpec::lowpass(500.0, 2), kSampleRate);
    Biquad bq(cascade.section(0).coefficients());

    (void)bq.process(1.0);
    REQUIRE(bq.getZ1() != 0.0);
    bq.reset();
    REQUIRE(bq.getZ1() == 0.0);
    REQUIRE(bq.getZ2() == 0.0);
}

// ==============================================================================
// Butterworth design
// ==============================================================================

TEST_CASE("Butterworth lowpass is -3 dB at cutoff and unity at DC", "[biquad][butterworth]") {
    for (int order = kMinFilterOrder; order <= kMaxFilterOrder; ++order) {
        INFO("order " << order);
        BiquadCascade cascade;
        cascade.setButterworth(FilterSpec::lowpass(1000.0, order), kSampleRate);

        REQUIRE(cascade.numSections() == static_cast<size_t>((order + 1) / 2));
        REQUIRE(cascade.isStable());
        REQUIRE(cascade.magnitudeAt(0.0, kSampleRate) == Approx(1.0).margin(1e-9));
        REQUIRE(cascade.magnitudeAt(1000.0, kSampleRate) == Approx(kMinus3dB).margin(1e-6));
        REQUIRE(cascade.magnitudeAt(10000.0, kSampleRate) < 0.1);
    }
}

TEST_CASE("Butterworth highpass is -3 dB at cutoff and blocks DC", "[biquad][butterworth]") {
    for (int order = kMinFilterOrder; order <= kMaxFilterOrder; ++order) {
        INFO("order " << order);
        BiquadCascade cascade;
        cascade.setButterworth(FilterSpec::highpass(200.0, order), kSampleRate);

        REQUIRE(cascade.isStable());
        REQUIRE(cascade.magnitudeAt(0.0, kSampleRate) == Approx(0.0).margin(1e-9));
        REQUIRE(cascade.magnitudeAt(200.0, kSampleRate) == Approx(kMinus3dB).margin(1e-6));
        REQUIRE(cascade.magnitudeAt(kSampleRate / 2.0, kSampleRate) == Approx(1.0).margin(1e-9));
    }
}

TEST_CASE("Butterworth bandpass passes the centre and is -3 dB at the edges",
          "[biquad][butterworth]") {
    const double low = 300.0;
    const double high = 3000.0;

    for (int order = 1; order <= 6; ++order) {
        INFO("order " << order);
        BiquadCascade cascade;
        cascade.setButterworth(FilterSpec::bandpass(low, high, order), kSampleRate);

        REQUIRE(cascade.numSections() == static_cast<size_t>(order));
        REQUIRE(cascade.isStable());
        REQUIRE(cascade.magnitudeAt(low, kSampleRate) == Approx(kMinus3dB).margin(1e-5));
        REQUIRE(cascade.magnitudeAt(high, kSampleRate) == Approx(kMinus3dB).margin(1e-5));
        REQUIRE(cascade.magnitudeAt(0.0, kSampleRate) == Approx(0.0).margin(1e-9));
        REQUIRE(cascade.magnitudeAt(kSampleRate / 2.0, kSampleRate) == Approx(0.0).margin(1e-9));
    }
}

TEST_CASE("Butterworth cutoffs near Nyquist stay stable", "[biquad][butterworth][edge]") {
    BiquadCascade cascade;
    cascade.setButterworth(FilterSpec::lowpass(20000.0, 6), kSampleRate);
    REQUIRE(cascade.isStable());

    cascade.setButterworth(FilterSpec::highpass(20.0, 6), kSampleRate);
    REQUIRE(cascade.isStable());
}

TEST_CASE("Invalid filter specs are configuration errors", "[biquad][butterworth][error]") {
    BiquadCascade cascade;

    SECTION("cutoff at or above Nyquist") {
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::lowpass(22050.0, 2), kSampleRate),
                          ConfigurationError);
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::highpass(30000.0, 2), kSampleRate),
                          ConfigurationError);
    }

    SECTION("non-positive cutoff") {
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::lowpass(0.0, 2), kSampleRate),
                          ConfigurationError);
    }

    SECTION("unordered band edges") {
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::bandpass(2000.0, 500.0, 2), kSampleRate),
                          ConfigurationError);
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::bandpass(500.0, 23000.0, 2), kSampleRate),
                          ConfigurationError);
    }

    SECTION("order out of range") {
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::lowpass(1000.0, 0), kSampleRate),
                          ConfigurationError);
        REQUIRE_THROWS_AS(cascade.setButterworth(FilterSpec::lowpass(1000.0, kMaxFilterOrder + 1),
                                                 kSampleRate),
                          ConfigurationError);
    }
}
