// ==============================================================================
// Layer 1: DSP Primitive - Biquad Sections and Butterworth Cascade
// ==============================================================================
// Transposed Direct Form II second-order sections in double precision, and a
// runtime-sized cascade designed as a Butterworth lowpass, highpass or
// bandpass from a FilterSpec.
//
// Design path: analog prototype -> LP/HP/BP frequency transform (prewarped)
// -> bilinear transform -> poles paired into second-order sections, zeros at
// z = -1 (lowpass), z = +1 (highpass) or one of each (bandpass). The
// cascade is normalized to unity gain at DC, Nyquist or band centre.
//
// State is double precision: renders are tens of seconds long and presets
// put cutoffs as low as 60 Hz, where float TDF2 state drifts audibly.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/db_utils.h>
#include <hearth/dsp/core/filter_design.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Lowest accepted Butterworth order
inline constexpr int kMinFilterOrder = 1;

/// Highest accepted Butterworth order (steeper filters ring)
inline constexpr int kMaxFilterOrder = 8;

// =============================================================================
// Filter Type / Spec
// =============================================================================

/// @brief Supported filter response types.
enum class FilterType : uint8_t {
    Lowpass,    ///< Butterworth lowpass, -3 dB at cutoff
    Highpass,   ///< Butterworth highpass, -3 dB at cutoff
    Bandpass    ///< Butterworth bandpass, -3 dB at low and high edges
};

/// @brief Filter request: type, cutoff (or band edges) and prototype order.
///
/// For Bandpass, `lowHz`/`highHz` are the band edges and the realised order
/// is 2 * order (each prototype pole becomes a conjugate pair).
struct FilterSpec {
    FilterType type = FilterType::Lowpass;
    double cutoffHz = 1000.0;  ///< Lowpass/Highpass cutoff
    double lowHz = 0.0;        ///< Bandpass lower edge
    double highHz = 0.0;       ///< Bandpass upper edge
    int order = 2;

    [[nodiscard]] static FilterSpec lowpass(double cutoffHz, int order) noexcept {
        return {FilterType::Lowpass, cutoffHz, 0.0, 0.0, order};
    }

    [[nodiscard]] static FilterSpec highpass(double cutoffHz, int order) noexcept {
        return {FilterType::Highpass, cutoffHz, 0.0, 0.0, order};
    }

    [[nodiscard]] static FilterSpec bandpass(double lowHz, double highHz, int order) noexcept {
        return {FilterType::Bandpass, 0.0, lowHz, highHz, order};
    }
};

/// Human-readable filter type name (for error messages and tool output)
[[nodiscard]] inline const char* filterTypeName(FilterType type) noexcept {
    switch (type) {
        case FilterType::Lowpass:  return "lowpass";
        case FilterType::Highpass: return "highpass";
        case FilterType::Bandpass: return "bandpass";
    }
    return "unknown";
}

/// Reject specs whose cutoffs are not strictly inside (0, Nyquist), whose
/// band edges are not ordered, or whose order is out of range.
/// @throws ConfigurationError
inline void validateFilterSpec(const FilterSpec& spec, double sampleRate) {
    detail::require(sampleRate > 0.0, "filter sample rate must be positive");
    const double nyquist = sampleRate * 0.5;
    const std::string name = filterTypeName(spec.type);

    detail::require(spec.order >= kMinFilterOrder && spec.order <= kMaxFilterOrder,
                    name + " order " + std::to_string(spec.order) + " outside ["
                    + std::to_string(kMinFilterOrder) + ", "
                    + std::to_string(kMaxFilterOrder) + "]");

    if (spec.type == FilterType::Bandpass) {
        detail::require(spec.lowHz > 0.0 && spec.lowHz < spec.highHz && spec.highHz < nyquist,
                        "bandpass edges must satisfy 0 < low < high < Nyquist ("
                        + std::to_string(spec.lowHz) + ", " + std::to_string(spec.highHz)
                        + ", Nyquist " + std::to_string(nyquist) + ")");
    } else {
        detail::require(spec.cutoffHz > 0.0 && spec.cutoffHz < nyquist,
                        name + " cutoff " + std::to_string(spec.cutoffHz)
                        + " Hz must lie strictly between 0 and Nyquist ("
                        + std::to_string(nyquist) + " Hz)");
    }
}

// =============================================================================
// Biquad Coefficients
// =============================================================================

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
struct BiquadCoefficients {
    double b0 = 1.0;  ///< Feedforward coefficient 0
    double b1 = 0.0;  ///< Feedforward coefficient 1
    double b2 = 0.0;  ///< Feedforward coefficient 2
    double a1 = 0.0;  ///< Feedback coefficient 1 (a0 = 1 implied)
    double a2 = 0.0;  ///< Feedback coefficient 2

    /// Complex response H(z) at a point on (or off) the unit circle
    [[nodiscard]] std::complex<double> response(std::complex<double> z) const noexcept {
        const std::complex<double> zi = 1.0 / z;
        const std::complex<double> zi2 = zi * zi;
        return (b0 + b1 * zi + b2 * zi2) / (1.0 + a1 * zi + a2 * zi2);
    }

    /// Gain for a constant (DC) input
    [[nodiscard]] double dcGain() const noexcept {
        return (b0 + b1 + b2) / (1.0 + a1 + a2);
    }

    /// Jury stability criterion for a second-order section
    [[nodiscard]] bool isStable() const noexcept {
        constexpr double epsilon = 1e-12;
        return std::abs(a2) < 1.0 + epsilon &&
               std::abs(a1) < 1.0 + a2 + epsilon;
    }
};

// =============================================================================
// Biquad Filter Class
// =============================================================================

/// @brief Transposed Direct Form II biquad filter.
///
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept {
        coeffs_ = coeffs;
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept {
        return coeffs_;
    }

    /// Process single sample using TDF2
    [[nodiscard]] double process(double input) noexcept {
        const double output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;

        z1_ = detail::flushDenormal(z1_);
        z2_ = detail::flushDenormal(z2_);

        return output;
    }

    /// Clear filter state
    void reset() noexcept {
        z1_ = 0.0;
        z2_ = 0.0;
    }

    /// Load the state this section would settle into after an infinitely
    /// long constant input of value `input`.
    /// @return The settled output (input * DC gain)
    double settleTo(double input) noexcept {
        const double output = input * coeffs_.dcGain();
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;
        z1_ = output - coeffs_.b0 * input;
        return output;
    }

    [[nodiscard]] double getZ1() const noexcept { return z1_; }
    [[nodiscard]] double getZ2() const noexcept { return z2_; }

private:
    BiquadCoefficients coeffs_;
    double z1_ = 0.0;
    double z2_ = 0.0;
};

// =============================================================================
// Butterworth Cascade
// =============================================================================

/// @brief Runtime-sized cascade of biquad sections designed as Butterworth.
///
/// Order N lowpass/highpass yields ceil(N/2) sections (one first-order
/// section stored as a biquad with b2 = a2 = 0 when N is odd). Order N
/// bandpass yields N sections.
class BiquadCascade {
public:
    BiquadCascade() = default;

    /// Design the cascade for `spec` at `sampleRate`.
    /// @throws ConfigurationError if the spec is invalid
    void setButterworth(const FilterSpec& spec, double sampleRate) {
        validateFilterSpec(spec, sampleRate);
        sections_.clear();

        const auto order = static_cast<size_t>(spec.order);
        const auto prototype = FilterDesign::butterworthPrototypePoles(order);

        std::vector<std::complex<double>> analogPoles;
        std::vector<double> digitalZeros;
        std::complex<double> reference{1.0, 0.0};

        switch (spec.type) {
            case FilterType::Lowpass: {
                const double wc = FilterDesign::prewarpAngular(spec.cutoffHz, sampleRate);
                for (const auto& p : prototype) analogPoles.push_back(p * wc);
                digitalZeros.assign(order, -1.0);
                reference = {1.0, 0.0};
                break;
            }
            case FilterType::Highpass: {
                const double wc = FilterDesign::prewarpAngular(spec.cutoffHz, sampleRate);
                for (const auto& p : prototype) analogPoles.push_back(wc / p);
                digitalZeros.assign(order, 1.0);
                reference = {-1.0, 0.0};
                break;
            }
            case FilterType::Bandpass: {
                const double wl = FilterDesign::prewarpAngular(spec.lowHz, sampleRate);
                const double wh = FilterDesign::prewarpAngular(spec.highHz, sampleRate);
                const double bw = wh - wl;
                const double w0 = std::sqrt(wl * wh);
                for (const auto& p : prototype) {
                    const std::complex<double> scaled = p * (bw * 0.5);
                    const std::complex<double> offset = std::sqrt(scaled * scaled - w0 * w0);
                    analogPoles.push_back(scaled + offset);
                    analogPoles.push_back(scaled - offset);
                }
                for (size_t i = 0; i < order; ++i) {
                    digitalZeros.push_back(1.0);
                    digitalZeros.push_back(-1.0);
                }
                const double centre = 2.0 * std::atan(w0 / (2.0 * sampleRate));
                reference = std::polar(1.0, centre);
                break;
            }
        }

        std::vector<std::complex<double>> digitalPoles;
        digitalPoles.reserve(analogPoles.size());
        for (const auto& p : analogPoles) {
            digitalPoles.push_back(FilterDesign::bilinear(p, sampleRate));
        }

        buildSections(digitalPoles, digitalZeros);
        normalizeAt(reference);
    }

    /// Process one sample through all sections
    [[nodiscard]] double process(double input) noexcept {
        double x = input;
        for (auto& section : sections_) {
            x = section.process(x);
        }
        return x;
    }

    /// Clear all section states
    void reset() noexcept {
        for (auto& section : sections_) {
            section.reset();
        }
    }

    /// Preload every section with its steady state for a constant input
    void settleTo(double input) noexcept {
        double x = input;
        for (auto& section : sections_) {
            x = section.settleTo(x);
        }
    }

    /// Magnitude response at `frequencyHz`
    [[nodiscard]] double magnitudeAt(double frequencyHz, double sampleRate) const noexcept {
        const double omega = kTwoPiD * frequencyHz / sampleRate;
        return std::abs(responseAt(std::polar(1.0, omega)));
    }

    [[nodiscard]] size_t numSections() const noexcept { return sections_.size(); }

    [[nodiscard]] const Biquad& section(size_t index) const noexcept { return sections_[index]; }

    /// True when every section passes the Jury criterion
    [[nodiscard]] bool isStable() const noexcept {
        for (const auto& section : sections_) {
            if (!section.coefficients().isStable()) return false;
        }
        return true;
    }

private:
    [[nodiscard]] std::complex<double> responseAt(std::complex<double> z) const noexcept {
        std::complex<double> h{1.0, 0.0};
        for (const auto& section : sections_) {
            h *= section.coefficients().response(z);
        }
        return h;
    }

    void buildSections(const std::vector<std::complex<double>>& poles,
                       std::vector<double> zeros) {
        constexpr double kRealTolerance = 1e-10;

        std::vector<BiquadCoefficients> denominators;
        std::vector<double> realPoles;
        for (const auto& p : poles) {
            if (std::abs(p.imag()) <= kRealTolerance) {
                realPoles.push_back(p.real());
            } else if (p.imag() > 0.0) {
                BiquadCoefficients c;
                c.a1 = -2.0 * p.real();
                c.a2 = std::norm(p);
                denominators.push_back(c);
            }
        }
        size_t i = 0;
        for (; i + 1 < realPoles.size(); i += 2) {
            BiquadCoefficients c;
            c.a1 = -(realPoles[i] + realPoles[i + 1]);
            c.a2 = realPoles[i] * realPoles[i + 1];
            denominators.push_back(c);
        }
        if (i < realPoles.size()) {
            BiquadCoefficients c;
            c.a1 = -realPoles[i];
            c.a2 = 0.0;
            denominators.push_back(c);
        }

        // Each section takes as many zeros as it has poles.
        size_t nextZero = 0;
        for (auto& c : denominators) {
            const bool firstOrder = (c.a2 == 0.0);
            if (firstOrder) {
                const double z = nextZero < zeros.size() ? zeros[nextZero++] : -1.0;
                c.b0 = 1.0;
                c.b1 = -z;
                c.b2 = 0.0;
            } else {
                const double z1 = nextZero < zeros.size() ? zeros[nextZero++] : -1.0;
                const double z2 = nextZero < zeros.size() ? zeros[nextZero++] : -1.0;
                c.b0 = 1.0;
                c.b1 = -(z1 + z2);
                c.b2 = z1 * z2;
            }
            sections_.emplace_back(c);
        }
    }

    void normalizeAt(std::complex<double> reference) noexcept {
        if (sections_.empty()) return;
        const double magnitude = std::abs(responseAt(reference));
        if (!(magnitude > 0.0) || !std::isfinite(magnitude)) return;

        // Spread the correction evenly so no single section carries it all.
        const double perSection = std::pow(1.0 / magnitude,
                                           1.0 / static_cast<double>(sections_.size()));
        for (auto& section : sections_) {
            BiquadCoefficients c = section.coefficients();
            c.b0 *= perSection;
            c.b1 *= perSection;
            c.b2 *= perSection;
            section.setCoefficients(c);
        }
    }

    std::vector<Biquad> sections_;
};

} // namespace DSP
} // namespace Hearth
