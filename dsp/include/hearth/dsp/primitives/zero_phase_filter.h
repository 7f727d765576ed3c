// ==============================================================================
// Layer 1: DSP Primitive - Zero-Phase Filter
// ==============================================================================
// Forward-backward IIR filtering of a whole buffer. The cascade runs once in
// each direction, so the magnitude response is squared and the phase
// response cancels: transients stay where they were.
//
// Edge handling:
// - the signal is extended at both ends by an odd reflection about the edge
//   sample, padLength = 3 * (2 * numSections + 1), clamped to size - 1
// - each pass starts from the steady state for a constant input equal to the
//   first sample of that pass, so the filter does not ring in from zero
// - the padding is stripped afterwards; output length equals input length
// ==============================================================================

#pragma once

#include <hearth/dsp/primitives/biquad.h>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace Hearth {
namespace DSP {

/// Odd-reflection pad length used for a cascade of `numSections` sections,
/// before clamping to the signal length.
[[nodiscard]] constexpr size_t zeroPhasePadLength(size_t numSections) noexcept {
    return 3 * (2 * numSections + 1);
}

/// @brief Offline forward-backward filter around a BiquadCascade.
///
/// @par Usage
/// @code
/// ZeroPhaseFilter lp;
/// lp.design(FilterSpec::lowpass(800.0, 4), 44100.0);
/// lp.process(buffer.samples());
/// @endcode
class ZeroPhaseFilter {
public:
    ZeroPhaseFilter() = default;

    /// Design for `spec` at `sampleRate`.
    /// @throws ConfigurationError if the spec is invalid
    void design(const FilterSpec& spec, double sampleRate) {
        cascade_.setButterworth(spec, sampleRate);
    }

    [[nodiscard]] const BiquadCascade& cascade() const noexcept { return cascade_; }

    /// Filter `samples` in place. Buffers with fewer than two samples are
    /// left untouched.
    void process(std::span<float> samples) {
        const size_t n = samples.size();
        if (n < 2 || cascade_.numSections() == 0) return;

        const size_t pad = std::min(zeroPhasePadLength(cascade_.numSections()), n - 1);
        const size_t extLength = n + 2 * pad;

        std::vector<double> ext(extLength);
        const double first = samples[0];
        const double last = samples[n - 1];
        for (size_t i = 0; i < pad; ++i) {
            ext[i] = 2.0 * first - samples[pad - i];
        }
        for (size_t i = 0; i < n; ++i) {
            ext[pad + i] = samples[i];
        }
        for (size_t i = 0; i < pad; ++i) {
            ext[pad + n + i] = 2.0 * last - samples[n - 2 - i];
        }

        // Forward pass
        cascade_.settleTo(ext.front());
        for (double& x : ext) {
            x = cascade_.process(x);
        }

        // Backward pass
        cascade_.settleTo(ext.back());
        for (size_t i = extLength; i-- > 0;) {
            ext[i] = cascade_.process(ext[i]);
        }

        for (size_t i = 0; i < n; ++i) {
            samples[i] = static_cast<float>(ext[pad + i]);
        }
        cascade_.reset();
    }

private:
    BiquadCascade cascade_;
};

} // namespace DSP
} // namespace Hearth
