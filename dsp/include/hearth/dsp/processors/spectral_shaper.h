// ==============================================================================
// Layer 2: DSP Processor - Spectral Shaper
// ==============================================================================
// Whole-buffer tone shaping for mixing and mastering: zero-phase Butterworth
// lowpass/highpass/bandpass, singly or as an ordered chain. Orders stay low
// (2-6 in the presets) for gentle roll-off.
//
// Every spec in a chain is validated before any sample is touched.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/primitives/biquad.h>
#include <hearth/dsp/primitives/zero_phase_filter.h>

#include <span>
#include <vector>

namespace Hearth {
namespace DSP {

/// @brief Pre-designed chain of zero-phase filters for one sample rate.
///
/// @par Usage
/// @code
/// SpectralShaper warmth({FilterSpec::lowpass(5000.0, 2)}, 44100.0);
/// warmth.process(master);
/// @endcode
class SpectralShaper {
public:
    SpectralShaper() = default;

    /// Design every filter in `chain` at `sampleRate`.
    /// @throws ConfigurationError if any spec is invalid
    SpectralShaper(const std::vector<FilterSpec>& chain, double sampleRate)
        : sampleRate_(sampleRate) {
        filters_.resize(chain.size());
        for (size_t i = 0; i < chain.size(); ++i) {
            filters_[i].design(chain[i], sampleRate);
        }
    }

    /// Apply the chain in order, in place.
    /// @throws ConfigurationError if the buffer rate differs from the design rate
    void process(AudioBuffer& buffer) {
        if (filters_.empty()) return;
        detail::require(buffer.sampleRate() == sampleRate_,
                        "buffer sample rate does not match the filter design rate");
        for (auto& f : filters_) {
            f.process(buffer.samples());
        }
    }

    [[nodiscard]] size_t numFilters() const noexcept { return filters_.size(); }
    [[nodiscard]] bool empty() const noexcept { return filters_.empty(); }

private:
    std::vector<ZeroPhaseFilter> filters_;
    double sampleRate_ = 0.0;
};

/// Zero-phase filter `buffer` in place.
/// @throws ConfigurationError if the spec is invalid for the buffer's rate
inline void process(AudioBuffer& buffer, const FilterSpec& spec) {
    ZeroPhaseFilter filter;
    filter.design(spec, buffer.sampleRate());
    filter.process(buffer.samples());
}

/// Zero-phase filtered copy of `buffer`; length is preserved.
[[nodiscard]] inline AudioBuffer filter(AudioBuffer buffer, const FilterSpec& spec) {
    process(buffer, spec);
    return buffer;
}

/// Apply `chain` to `buffer` in place, in order.
inline void processChain(AudioBuffer& buffer, const std::vector<FilterSpec>& chain) {
    SpectralShaper shaper(chain, buffer.sampleRate());
    shaper.process(buffer);
}

/// Copy of `buffer` with `chain` applied in order.
[[nodiscard]] inline AudioBuffer filterChain(AudioBuffer buffer, const std::vector<FilterSpec>& chain) {
    processChain(buffer, chain);
    return buffer;
}

} // namespace DSP
} // namespace Hearth
