// ==============================================================================
// Layer 2: DSP Processor - Sample Voice
// ==============================================================================
// Playback helpers for recorded instrument samples: resampling pitch shift,
// fit-to-duration, and the named bank the boundary fills before a render.
//
// Pitch shift is a plain resample (length and pitch change together):
//   newLength = trunc(length / 2^(semitones / 12))
//   out[i] = linear interpolation of in at i * (length - 1) / (newLength - 1)
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

/// Resample `buffer` to shift its pitch by `semitones` (positive = up).
[[nodiscard]] inline AudioBuffer pitchShift(const AudioBuffer& buffer, double semitones) {
    if (semitones == 0.0 || buffer.empty()) return buffer;

    const double factor = std::exp2(semitones / 12.0);
    const auto newLength = static_cast<size_t>(static_cast<double>(buffer.size()) / factor);
    AudioBuffer out(newLength, buffer.sampleRate());
    if (newLength == 0) return out;
    if (newLength == 1 || buffer.size() == 1) {
        out[0] = buffer[0];
        return out;
    }

    const double step = static_cast<double>(buffer.size() - 1) / static_cast<double>(newLength - 1);
    const size_t lastIndex = buffer.size() - 1;
    for (size_t i = 0; i < newLength; ++i) {
        const double position = static_cast<double>(i) * step;
        const auto index = std::min(static_cast<size_t>(position), lastIndex);
        const size_t next = std::min(index + 1, lastIndex);
        const auto frac = static_cast<float>(position - static_cast<double>(index));
        out[i] = buffer[index] + frac * (buffer[next] - buffer[index]);
    }
    return out;
}

/// Truncate or zero-pad `buffer` to exactly `numSamples` samples.
[[nodiscard]] inline AudioBuffer fitToDuration(AudioBuffer buffer, size_t numSamples) {
    const double sampleRate = buffer.sampleRate();
    std::vector<float> samples = std::move(buffer).release();
    samples.resize(numSamples, 0.0f);
    return AudioBuffer(std::move(samples), sampleRate);
}

/// @brief Named instrument samples at the working rate ("C4", "G4", ...).
class SampleBank {
public:
    SampleBank() = default;

    /// Add or replace `name`.
    void add(std::string name, AudioBuffer sample) {
        samples_.insert_or_assign(std::move(name), std::move(sample));
    }

    [[nodiscard]] bool contains(const std::string& name) const {
        return samples_.find(name) != samples_.end();
    }

    /// @throws ConfigurationError if `name` is not in the bank
    [[nodiscard]] const AudioBuffer& get(const std::string& name) const {
        const auto it = samples_.find(name);
        detail::require(it != samples_.end(), "sample '" + name + "' is not in the sample bank");
        return it->second;
    }

    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(samples_.size());
        for (const auto& [name, sample] : samples_) {
            result.push_back(name);
        }
        return result;
    }

private:
    std::map<std::string, AudioBuffer> samples_;
};

} // namespace DSP
} // namespace Hearth
