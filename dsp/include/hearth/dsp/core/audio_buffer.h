// ==============================================================================
// Layer 0: Core Utility - Audio Buffer
// ==============================================================================
// Mono, fixed-length, float sample buffer tagged with its sample rate.
// Buffers are value types: pipeline stages take them by value and return
// them, so ownership moves from stage to stage without sharing.
//
// Length rule: numSamples = floor(durationSeconds * sampleRate).
// ==============================================================================

#pragma once

#include <hearth/dsp/core/config_error.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

/// Number of whole samples covered by `seconds` at `sampleRate` (truncating).
/// Negative or non-finite products yield 0.
[[nodiscard]] inline size_t sampleCountFor(double seconds, double sampleRate) noexcept {
    const double product = seconds * sampleRate;
    if (!(product > 0.0) || !std::isfinite(product)) return 0;
    return static_cast<size_t>(product);
}

/// @brief Mono float audio buffer with an associated sample rate.
class AudioBuffer {
public:
    AudioBuffer() = default;

    /// Silent buffer of `numSamples` samples.
    AudioBuffer(size_t numSamples, double sampleRate)
        : samples_(numSamples, 0.0f), sampleRate_(sampleRate) {}

    /// Wrap existing samples.
    AudioBuffer(std::vector<float> samples, double sampleRate)
        : samples_(std::move(samples)), sampleRate_(sampleRate) {}

    /// Silent buffer for a duration. Rejects non-positive duration or rate
    /// and durations shorter than one sample.
    [[nodiscard]] static AudioBuffer silence(double durationSeconds, double sampleRate) {
        detail::require(sampleRate > 0.0 && std::isfinite(sampleRate),
                        "sample rate must be positive, got " + std::to_string(sampleRate));
        detail::require(durationSeconds > 0.0 && std::isfinite(durationSeconds),
                        "duration must be positive, got " + std::to_string(durationSeconds));
        const size_t count = sampleCountFor(durationSeconds, sampleRate);
        detail::require(count > 0, "duration " + std::to_string(durationSeconds)
                                   + " s is shorter than one sample");
        return AudioBuffer(count, sampleRate);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

    /// Duration in seconds (size / sampleRate)
    [[nodiscard]] double duration() const noexcept {
        return sampleRate_ > 0.0 ? static_cast<double>(samples_.size()) / sampleRate_ : 0.0;
    }

    /// Largest absolute sample value
    [[nodiscard]] float peak() const noexcept {
        float result = 0.0f;
        for (float s : samples_) {
            result = std::max(result, std::abs(s));
        }
        return result;
    }

    /// True when every sample is exactly zero
    [[nodiscard]] bool isSilent() const noexcept {
        return std::all_of(samples_.begin(), samples_.end(),
                           [](float s) { return s == 0.0f; });
    }

    // =========================================================================
    // Sample Access
    // =========================================================================

    [[nodiscard]] float* data() noexcept { return samples_.data(); }
    [[nodiscard]] const float* data() const noexcept { return samples_.data(); }

    [[nodiscard]] float& operator[](size_t index) noexcept { return samples_[index]; }
    [[nodiscard]] float operator[](size_t index) const noexcept { return samples_[index]; }

    [[nodiscard]] std::span<float> samples() noexcept { return samples_; }
    [[nodiscard]] std::span<const float> samples() const noexcept { return samples_; }

    [[nodiscard]] auto begin() noexcept { return samples_.begin(); }
    [[nodiscard]] auto end() noexcept { return samples_.end(); }
    [[nodiscard]] auto begin() const noexcept { return samples_.begin(); }
    [[nodiscard]] auto end() const noexcept { return samples_.end(); }

    /// Release the underlying storage
    [[nodiscard]] std::vector<float> release() && noexcept { return std::move(samples_); }

    // =========================================================================
    // In-place Operations
    // =========================================================================

    /// Multiply every sample by `gain`
    void scale(float gain) noexcept {
        for (float& s : samples_) {
            s *= gain;
        }
    }

    /// Add `source * gain` into this buffer starting at `offset`.
    /// The copy is clipped at the end of this buffer; an offset at or past
    /// the end adds nothing.
    /// @return Number of samples actually accumulated
    size_t addAt(std::span<const float> source, size_t offset, float gain = 1.0f) noexcept {
        if (offset >= samples_.size()) return 0;
        const size_t count = std::min(source.size(), samples_.size() - offset);
        for (size_t i = 0; i < count; ++i) {
            samples_[offset + i] += source[i] * gain;
        }
        return count;
    }

    size_t addAt(const AudioBuffer& source, size_t offset, float gain = 1.0f) noexcept {
        return addAt(source.samples(), offset, gain);
    }

private:
    std::vector<float> samples_;
    double sampleRate_ = 0.0;
};

} // namespace DSP
} // namespace Hearth
