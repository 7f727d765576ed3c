// ==============================================================================
// Layer 2: DSP Processor - Peak Normalizer
// ==============================================================================
// Scales a buffer so that max|x| equals a target peak:
//   x' = x / max|x| * targetPeak
// Normalizing an all-zero buffer is undefined and rejected.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>

#include <cmath>
#include <string>

namespace Hearth {
namespace DSP {

/// Scale `buffer` in place so its peak equals `targetPeak`.
/// @throws ConfigurationError if `targetPeak` is not positive and finite, or
///         if the buffer is silent
inline void normalizePeak(AudioBuffer& buffer, float targetPeak) {
    detail::require(targetPeak > 0.0f && std::isfinite(targetPeak),
                    "target peak must be positive, got " + std::to_string(targetPeak));
    const float peak = buffer.peak();
    detail::require(peak > 0.0f && std::isfinite(peak),
                    "cannot normalize a silent buffer");
    buffer.scale(targetPeak / peak);
}

/// Normalized copy of `buffer`.
[[nodiscard]] inline AudioBuffer normalizedToPeak(AudioBuffer buffer, float targetPeak) {
    normalizePeak(buffer, targetPeak);
    return buffer;
}

} // namespace DSP
} // namespace Hearth
