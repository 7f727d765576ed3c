// ==============================================================================
// Layer 0: Core Utility - PCM16 Conversion
// ==============================================================================
// The finished track leaves the core as signed 16-bit PCM. Conversion
// scales by 32767 and truncates toward zero; samples outside [-1, 1] are
// clamped rather than wrapped.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

namespace Hearth {
namespace DSP {

/// Full-scale value used for float <-> int16 conversion
inline constexpr float kPcm16FullScale = 32767.0f;

/// Convert one float sample to int16 (x * 32767, truncated, clamped)
[[nodiscard]] inline int16_t floatToPcm16(float sample) noexcept {
    const float scaled = std::clamp(sample * kPcm16FullScale, -32768.0f, kPcm16FullScale);
    return static_cast<int16_t>(scaled);
}

/// Convert a buffer to signed 16-bit PCM
[[nodiscard]] inline std::vector<int16_t> toPcm16(const AudioBuffer& buffer) {
    std::vector<int16_t> pcm(buffer.size());
    std::transform(buffer.begin(), buffer.end(), pcm.begin(), floatToPcm16);
    return pcm;
}

/// Convert signed 16-bit PCM to a float buffer (s / 32767)
[[nodiscard]] inline AudioBuffer fromPcm16(std::span<const int16_t> pcm, double sampleRate) {
    std::vector<float> samples(pcm.size());
    std::transform(pcm.begin(), pcm.end(), samples.begin(),
                   [](int16_t s) { return static_cast<float>(s) / kPcm16FullScale; });
    return AudioBuffer(std::move(samples), sampleRate);
}

} // namespace DSP
} // namespace Hearth
