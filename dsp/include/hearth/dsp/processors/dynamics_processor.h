// ==============================================================================
// Layer 2: DSP Processor - Dynamics Processor
// ==============================================================================
// Static (memoryless) dynamics for offline mastering:
// - soft-knee compression above a threshold, in one or more cascaded stages
// - tanh saturation as the final nonlinearity
//
// Compression: |x| > T  ->  sign(x) * (T + (|x| - T) / ratio)
// Saturation:  tanh(x * drive) / drive
//
// Both curves pass through the origin, so silence stays silent.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/db_utils.h>

#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Sample Curves
// =============================================================================

/// Compress one sample above `threshold` by `ratio`; identity at or below.
[[nodiscard]] inline float compress(float x, float threshold, float ratio) noexcept {
    const float magnitude = std::abs(x);
    if (magnitude <= threshold) return x;
    const float shaped = threshold + (magnitude - threshold) / ratio;
    return x < 0.0f ? -shaped : shaped;
}

/// Soft saturation: tanh(x * drive) / drive. Near-linear for small x and
/// bounded by 1 / drive.
[[nodiscard]] inline float saturate(float x, float drive) noexcept {
    return std::tanh(x * drive) / drive;
}

// =============================================================================
// Compressor Stage
// =============================================================================

/// @brief One static compression pass.
struct CompressorStage {
    float threshold = 0.3f;  ///< Linear amplitude, > 0
    float ratio = 2.0f;      ///< >= 1

    /// Stage with the threshold given in dBFS
    [[nodiscard]] static CompressorStage fromDb(float thresholdDb, float ratio) noexcept {
        return {dbToGain(thresholdDb), ratio};
    }
};

/// @throws ConfigurationError unless threshold > 0 and ratio >= 1
inline void validateStage(const CompressorStage& stage) {
    detail::require(stage.threshold > 0.0f && std::isfinite(stage.threshold),
                    "compressor threshold must be positive, got "
                    + std::to_string(stage.threshold));
    detail::require(stage.ratio >= 1.0f && std::isfinite(stage.ratio),
                    "compressor ratio must be >= 1, got " + std::to_string(stage.ratio));
}

/// @throws ConfigurationError unless drive > 0
inline void validateDrive(float drive) {
    detail::require(drive > 0.0f && std::isfinite(drive),
                    "saturation drive must be positive, got " + std::to_string(drive));
}

/// Apply every stage in order, in place.
/// @throws ConfigurationError if any stage is invalid
inline void compressCascade(AudioBuffer& buffer, const std::vector<CompressorStage>& stages) {
    for (const auto& stage : stages) {
        validateStage(stage);
    }
    for (const auto& stage : stages) {
        for (float& s : buffer) {
            s = compress(s, stage.threshold, stage.ratio);
        }
    }
}

/// Saturate every sample in place.
/// @throws ConfigurationError if drive <= 0
inline void saturateBuffer(AudioBuffer& buffer, float drive) {
    validateDrive(drive);
    for (float& s : buffer) {
        s = saturate(s, drive);
    }
}

// =============================================================================
// DynamicsProcessor
// =============================================================================

/// @brief Compression cascade followed by optional saturation.
///
/// Parameters are validated at construction; process() cannot fail.
///
/// @par Usage
/// @code
/// DynamicsProcessor dyn({{0.3f, 2.5f}}, 2.0f);
/// dyn.process(mix);
/// @endcode
class DynamicsProcessor {
public:
    DynamicsProcessor() = default;

    /// @throws ConfigurationError on an invalid stage or drive
    explicit DynamicsProcessor(std::vector<CompressorStage> stages,
                               std::optional<float> saturationDrive = std::nullopt)
        : stages_(std::move(stages))
        , drive_(saturationDrive) {
        for (const auto& stage : stages_) {
            validateStage(stage);
        }
        if (drive_) {
            validateDrive(*drive_);
        }
    }

    /// Compression stages in order, then saturation, in place
    void process(AudioBuffer& buffer) const noexcept {
        for (float& s : buffer) {
            s = processSample(s);
        }
    }

    [[nodiscard]] float processSample(float x) const noexcept {
        for (const auto& stage : stages_) {
            x = compress(x, stage.threshold, stage.ratio);
        }
        if (drive_) {
            x = saturate(x, *drive_);
        }
        return x;
    }

    [[nodiscard]] const std::vector<CompressorStage>& stages() const noexcept { return stages_; }
    [[nodiscard]] std::optional<float> saturationDrive() const noexcept { return drive_; }

private:
    std::vector<CompressorStage> stages_;
    std::optional<float> drive_;
};

} // namespace DSP
} // namespace Hearth
