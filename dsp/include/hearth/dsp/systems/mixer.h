// ==============================================================================
// Layer 3: System Component - Mixer / Master
// ==============================================================================
// Sums rendered layers and masters the result.
//
// Per layer, in plan order:
//   pre-filter chain -> pre-compression -> fade-in -> gain (dB) -> * weight
// Master:
//   shaping chain -> compression cascade -> saturation -> fade-in/out
//   -> peak normalization to targetPeak
//
// Everything is validated when the Mixer is constructed, so mix() and
// master() only fail on bad inputs (missing layer, length or rate mismatch,
// silent result).
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/primitives/biquad.h>
#include <hearth/dsp/processors/dynamics_processor.h>
#include <hearth/dsp/processors/spectral_shaper.h>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

// =============================================================================
// Plan Types
// =============================================================================

/// @brief How one layer enters the mix.
struct LayerMix {
    float weight = 1.0f;                          ///< >= 0
    std::vector<FilterSpec> preFilters;           ///< Zero-phase, in order
    std::optional<CompressorStage> preCompression;
    std::optional<double> fadeInSeconds;
    double fadeExponent = 2.0;
    float gainDb = 0.0f;
};

/// @brief Ordered (layer name, LayerMix) entries. Weights need not sum to 1.
struct MixPlan {
    std::vector<std::pair<std::string, LayerMix>> entries;

    MixPlan& add(std::string name, LayerMix mix) {
        entries.emplace_back(std::move(name), std::move(mix));
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] bool contains(const std::string& name) const noexcept;
};

/// @brief Master bus settings.
struct MasterSpec {
    std::vector<FilterSpec> shaping;
    std::vector<CompressorStage> compression;
    std::optional<float> saturationDrive;
    double fadeInSeconds = 0.0;
    double fadeOutSeconds = 0.0;
    double fadeExponent = 2.0;
    float targetPeak = 0.85f;  ///< (0, 1)
};

/// Rendered layers keyed by name
using LayerBuffers = std::map<std::string, AudioBuffer>;

// =============================================================================
// Mixer
// =============================================================================

/// @brief Weighted layer sum plus master chain.
///
/// @par Usage
/// @code
/// Mixer mixer(plan, master, 44100.0);
/// AudioBuffer track = mixer.mixAndMaster(layers);
/// @endcode
class Mixer {
public:
    /// @throws ConfigurationError on an empty plan, duplicate or negative
    ///         entries, invalid filters/stages, or targetPeak outside (0, 1)
    Mixer(MixPlan plan, MasterSpec master, double sampleRate);

    /// Weighted sum of every planned layer after its per-layer processing.
    /// Inputs not named by the plan are ignored.
    /// @throws ConfigurationError if a planned layer is missing or the
    ///         inputs disagree on length or sample rate
    [[nodiscard]] AudioBuffer mix(const LayerBuffers& layers) const;

    /// Master chain on an already mixed buffer.
    /// @throws ConfigurationError if the buffer is silent at normalization
    [[nodiscard]] AudioBuffer master(AudioBuffer buffer) const;

    /// mix() then master()
    [[nodiscard]] AudioBuffer mixAndMaster(const LayerBuffers& layers) const;

    [[nodiscard]] const MixPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] const MasterSpec& masterSpec() const noexcept { return master_; }

private:
    struct Channel {
        std::string name;
        LayerMix settings;
        SpectralShaper shaper;
    };

    [[nodiscard]] AudioBuffer processChannel(const Channel& channel, AudioBuffer buffer) const;

    MixPlan plan_;
    MasterSpec master_;
    double sampleRate_;
    std::vector<Channel> channels_;
    SpectralShaper masterShaper_;
    DynamicsProcessor dynamics_;
};

} // namespace DSP
} // namespace Hearth
