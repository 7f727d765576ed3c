// ==============================================================================
// Layer 3: System - Soundtrack Analyzer
// ==============================================================================
// Listening-quality checks for a finished track: warmth (spectral balance),
// envelope smoothness, consonance of the strongest partials, gentle dynamics
// (crest factor), melodic movement and spectral fullness.
//
// Spectra are Welch averages: Hann-windowed 8192-point frames with 50 %
// overlap, magnitude per bin averaged over all frames. Band energies are sums
// of averaged magnitudes over the bins inside the band (edges inclusive).
//
// The amplitude envelope is the Hilbert envelope, computed on the same
// 8192-sample frames and keeping the middle half of each frame (the first
// and last frame also keep their outer quarter).
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

/// Analysis frame length (samples)
inline constexpr size_t kAnalysisFrameSize = 8192;

/// Analysis hop (50 % overlap)
inline constexpr size_t kAnalysisHopSize = kAnalysisFrameSize / 2;

/// @brief Outcome of one named check.
struct QualityCheck {
    std::string name;
    bool passed = false;
};

/// @brief One analysis with its measurements and checks.
struct QualityTest {
    std::string name;
    std::vector<std::pair<std::string, double>> details;
    std::vector<QualityCheck> checks;

    [[nodiscard]] bool passed() const noexcept;

    /// Measurement by name (0 if absent)
    [[nodiscard]] double detail(const std::string& key) const noexcept;

    /// Check result by name (false if absent)
    [[nodiscard]] bool check(const std::string& key) const noexcept;
};

/// @brief All analyses of one track.
struct QualityReport {
    std::vector<QualityTest> tests;

    [[nodiscard]] size_t passedCount() const noexcept;
    [[nodiscard]] bool allPassed() const noexcept { return passedCount() == tests.size(); }
};

/// @brief Runs the quality analyses over one buffer.
///
/// @par Usage
/// @code
/// SoundtrackAnalyzer analyzer(track);
/// QualityReport report = analyzer.analyze();
/// @endcode
class SoundtrackAnalyzer {
public:
    /// Computes the averaged spectrum and per-frame spectra up front.
    /// @throws ConfigurationError if the buffer is shorter than one frame
    explicit SoundtrackAnalyzer(const AudioBuffer& buffer);

    /// Energy share of sub_bass / warm_bass / warm_mid / mid / high_mid / high
    [[nodiscard]] QualityTest analyzeWarmth() const;

    /// Harsh transients in the envelope derivative (|d| > 4 std) and
    /// smoothness = 1 - std(d) / (mean|d| + 1e-4)
    [[nodiscard]] QualityTest analyzeSmoothness() const;

    /// Frequency ratios between the ten lowest spectral peaks below 2 kHz
    /// that reach 10 % of the strongest peak
    [[nodiscard]] QualityTest analyzeConsonance() const;

    /// Peak, RMS and crest factor
    [[nodiscard]] QualityTest analyzeDynamics() const;

    /// Dominant 200-2000 Hz pitch per frame and how much it moves
    [[nodiscard]] QualityTest analyzeMelodicContent() const;

    /// Active 50 Hz bands between 50 and 2000 Hz
    [[nodiscard]] QualityTest analyzeFullness() const;

    /// Every analysis above
    [[nodiscard]] QualityReport analyze() const;

    /// Sum of averaged magnitudes for lowHz <= f <= highHz
    [[nodiscard]] double bandEnergy(double lowHz, double highHz) const noexcept;

    [[nodiscard]] size_t numFrames() const noexcept { return frameSpectra_.size(); }
    [[nodiscard]] double binFrequency(size_t bin) const noexcept;
    [[nodiscard]] const std::vector<double>& averageSpectrum() const noexcept { return average_; }
    [[nodiscard]] const std::vector<float>& envelope() const noexcept { return envelope_; }

private:
    double sampleRate_;
    double peak_ = 0.0;
    double rms_ = 0.0;
    std::vector<double> average_;
    std::vector<std::vector<float>> frameSpectra_;
    std::vector<float> envelope_;
};

} // namespace DSP
} // namespace Hearth
