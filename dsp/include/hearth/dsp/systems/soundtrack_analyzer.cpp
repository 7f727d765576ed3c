// ==============================================================================
// Layer 3: System - Soundtrack Analyzer
// ==============================================================================

#include <hearth/dsp/systems/soundtrack_analyzer.h>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace Hearth {
namespace DSP {

namespace {

struct Band {
    const char* name;
    double lowHz;
    double highHz;
};

constexpr Band kWarmthBands[] = {
    {"sub_bass", 20.0, 80.0},
    {"warm_bass", 80.0, 250.0},
    {"warm_mid", 250.0, 500.0},
    {"mid", 500.0, 2000.0},
    {"high_mid", 2000.0, 6000.0},
    {"high", 6000.0, 12000.0},
};

constexpr double kMelodicLowHz = 200.0;
constexpr double kMelodicHighHz = 2000.0;
constexpr double kPitchChangeHz = 20.0;

constexpr double kFullnessBandWidthHz = 50.0;
constexpr size_t kFullnessBandCount = 39;  // 50-100 Hz ... 1950-2000 Hz

constexpr double kHarshTransientSigmas = 4.0;
constexpr double kSmoothnessEpsilon = 1e-4;

constexpr double kPeakHeightFraction = 0.1;
constexpr double kConsonanceHighHz = 2000.0;
constexpr size_t kConsonancePeakLimit = 10;
constexpr double kRatioTolerance = 0.1;
// Unison, octave, fifth, major third, fourth, minor third
constexpr double kConsonantRatios[] = {1.0, 2.0, 1.5, 1.25, 1.33, 1.2};

bool isConsonant(double ratio) noexcept {
    for (double r : kConsonantRatios) {
        if (std::abs(ratio - r) < kRatioTolerance || std::abs(ratio - 2.0 * r) < kRatioTolerance) {
            return true;
        }
    }
    return false;
}

} // namespace

// =============================================================================
// Report Types
// =============================================================================

bool QualityTest::passed() const noexcept {
    return std::all_of(checks.begin(), checks.end(), [](const QualityCheck& c) { return c.passed; });
}

double QualityTest::detail(const std::string& key) const noexcept {
    for (const auto& [name, value] : details) {
        if (name == key) return value;
    }
    return 0.0;
}

bool QualityTest::check(const std::string& key) const noexcept {
    for (const auto& c : checks) {
        if (c.name == key) return c.passed;
    }
    return false;
}

size_t QualityReport::passedCount() const noexcept {
    return static_cast<size_t>(std::count_if(tests.begin(), tests.end(),
                                             [](const QualityTest& t) { return t.passed(); }));
}

// =============================================================================
// Analyzer
// =============================================================================

SoundtrackAnalyzer::SoundtrackAnalyzer(const AudioBuffer& buffer)
    : sampleRate_(buffer.sampleRate()) {
    detail::require(sampleRate_ > 0.0, "analysis needs a positive sample rate");
    detail::require(buffer.size() >= kAnalysisFrameSize,
                    "analysis needs at least " + std::to_string(kAnalysisFrameSize)
                    + " samples, got " + std::to_string(buffer.size()));

    double sumSquares = 0.0;
    for (float s : buffer) {
        peak_ = std::max(peak_, static_cast<double>(std::abs(s)));
        sumSquares += static_cast<double>(s) * static_cast<double>(s);
    }
    rms_ = std::sqrt(sumSquares / static_cast<double>(buffer.size()));

    FFT fft;
    detail::require(fft.prepare(kAnalysisFrameSize), "FFT setup failed");

    const auto window = hannWindow(kAnalysisFrameSize);
    average_.assign(fft.numBins(), 0.0);

    const float* samples = buffer.data();
    for (size_t start = 0; start + kAnalysisFrameSize <= buffer.size(); start += kAnalysisHopSize) {
        std::vector<float> magnitudes(fft.numBins());
        fft.magnitudeSpectrum(samples + start, window.data(), magnitudes.data());
        for (size_t k = 0; k < magnitudes.size(); ++k) {
            average_[k] += magnitudes[k];
        }
        frameSpectra_.push_back(std::move(magnitudes));
    }

    const auto frames = static_cast<double>(frameSpectra_.size());
    for (double& m : average_) {
        m /= frames;
    }

    // Hilbert envelope: interior samples come from the middle half of a
    // frame, away from its circular wrap.
    constexpr size_t kQuarter = kAnalysisFrameSize / 4;
    envelope_.resize(buffer.size());
    std::vector<float> frameEnvelope(kAnalysisFrameSize);
    size_t written = 0;
    size_t start = 0;
    while (written < buffer.size()) {
        const bool last = start + kAnalysisFrameSize >= buffer.size();
        if (last) {
            start = buffer.size() - kAnalysisFrameSize;
        }
        fft.analyticEnvelope(samples + start, frameEnvelope.data());

        const size_t keepEnd = last ? buffer.size() : start + 3 * kQuarter;
        std::copy(frameEnvelope.begin() + static_cast<std::ptrdiff_t>(written - start),
                  frameEnvelope.begin() + static_cast<std::ptrdiff_t>(keepEnd - start),
                  envelope_.begin() + static_cast<std::ptrdiff_t>(written));
        written = keepEnd;
        start = written - kQuarter;
    }
}

double SoundtrackAnalyzer::binFrequency(size_t bin) const noexcept {
    return static_cast<double>(bin) * sampleRate_ / static_cast<double>(kAnalysisFrameSize);
}

double SoundtrackAnalyzer::bandEnergy(double lowHz, double highHz) const noexcept {
    double energy = 0.0;
    for (size_t k = 0; k < average_.size(); ++k) {
        const double f = binFrequency(k);
        if (f >= lowHz && f <= highHz) {
            energy += average_[k];
        }
    }
    return energy;
}

QualityTest SoundtrackAnalyzer::analyzeWarmth() const {
    QualityTest test;
    test.name = "warmth";

    double total = 0.0;
    std::vector<double> energies;
    for (const auto& band : kWarmthBands) {
        energies.push_back(bandEnergy(band.lowHz, band.highHz));
        total += energies.back();
    }

    std::vector<double> percent(energies.size(), 0.0);
    for (size_t i = 0; i < energies.size(); ++i) {
        percent[i] = total > 0.0 ? energies[i] / total * 100.0 : 0.0;
        test.details.emplace_back(kWarmthBands[i].name, percent[i]);
    }

    const double warmBass = percent[1];
    const double warmMid = percent[2];
    const double highMid = percent[4];
    const double high = percent[5];
    test.checks = {
        {"has_warm_bass", warmBass > 25.0},
        {"has_body", warmMid > 15.0},
        {"not_harsh", high < 10.0},
        {"gentle_highs", highMid < 20.0},
        {"warm_ratio", warmBass + warmMid > 45.0},
    };
    return test;
}

QualityTest SoundtrackAnalyzer::analyzeSmoothness() const {
    QualityTest test;
    test.name = "smoothness";

    const size_t n = envelope_.size() - 1;
    double sum = 0.0;
    double sumAbs = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = static_cast<double>(envelope_[i + 1]) - static_cast<double>(envelope_[i]);
        sum += d;
        sumAbs += std::abs(d);
    }
    const double mean = sum / static_cast<double>(n);
    const double meanAbs = sumAbs / static_cast<double>(n);

    double variance = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = static_cast<double>(envelope_[i + 1]) - static_cast<double>(envelope_[i]);
        variance += (d - mean) * (d - mean);
    }
    const double stddev = std::sqrt(variance / static_cast<double>(n));

    const double threshold = kHarshTransientSigmas * stddev;
    size_t harsh = 0;
    for (size_t i = 0; i < n; ++i) {
        const double d = static_cast<double>(envelope_[i + 1]) - static_cast<double>(envelope_[i]);
        if (std::abs(d) > threshold) ++harsh;
    }
    const double harshRatio = static_cast<double>(harsh) / static_cast<double>(n);
    const double smoothness = 1.0 - stddev / (meanAbs + kSmoothnessEpsilon);

    test.details = {{"harsh_transient_ratio", harshRatio}, {"smoothness_score", smoothness}};
    test.checks = {
        {"smooth_envelope", harshRatio < 0.01},
        {"gentle_transitions", smoothness > 0.5},
    };
    return test;
}

QualityTest SoundtrackAnalyzer::analyzeConsonance() const {
    QualityTest test;
    test.name = "consonance";

    double strongest = 0.0;
    for (size_t k = 1; k < average_.size(); ++k) {
        strongest = std::max(strongest, average_[k]);
    }
    const double minHeight = strongest * kPeakHeightFraction;

    std::vector<double> peaks;
    for (size_t k = 2; k + 1 < average_.size(); ++k) {
        const double m = average_[k];
        if (m >= minHeight && m > average_[k - 1] && m >= average_[k + 1]) {
            peaks.push_back(binFrequency(k));
        }
    }

    if (peaks.size() < 2) {
        test.details = {{"peak_count", static_cast<double>(peaks.size())}};
        test.checks = {{"has_harmony", true}};
        return test;
    }

    std::vector<double> musical;
    for (double f : peaks) {
        if (f < kConsonanceHighHz && musical.size() < kConsonancePeakLimit) musical.push_back(f);
    }

    size_t consonant = 0;
    size_t pairs = 0;
    for (size_t i = 0; i < musical.size(); ++i) {
        for (size_t j = i + 1; j < musical.size(); ++j) {
            const double ratio = std::max(musical[i], musical[j]) / std::min(musical[i], musical[j]);
            if (isConsonant(ratio)) ++consonant;
            ++pairs;
        }
    }
    const double ratio = pairs > 0 ? static_cast<double>(consonant) / static_cast<double>(pairs) : 1.0;

    test.details = {{"consonance_ratio", ratio},
                    {"consonant_pairs", static_cast<double>(consonant)},
                    {"total_pairs", static_cast<double>(pairs)}};
    test.checks = {{"mostly_consonant", ratio > 0.3}};
    return test;
}

QualityTest SoundtrackAnalyzer::analyzeDynamics() const {
    QualityTest test;
    test.name = "gentle_dynamics";

    const double crest = rms_ > 0.0 ? peak_ / rms_ : 0.0;
    const double crestDb = crest > 0.0 ? 20.0 * std::log10(crest) : 0.0;

    test.details = {{"crest_factor_db", crestDb}, {"rms_level", rms_}, {"peak_level", peak_}};
    test.checks = {
        {"not_too_flat", crestDb > 3.0},
        {"not_too_punchy", crestDb < 12.0},
        {"good_volume", rms_ > 0.08},
    };
    return test;
}

QualityTest SoundtrackAnalyzer::analyzeMelodicContent() const {
    QualityTest test;
    test.name = "melodic_content";

    std::vector<double> dominant;
    for (const auto& spectrum : frameSpectra_) {
        size_t best = 0;
        float bestMagnitude = 0.0f;
        for (size_t k = 0; k < spectrum.size(); ++k) {
            const double f = binFrequency(k);
            if (f > kMelodicLowHz && f < kMelodicHighHz && spectrum[k] > bestMagnitude) {
                bestMagnitude = spectrum[k];
                best = k;
            }
        }
        if (bestMagnitude > 0.0f) {
            dominant.push_back(binFrequency(best));
        }
    }

    if (dominant.size() < 3) {
        test.details = {{"frames", static_cast<double>(dominant.size())}};
        test.checks = {{"has_melody", false}};
        return test;
    }

    size_t changes = 0;
    for (size_t i = 1; i < dominant.size(); ++i) {
        if (std::abs(dominant[i] - dominant[i - 1]) > kPitchChangeHz) ++changes;
    }
    const double mean = std::accumulate(dominant.begin(), dominant.end(), 0.0)
                      / static_cast<double>(dominant.size());
    double variance = 0.0;
    for (double f : dominant) {
        variance += (f - mean) * (f - mean);
    }
    const double stddev = std::sqrt(variance / static_cast<double>(dominant.size()));

    test.details = {{"pitch_changes", static_cast<double>(changes)}, {"pitch_std", stddev}};
    test.checks = {
        {"has_melody", changes > 3},
        {"not_monotonous", stddev > 50.0},
    };
    return test;
}

QualityTest SoundtrackAnalyzer::analyzeFullness() const {
    QualityTest test;
    test.name = "fullness";

    const double meanBin = std::accumulate(average_.begin(), average_.end(), 0.0)
                         / static_cast<double>(average_.size());

    // A band is active when its mean bin exceeds half the mean bin spread
    // over the two-sided bins one band spans in a track-length transform.
    const double trackBinsPerBand = 2.0 * kFullnessBandWidthHz
                                  * static_cast<double>(envelope_.size()) / sampleRate_;
    const double threshold = 0.5 * meanBin / trackBinsPerBand;

    size_t active = 0;
    for (size_t i = 1; i <= kFullnessBandCount; ++i) {
        const double low = kFullnessBandWidthHz * static_cast<double>(i);
        const double high = low + kFullnessBandWidthHz;
        size_t bins = 0;
        for (size_t k = 0; k < average_.size(); ++k) {
            const double f = binFrequency(k);
            if (f >= low && f <= high) ++bins;
        }
        if (bins > 0 && bandEnergy(low, high) / static_cast<double>(bins) > threshold) ++active;
    }
    const double ratio = static_cast<double>(active) / static_cast<double>(kFullnessBandCount);

    test.details = {{"active_bands", static_cast<double>(active)}, {"fullness_ratio", ratio}};
    test.checks = {
        {"sounds_full", ratio > 0.3},
        {"rich_spectrum", active > 10},
    };
    return test;
}

QualityReport SoundtrackAnalyzer::analyze() const {
    QualityReport report;
    report.tests.push_back(analyzeWarmth());
    report.tests.push_back(analyzeSmoothness());
    report.tests.push_back(analyzeConsonance());
    report.tests.push_back(analyzeDynamics());
    report.tests.push_back(analyzeMelodicContent());
    report.tests.push_back(analyzeFullness());
    return report;
}

} // namespace DSP
} // namespace Hearth
