// ==============================================================================
// Hearth Soundtrack Renderer
// ==============================================================================
// Renders one of the built-in presets to a 16-bit mono WAV file and
// optionally prints the listening-quality report for the result.
//
// Usage:
//   hearth_render [--preset layered|sampled-piano|warm-pad] [--duration s]
//                 [--sample-rate hz] [--seed n] [--target-peak x]
//                 [--samples-dir dir] [--midi-render file.wav]
//                 [--output file.wav] [--analyze]
// ==============================================================================

#include "wav_io.h"

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/pcm_utils.h>
#include <hearth/dsp/processors/sample_voice.h>
#include <hearth/dsp/systems/soundtrack_analyzer.h>
#include <hearth/dsp/systems/soundtrack_presets.h>
#include <hearth/dsp/systems/soundtrack_renderer.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Hearth::DSP;

namespace {

struct CommandLine {
    RenderConfig config;
    std::filesystem::path samplesDir;
    std::filesystem::path midiRender;
    bool showHelp = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --preset NAME        layered (default), sampled-piano, warm-pad\n"
              << "  --duration SECONDS   track length (default " << kDefaultDurationSeconds << ")\n"
              << "  --sample-rate HZ     output rate (default " << kDefaultSampleRate << ")\n"
              << "  --seed N             base seed for noise textures (default " << kDefaultBaseSeed << ")\n"
              << "  --target-peak X      master peak in (0, 1) (default " << kDefaultTargetPeak << ")\n"
              << "  --samples-dir DIR    piano samples as DIR/<Note>.wav\n"
              << "  --midi-render FILE   pre-rendered score mixed by warm-pad\n"
              << "  --output FILE        output WAV (default soundtrack.wav)\n"
              << "  --analyze            print the quality report\n";
}

CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cmd.showHelp = true;
        } else if (arg == "--preset") {
            cmd.config.preset = parsePreset(value());
        } else if (arg == "--duration") {
            cmd.config.durationSeconds = std::stod(value());
        } else if (arg == "--sample-rate") {
            cmd.config.sampleRate = std::stod(value());
        } else if (arg == "--seed") {
            cmd.config.baseSeed = static_cast<uint32_t>(std::stoul(value()));
        } else if (arg == "--target-peak") {
            cmd.config.targetPeak = std::stof(value());
        } else if (arg == "--samples-dir") {
            cmd.samplesDir = value();
        } else if (arg == "--midi-render") {
            cmd.midiRender = value();
        } else if (arg == "--output" || arg == "-o") {
            cmd.config.outputPath = value();
        } else if (arg == "--analyze") {
            cmd.config.analyze = true;
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return cmd;
}

// Missing notes are skipped; the preset falls back when nothing loads
SampleBank loadPianoSamples(const std::filesystem::path& dir, double sampleRate) {
    SampleBank bank;
    if (dir.empty()) return bank;

    for (const auto& note : pianoSampleNames()) {
        const auto path = dir / (note + ".wav");
        if (!std::filesystem::exists(path)) {
            std::cerr << "  Missing sample: " << path.string() << std::endl;
            continue;
        }
        AudioBuffer sample = HearthTools::readWav16(path);
        if (sample.sampleRate() != sampleRate) {
            std::cerr << "  Skipping " << path.string() << ": sample rate "
                      << sample.sampleRate() << " Hz, expected " << sampleRate << " Hz" << std::endl;
            continue;
        }
        std::cout << "  Loaded: " << note << " (" << sample.size() << " samples)" << std::endl;
        bank.add(note, std::move(sample));
    }
    return bank;
}

void printReport(const QualityReport& report) {
    std::cout << "\nQuality report" << std::endl;
    for (const auto& test : report.tests) {
        std::cout << "  " << (test.passed() ? "[PASS] " : "[FAIL] ") << test.name << std::endl;
        for (const auto& [key, value] : test.details) {
            std::cout << "      " << key << " = " << std::fixed << std::setprecision(3) << value
                      << std::endl;
        }
        for (const auto& check : test.checks) {
            std::cout << "      " << (check.passed ? "ok   " : "miss ") << check.name << std::endl;
        }
    }
    std::cout << "  " << report.passedCount() << "/" << report.tests.size() << " tests passed"
              << std::endl;
}

int run(const CommandLine& cmd) {
    const RenderConfig& config = cmd.config;

    std::cout << "Rendering preset '" << presetName(config.preset) << "' ("
              << config.durationSeconds << " s at " << config.sampleRate << " Hz)..." << std::endl;

    SampleBank samples;
    if (config.preset == Preset::SampledPiano) {
        samples = loadPianoSamples(cmd.samplesDir, config.sampleRate);
        if (samples.empty()) {
            std::cout << "  No piano samples loaded, using the layered arrangement" << std::endl;
        }
    }

    std::optional<AudioBuffer> external;
    if (config.preset == Preset::WarmPad && !cmd.midiRender.empty()) {
        external = HearthTools::readWav16(cmd.midiRender);
        std::cout << "  Loaded external render: " << cmd.midiRender.string() << std::endl;
    }

    SoundtrackRenderer renderer(makePlan(config, std::move(samples), std::move(external)));
    const AudioBuffer track = renderer.render();
    const std::vector<int16_t> pcm = toPcm16(track);

    const std::filesystem::path outputPath = config.outputPath;
    if (outputPath.has_parent_path()) {
        std::filesystem::create_directories(outputPath.parent_path());
    }
    HearthTools::writeWav16(outputPath, pcm, static_cast<uint32_t>(config.sampleRate));
    std::cout << "  Created: " << outputPath.string() << " (peak " << track.peak() << ")" << std::endl;

    if (config.analyze) {
        printReport(SoundtrackAnalyzer(track).analyze());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CommandLine cmd = parseArguments(argc, argv);
        if (cmd.showHelp) {
            printUsage(argv[0]);
            return 0;
        }
        return run(cmd);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
