// ==============================================================================
// Layer 3: System - Soundtrack Presets
// ==============================================================================

#include <hearth/dsp/systems/soundtrack_presets.h>

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/random.h>
#include <hearth/dsp/primitives/biquad.h>
#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/primitives/oscillator_bank.h>
#include <hearth/dsp/processors/dynamics_processor.h>
#include <hearth/dsp/systems/layer_composer.h>

#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

namespace {

// Pitches used by the synthesized arrangements (Hz)
constexpr double kC2 = 65.41;
constexpr double kG2 = 98.00;
constexpr double kC3 = 130.81;
constexpr double kE3 = 164.81;
constexpr double kG3 = 196.00;
constexpr double kC4 = 261.63;
constexpr double kC5 = 523.25;
constexpr double kD5 = 587.33;
constexpr double kE5 = 659.25;
constexpr double kG5 = 783.99;
constexpr double kA5 = 880.00;

/// Mud filter on every layer above the bass foundation
constexpr double kLayerHighpassHz = 200.0;
constexpr int kLayerHighpassOrder = 6;

constexpr double kScoreTempoBpm = 66.0;

SoundEvent toneEvent(double start, double duration, std::vector<double> frequencies,
                     float velocity, size_t timbre, const EnvelopeSpec& envelope) {
    SoundEvent event;
    event.startSeconds = start;
    event.durationSeconds = duration;
    event.frequencies = std::move(frequencies);
    event.velocity = velocity;
    event.timbre = timbre;
    event.envelope = envelope;
    return event;
}

SoundEvent sampleEvent(double start, double duration, float velocity, size_t timbre,
                       const AdsrParams& adsr) {
    SoundEvent event;
    event.startSeconds = start;
    event.durationSeconds = duration;
    event.velocity = velocity;
    event.timbre = timbre;
    event.envelope = EnvelopeSpec::adsrShape(adsr);
    return event;
}

ToneSpec chimeTone() {
    ToneSpec tone;
    tone.harmonics = {{1.0, 1.0}, {2.0, 0.5}, {3.0, 0.2}, {4.0, 0.1}};
    return tone;
}

ToneSpec softTone() {
    ToneSpec tone;
    tone.harmonics = {{1.0, 1.0}, {2.0, 0.3}, {3.0, 0.1}};
    return tone;
}

/// ADSR whose decay/sustain are a plain hold at 1 (attack and release only)
AdsrParams attackRelease(double attack, double release, double exponent) {
    AdsrParams p;
    p.attackSeconds = attack;
    p.decaySeconds = 0.0;
    p.sustainLevel = 1.0;
    p.releaseSeconds = release;
    p.curveExponent = exponent;
    p.releaseExponent = exponent;
    return p;
}

AdsrParams pianoAdsr(double attack, double decay, double sustain, double release) {
    AdsrParams p;
    p.attackSeconds = attack;
    p.decaySeconds = decay;
    p.sustainLevel = sustain;
    p.releaseSeconds = release;
    p.curveExponent = 1.0;
    p.releaseExponent = 2.0;
    return p;
}

LayerMix highpassedLayer(float weight) {
    LayerMix mix;
    mix.weight = weight;
    mix.preFilters = {FilterSpec::highpass(kLayerHighpassHz, kLayerHighpassOrder)};
    return mix;
}

} // namespace

// =============================================================================
// Names
// =============================================================================

const char* presetName(Preset preset) noexcept {
    switch (preset) {
        case Preset::Layered:      return "layered";
        case Preset::SampledPiano: return "sampled-piano";
        case Preset::WarmPad:      return "warm-pad";
    }
    return "unknown";
}

Preset parsePreset(const std::string& name) {
    for (Preset p : {Preset::Layered, Preset::SampledPiano, Preset::WarmPad}) {
        if (name == presetName(p)) return p;
    }
    throw ConfigurationError("unknown preset '" + name
                             + "' (expected layered, sampled-piano or warm-pad)");
}

std::vector<std::string> pianoSampleNames() {
    return {"G4", "A4", "B4", "C5", "C3", "E3", "E4", "D4"};
}

// =============================================================================
// Layered
// =============================================================================

LayerSpec makeBassLayer(double durationSeconds) {
    LayerSpec layer;
    layer.name = "bass";

    ToneSpec foundation;
    foundation.harmonics = {{1.0, 0.4}, {2.0, 0.25}, {3.0, 0.1}};
    ToneSpec body;
    body.harmonics = {{1.0, 0.15}};

    const size_t foundationTimbre = layer.addTimbre(Timbre::makeTone(foundation));
    const size_t bodyTimbre = layer.addTimbre(Timbre::makeTone(body));

    layer.events.push_back(toneEvent(0.0, durationSeconds, {kC2, kG2}, 1.0f, foundationTimbre,
                                     EnvelopeSpec::flat()));
    layer.events.push_back(toneEvent(0.0, durationSeconds, {kC3, kG3, kC4}, 1.0f, bodyTimbre,
                                     EnvelopeSpec::flat()));

    layer.swell = AmplitudeModulation{0.85, 0.15, 0.05};
    layer.linearFadeInSeconds = 2.0;
    layer.normalizePeak = 0.75f;
    return layer;
}

LayerSpec makeMelodyLayer() {
    LayerSpec layer;
    layer.name = "melody";
    const size_t timbre = layer.addTimbre(Timbre::makeTone(softTone()));

    const auto envelope = EnvelopeSpec::adsrShape(attackRelease(0.1, 0.5, 1.0));
    constexpr float kNoteLevel = 0.12f;

    struct Note { double start; double frequency; double duration; };
    const Note notes[] = {
        {0.5, kC5, 1.5},
        {2.5, kD5, 1.5},
        {5.0, kE5, 1.5},
        {7.5, kG5, 1.5},
        {10.0, kC5, 1.8},
    };
    for (const auto& n : notes) {
        layer.events.push_back(toneEvent(n.start, n.duration, {n.frequency}, kNoteLevel, timbre, envelope));
    }

    layer.normalizePeak = 0.7f;
    return layer;
}

LayerSpec makeAtmosphereLayer(double durationSeconds, uint32_t seed) {
    LayerSpec layer;
    layer.name = "atmosphere";

    // Wind: warm whoosh with a slow intensity swell
    NoiseSpec wind;
    wind.filters = {FilterSpec::lowpass(800.0, 4), FilterSpec::highpass(100.0, 2)};
    wind.modulation = AmplitudeModulation{0.3, 0.2, 0.15};
    const size_t windTimbre = layer.addTimbre(Timbre::makeNoise(wind));

    SoundEvent windEvent;
    windEvent.durationSeconds = durationSeconds;
    windEvent.velocity = 0.08f;
    windEvent.timbre = windTimbre;
    windEvent.seed = deriveSeed(seed, 0);
    layer.events.push_back(windEvent);

    // Leaves: crinkly high-passed bursts on a rising-then-falling arch
    NoiseSpec rustle;
    rustle.filters = {FilterSpec::highpass(2000.0, 3)};
    SoundEvent rustleTemplate;
    rustleTemplate.durationSeconds = 0.8;
    rustleTemplate.velocity = 0.03f;
    rustleTemplate.timbre = layer.addTimbre(Timbre::makeNoise(rustle));
    rustleTemplate.envelope = EnvelopeSpec::arch(4.0);
    for (auto& e : scatterEvents(8, 1.5, 1.0, deriveSeed(seed, 1), rustleTemplate)) {
        layer.events.push_back(std::move(e));
    }

    // Room hum: 120 Hz + 180 Hz with a very slow swell
    ToneSpec hum;
    hum.harmonics = {{1.0, 0.05}, {1.5, 0.03}};
    Timbre humTimbre = Timbre::makeTone(hum);
    humTimbre.swell = AmplitudeModulation{1.0, 0.3, 0.05};
    const size_t humIndex = layer.addTimbre(std::move(humTimbre));
    layer.events.push_back(toneEvent(0.0, durationSeconds, {120.0}, 1.0f, humIndex,
                                     EnvelopeSpec::flat()));

    // Fire: short band-passed crackles anywhere in the track
    NoiseSpec crackle;
    crackle.filters = {FilterSpec::bandpass(500.0, 3000.0, 3)};
    SoundEvent crackleTemplate;
    crackleTemplate.durationSeconds = 0.15;
    crackleTemplate.velocity = 0.04f;
    crackleTemplate.timbre = layer.addTimbre(Timbre::makeNoise(crackle));
    crackleTemplate.envelope = EnvelopeSpec::expDecay(30.0);
    for (auto& e : scatterEvents(15, 0.0, durationSeconds, deriveSeed(seed, 2), crackleTemplate)) {
        layer.events.push_back(std::move(e));
    }

    layer.normalizePeak = 0.8f;
    return layer;
}

LayerSpec makeEffectsLayer() {
    LayerSpec layer;
    layer.name = "effects";
    const size_t timbre = layer.addTimbre(Timbre::makeTone(chimeTone()));
    const auto envelope = EnvelopeSpec::chime(8.0, 1.2);

    struct Chime { double start; double frequency; double duration; };
    const Chime chimes[] = {
        {1.5, kC5, 1.2},
        {3.5, kE5, 1.0},
        {6.0, kG5, 1.2},
        {8.5, kA5, 1.0},
        {10.5, kC5, 1.5},
    };
    for (const auto& c : chimes) {
        layer.events.push_back(toneEvent(c.start, c.duration, {c.frequency}, 0.06f, timbre, envelope));
    }

    // Grandfather-clock dings with a half-level sub-octave
    const Chime dings[] = {
        {0.2, kC4, 2.0},
        {5.5, kG3, 2.0},
        {11.0, kC4, 2.0},
    };
    constexpr float kDingLevel = 0.05f;
    for (const auto& d : dings) {
        layer.events.push_back(toneEvent(d.start, d.duration, {d.frequency}, kDingLevel, timbre, envelope));
        layer.events.push_back(toneEvent(d.start, d.duration, {d.frequency * 0.5}, kDingLevel * 0.5f,
                                         timbre, envelope));
    }

    layer.normalizePeak = 0.6f;
    return layer;
}

SoundtrackPlan makeLayeredPlan(const RenderConfig& config) {
    SoundtrackPlan plan;
    plan.sampleRate = config.sampleRate;
    plan.durationSeconds = config.durationSeconds;

    plan.layers.push_back(makeBassLayer(config.durationSeconds));
    plan.layers.push_back(makeMelodyLayer());
    plan.layers.push_back(makeAtmosphereLayer(config.durationSeconds, config.baseSeed));
    plan.layers.push_back(makeEffectsLayer());

    LayerMix bass;
    bass.weight = 0.70f;
    plan.mix.add("bass", bass)
        .add("melody", highpassedLayer(0.25f))
        .add("atmosphere", highpassedLayer(0.20f))
        .add("effects", highpassedLayer(0.15f));

    plan.master.shaping = {FilterSpec::lowpass(5000.0, 2)};
    plan.master.compression = {CompressorStage{0.3f, 2.5f}};
    plan.master.saturationDrive = 2.0f;
    plan.master.fadeInSeconds = 2.0;
    plan.master.fadeOutSeconds = 2.0;
    plan.master.targetPeak = config.targetPeak;
    return plan;
}

// =============================================================================
// Sampled Piano
// =============================================================================

LayerSpec makeEnsemblePadLayer(double durationSeconds) {
    LayerSpec layer;
    layer.name = "pad";

    ToneSpec tone;
    tone.harmonics = {{1.0, 1.0}, {2.0, 0.4}, {3.0, 0.15}};
    tone.detuneCents = fractionToCents(0.004);
    tone.vibrato = VibratoSpec{4.5, 0.003};
    const size_t timbre = layer.addTimbre(Timbre::makeTone(tone));

    // 0.12 overall, shared across the three chord tones
    constexpr float kPadLevel = 0.12f / 3.0f;
    layer.events.push_back(toneEvent(0.0, durationSeconds, {kC3, kE3, kG3}, kPadLevel, timbre,
                                     EnvelopeSpec::adsrShape(attackRelease(2.0, 2.5, 2.0))));
    return layer;
}

std::vector<LayerSpec> makePianoLayers(const SampleBank& samples) {
    struct Note { double start; const char* name; double duration; float velocity; };

    const auto build = [&samples](const char* layerName, std::initializer_list<Note> notes,
                                  const AdsrParams& adsr) {
        LayerSpec layer;
        layer.name = layerName;
        for (const auto& n : notes) {
            if (!samples.contains(n.name)) continue;
            size_t timbre = layer.timbres.size();
            for (size_t i = 0; i < layer.timbres.size(); ++i) {
                if (layer.timbres[i].sampleName == n.name) timbre = i;
            }
            if (timbre == layer.timbres.size()) {
                timbre = layer.addTimbre(Timbre::makeSample(n.name));
            }
            layer.events.push_back(sampleEvent(n.start, n.duration, n.velocity, timbre, adsr));
        }
        return layer;
    };

    // "Coming home" melody: G A C B A G
    std::vector<LayerSpec> layers;
    const auto keep = [&layers](LayerSpec layer) {
        if (!layer.events.empty()) layers.push_back(std::move(layer));
    };
    keep(build("piano",
                           {{0.5, "G4", 2.0, 0.85f},
                            {3.0, "A4", 1.8, 0.8f},
                            {5.0, "C5", 2.5, 0.95f},
                            {7.5, "B4", 1.5, 0.75f},
                            {9.2, "A4", 1.3, 0.7f},
                            {10.8, "G4", 1.2, 0.8f}},
                           pianoAdsr(0.01, 0.3, 0.6, 0.8)));
    keep(build("piano-bass",
                           {{0.0, "C3", 4.0, 0.4f},
                            {4.0, "E3", 3.5, 0.35f},
                            {8.0, "C3", 4.0, 0.4f}},
                           pianoAdsr(0.02, 0.5, 0.5, 1.5)));
    keep(build("sparkle",
                           {{2.0, "E4", 1.5, 0.25f},
                            {6.5, "D4", 1.5, 0.25f}},
                           pianoAdsr(0.05, 0.3, 0.4, 0.6)));
    return layers;
}

SoundtrackPlan makeSampledPianoPlan(const RenderConfig& config, SampleBank samples) {
    detail::require(!samples.empty(), "sampled-piano preset needs a sample bank");

    SoundtrackPlan plan;
    plan.sampleRate = config.sampleRate;
    plan.durationSeconds = config.durationSeconds;
    plan.samples = std::move(samples);

    plan.layers.push_back(makeEnsemblePadLayer(config.durationSeconds));
    for (auto& layer : makePianoLayers(plan.samples)) {
        plan.layers.push_back(std::move(layer));
    }
    for (const auto& layer : plan.layers) {
        plan.mix.add(layer.name, LayerMix{});
    }

    plan.master.shaping = {FilterSpec::lowpass(5000.0, 2)};
    plan.master.compression = {CompressorStage{0.3f, 3.0f}};
    plan.master.saturationDrive = 2.0f;
    plan.master.fadeInSeconds = 2.0;
    plan.master.fadeOutSeconds = 2.5;
    plan.master.targetPeak = config.targetPeak;
    return plan;
}

// =============================================================================
// Warm Pad
// =============================================================================

LayerSpec makeSynthPadLayer(double durationSeconds) {
    LayerSpec layer;
    layer.name = "pad";

    ToneSpec tone;
    tone.harmonics = {{1.0, 1.0}, {2.0, 0.3}};
    const size_t timbre = layer.addTimbre(Timbre::makeTone(tone));
    const auto envelope = EnvelopeSpec::adsrShape(attackRelease(2.0, 2.0, 2.0));

    const double freqs[] = {kC2, kG2, kC3, kE3, kG3};
    for (size_t i = 0; i < std::size(freqs); ++i) {
        const auto level = static_cast<float>(0.15 / static_cast<double>(i + 1));
        layer.events.push_back(toneEvent(0.0, durationSeconds, {freqs[i]}, level, timbre, envelope));
    }

    layer.swell = AmplitudeModulation{0.7, 0.3, 0.04};
    layer.normalizePeak = 0.6f;
    return layer;
}

LayerSpec makeScoreLayer(const std::string& layerName) {
    LayerSpec layer;
    layer.name = layerName;

    ToneSpec strings;
    strings.harmonics = {{1.0, 1.0}, {2.0, 0.4}, {3.0, 0.15}};
    strings.detuneCents = 8.0;
    ToneSpec bass;
    bass.harmonics = {{1.0, 1.0}, {2.0, 0.25}, {3.0, 0.1}};

    const size_t stringsTimbre = layer.addTimbre(Timbre::makeTone(strings));
    const size_t pianoTimbre = layer.addTimbre(Timbre::makeTone(softTone()));
    const size_t bassTimbre = layer.addTimbre(Timbre::makeTone(bass));
    const size_t bellTimbre = layer.addTimbre(Timbre::makeTone(chimeTone()));

    AdsrParams stringsAdsr;
    stringsAdsr.attackSeconds = 0.8;
    stringsAdsr.decaySeconds = 0.5;
    stringsAdsr.sustainLevel = 0.8;
    stringsAdsr.releaseSeconds = 1.5;

    const auto append = [&layer](std::vector<SoundEvent> events) {
        for (auto& e : events) {
            layer.events.push_back(std::move(e));
        }
    };

    // C major add9 pad, held
    append(scoreToEvents({{48, 0.0, 14.0, 50},
                          {52, 0.1, 14.0, 45},
                          {55, 0.2, 14.0, 45},
                          {62, 0.3, 14.0, 40},
                          {60, 0.4, 14.0, 42}},
                         kScoreTempoBpm, stringsTimbre, EnvelopeSpec::adsrShape(stringsAdsr)));
    // Legato folk melody
    append(scoreToEvents({{67, 0.5, 2.5, 65},
                          {69, 2.5, 2.0, 60},
                          {72, 4.0, 3.0, 70},
                          {71, 6.5, 2.0, 55},
                          {69, 8.0, 2.0, 50},
                          {67, 9.5, 3.5, 60}},
                         kScoreTempoBpm, pianoTimbre,
                         EnvelopeSpec::adsrShape(pianoAdsr(0.01, 0.3, 0.6, 0.8))));
    append(scoreToEvents({{36, 0.0, 5.0, 55},
                          {36, 5.0, 4.0, 50},
                          {43, 9.0, 4.0, 55}},
                         kScoreTempoBpm, bassTimbre,
                         EnvelopeSpec::adsrShape(pianoAdsr(0.02, 0.5, 0.5, 1.5))));
    append(scoreToEvents({{72, 2.0, 2.0, 35},
                          {79, 7.0, 2.0, 30}},
                         kScoreTempoBpm, bellTimbre, EnvelopeSpec::chime(8.0, 1.2)));

    layer.normalizePeak = 0.8f;
    return layer;
}

SoundtrackPlan makeWarmPadPlan(const RenderConfig& config, std::optional<AudioBuffer> externalRender) {
    SoundtrackPlan plan;
    plan.sampleRate = config.sampleRate;
    plan.durationSeconds = config.durationSeconds;

    plan.layers.push_back(makeSynthPadLayer(config.durationSeconds));
    if (externalRender) {
        plan.externalRender = std::move(externalRender);
    } else {
        plan.layers.push_back(makeScoreLayer(kExternalLayerName));
    }

    LayerMix pad;
    pad.preFilters = {FilterSpec::lowpass(500.0, 2)};
    pad.fadeInSeconds = 3.0;
    pad.fadeExponent = 1.0;
    pad.gainDb = 4.0f;

    LayerMix external;
    external.preFilters = {FilterSpec::lowpass(3000.0, 2), FilterSpec::highpass(60.0, 2)};
    external.preCompression = CompressorStage::fromDb(-25.0f, 5.0f);
    external.fadeInSeconds = 2.0;
    external.fadeExponent = 1.0;
    external.gainDb = -3.0f;

    plan.mix.add("pad", pad).add(kExternalLayerName, external);

    plan.master.compression = {CompressorStage::fromDb(-18.0f, 4.0f),
                               CompressorStage::fromDb(-12.0f, 2.0f)};
    plan.master.fadeInSeconds = 2.5;
    plan.master.fadeOutSeconds = 2.5;
    plan.master.targetPeak = config.targetPeak;
    return plan;
}

// =============================================================================
// Dispatch
// =============================================================================

SoundtrackPlan makePlan(const RenderConfig& config, SampleBank samples,
                        std::optional<AudioBuffer> externalRender) {
    switch (config.preset) {
        case Preset::Layered:
            return makeLayeredPlan(config);
        case Preset::SampledPiano:
            if (samples.empty()) {
                return makeLayeredPlan(config);
            }
            return makeSampledPianoPlan(config, std::move(samples));
        case Preset::WarmPad:
            return makeWarmPadPlan(config, std::move(externalRender));
    }
    return makeLayeredPlan(config);
}

} // namespace DSP
} // namespace Hearth
