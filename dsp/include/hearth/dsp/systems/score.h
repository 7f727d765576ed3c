// ==============================================================================
// Layer 3: System Component - MIDI Score
// ==============================================================================
// Note lists written in MIDI terms (note number, beats, 0-127 velocity) and
// their conversion to SoundEvents at a fixed tempo.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/midi_utils.h>
#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/systems/sound_event.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Hearth {
namespace DSP {

/// @brief One note of a score track.
struct ScoreNote {
    int midiNote = 60;
    double startBeat = 0.0;
    double durationBeats = 1.0;
    int velocity = 100;  ///< [0, 127]
};

/// Convert `notes` to events on timbre `timbre` with envelope `envelope`.
///   frequency = midiNoteToFrequency(note)
///   seconds   = beats * 60 / tempo
///   velocity  = velocity / 127
/// @throws ConfigurationError on a non-positive tempo or malformed note
[[nodiscard]] inline std::vector<SoundEvent> scoreToEvents(const std::vector<ScoreNote>& notes,
                                                           double tempoBpm, size_t timbre,
                                                           const EnvelopeSpec& envelope) {
    detail::require(tempoBpm > 0.0 && std::isfinite(tempoBpm),
                    "score tempo must be positive, got " + std::to_string(tempoBpm));

    std::vector<SoundEvent> events;
    events.reserve(notes.size());
    for (const auto& note : notes) {
        detail::require(note.midiNote >= 0 && note.midiNote <= 127,
                        "MIDI note " + std::to_string(note.midiNote) + " outside [0, 127]");
        detail::require(note.startBeat >= 0.0 && note.durationBeats > 0.0,
                        "score note needs a non-negative start and positive length");
        detail::require(note.velocity >= kMinMidiVelocity && note.velocity <= kMaxMidiVelocity,
                        "MIDI velocity " + std::to_string(note.velocity) + " outside [0, 127]");

        SoundEvent event;
        event.startSeconds = beatsToSeconds(note.startBeat, tempoBpm);
        event.durationSeconds = beatsToSeconds(note.durationBeats, tempoBpm);
        event.frequencies = {static_cast<double>(midiNoteToFrequency(note.midiNote))};
        event.velocity = velocityToGain(note.velocity);
        event.timbre = timbre;
        event.envelope = envelope;
        events.push_back(std::move(event));
    }
    return events;
}

} // namespace DSP
} // namespace Hearth
