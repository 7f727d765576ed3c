// ==============================================================================
// Layer 0: Core Utilities
// midi_utils.h - MIDI Note, Velocity and Tempo Conversion Functions
// ==============================================================================
// Scores are written in MIDI terms (note numbers, beats, 0-127 velocities)
// and converted to the Hz / seconds / 0-1 units the synthesis core uses.
//
// Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <hearth/dsp/core/db_utils.h>  // For detail::constexprExp

#include <cstdint>

namespace Hearth {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Standard A4 reference frequency in Hz
inline constexpr float kA4FrequencyHz = 440.0f;

/// MIDI note number for A4
inline constexpr int kA4MidiNote = 69;

/// Minimum valid MIDI velocity
inline constexpr int kMinMidiVelocity = 0;

/// Maximum valid MIDI velocity
inline constexpr int kMaxMidiVelocity = 127;

// ==============================================================================
// Functions
// ==============================================================================

/// Convert MIDI note number to frequency using 12-TET tuning.
///
///   frequency = a4Frequency * 2^((midiNote - 69) / 12)
///
/// @example midiNoteToFrequency(69) -> 440.0 Hz  (A4)
/// @example midiNoteToFrequency(60) -> 261.63 Hz (C4, middle C)
/// @example midiNoteToFrequency(36) -> 65.41 Hz  (C2)
[[nodiscard]] constexpr float midiNoteToFrequency(
    int midiNote,
    float a4Frequency = kA4FrequencyHz
) noexcept {
    constexpr float kLn2Over12 = 0.0577622650f;  // ln(2) / 12
    const float exponent = static_cast<float>(midiNote - kA4MidiNote) * kLn2Over12;
    return a4Frequency * detail::constexprExp(exponent);
}

/// Convert MIDI velocity to linear gain (velocity / 127), clamped to [0, 127].
[[nodiscard]] constexpr float velocityToGain(int velocity) noexcept {
    const int clampedVelocity = (velocity < kMinMidiVelocity) ? kMinMidiVelocity
                              : (velocity > kMaxMidiVelocity) ? kMaxMidiVelocity
                              : velocity;
    return static_cast<float>(clampedVelocity) / static_cast<float>(kMaxMidiVelocity);
}

/// Convert a beat position to seconds at a fixed tempo.
/// @param beats Position or length in quarter-note beats
/// @param tempoBpm Tempo in beats per minute (must be > 0)
[[nodiscard]] constexpr double beatsToSeconds(double beats, double tempoBpm) noexcept {
    return beats * 60.0 / tempoBpm;
}

} // namespace DSP
} // namespace Hearth
