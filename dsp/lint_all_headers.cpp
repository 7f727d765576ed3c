// ==============================================================================
// HearthDSP Lint Stub - Compiles every public header in one translation unit
// ==============================================================================
// Gives clang-tidy and compile_commands.json a .cpp translation unit that
// includes every public DSP header, so a header that is not self-contained
// fails the build here rather than in whichever file happens to include it
// first.
//
// This file is NOT part of the HearthDSP library itself; it is compiled as a
// separate OBJECT library target (hearth_lint_stub).
// ==============================================================================

// Layer 0: Core
#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/config_error.h>
#include <hearth/dsp/core/db_utils.h>
#include <hearth/dsp/core/filter_design.h>
#include <hearth/dsp/core/math_constants.h>
#include <hearth/dsp/core/midi_utils.h>
#include <hearth/dsp/core/pcm_utils.h>
#include <hearth/dsp/core/random.h>

// Layer 1: Primitives
#include <hearth/dsp/primitives/biquad.h>
#include <hearth/dsp/primitives/envelope_shapes.h>
#include <hearth/dsp/primitives/fft.h>
#include <hearth/dsp/primitives/noise_texture.h>
#include <hearth/dsp/primitives/oscillator_bank.h>
#include <hearth/dsp/primitives/zero_phase_filter.h>

// Layer 2: Processors
#include <hearth/dsp/processors/dynamics_processor.h>
#include <hearth/dsp/processors/peak_normalizer.h>
#include <hearth/dsp/processors/sample_voice.h>
#include <hearth/dsp/processors/spectral_shaper.h>

// Layer 3: Systems
#include <hearth/dsp/systems/layer_composer.h>
#include <hearth/dsp/systems/mixer.h>
#include <hearth/dsp/systems/score.h>
#include <hearth/dsp/systems/sound_event.h>
#include <hearth/dsp/systems/soundtrack_analyzer.h>
#include <hearth/dsp/systems/soundtrack_presets.h>
#include <hearth/dsp/systems/soundtrack_renderer.h>
