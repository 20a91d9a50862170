// ==============================================================================
// KpatchCodec Lint Stub - Strict clang-tidy analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public codec header. Because it lives in codec/ (not
// codec/tests/), it uses the root .clang-tidy config with strict checks.
//
// This file is NOT part of the KpatchCodec library itself; it is compiled as a
// separate OBJECT library target (codec_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/bounded_value.h>
#include <kpatch/codec/core/byte_io.h>
#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/decode_options.h>
#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>
#include <kpatch/codec/core/note_names.h>
#include <kpatch/codec/core/parse_error.h>
#include <kpatch/codec/core/text_field.h>
#include <kpatch/codec/core/value_category.h>

// Layer 1: K4
#include <kpatch/codec/k4/amplifier.h>
#include <kpatch/codec/k4/bank.h>
#include <kpatch/codec/k4/drum_patch.h>
#include <kpatch/codec/k4/effect_patch.h>
#include <kpatch/codec/k4/filter.h>
#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/lfo.h>
#include <kpatch/codec/k4/modulation.h>
#include <kpatch/codec/k4/multi_patch.h>
#include <kpatch/codec/k4/single_patch.h>
#include <kpatch/codec/k4/source.h>
#include <kpatch/codec/k4/sysex_header.h>
#include <kpatch/codec/k4/wave.h>

// Layer 1: K5000
#include <kpatch/codec/k5000/additive_kit.h>
#include <kpatch/codec/k5000/amplifier.h>
#include <kpatch/codec/k5000/block_dump.h>
#include <kpatch/codec/k5000/control.h>
#include <kpatch/codec/k5000/dump.h>
#include <kpatch/codec/k5000/effect_settings.h>
#include <kpatch/codec/k5000/filter.h>
#include <kpatch/codec/k5000/k5000_types.h>
#include <kpatch/codec/k5000/lfo.h>
#include <kpatch/codec/k5000/multi_patch.h>
#include <kpatch/codec/k5000/oscillator.h>
#include <kpatch/codec/k5000/single_patch.h>
#include <kpatch/codec/k5000/source.h>
#include <kpatch/codec/k5000/sysex_header.h>
#include <kpatch/codec/k5000/tone_map.h>
