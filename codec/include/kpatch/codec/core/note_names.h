// ==============================================================================
// Layer 0: Core
// note_names.h - MIDI note number to display name
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bounded_value.h>

#include <array>
#include <string>
#include <string_view>

namespace Kpatch {
namespace Codec {

using MidiNote = BoundedValue<Category::MidiNote>;

inline constexpr std::array<std::string_view, 12> kNoteLetters = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

/// Note name with octave, 0 = "C-1", 60 = "C4", 127 = "G9".
/// Out-of-range numbers yield an empty string.
[[nodiscard]] inline std::string noteName(int note) {
    if (note < 0 || note > 127) {
        return {};
    }
    const int octave = note / 12 - 1;
    return std::string(kNoteLetters[static_cast<std::size_t>(note % 12)]) + std::to_string(octave);
}

[[nodiscard]] inline std::string noteName(MidiNote note) {
    return noteName(note.value());
}

/// Keyboard zone rendered as "C-1 ~ G9".
[[nodiscard]] inline std::string zoneName(MidiNote low, MidiNote high) {
    return noteName(low) + " ~ " + noteName(high);
}

} // namespace Codec
} // namespace Kpatch
