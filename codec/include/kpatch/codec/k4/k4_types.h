// ==============================================================================
// Layer 1: K4
// k4_types.h - Parameter value types and shared enums of the K4/K4r dialect
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bounded_value.h>
#include <kpatch/codec/core/byte_io.h>
#include <kpatch/codec/core/decode_options.h>
#include <kpatch/codec/core/parse_error.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Kpatch {
namespace K4 {

using Codec::ByteBuffer;
using Codec::ByteReader;
using Codec::ByteView;
using Codec::ByteWriter;
using Codec::Category;
using Codec::DecodeOptions;
using Codec::ParseError;
using Codec::ParseResult;

// ==============================================================================
// Value Types
// ==============================================================================

using Level = Codec::BoundedValue<Category::K4Level>;                   ///< 0..100
using Depth = Codec::BoundedValue<Category::K4Depth>;                   ///< -50..+50
using EffectNumber = Codec::BoundedValue<Category::K4EffectNumber>;     ///< 1..32
using PatchNumber = Codec::BoundedValue<Category::K4PatchNumber>;       ///< 0..63
using WaveNumber = Codec::BoundedValue<Category::K4WaveNumber>;         ///< 1..256
using Curve = Codec::BoundedValue<Category::K4Curve>;                   ///< 1..8
using Coarse = Codec::BoundedValue<Category::K4Coarse>;                 ///< -24..+24
using Resonance = Codec::BoundedValue<Category::K4Resonance>;           ///< 0..7
using BenderRange = Codec::BoundedValue<Category::K4BenderRange>;       ///< 0..12
using Transpose = Codec::BoundedValue<Category::K4Transpose>;           ///< -24..+24
using SmallEffectParameter = Codec::BoundedValue<Category::K4EffectSmall>;  ///< -7..+7
using BigEffectParameter = Codec::BoundedValue<Category::K4EffectBig>;      ///< 0..31
using Pan = Codec::BoundedValue<Category::K4Pan>;                       ///< -7..+7
using MidiChannel = Codec::BoundedValue<Category::MidiChannel>;         ///< 1..16
using MidiNote = Codec::BoundedValue<Category::MidiNote>;               ///< 0..127

// ==============================================================================
// Constants
// ==============================================================================

inline constexpr std::size_t kNameLength = 10;
inline constexpr std::size_t kSourceCount = 4;
inline constexpr std::size_t kFilterCount = 2;
inline constexpr std::size_t kSubmixCount = 8;
inline constexpr std::size_t kMultiSectionCount = 8;
inline constexpr std::size_t kDrumNoteCount = 61;

// ==============================================================================
// Submix
// ==============================================================================

/// Output select (submix channel).
enum class Submix : uint8_t {
    A = 0, B, C, D, E, F, G, H
};

inline constexpr uint8_t kSubmixValueCount = 8;

[[nodiscard]] constexpr std::string_view submixName(Submix submix) noexcept {
    constexpr std::array<std::string_view, kSubmixValueCount> kNames = {
        "A", "B", "C", "D", "E", "F", "G", "H"
    };
    const auto index = static_cast<std::size_t>(submix);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

} // namespace K4
} // namespace Kpatch
