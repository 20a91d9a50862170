// ==============================================================================
// Layer 1: K5000
// k5000_types.h - Parameter value types and shared enums of the K5000 dialect
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bounded_value.h>
#include <kpatch/codec/core/byte_io.h>
#include <kpatch/codec/core/decode_options.h>
#include <kpatch/codec/core/parse_error.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Kpatch {
namespace K5000 {

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

using Volume = Codec::BoundedValue<Category::Volume>;                         ///< 0..127
using BenderPitch = Codec::BoundedValue<Category::BenderPitch>;               ///< 0..24
using BenderCutoff = Codec::BoundedValue<Category::BenderCutoff>;             ///< 0..31
using EnvelopeTime = Codec::BoundedValue<Category::EnvelopeTime>;             ///< 0..127
using EnvelopeLevel = Codec::BoundedValue<Category::EnvelopeLevel>;           ///< -63..+63
using EnvelopeRate = Codec::BoundedValue<Category::EnvelopeRate>;             ///< 0..127
using HarmonicEnvelopeLevel = Codec::BoundedValue<Category::HarmonicEnvelopeLevel>;  ///< 0..63
using Bias = Codec::BoundedValue<Category::Bias>;                             ///< -63..+63
using ControlTime = Codec::BoundedValue<Category::ControlTime>;               ///< -63..+63
using EnvelopeDepth = Codec::BoundedValue<Category::EnvelopeDepth>;           ///< -63..+63
using LfoSpeed = Codec::BoundedValue<Category::LfoSpeed>;                     ///< 0..127
using LfoDepth = Codec::BoundedValue<Category::LfoDepth>;                     ///< 0..63
using KeyScaling = Codec::BoundedValue<Category::KeyScaling>;                 ///< -63..+63
using EffectParameter = Codec::BoundedValue<Category::EffectParameter>;       ///< 0..127
using Cutoff = Codec::BoundedValue<Category::Cutoff>;                         ///< 0..127
using Resonance = Codec::BoundedValue<Category::Resonance>;                   ///< 0..31
using FilterLevel = Codec::BoundedValue<Category::FilterLevel>;               ///< 0..31
using PitchEnvelopeLevel = Codec::BoundedValue<Category::PitchEnvelopeLevel>; ///< -63..+63
using VelocityDepth = Codec::BoundedValue<Category::VelocityDepth>;           ///< 0..127
using PortamentoLevel = Codec::BoundedValue<Category::PortamentoLevel>;       ///< 0..127
using KeyOnDelay = Codec::BoundedValue<Category::KeyOnDelay>;                 ///< 0..127
using VelocitySensitivity = Codec::BoundedValue<Category::VelocitySensitivity>;  ///< -63..+63
using ControlDepth = Codec::BoundedValue<Category::ControlDepth>;             ///< -63..+63
using EffectDepth = Codec::BoundedValue<Category::EffectDepth>;               ///< 0..100
using Pan = Codec::BoundedValue<Category::Pan>;                               ///< -63..+63
using KeyScalingToGain = Codec::BoundedValue<Category::KeyScalingToGain>;     ///< -63..+63
using Coarse = Codec::BoundedValue<Category::Coarse>;                         ///< -24..+24
using Fine = Codec::BoundedValue<Category::Fine>;                             ///< -63..+63
using MacroDepth = Codec::BoundedValue<Category::MacroDepth>;                 ///< -31..+31
using VelocityCurve = Codec::BoundedValue<Category::VelocityCurve>;           ///< 1..12
using GeqLevel = Codec::BoundedValue<Category::GeqLevel>;                     ///< -6..+6
using HarmonicLevel = Codec::BoundedValue<Category::HarmonicLevel>;           ///< 0..127
using DataByte = Codec::BoundedValue<Category::DataByte>;                     ///< 0..127
using WaveKit = Codec::BoundedValue<Category::WaveKit>;                       ///< 0..1023
using InstrumentNumber = Codec::BoundedValue<Category::InstrumentNumber>;     ///< 0..511
using MidiChannel = Codec::BoundedValue<Category::MidiChannel>;               ///< 1..16
using MidiNote = Codec::BoundedValue<Category::MidiNote>;                     ///< 0..127

// ==============================================================================
// Constants
// ==============================================================================

inline constexpr std::size_t kNameLength = 8;
inline constexpr std::size_t kMinSourceCount = 2;
inline constexpr std::size_t kMaxSourceCount = 6;
inline constexpr std::size_t kMacroCount = 4;
inline constexpr std::size_t kGeqBandCount = 7;
inline constexpr std::size_t kHarmonicCount = 64;
inline constexpr std::size_t kFormantBandCount = 128;
inline constexpr std::size_t kMultiSectionCount = 4;
inline constexpr std::size_t kToneCount = 128;

/// Wave number selecting the additive (ADD) generator instead of a PCM wave.
inline constexpr int kAdditiveWave = 512;

// ==============================================================================
// Effect Path
// ==============================================================================

enum class EffectPath : uint8_t {
    Path1 = 0, Path2, Path3, Path4
};

inline constexpr uint8_t kEffectPathCount = 4;

[[nodiscard]] constexpr int effectPathNumber(EffectPath path) noexcept {
    return static_cast<int>(path) + 1;
}

// ==============================================================================
// Flags
// ==============================================================================

/// Read a whole byte that must be 0 or 1.
[[nodiscard]] inline bool readFlag(ByteReader& reader, std::string_view field) {
    const uint8_t raw = reader.byte();
    if (!reader.failed() && raw > 1) {
        reader.fail(ParseError::invalidDiscriminant(std::string(field), raw));
        return false;
    }
    return raw == 1;
}

[[nodiscard]] constexpr uint8_t flagByte(bool on) noexcept {
    return on ? 1 : 0;
}

} // namespace K5000
} // namespace Kpatch
