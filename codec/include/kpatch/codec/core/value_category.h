// ==============================================================================
// Layer 0: Core
// value_category.h - Bounds, zero point and wire bias of every parameter kind
// ==============================================================================
// The single source of truth for bias arithmetic. A wire byte is the logical
// value plus the category's bias:
//
//   wire  = value + bias
//   value = wire  - bias
//
// Examples: K4Depth (-50..+50) is stored as 0..100 (bias +50); K4EffectNumber
// (1..32) is stored as 0..31 (bias -1); K5000 EnvelopeLevel (-63..+63) is
// stored as 1..127 (bias +64).
// ==============================================================================

#pragma once

#include <cstdint>
#include <string_view>

namespace Kpatch {
namespace Codec {

enum class Category : uint8_t {
    // Shared
    MidiChannel = 0,      ///< 1..16, wire 0..15
    MidiNote,             ///< 0..127

    // Dialect A (K4)
    K4Level,              ///< 0..100
    K4Depth,              ///< -50..+50, wire 0..100
    K4EffectNumber,       ///< 1..32, wire 0..31
    K4PatchNumber,        ///< 0..63
    K4WaveNumber,         ///< 1..256, wire 0..255 split over two bytes
    K4Curve,              ///< 1..8, wire 0..7
    K4Coarse,             ///< -24..+24, wire 0..48
    K4Resonance,          ///< 0..7
    K4BenderRange,        ///< 0..12 semitones
    K4Transpose,          ///< -24..+24, wire 0..48
    K4EffectSmall,        ///< -7..+7, wire 0..14
    K4EffectBig,          ///< 0..31
    K4Pan,                ///< -7..+7, wire 0..14

    // Dialect B (K5000)
    Volume,               ///< 0..127
    BenderPitch,          ///< 0..24
    BenderCutoff,         ///< 0..31
    EnvelopeTime,         ///< 0..127
    EnvelopeLevel,        ///< -63..+63, wire 1..127
    EnvelopeRate,         ///< 0..127
    HarmonicEnvelopeLevel,///< 0..63
    Bias,                 ///< -63..+63
    ControlTime,          ///< -63..+63
    EnvelopeDepth,        ///< -63..+63
    LfoSpeed,             ///< 0..127
    LfoDepth,             ///< 0..63
    KeyScaling,           ///< -63..+63
    EffectParameter,      ///< 0..127
    Cutoff,               ///< 0..127
    Resonance,            ///< 0..31
    FilterLevel,          ///< 0..31
    PitchEnvelopeLevel,   ///< -63..+63
    VelocityDepth,        ///< 0..127
    PortamentoLevel,      ///< 0..127
    KeyOnDelay,           ///< 0..127
    VelocitySensitivity,  ///< -63..+63
    ControlDepth,         ///< -63..+63
    EffectDepth,          ///< 0..100
    Pan,                  ///< -63..+63
    KeyScalingToGain,     ///< -63..+63
    Coarse,               ///< -24..+24, wire 0..48
    Fine,                 ///< -63..+63
    MacroDepth,           ///< -31..+31, wire 33..95
    VelocityCurve,        ///< 1..12, wire 0..11
    GeqLevel,             ///< -6..+6, wire 58..70
    HarmonicLevel,        ///< 0..127
    DataByte,             ///< 0..127, any 7-bit value
    WaveKit,              ///< 0..1023, 10 bits split over two bytes
    InstrumentNumber      ///< 0..511, split over two bytes
};

/// Total number of Category values.
inline constexpr uint8_t kCategoryCount = 50;

/// Bounds and wire bias of one category.
struct CategorySpec {
    std::string_view name;
    int minimum = 0;
    int maximum = 0;
    int zero = 0;     ///< Default value; always inside [minimum, maximum]
    int bias = 0;     ///< Added on encode, subtracted on decode

    [[nodiscard]] constexpr bool contains(int value) const noexcept {
        return value >= minimum && value <= maximum;
    }
};

/// Range, zero and wire bias of a category.
[[nodiscard]] constexpr CategorySpec categorySpec(Category category) noexcept {
    switch (category) {
        case Category::MidiChannel:           return {"MidiChannel", 1, 16, 1, -1};
        case Category::MidiNote:              return {"MidiNote", 0, 127, 60, 0};

        case Category::K4Level:               return {"K4Level", 0, 100, 0, 0};
        case Category::K4Depth:               return {"K4Depth", -50, 50, 0, 50};
        case Category::K4EffectNumber:        return {"K4EffectNumber", 1, 32, 1, -1};
        case Category::K4PatchNumber:         return {"K4PatchNumber", 0, 63, 0, 0};
        case Category::K4WaveNumber:          return {"K4WaveNumber", 1, 256, 1, -1};
        case Category::K4Curve:               return {"K4Curve", 1, 8, 1, -1};
        case Category::K4Coarse:              return {"K4Coarse", -24, 24, 0, 24};
        case Category::K4Resonance:           return {"K4Resonance", 0, 7, 0, 0};
        case Category::K4BenderRange:         return {"K4BenderRange", 0, 12, 0, 0};
        case Category::K4Transpose:           return {"K4Transpose", -24, 24, 0, 24};
        case Category::K4EffectSmall:         return {"K4EffectSmall", -7, 7, 0, 7};
        case Category::K4EffectBig:           return {"K4EffectBig", 0, 31, 0, 0};
        case Category::K4Pan:                 return {"K4Pan", -7, 7, 0, 7};

        case Category::Volume:                return {"Volume", 0, 127, 0, 0};
        case Category::BenderPitch:           return {"BenderPitch", 0, 24, 0, 0};
        case Category::BenderCutoff:          return {"BenderCutoff", 0, 31, 0, 0};
        case Category::EnvelopeTime:          return {"EnvelopeTime", 0, 127, 0, 0};
        case Category::EnvelopeLevel:         return {"EnvelopeLevel", -63, 63, 0, 64};
        case Category::EnvelopeRate:          return {"EnvelopeRate", 0, 127, 0, 0};
        case Category::HarmonicEnvelopeLevel: return {"HarmonicEnvelopeLevel", 0, 63, 0, 0};
        case Category::Bias:                  return {"Bias", -63, 63, 0, 64};
        case Category::ControlTime:           return {"ControlTime", -63, 63, 0, 64};
        case Category::EnvelopeDepth:         return {"EnvelopeDepth", -63, 63, 0, 64};
        case Category::LfoSpeed:              return {"LfoSpeed", 0, 127, 0, 0};
        case Category::LfoDepth:              return {"LfoDepth", 0, 63, 0, 0};
        case Category::KeyScaling:            return {"KeyScaling", -63, 63, 0, 64};
        case Category::EffectParameter:       return {"EffectParameter", 0, 127, 0, 0};
        case Category::Cutoff:                return {"Cutoff", 0, 127, 0, 0};
        case Category::Resonance:             return {"Resonance", 0, 31, 0, 0};
        case Category::FilterLevel:           return {"FilterLevel", 0, 31, 0, 0};
        case Category::PitchEnvelopeLevel:    return {"PitchEnvelopeLevel", -63, 63, 0, 64};
        case Category::VelocityDepth:         return {"VelocityDepth", 0, 127, 0, 0};
        case Category::PortamentoLevel:       return {"PortamentoLevel", 0, 127, 0, 0};
        case Category::KeyOnDelay:            return {"KeyOnDelay", 0, 127, 0, 0};
        case Category::VelocitySensitivity:   return {"VelocitySensitivity", -63, 63, 0, 64};
        case Category::ControlDepth:          return {"ControlDepth", -63, 63, 0, 64};
        case Category::EffectDepth:           return {"EffectDepth", 0, 100, 0, 0};
        case Category::Pan:                   return {"Pan", -63, 63, 0, 64};
        case Category::KeyScalingToGain:      return {"KeyScalingToGain", -63, 63, 0, 64};
        case Category::Coarse:                return {"Coarse", -24, 24, 0, 24};
        case Category::Fine:                  return {"Fine", -63, 63, 0, 64};
        case Category::MacroDepth:            return {"MacroDepth", -31, 31, 0, 64};
        case Category::VelocityCurve:         return {"VelocityCurve", 1, 12, 1, -1};
        case Category::GeqLevel:              return {"GeqLevel", -6, 6, 0, 64};
        case Category::HarmonicLevel:         return {"HarmonicLevel", 0, 127, 0, 0};
        case Category::DataByte:              return {"DataByte", 0, 127, 0, 0};
        case Category::WaveKit:               return {"WaveKit", 0, 1023, 0, 0};
        case Category::InstrumentNumber:      return {"InstrumentNumber", 0, 511, 0, 0};
    }
    return {"Unknown", 0, 0, 0, 0};
}

} // namespace Codec
} // namespace Kpatch
