// ==============================================================================
// Layer 1: K5000
// effect_settings.h - Reverb, four effect slots, GEQ and effect control
// ==============================================================================
// Effect settings (31 bytes):
//   0       algorithm (1..4)
//   1..6    reverb: type, depth, parameters 1..4
//   7..30   effect 1..4, same layout as the reverb
//
// Types 0..10 are reverbs; 11..47 are effects. Every type names its four
// parameters; an empty name marks an unused parameter.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/k5000/control.h>
#include <kpatch/codec/k5000/k5000_types.h>

#include <array>
#include <string_view>

namespace Kpatch {
namespace K5000 {

// ==============================================================================
// Effect Types
// ==============================================================================

enum class EffectType : uint8_t {
    Hall1 = 0,
    Hall2,
    Hall3,
    Room1,
    Room2,
    Room3,
    Plate1,
    Plate2,
    Plate3,
    Reverse,
    LongDelay,
    EarlyReflection1,
    EarlyReflection2,
    TapDelay1,
    TapDelay2,
    SingleDelay,
    DualDelay,
    StereoDelay,
    CrossDelay,
    AutoPan,
    AutoPanAndDelay,
    Chorus1,
    Chorus2,
    Chorus1AndDelay,
    Chorus2AndDelay,
    Flanger1,
    Flanger2,
    Flanger1AndDelay,
    Flanger2AndDelay,
    Ensemble,
    EnsembleAndDelay,
    Celeste,
    CelesteAndDelay,
    Tremolo,
    TremoloAndDelay,
    Phaser1,
    Phaser2,
    Phaser1AndDelay,
    Phaser2AndDelay,
    Rotary,
    AutoWah,
    Bandpass,
    Exciter,
    Enhancer,
    Overdrive,
    Distortion,
    OverdriveAndDelay,
    DistortionAndDelay
};

inline constexpr uint8_t kEffectTypeCount = 48;
inline constexpr uint8_t kReverbTypeCount = 11;

[[nodiscard]] constexpr bool isReverbType(EffectType type) noexcept {
    return static_cast<uint8_t>(type) < kReverbTypeCount;
}

using EffectParameterNames = std::array<std::string_view, 4>;

inline constexpr std::array<std::string_view, kEffectTypeCount> kEffectTypeNames = {
    "Hall 1",
    "Hall 2",
    "Hall 3",
    "Room 1",
    "Room 2",
    "Room 3",
    "Plate 1",
    "Plate 2",
    "Plate 3",
    "Reverse",
    "Long Delay",
    "Early Reflection 1",
    "Early Reflection 2",
    "Tap Delay 1",
    "Tap Delay 2",
    "Single Delay",
    "Dual Delay",
    "Stereo Delay",
    "Cross Delay",
    "Auto Pan",
    "Auto Pan & Delay",
    "Chorus 1",
    "Chorus 2",
    "Chorus 1 & Delay",
    "Chorus 2 & Delay",
    "Flanger 1",
    "Flanger 2",
    "Flanger 1 & Delay",
    "Flanger 2 & Delay",
    "Ensemble",
    "Ensemble & Delay",
    "Celeste",
    "Celeste & Delay",
    "Tremolo",
    "Tremolo & Delay",
    "Phaser 1",
    "Phaser 2",
    "Phaser 1 & Delay",
    "Phaser 2 & Delay",
    "Rotary",
    "Auto Wah",
    "Bandpass",
    "Exciter",
    "Enhancer",
    "Overdrive",
    "Distortion",
    "Overdrive & Delay",
    "Distortion & Delay",
};

inline constexpr std::array<EffectParameterNames, kEffectTypeCount> kEffectParameterNames = {{
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Reverb Time", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Feedback", "Predelay Time", "High Frequency Damping"},
    {"Dry/Wet 2", "Feedback", "Delay Time", "High Frequency Damping"},
    {"Slope", "Predelay Time", "Feedback", ""},
    {"Slope", "Predelay Time", "Feedback", ""},
    {"Delay Time 1", "Tap Level", "Delay Time 2", ""},
    {"Delay Time 1", "Tap Level", "Delay Time 2", ""},
    {"Delay Time Fine", "Delay Time Coarse", "Feedback", ""},
    {"Delay Time Left", "Feedback Left", "Delay Time Right", "Feedback Right"},
    {"Delay Time", "Feedback", "", ""},
    {"Delay Time", "Feedback", "", ""},
    {"Speed", "Depth", "Predelay Time", "Wave"},
    {"Speed", "Depth", "Delay Time", "Wave"},
    {"Speed", "Depth", "Predelay Time", "Wave"},
    {"Speed", "Depth", "Predelay Time", "Wave"},
    {"Speed", "Depth", "Delay Time", "Wave"},
    {"Speed", "Depth", "Delay Time", "Wave"},
    {"Speed", "Depth", "Predelay Time", "Feedback"},
    {"Speed", "Depth", "Predelay Time", "Feedback"},
    {"Speed", "Depth", "Delay Time", "Feedback"},
    {"Speed", "Depth", "Delay Time", "Feedback"},
    {"Depth", "Predelay Time", "", ""},
    {"Depth", "Delay Time", "", ""},
    {"Speed", "Depth", "Predelay Time", ""},
    {"Speed", "Depth", "Delay Time", ""},
    {"Speed", "Depth", "Predelay Time", "Wave"},
    {"Speed", "Depth", "Delay Time", "Wave"},
    {"Speed", "Depth", "Predelay Time", "Feedback"},
    {"Speed", "Depth", "Predelay Time", "Feedback"},
    {"Speed", "Depth", "Delay Time", "Feedback"},
    {"Speed", "Depth", "Delay Time", "Feedback"},
    {"Slow Speed", "Fast Speed", "Acceleration", "Slow/Fast Switch"},
    {"Sense", "Frequency Bottom", "Frequency Top", "Resonance"},
    {"Center Frequency", "Bandwidth", "", ""},
    {"EQ Low", "EQ High", "Intensity", ""},
    {"EQ Low", "EQ High", "Intensity", ""},
    {"EQ Low", "EQ High", "Output Level", "Drive"},
    {"EQ Low", "EQ High", "Output Level", "Drive"},
    {"EQ Low", "EQ High", "Delay Time", "Drive"},
    {"EQ Low", "EQ High", "Delay Time", "Drive"},
}};

[[nodiscard]] constexpr std::string_view effectTypeName(EffectType type) noexcept {
    const auto index = static_cast<std::size_t>(type);
    return index < kEffectTypeNames.size() ? kEffectTypeNames[index] : std::string_view{};
}

[[nodiscard]] constexpr EffectParameterNames effectParameterNames(EffectType type) noexcept {
    const auto index = static_cast<std::size_t>(type);
    return index < kEffectParameterNames.size() ? kEffectParameterNames[index]
                                                : EffectParameterNames{};
}

enum class EffectAlgorithm : uint8_t {
    Algorithm1 = 0,
    Algorithm2,
    Algorithm3,
    Algorithm4
};

inline constexpr uint8_t kEffectAlgorithmCount = 4;

[[nodiscard]] constexpr int effectAlgorithmNumber(EffectAlgorithm algorithm) noexcept {
    return static_cast<int>(algorithm) + 1;
}

// ==============================================================================
// Effect Definition
// ==============================================================================

struct EffectDefinition {
    static constexpr std::size_t kDataSize = 6;
    static constexpr std::size_t kParameterCount = 4;

    EffectType type = EffectType::Hall1;
    EffectDepth depth;
    std::array<EffectParameter, kParameterCount> parameters{};

    [[nodiscard]] static ParseResult<EffectDefinition> decode(ByteView data,
                                                              const DecodeOptions& options = {}) {
        ByteReader reader(data, "effect", options);
        reader.require(kDataSize);
        EffectDefinition effect;
        effect.type = reader.enumeration<EffectType>(kEffectTypeCount, "type");
        effect.depth = reader.value<Category::EffectDepth>("depth");
        constexpr std::array<std::string_view, kParameterCount> kFields = {
            "parameter 1", "parameter 2", "parameter 3", "parameter 4"
        };
        for (std::size_t i = 0; i < kParameterCount; ++i) {
            effect.parameters[i] = reader.value<Category::EffectParameter>(kFields[i]);
        }
        return reader.finish(effect);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.enumeration(type);
        writer.value(depth);
        for (const auto& parameter : parameters) {
            writer.value(parameter);
        }
        return std::move(writer).take();
    }

    [[nodiscard]] std::string_view name() const noexcept { return effectTypeName(type); }

    [[nodiscard]] EffectParameterNames parameterNames() const noexcept {
        return effectParameterNames(type);
    }

    bool operator==(const EffectDefinition&) const = default;
};

struct EffectSettings {
    static constexpr std::size_t kDataSize = 31;
    static constexpr std::size_t kEffectSlotCount = 4;

    EffectAlgorithm algorithm = EffectAlgorithm::Algorithm1;
    EffectDefinition reverb;
    std::array<EffectDefinition, kEffectSlotCount> effects{};

    [[nodiscard]] static ParseResult<EffectSettings> decode(ByteView data,
                                                            const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const EffectSettings&) const = default;
};

// ==============================================================================
// Graphic EQ
// ==============================================================================

/// Seven-band graphic EQ, -6..+6 per band.
struct Geq {
    static constexpr std::size_t kDataSize = kGeqBandCount;

    std::array<GeqLevel, kGeqBandCount> bands{};

    [[nodiscard]] static ParseResult<Geq> decode(ByteView data,
                                                 const DecodeOptions& options = {}) {
        ByteReader reader(data, "geq", options);
        reader.require(kDataSize);
        Geq geq;
        Codec::readValues(reader, geq.bands, "band");
        return reader.finish(geq);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        Codec::writeValues(writer, bands);
        return std::move(writer).take();
    }

    bool operator==(const Geq&) const = default;
};

// ==============================================================================
// Effect Control
// ==============================================================================

enum class EffectDestination : uint8_t {
    Effect1DryWet = 0,
    Effect1Parameter,
    Effect2DryWet,
    Effect2Parameter,
    Effect3DryWet,
    Effect3Parameter,
    Effect4DryWet,
    Effect4Parameter
};

inline constexpr uint8_t kEffectDestinationCount = 8;

[[nodiscard]] constexpr std::string_view effectDestinationName(
    EffectDestination destination) noexcept {
    constexpr std::array<std::string_view, kEffectDestinationCount> kNames = {
        "Effect 1 dry/wet", "Effect 1 parameter", "Effect 2 dry/wet", "Effect 2 parameter",
        "Effect 3 dry/wet", "Effect 3 parameter", "Effect 4 dry/wet", "Effect 4 parameter"
    };
    const auto index = static_cast<std::size_t>(destination);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

struct EffectControlSource {
    static constexpr std::size_t kDataSize = 3;

    ControlSource source = ControlSource::Bender;
    EffectDestination destination = EffectDestination::Effect1DryWet;
    ControlDepth depth;

    [[nodiscard]] static ParseResult<EffectControlSource> decode(
        ByteView data, const DecodeOptions& options = {}) {
        ByteReader reader(data, "effect control source", options);
        reader.require(kDataSize);
        EffectControlSource control;
        control.source = reader.enumeration<ControlSource>(kControlSourceCount, "source");
        control.destination = reader.enumeration<EffectDestination>(kEffectDestinationCount,
                                                                    "destination");
        control.depth = reader.value<Category::ControlDepth>("depth");
        return reader.finish(control);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {Codec::enumToByte(source), Codec::enumToByte(destination), depth.toWireByte()};
    }

    bool operator==(const EffectControlSource&) const = default;
};

struct EffectControl {
    static constexpr std::size_t kDataSize = 6;

    EffectControlSource source1;
    EffectControlSource source2;

    [[nodiscard]] static ParseResult<EffectControl> decode(ByteView data,
                                                           const DecodeOptions& options = {}) {
        ByteReader reader(data, "effect control", options);
        reader.require(kDataSize);
        EffectControl control;
        control.source1 = reader.block<EffectControlSource>("source 1");
        control.source2 = reader.block<EffectControlSource>("source 2");
        return reader.finish(control);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.block(source1);
        writer.block(source2);
        return std::move(writer).take();
    }

    bool operator==(const EffectControl&) const = default;
};

} // namespace K5000
} // namespace Kpatch
