// ==============================================================================
// Layer 1: K5000
// control.h - Controllers, macros, switches and the source control block
// ==============================================================================
// Source control (28 bytes):
//   0      zone low
//   1      zone high
//   2      velocity switch: type bits 5-6, threshold index bits 0-4
//   3      effect path
//   4      volume
//   5, 6   bender pitch, bender cutoff
//   7..24  modulation (3 macros x 4, 2 assignables x 3)
//   25     key-on delay
//   26, 27 pan type, pan value
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/note_names.h>
#include <kpatch/codec/k5000/k5000_types.h>

#include <array>
#include <string>
#include <string_view>

namespace Kpatch {
namespace K5000 {

// ==============================================================================
// Control Sources and Destinations
// ==============================================================================

enum class ControlSource : uint8_t {
    Bender = 0,
    ChannelPressure,
    Wheel,
    Expression,
    MidiVolume,
    PanPot,
    GeneralController1,
    GeneralController2,
    GeneralController3,
    GeneralController4,
    GeneralController5,
    GeneralController6,
    GeneralController7,
    GeneralController8
};

inline constexpr uint8_t kControlSourceCount = 14;

[[nodiscard]] constexpr std::string_view controlSourceName(ControlSource source) noexcept {
    constexpr std::array<std::string_view, kControlSourceCount> kNames = {
        "Bender", "Channel pressure", "Wheel", "Expression", "MIDI volume", "Pan pot",
        "GC1", "GC2", "GC3", "GC4", "GC5", "GC6", "GC7", "GC8"
    };
    const auto index = static_cast<std::size_t>(source);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

enum class ControlDestination : uint8_t {
    PitchOffset = 0,
    CutoffOffset,
    Level,
    VibratoDepthOffset,
    GrowlDepthOffset,
    TremoloDepthOffset,
    LfoSpeedOffset,
    AttackTimeOffset,
    Decay1TimeOffset,
    ReleaseTimeOffset,
    VelocityOffset,
    ResonanceOffset,
    PanPotOffset,
    FormantFilterBiasOffset,
    FormantFilterEnvelopeLfoDepthOffset,
    FormantFilterEnvelopeLfoSpeedOffset,
    HarmonicLowOffset,
    HarmonicHighOffset,
    HarmonicEvenOffset,
    HarmonicOddOffset
};

inline constexpr uint8_t kControlDestinationCount = 20;

[[nodiscard]] constexpr std::string_view controlDestinationName(
    ControlDestination destination) noexcept {
    constexpr std::array<std::string_view, kControlDestinationCount> kNames = {
        "Pitch offset",
        "Cutoff offset",
        "Level",
        "Vibrato depth offset",
        "Growl depth offset",
        "Tremolo depth offset",
        "LFO speed offset",
        "Attack time offset",
        "Decay 1 time offset",
        "Release time offset",
        "Velocity offset",
        "Resonance offset",
        "Pan pot offset",
        "Formant filter bias offset",
        "Formant filter envelope LFO depth offset",
        "Formant filter envelope LFO speed offset",
        "Harmonic low offset",
        "Harmonic high offset",
        "Harmonic even offset",
        "Harmonic odd offset"
    };
    const auto index = static_cast<std::size_t>(destination);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

// ==============================================================================
// Velocity Switch
// ==============================================================================

enum class VelocitySwitchType : uint8_t {
    Off = 0,
    Loud,
    Soft
};

inline constexpr uint8_t kVelocitySwitchTypeCount = 3;

[[nodiscard]] constexpr std::string_view velocitySwitchTypeName(VelocitySwitchType type) noexcept {
    switch (type) {
        case VelocitySwitchType::Off:  return "Off";
        case VelocitySwitchType::Loud: return "Loud";
        case VelocitySwitchType::Soft: return "Soft";
    }
    return {};
}

/// Velocity thresholds addressed by the 5-bit index.
inline constexpr std::array<int, 32> kVelocityThresholds = {
    4,   8,   12,  16,  20,  24,  28,  32,
    36,  40,  44,  48,  52,  56,  60,  64,
    68,  72,  76,  80,  84,  88,  92,  96,
    100, 104, 108, 112, 116, 120, 124, 127
};

struct VelocitySwitch {
    static constexpr std::size_t kDataSize = 1;

    VelocitySwitchType type = VelocitySwitchType::Off;
    uint8_t thresholdIndex = 0;  ///< 0..31

    /// Velocity at which the switch flips (4..127).
    [[nodiscard]] constexpr int threshold() const noexcept {
        return kVelocityThresholds[thresholdIndex & 0x1F];
    }

    [[nodiscard]] static ParseResult<VelocitySwitch> decode(ByteView data,
                                                            const DecodeOptions& options = {}) {
        ByteReader reader(data, "velocity switch", options);
        const uint8_t b = reader.byte();
        VelocitySwitch vs;
        vs.type = reader.enumeration<VelocitySwitchType>(Codec::bitField(b, 5, 2),
                                                         kVelocitySwitchTypeCount, "type");
        vs.thresholdIndex = Codec::bitField(b, 0, 5);
        return reader.finish(vs);
    }

    [[nodiscard]] ByteBuffer encode() const {
        uint8_t b = Codec::withBitField(0, 0, 5, thresholdIndex);
        b = Codec::withBitField(b, 5, 2, Codec::enumToByte(type));
        return {b};
    }

    bool operator==(const VelocitySwitch&) const = default;
};

// ==============================================================================
// Macro and Assignable Controllers
// ==============================================================================

struct MacroController {
    static constexpr std::size_t kDataSize = 4;

    ControlDestination destination1 = ControlDestination::PitchOffset;
    MacroDepth depth1;
    ControlDestination destination2 = ControlDestination::PitchOffset;
    MacroDepth depth2;

    [[nodiscard]] static ParseResult<MacroController> decode(ByteView data,
                                                             const DecodeOptions& options = {}) {
        ByteReader reader(data, "macro", options);
        reader.require(kDataSize);
        MacroController macro;
        macro.destination1 = reader.enumeration<ControlDestination>(kControlDestinationCount,
                                                                    "destination 1");
        macro.depth1 = reader.value<Category::MacroDepth>("depth 1");
        macro.destination2 = reader.enumeration<ControlDestination>(kControlDestinationCount,
                                                                    "destination 2");
        macro.depth2 = reader.value<Category::MacroDepth>("depth 2");
        return reader.finish(macro);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {Codec::enumToByte(destination1), depth1.toWireByte(),
                Codec::enumToByte(destination2), depth2.toWireByte()};
    }

    bool operator==(const MacroController&) const = default;
};

struct AssignableController {
    static constexpr std::size_t kDataSize = 3;

    ControlSource source = ControlSource::Bender;
    ControlDestination destination = ControlDestination::PitchOffset;
    ControlDepth depth;

    [[nodiscard]] static ParseResult<AssignableController> decode(
        ByteView data, const DecodeOptions& options = {}) {
        ByteReader reader(data, "assignable", options);
        reader.require(kDataSize);
        AssignableController controller;
        controller.source = reader.enumeration<ControlSource>(kControlSourceCount, "source");
        controller.destination = reader.enumeration<ControlDestination>(kControlDestinationCount,
                                                                        "destination");
        controller.depth = reader.value<Category::ControlDepth>("depth");
        return reader.finish(controller);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {Codec::enumToByte(source), Codec::enumToByte(destination), depth.toWireByte()};
    }

    bool operator==(const AssignableController&) const = default;
};

/// Per-source controller routing (18 bytes).
struct Modulation {
    static constexpr std::size_t kDataSize = 18;

    MacroController pressure;
    MacroController wheel;
    MacroController expression;
    AssignableController assignable1;
    AssignableController assignable2;

    [[nodiscard]] static ParseResult<Modulation> decode(ByteView data,
                                                        const DecodeOptions& options = {}) {
        ByteReader reader(data, "modulation", options);
        reader.require(kDataSize);
        Modulation mod;
        mod.pressure = reader.block<MacroController>("pressure");
        mod.wheel = reader.block<MacroController>("wheel");
        mod.expression = reader.block<MacroController>("expression");
        mod.assignable1 = reader.block<AssignableController>("assignable 1");
        mod.assignable2 = reader.block<AssignableController>("assignable 2");
        return reader.finish(mod);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.block(pressure);
        writer.block(wheel);
        writer.block(expression);
        writer.block(assignable1);
        writer.block(assignable2);
        return std::move(writer).take();
    }

    bool operator==(const Modulation&) const = default;
};

// ==============================================================================
// Switches
// ==============================================================================

enum class Switch : uint8_t {
    Off = 0,
    HarmMax,
    HarmBright,
    HarmDark,
    HarmSaw,
    SelectLoud,
    AddLoud,
    AddFifth,
    AddOdd,
    AddEven,
    He1,
    He2,
    HarmonicEnvelopeLoop,
    FfMax,
    FfComb,
    FfHiCut,
    FfComb2
};

inline constexpr uint8_t kSwitchCount = 17;

[[nodiscard]] constexpr std::string_view switchName(Switch s) noexcept {
    constexpr std::array<std::string_view, kSwitchCount> kNames = {
        "Off",
        "Max harmonics",
        "Bright harmonics",
        "Dark harmonics",
        "Saw harmonics",
        "Select loud",
        "Add loud",
        "Add fifth",
        "Add odd",
        "Add even",
        "Harmonic Env 1",
        "Harmonic Env 2",
        "Harmonic envelope loop",
        "Formant filter max",
        "Formant filter comb",
        "Formant filter high cut",
        "Formant filter comb 2"
    };
    const auto index = static_cast<std::size_t>(s);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

/// SW1, SW2, FSW1, FSW2.
struct SwitchControl {
    static constexpr std::size_t kDataSize = 4;

    Switch switch1 = Switch::Off;
    Switch switch2 = Switch::Off;
    Switch footSwitch1 = Switch::Off;
    Switch footSwitch2 = Switch::Off;

    [[nodiscard]] static ParseResult<SwitchControl> decode(ByteView data,
                                                           const DecodeOptions& options = {}) {
        ByteReader reader(data, "switches", options);
        reader.require(kDataSize);
        SwitchControl sw;
        sw.switch1 = reader.enumeration<Switch>(kSwitchCount, "SW1");
        sw.switch2 = reader.enumeration<Switch>(kSwitchCount, "SW2");
        sw.footSwitch1 = reader.enumeration<Switch>(kSwitchCount, "FSW1");
        sw.footSwitch2 = reader.enumeration<Switch>(kSwitchCount, "FSW2");
        return reader.finish(sw);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {Codec::enumToByte(switch1), Codec::enumToByte(switch2),
                Codec::enumToByte(footSwitch1), Codec::enumToByte(footSwitch2)};
    }

    bool operator==(const SwitchControl&) const = default;
};

// ==============================================================================
// Voice Settings
// ==============================================================================

enum class Polyphony : uint8_t {
    Poly = 0,
    Solo1,
    Solo2
};

inline constexpr uint8_t kPolyphonyCount = 3;

[[nodiscard]] constexpr std::string_view polyphonyName(Polyphony polyphony) noexcept {
    switch (polyphony) {
        case Polyphony::Poly:  return "POLY";
        case Polyphony::Solo1: return "SOLO1";
        case Polyphony::Solo2: return "SOLO2";
    }
    return {};
}

/// Source N modulates the amplitude of source N+1.
enum class AmplitudeModulation : uint8_t {
    Off = 0,
    Source1To2,
    Source2To3,
    Source3To4,
    Source4To5,
    Source5To6
};

inline constexpr uint8_t kAmplitudeModulationCount = 6;

[[nodiscard]] constexpr std::string_view amplitudeModulationName(
    AmplitudeModulation am) noexcept {
    constexpr std::array<std::string_view, kAmplitudeModulationCount> kNames = {
        "OFF", "1->2", "2->3", "3->4", "4->5", "5->6"
    };
    const auto index = static_cast<std::size_t>(am);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

enum class PanType : uint8_t {
    Normal = 0,
    Random,
    KeyScale,
    NegativeKeyScale
};

inline constexpr uint8_t kPanTypeCount = 4;

[[nodiscard]] constexpr std::string_view panTypeName(PanType type) noexcept {
    switch (type) {
        case PanType::Normal:           return "Normal";
        case PanType::Random:           return "Random";
        case PanType::KeyScale:         return "Key scale";
        case PanType::NegativeKeyScale: return "Negative key scale";
    }
    return {};
}

// ==============================================================================
// Source Control
// ==============================================================================

struct Control {
    static constexpr std::size_t kDataSize = 28;

    MidiNote zoneLow = MidiNote::minimum();
    MidiNote zoneHigh = MidiNote::maximum();
    VelocitySwitch velocitySwitch;
    EffectPath effectPath = EffectPath::Path1;
    Volume volume = Volume::of<100>();
    BenderPitch benderPitch;
    BenderCutoff benderCutoff;
    Modulation modulation;
    KeyOnDelay keyOnDelay;
    PanType panType = PanType::Normal;
    Pan pan;

    [[nodiscard]] static ParseResult<Control> decode(ByteView data,
                                                     const DecodeOptions& options = {}) {
        ByteReader reader(data, "control", options);
        reader.require(kDataSize);
        Control control;
        control.zoneLow = reader.value<Category::MidiNote>("zone low");
        control.zoneHigh = reader.value<Category::MidiNote>("zone high");
        control.velocitySwitch = reader.block<VelocitySwitch>("velocity switch");
        control.effectPath = reader.enumeration<EffectPath>(kEffectPathCount, "effect path");
        control.volume = reader.value<Category::Volume>("volume");
        control.benderPitch = reader.value<Category::BenderPitch>("bender pitch");
        control.benderCutoff = reader.value<Category::BenderCutoff>("bender cutoff");
        control.modulation = reader.block<Modulation>("modulation");
        control.keyOnDelay = reader.value<Category::KeyOnDelay>("key on delay");
        control.panType = reader.enumeration<PanType>(kPanTypeCount, "pan type");
        control.pan = reader.value<Category::Pan>("pan");
        return reader.finish(control);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.value(zoneLow);
        writer.value(zoneHigh);
        writer.block(velocitySwitch);
        writer.enumeration(effectPath);
        writer.value(volume);
        writer.value(benderPitch);
        writer.value(benderCutoff);
        writer.block(modulation);
        writer.value(keyOnDelay);
        writer.enumeration(panType);
        writer.value(pan);
        return std::move(writer).take();
    }

    /// Keyboard zone as "C-1 ~ G9".
    [[nodiscard]] std::string zoneName() const { return Codec::zoneName(zoneLow, zoneHigh); }

    bool operator==(const Control&) const = default;
};

} // namespace K5000
} // namespace Kpatch
