// ==============================================================================
// Layer 1: K4
// effect_patch.h - K4 effect patch (35 bytes)
// ==============================================================================
//   0      effect type 0..15
//   1, 2   parameters 1 and 2 (-7..+7)
//   3      parameter 3 (0..31)
//   4..9   unused, zero
//   10..33 8 submixes x (pan, send 1, send 2)
//   34     checksum
// ==============================================================================

#pragma once

#include <kpatch/codec/k4/k4_types.h>

#include <array>
#include <string_view>

namespace Kpatch {
namespace K4 {

enum class EffectType : uint8_t {
    Reverb1 = 0,
    Reverb2,
    Reverb3,
    Reverb4,
    GateReverb,
    ReverseGate,
    NormalDelay,
    StereoPanpotDelay,
    Chorus,
    OverdriveFlanger,
    OverdriveNormalDelay,
    OverdriveReverb,
    NormalDelayNormalDelay,
    NormalDelayStereoPanpotDelay,
    ChorusNormalDelay,
    ChorusStereoPanpotDelay
};

inline constexpr uint8_t kEffectTypeCount = 16;

inline constexpr std::array<std::string_view, kEffectTypeCount> kEffectTypeNames = {
    "Reverb 1",
    "Reverb 2",
    "Reverb 3",
    "Reverb 4",
    "Gate Reverb",
    "Reverse Gate",
    "Normal Delay",
    "Stereo Panpot Delay",
    "Chorus",
    "Overdrive + Flanger",
    "Overdrive + Normal Delay",
    "Overdrive + Reverb",
    "Normal Delay + Normal Delay",
    "Normal Delay + Stereo Panpot Delay",
    "Chorus + Normal Delay",
    "Chorus + Stereo Panpot Delay",
};

using EffectParameterNames = std::array<std::string_view, 3>;

inline constexpr std::array<EffectParameterNames, kEffectTypeCount> kEffectParameterNames = {{
    {"Pre.delay", "Rev.Time", "Tone"},
    {"Pre.delay", "Rev.Time", "Tone"},
    {"Pre.delay", "Rev.Time", "Tone"},
    {"Pre.delay", "Rev.Time", "Tone"},
    {"Pre.delay", "Gate Time", "Tone"},
    {"Pre.delay", "Gate Time", "Tone"},
    {"Feedback", "Tone", "Delay"},
    {"Feedback", "L/R Delay", "Delay"},
    {"Width", "Feedback", "Rate"},
    {"Drive", "Fl.Type", "1-2 Bal"},
    {"Drive", "Delay Time", "1-2 Bal"},
    {"Drive", "Rev.Type", "1-2 Bal"},
    {"Delay1", "Delay2", "1-2 Bal"},
    {"Delay1", "Delay2", "1-2 Bal"},
    {"Chorus", "Delay", "1-2 Bal"},
    {"Chorus", "Delay", "1-2 Bal"},
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

/// Output settings of one submix channel (3 bytes).
struct SubmixSettings {
    static constexpr std::size_t kDataSize = 3;

    Pan pan;
    Level send1;
    Level send2;

    [[nodiscard]] static ParseResult<SubmixSettings> decode(ByteView data,
                                                            const DecodeOptions& options = {}) {
        ByteReader reader(data, "submix", options);
        reader.require(kDataSize);
        SubmixSettings settings;
        settings.pan = reader.value<Category::K4Pan>("pan");
        settings.send1 = reader.value<Category::K4Level>("send 1");
        settings.send2 = reader.value<Category::K4Level>("send 2");
        return reader.finish(settings);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {pan.toWireByte(), send1.toWireByte(), send2.toWireByte()};
    }

    bool operator==(const SubmixSettings&) const = default;
};

struct EffectPatch {
    static constexpr std::size_t kDataSize = 35;

    EffectType type = EffectType::Reverb1;
    SmallEffectParameter param1;
    SmallEffectParameter param2;
    BigEffectParameter param3;
    std::array<SubmixSettings, kSubmixCount> submixes{};

    [[nodiscard]] static ParseResult<EffectPatch> decode(ByteView data,
                                                         const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;
    [[nodiscard]] uint8_t checksum() const;

    [[nodiscard]] std::string_view name() const noexcept { return effectTypeName(type); }
    [[nodiscard]] EffectParameterNames parameterNames() const noexcept {
        return effectParameterNames(type);
    }

    bool operator==(const EffectPatch&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

} // namespace K4
} // namespace Kpatch
