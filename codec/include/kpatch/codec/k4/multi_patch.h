// ==============================================================================
// Layer 1: K4
// multi_patch.h - K4 multi patch (77 bytes): name, volume, effect, 8 sections
// ==============================================================================

#pragma once

#include <kpatch/codec/core/note_names.h>
#include <kpatch/codec/core/text_field.h>
#include <kpatch/codec/k4/k4_types.h>

#include <array>
#include <string>

namespace Kpatch {
namespace K4 {

enum class VelocitySwitch : uint8_t {
    All = 0,
    Soft,
    Loud
};

inline constexpr uint8_t kVelocitySwitchCount = 3;

enum class PlayMode : uint8_t {
    Keyboard = 0,
    Midi,
    Mix
};

inline constexpr uint8_t kPlayModeCount = 3;

/// One of the eight sections (8 bytes).
///   0  single number
///   1  zone low
///   2  zone high
///   3  receive channel 0-3, velocity switch 4-5, mute bit 6
///   4  submix 0-2, play mode 3-4
///   5  level
///   6  transpose
///   7  tune
struct MultiSection {
    static constexpr std::size_t kDataSize = 8;

    PatchNumber singleNumber;
    MidiNote zoneLow = MidiNote::of<0>();
    MidiNote zoneHigh = MidiNote::of<127>();
    MidiChannel receiveChannel;
    VelocitySwitch velocitySwitch = VelocitySwitch::All;
    bool muted = false;
    Submix submix = Submix::A;
    PlayMode playMode = PlayMode::Keyboard;
    Level level = Level::of<100>();
    Transpose transpose;
    Depth tune;

    [[nodiscard]] static ParseResult<MultiSection> decode(ByteView data,
                                                          const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    /// Zone rendered with note names, e.g. "C-1 ~ G9".
    [[nodiscard]] std::string zoneName() const { return Codec::zoneName(zoneLow, zoneHigh); }

    bool operator==(const MultiSection&) const = default;
};

struct MultiPatch {
    static constexpr std::size_t kDataSize = 77;

    Codec::PatchName<kNameLength> name;
    Level volume = Level::of<100>();
    EffectNumber effect;
    std::array<MultiSection, kMultiSectionCount> sections{};

    [[nodiscard]] static ParseResult<MultiPatch> decode(ByteView data,
                                                        const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;
    [[nodiscard]] uint8_t checksum() const;

    bool operator==(const MultiPatch&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

} // namespace K4
} // namespace Kpatch
