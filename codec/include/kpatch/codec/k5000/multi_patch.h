// ==============================================================================
// Layer 1: K5000
// multi_patch.h - K5000 multi (combi) patch (99 bytes)
// ==============================================================================
//   0        checksum
//   1..54    common: effects 31, GEQ 7, name 8, volume, section mutes, effect control 6
//   55..98   4 sections x 11
// ==============================================================================

#pragma once

#include <kpatch/codec/core/note_names.h>
#include <kpatch/codec/core/text_field.h>
#include <kpatch/codec/k5000/control.h>
#include <kpatch/codec/k5000/effect_settings.h>
#include <kpatch/codec/k5000/k5000_types.h>

#include <array>
#include <string>

namespace Kpatch {
namespace K5000 {

/// One multi section: a single patch on a keyboard zone and MIDI channel.
struct MultiSection {
    static constexpr std::size_t kDataSize = 11;

    InstrumentNumber instrument;
    Volume volume = Volume::of<127>();
    Pan pan;
    EffectPath effectPath = EffectPath::Path1;
    Coarse transpose;
    Fine tune;
    MidiNote zoneLow = MidiNote::minimum();
    MidiNote zoneHigh = MidiNote::maximum();
    VelocitySwitch velocitySwitch;
    MidiChannel receiveChannel;

    [[nodiscard]] static ParseResult<MultiSection> decode(ByteView data,
                                                          const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    [[nodiscard]] std::string zoneName() const { return Codec::zoneName(zoneLow, zoneHigh); }

    bool operator==(const MultiSection&) const = default;
};

struct MultiCommon {
    static constexpr std::size_t kDataSize = 54;

    EffectSettings effects;
    Geq geq;
    Codec::PatchName<kNameLength> name;
    Volume volume = Volume::of<127>();
    std::array<bool, kMultiSectionCount> sectionMutes{};  ///< true = muted
    EffectControl effectControl;

    [[nodiscard]] static ParseResult<MultiCommon> decode(ByteView data,
                                                         const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const MultiCommon&) const = default;
};

struct MultiPatch {
    static constexpr std::size_t kDataSize = 99;

    MultiCommon common;
    std::array<MultiSection, kMultiSectionCount> sections{};

    [[nodiscard]] static ParseResult<MultiPatch> decode(ByteView data,
                                                        const DecodeOptions& options = {});

    /// Checksum followed by the body.
    [[nodiscard]] ByteBuffer encode() const;

    /// Checksum over the common block and the sections.
    [[nodiscard]] uint8_t checksum() const;

    bool operator==(const MultiPatch&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

static_assert(1 + MultiCommon::kDataSize + kMultiSectionCount * MultiSection::kDataSize ==
              MultiPatch::kDataSize);

} // namespace K5000
} // namespace Kpatch
