// ==============================================================================
// Layer 1: K4
// single_patch.h - K4 single patch (131 bytes)
// ==============================================================================
//   s0..s9     name
//   s10        volume
//   s11        effect number, bits 0-4
//   s12        submix, bits 0-2
//   s13        source mode 0-1, polyphony mode 2-3, AM1>2 bit 4, AM3>4 bit 5
//   s14        source "not muted" bits 0-3, vibrato shape bits 4-5
//   s15        bender range 0-3, wheel assign 4-5
//   s16        vibrato speed
//   s17        wheel depth
//   s18..s21   auto-bend
//   s22, s23   vibrato pressure, vibrato depth
//   s24..s28   LFO
//   s29        pressure > frequency
//   s30..s57   4 sources, interleaved
//   s58..s101  4 amplifiers, interleaved
//   s102..s129 2 filters, interleaved
//   s130       checksum
// ==============================================================================

#pragma once

#include <kpatch/codec/core/text_field.h>
#include <kpatch/codec/k4/amplifier.h>
#include <kpatch/codec/k4/filter.h>
#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/lfo.h>
#include <kpatch/codec/k4/source.h>

#include <array>
#include <string>

namespace Kpatch {
namespace K4 {

enum class SourceMode : uint8_t {
    Normal = 0,
    Twin,
    Double
};

inline constexpr uint8_t kSourceModeCount = 3;

enum class PolyphonyMode : uint8_t {
    Poly1 = 0,
    Poly2,
    Solo1,
    Solo2
};

inline constexpr uint8_t kPolyphonyModeCount = 4;

enum class WheelAssign : uint8_t {
    Vibrato = 0,
    Lfo,
    Dcf
};

inline constexpr uint8_t kWheelAssignCount = 3;

using PatchName = Codec::PatchName<kNameLength>;

struct SinglePatch {
    static constexpr std::size_t kDataSize = 131;

    PatchName name;
    Level volume = Level::of<100>();
    EffectNumber effect;
    Submix submix = Submix::A;
    SourceMode sourceMode = SourceMode::Normal;
    PolyphonyMode polyphonyMode = PolyphonyMode::Poly1;
    bool am12 = false;
    bool am34 = false;
    std::array<bool, kSourceCount> sourceMutes{};  ///< true = muted
    BenderRange benderRange;
    WheelAssign wheelAssign = WheelAssign::Dcf;
    Depth wheelDepth;
    AutoBend autoBend;
    Vibrato vibrato;
    Lfo lfo;
    Depth pressureFrequency;
    std::array<Source, kSourceCount> sources{};
    std::array<Amplifier, kSourceCount> amplifiers{};
    std::array<Filter, kFilterCount> filters{};

    [[nodiscard]] static ParseResult<SinglePatch> decode(ByteView data,
                                                         const DecodeOptions& options = {});

    /// Body followed by its checksum.
    [[nodiscard]] ByteBuffer encode() const;

    /// Checksum of the encoded body (s0..s129).
    [[nodiscard]] uint8_t checksum() const;

    /// Source mute state as "1234", muted sources shown as '-'.
    [[nodiscard]] std::string sourceMuteString() const;

    bool operator==(const SinglePatch&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

} // namespace K4
} // namespace Kpatch
