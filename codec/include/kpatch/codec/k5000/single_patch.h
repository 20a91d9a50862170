// ==============================================================================
// Layer 1: K5000
// single_patch.h - K5000 single patch (variable size)
// ==============================================================================
//   0          checksum
//   1..81      common
//   82..       N sources x 86 (N = 2..6)
//   then       one additive kit (806) per ADD source, in source order
//
// The patch checksum covers the common block and the sources. Each additive
// kit carries its own checksum.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/text_field.h>
#include <kpatch/codec/k5000/additive_kit.h>
#include <kpatch/codec/k5000/control.h>
#include <kpatch/codec/k5000/effect_settings.h>
#include <kpatch/codec/k5000/k5000_types.h>
#include <kpatch/codec/k5000/source.h>

#include <array>
#include <string>
#include <vector>

namespace Kpatch {
namespace K5000 {

using PatchName = Codec::PatchName<kNameLength>;

// ==============================================================================
// Common
// ==============================================================================

/// Settings shared by all sources (81 bytes).
///
/// The four macros are stored split on the wire: the eight destinations
/// first, then the eight depths.
///
/// The source count byte belongs to SinglePatch. decode() range checks it,
/// encode() writes kMinSourceCount.
struct Common {
    static constexpr std::size_t kDataSize = 81;

    /// Position of the source count byte within the common block.
    static constexpr std::size_t kSourceCountOffset =
        EffectSettings::kDataSize + Geq::kDataSize + 1 + kNameLength + 3;

    EffectSettings effects;
    Geq geq;
    bool drumMark = false;
    PatchName name;
    Volume volume = Volume::of<115>();
    Polyphony polyphony = Polyphony::Poly;
    std::array<bool, kMaxSourceCount> sourceMutes{};  ///< true = muted
    AmplitudeModulation amplitudeModulation = AmplitudeModulation::Off;
    EffectControl effectControl;
    bool portamento = false;
    PortamentoLevel portamentoSpeed;
    std::array<MacroController, kMacroCount> macros{};
    SwitchControl switches;

    [[nodiscard]] static ParseResult<Common> decode(ByteView data,
                                                    const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const Common&) const = default;
};

static_assert(Common::kSourceCountOffset == 50);

// ==============================================================================
// Single Patch
// ==============================================================================

/// The source list holds 2..6 sources. Its length is the source count and its
/// ADD sources carry the additive kits, so only make() can change it.
struct SinglePatch {
    static constexpr std::size_t kCommonOffset = 1;
    static constexpr std::size_t kSourcesOffset = kCommonOffset + Common::kDataSize;

    /// Smallest encoded single: two PCM sources.
    static constexpr std::size_t kMinDataSize = kSourcesOffset + kMinSourceCount * Source::kDataSize;

    Common common;

    /// @return RangeError when `sources` does not hold 2..6 sources
    [[nodiscard]] static ParseResult<SinglePatch> make(Common common, std::vector<Source> sources);

    [[nodiscard]] const std::vector<Source>& sources() const noexcept { return sources_; }
    [[nodiscard]] std::size_t sourceCount() const noexcept { return sources_.size(); }

    /// @pre index < sourceCount()
    [[nodiscard]] Source& source(std::size_t index) { return sources_[index]; }
    [[nodiscard]] const Source& source(std::size_t index) const { return sources_[index]; }

    /// Size in bytes of the patch at the front of `data`, from its source
    /// count and the sources' wave numbers.
    /// @return TooShort when the common block or a source is cut off,
    ///         RangeError for a source count outside 2..6
    [[nodiscard]] static ParseResult<std::size_t> dataSizeFor(ByteView data);

    /// Size this patch encodes to.
    [[nodiscard]] std::size_t dataSize() const noexcept;

    /// Consumes exactly dataSizeFor(data) bytes.
    [[nodiscard]] static ParseResult<SinglePatch> decode(ByteView data,
                                                         const DecodeOptions& options = {});

    /// Checksum, common with the source count of sources(), sources, then the
    /// kit of each ADD source.
    [[nodiscard]] ByteBuffer encode() const;

    /// Checksum over the common block and the sources.
    [[nodiscard]] uint8_t checksum() const;

    [[nodiscard]] std::size_t additiveSourceCount() const noexcept;

    /// Source mute state as "123456" for the present sources, muted sources
    /// shown as '-'.
    [[nodiscard]] std::string sourceMuteString() const;

    bool operator==(const SinglePatch&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;

    std::vector<Source> sources_ = std::vector<Source>(kMinSourceCount);
};

} // namespace K5000
} // namespace Kpatch
