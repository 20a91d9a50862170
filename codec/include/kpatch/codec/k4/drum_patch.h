// ==============================================================================
// Layer 1: K4
// drum_patch.h - K4 drum patch (682 bytes)
// ==============================================================================
// Common block (11 bytes, own checksum) followed by 61 notes of 11 bytes.
// Each note holds two 5-byte drum sources interleaved with stride 2, then the
// note checksum. The note submix lives in bits 4-6 of source 1 byte 0.
// The drum patch has no overall checksum.
// ==============================================================================

#pragma once

#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/wave.h>

#include <array>

namespace Kpatch {
namespace K4 {

struct DrumCommon {
    static constexpr std::size_t kDataSize = 11;

    MidiChannel channel = MidiChannel::of<10>();
    Level volume = Level::of<100>();
    Level velocityDepth;

    [[nodiscard]] static ParseResult<DrumCommon> decode(ByteView data,
                                                        const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;
    [[nodiscard]] uint8_t checksum() const;

    bool operator==(const DrumCommon&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

/// Wave (2 bytes), decay, tune, level.
struct DrumSource {
    static constexpr std::size_t kDataSize = 5;

    WaveNumber wave;
    Level decay = Level::of<1>();
    Depth tune;
    Level level = Level::of<100>();

    [[nodiscard]] static ParseResult<DrumSource> decode(ByteView data,
                                                        const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const DrumSource&) const = default;
};

struct DrumNote {
    static constexpr std::size_t kDataSize = 11;

    Submix submix = Submix::A;
    DrumSource source1;
    DrumSource source2;

    [[nodiscard]] static ParseResult<DrumNote> decode(ByteView data,
                                                      const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;
    [[nodiscard]] uint8_t checksum() const;

    bool operator==(const DrumNote&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

struct DrumPatch {
    static constexpr std::size_t kDataSize = DrumCommon::kDataSize
                                             + kDrumNoteCount * DrumNote::kDataSize;

    DrumCommon common;
    std::array<DrumNote, kDrumNoteCount> notes{};

    [[nodiscard]] static ParseResult<DrumPatch> decode(ByteView data,
                                                       const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const DrumPatch&) const = default;
};

static_assert(DrumPatch::kDataSize == 682);

} // namespace K4
} // namespace Kpatch
