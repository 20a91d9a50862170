// ==============================================================================
// Layer 1: K5000
// block_dump.h - Consecutive single patches of a block single dump
// ==============================================================================
// Single patches differ in size (source count, additive kits), so a block
// cannot be indexed analytically. Each patch is sized with
// SinglePatch::dataSizeFor() and the offset accumulates front to back.
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/single_patch.h>
#include <kpatch/codec/k5000/sysex_header.h>
#include <kpatch/codec/k5000/tone_map.h>

#include <vector>

namespace Kpatch {
namespace K5000 {

struct BlockDump {
    BankId bank = BankId::A;
    std::vector<int> toneNumbers;      ///< 0-based, one per entry of `singles`
    std::vector<SinglePatch> singles;

    /// Decode the payload of a Block Single dump.
    ///
    /// With a tone map, exactly includedCount() singles are read and each gets
    /// the next included tone number. Bank B has no tone map: singles are read
    /// until the payload is exhausted, up to kToneCount.
    /// @return Unidentified for a header that is not a Block Single dump,
    ///         OffsetMismatch when bytes remain after the last single
    [[nodiscard]] static ParseResult<BlockDump> decode(const Header& header, ByteView payload,
                                                       const DecodeOptions& options = {});

    /// The singles concatenated in order.
    [[nodiscard]] ByteBuffer encode() const;

    [[nodiscard]] std::size_t dataSize() const noexcept;

    /// Map of the tones in `toneNumbers`.
    [[nodiscard]] ToneMap toneMap() const;

    bool operator==(const BlockDump&) const = default;
};

} // namespace K5000
} // namespace Kpatch
