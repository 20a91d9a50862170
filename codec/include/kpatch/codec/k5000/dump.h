// ==============================================================================
// Layer 1: K5000
// dump.h - K5000 dump classification and payload dispatch
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/block_dump.h>
#include <kpatch/codec/k5000/multi_patch.h>
#include <kpatch/codec/k5000/single_patch.h>
#include <kpatch/codec/k5000/sysex_header.h>
#include <kpatch/codec/k5000/tone_map.h>

#include <optional>
#include <variant>
#include <vector>

namespace Kpatch {
namespace K5000 {

/// Decoded payload of a dump, by kind. Drum kit and drum instrument payloads
/// are carried as raw bytes.
using Payload = std::variant<SinglePatch, MultiPatch, BlockDump, std::vector<MultiPatch>,
                             ByteBuffer>;

struct Dump {
    Header header;
    DumpKind kind = DumpKind::OneSingle;
    std::optional<int> number;       ///< Tone, multi or instrument number of a One dump
    std::optional<ToneMap> toneMap;  ///< Block single dumps of banks A, D, E and F
    ByteBuffer payload;              ///< Bytes after the header

    [[nodiscard]] ParseResult<Payload> decodePayload(const DecodeOptions& options = {}) const;
};

/// Classify a message (header + payload).
/// @return Unidentified when no rule matches, InvalidDiscriminant for an
///         unknown function, kind or bank byte, TooShort when the header is
///         incomplete
[[nodiscard]] ParseResult<Dump> identify(ByteView message, const DecodeOptions& options = {});

} // namespace K5000
} // namespace Kpatch
