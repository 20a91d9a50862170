// ==============================================================================
// Layer 1: K4
// sysex_header.h - K4 message header and dump classification
// ==============================================================================
// A K4 message (without F0, the 0x40 manufacturer byte and F7) is a 6-byte
// header followed by the payload:
//
//   0  channel (0..15)
//   1  function
//   2  group (0x00)
//   3  machine id (0x04)
//   4  substatus 1
//   5  substatus 2
//
// identify() matches (function, substatus 1, substatus 2) against a table of
// mutually exclusive rules. Each rule names the dump kind and its locality.
// ==============================================================================

#pragma once

#include <kpatch/codec/k4/bank.h>
#include <kpatch/codec/k4/k4_types.h>

#include <array>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace Kpatch {
namespace K4 {

// ==============================================================================
// Function
// ==============================================================================

enum class Function : uint8_t {
    OnePatchDumpRequest = 0x00,
    BlockPatchDumpRequest = 0x01,
    AllPatchDumpRequest = 0x02,
    ParameterSend = 0x10,
    OnePatchDataDump = 0x20,
    BlockPatchDataDump = 0x21,
    AllPatchDataDump = 0x22,
    EditBufferDump = 0x23,
    ProgramChange = 0x30,
    WriteComplete = 0x40,
    WriteError = 0x41,
    WriteErrorProtect = 0x42,
    WriteErrorNoCard = 0x43
};

inline constexpr std::array<Function, 13> kFunctions = {
    Function::OnePatchDumpRequest, Function::BlockPatchDumpRequest,
    Function::AllPatchDumpRequest, Function::ParameterSend,
    Function::OnePatchDataDump,    Function::BlockPatchDataDump,
    Function::AllPatchDataDump,    Function::EditBufferDump,
    Function::ProgramChange,       Function::WriteComplete,
    Function::WriteError,          Function::WriteErrorProtect,
    Function::WriteErrorNoCard
};

/// Function codes are sparse, so membership is checked against kFunctions.
[[nodiscard]] constexpr std::optional<Function> functionFromByte(uint8_t raw) noexcept {
    for (Function f : kFunctions) {
        if (static_cast<uint8_t>(f) == raw) {
            return f;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::string_view functionName(Function function) noexcept;

// ==============================================================================
// Header
// ==============================================================================

inline constexpr uint8_t kGroup = 0x00;
inline constexpr uint8_t kMachineId = 0x04;

struct Header {
    static constexpr std::size_t kDataSize = 6;

    MidiChannel channel;
    Function function = Function::OnePatchDataDump;
    uint8_t group = kGroup;
    uint8_t machineId = kMachineId;
    uint8_t substatus1 = 0;
    uint8_t substatus2 = 0;

    [[nodiscard]] static ParseResult<Header> decode(ByteView data,
                                                    const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const Header&) const = default;
};

// ==============================================================================
// Classification
// ==============================================================================

enum class Locality : uint8_t {
    Internal = 0,  ///< INT
    External       ///< EXT (memory card)
};

[[nodiscard]] constexpr std::string_view localityName(Locality locality) noexcept {
    return locality == Locality::Internal ? "INT" : "EXT";
}

enum class DumpKind : uint8_t {
    OneSingle = 0,
    OneMulti,
    OneEffect,
    Drum,
    BlockSingle,
    BlockMulti,
    BlockEffect,
    All
};

inline constexpr uint8_t kDumpKindCount = 8;

[[nodiscard]] std::string_view dumpKindName(DumpKind kind) noexcept;

/// Payload size in bytes for each dump kind.
[[nodiscard]] constexpr std::size_t payloadSize(DumpKind kind) noexcept {
    switch (kind) {
        case DumpKind::OneSingle:   return SinglePatch::kDataSize;
        case DumpKind::OneMulti:    return MultiPatch::kDataSize;
        case DumpKind::OneEffect:   return EffectPatch::kDataSize;
        case DumpKind::Drum:        return DrumPatch::kDataSize;
        case DumpKind::BlockSingle: return Bank::kSinglesSize;
        case DumpKind::BlockMulti:  return Bank::kMultisSize;
        case DumpKind::BlockEffect: return Bank::kEffectsSize;
        case DumpKind::All:         return Bank::kDataSize;
    }
    return 0;
}

/// One row of the dispatch table. Substatus 2 matches the closed range
/// [sub2Low, sub2High]; the patch number is substatus 2 minus sub2Low.
struct DispatchRule {
    Function function;
    uint8_t substatus1;
    uint8_t sub2Low;
    uint8_t sub2High;
    DumpKind kind;
    Locality locality;

    [[nodiscard]] constexpr bool matches(Function f, uint8_t sub1, uint8_t sub2) const noexcept {
        return f == function && sub1 == substatus1 && sub2 >= sub2Low && sub2 <= sub2High;
    }
};

inline constexpr std::array<DispatchRule, 16> kDispatchRules = {{
    {Function::OnePatchDataDump, 0x00, 0, 63, DumpKind::OneSingle, Locality::Internal},
    {Function::OnePatchDataDump, 0x00, 64, 127, DumpKind::OneMulti, Locality::Internal},
    {Function::OnePatchDataDump, 0x02, 0, 63, DumpKind::OneSingle, Locality::External},
    {Function::OnePatchDataDump, 0x02, 64, 127, DumpKind::OneMulti, Locality::External},
    {Function::OnePatchDataDump, 0x01, 0, 31, DumpKind::OneEffect, Locality::Internal},
    {Function::OnePatchDataDump, 0x03, 0, 31, DumpKind::OneEffect, Locality::External},
    {Function::OnePatchDataDump, 0x01, 32, 32, DumpKind::Drum, Locality::Internal},
    {Function::OnePatchDataDump, 0x03, 32, 32, DumpKind::Drum, Locality::External},
    {Function::BlockPatchDataDump, 0x00, 0x00, 0x00, DumpKind::BlockSingle, Locality::Internal},
    {Function::BlockPatchDataDump, 0x00, 0x40, 0x40, DumpKind::BlockMulti, Locality::Internal},
    {Function::BlockPatchDataDump, 0x02, 0x00, 0x00, DumpKind::BlockSingle, Locality::External},
    {Function::BlockPatchDataDump, 0x02, 0x40, 0x40, DumpKind::BlockMulti, Locality::External},
    {Function::BlockPatchDataDump, 0x01, 0x00, 0x00, DumpKind::BlockEffect, Locality::Internal},
    {Function::BlockPatchDataDump, 0x03, 0x00, 0x00, DumpKind::BlockEffect, Locality::External},
    {Function::AllPatchDataDump, 0x00, 0x00, 0x00, DumpKind::All, Locality::Internal},
    {Function::AllPatchDataDump, 0x02, 0x00, 0x00, DumpKind::All, Locality::External},
}};

/// First matching rule, if any.
[[nodiscard]] constexpr const DispatchRule* findRule(Function f, uint8_t sub1,
                                                     uint8_t sub2) noexcept {
    for (const auto& rule : kDispatchRules) {
        if (rule.matches(f, sub1, sub2)) {
            return &rule;
        }
    }
    return nullptr;
}

/// Decoded payload of a dump, by kind.
using Payload = std::variant<SinglePatch, MultiPatch, EffectPatch, DrumPatch,
                             std::vector<SinglePatch>, std::vector<MultiPatch>,
                             std::vector<EffectPatch>, Bank>;

struct Dump {
    Header header;
    DumpKind kind = DumpKind::All;
    Locality locality = Locality::Internal;
    int number = 0;       ///< Patch number within its kind (OneSingle, OneMulti, OneEffect)
    ByteBuffer payload;   ///< Bytes after the header

    /// Hand the payload to the composite decoder for this kind.
    [[nodiscard]] ParseResult<Payload> decodePayload(const DecodeOptions& options = {}) const;

    [[nodiscard]] std::size_t expectedPayloadSize() const noexcept { return payloadSize(kind); }
};

/// Classify a message (header + payload).
/// @return Unidentified when no rule matches, InvalidDiscriminant for an
///         unknown function byte, TooShort when the header is incomplete
[[nodiscard]] ParseResult<Dump> identify(ByteView message, const DecodeOptions& options = {});

} // namespace K4
} // namespace Kpatch
