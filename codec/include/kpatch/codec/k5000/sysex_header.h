// ==============================================================================
// Layer 1: K5000
// sysex_header.h - K5000 dump header and dispatch rules
// ==============================================================================
// A K5000 dump (without F0, the 0x40 manufacturer byte and F7) starts with a
// variable-length header:
//
//   0     channel (0..15)
//   1     cardinality (0x20 one, 0x21 block)
//   2     group (0x00)
//   3     machine id (0x0A)
//   4     kind
//   5     bank (singles only)
//   then  sub-bytes: a tone or section number, a 19-byte tone map, or none
//
// The rule matched by (cardinality, kind, bank) decides how many sub-bytes
// follow, so the header size is only known after classification.
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/k5000_types.h>
#include <kpatch/codec/k5000/tone_map.h>

#include <array>
#include <optional>
#include <string_view>

namespace Kpatch {
namespace K5000 {

// ==============================================================================
// Function
// ==============================================================================

enum class Function : uint8_t {
    OneBlockDumpRequest = 0x00,
    AllBlockDumpRequest = 0x01,
    ParameterSend = 0x10,
    TrackControl = 0x11,
    OneBlockDump = 0x20,
    AllBlockDump = 0x21,
    ModeChange = 0x31,
    Remote = 0x32,
    WriteComplete = 0x40,
    WriteError = 0x41,
    WriteErrorByProtect = 0x42,
    WriteErrorByMemoryFull = 0x44,
    WriteErrorByNoExpandedMemory = 0x45
};

inline constexpr std::array<Function, 13> kFunctions = {
    Function::OneBlockDumpRequest, Function::AllBlockDumpRequest,
    Function::ParameterSend,       Function::TrackControl,
    Function::OneBlockDump,        Function::AllBlockDump,
    Function::ModeChange,          Function::Remote,
    Function::WriteComplete,       Function::WriteError,
    Function::WriteErrorByProtect, Function::WriteErrorByMemoryFull,
    Function::WriteErrorByNoExpandedMemory
};

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
// Header Fields
// ==============================================================================

/// The two dump functions, as they appear in byte 1.
enum class Cardinality : uint8_t {
    One = 0x20,
    Block = 0x21
};

[[nodiscard]] constexpr std::optional<Cardinality> cardinalityFrom(Function function) noexcept {
    switch (function) {
        case Function::OneBlockDump: return Cardinality::One;
        case Function::AllBlockDump: return Cardinality::Block;
        default:                     return std::nullopt;
    }
}

[[nodiscard]] constexpr std::string_view cardinalityName(Cardinality cardinality) noexcept {
    return cardinality == Cardinality::One ? "One" : "Block";
}

enum class PatchKind : uint8_t {
    Single = 0x00,
    DrumKit = 0x10,
    DrumInstrument = 0x11,
    Multi = 0x20  ///< "Combi" on the K5000W
};

inline constexpr std::array<PatchKind, 4> kPatchKinds = {
    PatchKind::Single, PatchKind::DrumKit, PatchKind::DrumInstrument, PatchKind::Multi
};

[[nodiscard]] constexpr std::optional<PatchKind> patchKindFromByte(uint8_t raw) noexcept {
    for (PatchKind k : kPatchKinds) {
        if (static_cast<uint8_t>(k) == raw) {
            return k;
        }
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::string_view patchKindName(PatchKind kind) noexcept {
    switch (kind) {
        case PatchKind::Single:         return "Single";
        case PatchKind::DrumKit:        return "Drum Kit";
        case PatchKind::DrumInstrument: return "Drum Instrument";
        case PatchKind::Multi:          return "Multi/Combi";
    }
    return {};
}

/// Single patch banks. There is no bank C; D exists on the K5000S/R only.
enum class BankId : uint8_t {
    A = 0,  ///< ADD
    B,      ///< PCM
    D,      ///< ADD
    E,      ///< Expansion
    F       ///< Expansion
};

inline constexpr uint8_t kBankIdCount = 5;

[[nodiscard]] constexpr std::string_view bankName(BankId bank) noexcept {
    constexpr std::array<std::string_view, kBankIdCount> kNames = {"A", "B", "D", "E", "F"};
    const auto index = static_cast<std::size_t>(bank);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

[[nodiscard]] constexpr uint8_t bankBit(BankId bank) noexcept {
    return static_cast<uint8_t>(1u << static_cast<unsigned>(bank));
}

// ==============================================================================
// Classification
// ==============================================================================

enum class DumpKind : uint8_t {
    OneSingle = 0,
    OneMulti,
    OneDrumKit,
    OneDrumInstrument,
    BlockSingle,
    BlockMulti,
    BlockDrumInstrument
};

inline constexpr uint8_t kDumpKindCount = 7;

[[nodiscard]] std::string_view dumpKindName(DumpKind kind) noexcept;

/// One row of the dispatch table. `bankMask` has one bit per BankId and is
/// zero for kinds whose header has no bank byte.
struct DispatchRule {
    Cardinality cardinality;
    PatchKind kind;
    uint8_t bankMask;
    uint8_t subByteCount;
    DumpKind dumpKind;

    [[nodiscard]] constexpr bool matches(Cardinality c, PatchKind k,
                                         std::optional<BankId> bank) const noexcept {
        if (c != cardinality || k != kind) {
            return false;
        }
        if (!bank) {
            return bankMask == 0;
        }
        return (bankMask & bankBit(*bank)) != 0;
    }
};

inline constexpr uint8_t kAllBanks = bankBit(BankId::A) | bankBit(BankId::B) |
                                     bankBit(BankId::D) | bankBit(BankId::E) |
                                     bankBit(BankId::F);

/// Banks whose block dumps carry a tone map. Bank B always dumps all tones.
inline constexpr uint8_t kToneMapBanks = kAllBanks & static_cast<uint8_t>(~bankBit(BankId::B));

inline constexpr std::array<DispatchRule, 8> kDispatchRules = {{
    {Cardinality::One, PatchKind::Single, kAllBanks, 1, DumpKind::OneSingle},
    {Cardinality::One, PatchKind::Multi, 0, 1, DumpKind::OneMulti},
    {Cardinality::One, PatchKind::DrumKit, 0, 0, DumpKind::OneDrumKit},
    {Cardinality::One, PatchKind::DrumInstrument, 0, 1, DumpKind::OneDrumInstrument},
    {Cardinality::Block, PatchKind::Single, kToneMapBanks,
     static_cast<uint8_t>(ToneMap::kDataSize), DumpKind::BlockSingle},
    {Cardinality::Block, PatchKind::Single, bankBit(BankId::B), 0, DumpKind::BlockSingle},
    {Cardinality::Block, PatchKind::Multi, 0, 0, DumpKind::BlockMulti},
    {Cardinality::Block, PatchKind::DrumInstrument, 0, 0, DumpKind::BlockDrumInstrument},
}};

[[nodiscard]] constexpr const DispatchRule* findRule(Cardinality c, PatchKind k,
                                                     std::optional<BankId> bank) noexcept {
    for (const auto& rule : kDispatchRules) {
        if (rule.matches(c, k, bank)) {
            return &rule;
        }
    }
    return nullptr;
}

// ==============================================================================
// Header
// ==============================================================================

inline constexpr uint8_t kGroup = 0x00;
inline constexpr uint8_t kMachineId = 0x0A;

struct Header {
    /// Channel, cardinality, group, machine id, kind.
    static constexpr std::size_t kFixedSize = 5;

    MidiChannel channel;
    Cardinality cardinality = Cardinality::One;
    uint8_t group = kGroup;
    uint8_t machineId = kMachineId;
    PatchKind kind = PatchKind::Single;
    std::optional<BankId> bank = BankId::A;  ///< Present for singles only
    ByteBuffer subBytes;

    [[nodiscard]] std::size_t size() const noexcept {
        return kFixedSize + (kind == PatchKind::Single ? 1 : 0) + subBytes.size();
    }

    /// Reads the fixed bytes, matches them against kDispatchRules and reads
    /// as many sub-bytes as the matching rule calls for.
    /// @return Unidentified when no rule matches, InvalidDiscriminant for an
    ///         unknown function, kind or bank byte, TooShort when cut off
    [[nodiscard]] static ParseResult<Header> decode(ByteView data,
                                                    const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    [[nodiscard]] const DispatchRule* rule() const noexcept {
        return findRule(cardinality, kind, bank);
    }

    bool operator==(const Header&) const = default;
};

} // namespace K5000
} // namespace Kpatch
