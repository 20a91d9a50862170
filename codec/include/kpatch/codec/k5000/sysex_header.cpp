// ==============================================================================
// K5000 SysEx Header Implementation
// ==============================================================================

#include "sysex_header.h"

#include <spdlog/fmt/fmt.h>

namespace Kpatch {
namespace K5000 {

std::string_view functionName(Function function) noexcept {
    switch (function) {
        case Function::OneBlockDumpRequest:          return "One Block Dump Request";
        case Function::AllBlockDumpRequest:          return "All Block Dump Request";
        case Function::ParameterSend:                return "Parameter Send";
        case Function::TrackControl:                 return "Track Control";
        case Function::OneBlockDump:                 return "One Block Dump";
        case Function::AllBlockDump:                 return "All Block Dump";
        case Function::ModeChange:                   return "Mode Change";
        case Function::Remote:                       return "Remote";
        case Function::WriteComplete:                return "Write Complete";
        case Function::WriteError:                   return "Write Error";
        case Function::WriteErrorByProtect:          return "Write Error (Protect)";
        case Function::WriteErrorByMemoryFull:       return "Write Error (Memory Full)";
        case Function::WriteErrorByNoExpandedMemory: return "Write Error (No Expanded Memory)";
    }
    return {};
}

std::string_view dumpKindName(DumpKind kind) noexcept {
    switch (kind) {
        case DumpKind::OneSingle:           return "One Single";
        case DumpKind::OneMulti:            return "One Multi";
        case DumpKind::OneDrumKit:          return "One Drum Kit";
        case DumpKind::OneDrumInstrument:   return "One Drum Instrument";
        case DumpKind::BlockSingle:         return "Block Single";
        case DumpKind::BlockMulti:          return "Block Multi";
        case DumpKind::BlockDrumInstrument: return "Block Drum Instrument";
    }
    return {};
}

// ==============================================================================
// Header
// ==============================================================================

ParseResult<Header> Header::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "header", options);
    reader.require(kFixedSize);
    Header header;
    header.channel = reader.value<Category::MidiChannel>("channel");

    const uint8_t rawFunction = reader.byte();
    if (!reader.failed()) {
        const auto function = functionFromByte(rawFunction);
        if (!function) {
            reader.fail(ParseError::invalidDiscriminant("function", rawFunction));
        } else if (const auto cardinality = cardinalityFrom(*function)) {
            header.cardinality = *cardinality;
        } else {
            reader.fail(ParseError::unidentified(
                fmt::format("k5000 function '{}'", functionName(*function))));
        }
    }

    header.group = reader.byte();
    header.machineId = reader.byte();
    if (!reader.failed() && (header.group != kGroup || header.machineId != kMachineId)) {
        reader.fail(ParseError::unidentified(fmt::format(
            "k5000 header (group {:02X}H, machine {:02X}H)", header.group, header.machineId)));
    }

    const uint8_t rawKind = reader.byte();
    if (!reader.failed()) {
        if (auto kind = patchKindFromByte(rawKind)) {
            header.kind = *kind;
        } else {
            reader.fail(ParseError::invalidDiscriminant("kind", rawKind));
        }
    }

    header.bank.reset();
    if (!reader.failed() && header.kind == PatchKind::Single) {
        header.bank = reader.enumeration<BankId>(kBankIdCount, "bank");
    }

    if (reader.failed()) {
        return reader.finish(std::move(header));
    }

    const DispatchRule* rule = header.rule();
    if (rule == nullptr) {
        reader.fail(ParseError::unidentified(fmt::format(
            "k5000 header ({} {}{})", cardinalityName(header.cardinality),
            patchKindName(header.kind),
            header.bank ? fmt::format(" bank {}", bankName(*header.bank)) : std::string{})));
        return reader.finish(std::move(header));
    }

    const ByteView sub = reader.bytes(rule->subByteCount);
    header.subBytes.assign(sub.begin(), sub.end());
    return reader.finish(std::move(header));
}

ByteBuffer Header::encode() const {
    ByteBuffer out = {channel.toWireByte(), static_cast<uint8_t>(cardinality), group, machineId,
                      static_cast<uint8_t>(kind)};
    if (kind == PatchKind::Single) {
        out.push_back(static_cast<uint8_t>(bank.value_or(BankId::A)));
    }
    out.insert(out.end(), subBytes.begin(), subBytes.end());
    return out;
}

} // namespace K5000
} // namespace Kpatch
