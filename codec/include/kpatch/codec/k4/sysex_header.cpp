// ==============================================================================
// K4 SysEx Header Implementation
// ==============================================================================

#include "sysex_header.h"

#include <kpatch/codec/core/logging.h>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace Kpatch {
namespace K4 {

namespace {

/// Decode `count` consecutive blocks of T.
template <typename T>
ParseResult<std::vector<T>> decodeBlocks(ByteView data, std::size_t count,
                                         std::string_view context, std::string_view item,
                                         const DecodeOptions& options) {
    ByteReader reader(data, context, options);
    if (!reader.require(count * T::kDataSize)) {
        return reader.finish(std::vector<T>{});
    }
    std::vector<T> blocks;
    blocks.reserve(count);
    for (std::size_t i = 0; i < count && !reader.failed(); ++i) {
        blocks.push_back(reader.block<T>(fmt::format("{} {}", item, i + 1)));
    }
    return reader.finish(std::move(blocks));
}

/// Re-wrap a typed decode result as a Payload, keeping warnings.
template <typename T>
ParseResult<Payload> toPayload(ParseResult<T>&& decoded) {
    if (!decoded) {
        return decoded.error();
    }
    const std::vector<ParseError> warnings = decoded.warnings();
    ParseResult<Payload> result(Payload(std::move(decoded).value()));
    result.addWarnings(warnings);
    return result;
}

} // namespace

std::string_view functionName(Function function) noexcept {
    switch (function) {
        case Function::OnePatchDumpRequest:   return "One Patch Dump Request";
        case Function::BlockPatchDumpRequest: return "Block Patch Dump Request";
        case Function::AllPatchDumpRequest:   return "All Patch Dump Request";
        case Function::ParameterSend:         return "Parameter Send";
        case Function::OnePatchDataDump:      return "One Patch Data Dump";
        case Function::BlockPatchDataDump:    return "Block Patch Data Dump";
        case Function::AllPatchDataDump:      return "All Patch Data Dump";
        case Function::EditBufferDump:        return "Edit Buffer Dump";
        case Function::ProgramChange:         return "Program Change";
        case Function::WriteComplete:         return "Write Complete";
        case Function::WriteError:            return "Write Error";
        case Function::WriteErrorProtect:     return "Write Error (Protect)";
        case Function::WriteErrorNoCard:      return "Write Error (No Card)";
    }
    return {};
}

std::string_view dumpKindName(DumpKind kind) noexcept {
    switch (kind) {
        case DumpKind::OneSingle:   return "One Single";
        case DumpKind::OneMulti:    return "One Multi";
        case DumpKind::OneEffect:   return "One Effect";
        case DumpKind::Drum:        return "Drum";
        case DumpKind::BlockSingle: return "Block Single";
        case DumpKind::BlockMulti:  return "Block Multi";
        case DumpKind::BlockEffect: return "Block Effect";
        case DumpKind::All:         return "All";
    }
    return {};
}

// ==============================================================================
// Header
// ==============================================================================

ParseResult<Header> Header::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "header", options);
    reader.require(kDataSize);
    Header header;
    header.channel = reader.value<Category::MidiChannel>("channel");
    const uint8_t rawFunction = reader.byte();
    if (!reader.failed()) {
        if (auto function = functionFromByte(rawFunction)) {
            header.function = *function;
        } else {
            reader.fail(ParseError::invalidDiscriminant("function", rawFunction));
        }
    }
    header.group = reader.byte();
    header.machineId = reader.byte();
    header.substatus1 = reader.byte();
    header.substatus2 = reader.byte();
    return reader.finish(header);
}

ByteBuffer Header::encode() const {
    return {channel.toWireByte(), static_cast<uint8_t>(function), group, machineId, substatus1,
            substatus2};
}

// ==============================================================================
// Classification
// ==============================================================================

ParseResult<Dump> identify(ByteView message, const DecodeOptions& options) {
    auto header = Header::decode(message, options);
    if (!header) {
        return header.error();
    }
    if (header->group != kGroup || header->machineId != kMachineId) {
        return ParseError::unidentified(
            fmt::format("k4 header (group {:02X}H, machine {:02X}H)", header->group,
                        header->machineId));
    }

    const DispatchRule* rule =
        findRule(header->function, header->substatus1, header->substatus2);
    if (rule == nullptr) {
        return ParseError::unidentified(
            fmt::format("k4 header ({:02X}H {:02X}H {:02X}H)",
                        static_cast<uint8_t>(header->function), header->substatus1,
                        header->substatus2));
    }

    Dump dump;
    dump.header = header.value();
    dump.kind = rule->kind;
    dump.locality = rule->locality;
    dump.number = header->substatus2 - rule->sub2Low;
    const ByteView payload = message.subspan(Header::kDataSize);
    dump.payload.assign(payload.begin(), payload.end());

    Codec::logger()->debug("k4: {} {} #{}, payload {} bytes", dumpKindName(dump.kind),
                           localityName(dump.locality), dump.number, dump.payload.size());
    return dump;
}

ParseResult<Payload> Dump::decodePayload(const DecodeOptions& options) const {
    const ByteView data(payload);
    switch (kind) {
        case DumpKind::OneSingle:
            return toPayload(SinglePatch::decode(data, options));
        case DumpKind::OneMulti:
            return toPayload(MultiPatch::decode(data, options));
        case DumpKind::OneEffect:
            return toPayload(EffectPatch::decode(data, options));
        case DumpKind::Drum:
            return toPayload(DrumPatch::decode(data, options));
        case DumpKind::BlockSingle:
            return toPayload(decodeBlocks<SinglePatch>(data, kBankSingleCount, "block single",
                                                       "single", options));
        case DumpKind::BlockMulti:
            return toPayload(decodeBlocks<MultiPatch>(data, kBankMultiCount, "block multi",
                                                      "multi", options));
        case DumpKind::BlockEffect:
            return toPayload(decodeBlocks<EffectPatch>(data, kBankEffectCount, "block effect",
                                                       "effect", options));
        case DumpKind::All:
            return toPayload(Bank::decode(data, options));
    }
    return ParseError::unidentified("k4 dump kind");
}

} // namespace K4
} // namespace Kpatch
