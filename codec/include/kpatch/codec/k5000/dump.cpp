// ==============================================================================
// K5000 Dump Implementation
// ==============================================================================

#include "dump.h"

#include <kpatch/codec/core/logging.h>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace Kpatch {
namespace K5000 {

namespace {

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

/// Whole multis until the payload is exhausted.
ParseResult<std::vector<MultiPatch>> decodeMultis(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "block multi", options);
    const std::size_t count = data.size() / MultiPatch::kDataSize;
    if (count * MultiPatch::kDataSize != data.size()) {
        return ParseError::offsetMismatch("block multi", count * MultiPatch::kDataSize,
                                          data.size());
    }
    std::vector<MultiPatch> multis;
    multis.reserve(count);
    for (std::size_t i = 0; i < count && !reader.failed(); ++i) {
        multis.push_back(reader.block<MultiPatch>(fmt::format("multi {}", i + 1)));
    }
    return reader.finish(std::move(multis));
}

} // namespace

ParseResult<Dump> identify(ByteView message, const DecodeOptions& options) {
    auto header = Header::decode(message, options);
    if (!header) {
        return header.error();
    }
    const DispatchRule* rule = header->rule();
    if (rule == nullptr) {
        return ParseError::unidentified("k5000 header");
    }

    Dump dump;
    dump.header = header.value();
    dump.kind = rule->dumpKind;
    if (rule->subByteCount == 1) {
        dump.number = header->subBytes.front();
    } else if (rule->subByteCount == ToneMap::kDataSize) {
        auto map = ToneMap::decode(header->subBytes, options);
        if (!map) {
            return map.error();
        }
        dump.toneMap = map.value();
    }
    const ByteView payload = message.subspan(header->size());
    dump.payload.assign(payload.begin(), payload.end());

    Codec::logger()->debug("k5000: {}{}, payload {} bytes", dumpKindName(dump.kind),
                           header->bank ? fmt::format(" bank {}", bankName(*header->bank))
                                        : std::string{},
                           dump.payload.size());
    return dump;
}

ParseResult<Payload> Dump::decodePayload(const DecodeOptions& options) const {
    const ByteView data(payload);
    switch (kind) {
        case DumpKind::OneSingle:
            return toPayload(SinglePatch::decode(data, options));
        case DumpKind::OneMulti:
            return toPayload(MultiPatch::decode(data, options));
        case DumpKind::BlockSingle:
            return toPayload(BlockDump::decode(header, data, options));
        case DumpKind::BlockMulti:
            return toPayload(decodeMultis(data, options));
        case DumpKind::OneDrumKit:
        case DumpKind::OneDrumInstrument:
        case DumpKind::BlockDrumInstrument:
            return Payload(std::in_place_type<ByteBuffer>, payload);
    }
    return ParseError::unidentified("k5000 dump kind");
}

} // namespace K5000
} // namespace Kpatch
