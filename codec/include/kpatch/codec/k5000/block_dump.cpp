// ==============================================================================
// K5000 Block Dump Implementation
// ==============================================================================

#include "block_dump.h"

#include <kpatch/codec/core/logging.h>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace Kpatch {
namespace K5000 {

namespace {

/// Size and decode the single at the reader's position.
SinglePatch readSingle(ByteReader& reader, int tone) {
    const auto field = fmt::format("tone {}", tone + 1);
    if (reader.failed()) {
        return SinglePatch{};
    }
    auto size = SinglePatch::dataSizeFor(reader.data().subspan(reader.offset()));
    if (!size) {
        reader.fail(size.error().relabeled(field));
        return SinglePatch{};
    }
    Codec::logger()->debug("k5000 block: tone {} at offset {}, {} bytes", tone + 1,
                           reader.offset(), size.value());
    return reader.blockFrom<SinglePatch>(reader.bytes(size.value()), field);
}

} // namespace

ParseResult<BlockDump> BlockDump::decode(const Header& header, ByteView payload,
                                         const DecodeOptions& options) {
    const DispatchRule* rule = header.rule();
    if (rule == nullptr || rule->dumpKind != DumpKind::BlockSingle || !header.bank) {
        return ParseError::unidentified("k5000 block single header");
    }

    ByteReader reader(payload, "block single", options);
    BlockDump dump;
    dump.bank = *header.bank;

    if (rule->subByteCount == ToneMap::kDataSize) {
        auto map = ToneMap::decode(header.subBytes, options);
        if (!map) {
            return map.error().within("block single");
        }
        for (int tone : map->tones()) {
            if (reader.failed()) {
                break;
            }
            dump.singles.push_back(readSingle(reader, tone));
            dump.toneNumbers.push_back(tone);
        }
    } else {
        // A tail shorter than the smallest single is left for the check below.
        for (int tone = 0; tone < static_cast<int>(kToneCount) &&
                           reader.remaining() >= SinglePatch::kMinDataSize && !reader.failed();
             ++tone) {
            dump.singles.push_back(readSingle(reader, tone));
            dump.toneNumbers.push_back(tone);
        }
    }

    if (!reader.failed() && reader.remaining() != 0) {
        reader.fail(ParseError::offsetMismatch(std::string{}, payload.size(), reader.offset()));
    }
    return reader.finish(std::move(dump));
}

ByteBuffer BlockDump::encode() const {
    ByteWriter writer(dataSize());
    for (const auto& single : singles) {
        writer.block(single);
    }
    return std::move(writer).take();
}

std::size_t BlockDump::dataSize() const noexcept {
    std::size_t size = 0;
    for (const auto& single : singles) {
        size += single.dataSize();
    }
    return size;
}

ToneMap BlockDump::toneMap() const {
    ToneMap map;
    for (int tone : toneNumbers) {
        map.include(static_cast<std::size_t>(tone));
    }
    return map;
}

} // namespace K5000
} // namespace Kpatch
