// ==============================================================================
// K4 Drum Patch Implementation
// ==============================================================================

#include "drum_patch.h"

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/interleave.h>

namespace Kpatch {
namespace K4 {

namespace {

/// Number of zero bytes after the three common parameters.
constexpr std::size_t kCommonPadding = 7;

} // namespace

// ==============================================================================
// DrumCommon
// ==============================================================================

ParseResult<DrumCommon> DrumCommon::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "drum common", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(DrumCommon{});
    }
    DrumCommon common;
    common.channel = reader.value<Category::MidiChannel>("channel");
    common.volume = reader.value<Category::K4Level>("volume");
    common.velocityDepth = reader.value<Category::K4Level>("velocity depth");
    reader.skip(kCommonPadding);
    const uint8_t stored = reader.byte();
    reader.verifyChecksum(Codec::checksum(data.first(kDataSize - 1)), stored);
    return reader.finish(common);
}

ByteBuffer DrumCommon::encodeBody() const {
    ByteWriter writer(kDataSize);
    writer.value(channel);
    writer.value(volume);
    writer.value(velocityDepth);
    writer.zeros(kCommonPadding);
    return std::move(writer).take();
}

ByteBuffer DrumCommon::encode() const {
    ByteBuffer body = encodeBody();
    body.push_back(Codec::checksum(body));
    return body;
}

uint8_t DrumCommon::checksum() const {
    return Codec::checksum(encodeBody());
}

// ==============================================================================
// DrumSource
// ==============================================================================

ParseResult<DrumSource> DrumSource::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "drum source", options);
    reader.require(kDataSize);
    DrumSource source;
    const uint8_t high = reader.byte();
    const uint8_t low = reader.byte();
    source.wave = reader.valueFrom<Category::K4WaveNumber>(waveWireValue(high, low), "wave");
    source.decay = reader.value<Category::K4Level>("decay");
    source.tune = reader.value<Category::K4Depth>("tune");
    source.level = reader.value<Category::K4Level>("level");
    return reader.finish(source);
}

ByteBuffer DrumSource::encode() const {
    const auto waveBytes = encodeWave(wave);
    return {waveBytes[0], waveBytes[1], decay.toWireByte(), tune.toWireByte(),
            level.toWireByte()};
}

// ==============================================================================
// DrumNote
// ==============================================================================

ParseResult<DrumNote> DrumNote::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "drum note", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(DrumNote{});
    }
    DrumNote note;
    const ByteView region = reader.bytes(2 * DrumSource::kDataSize);
    ByteBuffer first = Codec::strideGather(region, 2, 0, DrumSource::kDataSize);
    const ByteBuffer second = Codec::strideGather(region, 2, 1, DrumSource::kDataSize);

    note.submix = reader.enumeration<Submix>(Codec::bitField(first[0], 4, 3), kSubmixValueCount,
                                             "submix");
    first[0] = Codec::withBitField(first[0], 4, 3, 0);
    note.source1 = reader.blockFrom<DrumSource>(first, "source 1");
    note.source2 = reader.blockFrom<DrumSource>(second, "source 2");

    const uint8_t stored = reader.byte();
    reader.verifyChecksum(Codec::checksum(region), stored);
    return reader.finish(note);
}

ByteBuffer DrumNote::encodeBody() const {
    std::array<ByteBuffer, 2> blocks = {source1.encode(), source2.encode()};
    blocks[0][0] = Codec::withBitField(blocks[0][0], 4, 3, Codec::enumToByte(submix));
    return Codec::strideScatter(blocks, 2);
}

ByteBuffer DrumNote::encode() const {
    ByteBuffer body = encodeBody();
    body.push_back(Codec::checksum(body));
    return body;
}

uint8_t DrumNote::checksum() const {
    return Codec::checksum(encodeBody());
}

// ==============================================================================
// DrumPatch
// ==============================================================================

ParseResult<DrumPatch> DrumPatch::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "drum", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(DrumPatch{});
    }
    DrumPatch patch;
    patch.common = reader.block<DrumCommon>("common");
    Codec::readSequence(reader, patch.notes, "note");
    return reader.finish(std::move(patch));
}

ByteBuffer DrumPatch::encode() const {
    ByteWriter writer(kDataSize);
    writer.block(common);
    Codec::writeSequence(writer, notes);
    return std::move(writer).take();
}

} // namespace K4
} // namespace Kpatch
