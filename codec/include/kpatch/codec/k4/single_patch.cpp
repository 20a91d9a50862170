// ==============================================================================
// K4 Single Patch Implementation
// ==============================================================================

#include "single_patch.h"

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>

namespace Kpatch {
namespace K4 {

using Codec::bit;
using Codec::bitField;
using Codec::withBit;
using Codec::withBitField;

ParseResult<SinglePatch> SinglePatch::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "single", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(SinglePatch{});
    }

    SinglePatch patch;
    patch.name = reader.block<PatchName>("name");
    patch.volume = reader.value<Category::K4Level>("volume");
    patch.effect = reader.valueFrom<Category::K4EffectNumber>(bitField(reader.byte(), 0, 5),
                                                              "effect");
    patch.submix = reader.enumeration<Submix>(bitField(reader.byte(), 0, 3), kSubmixValueCount,
                                              "submix");

    const uint8_t s13 = reader.byte();
    patch.sourceMode = reader.enumeration<SourceMode>(bitField(s13, 0, 2), kSourceModeCount,
                                                      "source mode");
    patch.polyphonyMode = reader.enumeration<PolyphonyMode>(bitField(s13, 2, 2),
                                                            kPolyphonyModeCount, "polyphony mode");
    patch.am12 = bit(s13, 4);
    patch.am34 = bit(s13, 5);

    // The wire stores "not muted".
    const uint8_t s14 = reader.byte();
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        patch.sourceMutes[i] = !bit(s14, static_cast<int>(i));
    }
    patch.vibrato.shape = reader.enumeration<LfoShape>(bitField(s14, 4, 2), kLfoShapeCount,
                                                       "vibrato shape");

    const uint8_t s15 = reader.byte();
    patch.benderRange = reader.valueFrom<Category::K4BenderRange>(bitField(s15, 0, 4),
                                                                  "bender range");
    patch.wheelAssign = reader.enumeration<WheelAssign>(bitField(s15, 4, 2), kWheelAssignCount,
                                                        "wheel assign");

    patch.vibrato.speed = reader.value<Category::K4Level>("vibrato speed");
    patch.wheelDepth = reader.value<Category::K4Depth>("wheel depth");
    patch.autoBend = reader.block<AutoBend>("auto bend");
    patch.vibrato.pressure = reader.value<Category::K4Depth>("vibrato pressure");
    patch.vibrato.depth = reader.value<Category::K4Depth>("vibrato depth");
    patch.lfo = reader.block<Lfo>("lfo");
    patch.pressureFrequency = reader.value<Category::K4Depth>("pressure frequency");

    Codec::readInterleaved(reader, patch.sources, "source");
    Codec::readInterleaved(reader, patch.amplifiers, "amplifier");
    Codec::readInterleaved(reader, patch.filters, "filter");

    const uint8_t stored = reader.byte();
    reader.verifyChecksum(Codec::checksum(data.first(kDataSize - 1)), stored);

    if (!reader.failed()) {
        Codec::logger()->trace("single '{}'", patch.name.str());
    }
    return reader.finish(std::move(patch));
}

ByteBuffer SinglePatch::encodeBody() const {
    ByteWriter writer(kDataSize);
    writer.block(name);
    writer.value(volume);
    writer.byte(withBitField(0, 0, 5, effect.toWireByte()));
    writer.byte(withBitField(0, 0, 3, Codec::enumToByte(submix)));

    uint8_t s13 = withBitField(0, 0, 2, Codec::enumToByte(sourceMode));
    s13 = withBitField(s13, 2, 2, Codec::enumToByte(polyphonyMode));
    s13 = withBit(s13, 4, am12);
    s13 = withBit(s13, 5, am34);
    writer.byte(s13);

    uint8_t s14 = withBitField(0, 4, 2, Codec::enumToByte(vibrato.shape));
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        s14 = withBit(s14, static_cast<int>(i), !sourceMutes[i]);
    }
    writer.byte(s14);

    uint8_t s15 = withBitField(0, 0, 4, benderRange.toWireByte());
    s15 = withBitField(s15, 4, 2, Codec::enumToByte(wheelAssign));
    writer.byte(s15);

    writer.value(vibrato.speed);
    writer.value(wheelDepth);
    writer.block(autoBend);
    writer.value(vibrato.pressure);
    writer.value(vibrato.depth);
    writer.block(lfo);
    writer.value(pressureFrequency);

    Codec::writeInterleaved(writer, sources);
    Codec::writeInterleaved(writer, amplifiers);
    Codec::writeInterleaved(writer, filters);
    return std::move(writer).take();
}

ByteBuffer SinglePatch::encode() const {
    ByteBuffer body = encodeBody();
    body.push_back(Codec::checksum(body));
    return body;
}

uint8_t SinglePatch::checksum() const {
    return Codec::checksum(encodeBody());
}

std::string SinglePatch::sourceMuteString() const {
    std::string s;
    for (std::size_t i = 0; i < kSourceCount; ++i) {
        s.push_back(sourceMutes[i] ? '-' : static_cast<char>('1' + i));
    }
    return s;
}

} // namespace K4
} // namespace Kpatch
