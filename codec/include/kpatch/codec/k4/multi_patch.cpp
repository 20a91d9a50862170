// ==============================================================================
// K4 Multi Patch Implementation
// ==============================================================================

#include "multi_patch.h"

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

// ==============================================================================
// MultiSection
// ==============================================================================

ParseResult<MultiSection> MultiSection::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "section", options);
    reader.require(kDataSize);
    MultiSection section;
    section.singleNumber = reader.value<Category::K4PatchNumber>("single number");
    section.zoneLow = reader.value<Category::MidiNote>("zone low");
    section.zoneHigh = reader.value<Category::MidiNote>("zone high");

    const uint8_t b3 = reader.byte();
    section.receiveChannel = reader.valueFrom<Category::MidiChannel>(bitField(b3, 0, 4),
                                                                     "receive channel");
    section.velocitySwitch = reader.enumeration<VelocitySwitch>(bitField(b3, 4, 2),
                                                                kVelocitySwitchCount,
                                                                "velocity switch");
    section.muted = bit(b3, 6);

    const uint8_t b4 = reader.byte();
    section.submix = reader.enumeration<Submix>(bitField(b4, 0, 3), kSubmixValueCount, "submix");
    section.playMode = reader.enumeration<PlayMode>(bitField(b4, 3, 2), kPlayModeCount,
                                                    "play mode");

    section.level = reader.value<Category::K4Level>("level");
    section.transpose = reader.value<Category::K4Transpose>("transpose");
    section.tune = reader.value<Category::K4Depth>("tune");
    return reader.finish(section);
}

ByteBuffer MultiSection::encode() const {
    uint8_t b3 = withBitField(0, 0, 4, receiveChannel.toWireByte());
    b3 = withBitField(b3, 4, 2, Codec::enumToByte(velocitySwitch));
    b3 = withBit(b3, 6, muted);

    uint8_t b4 = withBitField(0, 0, 3, Codec::enumToByte(submix));
    b4 = withBitField(b4, 3, 2, Codec::enumToByte(playMode));

    return {singleNumber.toWireByte(), zoneLow.toWireByte(), zoneHigh.toWireByte(), b3, b4,
            level.toWireByte(), transpose.toWireByte(), tune.toWireByte()};
}

// ==============================================================================
// MultiPatch
// ==============================================================================

ParseResult<MultiPatch> MultiPatch::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "multi", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(MultiPatch{});
    }

    MultiPatch patch;
    patch.name = reader.block<Codec::PatchName<kNameLength>>("name");
    patch.volume = reader.value<Category::K4Level>("volume");
    patch.effect = reader.valueFrom<Category::K4EffectNumber>(bitField(reader.byte(), 0, 5),
                                                              "effect");
    Codec::readSequence(reader, patch.sections, "section");

    const uint8_t stored = reader.byte();
    reader.verifyChecksum(Codec::checksum(data.first(kDataSize - 1)), stored);

    if (!reader.failed()) {
        Codec::logger()->trace("multi '{}'", patch.name.str());
    }
    return reader.finish(std::move(patch));
}

ByteBuffer MultiPatch::encodeBody() const {
    ByteWriter writer(kDataSize);
    writer.block(name);
    writer.value(volume);
    writer.value(effect);
    Codec::writeSequence(writer, sections);
    return std::move(writer).take();
}

ByteBuffer MultiPatch::encode() const {
    ByteBuffer body = encodeBody();
    body.push_back(Codec::checksum(body));
    return body;
}

uint8_t MultiPatch::checksum() const {
    return Codec::checksum(encodeBody());
}

} // namespace K4
} // namespace Kpatch
