// ==============================================================================
// K5000 Multi Patch Implementation
// ==============================================================================

#include "multi_patch.h"

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>

namespace Kpatch {
namespace K5000 {

using Codec::bit;
using Codec::withBit;

// ==============================================================================
// Section
// ==============================================================================

ParseResult<MultiSection> MultiSection::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "section", options);
    reader.require(kDataSize);
    MultiSection section;
    const uint8_t msb = reader.byte();
    const uint8_t lsb = reader.byte();
    section.instrument = reader.valueFrom<Category::InstrumentNumber>((msb << 7) | (lsb & 0x7F),
                                                                      "instrument");
    section.volume = reader.value<Category::Volume>("volume");
    section.pan = reader.value<Category::Pan>("pan");
    section.effectPath = reader.enumeration<EffectPath>(kEffectPathCount, "effect path");
    section.transpose = reader.value<Category::Coarse>("transpose");
    section.tune = reader.value<Category::Fine>("tune");
    section.zoneLow = reader.value<Category::MidiNote>("zone low");
    section.zoneHigh = reader.value<Category::MidiNote>("zone high");
    section.velocitySwitch = reader.block<VelocitySwitch>("velocity switch");
    section.receiveChannel = reader.value<Category::MidiChannel>("receive channel");
    return reader.finish(section);
}

ByteBuffer MultiSection::encode() const {
    ByteWriter writer(kDataSize);
    const int n = instrument.toWire();
    writer.byte(static_cast<uint8_t>((n >> 7) & 0x7F));
    writer.byte(static_cast<uint8_t>(n & 0x7F));
    writer.value(volume);
    writer.value(pan);
    writer.enumeration(effectPath);
    writer.value(transpose);
    writer.value(tune);
    writer.value(zoneLow);
    writer.value(zoneHigh);
    writer.block(velocitySwitch);
    writer.value(receiveChannel);
    return std::move(writer).take();
}

// ==============================================================================
// Common
// ==============================================================================

ParseResult<MultiCommon> MultiCommon::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "common", options);
    reader.require(kDataSize);
    MultiCommon common;
    common.effects = reader.block<EffectSettings>("effects");
    common.geq = reader.block<Geq>("geq");
    common.name = reader.block<Codec::PatchName<kNameLength>>("name");
    common.volume = reader.value<Category::Volume>("volume");
    const uint8_t mutes = reader.byte();
    for (std::size_t i = 0; i < kMultiSectionCount; ++i) {
        common.sectionMutes[i] = bit(mutes, static_cast<int>(i));
    }
    common.effectControl = reader.block<EffectControl>("effect control");
    return reader.finish(std::move(common));
}

ByteBuffer MultiCommon::encode() const {
    ByteWriter writer(kDataSize);
    writer.block(effects);
    writer.block(geq);
    writer.block(name);
    writer.value(volume);
    uint8_t mutes = 0;
    for (std::size_t i = 0; i < kMultiSectionCount; ++i) {
        mutes = withBit(mutes, static_cast<int>(i), sectionMutes[i]);
    }
    writer.byte(mutes);
    writer.block(effectControl);
    return std::move(writer).take();
}

// ==============================================================================
// Multi Patch
// ==============================================================================

ParseResult<MultiPatch> MultiPatch::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "multi", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(MultiPatch{});
    }
    MultiPatch patch;
    const uint8_t stored = reader.byte();
    patch.common = reader.block<MultiCommon>("common");
    Codec::readSequence(reader, patch.sections, "section");

    reader.verifyChecksum(Codec::checksum(data.subspan(1, kDataSize - 1)), stored);

    if (!reader.failed()) {
        Codec::logger()->trace("multi '{}'", patch.common.name.str());
    }
    return reader.finish(std::move(patch));
}

ByteBuffer MultiPatch::encodeBody() const {
    ByteWriter writer(kDataSize - 1);
    writer.block(common);
    Codec::writeSequence(writer, sections);
    return std::move(writer).take();
}

ByteBuffer MultiPatch::encode() const {
    const ByteBuffer body = encodeBody();
    ByteWriter writer(kDataSize);
    writer.byte(Codec::checksum(body));
    writer.bytes(body);
    return std::move(writer).take();
}

uint8_t MultiPatch::checksum() const {
    return Codec::checksum(encodeBody());
}

} // namespace K5000
} // namespace Kpatch
