// ==============================================================================
// K5000 Additive Kit Implementation
// ==============================================================================

#include "additive_kit.h"

#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>

namespace Kpatch {
namespace K5000 {

using Codec::bit;
using Codec::bitField;
using Codec::withBit;

// ==============================================================================
// MORF
// ==============================================================================

ParseResult<Morf> Morf::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "morf", options);
    reader.require(kDataSize);
    Morf morf;
    Codec::readSequence(reader, morf.copies, "copy");
    Codec::readValues(reader, morf.times, "time");
    morf.loop = reader.enumeration<LoopType>(kLoopTypeCount, "loop");
    return reader.finish(morf);
}

ByteBuffer Morf::encode() const {
    ByteWriter writer(kDataSize);
    Codec::writeSequence(writer, copies);
    Codec::writeValues(writer, times);
    writer.enumeration(loop);
    return std::move(writer).take();
}

// ==============================================================================
// Formant Envelope
// ==============================================================================

ParseResult<FormantEnvelope> FormantEnvelope::decode(ByteView data,
                                                     const DecodeOptions& options) {
    ByteReader reader(data, "envelope", options);
    reader.require(kDataSize);
    FormantEnvelope env;
    Codec::readSequence(reader, env.segments, "segment");
    env.loop = reader.enumeration<LoopType>(kLoopTypeCount, "loop");
    env.velocityDepth = reader.value<Category::EnvelopeDepth>("velocity depth");
    env.keyScalingDepth = reader.value<Category::EnvelopeDepth>("ks depth");
    return reader.finish(env);
}

ByteBuffer FormantEnvelope::encode() const {
    ByteWriter writer(kDataSize);
    Codec::writeSequence(writer, segments);
    writer.enumeration(loop);
    writer.value(velocityDepth);
    writer.value(keyScalingDepth);
    return std::move(writer).take();
}

// ==============================================================================
// Harmonic Envelope
// ==============================================================================

ParseResult<HarmonicEnvelope> HarmonicEnvelope::decode(ByteView data,
                                                       const DecodeOptions& options) {
    ByteReader reader(data, "harmonic envelope", options);
    reader.require(kDataSize);
    HarmonicEnvelope env;
    env.attack.rate = reader.value<Category::EnvelopeRate>("attack rate");
    env.attack.level = reader.value<Category::HarmonicEnvelopeLevel>("attack level");

    env.decay1.rate = reader.value<Category::EnvelopeRate>("decay 1 rate");
    const uint8_t d1 = reader.byte();
    env.decay1.level = reader.valueFrom<Category::HarmonicEnvelopeLevel>(bitField(d1, 0, 6),
                                                                         "decay 1 level");
    env.decay2.rate = reader.value<Category::EnvelopeRate>("decay 2 rate");
    const uint8_t d2 = reader.byte();
    env.decay2.level = reader.valueFrom<Category::HarmonicEnvelopeLevel>(bitField(d2, 0, 6),
                                                                         "decay 2 level");

    env.release.rate = reader.value<Category::EnvelopeRate>("release rate");
    env.release.level = reader.value<Category::HarmonicEnvelopeLevel>("release level");

    const bool loop1 = bit(d1, kLoopBit);
    const bool loop2 = bit(d2, kLoopBit);
    if (loop1 && loop2) {
        env.loop = LoopType::Loop1;
    } else if (loop2) {
        env.loop = LoopType::Loop2;
    } else if (!loop1) {
        env.loop = LoopType::Off;
    } else if (!reader.failed()) {
        reader.fail(ParseError::invalidDiscriminant("loop", 0b10));
    }
    return reader.finish(env);
}

ByteBuffer HarmonicEnvelope::encode() const {
    const uint8_t d1 = withBit(decay1.level.toWireByte(), kLoopBit, loop == LoopType::Loop1);
    const uint8_t d2 = withBit(decay2.level.toWireByte(), kLoopBit, loop != LoopType::Off);
    return {attack.rate.toWireByte(),  attack.level.toWireByte(),
            decay1.rate.toWireByte(),  d1,
            decay2.rate.toWireByte(),  d2,
            release.rate.toWireByte(), release.level.toWireByte()};
}

// ==============================================================================
// Additive Kit
// ==============================================================================

ParseResult<AdditiveKit> AdditiveKit::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "additive kit", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(AdditiveKit{});
    }

    const uint8_t stored = reader.byte();
    AdditiveKit kit;
    kit.common = reader.block<HarmonicCommon>("harmonic common");
    kit.morf = reader.block<Morf>("morf");
    kit.formantFilter = reader.block<FormantFilter>("formant filter");
    Codec::readValues(reader, kit.softLevels, "soft level");
    Codec::readValues(reader, kit.loudLevels, "loud level");
    Codec::readValues(reader, kit.bands, "band");
    Codec::readSequence(reader, kit.envelopes, "harmonic envelope");
    kit.loudSenseSelect = reader.value<Category::DataByte>("loud sense select");

    reader.verifyChecksum(Codec::checksum(data.subspan(1, kDataSize - 1)), stored);

    if (!reader.failed()) {
        Codec::logger()->trace("additive kit, morf {}", kit.common.morfEnabled ? "on" : "off");
    }
    return reader.finish(std::move(kit));
}

ByteBuffer AdditiveKit::encodeBody() const {
    ByteWriter writer(kDataSize - 1);
    writer.block(common);
    writer.block(morf);
    writer.block(formantFilter);
    Codec::writeValues(writer, softLevels);
    Codec::writeValues(writer, loudLevels);
    Codec::writeValues(writer, bands);
    Codec::writeSequence(writer, envelopes);
    writer.value(loudSenseSelect);
    return std::move(writer).take();
}

ByteBuffer AdditiveKit::encode() const {
    const ByteBuffer body = encodeBody();
    ByteBuffer out;
    out.reserve(kDataSize);
    out.push_back(Codec::checksum(body));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

uint8_t AdditiveKit::checksum() const {
    return Codec::checksum(encodeBody());
}

} // namespace K5000
} // namespace Kpatch
