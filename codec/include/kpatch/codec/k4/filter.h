// ==============================================================================
// Layer 1: K4
// filter.h - DCF: cutoff, resonance, envelope and modulation (14 bytes)
// ==============================================================================
// Byte 1 is shared: resonance in bits 0-2, LFO-to-cutoff switch in bit 3.
// The envelope sustain is bipolar (-50..+50), unlike the DCA sustain.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/modulation.h>

namespace Kpatch {
namespace K4 {

struct FilterEnvelope {
    static constexpr std::size_t kDataSize = 4;

    Level attack;
    Level decay;
    Depth sustain;
    Level release;

    [[nodiscard]] static ParseResult<FilterEnvelope> decode(ByteView data,
                                                            const DecodeOptions& options = {}) {
        ByteReader reader(data, "filter envelope", options);
        reader.require(kDataSize);
        FilterEnvelope env;
        env.attack = reader.value<Category::K4Level>("attack");
        env.decay = reader.value<Category::K4Level>("decay");
        env.sustain = reader.value<Category::K4Depth>("sustain");
        env.release = reader.value<Category::K4Level>("release");
        return reader.finish(env);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {attack.toWireByte(), decay.toWireByte(), sustain.toWireByte(),
                release.toWireByte()};
    }

    bool operator==(const FilterEnvelope&) const = default;
};

struct Filter {
    static constexpr std::size_t kDataSize = 14;

    Level cutoff = Level::of<49>();
    Resonance resonance = Resonance::of<2>();
    bool lfoModulatesCutoff = false;
    LevelModulation cutoffModulation;
    Depth envelopeDepth;
    Depth envelopeVelocityDepth;
    FilterEnvelope envelope;
    TimeModulation timeModulation;

    [[nodiscard]] static ParseResult<Filter> decode(ByteView data,
                                                    const DecodeOptions& options = {}) {
        ByteReader reader(data, "filter", options);
        reader.require(kDataSize);
        Filter filter;
        filter.cutoff = reader.value<Category::K4Level>("cutoff");
        const uint8_t b = reader.byte();
        filter.resonance = reader.valueFrom<Category::K4Resonance>(Codec::bitField(b, 0, 3),
                                                                    "resonance");
        filter.lfoModulatesCutoff = Codec::bit(b, 3);
        filter.cutoffModulation = reader.block<LevelModulation>("cutoff modulation");
        filter.envelopeDepth = reader.value<Category::K4Depth>("envelope depth");
        filter.envelopeVelocityDepth = reader.value<Category::K4Depth>("envelope velocity depth");
        filter.envelope = reader.block<FilterEnvelope>("envelope");
        filter.timeModulation = reader.block<TimeModulation>("time modulation");
        return reader.finish(filter);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.value(cutoff);
        uint8_t b = Codec::withBitField(0, 0, 3, resonance.toWireByte());
        b = Codec::withBit(b, 3, lfoModulatesCutoff);
        writer.byte(b);
        writer.block(cutoffModulation);
        writer.value(envelopeDepth);
        writer.value(envelopeVelocityDepth);
        writer.block(envelope);
        writer.block(timeModulation);
        return std::move(writer).take();
    }

    bool operator==(const Filter&) const = default;
};

} // namespace K4
} // namespace Kpatch
