// ==============================================================================
// Layer 1: K4
// amplifier.h - DCA: level, ADSR envelope and modulation (11 bytes)
// ==============================================================================

#pragma once

#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/modulation.h>

namespace Kpatch {
namespace K4 {

struct AmpEnvelope {
    static constexpr std::size_t kDataSize = 4;

    Level attack = Level::of<54>();
    Level decay = Level::of<72>();
    Level sustain = Level::of<90>();
    Level release = Level::of<64>();

    [[nodiscard]] static ParseResult<AmpEnvelope> decode(ByteView data,
                                                         const DecodeOptions& options = {}) {
        ByteReader reader(data, "amp envelope", options);
        reader.require(kDataSize);
        AmpEnvelope env;
        env.attack = reader.value<Category::K4Level>("attack");
        env.decay = reader.value<Category::K4Level>("decay");
        env.sustain = reader.value<Category::K4Level>("sustain");
        env.release = reader.value<Category::K4Level>("release");
        return reader.finish(env);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {attack.toWireByte(), decay.toWireByte(), sustain.toWireByte(),
                release.toWireByte()};
    }

    bool operator==(const AmpEnvelope&) const = default;
};

struct Amplifier {
    static constexpr std::size_t kDataSize = 11;

    Level level = Level::of<75>();
    AmpEnvelope envelope;
    LevelModulation levelModulation;
    TimeModulation timeModulation;

    [[nodiscard]] static ParseResult<Amplifier> decode(ByteView data,
                                                       const DecodeOptions& options = {}) {
        ByteReader reader(data, "amplifier", options);
        reader.require(kDataSize);
        Amplifier amp;
        amp.level = reader.value<Category::K4Level>("level");
        amp.envelope = reader.block<AmpEnvelope>("envelope");
        amp.levelModulation = reader.block<LevelModulation>("level modulation");
        amp.timeModulation = reader.block<TimeModulation>("time modulation");
        return reader.finish(amp);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.value(level);
        writer.block(envelope);
        writer.block(levelModulation);
        writer.block(timeModulation);
        return std::move(writer).take();
    }

    bool operator==(const Amplifier&) const = default;
};

} // namespace K4
} // namespace Kpatch
