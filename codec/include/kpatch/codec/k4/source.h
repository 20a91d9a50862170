// ==============================================================================
// Layer 1: K4
// source.h - One of the four sources (DCO) of a single patch (7 bytes)
// ==============================================================================
//   0  delay
//   1  wave high bit 0, KS curve bits 4-6
//   2  wave low 7 bits
//   3  coarse bits 0-5, key track bit 6
//   4  fixed key
//   5  fine
//   6  pressure>freq bit 0, vibrato/auto-bend bit 1, velocity curve bits 2-4
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/wave.h>

namespace Kpatch {
namespace K4 {

struct Source {
    static constexpr std::size_t kDataSize = 7;

    Level delay;
    WaveNumber wave;
    Curve keyScalingCurve;
    Coarse coarse;
    bool keyTrack = true;
    MidiNote fixedKey;   ///< Used when keyTrack is off; kept either way
    Depth fine;
    bool pressureFrequency = true;
    bool vibrato = true;
    Curve velocityCurve;

    [[nodiscard]] static ParseResult<Source> decode(ByteView data,
                                                    const DecodeOptions& options = {}) {
        ByteReader reader(data, "source", options);
        reader.require(kDataSize);
        Source source;
        source.delay = reader.value<Category::K4Level>("delay");

        const uint8_t b1 = reader.byte();
        const uint8_t b2 = reader.byte();
        source.wave = reader.valueFrom<Category::K4WaveNumber>(waveWireValue(b1, b2), "wave");
        source.keyScalingCurve = reader.valueFrom<Category::K4Curve>(Codec::bitField(b1, 4, 3),
                                                                     "ks curve");

        const uint8_t b3 = reader.byte();
        source.coarse = reader.valueFrom<Category::K4Coarse>(Codec::bitField(b3, 0, 6), "coarse");
        source.keyTrack = Codec::bit(b3, 6);

        source.fixedKey = reader.value<Category::MidiNote>("fixed key");
        source.fine = reader.value<Category::K4Depth>("fine");

        const uint8_t b6 = reader.byte();
        source.pressureFrequency = Codec::bit(b6, 0);
        source.vibrato = Codec::bit(b6, 1);
        source.velocityCurve = reader.valueFrom<Category::K4Curve>(Codec::bitField(b6, 2, 3),
                                                                   "velocity curve");
        return reader.finish(source);
    }

    [[nodiscard]] ByteBuffer encode() const {
        const auto waveBytes = encodeWave(wave);
        uint8_t b1 = Codec::withBitField(waveBytes[0], 4, 3, keyScalingCurve.toWireByte());
        uint8_t b3 = Codec::withBitField(0, 0, 6, coarse.toWireByte());
        b3 = Codec::withBit(b3, 6, keyTrack);
        uint8_t b6 = Codec::withBit(0, 0, pressureFrequency);
        b6 = Codec::withBit(b6, 1, vibrato);
        b6 = Codec::withBitField(b6, 2, 3, velocityCurve.toWireByte());
        return {delay.toWireByte(), b1, waveBytes[1], b3, fixedKey.toWireByte(),
                fine.toWireByte(), b6};
    }

    [[nodiscard]] std::string_view waveName() const noexcept { return K4::waveName(wave); }

    bool operator==(const Source&) const = default;
};

} // namespace K4
} // namespace Kpatch
