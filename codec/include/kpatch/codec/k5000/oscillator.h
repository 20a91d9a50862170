// ==============================================================================
// Layer 1: K5000
// oscillator.h - DCO: wave select, tuning and pitch envelope (12 bytes)
// ==============================================================================
//   0      wave number bits 7-9
//   1      wave number bits 0-6
//   2      coarse
//   3      fine
//   4      fixed key (0 = off)
//   5      key scaling to pitch
//   6..11  pitch envelope
//
// Wave 512 selects the additive generator; such a source carries an
// additive kit after the sources of its single patch.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/note_names.h>
#include <kpatch/codec/k5000/k5000_types.h>

#include <string_view>

namespace Kpatch {
namespace K5000 {

enum class KeyScalingToPitch : uint8_t {
    ZeroCent = 0,
    TwentyFiveCent,
    ThirtyThreeCent,
    FiftyCent
};

inline constexpr uint8_t kKeyScalingToPitchCount = 4;

[[nodiscard]] constexpr std::string_view keyScalingToPitchName(KeyScalingToPitch ks) noexcept {
    switch (ks) {
        case KeyScalingToPitch::ZeroCent:        return "0 cent";
        case KeyScalingToPitch::TwentyFiveCent:  return "25 cent";
        case KeyScalingToPitch::ThirtyThreeCent: return "33 cent";
        case KeyScalingToPitch::FiftyCent:       return "50 cent";
    }
    return {};
}

struct PitchEnvelope {
    static constexpr std::size_t kDataSize = 6;

    PitchEnvelopeLevel start;
    EnvelopeTime attackTime;
    PitchEnvelopeLevel attackLevel;
    EnvelopeTime decayTime;
    VelocitySensitivity timeVelocitySensitivity;
    VelocitySensitivity levelVelocitySensitivity;

    [[nodiscard]] static ParseResult<PitchEnvelope> decode(ByteView data,
                                                           const DecodeOptions& options = {}) {
        ByteReader reader(data, "pitch envelope", options);
        reader.require(kDataSize);
        PitchEnvelope env;
        env.start = reader.value<Category::PitchEnvelopeLevel>("start");
        env.attackTime = reader.value<Category::EnvelopeTime>("attack time");
        env.attackLevel = reader.value<Category::PitchEnvelopeLevel>("attack level");
        env.decayTime = reader.value<Category::EnvelopeTime>("decay time");
        env.timeVelocitySensitivity =
            reader.value<Category::VelocitySensitivity>("time velocity sensitivity");
        env.levelVelocitySensitivity =
            reader.value<Category::VelocitySensitivity>("level velocity sensitivity");
        return reader.finish(env);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {start.toWireByte(),       attackTime.toWireByte(),
                attackLevel.toWireByte(), decayTime.toWireByte(),
                timeVelocitySensitivity.toWireByte(), levelVelocitySensitivity.toWireByte()};
    }

    bool operator==(const PitchEnvelope&) const = default;
};

/// Split a 10-bit wave number into its two wire bytes (MSB, LSB).
[[nodiscard]] constexpr std::array<uint8_t, 2> waveBytes(WaveKit wave) noexcept {
    const int n = wave.toWire();
    return {static_cast<uint8_t>((n >> 7) & 0x07), static_cast<uint8_t>(n & 0x7F)};
}

struct Oscillator {
    static constexpr std::size_t kDataSize = 12;

    WaveKit wave = WaveKit::of<384>();
    Coarse coarse;
    Fine fine;
    MidiNote fixedKey = MidiNote::minimum();  ///< 0 = off
    KeyScalingToPitch keyScalingToPitch = KeyScalingToPitch::ZeroCent;
    PitchEnvelope pitchEnvelope;

    [[nodiscard]] static ParseResult<Oscillator> decode(ByteView data,
                                                        const DecodeOptions& options = {}) {
        ByteReader reader(data, "oscillator", options);
        reader.require(kDataSize);
        Oscillator osc;
        const uint8_t msb = reader.byte();
        const uint8_t lsb = reader.byte();
        osc.wave = reader.valueFrom<Category::WaveKit>((msb << 7) | (lsb & 0x7F), "wave");
        osc.coarse = reader.value<Category::Coarse>("coarse");
        osc.fine = reader.value<Category::Fine>("fine");
        osc.fixedKey = reader.value<Category::MidiNote>("fixed key");
        osc.keyScalingToPitch = reader.enumeration<KeyScalingToPitch>(kKeyScalingToPitchCount,
                                                                      "ks to pitch");
        osc.pitchEnvelope = reader.block<PitchEnvelope>("pitch envelope");
        return reader.finish(osc);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        const auto [msb, lsb] = waveBytes(wave);
        writer.byte(msb);
        writer.byte(lsb);
        writer.value(coarse);
        writer.value(fine);
        writer.value(fixedKey);
        writer.enumeration(keyScalingToPitch);
        writer.block(pitchEnvelope);
        return std::move(writer).take();
    }

    [[nodiscard]] bool isAdditive() const noexcept { return wave.value() == kAdditiveWave; }
    [[nodiscard]] bool hasFixedKey() const noexcept { return fixedKey.value() != 0; }

    bool operator==(const Oscillator&) const = default;
};

} // namespace K5000
} // namespace Kpatch
