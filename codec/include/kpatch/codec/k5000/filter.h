// ==============================================================================
// Layer 1: K5000
// filter.h - DCF: mode, cutoff, resonance and envelope (20 bytes)
// ==============================================================================
//   0       bypass (1 = bypassed)
//   1       mode
//   2       velocity curve
//   3, 4    resonance, level
//   5       cutoff
//   6, 7    KS to cutoff, velocity to cutoff
//   8       envelope depth
//   9..14   envelope
//   15, 16  KS to envelope: attack, decay 1
//   17..19  velocity to envelope: depth, attack, decay 1
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/k5000_types.h>

#include <string_view>

namespace Kpatch {
namespace K5000 {

enum class FilterMode : uint8_t {
    LowPass = 0,
    HighPass
};

inline constexpr uint8_t kFilterModeCount = 2;

[[nodiscard]] constexpr std::string_view filterModeName(FilterMode mode) noexcept {
    return mode == FilterMode::LowPass ? "Low pass" : "High pass";
}

struct FilterEnvelope {
    static constexpr std::size_t kDataSize = 6;

    EnvelopeTime attackTime;
    EnvelopeTime decay1Time;
    EnvelopeLevel decay1Level;
    EnvelopeTime decay2Time;
    EnvelopeLevel decay2Level;
    EnvelopeTime releaseTime;

    [[nodiscard]] static ParseResult<FilterEnvelope> decode(ByteView data,
                                                            const DecodeOptions& options = {}) {
        ByteReader reader(data, "envelope", options);
        reader.require(kDataSize);
        FilterEnvelope env;
        env.attackTime = reader.value<Category::EnvelopeTime>("attack time");
        env.decay1Time = reader.value<Category::EnvelopeTime>("decay 1 time");
        env.decay1Level = reader.value<Category::EnvelopeLevel>("decay 1 level");
        env.decay2Time = reader.value<Category::EnvelopeTime>("decay 2 time");
        env.decay2Level = reader.value<Category::EnvelopeLevel>("decay 2 level");
        env.releaseTime = reader.value<Category::EnvelopeTime>("release time");
        return reader.finish(env);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {attackTime.toWireByte(),  decay1Time.toWireByte(), decay1Level.toWireByte(),
                decay2Time.toWireByte(), decay2Level.toWireByte(), releaseTime.toWireByte()};
    }

    bool operator==(const FilterEnvelope&) const = default;
};

struct Filter {
    static constexpr std::size_t kDataSize = 20;

    bool bypassed = false;
    FilterMode mode = FilterMode::LowPass;
    VelocityCurve velocityCurve;
    Resonance resonance;
    FilterLevel level;
    Cutoff cutoff;
    EnvelopeDepth keyScalingToCutoff;
    EnvelopeDepth velocityToCutoff;
    EnvelopeDepth envelopeDepth;
    FilterEnvelope envelope;
    ControlTime keyScalingToAttack;
    ControlTime keyScalingToDecay1;
    EnvelopeDepth velocityToEnvelopeDepth;
    ControlTime velocityToAttack;
    ControlTime velocityToDecay1;

    [[nodiscard]] static ParseResult<Filter> decode(ByteView data,
                                                    const DecodeOptions& options = {}) {
        ByteReader reader(data, "filter", options);
        reader.require(kDataSize);
        Filter filter;
        filter.bypassed = readFlag(reader, "bypass");
        filter.mode = reader.enumeration<FilterMode>(kFilterModeCount, "mode");
        filter.velocityCurve = reader.value<Category::VelocityCurve>("velocity curve");
        filter.resonance = reader.value<Category::Resonance>("resonance");
        filter.level = reader.value<Category::FilterLevel>("level");
        filter.cutoff = reader.value<Category::Cutoff>("cutoff");
        filter.keyScalingToCutoff = reader.value<Category::EnvelopeDepth>("ks to cutoff");
        filter.velocityToCutoff = reader.value<Category::EnvelopeDepth>("velocity to cutoff");
        filter.envelopeDepth = reader.value<Category::EnvelopeDepth>("envelope depth");
        filter.envelope = reader.block<FilterEnvelope>("envelope");
        filter.keyScalingToAttack = reader.value<Category::ControlTime>("ks to attack");
        filter.keyScalingToDecay1 = reader.value<Category::ControlTime>("ks to decay 1");
        filter.velocityToEnvelopeDepth =
            reader.value<Category::EnvelopeDepth>("velocity to envelope depth");
        filter.velocityToAttack = reader.value<Category::ControlTime>("velocity to attack");
        filter.velocityToDecay1 = reader.value<Category::ControlTime>("velocity to decay 1");
        return reader.finish(filter);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.byte(flagByte(bypassed));
        writer.enumeration(mode);
        writer.value(velocityCurve);
        writer.value(resonance);
        writer.value(level);
        writer.value(cutoff);
        writer.value(keyScalingToCutoff);
        writer.value(velocityToCutoff);
        writer.value(envelopeDepth);
        writer.block(envelope);
        writer.value(keyScalingToAttack);
        writer.value(keyScalingToDecay1);
        writer.value(velocityToEnvelopeDepth);
        writer.value(velocityToAttack);
        writer.value(velocityToDecay1);
        return std::move(writer).take();
    }

    bool operator==(const Filter&) const = default;
};

} // namespace K5000
} // namespace Kpatch
