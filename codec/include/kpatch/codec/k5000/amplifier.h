// ==============================================================================
// Layer 1: K5000
// amplifier.h - DCA: velocity curve, envelope and modulation (15 bytes)
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/k5000_types.h>

namespace Kpatch {
namespace K5000 {

/// Six 0..127 stages: attack, decay 1 time/level, decay 2 time/level, release.
struct AmpEnvelope {
    static constexpr std::size_t kDataSize = 6;

    EnvelopeTime attackTime;
    EnvelopeTime decay1Time;
    EnvelopeTime decay1Level;
    EnvelopeTime decay2Time;
    EnvelopeTime decay2Level;
    EnvelopeTime releaseTime;

    [[nodiscard]] static ParseResult<AmpEnvelope> decode(ByteView data,
                                                         const DecodeOptions& options = {}) {
        ByteReader reader(data, "envelope", options);
        reader.require(kDataSize);
        AmpEnvelope env;
        env.attackTime = reader.value<Category::EnvelopeTime>("attack time");
        env.decay1Time = reader.value<Category::EnvelopeTime>("decay 1 time");
        env.decay1Level = reader.value<Category::EnvelopeTime>("decay 1 level");
        env.decay2Time = reader.value<Category::EnvelopeTime>("decay 2 time");
        env.decay2Level = reader.value<Category::EnvelopeTime>("decay 2 level");
        env.releaseTime = reader.value<Category::EnvelopeTime>("release time");
        return reader.finish(env);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {attackTime.toWireByte(),  decay1Time.toWireByte(), decay1Level.toWireByte(),
                decay2Time.toWireByte(), decay2Level.toWireByte(), releaseTime.toWireByte()};
    }

    bool operator==(const AmpEnvelope&) const = default;
};

/// Key scaling to the amplifier: level and three envelope times.
struct AmpKeyScaling {
    static constexpr std::size_t kDataSize = 4;

    ControlTime level;
    ControlTime attackTime;
    ControlTime decay1Time;
    ControlTime releaseTime;

    [[nodiscard]] static ParseResult<AmpKeyScaling> decode(ByteView data,
                                                           const DecodeOptions& options = {}) {
        ByteReader reader(data, "ks control", options);
        reader.require(kDataSize);
        AmpKeyScaling ks;
        ks.level = reader.value<Category::ControlTime>("level");
        ks.attackTime = reader.value<Category::ControlTime>("attack time");
        ks.decay1Time = reader.value<Category::ControlTime>("decay 1 time");
        ks.releaseTime = reader.value<Category::ControlTime>("release time");
        return reader.finish(ks);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {level.toWireByte(), attackTime.toWireByte(), decay1Time.toWireByte(),
                releaseTime.toWireByte()};
    }

    bool operator==(const AmpKeyScaling&) const = default;
};

/// Velocity to the amplifier. The level is an unsigned depth.
struct AmpVelocity {
    static constexpr std::size_t kDataSize = 4;

    VelocityDepth level;
    ControlTime attackTime;
    ControlTime decay1Time;
    ControlTime releaseTime;

    [[nodiscard]] static ParseResult<AmpVelocity> decode(ByteView data,
                                                         const DecodeOptions& options = {}) {
        ByteReader reader(data, "velocity control", options);
        reader.require(kDataSize);
        AmpVelocity vel;
        vel.level = reader.value<Category::VelocityDepth>("level");
        vel.attackTime = reader.value<Category::ControlTime>("attack time");
        vel.decay1Time = reader.value<Category::ControlTime>("decay 1 time");
        vel.releaseTime = reader.value<Category::ControlTime>("release time");
        return reader.finish(vel);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {level.toWireByte(), attackTime.toWireByte(), decay1Time.toWireByte(),
                releaseTime.toWireByte()};
    }

    bool operator==(const AmpVelocity&) const = default;
};

struct Amplifier {
    static constexpr std::size_t kDataSize = 15;

    VelocityCurve velocityCurve;
    AmpEnvelope envelope;
    AmpKeyScaling keyScaling;
    AmpVelocity velocity;

    [[nodiscard]] static ParseResult<Amplifier> decode(ByteView data,
                                                       const DecodeOptions& options = {}) {
        ByteReader reader(data, "amplifier", options);
        reader.require(kDataSize);
        Amplifier amp;
        amp.velocityCurve = reader.value<Category::VelocityCurve>("velocity curve");
        amp.envelope = reader.block<AmpEnvelope>("envelope");
        amp.keyScaling = reader.block<AmpKeyScaling>("ks control");
        amp.velocity = reader.block<AmpVelocity>("velocity control");
        return reader.finish(amp);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.value(velocityCurve);
        writer.block(envelope);
        writer.block(keyScaling);
        writer.block(velocity);
        return std::move(writer).take();
    }

    bool operator==(const Amplifier&) const = default;
};

} // namespace K5000
} // namespace Kpatch
