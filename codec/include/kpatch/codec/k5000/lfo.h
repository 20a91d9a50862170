// ==============================================================================
// Layer 1: K5000
// lfo.h - Source LFO with vibrato, growl and tremolo depths (11 bytes)
// ==============================================================================
//   0       waveform
//   1       speed
//   2       delay onset
//   3       fade-in time
//   4       fade-in to speed
//   5..10   vibrato, growl, tremolo: (depth, key scaling) each
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/k5000_types.h>

#include <array>
#include <string_view>

namespace Kpatch {
namespace K5000 {

enum class LfoWaveform : uint8_t {
    Triangle = 0,
    Square,
    Sawtooth,
    Sine,
    Random
};

inline constexpr uint8_t kLfoWaveformCount = 5;

[[nodiscard]] constexpr std::string_view lfoWaveformName(LfoWaveform waveform) noexcept {
    constexpr std::array<std::string_view, kLfoWaveformCount> kNames = {
        "Triangle", "Square", "Sawtooth", "Sine", "Random"
    };
    const auto index = static_cast<std::size_t>(waveform);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

struct LfoControl {
    static constexpr std::size_t kDataSize = 2;

    LfoDepth depth;
    KeyScaling keyScaling;

    [[nodiscard]] static ParseResult<LfoControl> decode(ByteView data,
                                                        const DecodeOptions& options = {}) {
        ByteReader reader(data, "lfo control", options);
        reader.require(kDataSize);
        LfoControl control;
        control.depth = reader.value<Category::LfoDepth>("depth");
        control.keyScaling = reader.value<Category::KeyScaling>("key scaling");
        return reader.finish(control);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {depth.toWireByte(), keyScaling.toWireByte()};
    }

    bool operator==(const LfoControl&) const = default;
};

struct Lfo {
    static constexpr std::size_t kDataSize = 11;

    LfoWaveform waveform = LfoWaveform::Triangle;
    LfoSpeed speed;
    DataByte delayOnset;
    DataByte fadeInTime;
    DataByte fadeInToSpeed;
    LfoControl vibrato;
    LfoControl growl;
    LfoControl tremolo;

    [[nodiscard]] static ParseResult<Lfo> decode(ByteView data,
                                                 const DecodeOptions& options = {}) {
        ByteReader reader(data, "lfo", options);
        reader.require(kDataSize);
        Lfo lfo;
        lfo.waveform = reader.enumeration<LfoWaveform>(kLfoWaveformCount, "waveform");
        lfo.speed = reader.value<Category::LfoSpeed>("speed");
        lfo.delayOnset = reader.value<Category::DataByte>("delay onset");
        lfo.fadeInTime = reader.value<Category::DataByte>("fade in time");
        lfo.fadeInToSpeed = reader.value<Category::DataByte>("fade in to speed");
        lfo.vibrato = reader.block<LfoControl>("vibrato");
        lfo.growl = reader.block<LfoControl>("growl");
        lfo.tremolo = reader.block<LfoControl>("tremolo");
        return reader.finish(lfo);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.enumeration(waveform);
        writer.value(speed);
        writer.value(delayOnset);
        writer.value(fadeInTime);
        writer.value(fadeInToSpeed);
        writer.block(vibrato);
        writer.block(growl);
        writer.block(tremolo);
        return std::move(writer).take();
    }

    bool operator==(const Lfo&) const = default;
};

} // namespace K5000
} // namespace Kpatch
