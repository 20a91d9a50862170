// ==============================================================================
// Layer 1: K4
// lfo.h - LFO, vibrato and auto-bend settings of a single patch
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/k4/k4_types.h>

#include <array>
#include <string_view>

namespace Kpatch {
namespace K4 {

enum class LfoShape : uint8_t {
    Triangle = 0,
    Sawtooth,
    Square,
    Random
};

inline constexpr uint8_t kLfoShapeCount = 4;

[[nodiscard]] constexpr std::string_view lfoShapeName(LfoShape shape) noexcept {
    constexpr std::array<std::string_view, kLfoShapeCount> kNames = {"TRI", "SAW", "SQR", "RND"};
    const auto index = static_cast<std::size_t>(shape);
    return index < kNames.size() ? kNames[index] : std::string_view{};
}

/// LFO (s24..s28). Shape uses bits 0-1 of the first byte.
struct Lfo {
    static constexpr std::size_t kDataSize = 5;

    LfoShape shape = LfoShape::Triangle;
    Level speed;
    Level delay;
    Depth depth;
    Depth pressureDepth;

    [[nodiscard]] static ParseResult<Lfo> decode(ByteView data, const DecodeOptions& options = {}) {
        ByteReader reader(data, "lfo", options);
        reader.require(kDataSize);
        Lfo lfo;
        lfo.shape = reader.enumeration<LfoShape>(Codec::bitField(reader.byte(), 0, 2),
                                                 kLfoShapeCount, "shape");
        lfo.speed = reader.value<Category::K4Level>("speed");
        lfo.delay = reader.value<Category::K4Level>("delay");
        lfo.depth = reader.value<Category::K4Depth>("depth");
        lfo.pressureDepth = reader.value<Category::K4Depth>("pressure depth");
        return reader.finish(lfo);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {Codec::enumToByte(shape), speed.toWireByte(), delay.toWireByte(),
                depth.toWireByte(), pressureDepth.toWireByte()};
    }

    bool operator==(const Lfo&) const = default;
};

/// Vibrato. Its bytes are spread over the common block (shape in s14 bits 4-5,
/// speed s16, pressure s22, depth s23), so the single patch packs it.
struct Vibrato {
    LfoShape shape = LfoShape::Triangle;
    Level speed;
    Depth pressure;
    Depth depth;

    bool operator==(const Vibrato&) const = default;
};

/// Auto-bend (s18..s21).
struct AutoBend {
    static constexpr std::size_t kDataSize = 4;

    Level time;
    Depth depth;
    Depth keyScalingTime;
    Depth velocityDepth;

    [[nodiscard]] static ParseResult<AutoBend> decode(ByteView data,
                                                      const DecodeOptions& options = {}) {
        ByteReader reader(data, "auto bend", options);
        reader.require(kDataSize);
        AutoBend bend;
        bend.time = reader.value<Category::K4Level>("time");
        bend.depth = reader.value<Category::K4Depth>("depth");
        bend.keyScalingTime = reader.value<Category::K4Depth>("key scaling time");
        bend.velocityDepth = reader.value<Category::K4Depth>("velocity depth");
        return reader.finish(bend);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {time.toWireByte(), depth.toWireByte(), keyScalingTime.toWireByte(),
                velocityDepth.toWireByte()};
    }

    bool operator==(const AutoBend&) const = default;
};

} // namespace K4
} // namespace Kpatch
