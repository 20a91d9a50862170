// ==============================================================================
// Layer 1: K4
// modulation.h - Level and time modulation triples shared by DCA and DCF
// ==============================================================================

#pragma once

#include <kpatch/codec/k4/k4_types.h>

namespace Kpatch {
namespace K4 {

/// Velocity, pressure and key-scaling depth applied to a level (3 bytes).
struct LevelModulation {
    static constexpr std::size_t kDataSize = 3;

    Depth velocityDepth;
    Depth pressureDepth;
    Depth keyScalingDepth;

    [[nodiscard]] static ParseResult<LevelModulation> decode(ByteView data,
                                                             const DecodeOptions& options = {}) {
        ByteReader reader(data, "level modulation", options);
        reader.require(kDataSize);
        LevelModulation mod;
        mod.velocityDepth = reader.value<Category::K4Depth>("velocity depth");
        mod.pressureDepth = reader.value<Category::K4Depth>("pressure depth");
        mod.keyScalingDepth = reader.value<Category::K4Depth>("key scaling depth");
        return reader.finish(mod);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {velocityDepth.toWireByte(), pressureDepth.toWireByte(),
                keyScalingDepth.toWireByte()};
    }

    bool operator==(const LevelModulation&) const = default;
};

/// Attack velocity, release velocity and key-scaling depth applied to
/// envelope times (3 bytes).
struct TimeModulation {
    static constexpr std::size_t kDataSize = 3;

    Depth attackVelocity;
    Depth releaseVelocity;
    Depth keyScaling;

    [[nodiscard]] static ParseResult<TimeModulation> decode(ByteView data,
                                                            const DecodeOptions& options = {}) {
        ByteReader reader(data, "time modulation", options);
        reader.require(kDataSize);
        TimeModulation mod;
        mod.attackVelocity = reader.value<Category::K4Depth>("attack velocity");
        mod.releaseVelocity = reader.value<Category::K4Depth>("release velocity");
        mod.keyScaling = reader.value<Category::K4Depth>("key scaling");
        return reader.finish(mod);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {attackVelocity.toWireByte(), releaseVelocity.toWireByte(),
                keyScaling.toWireByte()};
    }

    bool operator==(const TimeModulation&) const = default;
};

} // namespace K4
} // namespace Kpatch
