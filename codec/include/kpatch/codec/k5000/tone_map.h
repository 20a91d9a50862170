// ==============================================================================
// Layer 1: K5000
// tone_map.h - 128-flag tone presence map of a block single dump (19 bytes)
// ==============================================================================
// Seven flags per byte, least significant bit first. Tone 0 is bit 0 of
// byte 0, tone 7 is bit 0 of byte 1; the last byte carries tones 126..127 in
// bits 0..1.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/k5000/k5000_types.h>

#include <algorithm>
#include <array>
#include <vector>

namespace Kpatch {
namespace K5000 {

struct ToneMap {
    static constexpr std::size_t kDataSize = 19;
    static constexpr int kTonesPerByte = 7;

    std::array<bool, kToneCount> included{};

    [[nodiscard]] bool isIncluded(std::size_t tone) const noexcept {
        return tone < kToneCount && included[tone];
    }

    void include(std::size_t tone, bool on = true) noexcept {
        if (tone < kToneCount) {
            included[tone] = on;
        }
    }

    [[nodiscard]] std::size_t includedCount() const noexcept {
        return static_cast<std::size_t>(std::count(included.begin(), included.end(), true));
    }

    /// Included tone numbers (0-based), ascending.
    [[nodiscard]] std::vector<int> tones() const {
        std::vector<int> result;
        for (std::size_t i = 0; i < kToneCount; ++i) {
            if (included[i]) {
                result.push_back(static_cast<int>(i));
            }
        }
        return result;
    }

    /// Bits above the last tone of each byte are ignored.
    [[nodiscard]] static ParseResult<ToneMap> decode(ByteView data,
                                                     const DecodeOptions& options = {}) {
        ByteReader reader(data, "tone map", options);
        if (!reader.require(kDataSize)) {
            return reader.finish(ToneMap{});
        }
        ToneMap map;
        for (std::size_t i = 0; i < kDataSize; ++i) {
            const uint8_t b = reader.byte();
            for (int n = 0; n < kTonesPerByte; ++n) {
                const std::size_t tone = i * kTonesPerByte + static_cast<std::size_t>(n);
                if (tone < kToneCount) {
                    map.included[tone] = Codec::bit(b, n);
                }
            }
        }
        return reader.finish(map);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteBuffer out(kDataSize, 0);
        for (std::size_t tone = 0; tone < kToneCount; ++tone) {
            auto& b = out[tone / kTonesPerByte];
            b = Codec::withBit(b, static_cast<int>(tone % kTonesPerByte), included[tone]);
        }
        return out;
    }

    bool operator==(const ToneMap&) const = default;
};

static_assert((kToneCount + ToneMap::kTonesPerByte - 1) / ToneMap::kTonesPerByte ==
              ToneMap::kDataSize);

} // namespace K5000
} // namespace Kpatch
