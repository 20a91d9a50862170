// ==============================================================================
// Layer 0: Core
// checksum.h - Kawai 7-bit additive checksum
// ==============================================================================

#pragma once

#include <cstdint>
#include <span>

namespace Kpatch {
namespace Codec {

/// Constant added to the byte sum before masking.
inline constexpr uint8_t kChecksumSeed = 0xA5;

/// (sum of body + 0xA5) & 0x7F
[[nodiscard]] constexpr uint8_t checksum(std::span<const uint8_t> body) noexcept {
    unsigned int total = 0;
    for (uint8_t b : body) {
        total += b;
    }
    return static_cast<uint8_t>((total + kChecksumSeed) & 0x7F);
}

/// Checksum over several consecutive regions, as if they were one buffer.
[[nodiscard]] constexpr uint8_t checksum(std::span<const uint8_t> first,
                                         std::span<const uint8_t> second) noexcept {
    unsigned int total = 0;
    for (uint8_t b : first) {
        total += b;
    }
    for (uint8_t b : second) {
        total += b;
    }
    return static_cast<uint8_t>((total + kChecksumSeed) & 0x7F);
}

} // namespace Codec
} // namespace Kpatch
