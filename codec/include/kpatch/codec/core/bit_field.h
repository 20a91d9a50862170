// ==============================================================================
// Layer 0: Core
// bit_field.h - Packing of several small fields into one data byte
// ==============================================================================
// Decode and encode use the same (shift, width) pairs, so positions stay
// symmetric. Writing one field never disturbs the other bits of the byte.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Kpatch {
namespace Codec {

/// Mask of `width` low bits.
[[nodiscard]] constexpr uint8_t bitMask(int width) noexcept {
    return static_cast<uint8_t>((1u << width) - 1u);
}

/// Extract `width` bits starting at bit `shift`.
///
/// @example bitField(0b0011'0100, 4, 2) -> 3
[[nodiscard]] constexpr uint8_t bitField(uint8_t byte, int shift, int width) noexcept {
    return static_cast<uint8_t>((byte >> shift) & bitMask(width));
}

/// Replace `width` bits starting at bit `shift` with `value`, leaving the rest.
[[nodiscard]] constexpr uint8_t withBitField(uint8_t byte, int shift, int width,
                                             uint8_t value) noexcept {
    const auto mask = static_cast<uint8_t>(bitMask(width) << shift);
    return static_cast<uint8_t>((byte & ~mask) | ((value << shift) & mask));
}

[[nodiscard]] constexpr bool bit(uint8_t byte, int index) noexcept {
    return ((byte >> index) & 1u) != 0;
}

[[nodiscard]] constexpr uint8_t withBit(uint8_t byte, int index, bool on) noexcept {
    return withBitField(byte, index, 1, on ? 1 : 0);
}

} // namespace Codec
} // namespace Kpatch
