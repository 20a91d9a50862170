// ==============================================================================
// Layer 0: Core
// bounded_value.h - Range-checked parameter value tagged with its category
// ==============================================================================
// A BoundedValue can only be created through a validating factory, so a model
// built from BoundedValues never holds an out-of-range parameter. The category
// is a template argument: a Level cannot be assigned where a Depth is expected.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/parse_error.h>
#include <kpatch/codec/core/value_category.h>

#include <cstdint>
#include <string>

namespace Kpatch {
namespace Codec {

template <Category C>
class BoundedValue {
public:
    static constexpr CategorySpec kSpec = categorySpec(C);
    static constexpr Category kCategory = C;

    /// Category zero point (always in range).
    constexpr BoundedValue() noexcept : value_(kSpec.zero) {}

    /// Validate a logical value.
    /// @return RangeError naming the category when n is outside [min, max]
    [[nodiscard]] static ParseResult<BoundedValue> fromInteger(int n) {
        if (!kSpec.contains(n)) {
            return ParseError::rangeError(std::string(kSpec.name), n);
        }
        return BoundedValue(n);
    }

    /// Remove the category bias from a wire value, then validate.
    [[nodiscard]] static ParseResult<BoundedValue> fromWire(int wire) {
        return fromInteger(wire - kSpec.bias);
    }

    [[nodiscard]] static ParseResult<BoundedValue> fromWireByte(uint8_t wire) {
        return fromWire(static_cast<int>(wire));
    }

    /// Compile-time checked constant, e.g. `Level::of<100>()`.
    template <int N>
    [[nodiscard]] static constexpr BoundedValue of() noexcept {
        static_assert(N >= kSpec.minimum && N <= kSpec.maximum,
                      "constant outside category range");
        return BoundedValue(N);
    }

    [[nodiscard]] static constexpr BoundedValue minimum() noexcept {
        return BoundedValue(kSpec.minimum);
    }

    [[nodiscard]] static constexpr BoundedValue maximum() noexcept {
        return BoundedValue(kSpec.maximum);
    }

    [[nodiscard]] constexpr int value() const noexcept { return value_; }

    /// Biased wire value. Wider than a byte for WaveKit and InstrumentNumber.
    [[nodiscard]] constexpr int toWire() const noexcept { return value_ + kSpec.bias; }

    [[nodiscard]] constexpr uint8_t toWireByte() const noexcept {
        return static_cast<uint8_t>(toWire());
    }

    constexpr bool operator==(const BoundedValue&) const = default;

private:
    constexpr explicit BoundedValue(int value) noexcept : value_(value) {}

    int value_;
};

} // namespace Codec
} // namespace Kpatch
