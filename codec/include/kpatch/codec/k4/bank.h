// ==============================================================================
// Layer 1: K4
// bank.h - Complete K4 bank: 64 singles, 64 multis, drum, 32 effects
// ==============================================================================
//   offset     0  64 singles x 131
//   offset  8384  64 multis x 77
//   offset 13312  drum (682)
//   offset 13994  32 effects x 35
//   total  15114
// ==============================================================================

#pragma once

#include <kpatch/codec/k4/drum_patch.h>
#include <kpatch/codec/k4/effect_patch.h>
#include <kpatch/codec/k4/k4_types.h>
#include <kpatch/codec/k4/multi_patch.h>
#include <kpatch/codec/k4/single_patch.h>

#include <array>
#include <cstddef>

namespace Kpatch {
namespace K4 {

inline constexpr std::size_t kBankSingleCount = 64;
inline constexpr std::size_t kBankMultiCount = 64;
inline constexpr std::size_t kBankEffectCount = 32;

struct Bank {
    static constexpr std::size_t kSinglesSize = kBankSingleCount * SinglePatch::kDataSize;
    static constexpr std::size_t kMultisSize = kBankMultiCount * MultiPatch::kDataSize;
    static constexpr std::size_t kEffectsSize = kBankEffectCount * EffectPatch::kDataSize;
    static constexpr std::size_t kDataSize =
        kSinglesSize + kMultisSize + DrumPatch::kDataSize + kEffectsSize;

    std::array<SinglePatch, kBankSingleCount> singles{};
    std::array<MultiPatch, kBankMultiCount> multis{};
    DrumPatch drum;
    std::array<EffectPatch, kBankEffectCount> effects{};

    [[nodiscard]] static constexpr std::size_t singleOffset(std::size_t index) noexcept {
        return index * SinglePatch::kDataSize;
    }

    [[nodiscard]] static constexpr std::size_t multiOffset(std::size_t index) noexcept {
        return kSinglesSize + index * MultiPatch::kDataSize;
    }

    [[nodiscard]] static constexpr std::size_t drumOffset() noexcept {
        return kSinglesSize + kMultisSize;
    }

    [[nodiscard]] static constexpr std::size_t effectOffset(std::size_t index) noexcept {
        return drumOffset() + DrumPatch::kDataSize + index * EffectPatch::kDataSize;
    }

    /// Decode a whole bank. Fails with TooShort before decoding anything when
    /// the buffer is short, and with OffsetMismatch when a section does not
    /// consume exactly its declared size. With options.parallel the four
    /// collections are decoded on separate tasks; the result is the same.
    [[nodiscard]] static ParseResult<Bank> decode(ByteView data,
                                                  const DecodeOptions& options = {});

    /// Blocks in device order.
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const Bank&) const = default;
};

static_assert(Bank::multiOffset(0) == 8384);
static_assert(Bank::drumOffset() == 13312);
static_assert(Bank::effectOffset(0) == 13994);
static_assert(Bank::kDataSize == 15114);

} // namespace K4
} // namespace Kpatch
