// ==============================================================================
// Layer 0: Core
// decode_options.h - Caller-tunable decode behaviour
// ==============================================================================

#pragma once

#include <cstdint>
#include <string_view>

namespace Kpatch {
namespace Codec {

/// What to do when a stored checksum differs from the recomputed one.
enum class ChecksumPolicy : uint8_t {
    Strict = 0,  ///< Mismatch fails the decode with ChecksumMismatch
    Warn = 1,    ///< Mismatch is logged and reported through warnings()
    Ignore = 2   ///< Stored checksum is not compared
};

inline constexpr uint8_t kChecksumPolicyCount = 3;

[[nodiscard]] constexpr std::string_view checksumPolicyName(ChecksumPolicy policy) noexcept {
    switch (policy) {
        case ChecksumPolicy::Strict: return "strict";
        case ChecksumPolicy::Warn:   return "warn";
        case ChecksumPolicy::Ignore: return "ignore";
    }
    return "unknown";
}

struct DecodeOptions {
    ChecksumPolicy checksumPolicy = ChecksumPolicy::Warn;

    /// Decode independent bank collections on separate std::async tasks.
    bool parallel = false;

    [[nodiscard]] bool isValid() const noexcept {
        return static_cast<uint8_t>(checksumPolicy) < kChecksumPolicyCount;
    }
};

} // namespace Codec
} // namespace Kpatch
