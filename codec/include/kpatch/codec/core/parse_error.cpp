// ==============================================================================
// Parse Error Implementation
// ==============================================================================

#include "parse_error.h"

#include <spdlog/fmt/fmt.h>

namespace Kpatch {
namespace Codec {

std::string_view parseErrorKindName(ParseErrorKind kind) noexcept {
    switch (kind) {
        case ParseErrorKind::RangeError:          return "RangeError";
        case ParseErrorKind::InvalidDiscriminant: return "InvalidDiscriminant";
        case ParseErrorKind::TooShort:            return "TooShort";
        case ParseErrorKind::InvalidText:         return "InvalidText";
        case ParseErrorKind::ChecksumMismatch:    return "ChecksumMismatch";
        case ParseErrorKind::Unidentified:        return "Unidentified";
        case ParseErrorKind::OffsetMismatch:      return "OffsetMismatch";
    }
    return "Unknown";
}

std::string ParseError::message() const {
    switch (kind) {
        case ParseErrorKind::RangeError:
            return fmt::format("{}: value {} is out of range", context, actual);
        case ParseErrorKind::InvalidDiscriminant:
            return fmt::format("{}: invalid discriminant 0x{:02X}", context, actual);
        case ParseErrorKind::TooShort:
            return fmt::format("{}: got {} bytes, expected {}", context, actual, expected);
        case ParseErrorKind::InvalidText:
            return fmt::format("{}: invalid text (0x{:02X})", context, actual);
        case ParseErrorKind::ChecksumMismatch:
            return fmt::format("{}: checksum is {:02X}H, computed {:02X}H",
                               context, actual, expected);
        case ParseErrorKind::Unidentified:
            return fmt::format("{}: unable to identify this dump", context);
        case ParseErrorKind::OffsetMismatch:
            return fmt::format("{}: ended at offset {}, expected {}", context, actual, expected);
    }
    return context;
}

ParseError ParseError::within(std::string_view outer) const {
    ParseError copy = *this;
    if (copy.context.empty()) {
        copy.context = std::string(outer);
    } else {
        copy.context = fmt::format("{}/{}", outer, context);
    }
    return copy;
}

ParseError ParseError::relabeled(std::string_view outer) const {
    ParseError copy = *this;
    const auto slash = copy.context.find('/');
    if (slash == std::string::npos) {
        copy.context = std::string(outer);
    } else {
        copy.context = fmt::format("{}{}", outer, std::string_view(copy.context).substr(slash));
    }
    return copy;
}

ParseError ParseError::rangeError(std::string context, int value) {
    return ParseError{ParseErrorKind::RangeError, std::move(context), 0, value};
}

ParseError ParseError::invalidDiscriminant(std::string field, uint8_t raw) {
    return ParseError{ParseErrorKind::InvalidDiscriminant, std::move(field), 0, raw};
}

ParseError ParseError::tooShort(std::string context, std::size_t expected, std::size_t actual) {
    return ParseError{ParseErrorKind::TooShort, std::move(context),
                      static_cast<int>(expected), static_cast<int>(actual)};
}

ParseError ParseError::invalidText(std::string field, int raw) {
    return ParseError{ParseErrorKind::InvalidText, std::move(field), 0, raw};
}

ParseError ParseError::checksumMismatch(std::string context, uint8_t computed, uint8_t stored) {
    return ParseError{ParseErrorKind::ChecksumMismatch, std::move(context), computed, stored};
}

ParseError ParseError::unidentified(std::string context) {
    return ParseError{ParseErrorKind::Unidentified, std::move(context), 0, 0};
}

ParseError ParseError::offsetMismatch(std::string context, std::size_t expected,
                                      std::size_t actual) {
    return ParseError{ParseErrorKind::OffsetMismatch, std::move(context),
                      static_cast<int>(expected), static_cast<int>(actual)};
}

} // namespace Codec
} // namespace Kpatch
