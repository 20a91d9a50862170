// ==============================================================================
// Layer 0: Core
// parse_error.h - Decode failure kinds and the value-or-error result type
// ==============================================================================
// Decoding never throws. Every decode returns a ParseResult<T> that holds
// either the decoded value or the first ParseError encountered. Non-fatal
// findings (checksum mismatches under the Warn policy) travel alongside a
// successful value as warnings.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Kpatch {
namespace Codec {

// ==============================================================================
// Error Kinds
// ==============================================================================

enum class ParseErrorKind : uint8_t {
    RangeError = 0,           ///< Value outside its category bounds
    InvalidDiscriminant = 1,  ///< Raw byte matches no enumerated variant
    TooShort = 2,             ///< Fewer bytes than the entity's declared size
    InvalidText = 3,          ///< Name field holds a non-printable byte or is too long
    ChecksumMismatch = 4,     ///< Stored checksum differs from the recomputed one
    Unidentified = 5,         ///< Header matches no dispatch rule
    OffsetMismatch = 6        ///< Section consumed a different byte count than expected
};

/// Total number of ParseErrorKind values.
inline constexpr uint8_t kParseErrorKindCount = 7;

/// Display name of an error kind ("RangeError", "TooShort", ...).
[[nodiscard]] std::string_view parseErrorKindName(ParseErrorKind kind) noexcept;

// ==============================================================================
// ParseError
// ==============================================================================

/// @brief One decode failure.
///
/// `context` names the category, field or block the error refers to. Nested
/// decoders prefix their own block name via within(), so an error deep in a
/// bank reads like "bank/single 12/source 3: velocity curve".
///
/// `expected` and `actual` carry the numbers relevant to the kind:
/// - RangeError: actual = offending integer
/// - InvalidDiscriminant / InvalidText: actual = raw byte
/// - TooShort / OffsetMismatch: byte counts
/// - ChecksumMismatch: computed (expected) vs stored (actual)
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Unidentified;
    std::string context;
    int expected = 0;
    int actual = 0;

    /// Human-readable one-line description.
    [[nodiscard]] std::string message() const;

    /// Copy of this error with `outer` prefixed to the context.
    [[nodiscard]] ParseError within(std::string_view outer) const;

    /// Copy with the outermost context component replaced by `outer`. A nested
    /// block reports under its field name ("source 3") rather than its own
    /// ("source").
    [[nodiscard]] ParseError relabeled(std::string_view outer) const;

    bool operator==(const ParseError&) const = default;

    [[nodiscard]] static ParseError rangeError(std::string context, int value);
    [[nodiscard]] static ParseError invalidDiscriminant(std::string field, uint8_t raw);
    [[nodiscard]] static ParseError tooShort(std::string context, std::size_t expected,
                                             std::size_t actual);
    [[nodiscard]] static ParseError invalidText(std::string field, int raw);
    [[nodiscard]] static ParseError checksumMismatch(std::string context, uint8_t computed,
                                                     uint8_t stored);
    [[nodiscard]] static ParseError unidentified(std::string context);
    [[nodiscard]] static ParseError offsetMismatch(std::string context, std::size_t expected,
                                                   std::size_t actual);
};

// ==============================================================================
// ParseResult
// ==============================================================================

/// @brief Value-or-error returned by every decode operation.
///
/// Converts implicitly from either a T or a ParseError so decoders can
/// `return value;` and `return error;` directly.
///
/// @note Accessing value() on a failed result is a programming error
///       (std::bad_variant_access); check ok() or operator bool first.
template <typename T>
class ParseResult {
public:
    ParseResult(T value) : state_(std::move(value)) {}          // NOLINT(google-explicit-constructor)
    ParseResult(ParseError error) : state_(std::move(error)) {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state_); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(state_); }
    [[nodiscard]] T& value() & { return std::get<T>(state_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(state_)); }

    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }

    [[nodiscard]] const ParseError& error() const { return std::get<ParseError>(state_); }

    /// Non-fatal findings collected while decoding (checksum mismatches).
    [[nodiscard]] const std::vector<ParseError>& warnings() const noexcept { return warnings_; }

    void addWarning(ParseError warning) { warnings_.push_back(std::move(warning)); }

    void addWarnings(const std::vector<ParseError>& warnings) {
        warnings_.insert(warnings_.end(), warnings.begin(), warnings.end());
    }

private:
    std::variant<T, ParseError> state_;
    std::vector<ParseError> warnings_;
};

} // namespace Codec
} // namespace Kpatch
