// ==============================================================================
// Layer 0: Core
// text_field.h - Fixed-width ASCII patch names
// ==============================================================================
// Names occupy a fixed number of bytes, padded with spaces. Only printable
// ASCII (0x20..0x7E) is valid; NUL bytes found in dumps are read as spaces.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/byte_io.h>
#include <kpatch/codec/core/parse_error.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Kpatch {
namespace Codec {

inline constexpr uint8_t kFirstPrintable = 0x20;
inline constexpr uint8_t kLastPrintable = 0x7E;

[[nodiscard]] constexpr bool isPrintableAscii(uint8_t c) noexcept {
    return c >= kFirstPrintable && c <= kLastPrintable;
}

template <std::size_t Width>
class PatchName {
public:
    static constexpr std::size_t kDataSize = Width;

    /// All spaces.
    PatchName() : text_(Width, ' ') {}

    /// Validate and pad a user-supplied name.
    /// @return InvalidText for a non-printable character or a name longer than Width
    [[nodiscard]] static ParseResult<PatchName> fromString(std::string_view text) {
        if (text.size() > Width) {
            return ParseError::invalidText("name", static_cast<int>(text.size()));
        }
        PatchName name;
        for (std::size_t i = 0; i < text.size(); ++i) {
            const auto c = static_cast<uint8_t>(text[i]);
            if (!isPrintableAscii(c)) {
                return ParseError::invalidText("name", c);
            }
            name.text_[i] = static_cast<char>(c);
        }
        return name;
    }

    [[nodiscard]] static ParseResult<PatchName> decode(ByteView data,
                                                       const DecodeOptions& options = {}) {
        ByteReader reader(data, "name", options);
        PatchName name;
        const ByteView raw = reader.bytes(Width);
        for (std::size_t i = 0; i < raw.size() && !reader.failed(); ++i) {
            const uint8_t c = raw[i];
            if (c == 0) {
                continue;
            }
            if (!isPrintableAscii(c)) {
                reader.fail(ParseError::invalidText(std::string{}, c));
                break;
            }
            name.text_[i] = static_cast<char>(c);
        }
        return reader.finish(std::move(name));
    }

    [[nodiscard]] ByteBuffer encode() const { return ByteBuffer(text_.begin(), text_.end()); }

    /// Full padded text, exactly Width characters.
    [[nodiscard]] const std::string& str() const noexcept { return text_; }

    /// Text without trailing padding.
    [[nodiscard]] std::string_view trimmed() const noexcept {
        std::string_view view(text_);
        const auto end = view.find_last_not_of(' ');
        return end == std::string_view::npos ? std::string_view{} : view.substr(0, end + 1);
    }

    bool operator==(const PatchName&) const = default;

private:
    std::string text_;
};

} // namespace Codec
} // namespace Kpatch
