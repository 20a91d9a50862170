// ==============================================================================
// Layer 0: Core
// byte_io.h - Cursor-based reader and writer for dump byte images
// ==============================================================================
// ByteReader walks an untrusted buffer front to back. The first failure is
// latched: every later read returns a default value and does nothing, so a
// decoder can read its whole layout linearly and check the outcome once in
// finish().
//
// ByteWriter is the encode counterpart. Encoding a validated model cannot
// fail, so the writer has no error state.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bounded_value.h>
#include <kpatch/codec/core/decode_options.h>
#include <kpatch/codec/core/logging.h>
#include <kpatch/codec/core/parse_error.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Kpatch {
namespace Codec {

using ByteView = std::span<const uint8_t>;
using ByteBuffer = std::vector<uint8_t>;

// ==============================================================================
// Enumerations
// ==============================================================================

/// Checked conversion of a raw byte into an enum whose values run 0..count-1.
/// @return std::nullopt when raw is not a valid variant
template <typename E>
[[nodiscard]] constexpr std::optional<E> enumFromByte(uint8_t raw, uint8_t count) noexcept {
    if (raw >= count) {
        return std::nullopt;
    }
    return static_cast<E>(raw);
}

template <typename E>
[[nodiscard]] constexpr uint8_t enumToByte(E value) noexcept {
    return static_cast<uint8_t>(value);
}

// ==============================================================================
// ByteReader
// ==============================================================================

class ByteReader {
public:
    /// @param data     Bytes to decode, starting at the entity's first byte
    /// @param context  Name of the entity, prefixed to every error it reports
    /// @param options  Checksum policy and the like, passed on to nested blocks
    ByteReader(ByteView data, std::string_view context, const DecodeOptions& options = {})
        : data_(data), context_(context), options_(options) {}

    /// Fail with TooShort unless at least `size` bytes remain.
    bool require(std::size_t size) {
        if (failed()) {
            return false;
        }
        if (remaining() < size) {
            fail(ParseError::tooShort(std::string{}, offset_ + size, data_.size()));
            return false;
        }
        return true;
    }

    [[nodiscard]] uint8_t byte() {
        if (!require(1)) {
            return 0;
        }
        return data_[offset_++];
    }

    /// Next `count` bytes as a view into the source buffer.
    [[nodiscard]] ByteView bytes(std::size_t count) {
        if (!require(count)) {
            return {};
        }
        ByteView view = data_.subspan(offset_, count);
        offset_ += count;
        return view;
    }

    void skip(std::size_t count) {
        if (require(count)) {
            offset_ += count;
        }
    }

    /// Byte at `offset` from the current position, without consuming it.
    [[nodiscard]] uint8_t peek(std::size_t offset = 0) const noexcept {
        const std::size_t at = offset_ + offset;
        return at < data_.size() ? data_[at] : 0;
    }

    // -------------------------------------------------------------------------
    // Typed reads
    // -------------------------------------------------------------------------

    /// Read one byte as a biased value of category C.
    template <Category C>
    [[nodiscard]] BoundedValue<C> value(std::string_view field) {
        const uint8_t raw = byte();
        return valueFrom<C>(raw, field);
    }

    /// Validate an already extracted wire value (a bit field, a two-byte number).
    template <Category C>
    [[nodiscard]] BoundedValue<C> valueFrom(int wire, std::string_view field) {
        if (failed()) {
            return {};
        }
        auto result = BoundedValue<C>::fromWire(wire);
        if (!result) {
            fail(result.error().within(field));
            return {};
        }
        return result.value();
    }

    template <typename E>
    [[nodiscard]] E enumeration(uint8_t raw, uint8_t count, std::string_view field) {
        if (failed()) {
            return E{};
        }
        if (auto decoded = enumFromByte<E>(raw, count)) {
            return *decoded;
        }
        fail(ParseError::invalidDiscriminant(std::string(field), raw));
        return E{};
    }

    /// Read one byte as an enum with `count` variants.
    template <typename E>
    [[nodiscard]] E enumeration(uint8_t count, std::string_view field) {
        const uint8_t raw = byte();
        return enumeration<E>(raw, count, field);
    }

    /// Decode the next T::kDataSize bytes as a nested entity.
    template <typename T>
    [[nodiscard]] T block(std::string_view field) {
        ByteView view = bytes(T::kDataSize);
        return blockFrom<T>(view, field);
    }

    /// Decode a nested entity from an arbitrary view (e.g. a gathered stride).
    /// Warnings of the nested decode are kept; an error stops this reader.
    /// Both are reported under `field`.
    template <typename T>
    [[nodiscard]] T blockFrom(ByteView view, std::string_view field) {
        if (failed()) {
            return T{};
        }
        auto result = T::decode(view, options_);
        for (const auto& warning : result.warnings()) {
            warnings_.push_back(warning.relabeled(field));
        }
        if (!result) {
            fail(result.error().relabeled(field));
            return T{};
        }
        return std::move(result).value();
    }

    // -------------------------------------------------------------------------
    // Checksums
    // -------------------------------------------------------------------------

    /// Compare a recomputed checksum with the stored one under the checksum policy.
    void verifyChecksum(uint8_t computed, uint8_t stored) {
        if (failed() || computed == stored) {
            return;
        }
        switch (options_.checksumPolicy) {
            case ChecksumPolicy::Ignore:
                return;
            case ChecksumPolicy::Strict:
                fail(ParseError::checksumMismatch("checksum", computed, stored));
                return;
            case ChecksumPolicy::Warn: {
                auto warning = ParseError::checksumMismatch("checksum", computed, stored);
                logger()->warn("{}: {}", context_, warning.message());
                warnings_.push_back(std::move(warning));
                return;
            }
        }
    }

    // -------------------------------------------------------------------------
    // State
    // -------------------------------------------------------------------------

    void fail(ParseError error) {
        if (!error_) {
            error_ = std::move(error);
        }
    }

    [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
    [[nodiscard]] ByteView data() const noexcept { return data_; }
    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

    /// Wrap up a decode: the latched error if any, otherwise `value` with all
    /// collected warnings. Both carry this reader's context.
    template <typename T>
    [[nodiscard]] ParseResult<T> finish(T value) {
        if (error_) {
            return error_->within(context_);
        }
        ParseResult<T> result(std::move(value));
        for (const auto& warning : warnings_) {
            result.addWarning(warning.within(context_));
        }
        return result;
    }

private:
    ByteView data_;
    std::size_t offset_ = 0;
    std::string context_;
    DecodeOptions options_;
    std::optional<ParseError> error_;
    std::vector<ParseError> warnings_;
};

// ==============================================================================
// ByteWriter
// ==============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t capacity) { buffer_.reserve(capacity); }

    void byte(uint8_t b) { buffer_.push_back(b); }

    void bytes(ByteView view) { buffer_.insert(buffer_.end(), view.begin(), view.end()); }

    void zeros(std::size_t count) { buffer_.insert(buffer_.end(), count, 0); }

    template <Category C>
    void value(BoundedValue<C> v) {
        byte(v.toWireByte());
    }

    template <typename E>
    void enumeration(E e) {
        byte(enumToByte(e));
    }

    template <typename T>
    void block(const T& entity) {
        bytes(entity.encode());
    }

    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] const ByteBuffer& buffer() const noexcept { return buffer_; }
    [[nodiscard]] ByteBuffer take() && { return std::move(buffer_); }

private:
    ByteBuffer buffer_;
};

} // namespace Codec
} // namespace Kpatch
