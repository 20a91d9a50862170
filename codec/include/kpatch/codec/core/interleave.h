// ==============================================================================
// Layer 0: Core
// interleave.h - Stride gather/scatter for parallel parameter blocks
// ==============================================================================
// Kawai dumps often store N parallel blocks "column first": byte 0 of every
// block, then byte 1 of every block, and so on. Block b of a region holding
// N interleaved blocks is the stride-N sequence starting at offset b.
//
//   region:  a0 b0 c0 d0 a1 b1 c1 d1 ...
//   gather(region, 4, 1, n) -> b0 b1 b2 ...
//
// Decode and encode of every interleaved section go through these two
// functions only.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/byte_io.h>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

namespace Kpatch {
namespace Codec {

/// Collect `count` bytes at data[start], data[start + stride], ...
/// Positions beyond the end of `data` are not read; the result is then shorter.
[[nodiscard]] inline ByteBuffer strideGather(ByteView data, std::size_t stride,
                                             std::size_t start, std::size_t count) {
    ByteBuffer out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t at = start + i * stride;
        if (at >= data.size()) {
            break;
        }
        out.push_back(data[at]);
    }
    return out;
}

/// Inverse of strideGather over a whole region: byte i of block b lands at
/// i * stride + b. All blocks must have the same size and stride must equal
/// the number of blocks.
[[nodiscard]] inline ByteBuffer strideScatter(std::span<const ByteBuffer> blocks,
                                              std::size_t stride) {
    if (blocks.empty()) {
        return {};
    }
    const std::size_t blockSize = blocks.front().size();
    ByteBuffer out(blockSize * stride, 0);
    for (std::size_t b = 0; b < blocks.size() && b < stride; ++b) {
        for (std::size_t i = 0; i < blockSize && i < blocks[b].size(); ++i) {
            out[i * stride + b] = blocks[b][i];
        }
    }
    return out;
}

/// Read N interleaved entities of type T. Instances are named "<field> 1".."<field> N".
template <typename T, std::size_t N>
void readInterleaved(ByteReader& reader, std::array<T, N>& out, std::string_view field) {
    ByteView region = reader.bytes(N * T::kDataSize);
    if (reader.failed()) {
        return;
    }
    for (std::size_t i = 0; i < N; ++i) {
        const ByteBuffer gathered = strideGather(region, N, i, T::kDataSize);
        out[i] = reader.blockFrom<T>(gathered, fmt::format("{} {}", field, i + 1));
    }
}

template <typename T, std::size_t N>
void writeInterleaved(ByteWriter& writer, const std::array<T, N>& blocks) {
    std::array<ByteBuffer, N> encoded;
    for (std::size_t i = 0; i < N; ++i) {
        encoded[i] = blocks[i].encode();
    }
    writer.bytes(strideScatter(encoded, N));
}

/// Read N consecutive (not interleaved) entities of type T.
template <typename T, std::size_t N>
void readSequence(ByteReader& reader, std::array<T, N>& out, std::string_view field) {
    for (std::size_t i = 0; i < N && !reader.failed(); ++i) {
        out[i] = reader.block<T>(fmt::format("{} {}", field, i + 1));
    }
}

template <typename T, std::size_t N>
void writeSequence(ByteWriter& writer, const std::array<T, N>& blocks) {
    for (const auto& block : blocks) {
        writer.block(block);
    }
}

/// Read N consecutive one-byte values of category C. Values are named
/// "<field> 1".."<field> N" in errors.
template <Category C, std::size_t N>
void readValues(ByteReader& reader, std::array<BoundedValue<C>, N>& out, std::string_view field) {
    for (std::size_t i = 0; i < N && !reader.failed(); ++i) {
        const uint8_t raw = reader.byte();
        if (reader.failed()) {
            return;
        }
        auto decoded = BoundedValue<C>::fromWireByte(raw);
        if (!decoded) {
            reader.fail(decoded.error().within(fmt::format("{} {}", field, i + 1)));
            return;
        }
        out[i] = decoded.value();
    }
}

template <Category C, std::size_t N>
void writeValues(ByteWriter& writer, const std::array<BoundedValue<C>, N>& values) {
    for (const auto& v : values) {
        writer.value(v);
    }
}

} // namespace Codec
} // namespace Kpatch
