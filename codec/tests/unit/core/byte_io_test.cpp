// ==============================================================================
// Byte Reader/Writer, Interleaving and Names - Unit Tests
// ==============================================================================
// Layer 0: Core
//
// Tests for: codec/include/kpatch/codec/core/byte_io.h
//            codec/include/kpatch/codec/core/interleave.h
//            codec/include/kpatch/codec/core/text_field.h
//            codec/include/kpatch/codec/core/note_names.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <kpatch/codec/core/byte_io.h>
#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/note_names.h>
#include <kpatch/codec/core/text_field.h>

#include <array>
#include <vector>

using namespace Kpatch::Codec;

namespace {

/// Two-byte entity: a level and a depth.
struct Pair {
    static constexpr std::size_t kDataSize = 2;

    BoundedValue<Category::K4Level> level;
    BoundedValue<Category::K4Depth> depth;

    static ParseResult<Pair> decode(ByteView data, const DecodeOptions& options = {}) {
        ByteReader reader(data, "pair", options);
        reader.require(kDataSize);
        Pair pair;
        pair.level = reader.value<Category::K4Level>("level");
        pair.depth = reader.value<Category::K4Depth>("depth");
        return reader.finish(pair);
    }

    ByteBuffer encode() const { return {level.toWireByte(), depth.toWireByte()}; }

    bool operator==(const Pair&) const = default;
};

/// Checksummed entity: one body byte followed by its checksum.
struct Sealed {
    static constexpr std::size_t kDataSize = 2;

    uint8_t body = 0;

    static ParseResult<Sealed> decode(ByteView data, const DecodeOptions& options = {}) {
        ByteReader reader(data, "sealed", options);
        reader.require(kDataSize);
        Sealed sealed;
        sealed.body = reader.byte();
        const uint8_t stored = reader.byte();
        reader.verifyChecksum(checksum(data.first(1)), stored);
        return reader.finish(sealed);
    }
};

} // namespace

// ==============================================================================
// ByteReader
// ==============================================================================

TEST_CASE("ByteReader reads values through their category", "[codec][core][byte_io]") {
    const std::vector<uint8_t> data = {100, 0};
    auto pair = Pair::decode(data);
    REQUIRE(pair);
    REQUIRE(pair->level.value() == 100);
    REQUIRE(pair->depth.value() == -50);
    REQUIRE(pair->encode() == data);
}

TEST_CASE("ByteReader reports TooShort with the entity context", "[codec][core][byte_io]") {
    const std::vector<uint8_t> data = {100};
    auto pair = Pair::decode(data);
    REQUIRE_FALSE(pair);
    REQUIRE(pair.error().kind == ParseErrorKind::TooShort);
    REQUIRE(pair.error().context == "pair");
    REQUIRE(pair.error().expected == 2);
    REQUIRE(pair.error().actual == 1);
}

TEST_CASE("ByteReader latches the first failure", "[codec][core][byte_io]") {
    const std::vector<uint8_t> data = {101, 200};
    auto pair = Pair::decode(data);
    REQUIRE_FALSE(pair);
    REQUIRE(pair.error().kind == ParseErrorKind::RangeError);
    REQUIRE(pair.error().context == "pair/level/K4Level");
    REQUIRE(pair.error().actual == 101);
}

TEST_CASE("ByteReader rejects unknown enumeration bytes", "[codec][core][byte_io]") {
    enum class Mode : uint8_t { A = 0, B, C };
    const std::vector<uint8_t> data = {3};
    ByteReader reader(data, "mode");
    const Mode mode = reader.enumeration<Mode>(3, "mode");
    REQUIRE(mode == Mode::A);
    auto result = reader.finish(mode);
    REQUIRE_FALSE(result);
    REQUIRE(result.error().kind == ParseErrorKind::InvalidDiscriminant);
    REQUIRE(result.error().actual == 3);
}

TEST_CASE("Nested blocks report under their field name", "[codec][core][byte_io]") {
    const std::vector<uint8_t> data = {0, 50, 0, 101};
    ByteReader reader(data, "outer");
    const Pair first = reader.block<Pair>("pair 1");
    const Pair second = reader.block<Pair>("pair 2");
    REQUIRE(first.depth.value() == 0);
    REQUIRE(second == Pair{});
    auto result = reader.finish(0);
    REQUIRE_FALSE(result);
    REQUIRE(result.error().context == "outer/pair 2/depth/K4Depth");
}

// ==============================================================================
// Checksum Policy
// ==============================================================================

TEST_CASE("Checksum policy decides what a mismatch does", "[codec][core][checksum_policy]") {
    const std::vector<uint8_t> good = {0x10, checksum(std::vector<uint8_t>{0x10})};
    std::vector<uint8_t> bad = good;
    bad[1] = static_cast<uint8_t>((bad[1] + 1) & 0x7F);

    SECTION("A matching checksum is silent under every policy") {
        for (auto policy : {ChecksumPolicy::Strict, ChecksumPolicy::Warn, ChecksumPolicy::Ignore}) {
            auto sealed = Sealed::decode(good, DecodeOptions{policy, false});
            REQUIRE(sealed);
            REQUIRE(sealed.warnings().empty());
        }
    }

    SECTION("Strict fails the decode") {
        auto sealed = Sealed::decode(bad, DecodeOptions{ChecksumPolicy::Strict, false});
        REQUIRE_FALSE(sealed);
        REQUIRE(sealed.error().kind == ParseErrorKind::ChecksumMismatch);
        REQUIRE(sealed.error().expected == good[1]);
        REQUIRE(sealed.error().actual == bad[1]);
    }

    SECTION("Warn keeps the value and reports a warning") {
        auto sealed = Sealed::decode(bad, DecodeOptions{ChecksumPolicy::Warn, false});
        REQUIRE(sealed);
        REQUIRE(sealed->body == 0x10);
        REQUIRE(sealed.warnings().size() == 1);
        REQUIRE(sealed.warnings().front().kind == ParseErrorKind::ChecksumMismatch);
        REQUIRE(sealed.warnings().front().context == "sealed/checksum");
    }

    SECTION("Ignore does not compare") {
        auto sealed = Sealed::decode(bad, DecodeOptions{ChecksumPolicy::Ignore, false});
        REQUIRE(sealed);
        REQUIRE(sealed.warnings().empty());
    }
}

TEST_CASE("Default decode options are valid", "[codec][core][checksum_policy]") {
    const DecodeOptions options;
    REQUIRE(options.isValid());
    REQUIRE(options.checksumPolicy == ChecksumPolicy::Warn);
    REQUIRE_FALSE(options.parallel);
    REQUIRE(checksumPolicyName(ChecksumPolicy::Strict) == "strict");
}

// ==============================================================================
// Interleaving
// ==============================================================================

TEST_CASE("Stride gather picks every Nth byte", "[codec][core][interleave]") {
    const std::vector<uint8_t> region = {0xA0, 0xB0, 0xC0, 0xD0, 0xA1, 0xB1, 0xC1, 0xD1};
    REQUIRE(strideGather(region, 4, 0, 2) == ByteBuffer{0xA0, 0xA1});
    REQUIRE(strideGather(region, 4, 1, 2) == ByteBuffer{0xB0, 0xB1});
    REQUIRE(strideGather(region, 4, 3, 2) == ByteBuffer{0xD0, 0xD1});
    REQUIRE(strideGather(region, 4, 3, 3).size() == 2);
}

TEST_CASE("Stride scatter is the inverse of gather", "[codec][core][interleave]") {
    const std::array<ByteBuffer, 4> blocks = {
        ByteBuffer{1, 2, 3}, ByteBuffer{4, 5, 6}, ByteBuffer{7, 8, 9}, ByteBuffer{10, 11, 12}
    };
    const ByteBuffer region = strideScatter(blocks, 4);
    REQUIRE(region == ByteBuffer{1, 4, 7, 10, 2, 5, 8, 11, 3, 6, 9, 12});
    for (std::size_t b = 0; b < blocks.size(); ++b) {
        REQUIRE(strideGather(region, 4, b, 3) == blocks[b]);
    }
}

TEST_CASE("Interleaved entities decode and encode through one stride",
          "[codec][core][interleave]") {
    // level of pair 1, level of pair 2, depth of pair 1, depth of pair 2
    const std::vector<uint8_t> data = {10, 20, 50, 60};
    ByteReader reader(data, "pairs");
    std::array<Pair, 2> pairs{};
    readInterleaved(reader, pairs, "pair");
    REQUIRE_FALSE(reader.failed());
    REQUIRE(pairs[0].level.value() == 10);
    REQUIRE(pairs[0].depth.value() == 0);
    REQUIRE(pairs[1].level.value() == 20);
    REQUIRE(pairs[1].depth.value() == 10);

    ByteWriter writer;
    writeInterleaved(writer, pairs);
    REQUIRE(writer.buffer() == ByteBuffer(data.begin(), data.end()));
}

// ==============================================================================
// Names
// ==============================================================================

TEST_CASE("Patch names are padded printable ASCII", "[codec][core][text_field]") {
    SECTION("NUL bytes read as spaces") {
        const std::vector<uint8_t> data = {'A', 'B', 0, 0};
        auto name = PatchName<4>::decode(data);
        REQUIRE(name);
        REQUIRE(name->str() == "AB  ");
        REQUIRE(name->trimmed() == "AB");
        REQUIRE(name->encode() == ByteBuffer{'A', 'B', ' ', ' '});
    }

    SECTION("Control characters are InvalidText") {
        const std::vector<uint8_t> data = {'A', 0x07, 'C', 'D'};
        auto name = PatchName<4>::decode(data);
        REQUIRE_FALSE(name);
        REQUIRE(name.error().kind == ParseErrorKind::InvalidText);
        REQUIRE(name.error().actual == 0x07);
    }

    SECTION("Names longer than the field are rejected") {
        REQUIRE_FALSE(PatchName<4>::fromString("TOO LONG"));
        REQUIRE(PatchName<4>::fromString("OK")->str() == "OK  ");
    }
}

TEST_CASE("Note names use octave -1 for note 0", "[codec][core][note_names]") {
    REQUIRE(noteName(0) == "C-1");
    REQUIRE(noteName(60) == "C4");
    REQUIRE(noteName(127) == "G9");
    REQUIRE(noteName(128).empty());
    REQUIRE(zoneName(MidiNote::minimum(), MidiNote::maximum()) == "C-1 ~ G9");
}
