// ==============================================================================
// K4 Single Patch - Unit Tests
// ==============================================================================
// Layer 1: K4
//
// Tests for: codec/include/kpatch/codec/k4/single_patch.h
//            codec/include/kpatch/codec/k4/source.h
//            codec/include/kpatch/codec/k4/wave.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <kpatch/codec/k4/single_patch.h>
#include <kpatch/codec/k4/wave.h>

#include "test_helpers/fixtures.h"

using namespace Kpatch::K4;
using Kpatch::Codec::ChecksumPolicy;
using Kpatch::Codec::ParseErrorKind;

namespace {

/// Byte i of source b within a single image (sources are interleaved).
constexpr std::size_t sourceByte(std::size_t source, std::size_t i) {
    return 30 + i * kSourceCount + source;
}

} // namespace

// ==============================================================================
// Decode
// ==============================================================================

TEST_CASE("K4 single decodes name, volume and effect", "[codec][k4][single]") {
    const auto image = TestHelpers::k4SingleImage();
    auto single = SinglePatch::decode(image);
    REQUIRE(single);
    REQUIRE(single.warnings().empty());
    REQUIRE(single->name.trimmed() == "Melo Vox 1");
    REQUIRE(single->volume.value() == 100);
    REQUIRE(single->effect.value() == 5);
}

TEST_CASE("K4 single re-encodes to the bytes it was decoded from", "[codec][k4][single]") {
    const auto image = TestHelpers::k4SingleImage();
    auto single = SinglePatch::decode(image);
    REQUIRE(single);
    REQUIRE(single->encode() == image);
    REQUIRE(single->checksum() == image.back());
}

TEST_CASE("K4 single reads source mutes as inverted bits", "[codec][k4][single]") {
    auto image = TestHelpers::k4SingleImage();
    image[14] = static_cast<uint8_t>((image[14] & 0xF0) | 0x05);
    TestHelpers::fixTrailingChecksum(image, 0, SinglePatch::kDataSize);

    auto single = SinglePatch::decode(image);
    REQUIRE(single);
    REQUIRE_FALSE(single->sourceMutes[0]);
    REQUIRE(single->sourceMutes[1]);
    REQUIRE_FALSE(single->sourceMutes[2]);
    REQUIRE(single->sourceMutes[3]);
    REQUIRE(single->sourceMuteString() == "1-3-");
    REQUIRE(single->encode() == image);
}

TEST_CASE("K4 single s13 fields decode independently", "[codec][k4][single]") {
    auto decodeWithS13 = [](uint8_t s13) {
        auto image = TestHelpers::k4SingleImage();
        image[13] = s13;
        TestHelpers::fixTrailingChecksum(image, 0, SinglePatch::kDataSize);
        auto single = SinglePatch::decode(image, {ChecksumPolicy::Strict, false});
        REQUIRE(single);
        REQUIRE(single->encode() == image);
        return single.value();
    };

    // Double mode (2), Solo 1 (2 << 2).
    const auto base = decodeWithS13(0x0A);
    REQUIRE(base.sourceMode == SourceMode::Double);
    REQUIRE(base.polyphonyMode == PolyphonyMode::Solo1);
    REQUIRE_FALSE(base.am12);
    REQUIRE_FALSE(base.am34);

    SECTION("AM1>2 leaves mode and polyphony alone") {
        const auto flipped = decodeWithS13(0x0A | 0x10);
        REQUIRE(flipped.am12);
        REQUIRE_FALSE(flipped.am34);
        REQUIRE(flipped.sourceMode == SourceMode::Double);
        REQUIRE(flipped.polyphonyMode == PolyphonyMode::Solo1);
    }

    SECTION("Mode and polyphony leave the AM flags alone") {
        const auto withAm = decodeWithS13(0x30);
        REQUIRE(withAm.am12);
        REQUIRE(withAm.am34);
        REQUIRE(withAm.sourceMode == SourceMode::Normal);
        REQUIRE(withAm.polyphonyMode == PolyphonyMode::Poly1);

        // Twin mode (1), Solo 2 (3 << 2).
        const auto changed = decodeWithS13(0x30 | 0x0D);
        REQUIRE(changed.am12);
        REQUIRE(changed.am34);
        REQUIRE(changed.sourceMode == SourceMode::Twin);
        REQUIRE(changed.polyphonyMode == PolyphonyMode::Solo2);
    }
}

TEST_CASE("K4 single gathers each source from the interleaved region", "[codec][k4][single]") {
    auto image = TestHelpers::k4SingleImage();
    // Source 2 plays wave 256, source 3 has a delay of 42.
    image[sourceByte(1, 1)] = static_cast<uint8_t>((image[sourceByte(1, 1)] & 0x70) | 0x01);
    image[sourceByte(1, 2)] = 0x7F;
    image[sourceByte(2, 0)] = 42;
    TestHelpers::fixTrailingChecksum(image, 0, SinglePatch::kDataSize);

    auto single = SinglePatch::decode(image);
    REQUIRE(single);
    REQUIRE(single->sources[1].wave.value() == 256);
    REQUIRE(waveName(single->sources[1].wave) == "LOOP 12");
    REQUIRE(single->sources[2].delay.value() == 42);
    REQUIRE(single->sources[0].delay.value() == 0);
    REQUIRE(single->encode() == image);
}

// ==============================================================================
// Failures
// ==============================================================================

TEST_CASE("K4 single one byte short is TooShort", "[codec][k4][single]") {
    auto image = TestHelpers::k4SingleImage();
    image.pop_back();
    auto single = SinglePatch::decode(image);
    REQUIRE_FALSE(single);
    REQUIRE(single.error().kind == ParseErrorKind::TooShort);
    REQUIRE(single.error().expected == 131);
    REQUIRE(single.error().actual == 130);
}

TEST_CASE("K4 single with a bad checksum follows the policy", "[codec][k4][single]") {
    auto image = TestHelpers::k4SingleImage();
    image.back() = static_cast<uint8_t>((image.back() + 1) & 0x7F);

    auto warned = SinglePatch::decode(image);
    REQUIRE(warned);
    REQUIRE(warned.warnings().size() == 1);
    REQUIRE(warned->name.trimmed() == "Melo Vox 1");

    auto strict = SinglePatch::decode(image, {ChecksumPolicy::Strict, false});
    REQUIRE_FALSE(strict);
    REQUIRE(strict.error().kind == ParseErrorKind::ChecksumMismatch);

    auto ignored = SinglePatch::decode(image, {ChecksumPolicy::Ignore, false});
    REQUIRE(ignored);
    REQUIRE(ignored.warnings().empty());
}

TEST_CASE("K4 single rejects a volume above 100", "[codec][k4][single]") {
    auto image = TestHelpers::k4SingleImage();
    image[10] = 101;
    TestHelpers::fixTrailingChecksum(image, 0, SinglePatch::kDataSize);
    auto single = SinglePatch::decode(image);
    REQUIRE_FALSE(single);
    REQUIRE(single.error().kind == ParseErrorKind::RangeError);
    REQUIRE(single.error().actual == 101);
}

// ==============================================================================
// Encode
// ==============================================================================

TEST_CASE("K4 single encode always recomputes the checksum", "[codec][k4][single]") {
    SinglePatch single;
    single.name = PatchName::fromString("Test").value();
    single.volume = Level::of<77>();
    const auto bytes = single.encode();
    REQUIRE(bytes.size() == SinglePatch::kDataSize);
    REQUIRE(bytes.back() == single.checksum());

    auto back = SinglePatch::decode(bytes, {ChecksumPolicy::Strict, false});
    REQUIRE(back);
    REQUIRE(back.value() == single);
}

// ==============================================================================
// Waves
// ==============================================================================

TEST_CASE("K4 wave numbers split over two bytes", "[codec][k4][wave]") {
    SECTION("High bit and low seven bits decode to 256") {
        auto wave = decodeWave(0x01, 0x7F);
        REQUIRE(wave);
        REQUIRE(wave->value() == 256);
        REQUIRE(encodeWave(wave.value()) == std::array<uint8_t, 2>{0x01, 0x7F});
    }

    SECTION("Unrelated high bits are ignored") {
        REQUIRE(decodeWave(0x71, 0x00)->value() == 129);
    }

    SECTION("Wave 1 is the first entry") {
        REQUIRE(decodeWave(0x00, 0x00)->value() == 1);
        REQUIRE(waveName(1) == "SIN 1ST");
    }

    SECTION("Names cover 1..256 only") {
        REQUIRE(waveName(256) == "LOOP 12");
        REQUIRE(waveName(0).empty());
        REQUIRE(waveName(257).empty());
    }
}
