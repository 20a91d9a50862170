// ==============================================================================
// K5000 Additive Kit - Unit Tests
// ==============================================================================
// Layer 1: K5000
//
// Tests for: codec/include/kpatch/codec/k5000/additive_kit.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <kpatch/codec/k5000/additive_kit.h>

#include "test_helpers/fixtures.h"

using namespace Kpatch::K5000;
using Kpatch::Codec::ByteBuffer;
using Kpatch::Codec::ChecksumPolicy;
using Kpatch::Codec::DecodeOptions;
using Kpatch::Codec::ParseErrorKind;

namespace {

/// Envelope bytes with the given loop bits on the decay 1 and decay 2 levels.
ByteBuffer envelopeBytes(bool loopBit1, bool loopBit2) {
    const auto level1 = static_cast<uint8_t>(0x20 | (loopBit1 ? 0x40 : 0x00));
    const auto level2 = static_cast<uint8_t>(0x10 | (loopBit2 ? 0x40 : 0x00));
    return {0x7F, 0x3F, 0x50, level1, 0x30, level2, 0x40, 0x00};
}

} // namespace

// ==============================================================================
// Harmonic Envelope Loop
// ==============================================================================

TEST_CASE("K5000 harmonic envelope loop is spread over two level bytes",
          "[codec][k5000][additive]") {
    struct Row {
        bool bit1;
        bool bit2;
        LoopType loop;
    };
    const Row row = GENERATE(Row{true, true, LoopType::Loop1}, Row{false, true, LoopType::Loop2},
                             Row{false, false, LoopType::Off});

    const auto bytes = envelopeBytes(row.bit1, row.bit2);
    auto envelope = HarmonicEnvelope::decode(bytes);
    REQUIRE(envelope);
    REQUIRE(envelope->loop == row.loop);
    REQUIRE(envelope->decay1.level.value() == 0x20);
    REQUIRE(envelope->decay2.level.value() == 0x10);
    REQUIRE(envelope->encode() == bytes);
}

TEST_CASE("K5000 harmonic envelope rejects loop bits (1, 0)", "[codec][k5000][additive]") {
    auto envelope = HarmonicEnvelope::decode(envelopeBytes(true, false));
    REQUIRE_FALSE(envelope);
    REQUIRE(envelope.error().kind == ParseErrorKind::InvalidDiscriminant);
    REQUIRE(envelope.error().actual == 2);
    REQUIRE(envelope.error().context == "harmonic envelope/loop");
}

TEST_CASE("K5000 loop type names", "[codec][k5000][additive]") {
    REQUIRE(loopTypeName(LoopType::Off) == "OFF");
    REQUIRE(loopTypeName(LoopType::Loop1) == "LP1");
    REQUIRE(loopTypeName(LoopType::Loop2) == "LP2");
}

// ==============================================================================
// Kit
// ==============================================================================

TEST_CASE("K5000 additive kit round-trips with its own checksum", "[codec][k5000][additive]") {
    AdditiveKit kit;
    kit.common.morfEnabled = true;
    kit.morf.loop = LoopType::Loop2;
    kit.softLevels[0] = HarmonicLevel::of<127>();
    kit.loudLevels[63] = HarmonicLevel::of<90>();
    kit.envelopes[10].loop = LoopType::Loop1;
    kit.envelopes[10].decay1.level = HarmonicEnvelopeLevel::of<40>();

    const auto bytes = kit.encode();
    REQUIRE(bytes.size() == AdditiveKit::kDataSize);
    REQUIRE(bytes.front() == kit.checksum());

    auto back = AdditiveKit::decode(bytes, DecodeOptions{ChecksumPolicy::Strict, false});
    REQUIRE(back);
    REQUIRE(back.value() == kit);
}

TEST_CASE("K5000 additive kit checksum mismatch follows the policy", "[codec][k5000][additive]") {
    auto bytes = AdditiveKit{}.encode();
    bytes[200] ^= 0x01;

    auto warned = AdditiveKit::decode(bytes);
    REQUIRE(warned);
    REQUIRE(warned.warnings().size() == 1);

    auto strict = AdditiveKit::decode(bytes, DecodeOptions{ChecksumPolicy::Strict, false});
    REQUIRE_FALSE(strict);
    REQUIRE(strict.error().kind == ParseErrorKind::ChecksumMismatch);
}

TEST_CASE("K5000 additive kit one byte short is TooShort", "[codec][k5000][additive]") {
    auto bytes = AdditiveKit{}.encode();
    bytes.pop_back();
    auto kit = AdditiveKit::decode(bytes);
    REQUIRE_FALSE(kit);
    REQUIRE(kit.error().kind == ParseErrorKind::TooShort);
    REQUIRE(kit.error().expected == static_cast<int>(AdditiveKit::kDataSize));
}
