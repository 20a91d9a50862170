// ==============================================================================
// K4 Bank - Unit Tests
// ==============================================================================
// Layer 1: K4
//
// Tests for: codec/include/kpatch/codec/k4/bank.h
//            codec/include/kpatch/codec/k4/effect_patch.h
//            codec/include/kpatch/codec/k4/multi_patch.h
//            codec/include/kpatch/codec/k4/drum_patch.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <kpatch/codec/k4/bank.h>

#include "test_helpers/fixtures.h"

#include <string>

using namespace Kpatch::K4;
using Kpatch::Codec::ChecksumPolicy;
using Kpatch::Codec::DecodeOptions;
using Kpatch::Codec::ParseErrorKind;

// ==============================================================================
// Layout
// ==============================================================================

TEST_CASE("K4 bank consumes exactly the sum of its sections", "[codec][k4][bank]") {
    STATIC_REQUIRE(Bank::kDataSize == 131 * 64 + 77 * 64 + 682 + 35 * 32);
    STATIC_REQUIRE(Bank::singleOffset(63) + SinglePatch::kDataSize == Bank::multiOffset(0));
    STATIC_REQUIRE(Bank::multiOffset(63) + MultiPatch::kDataSize == Bank::drumOffset());
    STATIC_REQUIRE(Bank::effectOffset(31) + EffectPatch::kDataSize == Bank::kDataSize);
    REQUIRE(Bank{}.encode().size() == Bank::kDataSize);
}

// ==============================================================================
// Decode
// ==============================================================================

TEST_CASE("K4 bank decodes 64 singles and 32 effects", "[codec][k4][bank]") {
    const auto image = TestHelpers::k4BankImage();
    auto bank = Bank::decode(image);
    REQUIRE(bank);
    REQUIRE(bank.warnings().empty());
    REQUIRE(bank->singles.size() == 64);
    REQUIRE(bank->effects.size() == 32);
    REQUIRE(bank->singles[0].name.trimmed() == "SINGLE 01");
    REQUIRE(bank->singles[63].name.trimmed() == "SINGLE 64");
    REQUIRE(bank->effects[0].type == EffectType::Reverb1);
    REQUIRE(bank->effects[17].type == EffectType::Reverb2);
    REQUIRE(bank->effects[15].type == EffectType::ChorusStereoPanpotDelay);
}

TEST_CASE("K4 bank re-encodes to the bytes it was decoded from", "[codec][k4][bank]") {
    const auto image = TestHelpers::k4BankImage();
    auto bank = Bank::decode(image);
    REQUIRE(bank);
    REQUIRE(bank->encode() == image);
}

TEST_CASE("K4 bank one byte short is TooShort", "[codec][k4][bank]") {
    auto image = TestHelpers::k4BankImage();
    image.pop_back();
    auto bank = Bank::decode(image);
    REQUIRE_FALSE(bank);
    REQUIRE(bank.error().kind == ParseErrorKind::TooShort);
    REQUIRE(bank.error().expected == static_cast<int>(Bank::kDataSize));
    REQUIRE(bank.error().actual == static_cast<int>(Bank::kDataSize - 1));
}

TEST_CASE("K4 bank parallel decode equals sequential decode", "[codec][k4][bank]") {
    auto image = TestHelpers::k4BankImage();
    // One corrupted effect checksum, so warnings are compared too.
    image[Bank::effectOffset(3) + EffectPatch::kDataSize - 1] ^= 0x01;

    auto sequential = Bank::decode(image, DecodeOptions{ChecksumPolicy::Warn, false});
    auto parallel = Bank::decode(image, DecodeOptions{ChecksumPolicy::Warn, true});
    REQUIRE(sequential);
    REQUIRE(parallel);
    REQUIRE(sequential.value() == parallel.value());
    REQUIRE(sequential.warnings() == parallel.warnings());
    REQUIRE(sequential.warnings().size() == 1);
}

TEST_CASE("K4 bank checksum mismatch names the block", "[codec][k4][bank]") {
    auto image = TestHelpers::k4BankImage();
    image[Bank::singleOffset(11) + SinglePatch::kDataSize - 1] ^= 0x01;

    SECTION("Warn keeps the rest of the bank") {
        auto bank = Bank::decode(image);
        REQUIRE(bank);
        REQUIRE(bank.warnings().size() == 1);
        const auto& warning = bank.warnings().front();
        REQUIRE(warning.kind == ParseErrorKind::ChecksumMismatch);
        REQUIRE(warning.context.find("single 12") != std::string::npos);
        REQUIRE(bank->singles[11].name.trimmed() == "SINGLE 12");
    }

    SECTION("Strict fails the whole bank") {
        auto bank = Bank::decode(image, DecodeOptions{ChecksumPolicy::Strict, false});
        REQUIRE_FALSE(bank);
        REQUIRE(bank.error().kind == ParseErrorKind::ChecksumMismatch);
        REQUIRE(bank.error().context.find("single 12") != std::string::npos);
    }
}

// ==============================================================================
// Effects
// ==============================================================================

TEST_CASE("K4 effect type byte 0 is Reverb 1", "[codec][k4][effect]") {
    const auto image = TestHelpers::k4BankImage();
    const auto at = Bank::effectOffset(0);
    const Kpatch::Codec::ByteView view(image.data() + at, EffectPatch::kDataSize);
    REQUIRE(image[at] == 0x00);

    auto effect = EffectPatch::decode(view);
    REQUIRE(effect);
    REQUIRE(effect->type == EffectType::Reverb1);
    REQUIRE(effect->name() == "Reverb 1");
    REQUIRE(effect->parameterNames() == EffectParameterNames{"Pre.delay", "Rev.Time", "Tone"});
}

TEST_CASE("K4 effect type byte above 15 is InvalidDiscriminant", "[codec][k4][effect]") {
    auto bytes = EffectPatch{}.encode();
    bytes[0] = 16;
    TestHelpers::fixTrailingChecksum(bytes, 0, EffectPatch::kDataSize);
    auto effect = EffectPatch::decode(bytes);
    REQUIRE_FALSE(effect);
    REQUIRE(effect.error().kind == ParseErrorKind::InvalidDiscriminant);
    REQUIRE(effect.error().actual == 16);
}

// ==============================================================================
// Multi and Drum
// ==============================================================================

TEST_CASE("K4 multi round-trips through its encoding", "[codec][k4][multi]") {
    MultiPatch multi;
    multi.name = Kpatch::Codec::PatchName<kNameLength>::fromString("Split").value();
    multi.sections[0].zoneHigh = MidiNote::of<59>();
    multi.sections[1].zoneLow = MidiNote::of<60>();
    multi.sections[1].muted = true;

    const auto bytes = multi.encode();
    REQUIRE(bytes.size() == MultiPatch::kDataSize);
    auto back = MultiPatch::decode(bytes, DecodeOptions{ChecksumPolicy::Strict, false});
    REQUIRE(back);
    REQUIRE(back.value() == multi);
    REQUIRE(back->sections[0].zoneName() == "C-1 ~ B3");
}

TEST_CASE("K4 drum round-trips through its encoding", "[codec][k4][drum]") {
    DrumPatch drum;
    drum.common.volume = Level::of<80>();
    drum.notes[5].submix = Submix::C;
    drum.notes[5].source1.wave = WaveNumber::of<97>();

    const auto bytes = drum.encode();
    REQUIRE(bytes.size() == DrumPatch::kDataSize);
    auto back = DrumPatch::decode(bytes, DecodeOptions{ChecksumPolicy::Strict, false});
    REQUIRE(back);
    REQUIRE(back.value() == drum);
}
