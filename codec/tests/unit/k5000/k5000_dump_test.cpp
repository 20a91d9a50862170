// ==============================================================================
// K5000 Header, Tone Map and Dumps - Unit Tests
// ==============================================================================
// Layer 1: K5000
//
// Tests for: codec/include/kpatch/codec/k5000/sysex_header.h
//            codec/include/kpatch/codec/k5000/tone_map.h
//            codec/include/kpatch/codec/k5000/block_dump.h
//            codec/include/kpatch/codec/k5000/dump.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <kpatch/codec/k5000/dump.h>

#include "test_helpers/fixtures.h"

#include <optional>
#include <variant>
#include <vector>

using namespace Kpatch::K5000;
using Kpatch::Codec::ByteBuffer;
using Kpatch::Codec::ParseErrorKind;
using TestHelpers::concat;
using TestHelpers::k5000Header;

namespace {

constexpr uint8_t kOne = 0x20;
constexpr uint8_t kBlock = 0x21;

/// Tone map bytes with the given 0-based tones included.
ByteBuffer toneMapBytes(std::initializer_list<std::size_t> tones) {
    ToneMap map;
    for (std::size_t tone : tones) {
        map.include(tone);
    }
    return map.encode();
}

} // namespace

// ==============================================================================
// Tone Map
// ==============================================================================

TEST_CASE("K5000 tone map packs seven tones per byte", "[codec][k5000][tone_map]") {
    const auto bytes = toneMapBytes({0, 6, 7, 127});
    REQUIRE(bytes.size() == ToneMap::kDataSize);
    REQUIRE(bytes[0] == 0b0100'0001);
    REQUIRE(bytes[1] == 0b0000'0001);
    REQUIRE(bytes[18] == 0b0000'0010);

    auto map = ToneMap::decode(bytes);
    REQUIRE(map);
    REQUIRE(map->includedCount() == 4);
    REQUIRE(map->tones() == std::vector<int>{0, 6, 7, 127});
    REQUIRE(map->isIncluded(6));
    REQUIRE_FALSE(map->isIncluded(5));
    REQUIRE_FALSE(map->isIncluded(128));
}

TEST_CASE("K5000 tone map ignores bits past the last tone", "[codec][k5000][tone_map]") {
    ByteBuffer bytes(ToneMap::kDataSize, 0);
    bytes[0] = 0x80;
    bytes[18] = 0x7C;
    auto map = ToneMap::decode(bytes);
    REQUIRE(map);
    REQUIRE(map->includedCount() == 0);
}

TEST_CASE("K5000 tone map shorter than 19 bytes is TooShort", "[codec][k5000][tone_map]") {
    const ByteBuffer bytes(ToneMap::kDataSize - 1, 0);
    auto map = ToneMap::decode(bytes);
    REQUIRE_FALSE(map);
    REQUIRE(map.error().kind == ParseErrorKind::TooShort);
}

// ==============================================================================
// Dispatch Table
// ==============================================================================

TEST_CASE("K5000 dispatch rules are mutually exclusive", "[codec][k5000][dispatch]") {
    std::vector<std::optional<BankId>> banks = {std::nullopt};
    for (uint8_t b = 0; b < kBankIdCount; ++b) {
        banks.push_back(static_cast<BankId>(b));
    }

    for (Cardinality cardinality : {Cardinality::One, Cardinality::Block}) {
        for (PatchKind kind : kPatchKinds) {
            for (const auto& bank : banks) {
                int matches = 0;
                for (const auto& rule : kDispatchRules) {
                    if (rule.matches(cardinality, kind, bank)) {
                        ++matches;
                    }
                }
                REQUIRE(matches <= 1);
            }
        }
    }
}

TEST_CASE("K5000 single rules need a bank, other kinds must not have one",
          "[codec][k5000][dispatch]") {
    REQUIRE(findRule(Cardinality::One, PatchKind::Single, std::nullopt) == nullptr);
    REQUIRE(findRule(Cardinality::One, PatchKind::Multi, BankId::A) == nullptr);
    REQUIRE(findRule(Cardinality::Block, PatchKind::DrumKit, std::nullopt) == nullptr);

    const auto* blockA = findRule(Cardinality::Block, PatchKind::Single, BankId::A);
    const auto* blockB = findRule(Cardinality::Block, PatchKind::Single, BankId::B);
    REQUIRE(blockA != nullptr);
    REQUIRE(blockB != nullptr);
    REQUIRE(blockA->subByteCount == ToneMap::kDataSize);
    REQUIRE(blockB->subByteCount == 0);
}

// ==============================================================================
// Header
// ==============================================================================

TEST_CASE("K5000 header size depends on the matched rule", "[codec][k5000][header]") {
    SECTION("One single: bank and tone number") {
        const auto bytes = k5000Header(kOne, 0x00, {0x02, 0x05});
        auto header = Header::decode(bytes);
        REQUIRE(header);
        REQUIRE(header->bank == BankId::D);
        REQUIRE(header->subBytes == ByteBuffer{0x05});
        REQUIRE(header->size() == 7);
        REQUIRE(header->encode() == bytes);
    }

    SECTION("Block multi: no bank, no sub-bytes") {
        const auto bytes = k5000Header(kBlock, 0x20);
        auto header = Header::decode(bytes);
        REQUIRE(header);
        REQUIRE_FALSE(header->bank.has_value());
        REQUIRE(header->size() == Header::kFixedSize);
        REQUIRE(header->encode() == bytes);
    }

    SECTION("Block single of bank A carries a tone map") {
        const auto map = toneMapBytes({3});
        auto header = Header::decode(concat({k5000Header(kBlock, 0x00, {0x00}), map}));
        REQUIRE(header);
        REQUIRE(header->size() == 6 + ToneMap::kDataSize);
        REQUIRE(header->subBytes == map);
    }
}

TEST_CASE("K5000 header errors", "[codec][k5000][header]") {
    SECTION("Unknown function byte") {
        auto header = Header::decode(k5000Header(0x25, 0x00, {0x00, 0x00}));
        REQUIRE_FALSE(header);
        REQUIRE(header.error().kind == ParseErrorKind::InvalidDiscriminant);
    }

    SECTION("A function that is not a dump") {
        auto header = Header::decode(k5000Header(0x10, 0x00, {0x00, 0x00}));
        REQUIRE_FALSE(header);
        REQUIRE(header.error().kind == ParseErrorKind::Unidentified);
    }

    SECTION("Unknown kind byte") {
        auto header = Header::decode(k5000Header(kOne, 0x30));
        REQUIRE_FALSE(header);
        REQUIRE(header.error().kind == ParseErrorKind::InvalidDiscriminant);
        REQUIRE(header.error().actual == 0x30);
    }

    SECTION("Unknown bank byte") {
        auto header = Header::decode(k5000Header(kOne, 0x00, {0x05, 0x00}));
        REQUIRE_FALSE(header);
        REQUIRE(header.error().kind == ParseErrorKind::InvalidDiscriminant);
        REQUIRE(header.error().context.find("bank") != std::string::npos);
    }

    SECTION("Known bytes with no rule") {
        auto header = Header::decode(k5000Header(kBlock, 0x10));
        REQUIRE_FALSE(header);
        REQUIRE(header.error().kind == ParseErrorKind::Unidentified);
    }

    SECTION("Missing tone map") {
        auto header = Header::decode(k5000Header(kBlock, 0x00, {0x00, 0x01, 0x02}));
        REQUIRE_FALSE(header);
        REQUIRE(header.error().kind == ParseErrorKind::TooShort);
    }
}

// ==============================================================================
// identify()
// ==============================================================================

TEST_CASE("K5000 one single dump carries its tone number", "[codec][k5000][dump]") {
    const auto single = TestHelpers::k5000SingleImage();
    auto dump = identify(concat({k5000Header(kOne, 0x00, {0x00, 0x10}), single}));
    REQUIRE(dump);
    REQUIRE(dump->kind == DumpKind::OneSingle);
    REQUIRE(dump->number == 0x10);
    REQUIRE_FALSE(dump->toneMap.has_value());
    REQUIRE(dump->payload == single);

    auto payload = dump->decodePayload();
    REQUIRE(payload);
    REQUIRE(std::get<SinglePatch>(payload.value()).common.name.str() == "WizooIni");
}

TEST_CASE("K5000 drum payloads stay raw", "[codec][k5000][dump]") {
    const ByteBuffer body = {0x01, 0x02, 0x03};
    auto dump = identify(concat({k5000Header(kOne, 0x10), body}));
    REQUIRE(dump);
    REQUIRE(dump->kind == DumpKind::OneDrumKit);
    REQUIRE_FALSE(dump->number.has_value());

    auto payload = dump->decodePayload();
    REQUIRE(payload);
    REQUIRE(std::get<ByteBuffer>(payload.value()) == body);
}

TEST_CASE("K5000 block multi dump decodes whole multis", "[codec][k5000][dump]") {
    const auto multi = MultiPatch{}.encode();

    SECTION("Two multis") {
        auto dump = identify(concat({k5000Header(kBlock, 0x20), multi, multi}));
        REQUIRE(dump);
        REQUIRE(dump->kind == DumpKind::BlockMulti);
        auto payload = dump->decodePayload();
        REQUIRE(payload);
        REQUIRE(std::get<std::vector<MultiPatch>>(payload.value()).size() == 2);
    }

    SECTION("A partial multi is an OffsetMismatch") {
        auto message = concat({k5000Header(kBlock, 0x20), multi});
        message.push_back(0x00);
        auto dump = identify(message);
        REQUIRE(dump);
        auto payload = dump->decodePayload();
        REQUIRE_FALSE(payload);
        REQUIRE(payload.error().kind == ParseErrorKind::OffsetMismatch);
    }
}

// ==============================================================================
// Block Single Dumps
// ==============================================================================

TEST_CASE("K5000 block single follows the tone map", "[codec][k5000][block]") {
    const auto pcm = TestHelpers::k5000SingleImage();
    const auto additive = TestHelpers::k5000SingleImage(true);
    const auto map = toneMapBytes({2, 40});
    const auto message = concat({k5000Header(kBlock, 0x00, {0x00}), map, pcm, additive});

    auto dump = identify(message);
    REQUIRE(dump);
    REQUIRE(dump->kind == DumpKind::BlockSingle);
    REQUIRE(dump->toneMap.has_value());
    REQUIRE(dump->toneMap->includedCount() == 2);

    auto payload = dump->decodePayload();
    REQUIRE(payload);
    const auto& block = std::get<BlockDump>(payload.value());
    REQUIRE(block.bank == BankId::A);
    REQUIRE(block.toneNumbers == std::vector<int>{2, 40});
    REQUIRE(block.singles.size() == 2);
    REQUIRE(block.singles[0].additiveSourceCount() == 0);
    REQUIRE(block.singles[1].source(0).additiveKit.has_value());
    REQUIRE(block.dataSize() == pcm.size() + additive.size());
    REQUIRE(block.encode() == concat({pcm, additive}));
    REQUIRE(block.toneMap().encode() == map);
}

TEST_CASE("K5000 bank B block reads singles until the payload ends", "[codec][k5000][block]") {
    const auto pcm = TestHelpers::k5000SingleImage();
    const auto message = concat({k5000Header(kBlock, 0x00, {0x01}), pcm, pcm, pcm});

    auto dump = identify(message);
    REQUIRE(dump);
    REQUIRE_FALSE(dump->toneMap.has_value());

    auto payload = dump->decodePayload();
    REQUIRE(payload);
    const auto& block = std::get<BlockDump>(payload.value());
    REQUIRE(block.bank == BankId::B);
    REQUIRE(block.toneNumbers == std::vector<int>{0, 1, 2});
}

TEST_CASE("K5000 block single failures", "[codec][k5000][block]") {
    const auto pcm = TestHelpers::k5000SingleImage();

    SECTION("Bytes left after the mapped tones") {
        auto header = Header::decode(concat({k5000Header(kBlock, 0x00, {0x00}), toneMapBytes({0})}));
        REQUIRE(header);
        auto payload = concat({pcm, ByteBuffer{0x00, 0x00}});
        auto block = BlockDump::decode(header.value(), payload);
        REQUIRE_FALSE(block);
        REQUIRE(block.error().kind == ParseErrorKind::OffsetMismatch);
        REQUIRE(block.error().context == "block single");
        REQUIRE(block.error().expected == static_cast<int>(payload.size()));
        REQUIRE(block.error().actual == static_cast<int>(pcm.size()));
    }

    SECTION("A bank B tail shorter than a single") {
        auto header = Header::decode(k5000Header(kBlock, 0x00, {0x01}));
        REQUIRE(header);
        auto payload = concat({pcm, ByteBuffer{0x00, 0x00, 0x00}});
        auto block = BlockDump::decode(header.value(), payload);
        REQUIRE_FALSE(block);
        REQUIRE(block.error().kind == ParseErrorKind::OffsetMismatch);
        REQUIRE(block.error().context == "block single");
        REQUIRE(block.error().expected == static_cast<int>(payload.size()));
        REQUIRE(block.error().actual == static_cast<int>(pcm.size()));
    }

    SECTION("A mapped tone that is missing") {
        auto header = Header::decode(
            concat({k5000Header(kBlock, 0x00, {0x00}), toneMapBytes({0, 1})}));
        REQUIRE(header);
        auto block = BlockDump::decode(header.value(), pcm);
        REQUIRE_FALSE(block);
        REQUIRE(block.error().kind == ParseErrorKind::TooShort);
        REQUIRE(block.error().context.find("tone 2") != std::string::npos);
    }

    SECTION("A header that is not a block single") {
        auto header = Header::decode(k5000Header(kBlock, 0x20));
        REQUIRE(header);
        auto block = BlockDump::decode(header.value(), pcm);
        REQUIRE_FALSE(block);
        REQUIRE(block.error().kind == ParseErrorKind::Unidentified);
    }
}
