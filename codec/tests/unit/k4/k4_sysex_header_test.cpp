// ==============================================================================
// K4 Header and Dump Classification - Unit Tests
// ==============================================================================
// Layer 1: K4
//
// Tests for: codec/include/kpatch/codec/k4/sysex_header.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <kpatch/codec/k4/sysex_header.h>

#include "test_helpers/fixtures.h"

#include <variant>

using namespace Kpatch::K4;
using Kpatch::Codec::ParseErrorKind;
using TestHelpers::concat;
using TestHelpers::k4Header;

// ==============================================================================
// Dispatch Table
// ==============================================================================

TEST_CASE("K4 dispatch rules are mutually exclusive", "[codec][k4][dispatch]") {
    for (Function function : kFunctions) {
        for (int sub1 = 0; sub1 < 128; ++sub1) {
            for (int sub2 = 0; sub2 < 128; ++sub2) {
                int matches = 0;
                for (const auto& rule : kDispatchRules) {
                    if (rule.matches(function, static_cast<uint8_t>(sub1),
                                     static_cast<uint8_t>(sub2))) {
                        ++matches;
                    }
                }
                if (matches > 1) {
                    FAIL("overlapping rules for " << static_cast<int>(function) << " " << sub1
                                                  << " " << sub2);
                }
            }
        }
    }
    SUCCEED();
}

TEST_CASE("K4 every dump kind has a rule", "[codec][k4][dispatch]") {
    for (uint8_t k = 0; k < kDumpKindCount; ++k) {
        bool found = false;
        for (const auto& rule : kDispatchRules) {
            found = found || rule.kind == static_cast<DumpKind>(k);
        }
        REQUIRE(found);
    }
}

// ==============================================================================
// identify()
// ==============================================================================

TEST_CASE("K4 one single dump is classified with its patch number", "[codec][k4][dispatch]") {
    const auto single = TestHelpers::k4SingleImage();
    const auto message = concat({k4Header(0x20, 0x00, 12), single});

    auto dump = identify(message);
    REQUIRE(dump);
    REQUIRE(dump->kind == DumpKind::OneSingle);
    REQUIRE(dump->locality == Locality::Internal);
    REQUIRE(dump->number == 12);
    REQUIRE(dump->payload == single);
    REQUIRE(dump->expectedPayloadSize() == SinglePatch::kDataSize);

    auto payload = dump->decodePayload();
    REQUIRE(payload);
    REQUIRE(std::holds_alternative<SinglePatch>(payload.value()));
    REQUIRE(std::get<SinglePatch>(payload.value()).name.trimmed() == "Melo Vox 1");
}

TEST_CASE("K4 substatus picks locality and kind", "[codec][k4][dispatch]") {
    SECTION("Multi on a card") {
        auto dump = identify(k4Header(0x20, 0x02, 64 + 5));
        REQUIRE(dump);
        REQUIRE(dump->kind == DumpKind::OneMulti);
        REQUIRE(dump->locality == Locality::External);
        REQUIRE(dump->number == 5);
    }

    SECTION("Drum") {
        auto dump = identify(k4Header(0x20, 0x01, 32));
        REQUIRE(dump);
        REQUIRE(dump->kind == DumpKind::Drum);
    }

    SECTION("Effect") {
        auto dump = identify(k4Header(0x20, 0x03, 31));
        REQUIRE(dump);
        REQUIRE(dump->kind == DumpKind::OneEffect);
        REQUIRE(dump->locality == Locality::External);
        REQUIRE(dump->number == 31);
    }

    SECTION("Block of multis") {
        auto dump = identify(k4Header(0x21, 0x00, 0x40));
        REQUIRE(dump);
        REQUIRE(dump->kind == DumpKind::BlockMulti);
        REQUIRE(dump->expectedPayloadSize() == Bank::kMultisSize);
    }
}

TEST_CASE("K4 all-patch dump decodes a whole bank", "[codec][k4][dispatch]") {
    const auto bank = TestHelpers::k4BankImage();
    const auto message = concat({k4Header(0x22, 0x00, 0x00), bank});

    auto dump = identify(message);
    REQUIRE(dump);
    REQUIRE(dump->kind == DumpKind::All);

    auto payload = dump->decodePayload();
    REQUIRE(payload);
    const auto& decoded = std::get<Bank>(payload.value());
    REQUIRE(decoded.singles.size() == 64);
    REQUIRE(decoded.effects.size() == 32);
}

TEST_CASE("K4 headers without a rule are Unidentified", "[codec][k4][dispatch]") {
    SECTION("Effect number past the drum") {
        auto dump = identify(k4Header(0x20, 0x01, 33));
        REQUIRE_FALSE(dump);
        REQUIRE(dump.error().kind == ParseErrorKind::Unidentified);
    }

    SECTION("Dump request") {
        auto dump = identify(k4Header(0x00, 0x00, 0x00));
        REQUIRE_FALSE(dump);
        REQUIRE(dump.error().kind == ParseErrorKind::Unidentified);
    }

    SECTION("Another machine") {
        auto message = k4Header(0x20, 0x00, 0x00);
        message[3] = 0x0A;
        auto dump = identify(message);
        REQUIRE_FALSE(dump);
        REQUIRE(dump.error().kind == ParseErrorKind::Unidentified);
    }
}

TEST_CASE("K4 header errors", "[codec][k4][dispatch]") {
    SECTION("Unknown function byte") {
        auto dump = identify(k4Header(0x50, 0x00, 0x00));
        REQUIRE_FALSE(dump);
        REQUIRE(dump.error().kind == ParseErrorKind::InvalidDiscriminant);
        REQUIRE(dump.error().actual == 0x50);
    }

    SECTION("Truncated header") {
        const Kpatch::Codec::ByteBuffer message = {0x00, 0x20, 0x00};
        auto dump = identify(message);
        REQUIRE_FALSE(dump);
        REQUIRE(dump.error().kind == ParseErrorKind::TooShort);
    }
}

TEST_CASE("K4 header re-encodes to its bytes", "[codec][k4][dispatch]") {
    const auto bytes = k4Header(0x21, 0x02, 0x40);
    auto header = Header::decode(bytes);
    REQUIRE(header);
    REQUIRE(header->function == Function::BlockPatchDataDump);
    REQUIRE(header->encode() == bytes);
}
