// ==============================================================================
// K4 Bank Implementation
// ==============================================================================

#include "bank.h"

#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>

#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Kpatch {
namespace K4 {

namespace {

/// Decoded collection together with the number of bytes it consumed.
template <typename T, std::size_t N>
struct Section {
    ParseResult<std::array<T, N>> result;
    std::size_t consumed = 0;
};

template <typename T, std::size_t N>
Section<T, N> decodeSection(ByteView data, std::string_view sectionName,
                            std::string_view itemName, const DecodeOptions& options) {
    ByteReader reader(data, sectionName, options);
    std::array<T, N> items{};
    Codec::readSequence(reader, items, itemName);
    const std::size_t consumed = reader.offset();
    return {reader.finish(std::move(items)), consumed};
}

struct DrumSection {
    ParseResult<DrumPatch> result;
    std::size_t consumed = 0;
};

DrumSection decodeDrum(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "drum section", options);
    DrumPatch drum = reader.block<DrumPatch>("drum");
    const std::size_t consumed = reader.offset();
    return {reader.finish(std::move(drum)), consumed};
}

/// Checks one section against the running offset. Returns the error to
/// report, if any, and advances the offset otherwise.
template <typename R>
std::optional<ParseError> accept(const R& section, std::string_view name, std::size_t expected,
                                 std::size_t& offset) {
    Codec::logger()->debug("bank: {} at offset {}", name, offset);
    if (!section.result) {
        return section.result.error().within("bank");
    }
    if (section.consumed != expected) {
        return ParseError::offsetMismatch(std::string("bank/") + std::string(name),
                                          offset + expected, offset + section.consumed);
    }
    offset += section.consumed;
    return std::nullopt;
}

} // namespace

ParseResult<Bank> Bank::decode(ByteView data, const DecodeOptions& options) {
    if (data.size() < kDataSize) {
        return ParseError::tooShort("bank", kDataSize, data.size());
    }

    const ByteView singlesData = data.subspan(singleOffset(0), kSinglesSize);
    const ByteView multisData = data.subspan(multiOffset(0), kMultisSize);
    const ByteView drumData = data.subspan(drumOffset(), DrumPatch::kDataSize);
    const ByteView effectsData = data.subspan(effectOffset(0), kEffectsSize);

    auto decodeSingles = [&] {
        return decodeSection<SinglePatch, kBankSingleCount>(singlesData, "singles", "single",
                                                            options);
    };
    auto decodeMultis = [&] {
        return decodeSection<MultiPatch, kBankMultiCount>(multisData, "multis", "multi", options);
    };
    auto decodeDrumSection = [&] { return decodeDrum(drumData, options); };
    auto decodeEffects = [&] {
        return decodeSection<EffectPatch, kBankEffectCount>(effectsData, "effects", "effect",
                                                            options);
    };

    auto assemble = [&](auto&& singles, auto&& multis, auto&& drum,
                        auto&& effects) -> ParseResult<Bank> {
        std::size_t offset = 0;
        if (auto error = accept(singles, "singles", kSinglesSize, offset)) {
            return *error;
        }
        if (auto error = accept(multis, "multis", kMultisSize, offset)) {
            return *error;
        }
        if (auto error = accept(drum, "drum", DrumPatch::kDataSize, offset)) {
            return *error;
        }
        if (auto error = accept(effects, "effects", kEffectsSize, offset)) {
            return *error;
        }
        if (offset != kDataSize) {
            return ParseError::offsetMismatch("bank", kDataSize, offset);
        }

        Bank bank;
        bank.singles = std::move(singles.result).value();
        bank.multis = std::move(multis.result).value();
        bank.drum = std::move(drum.result).value();
        bank.effects = std::move(effects.result).value();

        ParseResult<Bank> result(std::move(bank));
        for (const auto* warnings : {&singles.result.warnings(), &multis.result.warnings(),
                                     &drum.result.warnings(), &effects.result.warnings()}) {
            for (const auto& warning : *warnings) {
                result.addWarning(warning.within("bank"));
            }
        }
        return result;
    };

    if (options.parallel) {
        auto singlesTask = std::async(std::launch::async, decodeSingles);
        auto multisTask = std::async(std::launch::async, decodeMultis);
        auto drumTask = std::async(std::launch::async, decodeDrumSection);
        auto effectsTask = std::async(std::launch::async, decodeEffects);
        auto singles = singlesTask.get();
        auto multis = multisTask.get();
        auto drum = drumTask.get();
        auto effects = effectsTask.get();
        return assemble(singles, multis, drum, effects);
    }

    auto singles = decodeSingles();
    auto multis = decodeMultis();
    auto drum = decodeDrumSection();
    auto effects = decodeEffects();
    return assemble(singles, multis, drum, effects);
}

ByteBuffer Bank::encode() const {
    ByteWriter writer(kDataSize);
    Codec::writeSequence(writer, singles);
    Codec::writeSequence(writer, multis);
    writer.block(drum);
    Codec::writeSequence(writer, effects);
    return std::move(writer).take();
}

} // namespace K4
} // namespace Kpatch
