// ==============================================================================
// K5000 Single Patch Implementation
// ==============================================================================

#include "single_patch.h"

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/logging.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace Kpatch {
namespace K5000 {

using Codec::bit;
using Codec::withBit;

// ==============================================================================
// Common
// ==============================================================================

ParseResult<Common> Common::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "common", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(Common{});
    }

    Common common;
    common.effects = reader.block<EffectSettings>("effects");
    common.geq = reader.block<Geq>("geq");
    common.drumMark = readFlag(reader, "drum mark");
    common.name = reader.block<PatchName>("name");
    common.volume = reader.value<Category::Volume>("volume");
    common.polyphony = reader.enumeration<Polyphony>(kPolyphonyCount, "polyphony");
    reader.skip(1);

    const uint8_t count = reader.byte();
    if (!reader.failed() && (count < kMinSourceCount || count > kMaxSourceCount)) {
        reader.fail(ParseError::rangeError("source count", count));
    }

    const uint8_t mutes = reader.byte();
    for (std::size_t i = 0; i < kMaxSourceCount; ++i) {
        common.sourceMutes[i] = bit(mutes, static_cast<int>(i));
    }
    common.amplitudeModulation = reader.enumeration<AmplitudeModulation>(
        kAmplitudeModulationCount, "amplitude modulation");
    common.effectControl = reader.block<EffectControl>("effect control");
    common.portamento = readFlag(reader, "portamento");
    common.portamentoSpeed = reader.value<Category::PortamentoLevel>("portamento speed");

    for (std::size_t i = 0; i < kMacroCount; ++i) {
        const auto field = fmt::format("macro {}", i + 1);
        auto& macro = common.macros[i];
        macro.destination1 = reader.enumeration<ControlDestination>(kControlDestinationCount,
                                                                    field + " destination 1");
        macro.destination2 = reader.enumeration<ControlDestination>(kControlDestinationCount,
                                                                    field + " destination 2");
    }
    for (std::size_t i = 0; i < kMacroCount; ++i) {
        const auto field = fmt::format("macro {}", i + 1);
        auto& macro = common.macros[i];
        macro.depth1 = reader.value<Category::MacroDepth>(field + " depth 1");
        macro.depth2 = reader.value<Category::MacroDepth>(field + " depth 2");
    }

    common.switches = reader.block<SwitchControl>("switches");

    if (!reader.failed()) {
        Codec::logger()->trace("common '{}', {} sources", common.name.str(), count);
    }
    return reader.finish(std::move(common));
}

ByteBuffer Common::encode() const {
    ByteWriter writer(kDataSize);
    writer.block(effects);
    writer.block(geq);
    writer.byte(flagByte(drumMark));
    writer.block(name);
    writer.value(volume);
    writer.enumeration(polyphony);
    writer.byte(0);
    writer.byte(static_cast<uint8_t>(kMinSourceCount));

    uint8_t mutes = 0;
    for (std::size_t i = 0; i < kMaxSourceCount; ++i) {
        mutes = withBit(mutes, static_cast<int>(i), sourceMutes[i]);
    }
    writer.byte(mutes);
    writer.enumeration(amplitudeModulation);
    writer.block(effectControl);
    writer.byte(flagByte(portamento));
    writer.value(portamentoSpeed);

    for (const auto& macro : macros) {
        writer.enumeration(macro.destination1);
        writer.enumeration(macro.destination2);
    }
    for (const auto& macro : macros) {
        writer.value(macro.depth1);
        writer.value(macro.depth2);
    }

    writer.block(switches);
    return std::move(writer).take();
}

// ==============================================================================
// Sizing
// ==============================================================================

ParseResult<std::size_t> SinglePatch::dataSizeFor(ByteView data) {
    const std::size_t countAt = kCommonOffset + Common::kSourceCountOffset;
    if (data.size() <= countAt) {
        return ParseError::tooShort("single", kSourcesOffset, data.size());
    }
    const uint8_t count = data[countAt];
    if (count < kMinSourceCount || count > kMaxSourceCount) {
        return ParseError::rangeError("single/common/source count", count);
    }

    const std::size_t sourcesEnd = kSourcesOffset + count * Source::kDataSize;
    if (data.size() < sourcesEnd) {
        return ParseError::tooShort("single", sourcesEnd, data.size());
    }

    std::size_t size = sourcesEnd;
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t waveAt = kSourcesOffset + i * Source::kDataSize + Source::kOscillatorOffset;
        const int wave = (data[waveAt] << 7) | (data[waveAt + 1] & 0x7F);
        if (wave == kAdditiveWave) {
            size += AdditiveKit::kDataSize;
        }
    }
    return size;
}

std::size_t SinglePatch::additiveSourceCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(sources_.begin(), sources_.end(),
                      [](const Source& source) { return source.isAdditive(); }));
}

std::size_t SinglePatch::dataSize() const noexcept {
    return kSourcesOffset + sources_.size() * Source::kDataSize +
           additiveSourceCount() * AdditiveKit::kDataSize;
}

std::string SinglePatch::sourceMuteString() const {
    std::string s;
    for (std::size_t i = 0; i < sources_.size(); ++i) {
        s.push_back(common.sourceMutes[i] ? '-' : static_cast<char>('1' + i));
    }
    return s;
}

ParseResult<SinglePatch> SinglePatch::make(Common common, std::vector<Source> sources) {
    if (sources.size() < kMinSourceCount || sources.size() > kMaxSourceCount) {
        return ParseError::rangeError("single/source count", static_cast<int>(sources.size()));
    }
    SinglePatch patch;
    patch.common = std::move(common);
    patch.sources_ = std::move(sources);
    return patch;
}

// ==============================================================================
// Codec
// ==============================================================================

ParseResult<SinglePatch> SinglePatch::decode(ByteView data, const DecodeOptions& options) {
    auto size = dataSizeFor(data);
    if (!size) {
        return size.error();
    }

    ByteReader reader(data, "single", options);
    if (!reader.require(size.value())) {
        return reader.finish(SinglePatch{});
    }

    const std::size_t count = data[kCommonOffset + Common::kSourceCountOffset];

    SinglePatch patch;
    const uint8_t stored = reader.byte();
    patch.common = reader.block<Common>("common");

    patch.sources_.clear();
    for (std::size_t i = 0; i < count && !reader.failed(); ++i) {
        patch.sources_.push_back(reader.block<Source>(fmt::format("source {}", i + 1)));
    }
    for (std::size_t i = 0; i < patch.sources_.size() && !reader.failed(); ++i) {
        if (patch.sources_[i].isAdditive()) {
            patch.sources_[i].additiveKit =
                reader.block<AdditiveKit>(fmt::format("additive kit {}", i + 1));
        }
    }

    const std::size_t summed = Common::kDataSize + count * Source::kDataSize;
    reader.verifyChecksum(Codec::checksum(data.subspan(kCommonOffset, summed)), stored);

    if (!reader.failed()) {
        Codec::logger()->trace("single '{}', {} bytes", patch.common.name.str(), reader.offset());
    }
    return reader.finish(std::move(patch));
}

ByteBuffer SinglePatch::encodeBody() const {
    ByteWriter writer(Common::kDataSize + sources_.size() * Source::kDataSize);
    ByteBuffer header = common.encode();
    header[Common::kSourceCountOffset] = static_cast<uint8_t>(sources_.size());
    writer.bytes(header);
    for (const auto& source : sources_) {
        writer.block(source);
    }
    return std::move(writer).take();
}

ByteBuffer SinglePatch::encode() const {
    const ByteBuffer body = encodeBody();
    ByteWriter writer(dataSize());
    writer.byte(Codec::checksum(body));
    writer.bytes(body);
    for (const auto& source : sources_) {
        if (const auto kit = source.effectiveKit()) {
            writer.block(*kit);
        }
    }
    return std::move(writer).take();
}

uint8_t SinglePatch::checksum() const {
    return Codec::checksum(encodeBody());
}

} // namespace K5000
} // namespace Kpatch
