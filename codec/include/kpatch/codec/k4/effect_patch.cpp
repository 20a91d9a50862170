// ==============================================================================
// K4 Effect Patch Implementation
// ==============================================================================

#include "effect_patch.h"

#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>

namespace Kpatch {
namespace K4 {

namespace {

constexpr std::size_t kEffectPadding = 6;

} // namespace

ParseResult<EffectPatch> EffectPatch::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "effect", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(EffectPatch{});
    }
    EffectPatch patch;
    patch.type = reader.enumeration<EffectType>(kEffectTypeCount, "effect type");
    patch.param1 = reader.value<Category::K4EffectSmall>("param 1");
    patch.param2 = reader.value<Category::K4EffectSmall>("param 2");
    patch.param3 = reader.value<Category::K4EffectBig>("param 3");
    reader.skip(kEffectPadding);
    Codec::readSequence(reader, patch.submixes, "submix");

    const uint8_t stored = reader.byte();
    reader.verifyChecksum(Codec::checksum(data.first(kDataSize - 1)), stored);

    if (!reader.failed()) {
        Codec::logger()->trace("effect '{}'", patch.name());
    }
    return reader.finish(std::move(patch));
}

ByteBuffer EffectPatch::encodeBody() const {
    ByteWriter writer(kDataSize);
    writer.enumeration(type);
    writer.value(param1);
    writer.value(param2);
    writer.value(param3);
    writer.zeros(kEffectPadding);
    Codec::writeSequence(writer, submixes);
    return std::move(writer).take();
}

ByteBuffer EffectPatch::encode() const {
    ByteBuffer body = encodeBody();
    body.push_back(Codec::checksum(body));
    return body;
}

uint8_t EffectPatch::checksum() const {
    return Codec::checksum(encodeBody());
}

} // namespace K4
} // namespace Kpatch
