// ==============================================================================
// K5000 Effect Settings Implementation
// ==============================================================================

#include "effect_settings.h"

#include <kpatch/codec/core/interleave.h>
#include <kpatch/codec/core/logging.h>

namespace Kpatch {
namespace K5000 {

ParseResult<EffectSettings> EffectSettings::decode(ByteView data, const DecodeOptions& options) {
    ByteReader reader(data, "effects", options);
    if (!reader.require(kDataSize)) {
        return reader.finish(EffectSettings{});
    }
    EffectSettings settings;
    settings.algorithm = reader.enumeration<EffectAlgorithm>(kEffectAlgorithmCount, "algorithm");
    settings.reverb = reader.block<EffectDefinition>("reverb");
    Codec::readSequence(reader, settings.effects, "effect");

    if (!reader.failed()) {
        Codec::logger()->trace("effects: algorithm {}, reverb '{}'",
                               effectAlgorithmNumber(settings.algorithm), settings.reverb.name());
    }
    return reader.finish(std::move(settings));
}

ByteBuffer EffectSettings::encode() const {
    ByteWriter writer(kDataSize);
    writer.enumeration(algorithm);
    writer.block(reverb);
    Codec::writeSequence(writer, effects);
    return std::move(writer).take();
}

} // namespace K5000
} // namespace Kpatch
