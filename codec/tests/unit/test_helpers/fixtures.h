#pragma once
// ==============================================================================
// Dump Fixtures
// ==============================================================================
// Byte images with known contents and valid checksums, for decoder tests.
// Images start from the encoding of a default model and are then patched
// byte by byte, so every test states the wire bytes it relies on.
// ==============================================================================

#include <kpatch/codec/core/checksum.h>
#include <kpatch/codec/k4/bank.h>
#include <kpatch/codec/k4/single_patch.h>
#include <kpatch/codec/k5000/multi_patch.h>
#include <kpatch/codec/k5000/single_patch.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace TestHelpers {

using Kpatch::Codec::ByteBuffer;

// ==============================================================================
// Byte Patching
// ==============================================================================

inline void patchBytes(ByteBuffer& image, std::size_t offset,
                       std::initializer_list<uint8_t> bytes) {
    std::size_t at = offset;
    for (uint8_t b : bytes) {
        image.at(at++) = b;
    }
}

inline void patchText(ByteBuffer& image, std::size_t offset, std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        image.at(offset + i) = static_cast<uint8_t>(text[i]);
    }
}

/// K4 blocks: checksum in the last byte, over the bytes before it.
inline void fixTrailingChecksum(ByteBuffer& image, std::size_t offset, std::size_t size) {
    const std::span<const uint8_t> body(image.data() + offset, size - 1);
    image.at(offset + size - 1) = Kpatch::Codec::checksum(body);
}

/// K5000 blocks: checksum in the first byte, over the `summed` bytes after it.
inline void fixLeadingChecksum(ByteBuffer& image, std::size_t offset, std::size_t summed) {
    const std::span<const uint8_t> body(image.data() + offset + 1, summed);
    image.at(offset) = Kpatch::Codec::checksum(body);
}

// ==============================================================================
// K4
// ==============================================================================

inline constexpr std::string_view kK4SingleName = "Melo Vox 1";

/// Single patch "Melo Vox 1" at volume 100 with effect 5.
inline ByteBuffer k4SingleImage() {
    ByteBuffer image = Kpatch::K4::SinglePatch{}.encode();
    patchText(image, 0, kK4SingleName);
    patchBytes(image, 10, {100, 4});
    fixTrailingChecksum(image, 0, Kpatch::K4::SinglePatch::kDataSize);
    return image;
}

/// Bank whose single i is named "SINGLE nn" and whose effect i has type i % 16.
inline ByteBuffer k4BankImage() {
    using Kpatch::K4::Bank;
    using Kpatch::K4::EffectPatch;
    using Kpatch::K4::SinglePatch;

    ByteBuffer image = Bank{}.encode();
    for (std::size_t i = 0; i < Kpatch::K4::kBankSingleCount; ++i) {
        const std::size_t at = Bank::singleOffset(i);
        patchText(image, at, "SINGLE ");
        patchBytes(image, at + 7,
                   {static_cast<uint8_t>('0' + (i + 1) / 10),
                    static_cast<uint8_t>('0' + (i + 1) % 10)});
        fixTrailingChecksum(image, at, SinglePatch::kDataSize);
    }
    for (std::size_t i = 0; i < Kpatch::K4::kBankEffectCount; ++i) {
        const std::size_t at = Bank::effectOffset(i);
        image.at(at) = static_cast<uint8_t>(i % Kpatch::K4::kEffectTypeCount);
        fixTrailingChecksum(image, at, EffectPatch::kDataSize);
    }
    return image;
}

/// Header bytes of a K4 message on channel 1.
inline ByteBuffer k4Header(uint8_t function, uint8_t substatus1, uint8_t substatus2) {
    return {0x00, function, 0x00, 0x04, substatus1, substatus2};
}

// ==============================================================================
// K5000
// ==============================================================================

/// Common block of the "WizooIni" single (81 bytes).
inline ByteBuffer k5000CommonImage() {
    return {
        // effect algorithm, reverb, effects 1..4
        0x00,
        0x00, 0x02, 0x02, 0x0d, 0x41, 0x0a,
        0x10, 0x00, 0x58, 0x33, 0x69, 0x22,
        0x1d, 0x00, 0x4a, 0x00, 0x00, 0x00,
        0x24, 0x00, 0x04, 0x3a, 0x04, 0x38,
        0x2a, 0x00, 0x0c, 0x0c, 0x63, 0x00,
        // GEQ
        0x42, 0x41, 0x40, 0x40, 0x3f, 0x3e, 0x41,
        // drum mark
        0x00,
        // name
        'W', 'i', 'z', 'o', 'o', 'I', 'n', 'i',
        // volume, polyphony, unused, source count, source mutes, AM
        0x73, 0x00, 0x00, 0x02, 0x01, 0x00,
        // effect control
        0x02, 0x01, 0x40, 0x01, 0x03, 0x40,
        // portamento, speed
        0x00, 0x00,
        // macro destinations
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        // macro depths
        0x40, 0x40, 0x40, 0x40, 0x40, 0x40, 0x40, 0x40,
        // switches
        0x00, 0x00, 0x00, 0x00,
    };
}

/// "WizooIni" with two PCM sources, or with its first source switched to ADD
/// (and one additive kit appended) when `additive` is set.
inline ByteBuffer k5000SingleImage(bool additive = false) {
    using Kpatch::K5000::AdditiveKit;
    using Kpatch::K5000::Common;
    using Kpatch::K5000::SinglePatch;
    using Kpatch::K5000::Source;

    ByteBuffer image;
    image.push_back(0);
    const ByteBuffer common = k5000CommonImage();
    image.insert(image.end(), common.begin(), common.end());
    for (int i = 0; i < 2; ++i) {
        const ByteBuffer source = (additive && i == 0) ? Source::additive().encode()
                                                       : Source{}.encode();
        image.insert(image.end(), source.begin(), source.end());
    }
    fixLeadingChecksum(image, 0, Common::kDataSize + 2 * Source::kDataSize);
    if (additive) {
        const ByteBuffer kit = AdditiveKit{}.encode();
        image.insert(image.end(), kit.begin(), kit.end());
    }
    return image;
}

/// Header bytes of a K5000 message on channel 1.
inline ByteBuffer k5000Header(uint8_t cardinality, uint8_t kind,
                              std::initializer_list<uint8_t> rest = {}) {
    ByteBuffer header = {0x00, cardinality, 0x00, 0x0A, kind};
    header.insert(header.end(), rest.begin(), rest.end());
    return header;
}

inline ByteBuffer concat(std::initializer_list<std::span<const uint8_t>> parts) {
    ByteBuffer out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace TestHelpers
