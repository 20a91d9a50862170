// ==============================================================================
// Layer 1: K5000
// additive_kit.h - Additive (ADD) source data (806 bytes)
// ==============================================================================
//   0         checksum
//   1..6      harmonic common
//   7..19     MORF
//   20..36    formant filter
//   37..100   harmonic levels, soft
//   101..164  harmonic levels, loud
//   165..292  formant filter bands
//   293..804  64 harmonic envelopes x 8
//   805       loud sense select
//
// The kit checksum covers every byte after the checksum byte.
// ==============================================================================

#pragma once

#include <kpatch/codec/core/bit_field.h>
#include <kpatch/codec/k5000/k5000_types.h>

#include <array>
#include <string_view>

namespace Kpatch {
namespace K5000 {

// ==============================================================================
// Loop Types
// ==============================================================================

enum class LoopType : uint8_t {
    Off = 0,
    Loop1,
    Loop2
};

inline constexpr uint8_t kLoopTypeCount = 3;

[[nodiscard]] constexpr std::string_view loopTypeName(LoopType loop) noexcept {
    switch (loop) {
        case LoopType::Off:   return "OFF";
        case LoopType::Loop1: return "LP1";
        case LoopType::Loop2: return "LP2";
    }
    return {};
}

// ==============================================================================
// Harmonic Common
// ==============================================================================

enum class HarmonicGroup : uint8_t {
    Low = 0,
    High
};

inline constexpr uint8_t kHarmonicGroupCount = 2;

struct HarmonicCommon {
    static constexpr std::size_t kDataSize = 6;

    bool morfEnabled = false;
    DataByte totalGain;
    HarmonicGroup group = HarmonicGroup::Low;
    KeyScalingToGain keyScalingToGain;
    VelocityCurve velocityCurve;
    VelocityDepth velocityDepth;

    [[nodiscard]] static ParseResult<HarmonicCommon> decode(ByteView data,
                                                            const DecodeOptions& options = {}) {
        ByteReader reader(data, "harmonic common", options);
        reader.require(kDataSize);
        HarmonicCommon common;
        common.morfEnabled = readFlag(reader, "morf");
        common.totalGain = reader.value<Category::DataByte>("total gain");
        common.group = reader.enumeration<HarmonicGroup>(kHarmonicGroupCount, "group");
        common.keyScalingToGain = reader.value<Category::KeyScalingToGain>("ks to gain");
        common.velocityCurve = reader.value<Category::VelocityCurve>("velocity curve");
        common.velocityDepth = reader.value<Category::VelocityDepth>("velocity depth");
        return reader.finish(common);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {flagByte(morfEnabled),
                totalGain.toWireByte(),
                Codec::enumToByte(group),
                keyScalingToGain.toWireByte(),
                velocityCurve.toWireByte(),
                velocityDepth.toWireByte()};
    }

    bool operator==(const HarmonicCommon&) const = default;
};

// ==============================================================================
// MORF
// ==============================================================================

/// Source of one MORF harmonic copy: patch and source number.
struct MorfCopy {
    static constexpr std::size_t kDataSize = 2;

    DataByte patch;
    DataByte source;

    [[nodiscard]] static ParseResult<MorfCopy> decode(ByteView data,
                                                      const DecodeOptions& options = {}) {
        ByteReader reader(data, "copy", options);
        reader.require(kDataSize);
        MorfCopy copy;
        copy.patch = reader.value<Category::DataByte>("patch");
        copy.source = reader.value<Category::DataByte>("source");
        return reader.finish(copy);
    }

    [[nodiscard]] ByteBuffer encode() const { return {patch.toWireByte(), source.toWireByte()}; }

    bool operator==(const MorfCopy&) const = default;
};

struct Morf {
    static constexpr std::size_t kDataSize = 13;
    static constexpr std::size_t kCopyCount = 4;

    std::array<MorfCopy, kCopyCount> copies{};
    std::array<EnvelopeTime, 4> times{};
    LoopType loop = LoopType::Off;

    [[nodiscard]] static ParseResult<Morf> decode(ByteView data,
                                                  const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const Morf&) const = default;
};

// ==============================================================================
// Formant Filter
// ==============================================================================

enum class FormantMode : uint8_t {
    Envelope = 0,
    Lfo
};

inline constexpr uint8_t kFormantModeCount = 2;

enum class FormantLfoShape : uint8_t {
    Triangle = 0,
    Sawtooth,
    Random
};

inline constexpr uint8_t kFormantLfoShapeCount = 3;

struct FormantEnvelopeSegment {
    static constexpr std::size_t kDataSize = 2;

    EnvelopeRate rate;
    EnvelopeLevel level;

    [[nodiscard]] static ParseResult<FormantEnvelopeSegment> decode(
        ByteView data, const DecodeOptions& options = {}) {
        ByteReader reader(data, "segment", options);
        reader.require(kDataSize);
        FormantEnvelopeSegment segment;
        segment.rate = reader.value<Category::EnvelopeRate>("rate");
        segment.level = reader.value<Category::EnvelopeLevel>("level");
        return reader.finish(segment);
    }

    [[nodiscard]] ByteBuffer encode() const { return {rate.toWireByte(), level.toWireByte()}; }

    bool operator==(const FormantEnvelopeSegment&) const = default;
};

/// Attack, decay 1, decay 2 and release segments, then loop and depths (11 bytes).
struct FormantEnvelope {
    static constexpr std::size_t kDataSize = 11;
    static constexpr std::size_t kSegmentCount = 4;

    std::array<FormantEnvelopeSegment, kSegmentCount> segments{};
    LoopType loop = LoopType::Off;
    EnvelopeDepth velocityDepth;
    EnvelopeDepth keyScalingDepth;

    [[nodiscard]] static ParseResult<FormantEnvelope> decode(ByteView data,
                                                             const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const FormantEnvelope&) const = default;
};

struct FormantLfo {
    static constexpr std::size_t kDataSize = 3;

    LfoSpeed speed;
    FormantLfoShape shape = FormantLfoShape::Triangle;
    LfoDepth depth;

    [[nodiscard]] static ParseResult<FormantLfo> decode(ByteView data,
                                                        const DecodeOptions& options = {}) {
        ByteReader reader(data, "lfo", options);
        reader.require(kDataSize);
        FormantLfo lfo;
        lfo.speed = reader.value<Category::LfoSpeed>("speed");
        lfo.shape = reader.enumeration<FormantLfoShape>(kFormantLfoShapeCount, "shape");
        lfo.depth = reader.value<Category::LfoDepth>("depth");
        return reader.finish(lfo);
    }

    [[nodiscard]] ByteBuffer encode() const {
        return {speed.toWireByte(), Codec::enumToByte(shape), depth.toWireByte()};
    }

    bool operator==(const FormantLfo&) const = default;
};

struct FormantFilter {
    static constexpr std::size_t kDataSize = 17;

    Bias bias;
    FormantMode mode = FormantMode::Envelope;
    EnvelopeDepth envelopeDepth;
    FormantEnvelope envelope;
    FormantLfo lfo;

    [[nodiscard]] static ParseResult<FormantFilter> decode(ByteView data,
                                                           const DecodeOptions& options = {}) {
        ByteReader reader(data, "formant filter", options);
        reader.require(kDataSize);
        FormantFilter filter;
        filter.bias = reader.value<Category::Bias>("bias");
        filter.mode = reader.enumeration<FormantMode>(kFormantModeCount, "mode");
        filter.envelopeDepth = reader.value<Category::EnvelopeDepth>("envelope depth");
        filter.envelope = reader.block<FormantEnvelope>("envelope");
        filter.lfo = reader.block<FormantLfo>("lfo");
        return reader.finish(filter);
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.value(bias);
        writer.enumeration(mode);
        writer.value(envelopeDepth);
        writer.block(envelope);
        writer.block(lfo);
        return std::move(writer).take();
    }

    bool operator==(const FormantFilter&) const = default;
};

// ==============================================================================
// Harmonic Envelope
// ==============================================================================

struct HarmonicEnvelopeSegment {
    EnvelopeRate rate;
    HarmonicEnvelopeLevel level;

    bool operator==(const HarmonicEnvelopeSegment&) const = default;
};

/// Four (rate, level) segments (8 bytes). The loop type is stored in bit 6
/// of the decay 1 and decay 2 level bytes:
///
///   decay 1  decay 2  loop
///   1        1        Loop1
///   0        1        Loop2
///   0        0        Off
///   1        0        (invalid)
struct HarmonicEnvelope {
    static constexpr std::size_t kDataSize = 8;
    static constexpr int kLoopBit = 6;

    HarmonicEnvelopeSegment attack;
    HarmonicEnvelopeSegment decay1;
    HarmonicEnvelopeSegment decay2;
    HarmonicEnvelopeSegment release;
    LoopType loop = LoopType::Off;

    [[nodiscard]] static ParseResult<HarmonicEnvelope> decode(ByteView data,
                                                              const DecodeOptions& options = {});
    [[nodiscard]] ByteBuffer encode() const;

    bool operator==(const HarmonicEnvelope&) const = default;
};

// ==============================================================================
// Additive Kit
// ==============================================================================

struct AdditiveKit {
    static constexpr std::size_t kDataSize = 806;

    HarmonicCommon common;
    Morf morf;
    FormantFilter formantFilter;
    std::array<HarmonicLevel, kHarmonicCount> softLevels{};
    std::array<HarmonicLevel, kHarmonicCount> loudLevels{};
    std::array<DataByte, kFormantBandCount> bands{};
    std::array<HarmonicEnvelope, kHarmonicCount> envelopes{};
    DataByte loudSenseSelect;

    [[nodiscard]] static ParseResult<AdditiveKit> decode(ByteView data,
                                                         const DecodeOptions& options = {});

    /// Checksum followed by the body.
    [[nodiscard]] ByteBuffer encode() const;

    /// Checksum over everything after the checksum byte.
    [[nodiscard]] uint8_t checksum() const;

    bool operator==(const AdditiveKit&) const = default;

private:
    [[nodiscard]] ByteBuffer encodeBody() const;
};

static_assert(1 + HarmonicCommon::kDataSize + Morf::kDataSize + FormantFilter::kDataSize +
                  2 * kHarmonicCount + kFormantBandCount +
                  kHarmonicCount * HarmonicEnvelope::kDataSize + 1 ==
              AdditiveKit::kDataSize);

} // namespace K5000
} // namespace Kpatch
