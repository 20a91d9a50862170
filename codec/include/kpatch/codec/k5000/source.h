// ==============================================================================
// Layer 1: K5000
// source.h - One voice source (86 bytes)
// ==============================================================================
//   0..27   control
//   28..39  oscillator
//   40..59  filter
//   60..74  amplifier
//   75..85  LFO
//
// An ADD source's kit is stored after all sources of the single patch.
// ==============================================================================

#pragma once

#include <kpatch/codec/k5000/additive_kit.h>
#include <kpatch/codec/k5000/amplifier.h>
#include <kpatch/codec/k5000/control.h>
#include <kpatch/codec/k5000/filter.h>
#include <kpatch/codec/k5000/k5000_types.h>
#include <kpatch/codec/k5000/lfo.h>
#include <kpatch/codec/k5000/oscillator.h>

#include <optional>
#include <utility>

namespace Kpatch {
namespace K5000 {

struct Source {
    static constexpr std::size_t kDataSize = 86;

    /// Offset of the oscillator within the source, used to size a single
    /// patch before decoding it.
    static constexpr std::size_t kOscillatorOffset = Control::kDataSize;

    Control control;
    Oscillator oscillator;
    Filter filter;
    Amplifier amplifier;
    Lfo lfo;
    std::optional<AdditiveKit> additiveKit;  ///< Read only for ADD sources

    /// The 86 source bytes. The kit is decoded by SinglePatch.
    [[nodiscard]] static ParseResult<Source> decode(ByteView data,
                                                    const DecodeOptions& options = {}) {
        ByteReader reader(data, "source", options);
        reader.require(kDataSize);
        Source source;
        source.control = reader.block<Control>("control");
        source.oscillator = reader.block<Oscillator>("oscillator");
        source.filter = reader.block<Filter>("filter");
        source.amplifier = reader.block<Amplifier>("amplifier");
        source.lfo = reader.block<Lfo>("lfo");
        return reader.finish(std::move(source));
    }

    [[nodiscard]] ByteBuffer encode() const {
        ByteWriter writer(kDataSize);
        writer.block(control);
        writer.block(oscillator);
        writer.block(filter);
        writer.block(amplifier);
        writer.block(lfo);
        return std::move(writer).take();
    }

    [[nodiscard]] bool isAdditive() const noexcept { return oscillator.isAdditive(); }

    /// The kit an ADD source encodes: its own, or a default kit when none is
    /// attached. Empty for PCM sources.
    [[nodiscard]] std::optional<AdditiveKit> effectiveKit() const {
        if (!isAdditive()) {
            return std::nullopt;
        }
        return additiveKit.value_or(AdditiveKit{});
    }

    /// A source generating from the additive engine.
    [[nodiscard]] static Source additive(AdditiveKit kit = {}) {
        Source source;
        source.oscillator.wave = WaveKit::of<kAdditiveWave>();
        source.additiveKit = std::move(kit);
        return source;
    }

    /// Compares what the source encodes to.
    bool operator==(const Source& other) const {
        return control == other.control && oscillator == other.oscillator &&
               filter == other.filter && amplifier == other.amplifier && lfo == other.lfo &&
               effectiveKit() == other.effectiveKit();
    }
};

static_assert(Control::kDataSize + Oscillator::kDataSize + Filter::kDataSize +
                  Amplifier::kDataSize + Lfo::kDataSize ==
              Source::kDataSize);

} // namespace K5000
} // namespace Kpatch
