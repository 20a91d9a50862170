// ==============================================================================
// Kawai Patch Report
// ==============================================================================
// Reads a .syx file, classifies every Kawai K4 or K5000 message in it and
// prints a summary of the decoded patches.
//
// Usage: kpatch_report [--strict | --ignore-checksums] [--parallel] [--verbose] file.syx
// ==============================================================================

#include <kpatch/codec/core/logging.h>
#include <kpatch/codec/k4/sysex_header.h>
#include <kpatch/codec/k5000/dump.h>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

using Kpatch::Codec::ByteBuffer;
using Kpatch::Codec::ByteView;
using Kpatch::Codec::ChecksumPolicy;
using Kpatch::Codec::DecodeOptions;
using Kpatch::Codec::ParseError;

namespace {

constexpr uint8_t kSysExStart = 0xF0;
constexpr uint8_t kSysExEnd = 0xF7;
constexpr uint8_t kKawaiId = 0x40;
constexpr std::size_t kMachineIdOffset = 3;

struct Arguments {
    DecodeOptions options;
    bool verbose = false;
    std::filesystem::path input;
};

void printUsage() {
    std::cerr << "Usage: kpatch_report [--strict | --ignore-checksums] [--parallel] "
                 "[--verbose] file.syx\n";
}

bool parseArguments(int argc, char* argv[], Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--strict") {
            args.options.checksumPolicy = ChecksumPolicy::Strict;
        } else if (arg == "--ignore-checksums") {
            args.options.checksumPolicy = ChecksumPolicy::Ignore;
        } else if (arg == "--parallel") {
            args.options.parallel = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else if (args.input.empty()) {
            args.input = arg;
        } else {
            std::cerr << "Only one input file is accepted\n";
            return false;
        }
    }
    return !args.input.empty() && args.options.isValid();
}

bool readFile(const std::filesystem::path& path, ByteBuffer& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

/// Kawai messages between F0 40 and F7, without the framing bytes.
std::vector<ByteBuffer> splitMessages(const ByteBuffer& data) {
    std::vector<ByteBuffer> messages;
    std::size_t i = 0;
    while (i < data.size()) {
        if (data[i] != kSysExStart) {
            ++i;
            continue;
        }
        std::size_t end = i + 1;
        while (end < data.size() && data[end] != kSysExEnd) {
            ++end;
        }
        if (i + 1 < end && data[i + 1] == kKawaiId) {
            messages.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(i + 2),
                                  data.begin() + static_cast<std::ptrdiff_t>(end));
        }
        i = end + 1;
    }
    return messages;
}

void printWarnings(const std::vector<ParseError>& warnings) {
    for (const auto& warning : warnings) {
        std::cout << "  warning: " << warning.message() << "\n";
    }
}

// ==============================================================================
// K4
// ==============================================================================

void printK4Single(const Kpatch::K4::SinglePatch& single, int number) {
    std::cout << fmt::format("  {:>3}  {}  vol {:>3}  effect {:>2}  sources {}\n", number,
                             single.name.str(), single.volume.value(), single.effect.value(),
                             single.sourceMuteString());
}

void printK4Multi(const Kpatch::K4::MultiPatch& multi, int number) {
    std::cout << fmt::format("  {:>3}  {}  effect {:>2}\n", number, multi.name.str(),
                             multi.effect.value());
}

void printK4Effect(const Kpatch::K4::EffectPatch& effect, int number) {
    std::cout << fmt::format("  {:>3}  {}\n", number, effect.name());
}

int reportK4(ByteView message, const DecodeOptions& options) {
    using namespace Kpatch::K4;

    auto dump = identify(message, options);
    if (!dump) {
        std::cerr << "error: " << dump.error().message() << "\n";
        return 1;
    }
    std::cout << fmt::format("K4 {} ({}), channel {}\n", dumpKindName(dump->kind),
                             localityName(dump->locality), dump->header.channel.value());

    auto payload = dump->decodePayload(options);
    if (!payload) {
        std::cerr << "error: " << payload.error().message() << "\n";
        return 1;
    }

    std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, SinglePatch>) {
                printK4Single(value, dump->number + 1);
            } else if constexpr (std::is_same_v<T, MultiPatch>) {
                printK4Multi(value, dump->number + 1);
            } else if constexpr (std::is_same_v<T, EffectPatch>) {
                printK4Effect(value, dump->number + 1);
            } else if constexpr (std::is_same_v<T, DrumPatch>) {
                std::cout << fmt::format("  drum, volume {}\n", value.common.volume.value());
            } else if constexpr (std::is_same_v<T, std::vector<SinglePatch>>) {
                for (std::size_t i = 0; i < value.size(); ++i) {
                    printK4Single(value[i], static_cast<int>(i) + 1);
                }
            } else if constexpr (std::is_same_v<T, std::vector<MultiPatch>>) {
                for (std::size_t i = 0; i < value.size(); ++i) {
                    printK4Multi(value[i], static_cast<int>(i) + 1);
                }
            } else if constexpr (std::is_same_v<T, std::vector<EffectPatch>>) {
                for (std::size_t i = 0; i < value.size(); ++i) {
                    printK4Effect(value[i], static_cast<int>(i) + 1);
                }
            } else if constexpr (std::is_same_v<T, Bank>) {
                for (std::size_t i = 0; i < value.singles.size(); ++i) {
                    printK4Single(value.singles[i], static_cast<int>(i) + 1);
                }
                for (std::size_t i = 0; i < value.multis.size(); ++i) {
                    printK4Multi(value.multis[i], static_cast<int>(i) + 1);
                }
                for (std::size_t i = 0; i < value.effects.size(); ++i) {
                    printK4Effect(value.effects[i], static_cast<int>(i) + 1);
                }
            }
        },
        payload.value());

    printWarnings(payload.warnings());
    return 0;
}

// ==============================================================================
// K5000
// ==============================================================================

void printK5000Single(const Kpatch::K5000::SinglePatch& single, int number) {
    std::cout << fmt::format("  {:>3}  {}  vol {:>3}  sources {}  ADD {}\n", number,
                             single.common.name.str(), single.common.volume.value(),
                             single.sourceMuteString(), single.additiveSourceCount());
}

void printK5000Multi(const Kpatch::K5000::MultiPatch& multi, int number) {
    std::cout << fmt::format("  {:>3}  {}  vol {:>3}\n", number, multi.common.name.str(),
                             multi.common.volume.value());
}

int reportK5000(ByteView message, const DecodeOptions& options) {
    using namespace Kpatch::K5000;

    auto dump = identify(message, options);
    if (!dump) {
        std::cerr << "error: " << dump.error().message() << "\n";
        return 1;
    }
    std::cout << fmt::format("K5000 {}{}, channel {}\n", dumpKindName(dump->kind),
                             dump->header.bank
                                 ? fmt::format(" bank {}", bankName(*dump->header.bank))
                                 : std::string{},
                             dump->header.channel.value());

    auto payload = dump->decodePayload(options);
    if (!payload) {
        std::cerr << "error: " << payload.error().message() << "\n";
        return 1;
    }

    const int number = dump->number.value_or(0) + 1;
    std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, SinglePatch>) {
                printK5000Single(value, number);
            } else if constexpr (std::is_same_v<T, MultiPatch>) {
                printK5000Multi(value, number);
            } else if constexpr (std::is_same_v<T, BlockDump>) {
                for (std::size_t i = 0; i < value.singles.size(); ++i) {
                    printK5000Single(value.singles[i], value.toneNumbers[i] + 1);
                }
            } else if constexpr (std::is_same_v<T, std::vector<MultiPatch>>) {
                for (std::size_t i = 0; i < value.size(); ++i) {
                    printK5000Multi(value[i], static_cast<int>(i) + 1);
                }
            } else if constexpr (std::is_same_v<T, ByteBuffer>) {
                std::cout << fmt::format("  {} bytes, not decoded\n", value.size());
            }
        },
        payload.value());

    printWarnings(payload.warnings());
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Arguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage();
        return 2;
    }
    if (args.verbose) {
        Kpatch::Codec::setLogLevel(spdlog::level::debug);
    }

    ByteBuffer data;
    if (!readFile(args.input, data)) {
        std::cerr << "Cannot read " << args.input.string() << "\n";
        return 1;
    }

    const auto messages = splitMessages(data);
    if (messages.empty()) {
        std::cerr << "No Kawai SysEx messages in " << args.input.string() << "\n";
        return 1;
    }

    int failures = 0;
    for (const auto& message : messages) {
        if (message.size() <= kMachineIdOffset) {
            std::cerr << "error: message of " << message.size() << " bytes is too short\n";
            ++failures;
            continue;
        }
        switch (message[kMachineIdOffset]) {
            case Kpatch::K4::kMachineId:
                failures += reportK4(message, args.options);
                break;
            case Kpatch::K5000::kMachineId:
                failures += reportK5000(message, args.options);
                break;
            default:
                std::cerr << fmt::format("error: unknown Kawai machine id {:02X}H\n",
                                         message[kMachineIdOffset]);
                ++failures;
                break;
        }
    }

    std::cout << messages.size() << " message(s), " << failures << " failed" << std::endl;
    return failures == 0 ? 0 : 1;
}
