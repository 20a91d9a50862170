// ==============================================================================
// Layer 0: Core
// logging.h - Named spdlog logger shared by all decoders
// ==============================================================================
// Decoders log checksum warnings, section offsets and block names. Logging
// never influences a decode result.
// ==============================================================================

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace Kpatch {
namespace Codec {

inline constexpr std::string_view kLoggerName = "kpatch";

/// Logger registered as "kpatch". Created on first use with a coloured stderr
/// sink at level warn, unless the application registered its own beforehand.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace Codec
} // namespace Kpatch
