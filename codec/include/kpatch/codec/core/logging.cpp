// ==============================================================================
// Logging Implementation
// ==============================================================================

#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace Kpatch {
namespace Codec {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        const std::string name(kLoggerName);
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace Codec
} // namespace Kpatch
