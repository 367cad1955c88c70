#include "workq/logging.hpp"
#include <spdlog/spdlog.h>

namespace workq {

void configure_logging(const LoggingConfig& config) {
    spdlog::set_pattern(config.log_pattern);

    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unrecognised names to off
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown LOG_LEVEL '{}', using info", config.log_level);
        return;
    }
    spdlog::set_level(level);
}

} // namespace workq
