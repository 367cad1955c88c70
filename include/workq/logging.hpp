#pragma once

#include "workq/config.hpp"

namespace workq {

// Applies level and pattern to the default spdlog logger.
// Unknown level names fall back to info with a warning.
void configure_logging(const LoggingConfig& config);

} // namespace workq
