#pragma once

#include "config/engine_config.h"

namespace kizuna {

/// Apply level, pattern and optional file sink to the spdlog default logger.
void configure_logging(const LoggingConfig& config);

} // namespace kizuna
