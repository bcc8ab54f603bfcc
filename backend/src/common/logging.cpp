/**
 * Logging setup on top of spdlog.
 */

#include "common/logging.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace kizuna {

void configure_logging(const LoggingConfig& config) {
    if (!config.file.empty()) {
        try {
            auto logger = spdlog::get("kizuna");
            if (!logger)
                logger = spdlog::basic_logger_mt("kizuna", config.file);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Engine: cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        spdlog::warn("Engine: unknown log level '{}', using info", config.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

    if (!config.pattern.empty())
        spdlog::set_pattern(config.pattern);
}

} // namespace kizuna
