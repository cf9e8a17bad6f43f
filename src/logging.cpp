#include "partfetch/logging.hpp"

#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace partfetch {

void initLogging(const Config& config) {
    std::shared_ptr<spdlog::logger> logger;
    spdlog::level::level_enum level = spdlog::level::warn;

    if (config.log_file.empty()) {
        logger = spdlog::stderr_color_mt("partfetch");
    } else {
        logger = spdlog::basic_logger_mt("partfetch", config.log_file);
        level = spdlog::level::info;
    }
    if (config.verbose) {
        level = spdlog::level::debug;
    }

    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace partfetch
