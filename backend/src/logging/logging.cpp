#include "logging/logging.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

bool setup_logging(const LogConfig& cfg) {
    const auto level = spdlog::level::from_str(cfg.level);

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.file.empty()) {
        logger = spdlog::stderr_color_mt("ballpass");
    } else {
        try {
            logger = spdlog::basic_logger_mt("ballpass", cfg.file);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", cfg.file, e.what());
            return false;
        }
    }

    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return true;
}
