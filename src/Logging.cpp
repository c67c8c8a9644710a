#include "Logging.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LoggingConfig& cfg) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    logger->set_pattern(cfg.pattern);
    logger->set_level(spdlog::level::from_str(cfg.level));
    spdlog::set_default_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}
