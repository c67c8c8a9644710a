#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "Config.hpp"

/**
 * @brief Creates the colour stdout logger, applies level and pattern, and makes it the default.
 */
std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const LoggingConfig& cfg);

/**
 * @brief Logger that discards everything; for tests and quiet tools.
 */
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name);
