#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace device_pool {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief @p text as a quoted, escaped JSON string for JSON-fragment log messages. */
std::string json_quote(const std::string& text);

}  // namespace device_pool
