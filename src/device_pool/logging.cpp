#include "device_pool/logging.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <json/json.h>

#include "device_pool/version.hpp"

namespace device_pool {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "device_pool";
constexpr char k_log_file_name[] = "device_pool.log";
constexpr std::chrono::seconds k_flush_interval{5}; /**< Background flush cadence for the rotating file. */
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            const std::filesystem::path path_log_file = path_log_dir / k_log_file_name;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("%H:%M:%S.%e [%^%l%$] %v");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path_log_file.string(),
                k_max_file_size_bytes,
                k_max_files
            );
            file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})");

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            // Lease expiries and sweep failures must reach disk even if the process dies.
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
            spdlog::flush_every(k_flush_interval);
            shared_logger->info(R"({{"component":"logging","version":"{}","file":{}}})",
                                k_version,
                                json_quote(path_log_file.string()));
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const auto level = spdlog::level::from_str(str_level);
    // from_str maps unrecognised names to "off"; only accept an explicit "off".
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn(R"({{"component":"logging","unknown_level":{},"using":"info"}})", json_quote(str_level));
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

std::string json_quote(const std::string& text) {
    return Json::valueToQuotedString(text.c_str());
}

}  // namespace device_pool
