#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of the application (e.g., in main())
    // Log files land in log_dir as <base_log_filename>_<UTC timestamp>.log
    void initialize(const std::string& base_log_filename = "backtester",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug,
                    const std::string& log_dir = "logs");

    bool isInitialized();

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper to set log level from a string (env vars, config files)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
