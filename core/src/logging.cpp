#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/pattern_formatter.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>
#include <sstream>
#include <iomanip>      // For std::put_time
#include <filesystem>
#include <algorithm>    // For std::min

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        std::string resolveLogDirectory(const std::string& requested) {
            try {
                if (!std::filesystem::exists(requested)) {
                    std::filesystem::create_directories(requested);
                    std::cout << "[Logging] Created log directory: " << requested << std::endl;
                }
                return requested;
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Error creating log directory '" << requested << "': " << fs_err.what() << std::endl;
                return "."; // Fallback
            }
        }

        std::string utcFileSuffix() {
            auto itt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm;
            #ifdef _WIN32
                gmtime_s(&utc_tm, &itt);
            #else
                gmtime_r(&itt, &utc_tm);
            #endif
            std::ostringstream oss;
            oss << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ");
            return oss.str();
        }

    } // namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level,
                    const std::string& log_dir)
    {
        try {
            // --- Environment override ---
            const char* env_level_cstr = std::getenv("SPDLOG_LEVEL");
            if (env_level_cstr) {
                std::string env_level_str(env_level_cstr);
                spdlog::level::level_enum env_level = level_from_string(env_level_str);
                console_level = env_level;
                file_level = env_level;
                std::cout << "[Logging] Overriding log level from SPDLOG_LEVEL environment variable to: "
                          << env_level_str << std::endl;
            }

            std::string log_file_path = resolveLogDirectory(log_dir) + "/" + base_log_filename + "_" + utcFileSuffix() + ".log";

            const std::string utc_pattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(utc_pattern, spdlog::pattern_time_type::utc));

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, 1024 * 1024 * 10, 5, true);
            file_sink->set_level(file_level);
            file_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(utc_pattern, spdlog::pattern_time_type::utc));

            // Re-initialization replaces the previous logger
            if (global_logger) {
                spdlog::drop(global_logger->name());
            }

            std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
            global_logger = std::make_shared<spdlog::logger>("SimLogger", sinks.begin(), sinks.end());
            global_logger->set_level(std::min(console_level, file_level));
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            spdlog::flush_on(spdlog::level::warn);

            #ifdef NDEBUG
                const char* build_type_str = "Release";
            #else
                const char* build_type_str = "Debug";
            #endif

            getLogger()->info("Logging initialized (Build Type: {}). Console: {}, File: {} ({})",
                            build_type_str,
                            spdlog::level::to_string_view(console_level),
                            spdlog::level::to_string_view(file_level),
                            log_file_path);

        } catch (const spdlog::spdlog_ex& ex) {
             std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
             std::cerr << "Log initialization failed (std::exception): " << ex.what() << std::endl;
        }
    }

    bool isInitialized() {
        return global_logger != nullptr;
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
             throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
         std::string lower_str = utils::toLower(level_str);
         if (lower_str == "trace") return spdlog::level::trace;
         if (lower_str == "debug") return spdlog::level::debug;
         if (lower_str == "info") return spdlog::level::info;
         if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
         if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
         if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
         if (lower_str == "off") return spdlog::level::off;
         std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
         return spdlog::level::info;
    }

} // namespace logging
} // namespace core
