/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace chain_ik {

namespace config { struct LoggingConfig; }

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file (empty = console only)
     * @param level Log level (trace, debug, info, warn, error, off)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console_enabled Attach the colored stdout sink
     */
    static void init(const std::string& log_file = "logs/chain_ik.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console_enabled = true);

    /**
     * Initialize from the `logging` section of a loaded configuration.
     * Replaces any logger created earlier.
     */
    static void init(const config::LoggingConfig& cfg);

    /**
     * Get the logger instance (lazily initialized with defaults)
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Change the level of the active logger
     */
    static void setLevel(const std::string& level);

    /**
     * Drop the active logger so the next init() starts from scratch
     */
    static void reset();

private:
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace chain_ik

// Convenience macros
#define LOG_TRACE(...) ::chain_ik::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::chain_ik::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::chain_ik::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::chain_ik::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::chain_ik::Logger::get()->error(__VA_ARGS__)
