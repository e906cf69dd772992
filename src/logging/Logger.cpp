/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include "../config/ChainConfig.hpp"
#include <vector>
#include <filesystem>
#include <iostream>

namespace chain_ik {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console_enabled) {
    if (s_initialized) {
        return;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        if (console_enabled) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        // File sink (rotating)
        if (!log_file.empty()) {
            std::filesystem::path log_path(log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        s_logger = std::make_shared<spdlog::logger>("chain_ik", sinks.begin(), sinks.end());
        s_logger->set_level(parseLevel(level));

        // Flush on warn or above
        s_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(s_logger);

        s_initialized = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }

    // A logger must exist even when the file sink could not be created
    if (!s_logger) {
        s_logger = std::make_shared<spdlog::logger>(
            "chain_ik", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        s_logger->set_level(parseLevel(level));
        s_initialized = true;
    }
}

void Logger::init(const config::LoggingConfig& cfg) {
    reset();
    init(cfg.file_enabled ? cfg.file : std::string(),
         cfg.level,
         static_cast<size_t>(cfg.max_size_mb) * 1024 * 1024,
         static_cast<size_t>(cfg.max_files),
         cfg.console_enabled);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized) {
        init(); // Initialize with defaults
    }
    return s_logger;
}

void Logger::setLevel(const std::string& level) {
    get()->set_level(parseLevel(level));
}

void Logger::reset() {
    if (s_logger) {
        s_logger->flush();
    }
    s_logger = nullptr;
    s_initialized = false;
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace chain_ik
