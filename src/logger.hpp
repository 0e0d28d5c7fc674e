#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

namespace lx {

// Installs the "lanxfer" logger as the spdlog default. An unopenable log file
// leaves console-only logging in place and returns false.
inline bool init_logger(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    std::string file_error;
    if (!cfg.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.file,
                static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(cfg.max_files));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("lanxfer", sinks.begin(), sinks.end());

    // Unknown names map to "off" in spdlog; fall back to info instead
    auto level = spdlog::level::from_str(cfg.level);
    if (level == spdlog::level::off && cfg.level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("Log file {} unavailable ({}), logging to console only", cfg.file, file_error);
        return false;
    }
    return true;
}

} // namespace lx
