#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace dir_tree {
    constexpr const char* kLoggerName = "dir_tree";
    constexpr const char* kLogPattern = "%H:%M:%S [%^%l%$] %v";

    struct LogOptions {
        bool verbose = false;
        std::optional<std::string> logfile;
    };

    /**
     * Creates and registers the "dir_tree" logger: a stderr console sink, plus an
     * appending file sink when a log file is given. Throws spdlog::spdlog_ex when
     * the log file cannot be opened.
     */
    std::shared_ptr<spdlog::logger> setup_logger(const LogOptions& options);

    // Registered "dir_tree" logger, falling back to spdlog's default logger.
    std::shared_ptr<spdlog::logger> resolve_logger(const std::shared_ptr<spdlog::logger>& logger);
}
