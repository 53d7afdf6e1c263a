#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "dir_tree/log.hpp"

namespace dir_tree {

    std::shared_ptr<spdlog::logger> setup_logger(const LogOptions& options) {
        std::vector<spdlog::sink_ptr> sinks;

        // stdout is reserved for the JSON document.
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(kLogPattern);
        sinks.push_back(std::move(console_sink));

        if (options.logfile) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.logfile, false);
            file_sink->set_pattern(kLogPattern);
            sinks.push_back(std::move(file_sink));
        }

        spdlog::drop(kLoggerName);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        return logger;
    }

    std::shared_ptr<spdlog::logger> resolve_logger(const std::shared_ptr<spdlog::logger>& logger) {
        if (logger) {
            return logger;
        }
        if (auto registered = spdlog::get(kLoggerName)) {
            return registered;
        }
        return spdlog::default_logger();
    }
}
