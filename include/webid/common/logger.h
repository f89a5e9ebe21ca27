/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Provides a consistent logging setup for the library and the CLI.
 * Wraps spdlog with standardized configuration.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

namespace webid::common {

/**
 * @brief Map a textual level to spdlog level (unknown values map to info)
 */
inline spdlog::level::level_enum parseLogLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize default logger
     * @param name Logger name shown in every line (e.g., "webid-tls")
     * @param logLevel Log level (trace, debug, info, warn, error, critical, off)
     * @param logToFile Enable rotating file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console goes to stderr so that CLI output on stdout stays machine-readable
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(parseLogLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}, file={}",
                          name, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLogLevel(level));
        spdlog::debug("Log level changed to: {}", level);
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace webid::common
