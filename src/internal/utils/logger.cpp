// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Logger Implementation                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/utils/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace sqlparse {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink; stderr keeps stdout free for parse output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("sqlparse", sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        logger_ = std::make_shared<spdlog::logger>(
            "sqlparse", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->warn("Log file '{}' unavailable, logging to console only: {}", log_file, ex.what());
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

LogLevel Logger::level_from_string(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    if (name == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

} // namespace sqlparse
