// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Logger                                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace sqlparse {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/// Process-wide logging facade over spdlog.
///
/// Every call is a no-op until init() runs, so an embedding application that
/// never initializes the logger gets no output from the library.
class Logger {
public:
    /// Console sink plus, when `log_file` is non-empty, a file sink
    static void init(const std::string& log_file, LogLevel level = LogLevel::INFO);

    /// Flush and drop the logger; later calls are no-ops again
    static void shutdown();

    [[nodiscard]] static bool is_initialized() noexcept { return logger_ != nullptr; }

    /// "trace", "debug", "info", "warn", "error", "critical" or "off";
    /// anything else maps to INFO
    [[nodiscard]] static LogLevel level_from_string(std::string_view name) noexcept;

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace sqlparse
