#ifndef COURIER_LOGGER_HPP
#define COURIER_LOGGER_HPP

#include <sstream>
#include <string>

namespace logging {
    enum class LogLevel : int {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        OFF = 4,
    };

    // Process-wide; WARN unless changed.
    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level();
    [[nodiscard]] bool enabled(LogLevel level);

    void write(LogLevel level, const std::string& message);
}  // namespace logging

// Message expressions are only evaluated when the level is enabled.
#define COURIER_LOG(level, expr)                        \
    do {                                                \
        if (::logging::enabled(level)) {                \
            std::ostringstream courier_log_oss_;        \
            courier_log_oss_ << expr;                   \
            ::logging::write(level, courier_log_oss_.str()); \
        }                                               \
    } while (0)

#define COURIER_LOG_DEBUG(expr) COURIER_LOG(::logging::LogLevel::DEBUG, expr)
#define COURIER_LOG_INFO(expr) COURIER_LOG(::logging::LogLevel::INFO, expr)
#define COURIER_LOG_WARN(expr) COURIER_LOG(::logging::LogLevel::WARN, expr)
#define COURIER_LOG_ERROR(expr) COURIER_LOG(::logging::LogLevel::ERROR, expr)

#endif
