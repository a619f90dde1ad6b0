#include "logger.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace logging {
    namespace {
        std::atomic<LogLevel> current_level{LogLevel::WARN};
        std::mutex write_mutex;

        const char* level_str(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG:
                    return "DEBUG";
                case LogLevel::INFO:
                    return "INFO";
                case LogLevel::WARN:
                    return "WARN";
                case LogLevel::ERROR:
                    return "ERROR";
                case LogLevel::OFF:
                    break;
            }
            return "?";
        }

        // YYYY-MM-DD HH:MM:SS.mmm, local time
        std::string now_timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t secs = std::chrono::system_clock::to_time_t(now);
            const auto msec = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

            std::tm tmv{};
            localtime_r(&secs, &tmv);

            std::array<char, 32> buf{};
            std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv);

            std::ostringstream oss;
            oss << buf.data() << '.' << std::setw(3) << std::setfill('0') << msec;
            return oss.str();
        }
    }  // namespace

    void set_level(LogLevel level) { current_level.store(level); }

    LogLevel get_level() { return current_level.load(); }

    bool enabled(LogLevel level) { return level != LogLevel::OFF && static_cast<int>(level) >= static_cast<int>(current_level.load()); }

    void write(LogLevel level, const std::string& message) {
        const std::string line = now_timestamp() + " [" + level_str(level) + "] courier: " + message + "\n";
        std::lock_guard<std::mutex> lock(write_mutex);
        std::clog << line;
    }
}  // namespace logging
