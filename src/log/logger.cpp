#include "gwpp/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gwpp {

namespace {

constexpr std::string_view RESET   = "\033[0m";
constexpr std::string_view GRAY    = "\033[90m";
constexpr std::string_view BOLD    = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_clock(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of('/');
    return (slash == std::string_view::npos) ? sv : sv.substr(slash + 1);
}

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    constexpr std::array<LogLevel, 7> levels{
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
        LogLevel::Error, LogLevel::Fatal, LogLevel::Off
    };

    for (const auto level : levels) {
        const auto candidate = to_string(level);
        const bool same = std::equal(
            name.begin(), name.end(), candidate.begin(), candidate.end(),
            [](char a, char b) {
                return std::toupper(static_cast<unsigned char>(a)) == static_cast<unsigned char>(b);
            });
        if (same) {
            return level;
        }
    }
    // spdlog spelling
    if (name == "warning") return LogLevel::Warn;
    if (name == "critical") return LogLevel::Fatal;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    std::ostringstream line;
    if (colors_enabled_) {
        line << GRAY << format_clock(record.timestamp) << RESET
             << ' ' << BOLD << level_color(record.level)
             << std::setw(5) << std::left << to_string(record.level) << RESET
             << ' ' << GRAY << basename_of(record.location.file_name())
             << ':' << record.location.line() << RESET;
    } else {
        line << format_clock(record.timestamp)
             << ' ' << std::setw(5) << std::left << to_string(record.level)
             << ' ' << basename_of(record.location.file_name())
             << ':' << record.location.line();
    }
    line << ' ' << record.message << '\n';

    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_slot() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_slot_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_slot_mutex());
    return *logger_slot();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_slot_mutex());
    if (logger) {
        logger_slot() = std::move(logger);
    } else {
        logger_slot() = std::make_unique<NullLogger>();
    }
}

}  // namespace gwpp
