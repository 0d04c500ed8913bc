#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCALE_CORE_LOGGING_H
#define SCALE_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scale::core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask of codec subsystems
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    CODEC      = 1u << 0,   // encode / decode entry points
    COMPACT    = 1u << 1,   // compact integer prefixes
    DECODE     = 1u << 2,   // resource refusals while decoding
    APPEND     = 1u << 3,   // in-place sequence appends
    CONFIG     = 1u << 4,   // option and config parsing
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator~(LogCategory a) noexcept {
    return static_cast<LogCategory>(~static_cast<uint32_t>(a));
}

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Parses a level name ("trace", "debug", "info", "warn", "error",
/// "fatal", "off"; case-insensitive).  Returns std::nullopt if unknown.
[[nodiscard]] std::optional<LogLevel> parse_log_level(
    std::string_view name) noexcept;

/// Name of the lowest set category bit, "NONE" for zero, "ALL" for the
/// full mask.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses a single category name ("codec", "compact", "decode",
/// "append", "config", "all", "none"; case-insensitive).
[[nodiscard]] std::optional<LogCategory> parse_log_category(
    std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    /// Replaces the whole category mask.
    void set_categories(LogCategory mask);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check: true if a message at @p level in @p cat would be
    /// written to at least one sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens the log file in append mode, replacing any previous one.
    /// An empty path closes the current file.  Returns false when the
    /// file cannot be opened; file output is then disabled.
    bool set_log_file(const std::filesystem::path& path);

    /// Starts collecting formatted lines in memory.  The capture sink
    /// counts as an active sink for will_log().
    void begin_capture();

    /// Stops collecting and returns every captured line (without the
    /// trailing newline).
    std::vector<std::string> end_capture();

    void flush();

    /// Writes one log line.  Callers check will_log() first so that
    /// disabled messages are never formatted.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{false};
    std::atomic<bool>     print_to_file_{false};
    std::atomic<bool>     capturing_{false};

    mutable std::mutex       write_mutex_;
    std::ofstream            file_stream_;
    std::filesystem::path    log_file_path_;
    std::string              buffer_;
    std::vector<std::string> captured_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace scale::core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The will_log() check runs before the message expression is evaluated.
//
//   LOG_DEBUG(scale::core::LogCategory::DECODE, "depth limit reached");
// ---------------------------------------------------------------------------

#define SCALE_LOG_AT(lvl, cat, msg)                                       \
    do {                                                                  \
        if (scale::core::Logger::instance().will_log((lvl), (cat))) {     \
            scale::core::Logger::instance().write(                        \
                (lvl), (cat), std::string(msg));                          \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) SCALE_LOG_AT(scale::core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) SCALE_LOG_AT(scale::core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  SCALE_LOG_AT(scale::core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  SCALE_LOG_AT(scale::core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) SCALE_LOG_AT(scale::core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) SCALE_LOG_AT(scale::core::LogLevel::FATAL, cat, msg)

#endif // SCALE_CORE_LOGGING_H
