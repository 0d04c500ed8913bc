// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace scale::core {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

struct CategoryName {
    LogCategory      cat;
    std::string_view name;
};

constexpr CategoryName CATEGORY_NAMES[] = {
    {LogCategory::CODEC,   "CODEC"},
    {LogCategory::COMPACT, "COMPACT"},
    {LogCategory::DECODE,  "DECODE"},
    {LogCategory::APPEND,  "APPEND"},
    {LogCategory::CONFIG,  "CONFIG"},
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Level / category names
// ---------------------------------------------------------------------------
std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    for (int i = static_cast<int>(LogLevel::TRACE);
         i <= static_cast<int>(LogLevel::OFF); ++i) {
        auto lvl = static_cast<LogLevel>(i);
        if (iequals(name, log_level_string(lvl))) return lvl;
    }
    if (iequals(name, "warning")) return LogLevel::WARN;
    return std::nullopt;
}

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (bits == static_cast<uint32_t>(LogCategory::ALL)) return "ALL";

    uint32_t lowest = bits & (~bits + 1u);
    for (const auto& entry : CATEGORY_NAMES) {
        if (static_cast<uint32_t>(entry.cat) == lowest) return entry.name;
    }
    return "UNKNOWN";
}

std::optional<LogCategory> parse_log_category(std::string_view name) noexcept {
    if (iequals(name, "all"))  return LogCategory::ALL;
    if (iequals(name, "none")) return LogCategory::NONE;
    for (const auto& entry : CATEGORY_NAMES) {
        if (iequals(name, entry.name)) return entry.cat;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Logger -- singleton access, construction
// ---------------------------------------------------------------------------
Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::Logger() {
    buffer_.reserve(BUFFER_FLUSH_THRESHOLD * 2);
}

Logger::~Logger() {
    flush();
}

// ---------------------------------------------------------------------------
// Logger -- configuration
// ---------------------------------------------------------------------------
void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

void Logger::enable_category(LogCategory cat) {
    enabled_categories_.fetch_or(static_cast<uint32_t>(cat),
                                 std::memory_order_release);
}

void Logger::disable_category(LogCategory cat) {
    enabled_categories_.fetch_and(~static_cast<uint32_t>(cat),
                                  std::memory_order_release);
}

void Logger::set_categories(LogCategory mask) {
    enabled_categories_.store(static_cast<uint32_t>(mask),
                              std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(
        level_.load(std::memory_order_acquire));
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (lvl == LogLevel::OFF ||
        static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    // NONE (0) always passes the category filter.
    uint32_t cat_bits = static_cast<uint32_t>(cat);
    if (cat_bits != 0) {
        uint32_t mask = enabled_categories_.load(std::memory_order_acquire);
        if ((mask & cat_bits) == 0) {
            return false;
        }
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire) ||
           capturing_.load(std::memory_order_acquire);
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

void Logger::set_print_to_file(bool enable) {
    print_to_file_.store(enable, std::memory_order_release);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        flush_file_locked();
        file_stream_.close();
    }
    buffer_.clear();
    log_file_path_ = path;

    if (path.empty()) return true;

    file_stream_.open(path, std::ios::out | std::ios::app | std::ios::ate);
    if (!file_stream_.is_open()) {
        print_to_file_.store(false, std::memory_order_release);
        std::cerr << "Logger: failed to open log file: " << path << "\n";
        return false;
    }
    return true;
}

void Logger::begin_capture() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    captured_.clear();
    capturing_.store(true, std::memory_order_release);
}

std::vector<std::string> Logger::end_capture() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    capturing_.store(false, std::memory_order_release);
    return std::move(captured_);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    flush_file_locked();
    std::cerr.flush();
}

void Logger::flush_file_locked() {
    if (!buffer_.empty() && file_stream_.is_open()) {
        file_stream_.write(buffer_.data(),
                           static_cast<std::streamsize>(buffer_.size()));
    }
    buffer_.clear();
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

// ---------------------------------------------------------------------------
// Logger -- writing
// ---------------------------------------------------------------------------
void Logger::write(LogLevel lvl, LogCategory cat,
                   std::string_view message) {
    //   [2026-02-03 12:00:00.123] [DEBUG] [DECODE] message here
    std::string line;
    line.reserve(64 + message.size());

    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_line_locked(line);

    if (static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN)) {
        flush_file_locked();
        std::cerr.flush();
    }
}

void Logger::write_line_locked(std::string_view line) {
    if (capturing_.load(std::memory_order_relaxed)) {
        captured_.emplace_back(line);
    }

    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(),
                        static_cast<std::streamsize>(line.size()));
        std::cerr.put('\n');
    }

    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        buffer_ += line;
        buffer_ += '\n';
        if (buffer_.size() >= BUFFER_FLUSH_THRESHOLD) {
            flush_file_locked();
        }
    }
}

// ---------------------------------------------------------------------------
// Logger -- timestamp formatting
// ---------------------------------------------------------------------------
std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    int millis = static_cast<int>(epoch_ms % 1000);

    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};

#if defined(_WIN32) || defined(_WIN64)
    gmtime_s(&tm_buf, &time_val);
#else
    gmtime_r(&time_val, &tm_buf);
#endif

    char buf[32];
    int n = std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);

    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace scale::core
