#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Helpers shared by the codec test files.

#include "core/hex.h"
#include "core/logging.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace test {

/// Bytes from a hex dump such as "28 00 01"; throws on malformed input
/// so that a typo in a fixture fails the test instead of passing
/// silently.
inline std::vector<uint8_t> bytes(std::string_view dump) {
    auto r = scale::core::parse_hex_dump(dump);
    if (!r.ok()) throw std::invalid_argument(r.error().format());
    return std::move(r).value();
}

inline std::string hex(const std::vector<uint8_t>& data) {
    return scale::core::to_hex_spaced(data);
}

/// Captures log lines for the lifetime of the object, with the level
/// and category mask temporarily replaced.
class LogCapture {
public:
    explicit LogCapture(scale::core::LogLevel level = scale::core::LogLevel::TRACE,
                        scale::core::LogCategory cats = scale::core::LogCategory::ALL)
        : saved_level_(scale::core::Logger::instance().level()),
          saved_cats_(scale::core::Logger::instance().enabled_categories()) {
        auto& log = scale::core::Logger::instance();
        log.set_level(level);
        log.set_categories(cats);
        log.begin_capture();
    }

    ~LogCapture() {
        auto& log = scale::core::Logger::instance();
        if (!finished_) log.end_capture();
        log.set_level(saved_level_);
        log.set_categories(saved_cats_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    /// Stops capturing and returns the collected lines.
    std::vector<std::string> lines() {
        finished_ = true;
        return scale::core::Logger::instance().end_capture();
    }

    /// True if any collected line contains @p needle.  Ends the capture.
    bool contains(std::string_view needle) {
        for (const auto& line : lines()) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    scale::core::LogLevel    saved_level_;
    scale::core::LogCategory saved_cats_;
    bool                     finished_ = false;
};

} // namespace test
