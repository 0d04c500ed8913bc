// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging_init.h"

#include <cctype>
#include <string>

namespace scale::core {

namespace {

std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse_log_categories
// ---------------------------------------------------------------------------

Result<LogCategory> parse_log_categories(std::string_view category_str) {
    LogCategory result = LogCategory::NONE;
    bool any = false;

    size_t start = 0;
    while (start <= category_str.size()) {
        size_t comma = category_str.find(',', start);
        if (comma == std::string_view::npos) {
            comma = category_str.size();
        }

        std::string_view token =
            trim_ws(category_str.substr(start, comma - start));
        if (!token.empty()) {
            auto cat = parse_log_category(token);
            if (!cat) {
                return make_error(ErrorCode::INVALID_VALUE,
                                  "unknown log category '" +
                                  std::string{token} + "'");
            }
            result |= *cat;
            any = true;
        }

        start = comma + 1;
    }

    return any ? result : LogCategory::ALL;
}

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

Result<void> init_logging(const Config& config) {
    LogLevel level = LogLevel::INFO;
    if (auto name = config.get(CONF_LOGLEVEL)) {
        auto parsed = parse_log_level(trim_ws(*name));
        if (!parsed) {
            return make_error(ErrorCode::INVALID_VALUE,
                              "unknown log level '" + *name + "'");
        }
        level = *parsed;
    }

    LogCategory categories = LogCategory::ALL;
    auto lists = config.get_list(CONF_LOGCATEGORIES);
    if (!lists.empty()) {
        categories = LogCategory::NONE;
        for (const auto& list : lists) {
            auto parsed = SCALE_TRY(parse_log_categories(list));
            categories |= parsed;
        }
    }

    auto& logger = Logger::instance();
    logger.set_level(level);
    logger.set_categories(categories);
    logger.set_print_to_console(
        config.get_bool(CONF_PRINTTOCONSOLE, false));

    std::string path = config.get_or(CONF_LOGFILE, "");
    if (!path.empty()) {
        if (!logger.set_log_file(path)) {
            return make_error(ErrorCode::INVALID_VALUE,
                              "cannot open log file '" + path + "'");
        }
        logger.set_print_to_file(true);
    } else {
        logger.set_print_to_file(false);
    }

    LOG_DEBUG(LogCategory::CONFIG,
              std::string("logging initialised at level ") +
              std::string(log_level_string(level)));
    return make_ok();
}

} // namespace scale::core
