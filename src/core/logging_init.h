#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logger setup from configuration.
//
//   loglevel        trace|debug|info|warn|error|fatal|off   (default info)
//   logcategories   comma-separated list, repeatable        (default all)
//   logfile         path of an append-mode log file         (default none)
//   printtoconsole  write to stderr                         (default 0)
// ---------------------------------------------------------------------------

#ifndef SCALE_CORE_LOGGING_INIT_H
#define SCALE_CORE_LOGGING_INIT_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"

#include <string_view>

namespace scale::core {

/// Apply the logging keys of @p config to the global Logger.
/// Fails on an unknown level or category name, or when the log file
/// cannot be opened; the logger is left untouched in the first two cases.
[[nodiscard]] Result<void> init_logging(const Config& config);

/// Parse a comma-separated list of category names into a bitmask.
/// Blank entries are skipped; an empty list yields ALL.
[[nodiscard]] Result<LogCategory> parse_log_categories(
    std::string_view category_str);

} // namespace scale::core

#endif // SCALE_CORE_LOGGING_INIT_H
