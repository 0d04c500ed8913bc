// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/options.h"

#include "core/logging.h"

#include <limits>
#include <string>

namespace scale::codec {

core::Result<DecodeOptions> options_from_config(const core::Config& conf) {
    DecodeOptions opts;

    const int64_t depth = conf.get_int(core::CONF_MAXDEPTH, 0);
    if (depth < 0 || depth > std::numeric_limits<uint32_t>::max()) {
        return core::make_error(core::ErrorCode::INVALID_VALUE,
                                "maxdepth out of range: " + std::to_string(depth));
    }
    opts.max_depth = static_cast<uint32_t>(depth);
    opts.require_full_input = conf.get_bool(core::CONF_REQUIREFULLINPUT, false);

    LOG_DEBUG(core::LogCategory::CONFIG,
              "decode options: maxdepth=" + std::to_string(opts.max_depth) +
              " requirefullinput=" + (opts.require_full_input ? "1" : "0"));
    return opts;
}

}  // namespace scale::codec
