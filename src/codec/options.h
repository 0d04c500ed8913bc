#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/codec.h"
#include "codec/io.h"
#include "core/config.h"
#include "core/error.h"

#include <cstdint>
#include <span>

namespace scale::codec {

// ---------------------------------------------------------------------------
// DecodeOptions -- limits applied to a top-level decode
// ---------------------------------------------------------------------------
struct DecodeOptions {
    /// Deepest allowed nesting of sequences and indirections; 0 means
    /// no limit.
    uint32_t max_depth = 0;
    /// Fail when bytes are left over after the value.
    bool require_full_input = false;
};

/// Read `maxdepth` and `requirefullinput` from @p conf.  A negative or
/// oversized depth is rejected.
[[nodiscard]] core::Result<DecodeOptions> options_from_config(const core::Config& conf);

template <Decodable T>
core::Result<T> decode_with_options(std::span<const uint8_t> bytes,
                                    const DecodeOptions& opts) {
    if (opts.max_depth == 0) {
        return opts.require_full_input ? decode_all<T>(bytes) : decode<T>(bytes);
    }
    return opts.require_full_input
               ? decode_all_with_depth_limit<T>(opts.max_depth, bytes)
               : decode_with_depth_limit<T>(opts.max_depth, bytes);
}

}  // namespace scale::codec
