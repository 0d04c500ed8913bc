#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/codec.h"
#include "codec/compact.h"
#include "codec/containers.h"
#include "codec/io.h"
#include "core/error.h"
#include "core/logging.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <limits>
#include <ranges>
#include <string>
#include <vector>

namespace scale::codec {

// ===================================================================
// EncodeAppend -- add elements to an already encoded sequence
// ===================================================================
//
// Only the Compact<u32> count in front of the elements is read and
// rewritten.  The existing element bytes are never decoded:
//
//   * same prefix width   -> overwrite the prefix, append at the end
//   * prefix grows        -> shift the element bytes right by the
//                            difference, write the new prefix, append
//
// The new items must encode exactly like Seq's elements; this is a
// byte splice and does not check it.
// ===================================================================

/// Sequences whose encoding supports appending.  Item is the element
/// type the appended values are encoded as.
template <typename Seq>
struct EncodeAppend;

template <typename T, typename A>
struct EncodeAppend<std::vector<T, A>> {
    using Item = T;
};

template <typename T, typename A>
struct EncodeAppend<std::deque<T, A>> {
    using Item = T;
};

template <typename Seq>
concept Appendable = requires { typename EncodeAppend<Seq>::Item; };

/// Append @p items to the encoded Seq held in @p encoded.  An empty
/// buffer counts as an empty sequence.  On error @p encoded is left
/// unchanged.
template <Appendable Seq, std::ranges::sized_range Items>
core::Result<void> append_to(std::vector<uint8_t>& encoded, const Items& items) {
    using Item = typename EncodeAppend<Seq>::Item;
    const size_t added = std::ranges::size(items);

    if (encoded.empty()) {
        if (added > std::numeric_limits<uint32_t>::max()) {
            LOG_WARN(core::LogCategory::APPEND,
                     "append of " + std::to_string(added) +
                     " elements would overflow the count");
            return core::make_error(core::ErrorCode::LENGTH_OVERFLOW,
                                    "New vec length greater than u32::MAX");
        }
        encode_length(added, encoded);
        for (const auto& item : items) Codec<Item>::encode_to(item, encoded);
        return core::make_ok();
    }

    SliceInput in(encoded);
    const uint32_t old_count = SCALE_TRY(decode_length(in).map_error([](core::Error e) {
        return std::move(e).chain("Could not decode the length of the encoded sequence");
    }));
    const size_t old_prefix = in.position();

    const uint64_t new_count = static_cast<uint64_t>(old_count) + added;
    if (new_count > std::numeric_limits<uint32_t>::max()) {
        LOG_WARN(core::LogCategory::APPEND,
                 "append of " + std::to_string(added) + " elements to " +
                 std::to_string(old_count) + " would overflow the count");
        return core::make_error(core::ErrorCode::LENGTH_OVERFLOW,
                                "New vec length greater than u32::MAX");
    }

    StackWriter<5> prefix;
    encode_compact_to(static_cast<uint32_t>(new_count), prefix);
    const auto new_prefix = prefix.bytes();

    if (new_prefix.size() != old_prefix) {
        LOG_TRACE(core::LogCategory::APPEND,
                  "count prefix grows from " + std::to_string(old_prefix) +
                  " to " + std::to_string(new_prefix.size()) + " bytes");
        encoded.insert(encoded.begin(), new_prefix.size() - old_prefix, uint8_t{0});
    }
    std::copy(new_prefix.begin(), new_prefix.end(), encoded.begin());

    for (const auto& item : items) Codec<Item>::encode_to(item, encoded);
    return core::make_ok();
}

/// Value-returning form of append_to(): takes the encoded buffer by
/// value and returns it extended.
template <Appendable Seq, std::ranges::sized_range Items>
core::Result<std::vector<uint8_t>> append_or_new(std::vector<uint8_t> encoded,
                                                 const Items& items) {
    SCALE_TRY_VOID(append_to<Seq>(encoded, items));
    return encoded;
}

}  // namespace scale::codec
