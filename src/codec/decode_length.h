#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/compact.h"
#include "codec/io.h"
#include "core/error.h"

#include <concepts>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <queue>
#include <set>
#include <span>
#include <tuple>
#include <vector>

namespace scale::codec {

// ---------------------------------------------------------------------------
// DecodeLength -- element count of an encoded collection
// ---------------------------------------------------------------------------
// Reads only the Compact<u32> prefix; the elements are never touched.
// A tuple reports the length of its first element.
// ---------------------------------------------------------------------------

namespace detail {

struct PrefixLength {
    static core::Result<uint32_t> len(std::span<const uint8_t> bytes) {
        SliceInput in(bytes);
        return decode_length(in);
    }
};

} // namespace detail

template <typename T>
struct DecodeLength;

template <typename T, typename A>
struct DecodeLength<std::vector<T, A>> : detail::PrefixLength {};

template <typename T, typename A>
struct DecodeLength<std::deque<T, A>> : detail::PrefixLength {};

template <typename T, typename A>
struct DecodeLength<std::list<T, A>> : detail::PrefixLength {};

template <typename T, typename C, typename A>
struct DecodeLength<std::set<T, C, A>> : detail::PrefixLength {};

template <typename K, typename V, typename C, typename A>
struct DecodeLength<std::map<K, V, C, A>> : detail::PrefixLength {};

template <typename T, typename Container, typename Compare>
struct DecodeLength<std::priority_queue<T, Container, Compare>>
    : detail::PrefixLength {};

template <typename First, typename... Rest>
struct DecodeLength<std::tuple<First, Rest...>> : DecodeLength<First> {};

template <typename T>
concept HasDecodeLength = requires(std::span<const uint8_t> bytes) {
    { DecodeLength<T>::len(bytes) } -> std::same_as<core::Result<uint32_t>>;
};

/// Number of elements in the encoded T at the front of @p bytes.
template <HasDecodeLength T>
core::Result<uint32_t> decode_len(std::span<const uint8_t> bytes) {
    return DecodeLength<T>::len(bytes);
}

}  // namespace scale::codec
