#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/int128.h"
#include "codec/io.h"
#include "core/error.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>

namespace scale::codec {

// ---------------------------------------------------------------------------
// TypeInfo -- which fixed-width primitive an element type is
// ---------------------------------------------------------------------------
// Only used to pick the bulk-copy path for sequences.  It has no bearing
// on the bytes produced.
// ---------------------------------------------------------------------------
enum class TypeInfo : uint8_t {
    UNKNOWN = 0,
    U8, I8, U16, I16, U32, I32, U64, I64, U128, I128,
};

template <typename T> inline constexpr TypeInfo type_info_v = TypeInfo::UNKNOWN;
template <> inline constexpr TypeInfo type_info_v<uint8_t>  = TypeInfo::U8;
template <> inline constexpr TypeInfo type_info_v<int8_t>   = TypeInfo::I8;
template <> inline constexpr TypeInfo type_info_v<uint16_t> = TypeInfo::U16;
template <> inline constexpr TypeInfo type_info_v<int16_t>  = TypeInfo::I16;
template <> inline constexpr TypeInfo type_info_v<uint32_t> = TypeInfo::U32;
template <> inline constexpr TypeInfo type_info_v<int32_t>  = TypeInfo::I32;
template <> inline constexpr TypeInfo type_info_v<uint64_t> = TypeInfo::U64;
template <> inline constexpr TypeInfo type_info_v<int64_t>  = TypeInfo::I64;
template <> inline constexpr TypeInfo type_info_v<uint128>  = TypeInfo::U128;
template <> inline constexpr TypeInfo type_info_v<int128>   = TypeInfo::I128;

/// True when T's in-memory bytes equal its encoding on this host, so a
/// contiguous run of T can be copied in one go.
template <typename T>
inline constexpr bool is_wire_identical_v =
    type_info_v<T> != TypeInfo::UNKNOWN &&
    std::endian::native == std::endian::little;

template <typename T>
inline std::span<const uint8_t> wire_bytes(std::span<const T> items) noexcept {
    static_assert(is_wire_identical_v<T>);
    return std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(items.data()), items.size_bytes());
}

/// Read @p count wire-identical elements into the contiguous container
/// @p out (std::vector<T> or std::string), replacing its contents.
///
/// When the input reports its remaining length the whole run is
/// checked against it and read at once.  Otherwise runs larger than
/// MAX_PREALLOCATION bytes are read chunk by chunk so that a forged
/// count cannot force a large allocation before the data is seen.
template <typename Container, Input I>
core::Result<void> read_wire_elements(I& in, Container& out, size_t count) {
    using T = typename Container::value_type;
    constexpr size_t ELEM = sizeof(T);

    const size_t byte_len = count * ELEM;
    const auto remaining = remaining_len(in);
    if (remaining && *remaining < byte_len) {
        return not_enough_data();
    }

    if (remaining || byte_len <= MAX_PREALLOCATION) {
        out.resize(count);
        return in.read(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(out.data()), byte_len));
    }

    constexpr size_t CHUNK = MAX_PREALLOCATION / ELEM;
    out.clear();
    while (out.size() < count) {
        const size_t done = out.size();
        const size_t n = std::min(CHUNK, count - done);
        out.resize(done + n);
        SCALE_TRY_VOID(in.read(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(out.data() + done), n * ELEM)));
    }
    return core::make_ok();
}

}  // namespace scale::codec
