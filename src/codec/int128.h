#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <string>
#include <type_traits>

namespace scale::codec {

// 128-bit integers are a GCC/Clang extension.  Under strict -std=c++20
// the standard traits do not recognise them, so the codec never relies
// on std::is_integral / std::numeric_limits / std::make_unsigned for
// these two types.
__extension__ typedef unsigned __int128 uint128;
__extension__ typedef __int128          int128;

template <typename T>
struct unsigned_of {
    using type = std::make_unsigned_t<T>;
};
template <> struct unsigned_of<uint128> { using type = uint128; };
template <> struct unsigned_of<int128>  { using type = uint128; };

template <typename T>
using unsigned_of_t = typename unsigned_of<T>::type;

/// Integer types with a fixed-width little-endian encoding.
template <typename T>
concept FixedWidthInt =
    (std::is_integral_v<T> && !std::is_same_v<T, bool>) ||
    std::is_same_v<T, uint128> || std::is_same_v<T, int128>;

/// Largest value of an unsigned type, including uint128.
template <typename U>
inline constexpr U max_of() noexcept {
    return static_cast<U>(~U{0});
}

/// Decimal rendering for diagnostics and test output.
inline std::string to_string(uint128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    return out;
}

inline std::string to_string(int128 v) {
    if (v >= 0) return to_string(static_cast<uint128>(v));
    return "-" + to_string(static_cast<uint128>(0) - static_cast<uint128>(v));
}

}  // namespace scale::codec
