#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/io.h"
#include "core/error.h"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace scale::codec {

// ===================================================================
// Codec<T> -- the single customisation point
// ===================================================================
//
// Specialisations provide
//   template <Output O> static void encode_to(const T&, O&);
//   template <Input I>  static core::Result<T> decode(I&);
// and may add any of
//   static size_t size_hint(const T&);
//   static size_t encoded_size(const T&);
//   template <class F> static auto using_encoded(const T&, F&&);
//   template <Input I> static core::Result<void> skip(I&);
//   static constexpr std::optional<size_t> encoded_fixed_size();
//   static constexpr size_t min_encoded_len();
//   static constexpr size_t max_encoded_len();
//
// The primary template forwards to members of T, which is how
// hand-written or generated aggregate codecs plug in:
//
//   struct Point {
//       int32_t x, y;
//       template <Output O> void encode_to(O& out) const;
//       template <Input I> static core::Result<Point> decode(I& in);
//   };
// ===================================================================

template <typename T>
struct Codec {
    template <Output O>
        requires requires(const T& v, O& out) { v.encode_to(out); }
    static void encode_to(const T& v, O& out) {
        v.encode_to(out);
    }

    template <Input I>
        requires requires(I& in) {
            { T::decode(in) } -> std::same_as<core::Result<T>>;
        }
    static core::Result<T> decode(I& in) {
        return T::decode(in);
    }

    static size_t size_hint(const T& v)
        requires requires(const T& x) {
            { x.size_hint() } -> std::convertible_to<size_t>;
        }
    {
        return v.size_hint();
    }

    template <Input I>
        requires requires(I& in) {
            { T::skip(in) } -> std::same_as<core::Result<void>>;
        }
    static core::Result<void> skip(I& in) {
        return T::skip(in);
    }

    static constexpr std::optional<size_t> encoded_fixed_size()
        requires requires { T::encoded_fixed_size(); }
    {
        return T::encoded_fixed_size();
    }

    static constexpr size_t min_encoded_len()
        requires requires { T::min_encoded_len(); }
    {
        return T::min_encoded_len();
    }

    static constexpr size_t max_encoded_len()
        requires requires { T::max_encoded_len(); }
    {
        return T::max_encoded_len();
    }
};

template <typename T>
concept Encodable = requires(const T& v, SizeCounter& out) {
    Codec<T>::encode_to(v, out);
};

template <typename T>
concept Decodable = requires(SliceInput& in) {
    { Codec<T>::decode(in) } -> std::same_as<core::Result<T>>;
};

template <typename T>
concept HasMaxEncodedLen = requires {
    { Codec<T>::max_encoded_len() } -> std::convertible_to<size_t>;
};

// ===================================================================
// Encoding entry points
// ===================================================================

/// Non-binding estimate of the encoded length; may be 0.
template <Encodable T>
size_t size_hint(const T& v) {
    if constexpr (requires { { Codec<T>::size_hint(v) } -> std::convertible_to<size_t>; }) {
        return Codec<T>::size_hint(v);
    } else {
        return 0;
    }
}

template <Encodable T, Output O>
void encode_to(const T& v, O& out) {
    Codec<T>::encode_to(v, out);
}

template <Encodable T>
std::vector<uint8_t> encode(const T& v) {
    std::vector<uint8_t> out;
    out.reserve(size_hint(v));
    Codec<T>::encode_to(v, out);
    return out;
}

/// Calls @p f with a span over the encoding of @p v.
template <Encodable T, typename F>
auto using_encoded(const T& v, F&& f) {
    if constexpr (requires { Codec<T>::using_encoded(v, std::forward<F>(f)); }) {
        return Codec<T>::using_encoded(v, std::forward<F>(f));
    } else {
        auto bytes = encode(v);
        return std::forward<F>(f)(std::span<const uint8_t>(bytes));
    }
}

/// Exact encoded length, computed without materialising the bytes.
template <Encodable T>
size_t encoded_size(const T& v) {
    if constexpr (requires { { Codec<T>::encoded_size(v) } -> std::convertible_to<size_t>; }) {
        return Codec<T>::encoded_size(v);
    } else {
        SizeCounter counter;
        Codec<T>::encode_to(v, counter);
        return counter.size();
    }
}

// ===================================================================
// Static size information
// ===================================================================

/// Set iff every value of T encodes to exactly that many bytes.
template <typename T>
constexpr std::optional<size_t> encoded_fixed_size() {
    if constexpr (requires { Codec<T>::encoded_fixed_size(); }) {
        return Codec<T>::encoded_fixed_size();
    } else {
        return std::nullopt;
    }
}

/// Lower bound on the encoded length of any value of T.
template <typename T>
constexpr size_t min_encoded_len() {
    if constexpr (requires { Codec<T>::min_encoded_len(); }) {
        return Codec<T>::min_encoded_len();
    } else {
        return encoded_fixed_size<T>().value_or(0);
    }
}

/// Upper bound on the encoded length of any value of T.
template <HasMaxEncodedLen T>
constexpr size_t max_encoded_len() {
    return Codec<T>::max_encoded_len();
}

// ===================================================================
// Decoding entry points
// ===================================================================

template <Decodable T, Input I>
core::Result<T> decode(I& in) {
    return Codec<T>::decode(in);
}

/// Decode a T from the front of @p bytes.  Trailing bytes are allowed.
template <Decodable T>
core::Result<T> decode(std::span<const uint8_t> bytes) {
    SliceInput in(bytes);
    return Codec<T>::decode(in);
}

/// Consume one encoded T without materialising it.
template <Decodable T, Input I>
core::Result<void> skip(I& in) {
    if constexpr (requires { { Codec<T>::skip(in) } -> std::same_as<core::Result<void>>; }) {
        return Codec<T>::skip(in);
    } else if constexpr (encoded_fixed_size<T>().has_value()) {
        return skip_bytes(in, *encoded_fixed_size<T>());
    } else {
        auto r = Codec<T>::decode(in);
        if (!r.ok()) return std::move(r).error();
        return core::make_ok();
    }
}

/// Decode a T and require that every byte was consumed.
template <Decodable T>
core::Result<T> decode_all(std::span<const uint8_t> bytes) {
    SliceInput in(bytes);
    auto value = SCALE_TRY(Codec<T>::decode(in));
    if (in.remaining() != 0) {
        return core::make_error(
            core::ErrorCode::TRAILING_DATA,
            "Input buffer has still data left after decoding!");
    }
    return value;
}

/// Decode a T, failing once nested sequences or indirections go deeper
/// than @p max_depth.
template <Decodable T>
core::Result<T> decode_with_depth_limit(uint32_t max_depth,
                                        std::span<const uint8_t> bytes) {
    SliceInput slice(bytes);
    DepthLimitInput<SliceInput> in(slice, max_depth);
    return Codec<T>::decode(in);
}

template <Decodable T>
core::Result<T> decode_all_with_depth_limit(uint32_t max_depth,
                                            std::span<const uint8_t> bytes) {
    SliceInput slice(bytes);
    DepthLimitInput<SliceInput> in(slice, max_depth);
    auto value = SCALE_TRY(Codec<T>::decode(in));
    if (slice.remaining() != 0) {
        return core::make_error(
            core::ErrorCode::TRAILING_DATA,
            "Input buffer has still data left after decoding!");
    }
    return value;
}

/// Decode one field of an aggregate, naming it in the error chain:
/// "Could not decode `Point::x`".
template <Decodable T, Input I>
core::Result<T> decode_field(I& in, std::string_view field) {
    return Codec<T>::decode(in).map_error([&](core::Error e) {
        return std::move(e).chain("Could not decode `" +
                                  std::string(field) + "`");
    });
}

}  // namespace scale::codec
