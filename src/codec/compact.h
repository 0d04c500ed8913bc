#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/codec.h"
#include "codec/int128.h"
#include "codec/io.h"
#include "core/error.h"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace scale::codec {

// ===================================================================
// Compact integer encoding
// ===================================================================
//
// The low two bits of the first byte select the mode:
//
//   00  0 .. 63                 1 byte    value << 2
//   01  64 .. 2^14-1            2 bytes   (value << 2) | 1, LE u16
//   10  2^14 .. 2^30-1          4 bytes   (value << 2) | 2, LE u32
//   11  2^30 ..                 1+n       ((n - 4) << 2) | 3, then the
//                                         value in n LE bytes, n >= 4
//
// Encoders always pick the shortest form.  Decoders reject any value
// that would have fitted a shorter form ("out of range"), a byte count
// wider than the target type ("unexpected prefix"), and values that do
// not fit the target type.
// ===================================================================

template <typename U>
concept CompactUnsigned =
    std::is_same_v<U, uint8_t>  || std::is_same_v<U, uint16_t> ||
    std::is_same_v<U, uint32_t> || std::is_same_v<U, uint64_t> ||
    std::is_same_v<U, uint128>;

/// Wrapper selecting the compact encoding for a value.
template <typename T>
struct Compact {
    T value{};

    constexpr Compact() = default;
    constexpr Compact(T v) : value(std::move(v)) {}  // NOLINT implicit

    bool operator==(const Compact&) const = default;
};

template <typename T>
Compact(T) -> Compact<T>;

namespace detail {

template <CompactUnsigned U>
constexpr size_t significant_bytes(U v) noexcept {
    size_t n = 0;
    while (v != 0) {
        ++n;
        v = static_cast<U>(v >> 7 >> 1);
    }
    return n;
}

template <Output O>
inline void write_le(O& out, uint32_t v, size_t bytes) {
    uint8_t buf[4];
    for (size_t i = 0; i < bytes; ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    write_bytes(out, std::span<const uint8_t>(buf, bytes));
}

inline core::Error compact_out_of_range(const char* type_name) {
    return core::make_error(core::ErrorCode::OUT_OF_RANGE,
                            std::string("out of range decoding Compact<") +
                            type_name + ">");
}

template <CompactUnsigned U>
constexpr const char* compact_type_name() noexcept {
    if constexpr (std::is_same_v<U, uint8_t>)       return "u8";
    else if constexpr (std::is_same_v<U, uint16_t>) return "u16";
    else if constexpr (std::is_same_v<U, uint32_t>) return "u32";
    else if constexpr (std::is_same_v<U, uint64_t>) return "u64";
    else                                            return "u128";
}

} // namespace detail

/// Number of bytes the compact encoding of @p v occupies.
template <CompactUnsigned U>
constexpr size_t compact_len(U v) noexcept {
    if (v <= 0x3F) return 1;
    if (v <= 0x3FFF) return 2;
    if (v <= 0x3FFFFFFF) return 4;
    size_t n = detail::significant_bytes(v);
    return 1 + (n < 4 ? 4 : n);
}

template <CompactUnsigned U, Output O>
void encode_compact_to(U v, O& out) {
    if (v <= 0x3F) {
        push_byte(out, static_cast<uint8_t>(v << 2));
    } else if (v <= 0x3FFF) {
        detail::write_le(out, (static_cast<uint32_t>(v) << 2) | 0b01, 2);
    } else if (v <= 0x3FFFFFFF) {
        detail::write_le(out, (static_cast<uint32_t>(v) << 2) | 0b10, 4);
    } else {
        size_t n = detail::significant_bytes(v);
        if (n < 4) n = 4;
        push_byte(out, static_cast<uint8_t>(((n - 4) << 2) | 0b11));
        uint8_t buf[16];
        U rest = v;
        for (size_t i = 0; i < n; ++i) {
            buf[i] = static_cast<uint8_t>(rest);
            rest = static_cast<U>(rest >> 7 >> 1);
        }
        write_bytes(out, std::span<const uint8_t>(buf, n));
    }
}

template <CompactUnsigned U, Input I>
core::Result<U> decode_compact(I& in) {
    const char* name = detail::compact_type_name<U>();
    const uint8_t prefix = SCALE_TRY(read_byte(in));

    switch (prefix & 0b11) {
    case 0b00:
        return static_cast<U>(prefix >> 2);

    case 0b01: {
        const uint8_t hi = SCALE_TRY(read_byte(in));
        const uint32_t x = ((static_cast<uint32_t>(hi) << 8) | prefix) >> 2;
        if (x <= 0x3F) return detail::compact_out_of_range(name);
        if constexpr (sizeof(U) == 1) {
            if (x > 0xFF) return detail::compact_out_of_range(name);
        }
        return static_cast<U>(x);
    }

    case 0b10: {
        uint8_t rest[3];
        SCALE_TRY_VOID(in.read(std::span<uint8_t>(rest, 3)));
        const uint32_t raw = static_cast<uint32_t>(prefix)
                           | (static_cast<uint32_t>(rest[0]) << 8)
                           | (static_cast<uint32_t>(rest[1]) << 16)
                           | (static_cast<uint32_t>(rest[2]) << 24);
        const uint32_t x = raw >> 2;
        if (x <= 0x3FFF) return detail::compact_out_of_range(name);
        if constexpr (sizeof(U) < 4) {
            if (x > static_cast<uint32_t>(max_of<U>())) {
                return detail::compact_out_of_range(name);
            }
        }
        return static_cast<U>(x);
    }

    default: {
        const size_t n = static_cast<size_t>(prefix >> 2) + 4;
        if constexpr (sizeof(U) < 4) {
            return core::make_error(core::ErrorCode::OUT_OF_RANGE,
                                    std::string("unexpected prefix decoding Compact<") +
                                    name + ">");
        } else {
            if (n > sizeof(U)) {
                return core::make_error(core::ErrorCode::OUT_OF_RANGE,
                                        std::string("unexpected prefix decoding Compact<") +
                                        name + ">");
            }
            uint8_t buf[sizeof(U)];
            SCALE_TRY_VOID(in.read(std::span<uint8_t>(buf, n)));
            U x = 0;
            for (size_t i = n; i-- > 0;) {
                x = static_cast<U>(x << 7 << 1) | buf[i];
            }
            // Four bytes must hold more than 30 bits; wider forms need a
            // non-zero top byte.
            const bool minimal = n == 4 ? x > 0x3FFFFFFF : buf[n - 1] != 0;
            if (!minimal) return detail::compact_out_of_range(name);
            return x;
        }
    }
    }
}

/// Skip one compact integer of any width, without range checks.
template <Input I>
core::Result<void> skip_compact(I& in) {
    const uint8_t prefix = SCALE_TRY(read_byte(in));
    switch (prefix & 0b11) {
    case 0b00: return core::make_ok();
    case 0b01: return skip_bytes(in, 1);
    case 0b10: return skip_bytes(in, 3);
    default:   return skip_bytes(in, static_cast<size_t>(prefix >> 2) + 4);
    }
}

/// Maximum compact length of any value of U: 2/4/5/9/17 bytes.
template <CompactUnsigned U>
constexpr size_t compact_max_len() noexcept {
    return compact_len(max_of<U>());
}

// ===================================================================
// Length prefixes
// ===================================================================

/// Write a sequence length as Compact<u32>.  A length that does not fit
/// in 32 bits is a programming error.
template <Output O>
void encode_length(size_t len, O& out) {
    if (len > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error(
            "Attempted to serialize a collection with too many elements.");
    }
    encode_compact_to(static_cast<uint32_t>(len), out);
}

template <Input I>
core::Result<uint32_t> decode_length(I& in) {
    return decode_compact<uint32_t>(in);
}

// ===================================================================
// CompactAs: user wrappers delegating to a compact-capable field
// ===================================================================
//
//   struct Index { uint32_t v; };
//   template <> struct CompactAs<Index> {
//       using As = uint32_t;
//       static As encode_as(const Index& i) { return i.v; }
//       static core::Result<Index> decode_from(As v) { return Index{v}; }
//   };
//
// After that, Compact<Index> encodes exactly like Compact<uint32_t>.
// ===================================================================

template <typename T>
struct CompactAs;

template <typename T>
concept CompactAsType = requires(const T& v) {
    typename CompactAs<T>::As;
    { CompactAs<T>::encode_as(v) };
    { CompactAs<T>::decode_from(std::declval<typename CompactAs<T>::As>()) }
        -> std::same_as<core::Result<T>>;
};

/// Types usable with Compact<T>.
template <typename T>
concept HasCompact = CompactUnsigned<T> ||
                     std::is_same_v<T, std::monostate> ||
                     CompactAsType<T>;

/// The wrapper a `compact` field of type T is encoded through.
template <HasCompact T>
using CompactType = Compact<T>;

// ===================================================================
// Codec specialisations
// ===================================================================

template <CompactUnsigned U>
struct Codec<Compact<U>> {
    template <Output O>
    static void encode_to(const Compact<U>& c, O& out) {
        encode_compact_to(c.value, out);
    }

    template <Input I>
    static core::Result<Compact<U>> decode(I& in) {
        auto v = SCALE_TRY(decode_compact<U>(in));
        return Compact<U>(v);
    }

    template <Input I>
    static core::Result<void> skip(I& in) {
        return skip_compact(in);
    }

    static size_t size_hint(const Compact<U>& c) { return compact_len(c.value); }
    static size_t encoded_size(const Compact<U>& c) { return compact_len(c.value); }

    template <typename F>
    static auto using_encoded(const Compact<U>& c, F&& f) {
        StackWriter<1 + sizeof(U)> w;
        encode_compact_to(c.value, w);
        return std::forward<F>(f)(w.bytes());
    }

    static constexpr size_t min_encoded_len() { return 1; }
    static constexpr size_t max_encoded_len() { return compact_max_len<U>(); }
};

template <>
struct Codec<Compact<std::monostate>> {
    template <Output O>
    static void encode_to(const Compact<std::monostate>&, O&) {}

    template <Input I>
    static core::Result<Compact<std::monostate>> decode(I&) {
        return Compact<std::monostate>{};
    }

    static constexpr std::optional<size_t> encoded_fixed_size() { return 0; }
    static constexpr size_t max_encoded_len() { return 0; }
};

template <CompactAsType T>
struct Codec<Compact<T>> {
    using As = typename CompactAs<T>::As;

    template <Output O>
    static void encode_to(const Compact<T>& c, O& out) {
        Codec<Compact<As>>::encode_to(
            Compact<As>(CompactAs<T>::encode_as(c.value)), out);
    }

    template <Input I>
    static core::Result<Compact<T>> decode(I& in) {
        auto inner = SCALE_TRY(Codec<Compact<As>>::decode(in));
        auto value = SCALE_TRY(CompactAs<T>::decode_from(std::move(inner.value)));
        return Compact<T>(std::move(value));
    }

    static size_t size_hint(const Compact<T>& c) {
        return codec::size_hint(Compact<As>(CompactAs<T>::encode_as(c.value)));
    }

    static constexpr size_t min_encoded_len() {
        return codec::min_encoded_len<Compact<As>>();
    }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<Compact<As>>
    {
        return Codec<Compact<As>>::max_encoded_len();
    }
};

}  // namespace scale::codec
