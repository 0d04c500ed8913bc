#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/codec.h"
#include "codec/compact.h"
#include "codec/int128.h"
#include "codec/io.h"
#include "codec/type_info.h"
#include "core/error.h"
#include "core/utf8.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace scale::codec {

// ===================================================================
// Fixed-width integers -- little-endian, sizeof(T) bytes
// ===================================================================

template <FixedWidthInt T>
struct Codec<T> {
    using U = unsigned_of_t<T>;

    template <Output O>
    static void encode_to(T v, O& out) {
        uint8_t buf[sizeof(T)];
        const U u = static_cast<U>(v);
        for (size_t i = 0; i < sizeof(T); ++i) {
            buf[i] = static_cast<uint8_t>(u >> (8 * i));
        }
        write_bytes(out, std::span<const uint8_t>(buf, sizeof(T)));
    }

    template <Input I>
    static core::Result<T> decode(I& in) {
        uint8_t buf[sizeof(T)];
        SCALE_TRY_VOID(in.read(std::span<uint8_t>(buf, sizeof(T))));
        U u = 0;
        for (size_t i = sizeof(T); i-- > 0;) {
            u = static_cast<U>(static_cast<U>(u << 7 << 1) | buf[i]);
        }
        return static_cast<T>(u);
    }

    template <typename F>
    static auto using_encoded(T v, F&& f) {
        StackWriter<sizeof(T)> w;
        encode_to(v, w);
        return std::forward<F>(f)(w.bytes());
    }

    static size_t size_hint(T) { return sizeof(T); }
    static constexpr std::optional<size_t> encoded_fixed_size() { return sizeof(T); }
    static constexpr size_t max_encoded_len() { return sizeof(T); }
};

// ===================================================================
// bool -- one byte, 0 or 1
// ===================================================================

template <>
struct Codec<bool> {
    template <Output O>
    static void encode_to(bool v, O& out) {
        push_byte(out, v ? 1 : 0);
    }

    template <Input I>
    static core::Result<bool> decode(I& in) {
        const uint8_t b = SCALE_TRY(read_byte(in));
        switch (b) {
        case 0: return false;
        case 1: return true;
        default:
            return core::make_error(core::ErrorCode::INVALID_VALUE,
                                    "Invalid boolean representation");
        }
    }

    static size_t size_hint(bool) { return 1; }
    static constexpr std::optional<size_t> encoded_fixed_size() { return 1; }
    static constexpr size_t max_encoded_len() { return 1; }
};

// ===================================================================
// Zero-sized values: unit and PhantomData<T>
// ===================================================================

/// Marker carrying a type but no data.  Encodes to nothing.
template <typename T>
struct PhantomData {
    bool operator==(const PhantomData&) const = default;
};

template <>
struct Codec<std::monostate> {
    template <Output O>
    static void encode_to(const std::monostate&, O&) {}

    template <Input I>
    static core::Result<std::monostate> decode(I&) {
        return std::monostate{};
    }

    static constexpr std::optional<size_t> encoded_fixed_size() { return 0; }
    static constexpr size_t max_encoded_len() { return 0; }
};

template <typename T>
struct Codec<PhantomData<T>> {
    template <Output O>
    static void encode_to(const PhantomData<T>&, O&) {}

    template <Input I>
    static core::Result<PhantomData<T>> decode(I&) {
        return PhantomData<T>{};
    }

    static constexpr std::optional<size_t> encoded_fixed_size() { return 0; }
    static constexpr size_t max_encoded_len() { return 0; }
};

// ===================================================================
// OptionBool -- optional<bool> folded into one byte
// ===================================================================
//   0 = none, 1 = true, 2 = false

struct OptionBool {
    std::optional<bool> value;

    bool operator==(const OptionBool&) const = default;
};

template <>
struct Codec<OptionBool> {
    template <Output O>
    static void encode_to(const OptionBool& v, O& out) {
        push_byte(out, !v.value ? 0 : (*v.value ? 1 : 2));
    }

    template <Input I>
    static core::Result<OptionBool> decode(I& in) {
        const uint8_t b = SCALE_TRY(read_byte(in));
        switch (b) {
        case 0: return OptionBool{std::nullopt};
        case 1: return OptionBool{true};
        case 2: return OptionBool{false};
        default:
            return core::make_error(core::ErrorCode::INVALID_DISCRIMINANT,
                                    "unexpected first byte decoding OptionBool");
        }
    }

    static size_t size_hint(const OptionBool&) { return 1; }
    static constexpr std::optional<size_t> encoded_fixed_size() { return 1; }
    static constexpr size_t max_encoded_len() { return 1; }
};

// ===================================================================
// NonZero<T> -- an integer that is never zero
// ===================================================================

template <FixedWidthInt T>
class NonZero {
public:
    [[nodiscard]] static std::optional<NonZero> create(T v) noexcept {
        if (v == 0) return std::nullopt;
        return NonZero(v);
    }

    [[nodiscard]] T get() const noexcept { return value_; }

    bool operator==(const NonZero&) const = default;

private:
    explicit NonZero(T v) noexcept : value_(v) {}

    T value_;
};

template <FixedWidthInt T>
struct Codec<NonZero<T>> {
    template <Output O>
    static void encode_to(const NonZero<T>& v, O& out) {
        Codec<T>::encode_to(v.get(), out);
    }

    template <Input I>
    static core::Result<NonZero<T>> decode(I& in) {
        const T raw = SCALE_TRY(Codec<T>::decode(in));
        auto nz = NonZero<T>::create(raw);
        if (!nz) {
            return core::make_error(core::ErrorCode::INVALID_VALUE,
                                    "cannot create non-zero number from 0");
        }
        return *nz;
    }

    static size_t size_hint(const NonZero<T>&) { return sizeof(T); }
    static constexpr std::optional<size_t> encoded_fixed_size() { return sizeof(T); }
    static constexpr size_t max_encoded_len() { return sizeof(T); }
};

// ===================================================================
// Strings -- Compact<u32> byte length, then UTF-8 bytes
// ===================================================================

template <>
struct Codec<std::string_view> {
    template <Output O>
    static void encode_to(std::string_view s, O& out) {
        encode_length(s.size(), out);
        write_bytes(out, std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(s.data()), s.size()));
    }

    static size_t size_hint(std::string_view s) {
        return compact_len(static_cast<uint32_t>(s.size())) + s.size();
    }
};

template <>
struct Codec<std::string> {
    template <Output O>
    static void encode_to(const std::string& s, O& out) {
        Codec<std::string_view>::encode_to(s, out);
    }

    template <Input I>
    static core::Result<std::string> decode(I& in) {
        const uint32_t len = SCALE_TRY(decode_length(in));
        std::string s;
        SCALE_TRY_VOID(read_wire_elements(in, s, len));
        if (auto bad = core::utf8_first_invalid(std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(s.data()), s.size()))) {
            return core::make_error(core::ErrorCode::INVALID_VALUE,
                                    "Invalid utf8 sequence at byte " +
                                    std::to_string(*bad));
        }
        return s;
    }

    template <Input I>
    static core::Result<void> skip(I& in) {
        const uint32_t len = SCALE_TRY(decode_length(in));
        return skip_bytes(in, len);
    }

    static size_t size_hint(const std::string& s) {
        return Codec<std::string_view>::size_hint(s);
    }

    static constexpr size_t min_encoded_len() { return 1; }
};

// ===================================================================
// Duration -- (u64 seconds, u32 nanoseconds), nanoseconds < 10^9
// ===================================================================

struct Duration {
    uint64_t secs  = 0;
    uint32_t nanos = 0;

    static constexpr uint32_t NANOS_PER_SEC = 1'000'000'000;

    /// A negative duration is a programming error.
    static Duration from_chrono(std::chrono::nanoseconds d) {
        if (d.count() < 0) {
            throw std::invalid_argument("Duration: negative value");
        }
        const auto n = static_cast<uint64_t>(d.count());
        return Duration{n / NANOS_PER_SEC, static_cast<uint32_t>(n % NANOS_PER_SEC)};
    }

    bool operator==(const Duration&) const = default;
};

template <>
struct Codec<Duration> {
    template <Output O>
    static void encode_to(const Duration& d, O& out) {
        Codec<uint64_t>::encode_to(d.secs, out);
        Codec<uint32_t>::encode_to(d.nanos, out);
    }

    template <Input I>
    static core::Result<Duration> decode(I& in) {
        const uint64_t secs = SCALE_TRY(Codec<uint64_t>::decode(in));
        const uint32_t nanos = SCALE_TRY(Codec<uint32_t>::decode(in));
        if (nanos >= Duration::NANOS_PER_SEC) {
            return core::make_error(
                core::ErrorCode::INVALID_VALUE,
                "Number of nanoseconds should not be higher than 10^9.");
        }
        return Duration{secs, nanos};
    }

    static size_t size_hint(const Duration&) { return 12; }
    static constexpr std::optional<size_t> encoded_fixed_size() { return 12; }
    static constexpr size_t max_encoded_len() { return 12; }
};

// ===================================================================
// Ranges -- encoded as the (start, end) pair
// ===================================================================

template <typename T>
struct Range {
    T start{};
    T end{};

    bool operator==(const Range&) const = default;
};

template <typename T>
struct RangeInclusive {
    T start{};
    T end{};

    bool operator==(const RangeInclusive&) const = default;
};

namespace detail {

template <typename R, typename T>
struct RangeCodec {
    template <Output O>
    static void encode_to(const R& r, O& out) {
        Codec<T>::encode_to(r.start, out);
        Codec<T>::encode_to(r.end, out);
    }

    template <Input I>
    static core::Result<R> decode(I& in) {
        auto start = SCALE_TRY(Codec<T>::decode(in));
        auto end = SCALE_TRY(Codec<T>::decode(in));
        return R{std::move(start), std::move(end)};
    }

    static size_t size_hint(const R& r) {
        return codec::size_hint(r.start) + codec::size_hint(r.end);
    }

    static constexpr std::optional<size_t> encoded_fixed_size() {
        constexpr auto inner = codec::encoded_fixed_size<T>();
        if (!inner) return std::nullopt;
        return 2 * *inner;
    }

    static constexpr size_t min_encoded_len() {
        return 2 * codec::min_encoded_len<T>();
    }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<T>
    {
        return 2 * Codec<T>::max_encoded_len();
    }
};

} // namespace detail

template <typename T>
struct Codec<Range<T>> : detail::RangeCodec<Range<T>, T> {};

template <typename T>
struct Codec<RangeInclusive<T>> : detail::RangeCodec<RangeInclusive<T>, T> {};

// ===================================================================
// Enumerations -- one discriminant byte
// ===================================================================
//
// A scoped enum becomes encodable by listing its legal values:
//
//   enum class Color : uint8_t { RED = 1, GREEN = 2 };
//   template <> struct EnumTraits<Color> {
//       static constexpr std::array values{Color::RED, Color::GREEN};
//   };
//
// The discriminant byte is the enumerator's underlying value, which must
// lie in 0..255.
// ===================================================================

template <typename E>
struct EnumTraits;

template <typename E>
concept ScaleEnum = std::is_enum_v<E> && requires {
    { EnumTraits<E>::values.size() } -> std::convertible_to<size_t>;
};

namespace detail {

template <typename E>
constexpr bool enum_fits_in_byte() {
    for (E e : EnumTraits<E>::values) {
        const auto raw = static_cast<std::underlying_type_t<E>>(e);
        if (raw < 0 || raw > 255) return false;
    }
    return EnumTraits<E>::values.size() <= 256;
}

} // namespace detail

template <ScaleEnum E>
struct Codec<E> {
    static_assert(detail::enum_fits_in_byte<E>(),
                  "enum discriminants must fit in a single byte");

    template <Output O>
    static void encode_to(E e, O& out) {
        push_byte(out, static_cast<uint8_t>(e));
    }

    template <Input I>
    static core::Result<E> decode(I& in) {
        const uint8_t b = SCALE_TRY(read_byte(in));
        for (E e : EnumTraits<E>::values) {
            if (static_cast<uint8_t>(e) == b) return e;
        }
        return core::make_error(core::ErrorCode::INVALID_DISCRIMINANT,
                                "invalid enum discriminant " +
                                std::to_string(b));
    }

    static size_t size_hint(E) { return 1; }
    static constexpr std::optional<size_t> encoded_fixed_size() { return 1; }
    static constexpr size_t max_encoded_len() { return 1; }
};

}  // namespace scale::codec
