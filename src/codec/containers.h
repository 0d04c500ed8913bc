#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/codec.h"
#include "codec/compact.h"
#include "codec/io.h"
#include "codec/primitives.h"
#include "codec/type_info.h"
#include "core/error.h"
#include "core/logging.h"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace scale::codec {

namespace detail {

// ---------------------------------------------------------------------------
// AscendGuard -- calls ascend_ref() when the nested decode is left
// ---------------------------------------------------------------------------
template <Input I>
class AscendGuard {
public:
    explicit AscendGuard(I& in) : in_(in) {}
    ~AscendGuard() { ascend_ref(in_); }

    AscendGuard(const AscendGuard&) = delete;
    AscendGuard& operator=(const AscendGuard&) = delete;

private:
    I& in_;
};

/// Fail fast when @p count elements of T cannot fit in what the input
/// has left.  Only the length prefix has been consumed at this point.
template <typename T, Input I>
core::Result<void> check_min_len(I& in, uint32_t count) {
    constexpr size_t MIN = codec::min_encoded_len<T>();
    if constexpr (MIN == 0) {
        return core::make_ok();
    } else {
        const auto remaining = remaining_len(in);
        if (remaining && count > *remaining / MIN) {
            LOG_DEBUG(core::LogCategory::DECODE,
                      "refusing " + std::to_string(count) +
                      " elements of at least " + std::to_string(MIN) +
                      " bytes with " + std::to_string(*remaining) +
                      " bytes left");
            return core::make_error(
                core::ErrorCode::NOT_ENOUGH_DATA,
                "Not enough data for required minimum length");
        }
        return core::make_ok();
    }
}

/// Elements worth reserving up front for a sequence of @p count T.
template <typename T>
constexpr size_t prealloc_capacity(uint32_t count) noexcept {
    constexpr size_t ELEM = sizeof(T) == 0 ? 1 : sizeof(T);
    return std::min<size_t>(count, MAX_PREALLOCATION / ELEM);
}

/// Decode @p count elements of T, handing each to @p sink.
template <typename T, Input I, typename Sink>
core::Result<void> decode_elements(I& in, uint32_t count, Sink&& sink) {
    SCALE_TRY_VOID(check_min_len<T>(in, count));
    SCALE_TRY_VOID(descend_ref(in));
    AscendGuard<I> guard(in);
    for (uint32_t i = 0; i < count; ++i) {
        auto item = SCALE_TRY(Codec<T>::decode(in));
        sink(std::move(item));
    }
    return core::make_ok();
}

template <typename T, Output O, typename Range>
void encode_elements(const Range& items, size_t len, O& out) {
    encode_length(len, out);
    for (const auto& item : items) {
        Codec<T>::encode_to(item, out);
    }
}

template <typename T, typename Range>
size_t sequence_size_hint(const Range& items, size_t len) {
    size_t total = compact_len(static_cast<uint32_t>(
        std::min<size_t>(len, std::numeric_limits<uint32_t>::max())));
    if constexpr (constexpr auto fixed = codec::encoded_fixed_size<T>(); fixed.has_value()) {
        total += len * *fixed;
    } else {
        for (const auto& item : items) total += codec::size_hint<T>(item);
    }
    return total;
}

/// Consume a length-prefixed sequence of T.
template <typename T, Input I>
core::Result<void> skip_sequence(I& in) {
    const uint32_t count = SCALE_TRY(decode_length(in));
    if constexpr (constexpr auto fixed = codec::encoded_fixed_size<T>(); fixed.has_value()) {
        return skip_bytes(in, static_cast<size_t>(count) * *fixed);
    } else {
        SCALE_TRY_VOID(check_min_len<T>(in, count));
        SCALE_TRY_VOID(descend_ref(in));
        AscendGuard<I> guard(in);
        for (uint32_t i = 0; i < count; ++i) {
            SCALE_TRY_VOID(codec::skip<T>(in));
        }
        return core::make_ok();
    }
}

/// Shared members of every length-prefixed container codec.
template <typename T>
struct SequenceCodecBase {
    template <Input I>
    static core::Result<void> skip(I& in) {
        return skip_sequence<T>(in);
    }

    static constexpr size_t min_encoded_len() { return 1; }
};

} // namespace detail

// ===================================================================
// Growable sequences: vector, deque, list
// ===================================================================

template <typename T, typename A>
struct Codec<std::vector<T, A>> : detail::SequenceCodecBase<T> {
    using Vec = std::vector<T, A>;

    template <Output O>
    static void encode_to(const Vec& v, O& out) {
        if constexpr (is_wire_identical_v<T>) {
            encode_length(v.size(), out);
            write_bytes(out, wire_bytes(std::span<const T>(v.data(), v.size())));
        } else {
            detail::encode_elements<T>(v, v.size(), out);
        }
    }

    template <Input I>
    static core::Result<Vec> decode(I& in) {
        const uint32_t count = SCALE_TRY(decode_length(in));
        Vec v;
        if constexpr (is_wire_identical_v<T>) {
            // Bulk copy: no nested decode, so no depth is spent.
            SCALE_TRY_VOID(read_wire_elements(in, v, count));
        } else {
            v.reserve(detail::prealloc_capacity<T>(count));
            SCALE_TRY_VOID(detail::decode_elements<T>(
                in, count, [&](T&& item) { v.push_back(std::move(item)); }));
        }
        return v;
    }

    static size_t size_hint(const Vec& v) {
        return detail::sequence_size_hint<T>(v, v.size());
    }
};

template <typename T, typename A>
struct Codec<std::deque<T, A>> : detail::SequenceCodecBase<T> {
    template <Output O>
    static void encode_to(const std::deque<T, A>& d, O& out) {
        detail::encode_elements<T>(d, d.size(), out);
    }

    template <Input I>
    static core::Result<std::deque<T, A>> decode(I& in) {
        const uint32_t count = SCALE_TRY(decode_length(in));
        std::deque<T, A> d;
        SCALE_TRY_VOID(detail::decode_elements<T>(
            in, count, [&](T&& item) { d.push_back(std::move(item)); }));
        return d;
    }

    static size_t size_hint(const std::deque<T, A>& d) {
        return detail::sequence_size_hint<T>(d, d.size());
    }
};

template <typename T, typename A>
struct Codec<std::list<T, A>> : detail::SequenceCodecBase<T> {
    template <Output O>
    static void encode_to(const std::list<T, A>& l, O& out) {
        detail::encode_elements<T>(l, l.size(), out);
    }

    template <Input I>
    static core::Result<std::list<T, A>> decode(I& in) {
        const uint32_t count = SCALE_TRY(decode_length(in));
        std::list<T, A> l;
        SCALE_TRY_VOID(detail::decode_elements<T>(
            in, count, [&](T&& item) { l.push_back(std::move(item)); }));
        return l;
    }

    static size_t size_hint(const std::list<T, A>& l) {
        return detail::sequence_size_hint<T>(l, l.size());
    }
};

/// Encode-only view over contiguous elements; encodes like a vector.
template <typename T>
struct Codec<std::span<const T>> {
    template <Output O>
    static void encode_to(std::span<const T> s, O& out) {
        if constexpr (is_wire_identical_v<T>) {
            encode_length(s.size(), out);
            write_bytes(out, wire_bytes(s));
        } else {
            detail::encode_elements<T>(s, s.size(), out);
        }
    }

    static size_t size_hint(std::span<const T> s) {
        return detail::sequence_size_hint<T>(s, s.size());
    }
};

// ===================================================================
// Ordered collections: set, map, priority_queue
// ===================================================================
//
// Encoded in iteration order.  Decoding inserts one element at a time;
// for maps a repeated key keeps the last value.  Heaps are written in
// pop order.

template <typename T, typename C, typename A>
struct Codec<std::set<T, C, A>> : detail::SequenceCodecBase<T> {
    template <Output O>
    static void encode_to(const std::set<T, C, A>& s, O& out) {
        detail::encode_elements<T>(s, s.size(), out);
    }

    template <Input I>
    static core::Result<std::set<T, C, A>> decode(I& in) {
        const uint32_t count = SCALE_TRY(decode_length(in));
        std::set<T, C, A> s;
        SCALE_TRY_VOID(detail::decode_elements<T>(
            in, count, [&](T&& item) { s.insert(std::move(item)); }));
        return s;
    }

    static size_t size_hint(const std::set<T, C, A>& s) {
        return detail::sequence_size_hint<T>(s, s.size());
    }
};

template <typename K, typename V, typename C, typename A>
struct Codec<std::map<K, V, C, A>>
    : detail::SequenceCodecBase<std::pair<K, V>> {
    using Map = std::map<K, V, C, A>;

    template <Output O>
    static void encode_to(const Map& m, O& out) {
        encode_length(m.size(), out);
        for (const auto& [k, v] : m) {
            Codec<K>::encode_to(k, out);
            Codec<V>::encode_to(v, out);
        }
    }

    template <Input I>
    static core::Result<Map> decode(I& in) {
        const uint32_t count = SCALE_TRY(decode_length(in));
        Map m;
        SCALE_TRY_VOID((detail::decode_elements<std::pair<K, V>>(
            in, count, [&](std::pair<K, V>&& kv) {
                m.insert_or_assign(std::move(kv.first), std::move(kv.second));
            })));
        return m;
    }

    static size_t size_hint(const Map& m) {
        size_t total = compact_len(static_cast<uint32_t>(m.size()));
        for (const auto& [k, v] : m) {
            total += codec::size_hint(k) + codec::size_hint(v);
        }
        return total;
    }
};

template <typename T, typename Container, typename Compare>
struct Codec<std::priority_queue<T, Container, Compare>>
    : detail::SequenceCodecBase<T> {
    using Heap = std::priority_queue<T, Container, Compare>;

    template <Output O>
    static void encode_to(const Heap& h, O& out) {
        encode_length(h.size(), out);
        Heap drain = h;
        while (!drain.empty()) {
            Codec<T>::encode_to(drain.top(), out);
            drain.pop();
        }
    }

    template <Input I>
    static core::Result<Heap> decode(I& in) {
        const uint32_t count = SCALE_TRY(decode_length(in));
        Heap h;
        SCALE_TRY_VOID(detail::decode_elements<T>(
            in, count, [&](T&& item) { h.push(std::move(item)); }));
        return h;
    }

    static size_t size_hint(const Heap& h) {
        return compact_len(static_cast<uint32_t>(h.size())) +
               h.size() * codec::encoded_fixed_size<T>().value_or(0);
    }
};

// ===================================================================
// Fixed-size arrays -- N elements, no length prefix
// ===================================================================

template <typename T, size_t N>
struct Codec<std::array<T, N>> {
    using Arr = std::array<T, N>;

    template <Output O>
    static void encode_to(const Arr& a, O& out) {
        if constexpr (is_wire_identical_v<T>) {
            write_bytes(out, wire_bytes(std::span<const T>(a.data(), N)));
        } else {
            for (const auto& item : a) Codec<T>::encode_to(item, out);
        }
    }

    template <Input I>
    static core::Result<Arr> decode(I& in) {
        if constexpr (is_wire_identical_v<T>) {
            Arr a{};
            SCALE_TRY_VOID(in.read(std::span<uint8_t>(
                reinterpret_cast<uint8_t*>(a.data()), N * sizeof(T))));
            return a;
        } else if constexpr (std::is_default_constructible_v<T>) {
            Arr a{};
            for (size_t i = 0; i < N; ++i) {
                a[i] = SCALE_TRY(Codec<T>::decode(in));
            }
            return a;
        } else {
            std::vector<T> staged;
            staged.reserve(N);
            for (size_t i = 0; i < N; ++i) {
                staged.push_back(SCALE_TRY(Codec<T>::decode(in)));
            }
            return from_staged(std::move(staged), std::make_index_sequence<N>{});
        }
    }

    template <Input I>
    static core::Result<void> skip(I& in) {
        if constexpr (constexpr auto fixed = codec::encoded_fixed_size<T>(); fixed.has_value()) {
            return skip_bytes(in, N * *fixed);
        } else {
            for (size_t i = 0; i < N; ++i) {
                SCALE_TRY_VOID(codec::skip<T>(in));
            }
            return core::make_ok();
        }
    }

    static size_t size_hint(const Arr& a) {
        if constexpr (constexpr auto fixed = codec::encoded_fixed_size<T>(); fixed.has_value()) {
            return N * *fixed;
        } else {
            size_t total = 0;
            for (const auto& item : a) total += codec::size_hint(item);
            return total;
        }
    }

    static constexpr std::optional<size_t> encoded_fixed_size() {
        constexpr auto inner = codec::encoded_fixed_size<T>();
        if (!inner) return std::nullopt;
        return N * *inner;
    }

    static constexpr size_t min_encoded_len() {
        return N * codec::min_encoded_len<T>();
    }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<T>
    {
        return N * Codec<T>::max_encoded_len();
    }

private:
    template <size_t... Is>
    static Arr from_staged(std::vector<T>&& staged, std::index_sequence<Is...>) {
        if (staged.size() != N) {
            throw std::logic_error("array decode produced " +
                                   std::to_string(staged.size()) +
                                   " elements, expected " + std::to_string(N));
        }
        return Arr{std::move(staged[Is])...};
    }
};

// ===================================================================
// optional<T> -- 0 = none, 1 = some followed by T
// ===================================================================

template <typename T>
struct Codec<std::optional<T>> {
    template <Output O>
    static void encode_to(const std::optional<T>& v, O& out) {
        if (v) {
            push_byte(out, 1);
            Codec<T>::encode_to(*v, out);
        } else {
            push_byte(out, 0);
        }
    }

    template <Input I>
    static core::Result<std::optional<T>> decode(I& in) {
        const uint8_t tag = SCALE_TRY(read_byte(in));
        switch (tag) {
        case 0:
            return std::optional<T>{};
        case 1: {
            auto value = SCALE_TRY(Codec<T>::decode(in));
            return std::optional<T>(std::move(value));
        }
        default:
            return core::make_error(core::ErrorCode::INVALID_DISCRIMINANT,
                                    "unexpected first byte decoding Option");
        }
    }

    template <Input I>
    static core::Result<void> skip(I& in) {
        const uint8_t tag = SCALE_TRY(read_byte(in));
        switch (tag) {
        case 0: return core::make_ok();
        case 1: return codec::skip<T>(in);
        default:
            return core::make_error(core::ErrorCode::INVALID_DISCRIMINANT,
                                    "unexpected first byte decoding Option");
        }
    }

    static size_t size_hint(const std::optional<T>& v) {
        return 1 + (v ? codec::size_hint(*v) : 0);
    }

    static constexpr size_t min_encoded_len() { return 1; }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<T>
    {
        return 1 + Codec<T>::max_encoded_len();
    }
};

// ===================================================================
// core::Result<T, E> -- 0 = ok followed by T, 1 = err followed by E
// ===================================================================

template <typename T, typename E>
    requires (!std::is_void_v<T>)
struct Codec<core::Result<T, E>> {
    using R = core::Result<T, E>;

    template <Output O>
    static void encode_to(const R& r, O& out) {
        if (r.ok()) {
            push_byte(out, 0);
            Codec<T>::encode_to(r.value(), out);
        } else {
            push_byte(out, 1);
            Codec<E>::encode_to(r.error(), out);
        }
    }

    template <Input I>
    static core::Result<R> decode(I& in) {
        const uint8_t tag = SCALE_TRY(read_byte(in));
        switch (tag) {
        case 0: {
            auto value = SCALE_TRY(Codec<T>::decode(in));
            return R(std::move(value));
        }
        case 1: {
            auto err = SCALE_TRY(Codec<E>::decode(in));
            return R(std::move(err));
        }
        default:
            return core::make_error(core::ErrorCode::INVALID_DISCRIMINANT,
                                    "unexpected first byte decoding Result");
        }
    }

    static size_t size_hint(const R& r) {
        return 1 + (r.ok() ? codec::size_hint(r.value())
                           : codec::size_hint(r.error()));
    }

    static constexpr size_t min_encoded_len() {
        return 1 + std::min(codec::min_encoded_len<T>(),
                            codec::min_encoded_len<E>());
    }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<T> && HasMaxEncodedLen<E>
    {
        return 1 + std::max(Codec<T>::max_encoded_len(),
                            Codec<E>::max_encoded_len());
    }
};

// ===================================================================
// variant<Ts...> -- alternative index byte, then the alternative
// ===================================================================

template <typename... Ts>
struct Codec<std::variant<Ts...>> {
    static_assert(sizeof...(Ts) <= 256,
                  "a tagged union has at most 256 alternatives");

    using V = std::variant<Ts...>;

    template <Output O>
    static void encode_to(const V& v, O& out) {
        if (v.valueless_by_exception()) {
            throw std::logic_error("cannot encode a valueless variant");
        }
        push_byte(out, static_cast<uint8_t>(v.index()));
        std::visit([&](const auto& alt) {
            Codec<std::decay_t<decltype(alt)>>::encode_to(alt, out);
        }, v);
    }

    template <Input I>
    static core::Result<V> decode(I& in) {
        const uint8_t index = SCALE_TRY(read_byte(in));
        if (index >= sizeof...(Ts)) {
            return core::make_error(core::ErrorCode::INVALID_DISCRIMINANT,
                                    "variant index " + std::to_string(index) +
                                    " does not exist");
        }
        return decode_alternative(in, index, std::index_sequence_for<Ts...>{});
    }

    static size_t size_hint(const V& v) {
        return 1 + std::visit([](const auto& alt) {
            return codec::size_hint(alt);
        }, v);
    }

    static constexpr size_t min_encoded_len() {
        return 1 + std::min({codec::min_encoded_len<Ts>()...});
    }

    static constexpr size_t max_encoded_len()
        requires (HasMaxEncodedLen<Ts> && ...)
    {
        return 1 + std::max({Codec<Ts>::max_encoded_len()...});
    }

private:
    template <size_t K, Input I>
    static core::Result<V> decode_at(I& in) {
        using Alt = std::variant_alternative_t<K, V>;
        auto value = SCALE_TRY(Codec<Alt>::decode(in));
        return V(std::in_place_index<K>, std::move(value));
    }

    template <Input I, size_t... Ks>
    static core::Result<V> decode_alternative(I& in, uint8_t index,
                                              std::index_sequence<Ks...>) {
        using Fn = core::Result<V> (*)(I&);
        static constexpr Fn table[] = {&decode_at<Ks, I>...};
        return table[index](in);
    }
};

// ===================================================================
// Tuples and pairs -- elements back to back, no prefix
// ===================================================================

namespace detail {

template <typename... Ts>
struct ProductCodec {
    template <Output O, typename Tuple>
    static void encode_all(const Tuple& t, O& out) {
        std::apply([&](const auto&... items) {
            (Codec<std::decay_t<decltype(items)>>::encode_to(items, out), ...);
        }, t);
    }

    template <typename Result, Input I>
    static core::Result<Result> decode_all(I& in) {
        return decode_parts<Result>(in, std::index_sequence_for<Ts...>{});
    }

    template <Input I>
    static core::Result<void> skip_all(I& in) {
        core::Result<void> r;
        static_cast<void>(((r = codec::skip<Ts>(in), r.ok()) && ...));
        return r;
    }

    template <typename Tuple>
    static size_t size_hint_all(const Tuple& t) {
        return std::apply([](const auto&... items) {
            return (size_t{0} + ... + codec::size_hint(items));
        }, t);
    }

    static constexpr std::optional<size_t> fixed_size() {
        if constexpr ((codec::encoded_fixed_size<Ts>().has_value() && ...)) {
            return (size_t{0} + ... + *codec::encoded_fixed_size<Ts>());
        } else {
            return std::nullopt;
        }
    }

    static constexpr size_t min_len() {
        return (size_t{0} + ... + codec::min_encoded_len<Ts>());
    }

private:
    template <typename Result, Input I, size_t... Is>
    static core::Result<Result> decode_parts(I& in, std::index_sequence<Is...>) {
        std::tuple<std::optional<Ts>...> parts;
        core::Error err;
        const bool ok = (decode_part<Is>(in, parts, err) && ...);
        if (!ok) return err;
        return Result(std::move(*std::get<Is>(parts))...);
    }

    template <size_t K, Input I, typename Parts>
    static bool decode_part(I& in, Parts& parts, core::Error& err) {
        using Elem = std::tuple_element_t<K, std::tuple<Ts...>>;
        auto r = Codec<Elem>::decode(in);
        if (!r.ok()) {
            err = std::move(r).error();
            return false;
        }
        std::get<K>(parts).emplace(std::move(r).value());
        return true;
    }
};

} // namespace detail

template <typename... Ts>
struct Codec<std::tuple<Ts...>> {
    using Tuple = std::tuple<Ts...>;
    using Impl = detail::ProductCodec<Ts...>;

    template <Output O>
    static void encode_to(const Tuple& t, O& out) { Impl::encode_all(t, out); }

    template <Input I>
    static core::Result<Tuple> decode(I& in) {
        return Impl::template decode_all<Tuple>(in);
    }

    template <Input I>
    static core::Result<void> skip(I& in) { return Impl::skip_all(in); }

    static size_t size_hint(const Tuple& t) { return Impl::size_hint_all(t); }

    static constexpr std::optional<size_t> encoded_fixed_size() {
        return Impl::fixed_size();
    }

    static constexpr size_t min_encoded_len() { return Impl::min_len(); }

    static constexpr size_t max_encoded_len()
        requires (HasMaxEncodedLen<Ts> && ...)
    {
        return (size_t{0} + ... + Codec<Ts>::max_encoded_len());
    }
};

template <typename A, typename B>
struct Codec<std::pair<A, B>> {
    using Pair = std::pair<A, B>;
    using Impl = detail::ProductCodec<A, B>;

    template <Output O>
    static void encode_to(const Pair& p, O& out) {
        Codec<A>::encode_to(p.first, out);
        Codec<B>::encode_to(p.second, out);
    }

    template <Input I>
    static core::Result<Pair> decode(I& in) {
        return Impl::template decode_all<Pair>(in);
    }

    template <Input I>
    static core::Result<void> skip(I& in) { return Impl::skip_all(in); }

    static size_t size_hint(const Pair& p) {
        return codec::size_hint(p.first) + codec::size_hint(p.second);
    }

    static constexpr std::optional<size_t> encoded_fixed_size() {
        return Impl::fixed_size();
    }

    static constexpr size_t min_encoded_len() { return Impl::min_len(); }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<A> && HasMaxEncodedLen<B>
    {
        return Codec<A>::max_encoded_len() + Codec<B>::max_encoded_len();
    }
};

}  // namespace scale::codec
