#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/codec.h"
#include "codec/containers.h"
#include "codec/io.h"
#include "core/error.h"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace scale::codec {

// ===================================================================
// Transparent wrappers
// ===================================================================
//
// Owning and shared pointers encode exactly like the value they point
// to.  Decoding one is a step of indirection, so it goes through
// descend_ref()/ascend_ref() and counts against a depth limit.
// A null pointer cannot be encoded.
// ===================================================================

namespace detail {

template <typename T, Input I>
core::Result<T> decode_indirect(I& in) {
    SCALE_TRY_VOID(descend_ref(in));
    AscendGuard<I> guard(in);
    return Codec<T>::decode(in);
}

inline void require_non_null(const void* p) {
    if (p == nullptr) {
        throw std::invalid_argument("cannot encode a null pointer");
    }
}

} // namespace detail

template <typename T>
struct Codec<std::unique_ptr<T>> {
    using Value = std::remove_const_t<T>;

    template <Output O>
    static void encode_to(const std::unique_ptr<T>& p, O& out) {
        detail::require_non_null(p.get());
        Codec<Value>::encode_to(*p, out);
    }

    template <Input I>
    static core::Result<std::unique_ptr<T>> decode(I& in) {
        auto value = SCALE_TRY(detail::decode_indirect<Value>(in));
        return std::unique_ptr<T>(new Value(std::move(value)));
    }

    template <Input I>
    static core::Result<void> skip(I& in) { return codec::skip<Value>(in); }

    static size_t size_hint(const std::unique_ptr<T>& p) {
        return p ? codec::size_hint(*p) : 0;
    }

    static constexpr std::optional<size_t> encoded_fixed_size() {
        return codec::encoded_fixed_size<Value>();
    }

    static constexpr size_t min_encoded_len() {
        return codec::min_encoded_len<Value>();
    }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<Value>
    {
        return Codec<Value>::max_encoded_len();
    }
};

template <typename T>
struct Codec<std::shared_ptr<T>> {
    using Value = std::remove_const_t<T>;

    template <Output O>
    static void encode_to(const std::shared_ptr<T>& p, O& out) {
        detail::require_non_null(p.get());
        Codec<Value>::encode_to(*p, out);
    }

    template <Input I>
    static core::Result<std::shared_ptr<T>> decode(I& in) {
        auto value = SCALE_TRY(detail::decode_indirect<Value>(in));
        return std::shared_ptr<T>(std::make_shared<Value>(std::move(value)));
    }

    template <Input I>
    static core::Result<void> skip(I& in) { return codec::skip<Value>(in); }

    static size_t size_hint(const std::shared_ptr<T>& p) {
        return p ? codec::size_hint(*p) : 0;
    }

    static constexpr std::optional<size_t> encoded_fixed_size() {
        return codec::encoded_fixed_size<Value>();
    }

    static constexpr size_t min_encoded_len() {
        return codec::min_encoded_len<Value>();
    }

    static constexpr size_t max_encoded_len()
        requires HasMaxEncodedLen<Value>
    {
        return Codec<Value>::max_encoded_len();
    }
};

/// Borrowed references encode like their target; there is nothing to
/// decode into.
template <typename T>
struct Codec<std::reference_wrapper<T>> {
    using Value = std::remove_const_t<T>;

    template <Output O>
    static void encode_to(const std::reference_wrapper<T>& r, O& out) {
        Codec<Value>::encode_to(r.get(), out);
    }

    static size_t size_hint(const std::reference_wrapper<T>& r) {
        return codec::size_hint(static_cast<const Value&>(r.get()));
    }
};

}  // namespace scale::codec
