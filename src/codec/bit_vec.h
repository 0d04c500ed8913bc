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
#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace scale::codec {

// ===================================================================
// BitVec -- growable bit sequence packed into unsigned storage units
// ===================================================================
//
// Wire form: Compact<u32> bit count, then ceil(bits / unit_bits)
// storage units, each encoded as the fixed-width integer it is.
// Bit i lives in unit i / unit_bits; the order policy picks the bit
// position inside the unit.
//
// Padding bits past the declared length are not checked on decode.
// They are cleared when the vector is built, so a decoded vector
// always re-encodes with zero padding.
// ===================================================================

/// Bit 0 of each unit is its least significant bit.
struct Lsb0 {
    template <typename U>
    static constexpr U mask(size_t bit) noexcept {
        return static_cast<U>(U{1} << bit);
    }
};

/// Bit 0 of each unit is its most significant bit.
struct Msb0 {
    template <typename U>
    static constexpr U mask(size_t bit) noexcept {
        return static_cast<U>(U{1} << (sizeof(U) * 8 - 1 - bit));
    }
};

/// Largest bit count accepted on encode and decode.
inline constexpr uint32_t MAX_BITVEC_BITS = 0x1fffffff;

template <typename Store = uint8_t, typename Order = Lsb0>
class BitVec {
    static_assert(std::is_same_v<Store, uint8_t>  || std::is_same_v<Store, uint16_t> ||
                  std::is_same_v<Store, uint32_t> || std::is_same_v<Store, uint64_t>,
                  "BitVec storage must be an unsigned fixed-width integer");

public:
    using store_type = Store;
    using order_type = Order;

    static constexpr size_t UNIT_BITS = sizeof(Store) * 8;

    BitVec() = default;

    explicit BitVec(size_t bits, bool value = false)
        : units_(units_for(bits), value ? static_cast<Store>(~Store{0}) : Store{0}),
          bits_(bits) {
        clear_padding();
    }

    BitVec(std::initializer_list<bool> bits) {
        units_.reserve(units_for(bits.size()));
        for (bool b : bits) push_back(b);
    }

    /// Adopt raw storage units holding at least @p bits bits; anything
    /// past @p bits is dropped.
    static BitVec from_units(std::vector<Store> units, size_t bits) {
        if (units.size() < units_for(bits)) {
            throw std::invalid_argument("BitVec: " + std::to_string(units.size()) +
                                        " units cannot hold " +
                                        std::to_string(bits) + " bits");
        }
        BitVec v;
        v.units_ = std::move(units);
        v.units_.resize(units_for(bits));
        v.bits_ = bits;
        v.clear_padding();
        return v;
    }

    /// Storage units needed for @p bits bits.
    static constexpr size_t units_for(size_t bits) noexcept {
        return (bits + UNIT_BITS - 1) / UNIT_BITS;
    }

    [[nodiscard]] size_t size() const noexcept { return bits_; }
    [[nodiscard]] bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] const std::vector<Store>& units() const noexcept { return units_; }

    [[nodiscard]] bool get(size_t pos) const {
        check_index(pos);
        return (units_[pos / UNIT_BITS] & Order::template mask<Store>(pos % UNIT_BITS)) != 0;
    }

    [[nodiscard]] bool operator[](size_t pos) const { return get(pos); }

    void set(size_t pos, bool value) {
        check_index(pos);
        const Store m = Order::template mask<Store>(pos % UNIT_BITS);
        Store& unit = units_[pos / UNIT_BITS];
        unit = value ? static_cast<Store>(unit | m) : static_cast<Store>(unit & ~m);
    }

    void push_back(bool value) {
        if (bits_ % UNIT_BITS == 0) units_.push_back(0);
        ++bits_;
        set(bits_ - 1, value);
    }

    /// Shorten to @p bits; longer requests are ignored.
    void truncate(size_t bits) {
        if (bits >= bits_) return;
        bits_ = bits;
        units_.resize(units_for(bits));
        clear_padding();
    }

    [[nodiscard]] size_t count_ones() const noexcept {
        size_t n = 0;
        for (Store u : units_) n += static_cast<size_t>(std::popcount(u));
        return n;
    }

    bool operator==(const BitVec&) const = default;

private:
    void check_index(size_t pos) const {
        if (pos >= bits_) {
            throw std::out_of_range("BitVec index " + std::to_string(pos) +
                                    " out of range for length " +
                                    std::to_string(bits_));
        }
    }

    void clear_padding() noexcept {
        const size_t used = bits_ % UNIT_BITS;
        if (used == 0 || units_.empty()) return;
        Store keep = 0;
        for (size_t b = 0; b < used; ++b) keep |= Order::template mask<Store>(b);
        units_.back() &= keep;
    }

    std::vector<Store> units_;
    size_t             bits_ = 0;
};

template <typename Store, typename Order>
struct Codec<BitVec<Store, Order>> {
    using Bits = BitVec<Store, Order>;

    template <Output O>
    static void encode_to(const Bits& v, O& out) {
        if (v.size() > MAX_BITVEC_BITS) {
            throw std::length_error("BitVec: " + std::to_string(v.size()) +
                                    " bits exceed the encodable maximum");
        }
        encode_length(v.size(), out);
        if constexpr (is_wire_identical_v<Store>) {
            write_bytes(out, wire_bytes(std::span<const Store>(v.units())));
        } else {
            for (Store unit : v.units()) Codec<Store>::encode_to(unit, out);
        }
    }

    template <Input I>
    static core::Result<Bits> decode(I& in) {
        const uint32_t bits = SCALE_TRY(decode_length(in));
        if (bits > MAX_BITVEC_BITS) {
            LOG_DEBUG(core::LogCategory::DECODE,
                      "refusing bit vector of " + std::to_string(bits) + " bits");
            return core::make_error(core::ErrorCode::ALLOCATION_LIMIT,
                                    "Attempt to decode a bitvec with too many bits");
        }
        const size_t count = Bits::units_for(bits);
        std::vector<Store> units;
        if constexpr (is_wire_identical_v<Store>) {
            SCALE_TRY_VOID(read_wire_elements(in, units, count));
        } else {
            units.reserve(std::min<size_t>(count, MAX_PREALLOCATION / sizeof(Store)));
            for (size_t i = 0; i < count; ++i) {
                units.push_back(SCALE_TRY(Codec<Store>::decode(in)));
            }
        }
        return Bits::from_units(std::move(units), bits);
    }

    template <Input I>
    static core::Result<void> skip(I& in) {
        const uint32_t bits = SCALE_TRY(decode_length(in));
        if (bits > MAX_BITVEC_BITS) {
            return core::make_error(core::ErrorCode::ALLOCATION_LIMIT,
                                    "Attempt to decode a bitvec with too many bits");
        }
        return skip_bytes(in, Bits::units_for(bits) * sizeof(Store));
    }

    static size_t size_hint(const Bits& v) {
        return compact_len(static_cast<uint32_t>(v.size())) +
               v.units().size() * sizeof(Store);
    }

    static constexpr size_t min_encoded_len() { return 1; }
};

}  // namespace scale::codec
