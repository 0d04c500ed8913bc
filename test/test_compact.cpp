// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the compact integer codec.

#include "test_framework.h"
#include "test_util.h"

#include "codec/scale.h"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace scale;
using codec::Compact;
using codec::uint128;

namespace {

template <typename U>
std::string compact_hex(U v) {
    return test::hex(codec::encode(Compact<U>(v)));
}

template <typename U>
core::Result<U> decode_compact_hex(std::string_view dump) {
    return codec::decode_all<Compact<U>>(test::bytes(dump))
        .map([](const Compact<U>& c) { return c.value; });
}

struct BlockNumber {
    uint64_t n = 0;
    bool operator==(const BlockNumber&) const = default;
};

struct Even {
    uint32_t v = 0;
    bool operator==(const Even&) const = default;
};

} // namespace

namespace scale::codec {

template <>
struct CompactAs<BlockNumber> {
    using As = uint64_t;
    static As encode_as(const BlockNumber& b) { return b.n; }
    static core::Result<BlockNumber> decode_from(As v) { return BlockNumber{v}; }
};

template <>
struct CompactAs<Even> {
    using As = uint32_t;
    static As encode_as(const Even& e) { return e.v; }
    static core::Result<Even> decode_from(As v) {
        if (v % 2 != 0) {
            return core::make_error(core::ErrorCode::INVALID_VALUE, "odd value");
        }
        return Even{v};
    }
};

} // namespace scale::codec

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE(Compact, mode_boundaries_u64) {
    const std::vector<std::pair<uint64_t, std::string>> cases = {
        {0, "00"},
        {63, "fc"},
        {64, "01 01"},
        {16383, "fd ff"},
        {16384, "02 00 01 00"},
        {1073741823, "fe ff ff ff"},
        {1073741824, "03 00 00 00 40"},
        {(uint64_t{1} << 32) - 1, "03 ff ff ff ff"},
        {uint64_t{1} << 32, "07 00 00 00 00 01"},
        {uint64_t{1} << 40, "0b 00 00 00 00 00 01"},
        {uint64_t{1} << 48, "0f 00 00 00 00 00 00 01"},
        {(uint64_t{1} << 56) - 1, "0f ff ff ff ff ff ff ff"},
        {uint64_t{1} << 56, "13 00 00 00 00 00 00 00 01"},
        {std::numeric_limits<uint64_t>::max(), "13 ff ff ff ff ff ff ff ff"},
    };
    for (const auto& [value, expected] : cases) {
        CHECK_EQ(compact_hex<uint64_t>(value), expected);
        const auto encoded = test::bytes(expected);
        CHECK_EQ(codec::compact_len(value), encoded.size());
        CHECK_EQ(codec::encoded_size(Compact<uint64_t>(value)), encoded.size());
        auto back = decode_compact_hex<uint64_t>(expected);
        CHECK_OK(back);
        CHECK(back.value() == value);
    }
}

TEST_CASE(Compact, narrow_widths) {
    CHECK_EQ(compact_hex<uint8_t>(255), "fd 03");
    CHECK_EQ(compact_hex<uint16_t>(65535), "fe ff 03 00");
    CHECK_EQ(compact_hex<uint32_t>(std::numeric_limits<uint32_t>::max()), "03 ff ff ff ff");
}

TEST_CASE(Compact, u128_max) {
    const uint128 max = codec::max_of<uint128>();
    const auto encoded = codec::encode(Compact<uint128>(max));
    CHECK_EQ(encoded.size(), 17u);
    CHECK_EQ(encoded[0], 0x33);
    auto back = codec::decode_all<Compact<uint128>>(encoded);
    CHECK_OK(back);
    CHECK(back.value().value == max);
    CHECK_EQ(codec::to_string(max), "340282366920938463463374607431768211455");
}

TEST_CASE(Compact, max_encoded_len_per_width) {
    CHECK_EQ(codec::max_encoded_len<Compact<uint8_t>>(), 2u);
    CHECK_EQ(codec::max_encoded_len<Compact<uint16_t>>(), 4u);
    CHECK_EQ(codec::max_encoded_len<Compact<uint32_t>>(), 5u);
    CHECK_EQ(codec::max_encoded_len<Compact<uint64_t>>(), 9u);
    CHECK_EQ(codec::max_encoded_len<Compact<uint128>>(), 17u);
}

TEST_CASE(Compact, using_encoded_matches_encode) {
    const Compact<uint32_t> c(1u << 20);
    const auto direct = codec::encode(c);
    const bool same = codec::using_encoded(c, [&](std::span<const uint8_t> bytes) {
        return std::vector<uint8_t>(bytes.begin(), bytes.end()) == direct;
    });
    CHECK(same);
}

// ============================================================================
// Decoding: minimality and range
// ============================================================================

TEST_CASE(Compact, rejects_non_minimal_forms) {
    // 63 in two-byte mode, 16383 in four-byte mode.
    CHECK_ERR(decode_compact_hex<uint32_t>("fd 00"));
    CHECK_ERR(decode_compact_hex<uint32_t>("fe ff 00 00"));
    // 2^30 - 1 in mode 11 with four bytes.
    CHECK_ERR(decode_compact_hex<uint32_t>("03 ff ff ff 3f"));
    // 2^32 - 1 written with five bytes (top byte zero).
    CHECK_ERR(decode_compact_hex<uint64_t>("07 ff ff ff ff 00"));

    auto r = decode_compact_hex<uint64_t>("02 00 00 00");
    CHECK_ERR(r);
    CHECK_EQ(r.error().message(), "out of range decoding Compact<u64>");
}

TEST_CASE(Compact, smallest_value_of_each_mode_decodes) {
    CHECK_EQ(decode_compact_hex<uint32_t>("01 01").value(), 64u);
    CHECK_EQ(decode_compact_hex<uint32_t>("02 00 01 00").value(), 16384u);
    CHECK_EQ(decode_compact_hex<uint32_t>("03 00 00 00 40").value(), 1073741824u);
}

TEST_CASE(Compact, width_mismatch) {
    // 256 does not fit a u8.
    auto r8 = decode_compact_hex<uint8_t>("01 04");
    CHECK_ERR(r8);
    CHECK_EQ(r8.error().message(), "out of range decoding Compact<u8>");

    // 65536 does not fit a u16.
    CHECK_ERR(decode_compact_hex<uint16_t>("02 00 04 00"));

    // Mode 11 can never hold a u8 or u16.
    auto r16 = decode_compact_hex<uint16_t>("03 00 00 00 40");
    CHECK_ERR(r16);
    CHECK_EQ(r16.error().message(), "unexpected prefix decoding Compact<u16>");

    // Eight value bytes are too many for a u32.
    auto r32 = decode_compact_hex<uint32_t>("13 00 00 00 00 00 00 00 01");
    CHECK_ERR(r32);
    CHECK_EQ(r32.error().message(), "unexpected prefix decoding Compact<u32>");

    CHECK_OK(decode_compact_hex<uint64_t>("13 00 00 00 00 00 00 00 01"));
}

TEST_CASE(Compact, truncated_input) {
    CHECK_ERR(decode_compact_hex<uint32_t>(""));
    CHECK_ERR(decode_compact_hex<uint32_t>("01"));
    CHECK_ERR(decode_compact_hex<uint32_t>("02 00 01"));
    CHECK_ERR(decode_compact_hex<uint64_t>("07 00 00 00 00"));
}

TEST_CASE(Compact, skip_consumes_whole_field) {
    const auto data = test::bytes("07 00 00 00 00 01 fc");
    codec::SliceInput in(data);
    CHECK_OK(codec::skip<Compact<uint64_t>>(in));
    CHECK_EQ(in.remaining(), 1u);
    CHECK_OK(codec::skip<Compact<uint8_t>>(in));
    CHECK_EQ(in.remaining(), 0u);
}

// ============================================================================
// Length prefixes
// ============================================================================

TEST_CASE(Compact, length_prefix) {
    std::vector<uint8_t> out;
    codec::encode_length(1000, out);
    CHECK_EQ(test::hex(out), "a1 0f");

    codec::SliceInput in(out);
    CHECK_EQ(codec::decode_length(in).value(), 1000u);

    codec::SizeCounter counter;
    CHECK_THROWS(codec::encode_length(size_t{1} << 33, counter), std::length_error);
}

// ============================================================================
// CompactAs and unit
// ============================================================================

TEST_CASE(Compact, compact_as_delegates_to_inner_field) {
    const Compact<BlockNumber> block(BlockNumber{1u << 20});
    CHECK_EQ(test::hex(codec::encode(block)),
             test::hex(codec::encode(Compact<uint64_t>(1u << 20))));

    auto back = codec::decode_all<Compact<BlockNumber>>(codec::encode(block));
    CHECK_OK(back);
    CHECK(back.value().value == BlockNumber{1u << 20});
    CHECK_EQ(codec::max_encoded_len<Compact<BlockNumber>>(), 9u);
}

TEST_CASE(Compact, compact_as_decode_failure_propagates) {
    CHECK_OK(codec::decode_all<Compact<Even>>(codec::encode(Compact<uint32_t>(4))));
    auto odd = codec::decode_all<Compact<Even>>(codec::encode(Compact<uint32_t>(5)));
    CHECK_ERR(odd);
    CHECK_EQ(odd.error().message(), "odd value");
}

TEST_CASE(Compact, unit_is_empty) {
    CHECK(codec::encode(Compact<std::monostate>{}).empty());
    CHECK_EQ(codec::encoded_fixed_size<Compact<std::monostate>>(), std::optional<size_t>(0));
    CHECK(codec::HasCompact<uint32_t>);
    CHECK(codec::HasCompact<BlockNumber>);
    CHECK(!codec::HasCompact<int32_t>);
}
