// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the bit-vector codec.

#include "test_framework.h"
#include "test_util.h"

#include "codec/scale.h"

#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace scale;
using codec::BitVec;
using codec::Lsb0;
using codec::Msb0;

// ============================================================================
// Container behaviour
// ============================================================================

TEST_CASE(BitVec, push_get_set) {
    BitVec<> v;
    CHECK(v.empty());
    for (int i = 0; i < 10; ++i) v.push_back(i % 3 == 0);
    CHECK_EQ(v.size(), 10u);
    CHECK_EQ(v.units().size(), 2u);
    CHECK(v[0]);
    CHECK(!v[1]);
    CHECK(v[9]);
    CHECK_EQ(v.count_ones(), 4u);

    v.set(1, true);
    CHECK(v.get(1));
    CHECK_THROWS(v.get(10), std::out_of_range);
    CHECK_THROWS(v.set(10, true), std::out_of_range);
}

TEST_CASE(BitVec, truncate_clears_dropped_bits) {
    BitVec<> v(12, true);
    CHECK_EQ(v.count_ones(), 12u);
    v.truncate(3);
    CHECK_EQ(v.size(), 3u);
    CHECK_EQ(v.units().size(), 1u);
    CHECK_EQ(v.units()[0], 0x07);
    v.truncate(50);
    CHECK_EQ(v.size(), 3u);
}

TEST_CASE(BitVec, from_units) {
    auto v = BitVec<uint8_t>::from_units({0xff, 0xff}, 9);
    CHECK_EQ(v.size(), 9u);
    CHECK_EQ(v.units()[1], 0x01);
    CHECK_THROWS(BitVec<uint8_t>::from_units({0xff}, 9), std::invalid_argument);
}

// ============================================================================
// Wire form
// ============================================================================

TEST_CASE(BitVec, lsb0_and_msb0_layout) {
    const BitVec<uint8_t, Lsb0> lsb = {true, false, true, true};
    CHECK_EQ(test::hex(codec::encode(lsb)), "10 0d");

    const BitVec<uint8_t, Msb0> msb = {true, false, true, true};
    CHECK_EQ(test::hex(codec::encode(msb)), "10 b0");

    auto back = codec::decode_all<BitVec<uint8_t, Msb0>>(test::bytes("10 b0"));
    CHECK_OK(back);
    CHECK(back.value() == msb);
}

TEST_CASE(BitVec, wide_storage_units) {
    const BitVec<uint16_t> v(10, true);
    CHECK_EQ(test::hex(codec::encode(v)), "28 ff 03");
    CHECK_EQ(codec::size_hint(v), 3u);

    const BitVec<uint32_t, Msb0> w = {true};
    CHECK_EQ(test::hex(codec::encode(w)), "04 00 00 00 80");
    CHECK((codec::decode_all<BitVec<uint32_t, Msb0>>(codec::encode(w)).value() == w));
}

TEST_CASE(BitVec, empty) {
    CHECK_EQ(test::hex(codec::encode(BitVec<>{})), "00");
    auto back = codec::decode_all<BitVec<uint64_t>>(test::bytes("00"));
    CHECK_OK(back);
    CHECK(back.value().empty());
}

TEST_CASE(BitVec, padding_bits_are_not_validated) {
    // Four bits declared, all eight set on the wire.
    auto v = codec::decode_all<BitVec<>>(test::bytes("10 ff"));
    CHECK_OK(v);
    CHECK_EQ(v.value().size(), 4u);
    CHECK_EQ(v.value().count_ones(), 4u);
    CHECK_EQ(test::hex(codec::encode(v.value())), "10 0f");
}

TEST_CASE(BitVec, too_many_bits) {
    test::LogCapture capture(core::LogLevel::DEBUG, core::LogCategory::DECODE);
    auto r = codec::decode<BitVec<>>(test::bytes("02 00 00 80"));
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::ALLOCATION_LIMIT);
    CHECK_EQ(r.error().message(), "Attempt to decode a bitvec with too many bits");
    CHECK(capture.contains("refusing bit vector of 536870912 bits"));

    const auto data = test::bytes("02 00 00 80");
    codec::SliceInput in(data);
    CHECK_ERR(codec::skip<BitVec<>>(in));
}

TEST_CASE(BitVec, encode_refuses_what_decode_rejects) {
    const BitVec<uint64_t> too_long(size_t{codec::MAX_BITVEC_BITS} + 1);
    CHECK_THROWS(codec::encode(too_long), std::length_error);

    std::vector<uint8_t> out;
    CHECK_THROWS(codec::encode_to(too_long, out), std::length_error);
    CHECK(out.empty());
}

TEST_CASE(BitVec, truncated_storage) {
    CHECK_ERR(codec::decode<BitVec<>>(test::bytes("20")));
    CHECK_ERR(codec::decode<BitVec<uint16_t>>(test::bytes("24 ff")));
}

TEST_CASE(BitVec, skip_consumes_storage) {
    const auto data = test::bytes("24 ff 01 aa");
    codec::SliceInput in(data);
    CHECK_OK(codec::skip<BitVec<>>(in));
    CHECK_EQ(in.remaining(), 1u);
}

TEST_CASE(BitVec, inside_other_containers) {
    std::vector<BitVec<>> many;
    many.push_back(BitVec<>{true});
    many.push_back(BitVec<>{});
    CHECK_EQ(test::hex(codec::encode(many)), "08 04 01 00");
    CHECK(codec::decode_all<std::vector<BitVec<>>>(test::bytes("08 04 01 00")).value() == many);
}
