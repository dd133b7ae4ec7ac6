// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmaccount/hash_utils.hpp>
#include <evmaccount/rlp.hpp>
#include <gtest/gtest.h>
#include <test/utils/utils.hpp>
#include <sstream>

using namespace evmaccount;
using namespace evmaccount::test;
using namespace intx;

TEST(rlp, empty_bytes_hash)
{
    EXPECT_EQ(keccak256({}), EMPTY_CODE_HASH);
}

TEST(rlp, empty_mpt_hash)
{
    const auto rlp_null = rlp::encode(uint64_t{0});
    EXPECT_EQ(rlp_null, bytes{0x80});
    EXPECT_EQ(keccak256(rlp_null), EMPTY_MPT_HASH);
}

TEST(rlp, encode_string_short)
{
    EXPECT_EQ(rlp::encode("01"_hex), "01"_hex);
    EXPECT_EQ(rlp::encode("7f"_hex), "7f"_hex);
    EXPECT_EQ(rlp::encode("80"_hex), "8180"_hex);
    EXPECT_EQ(rlp::encode(bytes_view{}), "80"_hex);
    EXPECT_EQ(rlp::encode("dog"_b), "83646f67"_hex);
}

TEST(rlp, encode_string_long)
{
    const bytes b(56, 0xaa);
    const auto r = rlp::encode(b);
    EXPECT_EQ(r.size(), 56 + 2);
    EXPECT_EQ(hex({r.data(), 3}), "b838aa");

    const bytes b2(0x0100, 0x00);
    const auto r2 = rlp::encode(b2);
    EXPECT_EQ(r2.size(), 0x0100 + 3);
    EXPECT_EQ(hex({r2.data(), 4}), "b9010000");
}

TEST(rlp, encode_uint64)
{
    EXPECT_EQ(rlp::encode(uint64_t{0}), "80"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{1}), "01"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0x7f}), "7f"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0x80}), "8180"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0xff}), "81ff"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0x0100}), "820100"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0xffffff}), "83ffffff"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0x0100000000000000}), "880100000000000000"_hex);
    EXPECT_EQ(rlp::encode(uint64_t{0xffffffffffffffff}), "88ffffffffffffffff"_hex);
}

TEST(rlp, encode_uint256)
{
    EXPECT_EQ(rlp::encode(0_u256), "80"_hex);
    EXPECT_EQ(rlp::encode(1000000000000000000_u256), "880de0b6b3a7640000"_hex);
}

TEST(rlp, encode_vector)
{
    const std::vector<uint64_t> v{1, 2, 3};
    EXPECT_EQ(hex(rlp::encode(v)), "c3010203");
    EXPECT_EQ(rlp::encode(std::vector<uint64_t>{}), "c0"_hex);
}

TEST(rlp, encode_account_tuple)
{
    const auto expected =
        "f8 44"
        "80"
        "01"
        "a0 56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421"
        "a0 c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"_hex;

    const auto r = rlp::encode_tuple(uint64_t{0}, 1_u256, EMPTY_MPT_HASH, EMPTY_CODE_HASH);
    EXPECT_EQ(r, expected);
}

TEST(rlp, trim)
{
    const auto value = 0x00000000000000000000000000000000000000000000000000000000000001ff_bytes32;
    EXPECT_EQ(rlp::encode(rlp::trim(value)), "8201ff"_hex);
    EXPECT_EQ(rlp::trim("000000"_hex), bytes_view{});
    EXPECT_EQ(rlp::trim("0100"_hex), "0100"_hex);
}

TEST(rlp, load)
{
    EXPECT_EQ(rlp::load<uint64_t>("0102"_hex), 0x0102u);
    EXPECT_EQ(rlp::load<uint64_t>({}), 0u);
    EXPECT_EQ(rlp::load<uint256>("0de0b6b3a7640000"_hex), 1000000000000000000_u256);
    EXPECT_THROW((void)rlp::load<uint64_t>("010203040506070809"_hex), DecodeError);
}

TEST(rlp, decode_header)
{
    const auto b = "05"_hex;
    auto single = bytes_view{b};
    const auto h1 = rlp::decode_header(single);
    EXPECT_EQ(h1.payload_length, 1);
    EXPECT_FALSE(h1.is_list);
    EXPECT_EQ(single.size(), 1);  // The single byte is its own payload.

    const auto s = "83646f67"_hex;
    auto str = bytes_view{s};
    const auto h2 = rlp::decode_header(str);
    EXPECT_EQ(h2.payload_length, 3);
    EXPECT_FALSE(h2.is_list);
    EXPECT_EQ(str, "646f67"_hex);

    const auto l = "c3010203"_hex;
    auto list = bytes_view{l};
    const auto h3 = rlp::decode_header(list);
    EXPECT_EQ(h3.payload_length, 3);
    EXPECT_TRUE(h3.is_list);
}

TEST(rlp, decode_long_string)
{
    const bytes payload(60, 0x11);
    const auto encoded = rlp::encode(payload);
    auto input = bytes_view{encoded};
    bytes decoded;
    rlp::decode(input, decoded);
    EXPECT_EQ(decoded, payload);
    EXPECT_TRUE(input.empty());
}

TEST(rlp, decode_bytes_list)
{
    const auto encoded = rlp::encode_tuple(uint64_t{5}, "dog"_b, bytes_view{});
    const auto items = rlp::decode_bytes_list(encoded);
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[0], "05"_hex);
    EXPECT_EQ(items[1], "dog"_b);
    EXPECT_EQ(items[2], bytes{});
}

TEST(rlp, decode_errors)
{
    const auto decode_error = [](const bytes& input) {
        EXPECT_THROW((void)rlp::decode_bytes_list(input), DecodeError) << hex(input);
    };

    decode_error({});                // empty input
    decode_error("83 0102"_hex);     // string shorter than its header
    decode_error("c3 0102"_hex);     // list shorter than its header
    decode_error("80"_hex);          // not a list
    decode_error("c2 c0 01"_hex);    // nested list
    decode_error("c2 81 05"_hex);    // single byte below 0x80 wrapped in a header
    decode_error("c2 b8 01"_hex);    // long form used for a short string
    decode_error("f8 02 0102"_hex);  // long form used for a short list
    decode_error("c3 b9 0038"_hex);  // length with a leading zero
    decode_error("c0 00"_hex);       // trailing bytes
    decode_error("f9 ffff 00"_hex);  // list length far beyond the input
}

TEST(rlp, hash_output)
{
    std::ostringstream os;
    os << EMPTY_MPT_HASH;
    EXPECT_EQ(os.str(), "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421");
}
