// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0

#include "rlp.hpp"

namespace evmaccount::rlp
{
namespace
{
/// The prefix base of strings with the length in the long form: 0xb7 + length of length.
constexpr uint8_t LONG_STRING_BASE = STRING_BASE + SHORT_PAYLOAD_MAX;

/// The prefix base of lists with the length in the long form: 0xf7 + length of length.
constexpr uint8_t LONG_LIST_BASE = LIST_BASE + SHORT_PAYLOAD_MAX;

[[noreturn]] void fail(const char* reason)
{
    throw DecodeError(std::string{"rlp decoding error: "} + reason);
}

/// Reads the long-form payload length stored after the prefix byte.
uint64_t load_long_length(bytes_view& input, size_t length_size)
{
    if (length_size >= input.size())
        fail("input too short");

    const auto length_bytes = input.substr(1, length_size);
    if (length_bytes[0] == 0)
        fail("length has leading zero");
    const auto length = load<uint64_t>(length_bytes);
    if (length <= SHORT_PAYLOAD_MAX)
        fail("long form used for a short payload");

    input.remove_prefix(1 + length_size);
    return length;
}
}  // namespace

bytes internal::encode_header(uint8_t base, size_t payload_length)
{
    if (payload_length <= SHORT_PAYLOAD_MAX)
        return {static_cast<uint8_t>(base + payload_length)};

    uint8_t b[sizeof(uint64_t)];
    intx::be::store(b, uint64_t{payload_length});
    const auto length = trim({b, sizeof(b)});
    bytes header{static_cast<uint8_t>(base + SHORT_PAYLOAD_MAX + length.size())};
    return header += length;
}

Header decode_header(bytes_view& input)
{
    if (input.empty())
        fail("input is empty");

    const auto prefix = input[0];
    Header h;
    if (prefix < STRING_BASE)
        return {1, false};

    if (prefix <= LONG_STRING_BASE)
    {
        h.payload_length = prefix - STRING_BASE;
        if (h.payload_length >= input.size())
            fail("input too short");
        if (h.payload_length == 1 && input[1] < STRING_BASE)
            fail("non-canonical single byte");
        input.remove_prefix(1);
    }
    else if (prefix < LIST_BASE)
        h.payload_length = load_long_length(input, prefix - LONG_STRING_BASE);
    else if (prefix <= LONG_LIST_BASE)
    {
        h.is_list = true;
        h.payload_length = prefix - LIST_BASE;
        input.remove_prefix(1);
    }
    else
    {
        h.is_list = true;
        h.payload_length = load_long_length(input, prefix - LONG_LIST_BASE);
    }

    if (h.payload_length > input.size())
        fail("input too short");
    return h;
}

void decode(bytes_view& from, bytes& to)
{
    const auto h = decode_header(from);
    if (h.is_list)
        fail("unexpected list, byte string expected");

    const auto n = static_cast<size_t>(h.payload_length);
    to = from.substr(0, n);
    from.remove_prefix(n);
}

std::vector<bytes> decode_bytes_list(bytes_view input)
{
    const auto h = decode_header(input);
    if (!h.is_list)
        fail("unexpected byte string, list expected");

    const auto n = static_cast<size_t>(h.payload_length);
    auto payload = input.substr(0, n);
    if (input.size() != n)
        fail("trailing bytes after list");

    std::vector<bytes> items;
    while (!payload.empty())
        decode(payload, items.emplace_back());
    return items;
}

}  // namespace evmaccount::rlp
