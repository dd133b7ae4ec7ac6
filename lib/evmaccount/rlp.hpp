// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <algorithm>
#include <concepts>
#include <utility>
#include <vector>

/// Recursive Length Prefix encoding of byte strings and lists.
/// See https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/.
namespace evmaccount::rlp
{
using evmc::bytes;
using evmc::bytes_view;

/// The prefix base of byte strings.
constexpr uint8_t STRING_BASE = 0x80;

/// The prefix base of lists.
constexpr uint8_t LIST_BASE = 0xc0;

/// The longest payload encoded with the length inside the prefix byte.
constexpr size_t SHORT_PAYLOAD_MAX = 55;

namespace internal
{
/// Builds the item prefix for the payload length,
/// in the short form up to SHORT_PAYLOAD_MAX and in the long form otherwise.
bytes encode_header(uint8_t base, size_t payload_length);

inline bytes wrap_list(bytes_view payload)
{
    return encode_header(LIST_BASE, payload.size()) += payload;
}
}  // namespace internal

/// Strips leading zero bytes, producing the minimal big-endian form of an integer.
inline bytes_view trim(bytes_view b) noexcept
{
    const auto first = std::find_if(b.begin(), b.end(), [](uint8_t c) { return c != 0; });
    return b.substr(static_cast<size_t>(first - b.begin()));
}

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint256>;

/// Encoding of user types is found through the ADL hook rlp_encode().
template <typename T>
inline decltype(rlp_encode(std::declval<T>())) encode(const T& v)
{
    return rlp_encode(v);
}

inline bytes encode(bytes_view data)
{
    if (data.size() == 1 && data[0] < STRING_BASE)
        return bytes{data};
    return internal::encode_header(STRING_BASE, data.size()) += data;
}

/// Integers are encoded as their minimal big-endian byte string, 0 is the empty string.
template <UnsignedIntegral T>
inline bytes encode(const T& x)
{
    uint8_t b[sizeof(T)];
    intx::be::store(b, x);
    return encode(trim({b, sizeof(b)}));
}

template <typename T>
inline bytes encode(const std::vector<T>& items)
{
    bytes payload;
    for (const auto& item : items)
        payload += encode(item);
    return internal::wrap_list(payload);
}

/// Encodes the values as a list, each value encoded by its own overload.
template <typename... Types>
inline bytes encode_tuple(const Types&... elements)
{
    return internal::wrap_list((encode(elements) + ...));
}

/// Reads a big-endian unsigned integer. Throws DecodeError if the input is too long for T.
template <UnsignedIntegral T>
[[nodiscard]] inline T load(bytes_view input)
{
    if (input.size() > sizeof(T))
        throw DecodeError("rlp decoding error: integer too big");

    T x = 0;
    for (const auto b : input)
        x = (x << 8) | T{b};
    return x;
}

/// The decoded item prefix.
struct Header
{
    uint64_t payload_length = 0;
    bool is_list = false;
};

/// Decodes the item prefix and advances the input to the item payload.
/// A single byte below 0x80 is its own payload, the input is not advanced then.
///
/// Only the canonical form is accepted: the shortest length encoding, no leading zeros
/// in the length and no single byte below 0x80 wrapped in a prefix.
[[nodiscard]] Header decode_header(bytes_view& input);

/// Decodes a byte string item and advances the input past it.
void decode(bytes_view& from, bytes& to);

/// Decodes an RLP list of byte strings occupying the whole input.
[[nodiscard]] std::vector<bytes> decode_bytes_list(bytes_view input);

}  // namespace evmaccount::rlp
