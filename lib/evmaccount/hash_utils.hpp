// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <ethash/keccak.hpp>
#include <bit>
#include <iosfwd>

namespace evmaccount
{
using evmc::bytes;
using evmc::bytes32;
using evmc::bytes_view;
using namespace evmc::literals;

/// Default type for 256-bit hash.
///
/// Better than ethash::hash256 because has some additional handy constructors.
using hash256 = bytes32;

/// The keccak256 hash of the empty input. Identifies accounts without code.
constexpr auto EMPTY_CODE_HASH =
    0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32;

/// The hash of the empty Merkle Patricia Trie.
///
/// Specifically, this is the value of keccak256(RLP("")), i.e. keccak256({0x80}).
constexpr auto EMPTY_MPT_HASH =
    0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32;

/// Computes Keccak hash out of input bytes (wrapper of ethash::keccak256).
inline hash256 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<hash256>(ethash::keccak256(data.data(), data.size()));
}

/// Returns the hash as an owned byte string.
inline bytes to_bytes(const hash256& h)
{
    return {h.bytes, sizeof(h.bytes)};
}
}  // namespace evmaccount

std::ostream& operator<<(std::ostream& out, const evmaccount::hash256& h);
