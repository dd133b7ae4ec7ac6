// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <string_view>

namespace evmaccount::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_spaced_hex;
using evmc::hex;

/// Produces bytes out of string literal by casting individual characters.
inline bytes operator""_b(const char* data, size_t size)
{
    const std::string_view s{data, size};
    return {s.begin(), s.end()};
}

/// Produces bytes out of hex string literal. Spaces are allowed between bytes.
inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

}  // namespace evmaccount::test
