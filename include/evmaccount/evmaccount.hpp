// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmaccount/account.hpp>
#include <evmaccount/codec.hpp>
#include <evmaccount/errors.hpp>
#include <evmaccount/storage_bridge.hpp>
#include <evmaccount/store.hpp>

namespace evmaccount
{
/// The library version string, e.g. "0.1.0".
const char* version() noexcept;
}  // namespace evmaccount
