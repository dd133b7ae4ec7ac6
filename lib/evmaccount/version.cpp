// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0

#include <evmaccount/evmaccount.hpp>

namespace evmaccount
{
const char* version() noexcept
{
    return PROJECT_VERSION;
}
}  // namespace evmaccount
