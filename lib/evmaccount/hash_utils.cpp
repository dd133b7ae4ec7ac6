// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#include "hash_utils.hpp"
#include <ostream>

std::ostream& operator<<(std::ostream& out, const evmaccount::hash256& h)
{
    return out << "0x" << evmc::hex(h);
}
