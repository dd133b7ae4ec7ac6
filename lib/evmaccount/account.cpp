// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"
#include "rlp.hpp"

namespace evmaccount
{
intx::uint256 Account::nonce_value() const
{
    return rlp::load<intx::uint256>(m_nonce);
}

intx::uint256 Account::balance_value() const
{
    return rlp::load<intx::uint256>(m_balance);
}

std::array<bytes, 4> Account::raw() const
{
    return {m_nonce, m_balance, to_bytes(m_state_root), to_bytes(m_code_hash)};
}

bytes Account::serialize() const
{
    return rlp::encode_tuple(bytes_view{m_nonce}, bytes_view{m_balance}, m_state_root, m_code_hash);
}
}  // namespace evmaccount
