// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <array>

namespace evmaccount
{
class StorageBridge;

/// The account record as kept in the state trie: the tuple
/// [nonce, balance, storage root, code hash].
///
/// The integer fields are kept as minimal big-endian byte strings exactly as decoded,
/// so re-encoding reproduces the input bytes. The hashes are 32-byte values by type.
/// After construction only the StorageBridge replaces the state root and the code hash,
/// and only once the store has confirmed the corresponding write.
class Account
{
    friend class StorageBridge;

    bytes m_nonce;
    bytes m_balance;
    hash256 m_state_root = EMPTY_MPT_HASH;
    hash256 m_code_hash = EMPTY_CODE_HASH;

public:
    /// The empty account.
    Account() = default;

    Account(bytes nonce, bytes balance, const hash256& state_root, const hash256& code_hash)
      : m_nonce{std::move(nonce)},
        m_balance{std::move(balance)},
        m_state_root{state_root},
        m_code_hash{code_hash}
    {}

    [[nodiscard]] const bytes& nonce() const noexcept { return m_nonce; }
    [[nodiscard]] const bytes& balance() const noexcept { return m_balance; }

    /// The root of the account's storage trie.
    [[nodiscard]] const hash256& state_root() const noexcept { return m_state_root; }

    /// The keccak256 hash of the account's code.
    [[nodiscard]] const hash256& code_hash() const noexcept { return m_code_hash; }

    /// The nonce as an integer. Throws DecodeError if it does not fit 256 bits.
    [[nodiscard]] intx::uint256 nonce_value() const;

    /// The balance as an integer. Throws DecodeError if it does not fit 256 bits.
    [[nodiscard]] intx::uint256 balance_value() const;

    /// The account has code attached.
    [[nodiscard]] bool is_contract() const noexcept { return m_code_hash != EMPTY_CODE_HASH; }

    /// No nonce, no balance, no code and no storage.
    [[nodiscard]] bool is_empty() const noexcept
    {
        return m_nonce.empty() && m_balance.empty() && m_code_hash == EMPTY_CODE_HASH &&
               m_state_root == EMPTY_MPT_HASH;
    }

    /// The fields in the encoding order, as byte strings.
    [[nodiscard]] std::array<bytes, 4> raw() const;

    /// The canonical RLP encoding of the account.
    [[nodiscard]] bytes serialize() const;

    bool operator==(const Account&) const noexcept = default;
};

/// RLP encoding hook, makes rlp::encode() accept Account.
inline bytes rlp_encode(const Account& account)
{
    return account.serialize();
}
}  // namespace evmaccount
