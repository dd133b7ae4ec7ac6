// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account.hpp"
#include "store.hpp"
#include <iostream>
#include <string_view>

namespace evmaccount
{
enum class SetOptionResult
{
    success,
    invalid_name,
    invalid_value,
};

/// Reads and writes the code and the storage of an account through a Store.
///
/// The account's code hash and state root are replaced only after the store has confirmed
/// the write. The account and the bridge must outlive every operation started on them.
/// Mutating operations on the same account must not overlap.
///
/// Options (see set_option()):
/// - "trace": logs every store operation as a JSON line,
/// - "warnings": logs failed writes (on by default),
/// - "verify_code": checks the code returned by the store against the account's code hash.
class StorageBridge
{
    std::ostream& m_log;
    bool m_trace = false;
    bool m_warnings = true;
    bool m_verify_code = false;

    void trace(std::string_view op, bytes_view key, const hash256& root) const;
    void warn(std::string_view op, const std::error_code& ec) const;

public:
    /// Completion of a code read or write: the code, or the new code hash for writes.
    using CodeHandler = std::function<void(std::error_code, bytes)>;

    /// Completion of a storage read: the value or std::nullopt when the key is absent.
    using StorageHandler = Store::BytesHandler;

    /// Completion of a storage write. The failure detail goes to the log.
    using StatusHandler = std::function<void(bool)>;

    explicit StorageBridge(std::ostream& log = std::clog) noexcept : m_log{log} {}

    SetOptionResult set_option(std::string_view name, std::string_view value) noexcept;

    /// Loads the account's code from the store's raw keyspace.
    ///
    /// Accounts without code complete with empty bytes and the store is not accessed.
    /// Missing code is reported as CODE_NOT_FOUND.
    void get_code(Store& store, const Account& account, CodeHandler handler) const;

    /// Stores the code under its hash and sets the account's code hash.
    ///
    /// Empty code is not stored: the code hash is reset to EMPTY_CODE_HASH and the handler
    /// gets empty bytes. Otherwise the handler gets the new code hash.
    /// On error the account is left unchanged.
    void set_code(Store& store, Account& account, bytes code, CodeHandler handler) const;

    /// Looks up the key in the account's storage at its state root.
    void get_storage(
        Store& store, const Account& account, bytes_view key, StorageHandler handler) const;

    /// Writes the key into a branch of the account's storage and, on success,
    /// advances the account's state root to the branch root.
    ///
    /// The previous root stays valid in the store for other holders.
    void set_storage(Store& store, Account& account, bytes_view key, bytes value,
        StatusHandler handler) const;
};
}  // namespace evmaccount
