// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

namespace evmaccount
{
/// The external content-addressed and versioned key-value store.
///
/// The store has two keyspaces:
/// - the flat "raw" keyspace, where contract code is kept under its hash,
/// - the versioned keyspace (the trie), where each version is identified by its root hash.
///
/// All data access is asynchronous: the result is delivered to the completion handler,
/// which is invoked exactly once, either before the call returns or later.
/// A handler receiving a non-zero error code must ignore the other arguments.
/// Keys are only valid for the duration of the call, asynchronous stores must copy them.
class Store
{
public:
    /// Completion of a read: the value or std::nullopt when the key is absent.
    using BytesHandler = std::function<void(std::error_code, std::optional<bytes>)>;

    /// Completion of a write.
    using WriteHandler = std::function<void(std::error_code)>;

    virtual ~Store() = default;

    /// The root of the trie version this handle points to.
    [[nodiscard]] virtual hash256 root() const noexcept = 0;

    /// Points this handle to another trie version.
    virtual void set_root(const hash256& root) noexcept = 0;

    /// Creates an independent handle sharing the persisted content but having its own root.
    [[nodiscard]] virtual std::shared_ptr<Store> branch() const = 0;

    virtual void get_raw(bytes_view key, BytesHandler handler) = 0;
    virtual void put_raw(bytes_view key, bytes value, WriteHandler handler) = 0;

    /// Looks up the key in the trie version at root().
    virtual void get(bytes_view key, BytesHandler handler) = 0;

    /// Inserts the key into the trie version at root().
    /// On success the handle's root is advanced to the new version before the handler is called.
    virtual void put(bytes_view key, bytes value, WriteHandler handler) = 0;
};
}  // namespace evmaccount
