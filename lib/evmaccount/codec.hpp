// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "account.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace evmaccount
{
/// A single raw field value before coercion to bytes.
///
/// A string is hex with an optional "0x" prefix, an odd number of digits is left-padded
/// with a zero. Integers are converted to their minimal
/// big-endian form, so 0 becomes the empty byte string.
using FieldValue = std::variant<std::string, uint64_t, intx::uint256, bytes, hash256>;

/// Fields given by position: nonce, balance, stateRoot, codeHash.
using OrderedFields = std::vector<FieldValue>;

/// Fields given by name. Missing entries and entries that are an empty string, a zero integer
/// or an empty byte string take the default value. Any other entry is coerced and validated.
struct KeyedFields
{
    std::optional<FieldValue> nonce;
    std::optional<FieldValue> balance;
    std::optional<FieldValue> state_root;
    std::optional<FieldValue> code_hash;
};

/// The accepted account input shapes:
/// none (the empty account), RLP bytes, hex-encoded RLP bytes, ordered fields, keyed fields.
using AccountInput = std::variant<std::monostate, bytes, std::string, OrderedFields, KeyedFields>;

/// Coerces a raw field value to its canonical byte string.
///
/// A single zero byte is normalized to the empty byte string.
/// Throws DecodeError for invalid hex.
[[nodiscard]] bytes coerce_field(const FieldValue& value);

/// Builds the account out of any of the accepted input shapes.
///
/// Throws DecodeError for malformed input and ValidationError when stateRoot or codeHash
/// is not exactly 32 bytes long.
[[nodiscard]] Account decode_account(const AccountInput& input);

/// Decodes the account from its RLP encoding. The empty input gives the empty account.
[[nodiscard]] Account decode_account_rlp(bytes_view encoded);

/// Builds the account from JSON: null, a hex string of the RLP encoding,
/// an array of ordered fields or an object of keyed fields.
[[nodiscard]] Account decode_account_json(const nlohmann::json& j);

/// Renders the account as JSON of 0x-prefixed hex strings:
/// an array in the field order or, when labeled, an object with named fields.
[[nodiscard]] nlohmann::json to_json(const Account& account, bool labeled = false);

}  // namespace evmaccount
