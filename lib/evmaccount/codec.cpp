// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"
#include "rlp.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace evmaccount
{
namespace json = nlohmann;

namespace
{
/// The number of account fields.
constexpr size_t num_fields = 4;

/// The field names in the encoding order.
constexpr std::string_view field_names[num_fields]{"nonce", "balance", "stateRoot", "codeHash"};

/// The account fields after coercion, indexed by position. Empty optional means "use default".
using RawFields = std::array<std::optional<bytes>, num_fields>;

bytes normalize(bytes b)
{
    if (b.size() == 1 && b[0] == 0)
        b.clear();
    return b;
}

bytes from_hex_string(std::string_view s)
{
    auto decoded = evmc::from_hex(s);
    if (!decoded.has_value())
        throw DecodeError("invalid hex: " + std::string{s});
    return std::move(*decoded);
}

/// Decodes a hex field value. An odd number of digits is padded with a leading zero,
/// so quantities like "0x1" are accepted.
bytes from_hex_quantity(std::string_view s)
{
    if (s.starts_with("0x"))
        s.remove_prefix(2);
    if (s.size() % 2 == 0)
        return from_hex_string(s);
    return from_hex_string("0" + std::string{s});
}

bytes integer_to_bytes(const intx::uint256& x)
{
    uint8_t b[sizeof(x)];
    intx::be::store(b, x);
    return bytes{rlp::trim({b, sizeof(b)})};
}

hash256 to_hash(const std::optional<bytes>& b, size_t field_index, const hash256& default_value)
{
    if (!b.has_value())
        return default_value;
    if (b->size() != sizeof(hash256))
        throw ValidationError{field_names[field_index]};

    hash256 h;
    std::copy(b->begin(), b->end(), h.bytes);
    return h;
}

void check_field_count(size_t n)
{
    if (n > num_fields)
        throw DecodeError("invalid data: expected at most 4 fields, got " + std::to_string(n));
}

Account make_account(RawFields&& fields)
{
    // Validate the hashes before the integer fields are moved out.
    const auto state_root = to_hash(fields[2], 2, EMPTY_MPT_HASH);
    const auto code_hash = to_hash(fields[3], 3, EMPTY_CODE_HASH);
    return {std::move(fields[0]).value_or(bytes{}), std::move(fields[1]).value_or(bytes{}),
        state_root, code_hash};
}

Account from_ordered(std::vector<bytes>&& values)
{
    check_field_count(values.size());

    RawFields fields;
    for (size_t i = 0; i < values.size(); ++i)
        fields[i] = normalize(std::move(values[i]));
    return make_account(std::move(fields));
}

Account from_encoded(bytes_view encoded)
{
    if (encoded.empty())
        return {};
    return from_ordered(rlp::decode_bytes_list(encoded));
}

/// An empty string, a zero integer or an empty byte string. Such keyed entries are ignored.
bool is_falsy(const FieldValue& value)
{
    return std::visit(
        [](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, bytes>)
                return v.empty();
            else if constexpr (std::is_same_v<T, uint64_t> || std::is_same_v<T, intx::uint256>)
                return v == 0;
            else if constexpr (std::is_same_v<T, hash256>)
                return false;
            else
                static_assert(std::is_void_v<T>, "unhandled field value type");
        },
        value);
}

Account from_keyed(const KeyedFields& keyed)
{
    const std::optional<FieldValue>* entries[num_fields]{
        &keyed.nonce, &keyed.balance, &keyed.state_root, &keyed.code_hash};

    RawFields fields;
    for (size_t i = 0; i < num_fields; ++i)
    {
        if (entries[i]->has_value() && !is_falsy(**entries[i]))
            fields[i] = coerce_field(**entries[i]);
    }
    return make_account(std::move(fields));
}

FieldValue field_from_json(const json::json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    if (j.is_number_unsigned())
        return j.get<uint64_t>();
    if (j.is_number_integer() && j.get<int64_t>() >= 0)
        return static_cast<uint64_t>(j.get<int64_t>());
    if (j.is_null())
        return bytes{};
    throw DecodeError("invalid field value: " + j.dump());
}

std::optional<FieldValue> field_from_json(const json::json& j, const char* key)
{
    if (const auto it = j.find(key); it != j.end() && !it->is_null())
        return field_from_json(*it);
    return std::nullopt;
}

std::string to_hex_string(bytes_view b)
{
    return "0x" + evmc::hex(b);
}
}  // namespace

bytes coerce_field(const FieldValue& value)
{
    return std::visit(
        [](const auto& v) -> bytes {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>)
                return normalize(from_hex_quantity(v));
            else if constexpr (std::is_same_v<T, uint64_t>)
                return integer_to_bytes(v);
            else if constexpr (std::is_same_v<T, intx::uint256>)
                return integer_to_bytes(v);
            else if constexpr (std::is_same_v<T, bytes>)
                return normalize(v);
            else if constexpr (std::is_same_v<T, hash256>)
                return to_bytes(v);
            else
                static_assert(std::is_void_v<T>, "unhandled field value type");
        },
        value);
}

Account decode_account(const AccountInput& input)
{
    return std::visit(
        [](const auto& in) -> Account {
            using T = std::decay_t<decltype(in)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return {};
            else if constexpr (std::is_same_v<T, bytes>)
                return from_encoded(in);
            else if constexpr (std::is_same_v<T, std::string>)
                return from_encoded(from_hex_string(in));
            else if constexpr (std::is_same_v<T, OrderedFields>)
            {
                check_field_count(in.size());
                std::vector<bytes> values;
                values.reserve(in.size());
                for (const auto& v : in)
                    values.emplace_back(coerce_field(v));
                return from_ordered(std::move(values));
            }
            else if constexpr (std::is_same_v<T, KeyedFields>)
                return from_keyed(in);
            else
                static_assert(std::is_void_v<T>, "unhandled account input type");
        },
        input);
}

Account decode_account_rlp(bytes_view encoded)
{
    return from_encoded(encoded);
}

Account decode_account_json(const json::json& j)
{
    if (j.is_null())
        return {};

    if (j.is_string())
        return from_encoded(from_hex_string(j.get<std::string>()));

    if (j.is_array())
    {
        check_field_count(j.size());
        OrderedFields fields;
        for (const auto& e : j)
            fields.emplace_back(field_from_json(e));
        return decode_account(AccountInput{std::move(fields)});
    }

    if (j.is_object())
    {
        return from_keyed({field_from_json(j, "nonce"), field_from_json(j, "balance"),
            field_from_json(j, "stateRoot"), field_from_json(j, "codeHash")});
    }

    throw DecodeError("invalid data");
}

json::json to_json(const Account& account, bool labeled)
{
    const auto raw = account.raw();

    if (!labeled)
    {
        auto j = json::json::array();
        for (const auto& field : raw)
            j.push_back(to_hex_string(field));
        return j;
    }

    json::json j = json::json::object();
    for (size_t i = 0; i < num_fields; ++i)
        j[std::string{field_names[i]}] = to_hex_string(raw[i]);
    return j;
}

}  // namespace evmaccount
