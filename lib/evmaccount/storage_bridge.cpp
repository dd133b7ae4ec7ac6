// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0

#include "storage_bridge.hpp"
#include "errors.hpp"
#include <evmc/hex.hpp>
#include <optional>
#include <sstream>

namespace evmaccount
{
namespace
{
std::optional<bool> parse_flag(std::string_view value) noexcept
{
    if (value.empty() || value == "yes")
        return true;
    if (value == "no")
        return false;
    return std::nullopt;
}
}  // namespace

SetOptionResult StorageBridge::set_option(std::string_view name, std::string_view value) noexcept
{
    bool* flag = nullptr;
    if (name == "trace")
        flag = &m_trace;
    else if (name == "warnings")
        flag = &m_warnings;
    else if (name == "verify_code")
        flag = &m_verify_code;
    else
        return SetOptionResult::invalid_name;

    const auto v = parse_flag(value);
    if (!v.has_value())
        return SetOptionResult::invalid_value;
    *flag = *v;
    return SetOptionResult::success;
}

void StorageBridge::trace(std::string_view op, bytes_view key, const hash256& root) const
{
    if (!m_trace)
        return;

    // Formatted upfront to emit the line with a single write.
    std::ostringstream line;
    line << R"({"op":")" << op << R"(","key":"0x)" << evmc::hex(key) << R"(","root":"0x)"
         << evmc::hex(root) << "\"}\n";
    m_log << line.str();
}

void StorageBridge::warn(std::string_view op, const std::error_code& ec) const
{
    if (!m_warnings)
        return;

    std::ostringstream line;
    line << "evmaccount: " << op << " failed: " << ec.category().name() << ": " << ec.message()
         << '\n';
    m_log << line.str();
}

void StorageBridge::get_code(Store& store, const Account& account, CodeHandler handler) const
{
    if (!account.is_contract())
    {
        handler({}, {});
        return;
    }

    const auto code_hash = account.code_hash();
    trace("get_raw", code_hash, store.root());
    store.get_raw(code_hash, [this, code_hash, handler = std::move(handler)](
                                 std::error_code ec, std::optional<bytes> code) {
        if (ec)
            return handler(ec, {});
        if (!code.has_value())
            return handler(make_error_code(CODE_NOT_FOUND), {});
        if (m_verify_code && keccak256(*code) != code_hash)
            return handler(make_error_code(CODE_HASH_MISMATCH), {});
        handler({}, std::move(*code));
    });
}

void StorageBridge::set_code(Store& store, Account& account, bytes code, CodeHandler handler) const
{
    const auto code_hash = keccak256(code);
    if (code_hash == EMPTY_CODE_HASH)
    {
        account.m_code_hash = EMPTY_CODE_HASH;
        handler({}, {});
        return;
    }

    trace("put_raw", code_hash, store.root());
    store.put_raw(code_hash, std::move(code),
        [this, &account, code_hash, handler = std::move(handler)](std::error_code ec) {
            if (ec)
            {
                warn("set_code", ec);
                return handler(ec, {});
            }
            account.m_code_hash = code_hash;
            handler({}, to_bytes(code_hash));
        });
}

void StorageBridge::get_storage(
    Store& store, const Account& account, bytes_view key, StorageHandler handler) const
{
    auto branch = store.branch();
    branch->set_root(account.state_root());
    trace("get", key, branch->root());

    // The branch is kept alive until the store completes.
    branch->get(key, [branch, handler = std::move(handler)](
                         std::error_code ec, std::optional<bytes> value) {
        handler(ec, std::move(value));
    });
}

void StorageBridge::set_storage(
    Store& store, Account& account, bytes_view key, bytes value, StatusHandler handler) const
{
    auto branch = store.branch();
    branch->set_root(account.state_root());
    trace("put", key, branch->root());

    branch->put(key, std::move(value),
        [this, &account, branch, handler = std::move(handler)](std::error_code ec) {
            if (ec)
            {
                warn("set_storage", ec);
                handler(false);
                return;
            }
            account.m_state_root = branch->root();
            handler(true);
        });
}
}  // namespace evmaccount
