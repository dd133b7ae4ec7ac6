// evmaccount: Ethereum account record codec and storage bridge
// Copyright 2026 The evmaccount Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cassert>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace evmaccount
{
/// Malformed canonical encoding or an input of unsupported shape.
class DecodeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// An account field violating its length requirement.
class ValidationError : public std::invalid_argument
{
    std::string m_field;

public:
    explicit ValidationError(std::string_view field)
      : std::invalid_argument{
            "the field " + std::string{field} + " must have byte length of 32"},
        m_field{field}
    {}

    /// The name of the offending field, e.g. "stateRoot".
    [[nodiscard]] const std::string& field() const noexcept { return m_field; }
};

/// Failures reported by a Store and by the storage bridge.
enum ErrorCode : int
{
    SUCCESS = 0,
    STORE_UNAVAILABLE,
    STORE_READ_FAILED,
    STORE_WRITE_FAILED,
    UNKNOWN_ROOT,
    CODE_NOT_FOUND,
    CODE_HASH_MISMATCH,
    UNKNOWN_ERROR,
};

/// Obtains a reference to the static error category object for evmaccount errors.
inline const std::error_category& evmaccount_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "evmaccount"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case STORE_UNAVAILABLE:
                return "store unavailable";
            case STORE_READ_FAILED:
                return "store read failed";
            case STORE_WRITE_FAILED:
                return "store write failed";
            case UNKNOWN_ROOT:
                return "unknown trie root";
            case CODE_NOT_FOUND:
                return "code not found";
            case CODE_HASH_MISMATCH:
                return "code does not match code hash";
            case UNKNOWN_ERROR:
                return "Unknown error";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of an evmaccount error code value.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, evmaccount_category()};
}

}  // namespace evmaccount
