// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <omni/core/byte_string.hpp>
#include <omni/core/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <optional>

OMNI_NAMESPACE_BEGIN

enum class AccountError
{
    Success = 0,
    AccountAlreadyExists,
    AccountNotInitialized,
    ExpiredDeadline,
    InvalidSignature,
    InvalidTxHash,
    PrecompileCallFailed,
    ExecutionFailed,
};

// Selector of the matching Solidity custom error, e.g. "ExpiredDeadline()"
uint32_t account_error_selector(AccountError);

// Revert data for an engine error: the bare four byte selector
byte_string encode_account_error(AccountError);

std::optional<AccountError> decode_account_error(byte_string_view);

OMNI_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<omni::AccountError>
    : quick_status_code_from_enum_defaults<omni::AccountError>
{
    static constexpr auto const domain_name = "Account Error";
    static constexpr auto const domain_uuid =
        "8f2d6c41-5a93-4e17-b0c8-3e6a9d4f7b25";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
