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

#include <omni/execution/account/account_error.hpp>

#include <omni/core/byte_string.hpp>
#include <omni/core/config.hpp>
#include <omni/core/likely.h>
#include <omni/core/unaligned.hpp>
#include <omni/execution/core/contract/abi_signatures.hpp>
#include <omni/execution/core/contract/big_endian.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

OMNI_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::array<std::pair<AccountError, uint32_t>, 7> error_selectors{{
    {AccountError::AccountAlreadyExists,
     abi_encode_selector("AccountAlreadyExists()")},
    {AccountError::AccountNotInitialized,
     abi_encode_selector("AccountNotInitialized()")},
    {AccountError::ExpiredDeadline, abi_encode_selector("ExpiredDeadline()")},
    {AccountError::InvalidSignature,
     abi_encode_selector("InvalidSignature()")},
    {AccountError::InvalidTxHash, abi_encode_selector("InvalidTxHash()")},
    {AccountError::PrecompileCallFailed,
     abi_encode_selector("PrecompileCallFailed()")},
    {AccountError::ExecutionFailed, abi_encode_selector("ExecutionFailed()")},
}};

static_assert(error_selectors[0].second == 0x69783db7);
static_assert(error_selectors[1].second == 0x7556034e);
static_assert(error_selectors[2].second == 0xf87d9271);
static_assert(error_selectors[3].second == 0x8baa579f);
static_assert(error_selectors[4].second == 0xce5a7598);
static_assert(error_selectors[5].second == 0xfd23ff64);
static_assert(error_selectors[6].second == 0xacfdb444);

OMNI_ANONYMOUS_NAMESPACE_END

OMNI_NAMESPACE_BEGIN

uint32_t account_error_selector(AccountError const error)
{
    for (auto const &[e, selector] : error_selectors) {
        if (e == error) {
            return selector;
        }
    }
    return 0;
}

byte_string encode_account_error(AccountError const error)
{
    u32_be const selector{account_error_selector(error)};
    return byte_string{selector.bytes, sizeof(u32_be)};
}

std::optional<AccountError> decode_account_error(byte_string_view const output)
{
    if (OMNI_UNLIKELY(output.size() != sizeof(u32_be))) {
        return std::nullopt;
    }
    auto const selector = unaligned_load<u32_be>(output.data()).native();
    for (auto const &[e, s] : error_selectors) {
        if (s == selector) {
            return e;
        }
    }
    return std::nullopt;
}

OMNI_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<omni::AccountError>::mapping> const &
quick_status_code_from_enum<omni::AccountError>::value_mappings()
{
    using omni::AccountError;

    static std::initializer_list<mapping> const v = {
        {AccountError::Success, "success", {errc::success}},
        {AccountError::AccountAlreadyExists, "account already exists", {}},
        {AccountError::AccountNotInitialized, "account not initialized", {}},
        {AccountError::ExpiredDeadline, "expired deadline", {}},
        {AccountError::InvalidSignature, "invalid signature", {}},
        {AccountError::InvalidTxHash, "invalid tx hash", {}},
        {AccountError::PrecompileCallFailed, "precompile call failed", {}},
        {AccountError::ExecutionFailed, "execution failed", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
