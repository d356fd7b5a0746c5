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
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/likely.h>
#include <omni/core/result.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/contract/abi_decode_error.hpp>
#include <omni/execution/core/contract/big_endian.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <concepts>
#include <cstring>
#include <type_traits>

OMNI_NAMESPACE_BEGIN

// Consumes one head word from `enc`
template <typename T>
    requires(BigEndianType<T> || std::same_as<T, Address>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (OMNI_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

inline Result<bool> abi_decode_bool(byte_string_view &enc)
{
    if (OMNI_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }
    // all but the last byte must be zero and the last byte 0 or 1
    bool const padded = std::all_of(
        enc.begin(), enc.begin() + 31, [](auto const b) { return b == 0; });
    if (OMNI_UNLIKELY(!padded || enc[31] > 1)) {
        return AbiDecodeError::InvalidBool;
    }
    bool const output = enc[31] == 1;
    enc.remove_prefix(32);
    return output;
}

OMNI_NAMESPACE_END
