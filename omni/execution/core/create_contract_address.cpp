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

#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/keccak.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/create_contract_address.hpp>

#include <ethash/hash_types.hpp>

#include <cstring>

OMNI_ANONYMOUS_NAMESPACE_BEGIN

Address hash_and_clip(byte_string const &b)
{
    auto const h = keccak256(b);
    Address result{};
    std::memcpy(result.bytes, &h.bytes[12], sizeof(Address));
    return result;
}

OMNI_ANONYMOUS_NAMESPACE_END

OMNI_NAMESPACE_BEGIN

Address create2_contract_address(
    Address const &from, bytes32_t const &salt,
    ethash::hash256 const &code_hash)
{
    byte_string b{0xff};
    b.append(from.bytes, sizeof(Address));
    b.append(salt.bytes, sizeof(bytes32_t));
    b.append(code_hash.bytes, sizeof(ethash::hash256));
    return hash_and_clip(b);
}

OMNI_NAMESPACE_END
