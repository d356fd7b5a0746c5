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

#include <omni/execution/account/payload_hash.hpp>

#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/keccak.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/contract/abi_encode.hpp>
#include <omni/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <string_view>

OMNI_NAMESPACE_BEGIN

using namespace evmc::literals;

static_assert(
    DOMAIN_TYPEHASH ==
    0xcc6f7c3c2ff621842b8c114c2f484df3bccefbff5d907dc9e03138839d31b27d_bytes32);
static_assert(
    PAYLOAD_TYPEHASH ==
    0x62828f37516a5e36ef807712a580463f1cec836f6c5addd74971f89f8ba0778b_bytes32);

bytes32_t domain_separator(
    std::string_view const version, std::string_view const chain_id,
    Address const &verifying_contract)
{
    AbiEncoder encoder;
    encoder.add_bytes32(DOMAIN_TYPEHASH);
    encoder.add_bytes32(to_bytes(keccak256(to_byte_string_view(version))));
    encoder.add_bytes32(to_bytes(keccak256(to_byte_string_view(chain_id))));
    encoder.add_address(verifying_contract);
    return to_bytes(keccak256(encoder.encode_final()));
}

bytes32_t payload_struct_hash(Payload const &payload, uint64_t const nonce)
{
    AbiEncoder encoder;
    encoder.add_bytes32(PAYLOAD_TYPEHASH);
    encoder.add_address(payload.to);
    encoder.add_uint(u256_be{payload.value});
    encoder.add_bytes32(to_bytes(keccak256(payload.data)));
    encoder.add_uint(u64_be{payload.gas_limit});
    encoder.add_uint(u256_be{payload.max_fee_per_gas});
    encoder.add_uint(u256_be{payload.max_priority_fee_per_gas});
    encoder.add_uint(u64_be{nonce});
    encoder.add_uint(u64_be{payload.deadline});
    encoder.add_uint(
        u8_be{static_cast<uint8_t>(payload.verification_type)});
    return to_bytes(keccak256(encoder.encode_final()));
}

bytes32_t typed_payload_hash(
    bytes32_t const &domain_separator, bytes32_t const &struct_hash)
{
    byte_string preimage{0x19, 0x01};
    preimage.append(domain_separator.bytes, sizeof(bytes32_t));
    preimage.append(struct_hash.bytes, sizeof(bytes32_t));
    return to_bytes(keccak256(preimage));
}

OMNI_NAMESPACE_END
