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

#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/contract/abi_signatures.hpp>

#include <cstdint>
#include <string_view>

OMNI_NAMESPACE_BEGIN

inline constexpr bytes32_t DOMAIN_TYPEHASH = abi_encode_signature_hash(
    "OmniAccountDomain(string version,string chainId,address "
    "verifyingContract)");

inline constexpr bytes32_t PAYLOAD_TYPEHASH = abi_encode_signature_hash(
    "Payload(address to,uint256 value,bytes data,uint256 gasLimit,uint256 "
    "maxFeePerGas,uint256 maxPriorityFeePerGas,uint256 nonce,uint256 "
    "deadline,uint8 verificationType)");

bytes32_t domain_separator(
    std::string_view version, std::string_view chain_id,
    Address const &verifying_contract);

// `nonce` is the account's counter, not `payload.nonce`
bytes32_t payload_struct_hash(Payload const &, uint64_t nonce);

// keccak256(0x19 0x01 || domain_separator || struct_hash)
bytes32_t
typed_payload_hash(bytes32_t const &domain_separator, bytes32_t const &struct_hash);

OMNI_NAMESPACE_END
