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
#include <omni/core/result.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/oracle/verification_oracle.hpp>

#include <cstdint>
#include <string_view>

OMNI_NAMESPACE_BEGIN

class Host;

// Verification oracle reached through a message call to a host address:
//   verifySignature(bytes ownerKey, bytes32 msgHash, bytes signature)
//   verifyNativeTxHash(string namespace, string chainId, bytes ownerKey,
//                      bytes32 payloadHash, bytes txHash)
// both returning an abi encoded bool.
class PrecompileOracle : public VerificationOracle
{
    Host &host_;
    Address const address_;

    Result<bool> call(byte_string const &input);

public:
    struct Selector
    {
        static constexpr uint32_t VERIFY_SIGNATURE = 0x2222e36f;
        static constexpr uint32_t VERIFY_NATIVE_TX_HASH = 0xd96d24d9;
    };

    static constexpr int64_t CALL_GAS = 200'000;

    PrecompileOracle(Host &, Address const &);

    Address const &address() const;

    Result<bool> verify_signature(
        byte_string_view owner, bytes32_t const &message_hash,
        byte_string_view signature) override;

    Result<bool> verify_native_tx_hash(
        std::string_view chain_namespace, std::string_view chain_id,
        byte_string_view owner, bytes32_t const &payload_hash,
        byte_string_view tx_hash) override;
};

OMNI_NAMESPACE_END
