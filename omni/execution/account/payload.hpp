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
#include <omni/core/int.hpp>
#include <omni/execution/core/address.hpp>

#include <cstdint>

OMNI_NAMESPACE_BEGIN

enum class VerificationType : uint8_t
{
    SignatureBased = 0,
    TxHashBased = 1,
};

// One authorized outbound call. `nonce` is carried for the signer's benefit
// only; the account binds its own counter into the payload hash.
struct Payload
{
    Address to{};
    uint256_t value{0};
    byte_string data{};
    uint64_t gas_limit{0};
    uint256_t max_fee_per_gas{0};
    uint256_t max_priority_fee_per_gas{0};
    uint64_t nonce{0};
    uint64_t deadline{0};
    VerificationType verification_type{VerificationType::SignatureBased};
};

OMNI_NAMESPACE_END
