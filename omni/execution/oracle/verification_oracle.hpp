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

#include <string_view>

OMNI_NAMESPACE_BEGIN

// External verification service. An error result means the check could not
// be carried out; `false` means it was carried out and rejected.
class VerificationOracle
{
public:
    virtual ~VerificationOracle() = default;

    virtual Result<bool> verify_signature(
        byte_string_view owner, bytes32_t const &message_hash,
        byte_string_view signature) = 0;

    virtual Result<bool> verify_native_tx_hash(
        std::string_view chain_namespace, std::string_view chain_id,
        byte_string_view owner, bytes32_t const &payload_hash,
        byte_string_view tx_hash) = 0;
};

OMNI_NAMESPACE_END
