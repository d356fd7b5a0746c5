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

#include <string>
#include <string_view>

OMNI_NAMESPACE_BEGIN

// An account on a foreign chain
struct Identity
{
    std::string chain_namespace{};
    std::string chain_id{};
    byte_string owner{};

    friend bool operator==(Identity const &, Identity const &) = default;
};

// CAIP-2 namespace: 3 to 8 characters of [-a-z0-9]. Never contains the ':'
// separator of a chain key.
bool is_valid_chain_namespace(std::string_view);

// CAIP-2 chain identifier, e.g. "solana:101"
std::string chain_key(std::string_view chain_namespace, std::string_view chain_id);

std::string chain_key(Identity const &);

// keccak256(abi.encode(string chainNamespace, string chainId, bytes owner))
bytes32_t identity_hash(Identity const &);

OMNI_NAMESPACE_END
