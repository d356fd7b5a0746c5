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

#include <omni/execution/account/identity.hpp>

#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/keccak.hpp>
#include <omni/execution/core/contract/abi_encode.hpp>

#include <algorithm>
#include <string>
#include <string_view>

OMNI_NAMESPACE_BEGIN

bool is_valid_chain_namespace(std::string_view const chain_namespace)
{
    if (chain_namespace.size() < 3 || chain_namespace.size() > 8) {
        return false;
    }
    return std::ranges::all_of(chain_namespace, [](char const c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

std::string
chain_key(std::string_view const chain_namespace, std::string_view const chain_id)
{
    std::string key;
    key.reserve(chain_namespace.size() + 1 + chain_id.size());
    key.append(chain_namespace);
    key.push_back(':');
    key.append(chain_id);
    return key;
}

std::string chain_key(Identity const &identity)
{
    return chain_key(identity.chain_namespace, identity.chain_id);
}

bytes32_t identity_hash(Identity const &identity)
{
    AbiEncoder encoder;
    encoder.add_string(identity.chain_namespace);
    encoder.add_string(identity.chain_id);
    encoder.add_bytes(identity.owner);
    return to_bytes(keccak256(encoder.encode_final()));
}

OMNI_NAMESPACE_END
