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
#include <omni/core/result.hpp>
#include <omni/execution/account/account.hpp>
#include <omni/execution/account/account_config.hpp>
#include <omni/execution/account/account_implementation.hpp>
#include <omni/execution/account/identity.hpp>
#include <omni/execution/core/address.hpp>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

OMNI_NAMESPACE_BEGIN

class Host;

// Binds chain types to verification implementations and deploys one
// ControlledAccount per identity at a CREATE2 address:
//   create2(registry, identity_hash, keccak256(impl_address || vm_type_hash))
class AccountRegistry
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Host &host_;
    AccountConfig const config_;

    Map<std::string, bytes32_t> chain_types_{};
    Map<bytes32_t, std::shared_ptr<AccountImplementation const>>
        implementations_{};
    Map<Address, std::unique_ptr<ControlledAccount>> accounts_{};

    Result<std::shared_ptr<AccountImplementation const>>
    resolve(Identity const &) const;

public:
    AccountRegistry(Host &, AccountConfig);

    AccountRegistry(AccountRegistry const &) = delete;
    AccountRegistry &operator=(AccountRegistry const &) = delete;

    Result<void> register_chain_type(
        std::string_view chain_key, bytes32_t const &vm_type_hash);

    Result<void> register_implementation(
        std::string_view chain_key, bytes32_t const &vm_type_hash,
        std::shared_ptr<AccountImplementation const>);

    std::pair<bytes32_t, bool> lookup_chain_type(std::string_view chain_key) const;

    Result<Address> derive_address(Identity const &) const;

    // Returns the existing account's address if already deployed
    Result<Address> deploy(Identity const &);

    ControlledAccount *find_account(Address const &) const;
};

// Address derivation without a registry instance
Address derive_account_address(
    Address const &registry, Identity const &, Address const &implementation,
    bytes32_t const &vm_type_hash);

OMNI_NAMESPACE_END
