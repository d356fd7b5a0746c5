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

#include <omni/execution/registry/registry.hpp>

#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/keccak.hpp>
#include <omni/core/likely.h>
#include <omni/core/result.hpp>
#include <omni/execution/account/account.hpp>
#include <omni/execution/account/account_config.hpp>
#include <omni/execution/account/account_implementation.hpp>
#include <omni/execution/account/identity.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/create_contract_address.hpp>
#include <omni/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <omni/execution/core/fmt/bytes_fmt.hpp> // NOLINT
#include <omni/execution/host/host.hpp>
#include <omni/execution/registry/registry_error.hpp>
#include <omni/execution/state/state.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

OMNI_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Address derive_account_address(
    Address const &registry, Identity const &identity,
    Address const &implementation, bytes32_t const &vm_type_hash)
{
    byte_string code{implementation.bytes, sizeof(Address)};
    code.append(vm_type_hash.bytes, sizeof(bytes32_t));
    return create2_contract_address(
        registry, identity_hash(identity), keccak256(code));
}

AccountRegistry::AccountRegistry(Host &host, AccountConfig config)
    : host_{host}
    , config_{std::move(config)}
{
}

Result<void> AccountRegistry::register_chain_type(
    std::string_view const chain_key, bytes32_t const &vm_type_hash)
{
    auto const separator = chain_key.find(':');
    if (OMNI_UNLIKELY(
            separator == std::string_view::npos ||
            !is_valid_chain_namespace(chain_key.substr(0, separator)))) {
        return RegistryError::InvalidChainNamespace;
    }
    if (OMNI_UNLIKELY(vm_type_hash == bytes32_t{})) {
        return RegistryError::InvalidVmType;
    }
    auto const [it, inserted] =
        chain_types_.try_emplace(std::string{chain_key}, vm_type_hash);
    if (!inserted) {
        if (it->second != vm_type_hash) {
            return RegistryError::ChainTypeAlreadyRegistered;
        }
        return success();
    }
    LOG_INFO("registered chain type {} as {}", it->first, vm_type_hash);
    return success();
}

Result<void> AccountRegistry::register_implementation(
    std::string_view const chain_key, bytes32_t const &vm_type_hash,
    std::shared_ptr<AccountImplementation const> implementation)
{
    auto const chain_type = chain_types_.find(std::string{chain_key});
    if (OMNI_UNLIKELY(chain_type == chain_types_.end())) {
        return RegistryError::ChainTypeNotRegistered;
    }
    if (OMNI_UNLIKELY(chain_type->second != vm_type_hash)) {
        return RegistryError::VmTypeMismatch;
    }
    if (OMNI_UNLIKELY(!implementation)) {
        return RegistryError::InvalidImplementation;
    }
    if (OMNI_UNLIKELY(implementation->vm_type_hash() != vm_type_hash)) {
        return RegistryError::VmTypeMismatch;
    }

    auto const it = implementations_.find(vm_type_hash);
    if (it != implementations_.end()) {
        if (it->second != implementation) {
            return RegistryError::ImplementationAlreadyRegistered;
        }
        return success();
    }
    LOG_INFO(
        "registered implementation {} for vm type {}",
        implementation->address(),
        vm_type_hash);
    implementations_.emplace(vm_type_hash, std::move(implementation));
    return success();
}

std::pair<bytes32_t, bool>
AccountRegistry::lookup_chain_type(std::string_view const chain_key) const
{
    auto const it = chain_types_.find(std::string{chain_key});
    if (it == chain_types_.end()) {
        return {bytes32_t{}, false};
    }
    return {it->second, true};
}

Result<std::shared_ptr<AccountImplementation const>>
AccountRegistry::resolve(Identity const &identity) const
{
    if (OMNI_UNLIKELY(!is_valid_chain_namespace(identity.chain_namespace))) {
        return RegistryError::InvalidChainNamespace;
    }
    auto const chain_type = chain_types_.find(chain_key(identity));
    if (OMNI_UNLIKELY(chain_type == chain_types_.end())) {
        return RegistryError::ChainTypeNotRegistered;
    }
    auto const it = implementations_.find(chain_type->second);
    if (OMNI_UNLIKELY(it == implementations_.end())) {
        return RegistryError::ImplementationNotRegistered;
    }
    return it->second;
}

Result<Address> AccountRegistry::derive_address(Identity const &identity) const
{
    BOOST_OUTCOME_TRY(auto const implementation, resolve(identity));
    return derive_account_address(
        config_.registry,
        identity,
        implementation->address(),
        implementation->vm_type_hash());
}

Result<Address> AccountRegistry::deploy(Identity const &identity)
{
    BOOST_OUTCOME_TRY(auto implementation, resolve(identity));
    Address const address = derive_account_address(
        config_.registry,
        identity,
        implementation->address(),
        implementation->vm_type_hash());
    if (accounts_.contains(address)) {
        return address;
    }

    auto account = std::make_unique<ControlledAccount>(
        host_, address, config_.version, std::move(implementation));
    BOOST_OUTCOME_TRY(account->initialize(identity));

    host_.state().create_account(address);
    host_.install(address, *account);
    accounts_.emplace(address, std::move(account));

    LOG_INFO("deployed account {} for {}", address, chain_key(identity));
    return address;
}

ControlledAccount *AccountRegistry::find_account(Address const &address) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return it->second.get();
}

OMNI_NAMESPACE_END
