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
#include <omni/execution/account/account_implementation.hpp>
#include <omni/execution/account/identity.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/host/native_contract.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

OMNI_NAMESPACE_BEGIN

class Host;

// Host account controlled by a foreign chain identity. Payloads authorized
// by the identity are executed from this account's address and balance.
class ControlledAccount : public NativeContract
{
    Host &host_;
    Address const address_;
    std::string const version_;
    std::shared_ptr<AccountImplementation const> const implementation_;
    std::optional<Identity> identity_{};

    evmc::Result execute(Payload const &, byte_string_view proof);

    void increment_nonce();

public:
    // storage slot of the payload counter
    static constexpr bytes32_t NONCE_SLOT{};

    ControlledAccount(
        Host &, Address const &, std::string version,
        std::shared_ptr<AccountImplementation const>);

    Result<void> initialize(Identity);

    bool is_initialized() const;

    Identity const *identity() const;

    uint64_t nonce() const;

    Address const &address() const;

    AccountImplementation const &implementation() const;

    Result<bytes32_t> domain_separator() const;

    // Fails with ExpiredDeadline once the host timestamp is past the
    // deadline; a payload is still valid at the deadline itself.
    Result<bytes32_t> compute_payload_hash(Payload const &) const;

    Result<bool>
    verify_by_signature(bytes32_t const &message_hash, byte_string_view signature);

    Result<bool>
    verify_by_tx_hash(bytes32_t const &payload_hash, byte_string_view tx_hash);

    // Verifies and executes one payload. Returns the sub-call's result on
    // success. On failure every change is rolled back and the output holds
    // either the engine error (see encode_account_error) or the sub-call's
    // revert data unchanged.
    evmc::Result execute_payload(Payload const &, byte_string_view proof);

    // Plain value transfers are accepted, calls with data are rejected
    evmc::Result call(Host &, evmc_message const &) override;
};

OMNI_NAMESPACE_END
