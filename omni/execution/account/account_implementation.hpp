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
#include <omni/execution/core/address.hpp>
#include <omni/execution/oracle/verification_oracle.hpp>

OMNI_NAMESPACE_BEGIN

// Verification strategy shared by every account of one VM type. The address
// is the implementation's tag in account address derivation.
class AccountImplementation
{
    bytes32_t const vm_type_hash_;
    Address const address_;
    VerificationOracle &oracle_;

public:
    AccountImplementation(
        bytes32_t const &vm_type_hash, Address const &address,
        VerificationOracle &oracle)
        : vm_type_hash_{vm_type_hash}
        , address_{address}
        , oracle_{oracle}
    {
    }

    bytes32_t const &vm_type_hash() const
    {
        return vm_type_hash_;
    }

    Address const &address() const
    {
        return address_;
    }

    VerificationOracle &oracle() const
    {
        return oracle_;
    }
};

OMNI_NAMESPACE_END
