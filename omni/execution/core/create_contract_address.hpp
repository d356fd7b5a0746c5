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

#include <ethash/hash_types.hpp>

OMNI_NAMESPACE_BEGIN

// EIP-1014
Address create2_contract_address(
    Address const &from, bytes32_t const &salt,
    ethash::hash256 const &code_hash);

OMNI_NAMESPACE_END
