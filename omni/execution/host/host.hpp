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

#include <omni/core/config.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/host/native_contract.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>

OMNI_NAMESPACE_BEGIN

class State;

class Host
{
    State &state_;

    uint64_t timestamp_;

    ankerl::unordered_dense::segmented_map<Address, NativeContract *>
        contracts_{};

public:
    static constexpr int32_t max_call_depth = 1024;

    Host(State &, uint64_t timestamp);

    Host(Host const &) = delete;
    Host &operator=(Host const &) = delete;

    State &state();

    uint64_t timestamp() const;

    void set_timestamp(uint64_t);

    // The contract must outlive the host
    void install(Address const &, NativeContract &);

    // Message call with value transfer. All state changes made by the call,
    // including the transfer, are discarded unless it returns EVMC_SUCCESS.
    // An EVMC_STATIC call carries no value and never commits state changes.
    evmc::Result call(evmc_message const &);
};

OMNI_NAMESPACE_END
