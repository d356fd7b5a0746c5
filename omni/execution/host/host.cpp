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

#include <omni/execution/host/host.hpp>

#include <omni/core/assert.h>
#include <omni/core/config.hpp>
#include <omni/core/int.hpp>
#include <omni/core/likely.h>
#include <omni/execution/core/address.hpp>
#include <omni/execution/host/native_contract.hpp>
#include <omni/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <cstdint>

OMNI_ANONYMOUS_NAMESPACE_BEGIN

bool sender_has_balance(State const &state, evmc_message const &msg) noexcept
{
    auto const value = intx::be::load<uint256_t>(msg.value);
    auto const balance =
        intx::be::load<uint256_t>(state.get_balance(msg.sender));
    return balance >= value;
}

void transfer_balances(State &state, evmc_message const &msg)
{
    auto const value = intx::be::load<uint256_t>(msg.value);
    if (value == 0) {
        return;
    }
    state.subtract_from_balance(msg.sender, value);
    state.add_to_balance(msg.recipient, value);
}

OMNI_ANONYMOUS_NAMESPACE_END

OMNI_NAMESPACE_BEGIN

Host::Host(State &state, uint64_t const timestamp)
    : state_{state}
    , timestamp_{timestamp}
{
}

State &Host::state()
{
    return state_;
}

uint64_t Host::timestamp() const
{
    return timestamp_;
}

void Host::set_timestamp(uint64_t const timestamp)
{
    timestamp_ = timestamp;
}

void Host::install(Address const &address, NativeContract &contract)
{
    contracts_.insert_or_assign(address, &contract);
}

evmc::Result Host::call(evmc_message const &msg)
{
    OMNI_ASSERT(msg.kind == EVMC_CALL);

    if (OMNI_UNLIKELY(msg.depth > max_call_depth)) {
        return evmc::Result{EVMC_CALL_DEPTH_EXCEEDED, msg.gas};
    }

    bool const is_static = msg.flags & EVMC_STATIC;
    if (OMNI_UNLIKELY(
            is_static && intx::be::load<uint256_t>(msg.value) != 0)) {
        return evmc::Result{EVMC_STATIC_MODE_VIOLATION, 0};
    }

    state_.push();

    if (OMNI_UNLIKELY(!sender_has_balance(state_, msg))) {
        state_.pop_reject();
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, msg.gas};
    }
    if (!is_static) {
        transfer_balances(state_, msg);
    }

    evmc::Result result{EVMC_SUCCESS, msg.gas};
    if (auto const it = contracts_.find(msg.recipient);
        it != contracts_.end()) {
        result = it->second->call(*this, msg);
    }

    if (result.status_code == EVMC_SUCCESS && !is_static) {
        state_.pop_accept();
    }
    else {
        state_.pop_reject();
    }
    return result;
}

OMNI_NAMESPACE_END
