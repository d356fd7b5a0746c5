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
#include <omni/core/int.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/log.hpp>
#include <omni/execution/state/account_state.hpp>
#include <omni/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <vector>

OMNI_NAMESPACE_BEGIN

// In-memory host ledger with nested checkpoints. Every write made after a
// push() is discarded by the matching pop_reject() and kept by pop_accept().
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<Address, VersionStack<AccountState>> current_{};

    VersionStack<std::vector<Log>> logs_{{}};

    unsigned version_{0};

    AccountState const *recent_account_state(Address const &) const;

    AccountState &current_account_state(Address const &);

public:
    State() = default;

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    void push();

    void pop_accept();

    void pop_reject();

    unsigned version() const;

    ////////////////////////////////////////

    bool account_exists(Address const &) const;

    bytes32_t get_balance(Address const &) const;

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    ////////////////////////////////////////

    void create_account(Address const &);

    void add_to_balance(Address const &, uint256_t const &delta);

    void subtract_from_balance(Address const &, uint256_t const &delta);

    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    std::vector<Log> const &logs() const;

    void store_log(Log const &);
};

OMNI_NAMESPACE_END
