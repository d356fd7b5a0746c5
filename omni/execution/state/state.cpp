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

#include <omni/execution/state/state.hpp>

#include <omni/core/assert.h>
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/int.hpp>
#include <omni/core/likely.h>
#include <omni/execution/core/account.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/log.hpp>
#include <omni/execution/state/account_state.hpp>
#include <omni/execution/state/version_stack.hpp>

#include <intx/intx.hpp>

#include <vector>

OMNI_NAMESPACE_BEGIN

AccountState const *State::recent_account_state(Address const &address) const
{
    auto const it = current_.find(address);
    if (it == current_.end()) {
        return nullptr;
    }
    return &it->second.recent();
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (OMNI_UNLIKELY(it == current_.end())) {
        it = current_.try_emplace(address, AccountState{}, version_).first;
    }
    return it->second.current(version_);
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    OMNI_ASSERT(version_);

    for (auto &it : current_) {
        it.second.pop_accept(version_);
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    OMNI_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    for (auto const &address : removals) {
        current_.erase(address);
    }

    --version_;
}

unsigned State::version() const
{
    return version_;
}

bool State::account_exists(Address const &address) const
{
    auto const *const account_state = recent_account_state(address);
    return account_state && account_state->account_.has_value();
}

bytes32_t State::get_balance(Address const &address) const
{
    auto const *const account_state = recent_account_state(address);
    if (OMNI_LIKELY(account_state && account_state->account_.has_value())) {
        return intx::be::store<bytes32_t>(account_state->account_->balance);
    }
    return {};
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const *const account_state = recent_account_state(address);
    if (!account_state) {
        return {};
    }
    auto const &storage = account_state->storage_;
    if (auto const it = storage.find(key); it != storage.end()) {
        return it->second;
    }
    return {};
}

void State::create_account(Address const &address)
{
    auto &account = current_account_state(address).account_;
    if (!account.has_value()) {
        account = Account{};
    }
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account = current_account_state(address).account_;
    if (OMNI_UNLIKELY(!account.has_value())) {
        account = Account{};
    }

    OMNI_ASSERT(UINT256_MAX - delta >= account->balance, "balance overflow");

    account->balance += delta;
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account = current_account_state(address).account_;
    if (OMNI_UNLIKELY(!account.has_value())) {
        account = Account{};
    }

    OMNI_ASSERT(delta <= account->balance);

    account->balance -= delta;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &account_state = current_account_state(address);
    if (OMNI_UNLIKELY(!account_state.account_.has_value())) {
        account_state.account_ = Account{};
    }
    if (value == bytes32_t{}) {
        account_state.storage_.erase(key);
    }
    else {
        account_state.storage_.insert_or_assign(key, value);
    }
}

std::vector<Log> const &State::logs() const
{
    return logs_.recent();
}

void State::store_log(Log const &log)
{
    logs_.current(version_).push_back(log);
}

OMNI_NAMESPACE_END
