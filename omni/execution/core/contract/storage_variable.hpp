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
#include <omni/core/unaligned.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <cstddef>
#include <cstring>
#include <type_traits>

OMNI_NAMESPACE_BEGIN

// A fixed-size value laid out over consecutive storage slots of a contract,
// starting at `key`.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);
    using Slots = std::array<bytes32_t, N>;

private:
    State &state_;
    Address const address_;
    uint256_t const offset_;

    bytes32_t slot_key(size_t const i) const
    {
        return intx::be::store<bytes32_t>(offset_ + i);
    }

    Slots load_slots() const
    {
        Slots slots;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(address_, slot_key(i));
        }
        return slots;
    }

    void store_slots(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(address_, slot_key(i), slots[i]);
        }
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    T load() const noexcept
    {
        auto const slots = load_slots();
        return unaligned_load<T>(&slots[0].bytes[0]);
    }

    void store(T const &value)
    {
        Slots slots{}; // zero-pad the tail
        std::memcpy(&slots[0].bytes, &value, sizeof(T));
        store_slots(slots);
    }
};

OMNI_NAMESPACE_END
