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

#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/keccak.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/create_contract_address.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

using namespace omni;
using namespace evmc::literals;

TEST(CreateContractAddress, eip1014_zero_code)
{
    auto const code_hash = keccak256(byte_string{0x00});

    EXPECT_EQ(
        create2_contract_address(Address{}, bytes32_t{}, code_hash),
        0x4d1a2e2bb4f88f0250f26ffff098b0b30b26bf38_address);
    EXPECT_EQ(
        create2_contract_address(
            0xdeadbeef00000000000000000000000000000000_address,
            0x000000000000000000000000feed000000000000000000000000000000000000_bytes32,
            code_hash),
        0xD04116cDd17beBE565EB2422F2497E06cC1C9833_address);
}

TEST(CreateContractAddress, eip1014_salted)
{
    auto const code_hash = keccak256(byte_string{0xde, 0xad, 0xbe, 0xef});

    EXPECT_EQ(
        create2_contract_address(
            0x00000000000000000000000000000000deadbeef_address,
            0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32,
            code_hash),
        0x60f3f640a8508fC6a86d45DF051962668E1e8AC7_address);
}

TEST(CreateContractAddress, empty_code)
{
    EXPECT_EQ(
        create2_contract_address(
            Address{}, bytes32_t{}, keccak256(byte_string_view{})),
        0xE33C0C7F7df4809055C3ebA6c09CFe4BaF1BD9e0_address);
    EXPECT_EQ(to_bytes(keccak256(byte_string_view{})), NULL_HASH);
}
