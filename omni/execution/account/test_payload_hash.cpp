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
#include <omni/core/int.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/account/payload_hash.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/test/counter_contract.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <vector>

using namespace omni;
using namespace omni::test;
using namespace evmc::literals;

namespace
{
    constexpr auto ACCOUNT = 0xb82dc4c4e3a65629eecd6ed568d2cf567eb74e79_address;
    constexpr auto COUNTER =
        0x00000000000000000000000000000000000000c3_address;

    constexpr auto DOMAIN =
        0xd09965232e886b2c45a3057110bb06fe3ca79b3b8273478e2bfcec962c03d47a_bytes32;

    Payload set_counter_payload()
    {
        return Payload{
            .to = COUNTER,
            .value = 0,
            .data = CounterContract::set_counter(42),
            .gas_limit = 100'000,
            .max_fee_per_gas = 0,
            .max_priority_fee_per_gas = 0,
            .nonce = 0,
            .deadline = 2'000,
            .verification_type = VerificationType::SignatureBased};
    }

    bytes32_t hash_of(Payload const &payload, uint64_t const nonce = 0)
    {
        return typed_payload_hash(DOMAIN, payload_struct_hash(payload, nonce));
    }
}

TEST(PayloadHash, domain_separator)
{
    EXPECT_EQ(domain_separator("1", "101", ACCOUNT), DOMAIN);
    EXPECT_EQ(
        domain_separator("2", "101", ACCOUNT),
        0x3a6a886ce77802ee76e27dd258299edf966472dabd0ad665d9e66f8868ba033a_bytes32);
    EXPECT_NE(domain_separator("1", "102", ACCOUNT), DOMAIN);
    EXPECT_NE(domain_separator("1", "101", COUNTER), DOMAIN);
}

TEST(PayloadHash, known_vectors)
{
    auto const payload = set_counter_payload();
    EXPECT_EQ(
        payload_struct_hash(payload, 0),
        0x51cc32c4b0b05795e0aa616612b5cefacff69d5f5c45d0c67f4cecd3a52e8242_bytes32);
    EXPECT_EQ(
        hash_of(payload),
        0x9fadd6f155fe407e361bd9015fb3193c74df299b591a793843cb5f3963d5a815_bytes32);
    EXPECT_EQ(
        hash_of(payload, 1),
        0x1804887443b14a8d4d315cebc3f9d87492f7f322acc64622051dae87f7dc3a46_bytes32);

    auto tx_hash_payload = payload;
    tx_hash_payload.verification_type = VerificationType::TxHashBased;
    EXPECT_EQ(
        hash_of(tx_hash_payload),
        0xfffeaadba953caf445cbaffa21df4ded4faaa3d512f2a02cb682a1105b0cb5f4_bytes32);
}

TEST(PayloadHash, deterministic)
{
    EXPECT_EQ(hash_of(set_counter_payload()), hash_of(set_counter_payload()));
}

TEST(PayloadHash, every_field_is_bound)
{
    std::vector<std::function<void(Payload &)>> const mutations{
        [](Payload &p) { p.to = 0x00000000000000000000000000000000000000c4_address; },
        [](Payload &p) { p.value = 1; },
        [](Payload &p) { p.data.back() ^= 1; },
        [](Payload &p) { p.data.clear(); },
        [](Payload &p) { p.gas_limit += 1; },
        [](Payload &p) { p.max_fee_per_gas = 1; },
        [](Payload &p) { p.max_priority_fee_per_gas = 1; },
        [](Payload &p) { p.deadline += 1; },
        [](Payload &p) {
            p.verification_type = VerificationType::TxHashBased;
        },
    };

    auto const base = hash_of(set_counter_payload());
    std::vector<bytes32_t> seen{base};
    for (auto const &mutate : mutations) {
        auto payload = set_counter_payload();
        mutate(payload);
        auto const hash = hash_of(payload);
        for (auto const &other : seen) {
            EXPECT_NE(hash, other);
        }
        seen.push_back(hash);
    }
}

TEST(PayloadHash, account_nonce_is_bound)
{
    auto const payload = set_counter_payload();
    EXPECT_NE(hash_of(payload, 0), hash_of(payload, 1));
    EXPECT_NE(hash_of(payload, 1), hash_of(payload, 2));
}

TEST(PayloadHash, payload_nonce_is_informational)
{
    auto payload = set_counter_payload();
    auto const before = hash_of(payload);
    payload.nonce = 7;
    EXPECT_EQ(hash_of(payload), before);
}

TEST(PayloadHash, domain_is_bound)
{
    auto const struct_hash = payload_struct_hash(set_counter_payload(), 0);
    EXPECT_NE(
        typed_payload_hash(DOMAIN, struct_hash),
        typed_payload_hash(
            domain_separator("1", "102", ACCOUNT), struct_hash));
}
