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
#include <omni/core/result.hpp>
#include <omni/execution/account/account.hpp>
#include <omni/execution/account/account_error.hpp>
#include <omni/execution/account/account_implementation.hpp>
#include <omni/execution/account/identity.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/contract/abi_encode.hpp>
#include <omni/execution/core/contract/abi_signatures.hpp>
#include <omni/execution/host/host.hpp>
#include <omni/execution/state/state.hpp>
#include <omni/execution/test/counter_contract.hpp>
#include <omni/execution/test/mock_oracle.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>

using namespace omni;
using namespace omni::test;
using namespace evmc::literals;
using ::testing::_;
using ::testing::Eq;
using ::testing::InSequence;
using ::testing::StrictMock;

namespace
{
    constexpr auto ACCOUNT = 0xb82dc4c4e3a65629eecd6ed568d2cf567eb74e79_address;
    constexpr auto IMPLEMENTATION =
        0x00000000000000000000000000000000000000b2_address;
    constexpr auto COUNTER =
        0x00000000000000000000000000000000000000c3_address;
    constexpr auto EOA = 0x0000000000000000000000000000000000000b0b_address;
    constexpr auto FUNDER = 0x00000000000000000000000000000000000f00d5_address;

    constexpr auto SVM_VM_TYPE = abi_encode_signature_hash("svm");

    constexpr auto PAYLOAD_HASH =
        0x9fadd6f155fe407e361bd9015fb3193c74df299b591a793843cb5f3963d5a815_bytes32;
    constexpr auto PAYLOAD_HASH_TX =
        0xfffeaadba953caf445cbaffa21df4ded4faaa3d512f2a02cb682a1105b0cb5f4_bytes32;

    Identity solana_identity()
    {
        byte_string owner;
        for (unsigned char i = 1; i <= 32; ++i) {
            owner.push_back(i);
        }
        return Identity{
            .chain_namespace = "solana", .chain_id = "101", .owner = owner};
    }

    std::optional<AccountError> engine_error(evmc::Result const &result)
    {
        return decode_account_error({result.output_data, result.output_size});
    }

    struct AccountTest : ::testing::Test
    {
        State state{};
        Host host{state, 1'000};
        StrictMock<MockOracle> oracle{};
        std::shared_ptr<AccountImplementation const> implementation{
            std::make_shared<AccountImplementation const>(
                SVM_VM_TYPE, IMPLEMENTATION, oracle)};
        ControlledAccount account{host, ACCOUNT, "1", implementation};
        CounterContract counter{};

        byte_string const signature = byte_string(64, 0x5a);
        byte_string const tx_hash = byte_string(32, 0x7e);

        void SetUp() override
        {
            host.install(COUNTER, counter);
            host.install(ACCOUNT, account);
            state.create_account(ACCOUNT);
            ASSERT_TRUE(account.initialize(solana_identity()).has_value());
        }

        static Payload set_counter_payload(
            VerificationType const type = VerificationType::SignatureBased)
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
                .verification_type = type};
        }

        template <typename HashMatcher>
        void expect_signature(HashMatcher const &hash, bool const accepted)
        {
            EXPECT_CALL(
                oracle,
                verify_signature(
                    BytesEq(solana_identity().owner), hash, BytesEq(signature)))
                .WillOnce(verdict(accepted));
        }

        uint256_t balance(Address const &address) const
        {
            return intx::be::load<uint256_t>(state.get_balance(address));
        }
    };
}

TEST(AccountError, selectors)
{
    EXPECT_EQ(
        account_error_selector(AccountError::ExpiredDeadline), 0xf87d9271);
    EXPECT_EQ(
        encode_account_error(AccountError::ExecutionFailed),
        evmc::from_hex("0xacfdb444").value());
    EXPECT_EQ(
        decode_account_error(
            encode_account_error(AccountError::PrecompileCallFailed)),
        AccountError::PrecompileCallFailed);
    EXPECT_EQ(decode_account_error({}), std::nullopt);
    EXPECT_EQ(
        decode_account_error(CounterContract::error_string("boom")),
        std::nullopt);
}

TEST_F(AccountTest, initialize_exactly_once)
{
    EXPECT_TRUE(account.is_initialized());
    ASSERT_NE(account.identity(), nullptr);
    EXPECT_EQ(*account.identity(), solana_identity());
    EXPECT_EQ(account.nonce(), 0);
    EXPECT_EQ(account.address(), ACCOUNT);
    EXPECT_EQ(account.implementation().vm_type_hash(), SVM_VM_TYPE);

    auto const same = account.initialize(solana_identity());
    ASSERT_TRUE(same.has_error());
    EXPECT_EQ(same.assume_error(), AccountError::AccountAlreadyExists);

    Identity other = solana_identity();
    other.chain_id = "102";
    auto const different = account.initialize(other);
    ASSERT_TRUE(different.has_error());
    EXPECT_EQ(different.assume_error(), AccountError::AccountAlreadyExists);

    EXPECT_EQ(*account.identity(), solana_identity());
}

TEST_F(AccountTest, uninitialized)
{
    ControlledAccount fresh{host, EOA, "1", implementation};
    EXPECT_FALSE(fresh.is_initialized());
    EXPECT_EQ(fresh.identity(), nullptr);
    EXPECT_EQ(
        fresh.domain_separator().assume_error(),
        AccountError::AccountNotInitialized);
    EXPECT_EQ(
        fresh.compute_payload_hash(set_counter_payload()).assume_error(),
        AccountError::AccountNotInitialized);

    auto const result = fresh.execute_payload(set_counter_payload(), signature);
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(engine_error(result), AccountError::AccountNotInitialized);
}

TEST_F(AccountTest, domain_separator)
{
    EXPECT_EQ(
        account.domain_separator().value(),
        0xd09965232e886b2c45a3057110bb06fe3ca79b3b8273478e2bfcec962c03d47a_bytes32);
}

TEST_F(AccountTest, payload_hash)
{
    auto const hash = account.compute_payload_hash(set_counter_payload());
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash.value(), PAYLOAD_HASH);
    EXPECT_EQ(
        account.compute_payload_hash(set_counter_payload()).value(),
        PAYLOAD_HASH);
    EXPECT_EQ(
        account
            .compute_payload_hash(
                set_counter_payload(VerificationType::TxHashBased))
            .value(),
        PAYLOAD_HASH_TX);
}

TEST_F(AccountTest, deadline_is_inclusive)
{
    auto const payload = set_counter_payload();

    host.set_timestamp(payload.deadline);
    EXPECT_TRUE(account.compute_payload_hash(payload).has_value());

    host.set_timestamp(payload.deadline + 1);
    auto const expired = account.compute_payload_hash(payload);
    ASSERT_TRUE(expired.has_error());
    EXPECT_EQ(expired.assume_error(), AccountError::ExpiredDeadline);
}

TEST_F(AccountTest, expired_payload_is_not_verified)
{
    host.set_timestamp(2'001);
    auto const result = account.execute_payload(set_counter_payload(), signature);
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(engine_error(result), AccountError::ExpiredDeadline);
    EXPECT_EQ(account.nonce(), 0);
}

TEST_F(AccountTest, execute_at_deadline)
{
    host.set_timestamp(2'000);
    expect_signature(PAYLOAD_HASH, true);
    auto const result = account.execute_payload(set_counter_payload(), signature);
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(account.nonce(), 1);
}

TEST_F(AccountTest, verify_by_signature)
{
    {
        InSequence seq;
        expect_signature(PAYLOAD_HASH, true);
        expect_signature(PAYLOAD_HASH, false);
        EXPECT_CALL(oracle, verify_signature(_, _, _))
            .WillOnce(oracle_failure());
    }

    auto const accepted = account.verify_by_signature(PAYLOAD_HASH, signature);
    ASSERT_TRUE(accepted.has_value());
    EXPECT_TRUE(accepted.value());

    auto const rejected = account.verify_by_signature(PAYLOAD_HASH, signature);
    ASSERT_TRUE(rejected.has_value());
    EXPECT_FALSE(rejected.value());

    auto const failed = account.verify_by_signature(PAYLOAD_HASH, signature);
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.assume_error(), AccountError::PrecompileCallFailed);
}

TEST_F(AccountTest, verify_by_tx_hash)
{
    {
        InSequence seq;
        EXPECT_CALL(
            oracle,
            verify_native_tx_hash(
                Eq("solana"),
                Eq("101"),
                BytesEq(solana_identity().owner),
                Eq(PAYLOAD_HASH_TX),
                BytesEq(tx_hash)))
            .WillOnce(verdict(true));
        EXPECT_CALL(oracle, verify_native_tx_hash(_, _, _, _, _))
            .WillOnce(verdict(false));
        EXPECT_CALL(oracle, verify_native_tx_hash(_, _, _, _, _))
            .WillOnce(oracle_failure());
    }

    EXPECT_TRUE(account.verify_by_tx_hash(PAYLOAD_HASH_TX, tx_hash).value());
    EXPECT_FALSE(account.verify_by_tx_hash(PAYLOAD_HASH_TX, tx_hash).value());
    EXPECT_EQ(
        account.verify_by_tx_hash(PAYLOAD_HASH_TX, tx_hash).assume_error(),
        AccountError::PrecompileCallFailed);
}

TEST_F(AccountTest, empty_tx_hash_skips_oracle)
{
    EXPECT_CALL(oracle, verify_native_tx_hash(_, _, _, _, _)).Times(0);

    auto const res = account.verify_by_tx_hash(PAYLOAD_HASH_TX, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AccountError::InvalidTxHash);

    auto const result = account.execute_payload(
        set_counter_payload(VerificationType::TxHashBased), {});
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(engine_error(result), AccountError::InvalidTxHash);
    EXPECT_EQ(account.nonce(), 0);
}

TEST_F(AccountTest, execute_sets_counter)
{
    expect_signature(PAYLOAD_HASH, true);

    auto const payload = set_counter_payload();
    auto const result = account.execute_payload(payload, signature);
    ASSERT_EQ(result.status_code, EVMC_SUCCESS);

    EXPECT_EQ(CounterContract::value(state, COUNTER), uint256_t{42});
    EXPECT_EQ(account.nonce(), 1);
    EXPECT_EQ(state.version(), 0);

    ASSERT_EQ(state.logs().size(), 1);
    auto const &log = state.logs()[0];
    EXPECT_EQ(log.address, ACCOUNT);
    ASSERT_EQ(log.topics.size(), 2);
    EXPECT_EQ(
        log.topics[0],
        abi_encode_signature_hash("PayloadExecuted(bytes,address,bytes)"));
    EXPECT_EQ(log.topics[1], abi_encode_address(COUNTER));
    EXPECT_EQ(
        log.data,
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000040"
            "0000000000000000000000000000000000000000000000000000000000000080"
            "0000000000000000000000000000000000000000000000000000000000000020"
            "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"
            "0000000000000000000000000000000000000000000000000000000000000024"
            "8bb5d9c3000000000000000000000000000000000000000000000000000000000000002a"
            "00000000000000000000000000000000000000000000000000000000")
            .value());
}

TEST_F(AccountTest, execute_by_tx_hash)
{
    EXPECT_CALL(
        oracle,
        verify_native_tx_hash(_, _, _, Eq(PAYLOAD_HASH_TX), BytesEq(tx_hash)))
        .WillOnce(verdict(true));

    auto const result = account.execute_payload(
        set_counter_payload(VerificationType::TxHashBased), tx_hash);
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(CounterContract::value(state, COUNTER), uint256_t{42});
    EXPECT_EQ(account.nonce(), 1);
}

TEST_F(AccountTest, rejected_signature)
{
    expect_signature(PAYLOAD_HASH, false);

    auto const result = account.execute_payload(set_counter_payload(), signature);
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(engine_error(result), AccountError::InvalidSignature);
    EXPECT_EQ(account.nonce(), 0);
    EXPECT_EQ(CounterContract::value(state, COUNTER), uint256_t{0});
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(AccountTest, rejected_tx_hash)
{
    EXPECT_CALL(oracle, verify_native_tx_hash(_, _, _, _, _))
        .WillOnce(verdict(false));

    auto const result = account.execute_payload(
        set_counter_payload(VerificationType::TxHashBased), tx_hash);
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(engine_error(result), AccountError::InvalidTxHash);
    EXPECT_EQ(account.nonce(), 0);
    EXPECT_EQ(CounterContract::value(state, COUNTER), uint256_t{0});
}

TEST_F(AccountTest, oracle_failure_on_both_paths)
{
    EXPECT_CALL(oracle, verify_signature(_, _, _)).WillOnce(oracle_failure());
    EXPECT_CALL(oracle, verify_native_tx_hash(_, _, _, _, _))
        .WillOnce(oracle_failure());

    auto const by_signature =
        account.execute_payload(set_counter_payload(), signature);
    EXPECT_EQ(engine_error(by_signature), AccountError::PrecompileCallFailed);

    auto const by_tx_hash = account.execute_payload(
        set_counter_payload(VerificationType::TxHashBased), tx_hash);
    EXPECT_EQ(engine_error(by_tx_hash), AccountError::PrecompileCallFailed);

    EXPECT_EQ(account.nonce(), 0);
}

TEST_F(AccountTest, revert_reason_is_forwarded)
{
    expect_signature(_, true);

    auto payload = set_counter_payload();
    payload.data = CounterContract::call_data(CounterContract::Selector::FAIL);
    auto const result = account.execute_payload(payload, signature);

    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(
        byte_string(result.output_data, result.output_size),
        CounterContract::error_string("boom"));
    EXPECT_EQ(engine_error(result), std::nullopt);
    EXPECT_EQ(account.nonce(), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(AccountTest, silent_revert_is_execution_failed)
{
    expect_signature(_, true);

    auto payload = set_counter_payload();
    payload.data =
        CounterContract::call_data(CounterContract::Selector::FAIL_SILENTLY);
    auto const result = account.execute_payload(payload, signature);

    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(engine_error(result), AccountError::ExecutionFailed);
    EXPECT_EQ(account.nonce(), 0);
}

TEST_F(AccountTest, empty_data_to_contract_without_receive)
{
    expect_signature(_, true);

    auto payload = set_counter_payload();
    payload.data.clear();
    auto const result = account.execute_payload(payload, signature);

    EXPECT_EQ(engine_error(result), AccountError::ExecutionFailed);
    EXPECT_EQ(account.nonce(), 0);
}

TEST_F(AccountTest, value_transfer)
{
    state.add_to_balance(ACCOUNT, 100);
    expect_signature(_, true);

    Payload payload = set_counter_payload();
    payload.to = EOA;
    payload.value = 40;
    payload.data.clear();
    auto const result = account.execute_payload(payload, signature);

    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(balance(ACCOUNT), uint256_t{60});
    EXPECT_EQ(balance(EOA), uint256_t{40});
    EXPECT_EQ(account.nonce(), 1);
}

TEST_F(AccountTest, insufficient_balance_is_execution_failed)
{
    state.add_to_balance(ACCOUNT, 10);
    expect_signature(_, true);

    Payload payload = set_counter_payload();
    payload.to = EOA;
    payload.value = 11;
    payload.data.clear();
    auto const result = account.execute_payload(payload, signature);

    EXPECT_EQ(engine_error(result), AccountError::ExecutionFailed);
    EXPECT_EQ(balance(ACCOUNT), uint256_t{10});
    EXPECT_FALSE(state.account_exists(EOA));
}

TEST_F(AccountTest, nonce_advances_once_per_success)
{
    EXPECT_CALL(oracle, verify_signature(_, _, _))
        .WillRepeatedly(verdict(true));

    auto payload = set_counter_payload();
    auto const failing = [&] {
        auto p = payload;
        p.data = CounterContract::call_data(CounterContract::Selector::FAIL);
        return p;
    }();

    uint64_t expected = 0;
    for (unsigned i = 0; i < 6; ++i) {
        bool const succeed = i % 2 == 0;
        auto const result =
            account.execute_payload(succeed ? payload : failing, signature);
        EXPECT_EQ(result.status_code == EVMC_SUCCESS, succeed);
        if (succeed) {
            ++expected;
        }
        EXPECT_EQ(account.nonce(), expected);
    }
    EXPECT_EQ(state.logs().size(), expected);
}

TEST_F(AccountTest, hash_is_single_use)
{
    auto const payload = set_counter_payload();
    auto const first = account.compute_payload_hash(payload).value();
    EXPECT_EQ(first, PAYLOAD_HASH);

    // the oracle only ever approved the first hash
    EXPECT_CALL(oracle, verify_signature(_, Eq(first), _))
        .WillOnce(verdict(true));
    EXPECT_CALL(
        oracle,
        verify_signature(_, ::testing::Not(Eq(first)), _))
        .WillOnce(verdict(false));

    EXPECT_EQ(
        account.execute_payload(payload, signature).status_code, EVMC_SUCCESS);

    auto const second = account.compute_payload_hash(payload).value();
    EXPECT_NE(second, first);

    auto const replay = account.execute_payload(payload, signature);
    EXPECT_EQ(engine_error(replay), AccountError::InvalidSignature);
    EXPECT_EQ(account.nonce(), 1);
}

TEST_F(AccountTest, nonce_is_account_storage)
{
    EXPECT_CALL(oracle, verify_signature(_, _, _))
        .WillRepeatedly(verdict(true));

    EXPECT_EQ(
        state.get_storage(ACCOUNT, ControlledAccount::NONCE_SLOT),
        bytes32_t{});

    ASSERT_EQ(
        account.execute_payload(set_counter_payload(), signature).status_code,
        EVMC_SUCCESS);
    EXPECT_EQ(
        state.get_storage(ACCOUNT, ControlledAccount::NONCE_SLOT),
        0x0000000000000001000000000000000000000000000000000000000000000000_bytes32);

    // an enclosing checkpoint that is rejected takes the increment with it
    state.push();
    ASSERT_EQ(
        account.execute_payload(set_counter_payload(), signature).status_code,
        EVMC_SUCCESS);
    EXPECT_EQ(account.nonce(), 2);
    state.pop_reject();

    EXPECT_EQ(account.nonce(), 1);
    EXPECT_EQ(state.logs().size(), 1);
}

TEST_F(AccountTest, passive_receive)
{
    state.add_to_balance(FUNDER, 50);
    evmc_message msg{
        .kind = EVMC_CALL,
        .flags = 0,
        .depth = 0,
        .gas = 21'000,
        .recipient = ACCOUNT,
        .sender = FUNDER,
        .input_data = nullptr,
        .input_size = 0,
        .value = to_bytes(uint256_t{20}),
        .create2_salt = {},
        .code_address = ACCOUNT,
        .code = nullptr,
        .code_size = 0,
    };
    EXPECT_EQ(host.call(msg).status_code, EVMC_SUCCESS);
    EXPECT_EQ(balance(ACCOUNT), uint256_t{20});
    EXPECT_EQ(account.nonce(), 0);

    byte_string const data{0x01};
    msg.input_data = data.data();
    msg.input_size = data.size();
    EXPECT_EQ(host.call(msg).status_code, EVMC_REVERT);
    EXPECT_EQ(balance(ACCOUNT), uint256_t{20});
    EXPECT_EQ(balance(FUNDER), uint256_t{30});
}
