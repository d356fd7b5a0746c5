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

#include <omni/execution/account/account.hpp>

#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/likely.h>
#include <omni/core/result.hpp>
#include <omni/execution/account/account_error.hpp>
#include <omni/execution/account/account_implementation.hpp>
#include <omni/execution/account/identity.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/account/payload_hash.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/contract/abi_encode.hpp>
#include <omni/execution/core/contract/abi_signatures.hpp>
#include <omni/execution/core/contract/big_endian.hpp>
#include <omni/execution/core/contract/events.hpp>
#include <omni/execution/core/contract/storage_variable.hpp>
#include <omni/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <omni/execution/host/host.hpp>
#include <omni/execution/oracle/verification_oracle.hpp>
#include <omni/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>

OMNI_ANONYMOUS_NAMESPACE_BEGIN

using namespace evmc::literals;

constexpr bytes32_t PAYLOAD_EXECUTED =
    abi_encode_signature_hash("PayloadExecuted(bytes,address,bytes)");
static_assert(
    PAYLOAD_EXECUTED ==
    0xafc6dd5d2ec56ba31e4cd9723889549a104622ecdb580761d055cde575365b7d_bytes32);

evmc::Result revert(AccountError const error, int64_t const gas_left = 0)
{
    byte_string const output = encode_account_error(error);
    return evmc::Result{EVMC_REVERT, gas_left, 0, output.data(), output.size()};
}

template <typename Error>
AccountError to_account_error(Error const &error)
{
    for (auto const e :
         {AccountError::AccountAlreadyExists,
          AccountError::AccountNotInitialized,
          AccountError::ExpiredDeadline,
          AccountError::InvalidSignature,
          AccountError::InvalidTxHash,
          AccountError::PrecompileCallFailed,
          AccountError::ExecutionFailed}) {
        if (error == e) {
            return e;
        }
    }
    LOG_WARNING("unexpected account error: {}", error.message().c_str());
    return AccountError::ExecutionFailed;
}

OMNI_ANONYMOUS_NAMESPACE_END

OMNI_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

ControlledAccount::ControlledAccount(
    Host &host, Address const &address, std::string version,
    std::shared_ptr<AccountImplementation const> implementation)
    : host_{host}
    , address_{address}
    , version_{std::move(version)}
    , implementation_{std::move(implementation)}
{
}

Result<void> ControlledAccount::initialize(Identity identity)
{
    if (OMNI_UNLIKELY(identity_.has_value())) {
        return AccountError::AccountAlreadyExists;
    }
    identity_ = std::move(identity);
    LOG_DEBUG("account {} bound to {}", address_, chain_key(*identity_));
    return success();
}

bool ControlledAccount::is_initialized() const
{
    return identity_.has_value();
}

Identity const *ControlledAccount::identity() const
{
    return identity_ ? &*identity_ : nullptr;
}

uint64_t ControlledAccount::nonce() const
{
    StorageVariable<u64_be> const nonce{host_.state(), address_, NONCE_SLOT};
    return nonce.load().native();
}

void ControlledAccount::increment_nonce()
{
    StorageVariable<u64_be> nonce{host_.state(), address_, NONCE_SLOT};
    nonce.store(nonce.load().native() + 1);
}

Address const &ControlledAccount::address() const
{
    return address_;
}

AccountImplementation const &ControlledAccount::implementation() const
{
    return *implementation_;
}

Result<bytes32_t> ControlledAccount::domain_separator() const
{
    if (OMNI_UNLIKELY(!identity_)) {
        return AccountError::AccountNotInitialized;
    }
    return ::omni::domain_separator(version_, identity_->chain_id, address_);
}

Result<bytes32_t>
ControlledAccount::compute_payload_hash(Payload const &payload) const
{
    BOOST_OUTCOME_TRY(auto const domain, domain_separator());
    if (OMNI_UNLIKELY(host_.timestamp() > payload.deadline)) {
        return AccountError::ExpiredDeadline;
    }
    return typed_payload_hash(domain, payload_struct_hash(payload, nonce()));
}

Result<bool> ControlledAccount::verify_by_signature(
    bytes32_t const &message_hash, byte_string_view const signature)
{
    if (OMNI_UNLIKELY(!identity_)) {
        return AccountError::AccountNotInitialized;
    }
    auto const verdict = implementation_->oracle().verify_signature(
        identity_->owner, message_hash, signature);
    if (OMNI_UNLIKELY(verdict.has_error())) {
        LOG_WARNING(
            "signature verification for {} failed: {}",
            address_,
            verdict.error().message().c_str());
        return AccountError::PrecompileCallFailed;
    }
    return verdict.value();
}

Result<bool> ControlledAccount::verify_by_tx_hash(
    bytes32_t const &payload_hash, byte_string_view const tx_hash)
{
    if (OMNI_UNLIKELY(!identity_)) {
        return AccountError::AccountNotInitialized;
    }
    if (OMNI_UNLIKELY(tx_hash.empty())) {
        return AccountError::InvalidTxHash;
    }
    auto const verdict = implementation_->oracle().verify_native_tx_hash(
        identity_->chain_namespace,
        identity_->chain_id,
        identity_->owner,
        payload_hash,
        tx_hash);
    if (OMNI_UNLIKELY(verdict.has_error())) {
        LOG_WARNING(
            "tx hash verification for {} failed: {}",
            address_,
            verdict.error().message().c_str());
        return AccountError::PrecompileCallFailed;
    }
    return verdict.value();
}

evmc::Result ControlledAccount::execute(
    Payload const &payload, byte_string_view const proof)
{
    if (OMNI_UNLIKELY(!identity_)) {
        return revert(AccountError::AccountNotInitialized);
    }

    auto const payload_hash = compute_payload_hash(payload);
    if (OMNI_UNLIKELY(payload_hash.has_error())) {
        return revert(to_account_error(payload_hash.error()));
    }

    bool const tx_hash_based =
        payload.verification_type == VerificationType::TxHashBased;
    auto const verified =
        tx_hash_based ? verify_by_tx_hash(payload_hash.value(), proof)
                      : verify_by_signature(payload_hash.value(), proof);
    if (OMNI_UNLIKELY(verified.has_error())) {
        return revert(to_account_error(verified.error()));
    }
    if (OMNI_UNLIKELY(!verified.value())) {
        return revert(
            tx_hash_based ? AccountError::InvalidTxHash
                          : AccountError::InvalidSignature);
    }

    int64_t const gas = static_cast<int64_t>(std::min<uint64_t>(
        payload.gas_limit,
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max())));
    evmc_message const msg{
        .kind = EVMC_CALL,
        .flags = 0,
        .depth = 1,
        .gas = gas,
        .recipient = payload.to,
        .sender = address_,
        .input_data = payload.data.empty() ? nullptr : payload.data.data(),
        .input_size = payload.data.size(),
        .value = to_bytes(payload.value),
        .create2_salt = {},
        .code_address = payload.to,
        .code = nullptr,
        .code_size = 0,
    };

    evmc::Result result = host_.call(msg);
    if (OMNI_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        LOG_DEBUG(
            "payload call from {} to {} failed with status {}",
            address_,
            payload.to,
            static_cast<int>(result.status_code));
        if (result.output_size == 0) {
            return revert(AccountError::ExecutionFailed, result.gas_left);
        }
        return evmc::Result{
            EVMC_REVERT,
            result.gas_left,
            0,
            result.output_data,
            result.output_size};
    }

    increment_nonce();

    AbiEncoder encoder;
    encoder.add_bytes(identity_->owner);
    encoder.add_bytes(payload.data);
    host_.state().store_log(EventBuilder(address_, PAYLOAD_EXECUTED)
                                .add_topic(abi_encode_address(payload.to))
                                .add_data(encoder.encode_final())
                                .build());

    return result;
}

evmc::Result ControlledAccount::execute_payload(
    Payload const &payload, byte_string_view const proof)
{
    State &state = host_.state();
    state.push();
    evmc::Result result = execute(payload, proof);
    if (result.status_code == EVMC_SUCCESS) {
        state.pop_accept();
        LOG_DEBUG("account {} executed payload, nonce {}", address_, nonce());
    }
    else {
        state.pop_reject();
    }
    return result;
}

evmc::Result ControlledAccount::call(Host &, evmc_message const &msg)
{
    if (msg.input_size == 0) {
        return evmc::Result{EVMC_SUCCESS, msg.gas};
    }
    return evmc::Result{EVMC_REVERT, msg.gas};
}

OMNI_NAMESPACE_END
