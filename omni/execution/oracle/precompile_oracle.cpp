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

#include <omni/execution/oracle/precompile_oracle.hpp>

#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/config.hpp>
#include <omni/core/likely.h>
#include <omni/core/result.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/contract/abi_decode.hpp>
#include <omni/execution/core/contract/abi_encode.hpp>
#include <omni/execution/core/contract/abi_signatures.hpp>
#include <omni/execution/core/contract/big_endian.hpp>
#include <omni/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <omni/execution/host/host.hpp>
#include <omni/execution/oracle/oracle_error.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <string_view>

OMNI_ANONYMOUS_NAMESPACE_BEGIN

static_assert(
    PrecompileOracle::Selector::VERIFY_SIGNATURE ==
    abi_encode_selector("verifySignature(bytes,bytes32,bytes)"));
static_assert(
    PrecompileOracle::Selector::VERIFY_NATIVE_TX_HASH ==
    abi_encode_selector(
        "verifyNativeTxHash(string,string,bytes,bytes32,bytes)"));

byte_string with_selector(uint32_t const selector, AbiEncoder &encoder)
{
    u32_be const s{selector};
    byte_string input{s.bytes, sizeof(u32_be)};
    input += encoder.encode_final();
    return input;
}

OMNI_ANONYMOUS_NAMESPACE_END

OMNI_NAMESPACE_BEGIN

PrecompileOracle::PrecompileOracle(Host &host, Address const &address)
    : host_{host}
    , address_{address}
{
}

Address const &PrecompileOracle::address() const
{
    return address_;
}

Result<bool> PrecompileOracle::call(byte_string const &input)
{
    evmc_message const msg{
        .kind = EVMC_CALL,
        .flags = static_cast<uint32_t>(EVMC_STATIC),
        .depth = 1,
        .gas = CALL_GAS,
        .recipient = address_,
        .sender = Address{},
        .input_data = input.data(),
        .input_size = input.size(),
        .value = {},
        .create2_salt = {},
        .code_address = address_,
        .code = nullptr,
        .code_size = 0,
    };

    evmc::Result const result = host_.call(msg);
    if (OMNI_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        LOG_DEBUG(
            "oracle call to {} failed with status {}",
            address_,
            static_cast<int>(result.status_code));
        return OracleError::CallFailed;
    }

    byte_string_view output{result.output_data, result.output_size};
    if (OMNI_UNLIKELY(output.size() != sizeof(bytes32_t))) {
        return OracleError::MalformedOutput;
    }
    auto const verdict = abi_decode_bool(output);
    if (OMNI_UNLIKELY(verdict.has_error())) {
        return OracleError::MalformedOutput;
    }
    return verdict.value();
}

Result<bool> PrecompileOracle::verify_signature(
    byte_string_view const owner, bytes32_t const &message_hash,
    byte_string_view const signature)
{
    AbiEncoder encoder;
    encoder.add_bytes(owner);
    encoder.add_bytes32(message_hash);
    encoder.add_bytes(signature);
    return call(with_selector(Selector::VERIFY_SIGNATURE, encoder));
}

Result<bool> PrecompileOracle::verify_native_tx_hash(
    std::string_view const chain_namespace, std::string_view const chain_id,
    byte_string_view const owner, bytes32_t const &payload_hash,
    byte_string_view const tx_hash)
{
    AbiEncoder encoder;
    encoder.add_string(chain_namespace);
    encoder.add_string(chain_id);
    encoder.add_bytes(owner);
    encoder.add_bytes32(payload_hash);
    encoder.add_bytes(tx_hash);
    return call(with_selector(Selector::VERIFY_NATIVE_TX_HASH, encoder));
}

OMNI_NAMESPACE_END
