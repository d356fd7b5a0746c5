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

#include <omni/core/basic_formatter.hpp>
#include <omni/core/byte_string.hpp>
#include <omni/core/bytes.hpp>
#include <omni/core/int.hpp>
#include <omni/core/log_level_map.hpp>
#include <omni/execution/account/identity.hpp>
#include <omni/execution/account/payload.hpp>
#include <omni/execution/account/payload_hash.hpp>
#include <omni/execution/core/address.hpp>
#include <omni/execution/core/fmt/address_fmt.hpp>
#include <omni/execution/core/fmt/bytes_fmt.hpp>
#include <omni/execution/registry/registry.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

using namespace omni;

namespace
{
    template <typename T>
    CLI::Validator hex_validator(std::string const &name)
    {
        return CLI::Validator(
            [](std::string &s) -> std::string {
                if (!evmc::from_hex<T>(s).has_value()) {
                    return "invalid hex value: " + s;
                }
                return {};
            },
            name);
    }

    CLI::Validator const hex_bytes_validator(
        [](std::string &s) -> std::string {
            if (!evmc::from_hex(s).has_value()) {
                return "invalid hex bytes: " + s;
            }
            return {};
        },
        "HEX");

    CLI::Validator const chain_namespace_validator(
        [](std::string &s) -> std::string {
            if (!is_valid_chain_namespace(s)) {
                return "invalid CAIP-2 namespace: " + s;
            }
            return {};
        },
        "NAMESPACE");

    CLI::Validator const uint256_validator(
        [](std::string &s) -> std::string {
            try {
                (void)intx::from_string<uint256_t>(s);
            }
            catch (std::exception const &) {
                return "invalid 256-bit integer: " + s;
            }
            return {};
        },
        "UINT256");

    std::unordered_map<std::string, VerificationType> const
        verification_type_map = {
            {"signature", VerificationType::SignatureBased},
            {"tx_hash", VerificationType::TxHashBased}};
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"omni-account"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    std::string version{"1"};
    std::string registry{"0x0000000000000000000000000000000000000000"};
    auto log_level = quill::LogLevel::Warning;

    cli.add_option("--version", version, "protocol version string");
    cli.add_option("--registry", registry, "registry (deployer) address")
        ->check(hex_validator<Address>("ADDRESS"));
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    std::string chain_namespace;
    std::string chain_id;
    std::string owner;
    std::string implementation;
    std::string vm_type;

    auto *const address_cmd = cli.add_subcommand(
        "address", "derive the account address of an identity");
    address_cmd->add_option("--namespace", chain_namespace, "chain namespace")
        ->required()
        ->check(chain_namespace_validator);
    address_cmd->add_option("--chain_id", chain_id, "chain id")->required();
    address_cmd->add_option("--owner", owner, "owner key bytes")
        ->required()
        ->check(hex_bytes_validator);
    address_cmd
        ->add_option(
            "--implementation", implementation, "implementation address")
        ->required()
        ->check(hex_validator<Address>("ADDRESS"));
    address_cmd->add_option("--vm_type", vm_type, "vm type hash")
        ->required()
        ->check(hex_validator<bytes32_t>("BYTES32"));

    std::string account;

    auto *const domain_cmd = cli.add_subcommand(
        "domain", "compute the domain separator of an account");
    domain_cmd->add_option("--chain_id", chain_id, "source chain id")
        ->required();
    domain_cmd->add_option("--account", account, "account address")
        ->required()
        ->check(hex_validator<Address>("ADDRESS"));

    std::string to;
    std::string value{"0"};
    std::string data{"0x"};
    uint64_t gas_limit = 0;
    std::string max_fee_per_gas{"0"};
    std::string max_priority_fee_per_gas{"0"};
    uint64_t nonce = 0;
    uint64_t deadline = 0;
    auto verification_type = VerificationType::SignatureBased;

    auto *const hash_cmd =
        cli.add_subcommand("hash", "compute the typed hash of a payload");
    hash_cmd->add_option("--chain_id", chain_id, "source chain id")
        ->required();
    hash_cmd->add_option("--account", account, "account address")
        ->required()
        ->check(hex_validator<Address>("ADDRESS"));
    hash_cmd->add_option("--to", to, "call target")
        ->required()
        ->check(hex_validator<Address>("ADDRESS"));
    hash_cmd->add_option("--value", value, "call value in wei")
        ->check(uint256_validator);
    hash_cmd->add_option("--data", data, "call data")->check(
        hex_bytes_validator);
    hash_cmd->add_option("--gas_limit", gas_limit, "gas limit");
    hash_cmd->add_option("--max_fee", max_fee_per_gas, "max fee per gas")
        ->check(uint256_validator);
    hash_cmd
        ->add_option(
            "--max_priority_fee",
            max_priority_fee_per_gas,
            "max priority fee per gas")
        ->check(uint256_validator);
    hash_cmd->add_option("--nonce", nonce, "current account nonce");
    hash_cmd->add_option("--deadline", deadline, "unix timestamp")
        ->required();
    hash_cmd->add_option("--type", verification_type, "verification type")
        ->transform(
            CLI::CheckedTransformer(verification_type_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) %(file_name):%(line_number) LOG_%(log_level)\t%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    Address const registry_address = evmc::from_hex<Address>(registry).value();

    if (address_cmd->parsed()) {
        Identity const identity{
            .chain_namespace = chain_namespace,
            .chain_id = chain_id,
            .owner = evmc::from_hex(owner).value()};
        LOG_INFO(
            "deriving address of {} for registry {}",
            chain_key(identity),
            registry_address);
        std::cout << fmt::format(
                         "chain_key      {}\n"
                         "identity_hash  {}\n"
                         "address        {}\n",
                         chain_key(identity),
                         identity_hash(identity),
                         derive_account_address(
                             registry_address,
                             identity,
                             evmc::from_hex<Address>(implementation).value(),
                             evmc::from_hex<bytes32_t>(vm_type).value()));
    }
    else if (domain_cmd->parsed()) {
        std::cout << fmt::format(
            "{}\n",
            domain_separator(
                version, chain_id, evmc::from_hex<Address>(account).value()));
    }
    else if (hash_cmd->parsed()) {
        Payload const payload{
            .to = evmc::from_hex<Address>(to).value(),
            .value = intx::from_string<uint256_t>(value),
            .data = evmc::from_hex(data).value(),
            .gas_limit = gas_limit,
            .max_fee_per_gas = intx::from_string<uint256_t>(max_fee_per_gas),
            .max_priority_fee_per_gas =
                intx::from_string<uint256_t>(max_priority_fee_per_gas),
            .nonce = nonce,
            .deadline = deadline,
            .verification_type = verification_type};
        bytes32_t const domain = domain_separator(
            version, chain_id, evmc::from_hex<Address>(account).value());
        bytes32_t const struct_hash = payload_struct_hash(payload, nonce);
        std::cout << fmt::format(
            "domain_separator  {}\n"
            "struct_hash       {}\n"
            "payload_hash      {}\n",
            domain,
            struct_hash,
            typed_payload_hash(domain, struct_hash));
    }

    return 0;
}
