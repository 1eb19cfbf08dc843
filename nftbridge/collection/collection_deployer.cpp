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

#include <nftbridge/collection/collection_deployer.hpp>
#include <nftbridge/collection/create_contract_address.hpp>
#include <nftbridge/collection/external_call_error.hpp>
#include <nftbridge/contract/abi_encode.hpp>
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/fmt/address_fmt.hpp>
#include <nftbridge/core/fmt/int_fmt.hpp>
#include <nftbridge/core/keccak.hpp>
#include <nftbridge/core/likely.h>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <string_view>

NFTBRIDGE_NAMESPACE_BEGIN

byte_string bridgeable_collection_init_code(
    CollectionTemplate const &tmpl, std::string_view const name,
    std::string_view const symbol, Address const &controller)
{
    AbiEncoder encoder;
    encoder.add_string(name);
    encoder.add_string(symbol);
    encoder.add_address(controller);
    encoder.add_address(controller);
    return tmpl.init_code + encoder.encode_final();
}

Address bridgeable_collection_address(
    CollectionTemplate const &tmpl, uint256_t const &salt_seed,
    std::string_view const name, std::string_view const symbol,
    Address const &controller)
{
    auto const init_code =
        bridgeable_collection_init_code(tmpl, name, symbol, controller);
    return create2_contract_address(
        controller, to_big_endian_bytes(salt_seed), keccak256(init_code));
}

Result<Address> deploy_bridgeable_collection(
    evmc::HostInterface &host, CollectionTemplate const &tmpl,
    uint256_t const &salt_seed, std::string_view const name,
    std::string_view const symbol, Address const &controller)
{
    auto const init_code =
        bridgeable_collection_init_code(tmpl, name, symbol, controller);
    bytes32_t const salt = to_big_endian_bytes(salt_seed);
    Address const expected =
        create2_contract_address(controller, salt, keccak256(init_code));

    evmc_message msg{};
    msg.kind = EVMC_CREATE2;
    msg.gas = tmpl.gas;
    msg.sender = controller;
    msg.input_data = init_code.data();
    msg.input_size = init_code.size();
    msg.create2_salt = salt;

    evmc::Result const result = host.call(msg);
    if (NFTBRIDGE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        LOG_ERROR(
            "deploying collection {} with salt {} failed, status {}",
            name,
            salt_seed,
            static_cast<int>(result.status_code));
        return ExternalCallError::CreateFailed;
    }

    Address const created{result.create_address};
    if (NFTBRIDGE_UNLIKELY(created != expected)) {
        LOG_ERROR(
            "collection {} deployed at {}, expected {}",
            name,
            created,
            expected);
        return ExternalCallError::CreateAddressMismatch;
    }

    LOG_INFO("deployed collection {} ({}) at {}", name, symbol, created);
    return created;
}

NFTBRIDGE_NAMESPACE_END
