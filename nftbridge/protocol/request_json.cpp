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

#include <nftbridge/core/basic_formatter.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/fmt/address_fmt.hpp>
#include <nftbridge/protocol/request_header.hpp>
#include <nftbridge/protocol/request_json.hpp>
#include <nftbridge/protocol/word.hpp>

#include <evmc/evmc.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

NFTBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

char const *kind_name(CollectionKind const kind)
{
    switch (kind) {
    case CollectionKind::Erc721:
        return "erc721";
    case CollectionKind::Erc1155:
        return "erc1155";
    }
    throw std::invalid_argument("unknown collection kind");
}

CollectionKind kind_from_name(std::string const &name)
{
    if (name == "erc721") {
        return CollectionKind::Erc721;
    }
    if (name == "erc1155") {
        return CollectionKind::Erc1155;
    }
    throw std::invalid_argument("unknown collection kind: " + name);
}

uint8_t parse_version(nlohmann::json const &header)
{
    auto const version =
        header.value("version", int64_t{REQUEST_PROTOCOL_VERSION});
    if (version < 0 || version > std::numeric_limits<uint8_t>::max()) {
        throw std::invalid_argument(
            "version out of range: " + std::to_string(version));
    }
    return static_cast<uint8_t>(version);
}

Word parse_word(nlohmann::json const &j)
{
    return intx::from_string<Word>(j.get<std::string>());
}

Address parse_address(nlohmann::json const &j)
{
    auto const s = j.get<std::string>();
    auto const address = evmc::from_hex<Address>(s);
    if (!address.has_value()) {
        throw std::invalid_argument("invalid l1 address: " + s);
    }
    return *address;
}

L2Address parse_l2_address(nlohmann::json const &j)
{
    auto const res = word_to_l2_address(parse_word(j));
    if (res.has_error()) {
        throw std::invalid_argument(
            "invalid l2 address: " + j.get<std::string>());
    }
    return res.value();
}

NFTBRIDGE_ANONYMOUS_NAMESPACE_END

NFTBRIDGE_NAMESPACE_BEGIN

nlohmann::json to_json(Request const &request)
{
    auto json = nlohmann::json::object();

    json["header"] = {
        {"version", request.header.version},
        {"kind", kind_name(request.header.kind)},
        {"burn_auto", request.header.burn_auto},
        {"withdraw_auto", request.header.withdraw_auto}};
    json["hash"] = to_hex_word(request.hash);
    json["collection_l1"] = fmt::format("{}", request.collection_l1);
    json["collection_l2"] =
        request.collection_l2.has_value()
            ? nlohmann::json(fmt::format("{}", *request.collection_l2))
            : nlohmann::json(nullptr);
    json["owner_l1"] = fmt::format("{}", request.owner_l1);
    json["owner_l2"] = fmt::format("{}", request.owner_l2);
    json["name"] = request.name;
    json["symbol"] = request.symbol;
    json["uri"] = request.uri;

    auto &ids = json["token_ids"] = nlohmann::json::array();
    for (auto const &id : request.token_ids) {
        ids.push_back(to_hex_word(id));
    }
    auto &values = json["token_values"] = nlohmann::json::array();
    for (auto const &value : request.token_values) {
        values.push_back(to_hex_word(value));
    }
    json["token_uris"] = request.token_uris;
    auto &owners = json["new_owners"] = nlohmann::json::array();
    for (auto const &owner : request.new_owners) {
        owners.push_back(fmt::format("{}", owner));
    }

    return json;
}

Request request_from_json(nlohmann::json const &json)
{
    Request request;

    auto const &header = json.at("header");
    request.header.version = parse_version(header);
    request.header.kind = kind_from_name(header.at("kind").get<std::string>());
    request.header.burn_auto = header.value("burn_auto", false);
    request.header.withdraw_auto = header.value("withdraw_auto", false);

    request.hash = parse_word(json.at("hash"));
    request.collection_l1 = parse_address(json.at("collection_l1"));
    if (auto const &l2 = json.at("collection_l2"); !l2.is_null()) {
        auto const address = parse_l2_address(l2);
        if (!address.is_zero()) {
            request.collection_l2 = address;
        }
    }
    request.owner_l1 = parse_address(json.at("owner_l1"));
    request.owner_l2 = parse_l2_address(json.at("owner_l2"));
    request.name = json.value("name", std::string{});
    request.symbol = json.value("symbol", std::string{});
    request.uri = json.value("uri", std::string{});

    for (auto const &id : json.value("token_ids", nlohmann::json::array())) {
        request.token_ids.push_back(parse_word(id));
    }
    for (auto const &value :
         json.value("token_values", nlohmann::json::array())) {
        request.token_values.push_back(parse_word(value));
    }
    request.token_uris =
        json.value("token_uris", std::vector<std::string>{});
    for (auto const &owner :
         json.value("new_owners", nlohmann::json::array())) {
        request.new_owners.push_back(parse_l2_address(owner));
    }

    return request;
}

NFTBRIDGE_NAMESPACE_END
