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

#include <nftbridge/core/address.hpp>
#include <nftbridge/core/basic_formatter.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/protocol/request.hpp>
#include <nftbridge/protocol/request_codec.hpp>
#include <nftbridge/protocol/request_hash.hpp>
#include <nftbridge/protocol/request_header.hpp>
#include <nftbridge/protocol/request_json.hpp>
#include <nftbridge/protocol/request_route.hpp>
#include <nftbridge/protocol/word.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace nftbridge;

namespace
{
    std::unordered_map<std::string, quill::LogLevel> const log_level_map = {
        {"debug", quill::LogLevel::Debug},
        {"info", quill::LogLevel::Info},
        {"warning", quill::LogLevel::Warning},
        {"error", quill::LogLevel::Error},
        {"critical", quill::LogLevel::Critical},
        {"none", quill::LogLevel::None}};

    std::unordered_map<std::string, CollectionKind> const kind_map = {
        {"erc721", CollectionKind::Erc721},
        {"erc1155", CollectionKind::Erc1155}};

    // "-" reads standard input
    std::string read_input(std::string const &path)
    {
        if (path == "-") {
            std::stringstream buffer;
            buffer << std::cin.rdbuf();
            return buffer.str();
        }
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot open " + path);
        }
        return std::string(
            std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>());
    }

    int fail(char const *const what, std::string const &message)
    {
        LOG_ERROR("{} failed: {}", what, message);
        std::cerr << what << ": " << message << '\n';
        return EXIT_FAILURE;
    }

    int run_header(
        CollectionKind const kind, bool const burn_auto,
        bool const withdraw_auto, std::optional<std::string> const &decode)
    {
        if (!decode.has_value()) {
            std::cout << to_hex_word(
                             encode_request_header(
                                 kind, burn_auto, withdraw_auto))
                      << '\n';
            return EXIT_SUCCESS;
        }

        Word const word = intx::from_string<Word>(*decode);
        auto const header = decode_request_header(word);
        if (header.has_error()) {
            return fail("header", header.error().message().c_str());
        }

        auto json = nlohmann::json::object();
        json["version"] = header.value().version;
        json["kind"] =
            header.value().kind == CollectionKind::Erc721 ? "erc721"
                                                          : "erc1155";
        json["burn_auto"] = header.value().burn_auto;
        json["withdraw_auto"] = header.value().withdraw_auto;
        auto &actions = json["auto_actions"] = nlohmann::json::array();
        for (auto const action : auto_actions(word)) {
            actions.push_back(
                action == AutoAction::WithdrawAuto ? "withdraw_auto"
                                                   : "burn_auto");
        }
        std::cout << json.dump(2) << '\n';
        return EXIT_SUCCESS;
    }

    int run_hash(
        std::string const &sequence, std::string const &collection_l1,
        std::string const &collection_l2,
        std::vector<std::string> const &token_ids)
    {
        auto const l1 = evmc::from_hex<Address>(collection_l1);
        if (!l1.has_value()) {
            return fail("hash", "invalid l1 collection " + collection_l1);
        }
        auto const l2 =
            word_to_l2_address(intx::from_string<Word>(collection_l2));
        if (l2.has_error()) {
            return fail("hash", l2.error().message().c_str());
        }

        std::vector<uint256_t> ids;
        ids.reserve(token_ids.size());
        for (auto const &id : token_ids) {
            ids.push_back(intx::from_string<uint256_t>(id));
        }

        std::cout << to_hex_word(compute_request_hash(
                         intx::from_string<uint256_t>(sequence),
                         *l1,
                         l2.value(),
                         ids))
                  << '\n';
        return EXIT_SUCCESS;
    }

    // Accepts a single request object or an array of them; the output is the
    // concatenated word stream as an array of hex words.
    int run_encode(std::string const &input)
    {
        auto const json = nlohmann::json::parse(read_input(input));
        std::vector<Request> requests;
        if (json.is_array()) {
            for (auto const &item : json) {
                requests.push_back(request_from_json(item));
            }
        }
        else {
            requests.push_back(request_from_json(json));
        }

        auto out = nlohmann::json::array();
        for (auto const &request : requests) {
            auto const words = serialize_request(request);
            if (words.has_error()) {
                return fail("encode", words.error().message().c_str());
            }
            for (auto const &word : words.value()) {
                out.push_back(to_hex_word(word));
            }
        }
        std::cout << out.dump(2) << '\n';
        return EXIT_SUCCESS;
    }

    int run_decode(
        std::string const &input, std::optional<BridgeChain> const &source)
    {
        auto const json = nlohmann::json::parse(read_input(input));
        std::vector<Word> words;
        words.reserve(json.size());
        for (auto const &item : json) {
            words.push_back(intx::from_string<Word>(item.get<std::string>()));
        }

        auto const requests = deserialize_request_batch(words);
        if (requests.has_error()) {
            return fail("decode", requests.error().message().c_str());
        }

        auto out = nlohmann::json::array();
        for (auto const &request : requests.value()) {
            auto item = to_json(request);
            if (source.has_value()) {
                auto const route = route_request(request, *source);
                item["route"] = {
                    {"collection_src", to_hex_word(route.collection_src)},
                    {"collection_dst", to_hex_word(route.collection_dst)},
                    {"from", to_hex_word(route.from)},
                    {"to", to_hex_word(route.to)}};
            }
            out.push_back(std::move(item));
        }
        LOG_INFO("decoded {} requests", requests.value().size());
        std::cout << out.dump(2) << '\n';
        return EXIT_SUCCESS;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"nftbridge_cli"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    auto log_level = quill::LogLevel::Warning;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    auto *const header_cmd =
        cli.add_subcommand("header", "encode or decode a request header");
    std::string kind = "erc721";
    bool burn_auto = false;
    bool withdraw_auto = false;
    std::optional<std::string> header_word;
    header_cmd->add_option("--kind", kind, "erc721 or erc1155")
        ->check(CLI::IsMember({"erc721", "erc1155"}, CLI::ignore_case));
    header_cmd->add_flag("--burn_auto", burn_auto, "set the burn auto flag");
    header_cmd->add_flag(
        "--withdraw_auto", withdraw_auto, "set the withdraw auto flag");
    header_cmd->add_option("--decode", header_word, "header word to decode");

    auto *const hash_cmd =
        cli.add_subcommand("hash", "compute a request hash");
    std::string sequence;
    std::string collection_l1;
    std::string collection_l2 = "0";
    std::vector<std::string> token_ids;
    hash_cmd->add_option("--sequence", sequence, "request sequence number")
        ->required();
    hash_cmd->add_option("--collection_l1", collection_l1, "L1 collection")
        ->required();
    hash_cmd->add_option("--collection_l2", collection_l2, "L2 collection");
    hash_cmd->add_option("--token_id", token_ids, "token ids, in order");

    auto *const encode_cmd = cli.add_subcommand(
        "encode", "serialize JSON requests to a word stream");
    std::string encode_input = "-";
    encode_cmd->add_option("input", encode_input, "JSON file, - for stdin");

    auto *const decode_cmd = cli.add_subcommand(
        "decode", "deserialize a word stream to JSON requests");
    std::string decode_input = "-";
    std::string source;
    decode_cmd->add_option("input", decode_input, "JSON file, - for stdin");
    decode_cmd
        ->add_option("--source", source, "chain the requests leave, l1 or l2")
        ->check(CLI::IsMember({"l1", "l2"}, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    // stdout carries the command output
    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    try {
        if (*header_cmd) {
            return run_header(
                kind_map.at(kind), burn_auto, withdraw_auto, header_word);
        }
        if (*hash_cmd) {
            return run_hash(sequence, collection_l1, collection_l2, token_ids);
        }
        if (*encode_cmd) {
            return run_encode(encode_input);
        }
        std::optional<BridgeChain> chain;
        if (!source.empty()) {
            chain = source == "l1" ? BridgeChain::L1 : BridgeChain::L2;
        }
        return run_decode(decode_input, chain);
    }
    catch (nlohmann::json::exception const &e) {
        return fail("json", e.what());
    }
    catch (std::invalid_argument const &e) {
        return fail("argument", e.what());
    }
    catch (std::out_of_range const &e) {
        return fail("argument", e.what());
    }
    catch (std::runtime_error const &e) {
        return fail("io", e.what());
    }
}
