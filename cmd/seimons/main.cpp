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

#include "commands.hpp"

#include <seimons/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace seimons;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"seimons"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    auto log_level = quill::LogLevel::Info;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    std::string seed;
    uint64_t token_id = 0;
    std::string owner;
    auto *const generate_cmd =
        cli.add_subcommand("generate", "derive a monster from a seed");
    generate_cmd->add_option("--seed", seed, "256 bit seed")->required();
    generate_cmd->add_option(
        "--token_id", token_id, "token id assigned by the ledger");
    generate_cmd->add_option("--owner", owner, "owner address, 0x prefixed");

    std::string packed;
    bool strict = false;
    auto *const decode_cmd =
        cli.add_subcommand("decode", "decode a packed monster word");
    decode_cmd->add_option("--packed", packed, "packed word")->required();
    decode_cmd->add_flag(
        "--strict",
        strict,
        "reject unused bits and out of range element types or rarity");

    std::vector<std::string> packed_words;
    auto *const power_cmd = cli.add_subcommand(
        "power", "power of each packed word and their checked total");
    power_cmd->add_option("--packed", packed_words, "packed words")
        ->required();

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    int result = EXIT_FAILURE;
    if (generate_cmd->parsed()) {
        result = run_generate(stdout, seed, token_id, owner);
    }
    else if (decode_cmd->parsed()) {
        result = run_decode(stdout, packed, strict);
    }
    else if (power_cmd->parsed()) {
        result = run_power(stdout, packed_words);
    }

    quill::flush();
    return result;
}
