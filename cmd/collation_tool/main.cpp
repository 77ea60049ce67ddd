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

#include <sharding/collation/collation_config.hpp>
#include <sharding/core/config.hpp>
#include <sharding/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>

SHARDING_ANONYMOUS_NAMESPACE_BEGIN

namespace fs = std::filesystem;

std::map<std::string, ChunkRootScheme> const chunk_root_scheme_map = {
    {"ordered_trie", ChunkRootScheme::ordered_trie},
    {"binary", ChunkRootScheme::binary}};

SHARDING_ANONYMOUS_NAMESPACE_END

using namespace sharding;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"collation_tool"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    CollationConfig config;
    fs::path in;
    fs::path out;
    uint64_t shard_id = 0;
    uint64_t period = 0;
    std::string proposer = "0x0000000000000000000000000000000000000000";
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option(
           "--max_body_size",
           config.max_body_size,
           "limit on the serialized collation body in bytes")
        ->check(CLI::PositiveNumber);
    cli.add_option(
           "--chunk_size",
           config.chunk_size,
           "size of the body slices committed to by the chunk root")
        ->check(CLI::PositiveNumber);
    cli.add_option(
           "--chunk_root_scheme",
           config.chunk_root_scheme,
           "merkle derivation for the chunk root")
        ->transform(
            CLI::CheckedTransformer(chunk_root_scheme_map, CLI::ignore_case));

    auto *const encode = cli.add_subcommand(
        "encode", "build a collation from an rlp transaction list");
    encode->add_option("--in", in, "rlp transaction list")
        ->required()
        ->check(CLI::ExistingFile);
    encode->add_option("--out", out, "where to write the collation body");
    encode->add_option("--shard", shard_id, "shard id");
    encode->add_option("--period", period, "period");
    encode->add_option("--proposer", proposer, "proposer address");
    encode->add_flag(
        "--skip_evm",
        config.skip_evm_execution,
        "mark every blob as skipping evm execution");

    auto *const decode =
        cli.add_subcommand("decode", "decode a collation body");
    decode->add_option("--in", in, "collation body")
        ->required()
        ->check(CLI::ExistingFile);

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

    int const status =
        encode->parsed()
            ? run_encode(
                  in, out, shard_id, period, proposer, config, std::cout)
            : run_decode(in, config, std::cout);
    quill::flush();
    return status;
}
