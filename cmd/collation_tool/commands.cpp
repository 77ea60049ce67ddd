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
#include "file_io.hpp"

#include <sharding/collation/chunk_root.hpp>
#include <sharding/collation/collation.hpp>
#include <sharding/collation/collation_config.hpp>
#include <sharding/collation/collation_header.hpp>
#include <sharding/core/basic_formatter.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/keccak.hpp>
#include <sharding/primitives/address.hpp>
#include <sharding/primitives/fmt/address_fmt.hpp>
#include <sharding/primitives/fmt/bytes_fmt.hpp>
#include <sharding/primitives/rlp/transaction_rlp.hpp>
#include <sharding/primitives/transaction.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

SHARDING_NAMESPACE_BEGIN

namespace fs = std::filesystem;

std::optional<Address> parse_address(std::string const &hex)
{
    auto const bytes = evmc::from_hex(hex);
    if (!bytes.has_value() || bytes->size() != sizeof(Address)) {
        return std::nullopt;
    }
    Address address;
    std::memcpy(address.bytes, bytes->data(), sizeof(Address));
    return address;
}

int run_encode(
    fs::path const &in, fs::path const &out, uint64_t const shard_id,
    uint64_t const period, std::string const &proposer_hex,
    CollationConfig const &config, std::ostream &os)
{
    auto const proposer = parse_address(proposer_hex);
    if (!proposer.has_value()) {
        LOG_ERROR("invalid proposer address '{}'", proposer_hex);
        return EXIT_FAILURE;
    }

    auto const input = read_file(in);
    if (!input.has_value()) {
        return EXIT_FAILURE;
    }
    byte_string_view enc{*input};
    auto txns = rlp::decode_transaction_list(enc);
    if (txns.has_error()) {
        LOG_ERROR(
            "{} is not an rlp transaction list: {}",
            in.string(),
            txns.error().message().c_str());
        return EXIT_FAILURE;
    }
    if (!enc.empty()) {
        LOG_ERROR("{} has {} trailing bytes", in.string(), enc.size());
        return EXIT_FAILURE;
    }

    auto const collation = propose_collation(
        shard_id, period, *proposer, std::move(txns).assume_value(), config);
    if (collation.has_error()) {
        LOG_ERROR(
            "could not build collation: {}",
            collation.error().message().c_str());
        return EXIT_FAILURE;
    }

    auto const &header = collation.value().header();
    if (!out.empty() && !write_file(out, collation.value().body())) {
        return EXIT_FAILURE;
    }

    os << fmt::format(
        "transactions  {}\n"
        "body_size     {}\n"
        "chunk_root    {}\n"
        "signing_hash  {}\n"
        "hash          {}\n",
        collation.value().transactions().size(),
        collation.value().body().size(),
        header.chunk_root(),
        header.signing_hash(),
        header.hash());
    return EXIT_SUCCESS;
}

int run_decode(
    fs::path const &in, CollationConfig const &config, std::ostream &os)
{
    auto const body = read_file(in);
    if (!body.has_value()) {
        return EXIT_FAILURE;
    }
    if (body->size() > config.max_body_size) {
        LOG_ERROR(
            "{} is {} bytes, above the collation size limit of {} bytes",
            in.string(),
            body->size(),
            config.max_body_size);
        return EXIT_FAILURE;
    }

    auto const txns = deserialize(*body);
    if (txns.has_error()) {
        LOG_ERROR(
            "could not decode {}: {}",
            in.string(),
            txns.error().message().c_str());
        return EXIT_FAILURE;
    }

    os << fmt::format(
        "chunk_root    {}\n"
        "transactions  {}\n",
        compute_chunk_root(*body, config),
        txns.value().size());
    for (auto const &txn : txns.value()) {
        os << fmt::format(
            "{}\n", to_bytes(keccak256(rlp::encode_transaction(txn))));
    }
    return EXIT_SUCCESS;
}

SHARDING_NAMESPACE_END
