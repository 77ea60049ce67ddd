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

#include <sharding/collation/blob_codec.hpp>
#include <sharding/collation/chunk_root.hpp>
#include <sharding/collation/collation.hpp>
#include <sharding/collation/collation_config.hpp>
#include <sharding/collation/collation_error.hpp>
#include <sharding/collation/collation_header.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/likely.h>
#include <sharding/core/result.hpp>
#include <sharding/merkle/merkle_root.hpp>
#include <sharding/primitives/address.hpp>
#include <sharding/primitives/fmt/address_fmt.hpp>
#include <sharding/primitives/fmt/bytes_fmt.hpp>
#include <sharding/primitives/transaction.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

SHARDING_NAMESPACE_BEGIN

Collation::Collation(
    CollationHeader header, byte_string body,
    std::vector<Transaction> transactions)
    : header_{std::move(header)}
    , body_{std::move(body)}
    , transactions_{std::move(transactions)}
{
}

void Collation::calculate_chunk_root(
    merkle::MerkleRoot const &merkle, size_t const chunk_size)
{
    header_.chunk_root_ = compute_chunk_root(body_, merkle, chunk_size);
}

void Collation::calculate_chunk_root(CollationConfig const &config)
{
    header_.chunk_root_ = compute_chunk_root(body_, config);
}

void Collation::set_body(byte_string body, CollationConfig const &config)
{
    body_ = std::move(body);
    calculate_chunk_root(config);
}

void Collation::set_transactions(std::vector<Transaction> transactions)
{
    transactions_ = std::move(transactions);
}

Result<void> Collation::update_body(CollationConfig const &config)
{
    BOOST_OUTCOME_TRY(auto body, serialize(config));
    set_body(std::move(body), config);
    return outcome::success();
}

Result<byte_string> Collation::serialize(CollationConfig const &config) const
{
    return encode_body(transactions_, config);
}

Result<std::vector<Transaction>> deserialize(byte_string_view const body)
{
    return decode_body(body);
}

Result<Collation> propose_collation(
    uint64_t const shard_id, uint64_t const period, Address const &proposer,
    std::vector<Transaction> transactions, CollationConfig const &config)
{
    Collation collation{
        CollationHeader{shard_id, bytes32_t{}, period, proposer},
        byte_string{},
        std::move(transactions)};
    BOOST_OUTCOME_TRY(collation.update_body(config));

    LOG_DEBUG(
        "proposed collation shard={} period={} proposer={} txns={} "
        "body_size={} chunk_root={}",
        shard_id,
        period,
        proposer,
        collation.transactions().size(),
        collation.body().size(),
        collation.header().chunk_root());
    return collation;
}

Result<Collation> receive_collation(
    CollationHeader header, byte_string body, CollationConfig const &config)
{
    if (SHARDING_UNLIKELY(body.size() > config.max_body_size)) {
        LOG_WARNING(
            "received body of {} bytes for shard={} period={}, above the "
            "collation size limit of {} bytes",
            body.size(),
            header.shard_id(),
            header.period(),
            config.max_body_size);
        return CollationError::SizeLimitExceeded;
    }

    auto const chunk_root = compute_chunk_root(body, config);
    if (SHARDING_UNLIKELY(chunk_root != header.chunk_root())) {
        LOG_WARNING(
            "chunk root mismatch for shard={} period={}: header {} body {}",
            header.shard_id(),
            header.period(),
            header.chunk_root(),
            chunk_root);
        return CollationError::ChunkRootMismatch;
    }

    BOOST_OUTCOME_TRY(auto transactions, deserialize(body));
    return Collation{std::move(header), std::move(body), std::move(transactions)};
}

SHARDING_NAMESPACE_END
