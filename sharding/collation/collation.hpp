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

#pragma once

#include <sharding/collation/collation_config.hpp>
#include <sharding/collation/collation_header.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/config.hpp>
#include <sharding/core/result.hpp>
#include <sharding/merkle/merkle_root.hpp>
#include <sharding/primitives/address.hpp>
#include <sharding/primitives/transaction.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

SHARDING_NAMESPACE_BEGIN

//! A batch of transactions for one shard and period together with its
//! serialized body and header.
//!
//! The transaction list is the source of truth; the body and the header's
//! chunk root are derived from it. Construction does not check that the
//! three agree. After set_transactions() the body and chunk root are stale
//! until update_body() runs, and the header must not be hashed or signed in
//! between. Not thread safe.
class Collation
{
public:
    Collation(
        CollationHeader header, byte_string body,
        std::vector<Transaction> transactions);

    CollationHeader const &header() const noexcept
    {
        return header_;
    }

    byte_string const &body() const noexcept
    {
        return body_;
    }

    std::vector<Transaction> const &transactions() const noexcept
    {
        return transactions_;
    }

    Address const &proposer_address() const noexcept
    {
        return header_.proposer_address();
    }

    //! Recompute the header's chunk root from the current body
    void calculate_chunk_root(
        merkle::MerkleRoot const &, size_t chunk_size);
    void calculate_chunk_root(CollationConfig const &);

    //! Replace the body and recompute the chunk root
    void set_body(byte_string body, CollationConfig const &);

    void set_transactions(std::vector<Transaction> transactions);

    //! Re-encode the transactions into the body and recompute the chunk
    //! root. Leaves the collation unchanged on failure.
    Result<void> update_body(CollationConfig const &);

    //! Encode the transactions without touching the stored body
    Result<byte_string> serialize(CollationConfig const &) const;

private:
    CollationHeader header_;
    byte_string body_;
    std::vector<Transaction> transactions_;
};

Result<std::vector<Transaction>> deserialize(byte_string_view body);

//! Proposer path: encode the transactions, commit to the body and build an
//! unsigned header.
Result<Collation> propose_collation(
    uint64_t shard_id, uint64_t period, Address const &proposer,
    std::vector<Transaction> transactions, CollationConfig const &);

//! Receiver path: decode a body received for a header, failing with
//! ChunkRootMismatch if the header does not commit to it.
Result<Collation> receive_collation(
    CollationHeader header, byte_string body, CollationConfig const &);

SHARDING_NAMESPACE_END
