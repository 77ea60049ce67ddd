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

#include <sharding/collation/collation_header.hpp>
#include <sharding/collation/rlp/collation_header_rlp.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/keccak.hpp>
#include <sharding/primitives/address.hpp>

#include <cstdint>
#include <utility>

SHARDING_NAMESPACE_BEGIN

CollationHeader::CollationHeader(
    uint64_t const shard_id, bytes32_t const &chunk_root, uint64_t const period,
    Address const &proposer_address, byte_string proposer_signature)
    : shard_id_{shard_id}
    , chunk_root_{chunk_root}
    , period_{period}
    , proposer_address_{proposer_address}
    , proposer_signature_{std::move(proposer_signature)}
{
}

bytes32_t CollationHeader::hash() const
{
    return to_bytes(keccak256(rlp::encode_collation_header(*this)));
}

bytes32_t CollationHeader::signing_hash() const
{
    if (proposer_signature_.empty()) {
        return hash();
    }
    return with_signature({}).hash();
}

CollationHeader CollationHeader::with_signature(byte_string signature) const
{
    CollationHeader signed_header{*this};
    signed_header.proposer_signature_ = std::move(signature);
    return signed_header;
}

SHARDING_NAMESPACE_END
