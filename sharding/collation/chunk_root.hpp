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
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/config.hpp>
#include <sharding/merkle/merkle_root.hpp>

#include <cstddef>
#include <vector>

SHARDING_NAMESPACE_BEGIN

//! Ordered slices of chunk_size bytes; the last one may be shorter. An empty
//! body has no chunks.
std::vector<byte_string_view>
split_chunks(byte_string_view body, size_t chunk_size);

//! Commitment over a collation body: the merkle root of the rlp string
//! encoding of each chunk, in body order. With a chunk_size of 1 each leaf
//! is the rlp integer encoding of its byte instead.
bytes32_t compute_chunk_root(
    byte_string_view body, merkle::MerkleRoot const &, size_t chunk_size);

bytes32_t compute_chunk_root(byte_string_view body, CollationConfig const &);

merkle::MerkleRoot const &merkle_root_for(ChunkRootScheme);

SHARDING_NAMESPACE_END
