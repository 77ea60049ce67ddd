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

#include <sharding/collation/chunk_root.hpp>
#include <sharding/collation/collation_config.hpp>
#include <sharding/core/assert.h>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/merkle/binary_merkle_root.hpp>
#include <sharding/merkle/merkle_root.hpp>
#include <sharding/merkle/ordered_trie_root.hpp>
#include <sharding/primitives/rlp/int_rlp.hpp>
#include <sharding/rlp/encode2.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

SHARDING_NAMESPACE_BEGIN

std::vector<byte_string_view>
split_chunks(byte_string_view body, size_t const chunk_size)
{
    SHARDING_ASSERT(chunk_size > 0);

    std::vector<byte_string_view> chunks;
    chunks.reserve((body.size() + chunk_size - 1) / chunk_size);
    while (!body.empty()) {
        auto const n = std::min(chunk_size, body.size());
        chunks.push_back(body.substr(0, n));
        body = body.substr(n);
    }
    return chunks;
}

bytes32_t compute_chunk_root(
    byte_string_view const body, merkle::MerkleRoot const &merkle,
    size_t const chunk_size)
{
    auto const chunks = split_chunks(body, chunk_size);

    std::vector<byte_string> leaves;
    leaves.reserve(chunks.size());
    for (auto const &chunk : chunks) {
        // single byte chunks are committed as integers, so zero is 0x80
        if (chunk_size == 1) {
            leaves.push_back(rlp::encode_unsigned(uint8_t{chunk[0]}));
        }
        else {
            leaves.push_back(rlp::encode_string2(chunk));
        }
    }
    return merkle.root(leaves);
}

bytes32_t
compute_chunk_root(byte_string_view const body, CollationConfig const &config)
{
    return compute_chunk_root(
        body, merkle_root_for(config.chunk_root_scheme), config.chunk_size);
}

merkle::MerkleRoot const &merkle_root_for(ChunkRootScheme const scheme)
{
    static merkle::OrderedTrieRoot const ordered_trie{};
    static merkle::BinaryMerkleRoot const binary{};

    switch (scheme) {
    case ChunkRootScheme::ordered_trie:
        return ordered_trie;
    case ChunkRootScheme::binary:
        return binary;
    }
    SHARDING_ASSERT(false, "unknown chunk root scheme");
    __builtin_unreachable();
}

SHARDING_NAMESPACE_END
