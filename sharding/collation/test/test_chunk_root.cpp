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
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/merkle/binary_merkle_root.hpp>
#include <sharding/merkle/merkle_root.hpp>
#include <sharding/merkle/ordered_trie_root.hpp>
#include <sharding/rlp/encode2.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <vector>

using namespace sharding;

namespace
{
    byte_string make_body(size_t const size)
    {
        byte_string body;
        for (size_t i = 0; i < size; ++i) {
            body.push_back(static_cast<unsigned char>(i * 7));
        }
        return body;
    }

    struct RecordingMerkleRoot final : merkle::MerkleRoot
    {
        mutable std::vector<byte_string> leaves;

        bytes32_t root(std::span<byte_string const> const in) const override
        {
            leaves.assign(in.begin(), in.end());
            return bytes32_t{0x42};
        }
    };
}

TEST(ChunkRoot, SplitChunks)
{
    auto const body = make_body(70);

    auto const chunks = split_chunks(body, 32);
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0], byte_string_view{body}.substr(0, 32));
    EXPECT_EQ(chunks[1], byte_string_view{body}.substr(32, 32));
    EXPECT_EQ(chunks[2], byte_string_view{body}.substr(64));

    EXPECT_EQ(split_chunks(body, 1).size(), 70);
    EXPECT_EQ(split_chunks(body, 70).size(), 1);
    EXPECT_EQ(split_chunks(body, 1000).size(), 1);
    EXPECT_TRUE(split_chunks(byte_string_view{}, 32).empty());
}

TEST(ChunkRoot, LeavesAreRlpStrings)
{
    auto const body = make_body(40);
    RecordingMerkleRoot const recorder{};

    EXPECT_EQ(compute_chunk_root(body, recorder, 32), bytes32_t{0x42});
    ASSERT_EQ(recorder.leaves.size(), 2);
    EXPECT_EQ(
        recorder.leaves[0],
        rlp::encode_string2(byte_string_view{body}.substr(0, 32)));
    EXPECT_EQ(
        recorder.leaves[1],
        rlp::encode_string2(byte_string_view{body}.substr(32)));
}

TEST(ChunkRoot, SingleByteLeavesAreRlpIntegers)
{
    auto const body = make_body(40);
    RecordingMerkleRoot const recorder{};

    compute_chunk_root(body, recorder, 1);
    ASSERT_EQ(recorder.leaves.size(), 40);
    // zero byte is the empty integer, not the string 0x00
    EXPECT_EQ(body[0], 0);
    EXPECT_EQ(recorder.leaves[0], byte_string({0x80}));
    EXPECT_EQ(recorder.leaves[1], byte_string({0x07}));
    EXPECT_EQ(recorder.leaves[20], byte_string({0x81, 0x8c}));
}

TEST(ChunkRoot, EmptyBody)
{
    EXPECT_EQ(
        compute_chunk_root(byte_string_view{}, CollationConfig{}), NULL_ROOT);
    EXPECT_EQ(
        compute_chunk_root(
            byte_string_view{},
            CollationConfig{.chunk_root_scheme = ChunkRootScheme::binary}),
        NULL_HASH);
}

TEST(ChunkRoot, SchemeSelection)
{
    auto const body = make_body(100);

    EXPECT_EQ(
        compute_chunk_root(body, CollationConfig{}),
        compute_chunk_root(
            body, merkle::OrderedTrieRoot{}, DEFAULT_CHUNK_ROOT_CHUNK_SIZE));
    EXPECT_EQ(
        compute_chunk_root(
            body,
            CollationConfig{
                .chunk_size = 16,
                .chunk_root_scheme = ChunkRootScheme::binary}),
        compute_chunk_root(body, merkle::BinaryMerkleRoot{}, 16));
    EXPECT_NE(
        compute_chunk_root(body, CollationConfig{}),
        compute_chunk_root(
            body,
            CollationConfig{.chunk_root_scheme = ChunkRootScheme::binary}));
}

TEST(ChunkRoot, Deterministic)
{
    auto const body = make_body(256);
    CollationConfig const config{};

    auto const root = compute_chunk_root(body, config);
    EXPECT_EQ(compute_chunk_root(make_body(256), config), root);

    auto changed = body;
    changed[200] ^= 0xff;
    EXPECT_NE(compute_chunk_root(changed, config), root);

    EXPECT_NE(
        compute_chunk_root(body, CollationConfig{.chunk_size = 64}), root);
}
