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
#include <sharding/collation/collation_config.hpp>
#include <sharding/collation/collation_error.hpp>
#include <sharding/collation/raw_blob.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/primitives/rlp/transaction_rlp.hpp>
#include <sharding/primitives/transaction.hpp>
#include <sharding/test/transactions.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

using namespace sharding;

TEST(BlobCodec, EncodeDecode)
{
    auto const txns = test::make_transactions(6);
    CollationConfig const config{};

    auto const body = encode_body(txns, config);
    ASSERT_FALSE(body.has_error());
    EXPECT_EQ(body.value().size() % BLOB_CHUNK_SIZE, 0);

    size_t expected_size = 0;
    for (auto const &txn : txns) {
        expected_size +=
            num_chunks(rlp::encode_transaction(txn).size()) * BLOB_CHUNK_SIZE;
    }
    EXPECT_EQ(body.value().size(), expected_size);

    auto const decoded = decode_body(body.value());
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), txns);
}

TEST(BlobCodec, EmptyBody)
{
    auto const body = encode_body({}, CollationConfig{});
    ASSERT_FALSE(body.has_error());
    EXPECT_TRUE(body.value().empty());

    auto const decoded = decode_body(byte_string_view{});
    ASSERT_FALSE(decoded.has_error());
    EXPECT_TRUE(decoded.value().empty());
}

TEST(BlobCodec, SkipEvmExecution)
{
    auto const txns = test::make_transactions(3);
    CollationConfig const config{.skip_evm_execution = true};

    auto const body = encode_body(txns, config);
    ASSERT_FALSE(body.has_error());

    auto const blobs = deserialize_blobs(body.value());
    ASSERT_FALSE(blobs.has_error());
    ASSERT_EQ(blobs.value().size(), txns.size());
    for (auto const &blob : blobs.value()) {
        EXPECT_TRUE(blob.skip_evm_execution());
    }

    auto const decoded = decode_body(body.value());
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), txns);
}

TEST(BlobCodec, SizeLimit)
{
    std::vector<Transaction> const txns{test::make_legacy_transaction(0)};
    auto const size =
        num_chunks(rlp::encode_transaction(txns[0]).size()) * BLOB_CHUNK_SIZE;

    CollationConfig config{.max_body_size = size};
    auto const at_limit = encode_body(txns, config);
    ASSERT_FALSE(at_limit.has_error());
    EXPECT_EQ(at_limit.value().size(), size);

    config.max_body_size = size - 1;
    auto const above_limit = encode_body(txns, config);
    ASSERT_TRUE(above_limit.has_error());
    EXPECT_EQ(above_limit.error(), CollationError::SizeLimitExceeded);
}

TEST(BlobCodec, DefaultSizeLimit)
{
    std::vector<Transaction> const txns{
        test::make_contract_creation(MAX_COLLATION_BODY_SIZE)};
    auto const body = encode_body(txns, CollationConfig{});
    ASSERT_TRUE(body.has_error());
    EXPECT_EQ(body.error(), CollationError::SizeLimitExceeded);
}

TEST(BlobCodec, EncodingError)
{
    auto txns = test::make_transactions(4);
    txns[2].sc.y_parity = 2;
    auto const body = encode_body(txns, CollationConfig{});
    ASSERT_TRUE(body.has_error());
    EXPECT_EQ(body.error(), CollationError::EncodingError);
}

TEST(BlobCodec, DecodeCorruptRecord)
{
    // well formed chunks carrying a record that is not a transaction
    std::vector<RawBlob> const blobs{
        RawBlob{.data = rlp::encode_transaction(test::make_legacy_transaction(0))},
        RawBlob{.data = byte_string({0xc3, 0x01, 0x02})}};
    auto const body = serialize_blobs(blobs);

    auto const decoded = decode_body(body);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}

TEST(BlobCodec, DecodeMalformedChunks)
{
    auto body = encode_body(test::make_transactions(2), CollationConfig{});
    ASSERT_FALSE(body.has_error());
    body.value().pop_back();

    auto const decoded = decode_body(body.value());
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}

TEST(BlobCodec, DecodeShortBuffer)
{
    byte_string const body{0x01, 0x02, 0x03, 0x04, 0x05};
    auto const decoded = decode_body(body);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}
