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
#include <sharding/collation/collation_error.hpp>
#include <sharding/collation/raw_blob.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/int.hpp>
#include <sharding/primitives/rlp/address_rlp.hpp>
#include <sharding/primitives/rlp/int_rlp.hpp>
#include <sharding/primitives/rlp/transaction_rlp.hpp>
#include <sharding/primitives/signature.hpp>
#include <sharding/primitives/transaction.hpp>
#include <sharding/rlp/encode2.hpp>
#include <sharding/test/transactions.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

using namespace sharding;

namespace
{
    RawBlob make_blob(size_t const size, uint8_t const flags = 0)
    {
        byte_string data;
        for (size_t i = 0; i < size; ++i) {
            data.push_back(static_cast<unsigned char>(i + 1));
        }
        return RawBlob{.flags = flags, .data = data};
    }

    // legacy transaction encoding with the nonce field and v given verbatim
    byte_string encode_legacy_with(
        Transaction const &txn, byte_string const &nonce_field,
        uint256_t const &v)
    {
        return rlp::encode_list2(
            nonce_field,
            rlp::encode_unsigned(txn.max_fee_per_gas),
            rlp::encode_unsigned(txn.gas_limit),
            rlp::encode_address(txn.to),
            rlp::encode_unsigned(txn.value),
            rlp::encode_string2(txn.data),
            rlp::encode_unsigned(v),
            rlp::encode_unsigned(txn.sc.r),
            rlp::encode_unsigned(txn.sc.s));
    }
}

TEST(RawBlob, MakeFromTransaction)
{
    auto const txn = test::make_legacy_transaction(1);

    auto const blob = make_raw_blob(txn, false);
    ASSERT_FALSE(blob.has_error());
    EXPECT_EQ(blob.value().data, rlp::encode_transaction(txn));
    EXPECT_EQ(blob.value().flags, 0);
    EXPECT_FALSE(blob.value().skip_evm_execution());

    auto const skip = make_raw_blob(txn, true);
    ASSERT_FALSE(skip.has_error());
    EXPECT_EQ(skip.value().flags, SKIP_EVM_EXECUTION_FLAG);
    EXPECT_TRUE(skip.value().skip_evm_execution());

    auto const back = to_transaction(skip.value());
    ASSERT_FALSE(back.has_error());
    EXPECT_EQ(back.value(), txn);
}

TEST(RawBlob, MakeFromUnencodableTransaction)
{
    auto bad_parity = test::make_legacy_transaction(1);
    bad_parity.sc.y_parity = 2;
    auto const res = make_raw_blob(bad_parity, false);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CollationError::EncodingError);

    auto no_chain = test::make_eip1559_transaction(1);
    no_chain.sc.chain_id.reset();
    auto const res2 = make_raw_blob(no_chain, false);
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.error(), CollationError::EncodingError);

    auto bad_type = test::make_legacy_transaction(1);
    bad_type.type = TransactionType::LAST;
    auto const res3 = make_raw_blob(bad_type, false);
    ASSERT_TRUE(res3.has_error());
    EXPECT_EQ(res3.error(), CollationError::EncodingError);
}

TEST(RawBlob, ToTransactionRejectsGarbage)
{
    auto const res = to_transaction(RawBlob{.data = byte_string({0x01, 0x02})});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CollationError::DecodingError);

    auto data = rlp::encode_transaction(test::make_legacy_transaction(0));
    data.push_back(0x00);
    auto const trailing = to_transaction(RawBlob{.data = data});
    ASSERT_TRUE(trailing.has_error());
    EXPECT_EQ(trailing.error(), CollationError::DecodingError);
}

TEST(RawBlob, NumChunks)
{
    EXPECT_EQ(num_chunks(1), 1);
    EXPECT_EQ(num_chunks(31), 1);
    EXPECT_EQ(num_chunks(32), 2);
    EXPECT_EQ(num_chunks(62), 2);
    EXPECT_EQ(num_chunks(63), 3);
}

TEST(RawBlob, SerializeSingleChunk)
{
    std::vector<RawBlob> const blobs{make_blob(31)};
    auto const body = serialize_blobs(blobs);

    ASSERT_EQ(body.size(), BLOB_CHUNK_SIZE);
    EXPECT_EQ(serialized_size(blobs), body.size());
    EXPECT_EQ(body[0], 31);
    EXPECT_EQ(body.substr(1), blobs[0].data);
}

TEST(RawBlob, SerializeLayout)
{
    std::vector<RawBlob> const blobs{
        make_blob(32, SKIP_EVM_EXECUTION_FLAG), make_blob(5)};
    auto const body = serialize_blobs(blobs);

    ASSERT_EQ(body.size(), 3 * BLOB_CHUNK_SIZE);
    EXPECT_EQ(serialized_size(blobs), body.size());

    // first blob, one full chunk then a terminal chunk holding one byte
    EXPECT_EQ(body[0], 0x00);
    EXPECT_EQ(body.substr(1, 31), blobs[0].data.substr(0, 31));
    EXPECT_EQ(body[32], 0x81);
    EXPECT_EQ(body[33], blobs[0].data[31]);
    EXPECT_EQ(body.substr(34, 30), byte_string(30, 0));

    // second blob, terminal chunk holding five bytes
    EXPECT_EQ(body[64], 0x05);
    EXPECT_EQ(body.substr(65, 5), blobs[1].data);
    EXPECT_EQ(body.substr(70), byte_string(26, 0));

    auto const decoded = deserialize_blobs(body);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), blobs);
}

TEST(RawBlob, DeserializeEmpty)
{
    auto const decoded = deserialize_blobs(byte_string_view{});
    ASSERT_FALSE(decoded.has_error());
    EXPECT_TRUE(decoded.value().empty());
    EXPECT_TRUE(serialize_blobs({}).empty());
}

TEST(RawBlob, DeserializeRejectsPartialChunk)
{
    byte_string const body{0x04, 0x01, 0x02, 0x03, 0x04};
    auto const decoded = deserialize_blobs(body);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}

TEST(RawBlob, DeserializeRejectsReservedBits)
{
    for (unsigned char const reserved : {0x20, 0x40}) {
        std::vector<RawBlob> const blobs{make_blob(3)};
        auto body = serialize_blobs(blobs);
        body[0] |= reserved;
        auto const decoded = deserialize_blobs(body);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.error(), CollationError::DecodingError);
    }
}

TEST(RawBlob, DeserializeRejectsNonZeroPadding)
{
    std::vector<RawBlob> const blobs{make_blob(3)};
    auto body = serialize_blobs(blobs);
    body.back() = 0x01;
    auto const decoded = deserialize_blobs(body);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}

TEST(RawBlob, DeserializeRejectsUnterminatedBlob)
{
    std::vector<RawBlob> const blobs{make_blob(40)};
    auto const body = serialize_blobs(blobs);
    auto const truncated = byte_string_view{body}.substr(0, BLOB_CHUNK_SIZE);
    auto const decoded = deserialize_blobs(truncated);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}

TEST(RawBlob, DeserializeRejectsFlagOnNonTerminalChunk)
{
    std::vector<RawBlob> const blobs{make_blob(40)};
    auto body = serialize_blobs(blobs);
    body[0] = SKIP_EVM_EXECUTION_FLAG;
    auto const decoded = deserialize_blobs(body);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), CollationError::DecodingError);
}

TEST(RawBlob, ToTransactionRejectsNonCanonicalRecords)
{
    auto const txn = test::make_legacy_transaction(5);
    auto const v = get_v(txn.sc);

    // the encoding make_raw_blob writes is accepted
    auto const canonical =
        encode_legacy_with(txn, rlp::encode_unsigned(txn.nonce), v);
    ASSERT_EQ(canonical, rlp::encode_transaction(txn));
    auto const accepted = to_transaction(RawBlob{.data = canonical});
    ASSERT_FALSE(accepted.has_error());
    EXPECT_EQ(accepted.value(), txn);

    // nonce 5 as a one byte string instead of a single byte
    auto const long_nonce =
        to_transaction(RawBlob{.data = encode_legacy_with(
                                   txn, byte_string({0x81, 0x05}), v)});
    ASSERT_TRUE(long_nonce.has_error());
    EXPECT_EQ(long_nonce.error(), CollationError::DecodingError);

    // v outside 27, 28 and the eip-155 range
    for (uint256_t const bad_v : {uint256_t{0}, uint256_t{29}, uint256_t{34}}) {
        auto const res = to_transaction(RawBlob{
            .data = encode_legacy_with(
                txn, rlp::encode_unsigned(txn.nonce), bad_v)});
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), CollationError::DecodingError);
    }
}

TEST(RawBlob, ToTransactionRejectsBadParity)
{
    auto txn = test::make_eip1559_transaction(1);
    txn.sc.y_parity = 2;

    auto const res =
        to_transaction(RawBlob{.data = rlp::encode_transaction(txn)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CollationError::DecodingError);
}

TEST(RawBlob, BodyWithNonCanonicalRecordFails)
{
    auto const txn = test::make_legacy_transaction(5);
    std::vector<RawBlob> const blobs{
        RawBlob{.data = rlp::encode_transaction(
                     test::make_eip1559_transaction(1))},
        RawBlob{
            .data = encode_legacy_with(
                txn, byte_string({0x81, 0x05}), get_v(txn.sc))}};
    auto const body = serialize_blobs(blobs);

    // chunk layer is well formed, only the record is rejected
    auto const decoded = deserialize_blobs(body);
    ASSERT_FALSE(decoded.has_error());
    ASSERT_EQ(decoded.value().size(), 2u);

    auto const res = decode_body(body);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CollationError::DecodingError);
}
