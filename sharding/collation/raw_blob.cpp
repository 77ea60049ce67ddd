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

#include <sharding/collation/collation_error.hpp>
#include <sharding/collation/raw_blob.hpp>
#include <sharding/core/assert.h>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/int.hpp>
#include <sharding/core/likely.h>
#include <sharding/core/result.hpp>
#include <sharding/primitives/rlp/transaction_rlp.hpp>
#include <sharding/primitives/transaction.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

SHARDING_NAMESPACE_BEGIN

namespace
{
    // Fields the transaction encoding cannot carry faithfully; a blob built
    // from such a transaction would not decode back to it.
    bool is_encodable(Transaction const &txn)
    {
        if (txn.type >= TransactionType::LAST) {
            return false;
        }
        if (txn.sc.y_parity > 1) {
            return false;
        }
        if (txn.type != TransactionType::legacy) {
            return txn.sc.chain_id.has_value();
        }
        // v = chain_id * 2 + 35 + y_parity must not wrap
        return !txn.sc.chain_id.has_value() ||
               *txn.sc.chain_id <= (UINT256_MAX - 36) / 2;
    }
}

Result<RawBlob> make_raw_blob(Transaction const &txn, bool const skip_evm)
{
    if (SHARDING_UNLIKELY(!is_encodable(txn))) {
        return CollationError::EncodingError;
    }
    return RawBlob{
        .flags = skip_evm ? SKIP_EVM_EXECUTION_FLAG : uint8_t{0},
        .data = rlp::encode_transaction(txn)};
}

Result<Transaction> to_transaction(RawBlob const &blob)
{
    byte_string_view enc{blob.data};
    auto txn = rlp::decode_transaction(enc);
    if (SHARDING_UNLIKELY(txn.has_error())) {
        LOG_WARNING(
            "raw blob of {} bytes is not a transaction: {}",
            blob.data.size(),
            txn.error().message().c_str());
        return CollationError::DecodingError;
    }
    if (SHARDING_UNLIKELY(!enc.empty())) {
        LOG_WARNING(
            "raw blob has {} bytes trailing its transaction", enc.size());
        return CollationError::DecodingError;
    }
    // only records make_raw_blob could have written are accepted
    if (SHARDING_UNLIKELY(
            !is_encodable(txn.value()) ||
            rlp::encode_transaction(txn.value()) != blob.data)) {
        LOG_WARNING(
            "raw blob of {} bytes is not a canonical transaction encoding",
            blob.data.size());
        return CollationError::DecodingError;
    }
    return std::move(txn).assume_value();
}

size_t serialized_size(std::span<RawBlob const> const blobs) noexcept
{
    size_t size = 0;
    for (auto const &blob : blobs) {
        size += num_chunks(blob.data.size()) * BLOB_CHUNK_SIZE;
    }
    return size;
}

byte_string serialize_blobs(std::span<RawBlob const> const blobs)
{
    byte_string serialized;
    serialized.reserve(serialized_size(blobs));

    for (auto const &blob : blobs) {
        SHARDING_ASSERT(!blob.data.empty());
        SHARDING_ASSERT((blob.flags & ~SKIP_EVM_EXECUTION_FLAG) == 0);

        byte_string_view data{blob.data};
        while (data.size() > BLOB_CHUNK_DATA_SIZE) {
            serialized.push_back(0);
            serialized += data.substr(0, BLOB_CHUNK_DATA_SIZE);
            data = data.substr(BLOB_CHUNK_DATA_SIZE);
        }

        // terminal chunk, 1 to 31 bytes of data
        serialized.push_back(
            static_cast<unsigned char>(data.size() | blob.flags));
        serialized += data;
        serialized.append(BLOB_CHUNK_DATA_SIZE - data.size(), 0);
    }

    SHARDING_ASSERT(serialized.size() == serialized_size(blobs));
    return serialized;
}

Result<std::vector<RawBlob>> deserialize_blobs(byte_string_view const body)
{
    if (SHARDING_UNLIKELY(body.size() % BLOB_CHUNK_SIZE != 0)) {
        LOG_WARNING(
            "body size {} is not a multiple of the chunk size {}",
            body.size(),
            BLOB_CHUNK_SIZE);
        return CollationError::DecodingError;
    }

    std::vector<RawBlob> blobs;
    RawBlob current;
    for (size_t offset = 0; offset < body.size(); offset += BLOB_CHUNK_SIZE) {
        auto const chunk = body.substr(offset, BLOB_CHUNK_SIZE);
        uint8_t const indicator = chunk[0];
        auto const payload = chunk.substr(BLOB_INDICATOR_SIZE);

        if (SHARDING_UNLIKELY(indicator & RESERVED_INDICATOR_BITS)) {
            LOG_WARNING(
                "chunk at offset {} sets reserved indicator bits {:#04x}",
                offset,
                indicator);
            return CollationError::DecodingError;
        }

        size_t const length = indicator & DATA_LENGTH_MASK;
        if (length == 0) {
            if (SHARDING_UNLIKELY(indicator & SKIP_EVM_EXECUTION_FLAG)) {
                LOG_WARNING(
                    "non-terminal chunk at offset {} carries blob flags",
                    offset);
                return CollationError::DecodingError;
            }
            current.data += payload;
            continue;
        }

        auto const padding = payload.substr(length);
        if (SHARDING_UNLIKELY(!std::ranges::all_of(
                padding, [](unsigned char const b) { return b == 0; }))) {
            LOG_WARNING(
                "terminal chunk at offset {} has non-zero padding", offset);
            return CollationError::DecodingError;
        }

        current.data += payload.substr(0, length);
        current.flags = indicator & SKIP_EVM_EXECUTION_FLAG;
        blobs.emplace_back(std::move(current));
        current = RawBlob{};
    }

    if (SHARDING_UNLIKELY(!current.data.empty())) {
        LOG_WARNING(
            "body ends inside a blob, {} bytes without a terminal chunk",
            current.data.size());
        return CollationError::DecodingError;
    }

    return blobs;
}

SHARDING_NAMESPACE_END
