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
#include <sharding/core/likely.h>
#include <sharding/core/result.hpp>
#include <sharding/primitives/transaction.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

SHARDING_NAMESPACE_BEGIN

Result<std::vector<RawBlob>> create_raw_blobs(
    std::span<Transaction const> const txns, bool const skip_evm_execution)
{
    std::vector<RawBlob> blobs;
    blobs.reserve(txns.size());
    for (size_t i = 0; i < txns.size(); ++i) {
        auto blob = make_raw_blob(txns[i], skip_evm_execution);
        if (SHARDING_UNLIKELY(blob.has_error())) {
            LOG_ERROR(
                "creation of raw blob from transaction {} of {} failed: {}",
                i,
                txns.size(),
                blob.error().message().c_str());
            return std::move(blob).as_failure();
        }
        blobs.emplace_back(std::move(blob).assume_value());
    }
    return blobs;
}

Result<std::vector<Transaction>>
convert_to_transactions(std::span<RawBlob const> const blobs)
{
    std::vector<Transaction> txns;
    txns.reserve(blobs.size());
    for (size_t i = 0; i < blobs.size(); ++i) {
        auto txn = to_transaction(blobs[i]);
        if (SHARDING_UNLIKELY(txn.has_error())) {
            LOG_ERROR(
                "conversion of raw blob {} of {} to transaction failed",
                i,
                blobs.size());
            return std::move(txn).as_failure();
        }
        txns.emplace_back(std::move(txn).assume_value());
    }
    return txns;
}

Result<byte_string> encode_body(
    std::span<Transaction const> const txns, CollationConfig const &config)
{
    BOOST_OUTCOME_TRY(
        auto const blobs,
        create_raw_blobs(txns, config.skip_evm_execution));

    size_t const size = serialized_size(blobs);
    if (SHARDING_UNLIKELY(size > config.max_body_size)) {
        LOG_WARNING(
            "serialized body of {} transactions is {} bytes, above the "
            "collation size limit of {} bytes",
            txns.size(),
            size,
            config.max_body_size);
        return CollationError::SizeLimitExceeded;
    }

    return serialize_blobs(blobs);
}

Result<std::vector<Transaction>> decode_body(byte_string_view const body)
{
    BOOST_OUTCOME_TRY(auto const blobs, deserialize_blobs(body));
    return convert_to_transactions(blobs);
}

SHARDING_NAMESPACE_END
