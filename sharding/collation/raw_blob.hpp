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

#include <sharding/core/byte_string.hpp>
#include <sharding/core/config.hpp>
#include <sharding/core/result.hpp>
#include <sharding/primitives/transaction.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

SHARDING_NAMESPACE_BEGIN

// Body layout: 32 byte chunks, each an indicator byte followed by 31 bytes of
// blob data. A blob spans ceil(size / 31) chunks. Non-terminal chunks carry
// indicator 0. The terminal chunk carries the number of data bytes it holds
// (1 to 31) or'ed with the blob flags, and is zero padded.
inline constexpr size_t BLOB_CHUNK_SIZE = 32;
inline constexpr size_t BLOB_INDICATOR_SIZE = 1;
inline constexpr size_t BLOB_CHUNK_DATA_SIZE =
    BLOB_CHUNK_SIZE - BLOB_INDICATOR_SIZE;

inline constexpr uint8_t SKIP_EVM_EXECUTION_FLAG = 0x80;
inline constexpr uint8_t RESERVED_INDICATOR_BITS = 0x60;
inline constexpr uint8_t DATA_LENGTH_MASK = 0x1f;

static_assert(BLOB_CHUNK_DATA_SIZE == DATA_LENGTH_MASK);
static_assert(
    (SKIP_EVM_EXECUTION_FLAG | RESERVED_INDICATOR_BITS | DATA_LENGTH_MASK) ==
    0xff);

//! Codec-local record of one transaction: its RLP encoding plus blob flags.
struct RawBlob
{
    uint8_t flags{};
    byte_string data{};

    bool skip_evm_execution() const noexcept
    {
        return flags & SKIP_EVM_EXECUTION_FLAG;
    }

    friend bool operator==(RawBlob const &, RawBlob const &) = default;
};

Result<RawBlob> make_raw_blob(Transaction const &, bool skip_evm_execution);
//! Fails with DecodingError unless the data is exactly the encoding
//! make_raw_blob writes for the decoded transaction
Result<Transaction> to_transaction(RawBlob const &);

constexpr size_t num_chunks(size_t const data_size) noexcept
{
    return (data_size + BLOB_CHUNK_DATA_SIZE - 1) / BLOB_CHUNK_DATA_SIZE;
}

size_t serialized_size(std::span<RawBlob const>) noexcept;

byte_string serialize_blobs(std::span<RawBlob const>);
Result<std::vector<RawBlob>> deserialize_blobs(byte_string_view);

SHARDING_NAMESPACE_END
