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
#include <sharding/collation/raw_blob.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/config.hpp>
#include <sharding/core/result.hpp>
#include <sharding/primitives/transaction.hpp>

#include <span>
#include <vector>

SHARDING_NAMESPACE_BEGIN

Result<std::vector<RawBlob>>
create_raw_blobs(std::span<Transaction const>, bool skip_evm_execution);

Result<std::vector<Transaction>> convert_to_transactions(
    std::span<RawBlob const>);

//! Serialize transactions into a collation body. Fails with EncodingError if
//! a transaction has no raw blob form and with SizeLimitExceeded if the
//! whole body would be larger than config.max_body_size; no body is produced
//! in either case.
Result<byte_string>
encode_body(std::span<Transaction const>, CollationConfig const &);

//! Inverse of encode_body. Any malformed chunk or record fails the whole
//! body with DecodingError.
Result<std::vector<Transaction>> decode_body(byte_string_view);

SHARDING_NAMESPACE_END
