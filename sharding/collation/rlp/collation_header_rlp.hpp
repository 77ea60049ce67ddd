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

#include <sharding/collation/collation_header.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/result.hpp>
#include <sharding/rlp/config.hpp>

SHARDING_RLP_NAMESPACE_BEGIN

//! rlp([shard_id, chunk_root, period, proposer_address, proposer_signature]),
//! both the wire form and the hash preimage of a header
byte_string encode_collation_header(CollationHeader const &);

Result<CollationHeader> decode_collation_header(byte_string_view &);

SHARDING_RLP_NAMESPACE_END
