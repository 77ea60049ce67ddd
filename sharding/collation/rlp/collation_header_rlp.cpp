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

#include <sharding/collation/collation_header.hpp>
#include <sharding/collation/rlp/collation_header_rlp.hpp>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/likely.h>
#include <sharding/core/result.hpp>
#include <sharding/primitives/address.hpp>
#include <sharding/primitives/rlp/address_rlp.hpp>
#include <sharding/primitives/rlp/bytes_rlp.hpp>
#include <sharding/primitives/rlp/int_rlp.hpp>
#include <sharding/rlp/config.hpp>
#include <sharding/rlp/decode.hpp>
#include <sharding/rlp/decode_error.hpp>
#include <sharding/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

SHARDING_RLP_NAMESPACE_BEGIN

byte_string encode_collation_header(CollationHeader const &header)
{
    return encode_list2(
        encode_unsigned(header.shard_id()),
        encode_bytes32(header.chunk_root()),
        encode_unsigned(header.period()),
        encode_address(header.proposer_address()),
        encode_string2(header.proposer_signature()));
}

Result<CollationHeader> decode_collation_header(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(auto const shard_id, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(auto const chunk_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(auto const period, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(auto const proposer, decode_address(payload));
    BOOST_OUTCOME_TRY(auto const signature, decode_string(payload));

    if (SHARDING_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return CollationHeader{
        shard_id, chunk_root, period, proposer, byte_string{signature}};
}

SHARDING_RLP_NAMESPACE_END
