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
#include <sharding/core/keccak.hpp>
#include <sharding/core/likely.h>
#include <sharding/merkle/config.hpp>
#include <sharding/rlp/encode2.hpp>

SHARDING_MERKLE_NAMESPACE_BEGIN

//! Reference to a child node from within its parent: nodes whose encoding is
//! shorter than a hash are embedded, the rest are replaced by their hash.
inline byte_string to_node_reference(byte_string_view const rlp)
{
    if (SHARDING_LIKELY(rlp.size() >= KECCAK256_SIZE)) {
        auto const hash = keccak256(rlp);
        return rlp::encode_string2(to_byte_string_view(hash.bytes));
    }
    return byte_string{rlp};
}

SHARDING_MERKLE_NAMESPACE_END
