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

#include <sharding/core/assert.h>
#include <sharding/core/byte_string.hpp>
#include <sharding/merkle/config.hpp>

#include <cstddef>

SHARDING_MERKLE_NAMESPACE_BEGIN

//! one nibble per byte, high nibble first
inline byte_string to_nibbles(byte_string_view const bytes)
{
    byte_string nibbles;
    nibbles.reserve(bytes.size() * 2);
    for (auto const b : bytes) {
        nibbles.push_back(static_cast<unsigned char>(b >> 4));
        nibbles.push_back(static_cast<unsigned char>(b & 0x0f));
    }
    return nibbles;
}

//! hex-prefix encoding of a nibble path (Yellow Paper, appendix C)
inline byte_string
compact_encode(byte_string_view const nibbles, bool const terminating)
{
    byte_string res;
    res.reserve(nibbles.size() / 2 + 1);

    size_t i = 0;
    // Populate first byte with the encoded nibbles type and potentially
    // also the first nibble if number of nibbles is odd
    unsigned char first = terminating ? 0x20 : 0x00;
    if (nibbles.size() % 2) {
        SHARDING_DEBUG_ASSERT(nibbles[0] < 16);
        first |= static_cast<unsigned char>(0x10 | nibbles[0]);
        i = 1;
    }
    res.push_back(first);

    for (; i < nibbles.size(); i += 2) {
        SHARDING_DEBUG_ASSERT(nibbles[i] < 16 && nibbles[i + 1] < 16);
        res.push_back(
            static_cast<unsigned char>((nibbles[i] << 4) | nibbles[i + 1]));
    }
    return res;
}

SHARDING_MERKLE_NAMESPACE_END
