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

#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/keccak.hpp>
#include <sharding/merkle/binary_merkle_root.hpp>
#include <sharding/merkle/config.hpp>

#include <cstring>
#include <span>
#include <utility>
#include <vector>

SHARDING_MERKLE_NAMESPACE_BEGIN

bytes32_t
BinaryMerkleRoot::root(std::span<byte_string const> const leaves) const
{
    if (leaves.empty()) {
        return NULL_HASH;
    }

    std::vector<bytes32_t> level;
    level.reserve(leaves.size());
    for (auto const &leaf : leaves) {
        level.push_back(to_bytes(keccak256(leaf)));
    }

    while (level.size() > 1) {
        if (level.size() % 2 != 0) {
            level.push_back(level.back());
        }

        std::vector<bytes32_t> next_level;
        next_level.reserve(level.size() / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            unsigned char combined[2 * sizeof(bytes32_t)];
            std::memcpy(combined, level[i].bytes, sizeof(bytes32_t));
            std::memcpy(
                combined + sizeof(bytes32_t),
                level[i + 1].bytes,
                sizeof(bytes32_t));
            next_level.push_back(to_bytes(keccak256(combined)));
        }
        level = std::move(next_level);
    }

    return level.front();
}

SHARDING_MERKLE_NAMESPACE_END
