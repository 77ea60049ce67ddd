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
#include <sharding/core/bytes.hpp>
#include <sharding/merkle/config.hpp>
#include <sharding/merkle/merkle_root.hpp>

#include <span>

SHARDING_MERKLE_NAMESPACE_BEGIN

//! Binary Keccak-256 tree over hashed leaves. A level with an odd number of
//! nodes pairs its last node with itself. The root of the empty list is
//! NULL_HASH and the root of a single leaf is the hash of that leaf.
struct BinaryMerkleRoot final : MerkleRoot
{
    bytes32_t root(std::span<byte_string const> leaves) const override;
};

SHARDING_MERKLE_NAMESPACE_END
