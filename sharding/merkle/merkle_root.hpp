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

#include <span>

SHARDING_MERKLE_NAMESPACE_BEGIN

//! \brief Derives a single commitment over an ordered list of leaves.
//!
//! Implementations must be deterministic and stateless: the same leaves in
//! the same order always produce the same root, and a reordering or a change
//! to any leaf changes it. Each implementation defines the root of the empty
//! list.
struct MerkleRoot
{
    virtual ~MerkleRoot() = default;

    virtual bytes32_t root(std::span<byte_string const> leaves) const = 0;
};

SHARDING_MERKLE_NAMESPACE_END
