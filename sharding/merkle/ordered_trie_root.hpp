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

struct TrieEntry
{
    byte_string key;
    byte_string value;
};

//! Root of the Merkle Patricia trie over entries with distinct keys, in any
//! order. NULL_ROOT when there are no entries.
bytes32_t trie_root(std::span<TrieEntry const>);

//! Root of the Merkle Patricia trie mapping rlp(i) to the i-th leaf, the
//! same commitment Ethereum uses for transaction and receipt lists. The root
//! of the empty list is NULL_ROOT.
struct OrderedTrieRoot final : MerkleRoot
{
    bytes32_t root(std::span<byte_string const> leaves) const override;
};

SHARDING_MERKLE_NAMESPACE_END
