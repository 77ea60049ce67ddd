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

#include <sharding/core/assert.h>
#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/keccak.hpp>
#include <sharding/merkle/compact_encode.hpp>
#include <sharding/merkle/config.hpp>
#include <sharding/merkle/node_reference.hpp>
#include <sharding/merkle/ordered_trie_root.hpp>
#include <sharding/primitives/rlp/int_rlp.hpp>
#include <sharding/rlp/encode2.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

SHARDING_MERKLE_NAMESPACE_BEGIN

namespace
{
    struct Entry
    {
        byte_string path; // nibbles
        byte_string_view value;
    };

    size_t common_prefix_length(
        byte_string_view const a, byte_string_view const b, size_t const depth)
    {
        size_t n = 0;
        while (depth + n < a.size() && depth + n < b.size() &&
               a[depth + n] == b[depth + n]) {
            ++n;
        }
        return n;
    }

    // entries are sorted by path and their paths agree on [0, depth)
    byte_string encode_node(std::span<Entry const> const entries, size_t depth)
    {
        SHARDING_ASSERT(!entries.empty());

        if (entries.size() == 1) {
            byte_string_view const path{entries[0].path};
            return rlp::encode_list2(
                rlp::encode_string2(compact_encode(path.substr(depth), true)),
                rlp::encode_string2(entries[0].value));
        }

        // sorted, so the shared prefix of the extremes is shared by all
        size_t const prefix = common_prefix_length(
            entries.front().path, entries.back().path, depth);
        if (prefix > 0) {
            byte_string_view const path{entries.front().path};
            auto const child = encode_node(entries, depth + prefix);
            return rlp::encode_list2(
                rlp::encode_string2(
                    compact_encode(path.substr(depth, prefix), false)),
                to_node_reference(child));
        }

        byte_string branch;
        byte_string value = rlp::EMPTY_STRING;
        auto it = entries.begin();
        if (it->path.size() == depth) {
            value = rlp::encode_string2(it->value);
            ++it;
        }
        for (unsigned char nibble = 0; nibble < 16; ++nibble) {
            auto const first = it;
            while (it != entries.end() && it->path[depth] == nibble) {
                ++it;
            }
            if (first == it) {
                branch += rlp::EMPTY_STRING;
                continue;
            }
            auto const child = encode_node(
                entries.subspan(
                    static_cast<size_t>(first - entries.begin()),
                    static_cast<size_t>(it - first)),
                depth + 1);
            branch += to_node_reference(child);
        }
        SHARDING_ASSERT(it == entries.end());
        branch += value;
        return rlp::encode_list2(branch);
    }
}

bytes32_t trie_root(std::span<TrieEntry const> const trie_entries)
{
    if (trie_entries.empty()) {
        return NULL_ROOT;
    }

    std::vector<Entry> entries;
    entries.reserve(trie_entries.size());
    for (auto const &entry : trie_entries) {
        entries.push_back({.path = to_nibbles(entry.key), .value = entry.value});
    }
    std::ranges::sort(entries, {}, &Entry::path);
    SHARDING_ASSERT(
        std::ranges::adjacent_find(entries, {}, &Entry::path) ==
        entries.end());

    // root node is always hashed, even when shorter than a hash
    return to_bytes(keccak256(encode_node(entries, 0)));
}

bytes32_t OrderedTrieRoot::root(std::span<byte_string const> const leaves) const
{
    std::vector<TrieEntry> entries;
    entries.reserve(leaves.size());
    for (size_t i = 0; i < leaves.size(); ++i) {
        entries.push_back({.key = rlp::encode_unsigned(i), .value = leaves[i]});
    }
    return trie_root(entries);
}

SHARDING_MERKLE_NAMESPACE_END
