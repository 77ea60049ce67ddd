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

#include <sharding/core/config.hpp>

#include <cstddef>
#include <cstdint>

SHARDING_NAMESPACE_BEGIN

// Default limit on the serialized body of one collation, 1 MiB
inline constexpr size_t MAX_COLLATION_BODY_SIZE = size_t{1} << 20;

// Default size of the slices the chunk root commits to
inline constexpr size_t DEFAULT_CHUNK_ROOT_CHUNK_SIZE = 32;

enum class ChunkRootScheme : uint8_t
{
    ordered_trie = 0,
    binary,
};

struct CollationConfig
{
    size_t max_body_size{MAX_COLLATION_BODY_SIZE};
    size_t chunk_size{DEFAULT_CHUNK_ROOT_CHUNK_SIZE};
    ChunkRootScheme chunk_root_scheme{ChunkRootScheme::ordered_trie};
    // stamped into every raw blob written by the proposer path
    bool skip_evm_execution{false};
};

SHARDING_NAMESPACE_END
