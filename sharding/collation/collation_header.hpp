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
#include <sharding/core/config.hpp>
#include <sharding/primitives/address.hpp>

#include <cstdint>

SHARDING_NAMESPACE_BEGIN

class Collation;

//! Identity of a collation: which shard and period it belongs to, who
//! proposed it and the chunk root committing to its body.
//!
//! Headers are values. Once constructed only the owning Collation rewrites
//! the chunk root, and a signed header is a new header built by
//! with_signature().
class CollationHeader
{
public:
    CollationHeader() = default;
    CollationHeader(
        uint64_t shard_id, bytes32_t const &chunk_root, uint64_t period,
        Address const &proposer_address, byte_string proposer_signature = {});

    uint64_t shard_id() const noexcept
    {
        return shard_id_;
    }

    bytes32_t const &chunk_root() const noexcept
    {
        return chunk_root_;
    }

    uint64_t period() const noexcept
    {
        return period_;
    }

    Address const &proposer_address() const noexcept
    {
        return proposer_address_;
    }

    byte_string const &proposer_signature() const noexcept
    {
        return proposer_signature_;
    }

    //! keccak256 of the canonical encoding, signature included. The value
    //! changes when a signature is attached.
    bytes32_t hash() const;

    //! keccak256 of the canonical encoding with an empty signature; the
    //! target a proposer signs. Identical before and after signing.
    bytes32_t signing_hash() const;

    CollationHeader with_signature(byte_string signature) const;

    friend bool
    operator==(CollationHeader const &, CollationHeader const &) = default;

private:
    friend class Collation;

    uint64_t shard_id_{};
    bytes32_t chunk_root_{};
    uint64_t period_{};
    Address proposer_address_{};
    byte_string proposer_signature_{};
};

SHARDING_NAMESPACE_END
