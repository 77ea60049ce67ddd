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

#include <sharding/collation/collation_config.hpp>
#include <sharding/core/config.hpp>
#include <sharding/primitives/address.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

SHARDING_NAMESPACE_BEGIN

//! 0x-prefixed or bare hex, exactly 20 bytes
std::optional<Address> parse_address(std::string const &);

//! Build a collation from the rlp transaction list in `in`, write its body to
//! `out` unless empty and print the commitments. Returns a process exit code.
int run_encode(
    std::filesystem::path const &in, std::filesystem::path const &out,
    uint64_t shard_id, uint64_t period, std::string const &proposer_hex,
    CollationConfig const &, std::ostream &);

//! Decode the collation body in `in` and print its chunk root and the hash of
//! each transaction. Returns a process exit code.
int run_decode(
    std::filesystem::path const &in, CollationConfig const &, std::ostream &);

SHARDING_NAMESPACE_END
