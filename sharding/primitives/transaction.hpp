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

#include <sharding/core/byte_string.hpp>
#include <sharding/core/bytes.hpp>
#include <sharding/core/int.hpp>
#include <sharding/primitives/address.hpp>
#include <sharding/primitives/signature.hpp>

#include <cstdint>
#include <optional>
#include <vector>

SHARDING_NAMESPACE_BEGIN

enum class TransactionType : char
{
    legacy = 0,
    eip2930,
    eip1559,
    LAST,
};

struct AccessEntry
{
    Address a{};
    std::vector<bytes32_t> keys{};

    friend bool operator==(AccessEntry const &, AccessEntry const &) = default;
};

using AccessList = std::vector<AccessEntry>;

struct Transaction
{
    SignatureAndChain sc{};
    uint64_t nonce{};
    uint256_t max_fee_per_gas{}; // gas_price
    uint64_t gas_limit{};
    uint256_t value{};
    std::optional<Address> to{};
    TransactionType type{};
    byte_string data{};
    AccessList access_list{};
    uint256_t max_priority_fee_per_gas{};

    friend bool operator==(Transaction const &, Transaction const &) = default;
};

SHARDING_NAMESPACE_END
