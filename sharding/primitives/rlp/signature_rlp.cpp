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
#include <sharding/core/result.hpp>
#include <sharding/primitives/rlp/int_rlp.hpp>
#include <sharding/primitives/rlp/signature_rlp.hpp>
#include <sharding/primitives/signature.hpp>
#include <sharding/rlp/config.hpp>

#include <boost/outcome/try.hpp>

SHARDING_RLP_NAMESPACE_BEGIN

Result<SignatureAndChain> decode_sc(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const v, decode_unsigned<uint256_t>(enc));

    SignatureAndChain sc;
    sc.from_v(v);
    return sc;
}

SHARDING_RLP_NAMESPACE_END
