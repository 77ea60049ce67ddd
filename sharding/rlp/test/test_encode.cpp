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
#include <sharding/rlp/encode2.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace sharding;
using namespace sharding::rlp;

TEST(Rlp, ToBigCompact)
{
    EXPECT_EQ(to_big_compact(uint64_t{0}), byte_string{});
    EXPECT_EQ(to_big_compact(uint32_t{1024}), byte_string({0x04, 0x00}));
    EXPECT_EQ(to_big_compact(uint64_t{1024}), to_big_compact(uint16_t{1024}));
    EXPECT_EQ(
        to_big_compact(uint256_t{0x0102}),
        byte_string({0x01, 0x02}));
}

TEST(Rlp, EncodeString)
{
    // single byte below 0x80 is its own encoding
    EXPECT_EQ(encode_string2(byte_string({0x7f})), byte_string({0x7f}));
    EXPECT_EQ(encode_string2(byte_string({0x80})), byte_string({0x81, 0x80}));

    EXPECT_EQ(encode_string2(byte_string{}), EMPTY_STRING);

    std::string const dog = "dog";
    EXPECT_EQ(
        encode_string2(to_byte_string_view(dog)),
        byte_string({0x83, 'd', 'o', 'g'}));

    // 55 bytes still fits the short form
    auto const short_form = encode_string2(byte_string(55, 0xaa));
    ASSERT_EQ(short_form.size(), 56);
    EXPECT_EQ(short_form[0], 0xb7);

    auto const long_form = encode_string2(byte_string(56, 0xaa));
    ASSERT_EQ(long_form.size(), 58);
    EXPECT_EQ(long_form[0], 0xb8);
    EXPECT_EQ(long_form[1], 56);

    auto const two_byte_length = encode_string2(byte_string(1024, 0x01));
    ASSERT_EQ(two_byte_length.size(), 1027);
    EXPECT_EQ(two_byte_length.substr(0, 3), byte_string({0xb9, 0x04, 0x00}));
}

TEST(Rlp, EncodeList)
{
    EXPECT_EQ(encode_list2(), byte_string({0xc0}));

    std::string const cat = "cat";
    std::string const dog = "dog";
    EXPECT_EQ(
        encode_list2(
            encode_string2(to_byte_string_view(cat)),
            encode_string2(to_byte_string_view(dog))),
        byte_string({0xc8, 0x83, 'c', 'a', 't', 0x83, 'd', 'o', 'g'}));

    // nested empty lists, [ [], [[]] ]
    EXPECT_EQ(
        encode_list2(encode_list2(), encode_list2(encode_list2())),
        byte_string({0xc3, 0xc0, 0xc1, 0xc0}));

    auto const long_list = encode_list2(byte_string(60, 0x01));
    ASSERT_EQ(long_list.size(), 62);
    EXPECT_EQ(long_list.substr(0, 2), byte_string({0xf8, 60}));
}
