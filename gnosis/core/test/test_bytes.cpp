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

#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/bytes.hpp>
#include <gnosis/core/keccak.hpp>

#include <gtest/gtest.h>

using namespace gnosis;

TEST(Bytes, empty_structure_hashes)
{
    EXPECT_EQ(to_bytes(keccak256(byte_string({0xc0}))), NULL_LIST_HASH);
    EXPECT_EQ(to_bytes(keccak256(byte_string({0x80}))), NULL_ROOT);
}

TEST(Bytes, to_bytes_right_aligns)
{
    auto const b = to_bytes(byte_string({0x01, 0x02}));
    EXPECT_EQ(b, bytes32_t{0x0102});
    EXPECT_EQ(to_bytes(byte_string{}), bytes32_t{});
}
