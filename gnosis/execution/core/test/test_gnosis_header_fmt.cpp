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

#include <gnosis/core/bytes.hpp>
#include <gnosis/core/int.hpp>
#include <gnosis/execution/core/fmt/gnosis_header_fmt.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>

#include <quill/bundled/fmt/format.h>

#include <gtest/gtest.h>

#include <string>

using namespace gnosis;

TEST(GnosisHeaderFmt, post_merge)
{
    ConsensusFields const consensus = PostMerge{
        .mix_hash = bytes32_t{0x2a},
        .nonce = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}};

    EXPECT_EQ(
        fmt::format("{}", consensus),
        "PostMerge{Mix Hash=0x" + std::string(62, '0') +
            "2a Nonce=0x0102030405060708}");
}

TEST(GnosisHeaderFmt, pre_merge)
{
    AuraSeal seal{};
    seal.back() = 0x1b;
    ConsensusFields const consensus =
        PreMerge{.aura_step = 123456, .aura_seal = seal};

    EXPECT_EQ(
        fmt::format("{}", consensus),
        "PreMerge{Aura Step=123456 Aura Seal=0x" + std::string(128, '0') +
            "1b}");
}

TEST(GnosisHeaderFmt, header)
{
    GnosisHeader const header{
        .number = 42,
        .extra_data = {0xde, 0xad},
        .consensus = PreMerge{.aura_step = 7},
        .base_fee_per_gas = 9};

    auto const text = fmt::format("{}", header);
    EXPECT_TRUE(text.starts_with("GnosisHeader{Parent Hash=0x"));
    EXPECT_NE(text.find("Block Number=42 "), std::string::npos);
    EXPECT_NE(text.find("Extra Data=0xdead "), std::string::npos);
    EXPECT_NE(
        text.find("Consensus=PreMerge{Aura Step=7 "), std::string::npos);
    EXPECT_TRUE(text.ends_with("}}"));
}
