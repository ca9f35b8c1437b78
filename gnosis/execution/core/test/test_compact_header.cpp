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
#include <gnosis/core/int.hpp>
#include <gnosis/execution/core/compact_header.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/header_error.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <variant>

using namespace evmc::literals;
using namespace gnosis;

TEST(CompactHeader, post_merge)
{
    GnosisHeader const header{
        .number = 7,
        .extra_data = {0xde, 0xad},
        .consensus = PostMerge{
            .mix_hash = NULL_ROOT,
            .nonce = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}},
        .base_fee_per_gas = 1};

    auto const compact = to_compact_header(header);
    EXPECT_EQ(compact.mix_hash, NULL_ROOT);
    EXPECT_EQ(compact.nonce, 0x0102030405060708);
    EXPECT_FALSE(compact.aura_step.has_value());
    EXPECT_FALSE(compact.aura_seal.has_value());
    EXPECT_EQ(compact.base_fee_per_gas, 1);
    EXPECT_EQ(compact.extra_data, header.extra_data);

    auto const restored = from_compact_header(compact);
    ASSERT_FALSE(restored.has_error());
    EXPECT_EQ(restored.value(), header);
}

TEST(CompactHeader, pre_merge)
{
    AuraSeal seal{};
    seal.back() = 0x1b;
    GnosisHeader const header{
        .number = 12,
        .consensus = PreMerge{.aura_step = 123456, .aura_seal = seal}};

    auto const compact = to_compact_header(header);
    EXPECT_FALSE(compact.mix_hash.has_value());
    EXPECT_FALSE(compact.nonce.has_value());
    EXPECT_EQ(compact.aura_step, uint256_t{123456});
    EXPECT_EQ(compact.aura_seal, seal);

    auto const restored = from_compact_header(compact);
    ASSERT_FALSE(restored.has_error());
    EXPECT_EQ(restored.value(), header);
}

TEST(CompactHeader, zero_valued_slots_are_present)
{
    // a zero mix hash and nonce are still a post merge header
    GnosisHeader const header{};
    auto const compact = to_compact_header(header);
    EXPECT_EQ(compact.nonce, 0);

    auto const restored = from_compact_header(compact);
    ASSERT_FALSE(restored.has_error());
    EXPECT_TRUE(is_post_merge(restored.value()));
}

TEST(CompactHeader, malformed_consensus_slots)
{
    CompactHeader compact{};
    compact.mix_hash = NULL_ROOT;
    {
        auto const restored = from_compact_header(compact);
        ASSERT_TRUE(restored.has_error());
        EXPECT_TRUE(
            restored.assume_error() == HeaderError::IncompleteConsensusFields);
    }

    compact.nonce = 1;
    compact.aura_seal = AuraSeal{};
    {
        auto const restored = from_compact_header(compact);
        ASSERT_TRUE(restored.has_error());
        EXPECT_TRUE(
            restored.assume_error() == HeaderError::MixedConsensusFields);
    }
}

TEST(CompactHeader, nonce_is_big_endian)
{
    CompactHeader compact{};
    compact.mix_hash = NULL_ROOT;
    compact.nonce = 0x1122334455667788;

    auto const restored = from_compact_header(compact);
    ASSERT_FALSE(restored.has_error());
    auto const *const post =
        std::get_if<PostMerge>(&restored.value().consensus);
    ASSERT_NE(post, nullptr);
    byte_string_fixed<8> const expected{
        0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88};
    EXPECT_EQ(post->nonce, expected);
    EXPECT_EQ(to_compact_header(restored.value()).nonce, compact.nonce);
}
