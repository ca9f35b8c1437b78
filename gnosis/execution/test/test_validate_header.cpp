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
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/header_error.hpp>
#include <gnosis/execution/validate_header.hpp>

#include <gtest/gtest.h>

using namespace gnosis;

TEST(Validation, no_fork_fields)
{
    GnosisHeader const header{};
    EXPECT_FALSE(validate_fork_fields(header).has_error());
}

TEST(Validation, fork_prefixes)
{
    GnosisHeader header{};

    header.base_fee_per_gas = 1;
    EXPECT_FALSE(validate_fork_fields(header).has_error());

    header.withdrawals_root = NULL_ROOT;
    EXPECT_FALSE(validate_fork_fields(header).has_error());

    header.blob_gas_used = 0;
    header.excess_blob_gas = 0;
    header.parent_beacon_block_root = NULL_ROOT;
    EXPECT_FALSE(validate_fork_fields(header).has_error());

    header.requests_hash = NULL_ROOT;
    EXPECT_FALSE(validate_fork_fields(header).has_error());
}

TEST(Validation, gap_in_fork_fields)
{
    {
        GnosisHeader const header{.excess_blob_gas = 7};
        auto const res = validate_fork_fields(header);
        ASSERT_TRUE(res.has_error());
        EXPECT_TRUE(res.assume_error() == HeaderError::NonMonotonicForkFields);
    }

    {
        GnosisHeader const header{
            .base_fee_per_gas = 1,
            .withdrawals_root = NULL_ROOT,
            .blob_gas_used = 0,
            .requests_hash = NULL_ROOT};
        auto const res = validate_fork_fields(header);
        ASSERT_TRUE(res.has_error());
        EXPECT_TRUE(res.assume_error() == HeaderError::NonMonotonicForkFields);
    }
}
