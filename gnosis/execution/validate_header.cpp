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

#include <gnosis/core/config.hpp>
#include <gnosis/core/result.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/header_error.hpp>
#include <gnosis/execution/validate_header.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>

#include <array>

GNOSIS_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Result<void> validate_fork_fields(GnosisHeader const &header)
{
    std::array<bool, 6> const present = {
        header.base_fee_per_gas.has_value(),
        header.withdrawals_root.has_value(),
        header.blob_gas_used.has_value(),
        header.excess_blob_gas.has_value(),
        header.parent_beacon_block_root.has_value(),
        header.requests_hash.has_value()};

    bool absent_seen = false;
    for (bool const is_present : present) {
        if (!is_present) {
            absent_seen = true;
        }
        else if (absent_seen) {
            return HeaderError::NonMonotonicForkFields;
        }
    }
    return success();
}

GNOSIS_NAMESPACE_END
