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
#include <gnosis/core/int.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/fees.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

GNOSIS_NAMESPACE_BEGIN

namespace
{
    // Approximates `factor * e ** (n/d) using Taylor expansion
    uint256_t fake_exponential(uint256_t factor, uint256_t n, uint256_t d)
    {
        int i = 1;
        uint256_t output = 0;
        uint256_t acc = factor * d;
        while (acc > 0) {
            output += acc;
            acc = (acc * n) / (d * i);
            ++i;
        }
        return output / d;
    }
}

uint256_t
calc_blob_fee(uint64_t const excess_blob_gas, BlobParams const &params)
{
    if (params.update_fraction == 0) {
        return uint256_t{params.min_blob_fee};
    }
    return fake_exponential(
        uint256_t{params.min_blob_fee},
        uint256_t{excess_blob_gas},
        uint256_t{params.update_fraction});
}

uint64_t calc_next_block_base_fee(
    uint64_t const gas_used, uint64_t const gas_limit, uint64_t const base_fee,
    BaseFeeParams const &params)
{
    if (params.elasticity_multiplier == 0 ||
        params.max_change_denominator == 0) {
        return base_fee;
    }

    uint64_t const gas_target = gas_limit / params.elasticity_multiplier;
    if (gas_target == 0 || gas_used == gas_target) {
        return base_fee;
    }

    uint128_t const denominator =
        uint128_t{gas_target} * params.max_change_denominator;

    if (gas_used > gas_target) {
        uint128_t const delta = std::max(
            uint128_t{base_fee} * (gas_used - gas_target) / denominator,
            uint128_t{1});
        uint128_t const next = uint128_t{base_fee} + delta;
        if (next > std::numeric_limits<uint64_t>::max()) {
            return std::numeric_limits<uint64_t>::max();
        }
        return static_cast<uint64_t>(next);
    }

    uint128_t const delta =
        uint128_t{base_fee} * (gas_target - gas_used) / denominator;
    return base_fee - static_cast<uint64_t>(delta);
}

uint64_t calc_next_block_excess_blob_gas(
    uint64_t const excess_blob_gas, uint64_t const blob_gas_used,
    uint64_t const base_fee, BlobParams const &params)
{
    uint128_t const target =
        uint128_t{params.target_blob_count} * GAS_PER_BLOB;
    uint128_t const total = uint128_t{excess_blob_gas} + blob_gas_used;
    if (total < target) {
        return 0;
    }

    // EIP-7918: while the reserve price binds, the target is not subtracted
    if (uint256_t{params.blob_base_cost} * base_fee >
        uint256_t{GAS_PER_BLOB} * calc_blob_fee(excess_blob_gas, params)) {
        if (params.max_blob_count == 0) {
            return excess_blob_gas;
        }
        uint128_t const scaled = uint128_t{blob_gas_used} *
                                 (params.max_blob_count -
                                  params.target_blob_count) /
                                 params.max_blob_count;
        return static_cast<uint64_t>(scaled + excess_blob_gas);
    }

    return static_cast<uint64_t>(total - target);
}

std::optional<uint64_t>
next_block_base_fee(GnosisHeader const &header, BaseFeeParams const &params)
{
    if (!header.base_fee_per_gas.has_value()) {
        return std::nullopt;
    }
    return calc_next_block_base_fee(
        header.gas_used,
        header.gas_limit,
        header.base_fee_per_gas.value(),
        params);
}

std::optional<uint256_t>
blob_fee(GnosisHeader const &header, BlobParams const &params)
{
    if (!header.excess_blob_gas.has_value()) {
        return std::nullopt;
    }
    return calc_blob_fee(header.excess_blob_gas.value(), params);
}

std::optional<uint64_t>
next_block_excess_blob_gas(GnosisHeader const &header, BlobParams const &params)
{
    if (!header.excess_blob_gas.has_value() ||
        !header.blob_gas_used.has_value() ||
        !header.base_fee_per_gas.has_value()) {
        return std::nullopt;
    }
    return calc_next_block_excess_blob_gas(
        header.excess_blob_gas.value(),
        header.blob_gas_used.value(),
        header.base_fee_per_gas.value(),
        params);
}

std::optional<uint256_t>
next_block_blob_fee(GnosisHeader const &header, BlobParams const &params)
{
    auto const excess = next_block_excess_blob_gas(header, params);
    if (!excess.has_value()) {
        return std::nullopt;
    }
    return calc_blob_fee(excess.value(), params);
}

GNOSIS_NAMESPACE_END
