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

#include <gnosis/core/config.hpp>
#include <gnosis/core/int.hpp>

#include <cstdint>
#include <optional>

GNOSIS_NAMESPACE_BEGIN

struct GnosisHeader;

inline constexpr uint64_t GAS_PER_BLOB = 131072;

struct BaseFeeParams
{
    uint64_t max_change_denominator;
    uint64_t elasticity_multiplier;
};

// EIP-1559
inline constexpr BaseFeeParams ETHEREUM_BASE_FEE_PARAMS{
    .max_change_denominator = 8, .elasticity_multiplier = 2};

struct BlobParams
{
    uint64_t target_blob_count;
    uint64_t max_blob_count;
    uint64_t update_fraction;
    uint64_t min_blob_fee;
    // EIP-7918 reserve price, in units of execution base fee per blob
    uint64_t blob_base_cost;
};

inline constexpr BlobParams CANCUN_BLOB_PARAMS{
    .target_blob_count = 3,
    .max_blob_count = 6,
    .update_fraction = 3338477,
    .min_blob_fee = 1,
    .blob_base_cost = 0};

inline constexpr BlobParams GNOSIS_BLOB_PARAMS{
    .target_blob_count = 1,
    .max_blob_count = 2,
    .update_fraction = 1112826,
    .min_blob_fee = 1'000'000'000,
    .blob_base_cost = 0};

// Base fee per blob gas for a given excess blob gas. A zero update fraction
// pins it at the minimum.
uint256_t calc_blob_fee(uint64_t excess_blob_gas, BlobParams const &);

// the base fee is carried over unchanged when either parameter is zero
uint64_t calc_next_block_base_fee(
    uint64_t gas_used, uint64_t gas_limit, uint64_t base_fee,
    BaseFeeParams const &);

uint64_t calc_next_block_excess_blob_gas(
    uint64_t excess_blob_gas, uint64_t blob_gas_used, uint64_t base_fee,
    BlobParams const &);

// empty without a base fee
std::optional<uint64_t>
next_block_base_fee(GnosisHeader const &, BaseFeeParams const &);

// empty without an excess blob gas
std::optional<uint256_t> blob_fee(GnosisHeader const &, BlobParams const &);

// empty unless base fee, blob gas used and excess blob gas are all set
std::optional<uint64_t>
next_block_excess_blob_gas(GnosisHeader const &, BlobParams const &);

std::optional<uint256_t>
next_block_blob_fee(GnosisHeader const &, BlobParams const &);

GNOSIS_NAMESPACE_END
