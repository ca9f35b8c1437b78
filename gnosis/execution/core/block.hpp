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

#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/bytes.hpp>
#include <gnosis/core/config.hpp>
#include <gnosis/core/int.hpp>
#include <gnosis/execution/core/address.hpp>

#include <cstdint>
#include <optional>

GNOSIS_NAMESPACE_BEGIN

using Bloom = byte_string_fixed<256>;

/**
 * The standard post-merge Ethereum header, the interchange form used at the
 * boundaries of the node. It has no pre-merge concept.
 */
struct BlockHeader
{
    Bloom logs_bloom{}; // H_b
    bytes32_t parent_hash{}; // H_p
    bytes32_t ommers_hash{NULL_LIST_HASH}; // H_o
    bytes32_t state_root{NULL_ROOT}; // H_r
    bytes32_t transactions_root{NULL_ROOT}; // H_t
    bytes32_t receipts_root{NULL_ROOT}; // H_e
    bytes32_t prev_randao{}; // H_a
    uint256_t difficulty{}; // H_d

    uint64_t number{0}; // H_i
    uint64_t gas_limit{0}; // H_l
    uint64_t gas_used{0}; // H_g
    uint64_t timestamp{0}; // H_s

    byte_string_fixed<8> nonce{}; // H_n
    byte_string extra_data{}; // H_x

    Address beneficiary{}; // H_c

    std::optional<uint64_t> base_fee_per_gas{std::nullopt}; // H_f
    std::optional<bytes32_t> withdrawals_root{std::nullopt}; // H_w
    std::optional<uint64_t> blob_gas_used{std::nullopt}; // EIP-4844
    std::optional<uint64_t> excess_blob_gas{std::nullopt}; // EIP-4844
    std::optional<bytes32_t> parent_beacon_block_root{std::nullopt}; // EIP-4788
    std::optional<bytes32_t> requests_hash{std::nullopt}; // EIP-7685

    friend bool operator==(BlockHeader const &, BlockHeader const &) = default;
};

GNOSIS_NAMESPACE_END
