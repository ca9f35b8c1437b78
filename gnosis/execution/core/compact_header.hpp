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
#include <gnosis/core/result.hpp>
#include <gnosis/execution/core/address.hpp>
#include <gnosis/execution/core/block.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>

#include <cstdint>
#include <optional>

GNOSIS_NAMESPACE_BEGIN

/**
 * Storage shadow of GnosisHeader. The consensus fields are four independent
 * slots and the nonce is the big endian value of its 8 bytes.
 */
struct CompactHeader
{
    bytes32_t parent_hash{};
    bytes32_t ommers_hash{};
    Address beneficiary{};
    bytes32_t state_root{};
    bytes32_t transactions_root{};
    bytes32_t receipts_root{};
    Bloom logs_bloom{};
    uint256_t difficulty{};
    uint64_t number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    byte_string extra_data{};

    std::optional<bytes32_t> mix_hash{std::nullopt};
    std::optional<uint64_t> nonce{std::nullopt};
    std::optional<uint256_t> aura_step{std::nullopt};
    std::optional<AuraSeal> aura_seal{std::nullopt};

    std::optional<uint64_t> base_fee_per_gas{std::nullopt};
    std::optional<bytes32_t> withdrawals_root{std::nullopt};
    std::optional<uint64_t> blob_gas_used{std::nullopt};
    std::optional<uint64_t> excess_blob_gas{std::nullopt};
    std::optional<bytes32_t> parent_beacon_block_root{std::nullopt};
    std::optional<bytes32_t> requests_hash{std::nullopt};

    friend bool
    operator==(CompactHeader const &, CompactHeader const &) = default;
};

CompactHeader to_compact_header(GnosisHeader const &);

// fails unless exactly one consensus variant is fully set
Result<GnosisHeader> from_compact_header(CompactHeader const &);

GNOSIS_NAMESPACE_END
