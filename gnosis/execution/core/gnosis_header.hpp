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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

GNOSIS_NAMESPACE_BEGIN

inline constexpr size_t AURA_SEAL_SIZE = 65;

using AuraSeal = byte_string_fixed<AURA_SEAL_SIZE>;

// proof of stake sealing fields
struct PostMerge
{
    bytes32_t mix_hash{};
    byte_string_fixed<8> nonce{};

    friend bool operator==(PostMerge const &, PostMerge const &) = default;
};

// Aura sealing fields, a step counter and a 65 byte validator signature
struct PreMerge
{
    uint256_t aura_step{};
    AuraSeal aura_seal{};

    friend bool operator==(PreMerge const &, PreMerge const &) = default;
};

using ConsensusFields = std::variant<PostMerge, PreMerge>;

/**
 * Gnosis block header. Fixed fields in wire order, one of the two consensus
 * variants, then the fork extensions. The fork extensions are expected to
 * be set as a prefix of their order; the default codec does not enforce it
 * (see validate_fork_fields).
 */
struct GnosisHeader
{
    bytes32_t parent_hash{};
    bytes32_t ommers_hash{NULL_LIST_HASH};
    Address beneficiary{};
    bytes32_t state_root{NULL_ROOT};
    bytes32_t transactions_root{NULL_ROOT};
    bytes32_t receipts_root{NULL_ROOT};
    Bloom logs_bloom{};
    uint256_t difficulty{};
    uint64_t number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    byte_string extra_data{};

    ConsensusFields consensus{PostMerge{}};

    std::optional<uint64_t> base_fee_per_gas{std::nullopt}; // London
    std::optional<bytes32_t> withdrawals_root{std::nullopt}; // Shanghai
    std::optional<uint64_t> blob_gas_used{std::nullopt}; // Cancun
    std::optional<uint64_t> excess_blob_gas{std::nullopt}; // Cancun
    std::optional<bytes32_t> parent_beacon_block_root{std::nullopt}; // Cancun
    std::optional<bytes32_t> requests_hash{std::nullopt}; // Prague

    friend bool
    operator==(GnosisHeader const &, GnosisHeader const &) = default;
};

struct BlockNumHash
{
    uint64_t number{0};
    bytes32_t hash{};

    friend bool
    operator==(BlockNumHash const &, BlockNumHash const &) = default;
};

struct SealedGnosisHeader
{
    GnosisHeader header{};
    bytes32_t hash{};

    friend bool
    operator==(SealedGnosisHeader const &, SealedGnosisHeader const &) = default;
};

/**
 * Builds the consensus variant out of four independent slots. Exactly the
 * two slots of one variant must be set.
 */
Result<ConsensusFields> make_consensus_fields(
    std::optional<bytes32_t> const &mix_hash,
    std::optional<byte_string_fixed<8>> const &nonce,
    std::optional<uint256_t> const &aura_step,
    std::optional<AuraSeal> const &aura_seal);

inline bool is_post_merge(GnosisHeader const &header) noexcept
{
    return std::holds_alternative<PostMerge>(header.consensus);
}

inline bool is_pre_merge(GnosisHeader const &header) noexcept
{
    return std::holds_alternative<PreMerge>(header.consensus);
}

inline bool shanghai_active(GnosisHeader const &header) noexcept
{
    return header.withdrawals_root.has_value();
}

inline bool cancun_active(GnosisHeader const &header) noexcept
{
    return header.blob_gas_used.has_value();
}

inline bool prague_active(GnosisHeader const &header) noexcept
{
    return header.requests_hash.has_value();
}

inline bool ommers_hash_is_empty(GnosisHeader const &header) noexcept
{
    return header.ommers_hash == NULL_LIST_HASH;
}

inline bool transactions_root_is_empty(GnosisHeader const &header) noexcept
{
    return header.transactions_root == NULL_ROOT;
}

// keccak256 of the RLP encoding
bytes32_t hash(GnosisHeader const &);

BlockNumHash parent_num_hash(GnosisHeader const &);
BlockNumHash num_hash(GnosisHeader const &);

// pairs the header with a hash the caller already has, unverified
SealedGnosisHeader seal(GnosisHeader, bytes32_t const &);
SealedGnosisHeader seal(GnosisHeader);

Result<BlockHeader> to_block_header(GnosisHeader const &);
GnosisHeader from_block_header(BlockHeader const &);

GNOSIS_NAMESPACE_END
